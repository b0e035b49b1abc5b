/*
 * VorbisDecoder.h - Vorbis I audio packet decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef VORBISDECODER_H
#define VORBISDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Vorbis {

/**
 * @brief Decoder for Vorbis I audio packets.
 *
 * Built from the three header packets. The first audio packet only primes
 * the overlap state and returns no samples; every later packet returns
 * previous/4 + current/4 samples per channel. An audio packet that ends
 * early is not an error: a floor cut short marks its channel unused and a
 * residue cut short keeps what was decoded, as Vorbis I requires.
 */
class VorbisDecoder {
public:
    VorbisDecoder(const std::vector<uint8_t>& identification, const std::vector<uint8_t>& comment,
                  const std::vector<uint8_t>& setup, const DecoderConfig& config);

    size_t decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity);

    // Flushes the overlap tails and restarts as if after a seek
    size_t decodeLost(float* output, size_t capacity);

    void reset();

    unsigned sampleRate() const { return m_setup.identification().sample_rate; }
    unsigned channels() const { return m_channels; }
    size_t maxFrameSamples() const { return static_cast<size_t>(m_setup.identification().blocksize_1) / 2 * m_channels; }
    const VorbisSetup& setup() const { return m_setup; }

private:
    bool decodeFloor(IO::BitReader& reader, unsigned floor_index, unsigned n2, float* curve);
    bool decodeFloor0(IO::BitReader& reader, const Floor0& floor, unsigned floor_index, unsigned n2, float* curve);
    bool decodeFloor1(IO::BitReader& reader, const Floor1& floor, unsigned n2, float* curve) const;
    void decodeResidue(IO::BitReader& reader, const Residue& residue, unsigned n2,
                       const std::vector<unsigned>& channels, const std::vector<bool>& do_not_decode);
    void decodePartitions(IO::BitReader& reader, const Residue& residue, unsigned actual_size,
                          const std::vector<float*>& vectors, const std::vector<bool>& do_not_decode);
    const std::vector<int>& barkMap(const Floor0& floor, unsigned floor_index, unsigned n2);
    size_t writeInterleaved(const std::vector<std::vector<float>>& pcm, size_t count, float* output) const;

    VorbisSetup m_setup;
    DecoderConfig m_config;
    unsigned m_channels;

    Core::TransformEngine m_transform;
    Core::WindowOverlapEngine m_window;
    Core::StereoProcessor m_stereo;

    std::vector<std::vector<float>> m_spectrum;     // per channel, blocksize_1 / 2
    std::vector<std::vector<float>> m_floor;
    std::vector<std::vector<float>> m_pcm;
    std::vector<float> m_time;
    std::vector<float> m_interleave;                 // residue type 2 scratch
    std::map<std::pair<unsigned, unsigned>, std::vector<int>> m_bark_maps;
    bool m_first_packet;
    unsigned m_previous_block;
};

} // namespace Vorbis
} // namespace Codec
} // namespace PsyDec

#endif // VORBISDECODER_H
