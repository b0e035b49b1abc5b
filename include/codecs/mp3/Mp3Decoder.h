/*
 * Mp3Decoder.h - MPEG-1/2/2.5 Layer III decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MP3DECODER_H
#define MP3DECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace MP3 {

// Side information of one granule of one channel
struct GranuleInfo {
    unsigned part2_3_length = 0;
    unsigned big_values = 0;
    unsigned global_gain = 0;
    unsigned scalefac_compress = 0;
    bool window_switching = false;
    unsigned block_type = 0;
    bool mixed_block = false;
    unsigned table_select[3] = {0, 0, 0};
    unsigned subblock_gain[3] = {0, 0, 0};
    unsigned region0_count = 0;
    unsigned region1_count = 0;
    bool preflag = false;
    bool scalefac_scale = false;
    unsigned count1table_select = 0;

    bool isShort() const { return window_switching && block_type == 2; }
};

struct SideInfo {
    unsigned main_data_begin = 0;
    unsigned private_bits = 0;
    unsigned scfsi[2][4] = {};
    GranuleInfo granule[2][2];  // [granule][channel]
};

struct ScaleFactors {
    uint8_t l[22] = {};
    uint8_t s[13][3] = {};
    // Intensity position that means "not intensity coded" for each band
    uint8_t l_illegal[22] = {};
    uint8_t s_illegal[13] = {};
    unsigned intensity_scale = 0;
};

/**
 * @brief Layer III decoder for one elementary stream.
 *
 * Each decodeFrame() call takes exactly one frame, header included. Main
 * data may start in earlier frames (the bit reservoir); the decoder keeps
 * the last 511 bytes of main data for that purpose. The frame's channel
 * count and sample rate must match the values given at construction.
 */
class Mp3Decoder {
public:
    Mp3Decoder(unsigned sample_rate, unsigned channels, const DecoderConfig& config);

    /**
     * @brief Decode one frame into interleaved float PCM.
     * @return Interleaved samples written (1152 * channels for MPEG-1,
     *         576 * channels for LSF)
     * @throws DecoderException RESERVOIR_UNDERFLOW after writing a frame of
     *         silence when main_data_begin reaches before the stored data
     */
    size_t decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity);

    // Writes one MPEG-1 frame of silence
    size_t decodeLost(float* output, size_t capacity);

    void reset();

    unsigned sampleRate() const { return m_sample_rate; }
    unsigned channels() const { return m_channels; }
    size_t maxFrameSamples() const { return 1152 * static_cast<size_t>(m_channels); }
    size_t reservoirSize() const { return m_reservoir.size(); }

    static constexpr size_t kMaxReservoir = 511;

private:
    void parseSideInfo(IO::BitReader& reader, const Mp3FrameHeader& header, SideInfo& side) const;
    void checkCrc(const uint8_t* data, size_t side_size, uint16_t stored) const;
    void appendToReservoir(const uint8_t* data, size_t size);

    void readScaleFactors(IO::BitReader& reader, const Mp3FrameHeader& header, const SideInfo& side,
                          unsigned gr, unsigned ch, GranuleInfo& info, ScaleFactors& sf);
    void readScaleFactorsLsf(IO::BitReader& reader, const Mp3FrameHeader& header, unsigned ch,
                             GranuleInfo& info, ScaleFactors& sf);
    void decodeHuffman(IO::BitReader& reader, size_t part_end, const Mp3FrameHeader& header,
                       const GranuleInfo& info, int* values) const;
    void requantize(const Mp3FrameHeader& header, const GranuleInfo& info, const ScaleFactors& sf,
                    const int* values, float* xr) const;
    void processStereo(const Mp3FrameHeader& header, const GranuleInfo& right_info,
                       const ScaleFactors& right_sf);
    void reorder(const Mp3FrameHeader& header, const GranuleInfo& info, float* xr);
    static void antialias(const GranuleInfo& info, float* xr);
    void hybridSynthesis(unsigned ch, const GranuleInfo& info, const float* xr);
    void polyphaseSynthesis(unsigned ch, float* output, size_t stride);

    unsigned m_sample_rate;
    unsigned m_channels;
    DecoderConfig m_config;

    Core::TransformEngine m_transform;
    Core::WindowOverlapEngine m_window;   // one slot per channel and subband
    Core::StereoProcessor m_stereo;

    std::vector<uint8_t> m_reservoir;
    std::vector<uint8_t> m_main_data;

    ScaleFactors m_scalefactors[2];
    int m_values[2][576];
    float m_xr[2][576];
    float m_reorder_tmp[576];
    float m_imdct_in[18];
    float m_imdct_out[36];
    float m_subband_samples[2][18][32];   // [ch][time slot][subband]
    std::vector<float> m_synth_v[2];      // polyphase FIFO, 1024 values
};

} // namespace MP3
} // namespace Codec
} // namespace PsyDec

#endif // MP3DECODER_H
