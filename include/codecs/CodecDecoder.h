/*
 * CodecDecoder.h - Uniform decoder facade over the four codecs
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CODECDECODER_H
#define CODECDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {

enum class CodecType {
    MP3,
    AAC,
    VORBIS,
    OPUS
};

const char* codecTypeName(CodecType codec);
std::optional<CodecType> parseCodecType(const std::string& name);

/**
 * @brief Codec selection plus its out-of-band configuration.
 *
 * MP3 needs nothing beyond the rate and channel count. AAC takes an
 * AudioSpecificConfig (built from the rate and channel count when empty)
 * and whether frames arrive with ADTS headers. Vorbis needs its three
 * header packets. Opus takes an OpusHead packet, or nothing for a plain
 * mono or stereo stream without pre-skip or gain.
 */
struct CodecProfile {
    CodecType codec = CodecType::MP3;
    std::vector<uint8_t> audio_specific_config;
    bool adts = false;
    std::vector<uint8_t> vorbis_identification;
    std::vector<uint8_t> vorbis_comment;
    std::vector<uint8_t> vorbis_setup;
    std::vector<uint8_t> opus_head;

    static CodecProfile mp3();
    static CodecProfile aac(std::vector<uint8_t> asc = {}, bool adts = false);
    static CodecProfile vorbis(std::vector<uint8_t> identification, std::vector<uint8_t> comment,
                               std::vector<uint8_t> setup);
    static CodecProfile opus(std::vector<uint8_t> head = {});
};

/**
 * @brief Decoder for any of the supported codecs behind one interface.
 *
 * The codecs are a closed set held in a std::variant. All output is
 * interleaved float; with DecoderConfig::clip_output set it is clamped to
 * [-1, 1]. Per-frame errors propagate as DecoderException and leave the
 * decoder usable.
 */
class CodecDecoder {
public:
    /**
     * @brief Build a decoder.
     *
     * A sample rate or channel count of 0 accepts whatever the profile
     * carries (Vorbis headers, AudioSpecificConfig, OpusHead); a non-zero
     * value must match it.
     * @throws DecoderException CONFIG_ERROR for unsupported configurations
     */
    static std::unique_ptr<CodecDecoder> init(unsigned sample_rate, unsigned channels,
                                              const CodecProfile& profile,
                                              const DecoderConfig& config = DecoderConfig());

    /**
     * @brief Decode one frame.
     * @param output Interleaved output, at least maxFrameSamples() long
     * @return Interleaved samples written
     */
    size_t decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity);
    size_t decodeFrame(const std::vector<uint8_t>& frame, std::vector<float>& output);

    /**
     * @brief Produce output for a frame the caller could not deliver.
     *
     * Opus conceals the loss; the other codecs write one frame of silence
     * (Vorbis also restarts as after a seek).
     */
    size_t decodeLost(float* output, size_t capacity);

    // Clears cross-frame state, as for a seek
    void reset();

    // Releases the codec and its buffers; later calls fail with CONFIG_ERROR
    void deinit();

    bool isInitialized() const;
    CodecType codec() const { return m_codec; }
    const char* codecName() const { return codecTypeName(m_codec); }
    unsigned sampleRate() const;
    unsigned channels() const;
    size_t maxFrameSamples() const;

    // Samples per channel to drop from the start of the stream
    unsigned preSkip() const;

    const DecoderConfig& config() const { return m_config; }

    // Round to 16-bit with saturation
    static void toInt16(const float* input, int16_t* output, size_t count);
    static std::vector<int16_t> toInt16(const std::vector<float>& input);

private:
    using DecoderVariant = std::variant<std::monostate, MP3::Mp3Decoder, AAC::AacDecoder,
                                        Vorbis::VorbisDecoder, Opus::OpusDecoder>;

    CodecDecoder(CodecType codec, const DecoderConfig& config);

    void checkInitialized(const char* operation) const;
    size_t finish(float* output, size_t count) const;

    CodecType m_codec;
    DecoderConfig m_config;
    DecoderVariant m_decoder;
};

} // namespace Codec
} // namespace PsyDec

#endif // CODECDECODER_H
