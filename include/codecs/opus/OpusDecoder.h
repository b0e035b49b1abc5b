/*
 * OpusDecoder.h - Opus packet decoder (SILK, CELT and hybrid)
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef OPUSDECODER_H
#define OPUSDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {

/**
 * @brief Decoder for single-stream Opus packets.
 *
 * Every packet is split into its frames and each frame is routed through
 * SILK, CELT or both according to the TOC byte. Output is interleaved
 * float at 48 kHz with the OpusHead output gain applied. Pre-skip is
 * reported through preSkip() and left to the caller.
 *
 * Frames of one byte or less, and calls to decodeLost(), are concealed
 * from the decoded history.
 */
class OpusDecoder {
public:
    static constexpr unsigned SAMPLE_RATE = 48000;

    OpusDecoder(const OpusHead& head, const DecoderConfig& config);
    OpusDecoder(unsigned channels, const DecoderConfig& config);

    size_t decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity);

    // Conceals one packet of the last decoded duration
    size_t decodeLost(float* output, size_t capacity);

    void reset();

    unsigned sampleRate() const { return SAMPLE_RATE; }
    unsigned channels() const { return m_channels; }
    size_t maxFrameSamples() const { return static_cast<size_t>(OpusPacket::MAX_PACKET_SAMPLES) * m_channels; }
    unsigned preSkip() const { return m_head.pre_skip; }
    const OpusHead& head() const { return m_head; }

    // Range coder state after the last frame, 0 after concealment
    uint32_t finalRange() const { return m_final_range; }
    OpusMode lastMode() const { return m_prev_mode; }
    const OpusConcealment& concealment() const { return m_plc; }

private:
    void decodeOpusFrame(const OpusToc& toc, const OpusFrame& frame, float* pcm);
    void concealFrame(unsigned frame_size, float* pcm);
    void applyGain(float* pcm, size_t count) const;

    OpusHead m_head;
    DecoderConfig m_config;
    unsigned m_channels;
    float m_gain;

    SilkDecoder m_silk;
    CeltDecoder m_celt;
    OpusConcealment m_plc;

    std::vector<float> m_celt_pcm;
    std::vector<float> m_fade_pcm;

    OpusMode m_prev_mode;
    bool m_have_prev_mode;
    bool m_prev_redundancy;
    unsigned m_last_packet_samples;
    uint32_t m_final_range;
};

} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // OPUSDECODER_H
