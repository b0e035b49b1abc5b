/*
 * OpusConcealment.h - Packet loss concealment for the Opus decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef OPUSCONCEALMENT_H
#define OPUSCONCEALMENT_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {

/**
 * @brief Output-domain concealment of lost Opus packets.
 *
 * Keeps a short history of decoded 48 kHz output. The first lost block
 * repeats the last pitch period when the signal is voiced, otherwise the
 * last decoded block, and each further loss continues the same template
 * while the gain falls linearly to silence over plc_fade_frames blocks.
 * Concealed blocks are always full size and their energy never rises
 * from one block to the next. The first good block after a loss is
 * crossfaded from the concealment template.
 */
class OpusConcealment {
public:
    static constexpr unsigned HISTORY = 2880;          // 60 ms
    static constexpr unsigned MIN_PITCH = 100;         // 480 Hz
    static constexpr unsigned MAX_PITCH = 720;         // 66.7 Hz
    static constexpr unsigned CROSSFADE = 120;

    OpusConcealment(unsigned channels, const DecoderConfig& config);

    /**
     * @brief Record a decoded block.
     *
     * When the previous block was concealed the start of @p pcm is
     * crossfaded from the concealment signal in place.
     * @param pitch_lag SILK pitch lag in 48 kHz samples, 0 when unknown
     */
    void update(float* pcm, unsigned frame_size, unsigned pitch_lag);

    // Writes frame_size * channels concealed samples
    void conceal(float* pcm, unsigned frame_size);

    void reset();

    unsigned lostFrames() const { return m_lost; }
    float fadeGain() const { return m_gain; }
    bool voiced() const { return m_period != 0; }

private:
    void buildTemplate(unsigned frame_size);
    unsigned findPitch() const;
    float templateSample(unsigned channel, unsigned position) const;
    void pushHistory(const float* pcm, unsigned frame_size);

    DecoderConfig m_config;
    unsigned m_channels;

    std::vector<std::vector<float>> m_history;     // per channel, oldest first
    std::vector<std::vector<float>> m_template;    // per channel
    std::vector<float> m_crossfade;
    unsigned m_filled;
    unsigned m_template_length;
    unsigned m_period;          // pitch period of the template, 0 for block repeat
    unsigned m_phase;
    unsigned m_pitch_hint;
    unsigned m_lost;
    float m_gain;
    float m_scale;              // energy limiting applied to the last concealed block
    float m_last_energy;        // mean square of the last emitted block
};

} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // OPUSCONCEALMENT_H
