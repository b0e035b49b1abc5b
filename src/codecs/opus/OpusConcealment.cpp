/*
 * OpusConcealment.cpp - Packet loss concealment for the Opus decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace Opus {

namespace {

constexpr float kVoicingThreshold = 0.6f;

float meanSquare(const float* pcm, size_t count)
{
    if (count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(pcm[i]) * pcm[i];
    }
    return static_cast<float>(sum / count);
}

} // namespace

OpusConcealment::OpusConcealment(unsigned channels, const DecoderConfig& config)
    : m_config(config)
    , m_channels(channels)
    , m_history(channels, std::vector<float>(HISTORY, 0.0f))
    , m_template(channels)
    , m_crossfade(Core::WindowOverlapEngine::makeSlope(Core::WindowShape::VORBIS, CROSSFADE))
    , m_filled(0)
    , m_template_length(0)
    , m_period(0)
    , m_phase(0)
    , m_pitch_hint(0)
    , m_lost(0)
    , m_gain(1.0f)
    , m_scale(1.0f)
    , m_last_energy(0.0f)
{
    if (channels == 0 || channels > 2) {
        throw std::invalid_argument("OpusConcealment: channels must be 1 or 2");
    }
}

void OpusConcealment::reset()
{
    for (auto& h : m_history) {
        std::fill(h.begin(), h.end(), 0.0f);
    }
    for (auto& t : m_template) {
        t.clear();
    }
    m_filled = 0;
    m_template_length = 0;
    m_period = 0;
    m_phase = 0;
    m_pitch_hint = 0;
    m_lost = 0;
    m_gain = 1.0f;
    m_scale = 1.0f;
    m_last_energy = 0.0f;
}

void OpusConcealment::pushHistory(const float* pcm, unsigned frame_size)
{
    unsigned n = std::min(frame_size, HISTORY);
    const float* src = pcm + static_cast<size_t>(frame_size - n) * m_channels;
    for (unsigned c = 0; c < m_channels; ++c) {
        auto& h = m_history[c];
        std::move(h.begin() + n, h.end(), h.begin());
        float* dst = h.data() + (HISTORY - n);
        for (unsigned i = 0; i < n; ++i) {
            dst[i] = src[i * m_channels + c];
        }
    }
    m_filled = std::min(HISTORY, m_filled + frame_size);
}

unsigned OpusConcealment::findPitch() const
{
    unsigned max_lag = std::min(MAX_PITCH, m_filled / 2);
    if (max_lag < MIN_PITCH) {
        return 0;
    }
    unsigned window = std::min(m_filled - max_lag, 960u);

    std::vector<float> mono(window + max_lag);
    const size_t base = HISTORY - mono.size();
    for (size_t i = 0; i < mono.size(); ++i) {
        float sum = 0.0f;
        for (unsigned c = 0; c < m_channels; ++c) {
            sum += m_history[c][base + i];
        }
        mono[i] = sum / static_cast<float>(m_channels);
    }

    const float* recent = mono.data() + max_lag;
    double recent_energy = 0.0;
    for (unsigned i = 0; i < window; ++i) {
        recent_energy += static_cast<double>(recent[i]) * recent[i];
    }
    if (recent_energy <= 1e-9) {
        return 0;
    }

    unsigned best_lag = 0;
    double best = 0.0;
    for (unsigned lag = MIN_PITCH; lag <= max_lag; ++lag) {
        const float* past = recent - lag;
        double xy = 0.0;
        double yy = 0.0;
        for (unsigned i = 0; i < window; ++i) {
            xy += static_cast<double>(recent[i]) * past[i];
            yy += static_cast<double>(past[i]) * past[i];
        }
        if (xy <= 0.0 || yy <= 1e-9) {
            continue;
        }
        double score = xy / std::sqrt(recent_energy * yy);
        if (score > best) {
            best = score;
            best_lag = lag;
        }
    }
    return best >= kVoicingThreshold ? best_lag : 0;
}

void OpusConcealment::buildTemplate(unsigned frame_size)
{
    m_period = 0;
    if (m_pitch_hint >= MIN_PITCH && m_pitch_hint <= MAX_PITCH && m_pitch_hint <= m_filled) {
        m_period = m_pitch_hint;
    } else {
        m_period = findPitch();
    }

    m_template_length = m_period ? m_period : std::min(frame_size, m_filled);
    for (unsigned c = 0; c < m_channels; ++c) {
        const auto& h = m_history[c];
        m_template[c].assign(h.end() - m_template_length, h.end());
    }
    m_phase = 0;

    Debug::log("plc", "OpusConcealment::buildTemplate() ",
               m_period ? "pitch repeat, period " : "block repeat, length ",
               m_template_length);
}

float OpusConcealment::templateSample(unsigned channel, unsigned position) const
{
    if (m_template_length == 0) {
        return 0.0f;
    }
    return m_template[channel][position % m_template_length];
}

void OpusConcealment::conceal(float* pcm, unsigned frame_size)
{
    if (m_lost == 0) {
        buildTemplate(frame_size);
    }
    ++m_lost;

    const unsigned fade_frames = std::max(1u, m_config.plc_fade_frames);
    const float start_gain = m_gain;
    const float end_gain = m_lost >= fade_frames
                               ? 0.0f
                               : 1.0f - static_cast<float>(m_lost) / static_cast<float>(fade_frames);
    const float step = (end_gain - start_gain) / static_cast<float>(std::max(1u, frame_size));

    for (unsigned i = 0; i < frame_size; ++i) {
        float g = start_gain + step * static_cast<float>(i + 1);
        for (unsigned c = 0; c < m_channels; ++c) {
            pcm[i * m_channels + c] = templateSample(c, m_phase + i) * g;
        }
    }

    // Never louder than the block before it
    const size_t count = static_cast<size_t>(frame_size) * m_channels;
    float energy = meanSquare(pcm, count);
    m_scale = 1.0f;
    if (energy > m_last_energy && energy > 0.0f) {
        m_scale = std::sqrt(m_last_energy / energy);
        for (size_t i = 0; i < count; ++i) {
            pcm[i] *= m_scale;
        }
        energy = meanSquare(pcm, count);
        if (energy > m_last_energy) {
            energy = m_last_energy;
        }
    }

    m_phase = m_template_length ? (m_phase + frame_size) % m_template_length : 0;
    m_gain = end_gain;
    m_last_energy = energy;

    Debug::log("plc", "OpusConcealment::conceal() lost ", m_lost, " gain ", m_gain,
               " energy ", m_last_energy);
}

void OpusConcealment::update(float* pcm, unsigned frame_size, unsigned pitch_lag)
{
    const size_t count = static_cast<size_t>(frame_size) * m_channels;

    if (m_lost > 0 && frame_size > 0) {
        // Ramp up from the concealed level when the new block is louder
        float energy = meanSquare(pcm, count);
        if (energy > m_last_energy) {
            float gain = std::sqrt(m_last_energy / energy);
            float slope = 4.0f * (1.0f - gain) / static_cast<float>(frame_size);
            for (unsigned i = 0; i < frame_size && gain < 1.0f; ++i) {
                for (unsigned c = 0; c < m_channels; ++c) {
                    pcm[i * m_channels + c] *= gain;
                }
                gain = std::min(1.0f, gain + slope);
            }
        }

        if (m_template_length > 0) {
            const unsigned length = std::min(frame_size, CROSSFADE);
            std::vector<float> local;
            const float* w = m_crossfade.data();
            if (length != CROSSFADE) {
                local = Core::WindowOverlapEngine::makeSlope(Core::WindowShape::VORBIS, length);
                w = local.data();
            }
            const float level = m_gain * m_scale;
            for (unsigned i = 0; i < length; ++i) {
                float fade_in = w[i] * w[i];
                for (unsigned c = 0; c < m_channels; ++c) {
                    float concealed = templateSample(c, m_phase + i) * level;
                    float& out = pcm[i * m_channels + c];
                    out = fade_in * out + (1.0f - fade_in) * concealed;
                }
            }
        }

        Debug::log("plc", "OpusConcealment::update() recovered after ", m_lost, " lost frames");
        m_lost = 0;
        m_gain = 1.0f;
        m_scale = 1.0f;
    }

    pushHistory(pcm, frame_size);
    m_pitch_hint = pitch_lag;
    m_last_energy = meanSquare(pcm, count);
}

} // namespace Opus
} // namespace Codec
} // namespace PsyDec
