/*
 * StereoProcessor.cpp - Joint stereo reconstruction shared by the decoders
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Core {

StereoProcessor::StereoProcessor(unsigned channels)
    : m_channels(channels)
{
}

void StereoProcessor::requireStereo(const char* tool) const
{
    if (m_channels != 2) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               std::string(tool) + " signalled on a " + std::to_string(m_channels) +
                               " channel stream");
    }
}

void StereoProcessor::applyMidSide(float* left, float* right, size_t begin, size_t end, float scale) const
{
    requireStereo("mid/side stereo");
    for (size_t i = begin; i < end; ++i) {
        float m = left[i];
        float s = right[i];
        left[i] = (m + s) * scale;
        right[i] = (m - s) * scale;
    }
}

void StereoProcessor::applyIntensity(float* left, float* right, size_t begin, size_t end,
                                     const IntensityGains& gains) const
{
    requireStereo("intensity stereo");
    for (size_t i = begin; i < end; ++i) {
        float x = left[i];
        left[i] = x * gains.left;
        right[i] = x * gains.right;
    }
}

std::optional<IntensityGains> StereoProcessor::mp3IntensityGains(unsigned is_pos, bool lsf,
                                                                 unsigned intensity_scale, unsigned illegal_pos)
{
    if (is_pos == illegal_pos) {
        return std::nullopt;
    }

    if (!lsf) {
        // MPEG-1: ratio tan(is_pos * pi / 12), positions 0..6
        if (is_pos >= 7) {
            return std::nullopt;
        }
        if (is_pos == 6) {
            return IntensityGains{1.0f, 0.0f};
        }
        double ratio = std::tan(is_pos * M_PI / 12.0);
        return IntensityGains{static_cast<float>(ratio / (1.0 + ratio)),
                              static_cast<float>(1.0 / (1.0 + ratio))};
    }

    // MPEG-2 LSF: one channel keeps the value, the other is scaled by io^k
    double io = std::pow(2.0, -(1.0 + intensity_scale) / 4.0);
    if (is_pos == 0) {
        return IntensityGains{1.0f, 1.0f};
    }
    if (is_pos & 1) {
        return IntensityGains{static_cast<float>(std::pow(io, (is_pos + 1) / 2)), 1.0f};
    }
    return IntensityGains{1.0f, static_cast<float>(std::pow(io, is_pos / 2))};
}

IntensityGains StereoProcessor::aacIntensityGains(int position, int sign)
{
    float scale = static_cast<float>(std::pow(0.5, 0.25 * position));
    return IntensityGains{1.0f, sign < 0 ? -scale : scale};
}

void StereoProcessor::applyVorbisCoupling(float* magnitude, float* angle, size_t count) const
{
    if (m_channels < 2) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Vorbis coupling on a mono stream");
    }
    for (size_t i = 0; i < count; ++i) {
        float m = magnitude[i];
        float a = angle[i];
        float new_m, new_a;
        if (m > 0.0f) {
            if (a > 0.0f) {
                new_m = m;
                new_a = m - a;
            } else {
                new_a = m;
                new_m = m + a;
            }
        } else {
            if (a > 0.0f) {
                new_m = m;
                new_a = m + a;
            } else {
                new_a = m;
                new_m = m - a;
            }
        }
        magnitude[i] = new_m;
        angle[i] = new_a;
    }
}

void StereoProcessor::mixHybrid(float* out, const float* celt, size_t count)
{
    for (size_t i = 0; i < count; ++i) {
        out[i] += celt[i];
    }
}

} // namespace Core
} // namespace PsyDec
