/*
 * StereoProcessor.h - Joint stereo reconstruction shared by the decoders
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef STEREOPROCESSOR_H
#define STEREOPROCESSOR_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Core {

// Left/right gains applied to the single transmitted intensity band
struct IntensityGains {
    float left;
    float right;
};

/**
 * @brief Spectral-domain stereo tools.
 *
 * All operations work in place on coefficient ranges [begin, end). The
 * processor knows the stream's channel count so that a stereo tool
 * signalled on a mono stream is reported instead of silently ignored.
 */
class StereoProcessor {
public:
    explicit StereoProcessor(unsigned channels);

    // left = (M + S) * scale, right = (M - S) * scale
    void applyMidSide(float* left, float* right, size_t begin, size_t end, float scale = 1.0f) const;

    // right = left * gains.right, left *= gains.left
    void applyIntensity(float* left, float* right, size_t begin, size_t end, const IntensityGains& gains) const;

    /**
     * @brief Gains for an MP3 intensity position.
     * @param is_pos Transmitted scalefactor of the right channel
     * @param lsf True for MPEG-2/2.5 streams
     * @param intensity_scale scalefac_compress bit 0 (LSF only)
     * @param illegal_pos Position value meaning "no intensity" for this band
     * @return nullopt when the band falls back to plain stereo
     */
    static std::optional<IntensityGains> mp3IntensityGains(unsigned is_pos, bool lsf,
                                                            unsigned intensity_scale, unsigned illegal_pos);

    // AAC: right = left * sign * 0.5^(position / 4), left is untouched
    static IntensityGains aacIntensityGains(int position, int sign);

    // Vorbis square polar mapping, one magnitude/angle pair per bin
    void applyVorbisCoupling(float* magnitude, float* angle, size_t count) const;

    // Opus hybrid: out[i] += celt[i]
    static void mixHybrid(float* out, const float* celt, size_t count);

    // Throws CORRUPT_SIDE_INFO if the stream is not stereo
    void requireStereo(const char* tool) const;

    unsigned channels() const { return m_channels; }

private:
    unsigned m_channels;
};

} // namespace Core
} // namespace PsyDec

#endif // STEREOPROCESSOR_H
