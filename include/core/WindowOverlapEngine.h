/*
 * WindowOverlapEngine.h - Window shapes and overlap-add state
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef WINDOWOVERLAPENGINE_H
#define WINDOWOVERLAPENGINE_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Core {

enum class WindowShape {
    SINE,
    KBD,
    VORBIS      // sin(pi/2 sin^2(x)), also used by CELT
};

// AAC window_sequence with the shapes of the previous and current frame
struct AacWindow {
    enum Sequence {
        ONLY_LONG = 0,
        LONG_START = 1,
        EIGHT_SHORT = 2,
        LONG_STOP = 3
    };
    Sequence sequence = ONLY_LONG;
    WindowShape previous_shape = WindowShape::SINE;
    WindowShape shape = WindowShape::SINE;
    unsigned frame_length = 1024;
};

// MP3 block_type for one subband: 0 normal, 1 start, 2 short, 3 stop
struct Mp3Window {
    unsigned block_type = 0;
};

struct VorbisWindow {
    unsigned block_size = 0;
    unsigned previous_size = 0;
    unsigned next_size = 0;
};

// CELT: block length is twice the frame, slopes are `overlap` long
struct CeltWindow {
    unsigned frame_size = 960;
    unsigned overlap = 120;
    unsigned short_blocks = 1;
};

using WindowSequence = std::variant<AacWindow, Mp3Window, VorbisWindow, CeltWindow>;

/**
 * @brief Concrete geometry of one block.
 *
 * Each half of a long block is zeros, a slope centred in the half, then
 * ones. A block made of sub-windows places sub-window w at
 * (block_size - sub_size)/4 + w * sub_size/2; each sub-window has full
 * slopes of sub_size/2.
 */
struct WindowLayout {
    unsigned block_size = 0;
    unsigned sub_windows = 1;
    unsigned sub_size = 0;
    unsigned left_slope = 0;
    WindowShape left_shape = WindowShape::SINE;
    unsigned right_slope = 0;
    WindowShape right_shape = WindowShape::SINE;
    WindowShape sub_shape = WindowShape::SINE;
    WindowShape first_sub_left_shape = WindowShape::SINE;
    bool low_overlap = false;   // blocks abut and only their slopes overlap (CELT)
};

/**
 * @brief Windowing and overlap-add with per-channel tails.
 *
 * Consecutive blocks are aligned on their centres, so a block of size N
 * following one of size Np yields Np/4 + N/4 samples (N/2 for fixed-size
 * codecs). The tail of each channel is the second half of its last
 * windowed block.
 *
 * Low-overlap layouts (CELT) instead start each block's output at its
 * rising slope: every block yields exactly N/2 samples and only the
 * slope-long tail is carried, whatever the size of the previous block.
 */
class WindowOverlapEngine {
public:
    WindowOverlapEngine(unsigned channels, size_t max_block_size);

    /**
     * @brief Window one block, overlap-add it with the stored tail and keep
     * the new tail.
     * @param channel Overlap slot (a channel, or a channel/subband pair for MP3)
     * @param transform_output block_size samples, or sub_windows * sub_size
     *        samples laid out one sub-window after another
     * @param sequence Window selection for this block
     * @param pcm Receives outputLength() samples
     * @return Number of samples written
     */
    size_t applyAndOverlap(unsigned channel, const float* transform_output,
                           const WindowSequence& sequence, float* pcm);

    // Convenience form returning the PCM block
    std::vector<float> applyAndOverlap(unsigned channel, const float* transform_output,
                                       const WindowSequence& sequence);

    void reset();
    void resetChannel(unsigned channel);

    // Samples the next block of `block_size` will produce on `channel`
    size_t outputLength(unsigned channel, unsigned block_size) const;
    size_t outputLength(unsigned channel, const WindowLayout& layout) const;
    unsigned channels() const { return static_cast<unsigned>(m_tails.size()); }

    static WindowLayout resolve(const WindowSequence& sequence);

    // Rising slope of `length` samples (the window's left edge)
    const std::vector<float>& slope(WindowShape shape, unsigned length);

    static std::vector<float> makeSlope(WindowShape shape, unsigned length);
    static const char* shapeName(WindowShape shape);

private:
    void checkChannel(unsigned channel) const;
    void windowHalf(float* data, unsigned half, unsigned slope_len, WindowShape shape, bool rising);

    size_t m_max_block_size;
    std::vector<std::vector<float>> m_tails;
    std::vector<unsigned> m_previous_size;
    std::vector<float> m_block;
    std::map<std::pair<int, unsigned>, std::vector<float>> m_slopes;
};

} // namespace Core
} // namespace PsyDec

#endif // WINDOWOVERLAPENGINE_H
