/*
 * WindowOverlapEngine.cpp - Window shapes and overlap-add state
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Core {

namespace {

// Zeroth order modified Bessel function of the first kind
double bessel_i0(double x)
{
    double sum = 1.0;
    double term = 1.0;
    double half = x / 2.0;
    for (int k = 1; k < 50; ++k) {
        term *= (half / k) * (half / k);
        sum += term;
        if (term < sum * 1e-12) {
            break;
        }
    }
    return sum;
}

} // anonymous namespace

WindowOverlapEngine::WindowOverlapEngine(unsigned channels, size_t max_block_size)
    : m_max_block_size(max_block_size)
    , m_tails(channels, std::vector<float>(max_block_size / 2, 0.0f))
    , m_previous_size(channels, 0)
{
    if (channels == 0 || max_block_size < 4) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Window engine needs at least one channel");
    }
    m_block.resize(max_block_size);
}

std::vector<float> WindowOverlapEngine::makeSlope(WindowShape shape, unsigned length)
{
    std::vector<float> w(length);
    switch (shape) {
        case WindowShape::SINE:
            for (unsigned i = 0; i < length; ++i) {
                w[i] = static_cast<float>(std::sin(M_PI / (2.0 * length) * (i + 0.5)));
            }
            break;
        case WindowShape::VORBIS:
            for (unsigned i = 0; i < length; ++i) {
                double s = std::sin(M_PI / (2.0 * length) * (i + 0.5));
                w[i] = static_cast<float>(std::sin(M_PI / 2.0 * s * s));
            }
            break;
        case WindowShape::KBD: {
            // Kaiser-Bessel derived; alpha 4 for long slopes, 6 for short ones
            double alpha = (length <= 128) ? 6.0 : 4.0;
            std::vector<double> kaiser(length + 1);
            double denom = bessel_i0(M_PI * alpha);
            double total = 0.0;
            for (unsigned j = 0; j <= length; ++j) {
                double r = 2.0 * j / length - 1.0;
                kaiser[j] = bessel_i0(M_PI * alpha * std::sqrt(std::max(0.0, 1.0 - r * r))) / denom;
                total += kaiser[j];
            }
            double running = 0.0;
            for (unsigned i = 0; i < length; ++i) {
                running += kaiser[i];
                w[i] = static_cast<float>(std::sqrt(running / total));
            }
            break;
        }
    }
    return w;
}

const char* WindowOverlapEngine::shapeName(WindowShape shape)
{
    switch (shape) {
        case WindowShape::SINE: return "sine";
        case WindowShape::KBD: return "kbd";
        case WindowShape::VORBIS: return "vorbis";
        default: return "unknown";
    }
}

const std::vector<float>& WindowOverlapEngine::slope(WindowShape shape, unsigned length)
{
    auto key = std::make_pair(static_cast<int>(shape), length);
    auto it = m_slopes.find(key);
    if (it == m_slopes.end()) {
        it = m_slopes.emplace(key, makeSlope(shape, length)).first;
    }
    return it->second;
}

WindowLayout WindowOverlapEngine::resolve(const WindowSequence& sequence)
{
    WindowLayout layout;
    std::visit([&layout](const auto& seq) {
        using T = std::decay_t<decltype(seq)>;
        if constexpr (std::is_same_v<T, AacWindow>) {
            unsigned n = 2 * seq.frame_length;
            unsigned short_size = n / 8;
            layout.block_size = n;
            layout.left_shape = seq.previous_shape;
            layout.right_shape = seq.shape;
            layout.sub_shape = seq.shape;
            layout.first_sub_left_shape = seq.previous_shape;
            switch (seq.sequence) {
                case AacWindow::ONLY_LONG:
                    layout.left_slope = n / 2;
                    layout.right_slope = n / 2;
                    break;
                case AacWindow::LONG_START:
                    layout.left_slope = n / 2;
                    layout.right_slope = short_size / 2;
                    break;
                case AacWindow::EIGHT_SHORT:
                    layout.sub_windows = 8;
                    layout.sub_size = short_size;
                    layout.left_slope = short_size / 2;
                    layout.right_slope = short_size / 2;
                    break;
                case AacWindow::LONG_STOP:
                    layout.left_slope = short_size / 2;
                    layout.right_slope = n / 2;
                    break;
            }
        } else if constexpr (std::is_same_v<T, Mp3Window>) {
            layout.block_size = 36;
            layout.left_shape = layout.right_shape = layout.sub_shape = WindowShape::SINE;
            layout.first_sub_left_shape = WindowShape::SINE;
            switch (seq.block_type) {
                case 0:
                    layout.left_slope = 18;
                    layout.right_slope = 18;
                    break;
                case 1:
                    layout.left_slope = 18;
                    layout.right_slope = 6;
                    break;
                case 2:
                    layout.sub_windows = 3;
                    layout.sub_size = 12;
                    layout.left_slope = 6;
                    layout.right_slope = 6;
                    break;
                case 3:
                    layout.left_slope = 6;
                    layout.right_slope = 18;
                    break;
                default:
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                           "Invalid MP3 block type " + std::to_string(seq.block_type));
            }
        } else if constexpr (std::is_same_v<T, VorbisWindow>) {
            unsigned n = seq.block_size;
            unsigned prev = seq.previous_size ? seq.previous_size : n;
            unsigned next = seq.next_size ? seq.next_size : n;
            layout.block_size = n;
            layout.left_slope = std::min(prev, n) / 2;
            layout.right_slope = std::min(next, n) / 2;
            layout.left_shape = layout.right_shape = WindowShape::VORBIS;
            layout.sub_shape = layout.first_sub_left_shape = WindowShape::VORBIS;
        } else if constexpr (std::is_same_v<T, CeltWindow>) {
            unsigned n = 2 * seq.frame_size;
            layout.block_size = n;
            layout.left_shape = layout.right_shape = WindowShape::VORBIS;
            layout.sub_shape = layout.first_sub_left_shape = WindowShape::VORBIS;
            layout.left_slope = seq.overlap;
            layout.right_slope = seq.overlap;
            layout.low_overlap = true;
            if (seq.short_blocks > 1) {
                layout.sub_windows = seq.short_blocks;
                layout.sub_size = n / seq.short_blocks;
                if (layout.sub_size != 2 * seq.overlap) {
                    throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                                           "CELT short block size does not match overlap");
                }
            }
        }
    }, sequence);

    if (layout.block_size < 4 || layout.left_slope > layout.block_size / 2 ||
        layout.right_slope > layout.block_size / 2) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                               "Invalid window layout for block size " + std::to_string(layout.block_size));
    }
    return layout;
}

void WindowOverlapEngine::checkChannel(unsigned channel) const
{
    if (channel >= m_tails.size()) {
        throw std::out_of_range("WindowOverlapEngine: channel " + std::to_string(channel) + " out of range");
    }
}

/**
 * @brief Multiply one half of a block by its edge.
 *
 * A rising half is zeros, the slope, then ones; a falling half is the
 * mirror image. The slope is centred in the half.
 */
void WindowOverlapEngine::windowHalf(float* data, unsigned half, unsigned slope_len, WindowShape shape, bool rising)
{
    unsigned zeros = (half - slope_len) / 2;
    const std::vector<float>& w = slope(shape, slope_len);
    for (unsigned i = 0; i < half; ++i) {
        unsigned pos = rising ? i : half - 1 - i;
        float g;
        if (pos < zeros) {
            g = 0.0f;
        } else if (pos < zeros + slope_len) {
            g = w[pos - zeros];
        } else {
            g = 1.0f;
        }
        data[i] *= g;
    }
}

size_t WindowOverlapEngine::outputLength(unsigned channel, unsigned block_size) const
{
    checkChannel(channel);
    unsigned prev = m_previous_size[channel] ? m_previous_size[channel] : block_size;
    return prev / 4 + block_size / 4;
}

size_t WindowOverlapEngine::outputLength(unsigned channel, const WindowLayout& layout) const
{
    if (layout.low_overlap) {
        checkChannel(channel);
        return layout.block_size / 2;
    }
    return outputLength(channel, layout.block_size);
}

size_t WindowOverlapEngine::applyAndOverlap(unsigned channel, const float* transform_output,
                                            const WindowSequence& sequence, float* pcm)
{
    checkChannel(channel);
    WindowLayout layout = resolve(sequence);
    const unsigned n = layout.block_size;
    if (n > m_max_block_size) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                               "Block size " + std::to_string(n) + " exceeds window engine limit " +
                               std::to_string(m_max_block_size));
    }

    float* block = m_block.data();
    if (layout.sub_windows <= 1) {
        std::copy(transform_output, transform_output + n, block);
        windowHalf(block, n / 2, layout.left_slope, layout.left_shape, true);
        windowHalf(block + n / 2, n / 2, layout.right_slope, layout.right_shape, false);
    } else {
        const unsigned s = layout.sub_size;
        std::fill(block, block + n, 0.0f);
        std::vector<float> sub(s);
        for (unsigned w = 0; w < layout.sub_windows; ++w) {
            const float* src = transform_output + static_cast<size_t>(w) * s;
            std::copy(src, src + s, sub.begin());
            WindowShape left = (w == 0) ? layout.first_sub_left_shape : layout.sub_shape;
            windowHalf(sub.data(), s / 2, s / 2, left, true);
            windowHalf(sub.data() + s / 2, s / 2, s / 2, layout.sub_shape, false);
            unsigned offset = (n - s) / 4 + w * (s / 2);
            for (unsigned i = 0; i < s; ++i) {
                block[offset + i] += sub[i];
            }
        }
    }

    if (layout.low_overlap) {
        // Output starts at the rising slope; the falling slope becomes the tail
        const unsigned frame = n / 2;
        const unsigned zeros = (frame - layout.left_slope) / 2;
        std::vector<float>& tail = m_tails[channel];
        for (unsigned t = 0; t < frame; ++t) {
            pcm[t] = block[zeros + t] + (t < layout.left_slope ? tail[t] : 0.0f);
        }
        std::copy(block + zeros + frame, block + zeros + frame + layout.right_slope, tail.begin());
        m_previous_size[channel] = n;
        return frame;
    }

    // Centre-aligned overlap-add with the previous block's second half
    const unsigned prev = m_previous_size[channel] ? m_previous_size[channel] : n;
    const long shift = static_cast<long>(prev / 4) - static_cast<long>(n / 4);
    const size_t count = prev / 4 + n / 4;
    std::vector<float>& tail = m_tails[channel];
    for (size_t t = 0; t < count; ++t) {
        float v = (t < prev / 2) ? tail[t] : 0.0f;
        long idx = static_cast<long>(t) - shift;
        if (idx >= 0 && idx < static_cast<long>(n)) {
            v += block[idx];
        }
        pcm[t] = v;
    }

    std::copy(block + n / 2, block + n, tail.begin());
    m_previous_size[channel] = n;
    return count;
}

std::vector<float> WindowOverlapEngine::applyAndOverlap(unsigned channel, const float* transform_output,
                                                        const WindowSequence& sequence)
{
    WindowLayout layout = resolve(sequence);
    std::vector<float> pcm(outputLength(channel, layout));
    size_t written = applyAndOverlap(channel, transform_output, sequence, pcm.data());
    pcm.resize(written);
    return pcm;
}

void WindowOverlapEngine::reset()
{
    for (auto& tail : m_tails) {
        std::fill(tail.begin(), tail.end(), 0.0f);
    }
    std::fill(m_previous_size.begin(), m_previous_size.end(), 0u);
}

void WindowOverlapEngine::resetChannel(unsigned channel)
{
    checkChannel(channel);
    std::fill(m_tails[channel].begin(), m_tails[channel].end(), 0.0f);
    m_previous_size[channel] = 0;
}

} // namespace Core
} // namespace PsyDec
