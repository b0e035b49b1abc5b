/*
 * test_window_overlap.cpp - Unit tests for windowing and overlap-add
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_utils.h"

using namespace PsyDec;
using namespace PsyDec::Core;
using namespace TestFramework;

namespace {

// One half of a block window: zeros, the slope centred in the half, ones
void fillHalf(float* w, unsigned half, unsigned slope_len, WindowShape shape, bool rising)
{
    std::vector<float> slope = WindowOverlapEngine::makeSlope(shape, slope_len);
    unsigned zeros = (half - slope_len) / 2;
    for (unsigned i = 0; i < half; ++i) {
        unsigned pos = rising ? i : half - 1 - i;
        w[i] = pos < zeros ? 0.0f : (pos < zeros + slope_len ? slope[pos - zeros] : 1.0f);
    }
}

/**
 * Runs `signal` through analysis (windowed MDCT) and synthesis (IMDCT plus
 * WindowOverlapEngine) for the given block sequence and checks every output
 * block after the first against the input.
 */
void checkReconstruction(const std::vector<WindowSequence>& blocks, const std::string& what)
{
    TransformEngine transform(4096);
    WindowOverlapEngine engine(1, 4096);
    std::vector<float> signal = TestUtil::sine(997.0, 48000.0, 16384, 0.5);
    for (size_t i = 0; i < signal.size(); ++i) {
        signal[i] += 0.25f * static_cast<float>(std::sin(0.0123 * i * i / 100.0));
    }

    long center = 0;
    unsigned prev = 0;
    for (size_t b = 0; b < blocks.size(); ++b) {
        WindowLayout layout = WindowOverlapEngine::resolve(blocks[b]);
        const unsigned n = layout.block_size;
        center = (b == 0) ? static_cast<long>(n / 2)
                          : center + static_cast<long>(layout.low_overlap ? n / 2 : prev / 4 + n / 4);
        const long previous_center = (b == 0) ? 0 : center - static_cast<long>(prev / 4 + n / 4);
        const long start = center - static_cast<long>(n / 2);

        std::vector<float> time(n, 0.0f);
        if (layout.sub_windows <= 1) {
            std::vector<float> w(n), x(n), coefs(n / 2);
            fillHalf(w.data(), n / 2, layout.left_slope, layout.left_shape, true);
            fillHalf(w.data() + n / 2, n / 2, layout.right_slope, layout.right_shape, false);
            for (unsigned i = 0; i < n; ++i) {
                x[i] = signal[start + i] * w[i];
            }
            transform.mdct(x.data(), coefs.data(), n);
            transform.imdct(coefs.data(), time.data(), n, 4.0f / n);
        } else {
            const unsigned s = layout.sub_size;
            for (unsigned sub = 0; sub < layout.sub_windows; ++sub) {
                std::vector<float> w(s), x(s), coefs(s / 2);
                fillHalf(w.data(), s / 2, s / 2, sub == 0 ? layout.first_sub_left_shape : layout.sub_shape, true);
                fillHalf(w.data() + s / 2, s / 2, s / 2, layout.sub_shape, false);
                const long offset = start + (n - s) / 4 + sub * (s / 2);
                for (unsigned i = 0; i < s; ++i) {
                    x[i] = signal[offset + i] * w[i];
                }
                transform.mdct(x.data(), coefs.data(), s);
                transform.imdct(coefs.data(), time.data() + sub * s, s, 4.0f / s);
            }
        }

        std::vector<float> pcm = engine.applyAndOverlap(0, time.data(), blocks[b]);
        if (b > 0) {
            const long first = layout.low_overlap ? start + (n / 2 - layout.left_slope) / 2 : previous_center;
            for (size_t t = 0; t < pcm.size(); ++t) {
                if (std::fabs(pcm[t] - signal[first + t]) > 1e-4f) {
                    std::ostringstream oss;
                    oss << what << ": block " << b << " sample " << t << " is " << pcm[t]
                        << ", input was " << signal[first + t];
                    throw AssertionFailure(oss.str());
                }
            }
        }
        prev = n;
    }
}

AacWindow aac(AacWindow::Sequence sequence, WindowShape previous, WindowShape shape)
{
    AacWindow w;
    w.sequence = sequence;
    w.previous_shape = previous;
    w.shape = shape;
    w.frame_length = 128;
    return w;
}

} // namespace

void test_princen_bradley()
{
    const WindowShape shapes[] = {WindowShape::SINE, WindowShape::KBD, WindowShape::VORBIS};
    const unsigned lengths[] = {6, 18, 60, 120, 128, 1024};
    for (WindowShape shape : shapes) {
        for (unsigned length : lengths) {
            std::vector<float> w = WindowOverlapEngine::makeSlope(shape, length);
            for (unsigned i = 0; i < length; ++i) {
                double sum = static_cast<double>(w[i]) * w[i] +
                             static_cast<double>(w[length - 1 - i]) * w[length - 1 - i];
                ASSERT_NEAR(1.0, sum, 1e-5, std::string(WindowOverlapEngine::shapeName(shape)) + " slope " +
                                            std::to_string(length) + " at " + std::to_string(i));
            }
            ASSERT_TRUE(w.front() < w.back(), "Slope rises");
        }
    }
}

void test_aac_block_switching()
{
    const WindowShape S = WindowShape::SINE;
    const WindowShape K = WindowShape::KBD;
    checkReconstruction({
        aac(AacWindow::ONLY_LONG, S, S),
        aac(AacWindow::ONLY_LONG, S, K),
        aac(AacWindow::LONG_START, K, S),
        aac(AacWindow::EIGHT_SHORT, S, S),
        aac(AacWindow::EIGHT_SHORT, S, K),
        aac(AacWindow::LONG_STOP, K, K),
        aac(AacWindow::ONLY_LONG, K, S),
        aac(AacWindow::ONLY_LONG, S, S),
    }, "AAC");
}

void test_mp3_block_types()
{
    std::vector<WindowSequence> blocks;
    for (unsigned type : {0u, 0u, 1u, 2u, 2u, 3u, 0u, 1u, 3u, 0u}) {
        blocks.push_back(Mp3Window{type});
    }
    checkReconstruction(blocks, "MP3");
}

void test_vorbis_variable_blocks()
{
    // Long 512 and short 64 blocks, each knowing its neighbours
    const unsigned sizes[] = {512, 512, 64, 64, 64, 512, 64, 512, 512};
    const size_t count = sizeof(sizes) / sizeof(sizes[0]);
    std::vector<WindowSequence> blocks;
    for (size_t i = 0; i < count; ++i) {
        VorbisWindow w;
        w.block_size = sizes[i];
        w.previous_size = i > 0 ? sizes[i - 1] : sizes[i];
        w.next_size = i + 1 < count ? sizes[i + 1] : sizes[i];
        blocks.push_back(w);
    }
    checkReconstruction(blocks, "Vorbis");
}

void test_celt_low_overlap()
{
    std::vector<WindowSequence> blocks;
    for (int i = 0; i < 6; ++i) {
        CeltWindow w;
        w.frame_size = 480;
        w.overlap = 120;
        blocks.push_back(w);
    }
    checkReconstruction(blocks, "CELT");

    WindowOverlapEngine engine(1, 1920);
    CeltWindow w;
    ASSERT_EQUALS(size_t(960), engine.outputLength(0, WindowOverlapEngine::resolve(w)),
                  "Low-overlap blocks yield half their size");
}

void test_output_lengths()
{
    WindowOverlapEngine engine(2, 2048);
    ASSERT_EQUALS(size_t(128), engine.outputLength(0, 256), "First block assumes an equal predecessor");

    std::vector<float> block(2048, 0.0f);
    VorbisWindow longw{2048, 2048, 256};
    engine.applyAndOverlap(0, block.data(), longw);
    ASSERT_EQUALS(size_t(512 + 64), engine.outputLength(0, 256), "Long then short");
    ASSERT_EQUALS(size_t(128), engine.outputLength(1, 256), "Channels are independent");

    engine.reset();
    ASSERT_EQUALS(size_t(128), engine.outputLength(0, 256), "Reset forgets the previous block");
}

void test_reset_clears_tail()
{
    WindowOverlapEngine engine(1, 256);
    std::vector<float> ones(256, 1.0f);
    Mp3Window normal{0};
    engine.applyAndOverlap(0, ones.data(), normal);
    engine.reset();

    std::vector<float> zeros(36, 0.0f);
    std::vector<float> pcm = engine.applyAndOverlap(0, zeros.data(), normal);
    ASSERT_TRUE(TestUtil::maxAbs(pcm.data(), pcm.size()) == 0.0f, "No tail after reset");
}

void test_invalid_inputs()
{
    WindowOverlapEngine engine(1, 256);
    std::vector<float> block(512, 0.0f);
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
        engine.applyAndOverlap(0, block.data(), Mp3Window{4});
    }, "MP3 block type 4");
    TestUtil::expectDecoderError(DecoderError::UNSUPPORTED_TRANSFORM_SIZE, [&] {
        engine.applyAndOverlap(0, block.data(), VorbisWindow{512, 512, 512});
    }, "Block larger than the engine");
    TestPatterns::assertThrows<std::out_of_range>([&] {
        engine.applyAndOverlap(1, block.data(), Mp3Window{0});
    });
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        WindowOverlapEngine none(0, 256);
    }, "No channels");
}

int main(int argc, char* argv[])
{
    TestSuite suite("WindowOverlapEngine Tests");

    suite.addTest("Princen-Bradley Condition", test_princen_bradley);
    suite.addTest("AAC Block Switching Without Clicks", test_aac_block_switching);
    suite.addTest("MP3 Block Types Without Clicks", test_mp3_block_types);
    suite.addTest("Vorbis Variable Blocks Without Clicks", test_vorbis_variable_blocks);
    suite.addTest("CELT Low Overlap", test_celt_low_overlap);
    suite.addTest("Output Lengths", test_output_lengths);
    suite.addTest("Reset Clears Tail", test_reset_clears_tail);
    suite.addTest("Invalid Inputs", test_invalid_inputs);

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
