/*
 * test_transform_engine.cpp - Unit tests for the FFT and IMDCT core
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

TransformPath pathForWidth(unsigned width)
{
    switch (width) {
        case 1: return TransformPath::Scalar;
        case 4: return TransformPath::Vec4;
        default: return TransformPath::Vec8;
    }
}

std::vector<float> randomSignal(size_t count, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> out(count);
    for (auto& v : out) {
        v = dist(rng);
    }
    return out;
}

// y[n] = sum_k X[k] cos(2pi/N (n + 1/2 + N/4)(k + 1/2)), evaluated directly
std::vector<double> referenceImdct(const std::vector<float>& coefficients, size_t size)
{
    const size_t half = size / 2;
    const double n0 = 0.5 + static_cast<double>(size) / 4.0;
    std::vector<double> out(size, 0.0);
    for (size_t n = 0; n < size; ++n) {
        double sum = 0.0;
        for (size_t k = 0; k < half; ++k) {
            sum += coefficients[k] * std::cos(2.0 * M_PI / static_cast<double>(size) *
                                              (static_cast<double>(n) + n0) * (static_cast<double>(k) + 0.5));
        }
        out[n] = sum;
    }
    return out;
}

} // namespace

void test_fft_round_trip_all_strategies()
{
    for (const ButterflyStrategy* strategy : Butterfly::available()) {
        TransformEngine engine(8192, pathForWidth(strategy->width));
        ASSERT_EQUALS(std::string(strategy->name), std::string(engine.strategy().name),
                      "Engine runs the requested strategy");

        for (size_t size = 2; size <= 8192; size *= 2) {
            for (int kind = 0; kind < 2; ++kind) {
                std::vector<float> re = kind == 0 ? randomSignal(size, static_cast<unsigned>(size))
                                                  : TestUtil::sine(size / 8.0 + 0.3, static_cast<double>(size), size);
                std::vector<float> im = kind == 0 ? randomSignal(size, static_cast<unsigned>(size) + 1)
                                                  : std::vector<float>(size, 0.0f);
                const std::vector<float> orig_re = re, orig_im = im;

                engine.forwardFFT(re.data(), im.data(), size);
                engine.inverseFFT(re.data(), im.data(), size);

                float error = 0.0f;
                for (size_t i = 0; i < size; ++i) {
                    error = std::max(error, std::fabs(re[i] - orig_re[i]));
                    error = std::max(error, std::fabs(im[i] - orig_im[i]));
                }
                if (error > 1e-5f) {
                    std::ostringstream oss;
                    oss << strategy->name << " round trip at size " << size << " has error " << error;
                    throw AssertionFailure(oss.str());
                }
            }
        }
    }
}

void test_fft_single_bin()
{
    const size_t size = 64;
    TransformEngine engine(size);
    std::vector<float> re(size), im(size, 0.0f);
    for (size_t n = 0; n < size; ++n) {
        re[n] = static_cast<float>(std::cos(2.0 * M_PI * 5.0 * n / size));
    }
    engine.forwardFFT(re.data(), im.data(), size);

    for (size_t k = 0; k < size; ++k) {
        float expected = (k == 5 || k == size - 5) ? size / 2.0f : 0.0f;
        ASSERT_NEAR(expected, re[k], 1e-3, "Real part of bin " + std::to_string(k));
        ASSERT_NEAR(0.0, im[k], 1e-3, "Imaginary part of bin " + std::to_string(k));
    }
}

void test_real_fft_matches_complex()
{
    TransformEngine engine(1024);
    for (size_t size : {4u, 16u, 256u, 1024u}) {
        std::vector<float> input = randomSignal(size, 7);
        std::vector<float> out_re(size / 2 + 1), out_im(size / 2 + 1);
        engine.realFFT(input.data(), out_re.data(), out_im.data(), size);

        std::vector<float> re = input, im(size, 0.0f);
        engine.forwardFFT(re.data(), im.data(), size);
        for (size_t k = 0; k <= size / 2; ++k) {
            ASSERT_NEAR(re[k], out_re[k], 1e-3, "Real FFT real part");
            ASSERT_NEAR(im[k], out_im[k], 1e-3, "Real FFT imaginary part");
        }
    }
}

void test_imdct_matches_direct_reference()
{
    TransformEngine engine(8192);
    // MP3 short/long, AAC short/long, CELT, Vorbis
    const size_t sizes[] = {12, 36, 256, 2048, 240, 480, 960, 1920, 64, 512, 4096, 8192};
    for (size_t size : sizes) {
        std::vector<float> coefficients = randomSignal(size / 2, static_cast<unsigned>(size) * 3);
        std::vector<float> out(size);
        engine.imdct(coefficients.data(), out.data(), size);
        std::vector<double> expected = referenceImdct(coefficients, size);

        double peak = 0.0, error = 0.0;
        for (size_t n = 0; n < size; ++n) {
            peak = std::max(peak, std::fabs(expected[n]));
            error = std::max(error, std::fabs(expected[n] - out[n]));
        }
        if (error > 1e-4 * std::max(1.0, peak)) {
            std::ostringstream oss;
            oss << "IMDCT size " << size << ": error " << error << " against peak " << peak;
            throw AssertionFailure(oss.str());
        }
    }
}

void test_imdct_scale()
{
    TransformEngine engine(2048);
    std::vector<float> coefficients = randomSignal(128, 11);
    std::vector<float> unit(256), scaled(256);
    engine.imdct(coefficients.data(), unit.data(), 256);
    engine.imdct(coefficients.data(), scaled.data(), 256, 0.25f);
    for (float& sample : unit) {
        sample *= 0.25f;
    }
    ASSERT_BUFFER_NEAR(unit, scaled, unit.size(), 1e-5, "Scale applies linearly");
}

void test_mdct_imdct_time_domain_aliasing()
{
    // Sine-windowed MDCT then IMDCT, overlap-added over two blocks, gives
    // back the middle half of the input once the IMDCT is scaled by 4/N
    const size_t size = 256;
    const size_t half = size / 2;
    TransformEngine engine(size);
    std::vector<float> signal = randomSignal(3 * half, 5);
    std::vector<float> window(size);
    for (size_t n = 0; n < size; ++n) {
        window[n] = static_cast<float>(std::sin(M_PI / size * (n + 0.5)));
    }

    std::vector<float> out(2 * size, 0.0f);
    for (size_t block = 0; block < 2; ++block) {
        std::vector<float> in(size), coefs(half), time(size);
        for (size_t n = 0; n < size; ++n) {
            in[n] = signal[block * half + n] * window[n];
        }
        engine.mdct(in.data(), coefs.data(), size);
        engine.imdct(coefs.data(), time.data(), size, 2.0f / half);
        for (size_t n = 0; n < size; ++n) {
            out[block * half + n] += time[n] * window[n];
        }
    }
    ASSERT_BUFFER_NEAR(signal.data() + half, out.data() + half, half, 1e-4, "Perfect reconstruction");
}

void test_unsupported_sizes()
{
    TransformEngine engine(1024);
    std::vector<float> re(2048), im(2048);
    TestUtil::expectDecoderError(DecoderError::UNSUPPORTED_TRANSFORM_SIZE, [&] {
        engine.forwardFFT(re.data(), im.data(), 2048);
    }, "FFT above the limit");
    TestUtil::expectDecoderError(DecoderError::UNSUPPORTED_TRANSFORM_SIZE, [&] {
        engine.forwardFFT(re.data(), im.data(), 100);
    }, "Non power-of-two FFT");
    TestUtil::expectDecoderError(DecoderError::UNSUPPORTED_TRANSFORM_SIZE, [&] {
        engine.imdct(re.data(), im.data(), 30);
    }, "IMDCT size not a multiple of 4");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        TransformEngine bad(1000);
    }, "Engine limit not a power of two");
}

void test_strategy_selection()
{
    ASSERT_EQUALS(1u, Butterfly::select(TransformPath::Scalar).width, "Scalar path");
    ASSERT_TRUE(Butterfly::select(TransformPath::Vec4).width <= 4, "Vec4 never wider than 4");
    ASSERT_TRUE(Butterfly::select(TransformPath::Auto).width >= Butterfly::select(TransformPath::Vec4).width,
                "Auto picks the widest");
    ASSERT_EQUALS(std::string(Butterfly::scalar().name), std::string(Butterfly::available().front()->name),
                  "Scalar is always available");
}

int main(int argc, char* argv[])
{
    TestSuite suite("TransformEngine Tests");

    suite.addTest("FFT Round Trip, Every Strategy", test_fft_round_trip_all_strategies);
    suite.addTest("FFT Single Bin", test_fft_single_bin);
    suite.addTest("Real FFT", test_real_fft_matches_complex);
    suite.addTest("IMDCT Against Direct Evaluation", test_imdct_matches_direct_reference);
    suite.addTest("IMDCT Scale", test_imdct_scale);
    suite.addTest("MDCT/IMDCT Aliasing Cancellation", test_mdct_imdct_time_domain_aliasing);
    suite.addTest("Unsupported Sizes", test_unsupported_sizes);
    suite.addTest("Strategy Selection", test_strategy_selection);

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
