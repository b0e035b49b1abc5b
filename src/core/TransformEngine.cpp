/*
 * TransformEngine.cpp - FFT, real FFT and MDCT/IMDCT for all decoders
 * This file is part of PsyDec.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2011-2025 Mattis Michel <sic_zer0@hotmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "psydec.h"

namespace PsyDec {
namespace Core {

namespace {

// Inner transforms up to this length that are not a power of two use a
// direct DFT; longer ones go through Bluestein.
constexpr size_t kDirectDftLimit = 64;

unsigned log2_exact(size_t n)
{
    unsigned bits = 0;
    while ((size_t(1) << bits) < n) {
        ++bits;
    }
    return bits;
}

/**
 * @brief Performs bit-reversal on an integer index.
 * @param in The integer index to reverse.
 * @param bits The number of bits in the index (log2 of the FFT size).
 */
unsigned int bitreverse(unsigned int in, unsigned bits)
{
    unsigned int out = 0;
    while (bits--) {
        out |= (in & 1) << bits;
        in >>= 1;
    }
    return out;
}

} // anonymous namespace

/**
 * @brief Constructs a transform engine for sizes up to max_size.
 * @param max_size Largest FFT length, a power of two.
 * @param path Butterfly path limit; the widest supported path at or below it is used.
 *
 * The bit-reversal permutation for max_size and the per-stage twiddle
 * factors (complex roots of unity) are computed here once.
 */
TransformEngine::TransformEngine(size_t max_size, TransformPath path)
    : m_max_size(max_size)
    , m_max_bits(0)
    , m_strategy(&Butterfly::select(path))
{
    if (!isPowerOfTwo(max_size) || max_size < 4) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Transform size limit must be a power of two >= 4, got " + std::to_string(max_size));
    }
    m_max_bits = log2_exact(max_size);

    m_bitrev.resize(max_size);
    for (size_t i = 0; i < max_size; ++i) {
        m_bitrev[i] = bitreverse(static_cast<unsigned int>(i), m_max_bits);
    }

    // Stage with half-length h reads w_k = e^{-i pi k / h} at [h - 1 + k].
    // The layout does not depend on the transform size, so one table
    // serves every size up to max_size.
    m_twiddle_re.resize(max_size - 1);
    m_twiddle_im.resize(max_size - 1);
    for (size_t h = 1; h < max_size; h <<= 1) {
        for (size_t k = 0; k < h; ++k) {
            double angle = -M_PI * static_cast<double>(k) / static_cast<double>(h);
            m_twiddle_re[h - 1 + k] = static_cast<float>(std::cos(angle));
            m_twiddle_im[h - 1 + k] = static_cast<float>(std::sin(angle));
        }
    }

    Debug::log("transform", "TransformEngine::TransformEngine() max size ", max_size,
               ", butterfly path ", m_strategy->name);
}

void TransformEngine::checkFFTSize(size_t size) const
{
    if (!isPowerOfTwo(size) || size > m_max_size) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                               "FFT size " + std::to_string(size) + " unsupported (max " +
                               std::to_string(m_max_size) + ", power of two only)");
    }
}

/**
 * @brief Bit-reversal permutation followed by the iterative butterfly stages.
 *
 * Stages whose half-length is at least the strategy width go through the
 * platform butterfly; the first few narrow stages use the scalar one.
 */
void TransformEngine::runStages(float* re, float* im, size_t size) const
{
    if (size < 2) {
        return;
    }
    unsigned shift = m_max_bits - log2_exact(size);
    for (size_t i = 0; i < size; ++i) {
        size_t r = m_bitrev[i] >> shift;
        if (r > i) {
            std::swap(re[i], re[r]);
            std::swap(im[i], im[r]);
        }
    }

    const ButterflyStrategy& narrow = Butterfly::scalar();
    for (size_t h = 1; h < size; h <<= 1) {
        const ButterflyStrategy& s = (h >= m_strategy->width) ? *m_strategy : narrow;
        const float* w_re = m_twiddle_re.data() + h - 1;
        const float* w_im = m_twiddle_im.data() + h - 1;
        for (size_t j = 0; j < size; j += (h << 1)) {
            s.op(re + j, im + j, re + j + h, im + j + h, w_re, w_im, h);
        }
    }
}

void TransformEngine::forwardFFT(float* re, float* im, size_t size) const
{
    checkFFTSize(size);
    runStages(re, im, size);
}

void TransformEngine::inverseFFT(float* re, float* im, size_t size) const
{
    checkFFTSize(size);
    // conj(FFT(conj(x))) / N
    for (size_t i = 0; i < size; ++i) {
        im[i] = -im[i];
    }
    runStages(re, im, size);
    float scale = 1.0f / static_cast<float>(size);
    for (size_t i = 0; i < size; ++i) {
        re[i] *= scale;
        im[i] = -im[i] * scale;
    }
}

/**
 * @brief Half-length complex FFT of real input.
 *
 * Even samples go to the real part and odd samples to the imaginary part of
 * a size/2 complex sequence; the spectrum is then split and recombined with
 * the last-stage twiddles.
 */
void TransformEngine::realFFT(const float* input, float* out_re, float* out_im, size_t size)
{
    checkFFTSize(size);
    if (size < 2) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE, "Real FFT needs at least 2 samples");
    }
    size_t m = size / 2;
    m_real_work_re.resize(m);
    m_real_work_im.resize(m);
    for (size_t k = 0; k < m; ++k) {
        m_real_work_re[k] = input[2 * k];
        m_real_work_im[k] = input[2 * k + 1];
    }
    runStages(m_real_work_re.data(), m_real_work_im.data(), m);

    for (size_t k = 0; k <= m; ++k) {
        size_t a = k % m;
        size_t b = (m - k) % m;
        float zr = m_real_work_re[a], zi = m_real_work_im[a];
        float cr = m_real_work_re[b], ci = -m_real_work_im[b];
        // E = (Z[k] + conj Z[m-k]) / 2, O = (Z[k] - conj Z[m-k]) / 2i
        float er = 0.5f * (zr + cr), ei = 0.5f * (zi + ci);
        float or_ = 0.5f * (zi - ci), oi = -0.5f * (zr - cr);
        float wr, wi;
        if (k < m) {
            wr = m_twiddle_re[m - 1 + k];
            wi = m_twiddle_im[m - 1 + k];
        } else {
            wr = -1.0f;
            wi = 0.0f;
        }
        out_re[k] = er + (or_ * wr - oi * wi);
        out_im[k] = ei + (or_ * wi + oi * wr);
    }
}

TransformEngine::ImdctPlan& TransformEngine::plan(size_t size)
{
    auto it = m_plans.find(size);
    if (it != m_plans.end()) {
        return *it->second;
    }

    if (size < 4 || size % 4 != 0 || size > m_max_size) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                               "IMDCT size " + std::to_string(size) + " unsupported (max " +
                               std::to_string(m_max_size) + ", multiple of 4 only)");
    }

    auto p = std::make_unique<ImdctPlan>();
    p->size = size;
    p->half = size / 2;
    p->quarter = size / 4;
    const size_t M = p->half;
    const size_t L = p->quarter;

    p->pre_re.resize(L);
    p->pre_im.resize(L);
    p->post_re.resize(L);
    p->post_im.resize(L);
    for (size_t i = 0; i < L; ++i) {
        double a = -M_PI * static_cast<double>(i) / static_cast<double>(M);
        p->pre_re[i] = static_cast<float>(std::cos(a));
        p->pre_im[i] = static_cast<float>(std::sin(a));
        double b = -M_PI * (static_cast<double>(i) + 0.25) / static_cast<double>(M);
        p->post_re[i] = static_cast<float>(std::cos(b));
        p->post_im[i] = static_cast<float>(std::sin(b));
    }

    if (!isPowerOfTwo(L)) {
        if (L <= kDirectDftLimit) {
            p->dft_re.resize(L * L);
            p->dft_im.resize(L * L);
            for (size_t k = 0; k < L; ++k) {
                for (size_t n = 0; n < L; ++n) {
                    double a = -2.0 * M_PI * static_cast<double>((k * n) % L) / static_cast<double>(L);
                    p->dft_re[k * L + n] = static_cast<float>(std::cos(a));
                    p->dft_im[k * L + n] = static_cast<float>(std::sin(a));
                }
            }
            p->tmp_re.resize(L);
            p->tmp_im.resize(L);
        } else {
            size_t P = 1;
            while (P < 2 * L - 1) {
                P <<= 1;
            }
            if (P > m_max_size) {
                throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                                       "IMDCT size " + std::to_string(size) + " needs a " +
                                       std::to_string(P) + " point convolution");
            }
            p->conv_size = P;
            p->chirp_re.resize(L);
            p->chirp_im.resize(L);
            for (size_t n = 0; n < L; ++n) {
                // n^2 reduced mod 2L keeps the angle small
                double a = -M_PI * static_cast<double>((n * n) % (2 * L)) / static_cast<double>(L);
                p->chirp_re[n] = static_cast<float>(std::cos(a));
                p->chirp_im[n] = static_cast<float>(std::sin(a));
            }
            p->chirp_fft_re.assign(P, 0.0f);
            p->chirp_fft_im.assign(P, 0.0f);
            for (size_t n = 0; n < L; ++n) {
                p->chirp_fft_re[n] = p->chirp_re[n];
                p->chirp_fft_im[n] = -p->chirp_im[n];
                if (n > 0) {
                    p->chirp_fft_re[P - n] = p->chirp_re[n];
                    p->chirp_fft_im[P - n] = -p->chirp_im[n];
                }
            }
            forwardFFT(p->chirp_fft_re.data(), p->chirp_fft_im.data(), P);
            p->tmp_re.resize(P);
            p->tmp_im.resize(P);
        }
    }

    p->work_re.resize(L);
    p->work_im.resize(L);
    p->dct.resize(M);

    Debug::log("transform", "TransformEngine::plan() built IMDCT plan for size ", size,
               isPowerOfTwo(L) ? " (radix-2)" : (L <= kDirectDftLimit ? " (direct DFT)" : " (Bluestein)"));

    auto& ref = *p;
    m_plans.emplace(size, std::move(p));
    return ref;
}

/**
 * @brief Forward complex DFT of length quarter, whatever its factorisation.
 */
void TransformEngine::complexTransform(ImdctPlan& p, float* re, float* im)
{
    const size_t L = p.quarter;
    if (isPowerOfTwo(L)) {
        runStages(re, im, L);
        return;
    }

    if (!p.dft_re.empty()) {
        for (size_t k = 0; k < L; ++k) {
            const float* cr = &p.dft_re[k * L];
            const float* ci = &p.dft_im[k * L];
            float sr = 0.0f, si = 0.0f;
            for (size_t n = 0; n < L; ++n) {
                sr += re[n] * cr[n] - im[n] * ci[n];
                si += re[n] * ci[n] + im[n] * cr[n];
            }
            p.tmp_re[k] = sr;
            p.tmp_im[k] = si;
        }
        std::copy(p.tmp_re.begin(), p.tmp_re.begin() + L, re);
        std::copy(p.tmp_im.begin(), p.tmp_im.begin() + L, im);
        return;
    }

    // Bluestein: X[k] = c[k] * sum_n (x[n] c[n]) conj(c[k - n])
    const size_t P = p.conv_size;
    std::fill(p.tmp_re.begin(), p.tmp_re.end(), 0.0f);
    std::fill(p.tmp_im.begin(), p.tmp_im.end(), 0.0f);
    for (size_t n = 0; n < L; ++n) {
        p.tmp_re[n] = re[n] * p.chirp_re[n] - im[n] * p.chirp_im[n];
        p.tmp_im[n] = re[n] * p.chirp_im[n] + im[n] * p.chirp_re[n];
    }
    runStages(p.tmp_re.data(), p.tmp_im.data(), P);
    for (size_t i = 0; i < P; ++i) {
        float ar = p.tmp_re[i], ai = p.tmp_im[i];
        float br = p.chirp_fft_re[i], bi = p.chirp_fft_im[i];
        p.tmp_re[i] = ar * br - ai * bi;
        p.tmp_im[i] = ar * bi + ai * br;
    }
    inverseFFT(p.tmp_re.data(), p.tmp_im.data(), P);
    for (size_t k = 0; k < L; ++k) {
        float cr = p.tmp_re[k], ci = p.tmp_im[k];
        re[k] = cr * p.chirp_re[k] - ci * p.chirp_im[k];
        im[k] = cr * p.chirp_im[k] + ci * p.chirp_re[k];
    }
}

/**
 * @brief Inverse MDCT through a DCT-IV.
 *
 * The DCT-IV u of the size/2 coefficients is computed with one size/4 point
 * complex transform; the IMDCT output is u unfolded with the usual
 * (-u, -u reversed, u) symmetry.
 */
void TransformEngine::imdct(const float* coefficients, float* output, size_t size, float scale)
{
    ImdctPlan& p = plan(size);
    const size_t M = p.half;
    const size_t L = p.quarter;

    float* re = p.work_re.data();
    float* im = p.work_im.data();
    for (size_t i = 0; i < L; ++i) {
        float zr = coefficients[2 * i];
        float zi = coefficients[M - 1 - 2 * i];
        re[i] = zr * p.pre_re[i] - zi * p.pre_im[i];
        im[i] = zr * p.pre_im[i] + zi * p.pre_re[i];
    }

    complexTransform(p, re, im);

    float* u = p.dct.data();
    for (size_t j = 0; j < L; ++j) {
        float br = re[j] * p.post_re[j] - im[j] * p.post_im[j];
        float bi = re[j] * p.post_im[j] + im[j] * p.post_re[j];
        u[2 * j] = br * scale;
        u[M - 1 - 2 * j] = -bi * scale;
    }

    const size_t h = M / 2;
    for (size_t n = 0; n < h; ++n) {
        output[n] = u[n + h];
    }
    for (size_t n = h; n < 3 * h; ++n) {
        output[n] = -u[3 * h - 1 - n];
    }
    for (size_t n = 3 * h; n < 2 * M; ++n) {
        output[n] = -u[n - 3 * h];
    }
}

void TransformEngine::mdct(const float* input, float* coefficients, size_t size) const
{
    if (size < 4 || size % 4 != 0 || size > m_max_size) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                               "MDCT size " + std::to_string(size) + " unsupported");
    }
    const size_t M = size / 2;
    const double n0 = 0.5 + static_cast<double>(size) / 4.0;
    for (size_t k = 0; k < M; ++k) {
        double sum = 0.0;
        for (size_t n = 0; n < size; ++n) {
            sum += input[n] * std::cos(2.0 * M_PI / static_cast<double>(size) *
                                       (static_cast<double>(n) + n0) * (static_cast<double>(k) + 0.5));
        }
        coefficients[k] = static_cast<float>(sum);
    }
}

} // namespace Core
} // namespace PsyDec
