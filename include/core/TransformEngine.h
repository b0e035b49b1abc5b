/*
 * TransformEngine.h - FFT, real FFT and MDCT/IMDCT for all decoders
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

#ifndef TRANSFORMENGINE_H
#define TRANSFORMENGINE_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Core {

/**
 * @brief One radix-2 butterfly pass over a run of `count` index pairs.
 *
 * a[k] += w[k] * b[k], b[k] = a_old[k] - w[k] * b[k], complex values split
 * into real and imaginary arrays.
 */
using ButterflyOp = void (*)(float* a_re, float* a_im, float* b_re, float* b_im,
                             const float* w_re, const float* w_im, size_t count);

/**
 * @brief Platform strategy for the butterfly stages.
 *
 * `width` is the number of lanes `op` processes at once. Runs shorter than
 * `width` always go through the scalar op.
 */
struct ButterflyStrategy {
    unsigned width;
    ButterflyOp op;
    const char* name;
};

namespace Butterfly {
    const ButterflyStrategy& scalar();
    // Widest strategy not wider than `path` that this host can run
    const ButterflyStrategy& select(TransformPath path);
    // All strategies this host can run, narrowest first
    std::vector<const ButterflyStrategy*> available();
}

/**
 * @brief Shared numeric core: complex FFT, real FFT, MDCT and IMDCT.
 *
 * The bit-reversal table and the per-stage twiddle table are built once for
 * `max_size` and serve every smaller power-of-two size. IMDCT plans are built
 * lazily per size and cached. An engine is owned by one decoder; it is not
 * safe to call imdct() concurrently on the same engine.
 */
class TransformEngine {
public:
    explicit TransformEngine(size_t max_size = 8192, TransformPath path = TransformPath::Auto);

    // In place; size must be a power of two <= max_size. Inverse scales by 1/N.
    void forwardFFT(float* re, float* im, size_t size) const;
    void inverseFFT(float* re, float* im, size_t size) const;

    // Real input of `size` samples to size/2 + 1 complex bins.
    void realFFT(const float* input, float* out_re, float* out_im, size_t size);

    // size/2 coefficients to `size` time samples:
    // y[n] = scale * sum_k X[k] cos(2pi/size (n + 1/2 + size/4)(k + 1/2))
    void imdct(const float* coefficients, float* output, size_t size, float scale = 1.0f);

    // `size` time samples to size/2 coefficients (direct evaluation)
    void mdct(const float* input, float* coefficients, size_t size) const;

    const ButterflyStrategy& strategy() const { return *m_strategy; }
    size_t maxSize() const { return m_max_size; }

    static bool isPowerOfTwo(size_t n) { return n != 0 && (n & (n - 1)) == 0; }

private:
    // DCT-IV of length M through an M/2 point complex transform
    struct ImdctPlan {
        size_t size = 0;            // N
        size_t half = 0;            // M = N/2
        size_t quarter = 0;         // L = M/2, complex transform length
        std::vector<float> pre_re, pre_im;    // e^{-i pi p / M}
        std::vector<float> post_re, post_im;  // e^{-i pi (j + 1/4) / M}
        // Direct DFT for short non power-of-two lengths
        std::vector<float> dft_re, dft_im;
        // Bluestein chirp-z for long non power-of-two lengths
        size_t conv_size = 0;
        std::vector<float> chirp_re, chirp_im;          // e^{-i pi n^2 / L}
        std::vector<float> chirp_fft_re, chirp_fft_im;  // FFT of conj chirp, zero padded
        // Scratch
        std::vector<float> work_re, work_im, tmp_re, tmp_im, dct;
    };

    void checkFFTSize(size_t size) const;
    void runStages(float* re, float* im, size_t size) const;
    ImdctPlan& plan(size_t size);
    void complexTransform(ImdctPlan& p, float* re, float* im);

    size_t m_max_size;
    unsigned m_max_bits;
    const ButterflyStrategy* m_strategy;
    std::vector<uint32_t> m_bitrev;     // for m_max_size
    std::vector<float> m_twiddle_re;    // stage half-length h uses [h - 1, 2h - 1)
    std::vector<float> m_twiddle_im;
    std::vector<float> m_real_work_re, m_real_work_im;
    std::map<size_t, std::unique_ptr<ImdctPlan>> m_plans;
};

} // namespace Core
} // namespace PsyDec

#endif // TRANSFORMENGINE_H
