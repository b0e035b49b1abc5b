/*
 * ButterflyKernels.cpp - Platform butterfly strategies for the transform engine
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

// This file is the only place that knows about vector instruction sets.

namespace PsyDec {
namespace Core {

namespace {

void butterfly_scalar(float* a_re, float* a_im, float* b_re, float* b_im,
                      const float* w_re, const float* w_im, size_t count)
{
    for (size_t k = 0; k < count; ++k) {
        float t_re = b_re[k] * w_re[k] - b_im[k] * w_im[k];
        float t_im = b_re[k] * w_im[k] + b_im[k] * w_re[k];
        b_re[k] = a_re[k] - t_re;
        b_im[k] = a_im[k] - t_im;
        a_re[k] += t_re;
        a_im[k] += t_im;
    }
}

#ifdef HAVE_SSE2
void butterfly_sse2(float* a_re, float* a_im, float* b_re, float* b_im,
                    const float* w_re, const float* w_im, size_t count)
{
    size_t k = 0;
    for (; k + 4 <= count; k += 4) {
        __m128 br = _mm_loadu_ps(b_re + k);
        __m128 bi = _mm_loadu_ps(b_im + k);
        __m128 wr = _mm_loadu_ps(w_re + k);
        __m128 wi = _mm_loadu_ps(w_im + k);
        __m128 ar = _mm_loadu_ps(a_re + k);
        __m128 ai = _mm_loadu_ps(a_im + k);
        __m128 tr = _mm_sub_ps(_mm_mul_ps(br, wr), _mm_mul_ps(bi, wi));
        __m128 ti = _mm_add_ps(_mm_mul_ps(br, wi), _mm_mul_ps(bi, wr));
        _mm_storeu_ps(b_re + k, _mm_sub_ps(ar, tr));
        _mm_storeu_ps(b_im + k, _mm_sub_ps(ai, ti));
        _mm_storeu_ps(a_re + k, _mm_add_ps(ar, tr));
        _mm_storeu_ps(a_im + k, _mm_add_ps(ai, ti));
    }
    if (k < count) {
        butterfly_scalar(a_re + k, a_im + k, b_re + k, b_im + k, w_re + k, w_im + k, count - k);
    }
}
#endif

#ifdef HAVE_NEON
void butterfly_neon(float* a_re, float* a_im, float* b_re, float* b_im,
                    const float* w_re, const float* w_im, size_t count)
{
    size_t k = 0;
    for (; k + 4 <= count; k += 4) {
        float32x4_t br = vld1q_f32(b_re + k);
        float32x4_t bi = vld1q_f32(b_im + k);
        float32x4_t wr = vld1q_f32(w_re + k);
        float32x4_t wi = vld1q_f32(w_im + k);
        float32x4_t ar = vld1q_f32(a_re + k);
        float32x4_t ai = vld1q_f32(a_im + k);
        float32x4_t tr = vsubq_f32(vmulq_f32(br, wr), vmulq_f32(bi, wi));
        float32x4_t ti = vaddq_f32(vmulq_f32(br, wi), vmulq_f32(bi, wr));
        vst1q_f32(b_re + k, vsubq_f32(ar, tr));
        vst1q_f32(b_im + k, vsubq_f32(ai, ti));
        vst1q_f32(a_re + k, vaddq_f32(ar, tr));
        vst1q_f32(a_im + k, vaddq_f32(ai, ti));
    }
    if (k < count) {
        butterfly_scalar(a_re + k, a_im + k, b_re + k, b_im + k, w_re + k, w_im + k, count - k);
    }
}
#endif

#ifdef HAVE_X86_DISPATCH
__attribute__((target("avx")))
void butterfly_avx(float* a_re, float* a_im, float* b_re, float* b_im,
                   const float* w_re, const float* w_im, size_t count)
{
    size_t k = 0;
    for (; k + 8 <= count; k += 8) {
        __m256 br = _mm256_loadu_ps(b_re + k);
        __m256 bi = _mm256_loadu_ps(b_im + k);
        __m256 wr = _mm256_loadu_ps(w_re + k);
        __m256 wi = _mm256_loadu_ps(w_im + k);
        __m256 ar = _mm256_loadu_ps(a_re + k);
        __m256 ai = _mm256_loadu_ps(a_im + k);
        __m256 tr = _mm256_sub_ps(_mm256_mul_ps(br, wr), _mm256_mul_ps(bi, wi));
        __m256 ti = _mm256_add_ps(_mm256_mul_ps(br, wi), _mm256_mul_ps(bi, wr));
        _mm256_storeu_ps(b_re + k, _mm256_sub_ps(ar, tr));
        _mm256_storeu_ps(b_im + k, _mm256_sub_ps(ai, ti));
        _mm256_storeu_ps(a_re + k, _mm256_add_ps(ar, tr));
        _mm256_storeu_ps(a_im + k, _mm256_add_ps(ai, ti));
    }
    if (k < count) {
        butterfly_scalar(a_re + k, a_im + k, b_re + k, b_im + k, w_re + k, w_im + k, count - k);
    }
}

bool host_has_avx()
{
    __builtin_cpu_init();
    return __builtin_cpu_supports("avx");
}
#endif

const ButterflyStrategy kScalar{1, butterfly_scalar, "scalar"};
#ifdef HAVE_SSE2
const ButterflyStrategy kSse2{4, butterfly_sse2, "sse2"};
#endif
#ifdef HAVE_NEON
const ButterflyStrategy kNeon{4, butterfly_neon, "neon"};
#endif
#ifdef HAVE_X86_DISPATCH
const ButterflyStrategy kAvx{8, butterfly_avx, "avx"};
#endif

} // anonymous namespace

namespace Butterfly {

const ButterflyStrategy& scalar()
{
    return kScalar;
}

std::vector<const ButterflyStrategy*> available()
{
    std::vector<const ButterflyStrategy*> strategies{&kScalar};
#ifdef HAVE_SSE2
    strategies.push_back(&kSse2);
#endif
#ifdef HAVE_NEON
    strategies.push_back(&kNeon);
#endif
#ifdef HAVE_X86_DISPATCH
    if (host_has_avx()) {
        strategies.push_back(&kAvx);
    }
#endif
    return strategies;
}

const ButterflyStrategy& select(TransformPath path)
{
    unsigned max_width = 8;
    switch (path) {
        case TransformPath::Scalar: max_width = 1; break;
        case TransformPath::Vec4: max_width = 4; break;
        case TransformPath::Vec8:
        case TransformPath::Auto: max_width = 8; break;
    }

    const ButterflyStrategy* best = &kScalar;
    for (const ButterflyStrategy* candidate : available()) {
        if (candidate->width <= max_width && candidate->width > best->width) {
            best = candidate;
        }
    }
    return *best;
}

} // namespace Butterfly

} // namespace Core
} // namespace PsyDec
