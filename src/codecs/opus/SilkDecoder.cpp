/*
 * SilkDecoder.cpp - Opus SILK layer decoder (RFC 6716 section 4.2)
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

using namespace Tables;

struct NlsfCodebook {
    int order;
    int n_vectors;
    int32_t quant_step_q16;
    const uint8_t* cb1_nlsf_q8;
    const int16_t* cb1_weight_q9;
    const uint8_t* cb1_icdf;
    const uint8_t* pred_q8;
    const uint8_t* ec_select;
    const uint8_t* ec_icdf;
    const int16_t* delta_min_q15;
};

namespace {

constexpr int TYPE_NO_VOICE_ACTIVITY = 0;
constexpr int TYPE_VOICED = 2;

constexpr int SHELL_FRAME = 16;
constexpr int MAX_PULSES = 16;
constexpr int N_RATE_LEVELS = 10;
constexpr int NLSF_QUANT_MAX_AMPLITUDE = 4;
constexpr int NLSF_QUANT_LEVEL_ADJ_Q10 = 102;
constexpr int QUANT_LEVEL_ADJUST_Q10 = 80;
constexpr int MAX_STABILIZE_LOOPS = 20;
constexpr int MAX_LPC_STABILIZE_ITERATIONS = 16;
constexpr int32_t A_LIMIT = 16773022;           // 0.99975 in Q24
constexpr int32_t MIN_INV_PRED_GAIN_Q30 = 107374; // 1 / 1e4 in Q30

constexpr int N_LEVELS_QGAIN = 64;
constexpr int MIN_DELTA_GAIN_QUANT = -4;
constexpr int MAX_DELTA_GAIN_QUANT = 36;
constexpr int32_t GAIN_OFFSET = 2090;
constexpr int32_t GAIN_INV_SCALE_Q16 = 1907817;

constexpr int PE_MIN_LAG_MS = 2;
constexpr int PE_MAX_LAG_MS = 18;
constexpr int STEREO_INTERP_LEN_MS = 8;
constexpr int32_t STEREO_QUANT_STEP_Q16 = 6554;  // 0.5 / 5 in Q16

const NlsfCodebook* codebookFor(int fs_khz);

// Fixed-point primitives with the rounding SILK is specified with
inline int32_t smulwb(int32_t a, int32_t b)
{
    return static_cast<int32_t>((static_cast<int64_t>(a) * static_cast<int16_t>(b)) >> 16);
}

inline int32_t smlawb(int32_t acc, int32_t a, int32_t b)
{
    return acc + smulwb(a, b);
}

inline int32_t smulww(int32_t a, int32_t b)
{
    return static_cast<int32_t>((static_cast<int64_t>(a) * b) >> 16);
}

inline int32_t smulbb(int32_t a, int32_t b)
{
    return static_cast<int32_t>(static_cast<int16_t>(a)) * static_cast<int16_t>(b);
}

inline int32_t smmul(int32_t a, int32_t b)
{
    return static_cast<int32_t>((static_cast<int64_t>(a) * b) >> 32);
}

inline int32_t rshiftRound(int32_t a, int shift)
{
    return shift == 1 ? (a >> 1) + (a & 1) : ((a >> (shift - 1)) + 1) >> 1;
}

inline int64_t rshiftRound64(int64_t a, int shift)
{
    return shift == 1 ? (a >> 1) + (a & 1) : ((a >> (shift - 1)) + 1) >> 1;
}

inline int16_t sat16(int32_t a)
{
    return static_cast<int16_t>(std::min<int32_t>(std::max<int32_t>(a, INT16_MIN), INT16_MAX));
}

inline int32_t sat32(int64_t a)
{
    return static_cast<int32_t>(std::min<int64_t>(std::max<int64_t>(a, INT32_MIN), INT32_MAX));
}

inline int32_t lshiftSat32(int32_t a, int shift)
{
    const int32_t lo = INT32_MIN >> shift;
    const int32_t hi = INT32_MAX >> shift;
    return static_cast<int32_t>(static_cast<uint32_t>(std::min(std::max(a, lo), hi)) << shift);
}

inline int32_t addWrap(int32_t a, int32_t b)
{
    return static_cast<int32_t>(static_cast<uint32_t>(a) + static_cast<uint32_t>(b));
}

inline int32_t clz32(int32_t v)
{
    return v ? __builtin_clz(static_cast<uint32_t>(v)) : 32;
}

inline int32_t silkRand(int32_t seed)
{
    return static_cast<int32_t>(907633515u + static_cast<uint32_t>(seed) * 196314165u);
}

// 1 / b in Q(qres)
int32_t inverse32VarQ(int32_t b32, int qres)
{
    const int b_headrm = clz32(std::abs(b32)) - 1;
    const int32_t b32_nrm = b32 << b_headrm;
    const int32_t b32_inv = (INT32_MAX >> 2) / (b32_nrm >> 16);
    int32_t result = b32_inv << 16;
    const int32_t err_q32 = ((1 << 29) - smulwb(b32_nrm, b32_inv)) << 3;
    result = result + smulww(err_q32, b32_inv);
    const int lshift = 61 - b_headrm - qres;
    if (lshift <= 0) {
        return lshiftSat32(result, -lshift);
    }
    return lshift < 32 ? result >> lshift : 0;
}

// a / b in Q(qres)
int32_t div32VarQ(int32_t a32, int32_t b32, int qres)
{
    const int a_headrm = clz32(std::abs(a32)) - 1;
    int32_t a32_nrm = a32 << a_headrm;
    const int b_headrm = clz32(std::abs(b32)) - 1;
    const int32_t b32_nrm = b32 << b_headrm;
    const int32_t b32_inv = (INT32_MAX >> 2) / (b32_nrm >> 16);
    int32_t result = smulwb(a32_nrm, b32_inv);
    a32_nrm = static_cast<int32_t>(static_cast<uint32_t>(a32_nrm)
                                   - (static_cast<uint32_t>(smmul(b32_nrm, result)) << 3));
    result = smlawb(result, a32_nrm, b32_inv);
    const int lshift = 29 + a_headrm - b_headrm - qres;
    if (lshift < 0) {
        return lshiftSat32(result, -lshift);
    }
    return lshift < 32 ? result >> lshift : 0;
}

// Approximation of 2^(x / 128)
int32_t log2lin(int32_t in_log_q7)
{
    if (in_log_q7 < 0) {
        return 0;
    }
    if (in_log_q7 >= 3967) {
        return INT32_MAX;
    }
    int32_t out = 1 << (in_log_q7 >> 7);
    const int32_t frac_q7 = in_log_q7 & 0x7F;
    const int32_t poly = smlawb(frac_q7, smulbb(frac_q7, 128 - frac_q7), -174);
    if (in_log_q7 < 2048) {
        out = out + ((out * poly) >> 7);
    } else {
        out = out + (out >> 7) * poly;
    }
    return out;
}

void bandwidthExpand32(int32_t* ar, int d, int32_t chirp_q16)
{
    const int32_t chirp_minus_one_q16 = chirp_q16 - 65536;
    for (int i = 0; i < d - 1; i++) {
        ar[i] = smulww(chirp_q16, ar[i]);
        chirp_q16 += rshiftRound(chirp_q16 * chirp_minus_one_q16, 16);
    }
    ar[d - 1] = smulww(chirp_q16, ar[d - 1]);
}

// Converts Q17 coefficients to Q12, shrinking them until they fit in 16 bits
void lpcFit(int16_t* a_q12, int32_t* a_q17, int d)
{
    constexpr int shift = 17 - 12;
    int i = 0;
    for (; i < 10; i++) {
        int32_t maxabs = 0;
        int idx = 0;
        for (int k = 0; k < d; k++) {
            const int32_t absval = std::abs(a_q17[k]);
            if (absval > maxabs) {
                maxabs = absval;
                idx = k;
            }
        }
        maxabs = rshiftRound(maxabs, shift);
        if (maxabs <= INT16_MAX) {
            break;
        }
        maxabs = std::min<int32_t>(maxabs, 163838);
        const int32_t chirp_q16 = 65470 - ((maxabs - INT16_MAX) << 14) / ((maxabs * (idx + 1)) >> 2);
        bandwidthExpand32(a_q17, d, chirp_q16);
    }

    if (i == 10) {
        for (int k = 0; k < d; k++) {
            a_q12[k] = sat16(rshiftRound(a_q17[k], shift));
            a_q17[k] = static_cast<int32_t>(a_q12[k]) << shift;
        }
    } else {
        for (int k = 0; k < d; k++) {
            a_q12[k] = static_cast<int16_t>(rshiftRound(a_q17[k], shift));
        }
    }
}

// Zero if the filter is unstable or has too much prediction gain
int32_t inversePredictionGain(const int16_t* a_q12, int order)
{
    int32_t a_qa[SilkDecoder::MAX_LPC_ORDER];
    int32_t dc_resp = 0;
    for (int k = 0; k < order; k++) {
        dc_resp += a_q12[k];
        a_qa[k] = static_cast<int32_t>(a_q12[k]) << 12;
    }
    if (dc_resp >= 4096) {
        return 0;
    }

    int32_t inv_gain_q30 = 1 << 30;
    for (int k = order - 1; k > 0; k--) {
        if (a_qa[k] > A_LIMIT || a_qa[k] < -A_LIMIT) {
            return 0;
        }
        const int32_t rc_q31 = -(a_qa[k] << 7);
        const int32_t rc_mult1_q30 = (1 << 30) - smmul(rc_q31, rc_q31);
        inv_gain_q30 = smmul(inv_gain_q30, rc_mult1_q30) << 2;
        if (inv_gain_q30 < MIN_INV_PRED_GAIN_Q30) {
            return 0;
        }
        const int mult2q = 32 - clz32(std::abs(rc_mult1_q30));
        const int32_t rc_mult2 = inverse32VarQ(rc_mult1_q30, mult2q + 30);
        for (int n = 0; n < (k + 1) >> 1; n++) {
            const int32_t tmp1 = a_qa[n];
            const int32_t tmp2 = a_qa[k - n - 1];
            const int32_t frac1 = static_cast<int32_t>(rshiftRound64(static_cast<int64_t>(tmp2) * rc_q31, 31));
            const int32_t frac2 = static_cast<int32_t>(rshiftRound64(static_cast<int64_t>(tmp1) * rc_q31, 31));
            int64_t tmp64 = rshiftRound64(static_cast<int64_t>(sat32(static_cast<int64_t>(tmp1) - frac1)) * rc_mult2, mult2q);
            if (tmp64 > INT32_MAX || tmp64 < INT32_MIN) {
                return 0;
            }
            a_qa[n] = static_cast<int32_t>(tmp64);
            tmp64 = rshiftRound64(static_cast<int64_t>(sat32(static_cast<int64_t>(tmp2) - frac2)) * rc_mult2, mult2q);
            if (tmp64 > INT32_MAX || tmp64 < INT32_MIN) {
                return 0;
            }
            a_qa[k - n - 1] = static_cast<int32_t>(tmp64);
        }
    }

    if (a_qa[0] > A_LIMIT || a_qa[0] < -A_LIMIT) {
        return 0;
    }
    const int32_t rc_q31 = -(a_qa[0] << 7);
    const int32_t rc_mult1_q30 = (1 << 30) - smmul(rc_q31, rc_q31);
    inv_gain_q30 = smmul(inv_gain_q30, rc_mult1_q30) << 2;
    return inv_gain_q30 < MIN_INV_PRED_GAIN_Q30 ? 0 : inv_gain_q30;
}

void findPolynomial(int32_t* out, const int32_t* c_lsf, int dd)
{
    out[0] = 1 << 16;
    out[1] = -c_lsf[0];
    for (int k = 1; k < dd; k++) {
        const int32_t ftmp = c_lsf[2 * k];
        out[k + 1] = (out[k - 1] << 1) - static_cast<int32_t>(rshiftRound64(static_cast<int64_t>(ftmp) * out[k], 16));
        for (int n = k; n > 1; n--) {
            out[n] += out[n - 2] - static_cast<int32_t>(rshiftRound64(static_cast<int64_t>(ftmp) * out[n - 1], 16));
        }
        out[1] -= ftmp;
    }
}

// NLSF (Q15) to monic whitening filter coefficients (Q12)
void nlsfToLpc(int16_t* a_q12, const int16_t* nlsf, int d)
{
    static constexpr uint8_t kOrdering16[16] = { 0, 15, 8, 7, 4, 11, 12, 3, 2, 13, 10, 5, 6, 9, 14, 1 };
    static constexpr uint8_t kOrdering10[10] = { 0, 9, 6, 3, 4, 5, 8, 1, 2, 7 };
    const uint8_t* ordering = d == 16 ? kOrdering16 : kOrdering10;

    int32_t cos_lsf_qa[SilkDecoder::MAX_LPC_ORDER];
    for (int k = 0; k < d; k++) {
        const int32_t f_int = nlsf[k] >> 8;
        const int32_t f_frac = nlsf[k] - (f_int << 8);
        const int32_t cos_val = kLsfCosTabQ12[f_int];
        const int32_t delta = kLsfCosTabQ12[f_int + 1] - cos_val;
        cos_lsf_qa[ordering[k]] = rshiftRound((cos_val << 8) + delta * f_frac, 4);
    }

    const int dd = d >> 1;
    int32_t P[SilkDecoder::MAX_LPC_ORDER / 2 + 1];
    int32_t Q[SilkDecoder::MAX_LPC_ORDER / 2 + 1];
    findPolynomial(P, &cos_lsf_qa[0], dd);
    findPolynomial(Q, &cos_lsf_qa[1], dd);

    int32_t a32_q17[SilkDecoder::MAX_LPC_ORDER];
    for (int k = 0; k < dd; k++) {
        const int32_t p_tmp = P[k + 1] + P[k];
        const int32_t q_tmp = Q[k + 1] - Q[k];
        a32_q17[k] = -q_tmp - p_tmp;
        a32_q17[d - k - 1] = q_tmp - p_tmp;
    }

    lpcFit(a_q12, a32_q17, d);

    for (int i = 0; inversePredictionGain(a_q12, d) == 0 && i < MAX_LPC_STABILIZE_ITERATIONS; i++) {
        bandwidthExpand32(a32_q17, d, 65536 - (2 << i));
        for (int k = 0; k < d; k++) {
            a_q12[k] = static_cast<int16_t>(rshiftRound(a32_q17[k], 5));
        }
    }
}

// Enforces the minimum spacing between NLSFs
void nlsfStabilize(int16_t* nlsf_q15, const int16_t* delta_min_q15, int L)
{
    int loops = 0;
    for (; loops < MAX_STABILIZE_LOOPS; loops++) {
        int32_t min_diff_q15 = nlsf_q15[0] - delta_min_q15[0];
        int I = 0;
        for (int i = 1; i <= L - 1; i++) {
            const int32_t diff_q15 = nlsf_q15[i] - (nlsf_q15[i - 1] + delta_min_q15[i]);
            if (diff_q15 < min_diff_q15) {
                min_diff_q15 = diff_q15;
                I = i;
            }
        }
        const int32_t last_diff_q15 = (1 << 15) - (nlsf_q15[L - 1] + delta_min_q15[L]);
        if (last_diff_q15 < min_diff_q15) {
            min_diff_q15 = last_diff_q15;
            I = L;
        }

        if (min_diff_q15 >= 0) {
            return;
        }

        if (I == 0) {
            nlsf_q15[0] = delta_min_q15[0];
        } else if (I == L) {
            nlsf_q15[L - 1] = static_cast<int16_t>((1 << 15) - delta_min_q15[L]);
        } else {
            int32_t min_center_q15 = 0;
            for (int k = 0; k < I; k++) {
                min_center_q15 += delta_min_q15[k];
            }
            min_center_q15 += delta_min_q15[I] >> 1;

            int32_t max_center_q15 = 1 << 15;
            for (int k = L; k > I; k--) {
                max_center_q15 -= delta_min_q15[k];
            }
            max_center_q15 -= delta_min_q15[I] >> 1;

            int32_t center = rshiftRound(static_cast<int32_t>(nlsf_q15[I - 1]) + nlsf_q15[I], 1);
            if (min_center_q15 > max_center_q15) {
                center = std::min(std::max(center, max_center_q15), min_center_q15);
            } else {
                center = std::min(std::max(center, min_center_q15), max_center_q15);
            }
            nlsf_q15[I - 1] = static_cast<int16_t>(center - (delta_min_q15[I] >> 1));
            nlsf_q15[I] = static_cast<int16_t>(nlsf_q15[I - 1] + delta_min_q15[I]);
        }
    }

    // Fall back to sorting and clamping
    std::sort(nlsf_q15, nlsf_q15 + L);
    nlsf_q15[0] = std::max<int16_t>(nlsf_q15[0], delta_min_q15[0]);
    for (int i = 1; i < L; i++) {
        nlsf_q15[i] = static_cast<int16_t>(std::max<int32_t>(nlsf_q15[i], sat16(nlsf_q15[i - 1] + delta_min_q15[i])));
    }
    nlsf_q15[L - 1] = static_cast<int16_t>(std::min<int32_t>(nlsf_q15[L - 1], (1 << 15) - delta_min_q15[L]));
    for (int i = L - 2; i >= 0; i--) {
        nlsf_q15[i] = static_cast<int16_t>(std::min<int32_t>(nlsf_q15[i], nlsf_q15[i + 1] - delta_min_q15[i + 1]));
    }
}

// Entropy table offsets and backward predictor for a first stage vector
void nlsfUnpack(int16_t* ec_ix, uint8_t* pred_q8, const NlsfCodebook& cb, int cb1_index)
{
    const uint8_t* sel = &cb.ec_select[cb1_index * cb.order / 2];
    for (int i = 0; i < cb.order; i += 2) {
        const uint8_t entry = *sel++;
        ec_ix[i] = static_cast<int16_t>(((entry >> 1) & 7) * (2 * NLSF_QUANT_MAX_AMPLITUDE + 1));
        pred_q8[i] = cb.pred_q8[i + (entry & 1) * (cb.order - 1)];
        ec_ix[i + 1] = static_cast<int16_t>(((entry >> 5) & 7) * (2 * NLSF_QUANT_MAX_AMPLITUDE + 1));
        pred_q8[i + 1] = cb.pred_q8[i + ((entry >> 4) & 1) * (cb.order - 1) + 1];
    }
}

void nlsfDecode(int16_t* nlsf_q15, const int8_t* indices, const NlsfCodebook& cb)
{
    int16_t ec_ix[SilkDecoder::MAX_LPC_ORDER];
    uint8_t pred_q8[SilkDecoder::MAX_LPC_ORDER];
    nlsfUnpack(ec_ix, pred_q8, cb, indices[0]);

    // Backward predictive residual dequantization
    int16_t res_q10[SilkDecoder::MAX_LPC_ORDER];
    int32_t out_q10 = 0;
    for (int i = cb.order - 1; i >= 0; i--) {
        const int32_t pred_q10 = smulbb(out_q10, pred_q8[i]) >> 8;
        out_q10 = static_cast<int32_t>(indices[i + 1]) << 10;
        if (out_q10 > 0) {
            out_q10 -= NLSF_QUANT_LEVEL_ADJ_Q10;
        } else if (out_q10 < 0) {
            out_q10 += NLSF_QUANT_LEVEL_ADJ_Q10;
        }
        out_q10 = smlawb(pred_q10, out_q10, cb.quant_step_q16);
        res_q10[i] = static_cast<int16_t>(out_q10);
    }

    const uint8_t* cb_element = &cb.cb1_nlsf_q8[indices[0] * cb.order];
    const int16_t* cb_weight = &cb.cb1_weight_q9[indices[0] * cb.order];
    for (int i = 0; i < cb.order; i++) {
        const int32_t value = ((static_cast<int32_t>(res_q10[i]) << 14) / cb_weight[i]) + (cb_element[i] << 7);
        nlsf_q15[i] = static_cast<int16_t>(std::min(std::max(value, 0), 32767));
    }

    nlsfStabilize(nlsf_q15, cb.delta_min_q15, cb.order);
}

// Gain indices to linear Q16 gains, tracking the previous index
void dequantizeGains(int32_t* gain_q16, const int8_t* ind, int& prev_ind, bool conditional, int nb_subfr)
{
    for (int k = 0; k < nb_subfr; k++) {
        if (k == 0 && !conditional) {
            prev_ind = std::max<int>(ind[k], prev_ind - 16);
        } else {
            const int ind_tmp = ind[k] + MIN_DELTA_GAIN_QUANT;
            const int double_step_threshold = 2 * MAX_DELTA_GAIN_QUANT - N_LEVELS_QGAIN + prev_ind;
            if (ind_tmp > double_step_threshold) {
                prev_ind += (ind_tmp << 1) - double_step_threshold;
            } else {
                prev_ind += ind_tmp;
            }
        }
        prev_ind = std::min(std::max(prev_ind, 0), N_LEVELS_QGAIN - 1);
        gain_q16[k] = log2lin(std::min<int32_t>(smulwb(GAIN_INV_SCALE_Q16, prev_ind) + GAIN_OFFSET, 3967));
    }
}

void decodePitchLags(int lag_index, int contour_index, int32_t* pitch_lags, int fs_khz, int nb_subfr)
{
    const int8_t* lag_cb;
    int cbk_size;
    if (fs_khz == 8) {
        if (nb_subfr == SilkDecoder::MAX_NB_SUBFR) {
            lag_cb = &kCbLagsStage2[0][0];
            cbk_size = 11;
        } else {
            lag_cb = &kCbLagsStage2_10ms[0][0];
            cbk_size = 3;
        }
    } else if (nb_subfr == SilkDecoder::MAX_NB_SUBFR) {
        lag_cb = &kCbLagsStage3[0][0];
        cbk_size = 34;
    } else {
        lag_cb = &kCbLagsStage3_10ms[0][0];
        cbk_size = 12;
    }

    const int min_lag = PE_MIN_LAG_MS * fs_khz;
    const int max_lag = PE_MAX_LAG_MS * fs_khz;
    const int lag = min_lag + lag_index;
    for (int k = 0; k < nb_subfr; k++) {
        pitch_lags[k] = std::min(std::max(lag + lag_cb[k * cbk_size + contour_index], min_lag), max_lag);
    }
}

// Whitening filter used to rebuild the LTP state after a filter change
void lpcAnalysisFilter(int16_t* out, const int16_t* in, const int16_t* B, int len, int d)
{
    for (int ix = d; ix < len; ix++) {
        const int16_t* in_ptr = &in[ix - 1];
        uint32_t acc = static_cast<uint32_t>(smulbb(in_ptr[0], B[0]));
        for (int j = 1; j < d; j++) {
            acc += static_cast<uint32_t>(smulbb(in_ptr[-j], B[j]));
        }
        const int32_t out_q12 = static_cast<int32_t>((static_cast<uint32_t>(in_ptr[1]) << 12) - acc);
        out[ix] = sat16(rshiftRound(out_q12, 12));
    }
    std::fill(out, out + d, static_cast<int16_t>(0));
}

// Splits a pulse count between two halves of a shell block
inline void decodeSplit(RangeDecoder& rd, int16_t& child1, int16_t& child2, int p, const uint8_t* shell_table)
{
    if (p > 0) {
        child1 = static_cast<int16_t>(rd.decodeIcdf(&shell_table[kShellCodeTableOffsets[p]], 8));
        child2 = static_cast<int16_t>(p - child1);
    } else {
        child1 = 0;
        child2 = 0;
    }
}

void shellDecode(RangeDecoder& rd, int16_t* pulses0, int pulses4)
{
    int16_t pulses3[2], pulses2[4], pulses1[8];
    decodeSplit(rd, pulses3[0], pulses3[1], pulses4, kShellCodeTable3);
    decodeSplit(rd, pulses2[0], pulses2[1], pulses3[0], kShellCodeTable2);
    decodeSplit(rd, pulses1[0], pulses1[1], pulses2[0], kShellCodeTable1);
    decodeSplit(rd, pulses0[0], pulses0[1], pulses1[0], kShellCodeTable0);
    decodeSplit(rd, pulses0[2], pulses0[3], pulses1[1], kShellCodeTable0);
    decodeSplit(rd, pulses1[2], pulses1[3], pulses2[1], kShellCodeTable1);
    decodeSplit(rd, pulses0[4], pulses0[5], pulses1[2], kShellCodeTable0);
    decodeSplit(rd, pulses0[6], pulses0[7], pulses1[3], kShellCodeTable0);
    decodeSplit(rd, pulses2[2], pulses2[3], pulses3[1], kShellCodeTable2);
    decodeSplit(rd, pulses1[4], pulses1[5], pulses2[2], kShellCodeTable1);
    decodeSplit(rd, pulses0[8], pulses0[9], pulses1[4], kShellCodeTable0);
    decodeSplit(rd, pulses0[10], pulses0[11], pulses1[5], kShellCodeTable0);
    decodeSplit(rd, pulses1[6], pulses1[7], pulses2[3], kShellCodeTable1);
    decodeSplit(rd, pulses0[12], pulses0[13], pulses1[6], kShellCodeTable0);
    decodeSplit(rd, pulses0[14], pulses0[15], pulses1[7], kShellCodeTable0);
}

// Two all-pass branches, one per output phase
void upsample2Hq(int32_t* S, int16_t* out, const int16_t* in, int len)
{
    for (int k = 0; k < len; k++) {
        const int32_t in32 = static_cast<int32_t>(in[k]) << 10;

        int32_t Y = in32 - S[0];
        int32_t X = smulwb(Y, kResamplerUp2HqCoefs0[0]);
        int32_t out32_1 = S[0] + X;
        S[0] = in32 + X;

        Y = out32_1 - S[1];
        X = smulwb(Y, kResamplerUp2HqCoefs0[1]);
        int32_t out32_2 = S[1] + X;
        S[1] = out32_1 + X;

        Y = out32_2 - S[2];
        X = smlawb(Y, Y, kResamplerUp2HqCoefs0[2]);
        out32_1 = S[2] + X;
        S[2] = out32_2 + X;

        out[2 * k] = sat16(rshiftRound(out32_1, 10));

        Y = in32 - S[3];
        X = smulwb(Y, kResamplerUp2HqCoefs1[0]);
        out32_1 = S[3] + X;
        S[3] = in32 + X;

        Y = out32_1 - S[4];
        X = smulwb(Y, kResamplerUp2HqCoefs1[1]);
        out32_2 = S[4] + X;
        S[4] = out32_1 + X;

        Y = out32_2 - S[5];
        X = smlawb(Y, Y, kResamplerUp2HqCoefs1[2]);
        out32_1 = S[5] + X;
        S[5] = out32_2 + X;

        out[2 * k + 1] = sat16(rshiftRound(out32_1, 10));
    }
}

int16_t* interpolateFir12(int16_t* out, const int16_t* buf, int32_t max_index_q16, int32_t index_increment_q16)
{
    for (int32_t index_q16 = 0; index_q16 < max_index_q16; index_q16 += index_increment_q16) {
        const int table_index = smulwb(index_q16 & 0xFFFF, 12);
        const int16_t* p = &buf[index_q16 >> 16];
        int32_t res_q15 = smulbb(p[0], kResamplerFracFir12[table_index][0]);
        res_q15 += smulbb(p[1], kResamplerFracFir12[table_index][1]);
        res_q15 += smulbb(p[2], kResamplerFracFir12[table_index][2]);
        res_q15 += smulbb(p[3], kResamplerFracFir12[table_index][3]);
        res_q15 += smulbb(p[4], kResamplerFracFir12[11 - table_index][3]);
        res_q15 += smulbb(p[5], kResamplerFracFir12[11 - table_index][2]);
        res_q15 += smulbb(p[6], kResamplerFracFir12[11 - table_index][1]);
        res_q15 += smulbb(p[7], kResamplerFracFir12[11 - table_index][0]);
        *out++ = sat16(rshiftRound(res_q15, 15));
    }
    return out;
}

const NlsfCodebook kNlsfNbMb = {
    10, 32, 11796,
    &kNlsfCb1NbMbQ8[0][0], &kNlsfCb1WghtNbMbQ9[0][0], &kNlsfCb1IcdfNbMb[0][0],
    kNlsfPredNbMbQ8, &kNlsfCb2SelectNbMb[0][0], &kNlsfCb2IcdfNbMb[0][0], kNlsfDeltaMinNbMbQ15
};

const NlsfCodebook kNlsfWb = {
    16, 32, 9830,
    &kNlsfCb1WbQ8[0][0], &kNlsfCb1WghtWbQ9[0][0], &kNlsfCb1IcdfWb[0][0],
    kNlsfPredWbQ8, &kNlsfCb2SelectWb[0][0], &kNlsfCb2IcdfWb[0][0], kNlsfDeltaMinWbQ15
};

const NlsfCodebook* codebookFor(int fs_khz)
{
    return fs_khz == 16 ? &kNlsfWb : &kNlsfNbMb;
}

const uint8_t* ltpGainIcdf(int per_index)
{
    switch (per_index) {
        case 0:
            return kLtpGainIcdf0;
        case 1:
            return kLtpGainIcdf1;
        default:
            return kLtpGainIcdf2;
    }
}

const int8_t* ltpGainVector(int per_index, int index)
{
    switch (per_index) {
        case 0:
            return kLtpGainVq0[index];
        case 1:
            return kLtpGainVq1[index];
        default:
            return kLtpGainVq2[index];
    }
}

} // namespace

SilkDecoder::SilkDecoder(unsigned channels, const DecoderConfig& config)
    : m_config(config)
    , m_channels(channels)
{
    if (channels < 1 || channels > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "SILK supports 1 or 2 channels, got " + std::to_string(channels));
    }
    for (auto& buf : m_frame_out) {
        buf.assign(MAX_FRAME_LENGTH + 2, 0);
    }
    m_resampled.resize(MAX_FRAME_LENGTH * 3);
    m_ltp_state.resize(MAX_FRAME_LENGTH);
    m_ltp_state_q15.resize(2 * MAX_FRAME_LENGTH);
    m_residual_q14.resize(MAX_SUB_FRAME_LENGTH);
    m_lpc_q14.resize(MAX_SUB_FRAME_LENGTH + MAX_LPC_ORDER);
    reset();
}

void SilkDecoder::reset()
{
    for (auto& st : m_state) {
        resetChannel(st);
    }
    m_pred_prev_q13.fill(0);
    m_mid_hist.fill(0);
    m_side_hist.fill(0);
    m_prev_mid_only = false;
    m_stream_channels = 0;
    m_pitch_lag = 0;
}

void SilkDecoder::resetChannel(ChannelState& st)
{
    st = ChannelState();
}

void SilkDecoder::setSampleRate(ChannelState& st, int fs_khz, int nb_subfr)
{
    st.nb_subfr = nb_subfr;
    st.subfr_length = 5 * fs_khz;
    const int frame_length = nb_subfr * st.subfr_length;

    if (st.fs_khz != fs_khz) {
        initResampler(st.resampler, fs_khz);
    }

    if (st.fs_khz != fs_khz || frame_length != st.frame_length) {
        if (fs_khz == 8) {
            st.pitch_contour_icdf = nb_subfr == MAX_NB_SUBFR ? kPitchContourNbIcdf : kPitchContour10msNbIcdf;
        } else {
            st.pitch_contour_icdf = nb_subfr == MAX_NB_SUBFR ? kPitchContourIcdf : kPitchContour10msIcdf;
        }
        if (st.fs_khz != fs_khz) {
            st.ltp_mem_length = 20 * fs_khz;
            st.lpc_order = fs_khz == 16 ? MAX_LPC_ORDER : 10;
            st.nlsf_cb = codebookFor(fs_khz);
            if (fs_khz == 16) {
                st.pitch_lag_low_bits_icdf = kUniform8Icdf;
            } else if (fs_khz == 12) {
                st.pitch_lag_low_bits_icdf = kUniform6Icdf;
            } else {
                st.pitch_lag_low_bits_icdf = kUniform4Icdf;
            }
            st.first_frame_after_reset = true;
            st.lag_prev = 100;
            st.last_gain_index = 10;
            st.prev_signal_type = TYPE_NO_VOICE_ACTIVITY;
            st.out_buf.fill(0);
            st.lpc_state_q14.fill(0);
        }
        st.fs_khz = fs_khz;
        st.frame_length = frame_length;
    }
}

void SilkDecoder::decode(RangeDecoder& rd, unsigned frame_size, OpusBandwidth bandwidth,
                         unsigned stream_channels, float* pcm)
{
    if (stream_channels < 1 || stream_channels > 2) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "SILK stream channel count out of range");
    }

    int frames = 0;
    int nb_subfr = 0;
    switch (frame_size) {
        case 480:
            frames = 1;
            nb_subfr = 2;
            break;
        case 960:
            frames = 1;
            nb_subfr = 4;
            break;
        case 1920:
            frames = 2;
            nb_subfr = 4;
            break;
        case 2880:
            frames = 3;
            nb_subfr = 4;
            break;
        default:
            throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                                   "SILK frame of " + std::to_string(frame_size) + " samples");
    }

    int fs_khz = 16;
    if (bandwidth == OpusBandwidth::NARROWBAND) {
        fs_khz = 8;
    } else if (bandwidth == OpusBandwidth::MEDIUMBAND) {
        fs_khz = 12;
    }

    // Mono to stereo switch in the bitstream starts the side channel afresh
    if (stream_channels > m_stream_channels && m_stream_channels != 0) {
        resetChannel(m_state[1]);
    }
    for (unsigned n = 0; n < stream_channels; n++) {
        setSampleRate(m_state[n], fs_khz, nb_subfr);
    }
    if (m_channels == 2 && stream_channels == 2 && m_stream_channels == 1) {
        m_pred_prev_q13.fill(0);
        m_side_hist.fill(0);
        m_state[1].resampler = m_state[0].resampler;
    }

    // Voice activity and redundancy flags for every frame of the packet
    for (unsigned n = 0; n < stream_channels; n++) {
        ChannelState& st = m_state[n];
        for (int i = 0; i < frames; i++) {
            st.vad_flags[i] = rd.decodeBitLogp(1) ? 1 : 0;
        }
        st.lbrr_flag = rd.decodeBitLogp(1);
    }
    for (unsigned n = 0; n < stream_channels; n++) {
        ChannelState& st = m_state[n];
        st.lbrr_flags.fill(0);
        if (!st.lbrr_flag) {
            continue;
        }
        if (frames == 1) {
            st.lbrr_flags[0] = 1;
        } else {
            const int symbol = rd.decodeIcdf(frames == 2 ? kLbrrFlags2Icdf : kLbrrFlags3Icdf, 8) + 1;
            for (int i = 0; i < frames; i++) {
                st.lbrr_flags[i] = (symbol >> i) & 1;
            }
        }
    }
    skipRedundancy(rd, stream_channels, frames);

    const int out_per_frame = m_state[0].frame_length * 48 / fs_khz;
    for (int i = 0; i < frames; i++) {
        int32_t ms_pred_q13[2] = { 0, 0 };
        bool mid_only = false;
        if (stream_channels == 2) {
            decodeStereoPrediction(rd, ms_pred_q13);
            if (m_state[1].vad_flags[i] == 0) {
                mid_only = rd.decodeIcdf(kStereoOnlyCodeMidIcdf, 8) != 0;
            }
        }

        // First frame with side coding after mid-only frames
        if (stream_channels == 2 && !mid_only && m_prev_mid_only) {
            ChannelState& side = m_state[1];
            side.out_buf.fill(0);
            side.lpc_state_q14.fill(0);
            side.lag_prev = 100;
            side.last_gain_index = 10;
            side.prev_signal_type = TYPE_NO_VOICE_ACTIVITY;
            side.first_frame_after_reset = true;
        }

        const int L = m_state[0].frame_length;
        for (unsigned n = 0; n < stream_channels; n++) {
            int16_t* out = &m_frame_out[n][2];
            if (n == 0 || !mid_only) {
                CodingMode coding = CodingMode::CONDITIONAL;
                if (i == 0) {
                    coding = CodingMode::INDEPENDENT;
                } else if (n > 0 && m_prev_mid_only) {
                    coding = CodingMode::INDEPENDENT_NO_LTP_SCALING;
                }
                decodeFrame(rd, m_state[n], m_state[n].vad_flags[i] != 0, coding, out);
            } else {
                std::fill(out, out + L, static_cast<int16_t>(0));
            }
        }

        int16_t* x1 = m_frame_out[0].data();
        if (m_channels == 2 && stream_channels == 2) {
            stereoMidSideToLeftRight(x1, m_frame_out[1].data(), ms_pred_q13, fs_khz, L);
        } else {
            x1[0] = m_mid_hist[0];
            x1[1] = m_mid_hist[1];
            m_mid_hist[0] = x1[L];
            m_mid_hist[1] = x1[L + 1];
        }

        float* dst = pcm + static_cast<size_t>(i) * out_per_frame * m_channels;
        const unsigned resampled_channels = std::min(m_channels, stream_channels);
        for (unsigned n = 0; n < resampled_channels; n++) {
            resample(m_state[n].resampler, m_resampled.data(), &m_frame_out[n][1], L);
            for (int j = 0; j < out_per_frame; j++) {
                dst[j * m_channels + n] = m_resampled[j] * (1.0f / 32768.0f);
            }
        }
        if (m_channels == 2 && stream_channels == 1) {
            for (int j = 0; j < out_per_frame; j++) {
                dst[2 * j + 1] = dst[2 * j];
            }
        }

        m_prev_mid_only = mid_only;
    }

    if (m_state[0].prev_signal_type == TYPE_VOICED) {
        static constexpr unsigned kLagScale[3] = { 6, 4, 3 };
        m_pitch_lag = static_cast<unsigned>(m_state[0].lag_prev) * kLagScale[(fs_khz - 8) >> 2];
    } else {
        m_pitch_lag = 0;
    }
    m_stream_channels = stream_channels;

    DEBUG_LOG_LAZY("silk", "SilkDecoder::decode() ", frame_size, " samples at ", static_cast<unsigned>(fs_khz),
                   " kHz internal, ", stream_channels, " coded channels, pitch lag ", m_pitch_lag);
}

void SilkDecoder::skipRedundancy(RangeDecoder& rd, unsigned stream_channels, int frames)
{
    int16_t pulses[MAX_FRAME_LENGTH];
    for (int i = 0; i < frames; i++) {
        for (unsigned n = 0; n < stream_channels; n++) {
            ChannelState& st = m_state[n];
            if (!st.lbrr_flags[i]) {
                continue;
            }
            if (stream_channels == 2 && n == 0) {
                int32_t pred_q13[2];
                decodeStereoPrediction(rd, pred_q13);
                if (m_state[1].lbrr_flags[i] == 0) {
                    rd.decodeIcdf(kStereoOnlyCodeMidIcdf, 8);
                }
            }
            const CodingMode coding = (i > 0 && st.lbrr_flags[i - 1]) ? CodingMode::CONDITIONAL
                                                                     : CodingMode::INDEPENDENT;
            decodeIndices(rd, st, true, coding);
            decodePulses(rd, pulses, st.indices.signal_type, st.indices.quant_offset, st.frame_length);
        }
    }
}

void SilkDecoder::decodeStereoPrediction(RangeDecoder& rd, int32_t pred_q13[2]) const
{
    int ix[2][3];
    const int joint = rd.decodeIcdf(kStereoPredJointIcdf, 8);
    ix[0][2] = joint / 5;
    ix[1][2] = joint - 5 * ix[0][2];
    for (int n = 0; n < 2; n++) {
        ix[n][0] = rd.decodeIcdf(kUniform3Icdf, 8);
        ix[n][1] = rd.decodeIcdf(kUniform5Icdf, 8);
    }

    for (int n = 0; n < 2; n++) {
        ix[n][0] += 3 * ix[n][2];
        const int32_t low_q13 = kStereoPredQuantQ13[ix[n][0]];
        const int32_t step_q13 = smulwb(kStereoPredQuantQ13[ix[n][0] + 1] - low_q13, STEREO_QUANT_STEP_Q16);
        pred_q13[n] = low_q13 + step_q13 * (2 * ix[n][1] + 1);
    }
    pred_q13[0] -= pred_q13[1];
}

void SilkDecoder::decodeIndices(RangeDecoder& rd, ChannelState& st, bool voice_active, CodingMode coding) const
{
    FrameIndices& idx = st.indices;

    int type;
    if (voice_active) {
        type = rd.decodeIcdf(kTypeOffsetVadIcdf, 8) + 2;
    } else {
        type = rd.decodeIcdf(kTypeOffsetNoVadIcdf, 8);
    }
    idx.signal_type = static_cast<int8_t>(type >> 1);
    idx.quant_offset = static_cast<int8_t>(type & 1);

    // Gains: absolute or delta for the first subframe, delta for the rest
    if (coding == CodingMode::CONDITIONAL) {
        idx.gains[0] = static_cast<int8_t>(rd.decodeIcdf(kDeltaGainIcdf, 8));
    } else {
        idx.gains[0] = static_cast<int8_t>(rd.decodeIcdf(kGainIcdf[idx.signal_type], 8) << 3);
        idx.gains[0] = static_cast<int8_t>(idx.gains[0] + rd.decodeIcdf(kUniform8Icdf, 8));
    }
    for (int i = 1; i < st.nb_subfr; i++) {
        idx.gains[i] = static_cast<int8_t>(rd.decodeIcdf(kDeltaGainIcdf, 8));
    }

    // NLSF codebook path
    const NlsfCodebook& cb = *st.nlsf_cb;
    idx.nlsf[0] = static_cast<int8_t>(rd.decodeIcdf(&cb.cb1_icdf[(idx.signal_type >> 1) * cb.n_vectors], 8));
    int16_t ec_ix[MAX_LPC_ORDER];
    uint8_t pred_q8[MAX_LPC_ORDER];
    nlsfUnpack(ec_ix, pred_q8, cb, idx.nlsf[0]);
    for (int i = 0; i < cb.order; i++) {
        int ix = rd.decodeIcdf(&cb.ec_icdf[ec_ix[i]], 8);
        if (ix == 0) {
            ix -= rd.decodeIcdf(kNlsfExtIcdf, 8);
        } else if (ix == 2 * NLSF_QUANT_MAX_AMPLITUDE) {
            ix += rd.decodeIcdf(kNlsfExtIcdf, 8);
        }
        idx.nlsf[i + 1] = static_cast<int8_t>(ix - NLSF_QUANT_MAX_AMPLITUDE);
    }

    if (st.nb_subfr == MAX_NB_SUBFR) {
        idx.nlsf_interp_q2 = static_cast<int8_t>(rd.decodeIcdf(kNlsfInterpolationFactorIcdf, 8));
    } else {
        idx.nlsf_interp_q2 = 4;
    }

    if (idx.signal_type == TYPE_VOICED) {
        bool absolute_lag = true;
        if (coding == CodingMode::CONDITIONAL && st.ec_prev_signal_type == TYPE_VOICED) {
            int delta = rd.decodeIcdf(kPitchDeltaIcdf, 8);
            if (delta > 0) {
                delta -= 9;
                idx.lag = static_cast<int16_t>(st.ec_prev_lag_index + delta);
                absolute_lag = false;
            }
        }
        if (absolute_lag) {
            idx.lag = static_cast<int16_t>(rd.decodeIcdf(kPitchLagIcdf, 8) * (st.fs_khz >> 1));
            idx.lag = static_cast<int16_t>(idx.lag + rd.decodeIcdf(st.pitch_lag_low_bits_icdf, 8));
        }
        st.ec_prev_lag_index = idx.lag;

        idx.contour = static_cast<int8_t>(rd.decodeIcdf(st.pitch_contour_icdf, 8));

        idx.per_index = static_cast<int8_t>(rd.decodeIcdf(kLtpPerIndexIcdf, 8));
        for (int k = 0; k < st.nb_subfr; k++) {
            idx.ltp[k] = static_cast<int8_t>(rd.decodeIcdf(ltpGainIcdf(idx.per_index), 8));
        }

        if (coding == CodingMode::INDEPENDENT) {
            idx.ltp_scale = static_cast<int8_t>(rd.decodeIcdf(kLtpScaleIcdf, 8));
        } else {
            idx.ltp_scale = 0;
        }
    }
    st.ec_prev_signal_type = idx.signal_type;

    idx.seed = static_cast<int8_t>(rd.decodeIcdf(kUniform4Icdf, 8));
}

void SilkDecoder::decodePulses(RangeDecoder& rd, int16_t* pulses, int signal_type, int quant_offset,
                               int frame_length) const
{
    const int rate_level = rd.decodeIcdf(kRateLevelsIcdf[signal_type >> 1], 8);

    // 10 ms at 12 kHz is 120 samples, which needs an extra partial block
    int iter = frame_length / SHELL_FRAME;
    if (iter * SHELL_FRAME < frame_length) {
        iter++;
    }

    int sum_pulses[MAX_FRAME_LENGTH / SHELL_FRAME];
    int n_lshifts[MAX_FRAME_LENGTH / SHELL_FRAME];
    for (int i = 0; i < iter; i++) {
        n_lshifts[i] = 0;
        sum_pulses[i] = rd.decodeIcdf(kPulsesPerBlockIcdf[rate_level], 8);
        while (sum_pulses[i] == MAX_PULSES + 1) {
            n_lshifts[i]++;
            // After ten extra LSBs the escape symbol is no longer allowed
            sum_pulses[i] = rd.decodeIcdf(kPulsesPerBlockIcdf[N_RATE_LEVELS - 1] + (n_lshifts[i] == 10), 8);
        }
    }

    for (int i = 0; i < iter; i++) {
        int16_t* block = &pulses[i * SHELL_FRAME];
        if (sum_pulses[i] > 0) {
            shellDecode(rd, block, sum_pulses[i]);
        } else {
            std::fill(block, block + SHELL_FRAME, static_cast<int16_t>(0));
        }
    }

    for (int i = 0; i < iter; i++) {
        if (n_lshifts[i] == 0) {
            continue;
        }
        int16_t* block = &pulses[i * SHELL_FRAME];
        for (int k = 0; k < SHELL_FRAME; k++) {
            int abs_q = block[k];
            for (int j = 0; j < n_lshifts[i]; j++) {
                abs_q = (abs_q << 1) + rd.decodeIcdf(kLsbIcdf, 8);
            }
            block[k] = static_cast<int16_t>(abs_q);
        }
        sum_pulses[i] |= n_lshifts[i] << 5;
    }

    // Signs, with a probability that depends on the pulse count of the block
    uint8_t icdf[2] = { 0, 0 };
    const uint8_t* sign_icdf = &kSignIcdf[7 * (quant_offset + (signal_type << 1))];
    const int blocks = (frame_length + SHELL_FRAME / 2) / SHELL_FRAME;
    for (int i = 0; i < blocks; i++) {
        const int p = sum_pulses[i];
        if (p <= 0) {
            continue;
        }
        int16_t* block = &pulses[i * SHELL_FRAME];
        icdf[0] = sign_icdf[std::min(p & 0x1F, 6)];
        for (int j = 0; j < SHELL_FRAME; j++) {
            if (block[j] > 0) {
                block[j] = static_cast<int16_t>(block[j] * ((rd.decodeIcdf(icdf, 8) << 1) - 1));
            }
        }
    }
}

void SilkDecoder::decodeParameters(ChannelState& st, CodingMode coding, FrameParameters& params) const
{
    FrameIndices& idx = st.indices;

    dequantizeGains(params.gains_q16, idx.gains.data(), st.last_gain_index,
                    coding == CodingMode::CONDITIONAL, st.nb_subfr);

    int16_t nlsf_q15[MAX_LPC_ORDER];
    nlsfDecode(nlsf_q15, idx.nlsf.data(), *st.nlsf_cb);
    nlsfToLpc(params.pred_coef_q12[1], nlsf_q15, st.lpc_order);

    // No interpolation across a reset
    if (st.first_frame_after_reset) {
        idx.nlsf_interp_q2 = 4;
    }

    if (idx.nlsf_interp_q2 < 4) {
        int16_t nlsf0_q15[MAX_LPC_ORDER];
        for (int i = 0; i < st.lpc_order; i++) {
            nlsf0_q15[i] = static_cast<int16_t>(st.prev_nlsf_q15[i]
                + ((idx.nlsf_interp_q2 * (nlsf_q15[i] - st.prev_nlsf_q15[i])) >> 2));
        }
        nlsfToLpc(params.pred_coef_q12[0], nlsf0_q15, st.lpc_order);
    } else {
        std::copy(params.pred_coef_q12[1], params.pred_coef_q12[1] + st.lpc_order, params.pred_coef_q12[0]);
    }
    std::copy(nlsf_q15, nlsf_q15 + st.lpc_order, st.prev_nlsf_q15.begin());

    if (idx.signal_type == TYPE_VOICED) {
        decodePitchLags(idx.lag, idx.contour, params.pitch_lags, st.fs_khz, st.nb_subfr);
        for (int k = 0; k < st.nb_subfr; k++) {
            const int8_t* cb = ltpGainVector(idx.per_index, idx.ltp[k]);
            for (int i = 0; i < LTP_ORDER; i++) {
                params.ltp_coef_q14[k * LTP_ORDER + i] = static_cast<int16_t>(cb[i] << 7);
            }
        }
        params.ltp_scale_q14 = kLtpScalesQ14[idx.ltp_scale];
    } else {
        std::fill(params.pitch_lags, params.pitch_lags + MAX_NB_SUBFR, 0);
        std::fill(params.ltp_coef_q14, params.ltp_coef_q14 + MAX_NB_SUBFR * LTP_ORDER, static_cast<int16_t>(0));
        idx.per_index = 0;
        params.ltp_scale_q14 = 0;
    }
}

void SilkDecoder::decodeCore(ChannelState& st, FrameParameters& params, const int16_t* pulses, int16_t* out)
{
    const FrameIndices& idx = st.indices;
    const int32_t offset_q10 = kQuantizationOffsetsQ10[idx.signal_type >> 1][idx.quant_offset];
    const bool nlsf_interpolated = idx.nlsf_interp_q2 < 4;

    // Excitation: pulses shifted toward zero, quantization offset, pseudo-random sign
    int32_t rand_seed = idx.seed;
    for (int i = 0; i < st.frame_length; i++) {
        rand_seed = silkRand(rand_seed);
        int32_t e = static_cast<int32_t>(pulses[i]) << 14;
        if (e > 0) {
            e -= QUANT_LEVEL_ADJUST_Q10 << 4;
        } else if (e < 0) {
            e += QUANT_LEVEL_ADJUST_Q10 << 4;
        }
        e += offset_q10 << 4;
        if (rand_seed < 0) {
            e = -e;
        }
        st.exc_q14[i] = e;
        rand_seed = addWrap(rand_seed, pulses[i]);
    }

    int16_t* s_ltp = m_ltp_state.data();
    int32_t* s_ltp_q15 = m_ltp_state_q15.data();
    int32_t* s_lpc_q14 = m_lpc_q14.data();
    std::copy(st.lpc_state_q14.begin(), st.lpc_state_q14.end(), s_lpc_q14);

    const int32_t* pexc_q14 = st.exc_q14.data();
    int16_t* pxq = out;
    int s_ltp_buf_idx = st.ltp_mem_length;
    for (int k = 0; k < st.nb_subfr; k++) {
        const int32_t* pres_q14 = m_residual_q14.data();
        const int16_t* A_q12 = params.pred_coef_q12[k >> 1];
        const int16_t* B_q14 = &params.ltp_coef_q14[k * LTP_ORDER];
        const int signal_type = idx.signal_type;

        const int32_t gain_q10 = params.gains_q16[k] >> 6;
        int32_t inv_gain_q31 = inverse32VarQ(params.gains_q16[k], 47);

        int32_t gain_adj_q16 = 1 << 16;
        if (params.gains_q16[k] != st.prev_gain_q16) {
            gain_adj_q16 = div32VarQ(st.prev_gain_q16, params.gains_q16[k], 16);
            for (int i = 0; i < MAX_LPC_ORDER; i++) {
                s_lpc_q14[i] = smulww(gain_adj_q16, s_lpc_q14[i]);
            }
        }
        st.prev_gain_q16 = params.gains_q16[k];

        int lag = 0;
        if (signal_type == TYPE_VOICED) {
            lag = params.pitch_lags[k];

            // Rebuild the LTP state through the new whitening filter
            if (k == 0 || (k == 2 && nlsf_interpolated)) {
                const int start_idx = std::max(st.ltp_mem_length - lag - st.lpc_order - LTP_ORDER / 2, 0);
                if (k == 2) {
                    std::copy(out, out + 2 * st.subfr_length, st.out_buf.begin() + st.ltp_mem_length);
                }
                lpcAnalysisFilter(&s_ltp[start_idx], &st.out_buf[start_idx + k * st.subfr_length], A_q12,
                                  st.ltp_mem_length - start_idx, st.lpc_order);
                if (k == 0) {
                    // LTP downscaling limits error propagation across packets
                    inv_gain_q31 = smulwb(inv_gain_q31, params.ltp_scale_q14) << 2;
                }
                for (int i = 0; i < lag + LTP_ORDER / 2; i++) {
                    s_ltp_q15[s_ltp_buf_idx - i - 1] = smulwb(inv_gain_q31, s_ltp[st.ltp_mem_length - i - 1]);
                }
            } else if (gain_adj_q16 != 1 << 16) {
                for (int i = 0; i < lag + LTP_ORDER / 2; i++) {
                    s_ltp_q15[s_ltp_buf_idx - i - 1] = smulww(gain_adj_q16, s_ltp_q15[s_ltp_buf_idx - i - 1]);
                }
            }

            // Long-term prediction
            int32_t* res = m_residual_q14.data();
            const int32_t* pred_lag = &s_ltp_q15[s_ltp_buf_idx - lag + LTP_ORDER / 2];
            for (int i = 0; i < st.subfr_length; i++) {
                int32_t ltp_pred_q13 = 2;
                ltp_pred_q13 = smlawb(ltp_pred_q13, pred_lag[0], B_q14[0]);
                ltp_pred_q13 = smlawb(ltp_pred_q13, pred_lag[-1], B_q14[1]);
                ltp_pred_q13 = smlawb(ltp_pred_q13, pred_lag[-2], B_q14[2]);
                ltp_pred_q13 = smlawb(ltp_pred_q13, pred_lag[-3], B_q14[3]);
                ltp_pred_q13 = smlawb(ltp_pred_q13, pred_lag[-4], B_q14[4]);
                pred_lag++;

                res[i] = pexc_q14[i] + (ltp_pred_q13 << 1);
                s_ltp_q15[s_ltp_buf_idx] = res[i] << 1;
                s_ltp_buf_idx++;
            }
        } else {
            pres_q14 = pexc_q14;
        }

        // Short-term prediction
        for (int i = 0; i < st.subfr_length; i++) {
            int32_t lpc_pred_q10 = st.lpc_order >> 1;
            for (int j = 0; j < st.lpc_order; j++) {
                lpc_pred_q10 = smlawb(lpc_pred_q10, s_lpc_q14[MAX_LPC_ORDER + i - j - 1], A_q12[j]);
            }
            s_lpc_q14[MAX_LPC_ORDER + i] = sat32(static_cast<int64_t>(pres_q14[i]) + lshiftSat32(lpc_pred_q10, 4));
            pxq[i] = sat16(rshiftRound(smulww(s_lpc_q14[MAX_LPC_ORDER + i], gain_q10), 8));
        }

        std::copy(s_lpc_q14 + st.subfr_length, s_lpc_q14 + st.subfr_length + MAX_LPC_ORDER, s_lpc_q14);
        pexc_q14 += st.subfr_length;
        pxq += st.subfr_length;
    }

    std::copy(s_lpc_q14, s_lpc_q14 + MAX_LPC_ORDER, st.lpc_state_q14.begin());
}

void SilkDecoder::decodeFrame(RangeDecoder& rd, ChannelState& st, bool voice_active, CodingMode coding, int16_t* out)
{
    int16_t pulses[MAX_FRAME_LENGTH];
    FrameParameters params;

    decodeIndices(rd, st, voice_active, coding);
    decodePulses(rd, pulses, st.indices.signal_type, st.indices.quant_offset, st.frame_length);
    decodeParameters(st, coding, params);
    decodeCore(st, params, pulses, out);

    st.prev_signal_type = st.indices.signal_type;
    st.first_frame_after_reset = false;

    const int mv_len = st.ltp_mem_length - st.frame_length;
    std::copy(st.out_buf.begin() + st.frame_length, st.out_buf.begin() + st.ltp_mem_length, st.out_buf.begin());
    std::copy(out, out + st.frame_length, st.out_buf.begin() + mv_len);

    st.lag_prev = params.pitch_lags[st.nb_subfr - 1];
}

void SilkDecoder::stereoMidSideToLeftRight(int16_t* x1, int16_t* x2, const int32_t pred_q13[2], int fs_khz, int length)
{
    x1[0] = m_mid_hist[0];
    x1[1] = m_mid_hist[1];
    x2[0] = m_side_hist[0];
    x2[1] = m_side_hist[1];
    m_mid_hist[0] = x1[length];
    m_mid_hist[1] = x1[length + 1];
    m_side_hist[0] = x2[length];
    m_side_hist[1] = x2[length + 1];

    // Interpolate the predictors over the first 8 ms
    int32_t pred0_q13 = m_pred_prev_q13[0];
    int32_t pred1_q13 = m_pred_prev_q13[1];
    const int interp_len = STEREO_INTERP_LEN_MS * fs_khz;
    const int32_t denom_q16 = (1 << 16) / interp_len;
    const int32_t delta0_q13 = rshiftRound(smulbb(pred_q13[0] - m_pred_prev_q13[0], denom_q16), 16);
    const int32_t delta1_q13 = rshiftRound(smulbb(pred_q13[1] - m_pred_prev_q13[1], denom_q16), 16);
    for (int n = 0; n < length; n++) {
        if (n < interp_len) {
            pred0_q13 += delta0_q13;
            pred1_q13 += delta1_q13;
        } else {
            pred0_q13 = pred_q13[0];
            pred1_q13 = pred_q13[1];
        }
        int32_t sum = ((x1[n] + x1[n + 2]) + (x1[n + 1] << 1)) << 9;
        sum = smlawb(static_cast<int32_t>(x2[n + 1]) << 8, sum, pred0_q13);
        sum = smlawb(sum, static_cast<int32_t>(x1[n + 1]) << 11, pred1_q13);
        x2[n + 1] = sat16(rshiftRound(sum, 8));
    }
    m_pred_prev_q13[0] = pred_q13[0];
    m_pred_prev_q13[1] = pred_q13[1];

    for (int n = 0; n < length; n++) {
        const int32_t sum = x1[n + 1] + static_cast<int32_t>(x2[n + 1]);
        const int32_t diff = x1[n + 1] - static_cast<int32_t>(x2[n + 1]);
        x1[n + 1] = sat16(sum);
        x2[n + 1] = sat16(diff);
    }
}

void SilkDecoder::initResampler(Resampler& rs, int fs_in_khz)
{
    rs = Resampler();
    // Decoder delays toward 48 kHz output
    switch (fs_in_khz) {
        case 8:
            rs.input_delay = 0;
            break;
        case 12:
            rs.input_delay = 4;
            break;
        default:
            rs.input_delay = 7;
            break;
    }
    rs.fs_in_khz = fs_in_khz;
    rs.batch_size = fs_in_khz * 10;

    const int32_t fs_in = fs_in_khz * 1000;
    constexpr int32_t fs_out = 48000;
    rs.inv_ratio_q16 = ((fs_in << 15) / fs_out) << 2;
    while (smulww(rs.inv_ratio_q16, fs_out) < (fs_in << 1)) {
        rs.inv_ratio_q16++;
    }
}

void SilkDecoder::resample(Resampler& rs, int16_t* out, const int16_t* in, int in_len)
{
    constexpr int fs_out_khz = 48;
    const int n_samples = rs.fs_in_khz - rs.input_delay;

    std::copy(in, in + n_samples, rs.delay_buf.begin() + rs.input_delay);
    resampleIirFir(rs, out, rs.delay_buf.data(), rs.fs_in_khz);
    resampleIirFir(rs, out + fs_out_khz, in + n_samples, in_len - rs.fs_in_khz);
    std::copy(in + in_len - rs.input_delay, in + in_len, rs.delay_buf.begin());
}

void SilkDecoder::resampleIirFir(Resampler& rs, int16_t* out, const int16_t* in, int in_len)
{
    std::array<int16_t, 2 * Resampler::MAX_BATCH + Resampler::FIR_ORDER> buf;
    std::copy(rs.fir.begin(), rs.fir.end(), buf.begin());

    int n_samples_in = 0;
    for (;;) {
        n_samples_in = std::min(in_len, rs.batch_size);
        upsample2Hq(rs.iir.data(), buf.data() + Resampler::FIR_ORDER, in, n_samples_in);
        out = interpolateFir12(out, buf.data(), n_samples_in << 17, rs.inv_ratio_q16);
        in += n_samples_in;
        in_len -= n_samples_in;
        if (in_len <= 0) {
            break;
        }
        std::copy(buf.begin() + (n_samples_in << 1), buf.begin() + (n_samples_in << 1) + Resampler::FIR_ORDER,
                  buf.begin());
    }
    std::copy(buf.begin() + (n_samples_in << 1), buf.begin() + (n_samples_in << 1) + Resampler::FIR_ORDER,
              rs.fir.begin());
}

} // namespace Opus
} // namespace Codec
} // namespace PsyDec
