/*
 * CeltDecoder.cpp - Opus CELT layer decoder (RFC 6716 section 4.3)
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

namespace {

constexpr int BITRES = RangeDecoder::BITRES;

constexpr int SPREAD_NONE = 0;
constexpr int SPREAD_NORMAL = 2;
constexpr int SPREAD_AGGRESSIVE = 3;

constexpr int MAX_FINE_BITS = 8;
constexpr int FINE_OFFSET = 21;
constexpr int QTHETA_OFFSET = 4;
constexpr int QTHETA_OFFSET_TWOPHASE = 16;
constexpr int ALLOC_STEPS = 6;
constexpr int LOG_MAX_PSEUDO = 6;

constexpr int COMBFILTER_MINPERIOD = 15;
constexpr int kCombHistory = 1024 + 8;     // longest pitch period plus filter taps
constexpr int kMaxFrame = kShortMdctSize << kMaxLM;

constexpr float kPreemphasis = 0.85000610f;
constexpr float kSigScale = 32768.0f;

// Hadamard ordering for 2, 4, 8 and 16 interleaved blocks, indexed from stride - 2
constexpr int kHadamardOrder[30] = {
    1, 0,
    3, 0, 2, 1,
    7, 0, 4, 3, 6, 1, 5, 2,
    15, 0, 8, 7, 12, 3, 11, 4, 14, 1, 9, 6, 13, 2, 10, 5
};

inline uint32_t lcgRand(uint32_t seed)
{
    return 1664525u * seed + 1013904223u;
}

inline int fracMul16(int a, int b)
{
    return (16384 + static_cast<int16_t>(a) * static_cast<int16_t>(b)) >> 15;
}

int bitexactCos(int x)
{
    int tmp = (4096 + x * x) >> 13;
    int x2 = tmp;
    x2 = (32767 - x2) + fracMul16(x2, (-7651 + fracMul16(x2, (8277 + fracMul16(-626, x2)))));
    return 1 + x2;
}

int bitexactLog2tan(int isin, int icos)
{
    int lc = RangeDecoder::ilog(static_cast<uint32_t>(icos));
    int ls = RangeDecoder::ilog(static_cast<uint32_t>(isin));
    icos <<= 15 - lc;
    isin <<= 15 - ls;
    return (ls - lc) * (1 << 11) + fracMul16(isin, fracMul16(isin, -2597) + 7932)
        - fracMul16(icos, fracMul16(icos, -2597) + 7932);
}

unsigned isqrt32(uint32_t val)
{
    unsigned g = 0;
    int bshift = (RangeDecoder::ilog(val) - 1) >> 1;
    unsigned b = 1u << bshift;
    do {
        uint32_t t = ((static_cast<uint32_t>(g) << 1) + b) << bshift;
        if (t <= val) {
            g += b;
            val -= t;
        }
        b >>= 1;
        bshift--;
    } while (bshift >= 0);
    return g;
}

int computeQn(int N, int b, int offset, int pulse_cap, bool stereo)
{
    int N2 = 2 * N - 1;
    if (stereo && N == 2) {
        N2--;
    }
    // Leaves room for one side pulse when itheta is 16384
    int qb = (b + N2 * offset) / N2;
    qb = std::min(b - pulse_cap - (4 << BITRES), qb);
    qb = std::min(8 << BITRES, qb);
    if (qb < (1 << BITRES >> 1)) {
        return 1;
    }
    int qn = kExp2Table8[qb & 0x7] >> (14 - (qb >> BITRES));
    return (qn + 1) >> 1 << 1;
}

inline int getPulses(int i)
{
    return i < 8 ? i : (8 + (i & 7)) << ((i >> 3) - 1);
}

const uint8_t* pulseCache(int band, int LM)
{
    return kCacheBits50 + kCacheIndex50[LM + 1][band];
}

int bitsToPulses(int band, int LM, int bits)
{
    const uint8_t* cache = pulseCache(band, LM);
    int lo = 0;
    int hi = cache[0];
    bits--;
    for (int i = 0; i < LOG_MAX_PSEUDO; ++i) {
        int mid = (lo + hi + 1) >> 1;
        if (cache[mid] >= bits) {
            hi = mid;
        } else {
            lo = mid;
        }
    }
    if (bits - (lo == 0 ? -1 : cache[lo]) <= cache[hi] - bits) {
        return lo;
    }
    return hi;
}

int pulsesToBits(int band, int LM, int pulses)
{
    const uint8_t* cache = pulseCache(band, LM);
    return pulses == 0 ? 0 : cache[pulses] + 1;
}

void haar1(float* X, int N0, int stride)
{
    N0 >>= 1;
    for (int i = 0; i < stride; ++i) {
        for (int j = 0; j < N0; ++j) {
            float tmp1 = 0.70710678f * X[stride * 2 * j + i];
            float tmp2 = 0.70710678f * X[stride * (2 * j + 1) + i];
            X[stride * 2 * j + i] = tmp1 + tmp2;
            X[stride * (2 * j + 1) + i] = tmp1 - tmp2;
        }
    }
}

void deinterleaveHadamard(float* X, int N0, int stride, bool hadamard, std::vector<float>& tmp)
{
    const int N = N0 * stride;
    tmp.resize(static_cast<size_t>(N));
    if (hadamard) {
        const int* ordery = kHadamardOrder + stride - 2;
        for (int i = 0; i < stride; ++i) {
            for (int j = 0; j < N0; ++j) {
                tmp[ordery[i] * N0 + j] = X[j * stride + i];
            }
        }
    } else {
        for (int i = 0; i < stride; ++i) {
            for (int j = 0; j < N0; ++j) {
                tmp[i * N0 + j] = X[j * stride + i];
            }
        }
    }
    std::copy(tmp.begin(), tmp.begin() + N, X);
}

void interleaveHadamard(float* X, int N0, int stride, bool hadamard, std::vector<float>& tmp)
{
    const int N = N0 * stride;
    tmp.resize(static_cast<size_t>(N));
    if (hadamard) {
        const int* ordery = kHadamardOrder + stride - 2;
        for (int i = 0; i < stride; ++i) {
            for (int j = 0; j < N0; ++j) {
                tmp[j * stride + i] = X[ordery[i] * N0 + j];
            }
        }
    } else {
        for (int i = 0; i < stride; ++i) {
            for (int j = 0; j < N0; ++j) {
                tmp[j * stride + i] = X[i * N0 + j];
            }
        }
    }
    std::copy(tmp.begin(), tmp.begin() + N, X);
}

void renormaliseVector(float* X, int N, float gain)
{
    float E = 1e-15f;
    for (int i = 0; i < N; ++i) {
        E += X[i] * X[i];
    }
    float g = gain / std::sqrt(E);
    for (int i = 0; i < N; ++i) {
        X[i] *= g;
    }
}

void stereoMerge(float* X, float* Y, float mid, int N)
{
    float xp = 0.0f;
    float side = 0.0f;
    for (int j = 0; j < N; ++j) {
        xp += Y[j] * X[j];
        side += Y[j] * Y[j];
    }
    xp *= mid;
    float El = mid * mid + side - 2.0f * xp;
    float Er = mid * mid + side + 2.0f * xp;
    if (Er < 6e-4f || El < 6e-4f) {
        std::copy(X, X + N, Y);
        return;
    }
    float lgain = 1.0f / std::sqrt(El);
    float rgain = 1.0f / std::sqrt(Er);
    for (int j = 0; j < N; ++j) {
        float l = mid * X[j];
        float r = Y[j];
        X[j] = lgain * (l - r);
        Y[j] = rgain * (l + r);
    }
}

void expRotation1(float* X, int len, int stride, float c, float s)
{
    float ms = -s;
    float* ptr = X;
    for (int i = 0; i < len - stride; ++i) {
        float x1 = ptr[0];
        float x2 = ptr[stride];
        ptr[stride] = c * x2 + s * x1;
        *ptr++ = c * x1 + ms * x2;
    }
    ptr = &X[len - 2 * stride - 1];
    for (int i = len - 2 * stride - 1; i >= 0; --i) {
        float x1 = ptr[0];
        float x2 = ptr[stride];
        ptr[stride] = c * x2 + s * x1;
        *ptr-- = c * x1 + ms * x2;
    }
}

// Undoes the encoder's spreading rotation
void expRotation(float* X, int len, int stride, int K, int spread)
{
    static const int kSpreadFactor[3] = { 15, 10, 5 };
    if (2 * K >= len || spread == SPREAD_NONE) {
        return;
    }
    int factor = kSpreadFactor[spread - 1];
    float gain = static_cast<float>(len) / static_cast<float>(len + factor * K);
    float theta = 0.5f * gain * gain;
    float c = std::cos(0.5f * M_PI_F * theta);
    float s = std::cos(0.5f * M_PI_F * (1.0f - theta));

    int stride2 = 0;
    if (len >= 8 * stride) {
        stride2 = 1;
        while ((stride2 * stride2 + stride2) * stride + (stride >> 2) < len) {
            stride2++;
        }
    }
    len /= stride;
    for (int i = 0; i < stride; ++i) {
        if (stride2) {
            expRotation1(X + i * len, len, stride2, s, c);
        }
        expRotation1(X + i * len, len, 1, c, s);
    }
}

uint32_t collapseMask(const int* iy, int N, int B)
{
    if (B <= 1) {
        return 1;
    }
    const int N0 = N / B;
    uint32_t mask = 0;
    for (int i = 0; i < B; ++i) {
        int tmp = 0;
        for (int j = 0; j < N0; ++j) {
            tmp |= iy[i * N0 + j];
        }
        mask |= static_cast<uint32_t>(tmp != 0) << i;
    }
    return mask;
}

// Row of the PVQ codebook size recurrence for n dimensions, returns V(n, k)
uint32_t pvqRow(int n, int k, uint32_t* u)
{
    auto next = [](uint32_t* ui0, int len, uint32_t ui1) {
        int j = 1;
        do {
            uint32_t ui2 = ui0[j] + ui0[j - 1] + ui1;
            ui0[j - 1] = ui1;
            ui1 = ui2;
        } while (++j < len);
        ui0[j - 1] = ui1;
    };
    const int len = k + 2;
    u[0] = 0;
    u[1] = 1;
    for (int i = 2; i < len; ++i) {
        u[i] = static_cast<uint32_t>((i << 1) - 1);
    }
    for (int i = 2; i < n; ++i) {
        next(u + 1, k + 1, 1);
    }
    return u[k] + u[k + 1];
}

// Index to pulse vector, walking the row back down one dimension per sample
void pvqDecodeIndex(int n, int k, uint32_t index, int* y, uint32_t* u)
{
    auto prev = [](uint32_t* ui, int len, uint32_t ui0) {
        int j = 1;
        do {
            uint32_t ui1 = ui[j] - ui[j - 1] - ui0;
            ui[j - 1] = ui0;
            ui0 = ui1;
        } while (++j < len);
        ui[j - 1] = ui0;
    };
    int j = 0;
    do {
        uint32_t p = u[k + 1];
        int s = -static_cast<int>(index >= p);
        index -= p & static_cast<uint32_t>(s);
        int yj = k;
        p = u[k];
        while (p > index) {
            p = u[--k];
        }
        index -= p;
        yj -= k;
        y[j] = (yj + s) ^ s;
        prev(u, k + 2, 0);
    } while (++j < n);
}

} // namespace

CeltDecoder::CeltDecoder(unsigned channels, const DecoderConfig& config)
    : m_config(config)
    , m_channels(channels)
    , m_start_band(0)
    , m_end_band(kNbEBands)
    , m_transform(config.max_transform_size, config.transform_path)
    , m_window(channels, 2 * kMaxFrame)
{
    if (channels < 1 || channels > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "CELT supports 1 or 2 channels, got " + std::to_string(channels));
    }
    const std::vector<float> slope = Core::WindowOverlapEngine::makeSlope(Core::WindowShape::VORBIS, kOverlap);
    m_postfilter_window.resize(slope.size());
    for (size_t i = 0; i < slope.size(); ++i) {
        m_postfilter_window[i] = slope[i] * slope[i];
    }
    m_history.assign(channels, std::vector<float>(kCombHistory + kMaxFrame, 0.0f));
    m_preemph_mem.assign(channels, 0.0f);
    m_time.resize(2 * kMaxFrame);
    m_freq.resize(2 * kMaxFrame);
    m_X.resize(2 * kMaxFrame);
    reset();
}

void CeltDecoder::reset()
{
    m_window.reset();
    m_old_band_e.fill(0.0f);
    m_old_log_e.fill(-28.0f);
    m_old_log_e2.fill(-28.0f);
    m_pf_period = m_pf_period_old = 0;
    m_pf_gain = m_pf_gain_old = 0.0f;
    m_pf_tapset = m_pf_tapset_old = 0;
    for (auto& h : m_history) {
        std::fill(h.begin(), h.end(), 0.0f);
    }
    std::fill(m_preemph_mem.begin(), m_preemph_mem.end(), 0.0f);
    m_rng = 0;
}

void CeltDecoder::setBandRange(int start, int end)
{
    if (start < 0 || end > kNbEBands || start >= end) {
        throw std::invalid_argument("CeltDecoder: bad band range");
    }
    m_start_band = start;
    m_end_band = end;
}

int CeltDecoder::endBandFor(OpusBandwidth bandwidth)
{
    switch (bandwidth) {
        case OpusBandwidth::NARROWBAND:
            return 13;
        case OpusBandwidth::MEDIUMBAND:
        case OpusBandwidth::WIDEBAND:
            return 17;
        case OpusBandwidth::SUPERWIDEBAND:
            return 19;
        case OpusBandwidth::FULLBAND:
            return 21;
    }
    return kNbEBands;
}

void CeltDecoder::decode(RangeDecoder& rd, unsigned frame_size, unsigned stream_channels, float* pcm)
{
    int LM = 0;
    while (LM <= kMaxLM && (kShortMdctSize << LM) != static_cast<int>(frame_size)) {
        LM++;
    }
    if (LM > kMaxLM) {
        throw DecoderException(DecoderError::UNSUPPORTED_TRANSFORM_SIZE,
                               "CELT frame of " + std::to_string(frame_size) + " samples");
    }
    if (stream_channels < 1 || stream_channels > 2) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "CELT stream channel count out of range");
    }
    if (rd.storage() > OpusPacket::MAX_FRAME_BYTES) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "CELT frame larger than 1275 bytes");
    }

    const int C = static_cast<int>(stream_channels);
    const int CC = static_cast<int>(m_channels);
    const int M = 1 << LM;
    const int N = M * kShortMdctSize;
    const int start = m_start_band;
    const int end = m_end_band;

    if (C == 1) {
        for (int i = 0; i < kNbEBands; ++i) {
            m_old_band_e[i] = std::max(m_old_band_e[i], m_old_band_e[kNbEBands + i]);
        }
    }

    int total_bits = static_cast<int>(rd.storage() * 8);
    int tell = rd.tell();
    bool silence = false;
    if (tell >= total_bits) {
        silence = true;
    } else if (tell == 1) {
        silence = rd.decodeBitLogp(15);
    }
    if (silence) {
        rd.consumeAll();
        tell = total_bits;
    }

    int postfilter_pitch = 0;
    float postfilter_gain = 0.0f;
    int postfilter_tapset = 0;
    if (start == 0 && tell + 16 <= total_bits) {
        if (rd.decodeBitLogp(1)) {
            int octave = static_cast<int>(rd.decodeUInt(6));
            postfilter_pitch = (16 << octave) + static_cast<int>(rd.decodeBits(4 + octave)) - 1;
            int qg = static_cast<int>(rd.decodeBits(3));
            if (rd.tell() + 2 <= total_bits) {
                postfilter_tapset = rd.decodeIcdf(kTapsetIcdf, 2);
            }
            postfilter_gain = 0.09375f * static_cast<float>(qg + 1);
        }
        tell = rd.tell();
    }

    bool transient = false;
    if (LM > 0 && tell + 3 <= total_bits) {
        transient = rd.decodeBitLogp(3);
        tell = rd.tell();
    }
    bool intra = tell + 3 <= total_bits ? rd.decodeBitLogp(3) : false;

    unquantCoarseEnergy(rd, C, LM, intra);

    std::array<int, kNbEBands> tf_res{};
    decodeTimeFrequency(rd, transient, LM, tf_res);

    tell = rd.tell();
    int spread = SPREAD_NORMAL;
    if (tell + 4 <= total_bits) {
        spread = rd.decodeIcdf(kSpreadIcdf, 5);
    }

    std::array<int, kNbEBands> cap{};
    for (int i = 0; i < kNbEBands; ++i) {
        int n = bandWidth(i) << LM;
        cap[i] = (kCacheCaps50[2 * LM + C - 1][i] + 64) * C * n >> 2;
    }

    // Dynamic allocation boosts
    std::array<int, kNbEBands> offsets{};
    int dynalloc_logp = 6;
    total_bits <<= BITRES;
    tell = static_cast<int>(rd.tellFrac());
    for (int i = start; i < end; ++i) {
        int width = C * bandWidth(i) << LM;
        int quanta = std::min(width << BITRES, std::max(6 << BITRES, width));
        int loop_logp = dynalloc_logp;
        int boost = 0;
        while (tell + (loop_logp << BITRES) < total_bits && boost < cap[i]) {
            bool flag = rd.decodeBitLogp(static_cast<unsigned>(loop_logp));
            tell = static_cast<int>(rd.tellFrac());
            if (!flag) {
                break;
            }
            boost += quanta;
            total_bits -= quanta;
            loop_logp = 1;
        }
        offsets[i] = boost;
        if (boost > 0) {
            dynalloc_logp = std::max(2, dynalloc_logp - 1);
        }
    }

    int alloc_trim = tell + (6 << BITRES) <= total_bits ? rd.decodeIcdf(kTrimIcdf, 7) : 5;

    int bits = (static_cast<int>(rd.storage() * 8) << BITRES) - static_cast<int>(rd.tellFrac()) - 1;
    int anti_collapse_rsv = transient && LM >= 2 && bits >= ((LM + 2) << BITRES) ? (1 << BITRES) : 0;
    bits -= anti_collapse_rsv;

    Allocation alloc;
    computeAllocation(rd, offsets, cap, alloc_trim, bits, C, LM, alloc);
    unquantFineEnergy(rd, C, alloc);

    std::array<uint8_t, 2 * kNbEBands> collapse_masks{};
    std::fill(m_X.begin(), m_X.begin() + C * N, 0.0f);
    quantAllBands(rd, m_X.data(), C == 2 ? m_X.data() + N : nullptr, collapse_masks.data(), alloc,
                  transient, spread, tf_res,
                  static_cast<int>(rd.storage()) * (8 << BITRES) - anti_collapse_rsv, LM, CC == 1);

    bool anti_collapse_on = false;
    if (anti_collapse_rsv > 0) {
        anti_collapse_on = rd.decodeBits(1) != 0;
    }

    unquantEnergyFinalise(rd, C, alloc, static_cast<int>(rd.storage() * 8) - rd.tell());

    if (anti_collapse_on) {
        antiCollapse(m_X.data(), collapse_masks.data(), LM, C, N, alloc, m_rng);
    }

    if (silence) {
        std::fill(m_old_band_e.begin(), m_old_band_e.end(), -28.0f);
    }

    // Synthesis: denormalise, IMDCT and overlap into the post-filter history
    const int B = transient ? M : 1;
    const Core::CeltWindow window{ static_cast<unsigned>(N), static_cast<unsigned>(kOverlap), static_cast<unsigned>(B) };
    for (int c = 0; c < CC; ++c) {
        if (C == 1) {
            denormalise(m_X.data(), m_freq.data(), m_old_band_e.data(), M, silence);
        } else if (CC == 1) {
            denormalise(m_X.data(), m_freq.data(), m_old_band_e.data(), M, silence);
            denormalise(m_X.data() + N, m_freq.data() + N, m_old_band_e.data() + kNbEBands, M, silence);
            for (int i = 0; i < N; ++i) {
                m_freq[i] = 0.5f * (m_freq[i] + m_freq[N + i]);
            }
        } else {
            denormalise(m_X.data() + c * N, m_freq.data(), m_old_band_e.data() + c * kNbEBands, M, silence);
        }

        if (B == 1) {
            m_transform.imdct(m_freq.data(), m_time.data(), static_cast<size_t>(2 * N), 0.5f);
        } else {
            std::array<float, kShortMdctSize> coef;
            for (int b = 0; b < B; ++b) {
                for (int j = 0; j < kShortMdctSize; ++j) {
                    coef[j] = m_freq[b + j * B];
                }
                m_transform.imdct(coef.data(), m_time.data() + b * 2 * kShortMdctSize, 2 * kShortMdctSize, 0.5f);
            }
        }

        float* syn = m_history[c].data() + kCombHistory;
        m_window.applyAndOverlap(static_cast<unsigned>(c), m_time.data(), window, syn);

        m_pf_period = std::max(m_pf_period, COMBFILTER_MINPERIOD);
        m_pf_period_old = std::max(m_pf_period_old, COMBFILTER_MINPERIOD);
        combFilter(syn, m_pf_period_old, m_pf_period, kShortMdctSize,
                   m_pf_gain_old, m_pf_gain, m_pf_tapset_old, m_pf_tapset);
        if (LM != 0) {
            combFilter(syn + kShortMdctSize, m_pf_period, postfilter_pitch, N - kShortMdctSize,
                       m_pf_gain, postfilter_gain, m_pf_tapset, postfilter_tapset);
        }

        float mem = m_preemph_mem[c];
        for (int j = 0; j < N; ++j) {
            float tmp = syn[j] + mem;
            mem = kPreemphasis * tmp;
            pcm[j * CC + c] = tmp / kSigScale;
        }
        m_preemph_mem[c] = mem;

        std::vector<float>& hist = m_history[c];
        std::copy(hist.begin() + N, hist.begin() + N + kCombHistory, hist.begin());
    }

    m_pf_period_old = m_pf_period;
    m_pf_gain_old = m_pf_gain;
    m_pf_tapset_old = m_pf_tapset;
    m_pf_period = postfilter_pitch;
    m_pf_gain = postfilter_gain;
    m_pf_tapset = postfilter_tapset;
    if (LM != 0) {
        m_pf_period_old = m_pf_period;
        m_pf_gain_old = m_pf_gain;
        m_pf_tapset_old = m_pf_tapset;
    }

    if (C == 1) {
        std::copy(m_old_band_e.begin(), m_old_band_e.begin() + kNbEBands, m_old_band_e.begin() + kNbEBands);
    }

    if (!transient) {
        m_old_log_e2 = m_old_log_e;
        m_old_log_e = m_old_band_e;
    } else {
        for (int i = 0; i < 2 * kNbEBands; ++i) {
            m_old_log_e[i] = std::min(m_old_log_e[i], m_old_band_e[i]);
        }
    }
    for (int c = 0; c < 2; ++c) {
        for (int i = 0; i < kNbEBands; ++i) {
            if (i >= start && i < end) {
                continue;
            }
            m_old_band_e[c * kNbEBands + i] = 0.0f;
            m_old_log_e[c * kNbEBands + i] = -28.0f;
            m_old_log_e2[c * kNbEBands + i] = -28.0f;
        }
    }
    m_rng = rd.range();

    if (rd.tell() > static_cast<int>(rd.storage() * 8)) {
        throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA, "CELT frame overran its bit budget", frame_size);
    }
    DEBUG_LOG_LAZY("celt", "CeltDecoder::decode() ", frame_size, " samples, C=", C, " transient=", transient,
                   " silence=", silence, " coded_bands=", alloc.coded_bands);
}

void CeltDecoder::unquantCoarseEnergy(RangeDecoder& rd, int C, int LM, bool intra)
{
    const uint8_t* prob_model = kEnergyProbModel[LM][intra ? 1 : 0];
    const float coef = intra ? 0.0f : kPredCoef[LM];
    const float beta = intra ? kBetaIntra : kBetaCoef[LM];
    float prev[2] = { 0.0f, 0.0f };
    const int budget = static_cast<int>(rd.storage() * 8);

    for (int i = m_start_band; i < m_end_band; ++i) {
        for (int c = 0; c < C; ++c) {
            int qi;
            int tell = rd.tell();
            if (budget - tell >= 15) {
                int pi = 2 * std::min(i, 20);
                qi = rd.decodeLaplace(static_cast<unsigned>(prob_model[pi]) << 7, prob_model[pi + 1] << 6);
            } else if (budget - tell >= 2) {
                qi = rd.decodeIcdf(kSmallEnergyIcdf, 2);
                qi = (qi >> 1) ^ -(qi & 1);
            } else if (budget - tell >= 1) {
                qi = -static_cast<int>(rd.decodeBitLogp(1));
            } else {
                qi = -1;
            }
            const float q = static_cast<float>(qi);
            float& old = m_old_band_e[i + c * kNbEBands];
            old = std::max(-9.0f, old);
            float tmp = coef * old + prev[c] + q;
            old = std::max(-28.0f, tmp);
            prev[c] = prev[c] + q - beta * q;
        }
    }
}

void CeltDecoder::unquantFineEnergy(RangeDecoder& rd, int C, const Allocation& alloc)
{
    for (int i = m_start_band; i < m_end_band; ++i) {
        const int fine = alloc.fine_quant[i];
        if (fine <= 0) {
            continue;
        }
        for (int c = 0; c < C; ++c) {
            uint32_t q2 = rd.decodeBits(static_cast<unsigned>(fine));
            float offset = (static_cast<float>(q2) + 0.5f) * static_cast<float>(1 << (14 - fine)) / 16384.0f - 0.5f;
            m_old_band_e[i + c * kNbEBands] += offset;
        }
    }
}

void CeltDecoder::unquantEnergyFinalise(RangeDecoder& rd, int C, const Allocation& alloc, int bits_left)
{
    for (int prio = 0; prio < 2; ++prio) {
        for (int i = m_start_band; i < m_end_band && bits_left >= C; ++i) {
            if (alloc.fine_quant[i] >= MAX_FINE_BITS || alloc.fine_priority[i] != prio) {
                continue;
            }
            for (int c = 0; c < C; ++c) {
                uint32_t q2 = rd.decodeBits(1);
                float offset = (static_cast<float>(q2) - 0.5f) * static_cast<float>(1 << (14 - alloc.fine_quant[i] - 1)) / 16384.0f;
                m_old_band_e[i + c * kNbEBands] += offset;
                bits_left--;
            }
        }
    }
}

void CeltDecoder::decodeTimeFrequency(RangeDecoder& rd, bool transient, int LM,
                                      std::array<int, kNbEBands>& tf_res) const
{
    int budget = static_cast<int>(rd.storage() * 8);
    int tell = rd.tell();
    int logp = transient ? 2 : 4;
    int tf_select_rsv = LM > 0 && tell + logp + 1 <= budget ? 1 : 0;
    budget -= tf_select_rsv;
    int tf_changed = 0;
    int curr = 0;
    for (int i = m_start_band; i < m_end_band; ++i) {
        if (tell + logp <= budget) {
            curr ^= rd.decodeBitLogp(static_cast<unsigned>(logp)) ? 1 : 0;
            tell = rd.tell();
            tf_changed |= curr;
        }
        tf_res[i] = curr;
        logp = transient ? 4 : 5;
    }
    const int t = transient ? 4 : 0;
    int tf_select = 0;
    if (tf_select_rsv && kTfSelectTable[LM][t + tf_changed] != kTfSelectTable[LM][t + 2 + tf_changed]) {
        tf_select = rd.decodeBitLogp(1) ? 1 : 0;
    }
    for (int i = m_start_band; i < m_end_band; ++i) {
        tf_res[i] = kTfSelectTable[LM][t + 2 * tf_select + tf_res[i]];
    }
}

void CeltDecoder::computeAllocation(RangeDecoder& rd, const std::array<int, kNbEBands>& offsets,
                                    const std::array<int, kNbEBands>& cap, int alloc_trim, int total,
                                    int C, int LM, Allocation& alloc) const
{
    const int start = m_start_band;
    const int end = m_end_band;
    total = std::max(total, 0);
    int skip_start = start;
    // One bit to signal the end of skipped bands
    int skip_rsv = total >= 1 << BITRES ? 1 << BITRES : 0;
    total -= skip_rsv;
    int intensity_rsv = 0;
    int dual_stereo_rsv = 0;
    if (C == 2) {
        intensity_rsv = kLog2FracTable[end - start];
        if (intensity_rsv > total) {
            intensity_rsv = 0;
        } else {
            total -= intensity_rsv;
            dual_stereo_rsv = total >= 1 << BITRES ? 1 << BITRES : 0;
            total -= dual_stereo_rsv;
        }
    }

    std::array<int, kNbEBands> bits1{};
    std::array<int, kNbEBands> bits2{};
    std::array<int, kNbEBands> thresh{};
    std::array<int, kNbEBands> trim_offset{};
    for (int j = start; j < end; ++j) {
        const int width = bandWidth(j);
        // Below this no PVQ bits are allocated
        thresh[j] = std::max(C << BITRES, (3 * width << LM << BITRES) >> 4);
        trim_offset[j] = C * width * (alloc_trim - 5 - LM) * (end - j - 1) * (1 << (LM + BITRES)) >> 6;
        if (width << LM == 1) {
            trim_offset[j] -= C << BITRES;
        }
    }

    int lo = 1;
    int hi = kNbAllocVectors - 1;
    do {
        bool done = false;
        int psum = 0;
        int mid = (lo + hi) >> 1;
        for (int j = end; j-- > start;) {
            int bitsj = C * bandWidth(j) * kBandAllocation[mid][j] << LM >> 2;
            if (bitsj > 0) {
                bitsj = std::max(0, bitsj + trim_offset[j]);
            }
            bitsj += offsets[j];
            if (bitsj >= thresh[j] || done) {
                done = true;
                psum += std::min(bitsj, cap[j]);
            } else if (bitsj >= C << BITRES) {
                psum += C << BITRES;
            }
        }
        if (psum > total) {
            hi = mid - 1;
        } else {
            lo = mid + 1;
        }
    } while (lo <= hi);
    hi = lo--;

    for (int j = start; j < end; ++j) {
        const int width = bandWidth(j);
        int bits1j = C * width * kBandAllocation[lo][j] << LM >> 2;
        int bits2j = hi >= kNbAllocVectors ? cap[j] : C * width * kBandAllocation[hi][j] << LM >> 2;
        if (bits1j > 0) {
            bits1j = std::max(0, bits1j + trim_offset[j]);
        }
        if (bits2j > 0) {
            bits2j = std::max(0, bits2j + trim_offset[j]);
        }
        if (lo > 0) {
            bits1j += offsets[j];
        }
        bits2j += offsets[j];
        if (offsets[j] > 0) {
            skip_start = j;
        }
        bits1[j] = bits1j;
        bits2[j] = std::max(0, bits2j - bits1j);
    }

    alloc.coded_bands = interpolateBits(rd, skip_start, bits1.data(), bits2.data(), thresh.data(), cap.data(),
                                        total, skip_rsv, intensity_rsv, dual_stereo_rsv, C, LM, alloc);
}

int CeltDecoder::interpolateBits(RangeDecoder& rd, int skip_start, const int* bits1, const int* bits2,
                                 const int* thresh, const int* cap, int total, int skip_rsv,
                                 int intensity_rsv, int dual_stereo_rsv, int C, int LM, Allocation& alloc) const
{
    const int start = m_start_band;
    const int end = m_end_band;
    const int alloc_floor = C << BITRES;
    const int stereo = C > 1 ? 1 : 0;
    const int logM = LM << BITRES;
    int* bits = alloc.pulses.data();
    int* ebits = alloc.fine_quant.data();
    int* fine_priority = alloc.fine_priority.data();

    int lo = 0;
    int hi = 1 << ALLOC_STEPS;
    for (int i = 0; i < ALLOC_STEPS; ++i) {
        int mid = (lo + hi) >> 1;
        int psum = 0;
        bool done = false;
        for (int j = end; j-- > start;) {
            int tmp = bits1[j] + (mid * bits2[j] >> ALLOC_STEPS);
            if (tmp >= thresh[j] || done) {
                done = true;
                psum += std::min(tmp, cap[j]);
            } else if (tmp >= alloc_floor) {
                psum += alloc_floor;
            }
        }
        if (psum > total) {
            hi = mid;
        } else {
            lo = mid;
        }
    }

    int psum = 0;
    bool done = false;
    for (int j = end; j-- > start;) {
        int tmp = bits1[j] + (lo * bits2[j] >> ALLOC_STEPS);
        if (tmp < thresh[j] && !done) {
            tmp = tmp >= alloc_floor ? alloc_floor : 0;
        } else {
            done = true;
        }
        tmp = std::min(tmp, cap[j]);
        bits[j] = tmp;
        psum += tmp;
    }

    // Skip bands from the top down while the stream says so
    int coded_bands = end;
    for (;; coded_bands--) {
        int j = coded_bands - 1;
        if (j <= skip_start) {
            total += skip_rsv;
            break;
        }
        int left = total - psum;
        int percoeff = left / (kEBands[coded_bands] - kEBands[start]);
        left -= (kEBands[coded_bands] - kEBands[start]) * percoeff;
        int rem = std::max(left - (kEBands[j] - kEBands[start]), 0);
        int band_width = kEBands[coded_bands] - kEBands[j];
        int band_bits = bits[j] + percoeff * band_width + rem;
        if (band_bits >= std::max(thresh[j], alloc_floor + (1 << BITRES))) {
            if (rd.decodeBitLogp(1)) {
                break;
            }
            psum += 1 << BITRES;
            band_bits -= 1 << BITRES;
        }
        psum -= bits[j] + intensity_rsv;
        if (intensity_rsv > 0) {
            intensity_rsv = kLog2FracTable[j - start];
        }
        psum += intensity_rsv;
        if (band_bits >= alloc_floor) {
            psum += alloc_floor;
            bits[j] = alloc_floor;
        } else {
            bits[j] = 0;
        }
    }

    if (intensity_rsv > 0) {
        alloc.intensity = start + static_cast<int>(rd.decodeUInt(static_cast<uint32_t>(coded_bands + 1 - start)));
    } else {
        alloc.intensity = 0;
    }
    if (alloc.intensity <= start) {
        total += dual_stereo_rsv;
        dual_stereo_rsv = 0;
    }
    alloc.dual_stereo = dual_stereo_rsv > 0 && rd.decodeBitLogp(1) ? 1 : 0;

    // Spread what is left evenly per coefficient
    int left = total - psum;
    int percoeff = left / (kEBands[coded_bands] - kEBands[start]);
    left -= (kEBands[coded_bands] - kEBands[start]) * percoeff;
    for (int j = start; j < coded_bands; ++j) {
        bits[j] += percoeff * bandWidth(j);
    }
    for (int j = start; j < coded_bands; ++j) {
        int tmp = std::min(left, bandWidth(j));
        bits[j] += tmp;
        left -= tmp;
    }

    int balance = 0;
    int j = start;
    for (; j < coded_bands; ++j) {
        const int N0 = bandWidth(j);
        const int N = N0 << LM;
        int bit = bits[j] + balance;
        int excess;
        if (N > 1) {
            excess = std::max(bit - cap[j], 0);
            bits[j] = bit - excess;

            // Extra degree of freedom in stereo
            int den = C * N + ((C == 2 && N > 2 && !alloc.dual_stereo && j < alloc.intensity) ? 1 : 0);
            int NClogN = den * (kLogN400[j] + logM);
            int offset = (NClogN >> 1) - den * FINE_OFFSET;
            if (N == 2) {
                offset += den << BITRES >> 2;
            }
            if (bits[j] + offset < den * 2 << BITRES) {
                offset += NClogN >> 2;
            } else if (bits[j] + offset < den * 3 << BITRES) {
                offset += NClogN >> 3;
            }

            ebits[j] = std::max(0, bits[j] + offset + (den << (BITRES - 1)));
            ebits[j] = (ebits[j] / den) >> BITRES;
            if (C * ebits[j] > (bits[j] >> BITRES)) {
                ebits[j] = bits[j] >> stereo >> BITRES;
            }
            ebits[j] = std::min(ebits[j], MAX_FINE_BITS);
            fine_priority[j] = ebits[j] * (den << BITRES) >= bits[j] + offset ? 1 : 0;
            bits[j] -= C * ebits[j] << BITRES;
        } else {
            // Single bin: everything but the sign bit goes to fine energy
            excess = std::max(0, bit - (C << BITRES));
            bits[j] = bit - excess;
            ebits[j] = 0;
            fine_priority[j] = 1;
        }

        if (excess > 0) {
            int extra_fine = std::min(excess >> (stereo + BITRES), MAX_FINE_BITS - ebits[j]);
            ebits[j] += extra_fine;
            int extra_bits = extra_fine * C << BITRES;
            fine_priority[j] = extra_bits >= excess - balance ? 1 : 0;
            excess -= extra_bits;
        }
        balance = excess;
    }
    alloc.balance = balance;

    for (; j < end; ++j) {
        ebits[j] = bits[j] >> stereo >> BITRES;
        bits[j] = 0;
        fine_priority[j] = ebits[j] < 1 ? 1 : 0;
    }
    return coded_bands;
}

void CeltDecoder::quantAllBands(RangeDecoder& rd, float* X_, float* Y_, uint8_t* collapse_masks,
                                const Allocation& alloc, bool short_blocks, int spread,
                                const std::array<int, kNbEBands>& tf_res, int total_bits, int LM,
                                bool disable_inv)
{
    const int start = m_start_band;
    const int end = m_end_band;
    const int M = 1 << LM;
    const int B = short_blocks ? M : 1;
    const int C = Y_ ? 2 : 1;
    const int norm_offset = M * kEBands[start];
    const int norm_len = M * kEBands[kNbEBands - 1] - norm_offset;

    m_norm.assign(static_cast<size_t>(C * norm_len), 0.0f);
    float* norm = m_norm.data();
    float* norm2 = norm + norm_len;
    m_band_scratch.resize(static_cast<size_t>(M * bandWidth(kNbEBands - 1)));
    float* scratch = m_band_scratch.data();

    m_ctx.rd = &rd;
    m_ctx.intensity = alloc.intensity;
    m_ctx.seed = m_rng;
    m_ctx.spread = spread;
    m_ctx.disable_inv = disable_inv;

    int balance = alloc.balance;
    int dual_stereo = alloc.dual_stereo;
    int lowband_offset = 0;
    bool update_lowband = true;

    for (int i = start; i < end; ++i) {
        m_ctx.band = i;
        const bool last = i == end - 1;
        float* X = X_ + M * kEBands[i];
        float* Y = Y_ ? Y_ + M * kEBands[i] : nullptr;
        const int N = M * kEBands[i + 1] - M * kEBands[i];
        const int tell = static_cast<int>(rd.tellFrac());

        if (i != start) {
            balance -= tell;
        }
        const int remaining_bits = total_bits - tell - 1;
        m_ctx.remaining_bits = remaining_bits;
        int b = 0;
        if (i <= alloc.coded_bands - 1) {
            int curr_balance = balance / std::min(3, alloc.coded_bands - i);
            b = std::max(0, std::min(16383, std::min(remaining_bits + 1, alloc.pulses[i] + curr_balance)));
        }

        if ((M * kEBands[i] - N >= M * kEBands[start] || i == start + 1) && (update_lowband || lowband_offset == 0)) {
            lowband_offset = i;
        }
        if (i == start + 1) {
            // Duplicate enough of the first band to fold the second (hybrid start bands)
            int n1 = M * bandWidth(start);
            int n2 = M * bandWidth(start + 1);
            if (n2 > n1) {
                std::copy_n(norm + 2 * n1 - n2, n2 - n1, norm + n1);
                if (dual_stereo) {
                    std::copy_n(norm2 + 2 * n1 - n2, n2 - n1, norm2 + n1);
                }
            }
        }

        const int tf_change = tf_res[i];
        m_ctx.tf_change = tf_change;

        // Conservative collapse masks of the bands we fold from
        int effective_lowband = -1;
        uint32_t x_cm;
        uint32_t y_cm;
        if (lowband_offset != 0 && (spread != SPREAD_AGGRESSIVE || B > 1 || tf_change < 0)) {
            effective_lowband = std::max(0, M * kEBands[lowband_offset] - norm_offset - N);
            int fold_start = lowband_offset;
            while (M * kEBands[--fold_start] > effective_lowband + norm_offset) {
            }
            int fold_end = lowband_offset - 1;
            while (++fold_end < i && M * kEBands[fold_end] < effective_lowband + norm_offset + N) {
            }
            x_cm = y_cm = 0;
            int fold_i = fold_start;
            do {
                x_cm |= collapse_masks[fold_i * C + 0];
                y_cm |= collapse_masks[fold_i * C + C - 1];
            } while (++fold_i < fold_end);
        } else {
            x_cm = y_cm = (1u << B) - 1;
        }

        if (dual_stereo && i == alloc.intensity) {
            // Intensity takes over from dual stereo
            dual_stereo = 0;
            for (int j = 0; j < M * kEBands[i] - norm_offset; ++j) {
                norm[j] = 0.5f * (norm[j] + norm2[j]);
            }
        }

        float* lowband = effective_lowband != -1 ? norm + effective_lowband : nullptr;
        float* lowband_out = last ? nullptr : norm + M * kEBands[i] - norm_offset;
        if (dual_stereo) {
            float* lowband2 = effective_lowband != -1 ? norm2 + effective_lowband : nullptr;
            float* lowband_out2 = last ? nullptr : norm2 + M * kEBands[i] - norm_offset;
            x_cm = quantBand(X, N, b / 2, B, lowband, LM, lowband_out, 1.0f, scratch, static_cast<int>(x_cm));
            y_cm = quantBand(Y, N, b / 2, B, lowband2, LM, lowband_out2, 1.0f, scratch, static_cast<int>(y_cm));
        } else {
            if (Y) {
                x_cm = quantBandStereo(X, Y, N, b, B, lowband, LM, lowband_out, scratch, static_cast<int>(x_cm | y_cm));
            } else {
                x_cm = quantBand(X, N, b, B, lowband, LM, lowband_out, 1.0f, scratch, static_cast<int>(x_cm | y_cm));
            }
            y_cm = x_cm;
        }
        collapse_masks[i * C + 0] = static_cast<uint8_t>(x_cm);
        collapse_masks[i * C + C - 1] = static_cast<uint8_t>(y_cm);
        balance += alloc.pulses[i] + tell;

        // Folding position only moves while there is at least 1 bit per sample
        update_lowband = b > (N << BITRES);
    }
    m_rng = m_ctx.seed;
}

uint32_t CeltDecoder::quantBandSingle(float* X, float* Y, float* lowband_out)
{
    float* x = X;
    const int passes = Y ? 2 : 1;
    for (int c = 0; c < passes; ++c) {
        int sign = 0;
        if (m_ctx.remaining_bits >= 1 << BITRES) {
            sign = static_cast<int>(m_ctx.rd->decodeBits(1));
            m_ctx.remaining_bits -= 1 << BITRES;
        }
        x[0] = sign ? -1.0f : 1.0f;
        x = Y;
    }
    if (lowband_out) {
        lowband_out[0] = X[0];
    }
    return 1;
}

CeltDecoder::SplitContext CeltDecoder::computeTheta(int N, int& b, int B, int B0, int LM, bool stereo, int& fill)
{
    RangeDecoder& rd = *m_ctx.rd;
    SplitContext sctx;
    const int i = m_ctx.band;

    const int pulse_cap = kLogN400[i] + LM * (1 << BITRES);
    const int offset = (pulse_cap >> 1) - (stereo && N == 2 ? QTHETA_OFFSET_TWOPHASE : QTHETA_OFFSET);
    int qn = computeQn(N, b, offset, pulse_cap, stereo);
    if (stereo && i >= m_ctx.intensity) {
        qn = 1;
    }

    const int tell = static_cast<int>(rd.tellFrac());
    int itheta = 0;
    if (qn != 1) {
        if (stereo && N > 2) {
            // Step pdf: p0 up to itheta = qn/2, then 1
            const int p0 = 3;
            const int x0 = qn / 2;
            const int ft = p0 * (x0 + 1) + x0;
            int fs = static_cast<int>(rd.decode(static_cast<unsigned>(ft)));
            int x = fs < (x0 + 1) * p0 ? fs / p0 : x0 + 1 + (fs - (x0 + 1) * p0);
            int fl = x <= x0 ? p0 * x : (x - 1 - x0) + (x0 + 1) * p0;
            int fh = x <= x0 ? p0 * (x + 1) : (x - x0) + (x0 + 1) * p0;
            rd.update(static_cast<unsigned>(fl), static_cast<unsigned>(fh), static_cast<unsigned>(ft));
            itheta = x;
        } else if (B0 > 1 || stereo) {
            itheta = static_cast<int>(rd.decodeUInt(static_cast<uint32_t>(qn + 1)));
        } else {
            // Triangular pdf
            const int half = qn >> 1;
            const int ft = (half + 1) * (half + 1);
            int fm = static_cast<int>(rd.decode(static_cast<unsigned>(ft)));
            int fs;
            int fl;
            if (fm < (half * (half + 1) >> 1)) {
                itheta = static_cast<int>((isqrt32(8 * static_cast<uint32_t>(fm) + 1) - 1) >> 1);
                fs = itheta + 1;
                fl = itheta * (itheta + 1) >> 1;
            } else {
                itheta = static_cast<int>((2 * (qn + 1) - isqrt32(8 * static_cast<uint32_t>(ft - fm - 1) + 1)) >> 1);
                fs = qn + 1 - itheta;
                fl = ft - ((qn + 1 - itheta) * (qn + 2 - itheta) >> 1);
            }
            rd.update(static_cast<unsigned>(fl), static_cast<unsigned>(fl + fs), static_cast<unsigned>(ft));
        }
        itheta = itheta * 16384 / qn;
    } else if (stereo) {
        if (b > 2 << BITRES && m_ctx.remaining_bits > 2 << BITRES) {
            sctx.inv = rd.decodeBitLogp(2);
        }
        // Mono output cannot reproduce an inverted side
        if (m_ctx.disable_inv) {
            sctx.inv = false;
        }
        itheta = 0;
    }
    sctx.qalloc = static_cast<int>(rd.tellFrac()) - tell;
    b -= sctx.qalloc;

    if (itheta == 0) {
        sctx.imid = 32767;
        sctx.iside = 0;
        fill &= (1 << B) - 1;
        sctx.delta = -16384;
    } else if (itheta == 16384) {
        sctx.imid = 0;
        sctx.iside = 32767;
        fill &= ((1 << B) - 1) << B;
        sctx.delta = 16384;
    } else {
        sctx.imid = bitexactCos(itheta);
        sctx.iside = bitexactCos(16384 - itheta);
        // Mid/side allocation minimising squared error
        sctx.delta = fracMul16((N - 1) << 7, bitexactLog2tan(sctx.iside, sctx.imid));
    }
    sctx.itheta = itheta;
    return sctx;
}

uint32_t CeltDecoder::quantPartition(float* X, int N, int b, int B, float* lowband, int LM, float gain, int fill)
{
    const int B0 = B;
    const int i = m_ctx.band;
    uint32_t cm = 0;

    // Split in two if this needs 1.5 bits more than one partition can use
    const uint8_t* cache = pulseCache(i, LM);
    if (LM != -1 && b > cache[cache[0]] + 12 && N > 2) {
        N >>= 1;
        float* Y = X + N;
        LM -= 1;
        if (B == 1) {
            fill = (fill & 1) | (fill << 1);
        }
        B = (B + 1) >> 1;

        SplitContext sctx = computeTheta(N, b, B, B0, LM, false, fill);
        const float mid = static_cast<float>(sctx.imid) / 32768.0f;
        const float side = static_cast<float>(sctx.iside) / 32768.0f;
        int delta = sctx.delta;
        const int itheta = sctx.itheta;

        // More bits for low-energy short blocks
        if (B0 > 1 && (itheta & 0x3fff)) {
            if (itheta > 8192) {
                delta -= delta >> (4 - LM);
            } else {
                delta = std::min(0, delta + (N << BITRES >> (5 - LM)));
            }
        }
        int mbits = std::max(0, std::min(b, (b - delta) / 2));
        int sbits = b - mbits;
        m_ctx.remaining_bits -= sctx.qalloc;

        float* next_lowband2 = lowband ? lowband + N : nullptr;

        int rebalance = m_ctx.remaining_bits;
        if (mbits >= sbits) {
            cm = quantPartition(X, N, mbits, B, lowband, LM, gain * mid, fill);
            rebalance = mbits - (rebalance - m_ctx.remaining_bits);
            if (rebalance > 3 << BITRES && itheta != 0) {
                sbits += rebalance - (3 << BITRES);
            }
            cm |= quantPartition(Y, N, sbits, B, next_lowband2, LM, gain * side, fill >> B) << (B0 >> 1);
        } else {
            cm = quantPartition(Y, N, sbits, B, next_lowband2, LM, gain * side, fill >> B) << (B0 >> 1);
            rebalance = sbits - (rebalance - m_ctx.remaining_bits);
            if (rebalance > 3 << BITRES && itheta != 16384) {
                mbits += rebalance - (3 << BITRES);
            }
            cm |= quantPartition(X, N, mbits, B, lowband, LM, gain * mid, fill);
        }
        return cm;
    }

    int q = bitsToPulses(i, LM, b);
    int curr_bits = pulsesToBits(i, LM, q);
    m_ctx.remaining_bits -= curr_bits;
    while (m_ctx.remaining_bits < 0 && q > 0) {
        m_ctx.remaining_bits += curr_bits;
        q--;
        curr_bits = pulsesToBits(i, LM, q);
        m_ctx.remaining_bits -= curr_bits;
    }

    if (q != 0) {
        return algUnquant(X, N, getPulses(q), m_ctx.spread, B, gain);
    }

    // No pulses: fill with noise or folded spectrum
    const uint32_t cm_mask = static_cast<uint32_t>((1ul << B) - 1);
    fill &= static_cast<int>(cm_mask);
    if (!fill) {
        std::fill(X, X + N, 0.0f);
        return 0;
    }
    if (!lowband) {
        for (int j = 0; j < N; ++j) {
            m_ctx.seed = lcgRand(m_ctx.seed);
            X[j] = static_cast<float>(static_cast<int32_t>(m_ctx.seed) >> 20);
        }
        cm = cm_mask;
    } else {
        for (int j = 0; j < N; ++j) {
            m_ctx.seed = lcgRand(m_ctx.seed);
            // About 48 dB below the folded level
            const float tmp = (m_ctx.seed & 0x8000) ? 1.0f / 256 : -1.0f / 256;
            X[j] = lowband[j] + tmp;
        }
        cm = static_cast<uint32_t>(fill);
    }
    renormaliseVector(X, N, gain);
    return cm;
}

uint32_t CeltDecoder::quantBand(float* X, int N, int b, int B, float* lowband, int LM, float* lowband_out,
                                float gain, float* scratch, int fill)
{
    const int N0 = N;
    int N_B = N / B;
    int B0 = B;
    int time_divide = 0;
    int recombine = 0;
    const bool long_blocks = B0 == 1;
    int tf_change = m_ctx.tf_change;

    if (N == 1) {
        return quantBandSingle(X, nullptr, lowband_out);
    }

    if (tf_change > 0) {
        recombine = tf_change;
    }

    if (scratch && lowband && (recombine || ((N_B & 1) == 0 && tf_change < 0) || B0 > 1)) {
        std::copy(lowband, lowband + N, scratch);
        lowband = scratch;
    }

    // Recombine bands for more frequency resolution
    for (int k = 0; k < recombine; ++k) {
        if (lowband) {
            haar1(lowband, N >> k, 1 << k);
        }
        fill = kBitInterleaveTable[fill & 0xF] | kBitInterleaveTable[fill >> 4] << 2;
    }
    B >>= recombine;
    N_B <<= recombine;

    // More time resolution
    while ((N_B & 1) == 0 && tf_change < 0) {
        if (lowband) {
            haar1(lowband, N_B, B);
        }
        fill |= fill << B;
        B <<= 1;
        N_B >>= 1;
        time_divide++;
        tf_change++;
    }
    B0 = B;
    const int N_B0 = N_B;

    if (B0 > 1 && lowband) {
        deinterleaveHadamard(lowband, N_B >> recombine, B0 << recombine, long_blocks, m_hadamard_scratch);
    }

    uint32_t cm = quantPartition(X, N, b, B, lowband, LM, gain, fill);

    if (B0 > 1) {
        interleaveHadamard(X, N_B >> recombine, B0 << recombine, long_blocks, m_hadamard_scratch);
    }

    N_B = N_B0;
    B = B0;
    for (int k = 0; k < time_divide; ++k) {
        B >>= 1;
        N_B <<= 1;
        cm |= cm >> B;
        haar1(X, N_B, B);
    }

    for (int k = 0; k < recombine; ++k) {
        cm = kBitDeinterleaveTable[cm];
        haar1(X, N0 >> k, 1 << k);
    }
    B <<= recombine;

    // Scaled copy for folding into later bands
    if (lowband_out) {
        const float n = std::sqrt(static_cast<float>(N0));
        for (int j = 0; j < N0; ++j) {
            lowband_out[j] = n * X[j];
        }
    }
    return cm & ((1u << B) - 1);
}

uint32_t CeltDecoder::quantBandStereo(float* X, float* Y, int N, int b, int B, float* lowband, int LM,
                                      float* lowband_out, float* scratch, int fill)
{
    if (N == 1) {
        return quantBandSingle(X, Y, lowband_out);
    }

    const int orig_fill = fill;
    SplitContext sctx = computeTheta(N, b, B, B, LM, true, fill);
    const float mid = static_cast<float>(sctx.imid) / 32768.0f;
    const float side = static_cast<float>(sctx.iside) / 32768.0f;
    const int itheta = sctx.itheta;
    uint32_t cm = 0;

    if (N == 2) {
        // Mid and side are orthogonal; the side needs a single sign bit
        int mbits = b;
        int sbits = 0;
        if (itheta != 0 && itheta != 16384) {
            sbits = 1 << BITRES;
        }
        mbits -= sbits;
        const bool c = itheta > 8192;
        m_ctx.remaining_bits -= sctx.qalloc + sbits;

        float* x2 = c ? Y : X;
        float* y2 = c ? X : Y;
        int sign = 0;
        if (sbits) {
            sign = static_cast<int>(m_ctx.rd->decodeBits(1));
        }
        const float s = static_cast<float>(1 - 2 * sign);
        cm = quantBand(x2, N, mbits, B, lowband, LM, lowband_out, 1.0f, scratch, orig_fill);
        y2[0] = -s * x2[1];
        y2[1] = s * x2[0];
        X[0] *= mid;
        X[1] *= mid;
        Y[0] *= side;
        Y[1] *= side;
        float tmp = X[0];
        X[0] = tmp - Y[0];
        Y[0] = tmp + Y[0];
        tmp = X[1];
        X[1] = tmp - Y[1];
        Y[1] = tmp + Y[1];
    } else {
        int mbits = std::max(0, std::min(b, (b - sctx.delta) / 2));
        int sbits = b - mbits;
        m_ctx.remaining_bits -= sctx.qalloc;

        int rebalance = m_ctx.remaining_bits;
        // The mid stays normalised for folding; the side never folds
        if (mbits >= sbits) {
            cm = quantBand(X, N, mbits, B, lowband, LM, lowband_out, 1.0f, scratch, fill);
            rebalance = mbits - (rebalance - m_ctx.remaining_bits);
            if (rebalance > 3 << BITRES && itheta != 0) {
                sbits += rebalance - (3 << BITRES);
            }
            cm |= quantBand(Y, N, sbits, B, nullptr, LM, nullptr, side, nullptr, fill >> B);
        } else {
            cm = quantBand(Y, N, sbits, B, nullptr, LM, nullptr, side, nullptr, fill >> B);
            rebalance = sbits - (rebalance - m_ctx.remaining_bits);
            if (rebalance > 3 << BITRES && itheta != 16384) {
                mbits += rebalance - (3 << BITRES);
            }
            cm |= quantBand(X, N, mbits, B, lowband, LM, lowband_out, 1.0f, scratch, fill);
        }
    }

    if (N != 2) {
        stereoMerge(X, Y, mid, N);
    }
    if (sctx.inv) {
        for (int j = 0; j < N; ++j) {
            Y[j] = -Y[j];
        }
    }
    return cm;
}

uint32_t CeltDecoder::algUnquant(float* X, int N, int K, int spread, int B, float gain)
{
    m_pulses_scratch.resize(static_cast<size_t>(N));
    m_pvq_row.resize(static_cast<size_t>(K + 2));
    int* iy = m_pulses_scratch.data();

    const uint32_t v = pvqRow(N, K, m_pvq_row.data());
    pvqDecodeIndex(N, K, m_ctx.rd->decodeUInt(v), iy, m_pvq_row.data());

    float ryy = 0.0f;
    for (int j = 0; j < N; ++j) {
        ryy += static_cast<float>(iy[j] * iy[j]);
    }
    const float g = gain / std::sqrt(ryy);
    for (int j = 0; j < N; ++j) {
        X[j] = g * static_cast<float>(iy[j]);
    }
    expRotation(X, N, B, K, spread);
    return collapseMask(iy, N, B);
}

void CeltDecoder::antiCollapse(float* X_, const uint8_t* collapse_masks, int LM, int C, int size,
                               const Allocation& alloc, uint32_t seed) const
{
    for (int i = m_start_band; i < m_end_band; ++i) {
        const int N0 = bandWidth(i);
        // Depth in 1/8 bits
        const int depth = ((1 + alloc.pulses[i]) / N0) >> LM;
        const float thresh = 0.5f * std::exp2(-0.125f * static_cast<float>(depth));
        const float sqrt_1 = 1.0f / std::sqrt(static_cast<float>(N0 << LM));

        for (int c = 0; c < C; ++c) {
            float prev1 = m_old_log_e[c * kNbEBands + i];
            float prev2 = m_old_log_e2[c * kNbEBands + i];
            if (C == 1) {
                prev1 = std::max(prev1, m_old_log_e[kNbEBands + i]);
                prev2 = std::max(prev2, m_old_log_e2[kNbEBands + i]);
            }
            float ediff = std::max(0.0f, m_old_band_e[c * kNbEBands + i] - std::min(prev1, prev2));
            float r = 2.0f * std::exp2(-ediff);
            if (LM == 3) {
                r *= 1.41421356f;
            }
            r = std::min(thresh, r) * sqrt_1;

            float* X = X_ + c * size + (kEBands[i] << LM);
            bool renormalize = false;
            for (int k = 0; k < 1 << LM; ++k) {
                if (!(collapse_masks[i * C + c] & 1 << k)) {
                    for (int j = 0; j < N0; ++j) {
                        seed = lcgRand(seed);
                        X[(j << LM) + k] = (seed & 0x8000) ? r : -r;
                    }
                    renormalize = true;
                }
            }
            if (renormalize) {
                renormaliseVector(X, N0 << LM, 1.0f);
            }
        }
    }
}

void CeltDecoder::denormalise(const float* X, float* freq, const float* band_log_e, int M, bool silence) const
{
    const int N = M * kShortMdctSize;
    int start = m_start_band;
    int end = m_end_band;
    int bound = M * kEBands[end];
    if (silence) {
        bound = 0;
        start = end = 0;
    }
    float* f = freq;
    const float* x = X + M * kEBands[start];
    for (int i = 0; i < M * kEBands[start]; ++i) {
        *f++ = 0.0f;
    }
    for (int i = start; i < end; ++i) {
        const float g = std::exp2(std::min(32.0f, band_log_e[i] + kEnergyMeans[i]));
        for (int j = M * kEBands[i]; j < M * kEBands[i + 1]; ++j) {
            *f++ = *x++ * g;
        }
    }
    std::fill(freq + bound, freq + N, 0.0f);
}

void CeltDecoder::combFilter(float* x, int T0, int T1, int N, float g0, float g1, int tapset0, int tapset1) const
{
    if (g0 == 0.0f && g1 == 0.0f) {
        return;
    }
    T0 = std::max(T0, COMBFILTER_MINPERIOD);
    T1 = std::max(T1, COMBFILTER_MINPERIOD);
    const float g00 = g0 * kPostfilterTaps[tapset0][0];
    const float g01 = g0 * kPostfilterTaps[tapset0][1];
    const float g02 = g0 * kPostfilterTaps[tapset0][2];
    const float g10 = g1 * kPostfilterTaps[tapset1][0];
    const float g11 = g1 * kPostfilterTaps[tapset1][1];
    const float g12 = g1 * kPostfilterTaps[tapset1][2];

    float x1 = x[-T1 + 1];
    float x2 = x[-T1];
    float x3 = x[-T1 - 1];
    float x4 = x[-T1 - 2];
    int overlap = kOverlap;
    if (g0 == g1 && T0 == T1 && tapset0 == tapset1) {
        overlap = 0;
    }
    overlap = std::min(overlap, N);

    // Cross-fade from the old filter to the new one, in place
    int i = 0;
    for (; i < overlap; ++i) {
        float x0 = x[i - T1 + 2];
        float f = m_postfilter_window[i];
        x[i] = x[i]
            + (1.0f - f) * g00 * x[i - T0]
            + (1.0f - f) * g01 * (x[i - T0 + 1] + x[i - T0 - 1])
            + (1.0f - f) * g02 * (x[i - T0 + 2] + x[i - T0 - 2])
            + f * g10 * x2
            + f * g11 * (x1 + x3)
            + f * g12 * (x0 + x4);
        x4 = x3;
        x3 = x2;
        x2 = x1;
        x1 = x0;
    }
    if (g1 == 0.0f) {
        return;
    }
    for (; i < N; ++i) {
        float x0 = x[i - T1 + 2];
        x[i] = x[i] + g10 * x2 + g11 * (x1 + x3) + g12 * (x0 + x4);
        x4 = x3;
        x3 = x2;
        x2 = x1;
        x1 = x0;
    }
}

} // namespace Opus
} // namespace Codec
} // namespace PsyDec
