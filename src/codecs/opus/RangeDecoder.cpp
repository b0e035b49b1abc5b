/*
 * RangeDecoder.cpp - Opus entropy decoder (RFC 6716 section 4.1)
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

namespace {

constexpr int SYM_BITS = 8;
constexpr int CODE_BITS = 32;
constexpr uint32_t SYM_MAX = (1u << SYM_BITS) - 1;
constexpr uint32_t CODE_TOP = 1u << (CODE_BITS - 1);
constexpr uint32_t CODE_BOT = CODE_TOP >> SYM_BITS;
constexpr int CODE_EXTRA = (CODE_BITS - 2) % SYM_BITS + 1;
constexpr int UINT_BITS = 8;
constexpr int WINDOW_SIZE = 32;
constexpr unsigned LAPLACE_MINP = 1;
constexpr unsigned LAPLACE_NMIN = 16;

} // namespace

void RangeDecoder::init(const uint8_t* data, size_t size)
{
    m_data = data;
    m_storage = size;
    m_offs = 0;
    m_end_offs = 0;
    m_end_window = 0;
    m_nend_bits = 0;
    m_nbits_total = CODE_BITS + 1 - ((CODE_BITS - CODE_EXTRA) / SYM_BITS) * SYM_BITS;
    m_rng = 1u << CODE_EXTRA;
    m_rem = readByte();
    m_val = m_rng - 1 - (static_cast<uint32_t>(m_rem) >> (SYM_BITS - CODE_EXTRA));
    m_ext = 0;
    m_error = false;
    normalize();
}

void RangeDecoder::normalize()
{
    while (m_rng <= CODE_BOT) {
        m_nbits_total += SYM_BITS;
        m_rng <<= SYM_BITS;
        int sym = m_rem;
        m_rem = readByte();
        sym = (sym << SYM_BITS | m_rem) >> (SYM_BITS - CODE_EXTRA);
        m_val = ((m_val << SYM_BITS) + (SYM_MAX & ~static_cast<uint32_t>(sym))) & (CODE_TOP - 1);
    }
}

unsigned RangeDecoder::decode(unsigned ft)
{
    m_ext = m_rng / ft;
    unsigned s = m_val / m_ext;
    return ft - std::min(s + 1, ft);
}

unsigned RangeDecoder::decodeBin(unsigned bits)
{
    m_ext = m_rng >> bits;
    unsigned s = m_val / m_ext;
    return (1u << bits) - std::min(s + 1, 1u << bits);
}

void RangeDecoder::update(unsigned fl, unsigned fh, unsigned ft)
{
    uint32_t s = m_ext * (ft - fh);
    m_val -= s;
    m_rng = fl > 0 ? m_ext * (fh - fl) : m_rng - s;
    normalize();
}

bool RangeDecoder::decodeBitLogp(unsigned logp)
{
    uint32_t s = m_rng >> logp;
    bool ret = m_val < s;
    if (!ret) {
        m_val -= s;
    }
    m_rng = ret ? s : m_rng - s;
    normalize();
    return ret;
}

int RangeDecoder::decodeIcdf(const uint8_t* icdf, unsigned ftb)
{
    uint32_t s = m_rng;
    uint32_t r = s >> ftb;
    uint32_t t;
    int ret = -1;
    do {
        t = s;
        s = r * icdf[++ret];
    } while (m_val < s);
    m_val -= s;
    m_rng = t - s;
    normalize();
    return ret;
}

uint32_t RangeDecoder::decodeUInt(uint32_t ft)
{
    if (ft <= 1) {
        return 0;
    }
    --ft;
    int ftb = ilog(ft);
    if (ftb > UINT_BITS) {
        ftb -= UINT_BITS;
        unsigned top = (ft >> ftb) + 1;
        unsigned s = decode(top);
        update(s, s + 1, top);
        uint32_t t = static_cast<uint32_t>(s) << ftb | decodeBits(static_cast<unsigned>(ftb));
        if (t <= ft) {
            return t;
        }
        m_error = true;
        return ft;
    }
    ++ft;
    unsigned s = decode(ft);
    update(s, s + 1, ft);
    return s;
}

uint32_t RangeDecoder::decodeBits(unsigned bits)
{
    if (bits == 0) {
        return 0;
    }
    uint32_t window = m_end_window;
    int available = m_nend_bits;
    if (static_cast<unsigned>(available) < bits) {
        do {
            window |= static_cast<uint32_t>(readByteFromEnd()) << available;
            available += SYM_BITS;
        } while (available <= WINDOW_SIZE - SYM_BITS);
    }
    uint32_t ret = bits >= 32 ? window : window & ((1u << bits) - 1u);
    window = bits >= 32 ? 0 : window >> bits;
    available -= static_cast<int>(bits);
    m_end_window = window;
    m_nend_bits = available;
    m_nbits_total += static_cast<int>(bits);
    return ret;
}

int RangeDecoder::decodeLaplace(unsigned fs, int decay)
{
    int val = 0;
    unsigned fl = 0;
    unsigned fm = decodeBin(15);
    if (fm >= fs) {
        ++val;
        fl = fs;
        fs = ((32768 - LAPLACE_MINP * (2 * LAPLACE_NMIN) - fs) * static_cast<unsigned>(16384 - decay) >> 15)
             + LAPLACE_MINP;
        while (fs > LAPLACE_MINP && fm >= fl + 2 * fs) {
            fs *= 2;
            fl += fs;
            fs = ((fs - 2 * LAPLACE_MINP) * static_cast<unsigned>(decay)) >> 15;
            fs += LAPLACE_MINP;
            ++val;
        }
        // Past the decaying part every value has probability LAPLACE_MINP
        if (fs <= LAPLACE_MINP) {
            unsigned di = (fm - fl) >> 1;
            val += static_cast<int>(di);
            fl += 2 * di * LAPLACE_MINP;
        }
        if (fm < fl + fs) {
            val = -val;
        } else {
            fl += fs;
        }
    }
    update(fl, std::min(fl + fs, 32768u), 32768);
    return val;
}

uint32_t RangeDecoder::tellFrac() const
{
    static const uint32_t correction[8] = {35733, 38967, 42495, 46340, 50535, 55109, 60097, 65535};
    uint32_t nbits = static_cast<uint32_t>(m_nbits_total) << BITRES;
    int l = ilog(m_rng);
    uint32_t r = m_rng >> (l - 16);
    uint32_t b = (r >> 12) - 8;
    b += r > correction[b];
    l = (l << 3) + static_cast<int>(b);
    return nbits - static_cast<uint32_t>(l);
}

} // namespace Opus
} // namespace Codec
} // namespace PsyDec
