/*
 * RangeDecoder.h - Opus entropy decoder (RFC 6716 section 4.1)
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef RANGEDECODER_H
#define RANGEDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {

/**
 * @brief Range decoder shared by SILK and CELT.
 *
 * Range coded symbols are read from the front of the frame and raw bits
 * from the back. Reading past either end yields zeros, as the format
 * requires, so the decoder itself never throws; callers budget with
 * tell() and tellFrac().
 */
class RangeDecoder {
public:
    static constexpr int BITRES = 3;

    RangeDecoder() = default;
    RangeDecoder(const uint8_t* data, size_t size) { init(data, size); }

    void init(const uint8_t* data, size_t size);

    // Frequency-table primitives
    unsigned decode(unsigned ft);
    unsigned decodeBin(unsigned bits);
    void update(unsigned fl, unsigned fh, unsigned ft);

    bool decodeBitLogp(unsigned logp);
    int decodeIcdf(const uint8_t* icdf, unsigned ftb);
    uint32_t decodeUInt(uint32_t ft);
    uint32_t decodeBits(unsigned bits);
    int decodeLaplace(unsigned fs, int decay);

    // Bits consumed so far, whole and in 1/8 bit units
    int tell() const { return m_nbits_total - ilog(m_rng); }
    uint32_t tellFrac() const;

    // Drops trailing bytes (redundant CELT data at the end of a frame)
    void shrink(size_t bytes) { m_storage -= std::min<size_t>(bytes, m_storage); }

    // Marks the whole frame as read, used for CELT silence frames
    void consumeAll() { m_nbits_total += static_cast<int>(m_storage * 8) - tell(); }

    size_t storage() const { return m_storage; }
    uint32_t range() const { return m_rng; }
    bool hasError() const { return m_error; }

    static int ilog(uint32_t v) { return v ? 32 - __builtin_clz(v) : 0; }

private:
    int readByte() { return m_offs < m_storage ? m_data[m_offs++] : 0; }
    int readByteFromEnd() { return m_end_offs < m_storage ? m_data[m_storage - ++m_end_offs] : 0; }
    void normalize();

    const uint8_t* m_data = nullptr;
    size_t m_storage = 0;
    size_t m_offs = 0;
    size_t m_end_offs = 0;
    uint32_t m_end_window = 0;
    int m_nend_bits = 0;
    int m_nbits_total = 0;
    uint32_t m_rng = 0;
    uint32_t m_val = 0;
    uint32_t m_ext = 0;
    int m_rem = 0;
    bool m_error = false;
};

} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // RANGEDECODER_H
