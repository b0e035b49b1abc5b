/*
 * BitWriter.h - Bit packer used by the tests to build frames
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TEST_BITWRITER_H
#define TEST_BITWRITER_H

#include <cstdint>
#include <vector>

namespace TestUtil {

/**
 * @brief Mirror of IO::BitReader for writing test bitstreams.
 *
 * MSB-first packing fills each byte from bit 7 down (MPEG, AAC); LSB-first
 * packing fills from bit 0 up and writes values low bit first (Vorbis).
 */
class BitWriter {
public:
    explicit BitWriter(bool lsb_first = false) : m_lsb_first(lsb_first) {}

    void write(uint32_t value, unsigned bits)
    {
        for (unsigned i = 0; i < bits; ++i) {
            unsigned bit = m_lsb_first ? (value >> i) & 1u : (value >> (bits - 1 - i)) & 1u;
            writeBit(bit != 0);
        }
    }

    void writeBit(bool bit)
    {
        if (m_bit_count % 8 == 0) {
            m_bytes.push_back(0);
        }
        if (bit) {
            unsigned pos = m_bit_count % 8;
            m_bytes.back() |= static_cast<uint8_t>(m_lsb_first ? (1u << pos) : (0x80u >> pos));
        }
        ++m_bit_count;
    }

    // Two's complement in `bits` bits
    void writeSigned(int32_t value, unsigned bits)
    {
        write(static_cast<uint32_t>(value) & ((bits >= 32) ? 0xFFFFFFFFu : ((1u << bits) - 1)), bits);
    }

    void align()
    {
        while (m_bit_count % 8 != 0) {
            writeBit(false);
        }
    }

    size_t bitCount() const { return m_bit_count; }
    const std::vector<uint8_t>& bytes() const { return m_bytes; }

    std::vector<uint8_t> finish()
    {
        align();
        return m_bytes;
    }

private:
    bool m_lsb_first;
    size_t m_bit_count = 0;
    std::vector<uint8_t> m_bytes;
};

} // namespace TestUtil

#endif // TEST_BITWRITER_H
