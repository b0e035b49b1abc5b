/*
 * Crc16.h - CRC-16 (polynomial 0x8005) for MPEG audio and ADTS frames
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CRC16_H
#define CRC16_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace IO {

/**
 * Table-driven CRC-16, x^16 + x^15 + x^2 + 1, MSB first, no reflection.
 * MPEG audio and ADTS start the register at 0xFFFF.
 */
class Crc16 {
public:
    explicit Crc16(uint16_t initial = 0xFFFF);

    void reset();
    void update(const uint8_t* data, size_t length);
    // Feeds the low `bit_count` bits of `value`, most significant first
    void updateBits(uint32_t value, unsigned bit_count);
    uint16_t value() const { return m_crc; }

    static uint16_t compute(const uint8_t* data, size_t length, uint16_t initial = 0xFFFF);

private:
    uint16_t m_initial;
    uint16_t m_crc;
};

} // namespace IO
} // namespace PsyDec

#endif // CRC16_H
