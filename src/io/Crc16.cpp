/*
 * Crc16.cpp - CRC-16 (polynomial 0x8005) for MPEG audio and ADTS frames
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace IO {

namespace {

constexpr uint16_t kPolynomial = 0x8005;

std::array<uint16_t, 256> buildTable()
{
    std::array<uint16_t, 256> table{};
    for (unsigned i = 0; i < 256; ++i) {
        uint16_t crc = static_cast<uint16_t>(i << 8);
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ kPolynomial)
                                 : static_cast<uint16_t>(crc << 1);
        }
        table[i] = crc;
    }
    return table;
}

const std::array<uint16_t, 256>& table()
{
    static const std::array<uint16_t, 256> t = buildTable();
    return t;
}

} // anonymous namespace

Crc16::Crc16(uint16_t initial)
    : m_initial(initial)
    , m_crc(initial)
{
}

void Crc16::reset()
{
    m_crc = m_initial;
}

void Crc16::update(const uint8_t* data, size_t length)
{
    const auto& t = table();
    for (size_t i = 0; i < length; ++i) {
        m_crc = static_cast<uint16_t>((m_crc << 8) ^ t[((m_crc >> 8) ^ data[i]) & 0xFF]);
    }
}

void Crc16::updateBits(uint32_t value, unsigned bit_count)
{
    while (bit_count--) {
        bool in = ((value >> bit_count) & 1u) != 0;
        bool top = (m_crc & 0x8000) != 0;
        m_crc = static_cast<uint16_t>(m_crc << 1);
        if (in != top) {
            m_crc ^= kPolynomial;
        }
    }
}

uint16_t Crc16::compute(const uint8_t* data, size_t length, uint16_t initial)
{
    Crc16 crc(initial);
    crc.update(data, length);
    return crc.value();
}

} // namespace IO
} // namespace PsyDec
