/*
 * BitReader.cpp - Bit-granular cursor over a frame buffer
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace IO {

BitReader::BitReader(const uint8_t* data, size_t size, BitOrder order)
    : m_data(data)
    , m_size(data ? size : 0)
    , m_order(order)
    , m_byte_position(0)
    , m_bit_cache(0)
    , m_cache_bits(0)
    , m_total_bits_read(0)
{
}

void BitReader::refillCache()
{
    if (m_order == BitOrder::MSB_FIRST) {
        // New bytes enter at the bottom, the oldest bits sit highest
        while (m_cache_bits <= 56 && m_byte_position < m_size) {
            m_bit_cache = (m_bit_cache << 8) | m_data[m_byte_position++];
            m_cache_bits += 8;
        }
    } else {
        // New bytes enter above the valid bits, the oldest bits sit lowest
        while (m_cache_bits <= 56 && m_byte_position < m_size) {
            m_bit_cache |= static_cast<uint64_t>(m_data[m_byte_position++]) << m_cache_bits;
            m_cache_bits += 8;
        }
    }
}

void BitReader::ensureBits(unsigned bit_count)
{
    if (bit_count > 32) {
        throw std::invalid_argument("BitReader: cannot read more than 32 bits at once");
    }
    if (m_cache_bits < bit_count) {
        refillCache();
    }
    if (m_cache_bits < bit_count) {
        DEBUG_LOG_LAZY("bitreader", "BitReader::ensureBits() wanted ", bit_count,
                       " bits at position ", m_total_bits_read, ", ", m_cache_bits, " left");
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED,
                               "Read of " + std::to_string(bit_count) + " bits past end of buffer");
    }
}

uint32_t BitReader::cachedBits(unsigned bit_count) const
{
    uint64_t mask = (1ULL << bit_count) - 1;
    if (m_order == BitOrder::MSB_FIRST) {
        return static_cast<uint32_t>((m_bit_cache >> (m_cache_bits - bit_count)) & mask);
    }
    return static_cast<uint32_t>(m_bit_cache & mask);
}

void BitReader::consumeBits(unsigned bit_count)
{
    m_cache_bits -= bit_count;
    m_total_bits_read += bit_count;
    if (m_order == BitOrder::MSB_FIRST) {
        m_bit_cache &= (m_cache_bits == 0) ? 0 : ((1ULL << m_cache_bits) - 1);
    } else {
        m_bit_cache = (bit_count == 64) ? 0 : (m_bit_cache >> bit_count);
    }
}

uint32_t BitReader::readBits(unsigned bit_count)
{
    if (bit_count == 0) {
        return 0;
    }
    ensureBits(bit_count);
    uint32_t value = cachedBits(bit_count);
    consumeBits(bit_count);
    return value;
}

uint32_t BitReader::peekBits(unsigned bit_count)
{
    if (bit_count == 0) {
        return 0;
    }
    ensureBits(bit_count);
    return cachedBits(bit_count);
}

bool BitReader::readBit()
{
    return readBits(1) != 0;
}

int32_t BitReader::readBitsSigned(unsigned bit_count)
{
    if (bit_count == 0) {
        return 0;
    }
    uint32_t value = readBits(bit_count);
    if (bit_count < 32 && (value & (1U << (bit_count - 1)))) {
        value |= ~((1U << bit_count) - 1);
    }
    return static_cast<int32_t>(value);
}

void BitReader::byteAlign()
{
    unsigned bits_to_skip = static_cast<unsigned>((8 - (m_total_bits_read % 8)) % 8);
    if (bits_to_skip > 0) {
        ensureBits(bits_to_skip);
        consumeBits(bits_to_skip);
    }
}

bool BitReader::isAligned() const
{
    return (m_total_bits_read % 8) == 0;
}

void BitReader::skipBits(size_t bit_count)
{
    if (bit_count > bitsRemaining()) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED,
                               "Skip of " + std::to_string(bit_count) + " bits past end of buffer");
    }
    seekBits(m_total_bits_read + bit_count);
}

void BitReader::seekBits(size_t bit_position)
{
    if (bit_position > m_size * 8) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED,
                               "Seek to bit " + std::to_string(bit_position) + " past end of buffer");
    }
    m_byte_position = bit_position / 8;
    m_bit_cache = 0;
    m_cache_bits = 0;
    m_total_bits_read = m_byte_position * 8;
    unsigned partial = static_cast<unsigned>(bit_position % 8);
    if (partial > 0) {
        refillCache();
        consumeBits(partial);
    }
}

size_t BitReader::bitsRemaining() const
{
    return m_size * 8 - m_total_bits_read;
}

size_t BitReader::bitPosition() const
{
    return m_total_bits_read;
}

size_t BitReader::bytePosition() const
{
    return m_total_bits_read / 8;
}

} // namespace IO
} // namespace PsyDec
