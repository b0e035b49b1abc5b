/*
 * BitReader.h - Bit-granular cursor over a frame buffer
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef BITREADER_H
#define BITREADER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace IO {

/**
 * BitReader - Efficient bit-level reading from a borrowed byte slice
 *
 * Supports the two bit orders the decoders need:
 * - MSB_FIRST for MPEG audio, AAC and the Opus TOC (bit 7 of each byte first)
 * - LSB_FIRST for Vorbis packets (bit 0 of each byte first)
 *
 * The slice is not copied and must outlive the reader. A 64-bit cache keeps
 * multi-bit reads cheap. Any read that would cross the end of the slice
 * throws DecoderException(BITSTREAM_EXHAUSTED) and leaves the cursor where
 * it was.
 */
class BitReader {
public:
    enum class BitOrder {
        MSB_FIRST,
        LSB_FIRST
    };

    BitReader(const uint8_t* data, size_t size, BitOrder order = BitOrder::MSB_FIRST);

    // Basic bit reading (n <= 32)
    uint32_t readBits(unsigned bit_count);
    uint32_t peekBits(unsigned bit_count);
    bool readBit();
    int32_t readBitsSigned(unsigned bit_count);

    // Alignment and positioning
    void byteAlign();
    bool isAligned() const;
    void skipBits(size_t bit_count);
    void seekBits(size_t bit_position);

    // State queries
    size_t bitsRemaining() const;
    size_t bitPosition() const;
    size_t bytePosition() const;
    size_t size() const { return m_size; }
    const uint8_t* data() const { return m_data; }
    BitOrder order() const { return m_order; }

private:
    const uint8_t* m_data;
    size_t m_size;
    BitOrder m_order;

    size_t m_byte_position;      // Next byte to load into the cache
    uint64_t m_bit_cache;        // Cached bits
    uint32_t m_cache_bits;       // Number of valid bits in cache
    size_t m_total_bits_read;

    void refillCache();
    void ensureBits(unsigned bit_count);
    uint32_t cachedBits(unsigned bit_count) const;
    void consumeBits(unsigned bit_count);
};

} // namespace IO
} // namespace PsyDec

#endif // BITREADER_H
