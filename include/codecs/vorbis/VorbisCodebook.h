/*
 * VorbisCodebook.h - Vorbis I entropy codebooks and VQ lookup
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef VORBISCODEBOOK_H
#define VORBISCODEBOOK_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Vorbis {

// Number of bits needed to hold `value` (ilog() in Vorbis I)
unsigned ilog(uint32_t value);

// Vorbis 32-bit packed float: 21-bit mantissa, 10-bit biased exponent, sign
float float32Unpack(uint32_t packed);

// Largest r with r^dimensions <= entries
unsigned lookup1Values(unsigned entries, unsigned dimensions);

/**
 * @brief One codebook from the setup header.
 *
 * Codewords are assigned from the entry lengths in entry order, each entry
 * taking the lowest free codeword of its length. Entries with lookup type 1
 * or 2 also carry a vector of `dimensions` floats, expanded at parse time.
 */
class VorbisCodebook {
public:
    // Largest entries * dimensions accepted for a VQ table
    static constexpr uint64_t MAX_LOOKUP_TABLE = 1u << 22;

    // Reads one codebook, starting at the 0x564342 sync pattern
    static VorbisCodebook parse(IO::BitReader& reader);

    // Entry number of the next codeword
    uint32_t decodeScalar(IO::BitReader& reader) const;

    // VQ vector of the next codeword, `dimensions()` floats
    const float* decodeVector(IO::BitReader& reader) const;

    unsigned dimensions() const { return m_dimensions; }
    unsigned entries() const { return m_entries; }
    unsigned lookupType() const { return m_lookup_type; }
    bool hasLookup() const { return m_lookup_type != 0; }

    /**
     * @brief Builds a codebook directly from entry lengths (0 = unused).
     * @throws DecoderException(CONFIG_ERROR) for an overspecified tree
     */
    static VorbisCodebook fromLengths(unsigned dimensions, const std::vector<uint8_t>& lengths);

private:
    void buildTree(const std::vector<uint8_t>& lengths);

    unsigned m_dimensions = 0;
    unsigned m_entries = 0;
    unsigned m_lookup_type = 0;
    IO::HuffmanTree m_tree;
    std::vector<float> m_values;    // entries * dimensions
};

} // namespace Vorbis
} // namespace Codec
} // namespace PsyDec

#endif // VORBISCODEBOOK_H
