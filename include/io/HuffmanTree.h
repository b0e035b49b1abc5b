/*
 * HuffmanTree.h - Prefix code decoding over a BitReader
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUFFMANTREE_H
#define HUFFMANTREE_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace IO {

/**
 * @brief Binary decoding tree for one prefix code.
 *
 * Codewords are inserted most significant bit first and decoded one bit at
 * a time with BitReader::readBit(), so the same tree serves MSB-first
 * (MPEG, AAC) and LSB-first (Vorbis) streams. A walk that reaches a missing
 * branch throws DecoderException(CORRUPT_SPECTRAL_DATA).
 */
class HuffmanTree {
public:
    HuffmanTree();

    /**
     * @brief Adds one codeword.
     * @return false if the code collides with, or is a prefix of, an
     *         existing codeword
     */
    bool insert(uint32_t code, unsigned length, int32_t symbol);

    // Builds from parallel code/length arrays; symbol i is index i
    static HuffmanTree fromTable(const uint32_t* codes, const uint8_t* lengths, size_t count);

    int32_t decode(BitReader& reader) const;

    bool empty() const { return m_symbols.empty(); }
    size_t size() const { return m_symbols.size(); }
    // A one-entry tree with a zero-length code decodes without reading
    bool isTrivial() const { return m_trivial; }

private:
    // child value: 0 = absent, > 0 = node index, < 0 = -(symbol index + 1)
    struct Node {
        int32_t child[2];
    };

    std::vector<Node> m_nodes;
    std::vector<int32_t> m_symbols;
    bool m_trivial;
};

} // namespace IO
} // namespace PsyDec

#endif // HUFFMANTREE_H
