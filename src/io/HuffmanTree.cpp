/*
 * HuffmanTree.cpp - Prefix code decoding over a BitReader
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace IO {

HuffmanTree::HuffmanTree()
    : m_nodes(1, Node{{0, 0}})
    , m_trivial(false)
{
}

bool HuffmanTree::insert(uint32_t code, unsigned length, int32_t symbol)
{
    if (length > 32) {
        return false;
    }
    if (length == 0) {
        // Only valid as the sole entry of a single-symbol code
        if (!m_symbols.empty()) {
            return false;
        }
        m_symbols.push_back(symbol);
        m_trivial = true;
        return true;
    }
    if (m_trivial) {
        return false;
    }

    size_t node = 0;
    for (unsigned i = 0; i < length; ++i) {
        unsigned bit = (code >> (length - 1 - i)) & 1u;
        int32_t& child = m_nodes[node].child[bit];
        bool last = (i + 1 == length);
        if (child < 0) {
            return false;  // passes through an existing leaf
        }
        if (last) {
            if (child != 0) {
                return false;  // would shadow a longer codeword
            }
            m_symbols.push_back(symbol);
            child = -static_cast<int32_t>(m_symbols.size());
        } else if (child == 0) {
            m_nodes.push_back(Node{{0, 0}});
            // push_back may have moved the vector; index again
            m_nodes[node].child[bit] = static_cast<int32_t>(m_nodes.size() - 1);
            node = m_nodes.size() - 1;
        } else {
            node = static_cast<size_t>(child);
        }
    }
    return true;
}

HuffmanTree HuffmanTree::fromTable(const uint32_t* codes, const uint8_t* lengths, size_t count)
{
    HuffmanTree tree;
    for (size_t i = 0; i < count; ++i) {
        if (!tree.insert(codes[i], lengths[i], static_cast<int32_t>(i))) {
            throw std::logic_error("HuffmanTree: static table entry " + std::to_string(i) + " is not prefix free");
        }
    }
    return tree;
}

int32_t HuffmanTree::decode(BitReader& reader) const
{
    if (m_trivial) {
        return m_symbols[0];
    }
    size_t node = 0;
    for (;;) {
        int32_t child = m_nodes[node].child[reader.readBit() ? 1 : 0];
        if (child < 0) {
            return m_symbols[static_cast<size_t>(-child - 1)];
        }
        if (child == 0) {
            throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA, "Invalid Huffman codeword");
        }
        node = static_cast<size_t>(child);
    }
}

} // namespace IO
} // namespace PsyDec
