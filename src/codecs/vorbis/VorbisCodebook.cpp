/*
 * VorbisCodebook.cpp - Vorbis I entropy codebooks and VQ lookup
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace Vorbis {

unsigned ilog(uint32_t value)
{
    unsigned bits = 0;
    while (value) {
        ++bits;
        value >>= 1;
    }
    return bits;
}

float float32Unpack(uint32_t packed)
{
    double mantissa = packed & 0x1FFFFF;
    int exponent = static_cast<int>((packed & 0x7FE00000) >> 21);
    if (packed & 0x80000000) {
        mantissa = -mantissa;
    }
    return static_cast<float>(std::ldexp(mantissa, exponent - 788));
}

unsigned lookup1Values(unsigned entries, unsigned dimensions)
{
    if (dimensions == 0) {
        return 0;
    }
    unsigned r = static_cast<unsigned>(std::floor(std::pow(static_cast<double>(entries), 1.0 / dimensions)));
    // Correct for pow() rounding either way
    auto fits = [entries, dimensions](unsigned v) {
        uint64_t acc = 1;
        for (unsigned i = 0; i < dimensions; ++i) {
            acc *= v;
            if (acc > entries) {
                return false;
            }
        }
        return true;
    };
    while (r > 0 && !fits(r)) {
        --r;
    }
    while (fits(r + 1)) {
        ++r;
    }
    return r;
}

void VorbisCodebook::buildTree(const std::vector<uint8_t>& lengths)
{
    unsigned used = 0;
    size_t last_used = 0;
    for (size_t i = 0; i < lengths.size(); ++i) {
        if (lengths[i]) {
            ++used;
            last_used = i;
        }
    }

    m_tree = IO::HuffmanTree();
    if (used == 0) {
        return;
    }
    if (used == 1) {
        // A lone entry owns both one-bit codewords
        m_tree.insert(0, 1, static_cast<int32_t>(last_used));
        m_tree.insert(1, 1, static_cast<int32_t>(last_used));
        return;
    }

    // marker[len] is the next free codeword of each length
    uint32_t marker[33] = {};
    for (size_t i = 0; i < lengths.size(); ++i) {
        unsigned len = lengths[i];
        if (len == 0) {
            continue;
        }
        uint32_t entry = marker[len];
        if (len < 32 && (entry >> len) != 0) {
            throw DecoderException(DecoderError::CONFIG_ERROR,
                                   "Vorbis codebook is overspecified at entry " + std::to_string(i));
        }
        if (!m_tree.insert(entry, len, static_cast<int32_t>(i))) {
            throw DecoderException(DecoderError::CONFIG_ERROR,
                                   "Vorbis codebook has colliding codewords at entry " + std::to_string(i));
        }

        for (unsigned j = len; j > 0; --j) {
            if (marker[j] & 1) {
                if (j == 1) {
                    ++marker[1];
                } else {
                    marker[j] = marker[j - 1] << 1;
                }
                break;
            }
            ++marker[j];
        }
        for (unsigned j = len + 1; j < 33; ++j) {
            if ((marker[j] >> 1) == entry) {
                entry = marker[j];
                marker[j] = marker[j - 1] << 1;
            } else {
                break;
            }
        }
    }
}

VorbisCodebook VorbisCodebook::fromLengths(unsigned dimensions, const std::vector<uint8_t>& lengths)
{
    VorbisCodebook book;
    book.m_dimensions = dimensions;
    book.m_entries = static_cast<unsigned>(lengths.size());
    book.buildTree(lengths);
    return book;
}

VorbisCodebook VorbisCodebook::parse(IO::BitReader& reader)
{
    uint32_t sync = reader.readBits(24);
    if (sync != 0x564342) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis codebook sync pattern not found");
    }

    VorbisCodebook book;
    book.m_dimensions = reader.readBits(16);
    book.m_entries = reader.readBits(24);
    if (book.m_dimensions == 0 && book.m_entries > 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis codebook with zero dimensions");
    }

    std::vector<uint8_t> lengths(book.m_entries, 0);
    bool ordered = reader.readBit();
    if (!ordered) {
        bool sparse = reader.readBit();
        for (unsigned i = 0; i < book.m_entries; ++i) {
            if (!sparse || reader.readBit()) {
                lengths[i] = static_cast<uint8_t>(reader.readBits(5) + 1);
            }
        }
    } else {
        unsigned current_entry = 0;
        unsigned current_length = reader.readBits(5) + 1;
        while (current_entry < book.m_entries) {
            unsigned number = reader.readBits(ilog(book.m_entries - current_entry));
            if (current_entry + number > book.m_entries || current_length > 32) {
                throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis ordered codebook overruns its entries");
            }
            std::fill(lengths.begin() + current_entry, lengths.begin() + current_entry + number,
                      static_cast<uint8_t>(current_length));
            current_entry += number;
            ++current_length;
        }
    }
    book.buildTree(lengths);

    book.m_lookup_type = reader.readBits(4);
    if (book.m_lookup_type > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Vorbis codebook lookup type " + std::to_string(book.m_lookup_type));
    }
    if (book.m_lookup_type == 0) {
        return book;
    }

    float minimum = float32Unpack(reader.readBits(32));
    float delta = float32Unpack(reader.readBits(32));
    unsigned value_bits = reader.readBits(4) + 1;
    bool sequence_p = reader.readBit();

    // Both sizes are checked before anything is allocated
    const uint64_t table_size = static_cast<uint64_t>(book.m_entries) * book.m_dimensions;
    if (table_size > MAX_LOOKUP_TABLE) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Vorbis codebook lookup table of " + std::to_string(table_size) + " values");
    }
    const uint64_t lookup_values = (book.m_lookup_type == 1)
        ? lookup1Values(book.m_entries, book.m_dimensions)
        : table_size;
    if (lookup_values * value_bits > reader.bitsRemaining()) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Vorbis codebook multiplicands run past the setup header");
    }

    std::vector<uint32_t> multiplicands(static_cast<size_t>(lookup_values));
    for (uint32_t& multiplicand : multiplicands) {
        multiplicand = reader.readBits(value_bits);
    }

    book.m_values.assign(static_cast<size_t>(table_size), 0.0f);
    for (unsigned entry = 0; entry < book.m_entries; ++entry) {
        float last = 0.0f;
        uint64_t index_divisor = 1;
        for (unsigned j = 0; j < book.m_dimensions; ++j) {
            size_t offset = (book.m_lookup_type == 1)
                ? static_cast<size_t>((entry / index_divisor) % lookup_values)
                : static_cast<size_t>(entry) * book.m_dimensions + j;
            float value = multiplicands[offset] * delta + minimum + last;
            if (sequence_p) {
                last = value;
            }
            book.m_values[static_cast<size_t>(entry) * book.m_dimensions + j] = value;
            if (book.m_lookup_type == 1) {
                index_divisor *= lookup_values;
            }
        }
    }
    return book;
}

uint32_t VorbisCodebook::decodeScalar(IO::BitReader& reader) const
{
    return static_cast<uint32_t>(m_tree.decode(reader));
}

const float* VorbisCodebook::decodeVector(IO::BitReader& reader) const
{
    if (m_lookup_type == 0) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Vorbis codebook used for VQ has no lookup table");
    }
    uint32_t entry = decodeScalar(reader);
    return m_values.data() + static_cast<size_t>(entry) * m_dimensions;
}

} // namespace Vorbis
} // namespace Codec
} // namespace PsyDec
