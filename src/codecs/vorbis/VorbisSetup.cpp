/*
 * VorbisSetup.cpp - Vorbis I header packets
 * This file is part of PsyDec.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace Vorbis {

namespace {

uint32_t readLE32(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void checkHeader(const uint8_t* data, size_t size, unsigned type, const char* name)
{
    if (!VorbisSetup::isHeaderPacket(data, size, type)) {
        throw DecoderException(DecoderError::CONFIG_ERROR, std::string("Not a Vorbis ") + name + " header");
    }
}

} // anonymous namespace

bool VorbisSetup::isHeaderPacket(const uint8_t* data, size_t size, unsigned type)
{
    return data && size >= 7 && data[0] == type && std::memcmp(data + 1, "vorbis", 6) == 0;
}

VorbisIdentification VorbisIdentification::parse(const uint8_t* data, size_t size)
{
    // [0] type, [1-6] "vorbis", [7-10] version, [11] channels, [12-15] rate,
    // [16-27] bitrates, [28] blocksizes, [29] framing
    checkHeader(data, size, 1, "identification");
    if (size < 30) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis identification header truncated");
    }

    uint32_t version = readLE32(data + 7);
    if (version != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Unsupported Vorbis version " + std::to_string(version));
    }

    VorbisIdentification id;
    id.channels = data[11];
    id.sample_rate = readLE32(data + 12);
    id.bitrate_maximum = static_cast<int32_t>(readLE32(data + 16));
    id.bitrate_nominal = static_cast<int32_t>(readLE32(data + 20));
    id.bitrate_minimum = static_cast<int32_t>(readLE32(data + 24));
    unsigned exp0 = data[28] & 0x0F;
    unsigned exp1 = data[28] >> 4;
    bool framing = data[29] & 1;

    if (id.channels == 0 || id.sample_rate == 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis stream with no channels or no sample rate");
    }
    // Block sizes are 2^6 to 2^13 and the short one is not the longer
    if (exp0 < 6 || exp0 > 13 || exp1 < 6 || exp1 > 13 || exp0 > exp1) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Invalid Vorbis block sizes");
    }
    if (!framing) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis identification header framing bit not set");
    }
    id.blocksize_0 = 1u << exp0;
    id.blocksize_1 = 1u << exp1;
    return id;
}

VorbisComment VorbisComment::parse(const uint8_t* data, size_t size)
{
    checkHeader(data, size, 3, "comment");
    VorbisComment vc;
    size_t pos = 7;

    auto readString = [&](std::string& out) {
        if (pos + 4 > size) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis comment header truncated");
        }
        uint32_t length = readLE32(data + pos);
        pos += 4;
        if (length > size - pos) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis comment length past end of header");
        }
        out.assign(reinterpret_cast<const char*>(data + pos), length);
        pos += length;
    };

    readString(vc.vendor);
    if (pos + 4 > size) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis comment header truncated");
    }
    uint32_t count = readLE32(data + pos);
    pos += 4;
    for (uint32_t i = 0; i < count; ++i) {
        std::string comment;
        readString(comment);
        vc.comments.push_back(std::move(comment));
    }
    Debug::log("vorbis", "VorbisComment::parse() vendor \"", vc.vendor, "\", ", vc.comments.size(), " comment(s)");
    return vc;
}

std::optional<std::string> VorbisComment::find(const std::string& field) const
{
    for (const std::string& comment : comments) {
        size_t eq = comment.find('=');
        if (eq != field.size()) {
            continue;
        }
        bool match = std::equal(field.begin(), field.end(), comment.begin(), [](char a, char b) {
            return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
        });
        if (match) {
            return comment.substr(eq + 1);
        }
    }
    return std::nullopt;
}

VorbisSetup::VorbisSetup(const std::vector<uint8_t>& identification, const std::vector<uint8_t>& comment,
                         const std::vector<uint8_t>& setup)
    : m_id(VorbisIdentification::parse(identification.data(), identification.size()))
    , m_comment(VorbisComment::parse(comment.data(), comment.size()))
{
    try {
        parseSetup(setup.data(), setup.size());
    } catch (const DecoderException& e) {
        if (e.getError() == DecoderError::CONFIG_ERROR) {
            throw;
        }
        throw DecoderException(DecoderError::CONFIG_ERROR, std::string("Vorbis setup header: ") + e.what());
    }

    Debug::log("vorbis", "VorbisSetup::VorbisSetup() ", m_id.channels, " channel(s) at ", m_id.sample_rate,
               " Hz, blocks ", m_id.blocksize_0, "/", m_id.blocksize_1, ", ", codebooks.size(), " codebooks, ",
               modes.size(), " modes");
}

void VorbisSetup::checkBook(unsigned book, const char* user) const
{
    if (book >= codebooks.size()) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               std::string(user) + " references missing codebook " + std::to_string(book));
    }
}

void VorbisSetup::parseSetup(const uint8_t* data, size_t size)
{
    checkHeader(data, size, 5, "setup");
    IO::BitReader reader(data + 7, size - 7, IO::BitReader::BitOrder::LSB_FIRST);

    unsigned codebook_count = reader.readBits(8) + 1;
    codebooks.reserve(codebook_count);
    for (unsigned i = 0; i < codebook_count; ++i) {
        codebooks.push_back(VorbisCodebook::parse(reader));
    }

    // Time domain transforms are placeholders and must be zero
    unsigned time_count = reader.readBits(6) + 1;
    for (unsigned i = 0; i < time_count; ++i) {
        if (reader.readBits(16) != 0) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Nonzero Vorbis time domain transform");
        }
    }

    floors.resize(reader.readBits(6) + 1);
    for (Floor& floor : floors) {
        readFloor(reader, floor);
    }

    residues.resize(reader.readBits(6) + 1);
    for (Residue& residue : residues) {
        readResidue(reader, residue);
    }

    mappings.resize(reader.readBits(6) + 1);
    for (Mapping& mapping : mappings) {
        readMapping(reader, mapping);
    }

    modes.resize(reader.readBits(6) + 1);
    for (Mode& mode : modes) {
        mode.blockflag = reader.readBit();
        unsigned window_type = reader.readBits(16);
        unsigned transform_type = reader.readBits(16);
        mode.mapping = reader.readBits(8);
        if (window_type != 0 || transform_type != 0 || mode.mapping >= mappings.size()) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Invalid Vorbis mode");
        }
    }

    if (!reader.readBit()) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis setup header framing bit not set");
    }
}

void VorbisSetup::readFloor(IO::BitReader& reader, Floor& floor) const
{
    floor.type = reader.readBits(16);
    if (floor.type == 0) {
        Floor0& f = floor.floor0;
        f.order = reader.readBits(8);
        f.rate = reader.readBits(16);
        f.bark_map_size = reader.readBits(16);
        f.amplitude_bits = reader.readBits(6);
        f.amplitude_offset = reader.readBits(8);
        unsigned book_count = reader.readBits(4) + 1;
        for (unsigned i = 0; i < book_count; ++i) {
            unsigned book = reader.readBits(8);
            checkBook(book, "Floor 0");
            f.books.push_back(book);
        }
        if (f.order == 0 || f.rate == 0 || f.bark_map_size == 0) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Degenerate Vorbis floor 0");
        }
        return;
    }
    if (floor.type != 1) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Unknown Vorbis floor type " + std::to_string(floor.type));
    }

    Floor1& f = floor.floor1;
    unsigned partitions = reader.readBits(5);
    int max_class = -1;
    f.partition_class.resize(partitions);
    for (unsigned i = 0; i < partitions; ++i) {
        f.partition_class[i] = reader.readBits(4);
        max_class = std::max(max_class, static_cast<int>(f.partition_class[i]));
    }

    f.classes.resize(static_cast<size_t>(max_class + 1));
    for (Floor1::Class& c : f.classes) {
        c.dimensions = reader.readBits(3) + 1;
        c.subclasses = reader.readBits(2);
        if (c.subclasses) {
            c.masterbook = static_cast<int>(reader.readBits(8));
            checkBook(static_cast<unsigned>(c.masterbook), "Floor 1 class");
        }
        for (unsigned j = 0; j < (1u << c.subclasses); ++j) {
            c.subclass_books[j] = static_cast<int>(reader.readBits(8)) - 1;
            if (c.subclass_books[j] >= 0) {
                checkBook(static_cast<unsigned>(c.subclass_books[j]), "Floor 1 subclass");
            }
        }
    }

    f.multiplier = reader.readBits(2) + 1;
    unsigned range_bits = reader.readBits(4);
    f.x_list.push_back(0);
    f.x_list.push_back(1u << range_bits);
    for (unsigned i = 0; i < partitions; ++i) {
        const Floor1::Class& c = f.classes[f.partition_class[i]];
        for (unsigned j = 0; j < c.dimensions; ++j) {
            f.x_list.push_back(reader.readBits(range_bits));
        }
    }
    if (f.x_list.size() > 65) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis floor 1 has more than 65 points");
    }

    const size_t count = f.x_list.size();
    f.sorted_order.resize(count);
    for (size_t i = 0; i < count; ++i) {
        f.sorted_order[i] = static_cast<unsigned>(i);
    }
    std::sort(f.sorted_order.begin(), f.sorted_order.end(),
              [&f](unsigned a, unsigned b) { return f.x_list[a] < f.x_list[b]; });
    for (size_t i = 1; i < count; ++i) {
        if (f.x_list[f.sorted_order[i]] == f.x_list[f.sorted_order[i - 1]]) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis floor 1 repeats an X value");
        }
    }

    f.low_neighbor.assign(count, 0);
    f.high_neighbor.assign(count, 1);
    for (size_t i = 2; i < count; ++i) {
        unsigned low = 0, high = 1;
        unsigned low_x = 0, high_x = f.x_list[1];
        for (size_t j = 0; j < i; ++j) {
            unsigned x = f.x_list[j];
            if (x > low_x && x < f.x_list[i]) {
                low = static_cast<unsigned>(j);
                low_x = x;
            }
            if (x < high_x && x > f.x_list[i]) {
                high = static_cast<unsigned>(j);
                high_x = x;
            }
        }
        f.low_neighbor[i] = low;
        f.high_neighbor[i] = high;
    }
}

void VorbisSetup::readResidue(IO::BitReader& reader, Residue& residue) const
{
    residue.type = reader.readBits(16);
    if (residue.type > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Unknown Vorbis residue type " + std::to_string(residue.type));
    }
    residue.begin = reader.readBits(24);
    residue.end = reader.readBits(24);
    residue.partition_size = reader.readBits(24) + 1;
    residue.classifications = reader.readBits(6) + 1;
    residue.classbook = reader.readBits(8);
    checkBook(residue.classbook, "Residue classbook");

    std::vector<unsigned> cascade(residue.classifications);
    for (unsigned& bits : cascade) {
        unsigned low = reader.readBits(3);
        unsigned high = reader.readBit() ? reader.readBits(5) : 0;
        bits = high * 8 + low;
    }
    residue.books.assign(residue.classifications, std::array<int, 8>{{-1, -1, -1, -1, -1, -1, -1, -1}});
    for (unsigned c = 0; c < residue.classifications; ++c) {
        for (unsigned pass = 0; pass < 8; ++pass) {
            if (cascade[c] & (1u << pass)) {
                unsigned book = reader.readBits(8);
                checkBook(book, "Residue");
                if (!codebooks[book].hasLookup()) {
                    throw DecoderException(DecoderError::CONFIG_ERROR, "Residue book without VQ lookup");
                }
                residue.books[c][pass] = static_cast<int>(book);
            }
        }
    }
}

void VorbisSetup::readMapping(IO::BitReader& reader, Mapping& mapping) const
{
    if (reader.readBits(16) != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Unknown Vorbis mapping type");
    }
    const unsigned channels = m_id.channels;
    unsigned submaps = reader.readBit() ? reader.readBits(4) + 1 : 1;

    if (reader.readBit()) {
        unsigned steps = reader.readBits(8) + 1;
        unsigned bits = ilog(channels - 1);
        for (unsigned i = 0; i < steps; ++i) {
            Mapping::Coupling c;
            c.magnitude = reader.readBits(bits);
            c.angle = reader.readBits(bits);
            if (c.magnitude == c.angle || c.magnitude >= channels || c.angle >= channels) {
                throw DecoderException(DecoderError::CONFIG_ERROR, "Invalid Vorbis channel coupling");
            }
            mapping.coupling.push_back(c);
        }
    }

    if (reader.readBits(2) != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis mapping reserved field set");
    }

    mapping.mux.assign(channels, 0);
    if (submaps > 1) {
        for (unsigned ch = 0; ch < channels; ++ch) {
            mapping.mux[ch] = reader.readBits(4);
            if (mapping.mux[ch] >= submaps) {
                throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis mapping mux out of range");
            }
        }
    }
    for (unsigned i = 0; i < submaps; ++i) {
        reader.readBits(8);         // time configuration placeholder
        unsigned floor = reader.readBits(8);
        unsigned residue = reader.readBits(8);
        if (floor >= floors.size() || residue >= residues.size()) {
            throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis submap references a missing floor or residue");
        }
        mapping.submap_floor.push_back(floor);
        mapping.submap_residue.push_back(residue);
    }
}

} // namespace Vorbis
} // namespace Codec
} // namespace PsyDec
