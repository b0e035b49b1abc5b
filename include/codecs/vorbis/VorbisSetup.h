/*
 * VorbisSetup.h - Vorbis I header packets
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef VORBISSETUP_H
#define VORBISSETUP_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Vorbis {

// Identification header (packet type 1)
struct VorbisIdentification {
    unsigned channels = 0;
    unsigned sample_rate = 0;
    int32_t bitrate_maximum = 0;
    int32_t bitrate_nominal = 0;
    int32_t bitrate_minimum = 0;
    unsigned blocksize_0 = 0;       // short block, in samples
    unsigned blocksize_1 = 0;       // long block, in samples

    static VorbisIdentification parse(const uint8_t* data, size_t size);
};

// Comment header (packet type 3)
struct VorbisComment {
    std::string vendor;
    std::vector<std::string> comments;

    static VorbisComment parse(const uint8_t* data, size_t size);
    // Value of the first FIELD=value comment, case-insensitive on FIELD
    std::optional<std::string> find(const std::string& field) const;
};

// Floor type 0: LSP curve on a bark scale
struct Floor0 {
    unsigned order = 0;
    unsigned rate = 0;
    unsigned bark_map_size = 0;
    unsigned amplitude_bits = 0;
    unsigned amplitude_offset = 0;
    std::vector<unsigned> books;
};

// Floor type 1: piecewise linear curve over a sorted X list
struct Floor1 {
    struct Class {
        unsigned dimensions = 0;
        unsigned subclasses = 0;
        int masterbook = -1;
        int subclass_books[8] = {-1, -1, -1, -1, -1, -1, -1, -1};
    };

    std::vector<unsigned> partition_class;
    std::vector<Class> classes;
    unsigned multiplier = 1;
    std::vector<unsigned> x_list;

    // Derived at parse time
    std::vector<unsigned> sorted_order;     // indices of x_list in ascending X
    std::vector<unsigned> low_neighbor;
    std::vector<unsigned> high_neighbor;
};

struct Floor {
    unsigned type = 0;
    Floor0 floor0;
    Floor1 floor1;
};

struct Residue {
    unsigned type = 0;
    uint32_t begin = 0;
    uint32_t end = 0;
    uint32_t partition_size = 0;
    unsigned classifications = 0;
    unsigned classbook = 0;
    std::vector<std::array<int, 8>> books;   // [classification][pass], -1 = unused
};

struct Mapping {
    struct Coupling {
        unsigned magnitude = 0;
        unsigned angle = 0;
    };
    std::vector<Coupling> coupling;
    std::vector<unsigned> mux;              // submap per channel
    std::vector<unsigned> submap_floor;
    std::vector<unsigned> submap_residue;
};

struct Mode {
    bool blockflag = false;
    unsigned mapping = 0;
};

/**
 * @brief Everything the three header packets describe.
 *
 * Malformed headers throw DecoderException(CONFIG_ERROR); a header that
 * ends early is reported the same way.
 */
class VorbisSetup {
public:
    VorbisSetup(const std::vector<uint8_t>& identification, const std::vector<uint8_t>& comment,
                const std::vector<uint8_t>& setup);

    const VorbisIdentification& identification() const { return m_id; }
    const VorbisComment& comment() const { return m_comment; }

    std::vector<VorbisCodebook> codebooks;
    std::vector<Floor> floors;
    std::vector<Residue> residues;
    std::vector<Mapping> mappings;
    std::vector<Mode> modes;

    static bool isHeaderPacket(const uint8_t* data, size_t size, unsigned type);

private:
    void parseSetup(const uint8_t* data, size_t size);
    void readFloor(IO::BitReader& reader, Floor& floor) const;
    void readResidue(IO::BitReader& reader, Residue& residue) const;
    void readMapping(IO::BitReader& reader, Mapping& mapping) const;
    void checkBook(unsigned book, const char* user) const;

    VorbisIdentification m_id;
    VorbisComment m_comment;
};

} // namespace Vorbis
} // namespace Codec
} // namespace PsyDec

#endif // VORBISSETUP_H
