/*
 * AacTables.h - Constant tables for MPEG-4 AAC-LC
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AACTABLES_H
#define AACTABLES_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace AAC {

// Section codebook numbers with a special meaning
enum Codebook : unsigned {
    ZERO_HCB = 0,
    ESC_HCB = 11,
    NOISE_HCB = 13,
    INTENSITY_HCB2 = 14,
    INTENSITY_HCB = 15
};

// One spectral codebook of ISO/IEC 14496-3 Table 4.A.2 ff.
struct SpectralCodebook {
    const IO::HuffmanTree* tree;
    unsigned dimension;     // 4 for books 1-4, 2 otherwise
    bool is_signed;         // unsigned books carry sign bits after the codeword
    unsigned modulo;        // values per position: 2*lav+1 signed, lav+1 unsigned
};

// Scalefactor band layout for one sampling frequency index
struct SwbLayout {
    const uint16_t* long_offsets;   // long_count + 1 entries, last is 1024
    unsigned long_count;
    const uint16_t* short_offsets;  // short_count + 1 entries, last is 128
    unsigned short_count;
    unsigned tns_max_bands_long;
    unsigned tns_max_bands_short;
};

namespace Tables {

const IO::HuffmanTree& scalefactor();

// Books 1..11; anything else throws CORRUPT_SIDE_INFO
const SpectralCodebook& spectral(unsigned book);

// sampling_frequency_index 0..12; 13..15 throw CONFIG_ERROR
const SwbLayout& swb(unsigned sf_index);

unsigned sampleRate(unsigned sf_index);
std::optional<unsigned> sampleRateIndex(unsigned sample_rate);

// |x|^(4/3) for x in [0, 8191]
float pow43(unsigned value);

} // namespace Tables

} // namespace AAC
} // namespace Codec
} // namespace PsyDec

#endif // AACTABLES_H
