/*
 * Mp3Tables.h - Constant tables for MPEG-1/2/2.5 Layer III
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MP3TABLES_H
#define MP3TABLES_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace MP3 {

// Scalefactor band boundaries for one sample rate
struct BandTable {
    uint16_t long_bounds[23];   // in samples, 22 bands
    uint16_t short_bounds[14];  // in samples per window, 13 bands
};

// One of the 32 big_values code tables (ISO/IEC 11172-3 Table B.7)
struct BigValueTable {
    const IO::HuffmanTree* tree;   // null for tables 0, 4 and 14
    unsigned dimension;            // symbol = x * dimension + y
    unsigned linbits;
};

namespace Tables {

// Throws CORRUPT_SIDE_INFO for the unused table numbers 4 and 14
const BigValueTable& bigValues(unsigned table_select);
// count1 table A (0) or B (1); symbol bits are v w x y from MSB to LSB
const IO::HuffmanTree& count1(unsigned table_select);

// sfreq index 0..8: 44.1/48/32 kHz, 22.05/24/16 kHz, 11.025/12/8 kHz
const BandTable& bands(unsigned sfreq_index);

// |x|^(4/3) for x in [0, 8206]
float pow43(unsigned value);

extern const uint8_t kPretab[22];
extern const uint8_t kSlen[2][16];
extern const uint8_t kLsfBandCounts[6][3][4];
extern const float kSynthesisWindow[512];
extern const float kAntialiasCoefficients[8];

} // namespace Tables

} // namespace MP3
} // namespace Codec
} // namespace PsyDec

#endif // MP3TABLES_H
