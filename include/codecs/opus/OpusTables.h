/*
 * OpusTables.h - Constant tables for the CELT and SILK layers of Opus
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef OPUSTABLES_H
#define OPUSTABLES_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {
namespace Tables {

// RFC 6716 reference tables. CELT entries describe the only mode Opus uses
// (48 kHz, 960 sample frames, 120 sample overlap, 21 bands).

constexpr int kNbEBands = 21;
constexpr int kNbAllocVectors = 11;
constexpr int kShortMdctSize = 120;
constexpr int kOverlap = 120;
constexpr int kMaxLM = 3;

extern const int16_t kEBands[22];
extern const uint8_t kBandAllocation[11][21];
extern const uint8_t kEnergyProbModel[4][2][42];
extern const int16_t kCacheIndex50[5][21];
extern const uint8_t kCacheBits50[392];
extern const uint8_t kCacheCaps50[8][21];
extern const int16_t kLogN400[21];
extern const uint8_t kLog2FracTable[24];
extern const int8_t kTfSelectTable[4][8];
extern const uint8_t kTrimIcdf[11];
extern const uint8_t kSpreadIcdf[4];
extern const float kEnergyMeans[21];

extern const uint8_t kTapsetIcdf[3];
extern const uint8_t kSmallEnergyIcdf[3];
extern const float kPredCoef[4];
extern const float kBetaCoef[4];
extern const float kBetaIntra;
extern const uint8_t kBitInterleaveTable[16];
extern const uint8_t kBitDeinterleaveTable[16];
extern const int16_t kExp2Table8[8];
extern const float kPostfilterTaps[3][3];

// Number of 2.5 ms bins in band i
inline int bandWidth(int band) { return kEBands[band + 1] - kEBands[band]; }

extern const uint8_t kGainIcdf[3][8];
extern const uint8_t kDeltaGainIcdf[41];
extern const int16_t kStereoPredQuantQ13[16];
extern const uint8_t kStereoPredJointIcdf[25];
extern const uint8_t kLbrrFlags3Icdf[7];
extern const uint8_t kTypeOffsetVadIcdf[4];
extern const uint8_t kNlsfInterpolationFactorIcdf[5];
extern const uint8_t kUniform8Icdf[8];
extern const uint8_t kPulsesPerBlockIcdf[10][18];
extern const uint8_t kRateLevelsIcdf[2][9];
extern const uint8_t kShellCodeTable0[152];
extern const uint8_t kShellCodeTable1[152];
extern const uint8_t kShellCodeTable2[152];
extern const uint8_t kShellCodeTable3[152];
extern const uint8_t kShellCodeTableOffsets[17];
extern const uint8_t kSignIcdf[42];
extern const uint8_t kPitchLagIcdf[32];
extern const uint8_t kPitchDeltaIcdf[21];
extern const uint8_t kPitchContourIcdf[34];
extern const uint8_t kPitchContourNbIcdf[11];
extern const uint8_t kPitchContour10msIcdf[12];
extern const int8_t kCbLagsStage2[4][11];
extern const int8_t kCbLagsStage3[4][34];
extern const int8_t kCbLagsStage3_10ms[2][12];
extern const uint8_t kLtpGainIcdf0[8];
extern const uint8_t kLtpGainIcdf1[16];
extern const uint8_t kLtpGainIcdf2[32];
extern const int8_t kLtpGainVq0[8][5];
extern const int8_t kLtpGainVq1[16][5];
extern const int8_t kLtpGainVq2[32][5];
extern const uint8_t kNlsfCb1NbMbQ8[32][10];
extern const uint8_t kNlsfCb1WbQ8[32][16];
extern const int16_t kNlsfCb1WghtNbMbQ9[32][10];
extern const int16_t kNlsfCb1WghtWbQ9[32][16];
extern const uint8_t kNlsfCb1IcdfNbMb[2][32];
extern const uint8_t kNlsfCb1IcdfWb[2][32];
extern const uint8_t kNlsfCb2SelectNbMb[32][5];
extern const uint8_t kNlsfCb2SelectWb[32][8];
extern const uint8_t kNlsfCb2IcdfNbMb[8][9];
extern const uint8_t kNlsfCb2IcdfWb[8][9];
extern const uint8_t kNlsfPredNbMbQ8[18];
extern const uint8_t kNlsfPredWbQ8[30];
extern const int16_t kNlsfDeltaMinNbMbQ15[11];
extern const int16_t kNlsfDeltaMinWbQ15[17];
extern const int16_t kLsfCosTabQ12[129];
extern const int16_t kResamplerFracFir12[12][4];

extern const uint8_t kTypeOffsetNoVadIcdf[2];
extern const int16_t kQuantizationOffsetsQ10[2][2];
extern const int16_t kLtpScalesQ14[3];
extern const uint8_t kUniform3Icdf[3];
extern const uint8_t kUniform4Icdf[4];
extern const uint8_t kUniform5Icdf[5];
extern const uint8_t kUniform6Icdf[6];
extern const uint8_t kNlsfExtIcdf[7];
extern const uint8_t kLsbIcdf[2];
extern const uint8_t kLtpScaleIcdf[3];
extern const uint8_t kLtpPerIndexIcdf[3];
extern const uint8_t kStereoOnlyCodeMidIcdf[2];
extern const uint8_t kLbrrFlags2Icdf[3];
extern const uint8_t kPitchContour10msNbIcdf[3];
extern const int8_t kCbLagsStage2_10ms[2][3];
extern const int16_t kResamplerUp2HqCoefs0[3];
extern const int16_t kResamplerUp2HqCoefs1[3];

} // namespace Tables
} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // OPUSTABLES_H
