/*
 * Mp3Tables.cpp - Constant tables for MPEG-1/2/2.5 Layer III
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace MP3 {

namespace {

// Huffman codes of ISO/IEC 11172-3 Annex B, Table B.7, indexed x * dim + y
const uint32_t kCodes1[4] = {
    0x0001, 0x0001, 0x0001, 0x0000
};

const uint8_t kLengths1[4] = {
     1,  3,  2,  3
};

const uint32_t kCodes2[9] = {
    0x0001, 0x0002, 0x0001, 0x0003, 0x0001, 0x0001, 0x0003, 0x0002,
    0x0000
};

const uint8_t kLengths2[9] = {
     1,  3,  6,  3,  3,  5,  5,  5,  6
};

const uint32_t kCodes3[9] = {
    0x0003, 0x0002, 0x0001, 0x0001, 0x0001, 0x0001, 0x0003, 0x0002,
    0x0000
};

const uint8_t kLengths3[9] = {
     2,  2,  6,  3,  2,  5,  5,  5,  6
};

const uint32_t kCodes5[16] = {
    0x0001, 0x0002, 0x0006, 0x0005, 0x0003, 0x0001, 0x0004, 0x0004,
    0x0007, 0x0005, 0x0007, 0x0001, 0x0006, 0x0001, 0x0001, 0x0000
};

const uint8_t kLengths5[16] = {
     1,  3,  6,  7,  3,  3,  6,  7,  6,  6,  7,  8,  7,  6,  7,  8
};

const uint32_t kCodes6[16] = {
    0x0007, 0x0003, 0x0005, 0x0001, 0x0006, 0x0002, 0x0003, 0x0002,
    0x0005, 0x0004, 0x0004, 0x0001, 0x0003, 0x0003, 0x0002, 0x0000
};

const uint8_t kLengths6[16] = {
     3,  3,  5,  7,  3,  2,  4,  5,  4,  4,  5,  6,  6,  5,  6,  7
};

const uint32_t kCodes7[36] = {
    0x0001, 0x0002, 0x000a, 0x0013, 0x0010, 0x000a, 0x0003, 0x0003,
    0x0007, 0x000a, 0x0005, 0x0003, 0x000b, 0x0004, 0x000d, 0x0011,
    0x0008, 0x0004, 0x000c, 0x000b, 0x0012, 0x000f, 0x000b, 0x0002,
    0x0007, 0x0006, 0x0009, 0x000e, 0x0003, 0x0001, 0x0006, 0x0004,
    0x0005, 0x0003, 0x0002, 0x0000
};

const uint8_t kLengths7[36] = {
     1,  3,  6,  8,  8,  9,  3,  4,  6,  7,  7,  8,  6,  5,  7,  8,
     8,  9,  7,  7,  8,  9,  9,  9,  7,  7,  8,  9,  9, 10,  8,  8,
     9, 10, 10, 10
};

const uint32_t kCodes8[36] = {
    0x0003, 0x0004, 0x0006, 0x0012, 0x000c, 0x0005, 0x0005, 0x0001,
    0x0002, 0x0010, 0x0009, 0x0003, 0x0007, 0x0003, 0x0005, 0x000e,
    0x0007, 0x0003, 0x0013, 0x0011, 0x000f, 0x000d, 0x000a, 0x0004,
    0x000d, 0x0005, 0x0008, 0x000b, 0x0005, 0x0001, 0x000c, 0x0004,
    0x0004, 0x0001, 0x0001, 0x0000
};

const uint8_t kLengths8[36] = {
     2,  3,  6,  8,  8,  9,  3,  2,  4,  8,  8,  8,  6,  4,  6,  8,
     8,  9,  8,  8,  8,  9,  9, 10,  8,  7,  8,  9, 10, 10,  9,  8,
     9,  9, 11, 11
};

const uint32_t kCodes9[36] = {
    0x0007, 0x0005, 0x0009, 0x000e, 0x000f, 0x0007, 0x0006, 0x0004,
    0x0005, 0x0005, 0x0006, 0x0007, 0x0007, 0x0006, 0x0008, 0x0008,
    0x0008, 0x0005, 0x000f, 0x0006, 0x0009, 0x000a, 0x0005, 0x0001,
    0x000b, 0x0007, 0x0009, 0x0006, 0x0004, 0x0001, 0x000e, 0x0004,
    0x0006, 0x0002, 0x0006, 0x0000
};

const uint8_t kLengths9[36] = {
     3,  3,  5,  6,  8,  9,  3,  3,  4,  5,  6,  8,  4,  4,  5,  6,
     7,  8,  6,  5,  6,  7,  7,  8,  7,  6,  7,  7,  8,  9,  8,  7,
     8,  8,  9,  9
};

const uint32_t kCodes10[64] = {
    0x0001, 0x0002, 0x000a, 0x0017, 0x0023, 0x001e, 0x000c, 0x0011,
    0x0003, 0x0003, 0x0008, 0x000c, 0x0012, 0x0015, 0x000c, 0x0007,
    0x000b, 0x0009, 0x000f, 0x0015, 0x0020, 0x0028, 0x0013, 0x0006,
    0x000e, 0x000d, 0x0016, 0x0022, 0x002e, 0x0017, 0x0012, 0x0007,
    0x0014, 0x0013, 0x0021, 0x002f, 0x001b, 0x0016, 0x0009, 0x0003,
    0x001f, 0x0016, 0x0029, 0x001a, 0x0015, 0x0014, 0x0005, 0x0003,
    0x000e, 0x000d, 0x000a, 0x000b, 0x0010, 0x0006, 0x0005, 0x0001,
    0x0009, 0x0008, 0x0007, 0x0008, 0x0004, 0x0004, 0x0002, 0x0000
};

const uint8_t kLengths10[64] = {
     1,  3,  6,  8,  9,  9,  9, 10,  3,  4,  6,  7,  8,  9,  8,  8,
     6,  6,  7,  8,  9, 10,  9,  9,  7,  7,  8,  9, 10, 10,  9, 10,
     8,  8,  9, 10, 10, 10, 10, 10,  9,  9, 10, 10, 11, 11, 10, 11,
     8,  8,  9, 10, 10, 10, 11, 11,  9,  8,  9, 10, 10, 11, 11, 11
};

const uint32_t kCodes11[64] = {
    0x0003, 0x0004, 0x000a, 0x0018, 0x0022, 0x0021, 0x0015, 0x000f,
    0x0005, 0x0003, 0x0004, 0x000a, 0x0020, 0x0011, 0x000b, 0x000a,
    0x000b, 0x0007, 0x000d, 0x0012, 0x001e, 0x001f, 0x0014, 0x0005,
    0x0019, 0x000b, 0x0013, 0x003b, 0x001b, 0x0012, 0x000c, 0x0005,
    0x0023, 0x0021, 0x001f, 0x003a, 0x001e, 0x0010, 0x0007, 0x0005,
    0x001c, 0x001a, 0x0020, 0x0013, 0x0011, 0x000f, 0x0008, 0x000e,
    0x000e, 0x000c, 0x0009, 0x000d, 0x000e, 0x0009, 0x0004, 0x0001,
    0x000b, 0x0004, 0x0006, 0x0006, 0x0006, 0x0003, 0x0002, 0x0000
};

const uint8_t kLengths11[64] = {
     2,  3,  5,  7,  8,  9,  8,  9,  3,  3,  4,  6,  8,  8,  7,  8,
     5,  5,  6,  7,  8,  9,  8,  8,  7,  6,  7,  9,  8, 10,  8,  9,
     8,  8,  8,  9,  9, 10,  9, 10,  8,  8,  9, 10, 10, 11, 10, 11,
     8,  7,  7,  8,  9, 10, 10, 10,  8,  7,  8,  9, 10, 10, 10, 10
};

const uint32_t kCodes12[64] = {
    0x0009, 0x0006, 0x0010, 0x0021, 0x0029, 0x0027, 0x0026, 0x001a,
    0x0007, 0x0005, 0x0006, 0x0009, 0x0017, 0x0010, 0x001a, 0x000b,
    0x0011, 0x0007, 0x000b, 0x000e, 0x0015, 0x001e, 0x000a, 0x0007,
    0x0011, 0x000a, 0x000f, 0x000c, 0x0012, 0x001c, 0x000e, 0x0005,
    0x0020, 0x000d, 0x0016, 0x0013, 0x0012, 0x0010, 0x0009, 0x0005,
    0x0028, 0x0011, 0x001f, 0x001d, 0x0011, 0x000d, 0x0004, 0x0002,
    0x001b, 0x000c, 0x000b, 0x000f, 0x000a, 0x0007, 0x0004, 0x0001,
    0x001b, 0x000c, 0x0008, 0x000c, 0x0006, 0x0003, 0x0001, 0x0000
};

const uint8_t kLengths12[64] = {
     4,  3,  5,  7,  8,  9,  9,  9,  3,  3,  4,  5,  7,  7,  8,  8,
     5,  4,  5,  6,  7,  8,  7,  8,  6,  5,  6,  6,  7,  8,  8,  8,
     7,  6,  7,  7,  8,  8,  8,  9,  8,  7,  8,  8,  8,  9,  8,  9,
     8,  7,  7,  8,  8,  9,  9, 10,  9,  8,  8,  9,  9,  9,  9, 10
};

const uint32_t kCodes13[256] = {
    0x00001, 0x00005, 0x0000e, 0x00015, 0x00022, 0x00033, 0x0002e, 0x00047,
    0x0002a, 0x00034, 0x00044, 0x00034, 0x00043, 0x0002c, 0x0002b, 0x00013,
    0x00003, 0x00004, 0x0000c, 0x00013, 0x0001f, 0x0001a, 0x0002c, 0x00021,
    0x0001f, 0x00018, 0x00020, 0x00018, 0x0001f, 0x00023, 0x00016, 0x0000e,
    0x0000f, 0x0000d, 0x00017, 0x00024, 0x0003b, 0x00031, 0x0004d, 0x00041,
    0x0001d, 0x00028, 0x0001e, 0x00028, 0x0001b, 0x00021, 0x0002a, 0x00010,
    0x00016, 0x00014, 0x00025, 0x0003d, 0x00038, 0x0004f, 0x00049, 0x00040,
    0x0002b, 0x0004c, 0x00038, 0x00025, 0x0001a, 0x0001f, 0x00019, 0x0000e,
    0x00023, 0x00010, 0x0003c, 0x00039, 0x00061, 0x0004b, 0x00072, 0x0005b,
    0x00036, 0x00049, 0x00037, 0x00029, 0x00030, 0x00035, 0x00017, 0x00018,
    0x0003a, 0x0001b, 0x00032, 0x00060, 0x0004c, 0x00046, 0x0005d, 0x00054,
    0x0004d, 0x0003a, 0x0004f, 0x0001d, 0x0004a, 0x00031, 0x00029, 0x00011,
    0x0002f, 0x0002d, 0x0004e, 0x0004a, 0x00073, 0x0005e, 0x0005a, 0x0004f,
    0x00045, 0x00053, 0x00047, 0x00032, 0x0003b, 0x00026, 0x00024, 0x0000f,
    0x00048, 0x00022, 0x00038, 0x0005f, 0x0005c, 0x00055, 0x0005b, 0x0005a,
    0x00056, 0x00049, 0x0004d, 0x00041, 0x00033, 0x0002c, 0x0002b, 0x0002a,
    0x0002b, 0x00014, 0x0001e, 0x0002c, 0x00037, 0x0004e, 0x00048, 0x00057,
    0x0004e, 0x0003d, 0x0002e, 0x00036, 0x00025, 0x0001e, 0x00014, 0x00010,
    0x00035, 0x00019, 0x00029, 0x00025, 0x0002c, 0x0003b, 0x00036, 0x00051,
    0x00042, 0x0004c, 0x00039, 0x00036, 0x00025, 0x00012, 0x00027, 0x0000b,
    0x00023, 0x00021, 0x0001f, 0x00039, 0x0002a, 0x00052, 0x00048, 0x00050,
    0x0002f, 0x0003a, 0x00037, 0x00015, 0x00016, 0x0001a, 0x00026, 0x00016,
    0x00035, 0x00019, 0x00017, 0x00026, 0x00046, 0x0003c, 0x00033, 0x00024,
    0x00037, 0x0001a, 0x00022, 0x00017, 0x0001b, 0x0000e, 0x00009, 0x00007,
    0x00022, 0x00020, 0x0001c, 0x00027, 0x00031, 0x0004b, 0x0001e, 0x00034,
    0x00030, 0x00028, 0x00034, 0x0001c, 0x00012, 0x00011, 0x00009, 0x00005,
    0x0002d, 0x00015, 0x00022, 0x00040, 0x00038, 0x00032, 0x00031, 0x0002d,
    0x0001f, 0x00013, 0x0000c, 0x0000f, 0x0000a, 0x00007, 0x00006, 0x00003,
    0x00030, 0x00017, 0x00014, 0x00027, 0x00024, 0x00023, 0x00035, 0x00015,
    0x00010, 0x00017, 0x0000d, 0x0000a, 0x00006, 0x00001, 0x00004, 0x00002,
    0x00010, 0x0000f, 0x00011, 0x0001b, 0x00019, 0x00014, 0x0001d, 0x0000b,
    0x00011, 0x0000c, 0x00010, 0x00008, 0x00001, 0x00001, 0x00000, 0x00001
};

const uint8_t kLengths13[256] = {
     1,  4,  6,  7,  8,  9,  9, 10,  9, 10, 11, 11, 12, 12, 13, 13,
     3,  4,  6,  7,  8,  8,  9,  9,  9,  9, 10, 10, 11, 12, 12, 12,
     6,  6,  7,  8,  9,  9, 10, 10,  9, 10, 10, 11, 11, 12, 13, 13,
     7,  7,  8,  9,  9, 10, 10, 10, 10, 11, 11, 11, 11, 12, 13, 13,
     8,  7,  9,  9, 10, 10, 11, 11, 10, 11, 11, 12, 12, 13, 13, 14,
     9,  8,  9, 10, 10, 10, 11, 11, 11, 11, 12, 11, 13, 13, 14, 14,
     9,  9, 10, 10, 11, 11, 11, 11, 11, 12, 12, 12, 13, 13, 14, 14,
    10,  9, 10, 11, 11, 11, 12, 12, 12, 12, 13, 13, 13, 14, 16, 16,
     9,  8,  9, 10, 10, 11, 11, 12, 12, 12, 12, 13, 13, 14, 15, 15,
    10,  9, 10, 10, 11, 11, 11, 13, 12, 13, 13, 14, 14, 14, 16, 15,
    10, 10, 10, 11, 11, 12, 12, 13, 12, 13, 14, 13, 14, 15, 16, 17,
    11, 10, 10, 11, 12, 12, 12, 12, 13, 13, 13, 14, 15, 15, 15, 16,
    11, 11, 11, 12, 12, 13, 12, 13, 14, 14, 15, 15, 15, 16, 16, 16,
    12, 11, 12, 13, 13, 13, 14, 14, 14, 14, 14, 15, 16, 15, 16, 16,
    13, 12, 12, 13, 13, 13, 15, 14, 14, 17, 15, 15, 15, 17, 16, 16,
    12, 12, 13, 14, 14, 14, 15, 14, 15, 15, 16, 16, 19, 18, 19, 16
};

const uint32_t kCodes15[256] = {
    0x0007, 0x000c, 0x0012, 0x0035, 0x002f, 0x004c, 0x007c, 0x006c,
    0x0059, 0x007b, 0x006c, 0x0077, 0x006b, 0x0051, 0x007a, 0x003f,
    0x000d, 0x0005, 0x0010, 0x001b, 0x002e, 0x0024, 0x003d, 0x0033,
    0x002a, 0x0046, 0x0034, 0x0053, 0x0041, 0x0029, 0x003b, 0x0024,
    0x0013, 0x0011, 0x000f, 0x0018, 0x0029, 0x0022, 0x003b, 0x0030,
    0x0028, 0x0040, 0x0032, 0x004e, 0x003e, 0x0050, 0x0038, 0x0021,
    0x001d, 0x001c, 0x0019, 0x002b, 0x0027, 0x003f, 0x0037, 0x005d,
    0x004c, 0x003b, 0x005d, 0x0048, 0x0036, 0x004b, 0x0032, 0x001d,
    0x0034, 0x0016, 0x002a, 0x0028, 0x0043, 0x0039, 0x005f, 0x004f,
    0x0048, 0x0039, 0x0059, 0x0045, 0x0031, 0x0042, 0x002e, 0x001b,
    0x004d, 0x0025, 0x0023, 0x0042, 0x003a, 0x0034, 0x005b, 0x004a,
    0x003e, 0x0030, 0x004f, 0x003f, 0x005a, 0x003e, 0x0028, 0x0026,
    0x007d, 0x0020, 0x003c, 0x0038, 0x0032, 0x005c, 0x004e, 0x0041,
    0x0037, 0x0057, 0x0047, 0x0033, 0x0049, 0x0033, 0x0046, 0x001e,
    0x006d, 0x0035, 0x0031, 0x005e, 0x0058, 0x004b, 0x0042, 0x007a,
    0x005b, 0x0049, 0x0038, 0x002a, 0x0040, 0x002c, 0x0015, 0x0019,
    0x005a, 0x002b, 0x0029, 0x004d, 0x0049, 0x003f, 0x0038, 0x005c,
    0x004d, 0x0042, 0x002f, 0x0043, 0x0030, 0x0035, 0x0024, 0x0014,
    0x0047, 0x0022, 0x0043, 0x003c, 0x003a, 0x0031, 0x0058, 0x004c,
    0x0043, 0x006a, 0x0047, 0x0036, 0x0026, 0x0027, 0x0017, 0x000f,
    0x006d, 0x0035, 0x0033, 0x002f, 0x005a, 0x0052, 0x003a, 0x0039,
    0x0030, 0x0048, 0x0039, 0x0029, 0x0017, 0x001b, 0x003e, 0x0009,
    0x0056, 0x002a, 0x0028, 0x0025, 0x0046, 0x0040, 0x0034, 0x002b,
    0x0046, 0x0037, 0x002a, 0x0019, 0x001d, 0x0012, 0x000b, 0x000b,
    0x0076, 0x0044, 0x001e, 0x0037, 0x0032, 0x002e, 0x004a, 0x0041,
    0x0031, 0x0027, 0x0018, 0x0010, 0x0016, 0x000d, 0x000e, 0x0007,
    0x005b, 0x002c, 0x0027, 0x0026, 0x0022, 0x003f, 0x0034, 0x002d,
    0x001f, 0x0034, 0x001c, 0x0013, 0x000e, 0x0008, 0x0009, 0x0003,
    0x007b, 0x003c, 0x003a, 0x0035, 0x002f, 0x002b, 0x0020, 0x0016,
    0x0025, 0x0018, 0x0011, 0x000c, 0x000f, 0x000a, 0x0002, 0x0001,
    0x0047, 0x0025, 0x0022, 0x001e, 0x001c, 0x0014, 0x0011, 0x001a,
    0x0015, 0x0010, 0x000a, 0x0006, 0x0008, 0x0006, 0x0002, 0x0000
};

const uint8_t kLengths15[256] = {
     3,  4,  5,  7,  7,  8,  9,  9,  9, 10, 10, 11, 11, 11, 12, 13,
     4,  3,  5,  6,  7,  7,  8,  8,  8,  9,  9, 10, 10, 10, 11, 11,
     5,  5,  5,  6,  7,  7,  8,  8,  8,  9,  9, 10, 10, 11, 11, 11,
     6,  6,  6,  7,  7,  8,  8,  9,  9,  9, 10, 10, 10, 11, 11, 11,
     7,  6,  7,  7,  8,  8,  9,  9,  9,  9, 10, 10, 10, 11, 11, 11,
     8,  7,  7,  8,  8,  8,  9,  9,  9,  9, 10, 10, 11, 11, 11, 12,
     9,  7,  8,  8,  8,  9,  9,  9,  9, 10, 10, 10, 11, 11, 12, 12,
     9,  8,  8,  9,  9,  9,  9, 10, 10, 10, 10, 10, 11, 11, 11, 12,
     9,  8,  8,  9,  9,  9,  9, 10, 10, 10, 10, 11, 11, 12, 12, 12,
     9,  8,  9,  9,  9,  9, 10, 10, 10, 11, 11, 11, 11, 12, 12, 12,
    10,  9,  9,  9, 10, 10, 10, 10, 10, 11, 11, 11, 11, 12, 13, 12,
    10,  9,  9,  9, 10, 10, 10, 10, 11, 11, 11, 11, 12, 12, 12, 13,
    11, 10,  9, 10, 10, 10, 11, 11, 11, 11, 11, 11, 12, 12, 13, 13,
    11, 10, 10, 10, 10, 11, 11, 11, 11, 12, 12, 12, 12, 12, 13, 13,
    12, 11, 11, 11, 11, 11, 11, 11, 12, 12, 12, 12, 13, 13, 12, 13,
    12, 11, 11, 11, 11, 11, 11, 12, 12, 12, 12, 12, 13, 13, 13, 13
};

const uint32_t kCodes16[256] = {
    0x00001, 0x00005, 0x0000e, 0x0002c, 0x0004a, 0x0003f, 0x0006e, 0x0005d,
    0x000ac, 0x00095, 0x0008a, 0x000f2, 0x000e1, 0x000c3, 0x00178, 0x00011,
    0x00003, 0x00004, 0x0000c, 0x00014, 0x00023, 0x0003e, 0x00035, 0x0002f,
    0x00053, 0x0004b, 0x00044, 0x00077, 0x000c9, 0x0006b, 0x000cf, 0x00009,
    0x0000f, 0x0000d, 0x00017, 0x00026, 0x00043, 0x0003a, 0x00067, 0x0005a,
    0x000a1, 0x00048, 0x0007f, 0x00075, 0x0006e, 0x000d1, 0x000ce, 0x00010,
    0x0002d, 0x00015, 0x00027, 0x00045, 0x00040, 0x00072, 0x00063, 0x00057,
    0x0009e, 0x0008c, 0x000fc, 0x000d4, 0x000c7, 0x00183, 0x0016d, 0x0001a,
    0x0004b, 0x00024, 0x00044, 0x00041, 0x00073, 0x00065, 0x000b3, 0x000a4,
    0x0009b, 0x00108, 0x000f6, 0x000e2, 0x0018b, 0x0017e, 0x0016a, 0x00009,
    0x00042, 0x0001e, 0x0003b, 0x00038, 0x00066, 0x000b9, 0x000ad, 0x00109,
    0x0008e, 0x000fd, 0x000e8, 0x00190, 0x00184, 0x0017a, 0x001bd, 0x00010,
    0x0006f, 0x00036, 0x00034, 0x00064, 0x000b8, 0x000b2, 0x000a0, 0x00085,
    0x00101, 0x000f4, 0x000e4, 0x000d9, 0x00181, 0x0016e, 0x002cb, 0x0000a,
    0x00062, 0x00030, 0x0005b, 0x00058, 0x000a5, 0x0009d, 0x00094, 0x00105,
    0x000f8, 0x00197, 0x0018d, 0x00174, 0x0017c, 0x00379, 0x00374, 0x00008,
    0x00055, 0x00054, 0x00051, 0x0009f, 0x0009c, 0x0008f, 0x00104, 0x000f9,
    0x001ab, 0x00191, 0x00188, 0x0017f, 0x002d7, 0x002c9, 0x002c4, 0x00007,
    0x0009a, 0x0004c, 0x00049, 0x0008d, 0x00083, 0x00100, 0x000f5, 0x001aa,
    0x00196, 0x0018a, 0x00180, 0x002df, 0x00167, 0x002c6, 0x00160, 0x0000b,
    0x0008b, 0x00081, 0x00043, 0x0007d, 0x000f7, 0x000e9, 0x000e5, 0x000db,
    0x00189, 0x002e7, 0x002e1, 0x002d0, 0x00375, 0x00372, 0x001b7, 0x00004,
    0x000f3, 0x00078, 0x00076, 0x00073, 0x000e3, 0x000df, 0x0018c, 0x002ea,
    0x002e6, 0x002e0, 0x002d1, 0x002c8, 0x002c2, 0x000df, 0x001b4, 0x00006,
    0x000ca, 0x000e0, 0x000de, 0x000da, 0x000d8, 0x00185, 0x00182, 0x0017d,
    0x0016c, 0x00378, 0x001bb, 0x002c3, 0x001b8, 0x001b5, 0x006c0, 0x00004,
    0x002eb, 0x000d3, 0x000d2, 0x000d0, 0x00172, 0x0017b, 0x002de, 0x002d3,
    0x002ca, 0x006c7, 0x00373, 0x0036d, 0x0036c, 0x00d83, 0x00361, 0x00002,
    0x00179, 0x00171, 0x00066, 0x000bb, 0x002d6, 0x002d2, 0x00166, 0x002c7,
    0x002c5, 0x00362, 0x006c6, 0x00367, 0x00d82, 0x00366, 0x001b2, 0x00000,
    0x0000c, 0x0000a, 0x00007, 0x0000b, 0x0000a, 0x00011, 0x0000b, 0x00009,
    0x0000d, 0x0000c, 0x0000a, 0x00007, 0x00005, 0x00003, 0x00001, 0x00003
};

const uint8_t kLengths16[256] = {
     1,  4,  6,  8,  9,  9, 10, 10, 11, 11, 11, 12, 12, 12, 13,  9,
     3,  4,  6,  7,  8,  9,  9,  9, 10, 10, 10, 11, 12, 11, 12,  8,
     6,  6,  7,  8,  9,  9, 10, 10, 11, 10, 11, 11, 11, 12, 12,  9,
     8,  7,  8,  9,  9, 10, 10, 10, 11, 11, 12, 12, 12, 13, 13, 10,
     9,  8,  9,  9, 10, 10, 11, 11, 11, 12, 12, 12, 13, 13, 13,  9,
     9,  8,  9,  9, 10, 11, 11, 12, 11, 12, 12, 13, 13, 13, 14, 10,
    10,  9,  9, 10, 11, 11, 11, 11, 12, 12, 12, 12, 13, 13, 14, 10,
    10,  9, 10, 10, 11, 11, 11, 12, 12, 13, 13, 13, 13, 15, 15, 10,
    10, 10, 10, 11, 11, 11, 12, 12, 13, 13, 13, 13, 14, 14, 14, 10,
    11, 10, 10, 11, 11, 12, 12, 13, 13, 13, 13, 14, 13, 14, 13, 11,
    11, 11, 10, 11, 12, 12, 12, 12, 13, 14, 14, 14, 15, 15, 14, 10,
    12, 11, 11, 11, 12, 12, 13, 14, 14, 14, 14, 14, 14, 13, 14, 11,
    12, 12, 12, 12, 12, 13, 13, 13, 13, 15, 14, 14, 14, 14, 16, 11,
    14, 12, 12, 12, 13, 13, 14, 14, 14, 16, 15, 15, 15, 17, 15, 11,
    13, 13, 11, 12, 14, 14, 13, 14, 14, 15, 16, 15, 17, 15, 14, 11,
     9,  8,  8,  9,  9, 10, 10, 10, 11, 11, 11, 11, 11, 11, 11,  8
};

const uint32_t kCodes24[256] = {
    0x000f, 0x000d, 0x002e, 0x0050, 0x0092, 0x0106, 0x00f8, 0x01b2,
    0x01aa, 0x029d, 0x028d, 0x0289, 0x026d, 0x0205, 0x0408, 0x0058,
    0x000e, 0x000c, 0x0015, 0x0026, 0x0047, 0x0082, 0x007a, 0x00d8,
    0x00d1, 0x00c6, 0x0147, 0x0159, 0x013f, 0x0129, 0x0117, 0x002a,
    0x002f, 0x0016, 0x0029, 0x004a, 0x0044, 0x0080, 0x0078, 0x00dd,
    0x00cf, 0x00c2, 0x00b6, 0x0154, 0x013b, 0x0127, 0x021d, 0x0012,
    0x0051, 0x0027, 0x004b, 0x0046, 0x0086, 0x007d, 0x0074, 0x00dc,
    0x00cc, 0x00be, 0x00b2, 0x0145, 0x0137, 0x0125, 0x010f, 0x0010,
    0x0093, 0x0048, 0x0045, 0x0087, 0x007f, 0x0076, 0x0070, 0x00d2,
    0x00c8, 0x00bc, 0x0160, 0x0143, 0x0132, 0x011d, 0x021c, 0x000e,
    0x0107, 0x0042, 0x0081, 0x007e, 0x0077, 0x0072, 0x00d6, 0x00ca,
    0x00c0, 0x00b4, 0x0155, 0x013d, 0x012d, 0x0119, 0x0106, 0x000c,
    0x00f9, 0x007b, 0x0079, 0x0075, 0x0071, 0x00d7, 0x00ce, 0x00c3,
    0x00b9, 0x015b, 0x014a, 0x0134, 0x0123, 0x0110, 0x0208, 0x000a,
    0x01b3, 0x0073, 0x006f, 0x006d, 0x00d3, 0x00cb, 0x00c4, 0x00bb,
    0x0161, 0x014c, 0x0139, 0x012a, 0x011b, 0x0213, 0x017d, 0x0011,
    0x01ab, 0x00d4, 0x00d0, 0x00cd, 0x00c9, 0x00c1, 0x00ba, 0x00b1,
    0x00a9, 0x0140, 0x012f, 0x011e, 0x010c, 0x0202, 0x0179, 0x0010,
    0x014f, 0x00c7, 0x00c5, 0x00bf, 0x00bd, 0x00b5, 0x00ae, 0x014d,
    0x0141, 0x0131, 0x0121, 0x0113, 0x0209, 0x017b, 0x0173, 0x000b,
    0x029c, 0x00b8, 0x00b7, 0x00b3, 0x00af, 0x0158, 0x014b, 0x013a,
    0x0130, 0x0122, 0x0115, 0x0212, 0x017f, 0x0175, 0x016e, 0x000a,
    0x028c, 0x015a, 0x00ab, 0x00a8, 0x00a4, 0x013e, 0x0135, 0x012b,
    0x011f, 0x0114, 0x0107, 0x0201, 0x0177, 0x0170, 0x016a, 0x0006,
    0x0288, 0x0142, 0x013c, 0x0138, 0x0133, 0x012e, 0x0124, 0x011c,
    0x010d, 0x0105, 0x0200, 0x0178, 0x0172, 0x016c, 0x0167, 0x0004,
    0x026c, 0x012c, 0x0128, 0x0126, 0x0120, 0x011a, 0x0111, 0x010a,
    0x0203, 0x017c, 0x0176, 0x0171, 0x016d, 0x0169, 0x0165, 0x0002,
    0x0409, 0x0118, 0x0116, 0x0112, 0x010b, 0x0108, 0x0103, 0x017e,
    0x017a, 0x0174, 0x016f, 0x016b, 0x0168, 0x0166, 0x0164, 0x0000,
    0x002b, 0x0014, 0x0013, 0x0011, 0x000f, 0x000d, 0x000b, 0x0009,
    0x0007, 0x0006, 0x0004, 0x0007, 0x0005, 0x0003, 0x0001, 0x0003
};

const uint8_t kLengths24[256] = {
     4,  4,  6,  7,  8,  9,  9, 10, 10, 11, 11, 11, 11, 11, 12,  9,
     4,  4,  5,  6,  7,  8,  8,  9,  9,  9, 10, 10, 10, 10, 10,  8,
     6,  5,  6,  7,  7,  8,  8,  9,  9,  9,  9, 10, 10, 10, 11,  7,
     7,  6,  7,  7,  8,  8,  8,  9,  9,  9,  9, 10, 10, 10, 10,  7,
     8,  7,  7,  8,  8,  8,  8,  9,  9,  9, 10, 10, 10, 10, 11,  7,
     9,  7,  8,  8,  8,  8,  9,  9,  9,  9, 10, 10, 10, 10, 10,  7,
     9,  8,  8,  8,  8,  9,  9,  9,  9, 10, 10, 10, 10, 10, 11,  7,
    10,  8,  8,  8,  9,  9,  9,  9, 10, 10, 10, 10, 10, 11, 11,  8,
    10,  9,  9,  9,  9,  9,  9,  9,  9, 10, 10, 10, 10, 11, 11,  8,
    10,  9,  9,  9,  9,  9,  9, 10, 10, 10, 10, 10, 11, 11, 11,  8,
    11,  9,  9,  9,  9, 10, 10, 10, 10, 10, 10, 11, 11, 11, 11,  8,
    11, 10,  9,  9,  9, 10, 10, 10, 10, 10, 10, 11, 11, 11, 11,  8,
    11, 10, 10, 10, 10, 10, 10, 10, 10, 10, 11, 11, 11, 11, 11,  8,
    11, 10, 10, 10, 10, 10, 10, 10, 11, 11, 11, 11, 11, 11, 11,  8,
    12, 10, 10, 10, 10, 10, 10, 11, 11, 11, 11, 11, 11, 11, 11,  8,
     8,  7,  7,  7,  7,  7,  7,  7,  7,  7,  7,  8,  8,  8,  8,  4
};

const uint32_t kCount1CodesA[16] = {
    0x01, 0x05, 0x04, 0x05, 0x06, 0x05, 0x04, 0x04,
    0x07, 0x03, 0x06, 0x00, 0x07, 0x02, 0x03, 0x01
};

const uint8_t kCount1LengthsA[16] = {
    1, 4, 4, 5, 4, 6, 5, 6, 4, 5, 5, 6, 5, 6, 6, 6
};

const uint32_t kCount1CodesB[16] = {
    0x0f, 0x0e, 0x0d, 0x0c, 0x0b, 0x0a, 0x09, 0x08,
    0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x00
};

const uint8_t kCount1LengthsB[16] = {
    4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4
};


const BandTable kBandTables[9] = {
    // MPEG-1
    {{0, 4, 8, 12, 16, 20, 24, 30, 36, 44, 52, 62, 74, 90, 110, 134, 162, 196, 238, 288, 342, 418, 576},
     {0, 4, 8, 12, 16, 22, 30, 40, 52, 66, 84, 106, 136, 192}},
    {{0, 4, 8, 12, 16, 20, 24, 30, 36, 42, 50, 60, 72, 88, 106, 128, 156, 190, 230, 276, 330, 384, 576},
     {0, 4, 8, 12, 16, 22, 28, 38, 50, 64, 80, 100, 126, 192}},
    {{0, 4, 8, 12, 16, 20, 24, 30, 36, 44, 54, 66, 82, 102, 126, 156, 194, 240, 296, 364, 448, 550, 576},
     {0, 4, 8, 12, 16, 22, 30, 42, 58, 78, 104, 138, 180, 192}},
    // MPEG-2 LSF
    {{0, 6, 12, 18, 24, 30, 36, 44, 54, 66, 80, 96, 116, 140, 168, 200, 238, 284, 336, 396, 464, 522, 576},
     {0, 4, 8, 12, 18, 24, 32, 42, 56, 74, 100, 132, 174, 192}},
    {{0, 6, 12, 18, 24, 30, 36, 44, 54, 66, 80, 96, 114, 136, 162, 194, 232, 278, 332, 394, 464, 540, 576},
     {0, 4, 8, 12, 18, 26, 36, 48, 62, 80, 104, 136, 180, 192}},
    {{0, 6, 12, 18, 24, 30, 36, 44, 54, 66, 80, 96, 116, 140, 168, 200, 238, 284, 336, 396, 464, 522, 576},
     {0, 4, 8, 12, 18, 26, 36, 48, 62, 80, 104, 134, 174, 192}},
    // MPEG-2.5
    {{0, 6, 12, 18, 24, 30, 36, 44, 54, 66, 80, 96, 116, 140, 168, 200, 238, 284, 336, 396, 464, 522, 576},
     {0, 4, 8, 12, 18, 26, 36, 48, 62, 80, 104, 134, 174, 192}},
    {{0, 6, 12, 18, 24, 30, 36, 44, 54, 66, 80, 96, 116, 140, 168, 200, 238, 284, 336, 396, 464, 522, 576},
     {0, 4, 8, 12, 18, 26, 36, 48, 62, 80, 104, 134, 174, 192}},
    {{0, 12, 24, 36, 48, 60, 72, 88, 108, 132, 160, 192, 232, 280, 336, 400, 476, 566, 568, 570, 572, 574, 576},
     {0, 8, 16, 24, 36, 52, 72, 96, 124, 160, 162, 164, 166, 192}}
};

struct CodeSource {
    const uint32_t* codes;
    const uint8_t* lengths;
    unsigned dimension;
};

// Tables 16..23 share the codes of 16, 24..31 those of 24
CodeSource codeSource(unsigned table)
{
    switch (table) {
        case 1: return {kCodes1, kLengths1, 2};
        case 2: return {kCodes2, kLengths2, 3};
        case 3: return {kCodes3, kLengths3, 3};
        case 5: return {kCodes5, kLengths5, 4};
        case 6: return {kCodes6, kLengths6, 4};
        case 7: return {kCodes7, kLengths7, 6};
        case 8: return {kCodes8, kLengths8, 6};
        case 9: return {kCodes9, kLengths9, 6};
        case 10: return {kCodes10, kLengths10, 8};
        case 11: return {kCodes11, kLengths11, 8};
        case 12: return {kCodes12, kLengths12, 8};
        case 13: return {kCodes13, kLengths13, 16};
        case 15: return {kCodes15, kLengths15, 16};
        default: break;
    }
    if (table >= 16 && table < 24) {
        return {kCodes16, kLengths16, 16};
    }
    if (table >= 24 && table < 32) {
        return {kCodes24, kLengths24, 16};
    }
    return {nullptr, nullptr, 0};
}

const unsigned kLinbits[32] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    1, 2, 3, 4, 6, 8, 10, 13, 4, 5, 6, 7, 8, 9, 11, 13
};

struct HuffmanSet {
    std::array<IO::HuffmanTree, 32> trees;
    std::array<BigValueTable, 32> tables;
    IO::HuffmanTree count1[2];

    HuffmanSet()
    {
        for (unsigned t = 0; t < 32; ++t) {
            CodeSource src = codeSource(t);
            tables[t] = BigValueTable{nullptr, src.dimension, kLinbits[t]};
            if (src.codes) {
                trees[t] = IO::HuffmanTree::fromTable(src.codes, src.lengths, src.dimension * src.dimension);
                tables[t].tree = &trees[t];
            }
        }
        count1[0] = IO::HuffmanTree::fromTable(kCount1CodesA, kCount1LengthsA, 16);
        count1[1] = IO::HuffmanTree::fromTable(kCount1CodesB, kCount1LengthsB, 16);
    }
};

const HuffmanSet& huffmanSet()
{
    static const HuffmanSet set;
    return set;
}

std::vector<float> buildPow43()
{
    std::vector<float> table(8207);
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = static_cast<float>(std::pow(static_cast<double>(i), 4.0 / 3.0));
    }
    return table;
}

} // anonymous namespace

namespace Tables {

const uint8_t kPretab[22] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 2, 2, 3, 3, 3, 2, 0
};

// slen1, slen2 per scalefac_compress (MPEG-1)
const uint8_t kSlen[2][16] = {
    {0, 0, 0, 0, 3, 1, 1, 1, 2, 2, 2, 3, 3, 3, 4, 4},
    {0, 1, 2, 3, 0, 1, 2, 3, 1, 2, 3, 1, 2, 3, 2, 3}
};

// nr_of_sfb[partition table][long, short, mixed][partition] (ISO/IEC 13818-3)
const uint8_t kLsfBandCounts[6][3][4] = {
    {{6, 5, 5, 5}, {9, 9, 9, 9}, {6, 9, 9, 9}},
    {{6, 5, 7, 3}, {9, 9, 12, 6}, {6, 9, 12, 6}},
    {{11, 10, 0, 0}, {18, 18, 0, 0}, {15, 18, 0, 0}},
    {{7, 7, 7, 0}, {12, 12, 12, 0}, {6, 15, 12, 0}},
    {{6, 6, 6, 3}, {12, 9, 9, 6}, {6, 12, 9, 6}},
    {{8, 8, 5, 0}, {15, 12, 9, 0}, {6, 18, 9, 0}}
};

const float kAntialiasCoefficients[8] = {
    -0.6f, -0.535f, -0.33f, -0.185f, -0.095f, -0.041f, -0.0142f, -0.0037f
};

// Synthesis window D[i], ISO/IEC 11172-3 Table B.3
const float kSynthesisWindow[512] = {
    0.000000000f, -0.000015259f, -0.000015259f, -0.000015259f, -0.000015259f, -0.000015259f,
    -0.000015259f, -0.000030518f, -0.000030518f, -0.000030518f, -0.000030518f, -0.000045776f,
    -0.000045776f, -0.000061035f, -0.000061035f, -0.000076294f, -0.000076294f, -0.000091553f,
    -0.000106812f, -0.000106812f, -0.000122070f, -0.000137329f, -0.000152588f, -0.000167847f,
    -0.000198364f, -0.000213623f, -0.000244141f, -0.000259399f, -0.000289917f, -0.000320435f,
    -0.000366211f, -0.000396729f, -0.000442505f, -0.000473022f, -0.000534058f, -0.000579834f,
    -0.000625610f, -0.000686646f, -0.000747681f, -0.000808716f, -0.000885010f, -0.000961304f,
    -0.001037598f, -0.001113892f, -0.001205444f, -0.001296997f, -0.001388550f, -0.001480103f,
    -0.001586914f, -0.001693726f, -0.001785278f, -0.001907349f, -0.002014160f, -0.002120972f,
    -0.002243042f, -0.002349854f, -0.002456665f, -0.002578735f, -0.002685547f, -0.002792358f,
    -0.002899170f, -0.002990723f, -0.003082275f, -0.003173828f, 0.003250122f, 0.003326416f,
    0.003387451f, 0.003433228f, 0.003463745f, 0.003479004f, 0.003479004f, 0.003463745f,
    0.003417969f, 0.003372192f, 0.003280640f, 0.003173828f, 0.003051758f, 0.002883911f,
    0.002700806f, 0.002487183f, 0.002227783f, 0.001937866f, 0.001617432f, 0.001266479f,
    0.000869751f, 0.000442505f, -0.000030518f, -0.000549316f, -0.001098633f, -0.001693726f,
    -0.002334595f, -0.003005981f, -0.003723145f, -0.004486084f, -0.005294800f, -0.006118774f,
    -0.007003784f, -0.007919312f, -0.008865356f, -0.009841919f, -0.010848999f, -0.011886597f,
    -0.012939452f, -0.014022826f, -0.015121460f, -0.016235352f, -0.017349243f, -0.018463135f,
    -0.019577026f, -0.020690918f, -0.021789551f, -0.022857666f, -0.023910521f, -0.024932859f,
    -0.025909424f, -0.026840210f, -0.027725220f, -0.028533936f, -0.029281614f, -0.029937742f,
    -0.030532837f, -0.031005858f, -0.031387329f, -0.031661987f, -0.031814575f, -0.031845093f,
    -0.031738281f, -0.031478882f, 0.031082151f, 0.030517576f, 0.029785154f, 0.028884888f,
    0.027801514f, 0.026535034f, 0.025085449f, 0.023422241f, 0.021575928f, 0.019531250f,
    0.017257690f, 0.014801024f, 0.012115479f, 0.009231566f, 0.006134033f, 0.002822876f,
    -0.000686646f, -0.004394531f, -0.008316040f, -0.012420653f, -0.016708374f, -0.021179199f,
    -0.025817871f, -0.030609131f, -0.035552979f, -0.040634155f, -0.045837402f, -0.051132202f,
    -0.056533810f, -0.061996460f, -0.067520142f, -0.073059082f, -0.078628540f, -0.084182739f,
    -0.089706421f, -0.095169067f, -0.100540161f, -0.105819702f, -0.110946655f, -0.115921021f,
    -0.120697014f, -0.125259399f, -0.129562378f, -0.133590698f, -0.137298584f, -0.140670776f,
    -0.143676758f, -0.146255493f, -0.148422241f, -0.150115967f, -0.151306152f, -0.151962280f,
    -0.152069092f, -0.151596069f, -0.150497437f, -0.148773193f, -0.146362305f, -0.143264771f,
    -0.139450073f, -0.134887695f, -0.129577637f, -0.123474121f, -0.116577141f, -0.108856201f,
    0.100311279f, 0.090927124f, 0.080688477f, 0.069595337f, 0.057617184f, 0.044784546f,
    0.031082151f, 0.016510010f, 0.001068115f, -0.015228271f, -0.032379150f, -0.050354004f,
    -0.069168091f, -0.088775635f, -0.109161377f, -0.130310059f, -0.152206421f, -0.174789429f,
    -0.198059082f, -0.221984863f, -0.246505737f, -0.271591187f, -0.297210693f, -0.323318481f,
    -0.349868774f, -0.376800537f, -0.404083252f, -0.431655884f, -0.459472656f, -0.487472534f,
    -0.515609741f, -0.543823242f, -0.572036743f, -0.600219727f, -0.628295898f, -0.656219482f,
    -0.683914185f, -0.711318970f, -0.738372803f, -0.765029907f, -0.791213989f, -0.816864014f,
    -0.841949463f, -0.866363525f, -0.890090942f, -0.913055420f, -0.935195923f, -0.956481934f,
    -0.976852417f, -0.996246338f, -1.014617920f, -1.031936646f, -1.048156738f, -1.063217163f,
    -1.077117920f, -1.089782715f, -1.101211548f, -1.111373901f, -1.120223999f, -1.127746582f,
    -1.133926392f, -1.138763428f, -1.142211914f, -1.144287109f, 1.144989014f, 1.144287109f,
    1.142211914f, 1.138763428f, 1.133926392f, 1.127746582f, 1.120223999f, 1.111373901f,
    1.101211548f, 1.089782715f, 1.077117920f, 1.063217163f, 1.048156738f, 1.031936646f,
    1.014617920f, 0.996246338f, 0.976852417f, 0.956481934f, 0.935195923f, 0.913055420f,
    0.890090942f, 0.866363525f, 0.841949463f, 0.816864014f, 0.791213989f, 0.765029907f,
    0.738372803f, 0.711318970f, 0.683914185f, 0.656219482f, 0.628295898f, 0.600219727f,
    0.572036743f, 0.543823242f, 0.515609741f, 0.487472534f, 0.459472656f, 0.431655884f,
    0.404083252f, 0.376800537f, 0.349868774f, 0.323318481f, 0.297210693f, 0.271591187f,
    0.246505737f, 0.221984863f, 0.198059082f, 0.174789429f, 0.152206421f, 0.130310059f,
    0.109161377f, 0.088775635f, 0.069168091f, 0.050354004f, 0.032379150f, 0.015228271f,
    -0.001068115f, -0.016510010f, -0.031082151f, -0.044784546f, -0.057617184f, -0.069595337f,
    -0.080688477f, -0.090927124f, 0.100311279f, 0.108856201f, 0.116577141f, 0.123474121f,
    0.129577637f, 0.134887695f, 0.139450073f, 0.143264771f, 0.146362305f, 0.148773193f,
    0.150497437f, 0.151596069f, 0.152069092f, 0.151962280f, 0.151306152f, 0.150115967f,
    0.148422241f, 0.146255493f, 0.143676758f, 0.140670776f, 0.137298584f, 0.133590698f,
    0.129562378f, 0.125259399f, 0.120697014f, 0.115921021f, 0.110946655f, 0.105819702f,
    0.100540161f, 0.095169067f, 0.089706421f, 0.084182739f, 0.078628540f, 0.073059082f,
    0.067520142f, 0.061996460f, 0.056533810f, 0.051132202f, 0.045837402f, 0.040634155f,
    0.035552979f, 0.030609131f, 0.025817871f, 0.021179199f, 0.016708374f, 0.012420653f,
    0.008316040f, 0.004394531f, 0.000686646f, -0.002822876f, -0.006134033f, -0.009231566f,
    -0.012115479f, -0.014801024f, -0.017257690f, -0.019531250f, -0.021575928f, -0.023422241f,
    -0.025085449f, -0.026535034f, -0.027801514f, -0.028884888f, -0.029785154f, -0.030517576f,
    0.031082151f, 0.031478882f, 0.031738281f, 0.031845093f, 0.031814575f, 0.031661987f,
    0.031387329f, 0.031005858f, 0.030532837f, 0.029937742f, 0.029281614f, 0.028533936f,
    0.027725220f, 0.026840210f, 0.025909424f, 0.024932859f, 0.023910521f, 0.022857666f,
    0.021789551f, 0.020690918f, 0.019577026f, 0.018463135f, 0.017349243f, 0.016235352f,
    0.015121460f, 0.014022826f, 0.012939452f, 0.011886597f, 0.010848999f, 0.009841919f,
    0.008865356f, 0.007919312f, 0.007003784f, 0.006118774f, 0.005294800f, 0.004486084f,
    0.003723145f, 0.003005981f, 0.002334595f, 0.001693726f, 0.001098633f, 0.000549316f,
    0.000030518f, -0.000442505f, -0.000869751f, -0.001266479f, -0.001617432f, -0.001937866f,
    -0.002227783f, -0.002487183f, -0.002700806f, -0.002883911f, -0.003051758f, -0.003173828f,
    -0.003280640f, -0.003372192f, -0.003417969f, -0.003463745f, -0.003479004f, -0.003479004f,
    -0.003463745f, -0.003433228f, -0.003387451f, -0.003326416f, 0.003250122f, 0.003173828f,
    0.003082275f, 0.002990723f, 0.002899170f, 0.002792358f, 0.002685547f, 0.002578735f,
    0.002456665f, 0.002349854f, 0.002243042f, 0.002120972f, 0.002014160f, 0.001907349f,
    0.001785278f, 0.001693726f, 0.001586914f, 0.001480103f, 0.001388550f, 0.001296997f,
    0.001205444f, 0.001113892f, 0.001037598f, 0.000961304f, 0.000885010f, 0.000808716f,
    0.000747681f, 0.000686646f, 0.000625610f, 0.000579834f, 0.000534058f, 0.000473022f,
    0.000442505f, 0.000396729f, 0.000366211f, 0.000320435f, 0.000289917f, 0.000259399f,
    0.000244141f, 0.000213623f, 0.000198364f, 0.000167847f, 0.000152588f, 0.000137329f,
    0.000122070f, 0.000106812f, 0.000106812f, 0.000091553f, 0.000076294f, 0.000076294f,
    0.000061035f, 0.000061035f, 0.000045776f, 0.000045776f, 0.000030518f, 0.000030518f,
    0.000030518f, 0.000030518f, 0.000015259f, 0.000015259f, 0.000015259f, 0.000015259f,
    0.000015259f, 0.000015259f
};

const BigValueTable& bigValues(unsigned table_select)
{
    if (table_select >= 32 || table_select == 4 || table_select == 14) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "Invalid big_values table " + std::to_string(table_select));
    }
    return huffmanSet().tables[table_select];
}

const IO::HuffmanTree& count1(unsigned table_select)
{
    return huffmanSet().count1[table_select ? 1 : 0];
}

const BandTable& bands(unsigned sfreq_index)
{
    if (sfreq_index >= 9) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Invalid sample rate index");
    }
    return kBandTables[sfreq_index];
}

float pow43(unsigned value)
{
    static const std::vector<float> table = buildPow43();
    if (value >= table.size()) {
        throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA,
                               "Quantized value " + std::to_string(value) + " out of range");
    }
    return table[value];
}

} // namespace Tables

} // namespace MP3
} // namespace Codec
} // namespace PsyDec
