/*
 * Mp3FrameHeader.cpp - MPEG audio frame header
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

const unsigned kSampleRates[3][3] = {
    {44100, 48000, 32000},  // MPEG-1
    {22050, 24000, 16000},  // MPEG-2
    {11025, 12000, 8000}    // MPEG-2.5
};

// Layer III bitrates in kbps
const unsigned kBitrates[2][15] = {
    {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320},  // MPEG-1
    {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160}       // MPEG-2 and 2.5
};

unsigned versionIndex(MpegVersion version)
{
    switch (version) {
        case MpegVersion::MPEG1: return 0;
        case MpegVersion::MPEG2: return 1;
        case MpegVersion::MPEG25: return 2;
    }
    return 0;
}

} // anonymous namespace

Mp3FrameHeader Mp3FrameHeader::parse(const uint8_t* data, size_t size)
{
    if (size < 4) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "MP3 frame shorter than its header");
    }

    IO::BitReader reader(data, 4);
    if (reader.readBits(11) != 0x7FF) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "MP3 frame sync not found");
    }

    Mp3FrameHeader header;
    switch (reader.readBits(2)) {
        case 0: header.version = MpegVersion::MPEG25; break;
        case 2: header.version = MpegVersion::MPEG2; break;
        case 3: header.version = MpegVersion::MPEG1; break;
        default:
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Reserved MPEG version");
    }
    if (reader.readBits(2) != 1) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Not a Layer III frame");
    }
    header.protection = reader.readBit() == 0;
    header.bitrate_index = reader.readBits(4);
    if (header.bitrate_index == 15) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Reserved bitrate index 15");
    }
    header.sample_rate_index = reader.readBits(2);
    if (header.sample_rate_index == 3) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Reserved sample rate index");
    }
    header.padding = reader.readBit();
    reader.skipBits(1);  // private bit
    header.mode = static_cast<ChannelMode>(reader.readBits(2));
    header.mode_extension = reader.readBits(2);
    // copyright, original, emphasis
    reader.skipBits(4);
    return header;
}

bool Mp3FrameHeader::isValid(const uint8_t* data, size_t size)
{
    try {
        parse(data, size);
        return true;
    } catch (const DecoderException&) {
        return false;
    }
}

unsigned Mp3FrameHeader::sampleRate() const
{
    return kSampleRates[versionIndex(version)][sample_rate_index];
}

unsigned Mp3FrameHeader::bitrateKbps() const
{
    return kBitrates[isLsf() ? 1 : 0][bitrate_index];
}

size_t Mp3FrameHeader::frameLength() const
{
    if (isFreeFormat()) {
        return 0;
    }
    return lengthAt(bitrateKbps());
}

size_t Mp3FrameHeader::maxFreeFormatLength() const
{
    return lengthAt(isLsf() ? MAX_FREE_FORMAT_KBPS / 2 : MAX_FREE_FORMAT_KBPS);
}

size_t Mp3FrameHeader::lengthAt(unsigned kbps) const
{
    // 144 * bitrate / rate for MPEG-1, half that for the 576-sample LSF frame
    size_t coefficient = isLsf() ? 72 : 144;
    return coefficient * kbps * 1000 / sampleRate() + (padding ? 1 : 0);
}

size_t Mp3FrameHeader::sideInfoSize() const
{
    if (isLsf()) {
        return channels() == 1 ? 9 : 17;
    }
    return channels() == 1 ? 17 : 32;
}

unsigned Mp3FrameHeader::bandTableIndex() const
{
    return versionIndex(version) * 3 + sample_rate_index;
}

} // namespace MP3
} // namespace Codec
} // namespace PsyDec
