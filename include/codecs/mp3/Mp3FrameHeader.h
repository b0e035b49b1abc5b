/*
 * Mp3FrameHeader.h - MPEG audio frame header
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MP3FRAMEHEADER_H
#define MP3FRAMEHEADER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace MP3 {

enum class MpegVersion {
    MPEG1,
    MPEG2,
    MPEG25
};

enum class ChannelMode {
    STEREO = 0,
    JOINT_STEREO = 1,
    DUAL_CHANNEL = 2,
    MONO = 3
};

/**
 * @brief The 32-bit header in front of every Layer III frame.
 *
 * Only Layer III headers are accepted. Free-format frames (bitrate index 0)
 * parse, but their length is not in the header: it is the distance to the
 * next sync word, which the caller has to find.
 */
struct Mp3FrameHeader {
    // Highest free-format bitrate accepted, for MPEG-1; LSF takes half
    static constexpr unsigned MAX_FREE_FORMAT_KBPS = 640;

    MpegVersion version = MpegVersion::MPEG1;
    bool protection = false;        // CRC-16 follows the header
    unsigned bitrate_index = 0;
    unsigned sample_rate_index = 0; // 0..2 within the version
    bool padding = false;
    ChannelMode mode = ChannelMode::STEREO;
    unsigned mode_extension = 0;

    /**
     * @brief Parses four header bytes.
     * @throws DecoderException CORRUPT_SIDE_INFO on a bad sync word or a
     *         reserved field value
     */
    static Mp3FrameHeader parse(const uint8_t* data, size_t size);

    // True if the four bytes at data look like a Layer III header
    static bool isValid(const uint8_t* data, size_t size);

    unsigned sampleRate() const;
    // 0 for free format
    unsigned bitrateKbps() const;
    bool isFreeFormat() const { return bitrate_index == 0; }
    unsigned channels() const { return mode == ChannelMode::MONO ? 1 : 2; }
    bool isLsf() const { return version != MpegVersion::MPEG1; }
    unsigned granules() const { return isLsf() ? 1 : 2; }
    unsigned samplesPerChannel() const { return 576 * granules(); }
    // Bytes in the frame including the header, 0 for free format
    size_t frameLength() const;
    // Upper bound on a free-format frame at this rate
    size_t maxFreeFormatLength() const;
    size_t sideInfoSize() const;
    // Index into Tables::bands()
    unsigned bandTableIndex() const;
    bool msStereo() const { return mode == ChannelMode::JOINT_STEREO && (mode_extension & 0x2); }
    bool intensityStereo() const { return mode == ChannelMode::JOINT_STEREO && (mode_extension & 0x1); }

private:
    size_t lengthAt(unsigned kbps) const;
};

} // namespace MP3
} // namespace Codec
} // namespace PsyDec

#endif // MP3FRAMEHEADER_H
