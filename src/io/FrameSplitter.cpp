/*
 * FrameSplitter.cpp - Splits elementary MP3 and ADTS streams into frames
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace IO {

namespace {

/**
 * Length of the free-format frame at `offset`: the distance to the next
 * header with the same version, protection, bitrate index and rate. The
 * last frame of the buffer runs to its end. Returns 0 if neither fits
 * within the largest free-format frame.
 */
size_t freeFormatLength(const uint8_t* data, size_t size, size_t offset,
                        const Codec::MP3::Mp3FrameHeader& header)
{
    const size_t longest = header.maxFreeFormatLength();
    const size_t shortest = 4 + (header.protection ? 2 : 0) + header.sideInfoSize();
    const size_t limit = std::min(size, offset + longest + 1);
    for (size_t next = offset + shortest; next + 4 <= limit; ++next) {
        if (data[next] == 0xFF && data[next + 1] == data[offset + 1] &&
            (data[next + 2] & 0xFC) == (data[offset + 2] & 0xFC)) {
            return next - offset;
        }
    }
    if (size - offset >= shortest && size - offset <= longest) {
        return size - offset;
    }
    return 0;
}

// Frame length at `offset`, or 0 if no valid header starts there
size_t mp3FrameAt(const uint8_t* data, size_t size, size_t offset)
{
    try {
        Codec::MP3::Mp3FrameHeader header = Codec::MP3::Mp3FrameHeader::parse(data + offset, size - offset);
        return header.isFreeFormat() ? freeFormatLength(data, size, offset, header) : header.frameLength();
    } catch (const DecoderException& e) {
        DEBUG_LOG_LAZY("cli", "FrameSplitter: rejected MP3 header at ", offset, ": ", e.what());
        return 0;
    }
}

size_t adtsFrameAt(const uint8_t* data, size_t size, size_t offset)
{
    if (!Codec::AAC::AdtsHeader::hasSync(data + offset, size - offset)) {
        return 0;
    }
    try {
        Codec::AAC::AdtsHeader header = Codec::AAC::AdtsHeader::parse(data + offset, size - offset);
        return header.frame_length >= header.headerSize() ? header.frame_length : 0;
    } catch (const DecoderException& e) {
        DEBUG_LOG_LAZY("cli", "FrameSplitter: rejected ADTS header at ", offset, ": ", e.what());
        return 0;
    }
}

template<typename FrameAt>
std::vector<FrameSpan> split(const uint8_t* data, size_t size, size_t start, FrameAt frame_at,
                             const char* kind)
{
    std::vector<FrameSpan> frames;
    size_t offset = start;
    size_t skipped = 0;

    while (offset + 4 <= size) {
        size_t length = frame_at(data, size, offset);
        if (length == 0 || offset + length > size) {
            ++offset;
            ++skipped;
            continue;
        }
        // After a resync the following header must confirm this one
        size_t next = offset + length;
        bool resync = frames.empty() || skipped > 0;
        if (resync && next + 4 <= size && frame_at(data, size, next) == 0) {
            ++offset;
            ++skipped;
            continue;
        }
        if (skipped) {
            Debug::log("cli", "FrameSplitter: skipped ", skipped, " bytes before ", kind, " frame at ", offset);
            skipped = 0;
        }
        frames.push_back({offset, length});
        offset = next;
    }

    Debug::log("cli", "FrameSplitter: ", frames.size(), " ", kind, " frames in ", size, " bytes");
    return frames;
}

} // namespace

size_t FrameSplitter::id3v2Length(const uint8_t* data, size_t size)
{
    if (size < 10 || std::memcmp(data, "ID3", 3) != 0) {
        return 0;
    }
    // Size is four 7-bit bytes and excludes the header and footer
    if ((data[6] | data[7] | data[8] | data[9]) & 0x80) {
        return 0;
    }
    size_t length = (static_cast<size_t>(data[6]) << 21) | (static_cast<size_t>(data[7]) << 14) |
                    (static_cast<size_t>(data[8]) << 7) | data[9];
    length += 10;
    if (data[5] & 0x10) {
        length += 10;
    }
    return std::min(length, size);
}

std::vector<FrameSpan> FrameSplitter::splitMp3(const uint8_t* data, size_t size)
{
    return split(data, size, id3v2Length(data, size), mp3FrameAt, "MP3");
}

std::vector<FrameSpan> FrameSplitter::splitAdts(const uint8_t* data, size_t size)
{
    return split(data, size, id3v2Length(data, size), adtsFrameAt, "ADTS");
}

} // namespace IO
} // namespace PsyDec
