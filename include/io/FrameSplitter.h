/*
 * FrameSplitter.h - Splits elementary MP3 and ADTS streams into frames
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FRAMESPLITTER_H
#define FRAMESPLITTER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace IO {

/**
 * @brief A frame located inside a larger buffer.
 */
struct FrameSpan {
    size_t offset = 0;
    size_t length = 0;
};

/**
 * @brief Locates frames in raw MP3 and ADTS files.
 *
 * A candidate header only counts as a frame when the header at the end of
 * the frame is also valid (or the buffer ends there), which keeps stray
 * sync patterns inside audio data from being taken as frames. Bytes
 * between frames are skipped and logged on the "cli" channel.
 */
class FrameSplitter {
public:
    // Length of a leading ID3v2 tag, 0 when there is none
    static size_t id3v2Length(const uint8_t* data, size_t size);

    static std::vector<FrameSpan> splitMp3(const uint8_t* data, size_t size);
    static std::vector<FrameSpan> splitAdts(const uint8_t* data, size_t size);

    static std::vector<FrameSpan> splitMp3(const std::vector<uint8_t>& data)
    {
        return splitMp3(data.data(), data.size());
    }
    static std::vector<FrameSpan> splitAdts(const std::vector<uint8_t>& data)
    {
        return splitAdts(data.data(), data.size());
    }
};

} // namespace IO
} // namespace PsyDec

#endif // FRAMESPLITTER_H
