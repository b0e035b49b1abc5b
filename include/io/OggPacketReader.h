/*
 * OggPacketReader.h - Packet extraction from an Ogg file with libogg
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef OGGPACKETREADER_H
#define OGGPACKETREADER_H

// No direct includes - all includes should be in psydec.h

#ifdef HAVE_OGG

namespace PsyDec {
namespace IO {

/**
 * @brief Reads the packets of the first logical stream in an Ogg buffer.
 *
 * Pages of other logical streams are ignored. Holes in the page sequence
 * are reported through holes() so the caller can conceal them.
 */
class OggPacketReader {
public:
    explicit OggPacketReader(const std::vector<uint8_t>& data);
    ~OggPacketReader();

    OggPacketReader(const OggPacketReader&) = delete;
    OggPacketReader& operator=(const OggPacketReader&) = delete;

    /**
     * @brief Next packet of the stream.
     * @return false at the end of the data
     */
    bool next(std::vector<uint8_t>& packet);

    // Granule position of the last page read, -1 before any
    int64_t granulePosition() const { return m_granule; }
    bool endOfStream() const { return m_eos; }
    unsigned holes() const { return m_holes; }
    uint32_t serial() const { return m_serial; }

private:
    bool readPage();

    const std::vector<uint8_t>& m_data;
    size_t m_fed;
    ogg_sync_state m_sync;
    ogg_stream_state m_stream;
    bool m_have_stream;
    uint32_t m_serial;
    int64_t m_granule;
    bool m_eos;
    unsigned m_holes;
};

} // namespace IO
} // namespace PsyDec

#endif // HAVE_OGG

#endif // OGGPACKETREADER_H
