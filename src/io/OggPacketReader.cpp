/*
 * OggPacketReader.cpp - Packet extraction from an Ogg file with libogg
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

#ifdef HAVE_OGG

namespace PsyDec {
namespace IO {

namespace {
constexpr size_t FEED_SIZE = 4096;
}

OggPacketReader::OggPacketReader(const std::vector<uint8_t>& data)
    : m_data(data)
    , m_fed(0)
    , m_have_stream(false)
    , m_serial(0)
    , m_granule(-1)
    , m_eos(false)
    , m_holes(0)
{
    int result = ogg_sync_init(&m_sync);
    if (result != 0) {
        throw std::runtime_error("OggPacketReader: ogg_sync_init failed with code " + std::to_string(result));
    }
}

OggPacketReader::~OggPacketReader()
{
    if (m_have_stream) {
        ogg_stream_clear(&m_stream);
    }
    ogg_sync_clear(&m_sync);
}

bool OggPacketReader::readPage()
{
    ogg_page page;
    for (;;) {
        int result = ogg_sync_pageout(&m_sync, &page);
        if (result < 0) {
            Debug::log("cli", "OggPacketReader: skipped unsynced bytes");
            continue;
        }
        if (result == 0) {
            if (m_fed >= m_data.size()) {
                return false;
            }
            size_t bytes = std::min(FEED_SIZE, m_data.size() - m_fed);
            char* buffer = ogg_sync_buffer(&m_sync, static_cast<long>(bytes));
            if (!buffer) {
                throw std::runtime_error("OggPacketReader: ogg_sync_buffer failed");
            }
            std::memcpy(buffer, m_data.data() + m_fed, bytes);
            if (ogg_sync_wrote(&m_sync, static_cast<long>(bytes)) != 0) {
                throw std::runtime_error("OggPacketReader: ogg_sync_wrote failed");
            }
            m_fed += bytes;
            continue;
        }

        uint32_t serial = static_cast<uint32_t>(ogg_page_serialno(&page));
        if (!m_have_stream) {
            if (!ogg_page_bos(&page)) {
                continue;
            }
            if (ogg_stream_init(&m_stream, static_cast<int>(serial)) != 0) {
                throw std::runtime_error("OggPacketReader: ogg_stream_init failed");
            }
            m_have_stream = true;
            m_serial = serial;
            Debug::log("cli", "OggPacketReader: logical stream ", serial);
        } else if (serial != m_serial) {
            continue;
        }

        if (ogg_stream_pagein(&m_stream, &page) != 0) {
            Debug::log("cli", "OggPacketReader: rejected page ", static_cast<long>(ogg_page_pageno(&page)));
            continue;
        }
        m_granule = ogg_page_granulepos(&page);
        if (ogg_page_eos(&page)) {
            m_eos = true;
        }
        return true;
    }
}

bool OggPacketReader::next(std::vector<uint8_t>& packet)
{
    for (;;) {
        if (m_have_stream) {
            ogg_packet op;
            int result = ogg_stream_packetout(&m_stream, &op);
            if (result < 0) {
                ++m_holes;
                Debug::log("cli", "OggPacketReader: hole in page sequence");
                continue;
            }
            if (result > 0) {
                packet.assign(op.packet, op.packet + op.bytes);
                return true;
            }
            if (m_eos) {
                return false;
            }
        }
        if (!readPage()) {
            return false;
        }
    }
}

} // namespace IO
} // namespace PsyDec

#endif // HAVE_OGG
