/*
 * OpusHeader.cpp - OpusHead identification header, TOC byte and packet framing
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace Opus {

namespace {

// Frame length: one byte below 252, otherwise two bytes as 4 * second + first
size_t readFrameLength(const uint8_t*& p, const uint8_t* end)
{
    if (p >= end) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus frame length truncated");
    }
    size_t first = *p++;
    if (first < 252) {
        return first;
    }
    if (p >= end) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus frame length truncated");
    }
    return 4 * static_cast<size_t>(*p++) + first;
}

void checkFrameSize(size_t size)
{
    if (size > OpusPacket::MAX_FRAME_BYTES) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "Opus frame of " + std::to_string(size) + " bytes exceeds 1275");
    }
}

} // namespace

const char* modeName(OpusMode mode)
{
    switch (mode) {
    case OpusMode::SILK_ONLY: return "SILK";
    case OpusMode::HYBRID:    return "Hybrid";
    case OpusMode::CELT_ONLY: return "CELT";
    }
    return "unknown";
}

const char* bandwidthName(OpusBandwidth bandwidth)
{
    switch (bandwidth) {
    case OpusBandwidth::NARROWBAND:    return "NB";
    case OpusBandwidth::MEDIUMBAND:    return "MB";
    case OpusBandwidth::WIDEBAND:      return "WB";
    case OpusBandwidth::SUPERWIDEBAND: return "SWB";
    case OpusBandwidth::FULLBAND:      return "FB";
    }
    return "unknown";
}

OpusHead OpusHead::parse(const std::vector<uint8_t>& packet)
{
    if (packet.size() < 19 || std::memcmp(packet.data(), "OpusHead", 8) != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Not an OpusHead packet");
    }
    OpusHead head;
    head.version = packet[8];
    head.channels = packet[9];
    head.pre_skip = packet[10] | (packet[11] << 8);
    head.input_sample_rate = static_cast<uint32_t>(packet[12]) | (static_cast<uint32_t>(packet[13]) << 8) |
                             (static_cast<uint32_t>(packet[14]) << 16) | (static_cast<uint32_t>(packet[15]) << 24);
    head.output_gain_q8 = static_cast<int16_t>(packet[16] | (packet[17] << 8));
    head.mapping_family = packet[18];

    // Major version 0 is the only one defined; minor versions stay compatible
    if ((head.version >> 4) != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Unsupported OpusHead version " + std::to_string(head.version));
    }
    if (head.mapping_family != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Opus channel mapping family " + std::to_string(head.mapping_family) +
                               " is not supported");
    }
    if (head.channels < 1 || head.channels > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "OpusHead channel count " + std::to_string(head.channels) + " out of range");
    }
    Debug::log("opus", "OpusHead::parse() channels=", head.channels, " pre_skip=", head.pre_skip,
               " input_rate=", head.input_sample_rate, " gain_q8=", head.output_gain_q8);
    return head;
}

OpusToc OpusToc::parse(uint8_t toc)
{
    OpusToc t;
    t.config = toc >> 3;
    t.stereo = (toc & 0x04) != 0;
    t.code = toc & 0x03;

    if (t.config < 12) {
        t.mode = OpusMode::SILK_ONLY;
        t.bandwidth = static_cast<OpusBandwidth>(t.config / 4);
        static const unsigned silk_sizes[4] = {480, 960, 1920, 2880};
        t.frame_size = silk_sizes[t.config & 3];
    } else if (t.config < 16) {
        t.mode = OpusMode::HYBRID;
        t.bandwidth = t.config < 14 ? OpusBandwidth::SUPERWIDEBAND : OpusBandwidth::FULLBAND;
        t.frame_size = (t.config & 1) ? 960 : 480;
    } else {
        t.mode = OpusMode::CELT_ONLY;
        unsigned band = (t.config - 16) / 4;
        // CELT has no mediumband configuration
        t.bandwidth = band == 0 ? OpusBandwidth::NARROWBAND : static_cast<OpusBandwidth>(band + 1);
        t.frame_size = 120u << (t.config & 3);
    }
    return t;
}

OpusPacket OpusPacket::parse(const uint8_t* data, size_t size)
{
    if (!data || size == 0) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "Empty Opus packet");
    }
    OpusPacket packet;
    packet.toc = OpusToc::parse(data[0]);
    const uint8_t* p = data + 1;
    const uint8_t* end = data + size;

    switch (packet.toc.code) {
    case 0:
        checkFrameSize(static_cast<size_t>(end - p));
        packet.frames.push_back({p, static_cast<size_t>(end - p)});
        break;
    case 1: {
        size_t remaining = static_cast<size_t>(end - p);
        if (remaining & 1) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus code 1 packet has odd payload size");
        }
        checkFrameSize(remaining / 2);
        packet.frames.push_back({p, remaining / 2});
        packet.frames.push_back({p + remaining / 2, remaining / 2});
        break;
    }
    case 2: {
        size_t first = readFrameLength(p, end);
        if (first > static_cast<size_t>(end - p)) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus code 2 frame overruns packet");
        }
        checkFrameSize(first);
        checkFrameSize(static_cast<size_t>(end - p) - first);
        packet.frames.push_back({p, first});
        packet.frames.push_back({p + first, static_cast<size_t>(end - p) - first});
        break;
    }
    default: {
        if (p >= end) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus code 3 packet without frame count");
        }
        uint8_t count_byte = *p++;
        bool vbr = (count_byte & 0x80) != 0;
        bool padded = (count_byte & 0x40) != 0;
        unsigned count = count_byte & 0x3F;
        if (count == 0 || count * packet.toc.frame_size > MAX_PACKET_SAMPLES) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                   "Opus code 3 frame count " + std::to_string(count) + " invalid");
        }
        size_t padding = 0;
        if (padded) {
            uint8_t chunk;
            do {
                if (p >= end) {
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus padding length truncated");
                }
                chunk = *p++;
                padding += chunk == 255 ? 254 : chunk;
            } while (chunk == 255);
        }
        if (padding > static_cast<size_t>(end - p)) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus padding exceeds packet");
        }
        end -= padding;

        if (vbr) {
            std::vector<size_t> sizes;
            size_t total = 0;
            for (unsigned i = 0; i + 1 < count; ++i) {
                size_t len = readFrameLength(p, end);
                checkFrameSize(len);
                sizes.push_back(len);
                total += len;
            }
            if (total > static_cast<size_t>(end - p)) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus VBR frame lengths overrun packet");
            }
            sizes.push_back(static_cast<size_t>(end - p) - total);
            checkFrameSize(sizes.back());
            for (size_t len : sizes) {
                packet.frames.push_back({p, len});
                p += len;
            }
        } else {
            size_t remaining = static_cast<size_t>(end - p);
            if (remaining % count != 0) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       "Opus CBR payload not a multiple of the frame count");
            }
            size_t len = remaining / count;
            checkFrameSize(len);
            for (unsigned i = 0; i < count; ++i) {
                packet.frames.push_back({p + i * len, len});
            }
        }
        break;
    }
    }

    if (packet.samples() > MAX_PACKET_SAMPLES) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Opus packet longer than 120 ms");
    }
    return packet;
}

} // namespace Opus
} // namespace Codec
} // namespace PsyDec
