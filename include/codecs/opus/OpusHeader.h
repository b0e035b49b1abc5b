/*
 * OpusHeader.h - OpusHead identification header, TOC byte and packet framing
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef OPUSHEADER_H
#define OPUSHEADER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {

enum class OpusMode {
    SILK_ONLY,
    HYBRID,
    CELT_ONLY
};

enum class OpusBandwidth {
    NARROWBAND,     // 4 kHz
    MEDIUMBAND,     // 6 kHz
    WIDEBAND,       // 8 kHz
    SUPERWIDEBAND,  // 12 kHz
    FULLBAND        // 20 kHz
};

const char* modeName(OpusMode mode);
const char* bandwidthName(OpusBandwidth bandwidth);

/**
 * @brief The OpusHead packet of an Ogg Opus stream.
 *
 * Only channel mapping family 0 (mono or stereo, one stream) is accepted.
 */
struct OpusHead {
    unsigned version = 1;
    unsigned channels = 0;
    unsigned pre_skip = 0;
    uint32_t input_sample_rate = 0;     // informational, output is always 48 kHz
    int16_t output_gain_q8 = 0;         // dB in Q7.8
    unsigned mapping_family = 0;

    static OpusHead parse(const std::vector<uint8_t>& packet);

    // Linear factor for output_gain_q8
    float outputGain() const { return std::pow(10.0f, output_gain_q8 / (20.0f * 256.0f)); }
};

// Decoded table-of-contents byte
struct OpusToc {
    unsigned config = 0;
    OpusMode mode = OpusMode::CELT_ONLY;
    OpusBandwidth bandwidth = OpusBandwidth::FULLBAND;
    unsigned frame_size = 960;          // samples per frame at 48 kHz
    bool stereo = false;
    unsigned code = 0;                  // frame count code, 0..3

    static OpusToc parse(uint8_t toc);
};

struct OpusFrame {
    const uint8_t* data;
    size_t size;
};

/**
 * @brief One Opus packet split into its frames.
 *
 * Handles all four framing codes, including code 3 padding and VBR
 * lengths. Frames point into the caller's buffer. A malformed packet
 * throws CORRUPT_SIDE_INFO.
 */
struct OpusPacket {
    static constexpr size_t MAX_FRAME_BYTES = 1275;
    static constexpr unsigned MAX_PACKET_SAMPLES = 5760;    // 120 ms

    OpusToc toc;
    std::vector<OpusFrame> frames;

    static OpusPacket parse(const uint8_t* data, size_t size);

    unsigned samples() const { return toc.frame_size * static_cast<unsigned>(frames.size()); }
};

} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // OPUSHEADER_H
