/*
 * OpusDecoder.cpp - Opus packet decoder (SILK, CELT and hybrid)
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

// A CELT frame that decodes to silence, used to fade out the high band
const uint8_t kCeltSilence[2] = { 0xFF, 0xFF };
constexpr unsigned kFadeOutSamples = 120;
constexpr int kHybridStartBand = 17;

OpusHead headForChannels(unsigned channels)
{
    if (channels < 1 || channels > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Opus channel count " + std::to_string(channels) + " out of range");
    }
    OpusHead head;
    head.channels = channels;
    head.input_sample_rate = OpusDecoder::SAMPLE_RATE;
    return head;
}

} // namespace

OpusDecoder::OpusDecoder(const OpusHead& head, const DecoderConfig& config)
    : m_head(head)
    , m_config(config)
    , m_channels(headForChannels(head.channels).channels)
    , m_gain(head.outputGain())
    , m_silk(m_channels, config)
    , m_celt(m_channels, config)
    , m_plc(m_channels, config)
    , m_celt_pcm(static_cast<size_t>(960) * m_channels, 0.0f)
    , m_fade_pcm(static_cast<size_t>(kFadeOutSamples) * m_channels, 0.0f)
    , m_prev_mode(OpusMode::CELT_ONLY)
    , m_have_prev_mode(false)
    , m_prev_redundancy(false)
    , m_last_packet_samples(960)
    , m_final_range(0)
{
    if (head.mapping_family != 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Opus multistream mappings are not supported");
    }
    Debug::log("opus", "OpusDecoder::OpusDecoder() channels=", m_channels, " pre_skip=", m_head.pre_skip,
               " gain=", m_gain);
}

OpusDecoder::OpusDecoder(unsigned channels, const DecoderConfig& config)
    : OpusDecoder(headForChannels(channels), config)
{
}

void OpusDecoder::reset()
{
    m_silk.reset();
    m_celt.reset();
    m_plc.reset();
    m_prev_mode = OpusMode::CELT_ONLY;
    m_have_prev_mode = false;
    m_prev_redundancy = false;
    m_last_packet_samples = 960;
    m_final_range = 0;
}

void OpusDecoder::applyGain(float* pcm, size_t count) const
{
    if (m_gain == 1.0f) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        pcm[i] *= m_gain;
    }
}

size_t OpusDecoder::decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity)
{
    if (!data || size == 0) {
        return decodeLost(output, capacity);
    }

    OpusPacket packet = OpusPacket::parse(data, size);
    const unsigned frame_size = packet.toc.frame_size;
    const size_t samples = static_cast<size_t>(packet.samples()) * m_channels;
    if (capacity < samples) {
        throw std::invalid_argument("OpusDecoder: output buffer too small");
    }

    DEBUG_LOG_LAZY("opus", "OpusDecoder::decodeFrame() ", modeName(packet.toc.mode), " ",
                   bandwidthName(packet.toc.bandwidth), " frames=", packet.frames.size(),
                   " frame_size=", frame_size, " stereo=", packet.toc.stereo);

    float* pcm = output;
    for (const OpusFrame& frame : packet.frames) {
        if (frame.size <= 1) {
            concealFrame(frame_size, pcm);
        } else {
            decodeOpusFrame(packet.toc, frame, pcm);
            unsigned pitch = m_prev_mode == OpusMode::CELT_ONLY ? 0 : m_silk.pitchLag();
            m_plc.update(pcm, frame_size, pitch);
        }
        pcm += static_cast<size_t>(frame_size) * m_channels;
    }

    m_last_packet_samples = packet.samples();
    applyGain(output, samples);
    return samples;
}

size_t OpusDecoder::decodeLost(float* output, size_t capacity)
{
    const size_t samples = static_cast<size_t>(m_last_packet_samples) * m_channels;
    if (capacity < samples) {
        throw std::invalid_argument("OpusDecoder: output buffer too small");
    }

    // Conceal in blocks no longer than the longest CELT frame
    unsigned remaining = m_last_packet_samples;
    float* pcm = output;
    while (remaining > 0) {
        unsigned block = std::min(remaining, 960u);
        concealFrame(block, pcm);
        pcm += static_cast<size_t>(block) * m_channels;
        remaining -= block;
    }
    applyGain(output, samples);
    return samples;
}

void OpusDecoder::concealFrame(unsigned frame_size, float* pcm)
{
    m_plc.conceal(pcm, frame_size);
    m_final_range = 0;
}

void OpusDecoder::decodeOpusFrame(const OpusToc& toc, const OpusFrame& frame, float* pcm)
{
    const OpusMode mode = toc.mode;
    const unsigned frame_size = toc.frame_size;
    const unsigned stream_channels = toc.stereo ? 2 : 1;
    const size_t count = static_cast<size_t>(frame_size) * m_channels;

    RangeDecoder rd(frame.data, frame.size);
    int len = static_cast<int>(frame.size);

    if (mode != OpusMode::CELT_ONLY) {
        if (m_have_prev_mode && m_prev_mode == OpusMode::CELT_ONLY) {
            m_silk.reset();
        }
        m_silk.decode(rd, frame_size, toc.bandwidth, stream_channels, pcm);
    } else {
        std::fill(pcm, pcm + count, 0.0f);
    }

    // Redundant CELT frame for mode transitions: parsed so the main CELT
    // frame ends at the right byte, not decoded
    bool redundancy = false;
    if (mode != OpusMode::CELT_ONLY &&
        rd.tell() + 17 + (mode == OpusMode::HYBRID ? 20 : 0) <= 8 * len) {
        redundancy = mode == OpusMode::HYBRID ? rd.decodeBitLogp(12) : true;
        if (redundancy) {
            bool celt_to_silk = rd.decodeBitLogp(1);
            int redundancy_bytes = mode == OpusMode::HYBRID
                                       ? static_cast<int>(rd.decodeUInt(256)) + 2
                                       : len - ((rd.tell() + 7) >> 3);
            len -= redundancy_bytes;
            if (len * 8 < rd.tell()) {
                len = 0;
                redundancy_bytes = 0;
                redundancy = false;
            }
            rd.shrink(static_cast<size_t>(std::max(redundancy_bytes, 0)));
            Debug::log("opus", "OpusDecoder::decodeOpusFrame() redundant frame skipped, bytes=",
                       std::to_string(redundancy_bytes), " celt_to_silk=", celt_to_silk);
        }
    }

    if (mode != OpusMode::SILK_ONLY) {
        if (m_have_prev_mode && mode != m_prev_mode && !m_prev_redundancy) {
            m_celt.reset();
        }
        const int start = mode == OpusMode::HYBRID ? kHybridStartBand : 0;
        m_celt.setBandRange(start, CeltDecoder::endBandFor(toc.bandwidth));
        m_celt.decode(rd, frame_size, stream_channels, m_celt_pcm.data());
        Core::StereoProcessor::mixHybrid(pcm, m_celt_pcm.data(), count);
        m_final_range = m_celt.finalRange();
    } else {
        m_final_range = rd.range();
        if (m_have_prev_mode && m_prev_mode == OpusMode::HYBRID) {
            // Let the CELT overlap fade out instead of cutting the high band
            RangeDecoder silence(kCeltSilence, sizeof(kCeltSilence));
            m_celt.setBandRange(0, CeltDecoder::endBandFor(OpusBandwidth::FULLBAND));
            m_celt.decode(silence, kFadeOutSamples, stream_channels, m_fade_pcm.data());
            Core::StereoProcessor::mixHybrid(pcm, m_fade_pcm.data(),
                                             std::min(count, m_fade_pcm.size()));
        }
    }

    m_prev_mode = mode;
    m_have_prev_mode = true;
    m_prev_redundancy = redundancy;
}

} // namespace Opus
} // namespace Codec
} // namespace PsyDec
