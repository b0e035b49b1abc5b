/*
 * AacConfig.cpp - AudioSpecificConfig, ADTS and program config parsing
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace AAC {

namespace {

const unsigned kConfigChannels[8] = {0, 1, 2, 3, 4, 5, 6, 8};

unsigned readElementList(IO::BitReader& reader, unsigned count, bool has_cpe_flag)
{
    unsigned channels = 0;
    for (unsigned i = 0; i < count; ++i) {
        bool is_cpe = has_cpe_flag ? reader.readBit() : false;
        reader.readBits(4);         // element tag
        channels += is_cpe ? 2 : 1;
    }
    return channels;
}

} // anonymous namespace

ProgramConfig ProgramConfig::parse(IO::BitReader& reader)
{
    ProgramConfig pce;
    pce.element_instance_tag = reader.readBits(4);
    pce.object_type = reader.readBits(2);
    pce.sf_index = reader.readBits(4);
    pce.front_elements = reader.readBits(4);
    pce.side_elements = reader.readBits(4);
    pce.back_elements = reader.readBits(4);
    pce.lfe_elements = reader.readBits(2);
    unsigned assoc_data = reader.readBits(3);
    unsigned valid_cc = reader.readBits(4);
    if (reader.readBit()) {
        reader.readBits(4);         // mono_mixdown_element_number
    }
    if (reader.readBit()) {
        reader.readBits(4);         // stereo_mixdown_element_number
    }
    if (reader.readBit()) {
        reader.readBits(3);         // matrix_mixdown_idx, pseudo_surround_enable
    }

    pce.channels += readElementList(reader, pce.front_elements, true);
    pce.channels += readElementList(reader, pce.side_elements, true);
    pce.channels += readElementList(reader, pce.back_elements, true);
    pce.channels += readElementList(reader, pce.lfe_elements, false);
    readElementList(reader, assoc_data, false);
    for (unsigned i = 0; i < valid_cc; ++i) {
        reader.readBits(5);         // cc_element_is_ind_sw, tag
    }

    reader.byteAlign();
    unsigned comment_bytes = reader.readBits(8);
    pce.comment.reserve(comment_bytes);
    for (unsigned i = 0; i < comment_bytes; ++i) {
        pce.comment.push_back(static_cast<char>(reader.readBits(8)));
    }
    return pce;
}

AudioSpecificConfig AudioSpecificConfig::parse(const uint8_t* data, size_t size)
{
    if (!data || size < 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "AudioSpecificConfig shorter than 2 bytes");
    }

    AudioSpecificConfig asc;
    try {
        IO::BitReader reader(data, size);
        asc.object_type = reader.readBits(5);
        if (asc.object_type == 31) {
            asc.object_type = 32 + reader.readBits(6);
        }
        asc.sf_index = reader.readBits(4);
        if (asc.sf_index == 15) {
            asc.sample_rate = reader.readBits(24);
        } else {
            asc.sample_rate = Tables::sampleRate(asc.sf_index);
        }
        asc.channel_config = reader.readBits(4);

        if (asc.object_type == kObjectTypeLC) {
            // GASpecificConfig
            asc.frame_length_960 = reader.readBit();
            asc.depends_on_core_coder = reader.readBit();
            if (asc.depends_on_core_coder) {
                asc.core_coder_delay = reader.readBits(14);
            }
            reader.readBit();       // extensionFlag, always 0 for LC
            if (asc.channel_config == 0) {
                asc.program_config = ProgramConfig::parse(reader);
            }
        }
    } catch (const DecoderException& e) {
        if (e.getError() != DecoderError::BITSTREAM_EXHAUSTED) {
            throw;
        }
        throw DecoderException(DecoderError::CONFIG_ERROR, "AudioSpecificConfig truncated");
    }

    Debug::log("aac", "AudioSpecificConfig::parse() object type ", asc.object_type, ", ",
               asc.sample_rate, " Hz, channel config ", asc.channel_config);
    return asc;
}

AudioSpecificConfig AudioSpecificConfig::make(unsigned sample_rate, unsigned channels)
{
    std::optional<unsigned> index = Tables::sampleRateIndex(sample_rate);
    if (!index) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "AAC does not support a sample rate of " + std::to_string(sample_rate));
    }
    AudioSpecificConfig asc;
    asc.sf_index = *index;
    asc.sample_rate = sample_rate;
    asc.channel_config = 0;
    for (unsigned c = 1; c < 8; ++c) {
        if (kConfigChannels[c] == channels) {
            asc.channel_config = c;
            break;
        }
    }
    if (asc.channel_config == 0) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "No AAC channel configuration for " + std::to_string(channels) + " channels");
    }
    return asc;
}

std::vector<uint8_t> AudioSpecificConfig::serialize() const
{
    if (object_type >= 31 || sf_index >= 15 || channel_config == 0 || channel_config > 7) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Config has no two-byte AudioSpecificConfig form");
    }
    uint16_t bits = static_cast<uint16_t>((object_type << 11) | (sf_index << 7) | (channel_config << 3) |
                                          (frame_length_960 ? 4 : 0));
    return {static_cast<uint8_t>(bits >> 8), static_cast<uint8_t>(bits & 0xFF)};
}

unsigned AudioSpecificConfig::channels() const
{
    if (channel_config == 0) {
        return program_config ? program_config->channels : 0;
    }
    return channel_config < 8 ? kConfigChannels[channel_config] : 0;
}

void AudioSpecificConfig::validate() const
{
    if (object_type != kObjectTypeLC) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Only AAC-LC is supported, got object type " + std::to_string(object_type));
    }
    if (frame_length_960) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "960-sample AAC frames are not supported");
    }
    if (depends_on_core_coder) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "AAC core coder dependency is not supported");
    }
    if (sf_index >= 13) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Explicit AAC sample rates are not supported");
    }
    unsigned ch = channels();
    if (ch == 0 || ch > 8) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Invalid AAC channel configuration " + std::to_string(channel_config));
    }
}

bool AdtsHeader::hasSync(const uint8_t* data, size_t size)
{
    return size >= 2 && data[0] == 0xFF && (data[1] & 0xF6) == 0xF0;
}

AdtsHeader AdtsHeader::parse(const uint8_t* data, size_t size)
{
    if (size < 7) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "ADTS header truncated");
    }
    if (!hasSync(data, size)) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "ADTS sync word not found");
    }

    IO::BitReader reader(data, size);
    AdtsHeader h;
    reader.skipBits(12);
    h.mpeg2 = reader.readBit();
    reader.skipBits(2);                 // layer, checked by hasSync
    h.protection_absent = reader.readBit();
    h.profile = reader.readBits(2);
    h.sf_index = reader.readBits(4);
    reader.skipBits(1);                 // private_bit
    h.channel_config = reader.readBits(3);
    reader.skipBits(4);                 // original_copy, home, copyright bits
    h.frame_length = reader.readBits(13);
    h.buffer_fullness = reader.readBits(11);
    h.raw_data_blocks = reader.readBits(2) + 1;

    if (h.sf_index >= 13) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "Invalid ADTS sampling frequency index " + std::to_string(h.sf_index));
    }
    if (h.frame_length < h.headerSize()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "ADTS frame_length " + std::to_string(h.frame_length) + " below header size");
    }
    return h;
}

AudioSpecificConfig AdtsHeader::toConfig() const
{
    AudioSpecificConfig asc;
    asc.object_type = profile + 1;
    asc.sf_index = sf_index;
    asc.sample_rate = Tables::sampleRate(sf_index);
    asc.channel_config = channel_config;
    return asc;
}

std::array<uint8_t, 7> AdtsHeader::serialize() const
{
    std::array<uint8_t, 7> out{};
    unsigned len = frame_length;
    out[0] = 0xFF;
    out[1] = static_cast<uint8_t>(0xF0 | (mpeg2 ? 0x08 : 0) | (protection_absent ? 0x01 : 0));
    out[2] = static_cast<uint8_t>((profile << 6) | (sf_index << 2) | (channel_config >> 2));
    out[3] = static_cast<uint8_t>(((channel_config & 3) << 6) | (len >> 11));
    out[4] = static_cast<uint8_t>((len >> 3) & 0xFF);
    out[5] = static_cast<uint8_t>(((len & 7) << 5) | (buffer_fullness >> 6));
    out[6] = static_cast<uint8_t>(((buffer_fullness & 0x3F) << 2) | ((raw_data_blocks - 1) & 3));
    return out;
}

} // namespace AAC
} // namespace Codec
} // namespace PsyDec
