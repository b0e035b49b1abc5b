/*
 * CodecDecoder.cpp - Uniform decoder facade over the four codecs
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {

namespace {

// Visitor helper for std::visit with one lambda per alternative
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

void checkMatch(const char* what, unsigned requested, unsigned actual, CodecType codec)
{
    if (requested != 0 && requested != actual) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               std::string(codecTypeName(codec)) + " stream has " + what + " " +
                               std::to_string(actual) + ", " + std::to_string(requested) + " requested");
    }
}

} // namespace

const char* codecTypeName(CodecType codec)
{
    switch (codec) {
        case CodecType::MP3:
            return "mp3";
        case CodecType::AAC:
            return "aac";
        case CodecType::VORBIS:
            return "vorbis";
        case CodecType::OPUS:
            return "opus";
    }
    return "unknown";
}

std::optional<CodecType> parseCodecType(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "mp3") {
        return CodecType::MP3;
    }
    if (lower == "aac" || lower == "adts") {
        return CodecType::AAC;
    }
    if (lower == "vorbis" || lower == "ogg") {
        return CodecType::VORBIS;
    }
    if (lower == "opus") {
        return CodecType::OPUS;
    }
    return std::nullopt;
}

CodecProfile CodecProfile::mp3()
{
    return CodecProfile();
}

CodecProfile CodecProfile::aac(std::vector<uint8_t> asc, bool adts)
{
    CodecProfile profile;
    profile.codec = CodecType::AAC;
    profile.audio_specific_config = std::move(asc);
    profile.adts = adts;
    return profile;
}

CodecProfile CodecProfile::vorbis(std::vector<uint8_t> identification, std::vector<uint8_t> comment,
                                  std::vector<uint8_t> setup)
{
    CodecProfile profile;
    profile.codec = CodecType::VORBIS;
    profile.vorbis_identification = std::move(identification);
    profile.vorbis_comment = std::move(comment);
    profile.vorbis_setup = std::move(setup);
    return profile;
}

CodecProfile CodecProfile::opus(std::vector<uint8_t> head)
{
    CodecProfile profile;
    profile.codec = CodecType::OPUS;
    profile.opus_head = std::move(head);
    return profile;
}

CodecDecoder::CodecDecoder(CodecType codec, const DecoderConfig& config)
    : m_codec(codec)
    , m_config(config)
{
}

std::unique_ptr<CodecDecoder> CodecDecoder::init(unsigned sample_rate, unsigned channels,
                                                 const CodecProfile& profile, const DecoderConfig& config)
{
    Debug::log("codec", "CodecDecoder::init() codec=", codecTypeName(profile.codec), " rate=", sample_rate,
               " channels=", channels);

    if (!config.validate()) {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Invalid decoder configuration");
    }

    std::unique_ptr<CodecDecoder> decoder(new CodecDecoder(profile.codec, config));
    switch (profile.codec) {
        case CodecType::MP3:
            if (sample_rate == 0 || channels == 0) {
                throw DecoderException(DecoderError::CONFIG_ERROR, "MP3 needs a sample rate and channel count");
            }
            decoder->m_decoder.emplace<MP3::Mp3Decoder>(sample_rate, channels, config);
            break;

        case CodecType::AAC: {
            AAC::AudioSpecificConfig asc;
            if (profile.audio_specific_config.empty()) {
                if (sample_rate == 0 || channels == 0) {
                    throw DecoderException(DecoderError::CONFIG_ERROR,
                                           "AAC needs an AudioSpecificConfig or a sample rate and channel count");
                }
                asc = AAC::AudioSpecificConfig::make(sample_rate, channels);
            } else {
                asc = AAC::AudioSpecificConfig::parse(profile.audio_specific_config.data(),
                                                      profile.audio_specific_config.size());
            }
            checkMatch("sample rate", sample_rate, asc.sample_rate, profile.codec);
            checkMatch("channel count", channels, asc.channels(), profile.codec);
            decoder->m_decoder.emplace<AAC::AacDecoder>(asc, config, profile.adts);
            break;
        }

        case CodecType::VORBIS: {
            if (profile.vorbis_identification.empty() || profile.vorbis_comment.empty() ||
                profile.vorbis_setup.empty()) {
                throw DecoderException(DecoderError::CONFIG_ERROR, "Vorbis needs all three header packets");
            }
            auto& vorbis = decoder->m_decoder.emplace<Vorbis::VorbisDecoder>(
                profile.vorbis_identification, profile.vorbis_comment, profile.vorbis_setup, config);
            checkMatch("sample rate", sample_rate, vorbis.sampleRate(), profile.codec);
            checkMatch("channel count", channels, vorbis.channels(), profile.codec);
            break;
        }

        case CodecType::OPUS: {
            checkMatch("sample rate", sample_rate, Opus::OpusDecoder::SAMPLE_RATE, profile.codec);
            if (profile.opus_head.empty()) {
                if (channels == 0) {
                    throw DecoderException(DecoderError::CONFIG_ERROR, "Opus needs an OpusHead or a channel count");
                }
                decoder->m_decoder.emplace<Opus::OpusDecoder>(channels, config);
            } else {
                Opus::OpusHead head = Opus::OpusHead::parse(profile.opus_head);
                checkMatch("channel count", channels, head.channels, profile.codec);
                decoder->m_decoder.emplace<Opus::OpusDecoder>(head, config);
            }
            break;
        }
    }

    Debug::log("codec", "CodecDecoder::init() ", decoder->codecName(), " ready, ", decoder->sampleRate(),
               " Hz, ", decoder->channels(), " channel(s), max frame ", decoder->maxFrameSamples());
    return decoder;
}

bool CodecDecoder::isInitialized() const
{
    return !std::holds_alternative<std::monostate>(m_decoder);
}

void CodecDecoder::checkInitialized(const char* operation) const
{
    if (!isInitialized()) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               std::string("CodecDecoder::") + operation + "() after deinit()");
    }
}

size_t CodecDecoder::finish(float* output, size_t count) const
{
    if (m_config.clip_output) {
        for (size_t i = 0; i < count; ++i) {
            output[i] = std::isnan(output[i]) ? 0.0f : std::clamp(output[i], -1.0f, 1.0f);
        }
    }
    return count;
}

size_t CodecDecoder::decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity)
{
    checkInitialized("decodeFrame");
    try {
        size_t count = std::visit(Overloaded{
            [](std::monostate&) -> size_t { return 0; },
            [&](auto& decoder) -> size_t { return decoder.decodeFrame(data, size, output, capacity); }
        }, m_decoder);
        return finish(output, count);
    } catch (const DecoderException& e) {
        DEBUG_LOG_LAZY("codec", "CodecDecoder::decodeFrame() ", codecName(), " frame failed: ",
                       e.getErrorName(), ": ", e.what(), " [", Debug::hexDump(data, size), "]");
        finish(output, std::min(e.getSamplesWritten(), capacity));
        throw;
    }
}

size_t CodecDecoder::decodeFrame(const std::vector<uint8_t>& frame, std::vector<float>& output)
{
    if (output.size() < maxFrameSamples()) {
        output.resize(maxFrameSamples());
    }
    return decodeFrame(frame.data(), frame.size(), output.data(), output.size());
}

size_t CodecDecoder::decodeLost(float* output, size_t capacity)
{
    checkInitialized("decodeLost");
    size_t count = std::visit(Overloaded{
        [](std::monostate&) -> size_t { return 0; },
        [&](auto& decoder) -> size_t { return decoder.decodeLost(output, capacity); }
    }, m_decoder);
    Debug::log("codec", "CodecDecoder::decodeLost() ", codecName(), " wrote ", count, " samples");
    return finish(output, count);
}

void CodecDecoder::reset()
{
    checkInitialized("reset");
    std::visit(Overloaded{
        [](std::monostate&) {},
        [](auto& decoder) { decoder.reset(); }
    }, m_decoder);
}

void CodecDecoder::deinit()
{
    m_decoder.emplace<std::monostate>();
    Debug::log("codec", "CodecDecoder::deinit() ", codecName());
}

unsigned CodecDecoder::sampleRate() const
{
    checkInitialized("sampleRate");
    return std::visit(Overloaded{
        [](const std::monostate&) -> unsigned { return 0; },
        [](const auto& decoder) -> unsigned { return decoder.sampleRate(); }
    }, m_decoder);
}

unsigned CodecDecoder::channels() const
{
    checkInitialized("channels");
    return std::visit(Overloaded{
        [](const std::monostate&) -> unsigned { return 0; },
        [](const auto& decoder) -> unsigned { return decoder.channels(); }
    }, m_decoder);
}

size_t CodecDecoder::maxFrameSamples() const
{
    checkInitialized("maxFrameSamples");
    return std::visit(Overloaded{
        [](const std::monostate&) -> size_t { return 0; },
        [](const auto& decoder) -> size_t { return decoder.maxFrameSamples(); }
    }, m_decoder);
}

unsigned CodecDecoder::preSkip() const
{
    if (const auto* opus = std::get_if<Opus::OpusDecoder>(&m_decoder)) {
        return opus->preSkip();
    }
    return 0;
}

void CodecDecoder::toInt16(const float* input, int16_t* output, size_t count)
{
    for (size_t i = 0; i < count; ++i) {
        // NaN would reach the integer conversion untouched by the clamp
        if (std::isnan(input[i])) {
            output[i] = 0;
            continue;
        }
        float scaled = std::nearbyint(input[i] * 32768.0f);
        output[i] = static_cast<int16_t>(std::clamp(scaled, -32768.0f, 32767.0f));
    }
}

std::vector<int16_t> CodecDecoder::toInt16(const std::vector<float>& input)
{
    std::vector<int16_t> output(input.size());
    toInt16(input.data(), output.data(), input.size());
    return output;
}

} // namespace Codec
} // namespace PsyDec
