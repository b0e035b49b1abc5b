/*
 * test_codec_decoder.cpp - Unit tests for the CodecDecoder facade
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_utils.h"

using namespace PsyDec;
using namespace PsyDec::Codec;
using namespace TestFramework;
using TestUtil::BitWriter;

namespace {

// Mono AAC-LC raw data block with no spectral data
std::vector<uint8_t> silentAacFrame()
{
    BitWriter w;
    w.write(0, 3);          // SCE
    w.write(0, 4);          // element_instance_tag
    w.write(100, 8);        // global_gain
    w.write(0, 1);          // ics_reserved_bit
    w.write(0, 2);          // ONLY_LONG_SEQUENCE
    w.write(0, 1);          // sine window
    w.write(0, 6);          // max_sfb
    w.write(0, 1);          // predictor_data_present
    w.write(0, 3);          // pulse, tns, gain control
    w.write(7, 3);          // END
    return w.finish();
}

std::vector<uint8_t> opusHead(unsigned channels, unsigned pre_skip, int16_t gain_q8)
{
    std::vector<uint8_t> h = {'O', 'p', 'u', 's', 'H', 'e', 'a', 'd', 1};
    h.push_back(static_cast<uint8_t>(channels));
    h.push_back(static_cast<uint8_t>(pre_skip & 0xFF));
    h.push_back(static_cast<uint8_t>(pre_skip >> 8));
    h.insert(h.end(), {0x80, 0xBB, 0x00, 0x00});       // 48000
    h.push_back(static_cast<uint8_t>(gain_q8 & 0xFF));
    h.push_back(static_cast<uint8_t>((gain_q8 >> 8) & 0xFF));
    h.push_back(0);
    return h;
}

} // namespace

void test_codec_names()
{
    ASSERT_TRUE(parseCodecType("mp3") == CodecType::MP3, "mp3");
    ASSERT_TRUE(parseCodecType("AAC") == CodecType::AAC, "case insensitive");
    ASSERT_TRUE(parseCodecType("vorbis") == CodecType::VORBIS, "vorbis");
    ASSERT_TRUE(parseCodecType("opus") == CodecType::OPUS, "opus");
    ASSERT_FALSE(parseCodecType("flac").has_value(), "unknown codec");
    ASSERT_EQUALS(std::string("opus"), std::string(codecTypeName(CodecType::OPUS)), "name");
}

void test_config_errors()
{
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        CodecDecoder::init(44000, 2, CodecProfile::mp3());
    }, "MP3 at 44 kHz");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        CodecDecoder::init(44100, 3, CodecProfile::mp3());
    }, "MP3 with three channels");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        CodecDecoder::init(44100, 2, CodecProfile::opus());
    }, "Opus at 44.1 kHz");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        CodecDecoder::init(48000, 1, CodecProfile::opus(opusHead(2, 0, 0)));
    }, "Channel count disagrees with OpusHead");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        CodecDecoder::init(44100, 2, CodecProfile::vorbis({}, {}, {}));
    }, "Vorbis without headers");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        auto asc = AAC::AudioSpecificConfig::make(44100, 2).serialize();
        CodecDecoder::init(48000, 2, CodecProfile::aac(asc));
    }, "Rate disagrees with AudioSpecificConfig");

    DecoderConfig bad;
    bad.plc_fade_frames = 0;
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&bad] {
        CodecDecoder::init(48000, 2, CodecProfile::opus(), bad);
    }, "Invalid DecoderConfig");
}

void test_queries()
{
    auto mp3 = CodecDecoder::init(44100, 2, CodecProfile::mp3());
    ASSERT_EQUALS(std::string("mp3"), std::string(mp3->codecName()), "codec name");
    ASSERT_EQUALS(44100u, mp3->sampleRate(), "MP3 rate");
    ASSERT_EQUALS(2u, mp3->channels(), "MP3 channels");
    ASSERT_EQUALS(size_t(2304), mp3->maxFrameSamples(), "1152 x 2");

    auto aac = CodecDecoder::init(0, 0, CodecProfile::aac(AAC::AudioSpecificConfig::make(48000, 1).serialize()));
    ASSERT_EQUALS(48000u, aac->sampleRate(), "Rate taken from the AudioSpecificConfig");
    ASSERT_EQUALS(1u, aac->channels(), "Channels taken from the AudioSpecificConfig");
    ASSERT_EQUALS(size_t(1024), aac->maxFrameSamples(), "AAC long frame");

    auto opus = CodecDecoder::init(48000, 0, CodecProfile::opus(opusHead(2, 312, 0)));
    ASSERT_EQUALS(2u, opus->channels(), "Channels from OpusHead");
    ASSERT_EQUALS(312u, opus->preSkip(), "Pre-skip from OpusHead");
    ASSERT_EQUALS(size_t(5760 * 2), opus->maxFrameSamples(), "120 ms of stereo");
    ASSERT_EQUALS(0u, mp3->preSkip(), "No pre-skip for MP3");
}

void test_aac_through_facade()
{
    auto decoder = CodecDecoder::init(44100, 1, CodecProfile::aac());
    std::vector<uint8_t> frame = silentAacFrame();
    std::vector<float> out;
    size_t n = decoder->decodeFrame(frame, out);
    ASSERT_EQUALS(size_t(1024), n, "AAC long frame is 1024 samples per channel");
    ASSERT_TRUE(TestUtil::maxAbs(out.data(), n) < 1e-6f, "Silent frame");
}

void test_opus_through_facade()
{
    auto decoder = CodecDecoder::init(48000, 2, CodecProfile::opus());
    std::vector<uint8_t> packet = {31 << 3, 0xFF, 0xFF};
    std::vector<float> out(decoder->maxFrameSamples());
    size_t n = decoder->decodeFrame(packet.data(), packet.size(), out.data(), out.size());
    ASSERT_EQUALS(size_t(1920), n, "20 ms at 48 kHz is 960 x channels");

    n = decoder->decodeLost(out.data(), out.size());
    ASSERT_EQUALS(size_t(1920), n, "Concealment is full size");
}

void test_lost_frame_is_silence()
{
    auto decoder = CodecDecoder::init(32000, 1, CodecProfile::mp3());
    std::vector<float> out(decoder->maxFrameSamples(), 0.25f);
    size_t n = decoder->decodeLost(out.data(), out.size());
    ASSERT_EQUALS(size_t(1152), n, "One MPEG-1 frame");
    ASSERT_TRUE(TestUtil::maxAbs(out.data(), n) == 0.0f, "Silence");
}

void test_output_is_clipped()
{
    std::mt19937 rng(3);
    std::uniform_int_distribution<int> byte(0, 255);

    for (int clip = 0; clip < 2; ++clip) {
        DecoderConfig config;
        config.clip_output = clip != 0;
        // +40 dB pushes ordinary speech-level output well past full scale
        auto decoder = CodecDecoder::init(48000, 1, CodecProfile::opus(opusHead(1, 0, 40 * 256)), config);
        std::vector<float> out(decoder->maxFrameSamples());
        float peak = 0.0f;
        for (int i = 0; i < 20; ++i) {
            std::vector<uint8_t> packet = {9 << 3};
            for (int j = 0; j < 60; ++j) {
                packet.push_back(static_cast<uint8_t>(byte(rng)));
            }
            size_t n = decoder->decodeFrame(packet.data(), packet.size(), out.data(), out.size());
            peak = std::max(peak, TestUtil::maxAbs(out.data(), n));
        }
        if (clip) {
            ASSERT_TRUE(peak <= 1.0f, "Clipped output stays in [-1, 1]");
        } else {
            ASSERT_TRUE(peak > 1.0f, "Unclipped output exceeds full scale");
        }
    }
}

void test_to_int16()
{
    std::vector<float> in = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 2.0f, -3.0f, 1.0f / 32768.0f};
    std::vector<int16_t> out = CodecDecoder::toInt16(in);
    ASSERT_EQUALS(0, out[0], "zero");
    ASSERT_EQUALS(16384, out[1], "half scale");
    ASSERT_EQUALS(-16384, out[2], "negative half scale");
    ASSERT_EQUALS(32767, out[3], "+1 saturates");
    ASSERT_EQUALS(-32768, out[4], "-1 is the most negative value");
    ASSERT_EQUALS(32767, out[5], "above full scale saturates");
    ASSERT_EQUALS(-32768, out[6], "below full scale saturates");
    ASSERT_EQUALS(1, out[7], "one LSB");

    std::vector<float> special = {std::numeric_limits<float>::quiet_NaN(), -std::numeric_limits<float>::quiet_NaN(),
                                  std::numeric_limits<float>::infinity(), -std::numeric_limits<float>::infinity()};
    std::vector<int16_t> converted = CodecDecoder::toInt16(special);
    ASSERT_EQUALS(0, converted[0], "NaN becomes silence");
    ASSERT_EQUALS(0, converted[1], "Negative NaN becomes silence");
    ASSERT_EQUALS(32767, converted[2], "+inf saturates");
    ASSERT_EQUALS(-32768, converted[3], "-inf saturates");
}

void test_reset_and_deinit()
{
    auto decoder = CodecDecoder::init(44100, 1, CodecProfile::aac());
    std::vector<uint8_t> frame = silentAacFrame();
    std::vector<float> out(decoder->maxFrameSamples());
    decoder->decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    decoder->reset();
    ASSERT_EQUALS(size_t(1024), decoder->decodeFrame(frame.data(), frame.size(), out.data(), out.size()),
                  "Decoding continues after reset");

    ASSERT_TRUE(decoder->isInitialized(), "Initialized");
    decoder->deinit();
    ASSERT_FALSE(decoder->isInitialized(), "Released");
    ASSERT_EQUALS(std::string("aac"), std::string(decoder->codecName()), "Codec still named");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&] {
        decoder->decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    }, "decodeFrame after deinit");
}

void test_bad_frame_leaves_decoder_usable()
{
    auto decoder = CodecDecoder::init(44100, 1, CodecProfile::aac());
    std::vector<float> out(decoder->maxFrameSamples());
    std::vector<uint8_t> frame = silentAacFrame();
    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        decoder->decodeFrame(frame.data(), 2, out.data(), out.size());
    }, "Truncated frame fails");

    ASSERT_EQUALS(size_t(1024), decoder->decodeFrame(frame.data(), frame.size(), out.data(), out.size()),
                  "Next frame decodes");
}

int main(int argc, char* argv[])
{
    TestSuite suite("CodecDecoder Facade Tests");

    suite.addTest("Codec Names", test_codec_names);
    suite.addTest("Configuration Errors", test_config_errors);
    suite.addTest("Queries", test_queries);
    suite.addTest("AAC Frame", test_aac_through_facade);
    suite.addTest("Opus Frame", test_opus_through_facade);
    suite.addTest("Lost Frame", test_lost_frame_is_silence);
    suite.addTest("Output Clipping", test_output_is_clipped);
    suite.addTest("16-bit Conversion", test_to_int16);
    suite.addTest("Reset and Deinit", test_reset_and_deinit);
    suite.addTest("Recovery After Bad Frame", test_bad_frame_leaves_decoder_usable);

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
