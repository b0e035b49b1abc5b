/*
 * test_opus_decoder.cpp - Unit tests for the Opus decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_utils.h"
#include "RangeEncoder.h"

#ifdef HAVE_OPUS
#include <opus/opus.h>
#endif

using namespace PsyDec;
using namespace PsyDec::Codec::Opus;
using namespace TestFramework;
using TestUtil::RangeEncoder;

namespace {

// TOC bytes, code 0
constexpr uint8_t kCeltFb20Mono = 31 << 3;
constexpr uint8_t kCeltFb20Stereo = (31 << 3) | 0x04;
constexpr uint8_t kSilkWb20Mono = 9 << 3;
constexpr uint8_t kSilkWb60Mono = 11 << 3;
constexpr uint8_t kHybridSwb20Mono = 13 << 3;

// Range coded frame whose first symbol is the CELT silence flag
const std::vector<uint8_t> kSilence = { 0xFF, 0xFF };

std::vector<uint8_t> packet(uint8_t toc, const std::vector<uint8_t>& payload)
{
    std::vector<uint8_t> p;
    p.push_back(toc);
    p.insert(p.end(), payload.begin(), payload.end());
    return p;
}

std::vector<uint8_t> randomPayload(std::mt19937& rng, size_t size)
{
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<uint8_t> out(size);
    for (auto& b : out) {
        b = static_cast<uint8_t>(byte(rng));
    }
    return out;
}

std::vector<uint8_t> opusHead(unsigned channels, unsigned pre_skip, int16_t gain_q8, unsigned family)
{
    std::vector<uint8_t> h = {'O', 'p', 'u', 's', 'H', 'e', 'a', 'd', 1};
    h.push_back(static_cast<uint8_t>(channels));
    h.push_back(static_cast<uint8_t>(pre_skip & 0xFF));
    h.push_back(static_cast<uint8_t>(pre_skip >> 8));
    const uint32_t rate = 48000;
    for (unsigned i = 0; i < 4; ++i) {
        h.push_back(static_cast<uint8_t>(rate >> (8 * i)));
    }
    h.push_back(static_cast<uint8_t>(gain_q8 & 0xFF));
    h.push_back(static_cast<uint8_t>((gain_q8 >> 8) & 0xFF));
    h.push_back(static_cast<uint8_t>(family));
    return h;
}

bool allFinite(const float* data, size_t count)
{
    for (size_t i = 0; i < count; ++i) {
        if (!std::isfinite(data[i])) {
            return false;
        }
    }
    return true;
}

double blockEnergy(const std::vector<float>& block)
{
    double rms = TestUtil::rms(block.data(), block.size());
    return rms * rms;
}

/**
 * Intra-coded 20 ms CELT frame whose coarse band energies track `target`
 * (log2 units over the band means). Everything after the energies decodes
 * from the zero padding, so the band shapes are arbitrary but unit-norm.
 */
std::vector<uint8_t> celtEnergyFrame(const std::vector<float>& target, size_t bytes)
{
    RangeEncoder enc(bytes);
    enc.encodeBitLogp(false, 15);   // silence
    enc.encodeBitLogp(false, 1);    // postfilter
    enc.encodeBitLogp(false, 3);    // transient
    enc.encodeBitLogp(true, 3);     // intra
    const uint8_t* prob = Tables::kEnergyProbModel[3][1];
    float prev = 0.0f;
    for (int i = 0; i < Tables::kNbEBands; ++i) {
        const int q = static_cast<int>(std::lround(target[i] - prev));
        enc.encodeLaplace(q, static_cast<unsigned>(prob[2 * i]) << 7, prob[2 * i + 1] << 6);
        prev += static_cast<float>(q) - Tables::kBetaIntra * static_cast<float>(q);
    }
    return enc.finish();
}

/**
 * 20 ms wideband voiced SILK frame with no excitation pulses. The
 * excitation is then the quantization offset with pseudo-random signs, so
 * any periodicity in the output comes from the long-term predictor.
 */
std::vector<uint8_t> voicedSilkFrame(int lag, size_t bytes)
{
    const int gain_index = 45;
    const int cb1_index = 0;
    RangeEncoder enc(bytes);
    enc.encodeBitLogp(true, 1);     // voice activity
    enc.encodeBitLogp(false, 1);    // no LBRR
    enc.encodeIcdf(2, Tables::kTypeOffsetVadIcdf, 8);    // voiced, low offset
    enc.encodeIcdf(gain_index >> 3, Tables::kGainIcdf[2], 8);
    enc.encodeIcdf(gain_index & 7, Tables::kUniform8Icdf, 8);
    for (int k = 1; k < 4; ++k) {
        enc.encodeIcdf(4, Tables::kDeltaGainIcdf, 8);    // same gain
    }
    enc.encodeIcdf(cb1_index, Tables::kNlsfCb1IcdfWb[1], 8);
    for (int i = 0; i < 8; ++i) {
        const uint8_t entry = Tables::kNlsfCb2SelectWb[cb1_index][i];
        enc.encodeIcdf(4, Tables::kNlsfCb2IcdfWb[(entry >> 1) & 7], 8);   // zero residual
        enc.encodeIcdf(4, Tables::kNlsfCb2IcdfWb[(entry >> 5) & 7], 8);
    }
    enc.encodeIcdf(4, Tables::kNlsfInterpolationFactorIcdf, 8);
    const int lag_index = lag - 32;
    enc.encodeIcdf(lag_index / 8, Tables::kPitchLagIcdf, 8);
    enc.encodeIcdf(lag_index % 8, Tables::kUniform8Icdf, 8);
    enc.encodeIcdf(0, Tables::kPitchContourIcdf, 8);    // same lag in every subframe
    enc.encodeIcdf(1, Tables::kLtpPerIndexIcdf, 8);
    for (int k = 0; k < 4; ++k) {
        enc.encodeIcdf(11, Tables::kLtpGainIcdf1, 8);   // taps centred on the lag
    }
    enc.encodeIcdf(0, Tables::kLtpScaleIcdf, 8);
    enc.encodeIcdf(0, Tables::kUniform4Icdf, 8);        // seed
    enc.encodeIcdf(0, Tables::kRateLevelsIcdf[1], 8);
    for (int block = 0; block < 20; ++block) {
        enc.encodeIcdf(0, Tables::kPulsesPerBlockIcdf[0], 8);
    }
    return enc.finish();
}

} // namespace

// Range decoder

void test_range_decoder_primitives()
{
    static const uint8_t icdf[] = {200, 120, 40, 0};

    RangeEncoder enc(64);
    enc.encodeBitLogp(true, 1);
    enc.encodeBitLogp(false, 15);
    enc.encodeIcdf(2, icdf, 8);
    enc.encodeUInt(1234, 5000);
    enc.encodeUInt(3, 7);
    enc.encodeBits(0x2A, 6);
    enc.encodeBitLogp(true, 3);
    enc.encodeIcdf(0, icdf, 8);
    enc.encodeUInt(4999, 5000);
    enc.encodeIcdf(3, icdf, 8);
    std::vector<uint8_t> bytes = enc.finish();

    RangeDecoder rd(bytes.data(), bytes.size());
    ASSERT_TRUE(rd.decodeBitLogp(1), "bit logp 1");
    ASSERT_FALSE(rd.decodeBitLogp(15), "bit logp 15");
    ASSERT_EQUALS(2, rd.decodeIcdf(icdf, 8), "icdf symbol");
    ASSERT_EQUALS(1234u, rd.decodeUInt(5000), "uint with raw bits");
    ASSERT_EQUALS(3u, rd.decodeUInt(7), "small uint");
    ASSERT_EQUALS(0x2Au, rd.decodeBits(6), "raw bits");
    ASSERT_TRUE(rd.decodeBitLogp(3), "bit logp 3");
    ASSERT_EQUALS(0, rd.decodeIcdf(icdf, 8), "first icdf symbol");
    ASSERT_EQUALS(4999u, rd.decodeUInt(5000), "largest uint");
    ASSERT_EQUALS(3, rd.decodeIcdf(icdf, 8), "last icdf symbol");
    ASSERT_FALSE(rd.hasError(), "No decoder error");
    ASSERT_TRUE(rd.tell() <= static_cast<int>(8 * bytes.size()), "tell within the frame");
}

void test_range_decoder_tell()
{
    std::vector<uint8_t> zeros(8, 0);
    RangeDecoder rd(zeros.data(), zeros.size());
    ASSERT_EQUALS(1, rd.tell(), "One bit is consumed by initialisation");
    ASSERT_TRUE(rd.tellFrac() >= 8u, "tellFrac counts eighth bits");

    // Reading past the end yields zeros, never an exception
    for (int i = 0; i < 40; ++i) {
        rd.decodeBits(8);
    }
    ASSERT_EQUALS(0u, rd.decodeBits(8), "Bits past the end are zero");

    RangeDecoder shrunk(zeros.data(), zeros.size());
    shrunk.shrink(3);
    ASSERT_EQUALS(size_t(5), shrunk.storage(), "shrink drops trailing bytes");
    shrunk.shrink(100);
    ASSERT_EQUALS(size_t(0), shrunk.storage(), "shrink stops at zero");
}

// Header and framing

void test_toc_parsing()
{
    OpusToc t = OpusToc::parse(0 << 3);
    ASSERT_TRUE(t.mode == OpusMode::SILK_ONLY, "config 0 is SILK");
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::NARROWBAND, "config 0 is narrowband");
    ASSERT_EQUALS(480u, t.frame_size, "config 0 is 10 ms");

    t = OpusToc::parse(11 << 3);
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::WIDEBAND, "config 11 is wideband");
    ASSERT_EQUALS(2880u, t.frame_size, "config 11 is 60 ms");

    t = OpusToc::parse(12 << 3);
    ASSERT_TRUE(t.mode == OpusMode::HYBRID, "config 12 is hybrid");
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::SUPERWIDEBAND, "config 12 is superwideband");
    ASSERT_EQUALS(480u, t.frame_size, "config 12 is 10 ms");

    t = OpusToc::parse(15 << 3);
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::FULLBAND, "config 15 is fullband");
    ASSERT_EQUALS(960u, t.frame_size, "config 15 is 20 ms");

    t = OpusToc::parse((16 << 3) | 0x04 | 0x02);
    ASSERT_TRUE(t.mode == OpusMode::CELT_ONLY, "config 16 is CELT");
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::NARROWBAND, "config 16 is narrowband");
    ASSERT_EQUALS(120u, t.frame_size, "config 16 is 2.5 ms");
    ASSERT_TRUE(t.stereo, "stereo flag");
    ASSERT_EQUALS(2u, t.code, "frame count code");

    t = OpusToc::parse(20 << 3);
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::WIDEBAND, "CELT has no mediumband");

    t = OpusToc::parse(31 << 3);
    ASSERT_TRUE(t.bandwidth == OpusBandwidth::FULLBAND, "config 31 is fullband");
    ASSERT_EQUALS(960u, t.frame_size, "config 31 is 20 ms");
}

void test_packet_framing()
{
    std::vector<uint8_t> code0 = packet(kCeltFb20Mono, {1, 2, 3});
    OpusPacket p = OpusPacket::parse(code0.data(), code0.size());
    ASSERT_EQUALS(size_t(1), p.frames.size(), "code 0 has one frame");
    ASSERT_EQUALS(size_t(3), p.frames[0].size, "code 0 frame size");

    std::vector<uint8_t> code1 = packet(kCeltFb20Mono | 1, {1, 2, 3, 4});
    p = OpusPacket::parse(code1.data(), code1.size());
    ASSERT_EQUALS(size_t(2), p.frames.size(), "code 1 has two frames");
    ASSERT_EQUALS(size_t(2), p.frames[1].size, "code 1 frames are equal");
    ASSERT_EQUALS(3, p.frames[1].data[0], "second frame starts after the first");
    ASSERT_EQUALS(1920u, p.samples(), "two 20 ms frames");

    std::vector<uint8_t> code2 = packet(kCeltFb20Mono | 2, {1, 9, 8, 7, 6});
    p = OpusPacket::parse(code2.data(), code2.size());
    ASSERT_EQUALS(size_t(1), p.frames[0].size, "code 2 first length");
    ASSERT_EQUALS(size_t(3), p.frames[1].size, "code 2 second length");

    // Code 3, CBR, three frames and two bytes of padding
    std::vector<uint8_t> cbr = packet(kCeltFb20Mono | 3, {0x43, 2, 1, 1, 2, 2, 3, 3, 0, 0});
    p = OpusPacket::parse(cbr.data(), cbr.size());
    ASSERT_EQUALS(size_t(3), p.frames.size(), "code 3 frame count");
    ASSERT_EQUALS(size_t(2), p.frames[2].size, "padding excluded from frames");
    ASSERT_EQUALS(3, p.frames[2].data[0], "third frame data");

    // Code 3, VBR, two frames
    std::vector<uint8_t> vbr = packet(kCeltFb20Mono | 3, {0x82, 1, 0xAB, 0xCD, 0xEF});
    p = OpusPacket::parse(vbr.data(), vbr.size());
    ASSERT_EQUALS(size_t(1), p.frames[0].size, "VBR first length");
    ASSERT_EQUALS(size_t(2), p.frames[1].size, "VBR last frame takes the rest");

    // Two-byte frame length: 252 + 4 * 1 = 256
    std::vector<uint8_t> long2(1 + 2 + 256 + 10, 0);
    long2[0] = kCeltFb20Mono | 2;
    long2[1] = 252;
    long2[2] = 1;
    p = OpusPacket::parse(long2.data(), long2.size());
    ASSERT_EQUALS(size_t(256), p.frames[0].size, "two-byte frame length");
    ASSERT_EQUALS(size_t(10), p.frames[1].size, "remainder");
}

void test_packet_framing_errors()
{
    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [] {
        OpusPacket::parse(nullptr, 0);
    }, "Empty packet");

    std::vector<uint8_t> odd = packet(kCeltFb20Mono | 1, {1, 2, 3});
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&odd] {
        OpusPacket::parse(odd.data(), odd.size());
    }, "Code 1 odd payload");

    std::vector<uint8_t> no_frames = packet(kCeltFb20Mono | 3, {0x00});
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&no_frames] {
        OpusPacket::parse(no_frames.data(), no_frames.size());
    }, "Code 3 with zero frames");

    // Seven 20 ms frames exceed 120 ms
    std::vector<uint8_t> too_long = packet(kCeltFb20Mono | 3, {0x07, 1, 1, 1, 1, 1, 1, 1});
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&too_long] {
        OpusPacket::parse(too_long.data(), too_long.size());
    }, "Packet longer than 120 ms");

    std::vector<uint8_t> huge(1 + OpusPacket::MAX_FRAME_BYTES + 1, 0);
    huge[0] = kCeltFb20Mono;
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&huge] {
        OpusPacket::parse(huge.data(), huge.size());
    }, "Frame over 1275 bytes");

    std::vector<uint8_t> overrun = packet(kCeltFb20Mono | 2, {10, 1, 2});
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&overrun] {
        OpusPacket::parse(overrun.data(), overrun.size());
    }, "Code 2 length past the end");
}

void test_opus_head()
{
    OpusHead head = OpusHead::parse(opusHead(2, 312, 256, 0));
    ASSERT_EQUALS(2u, head.channels, "channels");
    ASSERT_EQUALS(312u, head.pre_skip, "pre_skip");
    ASSERT_EQUALS(48000u, head.input_sample_rate, "input rate");
    ASSERT_NEAR(std::pow(10.0f, 1.0f / 20.0f), head.outputGain(), 1e-5f, "1 dB output gain");

    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        OpusHead::parse(opusHead(2, 0, 0, 1));
    }, "Mapping family 1");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        OpusHead::parse(opusHead(3, 0, 0, 0));
    }, "Three channels in family 0");
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        std::vector<uint8_t> bad = opusHead(1, 0, 0, 0);
        bad[0] = 'X';
        OpusHead::parse(bad);
    }, "Bad magic");
}

// Decoding

void test_celt_silence_frame()
{
    DecoderConfig config;
    for (unsigned channels = 1; channels <= 2; ++channels) {
        OpusDecoder decoder(channels, config);
        std::vector<float> out(decoder.maxFrameSamples());
        std::vector<uint8_t> p = packet(channels == 2 ? kCeltFb20Stereo : kCeltFb20Mono, kSilence);
        size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
        ASSERT_EQUALS(size_t(960) * channels, n, "20 ms at 48 kHz is 960 samples per channel");
        ASSERT_TRUE(TestUtil::maxAbs(out.data(), n) < 1e-6f, "Silence decodes to zeros");
        ASSERT_TRUE(decoder.lastMode() == OpusMode::CELT_ONLY, "CELT-only frame");
    }
}

void test_celt_band_energy()
{
    // Band 10 is 2.4 to 2.8 kHz, band 15 is 4.8 to 5.6 kHz
    const int bands[2] = {10, 15};
    for (int raised : bands) {
        std::vector<float> target(Tables::kNbEBands, -8.0f);
        target[raised] = 6.0f;
        std::vector<uint8_t> p = packet(kCeltFb20Mono, celtEnergyFrame(target, 100));

        OpusDecoder decoder(1, DecoderConfig());
        std::vector<float> out(3 * 960);
        for (int i = 0; i < 3; ++i) {
            size_t n = decoder.decodeFrame(p.data(), p.size(), out.data() + i * 960, 960);
            ASSERT_EQUALS(size_t(960), n, "20 ms CELT frame");
        }
        ASSERT_TRUE(decoder.lastMode() == OpusMode::CELT_ONLY, "CELT-only frame");

        const float* tail = out.data() + 960;
        ASSERT_TRUE(TestUtil::rms(tail, 1920) > 1e-4, "Raised band is audible");
        const double low = Tables::kEBands[raised] * 200.0;
        const double high = Tables::kEBands[raised + 1] * 200.0;
        double share = TestUtil::bandEnergyShare(tail, 1920, 48000.0, low - 100.0, high + 100.0);
        ASSERT_TRUE(share > 0.9, "Band " + std::to_string(raised) + " holds " + std::to_string(share));
    }
}

void test_silk_voiced_pitch()
{
    // 100 samples at 16 kHz, 300 at the 48 kHz output
    const int lag = 100;
    std::vector<uint8_t> p = packet(kSilkWb20Mono, voicedSilkFrame(lag, 60));

    OpusDecoder decoder(1, DecoderConfig());
    std::vector<float> out(960);
    for (int i = 0; i < 5; ++i) {
        size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
        ASSERT_EQUALS(size_t(960), n, "20 ms SILK frame");
    }
    ASSERT_TRUE(decoder.lastMode() == OpusMode::SILK_ONLY, "SILK-only frame");
    ASSERT_TRUE(allFinite(out.data(), out.size()), "Finite output");
    ASSERT_TRUE(TestUtil::rms(out.data(), out.size()) > 1e-3, "Voiced frame is audible");

    size_t best_lag = 0;
    double best = -1.0;
    for (size_t candidate = 150; candidate <= 450; ++candidate) {
        double r = TestUtil::normalizedCorrelation(out.data(), out.size(), candidate);
        if (r > best) {
            best = r;
            best_lag = candidate;
        }
    }
    ASSERT_NEAR(300, best_lag, 3, "Period follows the coded pitch lag");
    ASSERT_TRUE(best > 0.5, "Strongly periodic, correlation " + std::to_string(best));
}

void test_multi_frame_packet()
{
    DecoderConfig config;
    OpusDecoder decoder(1, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> p = packet(kCeltFb20Mono | 1, {0xFF, 0xFF, 0xFF, 0xFF});
    size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
    ASSERT_EQUALS(size_t(1920), n, "Two frames per packet");

    std::vector<float> small(100);
    ASSERT_THROWS(decoder.decodeFrame(p.data(), p.size(), small.data(), small.size()),
                  "Undersized output buffer");
}

void test_silk_frames()
{
    DecoderConfig config;
    OpusDecoder decoder(1, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::mt19937 rng(1234);

    for (int i = 0; i < 20; ++i) {
        std::vector<uint8_t> p = packet(kSilkWb20Mono, randomPayload(rng, 40));
        size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
        ASSERT_EQUALS(size_t(960), n, "20 ms SILK frame");
        ASSERT_TRUE(allFinite(out.data(), n), "SILK output is finite");
        ASSERT_TRUE(TestUtil::maxAbs(out.data(), n) <= 1.0f, "SILK output is 16-bit scaled");
        ASSERT_TRUE(decoder.lastMode() == OpusMode::SILK_ONLY, "SILK-only frame");
    }

    std::vector<uint8_t> p = packet(kSilkWb60Mono, randomPayload(rng, 120));
    size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
    ASSERT_EQUALS(size_t(2880), n, "60 ms SILK frame");
    ASSERT_TRUE(allFinite(out.data(), n), "60 ms output is finite");
}

void test_stereo_silk_to_mono_output()
{
    DecoderConfig config;
    OpusDecoder mono(1, config);
    OpusDecoder stereo(2, config);
    std::vector<float> out(stereo.maxFrameSamples());
    std::mt19937 rng(99);

    for (int i = 0; i < 10; ++i) {
        std::vector<uint8_t> p = packet(kSilkWb20Mono | 0x04, randomPayload(rng, 60));
        size_t n = mono.decodeFrame(p.data(), p.size(), out.data(), out.size());
        ASSERT_EQUALS(size_t(960), n, "Stereo stream on a mono decoder");
        n = stereo.decodeFrame(p.data(), p.size(), out.data(), out.size());
        ASSERT_EQUALS(size_t(1920), n, "Stereo stream on a stereo decoder");
        ASSERT_TRUE(allFinite(out.data(), n), "Finite stereo output");
    }
}

void test_random_frames_are_survivable()
{
    DecoderConfig config;
    OpusDecoder decoder(2, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::mt19937 rng(42);
    const uint8_t tocs[] = {kCeltFb20Mono, kCeltFb20Stereo, kHybridSwb20Mono, kSilkWb20Mono, kHybridSwb20Mono | 0x04,
                            static_cast<uint8_t>(16 << 3), static_cast<uint8_t>(29 << 3)};

    for (int i = 0; i < 60; ++i) {
        uint8_t toc = tocs[i % (sizeof(tocs) / sizeof(tocs[0]))];
        std::vector<uint8_t> p = packet(toc, randomPayload(rng, 20 + static_cast<size_t>(i) * 3));
        size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
        ASSERT_EQUALS(static_cast<size_t>(OpusToc::parse(toc).frame_size) * 2, n, "Frame size follows the TOC");
        ASSERT_TRUE(allFinite(out.data(), n), "Finite output for arbitrary payloads");
    }
}

void test_output_gain()
{
    DecoderConfig config;
    OpusDecoder plain(OpusHead::parse(opusHead(1, 0, 0, 0)), config);
    OpusDecoder boosted(OpusHead::parse(opusHead(1, 0, 6 * 256, 0)), config);
    std::vector<float> a(plain.maxFrameSamples());
    std::vector<float> b(boosted.maxFrameSamples());
    std::mt19937 rng(7);

    for (int i = 0; i < 5; ++i) {
        std::vector<uint8_t> p = packet(kSilkWb20Mono, randomPayload(rng, 40));
        size_t n = plain.decodeFrame(p.data(), p.size(), a.data(), a.size());
        boosted.decodeFrame(p.data(), p.size(), b.data(), b.size());
        float gain = std::pow(10.0f, 6.0f / 20.0f);
        for (size_t j = 0; j < n; ++j) {
            ASSERT_NEAR(a[j] * gain, b[j], 1e-4f, "Output gain scales every sample");
        }
    }
}

// Concealment

void test_lost_before_any_packet()
{
    DecoderConfig config;
    OpusDecoder decoder(2, config);
    std::vector<float> out(decoder.maxFrameSamples(), 1.0f);
    size_t n = decoder.decodeLost(out.data(), out.size());
    ASSERT_EQUALS(size_t(1920), n, "Default concealment is 20 ms");
    ASSERT_TRUE(TestUtil::maxAbs(out.data(), n) == 0.0f, "Nothing to repeat yet");
}

void test_short_frame_is_concealed()
{
    DecoderConfig config;
    OpusDecoder decoder(1, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> p = {kCeltFb20Mono, 0x00};
    size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
    ASSERT_EQUALS(size_t(960), n, "Concealed frame is full size");
    ASSERT_EQUALS(1u, decoder.concealment().lostFrames(), "One byte frame counts as lost");
    ASSERT_EQUALS(0u, decoder.finalRange(), "No range state after concealment");
}

void test_voiced_concealment()
{
    DecoderConfig config;
    OpusConcealment plc(1, config);
    const double freq = 200.0;          // 240 sample period
    for (size_t block = 0; block < 3; ++block) {
        std::vector<float> pcm = TestUtil::sine(freq, 48000.0, 960, 0.5, block * 960);
        plc.update(pcm.data(), 960, 0);
    }
    std::vector<float> expected = TestUtil::sine(freq, 48000.0, 960, 0.5, 2880);

    std::vector<float> block(960);
    plc.conceal(block.data(), 960);
    ASSERT_TRUE(plc.voiced(), "A steady tone is voiced");

    double xy = 0.0, xx = 0.0, yy = 0.0;
    for (size_t i = 0; i < block.size(); ++i) {
        xy += static_cast<double>(block[i]) * expected[i];
        xx += static_cast<double>(block[i]) * block[i];
        yy += static_cast<double>(expected[i]) * expected[i];
    }
    ASSERT_TRUE(xy / std::sqrt(xx * yy) > 0.99, "Concealment continues the waveform");
    ASSERT_TRUE(blockEnergy(block) <= blockEnergy(expected) + 1e-6, "No louder than the decoded signal");
}

void test_concealment_energy_and_silence()
{
    DecoderConfig config;
    config.plc_fade_frames = 5;

    std::mt19937 rng(5);
    std::uniform_real_distribution<float> noise(-0.3f, 0.3f);

    for (int voiced = 0; voiced < 2; ++voiced) {
        OpusConcealment plc(1, config);
        for (size_t block = 0; block < 3; ++block) {
            std::vector<float> pcm = TestUtil::sine(310.0, 48000.0, 960, 0.5, block * 960);
            if (!voiced) {
                for (auto& s : pcm) {
                    s = noise(rng);
                }
            }
            plc.update(pcm.data(), 960, 0);
        }

        double previous = 1e9;
        std::vector<float> block(960);
        for (unsigned lost = 1; lost <= 8; ++lost) {
            plc.conceal(block.data(), 960);
            double energy = blockEnergy(block);
            ASSERT_TRUE(energy <= previous + 1e-9, "Concealed energy never increases");
            previous = energy;
            if (lost > config.plc_fade_frames) {
                ASSERT_TRUE(TestUtil::maxAbs(block.data(), block.size()) == 0.0f,
                            "Silent once the fade is over");
            }
        }
        ASSERT_EQUALS(8u, plc.lostFrames(), "Loss count");
        ASSERT_EQUALS(voiced != 0, plc.voiced(), "Voicing decision");
    }
}

void test_concealment_fade_length_follows_config()
{
    DecoderConfig config;
    config.plc_fade_frames = 2;
    OpusConcealment plc(2, config);
    std::vector<float> pcm(1920);
    for (size_t i = 0; i < 960; ++i) {
        pcm[2 * i] = pcm[2 * i + 1] = static_cast<float>(0.4 * std::sin(2.0 * M_PI * 250.0 * i / 48000.0));
    }
    plc.update(pcm.data(), 960, 0);

    std::vector<float> block(1920);
    plc.conceal(block.data(), 960);
    ASSERT_TRUE(TestUtil::maxAbs(block.data(), block.size()) > 0.0f, "First loss is audible");
    plc.conceal(block.data(), 960);
    plc.conceal(block.data(), 960);
    ASSERT_TRUE(TestUtil::maxAbs(block.data(), block.size()) == 0.0f, "Silent after two frames");
    ASSERT_NEAR(0.0f, plc.fadeGain(), 1e-9f, "Fade gain reached zero");
}

void test_recovery_crossfade()
{
    DecoderConfig config;
    OpusConcealment plc(1, config);
    std::vector<float> pcm = TestUtil::sine(200.0, 48000.0, 960, 0.5);
    plc.update(pcm.data(), 960, 240);

    std::vector<float> block(960);
    for (int i = 0; i < 8; ++i) {
        plc.conceal(block.data(), 960);
    }

    // A cosine starts at full amplitude; the first recovered block must not
    std::vector<float> resumed(960);
    for (size_t i = 0; i < resumed.size(); ++i) {
        resumed[i] = static_cast<float>(0.5 * std::cos(2.0 * M_PI * 300.0 * i / 48000.0));
    }
    std::vector<float> reference = resumed;
    plc.update(resumed.data(), 960, 0);

    ASSERT_TRUE(std::fabs(resumed[0]) < 0.05f, "Recovery starts from the concealed level");
    ASSERT_NEAR(reference[600], resumed[600], 1e-4f, "Full level once the ramp is over");
    ASSERT_EQUALS(0u, plc.lostFrames(), "Loss count cleared");
    ASSERT_NEAR(1.0f, plc.fadeGain(), 1e-9f, "Fade gain restored");
}

void test_decoder_concealment_energy()
{
    DecoderConfig config;
    OpusDecoder decoder(1, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::mt19937 rng(11);
    for (int i = 0; i < 10; ++i) {
        std::vector<uint8_t> p = packet(kSilkWb20Mono, randomPayload(rng, 50));
        decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
    }

    double previous = 1e30;
    for (unsigned lost = 1; lost <= 8; ++lost) {
        size_t n = decoder.decodeLost(out.data(), out.size());
        ASSERT_EQUALS(size_t(960), n, "Concealment keeps the last packet duration");
        std::vector<float> block(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(n));
        double energy = blockEnergy(block);
        ASSERT_TRUE(energy <= previous + 1e-12, "Energy never increases");
        previous = energy;
        if (lost > config.plc_fade_frames) {
            ASSERT_TRUE(TestUtil::maxAbs(block.data(), block.size()) == 0.0f, "Silence within the fade length");
        }
    }

    // Packets resume normally
    std::vector<uint8_t> p = packet(kSilkWb20Mono, randomPayload(rng, 50));
    size_t n = decoder.decodeFrame(p.data(), p.size(), out.data(), out.size());
    ASSERT_EQUALS(size_t(960), n, "Decoding resumes after concealment");
    ASSERT_EQUALS(0u, decoder.concealment().lostFrames(), "Out of concealment");
}

#ifdef HAVE_OPUS
void encodeAndCheck(int application, int bandwidth, int bitrate, const char* label)
{
    const int rate = 48000;
    int error = 0;
    OpusEncoder* enc = opus_encoder_create(rate, 1, application, &error);
    ASSERT_EQUALS(OPUS_OK, error, "opus_encoder_create");
    opus_encoder_ctl(enc, OPUS_SET_BITRATE(bitrate));
    if (bandwidth != OPUS_AUTO) {
        opus_encoder_ctl(enc, OPUS_SET_BANDWIDTH(bandwidth));
    }

    std::vector<float> input = TestUtil::sine(440.0, rate, rate, 0.5);
    DecoderConfig config;
    OpusDecoder decoder(1, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<float> pcm;
    std::vector<unsigned char> bytes(1500);
    for (size_t pos = 0; pos + 960 <= input.size(); pos += 960) {
        opus_int32 len = opus_encode_float(enc, input.data() + pos, 960, bytes.data(),
                                           static_cast<opus_int32>(bytes.size()));
        ASSERT_TRUE(len > 0, "opus_encode_float");
        size_t n = decoder.decodeFrame(bytes.data(), static_cast<size_t>(len), out.data(), out.size());
        pcm.insert(pcm.end(), out.begin(), out.begin() + static_cast<std::ptrdiff_t>(n));
    }
    opus_encoder_destroy(enc);

    ASSERT_TRUE(pcm.size() >= 48000 - 960, "Most of a second decoded");
    double freq = TestUtil::dominantFrequency(pcm.data() + 9600, 9600, rate, 1, 1000.0);
    ASSERT_TRUE(std::fabs(freq - 440.0) <= 2.0, std::string(label) + ": 440 Hz tone");
    ASSERT_TRUE(TestUtil::rms(pcm.data() + 9600, 9600) > 0.1, std::string(label) + ": tone level");
}

void test_libopus_celt()
{
    encodeAndCheck(OPUS_APPLICATION_RESTRICTED_LOWDELAY, OPUS_AUTO, 64000, "CELT");
}

void test_libopus_silk()
{
    encodeAndCheck(OPUS_APPLICATION_VOIP, OPUS_BANDWIDTH_WIDEBAND, 16000, "SILK");
}

void test_libopus_hybrid()
{
    encodeAndCheck(OPUS_APPLICATION_VOIP, OPUS_BANDWIDTH_FULLBAND, 28000, "Hybrid");
}
#endif

int main(int argc, char* argv[])
{
    TestSuite suite("Opus Decoder Tests");

    suite.addTest("Range Decoder Primitives", test_range_decoder_primitives);
    suite.addTest("Range Decoder Bit Accounting", test_range_decoder_tell);
    suite.addTest("TOC Parsing", test_toc_parsing);
    suite.addTest("Packet Framing", test_packet_framing);
    suite.addTest("Packet Framing Errors", test_packet_framing_errors);
    suite.addTest("OpusHead", test_opus_head);
    suite.addTest("CELT Silence", test_celt_silence_frame);
    suite.addTest("CELT Band Energy", test_celt_band_energy);
    suite.addTest("Multi-frame Packet", test_multi_frame_packet);
    suite.addTest("SILK Frames", test_silk_frames);
    suite.addTest("SILK Voiced Pitch", test_silk_voiced_pitch);
    suite.addTest("Stereo Stream Channel Mapping", test_stereo_silk_to_mono_output);
    suite.addTest("Arbitrary Payloads", test_random_frames_are_survivable);
    suite.addTest("Output Gain", test_output_gain);
    suite.addTest("Lost Before First Packet", test_lost_before_any_packet);
    suite.addTest("Short Frame Concealed", test_short_frame_is_concealed);
    suite.addTest("Voiced Concealment", test_voiced_concealment);
    suite.addTest("Concealment Energy", test_concealment_energy_and_silence);
    suite.addTest("Concealment Fade Length", test_concealment_fade_length_follows_config);
    suite.addTest("Recovery Crossfade", test_recovery_crossfade);
    suite.addTest("Decoder Concealment", test_decoder_concealment_energy);
#ifdef HAVE_OPUS
    suite.addTest("libopus CELT 440 Hz", test_libopus_celt);
    suite.addTest("libopus SILK 440 Hz", test_libopus_silk);
    suite.addTest("libopus Hybrid 440 Hz", test_libopus_hybrid);
#endif

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
