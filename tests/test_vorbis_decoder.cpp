/*
 * test_vorbis_decoder.cpp - Unit tests for the Vorbis I decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_utils.h"

#ifdef HAVE_VORBISENC
#include <vorbis/vorbisenc.h>
#endif

using namespace PsyDec;
using namespace PsyDec::Codec::Vorbis;
using namespace TestFramework;
using TestUtil::BitWriter;

namespace {

constexpr unsigned kRate = 8000;

void writeCodeword(BitWriter& w, uint32_t code, unsigned length)
{
    for (unsigned i = 0; i < length; ++i) {
        w.writeBit((code >> (length - 1 - i)) & 1u);
    }
}

std::vector<uint8_t> headerPrefix(uint8_t type)
{
    return {type, 'v', 'o', 'r', 'b', 'i', 's'};
}

std::vector<uint8_t> identificationHeader(unsigned channels, unsigned exp0, unsigned exp1)
{
    std::vector<uint8_t> h = headerPrefix(1);
    auto le32 = [&h](uint32_t v) {
        for (unsigned i = 0; i < 4; ++i) {
            h.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    };
    le32(0);
    h.push_back(static_cast<uint8_t>(channels));
    le32(kRate);
    le32(0);
    le32(64000);
    le32(0);
    h.push_back(static_cast<uint8_t>(exp0 | (exp1 << 4)));
    h.push_back(1);
    return h;
}

std::vector<uint8_t> commentHeader()
{
    std::vector<uint8_t> h = headerPrefix(3);
    const std::string vendor = "psydec test vectors";
    const std::string comment = "TITLE=Tone";
    auto le32 = [&h](uint32_t v) {
        for (unsigned i = 0; i < 4; ++i) {
            h.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    };
    le32(static_cast<uint32_t>(vendor.size()));
    h.insert(h.end(), vendor.begin(), vendor.end());
    le32(1);
    le32(static_cast<uint32_t>(comment.size()));
    h.insert(h.end(), comment.begin(), comment.end());
    h.push_back(1);
    return h;
}

uint32_t packFloat(float value)
{
    // Exact for small integers: mantissa 1 << 20, exponent adjusted
    if (value == 0.0f) {
        return 0;
    }
    uint32_t sign = value < 0 ? 0x80000000u : 0;
    float magnitude = std::fabs(value);
    int exponent = 768;
    while (magnitude >= 2.0f) {
        magnitude /= 2.0f;
        ++exponent;
    }
    uint32_t mantissa = static_cast<uint32_t>(magnitude * (1 << 20));
    return sign | (static_cast<uint32_t>(exponent) << 21) | mantissa;
}

/**
 * Setup with one floor 1 (no partitions, X = {0, 128}), one residue of
 * type `residue_type` over bins 0..127 in partitions of 8, a 1-bit
 * classbook and a 2-bit VQ book with values {-1, 0, 1, 2}. Mode 0 is
 * short, mode 1 long.
 */
std::vector<uint8_t> setupHeader(unsigned residue_type, unsigned channels = 1, bool coupled = false)
{
    BitWriter w(true);
    for (uint8_t b : headerPrefix(5)) {
        w.write(b, 8);
    }
    w.write(1, 8);              // two codebooks

    // Book 0: classbook, 2 entries, 1 bit each
    w.write(0x564342, 24);
    w.write(1, 16);
    w.write(2, 24);
    w.write(0, 1);              // unordered
    w.write(0, 1);              // not sparse
    w.write(0, 5);
    w.write(0, 5);
    w.write(0, 4);              // no lookup

    // Book 1: VQ, 4 entries, 2 bits each
    w.write(0x564342, 24);
    w.write(1, 16);
    w.write(4, 24);
    w.write(1, 1);              // ordered
    w.write(1, 5);              // first length 2
    w.write(4, 3);              // ilog(4) bits: 4 entries of length 2
    w.write(1, 4);              // lookup type 1
    w.write(packFloat(-1.0f), 32);
    w.write(packFloat(1.0f), 32);
    w.write(1, 4);              // 2 value bits
    w.write(0, 1);
    for (unsigned m = 0; m < 4; ++m) {
        w.write(m, 2);
    }

    w.write(0, 6);              // time transforms
    w.write(0, 16);

    w.write(0, 6);              // one floor
    w.write(1, 16);
    w.write(0, 5);              // no partitions
    w.write(0, 2);              // multiplier 1
    w.write(7, 4);              // range bits: X = {0, 128}

    w.write(0, 6);              // one residue
    w.write(residue_type, 16);
    w.write(0, 24);
    w.write(128, 24);
    w.write(7, 24);             // partition size 8
    w.write(1, 6);              // two classifications
    w.write(0, 8);              // classbook
    w.write(0, 3);              // class 0: no passes
    w.write(0, 1);
    w.write(1, 3);              // class 1: pass 0
    w.write(0, 1);
    w.write(1, 8);              // class 1 pass 0 book

    w.write(0, 6);              // one mapping
    w.write(0, 16);
    w.write(0, 1);              // one submap
    w.write(coupled ? 1 : 0, 1);
    if (coupled) {
        w.write(0, 8);          // one step
        w.write(0, PsyDec::Codec::Vorbis::ilog(channels - 1));
        w.write(1, PsyDec::Codec::Vorbis::ilog(channels - 1));
    }
    w.write(0, 2);
    w.write(0, 8);
    w.write(0, 8);
    w.write(0, 8);

    w.write(1, 6);              // two modes
    w.write(0, 1);
    w.write(0, 16);
    w.write(0, 16);
    w.write(0, 8);
    w.write(1, 1);
    w.write(0, 16);
    w.write(0, 16);
    w.write(0, 8);

    w.write(1, 1);              // framing
    return w.finish();
}

/**
 * @brief Audio packet with a flat floor and one residue spike.
 *
 * Every channel carries the same floor (Y = 200) and residue 1 at bin
 * `bin` (in partition bin / 8). Format 1 residues are coded per channel.
 */
std::vector<uint8_t> audioPacket(bool long_block, bool previous_long, bool next_long, unsigned bin,
                                 unsigned channels = 1, unsigned residue_type = 1)
{
    const unsigned n2 = long_block ? 128 : 64;
    BitWriter w(true);
    w.write(0, 1);
    w.write(long_block ? 1 : 0, 1);
    if (long_block) {
        w.write(previous_long ? 1 : 0, 1);
        w.write(next_long ? 1 : 0, 1);
    }
    for (unsigned ch = 0; ch < channels; ++ch) {
        w.write(1, 1);
        w.write(200, 8);
        w.write(200, 8);
    }

    const unsigned partitions = std::min(128u, n2 * (residue_type == 2 ? channels : 1)) / 8;
    const unsigned vectors = (residue_type == 2) ? 1 : channels;
    const unsigned spike = (residue_type == 2) ? bin * channels : bin;
    // Classwords of every vector come first, then each vector's entries
    for (unsigned p = 0; p < partitions; ++p) {
        const bool active = (p == spike / 8);
        for (unsigned v = 0; v < vectors; ++v) {
            writeCodeword(w, active ? 1 : 0, 1);
        }
        if (!active) {
            continue;
        }
        for (unsigned v = 0; v < vectors; ++v) {
            for (unsigned k = 0; k < 8; ++k) {
                // entries: 0 -> -1, 1 -> 0, 2 -> 1, 3 -> 2
                writeCodeword(w, (p * 8 + k == spike) ? 2 : 1, 2);
            }
        }
    }
    return w.finish();
}

VorbisDecoder makeDecoder(unsigned residue_type = 1, unsigned channels = 1, bool coupled = false)
{
    DecoderConfig config;
    return VorbisDecoder(identificationHeader(channels, 7, 8), commentHeader(),
                         setupHeader(residue_type, channels, coupled), config);
}

} // anonymous namespace

void test_ilog_and_float_unpack()
{
    ASSERT_EQUALS(0u, ilog(0), "ilog(0)");
    ASSERT_EQUALS(1u, ilog(1), "ilog(1)");
    ASSERT_EQUALS(3u, ilog(7), "ilog(7)");
    ASSERT_EQUALS(4u, ilog(8), "ilog(8)");
    ASSERT_TRUE(float32Unpack(packFloat(1.0f)) == 1.0f, "1.0 unpacks exactly");
    ASSERT_TRUE(float32Unpack(packFloat(-3.0f)) == -3.0f, "-3.0 unpacks exactly");
    ASSERT_EQUALS(4u, lookup1Values(16, 2), "16 entries in 2 dimensions");
    ASSERT_EQUALS(2u, lookup1Values(26, 3), "26 entries in 3 dimensions");
    ASSERT_EQUALS(81u, lookup1Values(81, 1), "One dimension is the entry count");
}

void test_codeword_assignment()
{
    // Lengths 2 4 4 4 4 2 3 3 give 00 0100 0101 0110 0111 10 110 111
    VorbisCodebook book = VorbisCodebook::fromLengths(1, {2, 4, 4, 4, 4, 2, 3, 3});
    const uint32_t codes[] = {0x0, 0x4, 0x5, 0x6, 0x7, 0x2, 0x6, 0x7};
    const unsigned lengths[] = {2, 4, 4, 4, 4, 2, 3, 3};

    BitWriter w(true);
    for (unsigned i = 0; i < 8; ++i) {
        writeCodeword(w, codes[i], lengths[i]);
    }
    std::vector<uint8_t> bytes = w.finish();
    IO::BitReader reader(bytes.data(), bytes.size(), IO::BitReader::BitOrder::LSB_FIRST);
    for (uint32_t i = 0; i < 8; ++i) {
        ASSERT_EQUALS(i, book.decodeScalar(reader), "Entry " + std::to_string(i));
    }
}

void test_overspecified_codebook()
{
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [] {
        VorbisCodebook::fromLengths(1, {1, 1, 1});
    }, "Three one-bit codewords");
}

void test_single_entry_codebook()
{
    VorbisCodebook book = VorbisCodebook::fromLengths(1, {0, 0, 1, 0});
    uint8_t data[] = {0x02};
    IO::BitReader reader(data, sizeof(data), IO::BitReader::BitOrder::LSB_FIRST);
    ASSERT_EQUALS(2u, book.decodeScalar(reader), "Bit 0 decodes the lone entry");
    ASSERT_EQUALS(2u, book.decodeScalar(reader), "Bit 1 decodes the lone entry");
}

/**
 * One ordered codebook in which every entry has the same codeword length,
 * followed by its lookup header and `multiplicands` values.
 */
std::vector<uint8_t> uniformCodebook(unsigned dimensions, unsigned entries, unsigned length,
                                     unsigned lookup_type, unsigned value_bits, unsigned multiplicands)
{
    BitWriter w(true);
    w.write(0x564342, 24);
    w.write(dimensions, 16);
    w.write(entries, 24);
    w.writeBit(true);               // ordered
    w.write(length - 1, 5);
    w.write(entries, ilog(entries));
    w.write(lookup_type, 4);
    w.write(packFloat(0.0f), 32);
    w.write(packFloat(1.0f), 32);
    w.write(value_bits - 1, 4);
    w.writeBit(false);
    for (unsigned i = 0; i < multiplicands; ++i) {
        w.write(i & ((1u << value_bits) - 1), value_bits);
    }
    return w.finish();
}

void test_oversized_lookup_tables()
{
    // 2^17 entries of 2^15 dimensions: the table size wraps to 0 in 32 bits
    std::vector<uint8_t> wrapping = uniformCodebook(32768, 131072, 17, 2, 8, 0);
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&wrapping] {
        IO::BitReader reader(wrapping.data(), wrapping.size(), IO::BitReader::BitOrder::LSB_FIRST);
        VorbisCodebook::parse(reader);
    }, "Table size past 32 bits");

    std::vector<uint8_t> large = uniformCodebook(65535, 128, 7, 1, 8, 0);
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&large] {
        IO::BitReader reader(large.data(), large.size(), IO::BitReader::BitOrder::LSB_FIRST);
        VorbisCodebook::parse(reader);
    }, "Table above the limit");

    // 16 entries in 2 dimensions need 4 multiplicands of 16 bits
    std::vector<uint8_t> truncated = uniformCodebook(2, 16, 4, 1, 16, 1);
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&truncated] {
        IO::BitReader reader(truncated.data(), truncated.size(), IO::BitReader::BitOrder::LSB_FIRST);
        VorbisCodebook::parse(reader);
    }, "Multiplicands past the end of the header");

    std::vector<uint8_t> complete = uniformCodebook(2, 16, 4, 1, 16, 4);
    IO::BitReader reader(complete.data(), complete.size(), IO::BitReader::BitOrder::LSB_FIRST);
    VorbisCodebook book = VorbisCodebook::parse(reader);
    ASSERT_EQUALS(16u, book.entries(), "Entries");
    ASSERT_TRUE(book.hasLookup(), "Lookup table kept");
}

void test_header_parsing()
{
    VorbisDecoder decoder = makeDecoder();
    const VorbisSetup& setup = decoder.setup();
    ASSERT_EQUALS(1u, decoder.channels(), "Mono");
    ASSERT_EQUALS(kRate, decoder.sampleRate(), "Sample rate");
    ASSERT_EQUALS(128u, setup.identification().blocksize_0, "Short block");
    ASSERT_EQUALS(256u, setup.identification().blocksize_1, "Long block");
    ASSERT_EQUALS(2u, setup.codebooks.size(), "Codebooks");
    ASSERT_EQUALS(2u, setup.modes.size(), "Modes");
    ASSERT_EQUALS(std::string("psydec test vectors"), setup.comment().vendor, "Vendor string");
    ASSERT_TRUE(setup.comment().find("title") == std::optional<std::string>("Tone"), "Comment lookup ignores case");
    ASSERT_EQUALS(static_cast<size_t>(128), decoder.maxFrameSamples(), "Long block / 2 per channel");
}

void test_bad_headers()
{
    DecoderConfig config;
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&] {
        VorbisDecoder(identificationHeader(1, 9, 8), commentHeader(), setupHeader(1), config);
    }, "Short block longer than long block");

    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&] {
        std::vector<uint8_t> setup = setupHeader(1);
        setup.resize(setup.size() / 2);
        VorbisDecoder(identificationHeader(1, 7, 8), commentHeader(), setup, config);
    }, "Truncated setup header");

    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&] {
        std::vector<uint8_t> setup = setupHeader(1);
        setup[8] ^= 0xFF;
        VorbisDecoder(identificationHeader(1, 7, 8), commentHeader(), setup, config);
    }, "Broken codebook sync");
}

void test_first_packet_returns_nothing()
{
    VorbisDecoder decoder = makeDecoder();
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> packet = audioPacket(true, true, true, 20);
    ASSERT_EQUALS(static_cast<size_t>(0), decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size()),
                  "First packet primes the overlap");
    ASSERT_EQUALS(static_cast<size_t>(128), decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size()),
                  "Long after long gives 256/4 + 256/4");
}

void test_tone_is_continuous()
{
    VorbisDecoder decoder = makeDecoder();
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<float> pcm;
    std::vector<uint8_t> packet = audioPacket(true, true, true, 20);
    for (unsigned i = 0; i < 40; ++i) {
        size_t n = decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
        pcm.insert(pcm.end(), out.begin(), out.begin() + n);
    }
    ASSERT_EQUALS(static_cast<size_t>(39 * 128), pcm.size(), "39 frames of output");

    // Bin 20 sits at 640.6 Hz; a constant coefficient lags a quarter turn
    // every 128-sample hop, which pulls the tone down to 625 Hz
    double freq = TestUtil::dominantFrequency(pcm.data(), 2048, kRate);
    ASSERT_TRUE(std::fabs(freq - 625.0) <= 10.0, "Tone near 625 Hz, got " + std::to_string(freq));

    float max_step = 0.0f;
    for (size_t i = 1; i < pcm.size(); ++i) {
        max_step = std::max(max_step, std::fabs(pcm[i] - pcm[i - 1]));
    }
    float peak = TestUtil::maxAbs(pcm.data(), pcm.size());
    ASSERT_TRUE(peak > 0.01f, "Tone is audible");
    // A sinusoid of this frequency moves about half its peak per sample
    ASSERT_TRUE(max_step <= peak * 0.75f, "No click at block boundaries");
}

void test_block_size_switching()
{
    VorbisDecoder decoder = makeDecoder();
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> first = audioPacket(true, true, false, 20);
    std::vector<uint8_t> short_block = audioPacket(false, false, false, 10);
    std::vector<uint8_t> back_to_long = audioPacket(true, false, true, 20);

    decoder.decodeFrame(first.data(), first.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(96), decoder.decodeFrame(short_block.data(), short_block.size(), out.data(), out.size()),
                  "Short after long gives 64 + 32");
    ASSERT_EQUALS(static_cast<size_t>(64), decoder.decodeFrame(short_block.data(), short_block.size(), out.data(), out.size()),
                  "Short after short gives 32 + 32");
    ASSERT_EQUALS(static_cast<size_t>(96), decoder.decodeFrame(back_to_long.data(), back_to_long.size(), out.data(), out.size()),
                  "Long after short gives 32 + 64");
}

void test_residue_formats()
{
    for (unsigned type = 0; type <= 2; ++type) {
        VorbisDecoder decoder = makeDecoder(type);
        std::vector<float> out(decoder.maxFrameSamples());
        std::vector<uint8_t> packet = audioPacket(true, true, true, 20, 1, type);
        std::vector<float> pcm;
        for (unsigned i = 0; i < 20; ++i) {
            size_t n = decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
            pcm.insert(pcm.end(), out.begin(), out.begin() + n);
        }
        ASSERT_TRUE(TestUtil::maxAbs(pcm.data(), pcm.size()) > 0.01f,
                    "Residue type " + std::to_string(type) + " produces signal");
    }
}

void test_square_polar_coupling()
{
    // Magnitude and angle both carry the spike: angle > 0, magnitude > 0
    // gives new_angle = m - a = 0, so channel 1 is silent
    VorbisDecoder decoder = makeDecoder(1, 2, true);
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> packet = audioPacket(true, true, true, 20, 2, 1);
    for (unsigned i = 0; i < 4; ++i) {
        size_t n = decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
        if (i > 0) {
            ASSERT_EQUALS(static_cast<size_t>(256), n, "Two channels of 128");
            ASSERT_TRUE(TestUtil::maxAbs(out.data(), 128, 2) > 0.01f, "Magnitude channel has the tone");
            ASSERT_TRUE(TestUtil::maxAbs(out.data() + 1, 128, 2) < 1e-6f, "Angle channel cancels");
        }
    }
}

void test_truncated_packet_is_not_an_error()
{
    VorbisDecoder decoder = makeDecoder();
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> packet = audioPacket(true, true, true, 100);
    decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
    size_t n = decoder.decodeFrame(packet.data(), 4, out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(128), n, "Short packet still produces a block");

    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        decoder.decodeFrame(packet.data(), 0, out.data(), out.size());
    }, "Empty packet");

    std::vector<uint8_t> header = identificationHeader(1, 7, 8);
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
        decoder.decodeFrame(header.data(), header.size(), out.data(), out.size());
    }, "Header packet in the audio stream");
}

void test_lost_packet_flushes()
{
    VorbisDecoder decoder = makeDecoder();
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<uint8_t> packet = audioPacket(true, true, true, 20);
    decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
    decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(128), decoder.decodeLost(out.data(), out.size()), "Tail is flushed");
    ASSERT_EQUALS(static_cast<size_t>(0), decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size()),
                  "Decoder restarts after a loss");
}

#ifdef HAVE_VORBISENC
void test_libvorbis_sine()
{
    const unsigned rate = 44100;
    vorbis_info vi;
    vorbis_info_init(&vi);
    ASSERT_EQUALS(0, vorbis_encode_init_vbr(&vi, 1, rate, 0.5f), "vorbis_encode_init_vbr");
    vorbis_comment vc;
    vorbis_comment_init(&vc);
    vorbis_dsp_state vd;
    vorbis_analysis_init(&vd, &vi);
    vorbis_block vb;
    vorbis_block_init(&vd, &vb);

    ogg_packet h_id, h_comment, h_setup;
    vorbis_analysis_headerout(&vd, &vc, &h_id, &h_comment, &h_setup);
    std::vector<uint8_t> id(h_id.packet, h_id.packet + h_id.bytes);
    std::vector<uint8_t> comment(h_comment.packet, h_comment.packet + h_comment.bytes);
    std::vector<uint8_t> setup(h_setup.packet, h_setup.packet + h_setup.bytes);

    std::vector<std::vector<uint8_t>> packets;
    std::vector<float> input = TestUtil::sine(440.0, rate, rate);
    size_t fed = 0;
    bool eos = false;
    while (!eos) {
        if (fed < input.size()) {
            size_t chunk = std::min<size_t>(1024, input.size() - fed);
            float** buffer = vorbis_analysis_buffer(&vd, static_cast<int>(chunk));
            std::copy(input.begin() + fed, input.begin() + fed + chunk, buffer[0]);
            vorbis_analysis_wrote(&vd, static_cast<int>(chunk));
            fed += chunk;
        } else {
            vorbis_analysis_wrote(&vd, 0);
        }
        while (vorbis_analysis_blockout(&vd, &vb) == 1) {
            vorbis_analysis(&vb, nullptr);
            vorbis_bitrate_addblock(&vb);
            ogg_packet op;
            while (vorbis_bitrate_flushpacket(&vd, &op)) {
                packets.emplace_back(op.packet, op.packet + op.bytes);
                if (op.e_o_s) {
                    eos = true;
                }
            }
        }
    }
    vorbis_block_clear(&vb);
    vorbis_dsp_clear(&vd);
    vorbis_comment_clear(&vc);
    vorbis_info_clear(&vi);

    DecoderConfig config;
    VorbisDecoder decoder(id, comment, setup, config);
    std::vector<float> out(decoder.maxFrameSamples());
    std::vector<float> pcm;
    for (const auto& packet : packets) {
        size_t n = decoder.decodeFrame(packet.data(), packet.size(), out.data(), out.size());
        pcm.insert(pcm.end(), out.begin(), out.begin() + n);
    }
    ASSERT_TRUE(pcm.size() >= rate / 2, "Most of a second decoded");
    double freq = TestUtil::dominantFrequency(pcm.data() + 4096, 8192, rate, 1, 1000.0);
    ASSERT_TRUE(std::fabs(freq - 440.0) <= 5.0, "Peak at 440 Hz, got " + std::to_string(freq));
    ASSERT_TRUE(TestUtil::rms(pcm.data() + 4096, 8192) > 0.25, "Level close to the input");
}
#endif

int main(int argc, char* argv[])
{
    TestSuite suite("Vorbis Decoder Tests");

    suite.addTest("ilog and float32 unpack", test_ilog_and_float_unpack);
    suite.addTest("Codeword Assignment", test_codeword_assignment);
    suite.addTest("Overspecified Codebook", test_overspecified_codebook);
    suite.addTest("Single Entry Codebook", test_single_entry_codebook);
    suite.addTest("Oversized Lookup Tables", test_oversized_lookup_tables);
    suite.addTest("Header Parsing", test_header_parsing);
    suite.addTest("Bad Headers", test_bad_headers);
    suite.addTest("First Packet", test_first_packet_returns_nothing);
    suite.addTest("Tone Continuity", test_tone_is_continuous);
    suite.addTest("Block Size Switching", test_block_size_switching);
    suite.addTest("Residue Formats", test_residue_formats);
    suite.addTest("Square Polar Coupling", test_square_polar_coupling);
    suite.addTest("Truncated Packet", test_truncated_packet_is_not_an_error);
    suite.addTest("Lost Packet", test_lost_packet_flushes);
#ifdef HAVE_VORBISENC
    suite.addTest("libvorbis 440 Hz", test_libvorbis_sine);
#endif

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
