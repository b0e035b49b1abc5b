/*
 * test_aac_decoder.cpp - Unit tests for the AAC-LC decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_utils.h"

using namespace PsyDec;
using namespace PsyDec::Codec::AAC;
using namespace TestFramework;
using TestUtil::BitWriter;

namespace {

constexpr unsigned kRate = 44100;
constexpr unsigned kFrame = 1024;

void writeLongIcsInfo(BitWriter& w, unsigned max_sfb)
{
    w.write(0, 1);          // ics_reserved_bit
    w.write(0, 2);          // ONLY_LONG_SEQUENCE
    w.write(0, 1);          // sine window
    w.write(max_sfb, 6);
    w.write(0, 1);          // predictor_data_present
}

void writeSection(BitWriter& w, unsigned book, unsigned length)
{
    w.write(book, 4);
    while (length >= 31) {
        w.write(31, 5);
        length -= 31;
    }
    w.write(length, 5);
}

// Stream with no spectral data, used for silent frames
void writeEmptyLongStream(BitWriter& w, bool with_ics_info)
{
    w.write(100, 8);        // global_gain
    if (with_ics_info) {
        writeLongIcsInfo(w, 0);
    }
    w.write(0, 3);          // pulse, tns, gain control
}

/**
 * @brief Minimal long-block AAC-LC encoder.
 *
 * Every band is coded with the escape codebook at one scalefactor, which
 * is enough to push a real signal through the whole decode path.
 */
class LongBlockEncoder {
public:
    explicit LongBlockEncoder(unsigned global_gain = 140)
        : m_engine(2048)
        , m_global_gain(global_gain)
        , m_layout(Tables::swb(4))
        , m_book(TestUtil::invertTree(*Tables::spectral(ESC_HCB).tree, 12))
        , m_history(2 * kFrame, 0.0f)
    {
    }

    // Pushes 1024 new samples and returns the quantized spectrum of the block
    std::vector<int> push(const float* samples)
    {
        std::copy(m_history.begin() + kFrame, m_history.end(), m_history.begin());
        std::copy(samples, samples + kFrame, m_history.begin() + kFrame);

        std::vector<float> block(2 * kFrame);
        for (unsigned n = 0; n < 2 * kFrame; ++n) {
            float window = static_cast<float>(std::sin(M_PI / (2.0 * kFrame) * (n + 0.5)));
            block[n] = m_history[n] * window * 32768.0f;
        }
        std::vector<float> coefs(kFrame);
        m_engine.mdct(block.data(), coefs.data(), 2 * kFrame);

        double gain = std::pow(2.0, 0.25 * (static_cast<int>(m_global_gain) - 100));
        std::vector<int> q(kFrame);
        for (unsigned k = 0; k < kFrame; ++k) {
            double x = 2.0 * coefs[k] / gain;
            int magnitude = static_cast<int>(std::pow(std::fabs(x), 0.75) + 0.5);
            magnitude = std::min(magnitude, 8191);
            q[k] = x < 0 ? -magnitude : magnitude;
        }
        return q;
    }

    void writeStream(BitWriter& w, const std::vector<int>& q, bool with_ics_info) const
    {
        const unsigned bands = m_layout.long_count;
        w.write(m_global_gain, 8);
        if (with_ics_info) {
            writeLongIcsInfo(w, bands);
        }
        writeSection(w, ESC_HCB, bands);
        for (unsigned sfb = 0; sfb < bands; ++sfb) {
            w.write(0, 1);      // scalefactor delta 0
        }
        w.write(0, 3);
        writeSpectrum(w, q);
    }

    unsigned bands() const { return m_layout.long_count; }

private:
    void writeSpectrum(BitWriter& w, const std::vector<int>& q) const
    {
        const unsigned end = m_layout.long_offsets[m_layout.long_count];
        for (unsigned k = 0; k < end; k += 2) {
            int a = std::min(std::abs(q[k]), 16);
            int b = std::min(std::abs(q[k + 1]), 16);
            const TestUtil::Codeword& cw = m_book.at(a * 17 + b);
            w.write(cw.code, cw.length);
            if (a) {
                w.write(q[k] < 0 ? 1 : 0, 1);
            }
            if (b) {
                w.write(q[k + 1] < 0 ? 1 : 0, 1);
            }
            if (a == 16) {
                writeEscape(w, std::abs(q[k]));
            }
            if (b == 16) {
                writeEscape(w, std::abs(q[k + 1]));
            }
        }
    }

    static void writeEscape(BitWriter& w, int value)
    {
        unsigned n = 0;
        while ((1 << (n + 5)) <= value) {
            ++n;
        }
        for (unsigned i = 0; i < n; ++i) {
            w.write(1, 1);
        }
        w.write(0, 1);
        w.write(static_cast<uint32_t>(value - (1 << (n + 4))), n + 4);
    }

    Core::TransformEngine m_engine;
    unsigned m_global_gain;
    const SwbLayout& m_layout;
    std::map<int32_t, TestUtil::Codeword> m_book;
    std::vector<float> m_history;
};

std::vector<uint8_t> monoFrame(const LongBlockEncoder& encoder, const std::vector<int>& q)
{
    BitWriter w;
    w.write(static_cast<unsigned>(ElementId::SCE), 3);
    w.write(0, 4);
    encoder.writeStream(w, q, true);
    w.write(static_cast<unsigned>(ElementId::END), 3);
    return w.finish();
}

std::vector<uint8_t> silentMonoFrame()
{
    BitWriter w;
    w.write(static_cast<unsigned>(ElementId::SCE), 3);
    w.write(0, 4);
    writeEmptyLongStream(w, true);
    w.write(static_cast<unsigned>(ElementId::END), 3);
    return w.finish();
}

AacDecoder makeDecoder(unsigned channels, bool adts = false)
{
    DecoderConfig config;
    return AacDecoder(AudioSpecificConfig::make(kRate, channels), config, adts);
}

} // anonymous namespace

void test_scalefactor_zero_delta_is_one_bit()
{
    uint8_t data[] = {0x00, 0x00};
    IO::BitReader reader(data, sizeof(data));
    ASSERT_EQUALS(60, Tables::scalefactor().decode(reader), "Codeword 0 should be delta 0");
    ASSERT_EQUALS(1u, reader.bitPosition(), "Delta 0 should take one bit");
}

void test_silent_frame()
{
    AacDecoder decoder = makeDecoder(1);
    std::vector<uint8_t> frame = silentMonoFrame();
    std::vector<float> out(kFrame, 1.0f);
    size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(kFrame), written, "Mono frame is 1024 samples");
    ASSERT_TRUE(TestUtil::maxAbs(out.data(), out.size()) == 0.0f, "Silent frame decodes to zeros");
}

void test_silent_short_frame()
{
    AacDecoder decoder = makeDecoder(1);
    BitWriter w;
    w.write(static_cast<unsigned>(ElementId::SCE), 3);
    w.write(0, 4);
    w.write(100, 8);
    w.write(0, 1);
    w.write(Core::AacWindow::EIGHT_SHORT, 2);
    w.write(1, 1);          // KBD
    w.write(0, 4);          // max_sfb
    w.write(0x5A, 7);       // scale_factor_grouping
    w.write(0, 3);
    w.write(static_cast<unsigned>(ElementId::END), 3);
    std::vector<uint8_t> frame = w.finish();

    std::vector<float> out(kFrame, 1.0f);
    size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(kFrame), written, "Short-window frame is still 1024 samples");
    ASSERT_TRUE(TestUtil::maxAbs(out.data(), out.size()) == 0.0f, "Silent short frame decodes to zeros");
}

void test_sine_round_trip()
{
    AacDecoder decoder = makeDecoder(1);
    LongBlockEncoder encoder;
    const unsigned frames = 6;
    std::vector<float> input = TestUtil::sine(440.0, kRate, kFrame * frames);

    std::vector<float> decoded;
    std::vector<float> out(decoder.maxFrameSamples());
    for (unsigned f = 0; f < frames; ++f) {
        std::vector<int> q = encoder.push(input.data() + f * kFrame);
        std::vector<uint8_t> frame = monoFrame(encoder, q);
        size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
        ASSERT_EQUALS(static_cast<size_t>(kFrame), written, "Each frame yields 1024 samples");
        decoded.insert(decoded.end(), out.begin(), out.begin() + written);
    }

    // Frame f reproduces input frame f - 1
    ASSERT_TRUE(TestUtil::maxAbs(decoded.data(), kFrame) < 5e-3f, "First frame is the encoder delay");
    float worst = 0.0f;
    for (size_t i = kFrame; i < decoded.size(); ++i) {
        worst = std::max(worst, std::fabs(decoded[i] - input[i - kFrame]));
    }
    ASSERT_TRUE(worst < 0.01f, "Decoded sine should match the input, worst error " + std::to_string(worst));
    double freq = TestUtil::dominantFrequency(decoded.data() + kFrame, 4096, kRate);
    ASSERT_TRUE(std::fabs(freq - 440.0) <= 10.0, "Dominant frequency should be 440 Hz");
}

void test_mid_side_pair()
{
    AacDecoder decoder = makeDecoder(2);
    LongBlockEncoder encoder;
    const unsigned frames = 4;
    std::vector<float> input = TestUtil::sine(1000.0, kRate, kFrame * frames, 0.25);

    std::vector<float> out(decoder.maxFrameSamples());
    for (unsigned f = 0; f < frames; ++f) {
        std::vector<int> q = encoder.push(input.data() + f * kFrame);
        BitWriter w;
        w.write(static_cast<unsigned>(ElementId::CPE), 3);
        w.write(0, 4);
        w.write(1, 1);                          // common_window
        writeLongIcsInfo(w, encoder.bands());
        w.write(2, 2);                          // ms_mask_present: all bands
        encoder.writeStream(w, q, false);       // mid
        w.write(100, 8);                        // side: all zero bands
        writeSection(w, ZERO_HCB, encoder.bands());
        w.write(0, 3);
        w.write(static_cast<unsigned>(ElementId::END), 3);
        std::vector<uint8_t> frame = w.finish();

        size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
        ASSERT_EQUALS(static_cast<size_t>(2 * kFrame), written, "Stereo frame is 2048 samples");
        for (size_t i = 0; i < kFrame; ++i) {
            ASSERT_TRUE(out[2 * i] == out[2 * i + 1], "Zero side signal gives identical channels");
        }
    }
    ASSERT_TRUE(TestUtil::rms(out.data(), kFrame, 2) > 0.1, "Mid signal reaches both channels");
}

void test_adts_framing()
{
    AacDecoder decoder = makeDecoder(1, true);
    std::vector<uint8_t> block = silentMonoFrame();

    AdtsHeader header;
    header.sf_index = 4;
    header.channel_config = 1;
    header.raw_data_blocks = 2;
    header.frame_length = static_cast<unsigned>(7 + 2 * block.size());
    std::array<uint8_t, 7> bytes = header.serialize();

    std::vector<uint8_t> frame(bytes.begin(), bytes.end());
    frame.insert(frame.end(), block.begin(), block.end());
    frame.insert(frame.end(), block.begin(), block.end());

    std::vector<float> out(decoder.maxFrameSamples());
    size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(2 * kFrame), written, "Two raw data blocks give 2048 samples");

    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        decoder.decodeFrame(frame.data(), frame.size() - 1, out.data(), out.size());
    }, "Frame shorter than frame_length");
}

void test_adts_header_round_trip()
{
    AdtsHeader header;
    header.sf_index = 3;
    header.channel_config = 2;
    header.frame_length = 371;
    std::array<uint8_t, 7> bytes = header.serialize();
    ASSERT_TRUE(AdtsHeader::hasSync(bytes.data(), bytes.size()), "Serialized header has the sync word");
    AdtsHeader parsed = AdtsHeader::parse(bytes.data(), bytes.size());
    ASSERT_EQUALS(3u, parsed.sf_index, "sf_index");
    ASSERT_EQUALS(2u, parsed.channel_config, "channel_config");
    ASSERT_EQUALS(371u, parsed.frame_length, "frame_length");
    ASSERT_EQUALS(48000u, parsed.toConfig().sample_rate, "Index 3 is 48 kHz");

    bytes[1] = 0x00;
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
        AdtsHeader::parse(bytes.data(), bytes.size());
    }, "Missing sync word");
}

void test_audio_specific_config()
{
    const uint8_t stereo_44k[] = {0x12, 0x10};
    AudioSpecificConfig asc = AudioSpecificConfig::parse(stereo_44k, sizeof(stereo_44k));
    ASSERT_EQUALS(2u, asc.object_type, "Object type LC");
    ASSERT_EQUALS(44100u, asc.sample_rate, "44.1 kHz");
    ASSERT_EQUALS(2u, asc.channels(), "Stereo");
    std::vector<uint8_t> round = asc.serialize();
    ASSERT_EQUALS(2u, round.size(), "Two byte config");
    ASSERT_TRUE(round[0] == 0x12 && round[1] == 0x10, "Serialized config matches input");

    const uint8_t main_profile[] = {0x0A, 0x10};
    AudioSpecificConfig main = AudioSpecificConfig::parse(main_profile, sizeof(main_profile));
    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&] {
        DecoderConfig config;
        AacDecoder decoder(main, config);
    }, "AAC Main is rejected");

    TestUtil::expectDecoderError(DecoderError::CONFIG_ERROR, [&] {
        AudioSpecificConfig::parse(stereo_44k, 1);
    }, "Truncated config");
}

void test_missing_channel_is_flushed()
{
    AacDecoder decoder = makeDecoder(2);
    std::vector<uint8_t> frame = silentMonoFrame();
    std::vector<float> out(decoder.maxFrameSamples(), 1.0f);
    size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(2 * kFrame), written, "Both channels are produced");
    ASSERT_TRUE(TestUtil::maxAbs(out.data() + 1, kFrame, 2) == 0.0f, "Missing channel is silent");
}

void test_fill_and_data_elements_are_skipped()
{
    AacDecoder decoder = makeDecoder(1);
    BitWriter w;
    w.write(static_cast<unsigned>(ElementId::FIL), 3);
    w.write(3, 4);
    w.write(0xA5A5A5, 24);
    w.write(static_cast<unsigned>(ElementId::DSE), 3);
    w.write(0, 4);
    w.write(1, 1);          // byte align
    w.write(2, 8);
    w.align();
    w.write(0xBEEF, 16);
    w.write(static_cast<unsigned>(ElementId::SCE), 3);
    w.write(0, 4);
    writeEmptyLongStream(w, true);
    w.write(static_cast<unsigned>(ElementId::END), 3);
    std::vector<uint8_t> frame = w.finish();

    std::vector<float> out(kFrame);
    size_t written = decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    ASSERT_EQUALS(static_cast<size_t>(kFrame), written, "Frame decodes past FIL and DSE");
}

void test_tns_side_info()
{
    AacDecoder decoder = makeDecoder(1);
    auto frameWithOrder = [](unsigned order) {
        BitWriter w;
        w.write(static_cast<unsigned>(ElementId::SCE), 3);
        w.write(0, 4);
        w.write(100, 8);
        writeLongIcsInfo(w, 0);
        w.write(0, 1);      // pulse
        w.write(1, 1);      // tns
        w.write(1, 2);      // n_filt
        w.write(1, 1);      // coef_res: 4 bits
        w.write(20, 6);     // length
        w.write(order, 5);
        if (order > 0 && order <= 20) {
            w.write(0, 1);  // direction
            w.write(0, 1);  // compress
            for (unsigned i = 0; i < order; ++i) {
                w.writeSigned(i % 2 ? -3 : 5, 4);
            }
        }
        w.write(0, 1);      // gain control
        w.write(static_cast<unsigned>(ElementId::END), 3);
        return w.finish();
    };

    std::vector<float> out(kFrame);
    std::vector<uint8_t> good = frameWithOrder(4);
    ASSERT_EQUALS(static_cast<size_t>(kFrame), decoder.decodeFrame(good.data(), good.size(), out.data(), out.size()),
                  "TNS filter over an empty spectrum decodes");

    std::vector<uint8_t> bad = frameWithOrder(21);
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
        decoder.decodeFrame(bad.data(), bad.size(), out.data(), out.size());
    }, "TNS order above 20");
}

void test_corrupt_side_info()
{
    std::vector<float> out(2 * kFrame);

    // Reserved codebook 12
    {
        AacDecoder decoder = makeDecoder(1);
        BitWriter w;
        w.write(static_cast<unsigned>(ElementId::SCE), 3);
        w.write(0, 4);
        w.write(100, 8);
        writeLongIcsInfo(w, 1);
        writeSection(w, 12, 1);
        w.write(0, 32);
        std::vector<uint8_t> frame = w.finish();
        TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
            decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
        }, "Codebook 12 is reserved");
    }

    // Intensity band in a single channel element
    {
        AacDecoder decoder = makeDecoder(1);
        BitWriter w;
        w.write(static_cast<unsigned>(ElementId::SCE), 3);
        w.write(0, 4);
        w.write(100, 8);
        writeLongIcsInfo(w, 1);
        writeSection(w, INTENSITY_HCB, 1);
        w.write(0, 1);      // position delta 0
        w.write(0, 3);
        w.write(static_cast<unsigned>(ElementId::END), 3);
        std::vector<uint8_t> frame = w.finish();
        TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
            decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
        }, "Intensity stereo in an SCE");
    }

    // Coupling channel element
    {
        AacDecoder decoder = makeDecoder(1);
        BitWriter w;
        w.write(static_cast<unsigned>(ElementId::CCE), 3);
        w.write(0, 32);
        std::vector<uint8_t> frame = w.finish();
        TestUtil::expectDecoderError(DecoderError::CORRUPT_SIDE_INFO, [&] {
            decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
        }, "CCE is not supported");
    }

    // Truncated frame
    {
        AacDecoder decoder = makeDecoder(1);
        std::vector<uint8_t> frame = silentMonoFrame();
        TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
            decoder.decodeFrame(frame.data(), 2, out.data(), out.size());
        }, "Frame cut after two bytes");
    }
}

void test_output_buffer_too_small()
{
    AacDecoder decoder = makeDecoder(2);
    std::vector<uint8_t> frame = silentMonoFrame();
    std::vector<float> out(kFrame);
    TestPatterns::assertThrows<std::invalid_argument>([&] {
        decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    }, "", "Undersized output buffer");
}

void test_lost_frame_fades_tail()
{
    AacDecoder decoder = makeDecoder(1);
    LongBlockEncoder encoder;
    std::vector<float> input = TestUtil::sine(440.0, kRate, kFrame * 3);
    std::vector<float> out(kFrame);
    for (unsigned f = 0; f < 3; ++f) {
        std::vector<int> q = encoder.push(input.data() + f * kFrame);
        std::vector<uint8_t> frame = monoFrame(encoder, q);
        decoder.decodeFrame(frame.data(), frame.size(), out.data(), out.size());
    }
    ASSERT_EQUALS(static_cast<size_t>(kFrame), decoder.decodeLost(out.data(), out.size()),
                  "Lost frame is one block");
    ASSERT_TRUE(TestUtil::maxAbs(out.data() + kFrame - 16, 16) < 0.01f, "Tail decays to zero");
    decoder.decodeLost(out.data(), out.size());
    ASSERT_TRUE(TestUtil::maxAbs(out.data(), kFrame) == 0.0f, "Second lost frame is silent");
}

int main(int argc, char* argv[])
{
    TestSuite suite("AAC-LC Decoder Tests");

    suite.addTest("Scalefactor Zero Delta", test_scalefactor_zero_delta_is_one_bit);
    suite.addTest("Silent Frame", test_silent_frame);
    suite.addTest("Silent Short Frame", test_silent_short_frame);
    suite.addTest("Sine Round Trip", test_sine_round_trip);
    suite.addTest("Mid/Side Pair", test_mid_side_pair);
    suite.addTest("ADTS Framing", test_adts_framing);
    suite.addTest("ADTS Header Round Trip", test_adts_header_round_trip);
    suite.addTest("AudioSpecificConfig", test_audio_specific_config);
    suite.addTest("Missing Channel Flush", test_missing_channel_is_flushed);
    suite.addTest("FIL and DSE Skipping", test_fill_and_data_elements_are_skipped);
    suite.addTest("TNS Side Info", test_tns_side_info);
    suite.addTest("Corrupt Side Info", test_corrupt_side_info);
    suite.addTest("Output Buffer Too Small", test_output_buffer_too_small);
    suite.addTest("Lost Frame", test_lost_frame_fades_tail);

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
