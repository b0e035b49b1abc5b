/*
 * test_cli_io.cpp - Unit tests for frame splitting and WAV output
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_utils.h"

using namespace PsyDec;
using namespace PsyDec::IO;
using namespace TestFramework;

namespace {

// MPEG-1 Layer III, 128 kbps, 44.1 kHz, joint stereo: 417 bytes, 418 padded
void appendMp3Frame(std::vector<uint8_t>& out, bool padding)
{
    size_t length = padding ? 418 : 417;
    size_t start = out.size();
    out.resize(start + length, 0);
    out[start] = 0xFF;
    out[start + 1] = 0xFB;
    out[start + 2] = padding ? 0x92 : 0x90;
    out[start + 3] = 0x40;
}

void appendAdtsFrame(std::vector<uint8_t>& out, unsigned length)
{
    Codec::AAC::AdtsHeader header;
    header.sf_index = 4;
    header.channel_config = 2;
    header.frame_length = length;
    auto bytes = header.serialize();
    out.insert(out.end(), bytes.begin(), bytes.end());
    out.resize(out.size() + length - bytes.size(), 0);
}

uint32_t readLe32(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t readLe16(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

} // namespace

void test_mp3_split()
{
    std::vector<uint8_t> data;
    appendMp3Frame(data, false);
    appendMp3Frame(data, true);
    appendMp3Frame(data, false);

    auto frames = FrameSplitter::splitMp3(data);
    ASSERT_EQUALS(size_t(3), frames.size(), "Three frames");
    ASSERT_EQUALS(size_t(0), frames[0].offset, "First frame offset");
    ASSERT_EQUALS(size_t(417), frames[0].length, "Unpadded length");
    ASSERT_EQUALS(size_t(417), frames[1].offset, "Second frame offset");
    ASSERT_EQUALS(size_t(418), frames[1].length, "Padded length");
    ASSERT_EQUALS(size_t(835), frames[2].offset, "Third frame offset");
}

void test_mp3_split_skips_tag_and_garbage()
{
    // ID3v2.4 tag with a 20-byte body
    std::vector<uint8_t> data = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 20};
    data.resize(30, 0xFF);
    ASSERT_EQUALS(size_t(30), FrameSplitter::id3v2Length(data.data(), data.size()), "Tag length");

    data.insert(data.end(), {0x12, 0x34, 0xFF, 0x00, 0x56});
    appendMp3Frame(data, false);
    appendMp3Frame(data, false);
    data.push_back(0xFF);                   // trailing partial header

    auto frames = FrameSplitter::splitMp3(data);
    ASSERT_EQUALS(size_t(2), frames.size(), "Two frames after the tag");
    ASSERT_EQUALS(size_t(35), frames[0].offset, "Tag and garbage skipped");
    ASSERT_EQUALS(size_t(35 + 417), frames[1].offset, "Second frame follows");
}

void test_mp3_split_truncated_frame()
{
    std::vector<uint8_t> data;
    appendMp3Frame(data, false);
    appendMp3Frame(data, false);
    data.resize(data.size() - 100);

    auto frames = FrameSplitter::splitMp3(data);
    ASSERT_EQUALS(size_t(1), frames.size(), "Truncated last frame is dropped");
}

void test_adts_split()
{
    std::vector<uint8_t> data;
    appendAdtsFrame(data, 30);
    appendAdtsFrame(data, 50);
    appendAdtsFrame(data, 7);

    auto frames = FrameSplitter::splitAdts(data);
    ASSERT_EQUALS(size_t(3), frames.size(), "Three ADTS frames");
    ASSERT_EQUALS(size_t(30), frames[1].offset, "Second frame offset");
    ASSERT_EQUALS(size_t(50), frames[1].length, "Second frame length");
    ASSERT_EQUALS(size_t(80), frames[2].offset, "Third frame offset");

    ASSERT_TRUE(FrameSplitter::splitAdts(std::vector<uint8_t>(100, 0)).empty(), "No frames in zeros");
}

void test_wav_header()
{
    auto h = WavWriter::header(48000, 2, 4000);
    ASSERT_TRUE(std::memcmp(h.data(), "RIFF", 4) == 0, "RIFF id");
    ASSERT_EQUALS(4036u, readLe32(&h[4]), "RIFF size");
    ASSERT_TRUE(std::memcmp(&h[8], "WAVEfmt ", 8) == 0, "WAVE and fmt ids");
    ASSERT_EQUALS(16u, readLe32(&h[16]), "fmt chunk size");
    ASSERT_EQUALS(1u, readLe16(&h[20]), "PCM format tag");
    ASSERT_EQUALS(2u, readLe16(&h[22]), "Channels");
    ASSERT_EQUALS(48000u, readLe32(&h[24]), "Sample rate");
    ASSERT_EQUALS(192000u, readLe32(&h[28]), "Byte rate");
    ASSERT_EQUALS(4u, readLe16(&h[32]), "Block align");
    ASSERT_EQUALS(16u, readLe16(&h[34]), "Bits per sample");
    ASSERT_TRUE(std::memcmp(&h[36], "data", 4) == 0, "data id");
    ASSERT_EQUALS(4000u, readLe32(&h[40]), "data size");
}

void test_wav_file()
{
    const std::string path = "test_cli_io_output.wav";
    std::vector<int16_t> samples = {0, 1, -1, 32767, -32768, 256};
    {
        WavWriter writer(path, 44100, 1);
        writer.write(samples.data(), 4);
        writer.write(samples.data() + 4, 2);
        ASSERT_EQUALS(size_t(6), writer.samplesWritten(), "Samples counted");
    }

    std::ifstream file(path, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();
    std::remove(path.c_str());

    ASSERT_EQUALS(size_t(44 + 12), bytes.size(), "Header plus 16-bit samples");
    ASSERT_EQUALS(48u, readLe32(&bytes[4]), "RIFF size patched on close");
    ASSERT_EQUALS(12u, readLe32(&bytes[40]), "data size patched on close");
    ASSERT_EQUALS(0xFFFFu, readLe16(&bytes[48]), "-1 little endian");
    ASSERT_EQUALS(0x8000u, readLe16(&bytes[52]), "-32768 little endian");
    ASSERT_EQUALS(0x0100u, readLe16(&bytes[54]), "256 little endian");
}

void test_wav_unwritable_path()
{
    TestPatterns::assertThrows<std::runtime_error>([] {
        WavWriter writer("/nonexistent-directory/out.wav", 44100, 2);
    }, "could not create");
}

int main(int argc, char* argv[])
{
    TestSuite suite("CLI Input and Output Tests");

    suite.addTest("MP3 Frame Split", test_mp3_split);
    suite.addTest("MP3 Tag and Garbage", test_mp3_split_skips_tag_and_garbage);
    suite.addTest("MP3 Truncated Frame", test_mp3_split_truncated_frame);
    suite.addTest("ADTS Frame Split", test_adts_split);
    suite.addTest("WAV Header", test_wav_header);
    suite.addTest("WAV File", test_wav_file);
    suite.addTest("WAV Unwritable Path", test_wav_unwritable_path);

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
