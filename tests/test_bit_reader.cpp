/*
 * test_bit_reader.cpp - Unit tests for BitReader, HuffmanTree and Crc16
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

void test_msb_first_reads()
{
    const uint8_t data[] = {0xFF, 0x00, 0xAA};
    BitReader reader(data, sizeof(data));

    ASSERT_EQUALS(0xFu, reader.readBits(4), "High nibble");
    ASSERT_EQUALS(0xFu, reader.readBits(4), "Low nibble");
    ASSERT_EQUALS(0x00u, reader.readBits(8), "Second byte");
    ASSERT_EQUALS(0xAAu, reader.readBits(8), "Third byte");
    ASSERT_EQUALS(size_t(0), reader.bitsRemaining(), "Buffer consumed");
}

void test_peek_does_not_advance()
{
    const uint8_t data[] = {0xA5, 0x3C};
    BitReader reader(data, sizeof(data));

    ASSERT_EQUALS(0xA53u, reader.peekBits(12), "Peek");
    ASSERT_EQUALS(size_t(0), reader.bitPosition(), "Peek leaves the cursor");
    ASSERT_EQUALS(0xA53u, reader.readBits(12), "Read matches peek");
    ASSERT_EQUALS(size_t(12), reader.bitPosition(), "Read advances once");
    ASSERT_EQUALS(0xCu, reader.readBits(4), "Last nibble");
}

void test_lsb_first_reads()
{
    // Vorbis packing: values fill each byte from bit 0 upwards
    const uint8_t data[] = {0xB4, 0x01};
    BitReader reader(data, sizeof(data), BitReader::BitOrder::LSB_FIRST);

    ASSERT_EQUALS(4u, reader.readBits(3), "Low three bits of 0xB4");
    ASSERT_EQUALS(22u, reader.readBits(5), "High five bits of 0xB4");
    ASSERT_TRUE(reader.readBit(), "Bit 0 of 0x01");
    ASSERT_EQUALS(0u, reader.readBits(7), "Rest of 0x01");
}

void test_lsb_first_spans_bytes()
{
    const uint8_t data[] = {0x34, 0x12, 0x78, 0x56};
    BitReader reader(data, sizeof(data), BitReader::BitOrder::LSB_FIRST);
    ASSERT_EQUALS(0x56781234u, reader.readBits(32), "Little-endian word");
}

void test_signed_reads()
{
    const uint8_t data[] = {0xF0, 0x70};
    BitReader reader(data, sizeof(data));
    ASSERT_EQUALS(-1, reader.readBitsSigned(4), "1111 is -1");
    ASSERT_EQUALS(0, reader.readBitsSigned(4), "0000 is 0");
    ASSERT_EQUALS(112, reader.readBitsSigned(8), "Positive byte");
}

void test_exhaustion_keeps_position()
{
    const uint8_t data[] = {0x12, 0x34};
    BitReader reader(data, sizeof(data));
    reader.readBits(10);

    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        reader.readBits(7);
    }, "Read past the end");
    ASSERT_EQUALS(size_t(10), reader.bitPosition(), "Cursor unchanged after the failed read");
    ASSERT_EQUALS(0x34u & 0x3Fu, reader.readBits(6), "Remaining bits still readable");

    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        reader.skipBits(1);
    }, "Skip past the end");

    BitReader empty(nullptr, 0);
    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        empty.readBit();
    }, "Empty buffer");
}

void test_alignment_and_seek()
{
    const uint8_t data[] = {0x80, 0xC3, 0xFF};
    BitReader reader(data, sizeof(data));

    reader.readBits(3);
    ASSERT_FALSE(reader.isAligned(), "Mid-byte");
    reader.byteAlign();
    ASSERT_TRUE(reader.isAligned(), "Aligned");
    ASSERT_EQUALS(size_t(1), reader.bytePosition(), "Second byte");
    ASSERT_EQUALS(0xC3u, reader.readBits(8), "Reads after alignment");

    reader.seekBits(9);
    ASSERT_EQUALS(0x43u, reader.readBits(7), "Seek into a byte");
    reader.seekBits(0);
    ASSERT_TRUE(reader.readBit(), "Seek back to the start");

    TestUtil::expectDecoderError(DecoderError::BITSTREAM_EXHAUSTED, [&] {
        reader.seekBits(25);
    }, "Seek past the end");
}

void test_wide_read_rejected()
{
    const uint8_t data[8] = {};
    BitReader reader(data, sizeof(data));
    TestPatterns::assertThrows<std::invalid_argument>([&] { reader.readBits(33); });
}

void test_huffman_decode()
{
    // a = 0, b = 10, c = 110, d = 111
    HuffmanTree tree;
    ASSERT_TRUE(tree.insert(0x0, 1, 'a'), "a");
    ASSERT_TRUE(tree.insert(0x2, 2, 'b'), "b");
    ASSERT_TRUE(tree.insert(0x6, 3, 'c'), "c");
    ASSERT_TRUE(tree.insert(0x7, 3, 'd'), "d");
    ASSERT_EQUALS(size_t(4), tree.size(), "Four symbols");

    // d a b c a -> 111 0 10 110 0 -> 1110 1011 0000 0000
    const uint8_t data[] = {0xEB, 0x00};
    BitReader reader(data, sizeof(data));
    std::string decoded;
    for (int i = 0; i < 5; ++i) {
        decoded.push_back(static_cast<char>(tree.decode(reader)));
    }
    ASSERT_EQUALS(std::string("dabca"), decoded, "Decoded symbols");
    ASSERT_EQUALS(size_t(10), reader.bitPosition(), "Bits consumed");
}

void test_huffman_rejects_prefix_collisions()
{
    HuffmanTree tree;
    ASSERT_TRUE(tree.insert(0x2, 2, 1), "10");
    ASSERT_FALSE(tree.insert(0x2, 2, 2), "Duplicate code");
    ASSERT_FALSE(tree.insert(0x5, 3, 3), "Extends an existing leaf");
    ASSERT_FALSE(tree.insert(0x1, 1, 4), "Prefix of an existing code");
    ASSERT_TRUE(tree.insert(0x3, 2, 5), "Sibling is fine");
}

void test_huffman_incomplete_code()
{
    // Only "1" is assigned, so a leading 0 has nowhere to go
    HuffmanTree tree;
    tree.insert(0x1, 1, 7);
    const uint8_t data[] = {0x40};
    BitReader reader(data, sizeof(data));
    TestUtil::expectDecoderError(DecoderError::CORRUPT_SPECTRAL_DATA, [&] {
        tree.decode(reader);
    }, "Missing branch");
}

void test_huffman_single_symbol()
{
    HuffmanTree tree;
    ASSERT_TRUE(tree.insert(0, 0, 42), "Zero-length code");
    ASSERT_TRUE(tree.isTrivial(), "Trivial tree");
    ASSERT_FALSE(tree.insert(0x1, 1, 43), "Nothing else fits");

    BitReader reader(nullptr, 0);
    ASSERT_EQUALS(42, tree.decode(reader), "Decodes without reading");
}

void test_huffman_from_table()
{
    const uint32_t codes[] = {0x0, 0x1};
    const uint8_t lengths[] = {1, 1};
    HuffmanTree tree = HuffmanTree::fromTable(codes, lengths, 2);
    ASSERT_EQUALS(size_t(2), tree.size(), "Two entries");

    const uint32_t bad_codes[] = {0x0, 0x0};
    TestPatterns::assertThrows<std::logic_error>([&] {
        HuffmanTree::fromTable(bad_codes, lengths, 2);
    }, "not prefix free");
}

void test_crc16()
{
    const char* check = "123456789";
    uint16_t crc = Crc16::compute(reinterpret_cast<const uint8_t*>(check), 9);
    ASSERT_EQUALS(0xAEE7u, static_cast<unsigned>(crc), "CRC-16 check value");

    // Feeding bit by bit gives the same register
    Crc16 bits;
    for (int i = 0; i < 9; ++i) {
        bits.updateBits(static_cast<uint8_t>(check[i]), 8);
    }
    ASSERT_EQUALS(0xAEE7u, static_cast<unsigned>(bits.value()), "Bitwise update");

    bits.reset();
    ASSERT_EQUALS(0xFFFFu, static_cast<unsigned>(bits.value()), "Reset to the initial value");
}

int main(int argc, char* argv[])
{
    TestSuite suite("BitReader, HuffmanTree and Crc16 Tests");

    suite.addTest("MSB-First Reads", test_msb_first_reads);
    suite.addTest("Peek Then Read", test_peek_does_not_advance);
    suite.addTest("LSB-First Reads", test_lsb_first_reads);
    suite.addTest("LSB-First Across Bytes", test_lsb_first_spans_bytes);
    suite.addTest("Signed Reads", test_signed_reads);
    suite.addTest("Exhaustion Keeps Position", test_exhaustion_keeps_position);
    suite.addTest("Alignment and Seek", test_alignment_and_seek);
    suite.addTest("Wide Read Rejected", test_wide_read_rejected);
    suite.addTest("Huffman Decode", test_huffman_decode);
    suite.addTest("Huffman Prefix Collisions", test_huffman_rejects_prefix_collisions);
    suite.addTest("Huffman Incomplete Code", test_huffman_incomplete_code);
    suite.addTest("Huffman Single Symbol", test_huffman_single_symbol);
    suite.addTest("Huffman From Table", test_huffman_from_table);
    suite.addTest("CRC-16", test_crc16);

    auto results = suite.runAll(argc, argv);
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
