/*
 * WavWriter.cpp - RIFF WAVE writer for 16-bit PCM output
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace IO {

namespace {

constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t BITS_PER_SAMPLE = 16;

template<typename T>
void put_le(uint8_t* out, T value)
{
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

} // namespace

std::array<uint8_t, WavWriter::HEADER_SIZE> WavWriter::header(unsigned sample_rate, unsigned channels,
                                                              uint32_t data_bytes)
{
    std::array<uint8_t, HEADER_SIZE> h{};
    const uint16_t block_align = static_cast<uint16_t>(channels * BITS_PER_SAMPLE / 8);

    std::memcpy(&h[0], "RIFF", 4);
    put_le<uint32_t>(&h[4], 36 + data_bytes);
    std::memcpy(&h[8], "WAVE", 4);
    std::memcpy(&h[12], "fmt ", 4);
    put_le<uint32_t>(&h[16], 16);
    put_le<uint16_t>(&h[20], WAVE_FORMAT_PCM);
    put_le<uint16_t>(&h[22], static_cast<uint16_t>(channels));
    put_le<uint32_t>(&h[24], sample_rate);
    put_le<uint32_t>(&h[28], sample_rate * block_align);
    put_le<uint16_t>(&h[32], block_align);
    put_le<uint16_t>(&h[34], BITS_PER_SAMPLE);
    std::memcpy(&h[36], "data", 4);
    put_le<uint32_t>(&h[40], data_bytes);
    return h;
}

WavWriter::WavWriter(const std::string& path, unsigned sample_rate, unsigned channels)
    : m_path(path)
    , m_sample_rate(sample_rate)
    , m_channels(channels)
    , m_samples(0)
{
    m_file.open(path, std::ios::binary | std::ios::trunc);
    if (!m_file.is_open()) {
        throw std::runtime_error("WavWriter: could not create " + path);
    }
    auto h = header(sample_rate, channels, 0);
    m_file.write(reinterpret_cast<const char*>(h.data()), h.size());
    Debug::log("cli", "WavWriter: writing ", path, " (", sample_rate, " Hz, ", channels, " channel(s))");
}

WavWriter::~WavWriter()
{
    try {
        close();
    } catch (const std::exception& e) {
        Debug::log("cli", "WavWriter: failed to finalize ", m_path, ": ", e.what());
    }
}

void WavWriter::write(const int16_t* samples, size_t count)
{
    if (!m_file.is_open()) {
        throw std::runtime_error("WavWriter: write after close");
    }
    std::vector<uint8_t> bytes(count * 2);
    for (size_t i = 0; i < count; ++i) {
        put_le<uint16_t>(&bytes[2 * i], static_cast<uint16_t>(samples[i]));
    }
    m_file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!m_file) {
        throw std::runtime_error("WavWriter: write to " + m_path + " failed");
    }
    m_samples += count;
}

void WavWriter::close()
{
    if (!m_file.is_open()) {
        return;
    }
    // RIFF sizes are 32-bit
    const size_t limit = std::numeric_limits<uint32_t>::max() - 36;
    uint32_t data_bytes = static_cast<uint32_t>(std::min(m_samples * 2, limit));
    auto h = header(m_sample_rate, m_channels, data_bytes);
    m_file.seekp(0);
    m_file.write(reinterpret_cast<const char*>(h.data()), h.size());
    m_file.close();
    Debug::log("cli", "WavWriter: closed ", m_path, ", ", m_samples, " samples");
    if (m_file.fail()) {
        throw std::runtime_error("WavWriter: could not finalize " + m_path);
    }
}

} // namespace IO
} // namespace PsyDec
