/*
 * WavWriter.h - RIFF WAVE writer for 16-bit PCM output
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef WAVWRITER_H
#define WAVWRITER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace IO {

/**
 * @brief Writes interleaved 16-bit samples to a canonical 44-byte-header
 * WAVE file.
 *
 * The RIFF and data chunk sizes are patched in by close(), which the
 * destructor calls if the caller did not.
 */
class WavWriter {
public:
    static constexpr size_t HEADER_SIZE = 44;

    /**
     * @throws std::runtime_error if the file cannot be created
     */
    WavWriter(const std::string& path, unsigned sample_rate, unsigned channels);
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    void write(const int16_t* samples, size_t count);
    void close();

    size_t samplesWritten() const { return m_samples; }

    static std::array<uint8_t, HEADER_SIZE> header(unsigned sample_rate, unsigned channels, uint32_t data_bytes);

private:
    std::ofstream m_file;
    std::string m_path;
    unsigned m_sample_rate;
    unsigned m_channels;
    size_t m_samples;
};

} // namespace IO
} // namespace PsyDec

#endif // WAVWRITER_H
