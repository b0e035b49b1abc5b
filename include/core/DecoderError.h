/*
 * DecoderError.h - Error types and exception handling for the decoders
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef DECODERERROR_H
#define DECODERERROR_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {

/**
 * @brief Error codes for decoder operations
 *
 * Every error except CONFIG_ERROR is scoped to a single frame: the decoder
 * that raised it stays usable and the next frame decodes normally.
 */
enum class DecoderError {
    /**
     * @brief No error occurred
     */
    NONE = 0,

    /**
     * @brief A read would cross the end of the frame buffer
     *
     * Recovery: drop the frame
     */
    BITSTREAM_EXHAUSTED,

    /**
     * @brief A header or side-information field holds an invalid value
     *
     * Includes intensity stereo signalled on a mono stream.
     * Recovery: drop the frame
     */
    CORRUPT_SIDE_INFO,

    /**
     * @brief A Huffman or VQ code has no valid table entry
     *
     * Recovery: drop the frame
     */
    CORRUPT_SPECTRAL_DATA,

    /**
     * @brief MP3 main_data_begin points before the stored reservoir
     *
     * Recovery: the decoder has already written one frame of silence;
     * the frame's own main data is kept for the next frame
     */
    RESERVOIR_UNDERFLOW,

    /**
     * @brief Transform size above the configured maximum or not
     * representable by the requested operation
     *
     * Recovery: fail the call
     */
    UNSUPPORTED_TRANSFORM_SIZE,

    /**
     * @brief Unsupported sample rate, channel count or codec profile
     *
     * Recovery: none, the decoder cannot be constructed
     */
    CONFIG_ERROR
};

/**
 * @brief Exception class for decoder errors
 *
 * USAGE:
 * ======
 * throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Bad block_type");
 *
 * try {
 *     count = decoder->decodeFrame(data, size, out, capacity);
 * } catch (const DecoderException& e) {
 *     if (e.getError() == DecoderError::RESERVOIR_UNDERFLOW) {
 *         count = e.getSamplesWritten();
 *     }
 * }
 */
class DecoderException : public std::runtime_error {
public:
    /**
     * @brief Construct decoder exception with error code and message
     *
     * @param error Error code indicating type of failure
     * @param message Descriptive error message
     * @param samples_written Interleaved samples already placed in the
     *        caller's buffer before the failure (silence fill)
     */
    DecoderException(DecoderError error, const std::string& message, size_t samples_written = 0)
        : std::runtime_error(message), m_error(error), m_samples_written(samples_written) {}

    /**
     * @brief Get the error code
     */
    DecoderError getError() const { return m_error; }

    /**
     * @brief Interleaved samples written before the error was raised
     */
    size_t getSamplesWritten() const { return m_samples_written; }

    /**
     * @brief Get human-readable error type name
     */
    const char* getErrorName() const {
        switch (m_error) {
            case DecoderError::NONE:
                return "NONE";
            case DecoderError::BITSTREAM_EXHAUSTED:
                return "BITSTREAM_EXHAUSTED";
            case DecoderError::CORRUPT_SIDE_INFO:
                return "CORRUPT_SIDE_INFO";
            case DecoderError::CORRUPT_SPECTRAL_DATA:
                return "CORRUPT_SPECTRAL_DATA";
            case DecoderError::RESERVOIR_UNDERFLOW:
                return "RESERVOIR_UNDERFLOW";
            case DecoderError::UNSUPPORTED_TRANSFORM_SIZE:
                return "UNSUPPORTED_TRANSFORM_SIZE";
            case DecoderError::CONFIG_ERROR:
                return "CONFIG_ERROR";
            default:
                return "UNKNOWN";
        }
    }

private:
    DecoderError m_error;
    size_t m_samples_written;
};

/**
 * @brief Get human-readable error message for error code
 */
inline const char* getErrorMessage(DecoderError error) {
    switch (error) {
        case DecoderError::NONE:
            return "No error";
        case DecoderError::BITSTREAM_EXHAUSTED:
            return "Read past the end of the frame";
        case DecoderError::CORRUPT_SIDE_INFO:
            return "Invalid header or side information";
        case DecoderError::CORRUPT_SPECTRAL_DATA:
            return "Invalid Huffman or VQ code";
        case DecoderError::RESERVOIR_UNDERFLOW:
            return "Bit reservoir does not hold the referenced main data";
        case DecoderError::UNSUPPORTED_TRANSFORM_SIZE:
            return "Unsupported transform size";
        case DecoderError::CONFIG_ERROR:
            return "Unsupported decoder configuration";
        default:
            return "Unknown error";
    }
}

} // namespace PsyDec

#endif // DECODERERROR_H
