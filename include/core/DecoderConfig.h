/*
 * DecoderConfig.h - Runtime configuration shared by all decoders
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DECODERCONFIG_H
#define DECODERCONFIG_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {

/**
 * @brief Butterfly implementation requested for the transform engine.
 *
 * Auto picks the widest path the host supports. Forcing a path wider than
 * the host supports falls back to the widest supported one.
 */
enum class TransformPath {
    Auto,
    Scalar,
    Vec4,
    Vec8
};

/**
 * @brief Decoder configuration
 */
struct DecoderConfig {
    // Transform engine
    size_t max_transform_size = 8192;
    TransformPath transform_path = TransformPath::Auto;

    // Opus concealment: frames from the first loss until silence
    unsigned plc_fade_frames = 5;

    // Error handling
    bool strict = false;            // treat CRC mismatches and skipped elements as errors
    bool clip_output = true;        // clamp output to [-1, 1]

    // Debugging and logging
    std::vector<std::string> debug_channels;

    /**
     * @brief Load configuration from PSYDEC_* environment variables
     */
    void loadFromEnvironment();

    /**
     * @brief Validate configuration values
     */
    bool validate() const;

    /**
     * @brief Convert configuration to key-value map
     */
    std::map<std::string, std::string> toMap() const;

    static std::string transformPathName(TransformPath path);
    static std::optional<TransformPath> parseTransformPath(const std::string& name);
};

} // namespace PsyDec

#endif // DECODERCONFIG_H
