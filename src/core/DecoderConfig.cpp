/*
 * DecoderConfig.cpp - Runtime configuration shared by all decoders
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {

void DecoderConfig::loadFromEnvironment() {
    const char* env_val;

    if ((env_val = std::getenv("PSYDEC_MAX_TRANSFORM_SIZE")) != nullptr) {
        try {
            max_transform_size = std::stoul(env_val);
        } catch (const std::exception& e) {
            Debug::log("config", "DecoderConfig::loadFromEnvironment() ignoring PSYDEC_MAX_TRANSFORM_SIZE=",
                       env_val, ": ", e.what());
        }
    }

    if ((env_val = std::getenv("PSYDEC_TRANSFORM_PATH")) != nullptr) {
        auto path = parseTransformPath(env_val);
        if (path) {
            transform_path = *path;
        } else {
            Debug::log("config", "DecoderConfig::loadFromEnvironment() unknown transform path: ", env_val);
        }
    }

    if ((env_val = std::getenv("PSYDEC_PLC_FADE_FRAMES")) != nullptr) {
        try {
            plc_fade_frames = static_cast<unsigned>(std::stoul(env_val));
        } catch (const std::exception& e) {
            Debug::log("config", "DecoderConfig::loadFromEnvironment() ignoring PSYDEC_PLC_FADE_FRAMES=",
                       env_val, ": ", e.what());
        }
    }

    if ((env_val = std::getenv("PSYDEC_STRICT")) != nullptr) {
        strict = (std::string(env_val) == "true" || std::string(env_val) == "1");
    }

    if ((env_val = std::getenv("PSYDEC_CLIP_OUTPUT")) != nullptr) {
        clip_output = (std::string(env_val) == "true" || std::string(env_val) == "1");
    }

    if ((env_val = std::getenv("PSYDEC_DEBUG_CHANNELS")) != nullptr) {
        debug_channels = Debug::parseChannelList(env_val);
    }
}

bool DecoderConfig::validate() const {
    // Power of two between 64 and 32768
    if (max_transform_size < 64 || max_transform_size > 32768 ||
        (max_transform_size & (max_transform_size - 1)) != 0) {
        return false;
    }

    if (plc_fade_frames == 0 || plc_fade_frames > 100) {
        return false;
    }

    return true;
}

std::map<std::string, std::string> DecoderConfig::toMap() const {
    std::map<std::string, std::string> config_map;

    config_map["max_transform_size"] = std::to_string(max_transform_size);
    config_map["transform_path"] = transformPathName(transform_path);
    config_map["plc_fade_frames"] = std::to_string(plc_fade_frames);
    config_map["strict"] = strict ? "true" : "false";
    config_map["clip_output"] = clip_output ? "true" : "false";

    std::string channels;
    for (const auto& channel : debug_channels) {
        if (!channels.empty()) channels += ",";
        channels += channel;
    }
    config_map["debug_channels"] = channels;

    return config_map;
}

std::string DecoderConfig::transformPathName(TransformPath path) {
    switch (path) {
        case TransformPath::Auto: return "auto";
        case TransformPath::Scalar: return "scalar";
        case TransformPath::Vec4: return "vec4";
        case TransformPath::Vec8: return "vec8";
        default: return "unknown";
    }
}

std::optional<TransformPath> DecoderConfig::parseTransformPath(const std::string& name) {
    if (name == "auto") return TransformPath::Auto;
    if (name == "scalar") return TransformPath::Scalar;
    if (name == "vec4") return TransformPath::Vec4;
    if (name == "vec8") return TransformPath::Vec8;
    return std::nullopt;
}

} // namespace PsyDec
