/*
 * AacConfig.h - AudioSpecificConfig, ADTS and program config parsing
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AACCONFIG_H
#define AACCONFIG_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace AAC {

constexpr unsigned kObjectTypeLC = 2;

/**
 * @brief program_config_element(), reduced to what channel mapping needs.
 */
struct ProgramConfig {
    unsigned element_instance_tag = 0;
    unsigned object_type = 0;
    unsigned sf_index = 0;
    unsigned front_elements = 0;
    unsigned side_elements = 0;
    unsigned back_elements = 0;
    unsigned lfe_elements = 0;
    unsigned channels = 0;          // front, side and back channels plus LFE
    std::string comment;

    // Reads the element body; the reader is left after the comment field
    static ProgramConfig parse(IO::BitReader& reader);
};

/**
 * @brief AudioSpecificConfig for the GA (AAC-LC) object type.
 *
 * Only object type 2 with 1024-sample frames is accepted; anything else is
 * rejected with CONFIG_ERROR when the decoder is built.
 */
struct AudioSpecificConfig {
    unsigned object_type = kObjectTypeLC;
    unsigned sf_index = 4;
    unsigned sample_rate = 44100;
    unsigned channel_config = 2;
    bool frame_length_960 = false;
    bool depends_on_core_coder = false;
    unsigned core_coder_delay = 0;
    std::optional<ProgramConfig> program_config;

    static AudioSpecificConfig parse(const uint8_t* data, size_t size);
    static AudioSpecificConfig make(unsigned sample_rate, unsigned channels);

    // Two-byte form for object type LC with a standard channel configuration
    std::vector<uint8_t> serialize() const;

    unsigned channels() const;
    void validate() const;
};

/**
 * @brief Fixed and variable ADTS header (ISO/IEC 13818-7 6.2).
 */
struct AdtsHeader {
    bool mpeg2 = false;
    bool protection_absent = true;
    unsigned profile = 1;           // object type - 1
    unsigned sf_index = 4;
    unsigned channel_config = 2;
    unsigned frame_length = 0;      // header included, in bytes
    unsigned buffer_fullness = 0x7FF;
    unsigned raw_data_blocks = 1;

    static bool hasSync(const uint8_t* data, size_t size);
    static AdtsHeader parse(const uint8_t* data, size_t size);

    size_t headerSize() const { return protection_absent ? 7 : 9; }
    AudioSpecificConfig toConfig() const;
    std::array<uint8_t, 7> serialize() const;
};

} // namespace AAC
} // namespace Codec
} // namespace PsyDec

#endif // AACCONFIG_H
