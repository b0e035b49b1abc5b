/*
 * Mp3Decoder.cpp - MPEG-1/2/2.5 Layer III decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace MP3 {

namespace {

constexpr unsigned kGranuleSize = 576;
constexpr unsigned kSubbands = 32;
constexpr unsigned kSlots = 18;

// Matrixing coefficients N[i][k] = cos((16 + i)(2k + 1) pi / 64)
const std::array<std::array<float, 32>, 64>& synthesisMatrix()
{
    static const std::array<std::array<float, 32>, 64> matrix = [] {
        std::array<std::array<float, 32>, 64> n{};
        for (unsigned i = 0; i < 64; ++i) {
            for (unsigned k = 0; k < 32; ++k) {
                n[i][k] = static_cast<float>(std::cos((16.0 + i) * (2.0 * k + 1.0) * M_PI / 64.0));
            }
        }
        return n;
    }();
    return matrix;
}

struct AntialiasTable {
    float cs[8];
    float ca[8];
};

const AntialiasTable& antialiasTable()
{
    static const AntialiasTable table = [] {
        AntialiasTable t{};
        for (unsigned i = 0; i < 8; ++i) {
            double c = Tables::kAntialiasCoefficients[i];
            double root = std::sqrt(1.0 + c * c);
            t.cs[i] = static_cast<float>(1.0 / root);
            t.ca[i] = static_cast<float>(c / root);
        }
        return t;
    }();
    return table;
}

// Long bands covered by the long part of a mixed block
unsigned mixedLongBands(const Mp3FrameHeader& header)
{
    return header.isLsf() ? 6 : 8;
}

} // anonymous namespace

Mp3Decoder::Mp3Decoder(unsigned sample_rate, unsigned channels, const DecoderConfig& config)
    : m_sample_rate(sample_rate)
    , m_channels(channels)
    , m_config(config)
    , m_transform(config.max_transform_size, config.transform_path)
    , m_window(channels * kSubbands, 36)
    , m_stereo(channels)
{
    static const unsigned kRates[] = {44100, 48000, 32000, 22050, 24000, 16000, 11025, 12000, 8000};
    if (std::find(std::begin(kRates), std::end(kRates), sample_rate) == std::end(kRates)) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "MP3 does not support a sample rate of " + std::to_string(sample_rate));
    }
    if (channels < 1 || channels > 2) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "MP3 supports 1 or 2 channels, got " + std::to_string(channels));
    }
    m_reservoir.reserve(kMaxReservoir + 2048);
    m_main_data.reserve(kMaxReservoir + 2048);
    reset();
    Debug::log("mp3", "Mp3Decoder::Mp3Decoder() ", sample_rate, " Hz, ", channels, " channel(s)");
}

void Mp3Decoder::reset()
{
    m_reservoir.clear();
    m_main_data.clear();
    m_window.reset();
    for (unsigned ch = 0; ch < 2; ++ch) {
        m_synth_v[ch].assign(1024, 0.0f);
        m_scalefactors[ch] = ScaleFactors();
    }
    std::memset(m_xr, 0, sizeof(m_xr));
    std::memset(m_values, 0, sizeof(m_values));
}

void Mp3Decoder::appendToReservoir(const uint8_t* data, size_t size)
{
    m_reservoir.insert(m_reservoir.end(), data, data + size);
    if (m_reservoir.size() > kMaxReservoir) {
        m_reservoir.erase(m_reservoir.begin(), m_reservoir.end() - kMaxReservoir);
    }
}

size_t Mp3Decoder::decodeLost(float* output, size_t capacity)
{
    size_t samples = maxFrameSamples();
    if (capacity < samples) {
        throw std::invalid_argument("Mp3Decoder: output buffer too small");
    }
    std::fill(output, output + samples, 0.0f);
    return samples;
}

size_t Mp3Decoder::decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity)
{
    Mp3FrameHeader header = Mp3FrameHeader::parse(data, size);
    if (header.sampleRate() != m_sample_rate || header.channels() != m_channels) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "Frame is " + std::to_string(header.sampleRate()) + " Hz/" +
                               std::to_string(header.channels()) + " ch, decoder is " +
                               std::to_string(m_sample_rate) + " Hz/" + std::to_string(m_channels) + " ch");
    }

    // A free-format frame is the whole buffer the caller split off
    const size_t frame_length = header.isFreeFormat() ? std::min(size, header.maxFreeFormatLength())
                                                      : header.frameLength();
    if (size < frame_length) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED,
                               "MP3 frame truncated: " + std::to_string(size) + " of " +
                               std::to_string(frame_length) + " bytes");
    }
    const size_t samples = static_cast<size_t>(header.samplesPerChannel()) * m_channels;
    if (capacity < samples) {
        throw std::invalid_argument("Mp3Decoder: output buffer too small");
    }

    size_t offset = 4;
    uint16_t stored_crc = 0;
    if (header.protection) {
        stored_crc = static_cast<uint16_t>((data[4] << 8) | data[5]);
        offset += 2;
    }
    const size_t side_size = header.sideInfoSize();
    if (offset + side_size > frame_length) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Side information exceeds frame");
    }

    SideInfo side;
    IO::BitReader side_reader(data + offset, side_size);
    parseSideInfo(side_reader, header, side);
    if (header.protection) {
        checkCrc(data, side_size, stored_crc);
    }

    const uint8_t* main = data + offset + side_size;
    const size_t main_size = frame_length - offset - side_size;

    if (side.main_data_begin > m_reservoir.size()) {
        DEBUG_LOG("mp3", "main_data_begin ", side.main_data_begin, " but reservoir holds ",
                  m_reservoir.size(), " bytes");
        std::string message = "main_data_begin " + std::to_string(side.main_data_begin) +
                              " exceeds reservoir of " + std::to_string(m_reservoir.size()) + " bytes";
        appendToReservoir(main, main_size);
        std::fill(output, output + samples, 0.0f);
        throw DecoderException(DecoderError::RESERVOIR_UNDERFLOW, message, samples);
    }

    m_main_data.assign(m_reservoir.end() - side.main_data_begin, m_reservoir.end());
    m_main_data.insert(m_main_data.end(), main, main + main_size);
    appendToReservoir(main, main_size);

    IO::BitReader reader(m_main_data.data(), m_main_data.size());
    const size_t main_bits = m_main_data.size() * 8;

    for (unsigned gr = 0; gr < header.granules(); ++gr) {
        for (unsigned ch = 0; ch < m_channels; ++ch) {
            GranuleInfo& info = side.granule[gr][ch];
            const size_t part_start = reader.bitPosition();
            const size_t part_end = part_start + info.part2_3_length;
            if (part_end > main_bits) {
                throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED,
                                       "part2_3_length runs past the main data");
            }

            readScaleFactors(reader, header, side, gr, ch, info, m_scalefactors[ch]);
            if (reader.bitPosition() > part_end) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       "Scalefactors longer than part2_3_length");
            }
            decodeHuffman(reader, part_end, header, info, m_values[ch]);
            reader.seekBits(part_end);
            requantize(header, info, m_scalefactors[ch], m_values[ch], m_xr[ch]);
        }

        if (m_channels == 2) {
            processStereo(header, side.granule[gr][1], m_scalefactors[1]);
        }

        for (unsigned ch = 0; ch < m_channels; ++ch) {
            const GranuleInfo& info = side.granule[gr][ch];
            reorder(header, info, m_xr[ch]);
            antialias(info, m_xr[ch]);
            hybridSynthesis(ch, info, m_xr[ch]);
            polyphaseSynthesis(ch, output + static_cast<size_t>(gr) * kGranuleSize * m_channels + ch, m_channels);
        }
    }

    return samples;
}

void Mp3Decoder::checkCrc(const uint8_t* data, size_t side_size, uint16_t stored) const
{
    IO::Crc16 crc;
    crc.update(data + 2, 2);
    crc.update(data + 6, side_size);
    if (crc.value() != stored) {
        if (m_config.strict) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "MP3 frame CRC mismatch");
        }
        Debug::log("mp3", "Mp3Decoder::checkCrc() CRC mismatch, decoding anyway");
    }
}

void Mp3Decoder::parseSideInfo(IO::BitReader& reader, const Mp3FrameHeader& header, SideInfo& side) const
{
    const bool lsf = header.isLsf();
    const unsigned nch = header.channels();

    side.main_data_begin = reader.readBits(lsf ? 8 : 9);
    if (lsf) {
        side.private_bits = reader.readBits(nch == 1 ? 1 : 2);
    } else {
        side.private_bits = reader.readBits(nch == 1 ? 5 : 3);
        for (unsigned ch = 0; ch < nch; ++ch) {
            for (unsigned band = 0; band < 4; ++band) {
                side.scfsi[ch][band] = reader.readBit();
            }
        }
    }

    for (unsigned gr = 0; gr < header.granules(); ++gr) {
        for (unsigned ch = 0; ch < nch; ++ch) {
            GranuleInfo& info = side.granule[gr][ch];
            info.part2_3_length = reader.readBits(12);
            info.big_values = reader.readBits(9);
            if (info.big_values > 288) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       "big_values " + std::to_string(info.big_values) + " exceeds 288");
            }
            info.global_gain = reader.readBits(8);
            info.scalefac_compress = reader.readBits(lsf ? 9 : 4);
            info.window_switching = reader.readBit();
            if (info.window_switching) {
                info.block_type = reader.readBits(2);
                if (info.block_type == 0) {
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                           "block_type 0 with window switching");
                }
                info.mixed_block = reader.readBit();
                for (unsigned r = 0; r < 2; ++r) {
                    info.table_select[r] = reader.readBits(5);
                }
                info.table_select[2] = 0;
                for (unsigned w = 0; w < 3; ++w) {
                    info.subblock_gain[w] = reader.readBits(3);
                }
                info.region0_count = (info.block_type == 2 && !info.mixed_block) ? 8 : 7;
                info.region1_count = 20 - info.region0_count;
            } else {
                info.block_type = 0;
                info.mixed_block = false;
                for (unsigned r = 0; r < 3; ++r) {
                    info.table_select[r] = reader.readBits(5);
                }
                info.region0_count = reader.readBits(4);
                info.region1_count = reader.readBits(3);
            }
            info.preflag = lsf ? false : reader.readBit();
            info.scalefac_scale = reader.readBit();
            info.count1table_select = reader.readBit();
        }
    }
}

void Mp3Decoder::readScaleFactors(IO::BitReader& reader, const Mp3FrameHeader& header, const SideInfo& side,
                                  unsigned gr, unsigned ch, GranuleInfo& info, ScaleFactors& sf)
{
    if (header.isLsf()) {
        readScaleFactorsLsf(reader, header, ch, info, sf);
        return;
    }

    const unsigned slen1 = Tables::kSlen[0][info.scalefac_compress];
    const unsigned slen2 = Tables::kSlen[1][info.scalefac_compress];
    std::fill(std::begin(sf.l_illegal), std::end(sf.l_illegal), uint8_t(7));
    std::fill(std::begin(sf.s_illegal), std::end(sf.s_illegal), uint8_t(7));
    sf.intensity_scale = 0;

    if (info.isShort()) {
        unsigned sfb = 0;
        if (info.mixed_block) {
            for (unsigned b = 0; b < 8; ++b) {
                sf.l[b] = static_cast<uint8_t>(reader.readBits(slen1));
            }
            sfb = 3;
        }
        for (; sfb < 12; ++sfb) {
            unsigned bits = (sfb < 6) ? slen1 : slen2;
            for (unsigned w = 0; w < 3; ++w) {
                sf.s[sfb][w] = static_cast<uint8_t>(reader.readBits(bits));
            }
        }
        sf.s[12][0] = sf.s[12][1] = sf.s[12][2] = 0;
        return;
    }

    // Long blocks: four scfsi groups, reused from granule 0 when flagged
    static const unsigned kGroupBounds[5] = {0, 6, 11, 16, 21};
    for (unsigned group = 0; group < 4; ++group) {
        if (gr == 1 && side.scfsi[ch][group]) {
            continue;
        }
        unsigned bits = (group < 2) ? slen1 : slen2;
        for (unsigned b = kGroupBounds[group]; b < kGroupBounds[group + 1]; ++b) {
            sf.l[b] = static_cast<uint8_t>(reader.readBits(bits));
        }
    }
    sf.l[21] = 0;
}

void Mp3Decoder::readScaleFactorsLsf(IO::BitReader& reader, const Mp3FrameHeader& header, unsigned ch,
                                     GranuleInfo& info, ScaleFactors& sf)
{
    unsigned sfc = info.scalefac_compress;
    unsigned slen[4] = {0, 0, 0, 0};
    unsigned table = 0;
    sf.intensity_scale = 0;
    info.preflag = false;

    if (header.intensityStereo() && ch == 1) {
        sf.intensity_scale = sfc & 1;
        sfc >>= 1;
        if (sfc < 180) {
            slen[0] = sfc / 36;
            slen[1] = (sfc % 36) / 6;
            slen[2] = (sfc % 36) % 6;
            table = 3;
        } else if (sfc < 244) {
            sfc -= 180;
            slen[0] = (sfc & 0x3F) >> 4;
            slen[1] = (sfc & 0x0F) >> 2;
            slen[2] = sfc & 0x03;
            table = 4;
        } else {
            sfc -= 244;
            slen[0] = sfc / 3;
            slen[1] = sfc % 3;
            table = 5;
        }
    } else {
        if (sfc < 400) {
            slen[0] = (sfc >> 4) / 5;
            slen[1] = (sfc >> 4) % 5;
            slen[2] = (sfc & 0x0F) >> 2;
            slen[3] = sfc & 0x03;
            table = 0;
        } else if (sfc < 500) {
            sfc -= 400;
            slen[0] = (sfc >> 2) / 5;
            slen[1] = (sfc >> 2) % 5;
            slen[2] = sfc & 0x03;
            table = 1;
        } else {
            sfc -= 500;
            slen[0] = sfc / 3;
            slen[1] = sfc % 3;
            info.preflag = true;
            table = 2;
        }
    }

    const unsigned layout = info.isShort() ? (info.mixed_block ? 2 : 1) : 0;

    // Read the flat scalefactor list, remembering each value's illegal position
    uint8_t values[39] = {};
    uint8_t illegal[39] = {};
    unsigned count = 0;
    for (unsigned part = 0; part < 4; ++part) {
        unsigned n = Tables::kLsfBandCounts[table][layout][part];
        for (unsigned i = 0; i < n && count < 39; ++i, ++count) {
            values[count] = static_cast<uint8_t>(reader.readBits(slen[part]));
            illegal[count] = static_cast<uint8_t>((1u << slen[part]) - 1);
        }
    }

    unsigned idx = 0;
    if (layout == 0) {
        for (unsigned b = 0; b < 21; ++b, ++idx) {
            sf.l[b] = values[idx];
            sf.l_illegal[b] = illegal[idx];
        }
        sf.l[21] = 0;
        sf.l_illegal[21] = sf.l_illegal[20];
        return;
    }

    unsigned sfb = 0;
    if (layout == 2) {
        for (unsigned b = 0; b < 6; ++b, ++idx) {
            sf.l[b] = values[idx];
            sf.l_illegal[b] = illegal[idx];
        }
        sfb = 3;
    }
    for (; sfb < 12; ++sfb) {
        for (unsigned w = 0; w < 3; ++w, ++idx) {
            sf.s[sfb][w] = values[idx];
        }
        sf.s_illegal[sfb] = illegal[idx - 1];
    }
    sf.s[12][0] = sf.s[12][1] = sf.s[12][2] = 0;
    sf.s_illegal[12] = sf.s_illegal[11];
}

/**
 * @brief Decodes big_values pairs and count1 quadruples up to part_end.
 *
 * Values beyond the decoded region are zero. A quadruple that ends past
 * part_end is discarded, as encoders may pad the last codeword.
 */
void Mp3Decoder::decodeHuffman(IO::BitReader& reader, size_t part_end, const Mp3FrameHeader& header,
                               const GranuleInfo& info, int* values) const
{
    std::fill(values, values + kGranuleSize, 0);
    const BandTable& bands = Tables::bands(header.bandTableIndex());

    unsigned region1_start;
    unsigned region2_start;
    if (info.isShort()) {
        if (!info.mixed_block) {
            region1_start = bands.short_bounds[(info.region0_count + 1) / 3] * 3;
        } else if (!header.isLsf()) {
            region1_start = bands.long_bounds[info.region0_count + 1];
        } else {
            unsigned width = bands.short_bounds[4] - bands.short_bounds[3];
            region1_start = bands.long_bounds[6] + 2 * width;
        }
        region2_start = kGranuleSize;
    } else {
        region1_start = bands.long_bounds[std::min(info.region0_count + 1, 22u)];
        region2_start = bands.long_bounds[std::min(info.region0_count + info.region1_count + 2, 22u)];
    }

    const unsigned big_end = info.big_values * 2;
    region1_start = std::min(region1_start, big_end);
    region2_start = std::min(region2_start, big_end);

    unsigned i = 0;
    for (unsigned region = 0; region < 3; ++region) {
        unsigned region_end = (region == 0) ? region1_start : (region == 1) ? region2_start : big_end;
        if (i >= region_end) {
            continue;
        }
        const BigValueTable& table = Tables::bigValues(info.table_select[region]);
        if (!table.tree) {
            // table 0: everything in the region is zero
            i = region_end;
            continue;
        }
        for (; i < region_end; i += 2) {
            if (reader.bitPosition() >= part_end) {
                throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA,
                                       "big_values region runs past part2_3_length");
            }
            int32_t symbol = table.tree->decode(reader);
            int x = symbol / static_cast<int>(table.dimension);
            int y = symbol % static_cast<int>(table.dimension);
            if (x == 15 && table.linbits) {
                x += static_cast<int>(reader.readBits(table.linbits));
            }
            if (x && reader.readBit()) {
                x = -x;
            }
            if (y == 15 && table.linbits) {
                y += static_cast<int>(reader.readBits(table.linbits));
            }
            if (y && reader.readBit()) {
                y = -y;
            }
            values[i] = x;
            values[i + 1] = y;
        }
    }
    if (reader.bitPosition() > part_end) {
        throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA, "big_values overran part2_3_length");
    }

    const IO::HuffmanTree& quad_tree = Tables::count1(info.count1table_select);
    while (i + 4 <= kGranuleSize && reader.bitPosition() < part_end) {
        int32_t symbol = quad_tree.decode(reader);
        int quad[4];
        for (unsigned q = 0; q < 4; ++q) {
            quad[q] = (symbol >> (3 - q)) & 1;
            if (quad[q] && reader.readBit()) {
                quad[q] = -quad[q];
            }
        }
        if (reader.bitPosition() > part_end) {
            break;
        }
        for (unsigned q = 0; q < 4; ++q) {
            values[i + q] = quad[q];
        }
        i += 4;
    }
}

void Mp3Decoder::requantize(const Mp3FrameHeader& header, const GranuleInfo& info, const ScaleFactors& sf,
                            const int* values, float* xr) const
{
    const BandTable& bands = Tables::bands(header.bandTableIndex());
    const double multiplier = info.scalefac_scale ? 1.0 : 0.5;
    const double global = 0.25 * (static_cast<double>(info.global_gain) - 210.0);

    auto quantized = [](int v) {
        float mag = Tables::pow43(static_cast<unsigned>(v < 0 ? -v : v));
        return v < 0 ? -mag : mag;
    };

    unsigned long_bands = 22;
    unsigned short_start = 13;
    if (info.isShort()) {
        long_bands = info.mixed_block ? mixedLongBands(header) : 0;
        short_start = info.mixed_block ? 3 : 0;
    }

    std::fill(xr, xr + kGranuleSize, 0.0f);

    for (unsigned sfb = 0; sfb < long_bands; ++sfb) {
        unsigned pre = info.preflag ? Tables::kPretab[sfb] : 0;
        double exponent = global - multiplier * (sf.l[sfb] + pre);
        float gain = static_cast<float>(std::pow(2.0, exponent));
        for (unsigned i = bands.long_bounds[sfb]; i < bands.long_bounds[sfb + 1]; ++i) {
            if (values[i]) {
                xr[i] = quantized(values[i]) * gain;
            }
        }
    }

    for (unsigned sfb = short_start; sfb < 13; ++sfb) {
        const unsigned width = bands.short_bounds[sfb + 1] - bands.short_bounds[sfb];
        const unsigned base = bands.short_bounds[sfb] * 3;
        for (unsigned w = 0; w < 3; ++w) {
            double exponent = global - 2.0 * info.subblock_gain[w] - multiplier * sf.s[sfb][w];
            float gain = static_cast<float>(std::pow(2.0, exponent));
            for (unsigned k = 0; k < width; ++k) {
                unsigned i = base + w * width + k;
                if (values[i]) {
                    xr[i] = quantized(values[i]) * gain;
                }
            }
        }
    }
}

void Mp3Decoder::processStereo(const Mp3FrameHeader& header, const GranuleInfo& right_info,
                               const ScaleFactors& right_sf)
{
    const bool ms = header.msStereo();
    const bool intensity = header.intensityStereo();
    if (!ms && !intensity) {
        return;
    }

    float* left = m_xr[0];
    float* right = m_xr[1];
    const BandTable& bands = Tables::bands(header.bandTableIndex());
    const bool lsf = header.isLsf();
    bool is_coded[kGranuleSize] = {};

    auto applyBand = [&](unsigned begin, unsigned end, unsigned is_pos, unsigned illegal) {
        auto gains = Core::StereoProcessor::mp3IntensityGains(is_pos, lsf, right_sf.intensity_scale, illegal);
        if (!gains) {
            return;
        }
        m_stereo.applyIntensity(left, right, begin, end, *gains);
        std::fill(is_coded + begin, is_coded + end, true);
    };

    if (intensity) {
        m_stereo.requireStereo("intensity stereo");
        if (right_info.isShort()) {
            const unsigned start = right_info.mixed_block ? 3 : 0;
            bool short_part_zero = true;
            for (unsigned w = 0; w < 3; ++w) {
                int last = -1;
                for (unsigned sfb = start; sfb < 13; ++sfb) {
                    unsigned width = bands.short_bounds[sfb + 1] - bands.short_bounds[sfb];
                    unsigned base = bands.short_bounds[sfb] * 3 + w * width;
                    for (unsigned k = 0; k < width; ++k) {
                        if (right[base + k] != 0.0f) {
                            last = static_cast<int>(sfb);
                            break;
                        }
                    }
                }
                if (last >= 0) {
                    short_part_zero = false;
                }
                for (unsigned sfb = std::max<int>(last + 1, static_cast<int>(start)); sfb < 13; ++sfb) {
                    unsigned width = bands.short_bounds[sfb + 1] - bands.short_bounds[sfb];
                    unsigned base = bands.short_bounds[sfb] * 3 + w * width;
                    unsigned src = std::min(sfb, 11u);
                    applyBand(base, base + width, right_sf.s[src][w], right_sf.s_illegal[src]);
                }
            }
            if (right_info.mixed_block && short_part_zero) {
                const unsigned long_bands = mixedLongBands(header);
                int last = -1;
                for (unsigned sfb = 0; sfb < long_bands; ++sfb) {
                    for (unsigned i = bands.long_bounds[sfb]; i < bands.long_bounds[sfb + 1]; ++i) {
                        if (right[i] != 0.0f) {
                            last = static_cast<int>(sfb);
                            break;
                        }
                    }
                }
                for (unsigned sfb = static_cast<unsigned>(last + 1); sfb < long_bands; ++sfb) {
                    applyBand(bands.long_bounds[sfb], bands.long_bounds[sfb + 1],
                              right_sf.l[sfb], right_sf.l_illegal[sfb]);
                }
            }
        } else {
            int last = -1;
            for (unsigned sfb = 0; sfb < 22; ++sfb) {
                for (unsigned i = bands.long_bounds[sfb]; i < bands.long_bounds[sfb + 1]; ++i) {
                    if (right[i] != 0.0f) {
                        last = static_cast<int>(sfb);
                        break;
                    }
                }
            }
            for (unsigned sfb = static_cast<unsigned>(last + 1); sfb < 22; ++sfb) {
                unsigned src = std::min(sfb, 20u);
                applyBand(bands.long_bounds[sfb], bands.long_bounds[sfb + 1],
                          right_sf.l[src], right_sf.l_illegal[src]);
            }
        }
    }

    if (ms) {
        const float scale = static_cast<float>(1.0 / std::sqrt(2.0));
        unsigned i = 0;
        while (i < kGranuleSize) {
            if (is_coded[i]) {
                ++i;
                continue;
            }
            unsigned run_end = i;
            while (run_end < kGranuleSize && !is_coded[run_end]) {
                ++run_end;
            }
            m_stereo.applyMidSide(left, right, i, run_end, scale);
            i = run_end;
        }
    }
}

void Mp3Decoder::reorder(const Mp3FrameHeader& header, const GranuleInfo& info, float* xr)
{
    if (!info.isShort()) {
        return;
    }
    const BandTable& bands = Tables::bands(header.bandTableIndex());
    const unsigned start_sfb = info.mixed_block ? 3 : 0;
    const unsigned begin = bands.short_bounds[start_sfb] * 3;

    std::copy(xr + begin, xr + kGranuleSize, m_reorder_tmp + begin);
    for (unsigned sfb = start_sfb; sfb < 13; ++sfb) {
        const unsigned width = bands.short_bounds[sfb + 1] - bands.short_bounds[sfb];
        const unsigned base = bands.short_bounds[sfb] * 3;
        for (unsigned w = 0; w < 3; ++w) {
            for (unsigned k = 0; k < width; ++k) {
                xr[base + 3 * k + w] = m_reorder_tmp[base + w * width + k];
            }
        }
    }
}

void Mp3Decoder::antialias(const GranuleInfo& info, float* xr)
{
    if (info.isShort() && !info.mixed_block) {
        return;
    }
    const unsigned limit = (info.isShort() && info.mixed_block) ? 2 : kSubbands;
    const AntialiasTable& t = antialiasTable();
    for (unsigned sb = 1; sb < limit; ++sb) {
        float* lower = xr + sb * kSlots - 1;
        float* upper = xr + sb * kSlots;
        for (unsigned i = 0; i < 8; ++i) {
            float lo = *(lower - i);
            float hi = upper[i];
            *(lower - i) = lo * t.cs[i] - hi * t.ca[i];
            upper[i] = hi * t.cs[i] + lo * t.ca[i];
        }
    }
}

void Mp3Decoder::hybridSynthesis(unsigned ch, const GranuleInfo& info, const float* xr)
{
    float pcm[kSlots];
    for (unsigned sb = 0; sb < kSubbands; ++sb) {
        unsigned block_type = info.window_switching ? info.block_type : 0;
        if (info.mixed_block && sb < 2) {
            block_type = 0;
        }

        const float* in = xr + sb * kSlots;
        if (block_type == 2) {
            // Three 12-point transforms laid out one after another
            for (unsigned w = 0; w < 3; ++w) {
                for (unsigned k = 0; k < 6; ++k) {
                    m_imdct_in[k] = in[3 * k + w];
                }
                m_transform.imdct(m_imdct_in, m_imdct_out + 12 * w, 12);
            }
        } else {
            m_transform.imdct(in, m_imdct_out, 36);
        }

        m_window.applyAndOverlap(ch * kSubbands + sb, m_imdct_out, Core::Mp3Window{block_type}, pcm);

        for (unsigned t = 0; t < kSlots; ++t) {
            // Frequency inversion of odd subbands
            float v = pcm[t];
            if ((sb & 1) && (t & 1)) {
                v = -v;
            }
            m_subband_samples[ch][t][sb] = v;
        }
    }
}

void Mp3Decoder::polyphaseSynthesis(unsigned ch, float* output, size_t stride)
{
    const auto& n = synthesisMatrix();
    const float* d = Tables::kSynthesisWindow;
    float* v = m_synth_v[ch].data();

    for (unsigned t = 0; t < kSlots; ++t) {
        const float* s = m_subband_samples[ch][t];
        std::memmove(v + 64, v, 960 * sizeof(float));
        for (unsigned i = 0; i < 64; ++i) {
            float sum = 0.0f;
            for (unsigned k = 0; k < kSubbands; ++k) {
                sum += n[i][k] * s[k];
            }
            v[i] = sum;
        }
        for (unsigned j = 0; j < kSubbands; ++j) {
            float sum = 0.0f;
            for (unsigned i = 0; i < 8; ++i) {
                sum += v[128 * i + j] * d[64 * i + j];
                sum += v[128 * i + 96 + j] * d[64 * i + 32 + j];
            }
            output[(t * kSubbands + j) * stride] = sum;
        }
    }
}

} // namespace MP3
} // namespace Codec
} // namespace PsyDec
