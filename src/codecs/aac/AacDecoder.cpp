/*
 * AacDecoder.cpp - MPEG-4 AAC-LC decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace AAC {

namespace {

constexpr unsigned kFrameLength = 1024;
constexpr unsigned kShortLength = 128;
constexpr int kScalefactorOffset = 100;
constexpr unsigned kMaxTnsOrderLong = 20;
constexpr unsigned kMaxTnsOrderShort = 7;

// Quantized spectra are in 16-bit PCM units
constexpr float kPcmScale = 1.0f / 32768.0f;

bool isIntensity(unsigned band_type)
{
    return band_type == INTENSITY_HCB || band_type == INTENSITY_HCB2;
}

bool isNoise(unsigned band_type)
{
    return band_type == NOISE_HCB;
}

// Intensity bands only make sense in the right channel of a pair
void rejectIntensity(const ChannelStream& cs, const char* element)
{
    for (unsigned g = 0; g < cs.ics.num_window_groups; ++g) {
        for (unsigned sfb = 0; sfb < cs.ics.max_sfb; ++sfb) {
            if (isIntensity(cs.band_type[g][sfb])) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       std::string("Intensity stereo band in ") + element);
            }
        }
    }
}

// Inverse quantization of one TNS coefficient (ISO/IEC 14496-3 4.6.9.3)
float tnsParcor(int value, unsigned coef_res_bits)
{
    double iqfac = ((1 << (coef_res_bits - 1)) - 0.5) / (M_PI / 2.0);
    double iqfac_m = ((1 << (coef_res_bits - 1)) + 0.5) / (M_PI / 2.0);
    return static_cast<float>(std::sin(value / (value >= 0 ? iqfac : iqfac_m)));
}

} // anonymous namespace

AacDecoder::AacDecoder(const AudioSpecificConfig& asc, const DecoderConfig& config, bool adts)
    : m_asc(asc)
    , m_config(config)
    , m_adts(adts)
    , m_channels(asc.channels())
    , m_swb(Tables::swb(asc.sf_index < 13 ? asc.sf_index : 0))
    , m_transform(config.max_transform_size, config.transform_path)
    , m_window(std::max(1u, asc.channels()), 2 * kFrameLength)
    , m_stereo(std::max(1u, asc.channels()))
    , m_random_state(0x1f2e3d4c)
{
    m_asc.validate();
    if (config.max_transform_size < 2 * kFrameLength) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "AAC needs a transform size of at least 2048");
    }
    m_streams[0] = std::make_unique<ChannelStream>();
    m_streams[1] = std::make_unique<ChannelStream>();
    m_time.assign(2 * kFrameLength, 0.0f);
    m_pcm.assign(kFrameLength, 0.0f);
    m_previous_shape.assign(m_channels, Core::WindowShape::SINE);
    Debug::log("aac", "AacDecoder::AacDecoder() ", m_asc.sample_rate, " Hz, ", m_channels,
               " channel(s)", adts ? ", ADTS framing" : "");
}

void AacDecoder::reset()
{
    m_window.reset();
    std::fill(m_previous_shape.begin(), m_previous_shape.end(), Core::WindowShape::SINE);
    m_random_state = 0x1f2e3d4c;
}

uint32_t AacDecoder::nextRandom()
{
    m_random_state = m_random_state * 1664525u + 1013904223u;
    return m_random_state;
}

size_t AacDecoder::decodeLost(float* output, size_t capacity)
{
    size_t samples = static_cast<size_t>(kFrameLength) * m_channels;
    if (capacity < samples) {
        throw std::invalid_argument("AacDecoder: output buffer too small");
    }
    for (unsigned ch = 0; ch < m_channels; ++ch) {
        flushChannel(ch, output);
    }
    return samples;
}

size_t AacDecoder::decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity)
{
    if (!data || size == 0) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "Empty AAC frame");
    }

    if (!m_adts) {
        if (capacity < static_cast<size_t>(kFrameLength) * m_channels) {
            throw std::invalid_argument("AacDecoder: output buffer too small");
        }
        IO::BitReader reader(data, size);
        return decodeRawDataBlock(reader, output);
    }

    AdtsHeader header = AdtsHeader::parse(data, size);
    if (header.sf_index != m_asc.sf_index || header.channel_config != m_asc.channel_config ||
        header.profile + 1 != kObjectTypeLC) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "ADTS header does not match the decoder configuration");
    }
    if (header.frame_length > size) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED,
                               "ADTS frame truncated: " + std::to_string(size) + " of " +
                               std::to_string(header.frame_length) + " bytes");
    }
    const size_t samples = static_cast<size_t>(kFrameLength) * m_channels * header.raw_data_blocks;
    if (capacity < samples) {
        throw std::invalid_argument("AacDecoder: output buffer too small");
    }

    IO::BitReader reader(data, header.frame_length);
    reader.skipBits(56);
    if (!header.protection_absent) {
        // raw_data_block_position[] for multi-block frames, then the header CRC
        if (header.raw_data_blocks > 1) {
            reader.skipBits(16 * (header.raw_data_blocks - 1));
        }
        reader.skipBits(16);
    }

    size_t written = 0;
    for (unsigned block = 0; block < header.raw_data_blocks; ++block) {
        written += decodeRawDataBlock(reader, output + written);
        if (!header.protection_absent && header.raw_data_blocks > 1) {
            reader.skipBits(16);    // adts_raw_data_block_error_check
        }
    }
    return written;
}

size_t AacDecoder::decodeRawDataBlock(IO::BitReader& reader, float* output)
{
    std::vector<bool> produced(m_channels, false);
    unsigned next_channel = 0;

    for (;;) {
        ElementId id = static_cast<ElementId>(reader.readBits(3));
        if (id == ElementId::END) {
            break;
        }

        switch (id) {
            case ElementId::SCE:
            case ElementId::LFE: {
                reader.readBits(4);             // element_instance_tag
                if (next_channel >= m_channels) {
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                           "More channel elements than configured channels");
                }
                ChannelStream& cs = *m_streams[0];
                readChannelStream(reader, cs, false);
                rejectIntensity(cs, id == ElementId::LFE ? "LFE element" : "single channel element");
                if (id == ElementId::LFE && cs.ics.isShort()) {
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "LFE element with short windows");
                }
                dequantize(cs);
                applyNoise(cs, nullptr, nullptr);
                applyTns(cs);
                synthesize(next_channel, cs, output);
                produced[next_channel] = true;
                ++next_channel;
                break;
            }

            case ElementId::CPE: {
                reader.readBits(4);
                if (next_channel + 2 > m_channels) {
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                           "Channel pair element exceeds configured channels");
                }
                ChannelStream& left = *m_streams[0];
                ChannelStream& right = *m_streams[1];
                bool common_window = reader.readBit();
                unsigned ms_mask_present = 0;
                uint8_t ms_used[8][64] = {};
                if (common_window) {
                    readIcsInfo(reader, left.ics);
                    right.ics = left.ics;
                    ms_mask_present = reader.readBits(2);
                    if (ms_mask_present == 3) {
                        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Reserved ms_mask_present value");
                    }
                    for (unsigned g = 0; g < left.ics.num_window_groups; ++g) {
                        for (unsigned sfb = 0; sfb < left.ics.max_sfb; ++sfb) {
                            ms_used[g][sfb] = (ms_mask_present == 1) ? reader.readBit() : (ms_mask_present == 2);
                        }
                    }
                }
                readChannelStream(reader, left, common_window);
                readChannelStream(reader, right, common_window);
                rejectIntensity(left, "left channel of a pair");

                dequantize(left);
                dequantize(right);
                applyNoise(left, nullptr, nullptr);
                applyNoise(right, ms_mask_present ? &left : nullptr, ms_used);
                applyJointStereo(left, right, ms_mask_present, ms_used);
                applyTns(left);
                applyTns(right);
                synthesize(next_channel, left, output);
                synthesize(next_channel + 1, right, output);
                produced[next_channel] = produced[next_channel + 1] = true;
                next_channel += 2;
                break;
            }

            case ElementId::CCE:
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       "Coupling channel elements are not supported");

            case ElementId::DSE:
                skipDataStream(reader);
                break;

            case ElementId::PCE: {
                ProgramConfig pce = ProgramConfig::parse(reader);
                Debug::log("aac", "AacDecoder::decodeRawDataBlock() in-band PCE with ", pce.channels, " channel(s)");
                break;
            }

            case ElementId::FIL:
                skipFill(reader);
                break;

            case ElementId::END:
                break;
        }
    }
    reader.byteAlign();

    for (unsigned ch = 0; ch < m_channels; ++ch) {
        if (!produced[ch]) {
            if (m_config.strict) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       "Frame carries no element for channel " + std::to_string(ch));
            }
            flushChannel(ch, output);
        }
    }
    return static_cast<size_t>(kFrameLength) * m_channels;
}

void AacDecoder::skipDataStream(IO::BitReader& reader)
{
    reader.readBits(4);
    bool align = reader.readBit();
    unsigned count = reader.readBits(8);
    if (count == 255) {
        count += reader.readBits(8);
    }
    if (align) {
        reader.byteAlign();
    }
    reader.skipBits(8 * static_cast<size_t>(count));
}

void AacDecoder::skipFill(IO::BitReader& reader)
{
    unsigned count = reader.readBits(4);
    if (count == 15) {
        count += reader.readBits(8) - 1;
    }
    reader.skipBits(8 * static_cast<size_t>(count));
}

void AacDecoder::readIcsInfo(IO::BitReader& reader, IcsInfo& ics) const
{
    if (reader.readBit()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "ics_reserved_bit set");
    }
    ics.window_sequence = static_cast<Core::AacWindow::Sequence>(reader.readBits(2));
    ics.window_shape = reader.readBit() ? Core::WindowShape::KBD : Core::WindowShape::SINE;

    if (ics.isShort()) {
        ics.max_sfb = reader.readBits(4);
        unsigned grouping = reader.readBits(7);
        ics.num_windows = 8;
        ics.num_window_groups = 1;
        std::fill(std::begin(ics.window_group_length), std::end(ics.window_group_length), 0u);
        ics.window_group_length[0] = 1;
        for (unsigned w = 0; w < 7; ++w) {
            if (grouping & (1u << (6 - w))) {
                ++ics.window_group_length[ics.num_window_groups - 1];
            } else {
                ics.window_group_length[ics.num_window_groups++] = 1;
            }
        }
        ics.num_swb = m_swb.short_count;
        ics.swb_offset = m_swb.short_offsets;
    } else {
        ics.max_sfb = reader.readBits(6);
        if (reader.readBit()) {
            throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Prediction is not allowed in AAC-LC");
        }
        ics.num_windows = 1;
        ics.num_window_groups = 1;
        std::fill(std::begin(ics.window_group_length), std::end(ics.window_group_length), 0u);
        ics.window_group_length[0] = 1;
        ics.num_swb = m_swb.long_count;
        ics.swb_offset = m_swb.long_offsets;
    }

    if (ics.max_sfb > ics.num_swb) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "max_sfb " + std::to_string(ics.max_sfb) + " exceeds " +
                               std::to_string(ics.num_swb) + " bands");
    }
}

void AacDecoder::readChannelStream(IO::BitReader& reader, ChannelStream& cs, bool common_window) const
{
    cs.global_gain = reader.readBits(8);
    if (!common_window) {
        readIcsInfo(reader, cs.ics);
    }
    readSectionData(reader, cs);
    readScalefactors(reader, cs);

    cs.pulse_present = reader.readBit();
    if (cs.pulse_present) {
        readPulseData(reader, cs);
    }
    cs.tns_present = reader.readBit();
    if (cs.tns_present) {
        readTnsData(reader, cs);
    }
    if (reader.readBit()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Gain control is not allowed in AAC-LC");
    }
    readSpectralData(reader, cs);
}

void AacDecoder::readSectionData(IO::BitReader& reader, ChannelStream& cs) const
{
    const IcsInfo& ics = cs.ics;
    const unsigned len_bits = ics.isShort() ? 3 : 5;
    const unsigned escape = (1u << len_bits) - 1;

    for (unsigned g = 0; g < ics.num_window_groups; ++g) {
        unsigned k = 0;
        while (k < ics.max_sfb) {
            unsigned book = reader.readBits(4);
            if (book == 12) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Reserved section codebook 12");
            }
            unsigned length = 0;
            unsigned incr;
            do {
                incr = reader.readBits(len_bits);
                length += incr;
            } while (incr == escape);
            if (k + length > ics.max_sfb) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Section runs past max_sfb");
            }
            for (unsigned sfb = k; sfb < k + length; ++sfb) {
                cs.band_type[g][sfb] = static_cast<uint8_t>(book);
            }
            k += length;
        }
        for (unsigned sfb = ics.max_sfb; sfb < 64; ++sfb) {
            cs.band_type[g][sfb] = ZERO_HCB;
        }
    }
}

void AacDecoder::readScalefactors(IO::BitReader& reader, ChannelStream& cs) const
{
    const IO::HuffmanTree& tree = Tables::scalefactor();
    int gain = static_cast<int>(cs.global_gain);
    int intensity_position = 0;
    int noise_energy = static_cast<int>(cs.global_gain) - 90;
    bool noise_pcm = true;

    for (unsigned g = 0; g < cs.ics.num_window_groups; ++g) {
        for (unsigned sfb = 0; sfb < cs.ics.max_sfb; ++sfb) {
            unsigned type = cs.band_type[g][sfb];
            if (type == ZERO_HCB) {
                cs.scalefactor[g][sfb] = 0;
            } else if (isIntensity(type)) {
                intensity_position += tree.decode(reader) - 60;
                cs.scalefactor[g][sfb] = intensity_position;
            } else if (isNoise(type)) {
                if (noise_pcm) {
                    noise_pcm = false;
                    noise_energy += static_cast<int>(reader.readBits(9)) - 256;
                } else {
                    noise_energy += tree.decode(reader) - 60;
                }
                cs.scalefactor[g][sfb] = noise_energy;
            } else {
                gain += tree.decode(reader) - 60;
                if (gain < 0 || gain > 255) {
                    throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                           "Scalefactor " + std::to_string(gain) + " out of range");
                }
                cs.scalefactor[g][sfb] = gain;
            }
        }
    }
}

void AacDecoder::readPulseData(IO::BitReader& reader, ChannelStream& cs) const
{
    if (cs.ics.isShort()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Pulse data with short windows");
    }
    cs.pulse_count = reader.readBits(2) + 1;
    cs.pulse_start_sfb = reader.readBits(6);
    if (cs.pulse_start_sfb >= cs.ics.num_swb) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "pulse_start_sfb out of range");
    }
    for (unsigned i = 0; i < cs.pulse_count; ++i) {
        cs.pulse_offset[i] = reader.readBits(5);
        cs.pulse_amp[i] = reader.readBits(4);
    }
}

void AacDecoder::readTnsData(IO::BitReader& reader, ChannelStream& cs) const
{
    const bool is_short = cs.ics.isShort();
    const unsigned max_order = is_short ? kMaxTnsOrderShort : kMaxTnsOrderLong;
    TnsData& tns = cs.tns;

    for (unsigned w = 0; w < cs.ics.num_windows; ++w) {
        tns.n_filt[w] = reader.readBits(is_short ? 1 : 2);
        if (tns.n_filt[w] == 0) {
            continue;
        }
        unsigned coef_res_bits = reader.readBit() ? 4 : 3;
        for (unsigned f = 0; f < tns.n_filt[w]; ++f) {
            TnsFilter& filter = tns.filter[w][f];
            filter.length = reader.readBits(is_short ? 4 : 6);
            filter.order = reader.readBits(is_short ? 3 : 5);
            if (filter.order > max_order) {
                throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                                       "TNS order " + std::to_string(filter.order) + " exceeds " +
                                       std::to_string(max_order));
            }
            if (filter.order == 0) {
                continue;
            }
            filter.downward = reader.readBit();
            unsigned compress = reader.readBit();
            unsigned bits = coef_res_bits - compress;

            float parcor[kMaxTnsOrderLong];
            for (unsigned i = 0; i < filter.order; ++i) {
                parcor[i] = tnsParcor(reader.readBitsSigned(bits), coef_res_bits);
            }

            // Reflection coefficients to direct form
            float tmp[kMaxTnsOrderLong + 1];
            filter.lpc[0] = 1.0f;
            for (unsigned m = 1; m <= filter.order; ++m) {
                for (unsigned i = 1; i < m; ++i) {
                    tmp[i] = filter.lpc[i] + parcor[m - 1] * filter.lpc[m - i];
                }
                for (unsigned i = 1; i < m; ++i) {
                    filter.lpc[i] = tmp[i];
                }
                filter.lpc[m] = parcor[m - 1];
            }
        }
    }
}

void AacDecoder::readSpectralData(IO::BitReader& reader, ChannelStream& cs) const
{
    const IcsInfo& ics = cs.ics;
    std::fill(std::begin(cs.quantized), std::end(cs.quantized), 0);

    unsigned window = 0;
    for (unsigned g = 0; g < ics.num_window_groups; ++g) {
        for (unsigned sfb = 0; sfb < ics.max_sfb; ++sfb) {
            unsigned type = cs.band_type[g][sfb];
            if (type == ZERO_HCB || isNoise(type) || isIntensity(type)) {
                continue;
            }
            const SpectralCodebook& book = Tables::spectral(type);
            const unsigned start = ics.swb_offset[sfb];
            const unsigned end = ics.swb_offset[sfb + 1];

            for (unsigned w = 0; w < ics.window_group_length[g]; ++w) {
                int* q = cs.quantized + (window + w) * ics.windowLength();
                for (unsigned k = start; k < end; k += book.dimension) {
                    int index = book.tree->decode(reader);
                    int values[4];
                    for (int i = static_cast<int>(book.dimension) - 1; i >= 0; --i) {
                        int v = index % static_cast<int>(book.modulo);
                        index /= static_cast<int>(book.modulo);
                        values[i] = book.is_signed ? v - static_cast<int>(book.modulo / 2) : v;
                    }
                    if (!book.is_signed) {
                        for (unsigned i = 0; i < book.dimension; ++i) {
                            if (values[i] != 0 && reader.readBit()) {
                                values[i] = -values[i];
                            }
                        }
                    }
                    if (type == ESC_HCB) {
                        for (unsigned i = 0; i < book.dimension; ++i) {
                            if (std::abs(values[i]) != 16) {
                                continue;
                            }
                            unsigned prefix = 0;
                            while (reader.readBit()) {
                                if (++prefix > 8) {
                                    throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA,
                                                           "Escape sequence longer than 13 bits");
                                }
                            }
                            int magnitude = static_cast<int>((1u << (prefix + 4)) + reader.readBits(prefix + 4));
                            values[i] = values[i] < 0 ? -magnitude : magnitude;
                        }
                    }
                    for (unsigned i = 0; i < book.dimension; ++i) {
                        q[k + i] = values[i];
                    }
                }
            }
        }
        window += ics.window_group_length[g];
    }

    if (cs.pulse_present) {
        unsigned k = ics.swb_offset[cs.pulse_start_sfb];
        for (unsigned i = 0; i < cs.pulse_count; ++i) {
            k += cs.pulse_offset[i];
            if (k >= kFrameLength) {
                throw DecoderException(DecoderError::CORRUPT_SPECTRAL_DATA, "Pulse position beyond the spectrum");
            }
            int amp = static_cast<int>(cs.pulse_amp[i]);
            cs.quantized[k] += (cs.quantized[k] > 0) ? amp : -amp;
        }
    }
}

void AacDecoder::dequantize(ChannelStream& cs)
{
    const IcsInfo& ics = cs.ics;
    std::fill(std::begin(cs.coef), std::end(cs.coef), 0.0f);

    unsigned window = 0;
    for (unsigned g = 0; g < ics.num_window_groups; ++g) {
        for (unsigned w = 0; w < ics.window_group_length[g]; ++w) {
            const size_t base = static_cast<size_t>(window + w) * ics.windowLength();
            for (unsigned sfb = 0; sfb < ics.max_sfb; ++sfb) {
                unsigned type = cs.band_type[g][sfb];
                if (type == ZERO_HCB || isNoise(type) || isIntensity(type)) {
                    continue;
                }
                float gain = static_cast<float>(std::pow(2.0, 0.25 * (cs.scalefactor[g][sfb] - kScalefactorOffset)));
                for (unsigned k = ics.swb_offset[sfb]; k < ics.swb_offset[sfb + 1]; ++k) {
                    int q = cs.quantized[base + k];
                    float magnitude = Tables::pow43(static_cast<unsigned>(std::abs(q))) * gain;
                    cs.coef[base + k] = q < 0 ? -magnitude : magnitude;
                }
            }
        }
        window += ics.window_group_length[g];
    }
}

/**
 * @brief Perceptual noise substitution.
 *
 * Each noise band is filled with uniform noise scaled to an energy of
 * 2^(noise_energy / 2). When both channels of a pair code a band as noise
 * and the band is M/S flagged, the right channel reuses the left noise.
 */
void AacDecoder::applyNoise(ChannelStream& cs, const ChannelStream* correlated_with, const uint8_t (*ms_used)[64])
{
    const IcsInfo& ics = cs.ics;
    unsigned window = 0;
    for (unsigned g = 0; g < ics.num_window_groups; ++g) {
        for (unsigned w = 0; w < ics.window_group_length[g]; ++w) {
            const size_t base = static_cast<size_t>(window + w) * ics.windowLength();
            for (unsigned sfb = 0; sfb < ics.max_sfb; ++sfb) {
                if (!isNoise(cs.band_type[g][sfb])) {
                    continue;
                }
                const unsigned start = ics.swb_offset[sfb];
                const unsigned end = ics.swb_offset[sfb + 1];

                if (correlated_with && ms_used && ms_used[g][sfb] && isNoise(correlated_with->band_type[g][sfb])) {
                    float ratio = static_cast<float>(
                        std::pow(2.0, 0.25 * (cs.scalefactor[g][sfb] - correlated_with->scalefactor[g][sfb])));
                    for (unsigned k = start; k < end; ++k) {
                        cs.coef[base + k] = correlated_with->coef[base + k] * ratio;
                    }
                    continue;
                }

                float energy = 0.0f;
                for (unsigned k = start; k < end; ++k) {
                    float r = static_cast<float>(static_cast<int32_t>(nextRandom()));
                    cs.coef[base + k] = r;
                    energy += r * r;
                }
                float scale = static_cast<float>(std::pow(2.0, 0.25 * cs.scalefactor[g][sfb])) /
                              std::sqrt(std::max(energy, 1e-30f));
                for (unsigned k = start; k < end; ++k) {
                    cs.coef[base + k] *= scale;
                }
            }
        }
        window += ics.window_group_length[g];
    }
}

void AacDecoder::applyJointStereo(ChannelStream& left, ChannelStream& right, unsigned ms_mask_present,
                                  const uint8_t (*ms_used)[64])
{
    const IcsInfo& ics = right.ics;
    bool has_intensity = false;
    for (unsigned g = 0; g < ics.num_window_groups && !has_intensity; ++g) {
        for (unsigned sfb = 0; sfb < ics.max_sfb; ++sfb) {
            if (isIntensity(right.band_type[g][sfb])) {
                has_intensity = true;
                break;
            }
        }
    }
    if (has_intensity && (left.ics.isShort() != ics.isShort() || left.ics.max_sfb < ics.max_sfb)) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO,
                               "Intensity stereo across mismatched channel layouts");
    }
    if (ms_mask_present == 0 && !has_intensity) {
        return;
    }

    unsigned window = 0;
    for (unsigned g = 0; g < ics.num_window_groups; ++g) {
        for (unsigned w = 0; w < ics.window_group_length[g]; ++w) {
            const size_t base = static_cast<size_t>(window + w) * ics.windowLength();
            for (unsigned sfb = 0; sfb < ics.max_sfb; ++sfb) {
                const size_t start = base + ics.swb_offset[sfb];
                const size_t end = base + ics.swb_offset[sfb + 1];
                unsigned right_type = right.band_type[g][sfb];
                bool ms = ms_mask_present && ms_used[g][sfb];

                if (isIntensity(right_type)) {
                    int sign = (right_type == INTENSITY_HCB) ? 1 : -1;
                    if (ms) {
                        sign = -sign;
                    }
                    Core::IntensityGains gains = Core::StereoProcessor::aacIntensityGains(right.scalefactor[g][sfb], sign);
                    m_stereo.applyIntensity(left.coef, right.coef, start, end, gains);
                } else if (ms && !isNoise(right_type) && !isNoise(left.band_type[g][sfb])) {
                    m_stereo.applyMidSide(left.coef, right.coef, start, end, 1.0f);
                }
            }
        }
        window += ics.window_group_length[g];
    }
}

void AacDecoder::applyTns(ChannelStream& cs) const
{
    if (!cs.tns_present) {
        return;
    }
    const IcsInfo& ics = cs.ics;
    const unsigned max_bands = ics.isShort() ? m_swb.tns_max_bands_short : m_swb.tns_max_bands_long;
    const unsigned limit = std::min(max_bands, ics.max_sfb);

    for (unsigned w = 0; w < ics.num_windows; ++w) {
        float* spec = cs.coef + static_cast<size_t>(w) * ics.windowLength();
        unsigned bottom = ics.num_swb;
        for (unsigned f = 0; f < cs.tns.n_filt[w]; ++f) {
            const TnsFilter& filter = cs.tns.filter[w][f];
            unsigned top = bottom;
            bottom = top > filter.length ? top - filter.length : 0;
            if (filter.order == 0) {
                continue;
            }
            unsigned start = ics.swb_offset[std::min(bottom, limit)];
            unsigned end = ics.swb_offset[std::min(top, limit)];
            if (end <= start) {
                continue;
            }

            // All-pole filter run across frequency
            float state[kMaxTnsOrderLong] = {};
            const unsigned size = end - start;
            for (unsigned i = 0; i < size; ++i) {
                unsigned k = filter.downward ? end - 1 - i : start + i;
                float y = spec[k];
                for (unsigned j = 0; j < filter.order; ++j) {
                    y -= filter.lpc[j + 1] * state[j];
                }
                for (unsigned j = filter.order - 1; j > 0; --j) {
                    state[j] = state[j - 1];
                }
                state[0] = y;
                spec[k] = y;
            }
        }
    }
}

void AacDecoder::synthesize(unsigned channel, ChannelStream& cs, float* output)
{
    const IcsInfo& ics = cs.ics;
    if (ics.isShort()) {
        const float scale = 2.0f / (2 * kShortLength) * kPcmScale;
        for (unsigned w = 0; w < 8; ++w) {
            m_transform.imdct(cs.coef + w * kShortLength, m_time.data() + w * 2 * kShortLength,
                              2 * kShortLength, scale);
        }
    } else {
        const float scale = 2.0f / (2 * kFrameLength) * kPcmScale;
        m_transform.imdct(cs.coef, m_time.data(), 2 * kFrameLength, scale);
    }

    Core::AacWindow window;
    window.sequence = ics.window_sequence;
    window.previous_shape = m_previous_shape[channel];
    window.shape = ics.window_shape;
    window.frame_length = kFrameLength;
    size_t count = m_window.applyAndOverlap(channel, m_time.data(), window, m_pcm.data());
    m_previous_shape[channel] = ics.window_shape;

    for (size_t i = 0; i < count; ++i) {
        output[i * m_channels + channel] = m_pcm[i];
    }
}

void AacDecoder::flushChannel(unsigned channel, float* output)
{
    std::fill(m_time.begin(), m_time.end(), 0.0f);
    Core::AacWindow window;
    window.previous_shape = m_previous_shape[channel];
    window.shape = m_previous_shape[channel];
    size_t count = m_window.applyAndOverlap(channel, m_time.data(), window, m_pcm.data());
    for (size_t i = 0; i < count; ++i) {
        output[i * m_channels + channel] = m_pcm[i];
    }
}

} // namespace AAC
} // namespace Codec
} // namespace PsyDec
