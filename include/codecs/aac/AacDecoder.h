/*
 * AacDecoder.h - MPEG-4 AAC-LC decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AACDECODER_H
#define AACDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace AAC {

// Syntactic element ids of raw_data_block()
enum class ElementId : unsigned {
    SCE = 0,
    CPE = 1,
    CCE = 2,
    LFE = 3,
    DSE = 4,
    PCE = 5,
    FIL = 6,
    END = 7
};

struct IcsInfo {
    Core::AacWindow::Sequence window_sequence = Core::AacWindow::ONLY_LONG;
    Core::WindowShape window_shape = Core::WindowShape::SINE;
    unsigned max_sfb = 0;
    unsigned num_windows = 1;
    unsigned num_window_groups = 1;
    unsigned window_group_length[8] = {1, 0, 0, 0, 0, 0, 0, 0};
    unsigned num_swb = 0;
    const uint16_t* swb_offset = nullptr;   // num_swb + 1 entries

    bool isShort() const { return window_sequence == Core::AacWindow::EIGHT_SHORT; }
    unsigned windowLength() const { return isShort() ? 128 : 1024; }
};

struct TnsFilter {
    unsigned length = 0;
    unsigned order = 0;
    bool downward = false;
    float lpc[21] = {};                     // lpc[0] == 1
};

struct TnsData {
    unsigned n_filt[8] = {};
    TnsFilter filter[8][3];
};

// One individual_channel_stream()
struct ChannelStream {
    unsigned global_gain = 0;
    IcsInfo ics;
    uint8_t band_type[8][64] = {};          // [group][sfb]
    int scalefactor[8][64] = {};            // gain, intensity position or noise energy
    bool pulse_present = false;
    unsigned pulse_start_sfb = 0;
    unsigned pulse_count = 0;
    unsigned pulse_offset[4] = {};
    unsigned pulse_amp[4] = {};
    bool tns_present = false;
    TnsData tns;
    int quantized[1024] = {};
    float coef[1024] = {};                  // short windows: window w at w * 128
};

/**
 * @brief Decoder for raw AAC-LC access units or ADTS frames.
 *
 * Syntactic elements are mapped to output channels in the order they
 * appear: an SCE or LFE takes one channel, a CPE two. Every frame produces
 * 1024 samples per channel (per raw data block for ADTS); channels the
 * frame leaves out are flushed with silence so their overlap state stays
 * continuous.
 */
class AacDecoder {
public:
    AacDecoder(const AudioSpecificConfig& asc, const DecoderConfig& config, bool adts = false);

    size_t decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity);
    size_t decodeLost(float* output, size_t capacity);
    void reset();

    unsigned sampleRate() const { return m_asc.sample_rate; }
    unsigned channels() const { return m_channels; }
    size_t maxFrameSamples() const { return 1024 * static_cast<size_t>(m_channels) * (m_adts ? 4 : 1); }
    const AudioSpecificConfig& config() const { return m_asc; }

private:
    size_t decodeRawDataBlock(IO::BitReader& reader, float* output);

    void readIcsInfo(IO::BitReader& reader, IcsInfo& ics) const;
    void readChannelStream(IO::BitReader& reader, ChannelStream& cs, bool common_window) const;
    void readSectionData(IO::BitReader& reader, ChannelStream& cs) const;
    void readScalefactors(IO::BitReader& reader, ChannelStream& cs) const;
    void readPulseData(IO::BitReader& reader, ChannelStream& cs) const;
    void readTnsData(IO::BitReader& reader, ChannelStream& cs) const;
    void readSpectralData(IO::BitReader& reader, ChannelStream& cs) const;
    void dequantize(ChannelStream& cs);
    void applyNoise(ChannelStream& cs, const ChannelStream* correlated_with, const uint8_t (*ms_used)[64]);
    void applyJointStereo(ChannelStream& left, ChannelStream& right, unsigned ms_mask_present,
                          const uint8_t (*ms_used)[64]);
    void applyTns(ChannelStream& cs) const;
    void synthesize(unsigned channel, ChannelStream& cs, float* output);
    void flushChannel(unsigned channel, float* output);

    static void skipDataStream(IO::BitReader& reader);
    static void skipFill(IO::BitReader& reader);

    uint32_t nextRandom();

    AudioSpecificConfig m_asc;
    DecoderConfig m_config;
    bool m_adts;
    unsigned m_channels;
    const SwbLayout& m_swb;

    Core::TransformEngine m_transform;
    Core::WindowOverlapEngine m_window;
    Core::StereoProcessor m_stereo;

    std::vector<Core::WindowShape> m_previous_shape;
    std::unique_ptr<ChannelStream> m_streams[2];
    std::vector<float> m_time;              // 2048 samples of IMDCT output
    std::vector<float> m_pcm;               // 1024 samples of one channel
    uint32_t m_random_state;
};

} // namespace AAC
} // namespace Codec
} // namespace PsyDec

#endif // AACDECODER_H
