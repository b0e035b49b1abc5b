/*
 * SilkDecoder.h - Opus SILK layer decoder (RFC 6716 section 4.2)
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef SILKDECODER_H
#define SILKDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {

// NLSF quantizer tables for one bandwidth class, defined in SilkDecoder.cpp
struct NlsfCodebook;

/**
 * @brief Fixed-point SILK decoder.
 *
 * Decodes the linear prediction layer of SILK-only and hybrid Opus frames
 * at the internal rate chosen by the bandwidth (8, 12 or 16 kHz) and
 * upsamples the result to 48 kHz. Low bitrate redundancy is parsed and
 * skipped; lost frames are left to the caller's concealment.
 */
class SilkDecoder {
public:
    static constexpr int MAX_LPC_ORDER = 16;
    static constexpr int MAX_NB_SUBFR = 4;
    static constexpr int MAX_FRAMES_PER_PACKET = 3;
    static constexpr int MAX_FRAME_LENGTH = 320;      // 20 ms at 16 kHz
    static constexpr int MAX_SUB_FRAME_LENGTH = 80;
    static constexpr int LTP_ORDER = 5;

    SilkDecoder(unsigned channels, const DecoderConfig& config);

    /**
     * @brief Decode the SILK part of one Opus frame.
     * @param rd Range decoder positioned at the start of the frame
     * @param frame_size 480, 960, 1920 or 2880 samples at 48 kHz
     * @param bandwidth Audio bandwidth from the TOC byte; hybrid frames pass
     *                  SWB or FB and are decoded at 16 kHz
     * @param stream_channels Coded channels (1 or 2)
     * @param pcm Receives frame_size * channels() interleaved samples
     */
    void decode(RangeDecoder& rd, unsigned frame_size, OpusBandwidth bandwidth,
                unsigned stream_channels, float* pcm);

    void reset();

    unsigned channels() const { return m_channels; }

    // Pitch lag of the last frame in 48 kHz samples, 0 if it was unvoiced
    unsigned pitchLag() const { return m_pitch_lag; }

private:
    enum class CodingMode {
        INDEPENDENT,
        INDEPENDENT_NO_LTP_SCALING,
        CONDITIONAL
    };

    struct FrameIndices {
        std::array<int8_t, MAX_NB_SUBFR> gains{};
        std::array<int8_t, MAX_LPC_ORDER + 1> nlsf{};
        std::array<int8_t, MAX_NB_SUBFR> ltp{};
        int16_t lag = 0;
        int8_t contour = 0;
        int8_t signal_type = 0;
        int8_t quant_offset = 0;
        int8_t nlsf_interp_q2 = 4;
        int8_t per_index = 0;
        int8_t ltp_scale = 0;
        int8_t seed = 0;
    };

    // Dequantized parameters of the frame being decoded
    struct FrameParameters {
        int16_t pred_coef_q12[2][MAX_LPC_ORDER];
        int16_t ltp_coef_q14[MAX_NB_SUBFR * LTP_ORDER];
        int32_t gains_q16[MAX_NB_SUBFR];
        int32_t pitch_lags[MAX_NB_SUBFR];
        int32_t ltp_scale_q14;
    };

    // IIR/FIR upsampler from the internal rate to 48 kHz
    struct Resampler {
        static constexpr int FIR_ORDER = 8;
        static constexpr int MAX_BATCH = 160;

        std::array<int32_t, 6> iir{};
        std::array<int16_t, FIR_ORDER> fir{};
        std::array<int16_t, 16> delay_buf{};
        int fs_in_khz = 0;
        int input_delay = 0;
        int batch_size = 0;
        int32_t inv_ratio_q16 = 0;
    };

    struct ChannelState {
        int fs_khz = 0;
        int nb_subfr = 0;
        int frame_length = 0;
        int subfr_length = 0;
        int ltp_mem_length = 0;
        int lpc_order = 0;
        const NlsfCodebook* nlsf_cb = nullptr;
        const uint8_t* pitch_lag_low_bits_icdf = nullptr;
        const uint8_t* pitch_contour_icdf = nullptr;

        std::array<int16_t, MAX_LPC_ORDER> prev_nlsf_q15{};
        std::array<int32_t, MAX_LPC_ORDER> lpc_state_q14{};
        std::array<int16_t, MAX_FRAME_LENGTH + 2 * MAX_SUB_FRAME_LENGTH> out_buf{};
        std::array<int32_t, MAX_FRAME_LENGTH> exc_q14{};
        int32_t prev_gain_q16 = 65536;
        int lag_prev = 100;
        int last_gain_index = 10;
        int prev_signal_type = 0;
        int ec_prev_signal_type = 0;
        int ec_prev_lag_index = 0;
        bool first_frame_after_reset = true;

        std::array<int, MAX_FRAMES_PER_PACKET> vad_flags{};
        std::array<int, MAX_FRAMES_PER_PACKET> lbrr_flags{};
        bool lbrr_flag = false;

        FrameIndices indices;
        Resampler resampler;
    };

    void resetChannel(ChannelState& st);
    void setSampleRate(ChannelState& st, int fs_khz, int nb_subfr);

    void skipRedundancy(RangeDecoder& rd, unsigned stream_channels, int frames);
    void decodeStereoPrediction(RangeDecoder& rd, int32_t pred_q13[2]) const;
    void decodeIndices(RangeDecoder& rd, ChannelState& st, bool voice_active, CodingMode coding) const;
    void decodePulses(RangeDecoder& rd, int16_t* pulses, int signal_type, int quant_offset, int frame_length) const;
    void decodeParameters(ChannelState& st, CodingMode coding, FrameParameters& params) const;
    void decodeCore(ChannelState& st, FrameParameters& params, const int16_t* pulses, int16_t* out);
    void decodeFrame(RangeDecoder& rd, ChannelState& st, bool voice_active, CodingMode coding, int16_t* out);

    void stereoMidSideToLeftRight(int16_t* x1, int16_t* x2, const int32_t pred_q13[2], int fs_khz, int length);

    static void initResampler(Resampler& rs, int fs_in_khz);
    static void resample(Resampler& rs, int16_t* out, const int16_t* in, int in_len);
    static void resampleIirFir(Resampler& rs, int16_t* out, const int16_t* in, int in_len);

    DecoderConfig m_config;
    unsigned m_channels;
    std::array<ChannelState, 2> m_state;

    // Mid/side to left/right state
    std::array<int32_t, 2> m_pred_prev_q13;
    std::array<int16_t, 2> m_mid_hist;
    std::array<int16_t, 2> m_side_hist;
    bool m_prev_mid_only;
    unsigned m_stream_channels;
    unsigned m_pitch_lag;

    std::array<std::vector<int16_t>, 2> m_frame_out;   // frame_length + 2 per channel
    std::vector<int16_t> m_resampled;
    std::vector<int16_t> m_ltp_state;
    std::vector<int32_t> m_ltp_state_q15;
    std::vector<int32_t> m_residual_q14;
    std::vector<int32_t> m_lpc_q14;
};

} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // SILKDECODER_H
