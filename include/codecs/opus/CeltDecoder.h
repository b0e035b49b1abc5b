/*
 * CeltDecoder.h - Opus CELT layer decoder (RFC 6716 section 4.3)
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CELTDECODER_H
#define CELTDECODER_H

// No direct includes - all includes should be in psydec.h

namespace PsyDec {
namespace Codec {
namespace Opus {

/**
 * @brief CELT band decoder and synthesis.
 *
 * Decodes coarse/fine band energies and PVQ band shapes from a shared
 * RangeDecoder, then runs the low-overlap IMDCT, the pitch post-filter and
 * de-emphasis. Output is always at 48 kHz. A stream may carry one or two
 * coded channels independently of the output channel count: mono streams
 * are duplicated and stereo streams averaged as needed.
 */
class CeltDecoder {
public:
    CeltDecoder(unsigned channels, const DecoderConfig& config);

    /**
     * @brief Decode one CELT frame.
     * @param rd Range decoder positioned at the CELT part of the frame
     * @param frame_size 120, 240, 480 or 960 samples
     * @param stream_channels Coded channels (1 or 2)
     * @param pcm Receives frame_size * channels() interleaved samples
     */
    void decode(RangeDecoder& rd, unsigned frame_size, unsigned stream_channels, float* pcm);

    // Bands coded in this frame; hybrid frames start at band 17
    void setBandRange(int start, int end);

    void reset();

    unsigned channels() const { return m_channels; }
    uint32_t finalRange() const { return m_rng; }
    const std::array<float, 2 * Tables::kNbEBands>& bandEnergies() const { return m_old_band_e; }

    static int endBandFor(OpusBandwidth bandwidth);

private:
    struct BandContext {
        RangeDecoder* rd = nullptr;
        int band = 0;
        int intensity = 0;
        int spread = 0;
        int tf_change = 0;
        int remaining_bits = 0;
        uint32_t seed = 0;
        bool disable_inv = false;
    };

    struct SplitContext {
        bool inv = false;
        int imid = 0;
        int iside = 0;
        int delta = 0;
        int itheta = 0;
        int qalloc = 0;
    };

    struct Allocation {
        std::array<int, Tables::kNbEBands> pulses{};
        std::array<int, Tables::kNbEBands> fine_quant{};
        std::array<int, Tables::kNbEBands> fine_priority{};
        int coded_bands = 0;
        int intensity = 0;
        int dual_stereo = 0;
        int balance = 0;
    };

    // Energy
    void unquantCoarseEnergy(RangeDecoder& rd, int C, int LM, bool intra);
    void unquantFineEnergy(RangeDecoder& rd, int C, const Allocation& alloc);
    void unquantEnergyFinalise(RangeDecoder& rd, int C, const Allocation& alloc, int bits_left);

    // Side information
    void decodeTimeFrequency(RangeDecoder& rd, bool transient, int LM, std::array<int, Tables::kNbEBands>& tf_res) const;
    void computeAllocation(RangeDecoder& rd, const std::array<int, Tables::kNbEBands>& offsets,
                           const std::array<int, Tables::kNbEBands>& cap, int alloc_trim, int total,
                           int C, int LM, Allocation& alloc) const;
    int interpolateBits(RangeDecoder& rd, int skip_start, const int* bits1, const int* bits2, const int* thresh,
                        const int* cap, int total, int skip_rsv, int intensity_rsv, int dual_stereo_rsv,
                        int C, int LM, Allocation& alloc) const;

    // Band shapes
    void quantAllBands(RangeDecoder& rd, float* X, float* Y, uint8_t* collapse_masks, const Allocation& alloc,
                       bool short_blocks, int spread, const std::array<int, Tables::kNbEBands>& tf_res,
                       int total_bits, int LM, bool disable_inv);
    uint32_t quantBand(float* X, int N, int b, int B, float* lowband, int LM, float* lowband_out,
                       float gain, float* scratch, int fill);
    uint32_t quantBandStereo(float* X, float* Y, int N, int b, int B, float* lowband, int LM,
                             float* lowband_out, float* scratch, int fill);
    uint32_t quantPartition(float* X, int N, int b, int B, float* lowband, int LM, float gain, int fill);
    uint32_t quantBandSingle(float* X, float* Y, float* lowband_out);
    SplitContext computeTheta(int N, int& b, int B, int B0, int LM, bool stereo, int& fill);
    uint32_t algUnquant(float* X, int N, int K, int spread, int B, float gain);
    void antiCollapse(float* X, const uint8_t* collapse_masks, int LM, int C, int size,
                      const Allocation& alloc, uint32_t seed) const;

    // Synthesis
    void denormalise(const float* X, float* freq, const float* band_log_e, int M, bool silence) const;
    void combFilter(float* x, int T0, int T1, int N, float g0, float g1, int tapset0, int tapset1) const;

    DecoderConfig m_config;
    unsigned m_channels;
    int m_start_band;
    int m_end_band;

    Core::TransformEngine m_transform;
    Core::WindowOverlapEngine m_window;
    std::vector<float> m_postfilter_window;    // squared 120-sample slope

    BandContext m_ctx;
    std::vector<float> m_X;                    // normalised band shapes, C * N
    std::vector<float> m_freq;
    std::vector<float> m_time;
    std::vector<float> m_norm;                 // folding source per coded channel
    std::vector<float> m_band_scratch;
    std::vector<uint32_t> m_pvq_row;
    std::vector<int> m_pulses_scratch;
    std::vector<float> m_hadamard_scratch;

    std::array<float, 2 * Tables::kNbEBands> m_old_band_e;
    std::array<float, 2 * Tables::kNbEBands> m_old_log_e;
    std::array<float, 2 * Tables::kNbEBands> m_old_log_e2;

    // Post-filter state
    int m_pf_period;
    int m_pf_period_old;
    float m_pf_gain;
    float m_pf_gain_old;
    int m_pf_tapset;
    int m_pf_tapset_old;

    std::vector<std::vector<float>> m_history;  // per output channel, post-filtered signal
    std::vector<float> m_preemph_mem;
    uint32_t m_rng;
};

} // namespace Opus
} // namespace Codec
} // namespace PsyDec

#endif // CELTDECODER_H
