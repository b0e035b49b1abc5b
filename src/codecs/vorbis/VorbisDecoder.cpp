/*
 * VorbisDecoder.cpp - Vorbis I audio packet decoder
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

namespace PsyDec {
namespace Codec {
namespace Vorbis {

namespace {

// Floor 1 amplitude table: 256 steps from 1.0649863e-07 up to 1.0, equal ratio
const std::array<float, 256>& inverseDbTable()
{
    static const std::array<float, 256> table = [] {
        std::array<float, 256> t{};
        const double first = 1.0649863e-07;
        const double step = -std::log(first) / 255.0;
        for (unsigned i = 0; i < 256; ++i) {
            t[i] = static_cast<float>(first * std::exp(step * i));
        }
        t[255] = 1.0f;
        return t;
    }();
    return table;
}

double bark(double x)
{
    return 13.1 * std::atan(0.00074 * x) + 2.24 * std::atan(0.0000000185 * x * x) + 0.0001 * x;
}

int renderPoint(int x0, int y0, int x1, int y1, int x)
{
    int dy = y1 - y0;
    int adx = x1 - x0;
    int err = std::abs(dy) * (x - x0);
    int off = err / adx;
    return dy < 0 ? y0 - off : y0 + off;
}

void renderLine(int x0, int y0, int x1, int y1, float* v, int n)
{
    const std::array<float, 256>& db = inverseDbTable();
    int dy = y1 - y0;
    int adx = x1 - x0;
    int ady = std::abs(dy);
    int base = dy / adx;
    int sy = dy < 0 ? base - 1 : base + 1;
    int x = x0;
    int y = y0;
    int err = 0;
    ady -= std::abs(base) * adx;

    auto put = [&](int pos, int value) {
        if (pos < n) {
            v[pos] = db[static_cast<size_t>(std::clamp(value, 0, 255))];
        }
    };
    put(x, y);
    for (x = x0 + 1; x < x1; ++x) {
        err += ady;
        if (err >= adx) {
            err -= adx;
            y += sy;
        } else {
            y += base;
        }
        put(x, y);
    }
}

bool isEndOfPacket(const DecoderException& e)
{
    return e.getError() == DecoderError::BITSTREAM_EXHAUSTED;
}

} // anonymous namespace

VorbisDecoder::VorbisDecoder(const std::vector<uint8_t>& identification, const std::vector<uint8_t>& comment,
                             const std::vector<uint8_t>& setup, const DecoderConfig& config)
    : m_setup(identification, comment, setup)
    , m_config(config)
    , m_channels(m_setup.identification().channels)
    , m_transform(config.max_transform_size, config.transform_path)
    , m_window(m_channels, m_setup.identification().blocksize_1)
    , m_stereo(m_channels)
    , m_first_packet(true)
    , m_previous_block(0)
{
    const unsigned long_block = m_setup.identification().blocksize_1;
    if (long_block > config.max_transform_size) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Vorbis block size " + std::to_string(long_block) +
                               " exceeds the configured transform size");
    }
    m_spectrum.assign(m_channels, std::vector<float>(long_block / 2, 0.0f));
    m_floor.assign(m_channels, std::vector<float>(long_block / 2, 0.0f));
    m_pcm.assign(m_channels, std::vector<float>(long_block / 2, 0.0f));
    m_time.assign(long_block, 0.0f);
}

void VorbisDecoder::reset()
{
    m_window.reset();
    m_first_packet = true;
    m_previous_block = 0;
}

size_t VorbisDecoder::decodeLost(float* output, size_t capacity)
{
    if (m_first_packet) {
        return 0;
    }
    const unsigned n = m_previous_block;
    const size_t samples = static_cast<size_t>(n / 2) * m_channels;
    if (capacity < samples) {
        throw std::invalid_argument("VorbisDecoder: output buffer too small");
    }
    std::fill(m_time.begin(), m_time.begin() + n, 0.0f);
    size_t count = 0;
    for (unsigned ch = 0; ch < m_channels; ++ch) {
        Core::VorbisWindow window{n, n, n};
        count = m_window.applyAndOverlap(ch, m_time.data(), window, m_pcm[ch].data());
    }
    writeInterleaved(m_pcm, count, output);
    reset();
    return count * m_channels;
}

size_t VorbisDecoder::writeInterleaved(const std::vector<std::vector<float>>& pcm, size_t count, float* output) const
{
    for (size_t i = 0; i < count; ++i) {
        for (unsigned ch = 0; ch < m_channels; ++ch) {
            output[i * m_channels + ch] = pcm[ch][i];
        }
    }
    return count * m_channels;
}

size_t VorbisDecoder::decodeFrame(const uint8_t* data, size_t size, float* output, size_t capacity)
{
    if (!data || size == 0) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "Empty Vorbis packet");
    }
    if (capacity < maxFrameSamples()) {
        throw std::invalid_argument("VorbisDecoder: output buffer too small");
    }

    const VorbisIdentification& id = m_setup.identification();
    IO::BitReader reader(data, size, IO::BitReader::BitOrder::LSB_FIRST);

    if (reader.readBit()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Header packet in the audio stream");
    }
    unsigned mode_number = reader.readBits(ilog(static_cast<uint32_t>(m_setup.modes.size() - 1)));
    if (mode_number >= m_setup.modes.size()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Vorbis mode " + std::to_string(mode_number) + " not defined");
    }
    const Mode& mode = m_setup.modes[mode_number];
    const Mapping& mapping = m_setup.mappings[mode.mapping];

    const unsigned n = mode.blockflag ? id.blocksize_1 : id.blocksize_0;
    const unsigned n2 = n / 2;
    Core::VorbisWindow window{n, n, n};
    if (mode.blockflag) {
        bool previous_long = reader.readBit();
        bool next_long = reader.readBit();
        window.previous_size = previous_long ? id.blocksize_1 : id.blocksize_0;
        window.next_size = next_long ? id.blocksize_1 : id.blocksize_0;
    } else {
        window.previous_size = id.blocksize_0;
        window.next_size = id.blocksize_0;
    }

    // Floors
    std::vector<bool> no_residue(m_channels, false);
    bool packet_ended = false;
    for (unsigned ch = 0; ch < m_channels; ++ch) {
        unsigned submap = mapping.mux[ch];
        if (packet_ended) {
            no_residue[ch] = true;
            continue;
        }
        try {
            no_residue[ch] = !decodeFloor(reader, mapping.submap_floor[submap], n2, m_floor[ch].data());
        } catch (const DecoderException& e) {
            if (!isEndOfPacket(e)) {
                throw;
            }
            no_residue[ch] = true;
            packet_ended = true;
        }
    }

    const std::vector<bool> floor_unused = no_residue;

    // A coupled pair is decoded if either of its channels is
    for (const Mapping::Coupling& c : mapping.coupling) {
        if (!no_residue[c.magnitude] || !no_residue[c.angle]) {
            no_residue[c.magnitude] = false;
            no_residue[c.angle] = false;
        }
    }

    // Residues
    for (unsigned ch = 0; ch < m_channels; ++ch) {
        std::fill(m_spectrum[ch].begin(), m_spectrum[ch].begin() + n2, 0.0f);
    }
    for (size_t submap = 0; submap < mapping.submap_residue.size(); ++submap) {
        std::vector<unsigned> channels;
        std::vector<bool> do_not_decode;
        for (unsigned ch = 0; ch < m_channels; ++ch) {
            if (mapping.mux[ch] == submap) {
                channels.push_back(ch);
                do_not_decode.push_back(no_residue[ch]);
            }
        }
        if (channels.empty() || packet_ended) {
            continue;
        }
        try {
            decodeResidue(reader, m_setup.residues[mapping.submap_residue[submap]], n2, channels, do_not_decode);
        } catch (const DecoderException& e) {
            if (!isEndOfPacket(e)) {
                throw;
            }
            packet_ended = true;
        }
    }

    // Inverse coupling, last step first
    for (auto it = mapping.coupling.rbegin(); it != mapping.coupling.rend(); ++it) {
        m_stereo.applyVorbisCoupling(m_spectrum[it->magnitude].data(), m_spectrum[it->angle].data(), n2);
    }

    // Floor times residue, then the inverse transform and overlap
    size_t count = 0;
    for (unsigned ch = 0; ch < m_channels; ++ch) {
        float* spectrum = m_spectrum[ch].data();
        if (floor_unused[ch]) {
            std::fill(spectrum, spectrum + n2, 0.0f);
        } else {
            const float* floor = m_floor[ch].data();
            for (unsigned i = 0; i < n2; ++i) {
                spectrum[i] *= floor[i];
            }
        }
        m_transform.imdct(spectrum, m_time.data(), n, -1.0f);
        count = m_window.applyAndOverlap(ch, m_time.data(), window, m_pcm[ch].data());
    }
    m_previous_block = n;

    if (packet_ended) {
        Debug::log("vorbis", "VorbisDecoder::decodeFrame() packet ended early, ", size, " bytes");
    }
    if (m_first_packet) {
        m_first_packet = false;
        return 0;
    }
    return writeInterleaved(m_pcm, count, output);
}

bool VorbisDecoder::decodeFloor(IO::BitReader& reader, unsigned floor_index, unsigned n2, float* curve)
{
    const Floor& floor = m_setup.floors[floor_index];
    if (floor.type == 0) {
        return decodeFloor0(reader, floor.floor0, floor_index, n2, curve);
    }
    return decodeFloor1(reader, floor.floor1, n2, curve);
}

const std::vector<int>& VorbisDecoder::barkMap(const Floor0& floor, unsigned floor_index, unsigned n2)
{
    auto key = std::make_pair(floor_index, n2);
    auto it = m_bark_maps.find(key);
    if (it != m_bark_maps.end()) {
        return it->second;
    }
    std::vector<int> map(n2 + 1);
    const double scale = floor.bark_map_size / bark(0.5 * floor.rate);
    for (unsigned i = 0; i < n2; ++i) {
        int value = static_cast<int>(std::floor(bark(static_cast<double>(floor.rate) * i / (2.0 * n2)) * scale));
        map[i] = std::min(static_cast<int>(floor.bark_map_size) - 1, value);
    }
    map[n2] = -1;
    return m_bark_maps.emplace(key, std::move(map)).first->second;
}

bool VorbisDecoder::decodeFloor0(IO::BitReader& reader, const Floor0& floor, unsigned floor_index, unsigned n2,
                                 float* curve)
{
    unsigned amplitude = reader.readBits(floor.amplitude_bits);
    if (amplitude == 0) {
        return false;
    }
    unsigned book_number = reader.readBits(ilog(static_cast<uint32_t>(floor.books.size())));
    if (book_number >= floor.books.size()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "Floor 0 book number out of range");
    }
    const VorbisCodebook& book = m_setup.codebooks[floor.books[book_number]];

    std::vector<float> coefficients;
    coefficients.reserve(floor.order + book.dimensions());
    float last = 0.0f;
    while (coefficients.size() < floor.order) {
        const float* v = book.decodeVector(reader);
        for (unsigned j = 0; j < book.dimensions(); ++j) {
            coefficients.push_back(v[j] + last);
        }
        last = coefficients.back();
    }

    const std::vector<int>& map = barkMap(floor, floor_index, n2);
    const double max_amplitude = static_cast<double>((1u << floor.amplitude_bits) - 1);
    unsigned i = 0;
    while (i < n2) {
        double omega = M_PI * map[i] / floor.bark_map_size;
        double cos_omega = std::cos(omega);
        double p, q;
        if (floor.order % 2) {
            p = 1.0 - cos_omega * cos_omega;
            q = 0.25;
            for (unsigned j = 0; 2 * j + 1 < floor.order - 1; ++j) {
                double d = std::cos(coefficients[2 * j + 1]) - cos_omega;
                p *= 4.0 * d * d;
            }
            for (unsigned j = 0; 2 * j < floor.order; ++j) {
                double d = std::cos(coefficients[2 * j]) - cos_omega;
                q *= 4.0 * d * d;
            }
        } else {
            p = (1.0 - cos_omega) / 2.0;
            q = (1.0 + cos_omega) / 2.0;
            for (unsigned j = 0; 2 * j + 1 < floor.order; ++j) {
                double dp = std::cos(coefficients[2 * j + 1]) - cos_omega;
                double dq = std::cos(coefficients[2 * j]) - cos_omega;
                p *= 4.0 * dp * dp;
                q *= 4.0 * dq * dq;
            }
        }
        double linear = std::exp(0.11512925 * (amplitude * floor.amplitude_offset /
                                               (max_amplitude * std::sqrt(p + q)) - floor.amplitude_offset));
        int current = map[i];
        do {
            curve[i++] = static_cast<float>(linear);
        } while (i < n2 && map[i] == current);
    }
    return true;
}

bool VorbisDecoder::decodeFloor1(IO::BitReader& reader, const Floor1& floor, unsigned n2, float* curve) const
{
    if (!reader.readBit()) {
        return false;
    }

    static const unsigned kRanges[4] = {256, 128, 86, 64};
    const unsigned range = kRanges[floor.multiplier - 1];
    const unsigned range_bits = ilog(range - 1);
    const size_t values = floor.x_list.size();

    std::vector<int> y(values, 0);
    y[0] = static_cast<int>(reader.readBits(range_bits));
    y[1] = static_cast<int>(reader.readBits(range_bits));
    size_t offset = 2;
    for (unsigned class_index : floor.partition_class) {
        const Floor1::Class& c = floor.classes[class_index];
        const unsigned csub = (1u << c.subclasses) - 1;
        uint32_t cval = 0;
        if (c.subclasses) {
            cval = m_setup.codebooks[static_cast<size_t>(c.masterbook)].decodeScalar(reader);
        }
        for (unsigned j = 0; j < c.dimensions; ++j) {
            int book = c.subclass_books[cval & csub];
            cval >>= c.subclasses;
            y[offset++] = (book >= 0) ? static_cast<int>(m_setup.codebooks[static_cast<size_t>(book)].decodeScalar(reader)) : 0;
        }
    }

    // Amplitude value synthesis
    std::vector<bool> step2(values, false);
    std::vector<int> final_y(values, 0);
    step2[0] = step2[1] = true;
    final_y[0] = y[0];
    final_y[1] = y[1];
    for (size_t i = 2; i < values; ++i) {
        unsigned low = floor.low_neighbor[i];
        unsigned high = floor.high_neighbor[i];
        int predicted = renderPoint(static_cast<int>(floor.x_list[low]), final_y[low],
                                    static_cast<int>(floor.x_list[high]), final_y[high],
                                    static_cast<int>(floor.x_list[i]));
        int val = y[i];
        int high_room = static_cast<int>(range) - predicted;
        int low_room = predicted;
        int room = std::min(high_room, low_room) * 2;
        if (val != 0) {
            step2[low] = true;
            step2[high] = true;
            step2[i] = true;
            if (val >= room) {
                final_y[i] = (high_room > low_room) ? val - low_room + predicted : predicted - val + high_room - 1;
            } else {
                final_y[i] = (val & 1) ? predicted - (val + 1) / 2 : predicted + val / 2;
            }
        } else {
            final_y[i] = predicted;
        }
    }

    // Curve synthesis over the points in ascending X
    const int n = static_cast<int>(n2);
    int lx = 0;
    int ly = final_y[floor.sorted_order[0]] * static_cast<int>(floor.multiplier);
    int hx = 0;
    int hy = ly;
    for (size_t i = 1; i < values; ++i) {
        unsigned index = floor.sorted_order[i];
        if (!step2[index]) {
            continue;
        }
        hy = final_y[index] * static_cast<int>(floor.multiplier);
        hx = static_cast<int>(floor.x_list[index]);
        renderLine(lx, ly, hx, hy, curve, n);
        lx = hx;
        ly = hy;
    }
    if (hx < n) {
        renderLine(hx, hy, n, hy, curve, n);
    }
    return true;
}

void VorbisDecoder::decodeResidue(IO::BitReader& reader, const Residue& residue, unsigned n2,
                                  const std::vector<unsigned>& channels, const std::vector<bool>& do_not_decode)
{
    if (residue.type != 2) {
        std::vector<float*> vectors;
        for (unsigned ch : channels) {
            vectors.push_back(m_spectrum[ch].data());
        }
        decodePartitions(reader, residue, n2, vectors, do_not_decode);
        return;
    }

    // Type 2: one interleaved vector over every channel of the submap
    bool any = std::find(do_not_decode.begin(), do_not_decode.end(), false) != do_not_decode.end();
    if (!any) {
        return;
    }
    const size_t ch_count = channels.size();
    const unsigned actual_size = static_cast<unsigned>(n2 * ch_count);
    m_interleave.assign(actual_size, 0.0f);
    std::vector<float*> vectors{m_interleave.data()};
    std::vector<bool> decode_one{false};

    bool ended = false;
    try {
        decodePartitions(reader, residue, actual_size, vectors, decode_one);
    } catch (const DecoderException& e) {
        if (!isEndOfPacket(e)) {
            throw;
        }
        ended = true;
    }
    for (size_t c = 0; c < ch_count; ++c) {
        float* out = m_spectrum[channels[c]].data();
        for (unsigned j = 0; j < n2; ++j) {
            out[j] = m_interleave[j * ch_count + c];
        }
    }
    if (ended) {
        throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "Vorbis residue ended early");
    }
}

void VorbisDecoder::decodePartitions(IO::BitReader& reader, const Residue& residue, unsigned actual_size,
                                     const std::vector<float*>& vectors, const std::vector<bool>& do_not_decode)
{
    const VorbisCodebook& classbook = m_setup.codebooks[residue.classbook];
    const unsigned classwords = classbook.dimensions();
    const uint32_t begin = std::min(residue.begin, actual_size);
    const uint32_t end = std::min(residue.end, actual_size);
    if (end <= begin || classwords == 0) {
        return;
    }
    const unsigned partitions = (end - begin) / residue.partition_size;
    const size_t ch_count = vectors.size();
    std::vector<std::vector<unsigned>> classifications(ch_count, std::vector<unsigned>(partitions + classwords, 0));

    for (unsigned pass = 0; pass < 8; ++pass) {
        unsigned partition = 0;
        while (partition < partitions) {
            if (pass == 0) {
                for (size_t ch = 0; ch < ch_count; ++ch) {
                    if (do_not_decode[ch]) {
                        continue;
                    }
                    uint32_t temp = classbook.decodeScalar(reader);
                    for (int i = static_cast<int>(classwords) - 1; i >= 0; --i) {
                        classifications[ch][partition + static_cast<unsigned>(i)] = temp % residue.classifications;
                        temp /= residue.classifications;
                    }
                }
            }
            for (unsigned i = 0; i < classwords && partition < partitions; ++i, ++partition) {
                for (size_t ch = 0; ch < ch_count; ++ch) {
                    if (do_not_decode[ch]) {
                        continue;
                    }
                    int book_index = residue.books[classifications[ch][partition]][pass];
                    if (book_index < 0) {
                        continue;
                    }
                    const VorbisCodebook& book = m_setup.codebooks[static_cast<size_t>(book_index)];
                    const unsigned dims = book.dimensions();
                    float* v = vectors[ch] + begin + static_cast<size_t>(partition) * residue.partition_size;
                    if (residue.type == 0) {
                        const unsigned step = residue.partition_size / dims;
                        for (unsigned k = 0; k < step; ++k) {
                            const float* entry = book.decodeVector(reader);
                            for (unsigned j = 0; j < dims; ++j) {
                                v[k + j * step] += entry[j];
                            }
                        }
                    } else {
                        unsigned k = 0;
                        while (k < residue.partition_size) {
                            const float* entry = book.decodeVector(reader);
                            for (unsigned j = 0; j < dims && k < residue.partition_size; ++j) {
                                v[k++] += entry[j];
                            }
                        }
                    }
                }
            }
        }
    }
}

} // namespace Vorbis
} // namespace Codec
} // namespace PsyDec
