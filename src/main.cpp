/*
 * main.cpp - contains main(), mostly.
 * This file is part of PsyDec.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

#include "psydec.h"

using namespace PsyDec;
using PsyDec::Codec::CodecDecoder;
using PsyDec::Codec::CodecProfile;
using PsyDec::Codec::CodecType;

namespace {

struct CliOptions {
    std::optional<CodecType> codec;
    unsigned rate = 0;
    unsigned channels = 0;
    std::string debug_channels;
    std::string logfile;
    std::string input;
    std::string output;
};

void usage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [options] <input> <output.wav>" << std::endl
              << std::endl
              << "  -c, --codec NAME      mp3, aac, vorbis or opus (default: from the file extension)" << std::endl
              << "  -r, --rate HZ         expected sample rate" << std::endl
              << "  -n, --channels N      expected channel count" << std::endl
              << "  -d, --debug LIST      comma separated debug channels, or \"all\"" << std::endl
              << "  -l, --logfile FILE    write debug output to FILE instead of stdout" << std::endl
              << "  -h, --help            show this help" << std::endl
              << "  -v, --version         show version information" << std::endl
              << std::endl
              << "MP3 and AAC are read as elementary streams (AAC with ADTS headers);" << std::endl
              << "Vorbis and Opus are read from Ogg." << std::endl;
}

void version()
{
    std::cout << "PsyDec version " << PSYDEC_VERSION << std::endl
              << "Maintainer: " << PSYDEC_MAINTAINER << std::endl
              << "MP3, AAC-LC, Vorbis and Opus decoding to WAV." << std::endl;
#ifndef HAVE_OGG
    std::cout << "Built without libogg: Vorbis and Opus input is unavailable." << std::endl;
#endif
}

bool parseUnsigned(const char* text, unsigned& value)
{
    char* end = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || parsed > std::numeric_limits<unsigned>::max()) {
        return false;
    }
    value = static_cast<unsigned>(parsed);
    return true;
}

std::vector<uint8_t> readFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Debug::log("cli", "Read ", data.size(), " bytes from ", path);
    return data;
}

std::optional<CodecType> codecFromExtension(const std::string& path)
{
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "mp3" || ext == "mp2") {
        return CodecType::MP3;
    }
    if (ext == "aac" || ext == "adts") {
        return CodecType::AAC;
    }
    if (ext == "ogg" || ext == "oga") {
        return CodecType::VORBIS;
    }
    if (ext == "opus") {
        return CodecType::OPUS;
    }
    return std::nullopt;
}

/**
 * Converts decoder output to 16-bit and writes it, dropping the first
 * `skip` samples per channel and anything past `limit` samples per channel.
 */
class PcmSink {
public:
    PcmSink(const std::string& path, unsigned rate, unsigned channels, size_t skip)
        : m_writer(path, rate, channels)
        , m_channels(channels)
        , m_skip(skip)
        , m_frames(0)
    {
    }

    void setLimit(size_t frames) { m_limit = frames; }

    void write(const float* pcm, size_t samples)
    {
        size_t frames = samples / m_channels;
        size_t drop = std::min(m_skip, frames);
        m_skip -= drop;
        frames -= drop;
        pcm += drop * m_channels;
        if (m_limit) {
            frames = std::min(frames, *m_limit > m_frames ? *m_limit - m_frames : 0);
        }
        if (frames == 0) {
            return;
        }
        m_pcm16.resize(frames * m_channels);
        CodecDecoder::toInt16(pcm, m_pcm16.data(), m_pcm16.size());
        m_writer.write(m_pcm16.data(), m_pcm16.size());
        m_frames += frames;
    }

    void close() { m_writer.close(); }
    size_t frames() const { return m_frames; }

private:
    IO::WavWriter m_writer;
    unsigned m_channels;
    size_t m_skip;
    size_t m_frames;
    std::optional<size_t> m_limit;
    std::vector<int16_t> m_pcm16;
};

/**
 * Decodes one frame, replacing it with concealment output when it fails.
 * In strict mode the error propagates instead.
 */
void decodeInto(CodecDecoder& decoder, const uint8_t* data, size_t size, std::vector<float>& pcm,
                PcmSink& sink, const DecoderConfig& config, unsigned& errors)
{
    size_t count;
    try {
        count = decoder.decodeFrame(data, size, pcm.data(), pcm.size());
    } catch (const DecoderException& e) {
        if (config.strict) {
            throw;
        }
        ++errors;
        Debug::log("cli", "Frame of ", size, " bytes failed (", e.getErrorName(), "): ", e.what());
        count = decoder.decodeLost(pcm.data(), pcm.size());
    }
    sink.write(pcm.data(), count);
}

void checkRequested(const CliOptions& options, unsigned rate, unsigned channels)
{
    if ((options.rate && options.rate != rate) || (options.channels && options.channels != channels)) {
        throw DecoderException(DecoderError::CONFIG_ERROR,
                               "Stream is " + std::to_string(rate) + " Hz/" + std::to_string(channels) +
                               " channel(s), " + std::to_string(options.rate) + "/" +
                               std::to_string(options.channels) + " requested");
    }
}

int decodeMp3(const CliOptions& options, const std::vector<uint8_t>& data, const DecoderConfig& config)
{
    std::vector<IO::FrameSpan> frames = IO::FrameSplitter::splitMp3(data);
    if (frames.empty()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "No MP3 frames found in " + options.input);
    }
    auto first = Codec::MP3::Mp3FrameHeader::parse(data.data() + frames[0].offset, frames[0].length);
    checkRequested(options, first.sampleRate(), first.channels());

    auto decoder = CodecDecoder::init(first.sampleRate(), first.channels(), CodecProfile::mp3(), config);
    PcmSink sink(options.output, decoder->sampleRate(), decoder->channels(), 0);
    std::vector<float> pcm(decoder->maxFrameSamples());
    unsigned errors = 0;
    for (const auto& frame : frames) {
        decodeInto(*decoder, data.data() + frame.offset, frame.length, pcm, sink, config, errors);
    }
    sink.close();
    std::cout << options.input << ": " << frames.size() << " MP3 frames, " << sink.frames()
              << " samples per channel, " << errors << " error(s)" << std::endl;
    return 0;
}

int decodeAdts(const CliOptions& options, const std::vector<uint8_t>& data, const DecoderConfig& config)
{
    std::vector<IO::FrameSpan> frames = IO::FrameSplitter::splitAdts(data);
    if (frames.empty()) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "No ADTS frames found in " + options.input);
    }
    auto header = Codec::AAC::AdtsHeader::parse(data.data() + frames[0].offset, frames[0].length);
    auto asc = header.toConfig();
    checkRequested(options, asc.sample_rate, asc.channels());

    auto decoder = CodecDecoder::init(0, 0, CodecProfile::aac(asc.serialize(), true), config);
    PcmSink sink(options.output, decoder->sampleRate(), decoder->channels(), 0);
    std::vector<float> pcm(decoder->maxFrameSamples());
    unsigned errors = 0;
    for (const auto& frame : frames) {
        decodeInto(*decoder, data.data() + frame.offset, frame.length, pcm, sink, config, errors);
    }
    sink.close();
    std::cout << options.input << ": " << frames.size() << " ADTS frames, " << sink.frames()
              << " samples per channel, " << errors << " error(s)" << std::endl;
    return 0;
}

#ifdef HAVE_OGG

bool startsWith(const std::vector<uint8_t>& packet, const char* magic, size_t length)
{
    return packet.size() >= length && std::memcmp(packet.data(), magic, length) == 0;
}

int decodeOgg(const CliOptions& options, const std::vector<uint8_t>& data, const DecoderConfig& config)
{
    IO::OggPacketReader reader(data);
    std::vector<uint8_t> first;
    if (!reader.next(first)) {
        throw DecoderException(DecoderError::CORRUPT_SIDE_INFO, "No Ogg stream found in " + options.input);
    }

    CodecProfile profile;
    if (startsWith(first, "\x01vorbis", 7)) {
        std::vector<uint8_t> comment, setup;
        if (!reader.next(comment) || !reader.next(setup)) {
            throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "Vorbis header packets missing");
        }
        profile = CodecProfile::vorbis(first, comment, setup);
    } else if (startsWith(first, "OpusHead", 8)) {
        std::vector<uint8_t> tags;
        if (!reader.next(tags)) {
            throw DecoderException(DecoderError::BITSTREAM_EXHAUSTED, "OpusTags packet missing");
        }
        profile = CodecProfile::opus(first);
    } else {
        throw DecoderException(DecoderError::CONFIG_ERROR, "Ogg stream is neither Vorbis nor Opus");
    }
    if (options.codec && *options.codec != profile.codec) {
        Debug::log("cli", "Ogg stream holds ", Codec::codecTypeName(profile.codec), ", not ",
                   Codec::codecTypeName(*options.codec));
    }

    auto decoder = CodecDecoder::init(options.rate, options.channels, profile, config);
    const size_t pre_skip = decoder->preSkip();
    PcmSink sink(options.output, decoder->sampleRate(), decoder->channels(), pre_skip);
    std::vector<float> pcm(decoder->maxFrameSamples());
    std::vector<uint8_t> packet;
    unsigned errors = 0;
    unsigned packets = 0;
    unsigned holes = 0;

    while (reader.next(packet)) {
        for (; holes < reader.holes(); ++holes) {
            sink.write(pcm.data(), decoder->decodeLost(pcm.data(), pcm.size()));
        }
        // The last page's granule position fixes the stream length
        if (reader.endOfStream() && reader.granulePosition() >= 0) {
            size_t granule = static_cast<size_t>(reader.granulePosition());
            sink.setLimit(granule > pre_skip ? granule - pre_skip : 0);
        }
        decodeInto(*decoder, packet.data(), packet.size(), pcm, sink, config, errors);
        ++packets;
    }
    sink.close();
    std::cout << options.input << ": " << packets << " " << decoder->codecName() << " packets, "
              << sink.frames() << " samples per channel, " << errors << " error(s)" << std::endl;
    return 0;
}

#endif // HAVE_OGG

} // namespace

int main(int argc, char *argv[]) {
    CliOptions options;

    static const struct option long_options[] = {
        {"codec", required_argument, 0, 'c'},
        {"rate", required_argument, 0, 'r'},
        {"channels", required_argument, 0, 'n'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:r:n:d:l:hv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.codec = Codec::parseCodecType(optarg);
                if (!options.codec) {
                    std::cerr << argv[0] << ": unknown codec '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'r':
                if (!parseUnsigned(optarg, options.rate)) {
                    std::cerr << argv[0] << ": invalid rate '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'n':
                if (!parseUnsigned(optarg, options.channels)) {
                    std::cerr << argv[0] << ": invalid channel count '" << optarg << "'" << std::endl;
                    return 1;
                }
                break;
            case 'd':
                options.debug_channels = optarg;
                break;
            case 'l':
                options.logfile = optarg;
                break;
            case 'h':
                usage(argv[0]);
                return 0;
            case 'v':
                version();
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }

    if (argc - optind != 2) {
        usage(argv[0]);
        return 1;
    }
    options.input = argv[optind];
    options.output = argv[optind + 1];

    // Environment first, command line overrides
    DecoderConfig config;
    config.loadFromEnvironment();
    if (!options.debug_channels.empty()) {
        config.debug_channels = Debug::parseChannelList(options.debug_channels);
    }
    Debug::init(options.logfile, config.debug_channels);
    for (const auto& [key, value] : config.toMap()) {
        Debug::log("config", "DecoderConfig ", key, " = ", value);
    }

    if (!config.validate()) {
        std::cerr << argv[0] << ": invalid PSYDEC_* configuration" << std::endl;
        Debug::shutdown();
        return 1;
    }

    if (!options.codec) {
        options.codec = codecFromExtension(options.input);
    }
    if (!options.codec) {
        std::cerr << argv[0] << ": cannot tell the codec of " << options.input << ", use --codec" << std::endl;
        Debug::shutdown();
        return 1;
    }
    Debug::log("cli", "Decoding ", options.input, " as ", Codec::codecTypeName(*options.codec));

    int status = 1;
    try {
        std::vector<uint8_t> data = readFile(options.input);
        switch (*options.codec) {
            case CodecType::MP3:
                status = decodeMp3(options, data, config);
                break;
            case CodecType::AAC:
                status = decodeAdts(options, data, config);
                break;
            case CodecType::VORBIS:
            case CodecType::OPUS:
#ifdef HAVE_OGG
                status = decodeOgg(options, data, config);
#else
                std::cerr << argv[0] << ": built without libogg, cannot read " << options.input << std::endl;
#endif
                break;
        }
    } catch (const DecoderException& e) {
        std::cerr << argv[0] << ": " << e.getErrorName() << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
    }

    Debug::shutdown();
    return status;
}
