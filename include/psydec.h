/*
 * psydec.h - main include for all other source files.
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

#ifndef __PSYDEC_H__
#define __PSYDEC_H__

#include <cstdint>
#include <ostream>

// defines
#define PSYDEC_VERSION "1-CURRENT"
#define PSYDEC_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
//
#include <algorithm>
#include <array>
#include <complex>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>
#include <optional>
#include <chrono>
#include <limits>

#ifndef M_PI_F
#define M_PI_F 3.14159265358979323846f
#endif

// C Standard Library
#include <cerrno>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <getopt.h>
#ifdef __SSE2__
#include <emmintrin.h>
#define HAVE_SSE2
#endif

#if defined(__x86_64__) || defined(__i386__)
#include <immintrin.h>
#define HAVE_X86_DISPATCH
#endif

#ifdef __ARM_NEON
#include <arm_neon.h>
#define HAVE_NEON
#endif

#ifdef HAVE_OGG
#include <ogg/ogg.h>
#endif

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "core/DecoderError.h"
#include "core/DecoderConfig.h"

// Bitstream input
#include "io/BitReader.h"
#include "io/HuffmanTree.h"
#include "io/Crc16.h"
#include "io/FrameSplitter.h"
#include "io/WavWriter.h"
#include "io/OggPacketReader.h"

// Shared numeric core
#include "core/TransformEngine.h"
#include "core/WindowOverlapEngine.h"
#include "core/StereoProcessor.h"

// MPEG-1/2/2.5 Layer III
#include "codecs/mp3/Mp3Tables.h"
#include "codecs/mp3/Mp3FrameHeader.h"
#include "codecs/mp3/Mp3Decoder.h"

// MPEG-4 AAC-LC
#include "codecs/aac/AacTables.h"
#include "codecs/aac/AacConfig.h"
#include "codecs/aac/AacDecoder.h"

// Vorbis I
#include "codecs/vorbis/VorbisCodebook.h"
#include "codecs/vorbis/VorbisSetup.h"
#include "codecs/vorbis/VorbisDecoder.h"

// Opus (SILK + CELT)
#include "codecs/opus/RangeDecoder.h"
#include "codecs/opus/OpusTables.h"
#include "codecs/opus/OpusHeader.h"
#include "codecs/opus/CeltDecoder.h"
#include "codecs/opus/SilkDecoder.h"
#include "codecs/opus/OpusConcealment.h"
#include "codecs/opus/OpusDecoder.h"

// Uniform front end
#include "codecs/CodecDecoder.h"

#endif // __PSYDEC_H__
