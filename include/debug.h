/*
 * debug.h - Debug output system
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct includes - all includes should be in psydec.h

/**
 * @brief Process-wide channel logger.
 *
 * Each decoder stage logs on its own channel (see knownChannels()); the
 * "all" channel turns every channel on. Channels are off until init()
 * names them, so a disabled log call costs one set lookup.
 */
class Debug {
public:
    /**
     * @brief Open the log and enable channels.
     * @param logfile Path to append to; empty logs to stdout
     * @param channels Channel names; unknown names are kept but reported
     *        on the "config" channel
     */
    static void init(const std::string& logfile, const std::vector<std::string>& channels);
    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);

    // Channels the decoders and the CLI log on
    static const std::vector<std::string>& knownChannels();
    static bool isKnownChannel(const std::string& channel);

    // "MP3, opus ,," -> {"mp3", "opus"}
    static std::vector<std::string> parseChannelList(const std::string& list);

    // First `limit` bytes as "ff fb 90 40 ...", for logging frame headers
    static std::string hexDump(const uint8_t* data, size_t size, size_t limit = 16);

    template<typename... Args>
    static inline void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, "", 0, ss.str());
        }
    }

    // Logging with function and line number
    template<typename... Args>
    static inline void log(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, function, line, ss.str());
        }
    }

private:
    static void write(const std::string& channel, const std::string& function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static bool m_log_to_file;
};

#define DEBUG_LOG(channel, ...) Debug::log(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

// Arguments are not evaluated unless the channel is on
#define DEBUG_LOG_LAZY(channel, ...) \
    do { \
        if (Debug::isChannelEnabled(channel)) { \
            Debug::log(channel, __VA_ARGS__); \
        } \
    } while(0)

#endif // DEBUG_H
