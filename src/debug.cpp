/*
 * debug.cpp - Debug output system implementation
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "psydec.h"

std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;
bool Debug::m_log_to_file = false;

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::vector<std::string> unknown;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!logfile.empty()) {
            m_logfile.open(logfile, std::ios::out | std::ios::app);
            m_log_to_file = m_logfile.is_open();
            if (!m_log_to_file) {
                std::cerr << "Debug: cannot open " << logfile << ", logging to stdout" << std::endl;
            }
        }
        for (const auto& channel : channels) {
            m_enabled_channels.insert(channel);
            if (channel != "all" && !isKnownChannel(channel)) {
                unknown.push_back(channel);
            }
        }
    }
    for (const auto& channel : unknown) {
        log("config", "Debug::init() unknown channel \"", channel, "\"");
    }
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile.close();
    }
    m_log_to_file = false;
    m_enabled_channels.clear();
}

bool Debug::isChannelEnabled(const std::string& channel) {
    if (m_enabled_channels.empty()) {
        return false;
    }
    return m_enabled_channels.count("all") > 0 || m_enabled_channels.count(channel) > 0;
}

const std::vector<std::string>& Debug::knownChannels() {
    static const std::vector<std::string> channels = {
        "bitreader", "transform", "window", "mp3", "aac", "vorbis", "opus",
        "celt", "silk", "plc", "codec", "cli", "config"
    };
    return channels;
}

bool Debug::isKnownChannel(const std::string& channel) {
    const auto& channels = knownChannels();
    return std::find(channels.begin(), channels.end(), channel) != channels.end();
}

std::vector<std::string> Debug::parseChannelList(const std::string& list) {
    std::vector<std::string> channels;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = item.find_last_not_of(" \t");
        std::string name = item.substr(first, last - first + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (std::find(channels.begin(), channels.end(), name) == channels.end()) {
            channels.push_back(name);
        }
    }
    return channels;
}

std::string Debug::hexDump(const uint8_t* data, size_t size, size_t limit) {
    std::stringstream ss;
    size_t shown = std::min(size, limit);
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < shown; ++i) {
        if (i) ss << ' ';
        ss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    if (shown < size) {
        ss << std::dec << " ... (" << size << " bytes)";
    }
    return ss.str();
}

void Debug::write(const std::string& channel, const std::string& function, int line, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    auto timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt = *std::localtime(&timer);

    std::stringstream ss;
    ss << std::put_time(&bt, "%H:%M:%S") << '.' << std::dec << std::setfill('0') << std::setw(6) << us.count()
       << " [" << channel << "]: ";
    if (!function.empty()) {
        ss << function << ":" << line << ": ";
    }
    ss << message;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_log_to_file && m_logfile.is_open()) {
        m_logfile << ss.str() << std::endl;
    } else {
        std::cout << ss.str() << std::endl;
    }
}
