//
//  logging.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <cstdint>

namespace taglens {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Route log lines to a file instead of stderr. Returns false when the file cannot be opened.
bool set_log_file(const std::string &path);

// While deferred, lines are queued in memory (the terminal UI owns the screen).
// Turning deferral off flushes the queue to the active sink.
void set_log_deferred(bool deferred);

// Writes one formatted line to the active sink.
void write_log_line(const std::string &line);

// Parses "error", "warn"/"warning", "info", "debug". Unknown strings map to Error.
LogVerbosity parse_log_level(const std::string &s);

// Hex-preview helper used in debug logs to dump a short prefix of binary payloads.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t>& data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace taglens

inline constexpr taglens::LogVerbosity tl_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return taglens::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return taglens::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return taglens::LogVerbosity::Info;
    }
    // Everything else (exiftool/ingest/view/etc.) treated as debug-level.
    return taglens::LogVerbosity::Debug;
}

inline bool tl_should_log(const char* level) {
    const auto current = taglens::get_log_verbosity();
    const auto sev = tl_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void tl_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    std::ostringstream out;
    if (lvl == "error") {
        out << "[TagLens][" << lvl << "][" << file << ":" << line << " " << func << "] " << msg;
    } else {
        out << "[TagLens][" << lvl << "] " << msg;
    }
    taglens::write_log_line(out.str());
}

#define TL_LOG(level, message)                                              \
    do {                                                                    \
        if (tl_should_log(level)) {                                         \
            std::ostringstream _tl_log_ss;                                  \
            _tl_log_ss << message;                                          \
            tl_log_impl(level, _tl_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
