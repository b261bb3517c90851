//
//  logging.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "logging.hpp"

#include <fstream>
#include <mutex>

namespace taglens {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};

namespace {

struct LogSink {
    std::mutex mutex;
    std::ofstream file;
    bool deferred = false;
    std::vector<std::string> queued;
};

LogSink &sink() {
    static LogSink s;
    return s;
}

void emit_locked(LogSink &s, const std::string &line) {
    if (s.file.is_open()) {
        s.file << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

bool set_log_file(const std::string &path) {
    auto &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.file.close();
    s.file.clear();
    s.file.open(path, std::ios::out | std::ios::app);
    return s.file.is_open();
}

void set_log_deferred(bool deferred) {
    auto &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.deferred = deferred;
    if (!deferred) {
        for (const auto &line : s.queued) {
            emit_locked(s, line);
        }
        s.queued.clear();
    }
}

void write_log_line(const std::string &line) {
    auto &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    // A log file never collides with the screen, so it is written immediately.
    if (s.deferred && !s.file.is_open()) {
        s.queued.push_back(line);
        return;
    }
    emit_locked(s, line);
}

LogVerbosity parse_log_level(const std::string &s) {
    if (s == "debug") return LogVerbosity::Debug;
    if (s == "info") return LogVerbosity::Info;
    if (s == "warn" || s == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

}  // namespace taglens
