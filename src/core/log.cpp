/**
 * @file log.cpp
 * @brief Process-wide diagnostic sink
 */

#include "cursers/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <mutex>

namespace cursers {

namespace {

struct LogSink {
    std::mutex mutex;
    std::ostream *stream = nullptr;
    std::atomic<LogLevel> level{LogLevel::Warning};
};

LogSink &sink() {
    static LogSink instance;
    return instance;
}

} // namespace

void set_log_level(LogLevel level) {
    sink().level.store(level);
}

LogLevel log_level() {
    return sink().level.load();
}

void set_log_stream(std::ostream *stream) {
    std::lock_guard<std::mutex> lock(sink().mutex);
    sink().stream = stream;
}

void log(LogLevel level, std::string_view component, const std::string &message) {
    if (level == LogLevel::Off || level < sink().level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(sink().mutex);
    std::ostream &out = sink().stream ? *sink().stream : std::cerr;
    out << "[" << component << "] " << to_string(level) << ": " << message << std::endl;
}

const char *to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error,
                           LogLevel::Off}) {
        if (lower == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace cursers
