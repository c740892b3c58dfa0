#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>

namespace oftee {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(log_level());
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "debug" || value == "trace") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warn" || value == "warning") return LogLevel::Warn;
    if (value == "error" || value == "fatal" || value == "panic") return LogLevel::Error;
    return std::nullopt;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

LogLine::LogLine(LogLevel level, std::string_view tag)
    : level_(level),
      enabled_(log_enabled(level)) {
    if (enabled_) out_ << '[' << tag << "] ";
}

LogLine::~LogLine() {
    if (!enabled_) return;
    out_ << '\n';
    const auto line = out_.str();
    auto& sink = level_ >= LogLevel::Warn ? std::cerr : std::cout;
    sink.write(line.data(), static_cast<std::streamsize>(line.size()));
    sink.flush();
}

} // namespace oftee
