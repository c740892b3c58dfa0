#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace oftee {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Accepts debug/info/warn/warning/error, plus trace (debug) and fatal/panic (error).
std::optional<LogLevel> parse_log_level(std::string_view text);
const char* to_string(LogLevel level);

// Collects one log line and emits it in a single write on destruction.
// Debug and info go to stdout, warn and error to stderr. A line below the
// current level formats nothing and writes nothing.
class LogLine {
public:
    LogLine(LogLevel level, std::string_view tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) out_ << value;
        return *this;
    }

    bool enabled() const { return enabled_; }
    std::string text() const { return out_.str(); }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream out_;
};

inline LogLine log_debug(std::string_view tag) { return LogLine(LogLevel::Debug, tag); }
inline LogLine log_info(std::string_view tag) { return LogLine(LogLevel::Info, tag); }
inline LogLine log_warn(std::string_view tag) { return LogLine(LogLevel::Warn, tag); }
inline LogLine log_error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }

} // namespace oftee
