#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace hrx {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

// Parses "debug", "info", "warning" (or "warn"), "error" and "off"
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

// Process-wide logger
// Lines are written as "[hrx] WARNING: message". Messages below the current
// level are dropped; the default level is Warning and the default sink is
// std::cerr.
//
// Thread safety: All public methods are thread-safe.
//
// Usage:
//   auto& log = Log::global();
//   if (log.enabled(LogLevel::Debug)) {
//       log.debug("parsed " + std::to_string(n) + " entries");
//   }
//
class Log {
public:
    static Log& global();

    void setLevel(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    // Redirect output. The stream must outlive its use by the logger.
    void setSink(std::ostream& sink);

    [[nodiscard]] bool enabled(LogLevel level) const;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

private:
    Log();

    void write(LogLevel level, std::string_view message);

    mutable std::mutex mutex_;
    std::ostream* sink_;
    LogLevel level_ = LogLevel::Warning;
};

}  // namespace hrx
