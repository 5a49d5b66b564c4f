#include "hrx/log.hpp"

#include <iostream>

namespace hrx {

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

Log& Log::global() {
    static Log instance;
    return instance;
}

Log::Log()
    : sink_(&std::cerr) {}

void Log::setLevel(LogLevel level) {
    std::lock_guard lock(mutex_);
    level_ = level;
}

LogLevel Log::level() const {
    std::lock_guard lock(mutex_);
    return level_;
}

void Log::setSink(std::ostream& sink) {
    std::lock_guard lock(mutex_);
    sink_ = &sink;
}

bool Log::enabled(LogLevel level) const {
    std::lock_guard lock(mutex_);
    return level != LogLevel::Off && level >= level_;
}

void Log::debug(std::string_view message) {
    write(LogLevel::Debug, message);
}

void Log::info(std::string_view message) {
    write(LogLevel::Info, message);
}

void Log::warn(std::string_view message) {
    write(LogLevel::Warning, message);
}

void Log::error(std::string_view message) {
    write(LogLevel::Error, message);
}

void Log::write(LogLevel level, std::string_view message) {
    std::lock_guard lock(mutex_);
    if (level < level_) {
        return;
    }

    *sink_ << "[hrx] ";
    switch (level) {
        case LogLevel::Debug: *sink_ << "DEBUG: "; break;
        case LogLevel::Warning: *sink_ << "WARNING: "; break;
        case LogLevel::Error: *sink_ << "ERROR: "; break;
        default: break;
    }
    *sink_ << message << "\n";
}

}  // namespace hrx
