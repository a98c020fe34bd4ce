#pragma once

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>

#ifndef IDENTPICK_LOG_LEVEL
#define IDENTPICK_LOG_LEVEL 0
#endif

namespace identpick {

enum class LogLevel {
    Disable = 0,
    Critical,
    Error,
    Warning,
    Info,
    Debug,
};

class EnabledLogger {
public:
    EnabledLogger(const char* prefix, const char* file, size_t line) {
        stream_ << "[identpick] [" << prefix << "] ";
        stream_ << "{" << std::filesystem::path(file).filename().string() << ":"
                << line << "} ";
    }

    ~EnabledLogger() {
        stream_ << "\n";
        std::cerr << stream_.str();
    }

    template <typename T>
    EnabledLogger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
};

class DisabledLogger {
public:
    DisabledLogger(const char*, const char*, size_t) {}

    template <typename T>
    DisabledLogger& operator<<(const T&) {
        return *this;
    }
};

/// Resolves to a no-op logger when `level` is above IDENTPICK_LOG_LEVEL.
template <LogLevel level>
using Logger = std::conditional_t<LogLevel{IDENTPICK_LOG_LEVEL} >= level,
                                  EnabledLogger, DisabledLogger>;

} // namespace identpick

#define IDENTPICK_LOG_COMMON(_level_, _level_name_) \
    identpick::Logger<_level_>(_level_name_, __FILE__, __LINE__)

#define LOG_ERROR IDENTPICK_LOG_COMMON(identpick::LogLevel::Error, "ERROR")
#define LOG_DEBUG IDENTPICK_LOG_COMMON(identpick::LogLevel::Debug, "DEBUG")
