#pragma once

#include <string>
#include <utility>

#include <fmt/format.h>

namespace ck::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

/**
 * @brief Destination for leveled log lines.
 *
 * Implementations only provide Write(); the level helpers format with {fmt}
 * and forward. One sink is created at process start and handed to whatever
 * needs to report (see ConfigSerializer).
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(LogLevel level, const std::string& message) = 0;

    template<typename... Args>
    void Debug(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Info(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Critical(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Critical, fmt::format(format, std::forward<Args>(args)...));
    }
};

} // namespace ck::core
