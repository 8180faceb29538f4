#include "ck/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <system_error>

#include <fmt/format.h>

namespace ck::core {

LoggerOptions LoggerOptions::FromEnvironment() {
    LoggerOptions options;
    if (const char* file = std::getenv("CK_LOG_FILE")) {
        options.filePath = file;
    }
    if (const char* level = std::getenv("CK_LOG_LEVEL")) {
        if (auto parsed = ParseLogLevel(level)) {
            options.minLevel = *parsed;
        } else {
            fmt::print(stderr, "[Logger] Ignoring unknown CK_LOG_LEVEL '{}'\n", level);
        }
    }
    return options;
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string value(name);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "debug") {
        return LogLevel::Debug;
    }
    if (value == "info") {
        return LogLevel::Info;
    }
    if (value == "warning" || value == "warn") {
        return LogLevel::Warning;
    }
    if (value == "error") {
        return LogLevel::Error;
    }
    if (value == "critical") {
        return LogLevel::Critical;
    }
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warning:  return "warning";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
    }
    return "unknown";
}

Logger::Logger(LoggerOptions options)
    : m_minLevel(options.minLevel),
      m_mirrorToConsole(options.mirrorToConsole) {
    SetLogFile(options.filePath);
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logStream.is_open()) {
        m_logStream.flush();
        m_logStream.close();
    }
}

void Logger::SetLogFile(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logStream.is_open()) {
        m_logStream.close();
    }
    m_logFilePath = path;
    OpenLogStreamLocked();
}

void Logger::OpenLogStreamLocked() {
    if (m_logFilePath.empty()) {
        return;
    }
    std::error_code ec;
    if (m_logFilePath.has_parent_path()) {
        std::filesystem::create_directories(m_logFilePath.parent_path(), ec);
    }
    m_logStream.open(m_logFilePath, std::ios::out | std::ios::app);
    if (!m_logStream.is_open() && m_mirrorToConsole) {
        fmt::print(stderr, "[Logger] Failed to open log file '{}'\n", m_logFilePath.string());
    }
}

size_t Logger::RegisterListener(LogCallback callback) {
    if (!callback) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t token = m_listenerCounter++;
    m_listeners.emplace_back(token, std::move(callback));
    return token;
}

void Logger::UnregisterListener(size_t token) {
    if (token == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_listeners.begin(), m_listeners.end(),
                             [token](const auto& entry) { return entry.first == token; });
    m_listeners.erase(it, m_listeners.end());
}

void Logger::Write(LogLevel level, const std::string& message) {
    if (level < GetMinLevel()) {
        return;
    }

    const std::string line = fmt::format("[{}] {}{}", FormatTimestamp(), LogLevelPrefix(level), message);

    std::vector<LogCallback> listenersCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mirrorToConsole) {
            if (level == LogLevel::Debug) {
                fmt::print(stdout, "{}\n", line);
            } else if (level >= LogLevel::Warning) {
                fmt::print(stderr, "{}\n", line);
            }
        }
        if (m_logStream.is_open()) {
            m_logStream << line << '\n';
            m_logStream.flush();
        }
        listenersCopy.reserve(m_listeners.size());
        for (const auto& [token, callback] : m_listeners) {
            if (callback) {
                listenersCopy.push_back(callback);
            }
        }
    }

    for (auto& callback : listenersCopy) {
        callback(level, line);
    }
}

std::string Logger::FormatTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto timeT = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       ms.count());
}

} // namespace ck::core
