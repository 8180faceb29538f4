#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ck/core/ILogSink.hpp"

namespace ck::core {

struct LoggerOptions {
    std::filesystem::path filePath = "log.log";
#ifdef CK_DEBUG
    LogLevel minLevel = LogLevel::Debug;
#else
    LogLevel minLevel = LogLevel::Info;
#endif
    bool mirrorToConsole = true;

    // Applies CK_LOG_FILE and CK_LOG_LEVEL on top of the defaults.
    static LoggerOptions FromEnvironment();
};

std::optional<LogLevel> ParseLogLevel(std::string_view name);
const char* LogLevelName(LogLevel level);

/**
 * @brief File + console log sink.
 *
 * Every line at or above the minimum level is appended to the log file.
 * Debug lines are mirrored to stdout, Warning and above to stderr; Info only
 * reaches the file and listeners.
 */
class Logger : public ILogSink {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(LoggerOptions options = {});
    ~Logger() override;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void Write(LogLevel level, const std::string& message) override;

    void SetLogFile(const std::filesystem::path& path);
    void SetMinLevel(LogLevel level) { m_minLevel.store(level, std::memory_order_release); }
    LogLevel GetMinLevel() const { return m_minLevel.load(std::memory_order_acquire); }

    size_t RegisterListener(LogCallback callback);
    void UnregisterListener(size_t token);

private:
    static std::string FormatTimestamp();
    static constexpr const char* LogLevelPrefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return "[Debug] ";
            case LogLevel::Info:     return "[Info] ";
            case LogLevel::Warning:  return "[Warning] ";
            case LogLevel::Error:    return "[Error] ";
            case LogLevel::Critical: return "[Critical] ";
        }
        return "";
    }

    void OpenLogStreamLocked();

    std::atomic<LogLevel> m_minLevel;
    bool m_mirrorToConsole = true;

    std::mutex m_mutex;
    std::filesystem::path m_logFilePath;
    std::ofstream m_logStream;
    std::vector<std::pair<size_t, LogCallback>> m_listeners;
    size_t m_listenerCounter = 1;
};

} // namespace ck::core
