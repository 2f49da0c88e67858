#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <optional>

namespace SerialDevice {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void setLogFile(const std::string& filename);
    void closeLogFile();
    void setConsoleOutput(bool enabled);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);

    mutable std::mutex mutex_;
    LogLevel minLevel_;
    bool consoleOutput_;
    std::ofstream logFile_;
};

// Accepts "DEBUG", "INFO", "WARNING" and "ERROR" (case-insensitive).
std::optional<LogLevel> logLevelFromString(const std::string& name);

} // namespace SerialDevice

#define SD_LOG_DEBUG(msg) ::SerialDevice::Logger::getInstance().log(::SerialDevice::LogLevel::DEBUG, msg)
#define SD_LOG_INFO(msg) ::SerialDevice::Logger::getInstance().log(::SerialDevice::LogLevel::INFO, msg)
#define SD_LOG_WARNING(msg) ::SerialDevice::Logger::getInstance().log(::SerialDevice::LogLevel::WARNING, msg)
#define SD_LOG_ERROR(msg) ::SerialDevice::Logger::getInstance().log(::SerialDevice::LogLevel::ERROR, msg)
