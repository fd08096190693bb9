#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <vector>

namespace usb_audio {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setSystemIdentity(const std::string& ident);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    void debug(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void info(const std::string& message,
             const std::string& source = "",
             const std::string& function = "");
    void warning(const std::string& message,
                const std::string& source = "",
                const std::string& function = "");
    void error(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void critical(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");

    void flush();
    void clear();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;

    static LogLevel levelFromInt(int level);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source = "",
             const std::string& function = "");
    std::string formatLogMessage(std::chrono::system_clock::time_point timestamp,
                                 LogLevel level,
                                 const std::string& message,
                                 const std::string& source,
                                 const std::string& function) const;
    std::string getLevelString(LogLevel level) const;

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::usb_audio::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::usb_audio::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::usb_audio::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::usb_audio::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::usb_audio::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace usb_audio
