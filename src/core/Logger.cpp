#include "Logger.hpp"
#include <syslog.h>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace usb_audio {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    std::string systemIdent{"usb-audio-rtsp"};
    bool includeTimestamps{true};
    bool includeSourceInfo{true};
    bool syslogOpen{false};

    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs{1000};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (logFile.empty()) {
            return;
        }
        std::error_code ec;
        auto parent = std::filesystem::path(logFile).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        if (!fileStream->is_open()) {
            std::cerr << "Failed to open log file " << logFile << std::endl;
            fileStream.reset();
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    void writeToConsole(LogLevel level, const std::string& formattedMessage) {
        if (level >= LogLevel::Warning) {
            std::cerr << formattedMessage << std::endl;
        } else {
            std::cout << formattedMessage << std::endl;
        }
    }

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream) {
            openLogFile();
        }
        if (fileStream) {
            (*fileStream) << formattedMessage << std::endl;
        }
    }

    void writeToSystem(LogLevel level, const std::string& message) {
        if (!syslogOpen) {
            openlog(systemIdent.c_str(), LOG_PID, LOG_DAEMON);
            syslogOpen = true;
        }
        int priority = LOG_INFO;
        switch (level) {
            case LogLevel::Debug:    priority = LOG_DEBUG; break;
            case LogLevel::Info:     priority = LOG_INFO; break;
            case LogLevel::Warning:  priority = LOG_WARNING; break;
            case LogLevel::Error:    priority = LOG_ERR; break;
            case LogLevel::Critical: priority = LOG_CRIT; break;
        }
        syslog(priority, "%s", message.c_str());
    }

    void pruneRecentLogs() {
        while (recentLogs.size() > maxRecentLogs) {
            recentLogs.pop_front();
        }
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() {
    d->closeLogFile();
    if (d->syslogOpen) {
        closelog();
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setSystemIdentity(const std::string& ident) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->systemIdent = ident;
    if (d->syslogOpen) {
        closelog();
        d->syslogOpen = false;
    }
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

void Logger::debug(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                    const std::string& source,
                    const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                const std::string& message,
                const std::string& source,
                const std::string& function) {
    std::lock_guard<std::mutex> lock(d->logMutex);

    if (level < d->currentLevel) {
        return;
    }

    LogEntry entry{
        std::chrono::system_clock::now(),
        level,
        message,
        source,
        function
    };

    d->recentLogs.push_back(entry);
    d->pruneRecentLogs();

    std::string formattedMessage = formatLogMessage(
        entry.timestamp, level, message, source, function);

    if (d->destination == LogDestination::Console ||
        d->destination == LogDestination::All) {
        d->writeToConsole(level, formattedMessage);
    }

    if (d->destination == LogDestination::File ||
        d->destination == LogDestination::All) {
        d->writeToFile(formattedMessage);
    }

    if (d->destination == LogDestination::System ||
        d->destination == LogDestination::All) {
        d->writeToSystem(level, message);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
    std::cout.flush();
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->recentLogs.clear();
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 :
                   d->recentLogs.size() - count;

    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        const auto& entry = d->recentLogs[i];
        result.push_back(formatLogMessage(
            entry.timestamp,
            entry.level,
            entry.message,
            entry.source,
            entry.function
        ));
    }

    return result;
}

LogLevel Logger::levelFromInt(int level) {
    switch (level) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

std::string Logger::formatLogMessage(std::chrono::system_clock::time_point timestamp,
                                   LogLevel level,
                                   const std::string& message,
                                   const std::string& source,
                                   const std::string& function) const {
    std::stringstream ss;

    if (d->includeTimestamps) {
        auto time = std::chrono::system_clock::to_time_t(timestamp);
        std::tm local{};
        localtime_r(&time, &local);
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ";
    }

    ss << "[" << getLevelString(level) << "] ";

    if (d->includeSourceInfo && !source.empty()) {
        ss << std::filesystem::path(source).filename().string();
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

} // namespace usb_audio
