#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <sstream>

namespace cyberrisk {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Per-phase tracing of engine runs.
    INFO,     ///< Run start/finish summaries.
    WARNING,  ///< Expected but notable outcomes (infeasible plans, cancellations).
    ERROR,    ///< Errors hindering specific operations.
    FATAL     ///< Critical errors halting the program.
};

/**
 * @class Logger
 * @brief A thread-safe singleton logger shared by all engines.
 *
 * Messages are timestamped and tagged with severity and source, written to the
 * console and optionally to a file. Engine calls may run on several worker threads
 * at once; output is serialized, and the level filter is read without locking.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     * @return Logger& Reference to the unique logger instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        logLevel_.store(level, std::memory_order_relaxed);
    }

    LogLevel getLogLevel() const {
        return logLevel_.load(std::memory_order_relaxed);
    }

    bool isEnabled(LogLevel level) const {
        return level >= getLogLevel();
    }

    /**
     * @brief Configures file logging.
     *
     * Enabling reopens the file in append mode, closing any previously open log file.
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] The path to the log file (used only if enable is true).
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "cyberrisk.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enable) {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            logFile_.open(filename, std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                return false;
            }
            writeLocked(formatLogMessage(LogLevel::INFO, "Logger", "File logging enabled to: " + filename));
            return true;
        }
        if (logFile_.is_open()) {
            writeLocked(formatLogMessage(LogLevel::INFO, "Logger", "File logging disabled."));
            logFile_.close();
        }
        return true;
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (e.g. "LossExpectancySimulator::run").
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (!isEnabled(level)) return;

        std::string formattedMessage = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        writeLocked(formattedMessage);
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Caller holds mutex_.
    void writeLocked(const std::string& formattedMessage) {
        std::cout << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) const {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    std::atomic<LogLevel> logLevel_; ///< Minimum level for messages to be processed.
    std::ofstream logFile_;          ///< Output file stream (if file logging is enabled).
    std::mutex mutex_;               ///< Serializes console and file output.
};

} // namespace cyberrisk

#endif // LOGGER_H
