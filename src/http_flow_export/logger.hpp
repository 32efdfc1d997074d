#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * Logger used by the exporter and the command line front end.
 *
 * Usage:
 *   Logger::setLevel(LogLevel::INFO);
 *   LOG_DEBUG("Sanitized request: " << request.method);
 *   LOG_INFO("Exported " << bytes << " bytes");
 *   LOG_WARNING("Clipboard backend not found");
 *   LOG_ERROR("Failed to open " << path);
 *
 * DEBUG and INFO/WARNING go to the standard stream, ERROR to the error
 * stream. Both streams can be redirected (tests capture export reports that
 * way). DEBUG is compiled out with -DNDEBUG.
 */

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4  // Disable all logging
};

class Logger {
public:
    static void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_level_ = level;
    }

    static LogLevel getLevel() {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_level_;
    }

    static void setShowTimestamp(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_timestamp_ = show;
    }

    // Redirect output. nullptr restores std::cout / std::cerr.
    static void setStreams(std::ostream* out, std::ostream* err) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out != nullptr ? out : &std::cout;
        err_ = err != nullptr ? err : &std::cerr;
    }

    static bool isEnabled(LogLevel level) {
        return level >= current_level_;
    }

    static void log(LogLevel level, const std::string& message,
                    const char* file = nullptr, int line = 0) {
        if (level < current_level_) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        std::ostringstream oss;

        if (show_timestamp_) {
            time_t now = time(nullptr);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", localtime(&now));
            oss << "[" << buf << "] ";
        }

        oss << "[" << levelToString(level) << "] ";

        // Source location only for DEBUG
        if (level == LogLevel::DEBUG && file) {
            oss << file << ":" << line << " - ";
        }

        oss << message << "\n";

        if (level >= LogLevel::ERROR) {
            *err_ << oss.str() << std::flush;
        } else {
            *out_ << oss.str() << std::flush;
        }
    }

private:
    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR:   return "ERROR";
            default:                return "UNKNOWN";
        }
    }

    static LogLevel current_level_;
    static bool show_timestamp_;
    static std::ostream* out_;
    static std::ostream* err_;
    static std::mutex mutex_;
};

#define LOG_DEBUG(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::DEBUG)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::DEBUG, oss.str(), __FILE__, __LINE__); \
        } \
    } while(0)

#define LOG_INFO(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::INFO)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::INFO, oss.str()); \
        } \
    } while(0)

#define LOG_WARNING(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::WARNING)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::WARNING, oss.str()); \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        if (Logger::isEnabled(LogLevel::ERROR)) { \
            std::ostringstream oss; \
            oss << msg; \
            Logger::log(LogLevel::ERROR, oss.str()); \
        } \
    } while(0)

#ifdef NDEBUG
#undef LOG_DEBUG
#define LOG_DEBUG(msg) do {} while(0)
#endif

#endif  // LOGGER_HPP
