/**
 * @file logger.hpp
 * @brief 线程安全日志系统
 * @date 2026-10-18
 */

#ifndef DUOARM_COMMON_LOGGER_HPP
#define DUOARM_COMMON_LOGGER_HPP

#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>

namespace duoarm {

/**
 * @brief 日志级别
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/**
 * @brief 从字符串解析日志级别 (trace/debug/info/warn/error/fatal)
 * @return 是否识别
 */
inline bool parse_log_level(const char* text, LogLevel& level) {
    if (!text) return false;
    static const struct { const char* name; LogLevel level; } table[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
        {"error", LogLevel::ERROR}, {"fatal", LogLevel::FATAL},
    };
    for (const auto& entry : table) {
        if (strcasecmp(text, entry.name) == 0) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

/**
 * @brief 日志类
 *
 * INFO及以下输出到stdout, WARN及以上输出到stderr。
 * 环境变量 DUOARM_LOG_LEVEL 可覆盖默认级别。
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
    void set_show_timestamp(bool show) { show_timestamp_ = show; }

    void log(LogLevel level, const char* file, int line, const char* fmt, ...) {
        if (level < min_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        FILE* out = (level >= LogLevel::WARN) ? stderr : stdout;

        // 时间戳
        if (show_timestamp_) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            struct tm tm_buf;
            localtime_r(&time, &tm_buf);
            char time_buf[32];
            std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);
            fprintf(out, "[%s.%03ld] ", time_buf, static_cast<long>(ms.count()));
        }

        fprintf(out, "[%s] ", level_str(level));

        // 文件和行号
        if (level >= LogLevel::WARN) {
            const char* filename = strrchr(file, '/');
            filename = filename ? filename + 1 : file;
            fprintf(out, "(%s:%d) ", filename, line);
        }

        va_list args;
        va_start(args, fmt);
        vfprintf(out, fmt, args);
        va_end(args);
        fprintf(out, "\n");
        fflush(out);
    }

private:
    Logger() : min_level_(LogLevel::INFO), show_timestamp_(true) {
        LogLevel env_level;
        if (parse_log_level(std::getenv("DUOARM_LOG_LEVEL"), env_level)) {
            min_level_ = env_level;
        }
    }

    const char* level_str(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return " INFO";
            case LogLevel::WARN:  return " WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    LogLevel min_level_;
    bool show_timestamp_;
    std::mutex mutex_;
};

// 日志宏
#define LOG_TRACE(fmt, ...) \
    duoarm::Logger::instance().log(duoarm::LogLevel::TRACE, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) \
    duoarm::Logger::instance().log(duoarm::LogLevel::DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) \
    duoarm::Logger::instance().log(duoarm::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) \
    duoarm::Logger::instance().log(duoarm::LogLevel::WARN, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) \
    duoarm::Logger::instance().log(duoarm::LogLevel::ERROR, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) \
    duoarm::Logger::instance().log(duoarm::LogLevel::FATAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

} // namespace duoarm

#endif // DUOARM_COMMON_LOGGER_HPP
