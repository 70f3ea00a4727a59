#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace fastdocx {

/**
 * @brief 进程级日志器：控制台彩色输出 + 可轮转的日志文件
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/fastdocx.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void trace(const std::string& message)    { log(Level::TRACE, message); }
    void debug(const std::string& message)    { log(Level::DEBUG, message); }
    void info(const std::string& message)     { log(Level::INFO, message); }
    void warn(const std::string& message)     { log(Level::WARN, message); }
    void error(const std::string& message)    { log(Level::ERROR, message); }
    void critical(const std::string& message) { log(Level::CRITICAL, message); }

    template<typename... Args>
    void trace(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::TRACE, fmt_str, args...);
    }

    template<typename... Args>
    void debug(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::DEBUG, fmt_str, args...);
    }

    template<typename... Args>
    void info(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::INFO, fmt_str, args...);
    }

    template<typename... Args>
    void warn(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::WARN, fmt_str, args...);
    }

    template<typename... Args>
    void error(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::ERROR, fmt_str, args...);
    }

    template<typename... Args>
    void critical(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::CRITICAL, fmt_str, args...);
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logFormatted(level, fmt_with_ctx, args...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void logFormatted(Level level, const std::string& fmt_str, Args&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            log(level, fmt_str);
        } else {
            try {
                log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error&) {
                // 格式串与参数不匹配时退化为原样输出
                log(level, fmt_str);
            }
        }
    }

    void log(Level level, const std::string& message);
    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

} // namespace fastdocx

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define FASTDOCX_FUNC __FUNCTION__
#else
#  define FASTDOCX_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define FASTDOCX_LOG_TRACE(fmt, ...)    fastdocx::Logger::getInstance().logCtx(fastdocx::Logger::Level::TRACE,    __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_DEBUG(fmt, ...)    fastdocx::Logger::getInstance().logCtx(fastdocx::Logger::Level::DEBUG,    __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_INFO(fmt, ...)     fastdocx::Logger::getInstance().logCtx(fastdocx::Logger::Level::INFO,     __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_WARN(fmt, ...)     fastdocx::Logger::getInstance().logCtx(fastdocx::Logger::Level::WARN,     __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_ERROR(fmt, ...)    fastdocx::Logger::getInstance().logCtx(fastdocx::Logger::Level::ERROR,    __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_CRITICAL(fmt, ...) fastdocx::Logger::getInstance().logCtx(fastdocx::Logger::Level::CRITICAL, __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)
