#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <memory>
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
 * @brief 进程级日志器
 *
 * 控制台 + 滚动文件两路输出，消息格式化统一走 fmt。
 * 未显式 initialize() 时，第一次写日志会按默认参数初始化。
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

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            log(level, fmt_str);
        } else {
            try {
                log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error& e) {
                // 格式串与参数不匹配时保留原始格式串，便于定位
                log(level, fmt::format("{} <format error: {}>", fmt_str, e.what()));
            }
        }
    }

    // 带源码位置信息的接口（供宏使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        logf(level,
             fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str),
             std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 去掉目录部分，只保留文件名
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
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define FASTDOCX_FUNC __FUNCTION__
#else
#  define FASTDOCX_FUNC __func__
#endif

#define FASTDOCX_LOG_AT(level, fmt, ...) \
    fastdocx::Logger::getInstance().logCtx(level, __FILE__, __LINE__, FASTDOCX_FUNC, fmt, ##__VA_ARGS__)

#define FASTDOCX_LOG_TRACE(fmt, ...)    FASTDOCX_LOG_AT(fastdocx::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_DEBUG(fmt, ...)    FASTDOCX_LOG_AT(fastdocx::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_INFO(fmt, ...)     FASTDOCX_LOG_AT(fastdocx::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_WARN(fmt, ...)     FASTDOCX_LOG_AT(fastdocx::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_ERROR(fmt, ...)    FASTDOCX_LOG_AT(fastdocx::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define FASTDOCX_LOG_CRITICAL(fmt, ...) FASTDOCX_LOG_AT(fastdocx::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace fastdocx
