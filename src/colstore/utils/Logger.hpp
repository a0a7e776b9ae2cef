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

namespace colstore {

/**
 * @brief 进程级日志器
 *
 * 控制台（带颜色）+ 文件输出，文件按大小轮转。
 * 首次写日志时若未初始化，则按默认参数自动初始化。
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
        TRUNCATE = 0,
        APPEND = 1
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/colstore.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            log(level, fmt_str);
        }
    }

    /**
     * @brief 带源码位置信息的接口（由COLSTORE_LOG_*宏调用）
     */
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
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
    void flush_unlocked();
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static inline const char* baseFilename(const char* path) {
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

#if defined(__GNUC__) || defined(__clang__) || defined(_MSC_VER)
#  define COLSTORE_FUNC __FUNCTION__
#else
#  define COLSTORE_FUNC __func__
#endif

// 统一日志宏（带源码位置信息）
#define COLSTORE_LOG_TRACE(fmt, ...)    colstore::Logger::getInstance().logCtx(colstore::Logger::Level::TRACE,    __FILE__, __LINE__, COLSTORE_FUNC, fmt, ##__VA_ARGS__)
#define COLSTORE_LOG_DEBUG(fmt, ...)    colstore::Logger::getInstance().logCtx(colstore::Logger::Level::DEBUG,    __FILE__, __LINE__, COLSTORE_FUNC, fmt, ##__VA_ARGS__)
#define COLSTORE_LOG_INFO(fmt, ...)     colstore::Logger::getInstance().logCtx(colstore::Logger::Level::INFO,     __FILE__, __LINE__, COLSTORE_FUNC, fmt, ##__VA_ARGS__)
#define COLSTORE_LOG_WARN(fmt, ...)     colstore::Logger::getInstance().logCtx(colstore::Logger::Level::WARN,     __FILE__, __LINE__, COLSTORE_FUNC, fmt, ##__VA_ARGS__)
#define COLSTORE_LOG_ERROR(fmt, ...)    colstore::Logger::getInstance().logCtx(colstore::Logger::Level::ERROR,    __FILE__, __LINE__, COLSTORE_FUNC, fmt, ##__VA_ARGS__)
#define COLSTORE_LOG_CRITICAL(fmt, ...) colstore::Logger::getInstance().logCtx(colstore::Logger::Level::CRITICAL, __FILE__, __LINE__, COLSTORE_FUNC, fmt, ##__VA_ARGS__)

} // namespace colstore
