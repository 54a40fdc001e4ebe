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

namespace xlstext {

/**
 * @brief 进程级日志器
 *
 * 同时输出到控制台和文件，文件超过大小上限时滚动。
 * 未显式初始化时，第一次写日志会按默认参数初始化。
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

    void initialize(const std::string& log_file_path = "logs/xlstext.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    /**
     * @brief 打开/关闭控制台输出
     *
     * 命令行工具把正文写到stdout时需要关闭控制台日志，避免混入输出。
     */
    void setConsoleEnabled(bool enabled);

    bool shouldLog(Level level) const;

    /**
     * @brief 写一条已经格式化好的消息
     */
    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时原样输出
            log(level, fmt_str);
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logToConsole(Level level, const std::string& message);
    void logToFile(const std::string& message);
    std::string formatMessage(Level level, const std::string& message) const;
    static const char* levelToString(Level level);
    std::string getTimestamp() const;
    void rotateFileIfNeeded();
    std::string getRotatedFilename(size_t index) const;
    void flushUnlocked();

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";

        std::string sig(func_sig);
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
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
#  define XLSTEXT_FUNC __FUNCTION__
#else
#  define XLSTEXT_FUNC __func__
#endif

#define XLSTEXT_LOG_AT(level, fmt, ...) \
    xlstext::Logger::getInstance().logCtx(level, __FILE__, __LINE__, XLSTEXT_FUNC, fmt, ##__VA_ARGS__)

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define XLSTEXT_LOG_TRACE(fmt, ...)    XLSTEXT_LOG_AT(xlstext::Logger::Level::TRACE,    fmt, ##__VA_ARGS__)
#define XLSTEXT_LOG_DEBUG(fmt, ...)    XLSTEXT_LOG_AT(xlstext::Logger::Level::DEBUG,    fmt, ##__VA_ARGS__)
#define XLSTEXT_LOG_INFO(fmt, ...)     XLSTEXT_LOG_AT(xlstext::Logger::Level::INFO,     fmt, ##__VA_ARGS__)
#define XLSTEXT_LOG_WARN(fmt, ...)     XLSTEXT_LOG_AT(xlstext::Logger::Level::WARN,     fmt, ##__VA_ARGS__)
#define XLSTEXT_LOG_ERROR(fmt, ...)    XLSTEXT_LOG_AT(xlstext::Logger::Level::ERROR,    fmt, ##__VA_ARGS__)
#define XLSTEXT_LOG_CRITICAL(fmt, ...) XLSTEXT_LOG_AT(xlstext::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace xlstext
