#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <thread>
#include <sstream>
#include <chrono>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace xlstext {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // 双重检查
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = max_files;
    write_mode_ = write_mode;

    // 空路径表示只输出到控制台
    if (!log_file_path_.empty()) {
        try {
            std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
            if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
                std::filesystem::create_directories(log_dir);
            }
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Logger: cannot create log directory: " << ex.what() << std::endl;
        }

        std::ios::openmode open_mode = (write_mode_ == WriteMode::APPEND) ?
                                       (std::ios::out | std::ios::app) :
                                       (std::ios::out | std::ios::trunc);
        file_stream_.open(log_file_path_, open_mode);
        if (file_stream_.is_open() && write_mode_ == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_.store(static_cast<size_t>(file_stream_.tellp()));
        } else {
            current_file_size_.store(0);
        }
    }

#ifdef _WIN32
    if (enable_console) {
        SetConsoleOutputCP(CP_UTF8);
    }
#endif

    initialized_.store(true);

    if (static_cast<int>(Level::DEBUG) >= static_cast<int>(current_level_.load())) {
        std::string msg = formatMessage(Level::DEBUG,
            fmt::format("Logger initialized. Log file: {}, Mode: {}",
                        log_file_path_.empty() ? "<none>" : log_file_path_,
                        write_mode_ == WriteMode::APPEND ? "APPEND" : "TRUNCATE"));
        if (enable_console_.load()) {
            logToConsole(Level::DEBUG, msg);
        }
        logToFile(msg);
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

void Logger::setConsoleEnabled(bool enabled) {
    enable_console_.store(enabled);
}

bool Logger::shouldLog(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!shouldLog(level)) return;

    if (!initialized_.load()) {
        initialize();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string formatted_message = formatMessage(level, message);

    if (enable_console_.load()) {
        logToConsole(level, formatted_message);
    }
    logToFile(formatted_message);

    // WARN及以上立即刷新
    if (static_cast<int>(level) >= static_cast<int>(Level::WARN)) {
        flushUnlocked();
    }
}

void Logger::logToConsole(Level level, const std::string& message) {
    const char* color_code = "\033[0m";
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break; // 白色
        case Level::DEBUG:    color_code = "\033[36m"; break; // 青色
        case Level::INFO:     color_code = "\033[32m"; break; // 绿色
        case Level::WARN:     color_code = "\033[33m"; break; // 黄色
        case Level::ERROR:    color_code = "\033[31m"; break; // 红色
        case Level::CRITICAL: color_code = "\033[35m"; break; // 紫色
        default: break;
    }

    // 日志走stderr，stdout留给转换结果
    std::cerr << color_code << message << "\033[0m" << '\n';
}

void Logger::logToFile(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }

    rotateFileIfNeeded();

    file_stream_ << message << '\n';
    current_file_size_.fetch_add(message.length() + 1);
}

void Logger::rotateFileIfNeeded() {
    if (current_file_size_.load() < max_file_size_ || max_files_ == 0) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::string old_file = getRotatedFilename(i - 1);
        std::string new_file = getRotatedFilename(i);
        if (std::filesystem::exists(old_file, ec)) {
            std::filesystem::rename(old_file, new_file, ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_.store(0);
}

std::string Logger::getRotatedFilename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::formatMessage(Level level, const std::string& message) const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return fmt::format("[{}] [{}] [{}] {}",
                       getTimestamp(),
                       levelToString(level),
                       oss.str(),
                       message);
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flushUnlocked();
}

void Logger::flushUnlocked() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    // 拿不到锁说明还有线程在写，直接返回避免死锁
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

    if (initialized_.load()) {
        if (file_stream_.is_open()) {
            file_stream_.flush();
            file_stream_.close();
        }
        initialized_.store(false);
    }
}

Logger::~Logger() {
    shutdown();
}

} // namespace xlstext
