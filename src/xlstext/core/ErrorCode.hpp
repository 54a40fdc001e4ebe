#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace xlstext {
namespace core {

/**
 * @brief XlsText统一错误码
 *
 * 底层统一返回错误码，是否抛异常由调用方决定。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 文件/流操作错误 (20-39)
    FileNotFound = 20,
    FileReadError = 21,
    FileWriteError = 22,

    // 表格文档错误 (40-59)
    InvalidWorkbook = 40,
    SheetNotFound = 41
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    // 注意：true 表示“有错误”
    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 成功结果
 */
inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace xlstext::core
