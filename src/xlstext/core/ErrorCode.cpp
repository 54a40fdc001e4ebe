#include "xlstext/core/ErrorCode.hpp"

namespace xlstext {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件/流操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::FileWriteError:
            return "File write error";

        // 表格文档错误
        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::SheetNotFound:
            return "sheet doesn't exist";

        default:
            return "Unknown error";
    }
}

}} // namespace xlstext::core
