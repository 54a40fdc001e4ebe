/**
 * @file Exception.cpp
 * @brief XlsText异常类实现
 */

#include "Exception.hpp"
#include "Expected.hpp"
#include <sstream>
#include <fmt/format.h>

namespace xlstext {
namespace core {

XlsTextException::XlsTextException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string XlsTextException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(error_code_) << "] " << what();

    if (file_ != nullptr) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void XlsTextException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : XlsTextException(filename.empty() ? message : fmt::format("{} (file: {})", message, filename),
                       code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : XlsTextException(parameter_name.empty() ? message
                                              : fmt::format("{} (parameter: {})", message, parameter_name),
                       ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

SheetException::SheetException(const std::string& message,
                               int sheet_index,
                               ErrorCode code, const char* file, int line)
    : XlsTextException(sheet_index < 0 ? message : fmt::format("{} (sheet: {})", message, sheet_index),
                       code, file, line)
    , sheet_index_(sheet_index) {
}

// 错误码到异常类型的映射
void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
            throw FileException(error.fullMessage(), "", error.code);

        case ErrorCode::InvalidArgument:
            throw ParameterException(error.fullMessage());

        case ErrorCode::SheetNotFound:
            throw SheetException(error.fullMessage(), -1, error.code);

        default:
            throw XlsTextException(error.fullMessage(), error.code);
    }
}

} // namespace core
} // namespace xlstext
