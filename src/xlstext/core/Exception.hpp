/**
 * @file Exception.hpp
 * @brief XlsText异常类定义
 */

#ifndef XLSTEXT_EXCEPTION_HPP
#define XLSTEXT_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace xlstext {
namespace core {

/**
 * @brief XlsText基础异常类
 */
class XlsTextException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    XlsTextException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（含错误码、源码位置和上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件/流相关异常
 */
class FileException : public XlsTextException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public XlsTextException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 工作表相关异常
 */
class SheetException : public XlsTextException {
public:
    SheetException(const std::string& message,
                   int sheet_index = -1,
                   ErrorCode code = ErrorCode::SheetNotFound,
                   const char* file = nullptr, int line = 0);

    int getSheetIndex() const { return sheet_index_; }

private:
    int sheet_index_;
};

} // namespace core
} // namespace xlstext

// 抛出时附带源码位置
#define XLSTEXT_THROW_PARAM(message, param) \
    throw xlstext::core::ParameterException((message), (param), __FILE__, __LINE__)

#define XLSTEXT_THROW_FILE(message, filename, code) \
    throw xlstext::core::FileException((message), (filename), (code), __FILE__, __LINE__)

#endif // XLSTEXT_EXCEPTION_HPP
