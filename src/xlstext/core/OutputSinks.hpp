#pragma once

#include "xlstext/core/IOutputSink.hpp"
#include "xlstext/core/Expected.hpp"
#include "xlstext/utils/FileWrapper.hpp"
#include <ostream>
#include <string>

namespace xlstext {
namespace core {

/**
 * @brief 写入内存字符串
 */
class StringSink : public IOutputSink {
public:
    StringSink() = default;

    Error write(const char* data, size_t size, size_t& written) override;
    std::string getTypeName() const override { return "StringSink"; }

    const std::string& str() const noexcept { return buffer_; }
    std::string release() { return std::move(buffer_); }

private:
    std::string buffer_;
};

/**
 * @brief 写入std::ostream（不拥有流）
 *
 * ostream无法报告部分写入，失败时按0字节计。
 */
class StreamSink : public IOutputSink {
public:
    explicit StreamSink(std::ostream& stream) : stream_(stream) {}

    Error write(const char* data, size_t size, size_t& written) override;
    std::string getTypeName() const override { return "StreamSink"; }

private:
    std::ostream& stream_;
};

/**
 * @brief 写入文件
 */
class FileSink : public IOutputSink {
public:
    explicit FileSink(utils::FileWrapper file) : file_(std::move(file)) {}

    /**
     * @brief 创建（截断）目标文件
     */
    static Result<FileSink> create(const std::string& path);

    Error write(const char* data, size_t size, size_t& written) override;
    std::string getTypeName() const override { return "FileSink"; }

    bool flush() { return file_.flush(); }

private:
    utils::FileWrapper file_;
};

}} // namespace xlstext::core
