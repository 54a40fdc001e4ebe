/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器
 */

#pragma once

#include <memory>
#include <cstdio>
#include <string>
#include "xlstext/core/Expected.hpp"

namespace xlstext {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 析构时自动关闭文件句柄。构造不抛异常，打开失败时通过open()返回错误。
 */
class FileWrapper {
public:
    FileWrapper() = default;

    /**
     * @brief 打开文件
     * @param filename 文件名（UTF-8）
     * @param mode fopen模式
     * @return 成功返回包装器，失败返回FileNotFound/FileReadError
     */
    static core::Result<FileWrapper> open(const std::string& filename, const char* mode);

    /**
     * @brief 包装已有FILE*
     * @param file 文件指针
     * @param take_ownership 为false时析构不关闭（用于stdout等）
     */
    explicit FileWrapper(FILE* file, bool take_ownership = true);

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept {
        return file_.get();
    }

    explicit operator bool() const noexcept {
        return file_ != nullptr;
    }

    /**
     * @brief 写入数据，返回实际写出的字节数
     */
    size_t write(const char* data, size_t size);

    /**
     * @brief 刷新文件缓冲区
     * @return 是否成功
     */
    bool flush();

private:
    std::unique_ptr<FILE, int(*)(FILE*)> file_{nullptr, &noClose};

    static int noClose(FILE*) { return 0; }
};

} // namespace utils
} // namespace xlstext
