#pragma once

#include "xlstext/core/Expected.hpp"
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace xlstext {
namespace core {

// OLE2复合文档签名
constexpr std::array<unsigned char, 8> kXlsSignature = {
    0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1
};

/**
 * @brief 判断数据是否以OLE2签名开头
 *
 * 只做前缀比较，不少于8字节且前8字节匹配即返回true。
 */
bool isFileXLS(const unsigned char* data, size_t size) noexcept;

inline bool isFileXLS(std::string_view data) noexcept {
    return isFileXLS(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

/**
 * @brief 读取文件头判断是否为.xls
 * @return 文件无法打开时返回FileNotFound/FileReadError
 */
Result<bool> isFileXLSPath(const std::string& path);

}} // namespace xlstext::core
