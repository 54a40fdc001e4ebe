#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace xlstext {
namespace core {

/**
 * @brief 转换选项
 */
struct ConvertOptions {
    // 字符串输出编码，交给底层解析库
    std::string encoding = "UTF-8";

    // 文本提取的字节预算，默认不限
    int64_t max_bytes = std::numeric_limits<int64_t>::max();

    // CSV导出的工作表序号
    int sheet_index = 0;
};

}} // namespace xlstext::core
