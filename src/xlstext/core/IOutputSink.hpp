#pragma once

#include "xlstext/core/ErrorCode.hpp"
#include <cstddef>
#include <string>

namespace xlstext {
namespace core {

/**
 * @brief 文本输出目标接口
 *
 * 文本提取把结果按块写入sink。实现需要如实报告本次实际写出的字节数，
 * 即使写入失败也要给出失败前已写出的部分。
 */
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    /**
     * @brief 写入一个数据块
     * @param data 数据指针
     * @param size 数据大小
     * @param written [out] 实际写出的字节数
     * @return 写入错误，成功时isOk()
     */
    virtual Error write(const char* data, size_t size, size_t& written) = 0;

    /**
     * @brief 获取sink类型名称（用于日志）
     */
    virtual std::string getTypeName() const = 0;
};

}} // namespace xlstext::core
