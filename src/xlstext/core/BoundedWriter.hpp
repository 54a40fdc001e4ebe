#pragma once

#include "xlstext/core/IOutputSink.hpp"
#include <cstdint>
#include <string_view>

namespace xlstext {
namespace core {

/**
 * @brief 按字节预算写入的包装器
 *
 * 每次写入的顺序固定为：超出剩余预算的块先截断到剩余预算，
 * 预算扣减截断后的长度，然后写入sink。
 * 预算耗尽或出现写错误后，调用方应立即停止。
 */
class BoundedWriter {
public:
    BoundedWriter(IOutputSink& sink, int64_t budget) noexcept
        : sink_(sink), remaining_(budget) {}

    /**
     * @brief 写入一个块
     * @return 写错误；预算耗尽本身不是错误
     */
    Error write(std::string_view chunk);

    /**
     * @brief 是否应停止：预算已耗尽或已出现写错误
     */
    bool exhausted() const noexcept { return remaining_ <= 0 || failed_; }

    int64_t written() const noexcept { return written_; }
    int64_t remaining() const noexcept { return remaining_; }

private:
    IOutputSink& sink_;
    int64_t remaining_;
    int64_t written_ = 0;
    bool failed_ = false;
};

}} // namespace xlstext::core
