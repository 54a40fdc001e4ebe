#pragma once

#include "xlstext/core/Expected.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace xlstext {
namespace reader {

/**
 * @brief 一行的只读视图
 *
 * 列范围为半开区间 [firstColumn(), lastColumn())。
 * 视图不能比产生它的ISheet活得更久。
 */
class IRow {
public:
    virtual ~IRow() = default;

    virtual uint32_t firstColumn() const = 0;
    virtual uint32_t lastColumn() const = 0;

    /**
     * @brief 单元格文本，空串表示无内容
     */
    virtual std::string cellText(uint32_t column) const = 0;
};

/**
 * @brief 工作表的只读视图
 */
class ISheet {
public:
    virtual ~ISheet() = default;

    virtual std::string name() const = 0;

    /**
     * @brief 最大行索引（含）
     */
    virtual uint32_t maxRow() const = 0;

    /**
     * @brief 获取一行
     * @return 行不存在时返回nullptr，这不是错误
     */
    virtual std::unique_ptr<IRow> row(uint32_t index) const = 0;
};

/**
 * @brief 已打开的表格文档
 */
class IDocument {
public:
    virtual ~IDocument() = default;

    virtual size_t sheetCount() const = 0;

    /**
     * @brief 获取工作表
     * @return 不存在或无法解析时返回nullptr
     */
    virtual std::unique_ptr<ISheet> sheet(size_t index) const = 0;
};

/**
 * @brief 表格解析能力的入口
 *
 * 所有二进制格式解码都在实现内部完成，转换逻辑只依赖这组接口。
 */
class IDocumentOpener {
public:
    virtual ~IDocumentOpener() = default;

    /**
     * @brief 打开文档
     * @param source 可寻址的字节源
     * @param encoding 字符串输出编码，如"UTF-8"
     */
    virtual core::Result<std::unique_ptr<IDocument>> open(std::istream& source,
                                                          const std::string& encoding) const = 0;
};

}} // namespace xlstext::reader
