#pragma once

#include "xlstext/core/ConvertOptions.hpp"
#include "xlstext/core/Expected.hpp"
#include "xlstext/core/IOutputSink.hpp"
#include "xlstext/reader/IDocument.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace xlstext {
namespace core {

/**
 * @brief 文本提取结果：已写出的字节数和写错误
 *
 * 文档打开失败不算错误，此时written为0且error为Ok。
 */
struct TextExtractResult {
    int64_t written = 0;
    Error error;
};

/**
 * @brief 把表格文档转换为纯文本、CSV或单元格列表
 *
 * 所有格式解码都交给IDocumentOpener，默认使用libxls实现。
 * 无法打开的文档按"没有内容"处理：三种提取都返回空结果，只记录日志。
 */
class SheetConverter {
public:
    SheetConverter();
    explicit SheetConverter(ConvertOptions options);
    SheetConverter(std::shared_ptr<const reader::IDocumentOpener> opener, ConvertOptions options = {});

    /**
     * @brief 提取全部工作表的文本，最多写出size字节
     *
     * 每个工作表先写标题行，再逐行写 "单元格, 单元格\n"。
     * 超出预算的块被截断，预算耗尽或写出错时立即停止。
     */
    TextExtractResult extractText(std::istream& source, IOutputSink& sink, int64_t size) const;

    /**
     * @brief 导出指定工作表为CSV
     * @return 工作表不存在时返回SheetNotFound("sheet doesn't exist")
     */
    Result<std::string> extractCSV(std::istream& source, int sheet_index) const;

    /**
     * @brief 按工作表、行、列顺序收集所有非空单元格
     */
    Result<std::vector<std::string>> extractCells(std::istream& source) const;

    // 基于文件路径的便捷版本，文件不存在时返回FileNotFound
    Result<TextExtractResult> extractTextFromFile(const std::string& path, IOutputSink& sink, int64_t size) const;
    Result<std::string> extractCSVFromFile(const std::string& path, int sheet_index) const;
    Result<std::vector<std::string>> extractCellsFromFile(const std::string& path) const;

    const ConvertOptions& options() const noexcept { return options_; }

private:
    std::unique_ptr<reader::IDocument> openDocument(std::istream& source) const;

    std::shared_ptr<const reader::IDocumentOpener> opener_;
    ConvertOptions options_;
};

}} // namespace xlstext::core
