#pragma once

#include "xlstext/reader/IDocument.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace xlstext {
namespace test {

// 内存中的表格数据，用于替代真实的.xls解析
struct MemoryRowData {
    uint32_t first_column = 0;
    std::vector<std::string> cells;  // 从first_column开始
};

struct MemorySheetData {
    std::string name;
    uint32_t max_row = 0;
    std::map<uint32_t, MemoryRowData> rows;  // 缺失的索引即不存在的行
    bool parse_fails = false;
};

struct MemoryWorkbookData {
    std::vector<MemorySheetData> sheets;

    MemorySheetData& addSheet(const std::string& name, uint32_t max_row) {
        MemorySheetData sheet;
        sheet.name = name;
        sheet.max_row = max_row;
        sheets.push_back(std::move(sheet));
        return sheets.back();
    }
};

inline void setRow(MemorySheetData& sheet, uint32_t index, std::vector<std::string> cells,
                   uint32_t first_column = 0) {
    MemoryRowData row;
    row.first_column = first_column;
    row.cells = std::move(cells);
    sheet.rows[index] = std::move(row);
}

class MemoryRow : public reader::IRow {
public:
    explicit MemoryRow(const MemoryRowData& data) : data_(data) {}

    uint32_t firstColumn() const override { return data_.first_column; }
    uint32_t lastColumn() const override {
        return data_.first_column + static_cast<uint32_t>(data_.cells.size());
    }

    std::string cellText(uint32_t column) const override {
        if (column < data_.first_column || column >= lastColumn()) return {};
        return data_.cells[column - data_.first_column];
    }

private:
    const MemoryRowData& data_;
};

class MemorySheet : public reader::ISheet {
public:
    explicit MemorySheet(const MemorySheetData& data) : data_(data) {}

    std::string name() const override { return data_.name; }
    uint32_t maxRow() const override { return data_.max_row; }

    std::unique_ptr<reader::IRow> row(uint32_t index) const override {
        auto it = data_.rows.find(index);
        if (it == data_.rows.end()) return nullptr;
        return std::make_unique<MemoryRow>(it->second);
    }

private:
    const MemorySheetData& data_;
};

class MemoryDocument : public reader::IDocument {
public:
    explicit MemoryDocument(std::shared_ptr<const MemoryWorkbookData> data) : data_(std::move(data)) {}

    size_t sheetCount() const override { return data_->sheets.size(); }

    std::unique_ptr<reader::ISheet> sheet(size_t index) const override {
        if (index >= data_->sheets.size() || data_->sheets[index].parse_fails) return nullptr;
        return std::make_unique<MemorySheet>(data_->sheets[index]);
    }

private:
    std::shared_ptr<const MemoryWorkbookData> data_;
};

/**
 * @brief 返回固定内容的打开器；data为空时模拟无法解析的输入
 */
class MemoryDocumentOpener : public reader::IDocumentOpener {
public:
    explicit MemoryDocumentOpener(std::shared_ptr<const MemoryWorkbookData> data) : data_(std::move(data)) {}

    core::Result<std::unique_ptr<reader::IDocument>> open(std::istream&, const std::string& encoding) const override {
        last_encoding = encoding;
        if (!data_) {
            return core::makeError(core::ErrorCode::InvalidWorkbook, "not a spreadsheet");
        }
        return std::unique_ptr<reader::IDocument>(new MemoryDocument(data_));
    }

    mutable std::string last_encoding;

private:
    std::shared_ptr<const MemoryWorkbookData> data_;
};

}} // namespace xlstext::test
