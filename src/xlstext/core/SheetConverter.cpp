#include "xlstext/core/SheetConverter.hpp"
#include "xlstext/core/BoundedWriter.hpp"
#include "xlstext/core/CellText.hpp"
#include "xlstext/reader/XlsDocument.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"

#include <filesystem>
#include <fstream>
#include <fmt/format.h>

namespace xlstext {
namespace core {

namespace {

// "A, B, C"：分隔符按列位置判断，firstColumn处的单元格前不加
std::string renderRow(const reader::IRow& row) {
    std::string text;
    const uint32_t first = row.firstColumn();
    const uint32_t last = row.lastColumn();
    for (uint32_t c = first; c < last; ++c) {
        const std::string cell = row.cellText(c);
        if (cell.empty()) {
            continue;
        }
        if (c > first) {
            text += ", ";
        }
        text += CellText::clean(cell);
    }
    text += '\n';
    return text;
}

// 打开输入文件，由解析器一次性读入
Error openInput(const std::string& path, std::ifstream& in) {
    in.open(path, std::ios::in | std::ios::binary);
    if (in.is_open()) {
        return success();
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return makeError(ErrorCode::FileNotFound, fmt::format("Failed to open file: {}", path));
    }
    return makeError(ErrorCode::FileReadError, fmt::format("Failed to open file: {}", path));
}

} // namespace

SheetConverter::SheetConverter()
    : SheetConverter(ConvertOptions{}) {}

SheetConverter::SheetConverter(ConvertOptions options)
    : SheetConverter(std::make_shared<reader::XlsDocumentOpener>(), std::move(options)) {}

SheetConverter::SheetConverter(std::shared_ptr<const reader::IDocumentOpener> opener, ConvertOptions options)
    : opener_(std::move(opener)), options_(std::move(options)) {
    if (!opener_) {
        opener_ = std::make_shared<reader::XlsDocumentOpener>();
    }
}

std::unique_ptr<reader::IDocument> SheetConverter::openDocument(std::istream& source) const {
    auto result = opener_->open(source, options_.encoding);
    if (!result) {
        // 无法解析的输入按空文档处理
        CORE_WARN("Cannot open document, treating as empty: {}", result.error().fullMessage());
        return nullptr;
    }
    return std::move(result).value();
}

TextExtractResult SheetConverter::extractText(std::istream& source, IOutputSink& sink, int64_t size) const {
    TextExtractResult result;

    auto document = openDocument(source);
    if (!document) {
        return result;
    }

    BoundedWriter writer(sink, size);
    const size_t sheet_count = document->sheetCount();
    for (size_t n = 0; n < sheet_count; ++n) {
        auto sheet = document->sheet(n);
        if (!sheet) {
            continue;
        }

        const uint32_t max_row = sheet->maxRow();
        Error err = writer.write(CellText::sheetTitle(sheet->name(), n, max_row));
        if (err || writer.exhausted()) {
            result.written = writer.written();
            result.error = std::move(err);
            return result;
        }

        // 行索引包含max_row
        for (uint64_t m = 0; m <= max_row; ++m) {
            auto row = sheet->row(static_cast<uint32_t>(m));
            if (!row) {
                continue;
            }
            err = writer.write(renderRow(*row));
            if (err || writer.exhausted()) {
                result.written = writer.written();
                result.error = std::move(err);
                return result;
            }
        }
    }

    result.written = writer.written();
    CORE_DEBUG("Extracted {} bytes of text from {} sheets", result.written, sheet_count);
    return result;
}

Result<std::string> SheetConverter::extractCSV(std::istream& source, int sheet_index) const {
    auto document = openDocument(source);
    if (!document) {
        return std::string();
    }

    std::unique_ptr<reader::ISheet> sheet;
    if (sheet_index >= 0) {
        sheet = document->sheet(static_cast<size_t>(sheet_index));
    }
    if (!sheet) {
        CORE_WARN("Sheet {} not available ({} sheets)", sheet_index, document->sheetCount());
        return makeError(ErrorCode::SheetNotFound, "sheet doesn't exist",
                         fmt::format("index {} of {}", sheet_index, document->sheetCount()));
    }

    // 与文本提取不同，这里不包含max_row这一行
    const uint32_t max_row = sheet->maxRow();
    std::string csv;
    bool first_line = true;
    for (uint32_t r = 0; r < max_row; ++r) {
        auto row = sheet->row(r);
        if (!row) {
            continue;
        }

        // 行之间用单个\n连接，末尾不加换行
        if (!first_line) {
            csv += '\n';
        }
        first_line = false;

        for (uint32_t c = row->firstColumn(); c < row->lastColumn(); ++c) {
            if (c > row->firstColumn()) {
                csv += ',';
            }
            csv += CellText::wrapCSVCell(row->cellText(c));
        }
    }
    CORE_DEBUG("Exported sheet {} as CSV, {} bytes", sheet_index, csv.size());
    return csv;
}

Result<std::vector<std::string>> SheetConverter::extractCells(std::istream& source) const {
    std::vector<std::string> cells;

    auto document = openDocument(source);
    if (!document) {
        return cells;
    }

    const size_t sheet_count = document->sheetCount();
    for (size_t n = 0; n < sheet_count; ++n) {
        auto sheet = document->sheet(n);
        if (!sheet) {
            continue;
        }
        const uint32_t max_row = sheet->maxRow();
        for (uint64_t m = 0; m <= max_row; ++m) {
            auto row = sheet->row(static_cast<uint32_t>(m));
            if (!row) {
                continue;
            }
            for (uint32_t c = row->firstColumn(); c < row->lastColumn(); ++c) {
                std::string text = row->cellText(c);
                if (!text.empty()) {
                    cells.push_back(CellText::clean(text));
                }
            }
        }
    }

    CORE_DEBUG("Collected {} cells", cells.size());
    return cells;
}

Result<TextExtractResult> SheetConverter::extractTextFromFile(const std::string& path, IOutputSink& sink,
                                                              int64_t size) const {
    std::ifstream stream;
    Error err = openInput(path, stream);
    if (err) {
        return err;
    }
    return extractText(stream, sink, size);
}

Result<std::string> SheetConverter::extractCSVFromFile(const std::string& path, int sheet_index) const {
    std::ifstream stream;
    Error err = openInput(path, stream);
    if (err) {
        return err;
    }
    return extractCSV(stream, sheet_index);
}

Result<std::vector<std::string>> SheetConverter::extractCellsFromFile(const std::string& path) const {
    std::ifstream stream;
    Error err = openInput(path, stream);
    if (err) {
        return err;
    }
    return extractCells(stream);
}

}} // namespace xlstext::core
