#include "xlstext/reader/XlsDocument.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <vector>

#include <fmt/format.h>
#include <xls.h>

namespace xlstext {
namespace reader {

namespace {

struct XlsWorkbookCloser {
    void operator()(xls::xlsWorkBook* wb) const {
        if (wb) xls::xls_close_WB(wb);
    }
};

struct XlsWorksheetCloser {
    void operator()(xls::xlsWorkSheet* ws) const {
        if (ws) xls::xls_close_WS(ws);
    }
};

using WorkbookPtr = std::unique_ptr<xls::xlsWorkBook, XlsWorkbookCloser>;
using WorksheetPtr = std::unique_ptr<xls::xlsWorkSheet, XlsWorksheetCloser>;

constexpr uint32_t kMaxXlsIndex = std::numeric_limits<xls::WORD>::max();

// 没有str的数值记录按%.15g输出，其余视为空
std::string cellToString(const xls::xlsCell& cell) {
    if (cell.str) {
        return std::string(cell.str);
    }
    const bool numeric = cell.id == XLS_RECORD_NUMBER || cell.id == XLS_RECORD_RK ||
                         cell.id == XLS_RECORD_MULRK || cell.id == XLS_RECORD_FORMULA ||
                         cell.id == XLS_RECORD_FORMULA_ALT;
    if (numeric && std::isfinite(cell.d)) {
        return fmt::format("{:.15g}", cell.d);
    }
    return {};
}

// xls_makeTable预先填充的单元格和BLANK/MULBLANK记录都不算内容
bool isBlank(const xls::xlsCell& cell) {
    return cell.id == 0 || cell.id == XLS_RECORD_BLANK || cell.id == XLS_RECORD_MULBLANK;
}

/**
 * 列范围：libxls给没有ROW记录的行填的lcell是lastcol（含），
 * 有ROW记录的行则是记录里的lcell（不含），两者都可能比表格窄。
 * 这里统一取到lastcol为止，并且不超过单元格数组。
 */
uint32_t columnEnd(const xls::xlsWorkSheet& ws, const xls::xlsRow& row) {
    const uint32_t end = std::max<uint32_t>(row.lcell, static_cast<uint32_t>(ws.rows.lastcol) + 1);
    return std::min<uint32_t>(end, row.cells.count);
}

class XlsRow : public IRow {
public:
    XlsRow(const xls::xlsRow* row, uint32_t last_column)
        : row_(row), last_column_(last_column) {}

    uint32_t firstColumn() const override { return row_->fcell; }
    uint32_t lastColumn() const override { return last_column_; }

    std::string cellText(uint32_t column) const override {
        if (column >= last_column_) return {};
        return cellToString(row_->cells.cell[column]);
    }

private:
    const xls::xlsRow* row_;
    uint32_t last_column_;
};

class XlsSheet : public ISheet {
public:
    XlsSheet(WorksheetPtr ws, std::string name)
        : ws_(std::move(ws)), name_(std::move(name)) {}

    std::string name() const override { return name_; }

    uint32_t maxRow() const override { return ws_->rows.lastrow; }

    std::unique_ptr<IRow> row(uint32_t index) const override {
        if (index > ws_->rows.lastrow || index > kMaxXlsIndex) {
            return nullptr;
        }
        const xls::xlsRow* row = xls::xls_row(ws_.get(), static_cast<xls::WORD>(index));
        if (!row) {
            return nullptr;
        }

        const uint32_t end = columnEnd(*ws_, *row);
        for (uint32_t c = row->fcell; c < end; ++c) {
            if (!isBlank(row->cells.cell[c])) {
                return std::make_unique<XlsRow>(row, end);
            }
        }
        // 整行都是空白单元格，视为不存在
        return nullptr;
    }

private:
    WorksheetPtr ws_;
    std::string name_;
};

class XlsDocument : public IDocument {
public:
    XlsDocument(std::vector<unsigned char> buffer, WorkbookPtr wb)
        : buffer_(std::move(buffer)), wb_(std::move(wb)) {}

    size_t sheetCount() const override { return wb_->sheets.count; }

    std::unique_ptr<ISheet> sheet(size_t index) const override {
        if (index >= sheetCount()) {
            return nullptr;
        }

        WorksheetPtr ws(xls::xls_getWorkSheet(wb_.get(), static_cast<int>(index)));
        if (!ws) {
            READER_WARN("xls_getWorkSheet({}) returned null", index);
            return nullptr;
        }

        xls::xls_error_t err = xls::xls_parseWorkSheet(ws.get());
        if (err != xls::LIBXLS_OK) {
            READER_WARN("Failed to parse sheet {}: {}", index, xls::xls_getError(err));
            return nullptr;
        }

        const char* name = wb_->sheets.sheet[index].name;
        READER_DEBUG("Parsed sheet {} '{}', last row {}", index, name ? name : "", ws->rows.lastrow);
        return std::make_unique<XlsSheet>(std::move(ws), name ? std::string(name) : std::string());
    }

private:
    // libxls直接引用这块内存，必须与workbook同生命周期
    std::vector<unsigned char> buffer_;
    WorkbookPtr wb_;
};

} // namespace

core::Result<std::unique_ptr<IDocument>> XlsDocumentOpener::open(std::istream& source,
                                                                 const std::string& encoding) const {
    // 尽量从头读；不可寻址的流从当前位置读
    source.seekg(0, std::ios::beg);
    if (!source) {
        source.clear();
    }

    std::vector<unsigned char> buffer((std::istreambuf_iterator<char>(source)),
                                      std::istreambuf_iterator<char>());
    if (source.bad()) {
        return core::makeError(core::ErrorCode::FileReadError, "Failed to read spreadsheet source");
    }
    if (buffer.empty()) {
        return core::makeError(core::ErrorCode::InvalidWorkbook, "Spreadsheet source is empty");
    }

    xls::xls_error_t err = xls::LIBXLS_OK;
    WorkbookPtr wb(xls::xls_open_buffer(buffer.data(), buffer.size(), encoding.c_str(), &err));
    if (!wb) {
        return core::makeError(core::ErrorCode::InvalidWorkbook, "Failed to open workbook",
                               err != xls::LIBXLS_OK ? xls::xls_getError(err) : "unknown libxls error");
    }

    READER_DEBUG("Opened workbook: {} bytes, {} sheets", buffer.size(), wb->sheets.count);

    return std::unique_ptr<IDocument>(new XlsDocument(std::move(buffer), std::move(wb)));
}

}} // namespace xlstext::reader
