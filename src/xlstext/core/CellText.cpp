#include "xlstext/core/CellText.hpp"
#include <utf8.h>
#include <fmt/format.h>

namespace xlstext {
namespace core {

bool CellText::isSpace(uint32_t code_point) noexcept {
    switch (code_point) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x85: case 0xA0:
        case 0x1680:
        case 0x2028: case 0x2029:
        case 0x202F: case 0x205F:
        case 0x3000:
            return true;
        default:
            // U+2000..U+200A 各种宽度的空格
            return code_point >= 0x2000 && code_point <= 0x200A;
    }
}

std::string_view CellText::trimSpace(std::string_view text) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    // 左侧
    while (begin < end) {
        const char* it = begin;
        try {
            uint32_t cp = utf8::next(it, end);
            if (!isSpace(cp)) break;
        } catch (const utf8::exception&) {
            break;
        }
        begin = it;
    }

    // 右侧
    while (end > begin) {
        const char* it = end;
        try {
            uint32_t cp = utf8::prior(it, begin);
            if (!isSpace(cp)) break;
        } catch (const utf8::exception&) {
            break;
        }
        end = it;
    }

    return std::string_view(begin, static_cast<size_t>(end - begin));
}

std::string CellText::clean(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            out.push_back(' ');
        } else if (c != '\r') {
            out.push_back(c);
        }
    }
    return std::string(trimSpace(out));
}

std::string CellText::wrapCSVCell(std::string_view cell) {
    std::string out;
    out.reserve(cell.size() + 2);
    out.push_back('"');
    out += clean(cell);
    out.push_back('"');
    return out;
}

std::string CellText::sheetTitle(std::string_view name, size_t sheet_index, uint32_t max_row) {
    std::string title;
    if (sheet_index > 0) {
        title.push_back('\n');
    }
    title += fmt::format("Sheet \"{}\" ({} rows):\n", clean(name), max_row);
    return title;
}

}} // namespace xlstext::core
