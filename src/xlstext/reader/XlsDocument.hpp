#pragma once

#include "xlstext/reader/IDocument.hpp"

namespace xlstext {
namespace reader {

/**
 * @brief 基于libxls的.xls文档打开器
 *
 * 即使只做部分提取，也需要完整的文件内容：源会被整体读入内存，
 * 交给xls_open_buffer解析。打开得到的文档持有这块内存和libxls句柄。
 *
 * 行的判定：libxls会为[0, lastrow]内每个索引分配行结构，
 * 不论文件里有没有对应的ROW记录。只含空白单元格的行视为不存在；
 * 存在的行列范围一律延伸到表格的lastcol。
 */
class XlsDocumentOpener : public IDocumentOpener {
public:
    XlsDocumentOpener() = default;

    core::Result<std::unique_ptr<IDocument>> open(std::istream& source,
                                                  const std::string& encoding) const override;
};

}} // namespace xlstext::reader
