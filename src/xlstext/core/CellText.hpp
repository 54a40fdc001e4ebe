#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace xlstext {
namespace core {

/**
 * @brief 单元格/标题文本的清洗与格式化
 *
 * 所有写出的文本都先经过clean()：换行替换为空格，删除回车，
 * 再去掉首尾空白（按UTF-8解码后的Unicode空白判断）。
 */
class CellText {
public:
    /**
     * @brief 清洗文本，结果不含\n和\r，首尾无空白
     *
     * 幂等：clean(clean(s)) == clean(s)
     */
    static std::string clean(std::string_view text);

    /**
     * @brief 去掉首尾Unicode空白
     *
     * 非法UTF-8字节视为非空白，遇到即停止裁剪。
     */
    static std::string_view trimSpace(std::string_view text);

    /**
     * @brief 清洗后用双引号包裹
     *
     * 不转义内部的引号和逗号。
     */
    static std::string wrapCSVCell(std::string_view cell);

    /**
     * @brief 生成工作表标题行
     * @param name 工作表名称（会先清洗）
     * @param sheet_index 工作表序号，大于0时前面多一个空行
     * @param max_row 最大行索引
     */
    static std::string sheetTitle(std::string_view name, size_t sheet_index, uint32_t max_row);

    static bool isSpace(uint32_t code_point) noexcept;
};

}} // namespace xlstext::core
