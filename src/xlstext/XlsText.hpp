#pragma once

// XlsText库 - 从旧版二进制.xls表格中提取文本、CSV和单元格列表

#include <string>

#include "xlstext/core/ErrorCode.hpp"
#include "xlstext/core/Expected.hpp"
#include "xlstext/core/Exception.hpp"
#include "xlstext/core/ConvertOptions.hpp"
#include "xlstext/core/FileSignature.hpp"
#include "xlstext/core/OutputSinks.hpp"
#include "xlstext/core/SheetConverter.hpp"
#include "xlstext/utils/Logger.hpp"

// 版本信息
#define XLSTEXT_VERSION_MAJOR 1
#define XLSTEXT_VERSION_MINOR 0
#define XLSTEXT_VERSION_PATCH 0
#define XLSTEXT_VERSION_STRING "1.0.0"

namespace xlstext {

inline std::string getVersion() {
    return XLSTEXT_VERSION_STRING;
}

/**
 * @brief 初始化XlsText库
 * @param log_file_path 日志文件路径，空串表示只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @param level 日志级别
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/xlstext.log",
                bool enable_console = true,
                Logger::Level level = Logger::Level::INFO);

/**
 * @brief 清理库资源，刷新并关闭日志
 */
void cleanup();

} // namespace xlstext
