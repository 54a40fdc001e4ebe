#include "xlstext/XlsText.hpp"
#include <iostream>

namespace xlstext {

bool initialize(const std::string& log_file_path, bool enable_console, Logger::Level level) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        XLSTEXT_LOG_DEBUG("XlsText library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统初始化失败，输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize XlsText: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    XLSTEXT_LOG_DEBUG("XlsText library cleanup");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

} // namespace xlstext
