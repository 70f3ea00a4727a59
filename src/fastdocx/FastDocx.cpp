#include "fastdocx/FastDocx.hpp"
#include "fastdocx/utils/Logger.hpp"
#include <iostream>

namespace fastdocx {

bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        FASTDOCX_LOG_INFO("FastDocx library initialized successfully");
        FASTDOCX_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用时输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize FastDocx: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    FASTDOCX_LOG_INFO("FastDocx library cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace fastdocx
