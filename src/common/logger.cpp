// ================================
// 日志实现 (spdlog sink 封装)
// ================================

#include "invlens/common/logger.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace invlens {

Logger* Logger::Instance() {
    static Logger instance;
    return &instance;
}

void Logger::Init(const std::string& log_file, const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::shared_ptr<spdlog::logger> logger;
    if (!log_file.empty()) {
        spdlog::drop("invlens_file");
        try {
            logger = spdlog::basic_logger_mt("invlens_file", log_file, false);
        } catch (const spdlog::spdlog_ex& e) {
            // 文件打不开时退回 stderr
            spdlog::error("Failed to open log file {}: {}", log_file, e.what());
        }
    }
    if (!logger) {
        logger = spdlog::get("invlens");
        if (!logger) {
            logger = spdlog::stderr_color_mt("invlens");
        }
    }

    logger->set_pattern("%Y-%m-%d %H:%M:%S.%f %t [%l] %v");
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);
    logger_ = logger;
}

std::shared_ptr<spdlog::logger> Logger::logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ ? logger_ : spdlog::default_logger();
}

} // namespace invlens
