#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace invlens {

// ================================
// 日志系统 (spdlog)
// ================================

class Logger {
public:
    static Logger* Instance();

    // log_file 为空时输出到 stderr
    // level: trace/debug/info/warn/error/off
    void Init(const std::string& log_file, const std::string& level = "info");

    std::shared_ptr<spdlog::logger> logger();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_TRACE(fmt, ...) spdlog::trace(fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) spdlog::debug(fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) spdlog::info(fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) spdlog::warn(fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) spdlog::error(fmt, ##__VA_ARGS__)

} // namespace invlens
