#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace invlens {

// ================================
// 基础类型定义
// ================================

using Timestamp = uint64_t;   // 秒 (Unix epoch)

// ================================
// 错误码
// ================================
enum class ErrorCode : int {
    kOK = 0,
    kNotFound = 2,
    kIOError = 5,
    kInvalidArgument = 22,
    kUnsupported = 95,

    // inventory 相关
    kManifestNotFound = 1001,     // 找不到 manifest, 不重试
    kManifestCorrupt = 1002,      // manifest 结构非法, 不重试
    kSourceUnavailable = 1003,    // 拉取失败 (已重试)
    kRecordFormatError = 1004,    // 单行格式错误, 跳过
    kRecordStreamCorrupt = 1005,  // 连续坏行超过阈值, 放弃该文件
    kQueryCancelled = 1006,       // 调用方取消
};

const char* ErrorCodeName(ErrorCode code);

class Status {
public:
    Status() : code_(ErrorCode::kOK) {}
    Status(ErrorCode code, const std::string& msg)
        : code_(code), msg_(msg) {}

    bool OK() const { return code_ == ErrorCode::kOK; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return msg_; }

    // "ManifestCorrupt: files[3] has no key"
    std::string ToString() const;

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") {
        return Status(ErrorCode::kNotFound, msg);
    }
    static Status InvalidArgument(const std::string& msg = "") {
        return Status(ErrorCode::kInvalidArgument, msg);
    }
    static Status IO(const std::string& msg = "") {
        return Status(ErrorCode::kIOError, msg);
    }
    static Status Unsupported(const std::string& msg = "") {
        return Status(ErrorCode::kUnsupported, msg);
    }
    static Status ManifestNotFound(const std::string& msg = "") {
        return Status(ErrorCode::kManifestNotFound, msg);
    }
    static Status ManifestCorrupt(const std::string& msg = "") {
        return Status(ErrorCode::kManifestCorrupt, msg);
    }
    static Status SourceUnavailable(const std::string& msg = "") {
        return Status(ErrorCode::kSourceUnavailable, msg);
    }
    static Status RecordFormatError(const std::string& msg = "") {
        return Status(ErrorCode::kRecordFormatError, msg);
    }
    static Status RecordStreamCorrupt(const std::string& msg = "") {
        return Status(ErrorCode::kRecordStreamCorrupt, msg);
    }
    static Status QueryCancelled(const std::string& msg = "") {
        return Status(ErrorCode::kQueryCancelled, msg);
    }

private:
    ErrorCode code_;
    std::string msg_;
};

// ================================
// 时间工具
// ================================
inline uint64_t NowInSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline uint64_t NowInMilliSeconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace invlens
