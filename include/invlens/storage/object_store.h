#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "invlens/common/result.h"
#include "invlens/common/types.h"

namespace invlens::storage {

struct ObjectInfo {
    std::string key;
    uint64_t size = 0;
    Timestamp last_modified = 0;
};

// ================================
// ObjectReader: 对象内容的顺序字节流
// ================================
class ObjectReader {
public:
    virtual ~ObjectReader() = default;

    // 读取最多 n 字节, 返回 0 表示 EOF
    virtual Result<size_t> Read(char* buf, size_t n) = 0;
};

// ================================
// 对象存储接口 (只读)
// 认证/限流重试由实现负责; 调用方再做有限次重试
//
// 错误约定:
//   kNotFound  - bucket 或 key 不存在, 不应重试
//   kIOError   - 可重试的瞬时错误
//   kSourceUnavailable - 不可重试的服务端错误 (权限等)
// ================================
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // 列出 prefix 下的全部对象 (内部处理分页)
    virtual Result<std::vector<ObjectInfo>> ListObjects(
        const std::string& bucket,
        const std::string& prefix
    ) = 0;

    virtual Result<std::unique_ptr<ObjectReader>> GetObject(
        const std::string& bucket,
        const std::string& key
    ) = 0;

    virtual std::string Name() const = 0;
};

// 读取整个对象 (只用于 manifest 这类小对象)
Result<std::string> ReadAll(ObjectStore& store,
                            const std::string& bucket,
                            const std::string& key);

// ================================
// S3 实现 (AWS SDK for C++)
// ================================

class S3ObjectStore : public ObjectStore {
public:
    struct Config {
        std::string access_key;
        std::string secret_key;
        std::string session_token;
        std::string region = "us-east-1";
        std::string endpoint;    // 可选, 用于兼容 S3 的存储 (MinIO/Ceph)
        bool path_style = false;
        uint32_t max_connections = 32;
    };

    explicit S3ObjectStore(Config config);
    ~S3ObjectStore() override;

    Result<std::vector<ObjectInfo>> ListObjects(
        const std::string& bucket,
        const std::string& prefix
    ) override;

    Result<std::unique_ptr<ObjectReader>> GetObject(
        const std::string& bucket,
        const std::string& key
    ) override;

    std::string Name() const override { return "s3"; }

private:
    Config config_;

    // 隐藏 AWS SDK 头文件
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ================================
// 本地文件系统实现 (开发/测试)
// 布局: {root}/{bucket}/{key}
// ================================

class LocalObjectStore : public ObjectStore {
public:
    struct Config {
        std::string root;
    };

    explicit LocalObjectStore(Config config);
    ~LocalObjectStore() override = default;

    Result<std::vector<ObjectInfo>> ListObjects(
        const std::string& bucket,
        const std::string& prefix
    ) override;

    Result<std::unique_ptr<ObjectReader>> GetObject(
        const std::string& bucket,
        const std::string& key
    ) override;

    std::string Name() const override { return "local"; }

    // 写入对象, 用于导入本地 inventory 副本
    Status PutObject(const std::string& bucket,
                     const std::string& key,
                     const std::string& data);

private:
    Config config_;

    std::string BucketPath(const std::string& bucket) const;
    std::string KeyToPath(const std::string& bucket, const std::string& key) const;
};

} // namespace invlens::storage
