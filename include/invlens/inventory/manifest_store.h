#pragma once

#include <memory>
#include <string>
#include <vector>
#include "invlens/common/result.h"

namespace rocksdb {
class DB;
}

namespace invlens::inventory {

// ================================
// ManifestStore: manifest 缓存的持久层 (key -> 编码后的 value)
// ================================
class ManifestStore {
public:
    virtual ~ManifestStore() = default;

    // 不存在返回 kNotFound
    virtual Result<std::string> Get(const std::string& key) = 0;

    virtual Status Put(const std::string& key, const std::string& value) = 0;

    virtual Status Delete(const std::string& key) = 0;

    // 按 key 顺序返回 prefix 下的全部 key
    virtual Result<std::vector<std::string>> ListKeys(const std::string& prefix) = 0;

    // 原子删除 prefix 下的全部 key
    virtual Status DeletePrefix(const std::string& prefix) = 0;
};

// ================================
// RocksDB 实现
// ================================
class RocksDBManifestStore : public ManifestStore {
public:
    struct Config {
        std::string db_path;
        bool create_if_missing = true;
        uint64_t cache_size = 64ULL << 20;  // 64MB block cache
    };

    explicit RocksDBManifestStore(Config config);
    ~RocksDBManifestStore() override;

    RocksDBManifestStore(const RocksDBManifestStore&) = delete;
    RocksDBManifestStore& operator=(const RocksDBManifestStore&) = delete;

    Status Init();

    Result<std::string> Get(const std::string& key) override;
    Status Put(const std::string& key, const std::string& value) override;
    Status Delete(const std::string& key) override;
    Result<std::vector<std::string>> ListKeys(const std::string& prefix) override;
    Status DeletePrefix(const std::string& prefix) override;

private:
    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
};

} // namespace invlens::inventory
