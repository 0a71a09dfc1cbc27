#pragma once

#include <cstdint>
#include <string>
#include "invlens/config/config_base.h"

namespace invlens::config {

// ================================
// 数据文件读取
// ================================
class ReaderConfig : public ConfigBase<ReaderConfig> {
    // 连续坏行超过该值即认为文件损坏
    CONFIG_ITEM(max_consecutive_malformed, uint32_t(10), checkers::checkPositive<uint32_t>);
    CONFIG_ITEM(read_buffer_bytes, uint32_t(64 * 1024), checkers::checkPositive<uint32_t>);
    // S3 Inventory CSV 中的 key 是 URL 编码的
    CONFIG_ITEM(decode_keys, true);
    CONFIG_ITEM(verify_checksums, true);
};

// ================================
// 对象存储拉取重试
// ================================
class FetchConfig : public ConfigBase<FetchConfig> {
    CONFIG_ITEM(max_attempts, uint32_t(3), checkers::checkRange<uint32_t, 1, 10>);
    CONFIG_ITEM(backoff_ms, uint32_t(200));
    CONFIG_ITEM(backoff_multiplier, uint32_t(2), checkers::checkPositive<uint32_t>);
};

// ================================
// Manifest 缓存
// ================================
class CacheConfig : public ConfigBase<CacheConfig> {
    // 为空时只用进程内缓存
    CONFIG_ITEM(db_path, "");
    // 0: 不过期, 直到观察到更新的 manifest 日期
    CONFIG_ITEM(ttl_seconds, uint64_t(0));
    // 0: 每次解析 "最新" 都重新 list
    CONFIG_ITEM(listing_ttl_seconds, uint64_t(0));
};

class QueryConfig : public ConfigBase<QueryConfig> {
    CONFIG_ITEM(worker_count, uint32_t(4), checkers::checkRange<uint32_t, 1, 256>);
    // search 时每个在途文件最多缓冲的匹配数
    CONFIG_ITEM(channel_capacity, uint32_t(1024), checkers::checkPositive<uint32_t>);
};

class StorageConfig : public ConfigBase<StorageConfig> {
    CONFIG_ITEM(type, "s3", [](const std::string& v) {
        return v == "local" || v == "s3" || v == "minio";
    });
    CONFIG_ITEM(root, "");          // local
    CONFIG_ITEM(endpoint, "");      // s3/minio
    CONFIG_ITEM(region, "us-east-1");
    CONFIG_ITEM(access_key, "");
    CONFIG_ITEM(secret_key, "");
    CONFIG_ITEM(session_token, "");
    CONFIG_ITEM(path_style, false);
};

class LogConfig : public ConfigBase<LogConfig> {
    CONFIG_ITEM(file, "");
    CONFIG_ITEM(level, "info", [](const std::string& v) {
        return v == "trace" || v == "debug" || v == "info" || v == "warn" ||
               v == "error" || v == "off";
    });
};

// ================================
// EngineConfig: 顶层配置
// ================================
class EngineConfig : public ConfigBase<EngineConfig> {
    CONFIG_OBJ(reader, ReaderConfig);
    CONFIG_OBJ(fetch, FetchConfig);
    CONFIG_OBJ(cache, CacheConfig);
    CONFIG_OBJ(query, QueryConfig);
    CONFIG_OBJ(storage, StorageConfig);
    CONFIG_OBJ(log, LogConfig);
};

// 环境变量覆盖 (INVLENS_S3_ENDPOINT, AWS_ACCESS_KEY_ID ...)
void ApplyEnvironment(EngineConfig* config);

} // namespace invlens::config
