#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "invlens/config/engine_config.h"
#include "invlens/storage/object_store.h"

namespace invlens::storage {

// 通用配置结构
struct StoreOptions {
    std::string type;           // local/s3/minio
    std::string root;           // local
    std::string endpoint;       // s3/minio
    std::string region;
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    bool path_style = false;

    static StoreOptions FromConfig(const config::StorageConfig& cfg) {
        StoreOptions opts;
        opts.type = cfg.type();
        opts.root = cfg.root();
        opts.endpoint = cfg.endpoint();
        opts.region = cfg.region();
        opts.access_key = cfg.access_key();
        opts.secret_key = cfg.secret_key();
        opts.session_token = cfg.session_token();
        opts.path_style = cfg.path_style();
        return opts;
    }
};

// 存储创建器类型
using StoreCreator = std::function<std::unique_ptr<ObjectStore>(const StoreOptions&)>;

// 对象存储工厂 (单例模式)
class StoreFactory {
public:
    static StoreFactory& Instance() {
        static StoreFactory instance;
        return instance;
    }

    void Register(const std::string& name, StoreCreator creator) {
        creators_[name] = std::move(creator);
    }

    Result<std::unique_ptr<ObjectStore>> Create(const StoreOptions& options) {
        auto it = creators_.find(options.type);
        if (it == creators_.end()) {
            return Status::InvalidArgument("Unknown object store type: " + options.type);
        }
        return it->second(options);
    }

private:
    StoreFactory() = default;
    std::unordered_map<std::string, StoreCreator> creators_;
};

// 内置存储注册
inline void RegisterBuiltinStores() {
    StoreFactory::Instance().Register("local", [](const StoreOptions& opts) {
        return std::make_unique<LocalObjectStore>(LocalObjectStore::Config{opts.root});
    });

    auto make_s3 = [](const StoreOptions& opts, bool path_style) {
        S3ObjectStore::Config s3_cfg;
        s3_cfg.access_key = opts.access_key;
        s3_cfg.secret_key = opts.secret_key;
        s3_cfg.session_token = opts.session_token;
        s3_cfg.region = opts.region;
        s3_cfg.endpoint = opts.endpoint;
        s3_cfg.path_style = path_style;
        return std::make_unique<S3ObjectStore>(std::move(s3_cfg));
    };

    StoreFactory::Instance().Register("s3", [make_s3](const StoreOptions& opts) {
        return make_s3(opts, opts.path_style);
    });

    // minio (S3 兼容接口, 总是 path style)
    StoreFactory::Instance().Register("minio", [make_s3](const StoreOptions& opts) {
        return make_s3(opts, true);
    });
}

} // namespace invlens::storage
