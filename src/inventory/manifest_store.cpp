// ================================
// RocksDB manifest 持久缓存
// ================================

#include "invlens/inventory/manifest_store.h"
#include "invlens/common/logger.h"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/cache.h>
#include <rocksdb/write_batch.h>
#include <cstring>

namespace invlens::inventory {

namespace {

bool HasPrefix(const rocksdb::Slice& key, const std::string& prefix) {
    return key.size() >= prefix.size() &&
           std::memcmp(key.data(), prefix.data(), prefix.size()) == 0;
}

} // namespace

RocksDBManifestStore::RocksDBManifestStore(Config config)
    : config_(std::move(config)) {}

RocksDBManifestStore::~RocksDBManifestStore() = default;

Status RocksDBManifestStore::Init() {
    rocksdb::Options options;
    options.create_if_missing = config_.create_if_missing;

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.cache_size);
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    rocksdb::DB* db = nullptr;
    auto status = rocksdb::DB::Open(options, config_.db_path, &db);
    if (!status.ok()) {
        LOG_ERROR("Failed to open manifest cache db: {}", status.ToString());
        return Status::IO("Failed to open manifest cache db: " + status.ToString());
    }
    db_.reset(db);

    LOG_INFO("Manifest cache db opened: {}", config_.db_path);
    return Status::Ok();
}

Result<std::string> RocksDBManifestStore::Get(const std::string& key) {
    if (!db_) {
        return Status::IO("Manifest cache db is not open");
    }
    std::string value;
    auto status = db_->Get(rocksdb::ReadOptions(), key, &value);
    if (status.IsNotFound()) {
        return Status::NotFound(key);
    }
    if (!status.ok()) {
        LOG_ERROR("Failed to read cache entry {}: {}", key, status.ToString());
        return Status::IO("Failed to read cache entry: " + status.ToString());
    }
    return value;
}

Status RocksDBManifestStore::Put(const std::string& key, const std::string& value) {
    if (!db_) {
        return Status::IO("Manifest cache db is not open");
    }
    auto status = db_->Put(rocksdb::WriteOptions(), key, value);
    if (!status.ok()) {
        LOG_ERROR("Failed to write cache entry {}: {}", key, status.ToString());
        return Status::IO("Failed to write cache entry: " + status.ToString());
    }
    return Status::Ok();
}

Status RocksDBManifestStore::Delete(const std::string& key) {
    if (!db_) {
        return Status::IO("Manifest cache db is not open");
    }
    auto status = db_->Delete(rocksdb::WriteOptions(), key);
    if (!status.ok()) {
        return Status::IO("Failed to delete cache entry: " + status.ToString());
    }
    return Status::Ok();
}

Result<std::vector<std::string>> RocksDBManifestStore::ListKeys(const std::string& prefix) {
    if (!db_) {
        return Status::IO("Manifest cache db is not open");
    }
    std::vector<std::string> keys;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
    for (it->Seek(prefix); it->Valid() && HasPrefix(it->key(), prefix); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    if (!it->status().ok()) {
        return Status::IO("Failed to scan cache entries: " + it->status().ToString());
    }
    return keys;
}

Status RocksDBManifestStore::DeletePrefix(const std::string& prefix) {
    auto keys = ListKeys(prefix);
    if (keys.hasError()) {
        return keys.error();
    }
    if (keys.value().empty()) {
        return Status::Ok();
    }

    rocksdb::WriteBatch batch;
    for (const auto& key : keys.value()) {
        batch.Delete(key);
    }
    auto status = db_->Write(rocksdb::WriteOptions(), &batch);
    if (!status.ok()) {
        return Status::IO("Failed to delete cache entries: " + status.ToString());
    }
    return Status::Ok();
}

} // namespace invlens::inventory
