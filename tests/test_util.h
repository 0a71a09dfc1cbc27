#pragma once

#include <gtest/gtest.h>
#include <zlib.h>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "invlens/common/md5.h"
#include "invlens/storage/object_store.h"

namespace invlens::test {

namespace fs = std::filesystem;

// ================================
// 临时目录 (mkdtemp)
// ================================
class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "invlens_test_XXXXXX").string();
        char* dir = mkdtemp(tmpl.data());
        if (dir) {
            path_ = dir;
        }
    }

    ~TempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ================================
// gzip 压缩 (一个 member)
// ================================
inline std::string Gzip(const std::string& data) {
    z_stream zs{};
    // 15 + 16: gzip 头
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return "";
    }
    std::string out(deflateBound(&zs, data.size()) + 32, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

// ================================
// 在 LocalObjectStore 中构造 inventory 报告
// ================================

constexpr const char* kDefaultSchema = "Bucket, Key, Size, LastModifiedDate, StorageClass";

struct DataFile {
    std::string name;           // data/ 下的文件名
    std::vector<std::string> rows;
};

inline std::string CsvRow(const std::string& bucket, const std::string& key, uint64_t size) {
    return "\"" + bucket + "\",\"" + key + "\",\"" + std::to_string(size) +
           "\",\"2024-01-04T10:00:00.000Z\",\"STANDARD\"";
}

inline std::string JoinRows(const std::vector<std::string>& rows) {
    std::string text;
    for (const auto& row : rows) {
        text += row + "\n";
    }
    return text;
}

class InventoryWriter {
public:
    InventoryWriter(storage::LocalObjectStore* store,
                    std::string dest_bucket,
                    std::string source_bucket,
                    std::string inventory_id)
        : store_(store),
          dest_bucket_(std::move(dest_bucket)),
          source_bucket_(std::move(source_bucket)),
          inventory_id_(std::move(inventory_id)) {}

    std::string Root() const { return source_bucket_ + "/" + inventory_id_ + "/"; }

    std::string ManifestKey(const std::string& stamp) const {
        return Root() + stamp + "/manifest.json";
    }

    // 写数据文件, 返回 manifest 中的 files 条目
    std::string WriteDataFile(const DataFile& file, bool gzip = true, bool with_md5 = true) {
        auto key = Root() + "data/" + file.name;
        auto body = JoinRows(file.rows);
        if (gzip) {
            body = Gzip(body);
        }
        EXPECT_TRUE(store_->PutObject(dest_bucket_, key, body).OK());
        std::string entry = "{\"key\": \"" + key + "\", \"size\": " + std::to_string(body.size());
        if (with_md5) {
            entry += ", \"MD5checksum\": \"" + Md5Digest::Hex(body) + "\"";
        }
        return entry + "}";
    }

    std::string ManifestJson(const std::vector<std::string>& entries,
                             const std::string& schema = kDefaultSchema,
                             const std::string& format = "CSV") const {
        std::string files;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) files += ", ";
            files += entries[i];
        }
        return "{\"sourceBucket\": \"" + source_bucket_ + "\","
               " \"destinationBucket\": \"arn:aws:s3:::" + dest_bucket_ + "\","
               " \"version\": \"2016-11-30\","
               " \"creationTimestamp\": \"1704420000000\","
               " \"fileFormat\": \"" + format + "\","
               " \"fileSchema\": \"" + schema + "\","
               " \"files\": [" + files + "],"
               " \"unknownField\": {\"ignored\": true}}";
    }

    void WriteManifest(const std::string& stamp, const std::string& json, bool with_checksum = true) {
        auto key = ManifestKey(stamp);
        EXPECT_TRUE(store_->PutObject(dest_bucket_, key, json).OK());
        if (with_checksum) {
            auto checksum_key = Root() + stamp + "/manifest.checksum";
            EXPECT_TRUE(store_->PutObject(dest_bucket_, checksum_key, Md5Digest::Hex(json) + "\n").OK());
        }
    }

    // 一步写出完整报告
    void WriteReport(const std::string& stamp, const std::vector<DataFile>& files) {
        std::vector<std::string> entries;
        for (const auto& file : files) {
            entries.push_back(WriteDataFile(file));
        }
        WriteManifest(stamp, ManifestJson(entries));
    }

private:
    storage::LocalObjectStore* store_;
    std::string dest_bucket_;
    std::string source_bucket_;
    std::string inventory_id_;
};

// ================================
// CountingStore: 统计调用并可注入失败
// ================================
class CountingStore : public storage::ObjectStore {
public:
    explicit CountingStore(std::shared_ptr<storage::ObjectStore> inner) : inner_(std::move(inner)) {}

    Result<std::vector<storage::ObjectInfo>> ListObjects(const std::string& bucket,
                                                         const std::string& prefix) override {
        ++lists_;
        return inner_->ListObjects(bucket, prefix);
    }

    Result<std::unique_ptr<storage::ObjectReader>> GetObject(const std::string& bucket,
                                                             const std::string& key) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++gets_[key];
            auto it = failures_.find(key);
            if (it != failures_.end() && it->second.remaining != 0) {
                if (it->second.remaining > 0) {
                    --it->second.remaining;
                }
                return it->second.status;
            }
        }
        return inner_->GetObject(bucket, key);
    }

    std::string Name() const override { return "counting"; }

    // times < 0: 一直失败
    void FailKey(const std::string& key, Status status, int times = -1) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[key] = Failure{std::move(status), times};
    }

    int Gets(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gets_.find(key);
        return it == gets_.end() ? 0 : it->second;
    }

    int Lists() const { return lists_.load(); }

private:
    struct Failure {
        Status status;
        int remaining = -1;
    };

    std::shared_ptr<storage::ObjectStore> inner_;
    mutable std::mutex mutex_;
    std::map<std::string, int> gets_;
    std::map<std::string, Failure> failures_;
    std::atomic<int> lists_{0};
};

} // namespace invlens::test
