// ================================
// 本地文件系统对象存储
// 用于开发/测试, 以及拷贝到本地的 inventory
// ================================

#include "invlens/storage/object_store.h"
#include "invlens/common/logger.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace invlens::storage {

namespace fs = std::filesystem;

namespace {

class LocalObjectReader : public ObjectReader {
public:
    explicit LocalObjectReader(std::ifstream file) : file_(std::move(file)) {}

    Result<size_t> Read(char* buf, size_t n) override {
        if (file_.eof()) {
            return size_t{0};
        }
        file_.read(buf, static_cast<std::streamsize>(n));
        if (file_.bad()) {
            return Status::IO("Failed to read local object");
        }
        return static_cast<size_t>(file_.gcount());
    }

private:
    std::ifstream file_;
};

Timestamp FileMTime(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    auto sys = std::chrono::time_point_cast<std::chrono::seconds>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return static_cast<Timestamp>(sys.time_since_epoch().count());
}

} // namespace

// ================================
// LocalObjectStore
// ================================

LocalObjectStore::LocalObjectStore(Config config)
    : config_(std::move(config)) {
    LOG_INFO("LocalObjectStore initialized: {}", config_.root);
}

std::string LocalObjectStore::BucketPath(const std::string& bucket) const {
    std::string path = config_.root;
    if (!path.empty() && path.back() != '/') {
        path.push_back('/');
    }
    path.append(bucket);
    return path;
}

std::string LocalObjectStore::KeyToPath(const std::string& bucket, const std::string& key) const {
    // {root}/{bucket}/{key}
    return BucketPath(bucket) + "/" + key;
}

Result<std::vector<ObjectInfo>> LocalObjectStore::ListObjects(
    const std::string& bucket,
    const std::string& prefix
) {
    auto bucket_path = fs::path(BucketPath(bucket));
    std::error_code ec;
    if (!fs::is_directory(bucket_path, ec)) {
        return Status::NotFound("No such bucket: " + bucket);
    }

    std::vector<ObjectInfo> objects;
    for (auto it = fs::recursive_directory_iterator(bucket_path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        auto key = fs::relative(it->path(), bucket_path).generic_string();
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        ObjectInfo info;
        info.key = std::move(key);
        info.size = it->file_size();
        info.last_modified = FileMTime(it->path());
        objects.push_back(std::move(info));
    }
    if (ec) {
        LOG_ERROR("Failed to list {}: {}", bucket_path.string(), ec.message());
        return Status::IO("Failed to list bucket " + bucket + ": " + ec.message());
    }

    // 与 S3 一致, 按 key 字典序返回
    std::sort(objects.begin(), objects.end(),
              [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });
    LOG_DEBUG("Listed {} objects under {}/{}", objects.size(), bucket, prefix);
    return objects;
}

Result<std::unique_ptr<ObjectReader>> LocalObjectStore::GetObject(
    const std::string& bucket,
    const std::string& key
) {
    auto path = KeyToPath(bucket, key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Status::NotFound("No such key: " + bucket + "/" + key);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR("Failed to open file for reading: {}", path);
        return Status::IO("Failed to open file: " + path);
    }
    return std::unique_ptr<ObjectReader>(std::make_unique<LocalObjectReader>(std::move(file)));
}

Status LocalObjectStore::PutObject(
    const std::string& bucket,
    const std::string& key,
    const std::string& data
) {
    auto path = KeyToPath(bucket, key);

    // 创建父目录
    auto parent_path = fs::path(path).parent_path();
    std::error_code ec;
    fs::create_directories(parent_path, ec);
    if (ec) {
        LOG_ERROR("Failed to create directory: {}", ec.message());
        return Status::IO("Failed to create directory: " + ec.message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        LOG_ERROR("Failed to open file for writing: {}", path);
        return Status::IO("Failed to open file: " + path);
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        LOG_ERROR("Failed to write file: {}", path);
        return Status::IO("Failed to write file: " + path);
    }

    LOG_DEBUG("Written {} bytes to {}", data.size(), path);
    return Status::Ok();
}

// ================================
// 公共工具
// ================================

Result<std::string> ReadAll(ObjectStore& store,
                            const std::string& bucket,
                            const std::string& key) {
    auto reader = store.GetObject(bucket, key);
    if (reader.hasError()) {
        return reader.error();
    }

    std::string data;
    char buf[16 * 1024];
    while (true) {
        auto n = reader.value()->Read(buf, sizeof(buf));
        if (n.hasError()) {
            return n.error();
        }
        if (n.value() == 0) {
            break;
        }
        data.append(buf, n.value());
    }
    return data;
}

} // namespace invlens::storage
