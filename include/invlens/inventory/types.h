#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "invlens/common/result.h"
#include "invlens/common/types.h"

namespace invlens::inventory {

// ================================
// 数据文件格式
// ================================
enum class FileFormat : uint32_t {
    kCSV = 0,
    kORC = 1,
    kParquet = 2,
};

const char* FileFormatName(FileFormat format);

// "CSV" / "ORC" / "Parquet", 大小写不敏感
Result<FileFormat> ParseFileFormat(const std::string& text);

// ================================
// InventoryConfig: 一份 inventory 报告的位置
// 报告路径: {destination_prefix}/{source_bucket}/{inventory_id}/{stamp}/manifest.json
// ================================
struct InventoryConfig {
    std::string source_bucket;
    std::string inventory_id;
    std::string destination_bucket;
    std::string destination_prefix;
    FileFormat format = FileFormat::kCSV;

    // 以 "/" 结尾, 直接用作 list 前缀
    std::string ManifestRoot() const;

    // 默认: 报告写在源 bucket 自身, 没有前缀
    static InventoryConfig Default(const std::string& bucket, const std::string& inventory_id);
};

// ================================
// DataFileRef: manifest 中的一个数据文件分片
// ================================
struct DataFileRef {
    std::string key;
    uint64_t size = 0;
    std::string md5;        // 可能为空
    FileFormat format = FileFormat::kCSV;

    bool operator==(const DataFileRef& other) const = default;
};

// ================================
// Manifest: 某个时间点的 inventory 快照描述
// 构造后不再修改
// ================================
struct Manifest {
    std::string source_bucket;
    std::string destination_bucket;
    std::string inventory_id;
    std::string version;
    std::string date;                   // 目录时间戳, 例如 2024-01-05T01-00Z
    std::string manifest_key;
    Timestamp creation_timestamp = 0;   // 毫秒
    FileFormat format = FileFormat::kCSV;
    std::vector<std::string> schema;
    std::vector<DataFileRef> files;

    uint64_t TotalBytes() const;

    // 不存在时返回 -1
    int ColumnIndex(const std::string& name) const;

    bool operator==(const Manifest& other) const = default;
};

// ================================
// InventoryRecord: 数据文件中的一行
// ================================
struct InventoryRecord {
    std::string bucket;
    std::string key;
    uint64_t size = 0;
    std::string last_modified;
    std::string storage_class;
    std::string etag;
    std::string version_id;
    bool is_latest = true;
    bool is_delete_marker = false;
    std::vector<std::pair<std::string, std::string>> extra;
};

// ================================
// manifest 目录时间戳
// ================================

// YYYY-MM-DDTHH-MMZ
bool IsManifestStamp(const std::string& text);

// YYYY-MM-DD
bool IsManifestDay(const std::string& text);

} // namespace invlens::inventory
