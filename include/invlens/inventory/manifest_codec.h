#pragma once

#include <string>
#include "invlens/common/result.h"
#include "invlens/inventory/types.h"

namespace invlens::inventory {

// manifest.json 之外的定位信息, 由调用方根据 key 得出
struct ManifestLocation {
    std::string inventory_id;
    std::string date;
    std::string manifest_key;
};

// ================================
// manifest.json 解析
// 未知字段忽略; 结构非法返回 kManifestCorrupt
// ================================
Result<Manifest> ParseManifestJson(const std::string& text, const ManifestLocation& location);

// 拆分 fileSchema ("Bucket, Key, Size")
std::vector<std::string> SplitSchema(const std::string& schema);

// ================================
// 缓存二进制编码 (小端, 自包含)
// ================================
std::string EncodeManifest(const Manifest& manifest);

// value = cached_at(8) + EncodeManifest
std::string EncodeCacheValue(Timestamp cached_at, const Manifest& manifest);
Result<Manifest> DecodeCacheValue(const std::string& value, Timestamp* cached_at);

} // namespace invlens::inventory
