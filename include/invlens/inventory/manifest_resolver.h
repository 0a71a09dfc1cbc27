#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "invlens/common/result.h"
#include "invlens/inventory/manifest_cache.h"
#include "invlens/inventory/types.h"
#include "invlens/storage/object_store.h"
#include "invlens/storage/retry.h"

namespace invlens::inventory {

// 一个候选 manifest (目录时间戳 + manifest.json 的 key)
struct ManifestCandidate {
    std::string date;
    std::string key;
};

// Discover 的结果: 目标 bucket 中的一个 inventory
struct InventoryLocation {
    std::string source_bucket;
    std::string inventory_id;
    std::string destination_prefix;
    std::string latest_date;
    std::string latest_manifest_key;
    size_t manifest_count = 0;
};

// ================================
// ManifestResolver
// bucket + inventory (+ 日期) -> Manifest
//
// date 为空:   选最新的可用 manifest
// date 为日期: 选当天最新的可用 manifest (YYYY-MM-DD)
// date 为时间戳: 精确匹配 (YYYY-MM-DDTHH-MMZ)
//
// 候选按时间戳降序尝试, 第一个存在且可解析的胜出
// ================================
class ManifestResolver {
public:
    ManifestResolver(std::shared_ptr<storage::ObjectStore> store,
                     storage::RetryPolicy policy,
                     std::shared_ptr<ManifestCache> cache = nullptr);

    Result<Manifest> Resolve(const InventoryConfig& config,
                             const std::optional<std::string>& date = std::nullopt);

    // 降序排列的全部候选
    Result<std::vector<ManifestCandidate>> ListCandidates(const InventoryConfig& config);

    // 拉取并解析单个 manifest, 校验 manifest.checksum (若存在)
    Result<Manifest> Fetch(const InventoryConfig& config, const ManifestCandidate& candidate);

    // 列出 destination_bucket/prefix 下全部 inventory 的最新 manifest
    Result<std::vector<InventoryLocation>> Discover(const std::string& destination_bucket,
                                                    const std::string& prefix = "");

    // 实际发起的 manifest 拉取次数
    uint64_t fetch_count() const { return fetch_count_.load(); }

    const std::shared_ptr<ManifestCache>& cache() const { return cache_; }

private:
    Result<Manifest> LoadCandidate(const InventoryConfig& config,
                                   const ManifestCandidate& candidate);

    Result<Manifest> ResolveExact(const InventoryConfig& config, const std::string& stamp);

    std::shared_ptr<storage::ObjectStore> store_;
    storage::RetryPolicy policy_;
    std::shared_ptr<ManifestCache> cache_;
    std::atomic<uint64_t> fetch_count_{0};
};

} // namespace invlens::inventory
