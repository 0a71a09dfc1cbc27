#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "invlens/common/cancellation.h"
#include "invlens/common/result.h"
#include "invlens/config/engine_config.h"
#include "invlens/inventory/manifest_cache.h"
#include "invlens/inventory/manifest_resolver.h"
#include "invlens/query/path_aggregator.h"
#include "invlens/query/search_engine.h"

namespace invlens::query {

// ================================
// InventoryQuery: 对外的查询入口
// 持有对象存储、manifest 解析器/缓存与两个查询引擎
// ================================
class InventoryQuery {
public:
    InventoryQuery(std::shared_ptr<storage::ObjectStore> store,
                   std::shared_ptr<inventory::ManifestCache> cache,
                   ScanOptions options);

    // 按配置创建对象存储与缓存 (cache.db_path 非空时打开 RocksDB)
    static Result<std::unique_ptr<InventoryQuery>> Create(const config::EngineConfig& config);

    // 未注册的 (bucket, inventory_id) 使用 InventoryConfig::Default
    void RegisterInventory(const inventory::InventoryConfig& config);
    inventory::InventoryConfig Lookup(const std::string& bucket,
                                      const std::string& inventory_id) const;

    Result<inventory::Manifest> Resolve(const std::string& bucket,
                                        const std::string& inventory_id,
                                        const std::optional<std::string>& date = std::nullopt);

    Result<std::unique_ptr<SearchStream>> Search(const std::string& bucket,
                                                 const std::string& inventory_id,
                                                 const SearchOptions& search,
                                                 const std::optional<std::string>& date = std::nullopt,
                                                 CancellationToken token = CancellationToken());

    Result<AggregateResult> AggregateByDepth(const std::string& bucket,
                                             const std::string& inventory_id,
                                             int depth,
                                             const std::optional<std::string>& date = std::nullopt,
                                             CancellationToken token = CancellationToken());

    Result<std::vector<inventory::InventoryLocation>> ListManifests(
        const std::string& destination_bucket,
        const std::string& prefix = "");

    // 丢弃缓存后重新解析最新 manifest
    Result<inventory::Manifest> Refresh(const std::string& bucket,
                                        const std::string& inventory_id);

    inventory::ManifestResolver& resolver() { return resolver_; }
    const std::shared_ptr<inventory::ManifestCache>& cache() const { return cache_; }

private:
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<inventory::ManifestCache> cache_;
    inventory::ManifestResolver resolver_;
    SearchEngine search_engine_;
    PathAggregator aggregator_;

    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, inventory::InventoryConfig> inventories_;
};

} // namespace invlens::query
