#include "invlens/query/inventory_query.h"
#include "invlens/common/result_macros.h"
#include "invlens/common/logger.h"
#include "invlens/inventory/manifest_store.h"
#include "invlens/storage/store_factory.h"

namespace invlens::query {

InventoryQuery::InventoryQuery(std::shared_ptr<storage::ObjectStore> store,
                               std::shared_ptr<inventory::ManifestCache> cache,
                               ScanOptions options)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      resolver_(store_, options.retry, cache_),
      search_engine_(store_, options),
      aggregator_(store_, options) {}

Result<std::unique_ptr<InventoryQuery>> InventoryQuery::Create(const config::EngineConfig& config) {
    auto valid = config.validate();
    if (valid.hasError()) {
        return valid.error();
    }

    storage::RegisterBuiltinStores();
    auto store = storage::StoreFactory::Instance().Create(
        storage::StoreOptions::FromConfig(config.storage()));
    if (store.hasError()) {
        return store.error();
    }

    std::shared_ptr<inventory::ManifestStore> persistent;
    if (!config.cache().db_path().empty()) {
        auto db = std::make_shared<inventory::RocksDBManifestStore>(
            inventory::RocksDBManifestStore::Config{config.cache().db_path()});
        RETURN_IF_NOT_OK(db->Init());
        persistent = std::move(db);
    }

    inventory::ManifestCache::Options cache_options;
    cache_options.ttl_seconds = config.cache().ttl_seconds();
    cache_options.listing_ttl_seconds = config.cache().listing_ttl_seconds();
    auto cache = std::make_shared<inventory::ManifestCache>(cache_options, std::move(persistent));

    return std::make_unique<InventoryQuery>(std::shared_ptr<storage::ObjectStore>(std::move(store).value()),
                                            std::move(cache),
                                            ScanOptions::FromConfig(config));
}

void InventoryQuery::RegisterInventory(const inventory::InventoryConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    inventories_[{config.source_bucket, config.inventory_id}] = config;
}

inventory::InventoryConfig InventoryQuery::Lookup(const std::string& bucket,
                                                  const std::string& inventory_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inventories_.find({bucket, inventory_id});
    if (it != inventories_.end()) {
        return it->second;
    }
    return inventory::InventoryConfig::Default(bucket, inventory_id);
}

Result<inventory::Manifest> InventoryQuery::Resolve(const std::string& bucket,
                                                    const std::string& inventory_id,
                                                    const std::optional<std::string>& date) {
    return resolver_.Resolve(Lookup(bucket, inventory_id), date);
}

Result<std::unique_ptr<SearchStream>> InventoryQuery::Search(const std::string& bucket,
                                                             const std::string& inventory_id,
                                                             const SearchOptions& search,
                                                             const std::optional<std::string>& date,
                                                             CancellationToken token) {
    if (search.query.empty()) {
        return Status::InvalidArgument("Search query must not be empty");
    }
    ASSIGN_OR_RETURN(auto manifest, Resolve(bucket, inventory_id, date));
    return search_engine_.Search(manifest, search, std::move(token));
}

Result<AggregateResult> InventoryQuery::AggregateByDepth(const std::string& bucket,
                                                         const std::string& inventory_id,
                                                         int depth,
                                                         const std::optional<std::string>& date,
                                                         CancellationToken token) {
    if (depth < 0) {
        return Status::InvalidArgument("Depth must be non-negative: " + std::to_string(depth));
    }
    ASSIGN_OR_RETURN(auto manifest, Resolve(bucket, inventory_id, date));
    return aggregator_.Aggregate(manifest, depth, std::move(token));
}

Result<std::vector<inventory::InventoryLocation>> InventoryQuery::ListManifests(
    const std::string& destination_bucket,
    const std::string& prefix) {
    return resolver_.Discover(destination_bucket, prefix);
}

Result<inventory::Manifest> InventoryQuery::Refresh(const std::string& bucket,
                                                    const std::string& inventory_id) {
    if (cache_) {
        RETURN_IF_NOT_OK(cache_->Invalidate(bucket, inventory_id));
    }
    return Resolve(bucket, inventory_id, std::nullopt);
}

} // namespace invlens::query
