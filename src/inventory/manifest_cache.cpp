#include "invlens/inventory/manifest_cache.h"
#include <algorithm>
#include <iterator>
#include "invlens/common/result_macros.h"
#include "invlens/common/logger.h"
#include "invlens/inventory/manifest_codec.h"

namespace invlens::inventory {

ManifestCache::ManifestCache(Options options, std::shared_ptr<ManifestStore> store)
    : options_(options),
      store_(std::move(store)),
      clock_([] { return NowInSeconds(); }) {}

std::string ManifestCache::InventoryPrefix(const std::string& bucket,
                                           const std::string& inventory_id) {
    return "manifest/" + bucket + "/" + inventory_id + "/";
}

std::string ManifestCache::CacheKey(const std::string& bucket,
                                    const std::string& inventory_id,
                                    const std::string& date) {
    return InventoryPrefix(bucket, inventory_id) + date;
}

bool ManifestCache::Expired(Timestamp cached_at) const {
    if (options_.ttl_seconds == 0) {
        return false;
    }
    return clock_() >= cached_at + options_.ttl_seconds;
}

std::optional<Manifest> ManifestCache::Lookup(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (!Expired(it->second.cached_at)) {
                return it->second.manifest;
            }
            LOG_DEBUG("Cache entry expired: {}", key);
            entries_.erase(it);
            ++evictions_;
        }
    }

    if (!store_) {
        return std::nullopt;
    }

    auto value = store_->Get(key);
    if (value.hasError()) {
        if (value.code() != ErrorCode::kNotFound) {
            LOG_WARN("Cache db read failed for {}: {}", key, value.error().ToString());
        }
        return std::nullopt;
    }

    Timestamp cached_at = 0;
    auto manifest = DecodeCacheValue(value.value(), &cached_at);
    if (manifest.hasError() || Expired(cached_at)) {
        if (manifest.hasError()) {
            LOG_WARN("Dropping undecodable cache entry {}: {}", key, manifest.error().message());
        }
        auto st = store_->Delete(key);
        if (!st.OK()) {
            LOG_WARN("Failed to drop cache entry {}: {}", key, st.ToString());
        }
        ++evictions_;
        return std::nullopt;
    }

    // 提升到内存层
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{manifest.value(), cached_at};
    return std::move(manifest).value();
}

std::optional<Manifest> ManifestCache::Get(const std::string& bucket,
                                           const std::string& inventory_id,
                                           const std::string& date) {
    auto manifest = Lookup(CacheKey(bucket, inventory_id, date));
    if (manifest) {
        ++hits_;
    } else {
        ++misses_;
    }
    return manifest;
}

// 调用方持有 mutex_; 返回该 inventory 在内存层中的最新日期
std::string ManifestCache::EvictOlderLocked(const std::string& prefix) {
    auto first = entries_.lower_bound(prefix);
    auto last = first;
    while (last != entries_.end() && last->first.compare(0, prefix.size(), prefix) == 0) {
        ++last;
    }
    if (first == last) {
        return {};
    }
    auto newest = std::prev(last)->first.substr(prefix.size());
    while (first != last && first->first.substr(prefix.size()) < newest) {
        LOG_DEBUG("Evicting superseded manifest {}", first->first);
        first = entries_.erase(first);
        ++evictions_;
    }
    return newest;
}

Status ManifestCache::EvictOlderOnDisk(const std::string& prefix) {
    auto keys = store_->ListKeys(prefix);
    if (keys.hasError()) {
        return keys.error();
    }
    std::string newest;
    for (const auto& key : keys.value()) {
        newest = std::max(newest, key.substr(prefix.size()));
    }
    for (const auto& key : keys.value()) {
        if (key.substr(prefix.size()) < newest) {
            RETURN_IF_NOT_OK(store_->Delete(key));
            ++evictions_;
        }
    }
    return Status::Ok();
}

Status ManifestCache::Put(const std::string& bucket,
                          const std::string& inventory_id,
                          const std::string& date,
                          const Manifest& manifest) {
    auto prefix = InventoryPrefix(bucket, inventory_id);
    auto key = prefix + date;
    auto now = clock_();

    {
        // 插入与淘汰在同一次加锁内完成: 只保留最新日期, 与并发 Put 的先后无关
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{manifest, now};
        auto newest = EvictOlderLocked(prefix);
        if (newest != date) {
            LOG_DEBUG("Not caching {}: newer manifest {} already cached", key, newest);
        }
    }

    if (!store_) {
        return Status::Ok();
    }
    RETURN_IF_NOT_OK(store_->Put(key, EncodeCacheValue(now, manifest)));
    return EvictOlderOnDisk(prefix);
}

Status ManifestCache::Invalidate(const std::string& bucket, const std::string& inventory_id) {
    auto prefix = InventoryPrefix(bucket, inventory_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.lower_bound(prefix);
        while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
            it = entries_.erase(it);
        }
        latest_.erase(prefix);
    }

    LOG_INFO("Invalidated cached manifests for {}/{}", bucket, inventory_id);
    if (store_) {
        return store_->DeletePrefix(prefix);
    }
    return Status::Ok();
}

Result<Manifest> ManifestCache::GetOrLoad(const std::string& bucket,
                                          const std::string& inventory_id,
                                          const std::string& date,
                                          const Loader& loader) {
    if (auto cached = Get(bucket, inventory_id, date)) {
        LOG_DEBUG("Manifest cache hit: {}/{}/{}", bucket, inventory_id, date);
        return std::move(*cached);
    }

    auto key = CacheKey(bucket, inventory_id, date);
    bool shared = false;
    auto result = flight_.Do(key, [&]() -> Result<Manifest> {
        // 等待锁期间可能已有其他调用者加载完成
        if (auto cached = Lookup(key)) {
            return std::move(*cached);
        }
        ++loads_;
        auto loaded = loader();
        if (loaded.hasValue()) {
            auto st = Put(bucket, inventory_id, date, loaded.value());
            if (!st.OK()) {
                LOG_WARN("Failed to cache manifest {}: {}", key, st.ToString());
            }
        }
        return loaded;
    }, &shared);

    if (shared) {
        LOG_DEBUG("Joined in-flight manifest load: {}", key);
    }
    return result;
}

void ManifestCache::RememberLatest(const std::string& bucket,
                                   const std::string& inventory_id,
                                   const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_[InventoryPrefix(bucket, inventory_id)] = Latest{date, clock_()};
}

std::optional<std::string> ManifestCache::FreshLatest(const std::string& bucket,
                                                      const std::string& inventory_id) const {
    if (options_.listing_ttl_seconds == 0) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_.find(InventoryPrefix(bucket, inventory_id));
    if (it == latest_.end() ||
        clock_() >= it->second.listed_at + options_.listing_ttl_seconds) {
        return std::nullopt;
    }
    return it->second.date;
}

ManifestCache::Stats ManifestCache::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.loads = loads_.load();
    s.evictions = evictions_.load();
    return s;
}

} // namespace invlens::inventory
