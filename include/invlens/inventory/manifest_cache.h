#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "invlens/common/result.h"
#include "invlens/common/singleflight.h"
#include "invlens/inventory/manifest_store.h"
#include "invlens/inventory/types.h"

namespace invlens::inventory {

// ================================
// ManifestCache: (bucket, inventory_id, date) -> Manifest
//
// 两层: 进程内 map + 可选的持久层 (ManifestStore)
// 默认策略: 缓存到观察到更新的 manifest 日期为止; ttl_seconds > 0 时按时间过期
// 同一 key 同时只有一次加载 (SingleFlight)
// ================================
class ManifestCache {
public:
    struct Options {
        uint64_t ttl_seconds = 0;
        uint64_t listing_ttl_seconds = 0;
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t loads = 0;
        uint64_t evictions = 0;
    };

    using Loader = std::function<Result<Manifest>()>;
    using Clock = std::function<Timestamp()>;

    explicit ManifestCache(Options options, std::shared_ptr<ManifestStore> store = nullptr);

    std::optional<Manifest> Get(const std::string& bucket,
                                const std::string& inventory_id,
                                const std::string& date);

    // 只保留该 inventory 的最新日期: 更旧的条目被淘汰, 比已缓存日期旧的不会留下
    Status Put(const std::string& bucket,
               const std::string& inventory_id,
               const std::string& date,
               const Manifest& manifest);

    Status Invalidate(const std::string& bucket, const std::string& inventory_id);

    // 命中直接返回; 否则 loader 只会被并发调用者中的一个执行
    // 加载失败不缓存
    Result<Manifest> GetOrLoad(const std::string& bucket,
                               const std::string& inventory_id,
                               const std::string& date,
                               const Loader& loader);

    // 记录一次 list 得出的最新日期 (listing_ttl_seconds 内复用)
    void RememberLatest(const std::string& bucket,
                        const std::string& inventory_id,
                        const std::string& date);
    std::optional<std::string> FreshLatest(const std::string& bucket,
                                           const std::string& inventory_id) const;

    Stats stats() const;

    // 测试用
    void SetClock(Clock clock) { clock_ = std::move(clock); }

    static std::string CacheKey(const std::string& bucket,
                                const std::string& inventory_id,
                                const std::string& date);
    static std::string InventoryPrefix(const std::string& bucket,
                                       const std::string& inventory_id);

private:
    struct Entry {
        Manifest manifest;
        Timestamp cached_at = 0;
    };

    struct Latest {
        std::string date;
        Timestamp listed_at = 0;
    };

    bool Expired(Timestamp cached_at) const;

    // 不计入统计
    std::optional<Manifest> Lookup(const std::string& key);

    std::string EvictOlderLocked(const std::string& prefix);
    Status EvictOlderOnDisk(const std::string& prefix);

    Options options_;
    std::shared_ptr<ManifestStore> store_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, Latest> latest_;

    SingleFlight<Result<Manifest>> flight_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> loads_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace invlens::inventory
