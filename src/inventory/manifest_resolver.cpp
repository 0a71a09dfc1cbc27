// ================================
// Manifest 定位与解析
// ================================

#include "invlens/inventory/manifest_resolver.h"
#include "invlens/common/result_macros.h"
#include "invlens/common/logger.h"
#include "invlens/common/md5.h"
#include "invlens/inventory/manifest_codec.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace invlens::inventory {

namespace {

constexpr const char* kManifestFile = "manifest.json";
constexpr const char* kChecksumFile = "manifest.checksum";

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> SplitPath(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto slash = key.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

std::string NormalizeChecksum(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            break;
        }
    }
    return out;
}

} // namespace

ManifestResolver::ManifestResolver(std::shared_ptr<storage::ObjectStore> store,
                                   storage::RetryPolicy policy,
                                   std::shared_ptr<ManifestCache> cache)
    : store_(std::move(store)), policy_(policy), cache_(std::move(cache)) {}

Result<std::vector<ManifestCandidate>> ManifestResolver::ListCandidates(
    const InventoryConfig& config) {
    auto root = config.ManifestRoot();
    auto listing = storage::FetchWithRetry(policy_, "list " + config.destination_bucket + "/" + root,
                                           [&] { return store_->ListObjects(config.destination_bucket, root); });
    if (listing.hasError()) {
        if (listing.code() == ErrorCode::kNotFound) {
            return Status::ManifestNotFound("No inventory under " +
                                            config.destination_bucket + "/" + root);
        }
        return listing.error();
    }

    // {root}{stamp}/manifest.json, 其他对象 (data/, hive/ ...) 忽略
    std::vector<ManifestCandidate> candidates;
    for (const auto& obj : listing.value()) {
        if (!EndsWith(obj.key, std::string("/") + kManifestFile)) {
            continue;
        }
        auto rest = obj.key.substr(root.size());
        auto slash = rest.find('/');
        if (slash == std::string::npos || rest.substr(slash + 1) != kManifestFile) {
            continue;
        }
        auto stamp = rest.substr(0, slash);
        if (!IsManifestStamp(stamp)) {
            LOG_DEBUG("Ignoring manifest under non-stamp directory: {}", obj.key);
            continue;
        }
        candidates.push_back(ManifestCandidate{stamp, obj.key});
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const ManifestCandidate& a, const ManifestCandidate& b) {
                  return a.date > b.date;
              });
    return candidates;
}

Result<Manifest> ManifestResolver::Fetch(const InventoryConfig& config,
                                         const ManifestCandidate& candidate) {
    ++fetch_count_;
    const auto& bucket = config.destination_bucket;

    auto body = storage::FetchWithRetry(policy_, candidate.key,
                                        [&] { return storage::ReadAll(*store_, bucket, candidate.key); });
    if (body.hasError()) {
        if (body.code() == ErrorCode::kNotFound) {
            return Status::ManifestNotFound(bucket + "/" + candidate.key);
        }
        return body.error();
    }

    // manifest.checksum 是可选的
    auto checksum_key = candidate.key.substr(0, candidate.key.size() - std::string(kManifestFile).size()) +
                        kChecksumFile;
    auto checksum = storage::FetchWithRetry(policy_, checksum_key,
                                            [&] { return storage::ReadAll(*store_, bucket, checksum_key); });
    if (checksum.hasValue()) {
        auto expected = NormalizeChecksum(checksum.value());
        auto actual = Md5Digest::Hex(body.value());
        if (expected != actual) {
            LOG_ERROR("Manifest checksum mismatch for {}: expected {}, got {}",
                      candidate.key, expected, actual);
            return Status::ManifestCorrupt("Checksum mismatch for " + candidate.key);
        }
    } else if (checksum.code() != ErrorCode::kNotFound) {
        return checksum.error();
    }

    ManifestLocation location{config.inventory_id, candidate.date, candidate.key};
    auto manifest = ParseManifestJson(body.value(), location);
    if (manifest.hasValue()) {
        // 数据文件与 manifest 在同一个 bucket; JSON 中的 destinationBucket 是 ARN
        manifest.value().destination_bucket = bucket;
        if (manifest.value().source_bucket.empty()) {
            manifest.value().source_bucket = config.source_bucket;
        }
    }
    return manifest;
}

Result<Manifest> ManifestResolver::LoadCandidate(const InventoryConfig& config,
                                                 const ManifestCandidate& candidate) {
    if (!cache_) {
        return Fetch(config, candidate);
    }
    return cache_->GetOrLoad(config.source_bucket, config.inventory_id, candidate.date,
                             [&] { return Fetch(config, candidate); });
}

Result<Manifest> ManifestResolver::ResolveExact(const InventoryConfig& config,
                                                const std::string& stamp) {
    ManifestCandidate candidate{stamp, config.ManifestRoot() + stamp + "/" + kManifestFile};
    return LoadCandidate(config, candidate);
}

Result<Manifest> ManifestResolver::Resolve(const InventoryConfig& config,
                                           const std::optional<std::string>& date) {
    if (config.source_bucket.empty() || config.inventory_id.empty()) {
        return Status::InvalidArgument("Inventory source bucket and id are required");
    }
    if (date && !date->empty()) {
        if (IsManifestStamp(*date)) {
            return ResolveExact(config, *date);
        }
        if (!IsManifestDay(*date)) {
            return Status::InvalidArgument("Invalid inventory date: " + *date +
                                           " (expected YYYY-MM-DD or YYYY-MM-DDTHH-MMZ)");
        }
    }

    bool want_latest = !date || date->empty();
    if (want_latest && cache_) {
        if (auto latest = cache_->FreshLatest(config.source_bucket, config.inventory_id)) {
            LOG_DEBUG("Reusing recent listing for {}/{}: {}",
                      config.source_bucket, config.inventory_id, *latest);
            return ResolveExact(config, *latest);
        }
    }

    ASSIGN_OR_RETURN(auto candidates, ListCandidates(config));
    if (!want_latest) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](const ManifestCandidate& c) {
                                            return c.date.compare(0, date->size(), *date) != 0;
                                        }),
                         candidates.end());
    }
    if (candidates.empty()) {
        return Status::ManifestNotFound("No manifest for " + config.source_bucket + "/" +
                                        config.inventory_id +
                                        (want_latest ? std::string() : " on " + *date));
    }

    Status last_error;
    for (const auto& candidate : candidates) {
        auto manifest = LoadCandidate(config, candidate);
        if (manifest.hasValue()) {
            LOG_INFO("Resolved {}/{} to manifest {}",
                     config.source_bucket, config.inventory_id, candidate.date);
            if (want_latest && cache_) {
                cache_->RememberLatest(config.source_bucket, config.inventory_id, candidate.date);
            }
            return manifest;
        }
        // 只跳过本身有问题的 manifest; 数据源不可用直接失败
        auto code = manifest.code();
        if (code != ErrorCode::kManifestCorrupt && code != ErrorCode::kManifestNotFound) {
            return manifest.error();
        }
        LOG_WARN("Skipping manifest {}: {}", candidate.key, manifest.error().ToString());
        last_error = manifest.error();
    }
    return last_error;
}

Result<std::vector<InventoryLocation>> ManifestResolver::Discover(
    const std::string& destination_bucket,
    const std::string& prefix) {
    auto listing = storage::FetchWithRetry(policy_, "list " + destination_bucket + "/" + prefix,
                                           [&] { return store_->ListObjects(destination_bucket, prefix); });
    if (listing.hasError()) {
        return listing.error();
    }

    // 路径: [prefix...]/source/inventory_id/stamp/manifest.json
    std::map<std::pair<std::string, std::string>, InventoryLocation> found;
    for (const auto& obj : listing.value()) {
        if (!EndsWith(obj.key, std::string("/") + kManifestFile)) {
            continue;
        }
        auto parts = SplitPath(obj.key);
        if (parts.size() < 4) {
            continue;
        }
        const auto& stamp = parts[parts.size() - 2];
        if (!IsManifestStamp(stamp)) {
            continue;
        }
        const auto& inventory_id = parts[parts.size() - 3];
        const auto& source = parts[parts.size() - 4];

        std::string dest_prefix;
        for (size_t i = 0; i + 4 < parts.size(); ++i) {
            if (!dest_prefix.empty()) dest_prefix += "/";
            dest_prefix += parts[i];
        }

        auto& loc = found[{source, inventory_id}];
        loc.source_bucket = source;
        loc.inventory_id = inventory_id;
        loc.destination_prefix = dest_prefix;
        ++loc.manifest_count;
        if (stamp > loc.latest_date) {
            loc.latest_date = stamp;
            loc.latest_manifest_key = obj.key;
        }
    }

    std::vector<InventoryLocation> result;
    result.reserve(found.size());
    for (auto& [_, loc] : found) {
        result.push_back(std::move(loc));
    }
    LOG_INFO("Discovered {} inventories in {}", result.size(), destination_bucket);
    return result;
}

} // namespace invlens::inventory
