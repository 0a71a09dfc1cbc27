#include "invlens/query/path_aggregator.h"
#include "invlens/common/result_macros.h"
#include "invlens/common/logger.h"
#include "invlens/common/worker_pool.h"
#include <algorithm>
#include <mutex>
#include <vector>

namespace invlens::query {

PathAggregator::PathAggregator(std::shared_ptr<storage::ObjectStore> store, ScanOptions options)
    : store_(std::move(store)), options_(options) {}

std::string PathAggregator::GroupKey(const std::string& key, uint32_t depth, bool* is_folder) {
    *is_folder = true;
    if (depth == 0) {
        return "";
    }

    // 第 depth 个 '/' 之前的部分; 不够 depth 个目录段时是完整 key
    size_t pos = 0;
    for (uint32_t seen = 0; seen < depth; ++seen) {
        auto slash = key.find('/', pos);
        if (slash == std::string::npos) {
            *is_folder = false;
            return key;
        }
        pos = slash + 1;
    }
    return key.substr(0, pos - 1);
}

Result<AggregateResult> PathAggregator::Aggregate(const inventory::Manifest& manifest,
                                                  int depth,
                                                  CancellationToken token) {
    if (depth < 0) {
        return Status::InvalidArgument("Depth must be non-negative: " + std::to_string(depth));
    }
    RETURN_IF_NOT_OK(CheckScannable(manifest));
    auto schema_result = inventory::RecordSchema::FromColumns(manifest.schema);
    if (schema_result.hasError()) {
        return schema_result.error();
    }
    const auto schema = std::move(schema_result).value();
    const auto group_depth = static_cast<uint32_t>(depth);
    const size_t n = manifest.files.size();

    AggregateResult result;
    if (depth == 0) {
        result.buckets[""].is_folder = true;
    }

    std::mutex mutex;
    std::vector<FileOutcome> outcomes(n);

    LOG_INFO("Aggregating {} files of {} at depth {}", n, manifest.source_bucket, depth);

    if (n > 0) {
        TaskPool::Config config;
        config.num_workers = std::min<size_t>(options_.worker_count, n);
        config.queue_size = n;
        TaskPool pool(config);
        pool.start();

        for (size_t i = 0; i < n; ++i) {
            pool.submit([&, i] {
                // 每个文件一个局部 map, 结束后合并
                AggregationMap local;
                auto outcome = ScanFile(*store_, manifest.destination_bucket, manifest.files[i],
                                        schema, options_, token,
                                        [&](inventory::InventoryRecord&& record) {
                                            bool is_folder = false;
                                            auto group = GroupKey(record.key, group_depth, &is_folder);
                                            auto& bucket = local[group];
                                            bucket.is_folder = bucket.is_folder || is_folder;
                                            bucket.Add(record.size);
                                            return true;
                                        });

                std::lock_guard<std::mutex> lock(mutex);
                for (const auto& [path, bucket] : local) {
                    result.buckets[path].Merge(bucket);
                }
                outcomes[i] = std::move(outcome);
            });
        }
        // 等待全部文件完成 (取消后剩余任务立即返回)
        pool.stop();
    }

    result.summary.files_total = n;
    for (size_t i = 0; i < n; ++i) {
        AccumulateFile(&result.summary, manifest.files[i], outcomes[i]);
    }
    result.summary.cancelled = token.IsCancelled();
    result.complete = !result.summary.cancelled && result.summary.files_failed == 0;

    LOG_INFO("Aggregation finished: {} groups, {}", result.buckets.size(),
             result.summary.ToString());
    return result;
}

} // namespace invlens::query
