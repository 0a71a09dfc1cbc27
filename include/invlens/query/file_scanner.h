#pragma once

#include <functional>
#include <string>
#include "invlens/common/cancellation.h"
#include "invlens/config/engine_config.h"
#include "invlens/inventory/record_reader.h"
#include "invlens/query/types.h"
#include "invlens/storage/object_store.h"
#include "invlens/storage/retry.h"

namespace invlens::query {

struct ScanOptions {
    inventory::ReaderOptions reader;
    storage::RetryPolicy retry;
    uint32_t worker_count = 4;
    uint32_t channel_capacity = 1024;

    static ScanOptions FromConfig(const config::EngineConfig& cfg) {
        ScanOptions opts;
        opts.reader = inventory::ReaderOptions::FromConfig(cfg.reader());
        opts.retry = storage::RetryPolicy::FromConfig(cfg.fetch());
        opts.worker_count = cfg.query().worker_count();
        opts.channel_capacity = cfg.query().channel_capacity();
        return opts;
    }
};

// 单个数据文件的扫描结果
struct FileOutcome {
    inventory::StreamStats stats;
    Status status;
    bool completed = false;
};

// 返回 false 停止扫描当前文件
using RecordCallback = std::function<bool(inventory::InventoryRecord&&)>;

// 顺序扫描一个数据文件; 取消时 status 为 kQueryCancelled
FileOutcome ScanFile(storage::ObjectStore& store,
                     const std::string& bucket,
                     const inventory::DataFileRef& file,
                     const inventory::RecordSchema& schema,
                     const ScanOptions& options,
                     const CancellationToken& token,
                     const RecordCallback& callback);

// 只有 CSV 数据文件可以流式读取
Status CheckScannable(const inventory::Manifest& manifest);

void AccumulateFile(ScanSummary* summary,
                    const inventory::DataFileRef& file,
                    const FileOutcome& outcome);

} // namespace invlens::query
