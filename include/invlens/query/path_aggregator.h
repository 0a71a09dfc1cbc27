#pragma once

#include <memory>
#include <string>
#include "invlens/common/cancellation.h"
#include "invlens/common/result.h"
#include "invlens/query/file_scanner.h"
#include "invlens/query/types.h"

namespace invlens::query {

// ================================
// PathAggregator: 按路径深度汇总 size/count
//
// key 按 '/' 拆段, 最后一段是对象名;
// depth <= 目录段数: 取前 depth 段 (目录);
// depth >  目录段数: 完整 key 自成一组;
// depth == 0: 全 bucket 一组 ("")
// ================================
class PathAggregator {
public:
    PathAggregator(std::shared_ptr<storage::ObjectStore> store, ScanOptions options);

    // 取消时返回已累计的部分结果 (complete = false)
    Result<AggregateResult> Aggregate(const inventory::Manifest& manifest,
                                      int depth,
                                      CancellationToken token = CancellationToken());

    static std::string GroupKey(const std::string& key, uint32_t depth, bool* is_folder);

private:
    std::shared_ptr<storage::ObjectStore> store_;
    ScanOptions options_;
};

} // namespace invlens::query
