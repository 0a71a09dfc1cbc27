#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "invlens/inventory/types.h"

namespace invlens::query {

// ================================
// ScanSummary: 每个查询结果都附带的扫描统计
// ================================
struct ScanSummary {
    uint64_t files_total = 0;
    uint64_t files_scanned = 0;     // 完整读完的文件
    uint64_t files_failed = 0;
    uint64_t rows_scanned = 0;
    uint64_t malformed_rows = 0;
    uint64_t checksum_mismatches = 0;
    uint64_t bytes_read = 0;
    bool cancelled = false;
    std::vector<std::string> warnings;

    uint64_t valid_rows() const { return rows_scanned - malformed_rows; }

    std::string ToString() const;
};

enum class MatchMode {
    kSubstring,
    kPrefix,
    kExactFolder,
};

const char* MatchModeName(MatchMode mode);
Result<MatchMode> ParseMatchMode(const std::string& text);

struct SearchOptions {
    std::string query;
    MatchMode mode = MatchMode::kSubstring;
    bool case_insensitive = false;
};

struct SearchMatch {
    inventory::InventoryRecord record;
    // exact-folder: key 中直到匹配段 (含) 的前缀, 其他模式为空
    std::string folder_path;
};

// ================================
// AggregationBucket: 一个截断路径的累计值
// ================================
struct AggregationBucket {
    uint64_t total_size = 0;
    uint64_t object_count = 0;
    bool is_folder = false;

    void Add(uint64_t size) {
        total_size += size;
        ++object_count;
    }

    void Merge(const AggregationBucket& other) {
        total_size += other.total_size;
        object_count += other.object_count;
        is_folder = is_folder || other.is_folder;
    }
};

using AggregationMap = std::map<std::string, AggregationBucket>;

struct AggregateResult {
    AggregationMap buckets;
    ScanSummary summary;
    // 取消或有文件失败时为 false
    bool complete = true;
};

// exact-folder 搜索结果按目录汇总
struct FolderSummary {
    AggregationMap folders;
    ScanSummary summary;
    bool complete = true;
};

} // namespace invlens::query
