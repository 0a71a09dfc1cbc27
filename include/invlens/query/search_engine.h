#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "invlens/common/bounded_queue.h"
#include "invlens/common/cancellation.h"
#include "invlens/common/result.h"
#include "invlens/common/worker_pool.h"
#include "invlens/query/file_scanner.h"
#include "invlens/query/types.h"

namespace invlens::query {

// ================================
// KeyMatcher: 按 MatchMode 匹配 key
// ================================
class KeyMatcher {
public:
    explicit KeyMatcher(const SearchOptions& options);

    // exact-folder 模式下 folder_path 返回匹配到的目录前缀
    bool Match(const std::string& key, std::string* folder_path) const;

private:
    bool MatchFolder(const std::string& key, std::string* folder_path) const;
    std::string Normalize(const std::string& s) const;

    MatchMode mode_;
    bool case_insensitive_;
    std::string query_;
    std::vector<std::string> query_segments_;
};

// ================================
// SearchStream: 按 manifest 文件顺序、文件内行顺序产出匹配
//
// worker 按顺序领取数据文件, 每个文件一个有界 channel;
// 消费者依次排空 channel 0, 1, ..., 保证输出有序
// ================================
class SearchStream {
public:
    ~SearchStream();

    SearchStream(const SearchStream&) = delete;
    SearchStream& operator=(const SearchStream&) = delete;

    // true: 得到一个匹配; false: 扫描结束或已取消
    Result<bool> Next(SearchMatch* match);

    // 可从其他线程调用; 已产出的匹配保留
    void Cancel();

    // Next 返回 false 后是最终值
    ScanSummary Summary() const;

    const inventory::Manifest& manifest() const { return *manifest_; }

private:
    friend class SearchEngine;

    SearchStream(std::shared_ptr<storage::ObjectStore> store,
                 std::shared_ptr<const inventory::Manifest> manifest,
                 inventory::RecordSchema schema,
                 SearchOptions search,
                 ScanOptions options,
                 CancellationToken token);

    void Start();
    void ScanOne(size_t index);
    void Shutdown();

    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<const inventory::Manifest> manifest_;
    inventory::RecordSchema schema_;
    KeyMatcher matcher_;
    ScanOptions options_;
    CancellationToken token_;

    std::vector<std::unique_ptr<BoundedQueue<SearchMatch>>> channels_;
    std::unique_ptr<TaskPool> pool_;

    mutable std::mutex mutex_;
    std::vector<FileOutcome> outcomes_;
    std::vector<bool> finished_;

    size_t current_ = 0;
    bool done_ = false;
};

// ================================
// SearchEngine
// ================================
class SearchEngine {
public:
    SearchEngine(std::shared_ptr<storage::ObjectStore> store, ScanOptions options);

    Result<std::unique_ptr<SearchStream>> Search(const inventory::Manifest& manifest,
                                                 const SearchOptions& search,
                                                 CancellationToken token = CancellationToken());

private:
    std::shared_ptr<storage::ObjectStore> store_;
    ScanOptions options_;
};

// 排空一个搜索流, 按 folder_path (其他模式按父目录) 汇总
Result<FolderSummary> SummarizeFolders(SearchStream& stream);

} // namespace invlens::query
