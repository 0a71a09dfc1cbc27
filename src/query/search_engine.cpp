// ================================
// 基于 inventory 的 key 搜索
// ================================

#include "invlens/query/search_engine.h"
#include "invlens/common/result_macros.h"
#include "invlens/common/logger.h"
#include <algorithm>
#include <cctype>

namespace invlens::query {

namespace {

std::vector<std::string> SplitSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

std::string ParentOf(const std::string& key) {
    auto slash = key.rfind('/');
    return slash == std::string::npos ? std::string() : key.substr(0, slash);
}

} // namespace

// ================================
// KeyMatcher
// ================================

KeyMatcher::KeyMatcher(const SearchOptions& options)
    : mode_(options.mode),
      case_insensitive_(options.case_insensitive),
      query_(Normalize(options.query)) {
    if (mode_ == MatchMode::kExactFolder) {
        // "a/logs/" 与 "a/logs" 等价
        auto trimmed = query_;
        while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
        while (!trimmed.empty() && trimmed.front() == '/') trimmed.erase(0, 1);
        query_segments_ = SplitSegments(trimmed);
    }
}

std::string KeyMatcher::Normalize(const std::string& s) const {
    if (!case_insensitive_) {
        return s;
    }
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool KeyMatcher::Match(const std::string& key, std::string* folder_path) const {
    folder_path->clear();
    switch (mode_) {
        case MatchMode::kSubstring:
            return Normalize(key).find(query_) != std::string::npos;
        case MatchMode::kPrefix:
            return Normalize(key).compare(0, query_.size(), query_) == 0;
        case MatchMode::kExactFolder:
            return MatchFolder(key, folder_path);
    }
    return false;
}

// 只看目录段 (最后一段是对象名)
bool KeyMatcher::MatchFolder(const std::string& key, std::string* folder_path) const {
    auto segments = SplitSegments(key);
    if (segments.size() < 2 || query_segments_.empty()) {
        return false;
    }
    const size_t dirs = segments.size() - 1;
    const size_t width = query_segments_.size();

    for (size_t start = 0; start + width <= dirs; ++start) {
        bool hit = true;
        for (size_t j = 0; j < width; ++j) {
            if (Normalize(segments[start + j]) != query_segments_[j]) {
                hit = false;
                break;
            }
        }
        if (!hit) {
            continue;
        }
        for (size_t j = 0; j < start + width; ++j) {
            if (j > 0) folder_path->push_back('/');
            folder_path->append(segments[j]);
        }
        return true;
    }
    return false;
}

// ================================
// SearchStream
// ================================

SearchStream::SearchStream(std::shared_ptr<storage::ObjectStore> store,
                           std::shared_ptr<const inventory::Manifest> manifest,
                           inventory::RecordSchema schema,
                           SearchOptions search,
                           ScanOptions options,
                           CancellationToken token)
    : store_(std::move(store)),
      manifest_(std::move(manifest)),
      schema_(std::move(schema)),
      matcher_(search),
      options_(options),
      token_(std::move(token)) {
    const size_t n = manifest_->files.size();
    channels_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        channels_.push_back(std::make_unique<BoundedQueue<SearchMatch>>(options_.channel_capacity));
    }
    outcomes_.resize(n);
    finished_.assign(n, false);
}

SearchStream::~SearchStream() {
    // 提前放弃的流: 唤醒阻塞在 channel 上的 worker
    if (!done_) {
        Cancel();
    }
    Shutdown();
}

void SearchStream::Start() {
    const size_t n = manifest_->files.size();
    if (n == 0) {
        return;
    }

    TaskPool::Config config;
    config.num_workers = std::min<size_t>(options_.worker_count, n);
    // 所有文件一次性入队, 避免提交阻塞
    config.queue_size = n;
    pool_ = std::make_unique<TaskPool>(config);
    pool_->start();
    for (size_t i = 0; i < n; ++i) {
        pool_->submit([this, i] { ScanOne(i); });
    }
}

void SearchStream::ScanOne(size_t index) {
    const auto& file = manifest_->files[index];
    auto& channel = *channels_[index];

    auto outcome = ScanFile(*store_, manifest_->destination_bucket, file, schema_, options_, token_,
                            [&](inventory::InventoryRecord&& record) {
                                std::string folder;
                                if (!matcher_.Match(record.key, &folder)) {
                                    return true;
                                }
                                // channel 被放弃 (取消) 时返回 false
                                return channel.enqueue(SearchMatch{std::move(record), std::move(folder)});
                            });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_[index] = std::move(outcome);
        finished_[index] = true;
    }
    channel.close();
}

void SearchStream::Shutdown() {
    if (pool_) {
        pool_->stop();
    }
}

Result<bool> SearchStream::Next(SearchMatch* match) {
    if (done_) {
        return false;
    }

    while (current_ < channels_.size() && !token_.IsCancelled()) {
        auto item = channels_[current_]->dequeue();
        if (item) {
            *match = std::move(*item);
            return true;
        }
        // 当前文件已结束且排空
        ++current_;
    }

    done_ = true;
    if (token_.IsCancelled()) {
        for (auto& channel : channels_) {
            channel->abandon();
        }
    }
    Shutdown();

    auto summary = Summary();
    LOG_INFO("Search finished: {}", summary.ToString());
    return false;
}

void SearchStream::Cancel() {
    token_.Cancel();
    for (auto& channel : channels_) {
        channel->abandon();
    }
}

ScanSummary SearchStream::Summary() const {
    ScanSummary summary;
    summary.files_total = manifest_->files.size();
    summary.cancelled = token_.IsCancelled();

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < outcomes_.size(); ++i) {
        if (finished_[i]) {
            AccumulateFile(&summary, manifest_->files[i], outcomes_[i]);
        }
    }
    return summary;
}

// ================================
// SearchEngine
// ================================

SearchEngine::SearchEngine(std::shared_ptr<storage::ObjectStore> store, ScanOptions options)
    : store_(std::move(store)), options_(options) {}

Result<std::unique_ptr<SearchStream>> SearchEngine::Search(const inventory::Manifest& manifest,
                                                           const SearchOptions& search,
                                                           CancellationToken token) {
    if (search.query.empty()) {
        return Status::InvalidArgument("Search query must not be empty");
    }
    RETURN_IF_NOT_OK(CheckScannable(manifest));
    auto schema = inventory::RecordSchema::FromColumns(manifest.schema);
    if (schema.hasError()) {
        return schema.error();
    }

    LOG_INFO("Searching {} files of {} for '{}' ({})", manifest.files.size(),
             manifest.source_bucket, search.query, MatchModeName(search.mode));

    // 构造函数私有, 不能用 make_unique
    std::unique_ptr<SearchStream> stream(new SearchStream(
        store_, std::make_shared<const inventory::Manifest>(manifest),
        std::move(schema).value(), search, options_, std::move(token)));
    stream->Start();
    return stream;
}

// ================================
// 目录汇总
// ================================

Result<FolderSummary> SummarizeFolders(SearchStream& stream) {
    FolderSummary result;
    SearchMatch match;
    while (true) {
        auto more = stream.Next(&match);
        if (more.hasError()) {
            return more.error();
        }
        if (!more.value()) {
            break;
        }
        auto folder = match.folder_path.empty() ? ParentOf(match.record.key) : match.folder_path;
        auto& bucket = result.folders[folder];
        bucket.is_folder = true;
        bucket.Add(match.record.size);
    }
    result.summary = stream.Summary();
    result.complete = !result.summary.cancelled && result.summary.files_failed == 0;
    return result;
}

} // namespace invlens::query
