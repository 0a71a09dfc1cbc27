// ================================
// 查询测试: 搜索, 路径汇总, 查询入口
// ================================

#include <gtest/gtest.h>
#include "invlens/query/inventory_query.h"
#include "invlens/query/path_aggregator.h"
#include "invlens/query/search_engine.h"
#include "test_util.h"

namespace invlens::test {

using inventory::Manifest;
using query::AggregateResult;
using query::MatchMode;
using query::SearchOptions;

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir_.path().empty());
        local_ = std::make_shared<storage::LocalObjectStore>(
            storage::LocalObjectStore::Config{dir_.path()});
        writer_ = std::make_unique<InventoryWriter>(local_.get(), "inv", "b1", "daily");
        options_.retry.backoff_ms = 1;
        options_.worker_count = 3;
        options_.channel_capacity = 2;
    }

    // 写一份报告并解析出 manifest
    Manifest Publish(const std::vector<DataFile>& files,
                     const std::string& stamp = "2024-01-05T01-00Z") {
        writer_->WriteReport(stamp, files);
        return Resolve(stamp);
    }

    Manifest Resolve(const std::string& stamp) {
        auto config = inventory::InventoryConfig::Default("b1", "daily");
        config.destination_bucket = "inv";
        inventory::ManifestResolver resolver(local_, options_.retry);
        auto m = resolver.Resolve(config, stamp);
        EXPECT_TRUE(m.hasValue()) << m.error().ToString();
        return m.hasValue() ? m.value() : Manifest{};
    }

    std::vector<query::SearchMatch> SearchAll(const Manifest& manifest,
                                              const SearchOptions& search,
                                              query::ScanSummary* summary = nullptr) {
        query::SearchEngine engine(local_, options_);
        auto stream = engine.Search(manifest, search);
        EXPECT_TRUE(stream.hasValue());
        std::vector<query::SearchMatch> matches;
        if (!stream.hasValue()) {
            return matches;
        }
        query::SearchMatch match;
        while (true) {
            auto more = stream.value()->Next(&match);
            EXPECT_TRUE(more.hasValue());
            if (!more.hasValue() || !more.value()) break;
            matches.push_back(match);
        }
        if (summary) {
            *summary = stream.value()->Summary();
        }
        return matches;
    }

    AggregateResult AggregateAt(const Manifest& manifest, int depth) {
        query::PathAggregator aggregator(local_, options_);
        auto result = aggregator.Aggregate(manifest, depth);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : AggregateResult{};
    }

    static std::vector<std::string> Keys(const std::vector<query::SearchMatch>& matches) {
        std::vector<std::string> keys;
        for (const auto& m : matches) keys.push_back(m.record.key);
        return keys;
    }

    TempDir dir_;
    std::shared_ptr<storage::LocalObjectStore> local_;
    std::unique_ptr<InventoryWriter> writer_;
    query::ScanOptions options_;
};

// ================================
// 路径汇总
// ================================

TEST_F(QueryTest, AggregateTwoFilesAtDepthOne) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a/b/c.txt", 100)}},
                             {"f2.csv.gz", {CsvRow("b1", "a/d.txt", 50)}}});

    auto result = AggregateAt(manifest, 1);
    ASSERT_EQ(result.buckets.size(), 1u);
    const auto& a = result.buckets.at("a");
    EXPECT_EQ(a.total_size, 150u);
    EXPECT_EQ(a.object_count, 2u);
    EXPECT_TRUE(a.is_folder);
    EXPECT_TRUE(result.complete);
    EXPECT_EQ(result.summary.files_scanned, 2u);
    EXPECT_EQ(result.summary.rows_scanned, 2u);

    // 深度超过目录段数的 key 自成一组
    auto deeper = AggregateAt(manifest, 2);
    ASSERT_EQ(deeper.buckets.size(), 2u);
    EXPECT_EQ(deeper.buckets.at("a/b").total_size, 100u);
    EXPECT_TRUE(deeper.buckets.at("a/b").is_folder);
    EXPECT_EQ(deeper.buckets.at("a/d.txt").total_size, 50u);
    EXPECT_FALSE(deeper.buckets.at("a/d.txt").is_folder);
}

TEST_F(QueryTest, DepthZeroIsWholeBucket) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "top.txt", 7), CsvRow("b1", "x/y", 3)}}});
    auto result = AggregateAt(manifest, 0);
    ASSERT_EQ(result.buckets.size(), 1u);
    EXPECT_EQ(result.buckets.at("").total_size, 10u);
    EXPECT_EQ(result.buckets.at("").object_count, 2u);

    // 空 inventory 也有 "" 组
    auto empty = Publish({}, "2024-01-06T01-00Z");
    auto none = AggregateAt(empty, 0);
    ASSERT_EQ(none.buckets.size(), 1u);
    EXPECT_EQ(none.buckets.at("").object_count, 0u);
    EXPECT_TRUE(none.complete);
}

TEST_F(QueryTest, GroupIsFolderWhenAnyMemberIsDeeper) {
    // 同一文件中 "x/y" 在前, 名为 "x" 的对象在后
    auto in_one_file = Publish({{"f1.csv.gz", {CsvRow("b1", "x/y", 10), CsvRow("b1", "x", 5)}}});
    auto result = AggregateAt(in_one_file, 1);
    ASSERT_EQ(result.buckets.size(), 1u);
    const auto& x = result.buckets.at("x");
    EXPECT_EQ(x.total_size, 15u);
    EXPECT_EQ(x.object_count, 2u);
    EXPECT_TRUE(x.is_folder);

    auto reversed = Publish({{"r1.csv.gz", {CsvRow("b1", "x", 5), CsvRow("b1", "x/y", 10)}}},
                            "2024-01-06T01-00Z");
    EXPECT_TRUE(AggregateAt(reversed, 1).buckets.at("x").is_folder);

    auto across_files = Publish({{"s1.csv.gz", {CsvRow("b1", "x/y", 10)}},
                                 {"s2.csv.gz", {CsvRow("b1", "x", 5)}}},
                                "2024-01-07T01-00Z");
    EXPECT_TRUE(AggregateAt(across_files, 1).buckets.at("x").is_folder);
}

TEST_F(QueryTest, GroupKey) {
    bool is_folder = false;
    EXPECT_EQ(query::PathAggregator::GroupKey("a/b/c.txt", 1, &is_folder), "a");
    EXPECT_TRUE(is_folder);
    EXPECT_EQ(query::PathAggregator::GroupKey("a/b/c.txt", 2, &is_folder), "a/b");
    EXPECT_TRUE(is_folder);
    EXPECT_EQ(query::PathAggregator::GroupKey("a/b/c.txt", 3, &is_folder), "a/b/c.txt");
    EXPECT_FALSE(is_folder);
    EXPECT_EQ(query::PathAggregator::GroupKey("top.txt", 1, &is_folder), "top.txt");
    EXPECT_FALSE(is_folder);
    EXPECT_EQ(query::PathAggregator::GroupKey("a//b", 2, &is_folder), "a/");
    EXPECT_TRUE(is_folder);
    EXPECT_EQ(query::PathAggregator::GroupKey("dir/", 1, &is_folder), "dir");
    EXPECT_TRUE(is_folder);
}

TEST_F(QueryTest, TotalsMatchValidRows) {
    std::vector<std::string> rows;
    uint64_t expected_bytes = 0;
    for (int i = 0; i < 40; ++i) {
        auto size = static_cast<uint64_t>(i * 3 + 1);
        rows.push_back(CsvRow("b1", "d" + std::to_string(i % 4) + "/s" + std::to_string(i % 3) + "/o" +
                                        std::to_string(i), size));
        expected_bytes += size;
    }
    rows.insert(rows.begin() + 7, "broken row");
    std::vector<std::string> first(rows.begin(), rows.begin() + 20);
    std::vector<std::string> second(rows.begin() + 20, rows.end());
    auto manifest = Publish({{"f1.csv.gz", first}, {"f2.csv.gz", second}});

    for (int depth = 0; depth <= 3; ++depth) {
        auto result = AggregateAt(manifest, depth);
        uint64_t bytes = 0;
        uint64_t count = 0;
        for (const auto& [path, bucket] : result.buckets) {
            bytes += bucket.total_size;
            count += bucket.object_count;
        }
        EXPECT_EQ(bytes, expected_bytes) << "depth " << depth;
        EXPECT_EQ(count, result.summary.valid_rows()) << "depth " << depth;
        EXPECT_EQ(count, 40u);
        EXPECT_EQ(result.summary.malformed_rows, 1u);
    }
}

TEST_F(QueryTest, DeeperGroupsRefineShallowerOnes) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a/x/1", 1), CsvRow("b1", "a/x/2", 2),
                                            CsvRow("b1", "a/y/3", 4), CsvRow("b1", "a/z", 8)}},
                             {"f2.csv.gz", {CsvRow("b1", "b/x/y/4", 16), CsvRow("b1", "c", 32)}}});
    auto shallow = AggregateAt(manifest, 1);
    auto deep = AggregateAt(manifest, 2);

    for (const auto& [path, bucket] : shallow.buckets) {
        uint64_t bytes = 0;
        uint64_t count = 0;
        for (const auto& [child, child_bucket] : deep.buckets) {
            bool under = bucket.is_folder ? child.compare(0, path.size() + 1, path + "/") == 0
                                          : child == path;
            if (under) {
                bytes += child_bucket.total_size;
                count += child_bucket.object_count;
            }
        }
        EXPECT_EQ(bytes, bucket.total_size) << path;
        EXPECT_EQ(count, bucket.object_count) << path;
    }
}

TEST_F(QueryTest, AggregateRejectsNegativeDepth) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a", 1)}}});
    query::PathAggregator aggregator(local_, options_);
    EXPECT_EQ(aggregator.Aggregate(manifest, -1).code(), ErrorCode::kInvalidArgument);
}

TEST_F(QueryTest, ColumnarFormatsAreUnsupported) {
    writer_->WriteManifest("2024-01-05T01-00Z",
                           writer_->ManifestJson({R"({"key": "b1/daily/data/x.orc", "size": 10})"},
                                                 kDefaultSchema, "ORC"));
    auto manifest = Resolve("2024-01-05T01-00Z");
    EXPECT_EQ(manifest.format, inventory::FileFormat::kORC);

    query::PathAggregator aggregator(local_, options_);
    EXPECT_EQ(aggregator.Aggregate(manifest, 1).code(), ErrorCode::kUnsupported);
    query::SearchEngine engine(local_, options_);
    EXPECT_EQ(engine.Search(manifest, SearchOptions{"x"}).code(), ErrorCode::kUnsupported);
}

TEST_F(QueryTest, FailedFileIsReportedAndOthersContinue) {
    auto good = writer_->WriteDataFile({"good.csv.gz", {CsvRow("b1", "a/1", 5)}});
    std::string missing = R"({"key": "b1/daily/data/missing.csv.gz", "size": 10})";
    auto good2 = writer_->WriteDataFile({"good2.csv.gz", {CsvRow("b1", "a/2", 6)}});
    writer_->WriteManifest("2024-01-05T01-00Z", writer_->ManifestJson({good, missing, good2}));
    auto manifest = Resolve("2024-01-05T01-00Z");

    auto result = AggregateAt(manifest, 1);
    EXPECT_FALSE(result.complete);
    EXPECT_FALSE(result.summary.cancelled);
    EXPECT_EQ(result.summary.files_total, 3u);
    EXPECT_EQ(result.summary.files_scanned, 2u);
    EXPECT_EQ(result.summary.files_failed, 1u);
    ASSERT_EQ(result.summary.warnings.size(), 1u);
    EXPECT_NE(result.summary.warnings[0].find("missing.csv.gz"), std::string::npos);
    EXPECT_EQ(result.buckets.at("a").total_size, 11u);

    query::ScanSummary summary;
    auto matches = SearchAll(manifest, SearchOptions{"a/"}, &summary);
    EXPECT_EQ(Keys(matches), (std::vector<std::string>{"a/1", "a/2"}));
    EXPECT_EQ(summary.files_failed, 1u);
}

TEST_F(QueryTest, CorruptFileKeepsRowsReadSoFar) {
    std::vector<std::string> rows = {CsvRow("b1", "a/ok", 9)};
    for (int i = 0; i < 12; ++i) rows.push_back("junk");
    auto manifest = Publish({{"bad.csv.gz", rows}, {"fine.csv.gz", {CsvRow("b1", "a/fine", 1)}}});

    auto result = AggregateAt(manifest, 1);
    EXPECT_FALSE(result.complete);
    EXPECT_EQ(result.summary.files_failed, 1u);
    // 损坏前读到的行仍然计入
    EXPECT_EQ(result.buckets.at("a").object_count, 2u);
    EXPECT_EQ(result.buckets.at("a").total_size, 10u);
}

TEST_F(QueryTest, CancelledAggregateIsPartial) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a/1", 1)}},
                             {"f2.csv.gz", {CsvRow("b1", "a/2", 1)}}});
    CancellationToken token;
    token.Cancel();
    query::PathAggregator aggregator(local_, options_);
    auto result = aggregator.Aggregate(manifest, 1, token);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().complete);
    EXPECT_TRUE(result.value().summary.cancelled);
    EXPECT_EQ(result.value().summary.files_failed, 0u);
    EXPECT_TRUE(result.value().buckets.empty());
}

TEST_F(QueryTest, ChecksumMismatchIsAWarning) {
    auto entry = writer_->WriteDataFile({"f1.csv.gz", {CsvRow("b1", "a/1", 4)}}, true, false);
    entry.pop_back();
    entry += R"(, "MD5checksum": "ffffffffffffffffffffffffffffffff"})";
    writer_->WriteManifest("2024-01-05T01-00Z", writer_->ManifestJson({entry}));
    auto manifest = Resolve("2024-01-05T01-00Z");

    auto result = AggregateAt(manifest, 1);
    EXPECT_TRUE(result.complete);
    EXPECT_EQ(result.summary.checksum_mismatches, 1u);
    EXPECT_EQ(result.buckets.at("a").total_size, 4u);
    ASSERT_EQ(result.summary.warnings.size(), 1u);
}

// ================================
// 搜索
// ================================

TEST_F(QueryTest, SubstringSearch) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a/b/c.txt", 100)}},
                             {"f2.csv.gz", {CsvRow("b1", "a/d.txt", 50)}}});
    query::ScanSummary summary;
    auto matches = SearchAll(manifest, SearchOptions{"b"}, &summary);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].record.key, "a/b/c.txt");
    EXPECT_EQ(matches[0].record.size, 100u);
    EXPECT_TRUE(matches[0].folder_path.empty());
    EXPECT_EQ(summary.files_scanned, 2u);
    EXPECT_EQ(summary.rows_scanned, 2u);
    EXPECT_FALSE(summary.cancelled);
}

TEST_F(QueryTest, EmptyQueryRejected) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a", 1)}}});
    query::SearchEngine engine(local_, options_);
    EXPECT_EQ(engine.Search(manifest, SearchOptions{}).code(), ErrorCode::kInvalidArgument);
}

TEST_F(QueryTest, ExactFolderMatchesWholeSegments) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a/logs/b.txt", 1),
                                            CsvRow("b1", "a/logsarchive/b.txt", 2),
                                            CsvRow("b1", "x/logs", 3),
                                            CsvRow("b1", "logs/top.txt", 4),
                                            CsvRow("b1", "a/b/logs/deep/c", 5)}}});
    SearchOptions search{"logs", MatchMode::kExactFolder};
    auto matches = SearchAll(manifest, search);
    EXPECT_EQ(Keys(matches), (std::vector<std::string>{"a/logs/b.txt", "logs/top.txt", "a/b/logs/deep/c"}));
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].folder_path, "a/logs");
    EXPECT_EQ(matches[1].folder_path, "logs");
    EXPECT_EQ(matches[2].folder_path, "a/b/logs");

    SearchOptions multi{"b/logs/", MatchMode::kExactFolder};
    EXPECT_EQ(Keys(SearchAll(manifest, multi)), (std::vector<std::string>{"a/b/logs/deep/c"}));
}

TEST_F(QueryTest, PrefixAndCaseInsensitive) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "Photos/2024/a.jpg", 1),
                                            CsvRow("b1", "photos/2023/b.jpg", 1),
                                            CsvRow("b1", "archive/photos/c.jpg", 1)}}});
    EXPECT_EQ(Keys(SearchAll(manifest, SearchOptions{"photos/", MatchMode::kPrefix})),
              (std::vector<std::string>{"photos/2023/b.jpg"}));
    EXPECT_EQ(Keys(SearchAll(manifest, SearchOptions{"photos/", MatchMode::kPrefix, true})),
              (std::vector<std::string>{"Photos/2024/a.jpg", "photos/2023/b.jpg"}));
    EXPECT_EQ(SearchAll(manifest, SearchOptions{"PHOTOS", MatchMode::kSubstring, true}).size(), 3u);
    EXPECT_EQ(SearchAll(manifest, SearchOptions{"PHOTOS", MatchMode::kSubstring}).size(), 0u);
    EXPECT_EQ(Keys(SearchAll(manifest, SearchOptions{"PHOTOS", MatchMode::kExactFolder, true})),
              (std::vector<std::string>{"Photos/2024/a.jpg", "photos/2023/b.jpg", "archive/photos/c.jpg"}));
}

TEST_F(QueryTest, MatchesFollowManifestOrder) {
    std::vector<DataFile> files;
    std::vector<std::string> expected;
    for (int f = 0; f < 6; ++f) {
        DataFile file{"part-" + std::to_string(f) + ".csv.gz", {}};
        for (int r = 0; r < 25; ++r) {
            auto key = "k/" + std::to_string(f) + "/" + std::to_string(r);
            file.rows.push_back(CsvRow("b1", key, 1));
            expected.push_back(key);
        }
        files.push_back(file);
    }
    auto manifest = Publish(files);
    EXPECT_EQ(Keys(SearchAll(manifest, SearchOptions{"k/"})), expected);
}

TEST_F(QueryTest, CancelKeepsMatchesAlreadyProduced) {
    std::vector<std::string> rows;
    for (int i = 0; i < 200; ++i) {
        rows.push_back(CsvRow("b1", "m/" + std::to_string(i), 1));
    }
    auto manifest = Publish({{"f1.csv.gz", rows}, {"f2.csv.gz", rows}});

    query::SearchEngine engine(local_, options_);
    auto stream = engine.Search(manifest, SearchOptions{"m/"});
    ASSERT_TRUE(stream.hasValue());
    auto& s = *stream.value();

    std::vector<std::string> keys;
    query::SearchMatch match;
    for (int i = 0; i < 3; ++i) {
        auto more = s.Next(&match);
        ASSERT_TRUE(more.hasValue());
        ASSERT_TRUE(more.value());
        keys.push_back(match.record.key);
    }
    s.Cancel();

    auto more = s.Next(&match);
    ASSERT_TRUE(more.hasValue());
    EXPECT_FALSE(more.value());
    EXPECT_EQ(keys, (std::vector<std::string>{"m/0", "m/1", "m/2"}));

    auto summary = s.Summary();
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.files_failed, 0u);
    EXPECT_LT(summary.files_scanned, 2u);
}

TEST_F(QueryTest, DroppingStreamEarlyDoesNotHang) {
    std::vector<std::string> rows;
    for (int i = 0; i < 100; ++i) {
        rows.push_back(CsvRow("b1", "m/" + std::to_string(i), 1));
    }
    auto manifest = Publish({{"f1.csv.gz", rows}, {"f2.csv.gz", rows}, {"f3.csv.gz", rows}});
    query::SearchEngine engine(local_, options_);
    CancellationToken token;
    {
        auto stream = engine.Search(manifest, SearchOptions{"m/"}, token);
        ASSERT_TRUE(stream.hasValue());
        query::SearchMatch match;
        ASSERT_TRUE(stream.value()->Next(&match).value());
    }
    SUCCEED();
}

TEST_F(QueryTest, SummarizeFolders) {
    auto manifest = Publish({{"f1.csv.gz", {CsvRow("b1", "a/logs/1", 10), CsvRow("b1", "a/logs/2", 5),
                                            CsvRow("b1", "b/logs/x/3", 1), CsvRow("b1", "c/other", 1)}}});
    query::SearchEngine engine(local_, options_);
    auto stream = engine.Search(manifest, SearchOptions{"logs", MatchMode::kExactFolder});
    ASSERT_TRUE(stream.hasValue());
    auto summary = query::SummarizeFolders(*stream.value());
    ASSERT_TRUE(summary.hasValue());
    EXPECT_TRUE(summary.value().complete);
    ASSERT_EQ(summary.value().folders.size(), 2u);
    EXPECT_EQ(summary.value().folders.at("a/logs").total_size, 15u);
    EXPECT_EQ(summary.value().folders.at("a/logs").object_count, 2u);
    EXPECT_EQ(summary.value().folders.at("b/logs").object_count, 1u);
    EXPECT_EQ(summary.value().summary.rows_scanned, 4u);
}

// ================================
// InventoryQuery
// ================================

TEST_F(QueryTest, InventoryQueryEndToEnd) {
    writer_->WriteReport("2024-01-04T01-00Z", {{"old.csv.gz", {CsvRow("b1", "a/old", 1)}}});
    writer_->WriteReport("2024-01-05T01-00Z", {{"f1.csv.gz", {CsvRow("b1", "a/b/c.txt", 100)}},
                                               {"f2.csv.gz", {CsvRow("b1", "a/d.txt", 50)}}});

    auto cache = std::make_shared<inventory::ManifestCache>(inventory::ManifestCache::Options{});
    query::InventoryQuery engine(local_, cache, options_);
    auto config = inventory::InventoryConfig::Default("b1", "daily");
    config.destination_bucket = "inv";
    engine.RegisterInventory(config);
    EXPECT_EQ(engine.Lookup("b1", "daily").destination_bucket, "inv");
    EXPECT_EQ(engine.Lookup("b2", "weekly").destination_bucket, "b2");

    auto sizes = engine.AggregateByDepth("b1", "daily", 1);
    ASSERT_TRUE(sizes.hasValue());
    EXPECT_EQ(sizes.value().buckets.at("a").total_size, 150u);

    auto old = engine.AggregateByDepth("b1", "daily", 1, std::string("2024-01-04"));
    ASSERT_TRUE(old.hasValue());
    EXPECT_EQ(old.value().buckets.at("a").total_size, 1u);

    auto stream = engine.Search("b1", "daily", SearchOptions{"c.txt"});
    ASSERT_TRUE(stream.hasValue());
    query::SearchMatch match;
    ASSERT_TRUE(stream.value()->Next(&match).value());
    EXPECT_EQ(match.record.key, "a/b/c.txt");
    EXPECT_FALSE(stream.value()->Next(&match).value());

    EXPECT_EQ(engine.AggregateByDepth("b1", "daily", -2).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(engine.Search("b1", "daily", SearchOptions{}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(engine.Resolve("b1", "nope").code(), ErrorCode::kManifestNotFound);

    auto listed = engine.ListManifests("inv");
    ASSERT_TRUE(listed.hasValue());
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_EQ(listed.value()[0].latest_date, "2024-01-05T01-00Z");
    EXPECT_EQ(listed.value()[0].manifest_count, 2u);

    // 新报告发布后 Refresh 拿到最新的
    writer_->WriteReport("2024-01-06T01-00Z", {{"new.csv.gz", {CsvRow("b1", "z/new", 7)}}});
    auto refreshed = engine.Refresh("b1", "daily");
    ASSERT_TRUE(refreshed.hasValue());
    EXPECT_EQ(refreshed.value().date, "2024-01-06T01-00Z");
}

TEST(InventoryQueryCreateTest, FromConfig) {
    TempDir dir;
    config::EngineConfig config;
    ASSERT_TRUE(config.set("storage.type", "local").hasValue());
    ASSERT_TRUE(config.set("storage.root", dir.path()).hasValue());
    ASSERT_TRUE(config.set("cache.db_path", dir.path() + "/cache").hasValue());

    storage::LocalObjectStore local(storage::LocalObjectStore::Config{dir.path()});
    InventoryWriter writer(&local, "b1", "b1", "daily");
    writer.WriteReport("2024-01-05T01-00Z", {{"f.csv.gz", {CsvRow("b1", "a/x", 3)}}});

    auto engine = query::InventoryQuery::Create(config);
    ASSERT_TRUE(engine.hasValue()) << engine.error().ToString();
    auto sizes = engine.value()->AggregateByDepth("b1", "daily", 1);
    ASSERT_TRUE(sizes.hasValue()) << sizes.error().ToString();
    EXPECT_EQ(sizes.value().buckets.at("a").total_size, 3u);
    EXPECT_EQ(engine.value()->cache()->stats().loads, 1u);
}

TEST(MatchModeTest, Parse) {
    EXPECT_EQ(query::ParseMatchMode("prefix").value(), MatchMode::kPrefix);
    EXPECT_EQ(query::ParseMatchMode("exact-folder").value(), MatchMode::kExactFolder);
    EXPECT_EQ(query::ParseMatchMode("regex").code(), ErrorCode::kInvalidArgument);
}

} // namespace invlens::test

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
