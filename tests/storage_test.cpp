// ================================
// 对象存储测试: LocalObjectStore, 重试, 工厂
// ================================

#include <gtest/gtest.h>
#include "invlens/storage/object_store.h"
#include "invlens/storage/retry.h"
#include "invlens/storage/store_factory.h"
#include "test_util.h"

namespace invlens::test {

class LocalObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir_.path().empty());
        store_ = std::make_shared<storage::LocalObjectStore>(
            storage::LocalObjectStore::Config{dir_.path()});
    }

    TempDir dir_;
    std::shared_ptr<storage::LocalObjectStore> store_;
};

TEST_F(LocalObjectStoreTest, PutGetRoundTrip) {
    ASSERT_TRUE(store_->PutObject("b1", "a/b/c.txt", "hello").OK());
    auto data = storage::ReadAll(*store_, "b1", "a/b/c.txt");
    ASSERT_TRUE(data.hasValue());
    EXPECT_EQ(data.value(), "hello");
}

TEST_F(LocalObjectStoreTest, ListIsSortedAndFilteredByPrefix) {
    ASSERT_TRUE(store_->PutObject("b1", "logs/2.txt", "22").OK());
    ASSERT_TRUE(store_->PutObject("b1", "logs/1.txt", "1").OK());
    ASSERT_TRUE(store_->PutObject("b1", "other/x.txt", "x").OK());

    auto listing = store_->ListObjects("b1", "logs/");
    ASSERT_TRUE(listing.hasValue());
    ASSERT_EQ(listing.value().size(), 2u);
    EXPECT_EQ(listing.value()[0].key, "logs/1.txt");
    EXPECT_EQ(listing.value()[1].key, "logs/2.txt");
    EXPECT_EQ(listing.value()[1].size, 2u);
}

TEST_F(LocalObjectStoreTest, MissingObjectsAreNotFound) {
    EXPECT_EQ(store_->ListObjects("nobucket", "").code(), ErrorCode::kNotFound);
    ASSERT_TRUE(store_->PutObject("b1", "k", "v").OK());
    EXPECT_EQ(store_->GetObject("b1", "missing").code(), ErrorCode::kNotFound);
}

TEST_F(LocalObjectStoreTest, LargeObjectIsStreamedInChunks) {
    std::string big(100 * 1024 + 7, 'z');
    ASSERT_TRUE(store_->PutObject("b1", "big.bin", big).OK());
    auto reader = store_->GetObject("b1", "big.bin");
    ASSERT_TRUE(reader.hasValue());

    char buf[4096];
    size_t total = 0;
    int reads = 0;
    while (true) {
        auto n = reader.value()->Read(buf, sizeof(buf));
        ASSERT_TRUE(n.hasValue());
        if (n.value() == 0) break;
        total += n.value();
        ++reads;
    }
    EXPECT_EQ(total, big.size());
    EXPECT_GT(reads, 1);
}

// ================================
// FetchWithRetry
// ================================

TEST(RetryTest, TransientErrorsAreRetried) {
    storage::RetryPolicy policy;
    policy.max_attempts = 3;
    policy.backoff_ms = 1;

    int calls = 0;
    auto result = storage::FetchWithRetry(policy, "obj", [&]() -> Result<int> {
        if (++calls < 3) return Status::IO("timeout");
        return 7;
    });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, ExhaustedAttemptsSurfaceSourceUnavailable) {
    storage::RetryPolicy policy;
    policy.max_attempts = 2;
    policy.backoff_ms = 1;

    int calls = 0;
    auto result = storage::FetchWithRetry(policy, "obj", [&]() -> Result<int> {
        ++calls;
        return Status::IO("connection reset");
    });
    EXPECT_EQ(result.code(), ErrorCode::kSourceUnavailable);
    EXPECT_EQ(calls, 2);
}

TEST(RetryTest, NotFoundIsNotRetried) {
    storage::RetryPolicy policy;
    policy.backoff_ms = 1;

    int calls = 0;
    auto result = storage::FetchWithRetry(policy, "obj", [&]() -> Result<int> {
        ++calls;
        return Status::NotFound("gone");
    });
    EXPECT_EQ(result.code(), ErrorCode::kNotFound);
    EXPECT_EQ(calls, 1);
}

// ================================
// StoreFactory
// ================================

TEST(StoreFactoryTest, CreatesRegisteredStores) {
    storage::RegisterBuiltinStores();
    TempDir dir;

    storage::StoreOptions opts;
    opts.type = "local";
    opts.root = dir.path();
    auto store = storage::StoreFactory::Instance().Create(opts);
    ASSERT_TRUE(store.hasValue());
    EXPECT_EQ(store.value()->Name(), "local");

    opts.type = "ftp";
    EXPECT_EQ(storage::StoreFactory::Instance().Create(opts).code(), ErrorCode::kInvalidArgument);
}

TEST(StoreFactoryTest, OptionsFromConfig) {
    config::EngineConfig cfg;
    ASSERT_TRUE(cfg.set("storage.type", "minio").hasValue());
    ASSERT_TRUE(cfg.set("storage.endpoint", "http://localhost:9000").hasValue());
    auto opts = storage::StoreOptions::FromConfig(cfg.storage());
    EXPECT_EQ(opts.type, "minio");
    EXPECT_EQ(opts.endpoint, "http://localhost:9000");
    EXPECT_EQ(opts.region, "us-east-1");
}

} // namespace invlens::test

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
