// ================================
// S3 对象存储 (AWS SDK for C++)
// ================================

#include "invlens/storage/object_store.h"
#include "invlens/common/logger.h"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/GetObjectResult.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/ListObjectsV2Result.h>
#include <mutex>

namespace invlens::storage {

namespace {

// Aws::InitAPI/ShutdownAPI 每个进程只能各调用一次, 按引用计数管理
std::mutex g_sdk_mutex;
int g_sdk_refs = 0;
Aws::SDKOptions g_sdk_options;

void AcquireSdk() {
    std::lock_guard<std::mutex> lock(g_sdk_mutex);
    if (g_sdk_refs++ == 0) {
        g_sdk_options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
        Aws::InitAPI(g_sdk_options);
    }
}

void ReleaseSdk() {
    std::lock_guard<std::mutex> lock(g_sdk_mutex);
    if (--g_sdk_refs == 0) {
        Aws::ShutdownAPI(g_sdk_options);
    }
}

template <typename Error>
Status ToStatus(const Error& error, const std::string& what) {
    auto msg = what + ": " + error.GetExceptionName() + " " + error.GetMessage();
    auto type = error.GetErrorType();
    if (type == Aws::S3::S3Errors::NO_SUCH_KEY ||
        type == Aws::S3::S3Errors::NO_SUCH_BUCKET ||
        type == Aws::S3::S3Errors::RESOURCE_NOT_FOUND ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
        return Status::NotFound(msg);
    }
    if (error.ShouldRetry()) {
        return Status::IO(msg);
    }
    // 权限/签名等错误, 重试无意义
    return Status::SourceUnavailable(msg);
}

class S3ObjectReader : public ObjectReader {
public:
    explicit S3ObjectReader(Aws::S3::Model::GetObjectResult result)
        : result_(std::move(result)) {}

    Result<size_t> Read(char* buf, size_t n) override {
        auto& body = result_.GetBody();
        if (body.eof()) {
            return size_t{0};
        }
        body.read(buf, static_cast<std::streamsize>(n));
        if (body.bad()) {
            return Status::IO("Connection lost while reading object body");
        }
        return static_cast<size_t>(body.gcount());
    }

private:
    Aws::S3::Model::GetObjectResult result_;
};

} // namespace

struct S3ObjectStore::Impl {
    std::unique_ptr<Aws::S3::S3Client> s3;
};

S3ObjectStore::S3ObjectStore(Config config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>()) {
    AcquireSdk();

    Aws::Client::ClientConfiguration aws_cfg;
    if (!config_.region.empty()) {
        aws_cfg.region = config_.region;
    }
    if (!config_.endpoint.empty()) {
        aws_cfg.endpointOverride = config_.endpoint;
    }
    aws_cfg.maxConnections = config_.max_connections;

    // AWS SDK 用 useVirtualAddressing, path style 与之相反
    bool use_virtual_addressing = !config_.path_style;

    if (!config_.access_key.empty() && !config_.secret_key.empty()) {
        Aws::Auth::AWSCredentials creds(config_.access_key.c_str(),
                                        config_.secret_key.c_str(),
                                        config_.session_token.c_str());
        impl_->s3 = std::make_unique<Aws::S3::S3Client>(creds, aws_cfg,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            use_virtual_addressing);
    } else {
        // 使用默认凭证链 (环境变量/profile/实例角色)
        impl_->s3 = std::make_unique<Aws::S3::S3Client>(aws_cfg,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            use_virtual_addressing);
    }

    LOG_INFO("S3ObjectStore initialized: region={} endpoint={}",
             config_.region, config_.endpoint.empty() ? "<aws>" : config_.endpoint);
}

S3ObjectStore::~S3ObjectStore() {
    impl_->s3.reset();
    ReleaseSdk();
}

Result<std::vector<ObjectInfo>> S3ObjectStore::ListObjects(
    const std::string& bucket,
    const std::string& prefix
) {
    std::vector<ObjectInfo> objects;
    Aws::S3::Model::ListObjectsV2Request request;
    request.SetBucket(bucket);
    if (!prefix.empty()) {
        request.SetPrefix(prefix);
    }

    while (true) {
        auto outcome = impl_->s3->ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            return ToStatus(outcome.GetError(), "ListObjectsV2 " + bucket + "/" + prefix);
        }

        const auto& listing = outcome.GetResult();
        for (const auto& obj : listing.GetContents()) {
            ObjectInfo info;
            info.key = obj.GetKey();
            info.size = static_cast<uint64_t>(obj.GetSize());
            info.last_modified = static_cast<Timestamp>(obj.GetLastModified().Seconds());
            objects.push_back(std::move(info));
        }

        if (!listing.GetIsTruncated()) {
            break;
        }
        request.SetContinuationToken(listing.GetNextContinuationToken());
    }

    LOG_DEBUG("Listed {} objects under s3://{}/{}", objects.size(), bucket, prefix);
    return objects;
}

Result<std::unique_ptr<ObjectReader>> S3ObjectStore::GetObject(
    const std::string& bucket,
    const std::string& key
) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);

    auto outcome = impl_->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        return ToStatus(outcome.GetError(), "GetObject s3://" + bucket + "/" + key);
    }

    return std::unique_ptr<ObjectReader>(
        std::make_unique<S3ObjectReader>(outcome.GetResultWithOwnership()));
}

} // namespace invlens::storage
