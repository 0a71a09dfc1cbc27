#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include "invlens/common/logger.h"
#include "invlens/common/result.h"
#include "invlens/config/engine_config.h"

namespace invlens::storage {

// ================================
// 拉取重试策略 (指数退避)
// ================================
struct RetryPolicy {
    uint32_t max_attempts = 3;
    uint32_t backoff_ms = 200;
    uint32_t backoff_multiplier = 2;

    static RetryPolicy FromConfig(const config::FetchConfig& cfg) {
        RetryPolicy policy;
        policy.max_attempts = cfg.max_attempts();
        policy.backoff_ms = cfg.backoff_ms();
        policy.backoff_multiplier = cfg.backoff_multiplier();
        return policy;
    }
};

inline bool IsRetryable(ErrorCode code) {
    return code == ErrorCode::kIOError;
}

// op: () -> Result<T>
// 只重试 kIOError; 用尽次数后返回 kSourceUnavailable, 其他错误原样返回
template <typename Op>
auto FetchWithRetry(const RetryPolicy& policy, const std::string& what, Op&& op)
    -> decltype(op()) {
    uint64_t delay_ms = policy.backoff_ms;
    uint32_t attempts = policy.max_attempts ? policy.max_attempts : 1;

    for (uint32_t attempt = 1;; ++attempt) {
        auto result = op();
        if (!result.hasError() || !IsRetryable(result.error().code())) {
            return result;
        }
        if (attempt >= attempts) {
            LOG_ERROR("Giving up on {} after {} attempts: {}",
                      what, attempt, result.error().message());
            return Status::SourceUnavailable(what + ": " + result.error().message());
        }
        LOG_WARN("Fetch {} failed (attempt {}/{}): {}, retrying in {}ms",
                 what, attempt, attempts, result.error().message(), delay_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        delay_ms *= policy.backoff_multiplier;
    }
}

} // namespace invlens::storage
