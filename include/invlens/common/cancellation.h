#pragma once

#include <atomic>
#include <memory>

namespace invlens {

// ================================
// CancellationToken: 查询取消信号
// 拷贝共享同一个标志
// ================================
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { flag_->store(true, std::memory_order_release); }

    bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace invlens
