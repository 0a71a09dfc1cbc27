#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace invlens {

// ================================
// SingleFlight: 同一 key 同时只执行一次 fn
// 并发调用者等待同一个结果 (参考 Go singleflight)
// ================================

template<typename T, typename Key = std::string>
class SingleFlight {
public:
    using Func = std::function<T()>;

    // shared 为 true 表示结果来自其他调用者的执行
    T Do(const Key& key, Func fn, bool* shared = nullptr) {
        std::shared_ptr<Call> c;
        {
            std::unique_lock lock(mu_);
            auto it = calls_.find(key);
            if (it != calls_.end()) {
                c = it->second;
                lock.unlock();
                if (shared) *shared = true;
                return wait(c);
            }
            c = std::make_shared<Call>();
            calls_[key] = c;
        }
        if (shared) *shared = false;

        try {
            c->val.emplace(fn());
        } catch (...) {
            c->err = std::current_exception();
        }

        {
            std::lock_guard lock(mu_);
            calls_.erase(key);
        }

        {
            std::lock_guard lock(c->mu);
            c->done = true;
        }
        c->cv.notify_all();

        if (c->err) std::rethrow_exception(c->err);
        return *c->val;
    }

    size_t InFlight() const {
        std::shared_lock lock(mu_);
        return calls_.size();
    }

private:
    struct Call {
        std::mutex mu;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> val;
        std::exception_ptr err;
    };

    T wait(std::shared_ptr<Call> c) {
        std::unique_lock lock(c->mu);
        c->cv.wait(lock, [&] { return c->done; });
        if (c->err) std::rethrow_exception(c->err);
        return *c->val;
    }

    mutable std::shared_mutex mu_;
    std::unordered_map<Key, std::shared_ptr<Call>> calls_;
};

} // namespace invlens
