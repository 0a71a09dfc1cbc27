#pragma once

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "invlens/common/result.h"
#include "invlens/common/types.h"

namespace invlens {
namespace config {

// ============================================================================
// Type Traits
// ============================================================================

template <typename T>
inline constexpr bool IsPrimitive = std::is_trivially_copyable_v<T> && sizeof(T) <= 8;

template <typename T>
using ReturnType = std::conditional_t<IsPrimitive<T>, T, const T&>;

template <typename T>
using ValueType = std::conditional_t<std::is_same_v<T, const char*>, std::string, T>;

// ============================================================================
// AtomicValue<T> - 基础类型原子存储
// ============================================================================

template <typename T>
class AtomicValue {
public:
    AtomicValue() = default;
    explicit AtomicValue(T value) : value_(value) {}
    AtomicValue(const AtomicValue& o) : value_(o.value()) {}

    T value(std::memory_order order = std::memory_order_seq_cst) const {
        return value_.load(order);
    }

    void setValue(T value, std::memory_order order = std::memory_order_seq_cst) {
        value_.store(value, order);
    }

    AtomicValue& operator=(const AtomicValue& o) {
        setValue(o.value());
        return *this;
    }

private:
    std::atomic<T> value_{};
};

// ============================================================================
// SharedValue<T> - 复杂类型 (string 等) 的共享指针存储
// ============================================================================

template <typename T>
class SharedValue {
public:
    explicit SharedValue(T&& value) : ptr_(std::make_shared<T>(std::move(value))) {}
    SharedValue(const SharedValue& o) : ptr_(std::atomic_load(&o.ptr_)) {}

    const T& value() const { return *std::atomic_load(&ptr_); }

    template <typename V>
    void setValue(V&& value) {
        std::atomic_store(&ptr_, std::make_shared<T>(std::forward<V>(value)));
    }

    SharedValue& operator=(const SharedValue& o) {
        std::atomic_store(&ptr_, std::atomic_load(&o.ptr_));
        return *this;
    }

private:
    std::shared_ptr<T> ptr_;
};

template <typename T>
using StoreType = std::conditional_t<IsPrimitive<T>, AtomicValue<T>, SharedValue<T>>;

// ============================================================================
// 文本 -> 值
// ============================================================================

template <typename T>
bool ParseValue(const std::string& text, T* out) {
    if constexpr (std::is_same_v<T, std::string>) {
        *out = text;
        return true;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (text == "true" || text == "1" || text == "yes" || text == "on") {
            *out = true;
            return true;
        }
        if (text == "false" || text == "0" || text == "no" || text == "off") {
            *out = false;
            return true;
        }
        return false;
    } else if constexpr (std::is_integral_v<T>) {
        if (text.empty()) return false;
        if (std::is_unsigned_v<T> && text[0] == '-') return false;
        char* end = nullptr;
        errno = 0;
        long long v = std::strtoll(text.c_str(), &end, 10);
        if (errno != 0 || end != text.c_str() + text.size()) return false;
        *out = static_cast<T>(v);
        return static_cast<long long>(*out) == v;
    } else if constexpr (std::is_floating_point_v<T>) {
        if (text.empty()) return false;
        char* end = nullptr;
        double v = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) return false;
        *out = static_cast<T>(v);
        return true;
    } else {
        return false;
    }
}

// ============================================================================
// IItem - 配置项接口
// ============================================================================

struct IItem {
    virtual ~IItem() = default;
    virtual Result<Void> validate(const std::string& path) const = 0;
    virtual Result<Void> parse(const std::string& path, const std::string& text) = 0;
    virtual std::string toString() const = 0;
};

// ============================================================================
// Item<T> - 配置项实现
// ============================================================================

template <typename T>
class Item : public IItem {
public:
    using Checker = std::function<bool(ReturnType<T>)>;

    Item(std::string name, T defaultValue, Checker checker = nullptr)
        : value_(std::move(defaultValue)),
          name_(std::move(name)),
          checker_(checker ? std::move(checker) : [](ReturnType<T>) { return true; }) {}

    ReturnType<T> value() const { return value_.value(); }

    template <typename V>
    void setValue(V&& value) { value_.setValue(std::forward<V>(value)); }

    bool checkAndSet(ReturnType<T> value) {
        if (checker_(value)) {
            setValue(value);
            return true;
        }
        return false;
    }

    Result<Void> validate(const std::string& path) const override {
        if (!checker_(value())) {
            return Err<Void>(ErrorCode::kInvalidArgument, "Check failed: " + path);
        }
        return Ok();
    }

    Result<Void> parse(const std::string& path, const std::string& text) override {
        T parsed{};
        if (!ParseValue<T>(text, &parsed)) {
            return Err<Void>(ErrorCode::kInvalidArgument,
                             "Bad value for " + path + ": '" + text + "'");
        }
        if (!checkAndSet(parsed)) {
            return Err<Void>(ErrorCode::kInvalidArgument,
                             "Check failed: " + path + " = " + text);
        }
        return Ok();
    }

    std::string toString() const override {
        if constexpr (std::is_same_v<T, std::string>) {
            return value();
        } else if constexpr (std::is_same_v<T, bool>) {
            return value() ? "true" : "false";
        } else if constexpr (std::is_arithmetic_v<T>) {
            return std::to_string(value());
        } else {
            return "<complex>";
        }
    }

private:
    StoreType<T> value_;
    std::string name_;
    Checker checker_;
};

// ============================================================================
// IConfig - 配置接口
// ============================================================================

struct IConfig {
    virtual ~IConfig() = default;
    virtual Result<Void> validate(const std::string& path = {}) const = 0;
    virtual Result<Void> set(const std::string& key, const std::string& text,
                             const std::string& path = {}) = 0;
    virtual void dump(std::vector<std::pair<std::string, std::string>>* out,
                      const std::string& path = {}) const = 0;
};

// ============================================================================
// ConfigBase<Derived> - CRTP 配置基类
// ============================================================================

template <typename Derived>
class ConfigBase : public IConfig {
protected:
    ConfigBase() = default;
    ConfigBase(const ConfigBase&) = default;
    ConfigBase& operator=(const ConfigBase&) = default;

public:
    Result<Void> validate(const std::string& path = {}) const override {
        auto* self = static_cast<const Derived*>(this);
        for (const auto& [name, item] : items_) {
            auto fullPath = path.empty() ? name : path + "." + name;
            auto res = (self->*item).validate(fullPath);
            if (res.hasError()) return res;
        }
        for (const auto& [name, section] : sections_) {
            auto fullPath = path.empty() ? name : path + "." + name;
            auto res = (self->*section).validate(fullPath);
            if (res.hasError()) return res;
        }
        return Ok();
    }

    // key 为点分路径, 例如 "reader.max_consecutive_malformed"
    Result<Void> set(const std::string& key, const std::string& text,
                     const std::string& path = {}) override {
        auto* self = static_cast<Derived*>(this);
        auto dot = key.find('.');
        auto head = key.substr(0, dot);
        auto fullPath = path.empty() ? head : path + "." + head;

        if (dot == std::string::npos) {
            auto it = items_.find(head);
            if (it == items_.end()) {
                return Err<Void>(ErrorCode::kInvalidArgument, "Unknown config item: " + fullPath);
            }
            return (self->*(it->second)).parse(fullPath, text);
        }

        auto it = sections_.find(head);
        if (it == sections_.end()) {
            return Err<Void>(ErrorCode::kInvalidArgument, "Unknown config section: " + fullPath);
        }
        return (self->*(it->second)).set(key.substr(dot + 1), text, fullPath);
    }

    void dump(std::vector<std::pair<std::string, std::string>>* out,
              const std::string& path = {}) const override {
        auto* self = static_cast<const Derived*>(this);
        for (const auto& [name, item] : items_) {
            auto fullPath = path.empty() ? name : path + "." + name;
            out->emplace_back(fullPath, (self->*item).toString());
        }
        for (const auto& [name, section] : sections_) {
            auto fullPath = path.empty() ? name : path + "." + name;
            (self->*section).dump(out, fullPath);
        }
    }

protected:
    std::map<std::string, IItem Derived::*, std::less<>> items_;
    std::map<std::string, IConfig Derived::*, std::less<>> sections_;
};

// 读取 "key = value" 格式的配置文件, '#' 开头为注释
Result<Void> LoadConfigFile(const std::string& file, IConfig* config);

}  // namespace config

// ============================================================================
// 配置项宏定义
// ============================================================================

#define CONFIG_ITEM(name, defaultValue, ...)                                                \
private:                                                                                    \
    using T##name = ::invlens::config::ValueType<std::decay_t<decltype(defaultValue)>>;     \
    using R##name = ::invlens::config::ReturnType<T##name>;                                 \
public:                                                                                     \
    R##name name() const { return name##_.value(); }                                        \
    bool set_##name(R##name value) { return name##_.checkAndSet(value); }                   \
private:                                                                                    \
    ::invlens::config::Item<T##name> name##_ = ::invlens::config::Item<T##name>(            \
        [this] {                                                                            \
            using Self = std::decay_t<decltype(*this)>;                                     \
            ConfigBase<Self>::items_[#name] =                                               \
                reinterpret_cast<::invlens::config::IItem Self::*>(&Self::name##_);         \
            return std::string(#name);                                                      \
        }(), defaultValue __VA_OPT__(, ) __VA_ARGS__)

#define CONFIG_OBJ(name, cls)                                                               \
public:                                                                                     \
    cls& name() { return name##_; }                                                         \
    const cls& name() const { return name##_; }                                             \
private:                                                                                    \
    cls name##_ = [this]() -> cls {                                                         \
        using Self = std::decay_t<decltype(*this)>;                                         \
        ConfigBase<Self>::sections_[#name] =                                                \
            reinterpret_cast<::invlens::config::IConfig Self::*>(&Self::name##_);           \
        return cls{};                                                                       \
    }()

// ============================================================================
// 常用 Checker 函数
// ============================================================================

namespace config::checkers {

template <typename T>
bool checkPositive(T val) { return val > 0; }

template <typename T>
bool checkNotNegative(T val) { return val >= 0; }

template <typename T, T Min, T Max>
bool checkRange(T val) { return val >= Min && val <= Max; }

}  // namespace config::checkers

}  // namespace invlens
