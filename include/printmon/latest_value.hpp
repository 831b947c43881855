#pragma once

#include <mutex>
#include <optional>
#include <utility>

namespace printmon {

// Single-slot exchange: each put() replaces whatever was there, readers always
// see the newest value. One writer, one or more readers.
template <typename T>
class LatestValue {
public:
    void put(T item) {
        std::lock_guard<std::mutex> lock(mu_);
        slot_ = std::move(item);
    }

    std::optional<T> peek() const {
        std::lock_guard<std::mutex> lock(mu_);
        return slot_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mu_);
        slot_.reset();
    }

private:
    mutable std::mutex mu_;
    std::optional<T> slot_;
};

}  // namespace printmon
