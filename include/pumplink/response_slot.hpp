#pragma once
/**
 * @file response_slot.hpp
 * @brief One-shot hand-off of a value from the dispatch thread to a waiting caller.
 *
 * The first set() wins; later ones are ignored. cancel() wakes the waiter without a value.
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace pumplink {

template <typename T>
class ResponseSlot {
public:
    ResponseSlot() = default;
    ResponseSlot(const ResponseSlot&) = delete;
    ResponseSlot& operator=(const ResponseSlot&) = delete;

    /// Store @p value unless a value is already present or the slot was cancelled.
    bool set(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value_ || cancelled_) return false;
        value_ = std::move(value);
        cv_.notify_all();
        return true;
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        cv_.notify_all();
    }

    /// Block until a value arrives, the slot is cancelled, or @p timeout_ms elapses.
    std::optional<T> wait_for(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0),
                     [this] { return value_.has_value() || cancelled_; });
        return value_;
    }

    std::optional<T> try_get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    bool has_value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::optional<T>        value_;
    bool                    cancelled_{false};
};

} // namespace pumplink
