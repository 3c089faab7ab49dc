#pragma once

#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <mutex>

namespace reliant {

    /// One-shot signal: fired once, observed by any number of waiters
    /// Used as the per-transaction cancellation channel and as the task exit latch
    class Signal {
      private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool fired_;

      public:
        Signal() : fired_(false) {}

        Signal(const Signal &) = delete;
        Signal &operator=(const Signal &) = delete;

        void fire() {
            std::lock_guard<std::mutex> lock(mutex_);
            fired_ = true;
            cv_.notify_all();
        }

        bool is_set() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return fired_;
        }

        /// Returns true if the signal fired before the timeout
        bool wait_for(dp::u32 timeout_ms) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return fired_; });
        }

        void wait() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return fired_; });
        }
    };

} // namespace reliant
