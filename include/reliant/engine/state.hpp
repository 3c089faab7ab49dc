#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <list>
#include <random>
#include <reliant/coap/defines.hpp>
#include <reliant/engine/metrics.hpp>
#include <reliant/engine/transaction.hpp>

namespace reliant {

    /// Session state owned by one engine and shared by reference with its receiver loop
    /// and retransmission tasks
    class EngineState {
      private:
        // MID counter - wraps modulo 2^16
        mutable std::mutex mid_mutex_;
        dp::u16 current_mid_;

        // Stop signals of every live retransmission task
        mutable std::mutex tasks_mutex_;
        std::list<std::shared_ptr<RetransmitTask>> live_tasks_;

        // Retransmission threads that have not returned yet
        std::mutex threads_mutex_;
        std::condition_variable threads_cv_;
        dp::usize running_threads_;

        std::mutex rng_mutex_;
        std::mt19937 rng_;

      public:
        TransactionTable transactions;
        DeliveryMetrics metrics;
        std::atomic<bool> stopped;

        EngineState() : current_mid_(0), running_threads_(0), rng_(std::random_device{}()), stopped(false) {
            std::uniform_int_distribution<dp::u32> first(1, 0xFFFF);
            current_mid_ = static_cast<dp::u16>(first(rng_));
        }

        EngineState(const EngineState &) = delete;
        EngineState &operator=(const EngineState &) = delete;

        dp::u16 current_mid() const {
            std::lock_guard<std::mutex> lock(mid_mutex_);
            return current_mid_;
        }

        void set_current_mid(dp::u16 mid) {
            std::lock_guard<std::mutex> lock(mid_mutex_);
            current_mid_ = mid;
        }

        /// Next MID not held by a live transaction
        dp::Res<dp::u16> allocate_mid() {
            std::lock_guard<std::mutex> lock(mid_mutex_);
            for (dp::u32 attempt = 0; attempt <= 0xFFFF; attempt++) {
                dp::u16 mid = current_mid_;
                current_mid_ = static_cast<dp::u16>(current_mid_ + 1);
                if (!transactions.contains_mid(mid)) {
                    return dp::result::ok(mid);
                }
                echo::trace("mid ", mid, " still in flight, skipping");
            }
            echo::error("every mid is in flight");
            return dp::result::err(dp::Error::io_error("mid space exhausted"));
        }

        void track(const std::shared_ptr<RetransmitTask> &task) {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            live_tasks_.push_back(task);
        }

        /// Best effort: absence is not an error
        void untrack(const std::shared_ptr<RetransmitTask> &task) {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            live_tasks_.remove(task);
        }

        /// Unblock every in-flight retransmission wait
        void fire_all() {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            for (auto &task : live_tasks_) {
                task->stop.fire();
            }
            echo::trace("fired ", live_tasks_.size(), " retransmission stop signals");
        }

        dp::usize live_task_count() const {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            return live_tasks_.size();
        }

        void thread_started() {
            std::lock_guard<std::mutex> lock(threads_mutex_);
            running_threads_++;
        }

        /// Last thing a retransmission thread does before returning
        void thread_finished() {
            std::lock_guard<std::mutex> lock(threads_mutex_);
            running_threads_--;
            threads_cv_.notify_all();
        }

        void wait_threads_finished() {
            std::unique_lock<std::mutex> lock(threads_mutex_);
            threads_cv_.wait(lock, [this] { return running_threads_ == 0; });
        }

        /// Initial backoff: uniform in [ack_timeout, ack_timeout * ack_random_factor]
        dp::u32 draw_backoff(const coap::TransmissionParams &params) {
            double low = static_cast<double>(params.ack_timeout_ms);
            double high = low * std::max(params.ack_random_factor, 1.0);
            std::lock_guard<std::mutex> lock(rng_mutex_);
            std::uniform_real_distribution<double> dist(low, high);
            return static_cast<dp::u32>(high > low ? dist(rng_) : low);
        }

        Buffer random_token(dp::usize length) {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            std::uniform_int_distribution<dp::u32> byte(0, 255);
            Buffer token(length);
            for (dp::usize i = 0; i < length; i++) {
                token[i] = static_cast<dp::u8>(byte(rng_));
            }
            return token;
        }
    };

} // namespace reliant
