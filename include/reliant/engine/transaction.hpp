#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <reliant/coap/message.hpp>
#include <reliant/engine/signal.hpp>
#include <string>
#include <vector>

namespace reliant {

    inline dp::i64 steady_now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
            .count();
    }

    /// Handle to the retransmission task of one confirmable message
    struct RetransmitTask {
        dp::u16 mid;
        Signal stop;   // fired to cancel the task
        Signal exited; // fired by the task once its cleanup is done

        explicit RetransmitTask(dp::u16 m) : mid(m) {}
    };

    /// Binds one outbound message to its eventual response
    /// Every mutable field is guarded by mutex
    struct Transaction {
        std::mutex mutex;
        coap::Message request;
        std::optional<coap::Message> response;
        std::shared_ptr<RetransmitTask> retransmit; // set while a retransmission task runs

        bool block_transfer; // block collaborator wants another round
        bool notification;   // active observe subscription

        // steady_now_ms() deadline for an exchange no retransmission task watches; 0 when none
        std::atomic<dp::i64> expires_at_ms;

        explicit Transaction(coap::Message req)
            : request(std::move(req)), block_transfer(false), notification(false), expires_at_ms(0) {}
    };

    inline std::string token_key(const Buffer &token) {
        return std::string(reinterpret_cast<const char *>(token.data()), token.size());
    }

    /// MID -> Transaction and token -> Transaction
    /// Keys are unique; all operations are internally synchronized
    class TransactionTable {
      private:
        std::map<dp::u16, std::shared_ptr<Transaction>> by_mid_;
        std::map<std::string, std::shared_ptr<Transaction>> by_token_;
        mutable std::mutex mutex_;

      public:
        TransactionTable() { echo::trace("TransactionTable constructed"); }

        /// Insert under the request's MID and, when present, its token
        /// Fails without inserting anything if either key is live
        dp::Res<void> register_transaction(const std::shared_ptr<Transaction> &transaction) {
            const auto &request = transaction->request;
            if (!request.mid.has_value()) {
                echo::error("register_transaction: request has no mid");
                return dp::result::err(dp::Error::invalid_argument("request has no mid"));
            }

            dp::u16 mid = *request.mid;
            std::lock_guard<std::mutex> lock(mutex_);
            if (by_mid_.find(mid) != by_mid_.end()) {
                echo::error("mid already in flight: ", mid);
                return dp::result::err(dp::Error::invalid_argument("duplicate mid"));
            }
            if (!request.token.empty() && by_token_.find(token_key(request.token)) != by_token_.end()) {
                echo::error("token already in flight: ", to_hex(request.token).c_str());
                return dp::result::err(dp::Error::invalid_argument("duplicate token"));
            }

            by_mid_[mid] = transaction;
            if (!request.token.empty()) {
                by_token_[token_key(request.token)] = transaction;
            }
            echo::trace("registered transaction mid=", mid, " token=", to_hex(request.token).c_str());
            return dp::result::ok();
        }

        std::shared_ptr<Transaction> lookup_by_mid(dp::u16 mid) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = by_mid_.find(mid);
            if (it == by_mid_.end()) {
                return nullptr;
            }
            return it->second;
        }

        std::shared_ptr<Transaction> lookup_by_token(const Buffer &token) const {
            if (token.empty()) {
                return nullptr;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = by_token_.find(token_key(token));
            if (it == by_token_.end()) {
                return nullptr;
            }
            return it->second;
        }

        /// No-op if absent
        void remove(dp::u16 mid) {
            std::lock_guard<std::mutex> lock(mutex_);
            by_mid_.erase(mid);
        }

        void remove_token(const Buffer &token) {
            std::lock_guard<std::mutex> lock(mutex_);
            by_token_.erase(token_key(token));
        }

        /// Drop every key that still points at this transaction
        void remove(const std::shared_ptr<Transaction> &transaction) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = by_mid_.begin(); it != by_mid_.end();) {
                if (it->second == transaction) {
                    it = by_mid_.erase(it);
                } else {
                    ++it;
                }
            }
            for (auto it = by_token_.begin(); it != by_token_.end();) {
                if (it->second == transaction) {
                    it = by_token_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        /// Transactions whose deadline is at or before now_ms
        std::vector<std::shared_ptr<Transaction>> expired(dp::i64 now_ms) const {
            std::vector<std::shared_ptr<Transaction>> found;
            auto collect = [&](const std::shared_ptr<Transaction> &transaction) {
                dp::i64 deadline = transaction->expires_at_ms.load();
                if (deadline == 0 || deadline > now_ms) {
                    return;
                }
                if (std::find(found.begin(), found.end(), transaction) == found.end()) {
                    found.push_back(transaction);
                }
            };

            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &entry : by_mid_) {
                collect(entry.second);
            }
            for (const auto &entry : by_token_) {
                collect(entry.second);
            }
            return found;
        }

        bool contains_mid(dp::u16 mid) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return by_mid_.find(mid) != by_mid_.end();
        }

        bool contains_token(const Buffer &token) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return by_token_.find(token_key(token)) != by_token_.end();
        }

        /// Number of live MID entries
        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return by_mid_.size();
        }

        dp::usize token_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return by_token_.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            by_mid_.clear();
            by_token_.clear();
        }
    };

} // namespace reliant
