#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <reliant/engine/engine.hpp>

namespace reliant {

    /// Blocking request/response calls on top of Engine<T>
    ///
    /// One synchronous exchange runs at a time. Observe notifications are handed to the callback
    /// registered by observe(), on the engine's receiver thread.
    template <typename Transport> class Client {
      public:
        using Peer = typename Transport::Peer;
        using NotificationCallback = std::function<void(const coap::Message &)>;

        static constexpr dp::u32 DEFAULT_TIMEOUT_MS = 10000;

      private:
        std::unique_ptr<Engine<Transport>> engine_;

        // Serializes request()
        std::mutex call_mutex_;

        // What the engine reported for an exchange
        struct Outcome {
            enum class Kind : dp::u8 { Response, Failure, Rejected };

            Kind kind;
            std::optional<coap::Message> response; // Response only
            std::string token;                     // token_key of the request, Rejected only
        };

        std::mutex inbox_mutex_;
        std::condition_variable inbox_cv_;
        std::deque<Outcome> inbox_;
        std::string waiting_token_; // token of the exchange request() is blocked on

        std::mutex observers_mutex_;
        std::map<std::string, NotificationCallback> observers_;

        std::mutex rng_mutex_;
        std::mt19937 rng_;

        void on_response(const std::optional<coap::Message> &response) {
            if (response.has_value()) {
                std::string key = token_key(response->token);
                bool awaited;
                {
                    std::lock_guard<std::mutex> lock(inbox_mutex_);
                    awaited = !waiting_token_.empty() && key == waiting_token_;
                }

                if (!awaited) {
                    NotificationCallback callback;
                    {
                        std::lock_guard<std::mutex> lock(observers_mutex_);
                        auto it = observers_.find(key);
                        if (it != observers_.end()) {
                            callback = it->second;
                        }
                    }
                    if (callback) {
                        callback(*response);
                        return;
                    }
                }
            }

            Outcome outcome;
            outcome.kind = response.has_value() ? Outcome::Kind::Response : Outcome::Kind::Failure;
            outcome.response = response;

            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox_.push_back(std::move(outcome));
            inbox_cv_.notify_all();
        }

        void on_reject(const coap::Message &request) {
            Outcome outcome;
            outcome.kind = Outcome::Kind::Rejected;
            outcome.token = token_key(request.token);

            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox_.push_back(std::move(outcome));
            inbox_cv_.notify_all();
        }

        Buffer make_token() {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            std::uniform_int_distribution<dp::u32> byte(0, 255);
            Buffer token(4);
            for (auto &b : token) {
                b = static_cast<dp::u8>(byte(rng_));
            }
            return token;
        }

        // Pop the outcome of token's exchange, or a delivery failure that can only be ours
        dp::Res<coap::Message> await(const Buffer &token, dp::u32 timeout_ms) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            std::string key = token_key(token);

            std::unique_lock<std::mutex> lock(inbox_mutex_);
            while (true) {
                while (!inbox_.empty()) {
                    Outcome entry = std::move(inbox_.front());
                    inbox_.pop_front();

                    if (entry.kind == Outcome::Kind::Response) {
                        if (token_key(entry.response->token) == key) {
                            waiting_token_.clear();
                            return dp::result::ok(std::move(*entry.response));
                        }
                        echo::debug("client dropping stale response ", entry.response->line().c_str());
                        continue;
                    }

                    if (entry.kind == Outcome::Kind::Rejected) {
                        if (entry.token == key) {
                            waiting_token_.clear();
                            echo::warn("request with token ", to_hex(token).c_str(), " rejected by peer");
                            return dp::result::err(dp::Error::io_error("rejected"));
                        }
                        echo::debug("client dropping stale rejection");
                        continue;
                    }

                    // Failures carry no token: if our transaction is still live the failure was someone else's
                    if (!engine_->transactions().contains_token(token)) {
                        waiting_token_.clear();
                        return dp::result::err(dp::Error::timeout("no response"));
                    }
                    echo::debug("client dropping stale delivery failure");
                }

                if (inbox_cv_.wait_until(lock, deadline) == std::cv_status::timeout && inbox_.empty()) {
                    waiting_token_.clear();
                    echo::warn("no response for token ", to_hex(token).c_str(), " within ", timeout_ms, "ms");
                    return dp::result::err(dp::Error::timeout("no response"));
                }
            }
        }

      public:
        Client(std::unique_ptr<Transport> transport, Peer peer)
            : Client(std::move(transport), peer, coap::TransmissionParams()) {}

        Client(std::unique_ptr<Transport> transport, Peer peer, coap::TransmissionParams params)
            : rng_(std::random_device{}()) {
            typename Engine<Transport>::Options options;
            options.params = params;
            options.callback = [this](const std::optional<coap::Message> &response) { on_response(response); };
            options.reject_callback = [this](const coap::Message &request) { on_reject(request); };
            engine_ = std::make_unique<Engine<Transport>>(std::move(transport), peer, std::move(options));
        }

        ~Client() { close(); }

        Client(const Client &) = delete;
        Client &operator=(const Client &) = delete;

        dp::Res<void> open() { return engine_->open(); }

        void close() { engine_->close(); }

        /// Send a request and block until its response, a rejection, a delivery failure or timeout_ms
        dp::Res<coap::Message> request(coap::Message message, dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            std::lock_guard<std::mutex> call_lock(call_mutex_);

            if (message.token.empty()) {
                message.token = make_token();
            }
            Buffer token = message.token;
            {
                std::lock_guard<std::mutex> lock(inbox_mutex_);
                inbox_.clear();
                waiting_token_ = token_key(token);
            }

            auto send_res = engine_->send(std::move(message));
            if (send_res.is_err()) {
                std::lock_guard<std::mutex> lock(inbox_mutex_);
                waiting_token_.clear();
                return dp::result::err(send_res.error());
            }

            return await(token, timeout_ms);
        }

        dp::Res<coap::Message> get(const dp::String &path, dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            return request(coap::make_request(coap::codes::GET, path), timeout_ms);
        }

        dp::Res<coap::Message> post(const dp::String &path, const dp::String &payload,
                                    dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            auto message = coap::make_request(coap::codes::POST, path);
            message.set_payload(payload);
            return request(std::move(message), timeout_ms);
        }

        dp::Res<coap::Message> put(const dp::String &path, const dp::String &payload,
                                   dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            auto message = coap::make_request(coap::codes::PUT, path);
            message.set_payload(payload);
            return request(std::move(message), timeout_ms);
        }

        dp::Res<coap::Message> del(const dp::String &path, dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            return request(coap::make_request(coap::codes::DELETE, path), timeout_ms);
        }

        /// GET /.well-known/core
        dp::Res<coap::Message> discover(dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            return get(coap::WELL_KNOWN_CORE, timeout_ms);
        }

        /// Register for notifications on path
        /// Returns the first response; later notifications go to callback until cancel_observing(token)
        dp::Res<coap::Message> observe(const dp::String &path, NotificationCallback callback,
                                       dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS) {
            auto message = coap::make_request(coap::codes::GET, path);
            message.add_uint_option(coap::options::OBSERVE, coap::OBSERVE_REGISTER);
            message.token = make_token();
            Buffer token = message.token;

            {
                std::lock_guard<std::mutex> lock(observers_mutex_);
                observers_[token_key(token)] = std::move(callback);
            }

            auto res = request(std::move(message), timeout_ms);
            if (res.is_err() || !res.value().observe().has_value()) {
                std::lock_guard<std::mutex> lock(observers_mutex_);
                observers_.erase(token_key(token));
                if (res.is_ok()) {
                    echo::warn("server did not accept the observe registration for ", path.c_str());
                }
            }
            return res;
        }

        /// Stop routing notifications for token; the next confirmable one is answered with RST
        bool cancel_observing(const Buffer &token) {
            {
                std::lock_guard<std::mutex> lock(observers_mutex_);
                observers_.erase(token_key(token));
            }
            return engine_->cancel_observing(token);
        }

        dp::usize observer_count() {
            std::lock_guard<std::mutex> lock(observers_mutex_);
            return observers_.size();
        }

        Engine<Transport> &engine() { return *engine_; }
    };

} // namespace reliant
