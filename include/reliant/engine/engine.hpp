#pragma once

#include <functional>
#include <reliant/coap/codec.hpp>
#include <reliant/engine/layers.hpp>
#include <reliant/engine/state.hpp>
#include <reliant/transport.hpp>
#include <thread>

namespace reliant {

    /// Reliable delivery of CoAP messages over one point-to-point datagram transport
    ///
    /// - send() registers a transaction, writes the datagram and, for confirmable messages, starts a
    ///   retransmission thread that retries with exponential backoff until ACK/RST or max_retransmit
    /// - one receiver thread, started by the first send that expects an answer, routes inbound
    ///   datagrams to their transactions and invokes the response callback
    /// - the callback receives std::nullopt when a confirmable message ran out of retransmissions, or
    ///   when an exchange with no retransmission task outlived its lifetime without a response
    /// - an RST is reported through the reject callback, never the response callback
    ///
    /// Callbacks and I/O policies run on engine threads and must not call close().
    template <typename Transport> class Engine {
        static_assert(is_transport<Transport>::value, "Transport does not satisfy the transport contract");

      public:
        using Peer = typename Transport::Peer;
        using ResponseCallback = std::function<void(const std::optional<coap::Message> &)>;
        using RejectCallback = std::function<void(const coap::Message &request)>;
        using IoPolicy = std::function<IoDecision(const dp::Error &, Engine &)>;

        struct Options {
            coap::TransmissionParams params;
            std::optional<dp::u16> starting_mid; // random when absent
            ResponseCallback callback;
            RejectCallback reject_callback;
            IoPolicy read_policy;  // absent: a read error stops the receiver
            IoPolicy write_policy; // absent: a write error is returned to the caller
            std::shared_ptr<BlockLayer> block_layer;
            std::shared_ptr<ObserveLayer> observe_layer;
        };

      private:
        std::unique_ptr<Transport> transport_;
        Peer peer_;
        Options options_;
        EngineState state_;

        // Transports are not required to support concurrent writers
        std::mutex send_mutex_;

        std::mutex lifecycle_mutex_;
        std::thread receiver_thread_;
        bool opened_;
        bool receiver_started_;
        bool closed_;
        std::atomic<bool> receiver_running_;

        static constexpr dp::usize TOKEN_LENGTH = 4;

        // ---------------------------------------------------------------- outbound

        dp::Res<void> locked_send(const Buffer &bytes) {
            std::lock_guard<std::mutex> lock(send_mutex_);
            return transport_->send_to(bytes, peer_);
        }

        /// Write through the transport, applying the write policy on failure
        dp::Res<void> write(const Buffer &bytes) {
            auto res = locked_send(bytes);
            if (res.is_ok()) {
                return res;
            }

            state_.metrics.write_errors++;
            echo::warn("write to ", peer_.to_string(), " failed: ", res.error().message.c_str());
            if (options_.write_policy && options_.write_policy(res.error(), *this) == IoDecision::Continue) {
                echo::debug("write error ignored by policy");
                return dp::result::ok();
            }
            return res;
        }

        dp::Res<void> send_datagram(const Buffer &bytes, const coap::Message &message) {
            auto res = write(bytes);
            if (res.is_err()) {
                return res;
            }
            state_.metrics.datagrams_sent++;

            // RFC 7967: nothing will come back, so nothing to listen for
            if (message.suppresses_all_responses()) {
                echo::debug("no response wanted for mid=", *message.mid);
                return dp::result::ok();
            }

            start_receiver();
            return dp::result::ok();
        }

        Buffer fresh_token() {
            for (dp::usize attempt = 0; attempt < 8; attempt++) {
                Buffer token = state_.random_token(TOKEN_LENGTH);
                if (!state_.transactions.contains_token(token)) {
                    return token;
                }
            }
            return state_.random_token(coap::MAX_TOKEN_LENGTH);
        }

        dp::Res<dp::u16> send_request(coap::Message request) {
            request = options_.observe_layer->send_request(std::move(request));
            request = options_.block_layer->send_request(std::move(request));

            if (!request.mid.has_value()) {
                auto mid_res = state_.allocate_mid();
                if (mid_res.is_err()) {
                    return dp::result::err(mid_res.error());
                }
                request.mid = mid_res.value();
            }
            if (request.token.empty()) {
                request.token = fresh_token();
            }
            request.acknowledged = false;
            request.rejected = false;
            request.timed_out = false;

            auto encode_res = coap::encode(request);
            if (encode_res.is_err()) {
                return dp::result::err(encode_res.error());
            }
            Buffer bytes = std::move(encode_res.value());

            dp::u16 mid = *request.mid;
            bool confirmable = request.type == coap::MessageType::Confirmable;
            bool silent = !confirmable && request.suppresses_all_responses();
            echo::debug("send ", request.line().c_str());

            auto transaction = std::make_shared<Transaction>(std::move(request));
            if (!confirmable) {
                transaction->expires_at_ms = steady_now_ms() + options_.params.non_lifetime_ms;
            }
            auto register_res = state_.transactions.register_transaction(transaction);
            if (register_res.is_err()) {
                return dp::result::err(register_res.error());
            }

            auto send_res = send_datagram(bytes, transaction->request);
            if (send_res.is_err()) {
                state_.transactions.remove(transaction);
                return dp::result::err(send_res.error());
            }

            if (silent) {
                state_.transactions.remove(transaction);
            }
            if (confirmable) {
                auto arm_res = start_retransmission(transaction, std::move(bytes));
                if (arm_res.is_err()) {
                    return dp::result::err(arm_res.error());
                }
            }
            return dp::result::ok(mid);
        }

        dp::Res<dp::u16> send_empty(coap::Message message) {
            message = options_.observe_layer->send_empty(std::move(message));
            if (!message.mid.has_value()) {
                auto mid_res = state_.allocate_mid();
                if (mid_res.is_err()) {
                    return dp::result::err(mid_res.error());
                }
                message.mid = mid_res.value();
            }

            auto encode_res = coap::encode(message);
            if (encode_res.is_err()) {
                return dp::result::err(encode_res.error());
            }

            echo::debug("send ", message.line().c_str());
            auto send_res = send_datagram(encode_res.value(), message);
            if (send_res.is_err()) {
                return dp::result::err(send_res.error());
            }
            return dp::result::ok(*message.mid);
        }

        void reply_empty(coap::MessageType type, dp::u16 mid) {
            auto encode_res = coap::encode(coap::make_empty(type, mid));
            if (encode_res.is_err()) {
                return;
            }
            echo::trace("reply ", coap::to_string(type), " mid=", mid);
            auto res = write(encode_res.value());
            if (res.is_err()) {
                echo::warn("could not send ", coap::to_string(type), " for mid=", mid);
                return;
            }
            state_.metrics.datagrams_sent++;
        }

        // ---------------------------------------------------------------- retransmission

        dp::Res<void> start_retransmission(const std::shared_ptr<Transaction> &transaction, Buffer bytes) {
            bool closed = false;
            {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                closed = closed_;
                if (!closed) {
                    state_.thread_started();
                }
            }
            if (closed) {
                // close() began while this message was being written
                {
                    std::lock_guard<std::mutex> lock(transaction->mutex);
                    transaction->request.timed_out = true;
                }
                state_.transactions.remove(transaction);
                echo::debug("mid=", *transaction->request.mid, " abandoned, engine closed during send");
                return dp::result::err(dp::Error::io_error("engine stopped"));
            }

            std::shared_ptr<RetransmitTask> task;
            dp::u32 backoff_ms = 0;
            {
                std::lock_guard<std::mutex> lock(transaction->mutex);
                if (transaction->request.acknowledged || transaction->request.rejected || transaction->retransmit) {
                    echo::trace("mid=", *transaction->request.mid, " resolved before retransmission armed");
                    state_.thread_finished();
                    return dp::result::ok();
                }
                backoff_ms = state_.draw_backoff(options_.params);
                task = std::make_shared<RetransmitTask>(*transaction->request.mid);
                transaction->retransmit = task;
                state_.track(task);
            }

            // close() may have fired the live set before this task joined it
            if (state_.stopped) {
                task->stop.fire();
            }

            std::thread(&Engine::retransmit_loop, this, transaction, task, std::move(bytes), backoff_ms).detach();
            return dp::result::ok();
        }

        void retransmit_loop(std::shared_ptr<Transaction> transaction, std::shared_ptr<RetransmitTask> task,
                             Buffer bytes, dp::u32 backoff_ms) {
            const dp::u16 mid = task->mid;
            const dp::u32 max_retransmit = options_.params.max_retransmit;
            dp::u32 retransmits = 0;
            echo::debug("retransmit loop enter mid=", mid, " backoff=", backoff_ms, "ms");

            std::unique_lock<std::mutex> lock(transaction->mutex);
            auto &request = transaction->request;
            while (!request.acknowledged && !request.rejected && !task->stop.is_set()) {
                lock.unlock();
                task->stop.wait_for(backoff_ms);
                lock.lock();

                if (request.acknowledged || request.rejected || task->stop.is_set()) {
                    break;
                }
                if (retransmits >= max_retransmit) {
                    break;
                }

                retransmits++;
                backoff_ms *= 2;
                echo::debug("retransmit mid=", mid, " attempt ", retransmits, "/", max_retransmit);

                // The write policy may call back into the engine
                lock.unlock();
                auto res = write(bytes);
                lock.lock();
                if (res.is_err()) {
                    echo::error("retransmit mid=", mid, " failed: ", res.error().message.c_str());
                    break;
                }
                state_.metrics.retransmissions++;
            }

            const bool delivered = request.acknowledged || request.rejected;
            request.timed_out = !delivered;
            transaction->retransmit.reset();
            state_.untrack(task);
            dp::String summary = request.line();
            lock.unlock();

            if (!delivered) {
                if (task->stop.is_set()) {
                    echo::debug("abandoning ", summary.c_str(), " on shutdown");
                } else {
                    echo::warn("giving up on ", summary.c_str(), " after ", retransmits, " retransmissions");
                }
                state_.metrics.delivery_timeouts++;
                state_.transactions.remove(transaction);
                if (options_.callback) {
                    options_.callback(std::nullopt);
                }
            }

            task->exited.fire();
            echo::debug("retransmit loop exit mid=", mid);
            state_.thread_finished();
        }

        /// Cancel a transaction's retransmission and wait until its thread is done with it
        void cancel_retransmission(const std::shared_ptr<RetransmitTask> &task) {
            if (!task) {
                return;
            }
            task->stop.fire();
            task->exited.wait();
        }

        // ---------------------------------------------------------------- inbound

        void start_receiver() {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (receiver_started_ || closed_ || state_.stopped) {
                return;
            }
            receiver_started_ = true;
            receiver_running_ = true;
            receiver_thread_ = std::thread(&Engine::receiver_loop, this);
        }

        /// Drop exchanges without a retransmission task whose lifetime ran out
        void expire_exchanges() {
            const dp::i64 now = steady_now_ms();
            for (const auto &transaction : state_.transactions.expired(now)) {
                dp::String summary;
                {
                    std::lock_guard<std::mutex> lock(transaction->mutex);
                    auto &request = transaction->request;
                    dp::i64 deadline = transaction->expires_at_ms;
                    if (deadline == 0 || deadline > now || request.timed_out || request.rejected) {
                        continue;
                    }
                    request.timed_out = true;
                    transaction->expires_at_ms = 0;
                    summary = request.line();
                }

                state_.transactions.remove(transaction);
                state_.metrics.expired++;
                echo::debug("no response to ", summary.c_str(), " within its lifetime");
                if (options_.callback) {
                    options_.callback(std::nullopt);
                }
            }
        }

        void receiver_loop() {
            echo::debug("receiver thread started");

            dp::i64 next_sweep = steady_now_ms();
            while (!state_.stopped) {
                if (steady_now_ms() >= next_sweep) {
                    expire_exchanges();
                    next_sweep = steady_now_ms() + options_.params.receive_timeout_ms;
                }

                auto recv_res = transport_->receive(options_.params.receive_timeout_ms);
                if (recv_res.is_err()) {
                    // Timeout is expected - just continue to check the stop flag
                    if (is_timeout(recv_res.error())) {
                        continue;
                    }

                    state_.metrics.read_errors++;
                    if (options_.read_policy && options_.read_policy(recv_res.error(), *this) == IoDecision::Continue) {
                        echo::debug("read error ignored by policy: ", recv_res.error().message.c_str());
                        continue;
                    }
                    if (!state_.stopped) {
                        echo::error("receive failed, stopping engine: ", recv_res.error().message.c_str());
                    }
                    stop();
                    break;
                }

                state_.metrics.datagrams_received++;
                auto decode_res = coap::decode(recv_res.value());
                if (decode_res.is_err()) {
                    state_.metrics.decode_errors++;
                    echo::warn("discarding malformed datagram: ", decode_res.error().message.c_str());
                    continue;
                }

                handle_message(std::move(decode_res.value()));
            }

            receiver_running_ = false;
            echo::debug("receiver thread stopped");
        }

        void handle_message(coap::Message message) {
            if (message.is_response()) {
                handle_response(std::move(message));
            } else if (message.is_empty()) {
                handle_empty(message);
            } else {
                // A client serves no resources
                state_.metrics.discarded++;
                echo::debug("ignoring inbound request ", message.line().c_str());
                if (message.type == coap::MessageType::Confirmable) {
                    reply_empty(coap::MessageType::Reset, *message.mid);
                }
            }
        }

        void handle_response(coap::Message response) {
            const dp::u16 mid = *response.mid;
            const bool piggybacked = response.type == coap::MessageType::Acknowledgement;

            // Piggybacked responses share the request's MID; separate responses only share the token
            auto transaction = piggybacked ? state_.transactions.lookup_by_mid(mid)
                                           : state_.transactions.lookup_by_token(response.token);
            if (!transaction) {
                state_.metrics.discarded++;
                echo::warn("unmatched response ", response.line().c_str());
                if (response.type == coap::MessageType::Confirmable) {
                    reply_empty(coap::MessageType::Reset, mid);
                }
                return;
            }

            std::shared_ptr<RetransmitTask> task;
            dp::u16 request_mid = 0;
            bool duplicate = false;
            {
                std::lock_guard<std::mutex> lock(transaction->mutex);
                auto &request = transaction->request;
                if (request.timed_out) {
                    state_.metrics.discarded++;
                    echo::debug("late response for abandoned mid=", *request.mid);
                    return;
                }
                if (!same_bytes(request.token, response.token)) {
                    state_.metrics.discarded++;
                    echo::warn("token mismatch for mid=", mid, ", discarding");
                    return;
                }
                if (!piggybacked && transaction->response.has_value() && transaction->response->mid == response.mid) {
                    duplicate = true;
                } else {
                    if (!request.acknowledged) {
                        request.acknowledged = true;
                        state_.metrics.acknowledged++;
                    }
                    request_mid = *request.mid;
                    transaction->response = response;
                    transaction->expires_at_ms = 0;
                    task = transaction->retransmit;
                }
            }

            if (duplicate) {
                echo::debug("duplicate ", response.line().c_str());
                if (response.type == coap::MessageType::Confirmable) {
                    reply_empty(coap::MessageType::Acknowledgement, mid);
                }
                return;
            }

            // No retransmission may race past a resolved exchange
            cancel_retransmission(task);

            if (response.type == coap::MessageType::Confirmable) {
                reply_empty(coap::MessageType::Acknowledgement, mid);
            }

            bool another_block = false;
            bool subscription = false;
            coap::Message next_request;
            {
                std::lock_guard<std::mutex> lock(transaction->mutex);
                options_.block_layer->receive_response(*transaction);
                another_block = transaction->block_transfer;
                if (another_block) {
                    next_request = transaction->request;
                } else {
                    options_.observe_layer->receive_response(*transaction);
                    subscription = transaction->notification;
                }
            }

            if (another_block) {
                continue_block_transfer(transaction, std::move(next_request));
                return;
            }

            if (subscription) {
                // Notifications keep arriving under the token
                state_.transactions.remove(request_mid);
                state_.metrics.notifications++;
            } else {
                state_.transactions.remove(transaction);
                state_.metrics.responses++;
            }

            echo::debug("response ", response.line().c_str(), " for mid=", request_mid);
            if (options_.callback) {
                options_.callback(response);
            }
        }

        void continue_block_transfer(const std::shared_ptr<Transaction> &transaction, coap::Message next) {
            state_.transactions.remove(transaction);

            next.mid.reset();
            echo::debug("block transfer continues for token=", to_hex(next.token).c_str());
            auto res = send_request(std::move(next));
            if (res.is_err()) {
                echo::error("block transfer continuation failed: ", res.error().message.c_str());
                if (options_.callback) {
                    options_.callback(std::nullopt);
                }
            }
        }

        void handle_empty(const coap::Message &message) {
            const dp::u16 mid = *message.mid;

            if (message.type == coap::MessageType::Confirmable) {
                // CoAP ping
                echo::debug("ping mid=", mid);
                reply_empty(coap::MessageType::Reset, mid);
                return;
            }
            if (message.type == coap::MessageType::NonConfirmable) {
                state_.metrics.discarded++;
                return;
            }

            auto transaction = state_.transactions.lookup_by_mid(mid);
            if (!transaction) {
                state_.metrics.discarded++;
                echo::debug("unmatched ", message.line().c_str());
                return;
            }

            const bool reset = message.type == coap::MessageType::Reset;
            std::shared_ptr<RetransmitTask> task;
            coap::Message request_copy;
            {
                std::lock_guard<std::mutex> lock(transaction->mutex);
                auto &request = transaction->request;
                if (request.timed_out) {
                    state_.metrics.discarded++;
                    return;
                }
                if (reset) {
                    if (!request.rejected) {
                        request.rejected = true;
                        state_.metrics.rejected++;
                    }
                    transaction->expires_at_ms = 0;
                    request_copy = request;
                } else {
                    if (!request.acknowledged) {
                        request.acknowledged = true;
                        state_.metrics.acknowledged++;
                    }
                    if (!transaction->response.has_value()) {
                        transaction->expires_at_ms = steady_now_ms() + options_.params.exchange_lifetime_ms;
                    }
                }
                task = transaction->retransmit;
            }

            cancel_retransmission(task);

            if (reset) {
                echo::debug("mid=", mid, " rejected by peer");
                state_.transactions.remove(transaction);
                if (options_.reject_callback) {
                    options_.reject_callback(request_copy);
                }
            } else {
                echo::debug("mid=", mid, " acknowledged, waiting for separate response");
            }
        }

        /// Stop receiving and unblock every retransmission wait
        void stop() {
            state_.stopped = true;
            state_.fire_all();
        }

      public:
        Engine(std::unique_ptr<Transport> transport, Peer peer) : Engine(std::move(transport), peer, Options()) {}

        Engine(std::unique_ptr<Transport> transport, Peer peer, Options options)
            : transport_(std::move(transport)), peer_(peer), options_(std::move(options)), opened_(false),
              receiver_started_(false), closed_(false), receiver_running_(false) {
            if (!options_.block_layer) {
                options_.block_layer = std::make_shared<BlockLayer>();
            }
            if (!options_.observe_layer) {
                options_.observe_layer = std::make_shared<ObserveLayer>();
            }
            if (options_.starting_mid.has_value()) {
                state_.set_current_mid(*options_.starting_mid);
            }
            echo::trace("Engine constructed, peer=", peer_.to_string(), " starting mid=", state_.current_mid());
        }

        ~Engine() { close(); }

        Engine(const Engine &) = delete;
        Engine &operator=(const Engine &) = delete;

        /// Acquire the transport
        dp::Res<void> open() {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (closed_) {
                return dp::result::err(dp::Error::io_error("engine closed"));
            }
            if (opened_) {
                return dp::result::ok();
            }

            auto res = transport_->open();
            if (res.is_err()) {
                echo::error("transport unavailable: ", res.error().message.c_str());
                return res;
            }

            opened_ = true;
            echo::info("engine open, peer ", peer_.to_string());
            return dp::result::ok();
        }

        /// Send a request or an empty message; returns the MID it went out with
        dp::Res<dp::u16> send(coap::Message message) {
            {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (!opened_) {
                    echo::error("send called but engine not open");
                    return dp::result::err(dp::Error::invalid_argument("engine not open"));
                }
            }
            if (state_.stopped) {
                echo::error("send called but engine stopped");
                return dp::result::err(dp::Error::io_error("engine stopped"));
            }

            if (message.is_request()) {
                return send_request(std::move(message));
            }
            if (message.is_empty()) {
                return send_empty(std::move(message));
            }

            echo::error("send: a client does not originate responses");
            return dp::result::err(dp::Error::invalid_argument("cannot send a response"));
        }

        /// Stop everything and release the transport; idempotent
        void close() {
            {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                if (closed_) {
                    echo::trace("engine already closed");
                    return;
                }
                closed_ = true;
            }

            echo::debug("engine closing, ", state_.live_task_count(), " retransmissions in flight");
            stop();

            if (receiver_thread_.joinable()) {
                receiver_thread_.join();
            }
            state_.wait_threads_finished();

            transport_->close();
            state_.transactions.clear();
            echo::info("engine closed");
        }

        /// Stop delivering notifications for a subscription
        bool cancel_observing(const Buffer &token) {
            auto transaction = state_.transactions.lookup_by_token(token);
            if (!transaction) {
                echo::warn("cancel_observing: unknown token ", to_hex(token).c_str());
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(transaction->mutex);
                transaction->notification = false;
            }
            state_.transactions.remove(transaction);
            echo::debug("subscription ", to_hex(token).c_str(), " cancelled");
            return true;
        }

        dp::u16 current_mid() const { return state_.current_mid(); }

        dp::Res<void> set_current_mid(dp::u32 mid) {
            if (mid > 0xFFFF) {
                echo::error("mid out of range: ", mid);
                return dp::result::err(dp::Error::invalid_argument("mid must fit in 16 bits"));
            }
            state_.set_current_mid(static_cast<dp::u16>(mid));
            return dp::result::ok();
        }

        /// Live MID entries in the transaction table
        dp::usize pending_count() const { return state_.transactions.size(); }

        dp::usize live_task_count() const { return state_.live_task_count(); }

        bool receiver_running() const { return receiver_running_; }

        bool is_stopped() const { return state_.stopped; }

        const TransactionTable &transactions() const { return state_.transactions; }

        const DeliveryMetrics &metrics() const { return state_.metrics; }

        const coap::TransmissionParams &params() const { return options_.params; }

        Transport &transport() { return *transport_; }

        const Peer &peer() const { return peer_; }
    };

} // namespace reliant
