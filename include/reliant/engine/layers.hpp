#pragma once

#include <reliant/engine/transaction.hpp>

namespace reliant {

    /// Block-wise transfer collaborator
    /// The defaults pass everything through unchanged; a segmenting implementation overrides them
    class BlockLayer {
      public:
        virtual ~BlockLayer() = default;

        /// Consulted on every outbound request before it is registered
        virtual coap::Message send_request(coap::Message request) { return request; }

        /// Consulted on every inbound response, called with transaction.mutex held
        /// Set transaction.block_transfer and rewrite transaction.request to ask for another round
        virtual void receive_response(Transaction &transaction) { transaction.block_transfer = false; }
    };

    /// Observe collaborator
    /// The default only flags subscriptions; it does not re-register or reorder notifications
    class ObserveLayer {
      public:
        virtual ~ObserveLayer() = default;

        virtual coap::Message send_request(coap::Message request) { return request; }

        virtual coap::Message send_empty(coap::Message message) { return message; }

        /// Called with transaction.mutex held
        /// A registration (Observe = 0) answered with a success carrying Observe is a live subscription
        virtual void receive_response(Transaction &transaction) {
            if (!transaction.response.has_value()) {
                transaction.notification = false;
                return;
            }

            auto registration = transaction.request.observe();
            const auto &response = *transaction.response;
            transaction.notification = registration.has_value() && *registration == coap::OBSERVE_REGISTER &&
                                       coap::is_success(response) && response.observe().has_value();
        }
    };

} // namespace reliant
