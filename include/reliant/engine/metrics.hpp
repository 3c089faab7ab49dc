#pragma once

#include <atomic>
#include <datapod/datapod.hpp>

namespace reliant {

    /// Counters for the delivery engine
    struct DeliveryMetrics {
        // Outbound
        std::atomic<dp::u64> datagrams_sent{0};
        std::atomic<dp::u64> retransmissions{0};
        std::atomic<dp::u64> write_errors{0};

        // Outcomes
        std::atomic<dp::u64> acknowledged{0};
        std::atomic<dp::u64> rejected{0};
        std::atomic<dp::u64> delivery_timeouts{0};
        std::atomic<dp::u64> expired{0}; // exchanges whose lifetime ran out without a response
        std::atomic<dp::u64> responses{0};
        std::atomic<dp::u64> notifications{0};

        // Inbound
        std::atomic<dp::u64> datagrams_received{0};
        std::atomic<dp::u64> decode_errors{0};
        std::atomic<dp::u64> discarded{0};
        std::atomic<dp::u64> read_errors{0};

        /// Reset all metrics to zero
        inline void reset() {
            datagrams_sent = 0;
            retransmissions = 0;
            write_errors = 0;
            acknowledged = 0;
            rejected = 0;
            delivery_timeouts = 0;
            expired = 0;
            responses = 0;
            notifications = 0;
            datagrams_received = 0;
            decode_errors = 0;
            discarded = 0;
            read_errors = 0;
        }

        /// Share of resolved confirmable exchanges that ran out of retransmissions (0.0 to 1.0)
        inline double timeout_rate() const {
            dp::u64 resolved = acknowledged.load() + rejected.load() + delivery_timeouts.load();
            if (resolved == 0)
                return 0.0;
            return static_cast<double>(delivery_timeouts.load()) / static_cast<double>(resolved);
        }

        /// Retransmissions per original datagram
        inline double retransmission_ratio() const {
            dp::u64 sent = datagrams_sent.load();
            if (sent == 0)
                return 0.0;
            return static_cast<double>(retransmissions.load()) / static_cast<double>(sent);
        }
    };

} // namespace reliant
