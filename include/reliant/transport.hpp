#pragma once

#include <reliant/endpoint.hpp>

#include <type_traits>
#include <utility>

namespace reliant {

    // Transport contract consumed by Engine<T>
    //
    // Transports are interchangeable implementations, not a class hierarchy. A type T qualifies when it has:
    //
    //   using Peer = ...;                                          // remote address type
    //   dp::Res<void>   open();                                    // not_found when the link cannot be acquired
    //   dp::Res<void>   send_to(const Buffer &bytes, const Peer &); // best effort, io_error on failure
    //   dp::Res<Buffer> receive(dp::u32 timeout_ms);               // timeout error when nothing arrived
    //   void            close();                                   // idempotent
    //   bool            is_open() const;
    //
    // No ordering or delivery guarantee is expected from the transport.

    // Decision returned by the injected read/write error policies
    enum class IoDecision : dp::u8 {
        Continue = 0, // swallow the error and keep going
        Escalate = 1  // stop the receiver / report the error to the caller
    };

    inline const char *to_string(IoDecision decision) {
        switch (decision) {
        case IoDecision::Continue:
            return "continue";
        case IoDecision::Escalate:
            return "escalate";
        default:
            return "unknown";
        }
    }

    template <typename T, typename = void> struct is_transport : std::false_type {};

    template <typename T>
    struct is_transport<
        T, std::void_t<typename T::Peer, decltype(std::declval<T &>().open()),
                       decltype(std::declval<T &>().send_to(std::declval<const Buffer &>(),
                                                            std::declval<const typename T::Peer &>())),
                       decltype(std::declval<T &>().receive(dp::u32{})), decltype(std::declval<T &>().close()),
                       decltype(std::declval<const T &>().is_open())>> : std::true_type {};

} // namespace reliant
