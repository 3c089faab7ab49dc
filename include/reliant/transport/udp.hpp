#pragma once

#include <reliant/transport.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace reliant {

    // UDP transport using BSD sockets
    // Unreliable, unordered - message boundaries preserved, no framing needed
    // The socket is bound on open() so the peer's replies come back to it
    class UdpTransport {
      private:
        dp::i32 fd_;
        UdpEndpoint local_endpoint_;

        static constexpr dp::usize MAX_UDP_SIZE = 1400; // Safe size to avoid fragmentation

      public:
        using Peer = UdpEndpoint;

        explicit UdpTransport(UdpEndpoint local = UdpEndpoint{"0.0.0.0", 0}) : fd_(-1), local_endpoint_(local) {
            echo::trace("UdpTransport constructed for ", local_endpoint_.to_string());
        }

        ~UdpTransport() {
            if (fd_ >= 0) {
                close();
            }
        }

        UdpTransport(const UdpTransport &) = delete;
        UdpTransport &operator=(const UdpTransport &) = delete;

        // Create the socket and bind the local endpoint
        // Port 0 picks an ephemeral port; local_endpoint() reports the one chosen
        dp::Res<void> open() {
            if (fd_ >= 0) {
                echo::warn("UdpTransport already open on ", local_endpoint_.to_string());
                return dp::result::ok();
            }

            echo::trace("binding to ", local_endpoint_.to_string());

            fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::not_found("socket unavailable"));
            }
            echo::trace("udp socket created fd=", fd_);

            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(local_endpoint_.port);

            if (local_endpoint_.host == "0.0.0.0" || local_endpoint_.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else {
                if (::inet_pton(AF_INET, local_endpoint_.host.c_str(), &addr.sin_addr) <= 0) {
                    ::close(fd_);
                    fd_ = -1;
                    echo::error("invalid address: ", local_endpoint_.host.c_str());
                    return dp::result::err(dp::Error::invalid_argument("invalid local address"));
                }
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("bind failed: ", strerror(errno));
                return dp::result::err(dp::Error::not_found(dp::String("bind failed: ") + strerror(errno)));
            }

            struct sockaddr_in bound = {};
            socklen_t bound_len = sizeof(bound);
            if (::getsockname(fd_, (struct sockaddr *)&bound, &bound_len) == 0) {
                local_endpoint_.port = ntohs(bound.sin_port);
            }

            echo::info("UdpTransport listening on ", local_endpoint_.to_string());
            return dp::result::ok();
        }

        // Send a datagram to the peer - fire and forget
        dp::Res<void> send_to(const Buffer &bytes, const Peer &peer) {
            if (fd_ < 0) {
                echo::error("send_to called but transport not open");
                return dp::result::err(dp::Error::io_error("transport not open"));
            }

            if (bytes.size() > MAX_UDP_SIZE) {
                echo::warn("datagram too large: ", bytes.size(), " > ", MAX_UDP_SIZE);
                return dp::result::err(dp::Error::invalid_argument(dp::String("datagram too large: ") +
                                                                   std::to_string(bytes.size()).c_str()));
            }

            echo::trace("sendto ", peer.to_string(), " len=", bytes.size());

            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_DGRAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(peer.port).c_str());
            dp::i32 ret = ::getaddrinfo(peer.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("cannot resolve ") + peer.host));
            }

            dp::isize n = ::sendto(fd_, bytes.data(), bytes.size(), 0, result->ai_addr, result->ai_addrlen);
            ::freeaddrinfo(result);

            if (n < 0) {
                echo::error("sendto failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("sendto failed: ") + strerror(errno)));
            }

            echo::debug("sent ", n, " bytes to ", peer.to_string());
            return dp::result::ok();
        }

        // Receive one datagram, waiting at most timeout_ms
        dp::Res<Buffer> receive(dp::u32 timeout_ms) {
            if (fd_ < 0) {
                echo::error("receive called but transport not open");
                return dp::result::err(dp::Error::io_error("transport not open"));
            }

            auto ready = wait_readable(fd_, timeout_ms);
            if (ready.is_err()) {
                return dp::result::err(ready.error());
            }

            Buffer bytes(MAX_UDP_SIZE);
            struct sockaddr_in src_addr = {};
            socklen_t src_len = sizeof(src_addr);

            dp::isize n = ::recvfrom(fd_, bytes.data(), bytes.size(), 0, (struct sockaddr *)&src_addr, &src_len);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    return dp::result::err(dp::Error::timeout("receive timeout"));
                }
                echo::error("recvfrom failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("recvfrom failed: ") + strerror(errno)));
            }

            bytes.resize(static_cast<dp::usize>(n));

            char src_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &src_addr.sin_addr, src_ip, sizeof(src_ip));
            echo::trace("recvfrom got ", n, " bytes from ", src_ip, ":", ntohs(src_addr.sin_port));

            return dp::result::ok(std::move(bytes));
        }

        void close() {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                echo::debug("UdpTransport closed");
            }
        }

        bool is_open() const { return fd_ >= 0; }

        const UdpEndpoint &local_endpoint() const { return local_endpoint_; }
    };

} // namespace reliant
