#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace reliant {

    // Opaque datagram bytes - what transports carry and the codec produces
    using Buffer = dp::Vector<dp::u8>;

    // Big-endian encoding for 16-bit header fields
    inline dp::Array<dp::u8, 2> encode_u16_be(dp::u16 value) {
        dp::Array<dp::u8, 2> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[1] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    inline dp::u16 decode_u16_be(const dp::u8 *bytes) {
        return static_cast<dp::u16>((static_cast<dp::u16>(bytes[0]) << 8) | static_cast<dp::u16>(bytes[1]));
    }

    inline void append_u16_be(Buffer &buffer, dp::u16 value) {
        auto bytes = encode_u16_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline void append_u32_be(Buffer &buffer, dp::u32 value) {
        buffer.push_back(static_cast<dp::u8>((value >> 24) & 0xFF));
        buffer.push_back(static_cast<dp::u8>((value >> 16) & 0xFF));
        buffer.push_back(static_cast<dp::u8>((value >> 8) & 0xFF));
        buffer.push_back(static_cast<dp::u8>(value & 0xFF));
    }

    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        return (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
               (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
    }

    inline bool same_bytes(const Buffer &a, const Buffer &b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (dp::usize i = 0; i < a.size(); i++) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }

    // Lowercase hex rendering, used for tokens and radio addresses in logs
    inline dp::String to_hex(const dp::u8 *bytes, dp::usize count) {
        static constexpr char DIGITS[] = "0123456789abcdef";
        std::string out;
        out.reserve(count * 2);
        for (dp::usize i = 0; i < count; i++) {
            out.push_back(DIGITS[(bytes[i] >> 4) & 0x0F]);
            out.push_back(DIGITS[bytes[i] & 0x0F]);
        }
        return dp::String(out.c_str());
    }

    inline dp::String to_hex(const Buffer &bytes) { return to_hex(bytes.data(), bytes.size()); }

    inline bool is_timeout(const dp::Error &error) { return error.code == dp::Error::TIMEOUT; }

    // Wait until fd has data to read
    // ERROR CATEGORIZATION:
    // - timeout: nothing arrived within timeout_ms (expected, recoverable)
    // - io_error: poll failed or the descriptor reported an error/hangup
    inline dp::Res<void> wait_readable(dp::i32 fd, dp::u32 timeout_ms) {
        struct pollfd pfd = {};
        pfd.fd = fd;
        pfd.events = POLLIN;

        while (true) {
            dp::i32 ret = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
            if (ret < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("poll interrupted by signal, retrying");
                    continue;
                }
                echo::trace("poll failed: ", strerror(errno), " (fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("poll error: ") + strerror(errno)));
            }
            if (ret == 0) {
                return dp::result::err(dp::Error::timeout("receive timeout"));
            }
            if (pfd.revents & POLLIN) {
                return dp::result::ok();
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                echo::trace("poll reported link failure (fd=", fd, ", revents=", pfd.revents, ")");
                return dp::result::err(dp::Error::io_error("link failure"));
            }
        }
    }

    // Helper to write exactly n bytes to a file descriptor
    // ERROR CATEGORIZATION:
    // - not_found: link gone (EBADF, EIO on a detached serial device)
    // - io_error: other I/O errors (unexpected, may be recoverable)
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = ::write(fd, buffer + total_written, count - total_written);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }

                if (errno == EBADF) {
                    echo::trace("write failed: bad file descriptor (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("bad file descriptor"));
                }
                if (errno == EIO) {
                    echo::trace("write failed: device detached (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("device detached"));
                }

                // Buffer full errors - may be recoverable with retry
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("write would block (fd=", fd, ", wanted=", count, ", wrote=", total_written, ")");
                    return dp::result::err(dp::Error::io_error("write would block"));
                }

                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

} // namespace reliant
