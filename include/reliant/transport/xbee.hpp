#pragma once

#include <reliant/transport.hpp>

#include <chrono>
#include <fcntl.h>
#include <optional>
#include <termios.h>
#include <unistd.h>

namespace reliant {
    namespace xbee {

        // API mode 1 framing: [0x7E][len_hi][len_lo][frame data: api id + payload][checksum]
        // checksum = 0xFF - (sum of frame data bytes & 0xFF)
        constexpr dp::u8 START_DELIMITER = 0x7E;

        // Frame types
        constexpr dp::u8 AT_COMMAND = 0x08;
        constexpr dp::u8 TRANSMIT_REQUEST = 0x10;
        constexpr dp::u8 AT_COMMAND_RESPONSE = 0x88;
        constexpr dp::u8 MODEM_STATUS = 0x8A;
        constexpr dp::u8 TRANSMIT_STATUS = 0x8B;
        constexpr dp::u8 RECEIVE_PACKET = 0x90;

        constexpr dp::usize MAX_FRAME_DATA = 512;
        constexpr dp::usize MAX_RF_PAYLOAD = 256;

        // Receive packet layout: [src64:8][src16:2][options:1][rf data]
        constexpr dp::usize RECEIVE_HEADER_SIZE = 11;

        struct Frame {
            dp::u8 api_id;
            Buffer data; // frame data after the api id
        };

        inline dp::u8 checksum(const Buffer &frame_data) {
            dp::u32 sum = 0;
            for (auto b : frame_data) {
                sum += b;
            }
            return static_cast<dp::u8>(0xFF - (sum & 0xFF));
        }

        // Wrap frame data (api id included) into a delimited frame
        inline Buffer build_frame(const Buffer &frame_data) {
            Buffer frame;
            frame.push_back(START_DELIMITER);
            append_u16_be(frame, static_cast<dp::u16>(frame_data.size()));
            frame.insert(frame.end(), frame_data.begin(), frame_data.end());
            frame.push_back(checksum(frame_data));
            return frame;
        }

        // Transmit Request: [0x10][frame id][dest64:8][dest16:2 = 0xFFFE][radius][options][rf data]
        // frame id 0 suppresses the transmit status frame
        inline Buffer build_transmit_request(dp::u8 frame_id, const XBeeAddress &dest, const Buffer &rf_data) {
            Buffer data;
            data.push_back(TRANSMIT_REQUEST);
            data.push_back(frame_id);
            auto addr = dest.to_bytes();
            data.insert(data.end(), addr.begin(), addr.end());
            append_u16_be(data, 0xFFFE);
            data.push_back(0x00); // broadcast radius: maximum hops
            data.push_back(0x00); // transmit options
            data.insert(data.end(), rf_data.begin(), rf_data.end());
            return build_frame(data);
        }

        // AT Command: [0x08][frame id][cmd:2][parameter]
        inline Buffer build_at_command(dp::u8 frame_id, const char *command, const Buffer &parameter) {
            Buffer data;
            data.push_back(AT_COMMAND);
            data.push_back(frame_id);
            data.push_back(static_cast<dp::u8>(command[0]));
            data.push_back(static_cast<dp::u8>(command[1]));
            data.insert(data.end(), parameter.begin(), parameter.end());
            return build_frame(data);
        }

        // Incremental frame parser for the serial byte stream
        // Resynchronizes on the start delimiter after garbage or a bad checksum
        class FrameReader {
          private:
            Buffer pending_;
            dp::usize dropped_;

            void drop_front(dp::usize count) { pending_.erase(pending_.begin(), pending_.begin() + count); }

          public:
            FrameReader() : dropped_(0) {}

            void feed(const dp::u8 *bytes, dp::usize count) { pending_.insert(pending_.end(), bytes, bytes + count); }

            std::optional<Frame> next() {
                while (true) {
                    dp::usize start = 0;
                    while (start < pending_.size() && pending_[start] != START_DELIMITER) {
                        start++;
                    }
                    if (start > 0) {
                        echo::trace("xbee skipping ", start, " bytes before delimiter");
                        drop_front(start);
                    }

                    if (pending_.size() < 3) {
                        return std::nullopt;
                    }

                    dp::u16 length = decode_u16_be(pending_.data() + 1);
                    if (length == 0 || length > MAX_FRAME_DATA) {
                        echo::warn("xbee frame length out of range: ", length);
                        dropped_++;
                        drop_front(1);
                        continue;
                    }

                    dp::usize total = 3 + static_cast<dp::usize>(length) + 1;
                    if (pending_.size() < total) {
                        return std::nullopt;
                    }

                    Buffer frame_data(pending_.begin() + 3, pending_.begin() + 3 + length);
                    if (checksum(frame_data) != pending_[total - 1]) {
                        echo::warn("xbee frame checksum mismatch, resyncing");
                        dropped_++;
                        drop_front(1);
                        continue;
                    }

                    drop_front(total);
                    Frame frame{frame_data[0], Buffer(frame_data.begin() + 1, frame_data.end())};
                    echo::trace("xbee frame api=0x", std::hex, static_cast<int>(frame.api_id), std::dec,
                                " len=", frame.data.size());
                    return frame;
                }
            }

            dp::usize dropped() const { return dropped_; }
            dp::usize buffered() const { return pending_.size(); }
        };

        inline dp::Res<speed_t> baud_constant(dp::u32 baud) {
            switch (baud) {
            case 1200:
                return dp::result::ok(static_cast<speed_t>(B1200));
            case 2400:
                return dp::result::ok(static_cast<speed_t>(B2400));
            case 4800:
                return dp::result::ok(static_cast<speed_t>(B4800));
            case 9600:
                return dp::result::ok(static_cast<speed_t>(B9600));
            case 19200:
                return dp::result::ok(static_cast<speed_t>(B19200));
            case 38400:
                return dp::result::ok(static_cast<speed_t>(B38400));
            case 57600:
                return dp::result::ok(static_cast<speed_t>(B57600));
            case 115200:
                return dp::result::ok(static_cast<speed_t>(B115200));
            case 230400:
                return dp::result::ok(static_cast<speed_t>(B230400));
            default:
                return dp::result::err(dp::Error::invalid_argument(dp::String("unsupported baud rate: ") +
                                                                   std::to_string(baud).c_str()));
            }
        }

    } // namespace xbee

    // XBee radio transport over a serial port in API mode 1
    // Half-duplex, lossy, small frames - exactly the link confirmable messages are for
    class XBeeTransport {
      private:
        SerialEndpoint serial_;
        dp::i32 fd_;
        xbee::FrameReader reader_;
        dp::u8 next_frame_id_;

        using Clock = std::chrono::steady_clock;

        dp::u8 take_frame_id() {
            dp::u8 id = next_frame_id_++;
            if (next_frame_id_ == 0) {
                next_frame_id_ = 1;
            }
            return id;
        }

        // Read frames until one arrives or the deadline passes
        dp::Res<xbee::Frame> read_frame(Clock::time_point deadline) {
            while (true) {
                auto frame = reader_.next();
                if (frame.has_value()) {
                    return dp::result::ok(std::move(*frame));
                }

                auto now = Clock::now();
                if (now >= deadline) {
                    return dp::result::err(dp::Error::timeout("receive timeout"));
                }
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

                auto ready = wait_readable(fd_, static_cast<dp::u32>(remaining > 0 ? remaining : 1));
                if (ready.is_err()) {
                    return dp::result::err(ready.error());
                }

                dp::u8 chunk[256];
                dp::isize n = ::read(fd_, chunk, sizeof(chunk));
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                        continue;
                    }
                    echo::error("serial read failed: ", strerror(errno));
                    return dp::result::err(dp::Error::io_error(dp::String("serial read failed: ") + strerror(errno)));
                }
                if (n == 0) {
                    echo::error("serial link closed");
                    return dp::result::err(dp::Error::io_error("serial link closed"));
                }

                echo::trace("serial read ", n, " bytes");
                reader_.feed(chunk, static_cast<dp::usize>(n));
            }
        }

        dp::Res<void> write_frame(const Buffer &frame) {
            if (fd_ < 0) {
                echo::error("write called but transport not open");
                return dp::result::err(dp::Error::io_error("transport not open"));
            }
            auto res = write_exact(fd_, frame.data(), frame.size());
            if (res.is_err()) {
                echo::error("serial write failed: ", res.error().message.c_str());
                return dp::result::err(dp::Error::io_error(res.error().message));
            }
            return dp::result::ok();
        }

      public:
        using Peer = XBeeAddress;

        explicit XBeeTransport(SerialEndpoint serial) : serial_(serial), fd_(-1), next_frame_id_(1) {
            echo::trace("XBeeTransport constructed for ", serial_.to_string());
        }

        ~XBeeTransport() {
            if (fd_ >= 0) {
                close();
            }
        }

        XBeeTransport(const XBeeTransport &) = delete;
        XBeeTransport &operator=(const XBeeTransport &) = delete;

        // Open and configure the serial port: raw 8N1, no flow control
        dp::Res<void> open() {
            if (fd_ >= 0) {
                echo::warn("XBeeTransport already open on ", serial_.device.c_str());
                return dp::result::ok();
            }

            auto speed_res = xbee::baud_constant(serial_.baud);
            if (speed_res.is_err()) {
                return dp::result::err(speed_res.error());
            }

            echo::trace("serial open ", serial_.device.c_str());
            fd_ = ::open(serial_.device.c_str(), O_RDWR | O_NOCTTY);
            if (fd_ < 0) {
                echo::error("serial open failed: ", strerror(errno));
                return dp::result::err(dp::Error::not_found(dp::String("cannot open ") + serial_.device));
            }

            struct termios tty = {};
            if (::tcgetattr(fd_, &tty) != 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("tcgetattr failed: ", strerror(errno));
                return dp::result::err(dp::Error::not_found(dp::String("tcgetattr failed: ") + strerror(errno)));
            }

            ::cfsetospeed(&tty, speed_res.value());
            ::cfsetispeed(&tty, speed_res.value());

            tty.c_cflag &= ~PARENB;  // No parity
            tty.c_cflag &= ~CSTOPB;  // 1 stop bit
            tty.c_cflag &= ~CSIZE;   // Clear size bits
            tty.c_cflag |= CS8;      // 8 data bits
            tty.c_cflag &= ~CRTSCTS; // No flow control
            tty.c_cflag |= CREAD | CLOCAL;

            // Raw mode
            tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
            tty.c_iflag &= ~(IXON | IXOFF | IXANY | ICRNL | INLCR | IGNCR);
            tty.c_oflag &= ~OPOST;

            // Reads return whatever is available; poll() provides the timeout
            tty.c_cc[VMIN] = 0;
            tty.c_cc[VTIME] = 0;

            if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("tcsetattr failed: ", strerror(errno));
                return dp::result::err(dp::Error::not_found(dp::String("tcsetattr failed: ") + strerror(errno)));
            }
            ::tcflush(fd_, TCIOFLUSH);

            echo::info("XBeeTransport connected to ", serial_.to_string());
            return dp::result::ok();
        }

        // Send RF data to a remote radio; no transmit status is requested
        dp::Res<void> send_to(const Buffer &bytes, const Peer &peer) {
            if (bytes.size() > xbee::MAX_RF_PAYLOAD) {
                echo::warn("datagram too large for xbee: ", bytes.size());
                return dp::result::err(dp::Error::invalid_argument(dp::String("datagram too large: ") +
                                                                   std::to_string(bytes.size()).c_str()));
            }

            echo::trace("xbee send to ", peer.to_string(), " len=", bytes.size());
            auto res = write_frame(xbee::build_transmit_request(0, peer, bytes));
            if (res.is_err()) {
                return res;
            }

            echo::debug("sent ", bytes.size(), " bytes to ", peer.to_string());
            return dp::result::ok();
        }

        // Receive the RF data of the next Receive Packet frame
        // Transmit status, modem status and AT responses are skipped
        dp::Res<Buffer> receive(dp::u32 timeout_ms) {
            if (fd_ < 0) {
                echo::error("receive called but transport not open");
                return dp::result::err(dp::Error::io_error("transport not open"));
            }

            auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
            while (true) {
                auto frame_res = read_frame(deadline);
                if (frame_res.is_err()) {
                    return dp::result::err(frame_res.error());
                }

                auto frame = std::move(frame_res.value());
                if (frame.api_id != xbee::RECEIVE_PACKET) {
                    echo::trace("xbee skipping frame api=0x", std::hex, static_cast<int>(frame.api_id), std::dec);
                    continue;
                }
                if (frame.data.size() < xbee::RECEIVE_HEADER_SIZE) {
                    echo::warn("xbee receive packet too short: ", frame.data.size());
                    continue;
                }

                XBeeAddress source = XBeeAddress::from_bytes(frame.data.data());
                Buffer rf_data(frame.data.begin() + xbee::RECEIVE_HEADER_SIZE, frame.data.end());
                echo::debug("received ", rf_data.size(), " bytes from ", source.to_string());
                return dp::result::ok(std::move(rf_data));
            }
        }

        // Issue a local AT command and wait for its response data
        // Not safe to call while an engine's receiver loop is reading this transport
        dp::Res<Buffer> at_command(const char *command, const Buffer &parameter, dp::u32 timeout_ms = 2000) {
            dp::u8 frame_id = take_frame_id();
            echo::trace("xbee AT", command[0], command[1], " frame_id=", static_cast<int>(frame_id));

            auto res = write_frame(xbee::build_at_command(frame_id, command, parameter));
            if (res.is_err()) {
                return dp::result::err(res.error());
            }

            auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
            while (true) {
                auto frame_res = read_frame(deadline);
                if (frame_res.is_err()) {
                    if (is_timeout(frame_res.error())) {
                        echo::warn("xbee AT", command[0], command[1], " timed out");
                    }
                    return dp::result::err(frame_res.error());
                }

                auto frame = std::move(frame_res.value());
                // [frame id][cmd:2][status][data]
                if (frame.api_id != xbee::AT_COMMAND_RESPONSE || frame.data.size() < 4 || frame.data[0] != frame_id) {
                    continue;
                }

                if (frame.data[3] != 0) {
                    echo::error("xbee AT", command[0], command[1], " failed status=", static_cast<int>(frame.data[3]));
                    return dp::result::err(dp::Error::io_error("AT command failed"));
                }
                return dp::result::ok(Buffer(frame.data.begin() + 4, frame.data.end()));
            }
        }

        // 64-bit address of the attached module (SH + SL)
        dp::Res<XBeeAddress> local_address(dp::u32 timeout_ms = 2000) {
            auto high = at_command("SH", Buffer(), timeout_ms);
            if (high.is_err()) {
                return dp::result::err(high.error());
            }
            auto low = at_command("SL", Buffer(), timeout_ms);
            if (low.is_err()) {
                return dp::result::err(low.error());
            }
            if (high.value().size() != 4 || low.value().size() != 4) {
                return dp::result::err(dp::Error::io_error("malformed SH/SL response"));
            }

            Buffer bytes = high.value();
            bytes.insert(bytes.end(), low.value().begin(), low.value().end());
            return dp::result::ok(XBeeAddress::from_bytes(bytes.data()));
        }

        // Node identifier string of the attached module
        dp::Res<dp::String> node_id(dp::u32 timeout_ms = 2000) {
            auto res = at_command("NI", Buffer(), timeout_ms);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            const auto &data = res.value();
            return dp::result::ok(dp::String(reinterpret_cast<const char *>(data.data()), data.size()));
        }

        // Find a remote radio by its node identifier (AT ND <NI>)
        // Response data: [MY:2][SH:4][SL:4][NI...]
        dp::Res<XBeeAddress> discover(const dp::String &node_id, dp::u32 timeout_ms = 10000) {
            echo::debug("discovering node ", node_id.c_str());
            Buffer parameter(node_id.begin(), node_id.end());

            auto res = at_command("ND", parameter, timeout_ms);
            if (res.is_err()) {
                echo::error("node ", node_id.c_str(), " not found");
                return dp::result::err(dp::Error::not_found(dp::String("node not found: ") + node_id));
            }

            const auto &data = res.value();
            if (data.size() < 10) {
                return dp::result::err(dp::Error::not_found(dp::String("node not found: ") + node_id));
            }

            XBeeAddress address = XBeeAddress::from_bytes(data.data() + 2);
            echo::info("node ", node_id.c_str(), " is ", address.to_string());
            return dp::result::ok(address);
        }

        void close() {
            if (fd_ >= 0) {
                echo::trace("closing serial fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                echo::debug("XBeeTransport closed");
            }
        }

        bool is_open() const { return fd_ >= 0; }

        const SerialEndpoint &serial() const { return serial_; }

        dp::usize dropped_frames() const { return reader_.dropped(); }
    };

} // namespace reliant
