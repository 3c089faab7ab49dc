#pragma once

#include <reliant/common.hpp>

namespace reliant {

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // Serial device the radio module is attached to
    struct SerialEndpoint {
        dp::String device; // Filesystem path like /dev/ttyUSB0
        dp::u32 baud;      // 9600 is the radio factory default

        inline dp::String to_string() const {
            return device + " @" + dp::String(std::to_string(baud).c_str());
        }
    };

    // XBee radio address - 64-bit extended address (SH:SL)
    struct XBeeAddress {
        dp::u64 value;

        static constexpr dp::u64 BROADCAST = 0x000000000000FFFFull;

        inline bool operator==(const XBeeAddress &other) const { return value == other.value; }
        inline bool operator!=(const XBeeAddress &other) const { return value != other.value; }

        inline dp::Array<dp::u8, 8> to_bytes() const {
            dp::Array<dp::u8, 8> bytes;
            for (dp::usize i = 0; i < 8; i++) {
                bytes[i] = static_cast<dp::u8>((value >> (56 - 8 * i)) & 0xFF);
            }
            return bytes;
        }

        static inline XBeeAddress from_bytes(const dp::u8 *bytes) {
            dp::u64 value = 0;
            for (dp::usize i = 0; i < 8; i++) {
                value = (value << 8) | bytes[i];
            }
            return XBeeAddress{value};
        }

        inline dp::String to_string() const {
            auto bytes = to_bytes();
            return to_hex(bytes.data(), bytes.size());
        }

        // Parse the 16 hex digit form printed on the module label, e.g. 0013A20040A1B2C3
        static inline dp::Res<XBeeAddress> parse(const dp::String &text) {
            const char *s = text.c_str();
            dp::usize len = text.size();
            if (len == 0 || len > 16) {
                return dp::result::err(dp::Error::invalid_argument("xbee address must be 1-16 hex digits"));
            }

            dp::u64 value = 0;
            for (dp::usize i = 0; i < len; i++) {
                char c = s[i];
                dp::u64 nibble;
                if (c >= '0' && c <= '9') {
                    nibble = static_cast<dp::u64>(c - '0');
                } else if (c >= 'a' && c <= 'f') {
                    nibble = static_cast<dp::u64>(c - 'a' + 10);
                } else if (c >= 'A' && c <= 'F') {
                    nibble = static_cast<dp::u64>(c - 'A' + 10);
                } else {
                    return dp::result::err(dp::Error::invalid_argument("invalid hex digit in xbee address"));
                }
                value = (value << 4) | nibble;
            }
            return dp::result::ok(XBeeAddress{value});
        }
    };

} // namespace reliant
