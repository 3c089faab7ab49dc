#pragma once

#include <reliant/coap/message.hpp>

namespace reliant {
    namespace coap {

        /// Wire format (RFC 7252 section 3), all multi-byte integers big-endian:
        /// [ver:2|type:2|tkl:4][code:8][mid:16][token:tkl][options...][0xFF][payload]
        /// Option header: [delta:4|length:4][ext delta:0-2][ext length:0-2][value]
        /// Nibble 13 -> one extension byte (value - 13), 14 -> two bytes (value - 269), 15 reserved

        namespace detail {

            inline void split_option_field(dp::u32 value, dp::u8 &nibble, Buffer &extension) {
                if (value < 13) {
                    nibble = static_cast<dp::u8>(value);
                } else if (value < 269) {
                    nibble = 13;
                    extension.push_back(static_cast<dp::u8>(value - 13));
                } else {
                    nibble = 14;
                    append_u16_be(extension, static_cast<dp::u16>(value - 269));
                }
            }

            inline dp::Res<dp::u32> read_option_field(dp::u8 nibble, const Buffer &bytes, dp::usize &pos) {
                if (nibble < 13) {
                    return dp::result::ok(static_cast<dp::u32>(nibble));
                }
                if (nibble == 13) {
                    if (pos + 1 > bytes.size()) {
                        return dp::result::err(dp::Error::invalid_argument("truncated option extension"));
                    }
                    dp::u32 value = static_cast<dp::u32>(bytes[pos]) + 13;
                    pos += 1;
                    return dp::result::ok(value);
                }
                if (nibble == 14) {
                    if (pos + 2 > bytes.size()) {
                        return dp::result::err(dp::Error::invalid_argument("truncated option extension"));
                    }
                    dp::u32 value = static_cast<dp::u32>(decode_u16_be(bytes.data() + pos)) + 269;
                    pos += 2;
                    return dp::result::ok(value);
                }
                return dp::result::err(dp::Error::invalid_argument("reserved option nibble 15"));
            }

        } // namespace detail

        /// Serialize a message; fails when it has no MID or an oversized token
        inline dp::Res<Buffer> encode(const Message &message) {
            if (!message.mid.has_value()) {
                echo::error("cannot encode message without mid");
                return dp::result::err(dp::Error::invalid_argument("message has no mid"));
            }
            if (message.token.size() > MAX_TOKEN_LENGTH) {
                echo::error("token too long: ", message.token.size());
                return dp::result::err(dp::Error::invalid_argument("token longer than 8 bytes"));
            }

            Buffer bytes;
            bytes.push_back(static_cast<dp::u8>((VERSION << 6) | (static_cast<dp::u8>(message.type) << 4) |
                                                static_cast<dp::u8>(message.token.size())));
            bytes.push_back(message.code);
            append_u16_be(bytes, *message.mid);
            bytes.insert(bytes.end(), message.token.begin(), message.token.end());

            // Options go out in ascending number order; equal numbers keep their relative order
            dp::Vector<Option> sorted = message.options;
            std::stable_sort(sorted.begin(), sorted.end(),
                             [](const Option &a, const Option &b) { return a.number < b.number; });

            dp::u16 previous = 0;
            for (const auto &opt : sorted) {
                if (opt.value.size() > 65535 + 269) {
                    echo::error("option ", opt.number, " value too long: ", opt.value.size());
                    return dp::result::err(dp::Error::invalid_argument("option value too long"));
                }

                dp::u8 delta_nibble = 0;
                dp::u8 length_nibble = 0;
                Buffer delta_ext;
                Buffer length_ext;
                detail::split_option_field(static_cast<dp::u32>(opt.number - previous), delta_nibble, delta_ext);
                detail::split_option_field(static_cast<dp::u32>(opt.value.size()), length_nibble, length_ext);

                bytes.push_back(static_cast<dp::u8>((delta_nibble << 4) | length_nibble));
                bytes.insert(bytes.end(), delta_ext.begin(), delta_ext.end());
                bytes.insert(bytes.end(), length_ext.begin(), length_ext.end());
                bytes.insert(bytes.end(), opt.value.begin(), opt.value.end());
                previous = opt.number;
            }

            if (!message.payload.empty()) {
                bytes.push_back(PAYLOAD_MARKER);
                bytes.insert(bytes.end(), message.payload.begin(), message.payload.end());
            }

            echo::trace("encoded ", message.line().c_str(), " into ", bytes.size(), " bytes");
            return dp::result::ok(std::move(bytes));
        }

        /// Parse a datagram; every malformed input is reported as invalid_argument
        inline dp::Res<Message> decode(const Buffer &bytes) {
            if (bytes.size() < HEADER_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("message too short"));
            }

            dp::u8 version = static_cast<dp::u8>(bytes[0] >> 6);
            if (version != VERSION) {
                return dp::result::err(dp::Error::invalid_argument("unsupported coap version"));
            }

            Message message;
            message.type = static_cast<MessageType>((bytes[0] >> 4) & 0x03);
            dp::usize token_length = bytes[0] & 0x0F;
            message.code = bytes[1];
            message.mid = decode_u16_be(bytes.data() + 2);

            if (token_length > MAX_TOKEN_LENGTH) {
                return dp::result::err(dp::Error::invalid_argument("token length over 8"));
            }
            if (message.code == codes::EMPTY && bytes.size() != HEADER_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("empty message with content"));
            }
            if (bytes.size() < HEADER_SIZE + token_length) {
                return dp::result::err(dp::Error::invalid_argument("truncated token"));
            }

            message.token = Buffer(bytes.begin() + HEADER_SIZE, bytes.begin() + HEADER_SIZE + token_length);

            dp::usize pos = HEADER_SIZE + token_length;
            dp::u32 number = 0;
            while (pos < bytes.size()) {
                dp::u8 header = bytes[pos++];
                if (header == PAYLOAD_MARKER) {
                    if (pos >= bytes.size()) {
                        return dp::result::err(dp::Error::invalid_argument("payload marker without payload"));
                    }
                    message.payload = Buffer(bytes.begin() + pos, bytes.end());
                    break;
                }

                auto delta_res = detail::read_option_field(static_cast<dp::u8>(header >> 4), bytes, pos);
                if (delta_res.is_err()) {
                    return dp::result::err(delta_res.error());
                }
                auto length_res = detail::read_option_field(static_cast<dp::u8>(header & 0x0F), bytes, pos);
                if (length_res.is_err()) {
                    return dp::result::err(length_res.error());
                }

                number += delta_res.value();
                if (number > 0xFFFF) {
                    return dp::result::err(dp::Error::invalid_argument("option number overflow"));
                }

                dp::usize length = length_res.value();
                if (pos + length > bytes.size()) {
                    return dp::result::err(dp::Error::invalid_argument("truncated option value"));
                }

                message.options.push_back(
                    Option{static_cast<dp::u16>(number), Buffer(bytes.begin() + pos, bytes.begin() + pos + length)});
                pos += length;
            }

            echo::trace("decoded ", message.line().c_str());
            return dp::result::ok(std::move(message));
        }

    } // namespace coap
} // namespace reliant
