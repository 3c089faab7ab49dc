#pragma once

#include <reliant/common.hpp>

namespace reliant {
    namespace coap {

        constexpr dp::u8 VERSION = 1;
        constexpr dp::usize HEADER_SIZE = 4;
        constexpr dp::usize MAX_TOKEN_LENGTH = 8;
        constexpr dp::u8 PAYLOAD_MARKER = 0xFF;

        /// Message types (2-bit header field)
        enum class MessageType : dp::u8 {
            Confirmable = 0,    // CON - requires acknowledgement, retransmitted
            NonConfirmable = 1, // NON
            Acknowledgement = 2,
            Reset = 3
        };

        inline const char *to_string(MessageType type) {
            switch (type) {
            case MessageType::Confirmable:
                return "CON";
            case MessageType::NonConfirmable:
                return "NON";
            case MessageType::Acknowledgement:
                return "ACK";
            case MessageType::Reset:
                return "RST";
            default:
                return "???";
            }
        }

        /// Code byte is class.detail: [class:3][detail:5]
        constexpr dp::u8 make_code(dp::u8 code_class, dp::u8 detail) {
            return static_cast<dp::u8>((code_class << 5) | (detail & 0x1F));
        }

        namespace codes {
            constexpr dp::u8 EMPTY = make_code(0, 0);

            // Methods
            constexpr dp::u8 GET = make_code(0, 1);
            constexpr dp::u8 POST = make_code(0, 2);
            constexpr dp::u8 PUT = make_code(0, 3);
            constexpr dp::u8 DELETE = make_code(0, 4);

            // Responses
            constexpr dp::u8 CREATED = make_code(2, 1);
            constexpr dp::u8 DELETED = make_code(2, 2);
            constexpr dp::u8 VALID = make_code(2, 3);
            constexpr dp::u8 CHANGED = make_code(2, 4);
            constexpr dp::u8 CONTENT = make_code(2, 5);
            constexpr dp::u8 CONTINUE = make_code(2, 31);
            constexpr dp::u8 BAD_REQUEST = make_code(4, 0);
            constexpr dp::u8 UNAUTHORIZED = make_code(4, 1);
            constexpr dp::u8 BAD_OPTION = make_code(4, 2);
            constexpr dp::u8 FORBIDDEN = make_code(4, 3);
            constexpr dp::u8 NOT_FOUND = make_code(4, 4);
            constexpr dp::u8 METHOD_NOT_ALLOWED = make_code(4, 5);
            constexpr dp::u8 NOT_ACCEPTABLE = make_code(4, 6);
            constexpr dp::u8 REQUEST_ENTITY_INCOMPLETE = make_code(4, 8);
            constexpr dp::u8 PRECONDITION_FAILED = make_code(4, 12);
            constexpr dp::u8 REQUEST_ENTITY_TOO_LARGE = make_code(4, 13);
            constexpr dp::u8 UNSUPPORTED_CONTENT_FORMAT = make_code(4, 15);
            constexpr dp::u8 INTERNAL_SERVER_ERROR = make_code(5, 0);
            constexpr dp::u8 NOT_IMPLEMENTED = make_code(5, 1);
            constexpr dp::u8 BAD_GATEWAY = make_code(5, 2);
            constexpr dp::u8 SERVICE_UNAVAILABLE = make_code(5, 3);
            constexpr dp::u8 GATEWAY_TIMEOUT = make_code(5, 4);
            constexpr dp::u8 PROXYING_NOT_SUPPORTED = make_code(5, 5);
        } // namespace codes

        inline const char *code_name(dp::u8 code) {
            switch (code) {
            case codes::EMPTY:
                return "EMPTY";
            case codes::GET:
                return "GET";
            case codes::POST:
                return "POST";
            case codes::PUT:
                return "PUT";
            case codes::DELETE:
                return "DELETE";
            case codes::CREATED:
                return "Created";
            case codes::DELETED:
                return "Deleted";
            case codes::VALID:
                return "Valid";
            case codes::CHANGED:
                return "Changed";
            case codes::CONTENT:
                return "Content";
            case codes::CONTINUE:
                return "Continue";
            case codes::BAD_REQUEST:
                return "Bad Request";
            case codes::UNAUTHORIZED:
                return "Unauthorized";
            case codes::BAD_OPTION:
                return "Bad Option";
            case codes::FORBIDDEN:
                return "Forbidden";
            case codes::NOT_FOUND:
                return "Not Found";
            case codes::METHOD_NOT_ALLOWED:
                return "Method Not Allowed";
            case codes::NOT_ACCEPTABLE:
                return "Not Acceptable";
            case codes::REQUEST_ENTITY_INCOMPLETE:
                return "Request Entity Incomplete";
            case codes::PRECONDITION_FAILED:
                return "Precondition Failed";
            case codes::REQUEST_ENTITY_TOO_LARGE:
                return "Request Entity Too Large";
            case codes::UNSUPPORTED_CONTENT_FORMAT:
                return "Unsupported Content-Format";
            case codes::INTERNAL_SERVER_ERROR:
                return "Internal Server Error";
            case codes::NOT_IMPLEMENTED:
                return "Not Implemented";
            case codes::BAD_GATEWAY:
                return "Bad Gateway";
            case codes::SERVICE_UNAVAILABLE:
                return "Service Unavailable";
            case codes::GATEWAY_TIMEOUT:
                return "Gateway Timeout";
            case codes::PROXYING_NOT_SUPPORTED:
                return "Proxying Not Supported";
            default:
                return "Unknown";
            }
        }

        /// Option numbers (RFC 7252, 7641, 7959, 7967)
        namespace options {
            constexpr dp::u16 IF_MATCH = 1;
            constexpr dp::u16 URI_HOST = 3;
            constexpr dp::u16 ETAG = 4;
            constexpr dp::u16 IF_NONE_MATCH = 5;
            constexpr dp::u16 OBSERVE = 6;
            constexpr dp::u16 URI_PORT = 7;
            constexpr dp::u16 LOCATION_PATH = 8;
            constexpr dp::u16 URI_PATH = 11;
            constexpr dp::u16 CONTENT_FORMAT = 12;
            constexpr dp::u16 MAX_AGE = 14;
            constexpr dp::u16 URI_QUERY = 15;
            constexpr dp::u16 ACCEPT = 17;
            constexpr dp::u16 LOCATION_QUERY = 20;
            constexpr dp::u16 BLOCK2 = 23;
            constexpr dp::u16 BLOCK1 = 27;
            constexpr dp::u16 SIZE2 = 28;
            constexpr dp::u16 PROXY_URI = 35;
            constexpr dp::u16 PROXY_SCHEME = 39;
            constexpr dp::u16 SIZE1 = 60;
            constexpr dp::u16 NO_RESPONSE = 258;
        } // namespace options

        /// No-Response value suppressing every response class (2.xx, 4.xx and 5.xx)
        constexpr dp::u32 NO_RESPONSE_ALL = 26;

        /// Observe registration values
        constexpr dp::u32 OBSERVE_REGISTER = 0;
        constexpr dp::u32 OBSERVE_DEREGISTER = 1;

        /// Content formats
        namespace formats {
            constexpr dp::u16 TEXT_PLAIN = 0;
            constexpr dp::u16 LINK_FORMAT = 40;
            constexpr dp::u16 XML = 41;
            constexpr dp::u16 OCTET_STREAM = 42;
            constexpr dp::u16 EXI = 47;
            constexpr dp::u16 JSON = 50;
            constexpr dp::u16 CBOR = 60;
        } // namespace formats

        constexpr const char *WELL_KNOWN_CORE = "/.well-known/core";

        /// Transmission parameters (RFC 7252 section 4.8)
        struct TransmissionParams {
            dp::u32 ack_timeout_ms = 2000;
            double ack_random_factor = 1.5;
            dp::u32 max_retransmit = 4;
            dp::u32 receive_timeout_ms = 100; // receiver loop poll bound
            dp::u32 non_lifetime_ms = 145000;      // NON_LIFETIME: how long a NON request waits for an answer
            dp::u32 exchange_lifetime_ms = 247000; // EXCHANGE_LIFETIME: how long an empty ACK waits for the response

            /// Longest time from first transmission until the sender gives up
            inline dp::u64 max_transmit_wait_ms() const {
                dp::u64 span = (static_cast<dp::u64>(1) << (max_retransmit + 1)) - 1;
                return static_cast<dp::u64>(static_cast<double>(ack_timeout_ms) * static_cast<double>(span) *
                                            ack_random_factor);
            }
        };

    } // namespace coap
} // namespace reliant
