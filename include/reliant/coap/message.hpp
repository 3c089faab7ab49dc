#pragma once

#include <reliant/coap/defines.hpp>

#include <algorithm>
#include <optional>
#include <sstream>

namespace reliant {
    namespace coap {

        struct Option {
            dp::u16 number;
            Buffer value;
        };

        /// Unit exchanged over the wire
        /// The delivery flags are not encoded; they record what the engine learned about this message
        struct Message {
            MessageType type = MessageType::Confirmable;
            dp::u8 code = codes::EMPTY;
            std::optional<dp::u16> mid; // assigned by the engine when absent
            Buffer token;
            dp::Vector<Option> options;
            Buffer payload;

            bool acknowledged = false;
            bool rejected = false;
            bool timed_out = false;

            dp::u8 code_class() const { return static_cast<dp::u8>(code >> 5); }
            dp::u8 code_detail() const { return static_cast<dp::u8>(code & 0x1F); }

            bool is_empty() const { return code == codes::EMPTY; }
            bool is_request() const { return code_class() == 0 && code != codes::EMPTY; }
            bool is_response() const { return code_class() >= 2 && code_class() <= 5; }

            void add_option(dp::u16 number, Buffer value) { options.push_back(Option{number, std::move(value)}); }

            /// Uint options use the shortest big-endian form; 0 is the empty value
            void add_uint_option(dp::u16 number, dp::u32 value) {
                Buffer bytes;
                bool started = false;
                for (dp::i32 shift = 24; shift >= 0; shift -= 8) {
                    dp::u8 b = static_cast<dp::u8>((value >> shift) & 0xFF);
                    if (b != 0 || started) {
                        bytes.push_back(b);
                        started = true;
                    }
                }
                add_option(number, std::move(bytes));
            }

            void add_string_option(dp::u16 number, const dp::String &value) {
                add_option(number, Buffer(value.begin(), value.end()));
            }

            void remove_option(dp::u16 number) {
                options.erase(std::remove_if(options.begin(), options.end(),
                                             [number](const Option &opt) { return opt.number == number; }),
                              options.end());
            }

            const Option *find_option(dp::u16 number) const {
                for (const auto &opt : options) {
                    if (opt.number == number) {
                        return &opt;
                    }
                }
                return nullptr;
            }

            bool has_option(dp::u16 number) const { return find_option(number) != nullptr; }

            std::optional<dp::u32> uint_option(dp::u16 number) const {
                const Option *opt = find_option(number);
                if (opt == nullptr || opt->value.size() > 4) {
                    return std::nullopt;
                }
                dp::u32 value = 0;
                for (auto b : opt->value) {
                    value = (value << 8) | b;
                }
                return value;
            }

            std::optional<dp::u32> observe() const { return uint_option(options::OBSERVE); }

            /// RFC 7967: No-Response = 26 means no response of any class is wanted
            bool suppresses_all_responses() const {
                auto value = uint_option(options::NO_RESPONSE);
                return value.has_value() && *value == NO_RESPONSE_ALL;
            }

            /// Split "/a/b?x=1&y" into Uri-Path and Uri-Query options
            void set_uri_path(const dp::String &uri) {
                remove_option(options::URI_PATH);
                remove_option(options::URI_QUERY);

                const char *s = uri.c_str();
                dp::usize len = uri.size();
                dp::usize query_at = len;
                for (dp::usize i = 0; i < len; i++) {
                    if (s[i] == '?') {
                        query_at = i;
                        break;
                    }
                }

                std::string segment;
                for (dp::usize i = 0; i <= query_at; i++) {
                    if (i == query_at || s[i] == '/') {
                        if (!segment.empty()) {
                            add_string_option(options::URI_PATH, dp::String(segment.c_str()));
                            segment.clear();
                        }
                        continue;
                    }
                    segment.push_back(s[i]);
                }

                for (dp::usize i = query_at + 1; i <= len && query_at < len; i++) {
                    if (i == len || s[i] == '&') {
                        if (!segment.empty()) {
                            add_string_option(options::URI_QUERY, dp::String(segment.c_str()));
                            segment.clear();
                        }
                        continue;
                    }
                    segment.push_back(s[i]);
                }
            }

            dp::String uri_path() const {
                std::string path;
                for (const auto &opt : options) {
                    if (opt.number == options::URI_PATH) {
                        path.push_back('/');
                        path.append(reinterpret_cast<const char *>(opt.value.data()), opt.value.size());
                    }
                }
                if (path.empty()) {
                    path = "/";
                }
                return dp::String(path.c_str());
            }

            dp::String payload_string() const {
                return dp::String(reinterpret_cast<const char *>(payload.data()), payload.size());
            }

            void set_payload(const dp::String &text) { payload = Buffer(text.begin(), text.end()); }

            /// One-line summary for logs
            dp::String line() const {
                std::ostringstream out;
                out << reliant::coap::to_string(type) << " mid=";
                if (mid.has_value()) {
                    out << *mid;
                } else {
                    out << "-";
                }
                out << " code=" << static_cast<int>(code_class()) << "." << (code_detail() < 10 ? "0" : "")
                    << static_cast<int>(code_detail()) << " token=" << to_hex(token).c_str()
                    << " payload=" << payload.size() << "B";
                return dp::String(out.str().c_str());
            }

            /// Multi-line dump for the command-line client
            dp::String to_string() const {
                std::ostringstream out;
                out << "Type: " << reliant::coap::to_string(type) << "\n";
                out << "MID: ";
                if (mid.has_value()) {
                    out << *mid;
                } else {
                    out << "-";
                }
                out << "\n";
                out << "Code: " << static_cast<int>(code_class()) << "." << (code_detail() < 10 ? "0" : "")
                    << static_cast<int>(code_detail()) << " " << code_name(code) << "\n";
                out << "Token: " << to_hex(token).c_str() << "\n";
                for (const auto &opt : options) {
                    out << "Option " << opt.number << ": ";
                    bool printable = !opt.value.empty();
                    for (auto b : opt.value) {
                        if (b < 0x20 || b > 0x7E) {
                            printable = false;
                            break;
                        }
                    }
                    if (printable) {
                        out << std::string(reinterpret_cast<const char *>(opt.value.data()), opt.value.size());
                    } else {
                        out << "0x" << to_hex(opt.value).c_str();
                    }
                    out << "\n";
                }
                if (!payload.empty()) {
                    out << "Payload: " << std::string(reinterpret_cast<const char *>(payload.data()), payload.size())
                        << "\n";
                }
                return dp::String(out.str().c_str());
            }
        };

        /// Build a request for a method code and "/path?query"
        inline Message make_request(dp::u8 method, const dp::String &uri,
                                    MessageType type = MessageType::Confirmable) {
            Message request;
            request.type = type;
            request.code = method;
            request.set_uri_path(uri);
            return request;
        }

        /// Build an empty ACK or RST answering mid
        inline Message make_empty(MessageType type, dp::u16 mid) {
            Message message;
            message.type = type;
            message.code = codes::EMPTY;
            message.mid = mid;
            return message;
        }

        inline bool is_success(const Message &response) { return response.code_class() == 2; }

    } // namespace coap
} // namespace reliant
