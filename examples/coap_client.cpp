#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <reliant/reliant.hpp>
#include <thread>

namespace {

    struct Args {
        dp::String link; // "udp" or "xbee"
        dp::String host;
        dp::u16 port = 5683;
        dp::String device;
        dp::u32 baud = 9600;
        dp::String address;
        dp::String node_id;
        dp::String operation = "DISCOVER";
        dp::String resource;
        dp::String payload;
        bool has_payload = false;
        dp::u32 observe_seconds = 30;
    };

    void usage(const char *prog) {
        echo::info("Usage:");
        echo::info("  ", prog, " udp <host> <port> [options]");
        echo::info("  ", prog, " xbee <device> [--baud N] (--address HEX | --node-id NAME) [options]");
        echo::info("Options:");
        echo::info("  --operation GET|PUT|POST|DELETE|DISCOVER|OBSERVE   (default DISCOVER)");
        echo::info("  --resource /path                                   required unless DISCOVER");
        echo::info("  --payload TEXT                                     required for PUT and POST");
        echo::info("  --observe-seconds N                                how long OBSERVE listens (default 30)");
    }

    bool parse_u32(const char *text, dp::u32 &out) {
        char *end = nullptr;
        unsigned long value = std::strtoul(text, &end, 10);
        if (end == text || *end != '\0' || value > 0xFFFFFFFFul) {
            return false;
        }
        out = static_cast<dp::u32>(value);
        return true;
    }

    bool parse_args(int argc, char **argv, Args &args) {
        if (argc < 3) {
            return false;
        }

        args.link = argv[1];
        int i = 2;
        if (args.link == "udp") {
            if (argc < 4) {
                return false;
            }
            args.host = argv[2];
            dp::u32 port = 0;
            if (!parse_u32(argv[3], port) || port == 0 || port > 0xFFFF) {
                echo::error("invalid port: ", argv[3]);
                return false;
            }
            args.port = static_cast<dp::u16>(port);
            i = 4;
        } else if (args.link == "xbee") {
            args.device = argv[2];
            i = 3;
        } else {
            echo::error("unknown link: ", argv[1]);
            return false;
        }

        for (; i < argc; i++) {
            const char *flag = argv[i];
            if (i + 1 >= argc) {
                echo::error("missing value for ", flag);
                return false;
            }
            const char *value = argv[++i];

            if (std::strcmp(flag, "--baud") == 0) {
                if (!parse_u32(value, args.baud)) {
                    echo::error("invalid baud rate: ", value);
                    return false;
                }
            } else if (std::strcmp(flag, "--address") == 0) {
                args.address = value;
            } else if (std::strcmp(flag, "--node-id") == 0) {
                args.node_id = value;
            } else if (std::strcmp(flag, "--operation") == 0) {
                args.operation = value;
            } else if (std::strcmp(flag, "--resource") == 0) {
                args.resource = value;
            } else if (std::strcmp(flag, "--payload") == 0) {
                args.payload = value;
                args.has_payload = true;
            } else if (std::strcmp(flag, "--observe-seconds") == 0) {
                if (!parse_u32(value, args.observe_seconds)) {
                    echo::error("invalid duration: ", value);
                    return false;
                }
            } else {
                echo::error("unknown option: ", flag);
                return false;
            }
        }

        const auto &op = args.operation;
        if (op != "GET" && op != "PUT" && op != "POST" && op != "DELETE" && op != "DISCOVER" && op != "OBSERVE") {
            echo::error("unknown operation: ", op.c_str());
            return false;
        }
        if (args.link == "xbee" && args.address.empty() == args.node_id.empty()) {
            echo::error("xbee needs exactly one of --address and --node-id");
            return false;
        }
        if (!args.resource.empty() && args.resource.c_str()[0] != '/') {
            echo::error("resource must start with /");
            return false;
        }
        if (op != "DISCOVER" && args.resource.empty()) {
            echo::error("resource must not be empty for a ", op.c_str(), " request");
            return false;
        }
        if ((op == "PUT" || op == "POST") && !args.has_payload) {
            echo::error("payload must not be empty for a ", op.c_str(), " request");
            return false;
        }
        return true;
    }

    void print_response(const dp::Res<reliant::coap::Message> &res) {
        if (res.is_err()) {
            echo::error("request failed: ", res.error().message.c_str());
            return;
        }
        std::printf("%s", res.value().to_string().c_str());
    }

    template <typename Transport>
    dp::Res<reliant::coap::Message> perform(reliant::Client<Transport> &client, const Args &args) {
        const auto &op = args.operation;
        if (op == "GET") {
            return client.get(args.resource);
        }
        if (op == "PUT") {
            return client.put(args.resource, args.payload);
        }
        if (op == "POST") {
            return client.post(args.resource, args.payload);
        }
        if (op == "DELETE") {
            return client.del(args.resource);
        }
        if (op == "OBSERVE") {
            return client.observe(args.resource, [](const reliant::coap::Message &note) {
                std::printf("%s\n", note.to_string().c_str());
                std::fflush(stdout);
            });
        }
        return client.discover();
    }

    template <typename Transport> int run(reliant::Client<Transport> &client, const Args &args) {
        auto open_res = client.open();
        if (open_res.is_err()) {
            echo::error("cannot open link: ", open_res.error().message.c_str());
            return 1;
        }

        auto res = perform(client, args);
        print_response(res);

        if (args.operation == "OBSERVE" && res.is_ok() && res.value().observe().has_value()) {
            echo::info("observing ", args.resource.c_str(), " for ", args.observe_seconds, "s");
            std::this_thread::sleep_for(std::chrono::seconds(args.observe_seconds));
            client.cancel_observing(res.value().token);
        }

        client.close();
        return res.is_ok() ? 0 : 1;
    }

} // namespace

int main(int argc, char **argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        usage(argv[0]);
        return 1;
    }

    if (args.link == "udp") {
        reliant::UdpEndpoint server{args.host, args.port};
        reliant::Client<reliant::UdpTransport> client(std::make_unique<reliant::UdpTransport>(), server);
        return run(client, args);
    }

    auto transport = std::make_unique<reliant::XBeeTransport>(reliant::SerialEndpoint{args.device, args.baud});
    reliant::XBeeAddress remote{0};
    if (!args.address.empty()) {
        auto parsed = reliant::XBeeAddress::parse(args.address);
        if (parsed.is_err()) {
            echo::error(parsed.error().message.c_str());
            usage(argv[0]);
            return 1;
        }
        remote = parsed.value();
    } else {
        // Node discovery needs the serial port before the engine takes it over
        auto open_res = transport->open();
        if (open_res.is_err()) {
            echo::error("cannot open ", args.device.c_str(), ": ", open_res.error().message.c_str());
            return 1;
        }
        auto found = transport->discover(args.node_id);
        if (found.is_err()) {
            echo::error(found.error().message.c_str());
            return 1;
        }
        remote = found.value();
    }

    reliant::Client<reliant::XBeeTransport> client(std::move(transport), remote);
    return run(client, args);
}
