#include "scripted_transport.hpp"

#include <atomic>
#include <chrono>
#include <doctest/doctest.h>
#include <reliant/engine/engine.hpp>
#include <set>
#include <thread>

using namespace reliant_test;
using reliant::Buffer;
using reliant::IoDecision;
using reliant::coap::Message;
using reliant::coap::MessageType;
namespace codes = reliant::coap::codes;
namespace options = reliant::coap::options;

using TestEngine = reliant::Engine<ScriptedTransport>;
using Clock = std::chrono::steady_clock;

namespace {

    struct Fixture {
        std::shared_ptr<ScriptedTransport::Script> script = std::make_shared<ScriptedTransport::Script>();
        CallbackLog log;
        TestEngine::Options options;

        Fixture() {
            options.params = fast_params();
            options.callback = log.callback();
        }

        std::unique_ptr<TestEngine> engine() {
            auto engine =
                std::make_unique<TestEngine>(std::make_unique<ScriptedTransport>(script), scripted_peer(), options);
            auto res = engine->open();
            REQUIRE(res.is_ok());
            return engine;
        }

        // Answer every request with a piggybacked 2.05
        void answer_requests(const char *payload = "ok") {
            std::string text(payload);
            script->responder = [text](const Message &sent) {
                std::vector<Buffer> replies;
                if (sent.is_request()) {
                    replies.push_back(piggybacked(sent, codes::CONTENT, text.c_str()));
                }
                return replies;
            };
        }
    };

    Message get(const char *path, MessageType type = MessageType::Confirmable) {
        return reliant::coap::make_request(codes::GET, path, type);
    }

    template <typename Pred> bool eventually(Pred pred, dp::u32 timeout_ms = 2000) {
        auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        while (Clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    dp::usize count_sent(ScriptedTransport::Script &script, MessageType type, dp::u16 mid) {
        dp::usize count = 0;
        for (dp::usize i = 0; i < script.sent_count(); i++) {
            Message message = script.sent_message(i);
            if (message.type == type && message.mid == mid && message.is_empty()) {
                count++;
            }
        }
        return count;
    }

} // namespace

TEST_CASE("Engine - Confirmable send acknowledged after two lost attempts") {
    Fixture f;
    f.script->drop_sends = 2;
    f.answer_requests("21.5");
    auto engine = f.engine();

    Message request = get("/temp");
    request.mid = 1;

    auto start = Clock::now();
    auto res = engine->send(request);
    REQUIRE(res.is_ok());
    CHECK(res.value() == 1);

    REQUIRE(f.log.wait_for(1, 3000));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();

    auto response = f.log.at(0);
    REQUIRE(response.has_value());
    CHECK(response->payload_string() == "21.5");
    CHECK(*response->mid == 1);

    // Original plus two retransmissions, all byte-identical
    REQUIRE(f.script->sent_count() == 3);
    CHECK(reliant::same_bytes(f.script->sent_at(0), f.script->sent_at(1)));
    CHECK(reliant::same_bytes(f.script->sent_at(0), f.script->sent_at(2)));
    CHECK(engine->metrics().retransmissions.load() == 2);

    // ACK_TIMEOUT x (1 + 2) with a random factor of 1.0
    CHECK(elapsed >= 110);
    CHECK(elapsed < 1500);

    CHECK(engine->pending_count() == 0);
    CHECK(engine->live_task_count() == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(f.log.size() == 1);
    CHECK(f.script->sent_count() == 3);
}

TEST_CASE("Engine - Confirmable send that is never answered") {
    Fixture f;
    auto engine = f.engine();

    Message request = get("/temp");
    request.mid = 7;
    REQUIRE(engine->send(request).is_ok());

    REQUIRE(f.log.wait_for(1, 5000));
    CHECK_FALSE(f.log.at(0).has_value());

    // One original and exactly max_retransmit retransmissions
    CHECK(f.script->sent_count() == 1 + f.options.params.max_retransmit);
    CHECK(engine->metrics().retransmissions.load() == f.options.params.max_retransmit);
    CHECK(engine->metrics().delivery_timeouts.load() == 1);
    CHECK(eventually([&] { return engine->live_task_count() == 0; }));
    CHECK(engine->pending_count() == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(f.log.size() == 1);
    CHECK_FALSE(engine->is_stopped());
}

TEST_CASE("Engine - Retransmission stops promptly after the ACK") {
    Fixture f;
    f.options.params = fast_params(2000);
    f.answer_requests();
    auto engine = f.engine();

    auto start = Clock::now();
    REQUIRE(engine->send(get("/fast")).is_ok());
    REQUIRE(f.log.wait_for(1, 1000));
    CHECK(eventually([&] { return engine->live_task_count() == 0; }, 500));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    CHECK(elapsed < 1000);
    CHECK(f.script->sent_count() == 1);
}

TEST_CASE("Engine - Mid allocation") {
    Fixture f;
    f.options.params = fast_params(5000);
    auto engine = f.engine();

    SUBCASE("Reusing a live mid fails") {
        Message request = get("/a");
        request.mid = 10;
        REQUIRE(engine->send(request).is_ok());

        Message again = get("/b");
        again.mid = 10;
        auto res = engine->send(again);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "duplicate mid");
        CHECK(engine->pending_count() == 1);
    }

    SUBCASE("Allocated mids are unique among live transactions") {
        std::set<dp::u16> mids;
        for (int i = 0; i < 50; i++) {
            auto res = engine->send(get("/many"));
            REQUIRE(res.is_ok());
            mids.insert(res.value());
        }
        CHECK(mids.size() == 50);
        CHECK(engine->pending_count() == 50);
        CHECK(eventually([&] { return engine->live_task_count() == 50; }));
    }

    SUBCASE("Counter wraps and is settable") {
        CHECK(engine->set_current_mid(70000).is_err());
        REQUIRE(engine->set_current_mid(0xFFFF).is_ok());
        CHECK(engine->current_mid() == 0xFFFF);
        CHECK(engine->send(get("/w")).value() == 0xFFFF);
        CHECK(engine->send(get("/w")).value() == 0);
        CHECK(engine->current_mid() == 1);
    }

    SUBCASE("Starting mid option") {
        Fixture g;
        g.options.starting_mid = 300;
        auto seeded = g.engine();
        CHECK(seeded->current_mid() == 300);
        seeded->close();
    }

    engine->close();
}

TEST_CASE("Engine - Close with retransmissions in flight") {
    Fixture f;
    f.options.params = fast_params(10000);
    auto engine = f.engine();

    for (int i = 0; i < 20; i++) {
        REQUIRE(engine->send(get("/slow")).is_ok());
    }
    REQUIRE(eventually([&] { return engine->live_task_count() == 20; }));

    auto start = Clock::now();
    engine->close();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();

    CHECK(elapsed < 1000);
    CHECK(engine->live_task_count() == 0);
    CHECK(engine->pending_count() == 0);
    CHECK_FALSE(engine->receiver_running());
    CHECK(f.script->close_calls == 1);

    SUBCASE("Second close is a no-op") {
        engine->close();
        CHECK(f.script->close_calls == 1);
    }

    SUBCASE("Send after close fails") {
        auto res = engine->send(get("/late"));
        REQUIRE(res.is_err());
        CHECK(res.error().message == "engine stopped");
    }

    // Every abandoned exchange is reported once
    REQUIRE(f.log.size() == 20);
    CHECK_FALSE(f.log.at(0).has_value());
}

TEST_CASE("Engine - Non-confirmable send") {
    Fixture f;
    f.script->responder = [](const Message &sent) {
        std::vector<Buffer> replies;
        if (sent.is_request()) {
            Message response;
            response.type = MessageType::NonConfirmable;
            response.code = codes::CONTENT;
            response.mid = 0x4000;
            response.token = sent.token;
            replies.push_back(reliant::coap::encode(response).value());
        }
        return replies;
    };
    auto engine = f.engine();

    auto res = engine->send(get("/non", MessageType::NonConfirmable));
    REQUIRE(res.is_ok());
    CHECK(engine->live_task_count() == 0);

    REQUIRE(f.log.wait_for(1, 1000));
    REQUIRE(f.log.at(0).has_value());
    CHECK(f.log.at(0)->code == codes::CONTENT);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    CHECK(f.script->sent_count() == 1);
    CHECK(engine->metrics().retransmissions.load() == 0);
}

TEST_CASE("Engine - Unanswered non-confirmable requests expire") {
    Fixture f;
    f.options.params.non_lifetime_ms = 100;
    auto engine = f.engine();

    const dp::usize count = 20;
    dp::u16 first_mid = 0;
    for (dp::usize i = 0; i < count; i++) {
        auto res = engine->send(get("/lost", MessageType::NonConfirmable));
        REQUIRE(res.is_ok());
        if (i == 0) {
            first_mid = res.value();
        }
    }
    CHECK(engine->pending_count() == count);
    CHECK(engine->live_task_count() == 0);

    REQUIRE(f.log.wait_for(count, 2000));
    for (dp::usize i = 0; i < count; i++) {
        CHECK_FALSE(f.log.at(i).has_value());
    }
    CHECK(engine->pending_count() == 0);
    CHECK(engine->transactions().token_count() == 0);
    CHECK(engine->metrics().expired.load() == count);
    CHECK(engine->metrics().delivery_timeouts.load() == 0);
    CHECK(f.script->sent_count() == count);

    // An answer after the lifetime finds nothing to resolve
    Message late;
    late.type = MessageType::NonConfirmable;
    late.code = codes::CONTENT;
    late.mid = 0x6000;
    late.token = f.script->sent_message(0).token;
    f.script->inject(late);
    CHECK(eventually([&] { return engine->metrics().discarded.load() == 1; }));
    CHECK(f.log.size() == count);

    // Expired mids are free again
    REQUIRE(engine->set_current_mid(first_mid).is_ok());
    auto again = engine->send(get("/again", MessageType::NonConfirmable));
    REQUIRE(again.is_ok());
    CHECK(again.value() == first_mid);
}

TEST_CASE("Engine - No-Response requests") {
    Fixture f;
    auto engine = f.engine();

    Message silent = get("/fire", MessageType::NonConfirmable);
    silent.add_uint_option(options::NO_RESPONSE, reliant::coap::NO_RESPONSE_ALL);

    SUBCASE("Fresh engine does not start the receiver") {
        REQUIRE(engine->send(silent).is_ok());
        CHECK(f.script->sent_count() == 1);
        CHECK_FALSE(engine->receiver_running());
        CHECK(engine->live_task_count() == 0);
        CHECK(engine->pending_count() == 0);
    }

    SUBCASE("A running receiver is left running") {
        f.answer_requests();
        REQUIRE(engine->send(get("/first")).is_ok());
        REQUIRE(f.log.wait_for(1, 1000));
        REQUIRE(engine->receiver_running());

        {
            std::lock_guard<std::mutex> lock(f.script->mutex);
            f.script->responder = nullptr;
        }
        REQUIRE(engine->send(silent).is_ok());
        CHECK(engine->receiver_running());
    }
}

TEST_CASE("Engine - Lifecycle errors") {
    SUBCASE("Send before open") {
        auto script = std::make_shared<ScriptedTransport::Script>();
        TestEngine engine(std::make_unique<ScriptedTransport>(script), scripted_peer());
        auto res = engine.send(get("/x"));
        REQUIRE(res.is_err());
        CHECK(res.error().message == "engine not open");
        CHECK(script->sent_count() == 0);
    }

    SUBCASE("Transport unavailable") {
        auto script = std::make_shared<ScriptedTransport::Script>();
        script->fail_open = true;
        TestEngine engine(std::make_unique<ScriptedTransport>(script), scripted_peer());
        CHECK(engine.open().is_err());
        CHECK(engine.send(get("/x")).is_err());
    }

    SUBCASE("Responses cannot be sent") {
        Fixture f;
        auto engine = f.engine();
        Message response;
        response.code = codes::CONTENT;
        CHECK(engine->send(response).is_err());
    }
}

TEST_CASE("Engine - Read error policy") {
    SUBCASE("Without a policy the receiver stops the engine") {
        Fixture f;
        f.options.params = fast_params(5000);
        auto engine = f.engine();
        REQUIRE(engine->send(get("/x")).is_ok());
        REQUIRE(eventually([&] { return engine->receiver_running(); }));

        f.script->inject_read_error(dp::Error::io_error("link failure"));
        CHECK(eventually([&] { return engine->is_stopped() && !engine->receiver_running(); }));
        CHECK(eventually([&] { return engine->live_task_count() == 0; }));

        auto res = engine->send(get("/y"));
        REQUIRE(res.is_err());
        CHECK(res.error().message == "engine stopped");
    }

    SUBCASE("Continue keeps receiving") {
        Fixture f;
        std::atomic<int> consulted{0};
        f.options.read_policy = [&](const dp::Error &error, TestEngine &) {
            consulted++;
            CHECK(error.message == "link busy");
            return IoDecision::Continue;
        };
        f.options.params = fast_params(5000);
        auto engine = f.engine();

        Message request = get("/x");
        request.mid = 50;
        request.token = {0x50};
        REQUIRE(engine->send(request).is_ok());

        f.script->inject_read_error(dp::Error::io_error("link busy"));
        f.script->inject(piggybacked(request, codes::CONTENT));

        REQUIRE(f.log.wait_for(1, 1000));
        CHECK(f.log.at(0).has_value());
        CHECK(consulted == 1);
        CHECK_FALSE(engine->is_stopped());
        CHECK(engine->metrics().read_errors.load() == 1);
    }

    SUBCASE("Escalate stops like no policy") {
        Fixture f;
        f.options.read_policy = [](const dp::Error &, TestEngine &) { return IoDecision::Escalate; };
        auto engine = f.engine();
        REQUIRE(engine->send(get("/x", MessageType::NonConfirmable)).is_ok());
        f.script->inject_read_error(dp::Error::io_error("gone"));
        CHECK(eventually([&] { return engine->is_stopped(); }));
    }
}

TEST_CASE("Engine - Write error policy") {
    SUBCASE("Without a policy the error reaches the caller") {
        Fixture f;
        f.script->fail_writes = 1;
        auto engine = f.engine();
        auto res = engine->send(get("/x"));
        REQUIRE(res.is_err());
        CHECK(res.error().message == "scripted write failure");
        CHECK(engine->pending_count() == 0);
        CHECK(engine->live_task_count() == 0);
        CHECK(engine->metrics().write_errors.load() == 1);
    }

    SUBCASE("Continue swallows the error and retransmission recovers") {
        Fixture f;
        f.options.write_policy = [](const dp::Error &, TestEngine &) { return IoDecision::Continue; };
        f.script->fail_writes = 1;
        f.answer_requests();
        auto engine = f.engine();

        REQUIRE(engine->send(get("/x")).is_ok());
        REQUIRE(f.log.wait_for(1, 2000));
        CHECK(f.log.at(0).has_value());
        CHECK(f.script->sent_count() == 1); // the failed write never reached the wire
    }

    SUBCASE("Escalate on retransmission is a delivery failure") {
        Fixture f;
        f.options.write_policy = [](const dp::Error &, TestEngine &) { return IoDecision::Escalate; };
        f.options.params = fast_params(100);
        f.script->drop_sends = 1;
        auto engine = f.engine();

        REQUIRE(engine->send(get("/x")).is_ok());
        {
            std::lock_guard<std::mutex> lock(f.script->mutex);
            f.script->fail_writes = 1;
        }

        REQUIRE(f.log.wait_for(1, 2000));
        CHECK_FALSE(f.log.at(0).has_value());
        CHECK(engine->metrics().write_errors.load() == 1);
        CHECK(engine->metrics().retransmissions.load() == 0);
        CHECK(engine->pending_count() == 0);
    }
}

TEST_CASE("Engine - Write policy may call back into the engine") {
    Fixture f;
    f.script->drop_sends = 1;
    Buffer token = {0x0F, 0x0E};
    std::atomic<int> policy_calls{0};
    f.options.write_policy = [&](const dp::Error &, TestEngine &engine) {
        policy_calls++;
        engine.cancel_observing(token);
        return IoDecision::Continue;
    };
    auto engine = f.engine();

    Message request = get("/busy");
    request.token = token;
    REQUIRE(engine->send(request).is_ok());
    {
        std::lock_guard<std::mutex> lock(f.script->mutex);
        f.script->fail_writes = 1;
    }

    // First retransmission fails, the policy drops the exchange, the task still runs out
    REQUIRE(f.log.wait_for(1, 3000));
    CHECK_FALSE(f.log.at(0).has_value());
    CHECK(policy_calls == 1);
    CHECK_FALSE(engine->transactions().contains_token(token));
    CHECK(eventually([&] { return engine->live_task_count() == 0; }));
}

TEST_CASE("Engine - Close while a confirmable send is being written") {
    Fixture f;
    std::atomic<TestEngine *> target{nullptr};
    f.script->responder = [&target](const Message &) {
        TestEngine *engine = target.exchange(nullptr);
        if (engine != nullptr) {
            std::thread closer([engine]() { engine->close(); });
            closer.join();
        }
        return std::vector<Buffer>();
    };
    auto engine = f.engine();
    target = engine.get();

    auto res = engine->send(get("/late"));
    REQUIRE(res.is_err());
    CHECK(res.error().message == "engine stopped");
    CHECK(engine->pending_count() == 0);
    CHECK(engine->live_task_count() == 0);
    CHECK(engine->is_stopped());
    CHECK(f.script->close_calls == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(f.log.size() == 0);
}

TEST_CASE("Engine - Malformed datagrams are discarded") {
    Fixture f;
    f.options.params = fast_params(5000);
    auto engine = f.engine();

    Message request = get("/x");
    request.mid = 60;
    request.token = {0x60};
    REQUIRE(engine->send(request).is_ok());

    f.script->inject(Buffer{0x00, 0x01});
    f.script->inject(Buffer{0x4F, 0x01, 0x00, 0x01});
    f.script->inject(piggybacked(request, codes::CHANGED));

    REQUIRE(f.log.wait_for(1, 1000));
    CHECK(f.log.at(0)->code == codes::CHANGED);
    CHECK(engine->metrics().decode_errors.load() == 2);
    CHECK(engine->receiver_running());
}

TEST_CASE("Engine - Separate response") {
    Fixture f;
    f.script->responder = [](const Message &sent) {
        std::vector<Buffer> replies;
        if (sent.is_request()) {
            replies.push_back(empty_reply(MessageType::Acknowledgement, *sent.mid));
        }
        return replies;
    };
    auto engine = f.engine();

    Message request = get("/slow");
    request.token = {0x0A, 0x0B};
    auto res = engine->send(request);
    REQUIRE(res.is_ok());

    // Empty ACK stops retransmission but keeps the exchange open
    REQUIRE(eventually([&] { return engine->live_task_count() == 0; }));
    CHECK(f.log.size() == 0);
    CHECK(engine->transactions().contains_token(request.token));

    Message response;
    response.type = MessageType::Confirmable;
    response.code = codes::CONTENT;
    response.mid = 0x5000;
    response.token = request.token;
    response.set_payload("done");
    f.script->inject(response);

    REQUIRE(f.log.wait_for(1, 1000));
    CHECK(f.log.at(0)->payload_string() == "done");
    CHECK(eventually([&] { return count_sent(*f.script, MessageType::Acknowledgement, 0x5000) == 1; }));
    CHECK_FALSE(engine->transactions().contains_token(request.token));

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    CHECK(f.log.size() == 1);
    CHECK(engine->metrics().retransmissions.load() == 0);
}

TEST_CASE("Engine - Acknowledged exchange without a separate response expires") {
    Fixture f;
    f.options.params.exchange_lifetime_ms = 100;
    f.script->responder = [](const Message &sent) {
        std::vector<Buffer> replies;
        if (sent.is_request()) {
            replies.push_back(empty_reply(MessageType::Acknowledgement, *sent.mid));
        }
        return replies;
    };
    auto engine = f.engine();

    Message request = get("/slow");
    request.token = {0x0C, 0x0D};
    REQUIRE(engine->send(request).is_ok());

    REQUIRE(f.log.wait_for(1, 2000));
    CHECK_FALSE(f.log.at(0).has_value());
    CHECK(engine->pending_count() == 0);
    CHECK_FALSE(engine->transactions().contains_token(request.token));
    CHECK(engine->metrics().acknowledged.load() == 1);
    CHECK(engine->metrics().expired.load() == 1);
    CHECK(engine->metrics().delivery_timeouts.load() == 0);
    CHECK(engine->metrics().retransmissions.load() == 0);

    // The separate response shows up too late and is reset
    Message response;
    response.type = MessageType::Confirmable;
    response.code = codes::CONTENT;
    response.mid = 0x5100;
    response.token = request.token;
    f.script->inject(response);
    CHECK(eventually([&] { return count_sent(*f.script, MessageType::Reset, 0x5100) == 1; }));
    CHECK(f.log.size() == 1);
}

TEST_CASE("Engine - Reset resolves without a response callback") {
    Fixture f;
    f.script->responder = [](const Message &sent) {
        std::vector<Buffer> replies;
        if (sent.is_request()) {
            replies.push_back(empty_reply(MessageType::Reset, *sent.mid));
        }
        return replies;
    };
    std::mutex mutex;
    std::vector<dp::String> rejected;
    f.options.reject_callback = [&](const Message &request) {
        std::lock_guard<std::mutex> lock(mutex);
        rejected.push_back(request.uri_path());
    };
    auto engine = f.engine();

    REQUIRE(engine->send(get("/nope")).is_ok());
    CHECK(eventually([&] { return engine->metrics().rejected.load() == 1; }));
    CHECK(eventually([&] { return engine->pending_count() == 0 && engine->live_task_count() == 0; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(f.log.size() == 0);
    CHECK(f.script->sent_count() == 1);

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(rejected.size() == 1);
    CHECK(rejected[0] == "/nope");
}

TEST_CASE("Engine - Unsolicited traffic") {
    Fixture f;
    f.options.params = fast_params(5000);
    auto engine = f.engine();
    REQUIRE(engine->send(get("/start")).is_ok());
    REQUIRE(eventually([&] { return engine->receiver_running(); }));

    SUBCASE("Unknown confirmable response is reset") {
        Message stray;
        stray.type = MessageType::Confirmable;
        stray.code = codes::CONTENT;
        stray.mid = 0x6000;
        stray.token = {0x99, 0x99};
        f.script->inject(stray);
        CHECK(eventually([&] { return count_sent(*f.script, MessageType::Reset, 0x6000) == 1; }));
    }

    SUBCASE("Unknown ACK is discarded") {
        f.script->inject(empty_reply(MessageType::Acknowledgement, 0x6001));
        CHECK(eventually([&] { return engine->metrics().discarded.load() == 1; }));
        CHECK(engine->pending_count() == 1);
    }

    SUBCASE("Ping is answered with reset") {
        f.script->inject(empty_reply(MessageType::Confirmable, 0x6002));
        CHECK(eventually([&] { return count_sent(*f.script, MessageType::Reset, 0x6002) == 1; }));
    }

    CHECK(f.log.size() == 0);
}

TEST_CASE("Engine - Observe subscription") {
    Fixture f;
    f.script->responder = [](const Message &sent) {
        std::vector<Buffer> replies;
        if (sent.is_request()) {
            Message response;
            response.type = MessageType::Acknowledgement;
            response.code = codes::CONTENT;
            response.mid = sent.mid;
            response.token = sent.token;
            response.add_uint_option(options::OBSERVE, 1);
            response.set_payload("20");
            replies.push_back(reliant::coap::encode(response).value());
        }
        return replies;
    };
    auto engine = f.engine();

    Message request = get("/temp");
    request.token = {0x0B, 0x5E};
    request.add_uint_option(options::OBSERVE, reliant::coap::OBSERVE_REGISTER);
    REQUIRE(engine->send(request).is_ok());
    REQUIRE(f.log.wait_for(1, 1000));
    CHECK(engine->transactions().contains_token(request.token));
    CHECK(engine->pending_count() == 0);

    auto notify = [&](dp::u16 mid, dp::u32 sequence, MessageType type) {
        Message note;
        note.type = type;
        note.code = codes::CONTENT;
        note.mid = mid;
        note.token = request.token;
        note.add_uint_option(options::OBSERVE, sequence);
        note.set_payload("21");
        f.script->inject(note);
    };

    notify(0x7000, 2, MessageType::NonConfirmable);
    notify(0x7001, 3, MessageType::Confirmable);
    REQUIRE(f.log.wait_for(3, 1000));
    CHECK(f.log.at(2)->observe().value() == 3);
    CHECK(eventually([&] { return count_sent(*f.script, MessageType::Acknowledgement, 0x7001) == 1; }));
    CHECK(engine->metrics().notifications.load() == 3);

    CHECK(engine->cancel_observing(request.token));
    CHECK_FALSE(engine->cancel_observing(request.token));

    notify(0x7002, 4, MessageType::Confirmable);
    CHECK(eventually([&] { return count_sent(*f.script, MessageType::Reset, 0x7002) == 1; }));
    CHECK(f.log.size() == 3);
}

namespace {

    // Asks for a second block once, then completes
    class TwoBlockLayer : public reliant::BlockLayer {
      public:
        int rounds = 0;

        void receive_response(reliant::Transaction &transaction) override {
            rounds++;
            transaction.block_transfer = rounds == 1;
            if (transaction.block_transfer) {
                transaction.request.remove_option(options::BLOCK2);
                transaction.request.add_uint_option(options::BLOCK2, 0x16); // num 1, szx 6
            }
        }
    };

} // namespace

TEST_CASE("Engine - Block transfer continuation") {
    Fixture f;
    auto layer = std::make_shared<TwoBlockLayer>();
    f.options.block_layer = layer;
    f.answer_requests("part");
    auto engine = f.engine();

    Message request = get("/big");
    request.token = {0xB1};
    auto res = engine->send(request);
    REQUIRE(res.is_ok());

    REQUIRE(f.log.wait_for(1, 2000));
    CHECK(layer->rounds == 2);
    REQUIRE(f.script->sent_count() == 2);

    Message first = f.script->sent_message(0);
    Message second = f.script->sent_message(1);
    CHECK(*first.mid != *second.mid);
    CHECK(reliant::same_bytes(first.token, second.token));
    CHECK_FALSE(first.has_option(options::BLOCK2));
    CHECK(second.uint_option(options::BLOCK2).value() == 0x16);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(f.log.size() == 1);
    CHECK(engine->pending_count() == 0);
}

TEST_CASE("Engine - Concurrent senders") {
    Fixture f;
    f.answer_requests();
    auto engine = f.engine();

    std::vector<std::thread> senders;
    for (int t = 0; t < 4; t++) {
        senders.emplace_back([&]() {
            for (int i = 0; i < 10; i++) {
                CHECK(engine->send(get("/c")).is_ok());
            }
        });
    }
    for (auto &th : senders) {
        th.join();
    }

    REQUIRE(f.log.wait_for(40, 3000));
    CHECK(eventually([&] { return engine->pending_count() == 0 && engine->live_task_count() == 0; }));
    CHECK(engine->metrics().responses.load() == 40);
}
