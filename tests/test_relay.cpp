#include <catch2/catch.hpp>
#include "relay.hpp"
#include "mock_http_client.hpp"

#include <thread>
#include <vector>

using namespace smsrelay;

static SmsMessage make_sms(const std::string& body = "hello") {
    SmsMessage sms;
    sms.sender = "+1";
    sms.body = body;
    sms.timestamp = 1000;
    return sms;
}

TEST_CASE("Relay: nothing active reports failure", "[relay_slot]") {
    MockHttpClient http;
    Relay relay(http);
    REQUIRE_FALSE(relay.active().has_value());
    REQUIRE(relay.active_tag().empty());
    REQUIRE_FALSE(relay.relay(make_sms()));
    REQUIRE(relay.failed_count() == 1);
    REQUIRE(http.call_count == 0);
}

TEST_CASE("Relay: activate record and relay", "[relay_slot]") {
    MockHttpClient http;
    Relay relay(http);
    relay.activate_record(ConfigJson::parse(R"({"TelegramBotForwarder": {"token": "T", "chatId": 42}})"));

    REQUIRE(relay.active_tag() == "TelegramBotForwarder");
    REQUIRE(relay.relay(make_sms()));
    REQUIRE(relay.delivered_count() == 1);
    REQUIRE(http.last_url.rfind("https://api.telegram.org/botT/sendMessage?chat_id=42&", 0) == 0);
}

TEST_CASE("Relay: invalid record keeps the previous forwarder", "[relay_slot]") {
    MockHttpClient http;
    Relay relay(http);
    relay.activate(TelegramBotForwarder("T", 1));

    REQUIRE_THROWS_AS(
        relay.activate_record(ConfigJson::parse(R"({"TelegramBotForwarder": {"token": "T"}})")),
        ConfigError);
    REQUIRE(relay.active_tag() == "TelegramBotForwarder");
    REQUIRE(std::get<TelegramBotForwarder>(*relay.active()).chat_id() == 1);
}

TEST_CASE("Relay: non-object record blocks activation", "[relay_slot]") {
    MockHttpClient http;
    Relay relay(http);
    REQUIRE_THROWS_AS(relay.activate_record(ConfigJson("garbage")), ConfigError);
    REQUIRE_THROWS_AS(relay.activate_record(ConfigJson(5)), ConfigError);
    REQUIRE_FALSE(relay.active().has_value());
}

TEST_CASE("Relay: failures do not block later messages", "[relay_slot]") {
    MockHttpClient http;
    http.response_queue = {{500, ""}, {0, ""}, {200, ""}};
    Relay relay(http);
    relay.activate(HttpCallbackForwarder("http://h/cb"));

    REQUIRE_FALSE(relay.relay(make_sms("one")));
    REQUIRE_FALSE(relay.relay(make_sms("two")));
    REQUIRE(relay.relay(make_sms("three")));
    REQUIRE(relay.failed_count() == 2);
    REQUIRE(relay.delivered_count() == 1);
    REQUIRE(http.last_body.find("body=three") != std::string::npos);
}

TEST_CASE("Relay: transport exception is a failed delivery", "[relay_slot]") {
    MockHttpClient http;
    http.throw_on_request = true;
    Relay relay(http);
    relay.activate(HttpCallbackForwarder("http://h/cb"));
    REQUIRE_NOTHROW(relay.relay(make_sms()));
    REQUIRE(relay.failed_count() == 1);
}

TEST_CASE("Relay: swap replaces the active forwarder", "[relay_slot]") {
    MockHttpClient http;
    Relay relay(http);
    relay.activate(HttpCallbackForwarder("http://first/cb"));
    relay.activate(HttpCallbackForwarder("http://second/cb"));

    relay.relay(make_sms());
    REQUIRE(http.last_url.rfind("http://second/cb?", 0) == 0);

    relay.deactivate();
    REQUIRE_FALSE(relay.relay(make_sms()));
}

TEST_CASE("Relay: check_linked only applies to managed relay", "[relay_slot]") {
    MockHttpClient http;
    Relay relay(http);
    REQUIRE_FALSE(relay.check_linked().has_value());

    relay.activate(StdoutForwarder());
    REQUIRE_FALSE(relay.check_linked().has_value());
}

TEST_CASE("Relay: check_linked updates the active value", "[relay_slot]") {
    MockHttpClient http;
    http.next_response = {200, ""};
    Relay relay(http);
    relay.activate(ManagedRelayForwarder("alice", "https://r.example", "bot", "ABCDEFGH"));

    auto linked = relay.check_linked();
    REQUIRE(linked.has_value());
    REQUIRE(*linked);
    REQUIRE(std::get<ManagedRelayForwarder>(*relay.active()).linked());

    http.next_response = {404, ""};
    REQUIRE(relay.check_linked() == false);
    REQUIRE_FALSE(std::get<ManagedRelayForwarder>(*relay.active()).linked());
}

// Thread-safe client that only counts calls
class CountingHttpClient : public HttpClient {
public:
    std::atomic<int> calls{0};
    HttpResponse request(HttpMethod, const std::string&, const std::string&,
                         const std::vector<Header>&) override {
        calls++;
        return {200, ""};
    }
};

TEST_CASE("Relay: concurrent relays and swaps are independent", "[relay_slot]") {
    CountingHttpClient http;
    Relay relay(http);
    relay.activate(HttpCallbackForwarder("http://h/a"));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&relay]() {
            for (int i = 0; i < 25; ++i) relay.relay(make_sms());
        });
    }
    threads.emplace_back([&relay]() {
        for (int i = 0; i < 25; ++i)
            relay.activate(HttpCallbackForwarder(i % 2 ? "http://h/a" : "http://h/b"));
    });
    for (auto& th : threads) th.join();

    REQUIRE(http.calls.load() == 100);
    REQUIRE(relay.delivered_count() == 100);
    REQUIRE(relay.failed_count() == 0);
}
