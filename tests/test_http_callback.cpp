#include <catch2/catch.hpp>
#include "forwarders/http_callback.hpp"
#include "mock_http_client.hpp"

using namespace smsrelay;

static SmsMessage make_sms(const std::string& sender = "A",
                           const std::string& body = "hi",
                           int64_t timestamp = 0) {
    SmsMessage sms;
    sms.sender = sender;
    sms.body = body;
    sms.timestamp = timestamp;
    sms.thread_id = "17";
    return sms;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ── build_request ────────────────────────────────────────────────

TEST_CASE("HttpCallbackForwarder: GET puts message and uri payload in query", "[callback]") {
    HttpCallbackForwarder fwd("http://h/cb", HttpMethod::Get, {{"k", "v"}});
    auto req = fwd.build_request(make_sms());

    REQUIRE(req.method == HttpMethod::Get);
    REQUIRE(req.url == "http://h/cb?address=A&body=hi&date=0&k=v&");
    REQUIRE(req.body.empty());
    REQUIRE_FALSE(contains(req.url, "thread_id"));
}

TEST_CASE("HttpCallbackForwarder: GET ignores body payload", "[callback]") {
    HttpCallbackForwarder fwd("http://h/cb", HttpMethod::Get, {}, {{"secret", "x"}});
    auto req = fwd.build_request(make_sms());
    REQUIRE_FALSE(contains(req.url, "secret"));
    REQUIRE(req.body.empty());
}

TEST_CASE("HttpCallbackForwarder: uri payload overrides message field in place", "[callback]") {
    HttpCallbackForwarder fwd("http://h/cb", HttpMethod::Get, {{"body", "fixed"}});
    auto req = fwd.build_request(make_sms());
    REQUIRE(req.url == "http://h/cb?address=A&body=fixed&date=0&");
}

TEST_CASE("HttpCallbackForwarder: POST sends message in body, uri payload in query", "[callback]") {
    HttpCallbackForwarder fwd("https://h/cb", HttpMethod::Post,
                              {{"api", "1"}}, {{"device", "my phone"}});
    auto req = fwd.build_request(make_sms("+1", "hello world", 1000));

    REQUIRE(req.method == HttpMethod::Post);
    REQUIRE(req.url == "https://h/cb?api=1&");
    REQUIRE(req.body == "address=%2B1&body=hello%20world&date=1000&device=my%20phone");
    REQUIRE(req.headers.size() == 1);
    REQUIRE(req.headers[0].first == "Content-Type");
    REQUIRE(req.headers[0].second == "application/x-www-form-urlencoded");
}

TEST_CASE("HttpCallbackForwarder: PUT uses PUT with the same layout", "[callback]") {
    HttpCallbackForwarder fwd("https://h/cb", HttpMethod::Put);
    auto req = fwd.build_request(make_sms());
    REQUIRE(req.method == HttpMethod::Put);
    REQUIRE(req.url == "https://h/cb?");
    REQUIRE(req.body == "address=A&body=hi&date=0");
}

TEST_CASE("HttpCallbackForwarder: thread_id is stripped from payloads", "[callback]") {
    HttpCallbackForwarder fwd("http://h", HttpMethod::Post,
                              {{"thread_id", "1"}}, {{"thread_id", "2"}, {"a", "b"}});
    REQUIRE(fwd.uri_payload().empty());
    REQUIRE(fwd.body_payload() == Fields{{"a", "b"}});
}

// ── forward ──────────────────────────────────────────────────────

TEST_CASE("HttpCallbackForwarder: forward succeeds on 200", "[callback]") {
    MockHttpClient http;
    http.next_response = {200, ""};
    HttpCallbackForwarder fwd("http://h/cb", HttpMethod::Get, {{"k", "v"}});

    REQUIRE(fwd.forward(make_sms(), http));
    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_method == HttpMethod::Get);
    REQUIRE(contains(http.last_url, "k=v"));
    REQUIRE(http.last_body.empty());
}

TEST_CASE("HttpCallbackForwarder: forward fails on non-200 statuses", "[callback]") {
    MockHttpClient http;
    HttpCallbackForwarder fwd("http://h/cb");

    for (long status : {201L, 204L, 301L, 404L, 500L}) {
        http.next_response = {status, ""};
        REQUIRE_FALSE(fwd.forward(make_sms(), http));
    }
}

TEST_CASE("HttpCallbackForwarder: forward fails without throwing on transport error", "[callback]") {
    MockHttpClient http;
    http.next_response = {0, ""};
    HttpCallbackForwarder fwd("http://h/cb");
    REQUIRE_FALSE(fwd.forward(make_sms(), http));

    http.throw_on_request = true;
    REQUIRE_NOTHROW(fwd.forward(make_sms(), http));
    REQUIRE_FALSE(fwd.forward(make_sms(), http));
}

// ── from_json / to_json ──────────────────────────────────────────

TEST_CASE("HttpCallbackForwarder: from_json reads all fields", "[callback]") {
    auto j = ConfigJson::parse(R"({"HttpCallbackForwarder": {
        "callbackUrl": "http://h/cb", "method": "PUT",
        "uriPayload": {"z": "1", "a": "2"}, "jsonPayload": {"n": 5}}})");
    auto fwd = HttpCallbackForwarder::from_json(j);

    REQUIRE(fwd.callback_url() == "http://h/cb");
    REQUIRE(fwd.method() == HttpMethod::Put);
    REQUIRE(fwd.uri_payload() == Fields{{"z", "1"}, {"a", "2"}});
    REQUIRE(fwd.body_payload() == Fields{{"n", "5"}});
}

TEST_CASE("HttpCallbackForwarder: legacy record without method defaults to POST", "[callback]") {
    auto fwd = HttpCallbackForwarder::from_json(ConfigJson{{"callbackUrl", "http://h"}});
    REQUIRE(fwd.method() == HttpMethod::Post);
    REQUIRE(fwd.uri_payload().empty());
    REQUIRE(fwd.body_payload().empty());
}

TEST_CASE("HttpCallbackForwarder: missing callback url throws ConfigError", "[callback]") {
    REQUIRE_THROWS_AS(HttpCallbackForwarder::from_json(ConfigJson{{"method", "GET"}}),
                      ConfigError);
    REQUIRE_THROWS_AS(HttpCallbackForwarder::from_json(ConfigJson{{"callbackUrl", ""}}),
                      ConfigError);
}

TEST_CASE("HttpCallbackForwarder: unknown method throws ConfigError", "[callback]") {
    ConfigJson j = {{"callbackUrl", "http://h"}, {"method", "DELETE"}};
    REQUIRE_THROWS_AS(HttpCallbackForwarder::from_json(j), ConfigError);
}

TEST_CASE("HttpCallbackForwarder: wrong field types throw ConfigError", "[callback]") {
    REQUIRE_THROWS_AS(HttpCallbackForwarder::from_json(ConfigJson{{"callbackUrl", 7}}),
                      ConfigError);
    ConfigJson j = {{"callbackUrl", "http://h"}, {"uriPayload", "k=v"}};
    REQUIRE_THROWS_AS(HttpCallbackForwarder::from_json(j), ConfigError);
}

TEST_CASE("HttpCallbackForwarder: to_json/from_json round trip", "[callback]") {
    HttpCallbackForwarder fwd("http://h/cb", HttpMethod::Get,
                              {{"b", "2"}, {"a", "1"}}, {{"x", "y"}});
    auto j = fwd.to_json();
    REQUIRE(j["method"] == "GET");
    REQUIRE(j["callbackUrl"] == "http://h/cb");
    REQUIRE(HttpCallbackForwarder::from_json(j) == fwd);
}
