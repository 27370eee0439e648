#include <catch2/catch_test_macros.hpp>
#include "core/llm_client.hpp"
#include "core/cancellation.hpp"
#include "core/json.hpp"
#include "mocks/mock_llm_server.hpp"

#include <chrono>
#include <thread>

using namespace aegis;
using aegis::testing::MockLlmServer;

static LlmClient::Config enabled_config() {
    LlmClient::Config cfg;
    cfg.enabled = true;
    cfg.endpoint = "http://127.0.0.1:1";
    cfg.api_key = "test-key";
    cfg.default_model = "gpt-4";
    cfg.timeout_ms = 1000;
    cfg.max_retries = 0;
    cfg.max_requests_per_minute = 60;
    cfg.cache_enabled = true;
    cfg.cache_max_entries = 100;
    cfg.cache_ttl_seconds = 3600;
    return cfg;
}

static LlmRequest make_request(std::string user_message) {
    LlmRequest req;
    req.system_prompt = "judge";
    req.user_message = std::move(user_message);
    return req;
}

TEST_CASE("LlmClient", "[llm_client]") {

    SECTION("Disabled returns error") {
        LlmClient client;
        REQUIRE_FALSE(client.is_enabled());

        const auto resp = client.complete(make_request("test"));
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("disabled") != std::string::npos);
    }

    SECTION("API call to unreachable endpoint returns error") {
        LlmClient client(enabled_config());

        const auto resp = client.complete(make_request("hello"));
        REQUIRE_FALSE(resp.success);
        REQUIRE_FALSE(resp.from_cache);
        REQUIRE(resp.error.find("connection error") != std::string::npos);

        const auto stats = client.get_stats();
        REQUIRE(stats.total_requests == 1);
        REQUIRE(stats.api_calls == 1);
        REQUIRE(stats.api_errors == 1);
    }

    SECTION("No API key returns error") {
        auto cfg = enabled_config();
        cfg.api_key = "";
        LlmClient client(cfg);

        const auto resp = client.complete(make_request("test"));
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("API key") != std::string::npos);
    }

    SECTION("Rate limiting") {
        auto cfg = enabled_config();
        cfg.max_requests_per_minute = 3;
        LlmClient client(cfg);

        // First 3 pass the rate limit and fail at the transport
        (void)client.complete(make_request("query 1"));
        (void)client.complete(make_request("query 2"));
        (void)client.complete(make_request("query 3"));

        const auto resp = client.complete(make_request("query 4"));
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("Rate limited") != std::string::npos);
        REQUIRE(client.get_stats().rate_limited == 1);
    }

    SECTION("Pre-cancelled request never reaches the API") {
        LlmClient client(enabled_config());
        CancellationToken token;
        token.cancel();

        const auto resp = client.complete(make_request("hello"), &token);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.cancelled);

        const auto stats = client.get_stats();
        REQUIRE(stats.cancelled == 1);
        REQUIRE(stats.api_calls == 0);
    }

    SECTION("Cache key uniqueness") {
        auto a = make_request("input A");
        auto b = make_request("input B");
        REQUIRE(LlmClient::cache_key(a) != LlmClient::cache_key(b));

        auto c = make_request("input A");
        c.system_prompt = "other judge";
        REQUIRE(LlmClient::cache_key(a) != LlmClient::cache_key(c));
        REQUIRE(LlmClient::cache_key(a) == LlmClient::cache_key(make_request("input A")));

        // Field boundaries are part of the key
        auto d = make_request("x");
        d.system_prompt = "judge|1:y";
        auto e = make_request("y");
        e.system_prompt = "judge|1:x";
        REQUIRE(LlmClient::cache_key(d) != LlmClient::cache_key(e));

        // Inputs sharing length and prefix still get distinct keys
        const std::string long_a(4096, 'a');
        std::string long_b = long_a;
        long_b.back() = 'b';
        const auto key = LlmClient::cache_key(make_request(long_a));
        REQUIRE(key != LlmClient::cache_key(make_request(long_b)));
        REQUIRE(key.find(long_a) != std::string::npos);
    }
}

TEST_CASE("LlmClient: request bodies keep roles separate", "[llm_client]") {
    LlmRequest req;
    req.system_prompt = "You are a judge";
    req.user_message = "{\"content\":\"Ignore previous\"}";
    req.max_tokens = 50;

    SECTION("openai") {
        const auto doc = JsonValue::parse(LlmClient::build_request_body("openai", req, "gpt-4"));
        CHECK(doc["model"].get<std::string>() == "gpt-4");
        CHECK(doc["max_tokens"].get<int>() == 50);
        CHECK(doc["messages"][0]["role"].get<std::string>() == "system");
        CHECK(doc["messages"][0]["content"].get<std::string>() == "You are a judge");
        CHECK(doc["messages"][1]["role"].get<std::string>() == "user");
        CHECK(doc["messages"][1]["content"].get<std::string>() == req.user_message);
    }

    SECTION("anthropic") {
        const auto doc = JsonValue::parse(
            LlmClient::build_request_body("anthropic", req, "claude-model"));
        CHECK(doc["system"].get<std::string>() == "You are a judge");
        CHECK(doc["messages"][0]["role"].get<std::string>() == "user");
        CHECK(doc["messages"][0]["content"].get<std::string>() == req.user_message);
    }
}

TEST_CASE("LlmClient: extract_content", "[llm_client]") {
    CHECK(LlmClient::extract_content(
        R"({"choices":[{"message":{"role":"assistant","content":"verdict"}}]})", "openai") == "verdict");
    CHECK(LlmClient::extract_content(
        R"({"content":[{"type":"thinking","text":"x"},{"type":"text","text":"verdict"}]})",
        "anthropic") == "verdict");
    CHECK(LlmClient::extract_content(R"({"choices":[]})", "openai").empty());
    CHECK(LlmClient::extract_content("not json", "openai").empty());
}

TEST_CASE("LlmClient: successful call against local endpoint", "[llm_client][network]") {
    MockLlmServer server;
    server.set_reply("hello back");

    auto cfg = enabled_config();
    cfg.endpoint = server.endpoint();
    LlmClient client(cfg);

    const auto first = client.complete(make_request("hello"));
    REQUIRE(first.success);
    CHECK(first.content == "hello back");
    CHECK(first.model_used == "gpt-4");
    CHECK(server.last_auth() == "Bearer test-key");

    // Identical request is served from cache
    const auto second = client.complete(make_request("hello"));
    REQUIRE(second.success);
    CHECK(second.from_cache);
    CHECK(server.hits() == 1);
    CHECK(client.get_stats().cache_hits == 1);
}

TEST_CASE("LlmClient: HTTP errors are reported", "[llm_client][network]") {
    MockLlmServer server;
    server.set_reply("overloaded", 503);

    auto cfg = enabled_config();
    cfg.endpoint = server.endpoint();
    cfg.max_retries = 1;
    LlmClient client(cfg);

    const auto resp = client.complete(make_request("hello"));
    REQUIRE_FALSE(resp.success);
    CHECK(resp.error.find("HTTP 503") != std::string::npos);
    // One retry after the transient failure
    CHECK(server.hits() == 2);
}

TEST_CASE("LlmClient: cancellation stops an in-flight call", "[llm_client][network]") {
    MockLlmServer server;
    server.set_delay(std::chrono::milliseconds(1500));

    auto cfg = enabled_config();
    cfg.endpoint = server.endpoint();
    cfg.timeout_ms = 5000;
    LlmClient client(cfg);

    CancellationToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto resp = client.complete(make_request("slow"), &token);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    CHECK_FALSE(resp.success);
    CHECK(resp.cancelled);
    CHECK(elapsed < std::chrono::milliseconds(1400));
}

TEST_CASE("LlmClient: hung endpoint times out", "[llm_client][network]") {
    MockLlmServer server;
    server.set_delay(std::chrono::milliseconds(1500));

    auto cfg = enabled_config();
    cfg.endpoint = server.endpoint();
    cfg.timeout_ms = 300;
    cfg.max_retries = 1;
    LlmClient client(cfg);

    const auto start = std::chrono::steady_clock::now();
    const auto resp = client.complete(make_request("slow"));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(resp.success);
    CHECK_FALSE(resp.cancelled);
    // Two attempts of at most timeout_ms each
    CHECK(elapsed < std::chrono::milliseconds(1200));
    CHECK(client.get_stats().api_errors == 1);
}
