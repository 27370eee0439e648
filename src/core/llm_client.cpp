#include "core/llm_client.hpp"
#include "core/cancellation.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <format>
#include <optional>
#include <thread>

namespace aegis {

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Cache Key Generation
// ============================================================================

std::string LlmClient::cache_key(const LlmRequest& request) {
    // The full request, length-prefixed so field boundaries cannot be forged
    return std::format("{}:{}|{}|{}|{}:{}|{}:{}", request.model.size(), request.model,
        request.temperature, request.max_tokens, request.system_prompt.size(),
        request.system_prompt, request.user_message.size(), request.user_message);
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        // New minute window
        minute_start_ = now;
        requests_this_minute_ = 0;
    }

    if (requests_this_minute_ >= config_.max_requests_per_minute) {
        return false;
    }

    ++requests_this_minute_;
    return true;
}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const LlmRequest& request, const CancellationToken* cancel) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        LlmResponse resp;
        resp.error = "LLM client is disabled";
        return resp;
    }

    if (cancel && cancel->is_cancelled()) {
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        LlmResponse resp;
        resp.error = "Request cancelled";
        resp.cancelled = true;
        return resp;
    }

    const auto model = request.model.empty() ? config_.default_model : request.model;
    LlmRequest effective = request;
    effective.model = model;
    const auto key = cache_key(effective);

    // Check cache (shared lock)
    if (config_.cache_enabled) {
        std::shared_lock lock(cache_mutex_);
        const auto it = cache_.find(key);
        if (it != cache_.end()) {
            const auto now = std::chrono::steady_clock::now();
            if (now < it->second.expires_at) {
                cache_hits_.fetch_add(1, std::memory_order_relaxed);
                auto response = it->second.response;
                response.from_cache = true;
                return response;
            }
        }
    }

    // Rate limit check
    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        LlmResponse resp;
        resp.error = "Rate limited: too many LLM API requests";
        resp.model_used = model;
        return resp;
    }

    auto response = call_api(effective, model, cancel);

    // Cache successful response
    if (response.success && config_.cache_enabled && config_.cache_max_entries > 0) {
        const auto expires = std::chrono::steady_clock::now() +
                             std::chrono::seconds(config_.cache_ttl_seconds);

        std::unique_lock lock(cache_mutex_);

        // Evict oldest entry if at capacity
        if (cache_.size() >= config_.cache_max_entries) {
            const auto oldest_it = std::min_element(cache_.begin(), cache_.end(),
                [](const auto& a, const auto& b) {
                    return a.second.expires_at < b.second.expires_at;
                });
            cache_.erase(oldest_it);
        }

        cache_[key] = {response, expires};
    }

    return response;
}

// ============================================================================
// Request Body / Response Parsing
// ============================================================================

std::string LlmClient::build_request_body(const std::string& provider,
                                          const LlmRequest& request,
                                          const std::string& model) {
    if (provider == "anthropic") {
        return std::format(
            R"({{"model":"{}","max_tokens":{},"temperature":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(model), request.max_tokens, request.temperature,
            utils::escape_json(request.system_prompt),
            utils::escape_json(request.user_message));
    }
    return std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(model), request.temperature, request.max_tokens,
        utils::escape_json(request.system_prompt),
        utils::escape_json(request.user_message));
}

std::string LlmClient::extract_content(const std::string& body, const std::string& provider) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return "";
    }

    if (provider == "anthropic") {
        // Anthropic: {"content":[{"type":"text","text":"..."}]}
        std::string text;
        doc["content"].for_each_element([&text](const JsonValue& block) {
            if (text.empty() && block.string_or("type", "") == "text") {
                text = block.string_or("text", "");
            }
        });
        return text;
    }

    // OpenAI: {"choices":[{"message":{"content":"..."}}]}
    const auto content = doc["choices"][0]["message"]["content"];
    return content.is_string() ? content.get<std::string>() : "";
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(const LlmRequest& request,
                                const std::string& model,
                                const CancellationToken* cancel) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const utils::Timer timer;
    auto fail = [&](std::string error) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        LlmResponse resp;
        resp.error = std::move(error);
        resp.model_used = model;
        resp.latency = timer.elapsed_ms();
        return resp;
    };
    auto cancelled = [&] {
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        LlmResponse resp;
        resp.error = "Request cancelled";
        resp.cancelled = true;
        resp.model_used = model;
        resp.latency = timer.elapsed_ms();
        return resp;
    };

    if (config_.api_key.empty()) {
        return fail("No API key configured");
    }

    if (config_.endpoint.empty()) {
        return fail("No endpoint configured");
    }

    const std::string json_body = build_request_body(config_.provider, request, model);

    // HTTP client
    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));

    // Declared after cli: unregistered before cli is destroyed
    std::optional<CancellationToken::Registration> cancel_registration;
    if (cancel) {
        cancel_registration.emplace(cancel->on_cancel([&cli] { cli.stop(); }));
    }

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    // Overall budget across all attempts
    const auto deadline = std::chrono::milliseconds(
        static_cast<uint64_t>(config_.timeout_ms) * (config_.max_retries + 1));

    // Retry loop
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (cancel && cancel->is_cancelled()) {
            return cancelled();
        }
        const auto elapsed = timer.elapsed_ms();
        if (attempt > 0 && elapsed >= deadline) {
            return fail("Deadline exceeded");
        }
        // Bounds the whole exchange, not just each socket read
        cli.set_max_timeout(std::min(std::chrono::milliseconds(config_.timeout_ms),
                                     deadline - elapsed));

        const auto res = cli.Post(path, headers, json_body, "application/json");

        if (cancel && cancel->is_cancelled()) {
            return cancelled();
        }

        if (!res) {
            if (attempt < config_.max_retries) continue;
            return fail("HTTP request failed: connection error");
        }

        const bool transient = res->status == httplib::StatusCode::TooManyRequests_429 ||
                               res->status >= 500;
        if (transient && attempt < config_.max_retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200 * (attempt + 1)));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            return fail(std::format("API error: HTTP {} - {}", res->status,
                                    res->body.substr(0, 200)));
        }

        auto content = extract_content(res->body, config_.provider);
        if (content.empty()) {
            return fail("API response has no message content");
        }

        LlmResponse resp;
        resp.success = true;
        resp.content = std::move(content);
        resp.model_used = model;
        resp.latency = timer.elapsed_ms();
        return resp;
    }

    return fail("Max retries exceeded");
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        cache_hits_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed),
        cancelled_.load(std::memory_order_relaxed)
    };
}

} // namespace aegis
