#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace aegis {

class CancellationToken;

/**
 * @brief One chat-completion call. The system prompt and the user message
 * travel as separate messages; they are never concatenated.
 */
struct LlmRequest {
    std::string system_prompt;
    std::string user_message;
    std::string model;          // empty = Config::default_model
    double temperature = 0.0;
    int max_tokens = 1000;
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    bool from_cache = false;
    bool cancelled = false;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief Outbound LLM transport used by the quarantined classifier.
 *
 * Uses OpenAI-compatible (or Anthropic messages) API format via httplib::Client.
 * Features:
 * - Response caching by request hash
 * - Per-minute rate limiting on LLM API calls
 * - Bounded retries on connection errors, 429 and 5xx
 * - Connection/read timeouts plus an overall deadline across retries
 * - Cancellation: a cancelled token stops the in-flight HTTP request
 */
class LlmClient {
public:
    struct Config {
        bool enabled = false;
        std::string provider = "openai";            // "openai" | "anthropic"
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string default_model = "gpt-3.5-turbo";
        uint32_t timeout_ms = 5000;
        uint32_t max_retries = 1;
        uint32_t max_requests_per_minute = 600;
        bool cache_enabled = true;
        size_t cache_max_entries = 1000;
        uint32_t cache_ttl_seconds = 300;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Run one completion.
     * @param cancel Optional token; when cancelled the HTTP call is stopped
     *               and the response reports cancelled=true.
     */
    [[nodiscard]] LlmResponse complete(const LlmRequest& request,
                                       const CancellationToken* cancel = nullptr);

    // Cache key generation (for testing)
    [[nodiscard]] static std::string cache_key(const LlmRequest& request);

    // Body building (for testing)
    [[nodiscard]] static std::string build_request_body(const std::string& provider,
                                                        const LlmRequest& request,
                                                        const std::string& model);

    /**
     * @brief Pull the assistant text out of a provider response body.
     * @return empty string if the body has no text content
     */
    [[nodiscard]] static std::string extract_content(const std::string& body,
                                                     const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t cache_hits = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
        uint64_t cancelled = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] LlmResponse call_api(const LlmRequest& request,
                                       const std::string& model,
                                       const CancellationToken* cancel);

    [[nodiscard]] bool check_rate_limit();

    Config config_;

    // Response cache
    struct CacheEntry {
        LlmResponse response;
        std::chrono::steady_clock::time_point expires_at;
    };
    std::unordered_map<std::string, CacheEntry> cache_;
    mutable std::shared_mutex cache_mutex_;

    // Rate limiting
    uint32_t requests_this_minute_ = 0;
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> cancelled_{0};
};

} // namespace aegis
