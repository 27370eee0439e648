#pragma once

#include "core/types.hpp"
#include "metrics/metrics_recorder.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace aegis {

class CancellationToken;
class DecisionAggregator;
class ISecondaryClassifier;
class RuleEngine;
class ShutdownCoordinator;

/**
 * @brief HTTP front of the inspection proxy
 *
 * Routes:
 *   POST /v1/analyze   inspect one piece of content
 *   GET  /v1/health    service identity and component status
 *   GET  /v1/metrics   JSON projection of the metrics snapshot
 *   GET  /metrics      Prometheus text exposition
 *   GET  /             service index
 *
 * Every analysis answers with a well-formed verdict; exceptions from the
 * analysis path become the standard service-error verdict.
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        size_t threads = 8;
        size_t top_threats = 5;
    };

    /// Status code and JSON body of one /v1/analyze exchange
    struct AnalyzeReply {
        int status = 200;
        std::string body;
    };

    HttpServer(std::shared_ptr<DecisionAggregator> aggregator,
               std::shared_ptr<MetricsRecorder> metrics,
               std::shared_ptr<ISecondaryClassifier> classifier,
               std::shared_ptr<const RuleEngine> rule_engine,
               Config config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks until stop() is called or listening fails (throws).
    void start();

    /// Cancels in-flight analyses and stops the listener.
    void stop();

    /// Cancels every in-flight analysis, and any that registers later,
    /// while the listener keeps running. Returns how many were cancelled.
    size_t cancel_in_flight();

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    /// True once the peer of a request has gone away
    using DisconnectCheck = std::function<bool()>;

    /// Runs one analysis request body through the aggregator. When a disconnect check
    /// is given, cancel_disconnected() cancels the analysis once it reports true.
    [[nodiscard]] AnalyzeReply analyze_body(const std::string& body,
                                            DisconnectCheck disconnected = {});

    /// Cancels every in-flight analysis whose client disconnected.
    /// start() runs this every kDisconnectPollInterval.
    size_t cancel_disconnected();

    static constexpr std::chrono::milliseconds kDisconnectPollInterval{100};

    /// "optimal" unless a configured classifier reports degraded health
    [[nodiscard]] std::string system_health() const;

    [[nodiscard]] size_t in_flight_analyses() const;

    // ── JSON / text projections ─────────────────────────────────────────
    [[nodiscard]] static std::string analysis_result_to_json(const AnalysisResult& result);
    [[nodiscard]] static std::string metrics_to_json(const MetricsSnapshot& snapshot,
                                                     size_t top_n,
                                                     std::string_view system_health);
    [[nodiscard]] static std::string build_prometheus_output(const MetricsSnapshot& snapshot);
    [[nodiscard]] static std::string error_json(std::string_view message);

private:
    void register_core_routes(httplib::Server& svr);

    void handle_analyze(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_metrics_json(const httplib::Request& req, httplib::Response& res);
    void handle_prometheus(const httplib::Request& req, httplib::Response& res);
    void handle_index(const httplib::Request& req, httplib::Response& res);

    std::string build_health_output() const;

    // In-flight cancellation tokens, cancelled on stop() or client disconnect
    struct Tracked {
        CancellationToken* token;
        DisconnectCheck disconnected;
    };
    uint64_t track(CancellationToken* token, DisconnectCheck disconnected);
    void untrack(uint64_t id);
    void watch_disconnects();

    std::shared_ptr<DecisionAggregator> aggregator_;
    std::shared_ptr<MetricsRecorder> metrics_;
    std::shared_ptr<ISecondaryClassifier> classifier_;
    std::shared_ptr<const RuleEngine> rule_engine_;
    const Config config_;

    std::unique_ptr<httplib::Server> svr_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;

    mutable std::mutex tokens_mutex_;
    std::unordered_map<uint64_t, Tracked> tokens_;
    uint64_t next_token_id_ = 1;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> cancel_all_{false};

    std::mutex watcher_mutex_;
    std::condition_variable watcher_cv_;
    std::thread watcher_;
};

} // namespace aegis
