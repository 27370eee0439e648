#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"
#include "config/config_loader.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace aegis;

TEST_CASE("ShutdownCoordinator: try_enter succeeds before shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    CHECK(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: try_enter fails after shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    sc.initiate_shutdown();
    CHECK_FALSE(sc.try_enter_request());
    CHECK(sc.is_shutting_down());
    CHECK(sc.rejected_count() == 1);
}

TEST_CASE("ShutdownCoordinator: wait_for_drain returns immediately when idle", "[shutdown]") {
    ShutdownCoordinator::Config cfg;
    cfg.shutdown_timeout = std::chrono::milliseconds(100);
    ShutdownCoordinator sc(cfg);

    sc.initiate_shutdown();
    const auto start = std::chrono::steady_clock::now();
    const bool ok = sc.wait_for_drain();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(ok);
    CHECK(elapsed < std::chrono::milliseconds(50));
}

TEST_CASE("ShutdownCoordinator: wait_for_drain blocks until leave_request", "[shutdown]") {
    ShutdownCoordinator::Config cfg;
    cfg.shutdown_timeout = std::chrono::milliseconds(5000);
    ShutdownCoordinator sc(cfg);

    REQUIRE(sc.try_enter_request());

    std::atomic<bool> drained{false};
    std::thread drain_thread([&] {
        sc.initiate_shutdown();
        drained = sc.wait_for_drain();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(drained.load());

    sc.leave_request();

    drain_thread.join();
    CHECK(drained.load());
}

TEST_CASE("ShutdownCoordinator: drain times out with a stuck request", "[shutdown]") {
    ShutdownCoordinator::Config cfg;
    cfg.shutdown_timeout = std::chrono::milliseconds(50);
    ShutdownCoordinator sc(cfg);

    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    const bool ok = sc.wait_for_drain();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(ok);
    CHECK(elapsed >= std::chrono::milliseconds(40));
    CHECK(sc.in_flight_count() == 1);

    sc.leave_request();
}

TEST_CASE("ShutdownCoordinator: concurrent enter/leave/shutdown", "[shutdown]") {
    ShutdownCoordinator::Config cfg;
    cfg.shutdown_timeout = std::chrono::milliseconds(2000);
    ShutdownCoordinator sc(cfg);

    std::atomic<int> entered{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&] {
            if (sc.try_enter_request()) {
                entered.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                sc.leave_request();
            } else {
                rejected.fetch_add(1);
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    sc.initiate_shutdown();

    for (auto& t : threads) t.join();

    CHECK(sc.wait_for_drain());
    CHECK(sc.in_flight_count() == 0);
    CHECK((entered.load() + rejected.load()) == 20);
    CHECK(sc.rejected_count() == static_cast<uint64_t>(rejected.load()));
}

TEST_CASE("ShutdownCoordinator: in-flight request completes after shutdown", "[shutdown]") {
    ShutdownCoordinator sc;

    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();

    CHECK_FALSE(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownGuard: leaves on scope exit", "[shutdown]") {
    ShutdownCoordinator sc;
    {
        REQUIRE(sc.try_enter_request());
        const ShutdownGuard guard{&sc};
        CHECK(sc.in_flight_count() == 1);
    }
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: timeout from TOML", "[shutdown][config]") {
    const std::string toml = R"(
[server]
shutdown_timeout_ms = 15000
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.server.shutdown_timeout_ms == 15000);
}
