#include <catch2/catch.hpp>

#include "Fakes.hpp"
#include "Worker.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;
using rune::Worker;
using rune::testing::eventually;

TEST_CASE("Worker ordering", "[worker]") {
    Worker worker("test");
    std::mutex mu;
    std::vector<int> order;

    SECTION("TasksRunInSubmissionOrder") {
        for (int i = 0; i < 50; ++i) {
            worker.post([&, i] {
                std::lock_guard<std::mutex> lock(mu);
                order.push_back(i);
            });
        }
        REQUIRE(eventually([&] {
            std::lock_guard<std::mutex> lock(mu);
            return order.size() == 50;
        }));
        for (int i = 0; i < 50; ++i) REQUIRE(order[i] == i);
    }

    SECTION("TimersRunAfterTheirDelay") {
        worker.post_after(60ms, [&] {
            std::lock_guard<std::mutex> lock(mu);
            order.push_back(2);
        });
        worker.post_after(10ms, [&] {
            std::lock_guard<std::mutex> lock(mu);
            order.push_back(1);
        });
        REQUIRE(eventually([&] {
            std::lock_guard<std::mutex> lock(mu);
            return order.size() == 2;
        }));
        REQUIRE(order == std::vector<int>{1, 2});
    }
}

TEST_CASE("Worker timers and shutdown", "[worker]") {
    Worker worker("test");
    std::atomic<int> runs{0};

    SECTION("CancelledTimerNeverRuns") {
        const auto id = worker.post_after(30ms, [&] { ++runs; });
        REQUIRE(worker.cancel_timer(id));
        REQUIRE_FALSE(worker.cancel_timer(id));
        std::this_thread::sleep_for(80ms);
        REQUIRE(runs == 0);
    }

    SECTION("ThrowingTaskDoesNotKillTheWorker") {
        worker.post([] { throw std::runtime_error("boom"); });
        worker.post([&] { ++runs; });
        REQUIRE(eventually([&] { return runs == 1; }));
    }

    SECTION("PostAfterStopIsIgnored") {
        worker.stop();
        worker.post([&] { ++runs; });
        REQUIRE(worker.post_after(1ms, [&] { ++runs; }) == 0);
        std::this_thread::sleep_for(20ms);
        REQUIRE(runs == 0);
    }

    SECTION("KnowsItsOwnThread") {
        REQUIRE_FALSE(worker.on_worker_thread());
        std::atomic<bool> inside{false};
        worker.post([&] { inside = worker.on_worker_thread(); ++runs; });
        REQUIRE(eventually([&] { return runs == 1; }));
        REQUIRE(inside);
    }
}
