#include <catch2/catch_test_macros.hpp>
#include "../src/periodic_task.hpp"
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("Periodic task", "[scheduler]") {
    SECTION("A throwing tick is counted and does not stop the task") {
        int calls = 0;
        PeriodicTask task("flaky", 1h, [&calls] {
            calls++;
            if (calls == 1) throw std::runtime_error("upstream timeout");
        });

        REQUIRE_FALSE(task.run_once());
        REQUIRE(task.run_once());
        REQUIRE(task.tick_count() == 2);
        REQUIRE(task.error_count() == 1);
    }

    SECTION("Stop cancels the wait between ticks") {
        std::atomic<int> calls{0};
        PeriodicTask task("slow", 1h, [&calls] { calls++; });

        task.start();
        for (int i = 0; i < 500 && calls == 0; i++) {
            std::this_thread::sleep_for(2ms);
        }
        auto before = std::chrono::steady_clock::now();
        task.stop();

        REQUIRE(calls == 1);
        REQUIRE_FALSE(task.is_running());
        REQUIRE(std::chrono::steady_clock::now() - before < 5s);
    }

    SECTION("Ticks repeat on the period") {
        std::atomic<int> calls{0};
        PeriodicTask task("fast", 5ms, [&calls] { calls++; });

        task.start();
        for (int i = 0; i < 1000 && calls < 3; i++) {
            std::this_thread::sleep_for(2ms);
        }
        task.stop();
        REQUIRE(calls >= 3);
    }
}
