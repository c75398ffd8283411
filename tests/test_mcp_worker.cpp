// Tests for the tool-call worker threads: bounded concurrency and clean shutdown.

#include "mcp/mcp_worker.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using test_support::check;

namespace test_mcp_worker {

// Test: never more than max_in_flight tasks run at once, and every task runs.
static bool test_concurrency_is_bounded() {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> completed{0};

    mcp_worker::InvocationTracker tracker(2);
    for (int task_index = 0; task_index < 6; task_index++) {
        tracker.submit([&running, &peak, &completed]() {
            int now_running = ++running;
            int previous_peak = peak.load();
            while (now_running > previous_peak && !peak.compare_exchange_weak(previous_peak, now_running)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            --running;
            ++completed;
        });
    }
    tracker.wait_for_all();

    bool success = completed == 6 && peak <= 2 && peak >= 1 && tracker.in_flight() == 0 &&
                   tracker.max_in_flight() == 2;
    return check(success, "Six tasks with a limit of two never exceed two at once");
}

// Test: after wait_for_all the task closures have been destroyed.
static bool test_wait_releases_closures() {
    auto shared_state = std::make_shared<int>(0);
    {
        mcp_worker::InvocationTracker tracker;
        for (int task_index = 0; task_index < 4; task_index++) {
            tracker.submit([shared_state]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                (*shared_state)++;
            });
        }
        tracker.wait_for_all();
        bool released = shared_state.use_count() == 1;
        if (!check(released, "Closures destroyed once wait_for_all returns")) {
            return false;
        }
    }
    return check(*shared_state == 4, "Every task ran exactly once");
}

// Test: a throwing task still counts as finished.
static bool test_throwing_task_finishes() {
    std::atomic<int> completed{0};
    auto start_time = std::chrono::steady_clock::now();
    {
        mcp_worker::InvocationTracker tracker(1);
        tracker.submit([]() { throw std::runtime_error("task failure"); });
        tracker.submit([&completed]() { ++completed; });
        tracker.wait_for_all();
    }
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    bool success = completed == 1 && elapsed < std::chrono::seconds(2);
    return check(success, "A throwing task frees its slot");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_concurrency_is_bounded();
    all_passed &= test_wait_releases_closures();
    all_passed &= test_throwing_task_finishes();
    return all_passed;
}

} // namespace test_mcp_worker
