#include "mcp/mcp_worker.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace mcp_worker {

static void join_all(std::vector<std::thread> &threads) {
    for (auto &thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

InvocationTracker::InvocationTracker(std::size_t max_in_flight)
    : max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {}

InvocationTracker::~InvocationTracker() {
    wait_for_all();
}

std::vector<std::thread> InvocationTracker::take_finished_threads() {
    std::vector<std::thread> finished_threads;
    for (auto iterator = workers_.begin(); iterator != workers_.end();) {
        if (iterator->finished) {
            finished_threads.push_back(std::move(iterator->thread));
            iterator = workers_.erase(iterator);
        } else {
            ++iterator;
        }
    }
    return finished_threads;
}

void InvocationTracker::submit(std::function<void()> task) {
    std::vector<std::thread> finished_threads;
    bool started = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_condition_.wait(lock, [this] { return in_flight_ < max_in_flight_; });
        finished_threads = take_finished_threads();

        // The thread is created under the lock, so finish_one cannot run before the
        // worker entry holds its thread.
        auto worker = workers_.emplace(workers_.end());
        try {
            worker->thread = std::thread([this, task, worker]() {
                try {
                    task();
                } catch (const std::exception &exception) {
                    debug_log::warn(std::string("tool call thread failed: ") + exception.what());
                }
                finish_one(worker);
            });
            in_flight_++;
            started = true;
        } catch (const std::system_error &error) {
            debug_log::warn(std::string("thread creation failed, running inline: ") + error.what());
            workers_.erase(worker);
        }
    }
    join_all(finished_threads);

    if (!started) {
        // Could not start a thread; run inline rather than dropping the call.
        try {
            task();
        } catch (const std::exception &exception) {
            debug_log::warn(std::string("tool call failed: ") + exception.what());
        }
    }
}

void InvocationTracker::finish_one(std::list<Worker>::iterator worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    worker->finished = true;
    in_flight_--;
    idle_condition_.notify_all();
}

void InvocationTracker::wait_for_all() {
    std::vector<std::thread> threads;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_condition_.wait(lock, [this] { return in_flight_ == 0; });
        for (auto &worker : workers_) {
            threads.push_back(std::move(worker.thread));
        }
        workers_.clear();
    }
    join_all(threads);
}

std::size_t InvocationTracker::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t InvocationTracker::max_in_flight() const {
    return max_in_flight_;
}

} // namespace mcp_worker
