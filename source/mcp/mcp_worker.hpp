#ifndef CMCPS_MCP_WORKER_HPP
#define CMCPS_MCP_WORKER_HPP

// Runs tool calls on their own threads so a slow command or download never
// holds up unrelated calls, and tracks them so shutdown can wait for the stragglers.

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <thread>
#include <vector>

namespace mcp_worker {

constexpr std::size_t DEFAULT_MAX_IN_FLIGHT = 32;

class InvocationTracker {
public:
    explicit InvocationTracker(std::size_t max_in_flight = DEFAULT_MAX_IN_FLIGHT);
    InvocationTracker(const InvocationTracker &) = delete;
    InvocationTracker &operator=(const InvocationTracker &) = delete;

    // Waits for and joins outstanding tasks; a tracker never outlives the threads it started.
    ~InvocationTracker();

    // Start task on a new thread. Blocks while max_in_flight tasks are already running.
    // Exceptions escaping task are logged.
    void submit(std::function<void()> task);

    // Block until every submitted task has finished and its thread has been joined.
    void wait_for_all();

    std::size_t in_flight() const;
    std::size_t max_in_flight() const;

private:
    struct Worker {
        std::thread thread;
        bool finished = false;
    };

    void finish_one(std::list<Worker>::iterator worker);

    // Moves the threads of finished workers out of workers_. Caller holds mutex_.
    std::vector<std::thread> take_finished_threads();

    mutable std::mutex mutex_;
    std::condition_variable idle_condition_;
    std::list<Worker> workers_;
    std::size_t in_flight_ = 0;
    std::size_t max_in_flight_;
};

} // namespace mcp_worker

#endif // CMCPS_MCP_WORKER_HPP
