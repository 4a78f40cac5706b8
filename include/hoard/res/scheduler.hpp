#pragma once

/// @file scheduler.hpp
/// @brief Single-threaded cooperative task queue

#include "fwd.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace hoard_res {

/// FIFO task queue driven by the owner's frame loop.
///
/// Tasks run on the thread that calls run_once(). post() is the only
/// thread-safe member. Work posted during a tick runs in the next tick.
class Scheduler {
public:
    using Task = std::function<void()>;

    Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Queue a task for the next tick
    void post(Task task);

    /// Run the tasks queued before this call. Returns how many ran.
    std::size_t run_once();

    /// Tick until the queue is empty or max_ticks is reached. Returns ticks run.
    std::size_t run_until_idle(std::size_t max_ticks = 10000);

    /// Drop every queued task without running it
    void clear();

    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] bool idle() const { return pending() == 0; }

    [[nodiscard]] std::uint64_t tick_count() const noexcept { return m_ticks; }

private:
    mutable std::mutex m_mutex;
    std::deque<Task> m_queue;
    std::uint64_t m_ticks = 0;
};

} // namespace hoard_res
