/// @file scheduler.cpp
/// @brief Scheduler implementation

#include <hoard/res/scheduler.hpp>

namespace hoard_res {

void Scheduler::post(Task task) {
    if (!task) {
        return;
    }
    std::lock_guard lock(m_mutex);
    m_queue.push_back(std::move(task));
}

std::size_t Scheduler::run_once() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(m_mutex);
        batch.swap(m_queue);
    }

    ++m_ticks;
    for (auto& task : batch) {
        task();
    }
    return batch.size();
}

std::size_t Scheduler::run_until_idle(std::size_t max_ticks) {
    std::size_t ticks = 0;
    while (ticks < max_ticks && !idle()) {
        run_once();
        ++ticks;
    }
    return ticks;
}

void Scheduler::clear() {
    std::lock_guard lock(m_mutex);
    m_queue.clear();
}

std::size_t Scheduler::pending() const {
    std::lock_guard lock(m_mutex);
    return m_queue.size();
}

} // namespace hoard_res
