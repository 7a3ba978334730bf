#include "multicore.hpp"

#include <system_error>

#include <fmt/format.h>

StepThreadPool::StepThreadPool(int threads) {
    const int count = threads > 0 ? threads : compute_step_threads();
    m_workers.reserve(count);
    try {
        for (int i = 0; i < count; ++i) {
            m_workers.emplace_back([this] { worker_thread(); });
        }
    } catch (const std::system_error &e) {
        // the destructor will not run, so release what did start
        join_all();
        throw celleste::SimulationError(fmt::format(
            "Could not start step worker {} of {}: {}", m_workers.size() + 1,
            count, e.what()));
    }
    LOG_DEBUG("Step pool up with {} workers", count);
}

StepThreadPool::~StepThreadPool() {
    join_all();
    LOG_DEBUG("Step pool down ({} workers)", m_workers.size());
}

void StepThreadPool::join_all() noexcept {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_stopping = true;
    }
    m_tasks_signal.notify_all();

    for (auto &worker : m_workers) {
        worker.join();
    }
}

void StepThreadPool::enqueue(Job f) {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_tasks.push(std::move(f));
    }
    m_tasks_signal.notify_one();
}

void StepThreadPool::worker_thread() {
    std::unique_lock<std::mutex> lock(m_tasks_mutex);
    for (;;) {
        m_tasks_signal.wait(lock,
                            [this] { return m_stopping || !m_tasks.empty(); });
        if (m_tasks.empty()) {
            return; // stopping with nothing left
        }

        Job job = std::move(m_tasks.front());
        m_tasks.pop();

        lock.unlock();
        job();
        lock.lock();
    }
}
