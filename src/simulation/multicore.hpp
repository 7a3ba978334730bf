#pragma once

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <exception>
#include <functional>
#include <latch>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

using Job = std::function<void()>;

/**
 * @brief A range kernel: processes items [start, end).
 */
template <typename F>
concept RangeKernel = requires(F f, int a, int b) {
    { f(a, b) } -> std::same_as<void>;
};

/**
 * @brief Default worker count for stepping (leaves 1 core for the render loop
 * and 1 for the OS)
 */
inline int compute_step_threads() {
    unsigned int num_threads = std::thread::hardware_concurrency();
    if (num_threads <= 2) {
        return 1;
    }

    return int(num_threads) - 2;
}

/**
 * @brief Fixed set of worker threads that split one range of work into
 * contiguous, disjoint blocks.
 *
 * parallel_for_n blocks until every block has finished; the first exception
 * thrown by a block is rethrown on the calling thread.
 */
class StepThreadPool {
  public:
    /** @brief Below this many items the kernel runs inline on the caller */
    static constexpr int MIN_PARALLEL_ITEMS = 64;

    /**
     * @param threads Number of workers (<= 0 picks compute_step_threads())
     * @throws celleste::SimulationError if a worker thread cannot be started
     */
    explicit StepThreadPool(int threads = -1);
    ~StepThreadPool();

    StepThreadPool(const StepThreadPool &) = delete;
    StepThreadPool(StepThreadPool &&) = delete;
    StepThreadPool &operator=(const StepThreadPool &) = delete;
    StepThreadPool &operator=(StepThreadPool &&) = delete;

    inline int size() const noexcept { return int(m_workers.size()); }

    /**
     * @brief Runs fn over [0, n_items) split into one block per worker.
     */
    template <RangeKernel F>
    void parallel_for_n(F fn, int n_items) {
        if (n_items <= 0) {
            return;
        }

        int num_threads = std::max(1, size());
        if (num_threads == 1 || n_items < MIN_PARALLEL_ITEMS) {
            fn(0, n_items);
            return;
        }

        int block = (n_items + num_threads - 1) / num_threads;
        int jobs = (n_items + block - 1) / block;
        std::latch job_latch(jobs);
        std::exception_ptr first_error;
        std::mutex error_mutex;

        for (int job = 0; job < jobs; ++job) {
            int start = job * block;
            int end_exclusive = std::min(n_items, start + block);

            enqueue([start, end_exclusive, &fn, &job_latch, &first_error,
                     &error_mutex] {
                try {
                    fn(start, end_exclusive);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                }
                job_latch.count_down();
            });
        }

        job_latch.wait();

        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

  private:
    void enqueue(Job f);

    /** @brief Lets queued jobs finish, then joins every worker */
    void join_all() noexcept;

    void worker_thread();

  private:
    std::vector<std::thread> m_workers;
    std::mutex m_tasks_mutex;
    std::condition_variable m_tasks_signal;
    std::queue<Job> m_tasks;
    bool m_stopping = false;
};
