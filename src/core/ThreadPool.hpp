#pragma once

/**
 * ThreadPool.hpp
 *
 * Thread pool for download attempts and other background work.
 */

#include "Logger.hpp"

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <stdexcept>
#include <cstdint>

namespace botarr::core {

/**
 * ThreadPool - Fixed size worker pool
 *
 * Features:
 * - Configurable thread count
 * - Task priorities (FIFO among equal priorities)
 * - Future-based results
 * - Graceful shutdown
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0)
        : m_stop(false), m_activeJobs(0) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4; // Fallback
        }

        m_workers.reserve(numThreads);

        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Destructor - drains the queue, then joins every worker
     */
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    // Disable copy and move
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Submit a task at default priority
     * @param f Function to execute
     * @param args Function arguments
     * @return Future for the result
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {
        return submitPriority(0, std::forward<F>(f), std::forward<Args>(args)...);
    }

    /**
     * Submit a task with priority
     * @param priority Task priority (higher = more priority)
     * @param f Function to execute
     * @param args Function arguments
     * @return Future for the result
     */
    template<class F, class... Args>
    auto submitPriority(int priority, F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {

        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool");
            }

            m_tasks.emplace(priority, m_nextSequence++, [task]() { (*task)(); });
        }

        m_condition.notify_one();
        return result;
    }

    /**
     * Get number of worker threads
     * @return Thread count
     */
    size_t size() const {
        return m_workers.size();
    }

    /**
     * Get number of pending tasks
     * @return Queue size
     */
    size_t pendingTasks() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        return m_tasks.size();
    }

    /**
     * Get number of active jobs
     * @return Active job count
     */
    size_t activeJobs() const {
        return m_activeJobs.load();
    }

    /**
     * Wait for all tasks to complete
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_tasks.empty() && m_activeJobs == 0;
        });
    }

private:
    /**
     * Worker thread loop
     */
    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(const_cast<QueuedTask&>(m_tasks.top()).task);
                m_tasks.pop();
                ++m_activeJobs;
            }

            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error("ThreadPool task failed: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_tasks.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    struct QueuedTask {
        int priority;
        uint64_t sequence;
        std::function<void()> task;

        QueuedTask(int p, uint64_t s, std::function<void()> t)
            : priority(p), sequence(s), task(std::move(t)) {}

        // Highest priority on top, earliest submission first within a priority
        bool operator<(const QueuedTask& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    std::vector<std::thread> m_workers;
    std::priority_queue<QueuedTask> m_tasks;
    uint64_t m_nextSequence{0};

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    std::atomic<bool> m_stop;
    std::atomic<size_t> m_activeJobs;
};

} // namespace botarr::core
