#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace dimforge::core
{
struct JobStats
{
    std::size_t totalWorkers = 0;
    std::size_t activeJobs = 0;
    std::size_t pendingJobs = 0;
    std::size_t completedJobs = 0;
    std::size_t failedJobs = 0;
};

class JobSystem;

/**
 * Outstanding-job count for one group of scheduled jobs. Only the owning
 * JobSystem changes it, under its queue lock, so a waiter that sees zero in
 * WaitForCounter may destroy the counter at once.
 */
class JobCounter
{
public:
    explicit JobCounter(std::size_t initial = 0) : m_count(initial) {}

    JobCounter(const JobCounter&) = delete;
    JobCounter& operator=(const JobCounter&) = delete;

    [[nodiscard]] bool IsZero() const
    {
        return m_count.load(std::memory_order_acquire) == 0;
    }

private:
    friend class JobSystem;

    std::atomic<std::size_t> m_count;
};

/**
 * Fixed-size worker pool for batch level generation.
 *
 * Owned by the caller (no global instance) so tests and tools can run pools of
 * different sizes side by side. Jobs must not share mutable state; each one
 * writes to its own pre-sized output slot. A job that throws is logged and
 * counted in JobStats::failedJobs, its counter is still released.
 */
class JobSystem
{
public:
    using JobFunction = std::function<void()>;

    // 0 picks hardware_concurrency - 1 (at least one worker).
    explicit JobSystem(std::size_t workerCount = 0);
    ~JobSystem();

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void Schedule(JobFunction job, std::string_view name = "", JobCounter* counter = nullptr);
    void ScheduleBatch(std::vector<JobFunction> jobs, std::string_view name = "", JobCounter* counter = nullptr);

    /**
     * Calls func(i) for i in [0, count), in batches of batchSize. Runs inline on
     * the calling thread when there is a single worker or a single batch; the
     * counter is then never incremented, so waiting on it returns at once.
     */
    template <typename Func>
    void ParallelFor(std::size_t count, std::size_t batchSize, Func&& func, JobCounter* counter = nullptr)
    {
        if (count == 0)
        {
            return;
        }

        if (batchSize == 0)
        {
            batchSize = 1;
        }

        using FuncType = std::decay_t<Func>;
        auto sharedFunc = std::make_shared<FuncType>(std::forward<Func>(func));

        if (m_workers.size() <= 1 || count <= batchSize)
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                (*sharedFunc)(i);
            }
            return;
        }

        const std::size_t batches = (count + batchSize - 1) / batchSize;
        std::vector<JobFunction> jobs;
        jobs.reserve(batches);

        for (std::size_t batch = 0; batch < batches; ++batch)
        {
            const std::size_t start = batch * batchSize;
            const std::size_t end = std::min(start + batchSize, count);
            jobs.push_back([start, end, sharedFunc]() {
                for (std::size_t i = start; i < end; ++i)
                {
                    (*sharedFunc)(i);
                }
            });
        }

        ScheduleBatch(std::move(jobs), "parallel-for", counter);
    }

    void WaitForAll();
    void WaitForCounter(JobCounter& counter);

    [[nodiscard]] JobStats GetStats() const;
    [[nodiscard]] std::size_t WorkerCount() const { return m_workers.size(); }

private:
    struct Job
    {
        JobFunction function;
        std::string name;
        JobCounter* counter = nullptr;
    };

    void WorkerThread();
    void Shutdown();
    void Execute(Job& job);

    std::vector<std::thread> m_workers;
    std::queue<Job> m_jobs;
    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_completeCondition;

    bool m_shutdown = false;            // Guarded by m_queueMutex
    std::size_t m_activeJobs = 0;       // Guarded by m_queueMutex
    std::atomic<std::size_t> m_completedJobs{0};
    std::atomic<std::size_t> m_failedJobs{0};
};
} // namespace dimforge::core
