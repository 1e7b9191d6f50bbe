#include "dimforge/core/JobSystem.hpp"

#include <exception>
#include <iostream>

namespace dimforge::core
{
JobSystem::JobSystem(std::size_t workerCount)
{
    if (workerCount == 0)
    {
        const auto hardware = std::thread::hardware_concurrency();
        workerCount = hardware > 1 ? hardware - 1 : 1;
    }

    m_workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        m_workers.emplace_back(&JobSystem::WorkerThread, this);
    }

    std::cout << "[JobSystem] Started " << workerCount << " workers\n";
}

JobSystem::~JobSystem()
{
    Shutdown();
}

void JobSystem::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_shutdown = true;
    }
    m_condition.notify_all();

    // Workers drain the queue before exiting.
    for (std::thread& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    m_workers.clear();
}

void JobSystem::Schedule(JobFunction job, std::string_view name, JobCounter* counter)
{
    if (!job)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (counter != nullptr)
        {
            counter->m_count.fetch_add(1, std::memory_order_relaxed);
        }
        m_jobs.push(Job{std::move(job), std::string(name), counter});
    }

    m_condition.notify_one();
}

void JobSystem::ScheduleBatch(std::vector<JobFunction> jobs, std::string_view name, JobCounter* counter)
{
    if (jobs.empty())
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        for (auto& job : jobs)
        {
            if (!job)
            {
                continue;
            }
            if (counter != nullptr)
            {
                counter->m_count.fetch_add(1, std::memory_order_relaxed);
            }
            m_jobs.push(Job{std::move(job), std::string(name), counter});
        }
    }

    m_condition.notify_all();
}

void JobSystem::WaitForAll()
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_completeCondition.wait(lock, [this]() {
        return m_jobs.empty() && m_activeJobs == 0;
    });
}

void JobSystem::WaitForCounter(JobCounter& counter)
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_completeCondition.wait(lock, [&counter]() {
        return counter.m_count.load(std::memory_order_relaxed) == 0;
    });
}

JobStats JobSystem::GetStats() const
{
    JobStats stats;
    stats.totalWorkers = m_workers.size();
    stats.completedJobs = m_completedJobs.load();
    stats.failedJobs = m_failedJobs.load();

    std::lock_guard<std::mutex> lock(m_queueMutex);
    stats.pendingJobs = m_jobs.size();
    stats.activeJobs = m_activeJobs;
    return stats;
}

void JobSystem::Execute(Job& job)
{
    try
    {
        job.function();
    }
    catch (const std::exception& e)
    {
        ++m_failedJobs;
        std::cerr << "[JobSystem] ERROR - Job '" << job.name << "' threw: " << e.what() << "\n";
    }
    catch (...)
    {
        ++m_failedJobs;
        std::cerr << "[JobSystem] ERROR - Job '" << job.name << "' threw an unknown exception\n";
    }
}

void JobSystem::WorkerThread()
{
    while (true)
    {
        Job job;

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_condition.wait(lock, [this]() {
                return m_shutdown || !m_jobs.empty();
            });

            if (m_jobs.empty())
            {
                // Shutdown with nothing left to run.
                return;
            }

            job = std::move(m_jobs.front());
            m_jobs.pop();
            // Counted under the lock so WaitForAll never sees an empty queue
            // while a popped job has not started.
            ++m_activeJobs;
        }

        Execute(job);
        ++m_completedJobs;

        {
            // The counter is released under the lock and never touched after
            // it, so a waiter woken by it may drop the counter right away.
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (job.counter != nullptr)
            {
                job.counter->m_count.fetch_sub(1, std::memory_order_relaxed);
            }
            --m_activeJobs;
        }
        m_completeCondition.notify_all();
    }
}
} // namespace dimforge::core
