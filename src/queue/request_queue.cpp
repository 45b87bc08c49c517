/// @file request_queue.cpp
/// @brief Worker pool, rate limiting and cancellation for RequestQueue.

#include "queue/request_queue.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace almanac::queue
{

namespace
{
    constexpr std::chrono::seconds kRateWindow{60};
}

// -----------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------

RequestQueue::RequestQueue(RequestQueueConfig config)
    : m_config(config)
{
    core::Logger::ensure_initialized();

    const u32 workers = std::max<u32>(1, m_config.max_concurrent);
    m_workers.reserve(workers);
    for (u32 i = 0; i < workers; ++i)
    {
        m_workers.emplace_back([this, i] { worker_loop(i); });
    }

    ALM_CORE_DEBUG("RequestQueue: Started {} workers (min interval {} ms, {} per minute)",
                   workers, m_config.min_interval.count(), m_config.max_per_minute);
}

RequestQueue::~RequestQueue()
{
    std::vector<Job> abandoned;
    {
        std::lock_guard lock(m_mutex);
        m_stopping = true;
        for (const auto& id : m_pending)
        {
            auto it = m_entries.find(id);
            if (it != m_entries.end())
            {
                abandoned.push_back(std::move(it->second.job));
                m_entries.erase(it);
            }
        }
        m_pending.clear();
    }
    m_cv.notify_all();

    for (auto& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }

    if (!abandoned.empty())
    {
        ALM_CORE_INFO("RequestQueue: Dropped {} queued requests at shutdown", abandoned.size());
    }
    for (auto& job : abandoned)
    {
        job.abandon();
    }
}

// -----------------------------------------------------------------
// Submission
// -----------------------------------------------------------------

std::any RequestQueue::submit(const std::string& id, Job job, std::any future)
{
    {
        std::lock_guard lock(m_mutex);

        if (const auto it = m_entries.find(id); it != m_entries.end())
        {
            ALM_CORE_DEBUG("RequestQueue: Request already {}: {}",
                           it->second.running ? "running" : "queued", id);
            return it->second.future;
        }

        if (!m_stopping)
        {
            m_entries.emplace(id, Entry{.job = std::move(job), .future = std::move(future), .running = false});
            m_pending.push_back(id);
            ALM_CORE_DEBUG("RequestQueue: Queued request {} (queue length: {})", id, m_pending.size());
            m_cv.notify_one();
            return {};
        }
    }

    ALM_CORE_WARN("RequestQueue: Rejected request {} during shutdown", id);
    job.abandon();
    return {};
}

bool RequestQueue::cancel(const std::string& id)
{
    Job job;
    {
        std::lock_guard lock(m_mutex);
        const auto it = m_entries.find(id);
        if (it == m_entries.end() || it->second.running)
        {
            return false;
        }

        job = std::move(it->second.job);
        m_entries.erase(it);
        m_pending.erase(std::remove(m_pending.begin(), m_pending.end(), id), m_pending.end());
    }

    ALM_CORE_DEBUG("RequestQueue: Cancelled request {}", id);
    job.abandon();

    // A rate-limited worker may be waiting on a request that no longer exists
    m_cv.notify_all();
    return true;
}

// -----------------------------------------------------------------
// Worker
// -----------------------------------------------------------------

std::chrono::steady_clock::time_point RequestQueue::next_start_allowed_locked(
    std::chrono::steady_clock::time_point now)
{
    while (!m_recent_starts.empty() && now - m_recent_starts.front() >= kRateWindow)
    {
        m_recent_starts.pop_front();
    }

    auto allowed = now;
    if (m_last_start && m_config.min_interval.count() > 0)
    {
        allowed = std::max(allowed, *m_last_start + m_config.min_interval);
    }
    if (m_config.max_per_minute > 0 && m_recent_starts.size() >= m_config.max_per_minute)
    {
        allowed = std::max(allowed, m_recent_starts.front() + kRateWindow);
    }
    return allowed;
}

void RequestQueue::worker_loop(u32 worker_index)
{
    while (true)
    {
        std::string id;
        Job job;
        {
            std::unique_lock lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_pending.empty(); });
            if (m_stopping)
            {
                break;
            }

            const auto now = std::chrono::steady_clock::now();
            const auto allowed = next_start_allowed_locked(now);
            if (allowed > now)
            {
                ALM_CORE_TRACE("RequestQueue: Rate limiting active, worker {} waiting", worker_index);
                m_cv.wait_until(lock, allowed);
                continue;
            }

            id = m_pending.front();
            m_pending.pop_front();

            auto& entry = m_entries.at(id);
            entry.running = true;
            job = std::move(entry.job);

            m_last_start = now;
            m_recent_starts.push_back(now);
            ++m_in_flight;
        }

        ALM_CORE_DEBUG("RequestQueue: Worker {} executing {}", worker_index, id);
        job.run();

        {
            std::lock_guard lock(m_mutex);
            m_entries.erase(id);
            --m_in_flight;
            ++m_completed;
        }
    }
}

void RequestQueue::log_failure(const std::string& id, const char* what) const
{
    ALM_CORE_ERROR("RequestQueue: Request {} failed: {}", id, what);
}

// -----------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------

bool RequestQueue::contains(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    return m_entries.contains(id);
}

std::size_t RequestQueue::queued_count() const
{
    std::lock_guard lock(m_mutex);
    return m_pending.size();
}

std::size_t RequestQueue::in_flight_count() const
{
    std::lock_guard lock(m_mutex);
    return m_in_flight;
}

u64 RequestQueue::completed_count() const
{
    std::lock_guard lock(m_mutex);
    return m_completed;
}

std::string RequestQueue::status() const
{
    std::lock_guard lock(m_mutex);

    const auto now = std::chrono::steady_clock::now();
    const auto recent = std::count_if(m_recent_starts.begin(), m_recent_starts.end(),
                                      [&](const auto& t) { return now - t < kRateWindow; });

    std::string info = fmt::format(
        "Queue Status:\n"
        "- Queued: {}\n"
        "- In flight: {}\n"
        "- Completed: {}\n"
        "- Recent requests (last minute): {}",
        m_pending.size(), m_in_flight, m_completed, recent);

    if (m_config.max_per_minute > 0)
    {
        info += fmt::format("/{}", m_config.max_per_minute);
    }

    if (m_last_start)
    {
        const auto since = std::chrono::duration<f64>(now - *m_last_start).count();
        info += fmt::format("\n- Time since last request: {:.1f}s", since);
    }
    return info;
}

} // namespace almanac::queue
