#pragma once

/// @file request_queue.hpp
/// @brief Bounded worker pool for outbound requests with per-id coalescing.

#include "core/types.hpp"

#include <any>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace almanac::queue
{
    /// @brief Pool size and rate limits.
    struct RequestQueueConfig
    {
        u32 max_concurrent = 1;
        std::chrono::milliseconds min_interval{0};  ///< Minimum gap between starts; 0 disables
        u32 max_per_minute = 0;                     ///< Starts per rolling minute; 0 disables
    };

    /// @brief Runs deferred work on a fixed pool of threads, FIFO.
    ///
    /// At most one execution per request id is ever in progress: a request
    /// whose id is already queued or running does not run again, the caller
    /// receives the future of the existing execution instead.
    ///
    /// Every future resolves. It holds the work's result, or an empty
    /// optional when the work threw, was cancelled, or the queue was
    /// destroyed before it started. Callers may drop the future at any time.
    class RequestQueue
    {
    public:
        explicit RequestQueue(RequestQueueConfig config = {});

        /// @brief Cancels queued work and joins the workers (running work completes).
        ~RequestQueue();

        RequestQueue(const RequestQueue&) = delete;
        RequestQueue& operator=(const RequestQueue&) = delete;
        RequestQueue(RequestQueue&&) = delete;
        RequestQueue& operator=(RequestQueue&&) = delete;

        /// @brief Submit work under an id, or attach to the execution already using it.
        /// @throws std::logic_error if @p id is in use with a different result type.
        template <typename Result>
        std::shared_future<std::optional<Result>> enqueue(
            const std::string& id,
            std::function<std::optional<Result>()> work);

        /// @brief Drop a request that has not started yet.
        /// @return true if the request was queued and is now cancelled.
        bool cancel(const std::string& id);

        /// @brief True while @p id is queued or running.
        [[nodiscard]] bool contains(const std::string& id) const;

        [[nodiscard]] std::size_t queued_count() const;
        [[nodiscard]] std::size_t in_flight_count() const;
        [[nodiscard]] u64 completed_count() const;

        /// @brief Multi-line diagnostic summary.
        [[nodiscard]] std::string status() const;

    private:
        struct Job
        {
            std::function<void()> run;
            std::function<void()> abandon;
        };

        struct Entry
        {
            Job job;
            std::any future;
            bool running = false;
        };

        /// Registers a job; returns the existing entry's future if @p id is taken.
        std::any submit(const std::string& id, Job job, std::any future);

        void worker_loop(u32 worker_index);
        [[nodiscard]] std::chrono::steady_clock::time_point next_start_allowed_locked(
            std::chrono::steady_clock::time_point now);
        void log_failure(const std::string& id, const char* what) const;

        RequestQueueConfig m_config;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::unordered_map<std::string, Entry> m_entries;
        std::deque<std::string> m_pending;
        std::deque<std::chrono::steady_clock::time_point> m_recent_starts;
        std::optional<std::chrono::steady_clock::time_point> m_last_start;
        std::size_t m_in_flight = 0;
        u64 m_completed = 0;
        bool m_stopping = false;

        std::vector<std::thread> m_workers;
    };

    // -----------------------------------------------------------------
    // Template implementation
    // -----------------------------------------------------------------

    template <typename Result>
    std::shared_future<std::optional<Result>> RequestQueue::enqueue(
        const std::string& id,
        std::function<std::optional<Result>()> work)
    {
        using Future = std::shared_future<std::optional<Result>>;

        auto promise = std::make_shared<std::promise<std::optional<Result>>>();
        Future future = promise->get_future().share();

        Job job{
            .run = [this, id, work = std::move(work), promise]() {
                try
                {
                    promise->set_value(work());
                }
                catch (const std::exception& e)
                {
                    log_failure(id, e.what());
                    promise->set_value(std::nullopt);
                }
            },
            .abandon = [promise]() { promise->set_value(std::nullopt); },
        };

        std::any existing = submit(id, std::move(job), std::any(future));
        if (!existing.has_value())
        {
            return future;
        }
        if (const auto* attached = std::any_cast<Future>(&existing))
        {
            return *attached;
        }
        throw std::logic_error("RequestQueue: id '" + id + "' is in use with a different result type");
    }

} // namespace almanac::queue
