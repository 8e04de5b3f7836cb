// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

namespace parley
{

/// @brief Body of a background job. The stop token is the job's cooperative cancellation flag.
using JobFunction = std::function<void(std::stop_token)>;

/// @brief Owns the threads that run blocking work on behalf of a coordinator.
///
/// Cancellation is cooperative: requesting stop never interrupts a call already in flight, it only tells
/// the job not to start the next one. Finished threads are joined lazily on the next spawn; destruction
/// requests stop on every job and joins all of them.
class BackgroundJobs
{
  public:
    BackgroundJobs() = default;
    ~BackgroundJobs();

    BackgroundJobs(const BackgroundJobs&) = delete;
    BackgroundJobs& operator=(const BackgroundJobs&) = delete;

    /// @brief Starts a job on its own thread.
    /// @param work The job body.
    /// @return The stop source that cancels this job.
    auto spawn(JobFunction work) -> std::stop_source;

    /// @brief Requests stop on every job without waiting for them.
    void cancelAll();

    /// @brief Returns the number of jobs that have not returned yet.
    [[nodiscard]] auto runningCount() const -> std::size_t;

  private:
    struct Job
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void reapFinished();

    std::vector<Job> _jobs;
};

} // namespace parley
