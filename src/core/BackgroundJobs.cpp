// SPDX-License-Identifier: Apache-2.0
#include "BackgroundJobs.hpp"

#include <algorithm>

namespace parley
{

BackgroundJobs::~BackgroundJobs()
{
    cancelAll();
    // std::jthread joins on destruction
    _jobs.clear();
}

auto BackgroundJobs::spawn(JobFunction work) -> std::stop_source
{
    reapFinished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([work = std::move(work), finished](const std::stop_token& token) {
        work(token);
        finished->store(true, std::memory_order_release);
    });

    auto source = thread.get_stop_source();
    _jobs.push_back(Job { .thread = std::move(thread), .finished = std::move(finished) });
    return source;
}

void BackgroundJobs::cancelAll()
{
    for (auto& job: _jobs)
        job.thread.request_stop();
}

auto BackgroundJobs::runningCount() const -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(
        _jobs, [](const Job& job) { return !job.finished->load(std::memory_order_acquire); }));
}

void BackgroundJobs::reapFinished()
{
    std::erase_if(_jobs, [](Job& job) {
        if (!job.finished->load(std::memory_order_acquire))
            return false;
        job.thread.join();
        return true;
    });
}

} // namespace parley
