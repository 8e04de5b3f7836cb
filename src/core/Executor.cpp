// SPDX-License-Identifier: Apache-2.0
#include "Executor.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace parley
{

struct ThreadExecutor::Impl
{
    std::jthread worker;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Task> mailbox;
    bool shutdownRequested = false;

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !mailbox.empty() || shutdownRequested; });

                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                task = std::move(mailbox.front());
                mailbox.pop_front();
            }

            if (task)
                task();
        }
    }
};

ThreadExecutor::ThreadExecutor(): _impl(std::make_unique<Impl>())
{
    _impl->worker = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });
}

ThreadExecutor::~ThreadExecutor()
{
    shutdown();
}

void ThreadExecutor::post(Task task)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->mailbox.push_back(std::move(task));
    }
    _impl->cv.notify_one();
}

void ThreadExecutor::runAndWait(Task task)
{
    // A dropped task destroys the packaged_task, which makes the future ready as well.
    auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
    auto finished = packaged->get_future();
    post([packaged] { (*packaged)(); });
    packaged.reset();
    finished.wait();
}

auto ThreadExecutor::isWorkerThread() const -> bool
{
    return std::this_thread::get_id() == _impl->worker.get_id();
}

void ThreadExecutor::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shutdownRequested = true;
        _impl->mailbox.clear();
    }
    _impl->cv.notify_all();

    if (_impl->worker.joinable() && !isWorkerThread())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

} // namespace parley
