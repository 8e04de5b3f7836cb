// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <memory>

namespace parley
{

/// @brief A unit of work posted into a coordination context.
using Task = std::function<void()>;

/// @brief Serialized coordination context.
///
/// Every task posted to one executor runs on the same logical thread, one at a time, in posting order.
/// The coordinators keep all of their state behind an executor; asynchronous work reports back by
/// posting a task instead of touching coordinator state directly.
class Executor
{
  public:
    virtual ~Executor() = default;

    /// @brief Queues a task for execution. Safe to call from any thread.
    /// @param task The task to run.
    virtual void post(Task task) = 0;
};

/// @brief Executor that drains its mailbox on one dedicated worker thread.
class ThreadExecutor final: public Executor
{
  public:
    ThreadExecutor();
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void post(Task task) override;

    /// @brief Posts a task and blocks the calling thread until it has run.
    ///
    /// Must not be called from the worker thread itself.
    /// @param task The task to run.
    void runAndWait(Task task);

    /// @brief Returns true when called from the worker thread.
    [[nodiscard]] auto isWorkerThread() const -> bool;

    /// @brief Drops pending tasks and joins the worker thread. Later posts are ignored.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace parley
