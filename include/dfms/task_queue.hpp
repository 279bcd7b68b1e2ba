/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include <dfms/communicator/communicator.hpp>
#include <dfms/pausable_thread_loop.hpp>

namespace dfms::detail {

/**
 * @brief A FIFO of tasks drained by a dedicated pausable thread.
 *
 * Tasks run one at a time in push order. A task that throws is logged and dropped,
 * and the queue carries on with the next one. The thread pauses while the queue is
 * empty.
 */
class TaskQueue {
  public:
    /// @brief The task type.
    using Task = std::function<void()>;

    /**
     * @brief Construct a task queue.
     *
     * @param logger The logger used to report failing tasks.
     * @param name Name used in log messages.
     */
    TaskQueue(Communicator::Logger& logger, std::string name);

    ~TaskQueue() noexcept = default;

    TaskQueue(TaskQueue const&) = delete;
    TaskQueue& operator=(TaskQueue const&) = delete;

    /**
     * @brief Appends a task.
     *
     * @param task The task to run.
     */
    void push(Task task);

    /**
     * @brief Blocks until every task pushed so far has run.
     *
     * @note Must not be called from a task of the same queue.
     */
    void flush();

    /**
     * @brief Number of tasks waiting to run.
     *
     * @return The queue length, excluding a task that is currently running.
     */
    [[nodiscard]] std::size_t size() const;

  private:
    void progress();

    Communicator::Logger& logger_;
    std::string const name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool busy_{false};
    PausableThreadLoop thread_;
};

}  // namespace dfms::detail
