/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <exception>
#include <utility>

#include <dfms/task_queue.hpp>

namespace dfms::detail {

TaskQueue::TaskQueue(Communicator::Logger& logger, std::string name)
    : logger_{logger}, name_{std::move(name)}, thread_{[this]() { progress(); }} {}

void TaskQueue::push(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
    thread_.resume();
}

void TaskQueue::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
}

std::size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskQueue::progress() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) {
            thread_.pause_nb();
            return;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
        busy_ = true;
    }
    try {
        task();
    } catch (std::exception const& e) {
        logger_.warn("TaskQueue(", name_, ") - task failed: ", e.what());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
        if (tasks_.empty()) {
            thread_.pause_nb();
        }
    }
    cv_.notify_all();
}

}  // namespace dfms::detail
