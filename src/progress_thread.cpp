/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <utility>
#include <vector>

#include <dfms/error.hpp>
#include <dfms/progress_thread.hpp>
#include <dfms/utils.hpp>

namespace dfms {

ProgressThread::ProgressThread(
    Communicator::Logger& logger, std::shared_ptr<Statistics> statistics, Duration sleep
)
    : logger_(logger),
      statistics_(std::move(statistics)),
      thread_([this]() { event_loop(); }, sleep) {
    DFMS_EXPECTS(statistics_ != nullptr, "the statistics pointer cannot be NULL");
}

ProgressThread::~ProgressThread() {
    stop();
}

void ProgressThread::stop() {
    logger_.debug("ProgressThread.stop() - initiate");
    thread_.stop();
    logger_.debug("ProgressThread.stop() - done");
}

ProgressThread::FunctionID ProgressThread::add_function(Function&& function) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id =
        FunctionID(reinterpret_cast<ProgressThreadAddress>(this), next_function_id_++);
    staged_functions_.emplace(id.function_index, std::move(function));
    thread_.resume();
    return id;
}

void ProgressThread::remove_function(FunctionID function_id) {
    DFMS_EXPECTS(function_id.is_valid(), "FunctionID is not valid");
    DFMS_EXPECTS(
        function_id.thread_address == reinterpret_cast<ProgressThreadAddress>(this),
        "Function was not registered with this ProgressThread"
    );
    auto const idx = function_id.function_index;
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() {
        return !staged_functions_.contains(idx) && !functions_.contains(idx);
    });
}

void ProgressThread::event_loop() {
    auto const t0_event_loop = Clock::now();

    // Move any staged functions to the active set. `functions_` mirrors the keys of
    // `active_` and is what `remove_function()` observes under the lock.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [idx, function] : staged_functions_) {
            active_.emplace(idx, std::move(function));
            functions_.insert(idx);
        }
        staged_functions_.clear();
    }

    // Progress every function without holding the lock.
    std::vector<FunctionIndex> completed;
    for (auto& [idx, function] : active_) {
        if (function() == ProgressState::Done) {
            completed.push_back(idx);
        }
    }
    for (auto idx : completed) {
        active_.erase(idx);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto idx : completed) {
            functions_.erase(idx);
        }
        if (functions_.empty() && staged_functions_.empty()) {
            thread_.pause_nb();
        }
    }
    if (!completed.empty()) {
        cv_.notify_all();
    }

    statistics_->add_duration_stat("event-loop-total", Clock::now() - t0_event_loop);
}

}  // namespace dfms
