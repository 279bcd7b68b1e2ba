/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dfms/pausable_thread_loop.hpp>

namespace dfms::detail {

PausableThreadLoop::PausableThreadLoop(std::function<void()> func, Duration sleep) {
    thread_ = std::thread([this, f = std::move(func), sleep]() {
        while (true) {
            // wait until the thread is not paused
            state_.wait(State::Paused, std::memory_order_acquire);

            // if the thread is pausing, set it to paused, and loop again
            State expected = State::Pausing;
            if (state_.compare_exchange_strong(
                    expected,
                    State::Paused,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed
                ))
            {
                state_.notify_all();
                continue;
            }

            // Stopping -> Stopped is only performed by this thread.
            expected = State::Stopping;
            if (state_.compare_exchange_strong(
                    expected,
                    State::Stopped,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed
                ))
            {
                state_.notify_all();
                return;
            }

            f();

            if (sleep > std::chrono::seconds{0}) {
                std::this_thread::sleep_for(sleep);
            } else {
                std::this_thread::yield();
            }
        }
    });
}

PausableThreadLoop::~PausableThreadLoop() noexcept {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PausableThreadLoop::is_running() const noexcept {
    auto state = state_.load(std::memory_order_acquire);
    return state != State::Paused && state != State::Stopped;
}

void PausableThreadLoop::pause_nb() noexcept {
    State expected = State::Running;
    if (state_.compare_exchange_strong(
            expected, State::Pausing, std::memory_order_acq_rel, std::memory_order_relaxed
        ))
    {
        state_.notify_all();
    }
}

void PausableThreadLoop::pause() noexcept {
    pause_nb();
    state_.wait(State::Pausing, std::memory_order_acquire);
}

bool PausableThreadLoop::resume() noexcept {
    State curr = state_.load(std::memory_order_relaxed);
    while (curr == State::Paused || curr == State::Pausing) {
        // CAS weak is fine, a spurious failure just retries.
        if (state_.compare_exchange_weak(
                curr, State::Running, std::memory_order_acq_rel, std::memory_order_relaxed
            ))
        {
            state_.notify_all();
            return true;
        }
    }
    return false;
}

bool PausableThreadLoop::stop() noexcept {
    State curr = state_.load(std::memory_order_relaxed);
    while (curr != State::Stopping && curr != State::Stopped) {
        if (state_.compare_exchange_weak(
                curr,
                State::Stopping,
                std::memory_order_acq_rel,
                std::memory_order_relaxed
            ))
        {
            state_.notify_all();

            // wait for state_ Stopping -> Stopped
            state_.wait(State::Stopping, std::memory_order_acquire);

            if (thread_.joinable()) {
                thread_.join();
            }
            return true;
        }
        // else another thread changed state_ and curr holds the new value, retry.
    }
    return false;
}

}  // namespace dfms::detail
