/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <dfms/communicator/communicator.hpp>
#include <dfms/pausable_thread_loop.hpp>
#include <dfms/statistics.hpp>

namespace dfms {

/**
 * @brief A progress thread that can execute arbitrary functions.
 *
 * Functions are added with `add_function()` and called repeatedly by the thread until
 * they report `ProgressState::Done`. The thread pauses itself when there is nothing
 * to run and wakes up when a new function is added.
 *
 * Progress functions must not throw.
 */
class ProgressThread {
  public:
    /**
     * @brief The progress state of a function, can be either `InProgress` or `Done`.
     */
    enum ProgressState : bool {
        InProgress,
        Done,
    };

    /**
     * @typedef FunctionIndex
     * @brief The sequential index of a function registered with a ProgressThread.
     */
    using FunctionIndex = std::uint64_t;

    /**
     * @typedef ProgressThreadAddress
     * @brief The address of a ProgressThread instance.
     */
    using ProgressThreadAddress = std::uintptr_t;

    /**
     * @brief The unique ID of a function registered with `ProgressThread`.
     */
    struct FunctionID {
        ProgressThreadAddress thread_address{0};  ///< The ProgressThread instance.
        FunctionIndex function_index{0};  ///< The sequential index of the function.

        FunctionID() = default;

        /**
         * @brief Construct a new FunctionID.
         *
         * @param thread_addr The address of the ProgressThread instance.
         * @param index The sequential index of the function.
         */
        constexpr FunctionID(ProgressThreadAddress thread_addr, FunctionIndex index)
            : thread_address(thread_addr), function_index(index) {}

        /**
         * @brief Check if the FunctionID is valid.
         *
         * @return True if the FunctionID was issued by a ProgressThread.
         */
        [[nodiscard]] constexpr bool is_valid() const {
            return thread_address != ProgressThreadAddress(0);
        }
    };

    /**
     * @typedef Function
     * @brief The function type supported by `ProgressThread`, returning the progress
     * state of the function.
     */
    using Function = std::function<ProgressState()>;

    /**
     * @brief Construct a new progress thread.
     *
     * @param logger The logger instance to use.
     * @param statistics The statistics instance to use (disabled by default).
     * @param sleep The duration to sleep between each progress loop iteration.
     */
    ProgressThread(
        Communicator::Logger& logger,
        std::shared_ptr<Statistics> statistics = Statistics::disabled(),
        Duration sleep = std::chrono::microseconds{1}
    );

    ~ProgressThread();

    ProgressThread(ProgressThread const&) = delete;
    ProgressThread& operator=(ProgressThread const&) = delete;

    /**
     * @brief Stop the thread, blocking until it has stopped.
     */
    void stop();

    /**
     * @brief Insert a function to process as part of the event loop.
     *
     * @param function The function to register.
     * @return The unique ID of the function that was registered.
     */
    FunctionID add_function(Function&& function);

    /**
     * @brief Remove a function, blocking until it has returned `ProgressState::Done`.
     *
     * The function will keep being called until it is done, so the caller must make
     * sure it eventually reports `Done`.
     *
     * @param function_id The unique ID of the function to be removed.
     *
     * @throws std::logic_error If the function was not registered with this thread.
     */
    void remove_function(FunctionID function_id);

  private:
    /**
     * @brief The event loop progressing each of the functions.
     */
    void event_loop();

    Communicator::Logger& logger_;
    std::shared_ptr<Statistics> statistics_;
    std::mutex mutex_;
    std::condition_variable cv_;
    FunctionIndex next_function_id_{0};
    std::unordered_map<FunctionIndex, Function> staged_functions_;
    std::unordered_set<FunctionIndex> functions_;  ///< Indices of active functions.
    // Only touched by the loop thread.
    std::unordered_map<FunctionIndex, Function> active_;
    detail::PausableThreadLoop thread_;
};

}  // namespace dfms
