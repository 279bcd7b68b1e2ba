/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <random>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/pausable_thread_loop.hpp>

using dfms::detail::PausableThreadLoop;

TEST(PausableThreadLoop, ResumeAndPause) {
    int counter{0};
    std::mutex mutex;
    std::condition_variable cv;
    bool updated = false;

    PausableThreadLoop loop([&]() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++counter;
            updated = true;
        }
        cv.notify_one();
    });

    // The loop starts paused.
    EXPECT_FALSE(loop.is_running());
    loop.resume();
    EXPECT_TRUE(loop.is_running());

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&]() { return updated; });
    }

    loop.pause();
    int count_after_pause;
    {
        std::lock_guard<std::mutex> lock(mutex);
        count_after_pause = counter;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    loop.stop();
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_GT(counter, 0);
    // A pause may race with one last iteration.
    EXPECT_THAT(
        count_after_pause, testing::AnyOf(testing::Eq(counter), testing::Eq(counter - 1))
    );
}

TEST(PausableThreadLoop, StopIsFinal) {
    std::atomic<int> counter{0};
    PausableThreadLoop loop([&] { ++counter; }, std::chrono::milliseconds{1});
    EXPECT_TRUE(loop.resume());
    EXPECT_TRUE(loop.stop());
    EXPECT_FALSE(loop.is_running());
    EXPECT_FALSE(loop.resume());
    EXPECT_FALSE(loop.stop());
    int const after_stop = counter;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(after_stop, counter);
}

TEST(PausableThreadLoop, ConcurrentPauseAndResume) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> distr(1, 5);
    std::mutex gen_mutex;

    PausableThreadLoop loop([&] {
        int ms;
        {
            std::lock_guard<std::mutex> lock(gen_mutex);
            ms = distr(gen);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    });

    std::array<std::future<void>, 6> futures{
        std::async(std::launch::async, [&] { loop.pause(); }),
        std::async(std::launch::async, [&] { loop.resume(); }),
        std::async(std::launch::async, [&] { loop.pause_nb(); }),
        std::async(std::launch::async, [&] { loop.resume(); }),
        std::async(std::launch::async, [&] { loop.pause(); }),
        std::async(std::launch::async, [&] { loop.resume(); }),
    };
    for (auto& f : futures) {
        f.get();
    }

    // The loop may be running or paused, but every call returned.
    loop.stop();
    EXPECT_FALSE(loop.is_running());
}
