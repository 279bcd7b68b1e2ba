/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <condition_variable>
#include <memory>
#include <mutex>
#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/progress_thread.hpp>
#include <dfms/statistics.hpp>

#include "environment.hpp"

using dfms::ProgressThread;

TEST(ProgressThread, StopIsIdempotent) {
    ProgressThread progress_thread(GlobalEnvironment->comm_->logger());
    progress_thread.stop();
    EXPECT_NO_THROW(progress_thread.stop());
}

TEST(ProgressThread, RemoveFunctionOfOtherThreadThrows) {
    ProgressThread a(GlobalEnvironment->comm_->logger());
    ProgressThread b(GlobalEnvironment->comm_->logger());
    auto id = a.add_function([] { return ProgressThread::ProgressState::Done; });
    EXPECT_THROW(b.remove_function(id), std::logic_error);
    a.remove_function(id);
}

class ProgressThreadEvents
    : public ::testing::TestWithParam<std::tuple<int, int, bool>> {};

INSTANTIATE_TEST_SUITE_P(
    ProgressThread,
    ProgressThreadEvents,
    testing::Combine(
        testing::Values(1, 4),  // num_threads
        testing::Values(0, 1, 8),  // num_functions
        testing::Values(false, true)  // enable_statistics
    )
);

namespace {
struct TestFunction {
    std::size_t counter{0};
    ProgressThread::FunctionID id;
    std::mutex mutex;
    std::condition_variable cv;
};
}  // namespace

TEST_P(ProgressThreadEvents, FunctionsRunUntilDone) {
    auto const num_threads = static_cast<std::size_t>(std::get<0>(GetParam()));
    auto const num_functions = static_cast<std::size_t>(std::get<1>(GetParam()));
    bool const enable_statistics = std::get<2>(GetParam());

    auto& logger = GlobalEnvironment->comm_->logger();
    auto statistics = std::make_shared<dfms::Statistics>(enable_statistics);
    std::vector<std::unique_ptr<ProgressThread>> progress_threads;
    std::vector<std::vector<std::shared_ptr<TestFunction>>> functions(num_threads);

    auto expected_count = [num_functions](std::size_t thread, std::size_t function) {
        return thread * num_functions + function + 1;
    };

    for (std::size_t thread = 0; thread < num_threads; ++thread) {
        progress_threads.push_back(std::make_unique<ProgressThread>(logger, statistics));
        for (std::size_t function = 0; function < num_functions; ++function) {
            auto f = std::make_shared<TestFunction>();
            auto const expected = expected_count(thread, function);
            f->id = progress_threads[thread]->add_function([f, expected]() {
                auto ret = ProgressThread::ProgressState::InProgress;
                {
                    std::lock_guard<std::mutex> lock(f->mutex);
                    if (++f->counter == expected) {
                        ret = ProgressThread::ProgressState::Done;
                    }
                }
                f->cv.notify_one();
                return ret;
            });
            functions[thread].push_back(f);
        }
    }

    for (std::size_t thread = 0; thread < num_threads; ++thread) {
        for (std::size_t function = 0; function < num_functions; ++function) {
            auto f = functions[thread][function];
            auto const expected = expected_count(thread, function);
            {
                std::unique_lock<std::mutex> lock(f->mutex);
                f->cv.wait(lock, [&]() { return f->counter == expected; });
            }
            // Returns once the function reported Done, it is never called again.
            progress_threads[thread]->remove_function(f->id);
            std::lock_guard<std::mutex> lock(f->mutex);
            EXPECT_EQ(f->counter, expected);
        }
        progress_threads[thread]->stop();
    }

    if (statistics->enabled() && num_functions > 0) {
        EXPECT_THAT(statistics->report(), ::testing::HasSubstr("event-loop-total"));
    }
}
