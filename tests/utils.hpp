/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <dfms/app/application.hpp>
#include <dfms/node/consumer_node.hpp>
#include <dfms/node/container_node.hpp>
#include <dfms/node/event_channel.hpp>
#include <dfms/node/node.hpp>
#include <dfms/node/storage.hpp>

#include "environment.hpp"

/// @brief User-defined literal for specifying memory sizes in KiB.
constexpr std::size_t operator"" _KiB(unsigned long long val) {
    return val * (1 << 10);
}

/// @brief The input text of the grep/sort/reverse pipeline.
inline constexpr char const* pipeline_input =
    "first line\nwe have an a here\nand another one\nnoone knows me";

[[nodiscard]] inline std::vector<std::uint8_t> to_bytes(std::string const& s) {
    return {s.begin(), s.end()};
}

[[nodiscard]] inline std::shared_ptr<dfms::EventChannel> make_channel(
    std::shared_ptr<dfms::Statistics> statistics = dfms::Statistics::disabled()
) {
    return std::make_shared<dfms::EventChannel>(
        GlobalEnvironment->comm_->logger(), std::move(statistics)
    );
}

[[nodiscard]] inline dfms::NodeIdentity identity(dfms::InstanceID id) {
    return dfms::NodeIdentity{id, std::move(id), "test-session", ""};
}

[[nodiscard]] inline std::shared_ptr<dfms::Node> make_data_node(
    dfms::InstanceID id,
    std::shared_ptr<dfms::EventChannel> channel,
    std::optional<std::size_t> expected_size = std::nullopt
) {
    return std::make_shared<dfms::Node>(
        identity(std::move(id)),
        std::make_unique<dfms::InMemoryStorage>(),
        std::move(channel),
        expected_size
    );
}

/**
 * @brief Listener recording every event it receives.
 */
class RecordingListener final : public dfms::EventListener {
  public:
    explicit RecordingListener(std::string id) : id_{std::move(id)} {}

    [[nodiscard]] std::string const& listener_id() const noexcept override {
        return id_;
    }

    void deliver(dfms::Event const& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            throw dfms::delivery_error("recording listener " + id_ + " is broken");
        }
        events_.push_back(event);
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    [[nodiscard]] std::vector<dfms::Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

  private:
    std::string const id_;
    mutable std::mutex mutex_;
    std::vector<dfms::Event> events_;
    bool fail_{false};
};

/**
 * @brief Application that records the producers it ran for and copies their content.
 */
class RecordingApplication final : public dfms::Application {
  public:
    struct Record {
        std::mutex mutex;
        std::vector<dfms::InstanceID> producers;
        std::atomic<int> concurrent{0};
        std::atomic<int> max_concurrent{0};
    };

    explicit RecordingApplication(
        std::shared_ptr<Record> record,
        std::chrono::milliseconds delay = std::chrono::milliseconds{0},
        std::function<void(dfms::NodeRef&)> hook = nullptr
    )
        : record_{std::move(record)}, delay_{delay}, hook_{std::move(hook)} {}

    void run(dfms::ConsumerContext& ctx, dfms::NodeRef& producer) override {
        auto const now = ++record_->concurrent;
        int prev = record_->max_concurrent;
        while (prev < now && !record_->max_concurrent.compare_exchange_weak(prev, now)) {
        }
        {
            std::lock_guard<std::mutex> lock(record_->mutex);
            record_->producers.push_back(producer.instance_id());
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        --record_->concurrent;
        if (hook_) {
            hook_(producer);
        }
        ctx.write(dfms::read_all_text(producer));
    }

    [[nodiscard]] std::string const& name() const noexcept override {
        return name_;
    }

  private:
    std::shared_ptr<Record> record_;
    std::chrono::milliseconds const delay_;
    std::function<void(dfms::NodeRef&)> hook_;
    std::string const name_{"recording"};
};

[[nodiscard]] inline std::shared_ptr<dfms::ConsumerNode> make_consumer(
    dfms::InstanceID id,
    std::unique_ptr<dfms::Application> application,
    std::shared_ptr<dfms::EventChannel> channel,
    std::optional<std::size_t> num_producers = std::nullopt
) {
    return std::make_shared<dfms::ConsumerNode>(
        identity(std::move(id)),
        std::make_unique<dfms::InMemoryStorage>(),
        std::move(application),
        std::move(channel),
        dfms::config::Options{},
        std::nullopt,
        num_producers
    );
}

/// @brief Polls `pred` until it holds or `timeout` expires.
template <typename Pred>
[[nodiscard]] bool eventually(
    Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds{10}
) {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return true;
}
