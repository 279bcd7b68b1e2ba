/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <dfms/error.hpp>
#include <dfms/manager/manager_interface.hpp>

/**
 * @brief Scriptable manager that records the calls it receives.
 *
 * The node operations are not supported and throw `dfms::unknown_node`.
 */
class FakeManager final : public dfms::ManagerInterface {
  public:
    /// @brief How `reserve()` answers.
    enum class Reserve {
        ACCEPT,
        DECLINE,
        THROW,
    };

    explicit FakeManager(dfms::ManagerID id) : id_{std::move(id)} {}

    [[nodiscard]] dfms::ManagerID const& manager_id() const noexcept override {
        return id_;
    }

    bool reserve(dfms::SessionID const& session, std::size_t num_nodes) override {
        record("reserve " + session + " " + std::to_string(num_nodes));
        switch (reserve_) {
        case Reserve::ACCEPT:
            return true;
        case Reserve::DECLINE:
            return false;
        case Reserve::THROW:
            break;
        }
        throw std::runtime_error("manager " + id_ + " is unreachable");
    }

    void release(dfms::SessionID const& session) override {
        record("release " + session);
    }

    dfms::InstanceID register_node(
        dfms::NodeDescriptor const& descriptor, dfms::SessionID const& session
    ) override {
        record("register " + session + " " + descriptor.instance_id);
        return descriptor.instance_id;
    }

    void link(
        dfms::SessionID const& session,
        dfms::Edge const& edge,
        dfms::ManagerID const&,
        dfms::ManagerID const&
    ) override {
        record("link " + session + " " + edge.from + "->" + edge.to);
        if (fail_link_) {
            throw std::runtime_error("link refused by " + id_);
        }
    }

    [[nodiscard]] std::shared_ptr<dfms::NodeRef> lookup(
        dfms::InstanceID const& instance_id
    ) override {
        unsupported(instance_id);
    }

    dfms::ShutdownStatus shutdown_session(dfms::SessionID const& session) override {
        record("shutdown " + session);
        if (fail_shutdown_) {
            throw std::runtime_error("shutdown refused by " + id_);
        }
        return dfms::ShutdownStatus::CLEAN;
    }

    void deliver_event(
        dfms::InstanceID const& target, dfms::Event const& event
    ) override {
        ++deliveries_;
        record("deliver " + event.source + "->" + target);
        if (fail_delivery_ || deliveries_ <= transient_failures_) {
            throw dfms::delivery_error("manager " + id_ + " drops the event");
        }
    }

    [[nodiscard]] dfms::NodeInfo node_info(dfms::InstanceID const& id) override {
        unsupported(id);
    }

    [[nodiscard]] std::uint32_t node_checksum(dfms::InstanceID const& id) override {
        unsupported(id);
    }

    [[nodiscard]] std::size_t node_size(dfms::InstanceID const& id) override {
        unsupported(id);
    }

    std::size_t node_write(
        dfms::InstanceID const& id, std::span<std::uint8_t const>
    ) override {
        unsupported(id);
    }

    void node_finalize(dfms::InstanceID const& id) override {
        unsupported(id);
    }

    void node_fail(dfms::InstanceID const& id, std::string const&) override {
        unsupported(id);
    }

    [[nodiscard]] dfms::ReadHandle node_open(dfms::InstanceID const& id) override {
        unsupported(id);
    }

    [[nodiscard]] std::vector<std::uint8_t> node_read(
        dfms::InstanceID const& id, dfms::ReadHandle, std::size_t
    ) override {
        unsupported(id);
    }

    void node_close(dfms::InstanceID const& id, dfms::ReadHandle) override {
        unsupported(id);
    }

    [[nodiscard]] std::vector<dfms::NodeAddress> node_children(
        dfms::InstanceID const& id
    ) override {
        unsupported(id);
    }

    void set_reserve(Reserve reserve) {
        reserve_ = reserve;
    }

    void set_fail_link(bool fail) {
        fail_link_ = fail;
    }

    void set_fail_shutdown(bool fail) {
        fail_shutdown_ = fail;
    }

    void set_fail_delivery(bool fail) {
        fail_delivery_ = fail;
    }

    /// @brief Fails only the first `num` deliveries.
    void set_transient_delivery_failures(std::size_t num) {
        transient_failures_ = num;
    }

    [[nodiscard]] std::size_t deliveries() const noexcept {
        return deliveries_;
    }

    /// @brief The calls received so far, e.g. "reserve s 3".
    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

  private:
    void record(std::string call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(std::move(call));
    }

    [[noreturn]] void unsupported(dfms::InstanceID const& id) const {
        throw dfms::unknown_node(id + " is not hosted by fake manager " + id_);
    }

    dfms::ManagerID const id_;
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::atomic<Reserve> reserve_{Reserve::ACCEPT};
    std::atomic<bool> fail_link_{false};
    std::atomic<bool> fail_shutdown_{false};
    std::atomic<bool> fail_delivery_{false};
    std::atomic<std::size_t> deliveries_{0};
    std::atomic<std::size_t> transient_failures_{0};
};
