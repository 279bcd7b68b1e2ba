/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <dfms/node/event_channel.hpp>
#include <dfms/node/node_ref.hpp>
#include <dfms/node/storage.hpp>
#include <dfms/node/types.hpp>

namespace dfms {

/**
 * @brief A data-holding node of the dataflow graph.
 *
 * A node owns its storage and a running CRC-32 of the bytes written to it, and
 * publishes exactly one COMPLETE or ERROR event on its session's channel when it
 * reaches a terminal data state. All operations are serialized by an internal mutex,
 * events are published after the mutex is released.
 *
 * Writes are expected to come from a single writer at a time.
 */
class Node : public NodeRef, public std::enable_shared_from_this<Node> {
  public:
    /**
     * @brief Construct a node in state INITIALIZED.
     *
     * @param identity The identifiers of the node.
     * @param storage The byte buffer of the node.
     * @param channel The channel of the node's session.
     * @param expected_size If set, the node finalizes itself once this many bytes
     * have been written and longer writes are truncated.
     */
    Node(
        NodeIdentity identity,
        std::unique_ptr<Storage> storage,
        std::shared_ptr<EventChannel> channel,
        std::optional<std::size_t> expected_size = std::nullopt
    );

    ~Node() noexcept override = default;

    Node(Node const&) = delete;
    Node& operator=(Node const&) = delete;

    using NodeRef::write;

    [[nodiscard]] InstanceID const& instance_id() const noexcept override {
        return identity_.instance_id;
    }

    [[nodiscard]] ManagerID const& manager_id() const noexcept override {
        return identity_.manager_id;
    }

    /**
     * @brief The pipeline-level identifier.
     *
     * @return The object id.
     */
    [[nodiscard]] ObjectID const& object_id() const noexcept {
        return identity_.object_id;
    }

    /**
     * @brief The session owning the node.
     *
     * @return The session id.
     */
    [[nodiscard]] SessionID const& session_id() const noexcept {
        return identity_.session_id;
    }

    /**
     * @brief The expected size, if any.
     *
     * @return The expected number of bytes.
     */
    [[nodiscard]] std::optional<std::size_t> expected_size() const noexcept {
        return expected_size_;
    }

    [[nodiscard]] NodeState state() const override;
    [[nodiscard]] std::uint32_t checksum() const override;
    [[nodiscard]] std::size_t size() const override;

    /**
     * @brief Alias of `size()`.
     *
     * @return The number of bytes written so far.
     */
    [[nodiscard]] std::size_t bytes_written() const {
        return size();
    }

    [[nodiscard]] bool is_container() const override {
        return false;
    }

    [[nodiscard]] std::vector<std::shared_ptr<NodeRef>> children() const override {
        return {};
    }

    /**
     * @brief The cause given to `fail()`.
     *
     * @return The cause, empty unless the node is in ERROR.
     */
    [[nodiscard]] std::string cause() const;

    std::size_t write(std::span<std::uint8_t const> data) override;
    void finalize() override;
    void fail(std::string const& cause) override;
    [[nodiscard]] ReadHandle open() override;
    [[nodiscard]] std::vector<std::uint8_t> read(
        ReadHandle handle, std::size_t max_bytes
    ) override;
    void close(ReadHandle handle) override;

    /**
     * @brief Moves the node to EXPIRED and releases its storage and read handles.
     *
     * @return True if the node was WRITING, i.e. the teardown interrupted a writer.
     *
     * @throws std::exception If the storage fails to release its resources, the node
     * is EXPIRED regardless.
     */
    bool expire();

    /**
     * @brief Registers a downstream node hosted in this process.
     *
     * The consumer learns about this node through `add_producer()` and is subscribed
     * to its events. If this node is already terminal, its event is replayed to the
     * consumer.
     *
     * @param consumer The downstream node.
     *
     * @throws dfms::duplicate_consumer If `consumer` is already registered.
     * @throws std::invalid_argument If `consumer` cannot consume (e.g. a data node).
     */
    void add_consumer(std::shared_ptr<Node> const& consumer);

    /**
     * @brief Registers a listener for the events of this node.
     *
     * If this node is already terminal, its event is replayed to the listener.
     *
     * @param listener The listener, e.g. a proxy of a node in another process.
     *
     * @throws dfms::duplicate_consumer If a listener with the same id is registered.
     */
    void add_consumer(std::shared_ptr<EventListener> listener);

    /**
     * @brief The ids of the registered consumers, in registration order.
     *
     * @return The consumer ids.
     */
    [[nodiscard]] std::vector<std::string> consumers() const;

    /**
     * @brief Registers an upstream node whose COMPLETE event drives this node.
     *
     * @param producer The upstream node.
     *
     * @throws std::invalid_argument For nodes that do not consume, which is the
     * default.
     */
    virtual void add_producer(std::shared_ptr<NodeRef> const& producer);

    /**
     * @brief Handles an event of a node this node listens to.
     *
     * The default ignores the event.
     *
     * @param event The event.
     */
    virtual void handle_event(Event const& event);

    /**
     * @brief The channel of the node's session.
     *
     * @return The channel.
     */
    [[nodiscard]] std::shared_ptr<EventChannel> const& channel() const noexcept {
        return channel_;
    }

    /**
     * @brief Description of the node.
     *
     * @return The description.
     */
    [[nodiscard]] virtual std::string str() const;

  protected:
    /**
     * @brief Moves the node to COMPLETE unless it already reached a terminal state.
     *
     * @return True if this call completed the node.
     */
    bool try_finalize();

    /**
     * @brief Publishes an event of this node.
     *
     * @param kind The kind of event.
     */
    void publish(EventKind kind);

    NodeIdentity const identity_;  ///< The identifiers.
    std::shared_ptr<EventChannel> const channel_;  ///< The session channel.

  private:
    void check_writable() const;
    void check_readable() const;

    mutable std::mutex mutex_;
    std::unique_ptr<Storage> storage_;
    std::optional<std::size_t> const expected_size_;
    NodeState state_{NodeState::INITIALIZED};
    std::size_t bytes_written_{0};
    std::uint32_t crc_{0};
    std::string cause_;
    ReadHandle next_handle_{1};
    std::unordered_map<ReadHandle, std::unique_ptr<StorageReader>> readers_;
    std::vector<std::string> consumers_;
};

/**
 * @brief Listener delivering events synchronously to a node in this process.
 *
 * Holds a non-owning reference: the node belongs to its Node Manager.
 */
class LocalListener final : public EventListener {
  public:
    /**
     * @brief Construct a listener for a node.
     *
     * @param node The receiving node.
     */
    explicit LocalListener(std::shared_ptr<Node> const& node);

    [[nodiscard]] std::string const& listener_id() const noexcept override {
        return id_;
    }

    /**
     * @copydoc EventListener::deliver
     *
     * @throws dfms::delivery_error If the node no longer exists.
     */
    void deliver(Event const& event) override;

  private:
    std::weak_ptr<Node> node_;
    std::string const id_;
};

}  // namespace dfms
