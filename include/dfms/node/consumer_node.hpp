/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <dfms/app/application.hpp>
#include <dfms/config.hpp>
#include <dfms/node/node.hpp>

namespace dfms {

class ConsumerNode;

/**
 * @brief What an `Application` sees of the consumer it runs in.
 */
class ConsumerContext {
  public:
    /**
     * @brief Construct a context for a consumer.
     *
     * @param node The consumer node.
     */
    explicit ConsumerContext(ConsumerNode& node) : node_{node} {}

    /**
     * @brief Appends output to the consumer.
     *
     * @param data The bytes to write.
     * @return The number of bytes accepted.
     */
    std::size_t write(std::span<std::uint8_t const> data);

    /// @copydoc write(std::span<std::uint8_t const>)
    std::size_t write(std::string_view data);

    /**
     * @brief The per-node options of the consumer.
     *
     * @return The options.
     */
    [[nodiscard]] config::Options& options();

    /**
     * @brief The logger of the consumer's session.
     *
     * @return The logger.
     */
    [[nodiscard]] Communicator::Logger& logger();

    /**
     * @brief The id of the consumer.
     *
     * @return The instance id.
     */
    [[nodiscard]] InstanceID const& instance_id() const noexcept;

  private:
    ConsumerNode& node_;
};

/**
 * @brief A node driven by the completion of its producers.
 *
 * For every producer that completes, the embedded application runs once over that
 * producer's final content and writes its output to this node. Once every producer
 * has been consumed the node finalizes itself. A producer in ERROR, or an application
 * that throws, fails the node instead. Runs are serialized.
 *
 * The node never finalizes while its producer set is open. A consumer constructed
 * with a number of producers is closed from the start, otherwise `seal()` closes it.
 */
class ConsumerNode final : public Node {
  public:
    /**
     * @brief Construct a consumer.
     *
     * @param identity The identifiers of the node.
     * @param storage The byte buffer of the node.
     * @param application The application logic.
     * @param channel The channel of the node's session.
     * @param options The per-node options, available to the application.
     * @param expected_size If set, see `Node`.
     * @param num_producers The number of producers the consumer will have. When
     * given, the node only finalizes after that many producers completed. When not
     * given, it finalizes once it is sealed and every registered producer completed.
     */
    ConsumerNode(
        NodeIdentity identity,
        std::unique_ptr<Storage> storage,
        std::unique_ptr<Application> application,
        std::shared_ptr<EventChannel> channel,
        config::Options options = {},
        std::optional<std::size_t> expected_size = std::nullopt,
        std::optional<std::size_t> num_producers = std::nullopt
    );

    /**
     * @brief Registers a producer.
     *
     * Registration does not query the producer. A producer that already is terminal
     * is handled when the consumer subscribes to it, see `Node::add_consumer()`.
     *
     * @param producer The producer.
     *
     * @throws dfms::duplicate_consumer If `producer` is already registered.
     * @throws dfms::invalid_state_transition If the node is terminal, sealed, or
     * already has all of its declared producers.
     */
    void add_producer(std::shared_ptr<NodeRef> const& producer) override;

    /**
     * @brief Closes the producer set.
     *
     * Finalizes the node if every registered producer has already been consumed. A
     * consumer without producers does not finalize on its own. Sealing twice, or
     * sealing a consumer constructed with a number of producers, has no effect.
     */
    void seal();

    /**
     * @brief Whether the producer set is closed.
     *
     * @return True once sealed or when the number of producers was declared.
     */
    [[nodiscard]] bool sealed() const;

    /**
     * @brief Runs the application for a COMPLETE producer, fails on an ERROR producer.
     *
     * Each producer is handled at most once, repeated events are ignored.
     *
     * @param event The event of a producer.
     *
     * @throws std::invalid_argument If the source is not a producer of this node.
     */
    void handle_event(Event const& event) override;

    /**
     * @brief Number of completed application runs.
     *
     * @return The run count.
     */
    [[nodiscard]] std::size_t runs() const;

    /**
     * @brief The ids of the producers, in registration order.
     *
     * @return The producer ids.
     */
    [[nodiscard]] std::vector<InstanceID> producers() const;

    /**
     * @brief The per-node options.
     *
     * @return The options.
     */
    [[nodiscard]] config::Options& options() noexcept {
        return options_;
    }

    /**
     * @brief The application.
     *
     * @return The application.
     */
    [[nodiscard]] Application& application() noexcept {
        return *application_;
    }

    [[nodiscard]] std::string str() const override;

  private:
    std::unique_ptr<Application> application_;
    config::Options options_;
    std::optional<std::size_t> const num_producers_;

    // Lock order is `run_mutex_` then `producers_mutex_`.
    mutable std::mutex producers_mutex_;
    bool sealed_;
    std::vector<InstanceID> producer_ids_;
    std::vector<std::weak_ptr<NodeRef>> producers_;

    // Serializes application runs, guards everything below.
    mutable std::mutex run_mutex_;
    std::set<InstanceID> triggered_;
    std::size_t consumed_{0};
    std::size_t runs_{0};

    [[nodiscard]] bool all_consumed() const;
};

}  // namespace dfms
