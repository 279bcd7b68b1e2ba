/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace dfms {

/// @brief Globally unique identifier of a node instance within a run.
using InstanceID = std::string;

/// @brief Pipeline-level identifier, shared by equivalent instances of a stage.
using ObjectID = std::string;

/// @brief Identifier of a submission (one execution of a physical graph).
using SessionID = std::string;

/// @brief Identifier of a Node Manager.
using ManagerID = std::string;

/// @brief Identifier of an open read handle on a node.
using ReadHandle = std::uint64_t;

/**
 * @brief Lifecycle state of a node.
 *
 * INITIALIZED -> WRITING -> {COMPLETE, ERROR}. COMPLETE and ERROR are terminal for
 * data flow. EXPIRED is reached from any state by session teardown.
 */
enum class NodeState : std::uint8_t {
    INITIALIZED,
    WRITING,
    COMPLETE,
    ERROR,
    EXPIRED,
};

/**
 * @brief Whether no further data transition can happen in `state`.
 *
 * @param state The state.
 * @return True for COMPLETE, ERROR and EXPIRED.
 */
constexpr bool is_terminal(NodeState state) noexcept {
    return state == NodeState::COMPLETE || state == NodeState::ERROR
           || state == NodeState::EXPIRED;
}

/// @brief Kind of lifecycle notification.
enum class EventKind : std::uint8_t {
    COMPLETE,
    ERROR,
};

/// @brief Flavor of a node.
enum class NodeKind : std::uint8_t {
    DATA,
    CONTAINER,
    CONSUMER,
};

/// @brief Backend of a node's byte buffer.
enum class StorageKind : std::uint8_t {
    MEMORY,
    FILE,
};

/**
 * @brief Name of a node state.
 *
 * @param state The state.
 * @return The upper-case name.
 */
char const* to_string(NodeState state) noexcept;

/// @copydoc to_string(NodeState)
char const* to_string(EventKind kind) noexcept;

/// @copydoc to_string(NodeState)
char const* to_string(NodeKind kind) noexcept;

/// @copydoc to_string(NodeState)
char const* to_string(StorageKind kind) noexcept;

/**
 * @brief Parses a node kind name (case-insensitive).
 *
 * @param name "data", "container" or "consumer".
 * @return The node kind.
 *
 * @throws std::invalid_argument On an unknown name.
 */
NodeKind node_kind_from_string(std::string const& name);

/**
 * @brief Parses a storage kind name (case-insensitive).
 *
 * @param name "memory" or "file".
 * @return The storage kind.
 *
 * @throws std::invalid_argument On an unknown name.
 */
StorageKind storage_kind_from_string(std::string const& name);

inline std::ostream& operator<<(std::ostream& os, NodeState state) {
    return os << to_string(state);
}

inline std::ostream& operator<<(std::ostream& os, EventKind kind) {
    return os << to_string(kind);
}

inline std::ostream& operator<<(std::ostream& os, NodeKind kind) {
    return os << to_string(kind);
}

inline std::ostream& operator<<(std::ostream& os, StorageKind kind) {
    return os << to_string(kind);
}

/**
 * @brief A lifecycle notification published by a node.
 */
struct Event {
    InstanceID source;  ///< The node whose state changed.
    EventKind kind;  ///< COMPLETE or ERROR.
    double timestamp;  ///< Seconds since the Unix epoch.

    /**
     * @brief Creates an event stamped with the current time.
     *
     * @param source The publishing node.
     * @param kind The kind of event.
     * @return The event.
     */
    static Event now(InstanceID source, EventKind kind);

    /**
     * @brief Description of the event.
     *
     * @return A string like "Event(a/b, COMPLETE)".
     */
    [[nodiscard]] std::string str() const;
};

/**
 * @brief The identifiers of a node.
 */
struct NodeIdentity {
    ObjectID object_id;  ///< Pipeline-level identifier.
    InstanceID instance_id;  ///< Unique instance identifier.
    SessionID session_id{};  ///< Session owning the node.
    ManagerID manager_id{};  ///< Manager hosting the node.
};

}  // namespace dfms
