/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <sstream>
#include <stdexcept>

#include <dfms/error.hpp>
#include <dfms/node/types.hpp>
#include <dfms/utils.hpp>

namespace dfms {

char const* to_string(NodeState state) noexcept {
    switch (state) {
    case NodeState::INITIALIZED:
        return "INITIALIZED";
    case NodeState::WRITING:
        return "WRITING";
    case NodeState::COMPLETE:
        return "COMPLETE";
    case NodeState::ERROR:
        return "ERROR";
    case NodeState::EXPIRED:
        return "EXPIRED";
    }
    return "UNKNOWN";
}

char const* to_string(EventKind kind) noexcept {
    switch (kind) {
    case EventKind::COMPLETE:
        return "COMPLETE";
    case EventKind::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

char const* to_string(NodeKind kind) noexcept {
    switch (kind) {
    case NodeKind::DATA:
        return "DATA";
    case NodeKind::CONTAINER:
        return "CONTAINER";
    case NodeKind::CONSUMER:
        return "CONSUMER";
    }
    return "UNKNOWN";
}

char const* to_string(StorageKind kind) noexcept {
    switch (kind) {
    case StorageKind::MEMORY:
        return "MEMORY";
    case StorageKind::FILE:
        return "FILE";
    }
    return "UNKNOWN";
}

NodeKind node_kind_from_string(std::string const& name) {
    auto const s = to_upper(trim(name));
    for (auto kind : {NodeKind::DATA, NodeKind::CONTAINER, NodeKind::CONSUMER}) {
        if (s == to_string(kind)) {
            return kind;
        }
    }
    DFMS_FAIL("unknown node kind: \"" + name + "\"", std::invalid_argument);
}

StorageKind storage_kind_from_string(std::string const& name) {
    auto const s = to_upper(trim(name));
    for (auto kind : {StorageKind::MEMORY, StorageKind::FILE}) {
        if (s == to_string(kind)) {
            return kind;
        }
    }
    DFMS_FAIL("unknown storage kind: \"" + name + "\"", std::invalid_argument);
}

Event Event::now(InstanceID source, EventKind kind) {
    auto const since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Event{
        std::move(source),
        kind,
        std::chrono::duration_cast<std::chrono::duration<double>>(since_epoch).count()
    };
}

std::string Event::str() const {
    std::stringstream ss;
    ss << "Event(" << source << ", " << kind << ")";
    return ss.str();
}

}  // namespace dfms
