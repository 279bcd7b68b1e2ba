/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dfms/manager/manager_interface.hpp>

namespace dfms {

char const* to_string(EdgeKind kind) noexcept {
    switch (kind) {
    case EdgeKind::PRODUCER:
        return "PRODUCER";
    case EdgeKind::CHILD:
        return "CHILD";
    }
    return "UNKNOWN";
}

char const* to_string(ShutdownStatus status) noexcept {
    switch (status) {
    case ShutdownStatus::CLEAN:
        return "CLEAN";
    case ShutdownStatus::FORCED:
        return "FORCED";
    case ShutdownStatus::UNKNOWN_SESSION:
        return "UNKNOWN_SESSION";
    }
    return "UNKNOWN";
}

}  // namespace dfms
