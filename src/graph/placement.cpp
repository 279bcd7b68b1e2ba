/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <dfms/error.hpp>
#include <dfms/graph/placement.hpp>

namespace dfms {

void RoundRobinPlacement::reset(std::vector<ManagerID> const&) {
    next_ = 0;
}

ManagerID RoundRobinPlacement::place(
    StageSpec const& stage, std::size_t, std::vector<ManagerID> const& managers
) {
    if (stage.hint.has_value()) {
        DFMS_EXPECTS(
            std::ranges::find(managers, *stage.hint) != managers.end(),
            "stage " + stage.name + " is hinted to unknown manager " + *stage.hint,
            graph_construction_error
        );
        return *stage.hint;
    }
    return managers[next_++ % managers.size()];
}

}  // namespace dfms
