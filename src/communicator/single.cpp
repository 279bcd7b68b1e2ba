/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>
#include <stdexcept>

#include <dfms/communicator/single.hpp>
#include <dfms/error.hpp>

namespace dfms {

Single::Single(config::Options options) : logger_{this, std::move(options)} {}

std::unique_ptr<Communicator::Future> Single::send(
    std::unique_ptr<std::vector<std::uint8_t>>, Rank, Tag
) {
    DFMS_FAIL("Unexpected send to self", std::runtime_error);
}

std::pair<std::unique_ptr<std::vector<std::uint8_t>>, Rank> Single::recv_any(Tag) {
    return {nullptr, 0};
}

std::vector<std::unique_ptr<Communicator::Future>> Single::test_some(
    std::vector<std::unique_ptr<Communicator::Future>>&
) {
    DFMS_FAIL("Unexpected test_some from self", std::runtime_error);
}

void Single::wait(std::unique_ptr<Communicator::Future>) {
    DFMS_FAIL("Unexpected wait from self", std::runtime_error);
}

std::string Single::str() const {
    std::stringstream ss;
    ss << "Single(rank=0, nranks: 1)";
    return ss.str();
}

}  // namespace dfms
