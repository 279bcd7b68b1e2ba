/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>

#include <dfms/error.hpp>
#include <dfms/node/node_ref.hpp>

namespace dfms {

ScopedReader::ScopedReader(NodeRef& node) : node_{node}, handle_{node.open()} {}

ScopedReader::~ScopedReader() noexcept {
    if (!open_) {
        return;
    }
    try {
        node_.close(handle_);
    } catch (std::exception const& e) {
        // The node may have expired or its manager vanished while we were reading.
        std::cerr << "ScopedReader: failed to close handle " << handle_ << " of "
                  << node_.instance_id() << ": " << e.what() << std::endl;
    }
}

std::vector<std::uint8_t> ScopedReader::read(std::size_t max_bytes) {
    DFMS_EXPECTS(open_, "read from a closed ScopedReader");
    return node_.read(handle_, max_bytes);
}

void ScopedReader::close() {
    if (open_) {
        open_ = false;
        node_.close(handle_);
    }
}

std::vector<std::uint8_t> read_all(NodeRef& node, std::size_t chunk_size) {
    DFMS_EXPECTS(chunk_size > 0, "chunk size must be positive", std::invalid_argument);
    ScopedReader reader{node};
    std::vector<std::uint8_t> ret;
    while (true) {
        auto chunk = reader.read(chunk_size);
        if (chunk.empty()) {
            break;
        }
        ret.insert(ret.end(), chunk.begin(), chunk.end());
    }
    reader.close();
    return ret;
}

std::string read_all_text(NodeRef& node, std::size_t chunk_size) {
    auto const bytes = read_all(node, chunk_size);
    return {bytes.begin(), bytes.end()};
}

}  // namespace dfms
