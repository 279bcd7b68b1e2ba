/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dfms/graph/pipeline.hpp>

namespace dfms {

StageSpec StageSpec::data(std::string name, StorageKind storage) {
    StageSpec ret;
    ret.name = std::move(name);
    ret.kind = NodeKind::DATA;
    ret.storage = storage;
    return ret;
}

StageSpec StageSpec::consumer(
    std::string name,
    std::string application,
    std::vector<std::string> inputs,
    std::unordered_map<std::string, std::string> params
) {
    StageSpec ret;
    ret.name = std::move(name);
    ret.kind = NodeKind::CONSUMER;
    ret.application = std::move(application);
    ret.inputs = std::move(inputs);
    ret.params = std::move(params);
    return ret;
}

StageSpec StageSpec::container(std::string name, std::vector<std::string> children) {
    StageSpec ret;
    ret.name = std::move(name);
    ret.kind = NodeKind::CONTAINER;
    ret.children = std::move(children);
    return ret;
}

}  // namespace dfms
