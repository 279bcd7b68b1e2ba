/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <sstream>

#include <dfms/error.hpp>
#include <dfms/node/container_node.hpp>

namespace dfms {

ContainerNode::ContainerNode(
    NodeIdentity identity,
    std::shared_ptr<EventChannel> channel,
    std::optional<std::size_t> num_children
)
    : Node{std::move(identity), std::make_unique<InMemoryStorage>(), std::move(channel)},
      num_children_{num_children},
      sealed_{num_children.has_value()},
      // An open container holds one extra count, dropped by seal().
      outstanding_{static_cast<std::int64_t>(num_children.value_or(1))} {}

std::vector<std::shared_ptr<NodeRef>> ContainerNode::children() const {
    std::lock_guard<std::mutex> lock(children_mutex_);
    std::vector<std::shared_ptr<NodeRef>> ret;
    ret.reserve(children_.size());
    for (std::size_t i = 0; i < children_.size(); ++i) {
        auto child = children_[i].lock();
        DFMS_EXPECTS(
            child != nullptr,
            "child " + child_ids_[i] + " of " + instance_id() + " no longer exists",
            unknown_node
        );
        ret.push_back(std::move(child));
    }
    return ret;
}

std::size_t ContainerNode::write(std::span<std::uint8_t const>) {
    DFMS_FAIL(
        "container " + instance_id() + " is not writable", invalid_state_transition
    );
}

void ContainerNode::register_child(std::shared_ptr<NodeRef> const& child) {
    DFMS_EXPECTS(child != nullptr, "child cannot be NULL", std::invalid_argument);
    DFMS_EXPECTS(
        child->instance_id() != instance_id(),
        instance_id() + " cannot contain itself",
        std::invalid_argument
    );
    DFMS_EXPECTS(
        !is_terminal(state()),
        "cannot add children to " + instance_id() + " in state " + to_string(state()),
        invalid_state_transition
    );
    std::lock_guard<std::mutex> lock(children_mutex_);
    DFMS_EXPECTS(
        std::ranges::find(child_ids_, child->instance_id()) == child_ids_.end(),
        child->instance_id() + " is already a child of " + instance_id(),
        duplicate_consumer
    );
    DFMS_EXPECTS(
        num_children_.has_value() || !sealed_,
        "cannot add children to sealed " + instance_id(),
        invalid_state_transition
    );
    DFMS_EXPECTS(
        !num_children_.has_value() || child_ids_.size() < *num_children_,
        instance_id() + " already has all of its "
            + std::to_string(num_children_.value_or(0)) + " children",
        invalid_state_transition
    );
    if (!num_children_.has_value()) {
        outstanding_.fetch_add(1, std::memory_order_acq_rel);
    }
    children_.push_back(child);
    child_ids_.push_back(child->instance_id());
}

void ContainerNode::add_child(std::shared_ptr<Node> const& child) {
    register_child(child);
    child->add_consumer(std::make_shared<LocalListener>(shared_from_this()));
}

void ContainerNode::add_remote_child(std::shared_ptr<NodeRef> const& child) {
    register_child(child);
}

void ContainerNode::seal() {
    bool empty;
    {
        std::lock_guard<std::mutex> lock(children_mutex_);
        if (sealed_) {
            return;
        }
        sealed_ = true;
        empty = child_ids_.empty();
    }
    if (outstanding_.fetch_sub(1, std::memory_order_acq_rel) == 1 && !empty) {
        try_finalize();
    }
}

bool ContainerNode::sealed() const {
    std::lock_guard<std::mutex> lock(children_mutex_);
    return sealed_;
}

void ContainerNode::handle_event(Event const& event) {
    {
        std::lock_guard<std::mutex> lock(children_mutex_);
        DFMS_EXPECTS(
            std::ranges::find(child_ids_, event.source) != child_ids_.end(),
            event.source + " is not a child of " + instance_id(),
            std::invalid_argument
        );
        if (!seen_.insert(event.source).second) {
            return;
        }
    }
    if (event.kind == EventKind::ERROR) {
        fail("child " + event.source + " failed");
        return;
    }
    // Only the thread taking the counter from one to zero completes the container.
    if (outstanding_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        try_finalize();
    }
}

std::string ContainerNode::str() const {
    std::stringstream ss;
    ss << "ContainerNode(" << instance_id() << ", state=" << state()
       << ", outstanding=" << outstanding() << ", sealed=" << sealed() << ")";
    return ss.str();
}

}  // namespace dfms
