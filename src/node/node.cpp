/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <dfms/checksum.hpp>
#include <dfms/error.hpp>
#include <dfms/node/node.hpp>

namespace dfms {

Node::Node(
    NodeIdentity identity,
    std::unique_ptr<Storage> storage,
    std::shared_ptr<EventChannel> channel,
    std::optional<std::size_t> expected_size
)
    : identity_{std::move(identity)},
      channel_{std::move(channel)},
      storage_{std::move(storage)},
      expected_size_{expected_size} {
    DFMS_EXPECTS(storage_ != nullptr, "the storage cannot be NULL", std::invalid_argument);
    DFMS_EXPECTS(channel_ != nullptr, "the channel cannot be NULL", std::invalid_argument);
}

NodeState Node::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t Node::checksum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return crc_;
}

std::size_t Node::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

std::string Node::cause() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cause_;
}

void Node::check_writable() const {
    DFMS_EXPECTS(
        state_ != NodeState::ERROR,
        instance_id() + " has failed: " + cause_,
        node_failed
    );
    DFMS_EXPECTS(
        state_ == NodeState::INITIALIZED || state_ == NodeState::WRITING,
        "illegal operation on " + instance_id() + " in state " + to_string(state_),
        invalid_state_transition
    );
}

void Node::check_readable() const {
    DFMS_EXPECTS(
        state_ != NodeState::ERROR,
        instance_id() + " has failed: " + cause_,
        node_failed
    );
    DFMS_EXPECTS(
        state_ == NodeState::COMPLETE,
        "cannot read " + instance_id() + " in state " + to_string(state_),
        invalid_state_transition
    );
}

std::size_t Node::write(std::span<std::uint8_t const> data) {
    bool completed = false;
    bool storage_failed = false;
    std::string what;
    std::size_t accepted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_writable();
        state_ = NodeState::WRITING;
        if (expected_size_.has_value()) {
            data = data.first(std::min(data.size(), *expected_size_ - bytes_written_));
        }
        try {
            accepted = storage_->write(data);
        } catch (std::exception const& e) {
            state_ = NodeState::ERROR;
            cause_ = what = e.what();
            storage_failed = true;
        }
        if (!storage_failed) {
            crc_ = crc32(data.first(accepted), crc_);
            bytes_written_ += accepted;
            if (expected_size_.has_value() && bytes_written_ == *expected_size_) {
                state_ = NodeState::COMPLETE;
                completed = true;
            }
        }
    }
    if (storage_failed) {
        publish(EventKind::ERROR);
        DFMS_FAIL("write to " + instance_id() + " failed: " + what, node_failed);
    }
    channel_->statistics()->add_bytes_stat("bytes-written", accepted);
    if (completed) {
        publish(EventKind::COMPLETE);
    }
    return accepted;
}

void Node::finalize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_writable();
        state_ = NodeState::COMPLETE;
    }
    publish(EventKind::COMPLETE);
}

bool Node::try_finalize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return false;
        }
        state_ = NodeState::COMPLETE;
    }
    publish(EventKind::COMPLETE);
    return true;
}

void Node::fail(std::string const& cause) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        state_ = NodeState::ERROR;
        cause_ = cause;
    }
    channel_->logger().info(instance_id(), " failed: ", cause);
    publish(EventKind::ERROR);
}

ReadHandle Node::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_readable();
    auto const handle = next_handle_++;
    readers_.emplace(handle, storage_->open_reader());
    return handle;
}

std::vector<std::uint8_t> Node::read(ReadHandle handle, std::size_t max_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_readable();
    auto it = readers_.find(handle);
    DFMS_EXPECTS(
        it != readers_.end(),
        "read handle " + std::to_string(handle) + " is not open on " + instance_id(),
        std::out_of_range
    );
    return it->second->read(max_bytes);
}

void Node::close(ReadHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    DFMS_EXPECTS(
        readers_.erase(handle) == 1,
        "read handle " + std::to_string(handle) + " is not open on " + instance_id(),
        std::out_of_range
    );
}

bool Node::expire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == NodeState::EXPIRED) {
        return false;
    }
    bool const was_writing = state_ == NodeState::WRITING;
    state_ = NodeState::EXPIRED;
    readers_.clear();
    storage_->release();
    return was_writing;
}

void Node::add_consumer(std::shared_ptr<Node> const& consumer) {
    DFMS_EXPECTS(consumer != nullptr, "consumer cannot be NULL", std::invalid_argument);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DFMS_EXPECTS(
            std::ranges::find(consumers_, consumer->instance_id()) == consumers_.end(),
            consumer->instance_id() + " already consumes " + instance_id(),
            duplicate_consumer
        );
    }
    consumer->add_producer(shared_from_this());
    add_consumer(std::make_shared<LocalListener>(consumer));
}

void Node::add_consumer(std::shared_ptr<EventListener> listener) {
    DFMS_EXPECTS(listener != nullptr, "listener cannot be NULL", std::invalid_argument);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DFMS_EXPECTS(
            std::ranges::find(consumers_, listener->listener_id()) == consumers_.end(),
            listener->listener_id() + " already consumes " + instance_id(),
            duplicate_consumer
        );
        consumers_.push_back(listener->listener_id());
    }
    channel_->subscribe(instance_id(), listener);

    // Replay an event published before the subscription.
    auto const current = state();
    if (current == NodeState::COMPLETE) {
        channel_->deliver(*listener, Event::now(instance_id(), EventKind::COMPLETE));
    } else if (current == NodeState::ERROR) {
        channel_->deliver(*listener, Event::now(instance_id(), EventKind::ERROR));
    }
}

std::vector<std::string> Node::consumers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumers_;
}

void Node::add_producer(std::shared_ptr<NodeRef> const& producer) {
    DFMS_FAIL(
        instance_id() + " cannot consume " + producer->instance_id(),
        std::invalid_argument
    );
}

void Node::handle_event(Event const&) {}

void Node::publish(EventKind kind) {
    channel_->publish(Event::now(instance_id(), kind));
}

std::string Node::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    ss << "Node(" << instance_id() << ", state=" << state_
       << ", size=" << bytes_written_ << ", crc=" << crc_ << ", " << storage_->str()
       << ")";
    return ss.str();
}

LocalListener::LocalListener(std::shared_ptr<Node> const& node)
    : node_{node}, id_{node->instance_id()} {}

void LocalListener::deliver(Event const& event) {
    auto node = node_.lock();
    DFMS_EXPECTS(node != nullptr, id_ + " no longer exists", delivery_error);
    node->handle_event(event);
}

}  // namespace dfms
