/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <sstream>

#include <dfms/error.hpp>
#include <dfms/node/consumer_node.hpp>

namespace dfms {

std::size_t ConsumerContext::write(std::span<std::uint8_t const> data) {
    return node_.write(data);
}

std::size_t ConsumerContext::write(std::string_view data) {
    return node_.write(data);
}

config::Options& ConsumerContext::options() {
    return node_.options();
}

Communicator::Logger& ConsumerContext::logger() {
    return node_.channel()->logger();
}

InstanceID const& ConsumerContext::instance_id() const noexcept {
    return node_.instance_id();
}

ConsumerNode::ConsumerNode(
    NodeIdentity identity,
    std::unique_ptr<Storage> storage,
    std::unique_ptr<Application> application,
    std::shared_ptr<EventChannel> channel,
    config::Options options,
    std::optional<std::size_t> expected_size,
    std::optional<std::size_t> num_producers
)
    : Node{std::move(identity), std::move(storage), std::move(channel), expected_size},
      application_{std::move(application)},
      options_{std::move(options)},
      num_producers_{num_producers},
      sealed_{num_producers.has_value()} {
    DFMS_EXPECTS(
        application_ != nullptr, "application cannot be NULL", std::invalid_argument
    );
}

void ConsumerNode::add_producer(std::shared_ptr<NodeRef> const& producer) {
    DFMS_EXPECTS(producer != nullptr, "producer cannot be NULL", std::invalid_argument);
    DFMS_EXPECTS(
        producer->instance_id() != instance_id(),
        instance_id() + " cannot consume itself",
        std::invalid_argument
    );
    DFMS_EXPECTS(
        !is_terminal(state()),
        "cannot add producers to " + instance_id() + " in state " + to_string(state()),
        invalid_state_transition
    );
    std::lock_guard<std::mutex> lock(producers_mutex_);
    DFMS_EXPECTS(
        num_producers_.has_value() || !sealed_,
        "cannot add producers to sealed " + instance_id(),
        invalid_state_transition
    );
    DFMS_EXPECTS(
        std::ranges::find(producer_ids_, producer->instance_id()) == producer_ids_.end(),
        producer->instance_id() + " already is a producer of " + instance_id(),
        duplicate_consumer
    );
    DFMS_EXPECTS(
        !num_producers_.has_value() || producer_ids_.size() < *num_producers_,
        instance_id() + " already has all of its "
            + std::to_string(num_producers_.value_or(0)) + " producers",
        invalid_state_transition
    );
    producer_ids_.push_back(producer->instance_id());
    producers_.push_back(producer);
}

void ConsumerNode::handle_event(Event const& event) {
    std::shared_ptr<NodeRef> producer;
    {
        std::lock_guard<std::mutex> lock(producers_mutex_);
        auto it = std::ranges::find(producer_ids_, event.source);
        DFMS_EXPECTS(
            it != producer_ids_.end(),
            event.source + " is not a producer of " + instance_id(),
            std::invalid_argument
        );
        producer = producers_[static_cast<std::size_t>(it - producer_ids_.begin())].lock();
    }

    std::string failure;
    bool done = false;
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!triggered_.insert(event.source).second || is_terminal(state())) {
            return;
        }
        if (event.kind == EventKind::ERROR) {
            failure = "producer " + event.source + " failed";
        } else if (producer == nullptr) {
            failure = "producer " + event.source + " no longer exists";
        } else {
            try {
                ConsumerContext ctx{*this};
                application_->run(ctx, *producer);
                ++runs_;
            } catch (std::exception const& e) {
                failure = application_->name() + " failed on " + event.source + ": "
                          + e.what();
            }
        }
        if (failure.empty()) {
            ++consumed_;
            done = all_consumed();
        }
    }
    if (!failure.empty()) {
        fail(failure);
    } else if (done) {
        try_finalize();
    }
}

bool ConsumerNode::all_consumed() const {
    std::lock_guard<std::mutex> lock(producers_mutex_);
    if (num_producers_.has_value()) {
        return consumed_ == *num_producers_;
    }
    return sealed_ && !producer_ids_.empty() && consumed_ == producer_ids_.size();
}

void ConsumerNode::seal() {
    bool done;
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        {
            std::lock_guard<std::mutex> producers_lock(producers_mutex_);
            if (sealed_) {
                return;
            }
            sealed_ = true;
        }
        done = !is_terminal(state()) && all_consumed();
    }
    if (done) {
        try_finalize();
    }
}

bool ConsumerNode::sealed() const {
    std::lock_guard<std::mutex> lock(producers_mutex_);
    return sealed_;
}

std::size_t ConsumerNode::runs() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return runs_;
}

std::vector<InstanceID> ConsumerNode::producers() const {
    std::lock_guard<std::mutex> lock(producers_mutex_);
    return producer_ids_;
}

std::string ConsumerNode::str() const {
    std::stringstream ss;
    ss << "ConsumerNode(" << instance_id() << ", app=" << application_->name()
       << ", state=" << state() << ", runs=" << runs() << ", sealed=" << sealed()
       << ")";
    return ss.str();
}

}  // namespace dfms
