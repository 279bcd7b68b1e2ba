/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>

#include <dfms/error.hpp>
#include <dfms/rpc/router.hpp>

namespace dfms::rpc {

Router::Router(
    std::shared_ptr<Communicator> comm,
    std::shared_ptr<ProgressThread> progress_thread,
    OpID op_id,
    Duration timeout,
    std::shared_ptr<Statistics> statistics
)
    : comm_{std::move(comm)},
      progress_thread_{std::move(progress_thread)},
      request_tag_{op_id, 0},
      reply_tag_{op_id, 1},
      timeout_{timeout},
      statistics_{std::move(statistics)} {
    DFMS_EXPECTS(comm_ != nullptr, "the communicator cannot be NULL");
    DFMS_EXPECTS(progress_thread_ != nullptr, "the progress thread cannot be NULL");
    DFMS_EXPECTS(
        timeout_.count() > 0, "the rpc timeout must be positive", std::invalid_argument
    );
    progress_function_id_ =
        progress_thread_->add_function([this]() { return progress(); });
}

Duration Router::timeout_from_options(config::Options options) {
    return Duration{
        options.get<double>("rpc_timeout", config::default_factory<double>(10.0))
    };
}

Router::~Router() noexcept {
    progress_thread_->remove_function(progress_function_id_);
    std::map<std::uint64_t, std::promise<Message>> pending;
    std::vector<std::unique_ptr<Communicator::Future>> outgoing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = std::move(pending_);
        outgoing = std::move(outgoing_);
    }
    for (auto& [id, promise] : pending) {
        promise.set_exception(std::make_exception_ptr(
            delivery_error("call " + std::to_string(id) + " aborted, router stopped")
        ));
    }
    for (auto& future : outgoing) {
        comm_->wait(std::move(future));
    }
}

void Router::set_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void Router::send(Message const& message, Rank destination, Tag tag) {
    auto future = comm_->send(message.encode(), destination, tag);
    std::lock_guard<std::mutex> lock(mutex_);
    outgoing_.push_back(std::move(future));
}

std::vector<std::uint8_t> Router::call(
    Rank destination, Op op, std::vector<std::uint8_t> payload
) {
    auto const call_id = next_call_id_.fetch_add(1, std::memory_order_relaxed);
    std::future<Message> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reply = pending_[call_id].get_future();
    }
    auto const t0 = Clock::now();
    try {
        send(Message{call_id, op, Status::OK, std::move(payload)}, destination, request_tag_);
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(call_id);
        throw;
    }
    if (reply.wait_for(timeout_) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(call_id);
        }
        DFMS_FAIL(
            std::string{"call "} + to_string(op) + " to rank "
                + std::to_string(destination) + " timed out",
            delivery_error
        );
    }
    auto message = reply.get();
    statistics_->add_stat("rpc-calls", 1);
    statistics_->add_duration_stat("rpc-call-latency", Clock::now() - t0);
    if (message.status != Status::OK) {
        Reader reader{message.payload};
        raise(message.status, reader.string());
    }
    return std::move(message.payload);
}

void Router::serve(std::vector<std::uint8_t> const& buffer, Rank source) {
    Message request;
    try {
        request = Message::decode(buffer);
    } catch (std::out_of_range const& e) {
        comm_->logger().warn("dropping malformed request from ", source, ": ", e.what());
        return;
    }
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    Message reply{request.call_id, request.op, Status::OK, {}};
    try {
        Reader reader{request.payload};
        reply.payload = handler(source, request.op, reader);
    } catch (std::exception const& e) {
        reply.status = classify(e);
        Writer writer;
        writer.string(e.what());
        reply.payload = writer.take();
        comm_->logger().debug(
            to_string(request.op), " from ", source, " failed: ", e.what()
        );
    }
    send(reply, source, reply_tag_);
}

void Router::accept_reply(std::vector<std::uint8_t> const& buffer, Rank source) {
    Message reply;
    try {
        reply = Message::decode(buffer);
    } catch (std::out_of_range const& e) {
        comm_->logger().warn("dropping malformed reply from ", source, ": ", e.what());
        return;
    }
    std::promise<Message> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(reply.call_id);
        if (it == pending_.end()) {
            comm_->logger().debug(
                "late reply to call ", reply.call_id, " from ", source
            );
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(std::move(reply));
}

ProgressThread::ProgressState Router::progress() {
    bool serving;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        serving = handler_ != nullptr;
        if (!outgoing_.empty()) {
            // Completed sends are released when `done` goes out of scope.
            auto done = comm_->test_some(outgoing_);
        }
    }
    if (serving) {
        for (;;) {
            auto [msg, source] = comm_->recv_any(request_tag_);
            if (msg == nullptr) {
                break;
            }
            serve(*msg, source);
        }
    }
    for (;;) {
        auto [msg, source] = comm_->recv_any(reply_tag_);
        if (msg == nullptr) {
            break;
        }
        accept_reply(*msg, source);
    }
    return ProgressThread::ProgressState::InProgress;
}

}  // namespace dfms::rpc
