/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <dfms/communicator/communicator.hpp>
#include <dfms/config.hpp>
#include <dfms/progress_thread.hpp>
#include <dfms/rpc/protocol.hpp>
#include <dfms/statistics.hpp>
#include <dfms/utils.hpp>

namespace dfms::rpc {

/**
 * @brief Request/reply calls over a communicator.
 *
 * Requests travel with tag `Tag{op_id, 0}` and replies with `Tag{op_id, 1}`. Each
 * call carries an id that its reply echoes, so concurrent callers never receive each
 * other's replies. Incoming messages are polled by a function on the progress
 * thread, which also runs the request handler. The handler must not block on
 * another call.
 */
class Router {
  public:
    /**
     * @brief Serves one request.
     *
     * An exception thrown by the handler is sent back to the caller as a status code
     * and re-raised there.
     *
     * @param source The calling rank.
     * @param op The requested operation.
     * @param request The arguments.
     * @return The reply payload.
     */
    using Handler = std::function<std::vector<std::uint8_t>(
        Rank source, Op op, Reader& request
    )>;

    /**
     * @brief Construct a router.
     *
     * @param comm The communicator.
     * @param progress_thread The progress thread polling the communicator.
     * @param op_id The operation id of the tags used by this router.
     * @param timeout Per-call timeout.
     * @param statistics The statistics to record calls in.
     */
    Router(
        std::shared_ptr<Communicator> comm,
        std::shared_ptr<ProgressThread> progress_thread,
        OpID op_id,
        Duration timeout,
        std::shared_ptr<Statistics> statistics = Statistics::disabled()
    );

    /**
     * @brief The `rpc_timeout` option, in seconds.
     *
     * @param options The options.
     * @return The timeout, 10 seconds by default.
     */
    static Duration timeout_from_options(config::Options options);

    /**
     * @brief Stops polling. Pending calls fail with `delivery_error`.
     */
    ~Router() noexcept;

    Router(Router const&) = delete;
    Router& operator=(Router const&) = delete;

    /**
     * @brief Sets the request handler.
     *
     * Requests are left queued in the communicator until a handler is set. An
     * empty handler stops serving.
     *
     * @param handler The handler.
     */
    void set_handler(Handler handler);

    /**
     * @brief Calls a remote operation and waits for the reply.
     *
     * @param destination The serving rank.
     * @param op The operation.
     * @param payload The arguments.
     * @return The reply payload.
     *
     * @throws dfms::delivery_error If no reply arrived within the timeout.
     * @throws The exception type the remote handler raised, with its message.
     */
    std::vector<std::uint8_t> call(
        Rank destination, Op op, std::vector<std::uint8_t> payload
    );

    /// @brief The communicator.
    [[nodiscard]] std::shared_ptr<Communicator> const& comm() const noexcept {
        return comm_;
    }

    /// @brief The per-call timeout.
    [[nodiscard]] Duration timeout() const noexcept {
        return timeout_;
    }

  private:
    ProgressThread::ProgressState progress();
    void send(Message const& message, Rank destination, Tag tag);
    void serve(std::vector<std::uint8_t> const& buffer, Rank source);
    void accept_reply(std::vector<std::uint8_t> const& buffer, Rank source);

    std::shared_ptr<Communicator> comm_;
    std::shared_ptr<ProgressThread> progress_thread_;
    Tag const request_tag_;
    Tag const reply_tag_;
    Duration const timeout_;
    std::shared_ptr<Statistics> statistics_;

    std::atomic<std::uint64_t> next_call_id_{1};
    std::mutex mutex_;
    Handler handler_;
    std::map<std::uint64_t, std::promise<Message>> pending_;
    std::vector<std::unique_ptr<Communicator::Future>> outgoing_;
    ProgressThread::FunctionID progress_function_id_;
};

}  // namespace dfms::rpc
