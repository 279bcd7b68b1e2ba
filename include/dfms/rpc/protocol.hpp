/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <dfms/manager/manager_interface.hpp>
#include <dfms/node/types.hpp>

/**
 * @namespace dfms::rpc
 * @brief Request/reply calls between Node Managers in different processes.
 */
namespace dfms::rpc {

/// @brief The remote operations.
enum class Op : std::uint8_t {
    RESERVE = 1,
    RELEASE,
    REGISTER_NODE,
    LINK,
    SHUTDOWN_SESSION,
    DELIVER_EVENT,
    NODE_INFO,
    NODE_CHECKSUM,
    NODE_SIZE,
    NODE_WRITE,
    NODE_FINALIZE,
    NODE_FAIL,
    NODE_OPEN,
    NODE_READ,
    NODE_CLOSE,
    NODE_CHILDREN,
};

/**
 * @brief Outcome of a call.
 *
 * Every error type the managers raise has its own code, so the caller re-raises
 * the same type.
 */
enum class Status : std::uint8_t {
    OK = 0,
    INVALID_STATE_TRANSITION,
    NODE_FAILED,
    DUPLICATE_CONSUMER,
    UNKNOWN_NODE,
    GRAPH_CONSTRUCTION_ERROR,
    RESOURCE_UNAVAILABLE,
    DELIVERY_ERROR,
    INVALID_ARGUMENT,
    OUT_OF_RANGE,
    RUNTIME_ERROR,
    LOGIC_ERROR,
    UNKNOWN_ERROR,
};

/// @brief Name of an operation.
char const* to_string(Op op) noexcept;

/// @brief Name of a status.
char const* to_string(Status status) noexcept;

/**
 * @brief The status code of an exception.
 *
 * @param e The exception.
 * @return The most specific matching code.
 */
Status classify(std::exception const& e) noexcept;

/**
 * @brief Throws the exception type of a status code.
 *
 * @param status A status other than OK.
 * @param message The `what()` of the remote exception.
 */
[[noreturn]] void raise(Status status, std::string const& message);

/**
 * @brief A request or a reply.
 *
 * Wire layout: call id (u64), op (u8), status (u8), two reserved bytes, then the
 * payload. Integers are little-endian.
 */
struct Message {
    std::uint64_t call_id{0};  ///< Matches a reply to its request.
    Op op{Op::RESERVE};  ///< The operation.
    Status status{Status::OK};  ///< Always OK in requests.
    std::vector<std::uint8_t> payload{};  ///< Arguments or results.

    /// @brief Size of the fixed header in bytes.
    static constexpr std::size_t header_size = 12;

    /**
     * @brief Encodes the message.
     *
     * @return The bytes, ready to send.
     */
    [[nodiscard]] std::unique_ptr<std::vector<std::uint8_t>> encode() const;

    /**
     * @brief Decodes a message.
     *
     * @param buffer The received bytes.
     * @return The message.
     *
     * @throws std::out_of_range If the buffer is shorter than the header.
     */
    [[nodiscard]] static Message decode(std::vector<std::uint8_t> const& buffer);
};

/**
 * @brief Appends values to a payload.
 */
class Writer {
  public:
    Writer() = default;

    Writer& u8(std::uint8_t value);  ///< Appends a byte.
    Writer& u32(std::uint32_t value);  ///< Appends 4 bytes.
    Writer& u64(std::uint64_t value);  ///< Appends 8 bytes.
    Writer& i32(std::int32_t value);  ///< Appends 4 bytes.
    Writer& f64(double value);  ///< Appends 8 bytes.
    Writer& boolean(bool value);  ///< Appends a byte.
    Writer& string(std::string const& value);  ///< Appends a length and the bytes.
    Writer& bytes(std::span<std::uint8_t const> value);  ///< Appends a length and bytes.

    Writer& descriptor(NodeDescriptor const& value);  ///< Appends a node descriptor.
    Writer& edge(Edge const& value);  ///< Appends an edge.
    Writer& event(Event const& value);  ///< Appends an event.
    Writer& address(NodeAddress const& value);  ///< Appends a node address.
    Writer& info(NodeInfo const& value);  ///< Appends a node snapshot.

    /**
     * @brief Takes the payload.
     *
     * @return The payload, the writer is empty afterwards.
     */
    [[nodiscard]] std::vector<std::uint8_t> take() noexcept {
        return std::move(buffer_);
    }

  private:
    std::vector<std::uint8_t> buffer_;
};

/**
 * @brief Reads values back from a payload, in the order they were written.
 *
 * Every accessor throws `std::out_of_range` when the payload is too short.
 */
class Reader {
  public:
    /**
     * @brief Construct a reader.
     *
     * @param buffer The payload, must outlive the reader.
     */
    explicit Reader(std::span<std::uint8_t const> buffer) : buffer_{buffer} {}

    std::uint8_t u8();  ///< Reads a byte.
    std::uint32_t u32();  ///< Reads 4 bytes.
    std::uint64_t u64();  ///< Reads 8 bytes.
    std::int32_t i32();  ///< Reads 4 bytes.
    double f64();  ///< Reads 8 bytes.
    bool boolean();  ///< Reads a byte.
    std::string string();  ///< Reads a length and the bytes.
    std::vector<std::uint8_t> bytes();  ///< Reads a length and the bytes.

    NodeDescriptor descriptor();  ///< Reads a node descriptor.
    Edge edge();  ///< Reads an edge.
    Event event();  ///< Reads an event.
    NodeAddress address();  ///< Reads a node address.
    NodeInfo info();  ///< Reads a node snapshot.

    /// @brief Number of bytes not read yet.
    [[nodiscard]] std::size_t remaining() const noexcept {
        return buffer_.size() - offset_;
    }

  private:
    std::span<std::uint8_t const> take(std::size_t nbytes);

    std::span<std::uint8_t const> buffer_;
    std::size_t offset_{0};
};

}  // namespace dfms::rpc
