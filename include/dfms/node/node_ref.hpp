/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <dfms/node/types.hpp>

namespace dfms {

/**
 * @brief The node surface shared by local nodes and proxies of remote nodes.
 *
 * Application logic and the orchestration layer only ever talk to nodes through this
 * interface, so the same code drives a node in this process and a node hosted by a
 * Node Manager in another process.
 */
class NodeRef {
  public:
    virtual ~NodeRef() noexcept = default;

    /**
     * @brief The unique instance identifier.
     *
     * @return The instance id.
     */
    [[nodiscard]] virtual InstanceID const& instance_id() const noexcept = 0;

    /**
     * @brief The Node Manager hosting the node.
     *
     * @return The manager id, empty for a node not hosted by a manager.
     */
    [[nodiscard]] virtual ManagerID const& manager_id() const noexcept = 0;

    /**
     * @brief The current lifecycle state.
     *
     * @return The state.
     */
    [[nodiscard]] virtual NodeState state() const = 0;

    /**
     * @brief The derived value (CRC-32) of the bytes written so far.
     *
     * @return The checksum.
     */
    [[nodiscard]] virtual std::uint32_t checksum() const = 0;

    /**
     * @brief The number of bytes written so far.
     *
     * @return The size in bytes.
     */
    [[nodiscard]] virtual std::size_t size() const = 0;

    /**
     * @brief Whether the node is a container.
     *
     * @return True for container nodes.
     */
    [[nodiscard]] virtual bool is_container() const = 0;

    /**
     * @brief The children of a container, in insertion order.
     *
     * @return The children, empty for non-containers.
     *
     * @throws dfms::unknown_node If a child can no longer be resolved.
     */
    [[nodiscard]] virtual std::vector<std::shared_ptr<NodeRef>> children() const = 0;

    /**
     * @brief Appends bytes to the node.
     *
     * @param data The bytes to write.
     * @return The number of bytes accepted.
     *
     * @throws dfms::node_failed If the node is in ERROR.
     * @throws dfms::invalid_state_transition If the node is COMPLETE or EXPIRED.
     */
    virtual std::size_t write(std::span<std::uint8_t const> data) = 0;

    /**
     * @brief Appends text to the node.
     *
     * @param data The text to write.
     * @return The number of bytes accepted.
     */
    std::size_t write(std::string_view data) {
        return write(std::span<std::uint8_t const>{
            reinterpret_cast<std::uint8_t const*>(data.data()), data.size()
        });
    }

    /**
     * @brief Moves the node to COMPLETE and publishes a COMPLETE event.
     *
     * @throws dfms::node_failed If the node is in ERROR.
     * @throws dfms::invalid_state_transition If the node is COMPLETE or EXPIRED.
     */
    virtual void finalize() = 0;

    /**
     * @brief Moves the node to ERROR and publishes an ERROR event.
     *
     * A no-op on a node that is already COMPLETE, ERROR or EXPIRED.
     *
     * @param cause Description of the failure.
     */
    virtual void fail(std::string const& cause) = 0;

    /**
     * @brief Opens a read handle over the final content.
     *
     * @return The handle.
     *
     * @throws dfms::node_failed If the node is in ERROR.
     * @throws dfms::invalid_state_transition If the node is not COMPLETE.
     */
    [[nodiscard]] virtual ReadHandle open() = 0;

    /**
     * @brief Reads the next bytes of an open handle.
     *
     * @param handle The handle.
     * @param max_bytes Upper bound on the number of bytes returned.
     * @return The bytes, empty at the end of the content.
     *
     * @throws std::out_of_range If the handle is not open.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> read(
        ReadHandle handle, std::size_t max_bytes
    ) = 0;

    /**
     * @brief Closes a read handle.
     *
     * @param handle The handle.
     *
     * @throws std::out_of_range If the handle is not open.
     */
    virtual void close(ReadHandle handle) = 0;
};

/**
 * @brief RAII read handle, closed when the reader goes out of scope.
 */
class ScopedReader {
  public:
    /**
     * @brief Opens a read handle on a node.
     *
     * @param node The node to read, must outlive the reader.
     */
    explicit ScopedReader(NodeRef& node);

    ~ScopedReader() noexcept;

    ScopedReader(ScopedReader const&) = delete;
    ScopedReader& operator=(ScopedReader const&) = delete;

    /**
     * @brief Reads the next bytes.
     *
     * @param max_bytes Upper bound on the number of bytes returned.
     * @return The bytes, empty at the end of the content.
     */
    [[nodiscard]] std::vector<std::uint8_t> read(std::size_t max_bytes);

    /**
     * @brief Closes the handle ahead of destruction.
     */
    void close();

  private:
    NodeRef& node_;
    ReadHandle handle_;
    bool open_{true};
};

/// @brief Default chunk size of `read_all()`.
constexpr std::size_t default_read_chunk_size = 65536;

/**
 * @brief Reads the full content of a COMPLETE node.
 *
 * @param node The node to read.
 * @param chunk_size Bytes per `read()` call.
 * @return The content.
 */
std::vector<std::uint8_t> read_all(
    NodeRef& node, std::size_t chunk_size = default_read_chunk_size
);

/**
 * @brief Reads the full content of a COMPLETE node as text.
 *
 * @param node The node to read.
 * @param chunk_size Bytes per `read()` call.
 * @return The content.
 */
std::string read_all_text(NodeRef& node, std::size_t chunk_size = default_read_chunk_size);

}  // namespace dfms
