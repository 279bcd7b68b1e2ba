/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <dfms/config.hpp>
#include <dfms/node/types.hpp>

namespace dfms {

/**
 * @brief Sequential reader over the content of a `Storage`.
 */
class StorageReader {
  public:
    virtual ~StorageReader() noexcept = default;

    /**
     * @brief Reads the next bytes.
     *
     * @param max_bytes Upper bound on the number of bytes returned.
     * @return The bytes read, empty at the end of the data.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> read(std::size_t max_bytes) = 0;
};

/**
 * @brief Byte buffer backing a node.
 *
 * A storage is appended to while its node is writing and only read once the node is
 * complete. It is not thread-safe, the owning node serializes access.
 */
class Storage {
  public:
    virtual ~Storage() noexcept = default;

    /**
     * @brief Appends bytes.
     *
     * @param data The bytes to append.
     * @return Number of bytes accepted.
     *
     * @throws std::runtime_error If the backend fails to store the bytes.
     */
    virtual std::size_t write(std::span<std::uint8_t const> data) = 0;

    /**
     * @brief Number of bytes stored.
     *
     * @return The size in bytes.
     */
    [[nodiscard]] virtual std::size_t size() const = 0;

    /**
     * @brief Opens a reader positioned at the first byte.
     *
     * The reader must not outlive the storage or a call to `release()`.
     *
     * @return The reader.
     */
    [[nodiscard]] virtual std::unique_ptr<StorageReader> open_reader() = 0;

    /**
     * @brief Releases the backing resources. The storage is empty afterwards.
     */
    virtual void release() = 0;

    /**
     * @brief Description of the storage.
     *
     * @return The description.
     */
    [[nodiscard]] virtual std::string str() const = 0;
};

/**
 * @brief Storage in a host memory vector.
 */
class InMemoryStorage final : public Storage {
  public:
    InMemoryStorage() = default;

    std::size_t write(std::span<std::uint8_t const> data) override;

    [[nodiscard]] std::size_t size() const override {
        return data_.size();
    }

    [[nodiscard]] std::unique_ptr<StorageReader> open_reader() override;

    void release() override;

    [[nodiscard]] std::string str() const override;

  private:
    std::vector<std::uint8_t> data_;
};

/**
 * @brief Storage in a file, appended to and deleted on `release()`.
 */
class FileStorage final : public Storage {
  public:
    /**
     * @brief Creates (truncates) the backing file.
     *
     * @param path Location of the backing file.
     *
     * @throws std::runtime_error If the file cannot be created.
     */
    explicit FileStorage(std::filesystem::path path);

    ~FileStorage() noexcept override;

    std::size_t write(std::span<std::uint8_t const> data) override;

    [[nodiscard]] std::size_t size() const override {
        return size_;
    }

    [[nodiscard]] std::unique_ptr<StorageReader> open_reader() override;

    /**
     * @copydoc Storage::release
     *
     * @throws std::filesystem::filesystem_error If the file cannot be removed.
     */
    void release() override;

    [[nodiscard]] std::string str() const override;

    /**
     * @brief Location of the backing file.
     *
     * @return The path.
     */
    [[nodiscard]] std::filesystem::path const& path() const noexcept {
        return path_;
    }

  private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::size_t size_{0};
    bool released_{false};
};

/**
 * @brief Creates the storage for a node.
 *
 * File storages live under the "storage_dir" option (default: the system temporary
 * directory) in a file named after the process id and the instance id.
 *
 * @param kind The storage flavor.
 * @param instance_id The node the storage is for.
 * @param options Configuration options.
 * @return The storage.
 */
std::unique_ptr<Storage> make_storage(
    StorageKind kind, InstanceID const& instance_id, config::Options options
);

}  // namespace dfms
