/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include <dfms/communicator/communicator.hpp>
#include <dfms/node/types.hpp>
#include <dfms/utils.hpp>

namespace dfms {

/**
 * @brief Maps manager ids to the rank serving them.
 */
class AddressBook {
  public:
    virtual ~AddressBook() noexcept = default;

    /**
     * @brief Publishes the address of a manager, replacing any previous one.
     *
     * @param manager_id The manager.
     * @param rank Its rank.
     */
    virtual void publish(ManagerID const& manager_id, Rank rank) = 0;

    /**
     * @brief Waits for the address of a manager.
     *
     * @param manager_id The manager.
     * @param timeout How long to wait for it to be published.
     * @return The rank.
     *
     * @throws std::out_of_range If the manager was not published in time.
     */
    [[nodiscard]] virtual Rank lookup(ManagerID const& manager_id, Duration timeout) = 0;

    /**
     * @brief Every published address.
     *
     * @return Manager id to rank.
     */
    [[nodiscard]] virtual std::map<ManagerID, Rank> entries() const = 0;
};

/**
 * @brief An address book in process memory.
 */
class InMemoryAddressBook final : public AddressBook {
  public:
    void publish(ManagerID const& manager_id, Rank rank) override;
    [[nodiscard]] Rank lookup(ManagerID const& manager_id, Duration timeout) override;
    [[nodiscard]] std::map<ManagerID, Rank> entries() const override;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<ManagerID, Rank> entries_;
};

/**
 * @brief An address book shared by processes through a directory.
 *
 * Each entry is one file named after the manager id and holding the rank. Entries
 * are written to a temporary file and renamed into place, so a reader never sees a
 * partial entry. Lookups poll with exponential backoff.
 */
class FileAddressBook final : public AddressBook {
  public:
    /**
     * @brief Construct an address book.
     *
     * @param directory The coordination directory, created if missing.
     */
    explicit FileAddressBook(std::filesystem::path directory);

    void publish(ManagerID const& manager_id, Rank rank) override;
    [[nodiscard]] Rank lookup(ManagerID const& manager_id, Duration timeout) override;
    [[nodiscard]] std::map<ManagerID, Rank> entries() const override;

    /// @brief The coordination directory.
    [[nodiscard]] std::filesystem::path const& directory() const noexcept {
        return directory_;
    }

  private:
    [[nodiscard]] std::filesystem::path entry_path(ManagerID const& manager_id) const;
    [[nodiscard]] static std::optional<Rank> read_entry(
        std::filesystem::path const& path
    );

    std::filesystem::path const directory_;
};

}  // namespace dfms
