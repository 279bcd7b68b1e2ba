/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <dfms/communicator/communicator.hpp>
#include <dfms/config.hpp>

namespace dfms {

/**
 * @brief Single process communicator class that implements the `Communicator` interface.
 *
 * This class stubs out the `Communicator` interface with functions that throw.
 * In a single process every Node Manager is reachable in-process, so nothing is ever
 * sent through the communicator.
 */
class Single final : public Communicator {
  public:
    /**
     * @brief Construct a single process communicator.
     *
     * @param options Configuration options.
     */
    Single(config::Options options);

    ~Single() noexcept override = default;

    /**
     * @copydoc Communicator::rank
     */
    [[nodiscard]] constexpr Rank rank() const override {
        return 0;
    }

    /**
     * @copydoc Communicator::nranks
     */
    [[nodiscard]] constexpr Rank nranks() const override {
        return 1;
    }

    /**
     * @copydoc Communicator::send
     *
     * @throws std::runtime_error always.
     */
    [[nodiscard]] std::unique_ptr<Communicator::Future> send(
        std::unique_ptr<std::vector<std::uint8_t>> msg, Rank rank, Tag tag
    ) override;

    /**
     * @copydoc Communicator::recv_any
     *
     * @note Always returns `{nullptr, 0}`.
     */
    [[nodiscard]] std::pair<std::unique_ptr<std::vector<std::uint8_t>>, Rank> recv_any(
        Tag tag
    ) override;

    /**
     * @copydoc Communicator::test_some
     *
     * @throws std::runtime_error always.
     */
    [[nodiscard]] std::vector<std::unique_ptr<Communicator::Future>> test_some(
        std::vector<std::unique_ptr<Communicator::Future>>& future_vector
    ) override;

    /**
     * @copydoc Communicator::wait
     *
     * @throws std::runtime_error always.
     */
    void wait(std::unique_ptr<Communicator::Future> future) override;

    /**
     * @copydoc Communicator::logger
     */
    [[nodiscard]] Logger& logger() override {
        return logger_;
    }

    /**
     * @copydoc Communicator::str
     */
    [[nodiscard]] std::string str() const override;

  private:
    Logger logger_;
};

}  // namespace dfms
