/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <mpi.h>

#include <dfms/communicator/communicator.hpp>
#include <dfms/error.hpp>

namespace dfms {

/**
 * @namespace dfms::mpi
 * @brief Collection of helpful [MPI](https://www.mpi-forum.org/docs/) functions.
 */
namespace mpi {

/**
 * @brief Helper to initialize MPI with threading support.
 *
 * @param argc Pointer to the number of arguments passed to the program.
 * @param argv Pointer to the argument vector passed to the program.
 *
 * @throws std::logic_error If `MPI_THREAD_MULTIPLE` isn't provided or the MPI tag
 * space cannot hold a `Tag`.
 */
void init(int* argc, char*** argv);

/**
 * @brief Check if MPI is initialized.
 *
 * @return true If MPI is initialized.
 */
bool is_initialized();

/**
 * @brief Helper to check the MPI errcode of an MPI call.
 *
 * A macro to check the result of an MPI call and handle any error codes that are
 * returned.
 *
 * @param call The MPI call to be checked for errors.
 */
#define DFMS_MPI(call) dfms::mpi::detail::check_mpi_error((call), __FILE__, __LINE__)

namespace detail {
/**
 * @brief Checks and reports MPI error codes.
 *
 * @param error_code The MPI error code to check.
 * @param file The file where the MPI call occurred.
 * @param line The line number where the MPI call occurred.
 */
void check_mpi_error(int error_code, char const* file, int line);
}  // namespace detail
}  // namespace mpi

/**
 * @brief MPI communicator class that implements the `Communicator` interface.
 *
 * Sends are non-blocking (`MPI_Isend`); receives match a probed message
 * (`MPI_Improbe` / `MPI_Mrecv`) so that several threads can receive on the same
 * communicator.
 */
class MPI final : public Communicator {
  public:
    /**
     * @brief Represents the future result of an MPI send.
     *
     * The future owns the message until the request completes.
     */
    class Future : public Communicator::Future {
        friend class MPI;

      public:
        /**
         * @brief Construct a Future.
         *
         * @param req The MPI request handle for the operation.
         * @param data The message being sent.
         */
        Future(MPI_Request req, std::unique_ptr<std::vector<std::uint8_t>> data)
            : req_{req}, data_{std::move(data)} {}

        ~Future() noexcept override = default;

      private:
        MPI_Request req_;
        std::unique_ptr<std::vector<std::uint8_t>> data_;
    };

    /**
     * @brief Construct an MPI communicator.
     *
     * @param comm The MPI communicator to be used for communication.
     * @param options Configuration options.
     */
    MPI(MPI_Comm comm, config::Options options);

    ~MPI() noexcept override = default;

    /**
     * @copydoc Communicator::rank
     */
    [[nodiscard]] Rank rank() const override {
        return rank_;
    }

    /**
     * @copydoc Communicator::nranks
     */
    [[nodiscard]] Rank nranks() const override {
        return nranks_;
    }

    /**
     * @copydoc Communicator::send
     */
    [[nodiscard]] std::unique_ptr<Communicator::Future> send(
        std::unique_ptr<std::vector<std::uint8_t>> msg, Rank rank, Tag tag
    ) override;

    /**
     * @copydoc Communicator::recv_any
     */
    [[nodiscard]] std::pair<std::unique_ptr<std::vector<std::uint8_t>>, Rank> recv_any(
        Tag tag
    ) override;

    /**
     * @copydoc Communicator::test_some
     */
    [[nodiscard]] std::vector<std::unique_ptr<Communicator::Future>> test_some(
        std::vector<std::unique_ptr<Communicator::Future>>& future_vector
    ) override;

    /**
     * @copydoc Communicator::wait
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
    MPI_Comm comm_;
    Rank rank_;
    Rank nranks_;
    Logger logger_;
};

}  // namespace dfms
