/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <utility>

#include <mpi.h>

#include <dfms/communicator/mpi.hpp>
#include <dfms/error.hpp>

namespace dfms {

namespace mpi {
void init(int* argc, char*** argv) {
    if (!is_initialized()) {
        int provided;

        // Initialize MPI with the desired level of thread support
        DFMS_MPI(MPI_Init_thread(argc, argv, MPI_THREAD_MULTIPLE, &provided));

        DFMS_EXPECTS(
            provided == MPI_THREAD_MULTIPLE,
            "didn't get the requested thread level support: MPI_THREAD_MULTIPLE"
        );
    }

    // Check if max MPI TAG can accommodate the OpID + StageID
    int flag;
    std::int32_t* max_tag;
    DFMS_MPI(MPI_Comm_get_attr(MPI_COMM_WORLD, MPI_TAG_UB, &max_tag, &flag));
    DFMS_EXPECTS(flag, "Unable to get the MPI_TAG_UB attr");

    DFMS_EXPECTS(
        (*max_tag) >= Tag::max_value(),
        "MPI_TAG_UB(" + std::to_string(*max_tag)
            + ") is unable to accommodate the required max tag("
            + std::to_string(Tag::max_value()) + ")"
    );
}

bool is_initialized() {
    int flag;
    DFMS_MPI(MPI_Initialized(&flag));
    return flag;
}

void detail::check_mpi_error(int error_code, char const* file, int line) {
    if (error_code != MPI_SUCCESS) {
        std::array<char, MPI_MAX_ERROR_STRING> error_string;
        int error_length;
        MPI_Error_string(error_code, error_string.data(), &error_length);
        std::cerr << "MPI error at " << file << ":" << line << ": "
                  << std::string(
                         error_string.data(), static_cast<std::size_t>(error_length)
                     )
                  << std::endl;
        MPI_Abort(MPI_COMM_WORLD, error_code);
    }
}
}  // namespace mpi

namespace {
void check_mpi_thread_support() {
    int level;
    DFMS_MPI(MPI_Query_thread(&level));

    std::string level_str;
    switch (level) {
    case MPI_THREAD_SINGLE:
        level_str = "MPI_THREAD_SINGLE";
        break;
    case MPI_THREAD_FUNNELED:
        level_str = "MPI_THREAD_FUNNELED";
        break;
    case MPI_THREAD_SERIALIZED:
        level_str = "MPI_THREAD_SERIALIZED";
        break;
    case MPI_THREAD_MULTIPLE:
        level_str = "MPI_THREAD_MULTIPLE";
        break;
    default:
        throw std::logic_error("MPI_Query_thread(): unknown thread level support");
    }
    DFMS_EXPECTS(
        level == MPI_THREAD_MULTIPLE,
        "MPI thread level support " + level_str
            + " isn't sufficient, need MPI_THREAD_MULTIPLE"
    );
}
}  // namespace

MPI::MPI(MPI_Comm comm, config::Options options)
    : comm_{comm}, logger_{this, std::move(options)} {
    int rank;
    int nranks;
    DFMS_MPI(MPI_Comm_rank(comm_, &rank));
    DFMS_MPI(MPI_Comm_size(comm_, &nranks));
    rank_ = rank;
    nranks_ = nranks;
    check_mpi_thread_support();
}

std::unique_ptr<Communicator::Future> MPI::send(
    std::unique_ptr<std::vector<std::uint8_t>> msg, Rank rank, Tag tag
) {
    DFMS_EXPECTS(msg != nullptr, "the message cannot be NULL");
    DFMS_EXPECTS(
        msg->size() <= static_cast<std::size_t>(std::numeric_limits<int>::max()),
        "send buffer size exceeds MPI max count"
    );
    MPI_Request req;
    DFMS_MPI(MPI_Isend(
        msg->data(), static_cast<int>(msg->size()), MPI_UINT8_T, rank, tag, comm_, &req
    ));
    return std::make_unique<Future>(req, std::move(msg));
}

std::pair<std::unique_ptr<std::vector<std::uint8_t>>, Rank> MPI::recv_any(Tag tag) {
    int msg_available;
    MPI_Status probe_status;
    MPI_Message matched_msg;
    DFMS_MPI(MPI_Improbe(
        MPI_ANY_SOURCE, tag, comm_, &msg_available, &matched_msg, &probe_status
    ));
    if (!msg_available) {
        return {nullptr, 0};
    }
    DFMS_EXPECTS(tag == probe_status.MPI_TAG || tag == MPI_ANY_TAG, "corrupt mpi tag");
    MPI_Count size;
    DFMS_MPI(MPI_Get_elements_x(&probe_status, MPI_UINT8_T, &size));
    DFMS_EXPECTS(
        size <= std::numeric_limits<int>::max(), "recv buffer size exceeds MPI max count"
    );
    auto msg = std::make_unique<std::vector<std::uint8_t>>(static_cast<std::size_t>(size));

    MPI_Status msg_status;
    DFMS_MPI(MPI_Mrecv(
        msg->data(), static_cast<int>(msg->size()), MPI_UINT8_T, &matched_msg, &msg_status
    ));
    DFMS_MPI(MPI_Get_elements_x(&msg_status, MPI_UINT8_T, &size));
    DFMS_EXPECTS(
        static_cast<std::size_t>(size) == msg->size(),
        "incorrect size of the MPI_Recv message"
    );
    return {std::move(msg), probe_status.MPI_SOURCE};
}

std::vector<std::unique_ptr<Communicator::Future>> MPI::test_some(
    std::vector<std::unique_ptr<Communicator::Future>>& future_vector
) {
    if (future_vector.empty()) {
        return {};
    }
    std::vector<MPI_Request> reqs;
    reqs.reserve(future_vector.size());
    for (auto const& future : future_vector) {
        auto mpi_future = dynamic_cast<Future const*>(future.get());
        DFMS_EXPECTS(mpi_future != nullptr, "future isn't a MPI::Future");
        reqs.push_back(mpi_future->req_);
    }

    std::vector<int> indices(reqs.size());
    int num_completed{0};
    DFMS_MPI(MPI_Testsome(
        static_cast<int>(reqs.size()),
        reqs.data(),
        &num_completed,
        indices.data(),
        MPI_STATUSES_IGNORE
    ));
    DFMS_EXPECTS(num_completed != MPI_UNDEFINED, "Expected at least one active handle.");

    std::vector<std::unique_ptr<Communicator::Future>> completed;
    completed.reserve(static_cast<std::size_t>(num_completed));
    for (int i = 0; i < num_completed; ++i) {
        completed.push_back(
            std::move(future_vector[static_cast<std::size_t>(indices[i])])
        );
    }
    // Remove all completed (nullptr) futures from the vector
    std::erase(future_vector, nullptr);
    return completed;
}

void MPI::wait(std::unique_ptr<Communicator::Future> future) {
    auto mpi_future = dynamic_cast<Future*>(future.get());
    DFMS_EXPECTS(mpi_future != nullptr, "future isn't a MPI::Future");
    DFMS_MPI(MPI_Wait(&mpi_future->req_, MPI_STATUS_IGNORE));
}

std::string MPI::str() const {
    int version, subversion;
    DFMS_MPI(MPI_Get_version(&version, &subversion));

    std::stringstream ss;
    ss << "MPI(rank=" << rank_ << ", nranks: " << nranks_ << ", mpi-version=" << version
       << "." << subversion << ")";
    return ss.str();
}

}  // namespace dfms
