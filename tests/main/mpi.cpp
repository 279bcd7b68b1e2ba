/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <memory>

#include <gtest/gtest.h>
#include <mpi.h>

#include <dfms/communicator/mpi.hpp>

#include "../environment.hpp"

Environment* GlobalEnvironment = nullptr;

namespace {
MPI_Comm mpi_comm = MPI_COMM_NULL;
}  // namespace

Environment::Environment(int argc, char** argv) : argc_(argc), argv_(argv) {}

TestEnvironmentType Environment::type() const {
    return TestEnvironmentType::MPI;
}

void Environment::SetUp() {
    dfms::mpi::init(&argc_, &argv_);

    DFMS_MPI(MPI_Comm_dup(MPI_COMM_WORLD, &mpi_comm));

    options_ = dfms::config::Options(dfms::config::get_environment_variables());
    comm_ = std::make_shared<dfms::MPI>(mpi_comm, options_);
    progress_thread_ = std::make_shared<dfms::ProgressThread>(comm_->logger());
}

void Environment::TearDown() {
    progress_thread_ = nullptr;  // Stop the progress thread.
    comm_ = nullptr;
    DFMS_MPI(MPI_Comm_free(&mpi_comm));
    DFMS_MPI(MPI_Finalize());
}

void Environment::barrier() {
    DFMS_MPI(MPI_Barrier(mpi_comm));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    GlobalEnvironment = new Environment(argc, argv);
    ::testing::AddGlobalTestEnvironment(GlobalEnvironment);
    return RUN_ALL_TESTS();
}
