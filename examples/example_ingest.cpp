/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <mpi.h>

#include <dfms/communicator/mpi.hpp>
#include <dfms/coordinator/execution_coordinator.hpp>
#include <dfms/discovery/address_book.hpp>
#include <dfms/discovery/remote_discovery.hpp>
#include <dfms/error.hpp>
#include <dfms/graph/graph_builder.hpp>
#include <dfms/manager/node_manager.hpp>
#include <dfms/rpc/manager_server.hpp>
#include <dfms/rpc/router.hpp>
#include <dfms/statistics.hpp>

namespace {

// Managers are named after the rank hosting them: "001", "002", ...
dfms::ManagerID manager_name(dfms::Rank rank) {
    std::stringstream ss;
    ss << std::setw(3) << std::setfill('0') << rank + 1;
    return ss.str();
}

}  // namespace

// An example of how to run a dataflow graph over Node Managers in several processes.
int main(int argc, char** argv) {
    // The managers talk to each other over MPI. `mpi::init` initializes MPI with the
    // thread support the progress thread and the delivery queues need.
    dfms::mpi::init(&argc, &argv);

    // Initialize configuration options from environment variables, e.g.
    // DFMS_LOG_LEVEL=INFO or DFMS_STATISTICS=true.
    dfms::config::Options options{dfms::config::get_environment_variables()};

    {
        std::shared_ptr<dfms::Communicator> comm =
            std::make_shared<dfms::MPI>(MPI_COMM_WORLD, options);
        auto& log = comm->logger();

        // Statistics are disabled unless the "statistics" option is set.
        auto stats = dfms::Statistics::from_options(options);

        // The progress thread drives the RPC router: it sends requests and replies and
        // receives incoming messages in the background.
        auto progress_thread = std::make_shared<dfms::ProgressThread>(log, stats);

        // One router per process carries every RPC between the managers. All ranks
        // must use the same op id.
        auto router = std::make_shared<dfms::rpc::Router>(
            comm,
            progress_thread,
            0,  // op_id
            dfms::rpc::Router::timeout_from_options(options),
            stats
        );

        // Manager addresses (their ranks) are published in a shared directory. All
        // ranks must see the same directory, the default works on a single host.
        auto const coordination_dir = options.get<std::string>(
            "coordination_dir",
            dfms::config::default_factory<std::string>(
                (std::filesystem::temp_directory_path() / "dfms-coordination").string()
            )
        );
        auto address_book = std::make_shared<dfms::FileAddressBook>(coordination_dir);
        auto discovery = std::make_shared<dfms::RemoteDiscovery>(
            router, address_book, router->timeout()
        );

        // Every rank hosts one Node Manager and serves it to the other ranks.
        auto manager = std::make_shared<dfms::NodeManager>(
            manager_name(comm->rank()),
            comm,
            options,
            discovery,
            dfms::ApplicationRegistry::with_builtins(),
            stats
        );
        dfms::rpc::ManagerServer server{manager, router};
        discovery->set_local(manager);

        // Wait until every manager is published and served before submitting.
        DFMS_MPI(MPI_Barrier(MPI_COMM_WORLD));

        if (comm->rank() == 0) {
            dfms::ManagerID const first = manager_name(0);
            dfms::ManagerID const second = manager_name(comm->nranks() > 1 ? 1 : 0);

            // The logical pipeline: A is written by us, B, C and D each compute the
            // CRC-32 of their producer.
            dfms::PipelineSpec pipeline;
            pipeline.add(dfms::StageSpec::data("A", dfms::StorageKind::FILE).on(first))
                .add(dfms::StageSpec::consumer("B", "crc", {"A"}).on(first))
                .add(dfms::StageSpec::consumer("C", "crc", {"B"}).on(second))
                .add(dfms::StageSpec::consumer("D", "crc", {"C"}).on(second));

            std::vector<dfms::ManagerID> all_managers;
            for (dfms::Rank r = 0; r < comm->nranks(); ++r) {
                all_managers.push_back(manager_name(r));
            }

            dfms::SessionID const session = "ingest";
            dfms::PhysicalGraph pdg =
                dfms::GraphBuilder{}.build(pipeline, session, all_managers);
            log.print("Physical graph:\n", pdg.str());

            dfms::ExecutionCoordinator::Managers managers;
            for (auto const& id : pdg.managers()) {
                managers.emplace(id, discovery->resolve(id));
            }

            dfms::ExecutionCoordinator coordinator{comm};
            if (!coordinator.submit_pdg(pdg, managers)) {
                log.print("A manager declined the session, nothing to do");
            } else {
                // Data injection goes through a proxy of the root node. Finalizing
                // A triggers B, which triggers C on the other manager, and so on.
                auto const a_id = dfms::GraphBuilder::instance_id(
                    session, pipeline.stages().at(0), 0
                );
                auto a = coordinator.lookup(session, a_id);
                a->write(std::string{"a block of data ingested into A"});
                a->finalize();

                bool const done = coordinator.wait(session, dfms::Duration{60});
                auto const d_id = dfms::GraphBuilder::instance_id(
                    session, pipeline.stages().at(3), 0
                );
                auto d = coordinator.lookup(session, d_id);
                if (done && d->state() == dfms::NodeState::COMPLETE) {
                    log.print("D = ", dfms::read_all_text(*d));
                } else {
                    log.print("D did not complete, state: ", d->state());
                }

                // Tear the session down on every manager and report how it went.
                auto const report = coordinator.shutdown(session);
                for (auto const& [id, status] : report.status) {
                    log.print("manager ", id, " shutdown status: ", status);
                }
                for (auto const& [id, error] : report.errors) {
                    log.print("manager ", id, " failed to shut down: ", error);
                }
            }
        }

        // No rank stops serving before the coordinator is done.
        DFMS_MPI(MPI_Barrier(MPI_COMM_WORLD));

        if (stats->enabled()) {
            log.print(stats->report());
        }
        // The server, the manager and the router go out of scope here, before MPI is
        // finalized.
    }

    // `DFMS_MPI` is a convenience macro that checks for MPI errors.
    DFMS_MPI(MPI_Finalize());
}
