/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>

#include <dfms/coordinator/execution_coordinator.hpp>
#include <dfms/error.hpp>

namespace dfms {

bool ShutdownReport::clean() const {
    return errors.empty() && std::ranges::all_of(status, [](auto const& kv) {
               return kv.second == static_cast<std::int32_t>(ShutdownStatus::CLEAN);
           });
}

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<Communicator> comm)
    : comm_{std::move(comm)} {
    DFMS_EXPECTS(comm_ != nullptr, "the communicator cannot be NULL");
}

ExecutionCoordinator::Submission ExecutionCoordinator::submission(
    SessionID const& session
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    DFMS_EXPECTS(
        it != sessions_.end(), "session " + session + " is not live", std::out_of_range
    );
    return it->second;
}

void ExecutionCoordinator::teardown(
    PhysicalGraph const& pdg, Managers const& managers
) {
    for (auto const& m : pdg.managers()) {
        try {
            managers.at(m)->shutdown_session(pdg.session());
        } catch (std::exception const& e) {
            comm_->logger().warn(
                "cannot tear down ", pdg.session(), " on manager ", m, ": ", e.what()
            );
        }
    }
}

bool ExecutionCoordinator::submit_pdg(PhysicalGraph const& pdg, Managers const& managers) {
    auto const& session = pdg.session();
    auto const targeted = pdg.managers();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DFMS_EXPECTS(
            !sessions_.contains(session),
            "session " + session + " is already live",
            std::invalid_argument
        );
    }
    for (auto const& m : targeted) {
        DFMS_EXPECTS(
            managers.contains(m) && managers.at(m) != nullptr,
            "no manager " + m + " for session " + session,
            std::invalid_argument
        );
    }

    // Phase one, reserve everywhere or nowhere.
    std::vector<ManagerID> reserved;
    for (auto const& m : targeted) {
        bool accepted = false;
        try {
            accepted = managers.at(m)->reserve(session, pdg.nodes_on(m).size());
        } catch (std::exception const& e) {
            comm_->logger().warn(
                "manager ", m, " failed to reserve for ", session, ": ", e.what()
            );
            // The reservation may have happened before the failure was reported.
            reserved.push_back(m);
        }
        if (!accepted) {
            for (auto const& r : reserved) {
                try {
                    managers.at(r)->release(session);
                } catch (std::exception const& e) {
                    comm_->logger().warn(
                        "manager ", r, " failed to release ", session, ": ", e.what()
                    );
                }
            }
            comm_->logger().info(
                "session ", session, " rejected, manager ", m, " declined"
            );
            return false;
        }
        reserved.push_back(m);
    }

    // Phase two, create and wire.
    try {
        for (auto const& node : pdg.nodes()) {
            managers.at(pdg.manager_of(node.instance_id))->register_node(node, session);
        }
        for (auto const& edge : pdg.edges()) {
            auto const& from_manager = pdg.manager_of(edge.from);
            auto const& to_manager = pdg.manager_of(edge.to);
            auto const& receiver_manager = pdg.manager_of(edge.receiver());
            auto const& publisher_manager = pdg.manager_of(edge.publisher());
            managers.at(receiver_manager)->link(session, edge, from_manager, to_manager);
            if (publisher_manager != receiver_manager) {
                managers.at(publisher_manager)
                    ->link(session, edge, from_manager, to_manager);
            }
        }
    } catch (std::exception const& e) {
        comm_->logger().warn("submission of ", session, " failed: ", e.what());
        teardown(pdg, managers);
        throw;
    }

    Managers used;
    for (auto const& m : targeted) {
        used.emplace(m, managers.at(m));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.emplace(session, Submission{pdg, std::move(used)});
    }
    comm_->logger().info(
        "session ", session, " accepted: ", pdg.nodes().size(), " nodes on ",
        targeted.size(), " managers"
    );
    return true;
}

ShutdownReport ExecutionCoordinator::shutdown(SessionID const& session) {
    ShutdownReport ret;
    std::optional<Submission> sub;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) {
            comm_->logger().info("session ", session, " is not live, nothing to shut down");
            return ret;
        }
        sub = std::move(it->second);
        sessions_.erase(it);
    }
    for (auto const& [m, manager] : sub->managers) {
        try {
            auto const status = manager->shutdown_session(session);
            ret.status[m] = static_cast<std::int32_t>(status);
            comm_->logger().info("manager ", m, " tore down ", session, ": ", status);
        } catch (std::exception const& e) {
            ret.status[m] = -1;
            ret.errors[m] = e.what();
            comm_->logger().warn(
                "manager ", m, " failed to tear down ", session, ": ", e.what()
            );
        }
    }
    return ret;
}

void ExecutionCoordinator::abort(SessionID const& session, std::string const& cause) {
    for (auto const& root : roots(session)) {
        try {
            root->fail(cause);
        } catch (std::exception const& e) {
            comm_->logger().warn("cannot abort ", root->instance_id(), ": ", e.what());
        }
    }
}

std::vector<std::shared_ptr<NodeRef>> ExecutionCoordinator::roots(
    SessionID const& session
) {
    auto const sub = submission(session);
    std::vector<std::shared_ptr<NodeRef>> ret;
    for (auto const& id : sub.pdg.roots()) {
        ret.push_back(sub.managers.at(sub.pdg.manager_of(id))->lookup(id));
    }
    return ret;
}

std::shared_ptr<NodeRef> ExecutionCoordinator::lookup(
    SessionID const& session, InstanceID const& instance_id
) {
    auto const sub = submission(session);
    return sub.managers.at(sub.pdg.manager_of(instance_id))->lookup(instance_id);
}

bool ExecutionCoordinator::wait(SessionID const& session, Duration timeout) {
    auto const sub = submission(session);
    std::vector<std::shared_ptr<NodeRef>> pending;
    for (auto const& node : sub.pdg.nodes()) {
        pending.push_back(
            sub.managers.at(sub.pdg.manager_of(node.instance_id))->lookup(node.instance_id)
        );
    }
    auto const deadline =
        Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout);
    Duration backoff{0.0005};
    for (;;) {
        std::erase_if(pending, [](auto const& n) { return is_terminal(n->state()); });
        if (pending.empty()) {
            return true;
        }
        if (Clock::now() >= deadline) {
            comm_->logger().info(
                "session ", session, " still has ", pending.size(), " running nodes"
            );
            return false;
        }
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, Duration{0.05});
    }
}

PhysicalGraph ExecutionCoordinator::graph(SessionID const& session) const {
    return submission(session).pdg;
}

std::vector<SessionID> ExecutionCoordinator::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionID> ret;
    for (auto const& [id, _] : sessions_) {
        ret.push_back(id);
    }
    return ret;
}

}  // namespace dfms
