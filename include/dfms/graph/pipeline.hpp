/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <dfms/node/types.hpp>

namespace dfms {

/**
 * @brief One stage of a logical pipeline.
 *
 * A stage becomes `copies` node instances in the physical graph.
 */
struct StageSpec {
    std::string name;  ///< Unique name, also the object id of its instances.
    NodeKind kind{NodeKind::DATA};  ///< Flavor of the instances.
    std::string application{};  ///< Application name, consumers only.
    std::unordered_map<std::string, std::string> params{};  ///< Per-node options.
    StorageKind storage{StorageKind::MEMORY};  ///< Backend of the byte buffers.
    std::optional<std::size_t> expected_size{};  ///< Auto-finalize size, if any.
    std::vector<std::string> inputs{};  ///< Producer stages, consumers only.
    std::vector<std::string> children{};  ///< Child stages, containers only.
    std::size_t copies{1};  ///< Fan-out width.
    std::optional<ManagerID> hint{};  ///< Preferred manager, if any.

    /**
     * @brief A data stage, written from outside.
     *
     * @param name The stage name.
     * @param storage The storage backend.
     * @return The stage.
     */
    static StageSpec data(std::string name, StorageKind storage = StorageKind::MEMORY);

    /**
     * @brief A consumer stage.
     *
     * @param name The stage name.
     * @param application The application to run.
     * @param inputs The producer stages.
     * @param params Options of the application.
     * @return The stage.
     */
    static StageSpec consumer(
        std::string name,
        std::string application,
        std::vector<std::string> inputs,
        std::unordered_map<std::string, std::string> params = {}
    );

    /**
     * @brief A container stage.
     *
     * @param name The stage name.
     * @param children The child stages.
     * @return The stage.
     */
    static StageSpec container(std::string name, std::vector<std::string> children);

    /**
     * @brief Sets the fan-out width.
     *
     * @param n The number of copies.
     * @return This stage.
     */
    StageSpec& with_copies(std::size_t n) {
        copies = n;
        return *this;
    }

    /**
     * @brief Sets the placement hint.
     *
     * @param manager_id The preferred manager.
     * @return This stage.
     */
    StageSpec& on(ManagerID manager_id) {
        hint = std::move(manager_id);
        return *this;
    }
};

/**
 * @brief A logical pipeline: an ordered list of stages.
 */
class PipelineSpec {
  public:
    PipelineSpec() = default;

    /**
     * @brief Construct from stages.
     *
     * @param stages The stages, in order.
     */
    PipelineSpec(std::vector<StageSpec> stages) : stages_{std::move(stages)} {}

    /**
     * @brief Appends a stage.
     *
     * @param stage The stage.
     * @return This pipeline.
     */
    PipelineSpec& add(StageSpec stage) {
        stages_.push_back(std::move(stage));
        return *this;
    }

    /// @brief The stages, in order.
    [[nodiscard]] std::vector<StageSpec> const& stages() const noexcept {
        return stages_;
    }

  private:
    std::vector<StageSpec> stages_;
};

}  // namespace dfms
