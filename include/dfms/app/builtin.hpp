/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <string>

#include <dfms/app/application.hpp>
#include <dfms/config.hpp>

namespace dfms {

/**
 * @brief Base of the built-in applications, holds the name and the read chunk size.
 */
class BuiltinApplication : public Application {
  public:
    /**
     * @brief Construct a built-in application.
     *
     * @param name The registered name.
     * @param options The per-node options, `read_chunk_size` is read from them.
     */
    BuiltinApplication(std::string name, config::Options& options);

    [[nodiscard]] std::string const& name() const noexcept override {
        return name_;
    }

    /**
     * @brief Bytes requested per `read()` on the producer.
     *
     * @return The chunk size.
     */
    [[nodiscard]] std::size_t chunk_size() const noexcept {
        return chunk_size_;
    }

  private:
    std::string const name_;
    std::size_t const chunk_size_;
};

/// @brief Writes the decimal CRC-32 of the producer's content.
class CrcApplication final : public BuiltinApplication {
  public:
    /// @brief Construct from the per-node options.
    explicit CrcApplication(config::Options& options);
    void run(ConsumerContext& ctx, NodeRef& producer) override;
};

/**
 * @brief Writes every line of the producer that contains the `substring` option.
 *
 * Every line keeps its own terminator, a last line without one is written without.
 */
class GrepApplication final : public BuiltinApplication {
  public:
    /// @brief Construct from the per-node options.
    explicit GrepApplication(config::Options& options);
    void run(ConsumerContext& ctx, NodeRef& producer) override;

    /// @brief The substring to match.
    [[nodiscard]] std::string const& substring() const noexcept {
        return substring_;
    }

  private:
    std::string const substring_;
};

/// @brief Writes the producer's lines, each with its own terminator, in lexicographic order.
class SortApplication final : public BuiltinApplication {
  public:
    /// @brief Construct from the per-node options.
    explicit SortApplication(config::Options& options);
    void run(ConsumerContext& ctx, NodeRef& producer) override;
};

/**
 * @brief Reverses every token terminated by a space or a newline.
 *
 * The terminator is kept in place. A trailing token without terminator is dropped.
 */
class ReverseApplication final : public BuiltinApplication {
  public:
    /// @brief Construct from the per-node options.
    explicit ReverseApplication(config::Options& options);
    void run(ConsumerContext& ctx, NodeRef& producer) override;
};

/// @brief Copies the producer's content verbatim.
class CopyApplication final : public BuiltinApplication {
  public:
    /// @brief Construct from the per-node options.
    explicit CopyApplication(config::Options& options);
    void run(ConsumerContext& ctx, NodeRef& producer) override;
};

/**
 * @brief Writes the decimal sum of the checksums of all leaves under a container.
 *
 * Nested containers are descended into depth-first. The producer must be a container.
 */
class SumChecksumsApplication final : public BuiltinApplication {
  public:
    /// @brief Construct from the per-node options.
    explicit SumChecksumsApplication(config::Options& options);
    void run(ConsumerContext& ctx, NodeRef& producer) override;
};

/**
 * @brief Sum of the checksums of the leaves under a container.
 *
 * @param container The container to traverse.
 * @return The sum, in 64 bits.
 *
 * @throws std::invalid_argument If `container` is not a container.
 */
std::uint64_t sum_leaf_checksums(NodeRef& container);

/**
 * @brief Registers `crc`, `grep`, `sort`, `reverse`, `copy` and `sum_checksums`.
 *
 * @param registry The registry to add to.
 */
void register_builtin_applications(ApplicationRegistry& registry);

}  // namespace dfms
