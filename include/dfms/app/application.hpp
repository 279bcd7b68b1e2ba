/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <dfms/config.hpp>

namespace dfms {

class ConsumerContext;
class NodeRef;

/**
 * @brief Application logic run by a consumer node.
 *
 * `run()` is called once for every producer that completes, with read access to that
 * producer's final content. Output goes to the consumer through the context. An
 * exception thrown by `run()` fails the consumer.
 */
class Application {
  public:
    virtual ~Application() noexcept = default;

    /**
     * @brief Consumes a completed producer.
     *
     * @param ctx The consuming node.
     * @param producer The completed producer.
     */
    virtual void run(ConsumerContext& ctx, NodeRef& producer) = 0;

    /**
     * @brief Name of the application.
     *
     * @return The name it is registered under.
     */
    [[nodiscard]] virtual std::string const& name() const noexcept = 0;
};

/**
 * @brief Creates applications by name.
 */
class ApplicationRegistry {
  public:
    /**
     * @brief Factory of an application, given the per-node options.
     */
    using Factory = std::function<std::unique_ptr<Application>(config::Options&)>;

    ApplicationRegistry() = default;

    /**
     * @brief A registry holding the built-in applications.
     *
     * @return The registry.
     */
    static ApplicationRegistry with_builtins();

    /**
     * @brief Registers an application factory.
     *
     * @param name The application name.
     * @param factory The factory.
     *
     * @throws std::invalid_argument If `name` is already registered.
     */
    void add(std::string const& name, Factory factory);

    /**
     * @brief Whether an application is registered.
     *
     * @param name The application name.
     * @return True if registered.
     */
    [[nodiscard]] bool contains(std::string const& name) const;

    /**
     * @brief Creates an application.
     *
     * @param name The application name.
     * @param options The per-node options passed to the factory.
     * @return The application.
     *
     * @throws std::invalid_argument If `name` is not registered.
     */
    [[nodiscard]] std::unique_ptr<Application> create(
        std::string const& name, config::Options& options
    ) const;

    /**
     * @brief The registered names, sorted.
     *
     * @return The names.
     */
    [[nodiscard]] std::vector<std::string> names() const;

  private:
    std::map<std::string, Factory> factories_;
};

}  // namespace dfms
