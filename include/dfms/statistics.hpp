/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

#include <dfms/config.hpp>
#include <dfms/utils.hpp>

namespace dfms {

/**
 * @brief Tracks statistics across dfms operations.
 *
 * Statistics are named counters with a running sum and an update count. All
 * operations are thread-safe, and a disabled instance turns every update into a
 * no-op.
 */
class Statistics {
  public:
    /**
     * @brief Constructs a Statistics object.
     *
     * @param enabled If false, the object is a no-op.
     */
    Statistics(bool enabled = true);

    /**
     * @brief Constructs a Statistics object enabled by the "statistics" option.
     *
     * @param options Configuration options.
     * @return The new statistics instance.
     */
    static std::shared_ptr<Statistics> from_options(config::Options options);

    ~Statistics() noexcept = default;
    Statistics(Statistics const&) = delete;
    Statistics& operator=(Statistics const&) = delete;

    /**
     * @brief Returns a shared pointer to a disabled (no-op) Statistics instance.
     *
     * @return A shared pointer to a Statistics object with statistics disabled.
     */
    static std::shared_ptr<Statistics> disabled();

    /**
     * @brief Checks if statistics is enabled.
     *
     * @return True if statistics is enabled, otherwise false.
     */
    bool enabled() const noexcept {
        return enabled_;
    }

    /**
     * @brief Generates a report of statistics in a formatted string.
     *
     * @param header The header of the report.
     * @return A string representing the formatted statistics report.
     */
    std::string report(std::string const& header = "Statistics:") const;

    /**
     * @brief Type alias for a statistics formatting function.
     *
     * The formatter receives the output stream, the update count and the running sum.
     */
    using Formatter = std::function<void(std::ostream&, std::size_t, double)>;

    /**
     * @brief Default formatter for statistics output (implements `Formatter`).
     *
     * @param os Output stream to write the formatted value to.
     * @param count Number of updates.
     * @param val Sum of all updates.
     */
    static void FormatterDefault(std::ostream& os, std::size_t count, double val);

    /**
     * @brief Represents a single tracked statistic.
     */
    class Stat {
      public:
        /**
         * @brief Constructs a Stat with a specified formatter.
         *
         * @param formatter Function used to format this statistic when reporting.
         */
        Stat(Formatter formatter) : formatter_{std::move(formatter)} {}

        /**
         * @brief Adds a value to this statistic.
         *
         * @param value The value to add.
         * @return The updated total value.
         */
        double add(double value) {
            ++count_;
            return value_ += value;
        }

        /**
         * @brief Returns the number of updates applied to this statistic.
         *
         * @return The number of times `add()` was called.
         */
        [[nodiscard]] std::size_t count() const noexcept {
            return count_;
        }

        /**
         * @brief Returns the total value of this statistic.
         *
         * @return The accumulated value.
         */
        [[nodiscard]] double value() const noexcept {
            return value_;
        }

        /**
         * @brief Returns the formatter used by this statistic.
         *
         * @return A const reference to the formatter function.
         */
        [[nodiscard]] Formatter const& formatter() const noexcept {
            return formatter_;
        }

      private:
        std::size_t count_{0};
        double value_{0};
        Formatter formatter_;
    };

    /**
     * @brief Retrieves a statistic by name.
     *
     * @param name Name of the statistic to retrieve.
     * @return A copy of the statistic.
     *
     * @throws std::out_of_range If the statistic does not exist.
     */
    Stat get_stat(std::string const& name) const;

    /**
     * @brief Adds a numeric value to the named statistic.
     *
     * Creates the statistic if it doesn't exist.
     *
     * @param name Name of the statistic.
     * @param value Value to add.
     * @param formatter Formatter used when the statistic is created.
     * @return Updated total value, or zero if disabled.
     */
    double add_stat(
        std::string const& name,
        double value,
        Formatter const& formatter = FormatterDefault
    );

    /**
     * @brief Adds a byte count to the named statistic.
     *
     * @param name Name of the statistic.
     * @param nbytes Number of bytes to add.
     * @return The updated byte total.
     */
    std::size_t add_bytes_stat(std::string const& name, std::size_t nbytes);

    /**
     * @brief Adds a duration to the named statistic.
     *
     * @param name Name of the statistic.
     * @param seconds Duration in seconds to add.
     * @return The updated total duration.
     */
    Duration add_duration_stat(std::string const& name, Duration seconds);

  private:
    mutable std::mutex mutex_;
    bool enabled_;
    std::map<std::string, Stat> stats_;
};

}  // namespace dfms
