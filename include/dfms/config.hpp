/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <dfms/error.hpp>
#include <dfms/utils.hpp>

namespace dfms::config {

/**
 * @brief Type alias for a factory function that constructs options from strings.
 *
 * The factory receives the string representation of an option value and returns
 * an instance of the option type. If the option is not set, the factory is called
 * with an empty string and must return the default value.
 *
 * @tparam T The option type produced by the factory.
 */
template <typename T>
using OptionFactory = std::function<T(std::string const&)>;

/**
 * @brief Returns a factory that parses the option with `parse_string<T>` and falls
 * back to `default_value` when the option is unset.
 *
 * @tparam T The option type.
 * @param default_value The value used when the option is not set.
 * @return The option factory.
 */
template <typename T>
OptionFactory<T> default_factory(T default_value) {
    return [default_value = std::move(default_value)](std::string const& s) -> T {
        if (s.empty()) {
            return default_value;
        }
        return parse_string<T>(s);
    };
}

/**
 * @brief Configuration option value.
 *
 * The value is stored as a string until first accessed, at which point it is parsed
 * by the accessor's factory and cached as a `std::any`.
 */
class OptionValue {
  public:
    OptionValue() = default;

    /**
     * @brief Constructs an unparsed option from its string representation.
     *
     * @param value_as_string The string representation of the option value.
     */
    OptionValue(std::string value_as_string)
        : value_as_string_{std::move(value_as_string)} {}

    /**
     * @brief Retrieves the parsed value, empty if never accessed.
     *
     * @return The value as `std::any`.
     */
    [[nodiscard]] std::any const& get_value() const {
        return value_;
    }

    /**
     * @brief Retrieves the string representation of the value.
     *
     * @return The value as a string, empty if unset.
     */
    [[nodiscard]] std::string const& get_value_as_string() const {
        return value_as_string_;
    }

    /**
     * @brief Sets the parsed value, which can only happen once.
     *
     * @param value The parsed value.
     *
     * @throws std::invalid_argument if a value has already been set.
     */
    void set_value(std::any value) {
        DFMS_EXPECTS(!value_.has_value(), "value already set", std::invalid_argument);
        value_ = std::move(value);
    }

  private:
    std::any value_{};
    std::string value_as_string_{};
};

namespace detail {

/// @brief State shared between copies of an `Options` instance.
struct SharedOptions {
    mutable std::mutex mutex;  ///< Guards `options`.
    std::unordered_map<std::string, OptionValue> options;  ///< Shared options.
};

}  // namespace detail

/**
 * @brief Manages configuration options.
 *
 * Copies of an `Options` instance share the same underlying state, and all
 * accesses are thread-safe. Keys are trimmed and case-insensitive.
 */
class Options {
  public:
    /**
     * @brief Constructs from a map of option values.
     *
     * @param options Map of option keys to their values.
     *
     * @throws std::invalid_argument if keys are not case-insensitive unique.
     */
    Options(std::unordered_map<std::string, OptionValue> options = {});

    /**
     * @brief Constructs from a map of option values as strings.
     *
     * @param options_as_strings Map of option keys to their string representations.
     *
     * @throws std::invalid_argument if keys are not case-insensitive unique.
     */
    Options(std::unordered_map<std::string, std::string> options_as_strings);

    /**
     * @brief Inserts an option only if it is not already present.
     *
     * @param key The option key (trimmed and lower-cased).
     * @param option_as_string The string representation of the option value.
     * @return `true` if the option was inserted.
     */
    bool insert_if_absent(std::string const& key, std::string option_as_string);

    /**
     * @brief Inserts multiple options, each only if not already present.
     *
     * @param options_as_strings Map of option keys to their string representations.
     * @return Number of newly inserted options.
     */
    std::size_t insert_if_absent(
        std::unordered_map<std::string, std::string> options_as_strings
    );

    /**
     * @brief Retrieves a configuration option by key.
     *
     * On first access the option is parsed by `factory` and the result is cached.
     * Later accesses must use the same type.
     *
     * @tparam T The option type.
     * @param key The option key.
     * @param factory Function constructing the option from its string representation.
     * @return Reference to the option value.
     *
     * @throws std::invalid_argument if the stored option type does not match T.
     */
    template <typename T>
    T const& get(std::string const& key, OptionFactory<T> factory) {
        auto& shared = *shared_;
        std::lock_guard<std::mutex> lock(shared.mutex);
        auto& option = shared.options[to_lower(trim(key))];
        if (!option.get_value().has_value()) {
            option.set_value(std::make_any<T>(factory(option.get_value_as_string())));
        }
        try {
            return std::any_cast<T const&>(option.get_value());
        } catch (std::bad_any_cast const&) {
            DFMS_FAIL(
                "accessing option \"" + key + "\" with incompatible template type",
                std::invalid_argument
            );
        }
    }

    /**
     * @brief Retrieves all option values as strings.
     *
     * @return A map of option keys to their string representations.
     */
    [[nodiscard]] std::unordered_map<std::string, std::string> get_strings() const;

    /**
     * @brief Serializes the options into a binary buffer.
     *
     * Layout: a prelude (magic `"DFMS"`, version, flags, reserved), the number of
     * entries, one key/value offset pair per entry, the key and value bytes sorted
     * by key, and a CRC-32 trailer over the data region.
     *
     * @return The serialized options.
     *
     * @throws std::invalid_argument if an option has already been accessed (parsed)
     * or if limits are exceeded.
     */
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    /**
     * @brief Deserializes a buffer produced by `serialize()`.
     *
     * @param buffer The serialized options.
     * @return The reconstructed options.
     *
     * @throws std::invalid_argument on a malformed buffer or checksum mismatch.
     * @throws std::out_of_range if offsets point outside the buffer.
     */
    [[nodiscard]] static Options deserialize(std::vector<std::uint8_t> const& buffer);

  private:
    std::shared_ptr<detail::SharedOptions> shared_;
};

/**
 * @brief Populates a map with environment variables matching a pattern.
 *
 * The regex must contain exactly one capture group; the captured part becomes the
 * key. Existing keys in `output` are not overwritten.
 *
 * @param output The map to populate.
 * @param key_regex The pattern to match environment variable names.
 *
 * @throws std::invalid_argument If `key_regex` doesn't have exactly one capture group.
 */
void get_environment_variables(
    std::unordered_map<std::string, std::string>& output,
    std::string const& key_regex = "DFMS_(.*)"
);

/**
 * @brief Returns environment variables matching a pattern.
 *
 * @param key_regex The pattern to match environment variable names.
 * @return A map of captured keys to environment variable values.
 *
 * @throws std::invalid_argument If `key_regex` doesn't have exactly one capture group.
 */
std::unordered_map<std::string, std::string> get_environment_variables(
    std::string const& key_regex = "DFMS_(.*)"
);

}  // namespace dfms::config
