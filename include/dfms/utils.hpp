/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <array>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dfms {

/// Alias for high-resolution clock from the chrono library.
using Clock = std::chrono::high_resolution_clock;
/// Alias for a duration type representing time in seconds as a double.
using Duration = std::chrono::duration<double>;

/**
 * @brief Converts the specified value to a string with the specified precision.
 *
 * @tparam T The type of the value to convert.
 * @param value The value to convert.
 * @param precision The precision to use.
 * @return A string representation of the value with the specified precision.
 */
template <typename T>
std::string to_precision(T value, int precision = 2) {
    std::stringstream ss;
    ss.precision(precision);
    ss << std::fixed;
    ss << value;
    return ss.str();
}

/**
 * @brief Format number of bytes to a human readable string representation.
 *
 * @param nbytes The number of bytes.
 * @param precision The precision to use.
 * @return A string representation of the byte size with the specified precision.
 */
std::string inline format_nbytes(double nbytes, int precision = 2) {
    constexpr std::array<const char*, 5> units = {" B", " KiB", " MiB", " GiB", " TiB"};
    double n = nbytes;
    for (auto const& unit : units) {
        if (std::abs(n) < 1024.0) {
            return to_precision(n, precision) + unit;
        }
        n /= 1024.0;
    }
    return to_precision(n, precision) + " PiB";
}

/**
 * @brief Format a time duration to a human readable string representation.
 *
 * @param seconds The time duration to format (in seconds).
 * @param precision The precision to use.
 * @return A string representation of the duration with the specified precision.
 */
std::string inline format_duration(double seconds, int precision = 2) {
    double sec = std::abs(seconds);
    if (sec < 1e-6) {
        return to_precision(seconds * 1e9, precision) + " ns";
    } else if (sec < 1e-3) {
        return to_precision(seconds * 1e6, precision) + " us";
    } else if (sec < 1) {
        return to_precision(seconds * 1e3, precision) + " ms";
    } else {
        return to_precision(seconds, precision) + " s";
    }
}

/**
 * @brief Extracts the key-value pair of `key` from a map.
 *
 * @tparam MapType The type of the map.
 * @param map The map from which to extract the key-value pair.
 * @param key The key to extract.
 * @return The extracted key-value pair.
 *
 * @throws std::out_of_range If the key is not found in the map.
 */
template <typename MapType>
std::pair<typename MapType::key_type, typename MapType::mapped_type> extract_item(
    MapType& map, typename MapType::key_type const& key
) {
    auto node = map.extract(key);
    if (!node) {
        throw std::out_of_range("Invalid key passed to extract");
    }
    return {std::move(node.key()), std::move(node.mapped())};
}

/**
 * @brief Extracts the value associated with `key` from a map.
 *
 * @tparam MapType The type of the map.
 * @param map The map from which to extract the value.
 * @param key The key to extract.
 * @return The extracted value.
 *
 * @throws std::out_of_range If the key is not found in the map.
 */
template <typename MapType>
typename MapType::mapped_type extract_value(
    MapType& map, typename MapType::key_type const& key
) {
    return std::move(extract_item(map, key).second);
}

/**
 * @brief Trims whitespace from both ends of the specified string.
 *
 * @param str The input string to be processed.
 * @return The trimmed string.
 */
std::string trim(std::string const& str);

/**
 * @brief Converts the specified string to lowercase.
 *
 * @param str The input string to be processed.
 * @return The string converted to lowercase.
 */
std::string to_lower(std::string str);

/**
 * @brief Converts the specified string to uppercase.
 *
 * @param str The input string to be processed.
 * @return The string converted to uppercase.
 */
std::string to_upper(std::string str);

/**
 * @brief Parses a string into a value of type T.
 *
 * @tparam T The type to parse into, must be stream extractable.
 * @param value The string to parse.
 * @return The parsed value.
 *
 * @throws std::invalid_argument If the string cannot be parsed.
 */
template <typename T>
T parse_string(std::string const& value) {
    std::stringstream sstream(value);
    T ret;
    sstream >> ret;
    if (sstream.fail()) {
        throw std::invalid_argument("cannot parse \"" + std::string{value} + "\"");
    }
    return ret;
}

/**
 * @brief Specialization of `parse_string` for boolean values.
 *
 * Accepts `true`, `false`, `on`, `off`, `yes`, `no` (case-insensitive) and integers.
 *
 * @param value String to convert to a boolean.
 * @return The corresponding boolean value.
 *
 * @throws std::invalid_argument If the string cannot be interpreted as a boolean.
 */
template <>
bool parse_string(std::string const& value);

/**
 * @brief Specialization of `parse_string` for strings, returns the value unchanged.
 *
 * @param value The string.
 * @return A copy of `value`, including any whitespace.
 */
template <>
std::string parse_string(std::string const& value);

// Macro to concatenate two tokens x and y.
#define DFMS_CONCAT_DETAIL_(x, y) x##y
#define DFMS_CONCAT(x, y) DFMS_CONCAT_DETAIL_(x, y)

// Stringify a macro argument.
#define DFMS_STRINGIFY_DETAIL_(x) #x
#define DFMS_STRINGIFY(x) DFMS_STRINGIFY_DETAIL_(x)

}  // namespace dfms
