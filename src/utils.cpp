/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include <dfms/utils.hpp>

namespace dfms {

std::string trim(std::string const& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto const first = std::ranges::find_if_not(str, is_space);
    auto const last = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string to_lower(std::string str) {
    // The character must be cast to unsigned char to avoid UB in std::tolower().
    std::ranges::transform(str, str.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return str;
}

std::string to_upper(std::string str) {
    std::ranges::transform(str, str.begin(), [](unsigned char c) {
        return std::toupper(c);
    });
    return str;
}

template <>
bool parse_string(std::string const& value) {
    auto const str = to_lower(trim(value));
    int number{0};
    auto const [end, ec] = std::from_chars(str.data(), str.data() + str.size(), number);
    if (ec == std::errc{} && end == str.data() + str.size() && !str.empty()) {
        return number != 0;
    }
    if (str == "true" || str == "on" || str == "yes") {
        return true;
    }
    if (str == "false" || str == "off" || str == "no") {
        return false;
    }
    throw std::invalid_argument("cannot parse \"" + value + "\" as a boolean");
}

template <>
std::string parse_string(std::string const& value) {
    return value;
}

}  // namespace dfms
