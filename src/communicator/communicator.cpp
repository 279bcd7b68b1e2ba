/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>
#include <stdexcept>

#include <dfms/communicator/communicator.hpp>

namespace dfms {

namespace detail {

Communicator::Logger::LOG_LEVEL level_from_string(std::string const& str) {
    auto trimmed = to_upper(trim(str));
    for (std::uint32_t i = 0; i < Communicator::Logger::LOG_LEVEL_NAMES.size(); ++i) {
        auto level = static_cast<Communicator::Logger::LOG_LEVEL>(i);
        if (trimmed == Communicator::Logger::level_name(level)) {
            return level;
        }
    }
    std::stringstream ss;
    ss << "DFMS_LOG_LEVEL - unknown value: \"" << trimmed << "\", valid choices: { ";
    for (auto const& name : Communicator::Logger::LOG_LEVEL_NAMES) {
        ss << name << " ";
    }
    ss << "}";
    throw std::invalid_argument(ss.str());
}

}  // namespace detail

Communicator::Logger::Logger(Communicator* comm, config::Options options)
    : comm_{comm},
      level_{options.get<LOG_LEVEL>("log_level", [](std::string const& s) {
          return s.empty() ? LOG_LEVEL::WARN : detail::level_from_string(s);
      })} {}

}  // namespace dfms
