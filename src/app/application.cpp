/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>

#include <dfms/app/application.hpp>
#include <dfms/app/builtin.hpp>
#include <dfms/error.hpp>

namespace dfms {

ApplicationRegistry ApplicationRegistry::with_builtins() {
    ApplicationRegistry ret;
    register_builtin_applications(ret);
    return ret;
}

void ApplicationRegistry::add(std::string const& name, Factory factory) {
    DFMS_EXPECTS(factory != nullptr, "factory cannot be empty", std::invalid_argument);
    DFMS_EXPECTS(
        factories_.emplace(name, std::move(factory)).second,
        "application \"" + name + "\" is already registered",
        std::invalid_argument
    );
}

bool ApplicationRegistry::contains(std::string const& name) const {
    return factories_.contains(name);
}

std::unique_ptr<Application> ApplicationRegistry::create(
    std::string const& name, config::Options& options
) const {
    auto it = factories_.find(name);
    DFMS_EXPECTS(
        it != factories_.end(),
        "unknown application \"" + name + "\"",
        std::invalid_argument
    );
    auto ret = it->second(options);
    DFMS_EXPECTS(
        ret != nullptr, "factory of \"" + name + "\" returned NULL", std::logic_error
    );
    return ret;
}

std::vector<std::string> ApplicationRegistry::names() const {
    std::vector<std::string> ret;
    ret.reserve(factories_.size());
    for (auto const& [name, _] : factories_) {
        ret.push_back(name);
    }
    return ret;
}

}  // namespace dfms
