/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

#include <dfms/discovery/address_book.hpp>
#include <dfms/error.hpp>

namespace dfms {

namespace {

constexpr char const* entry_suffix = ".addr";

void check_manager_id(ManagerID const& manager_id) {
    DFMS_EXPECTS(
        !manager_id.empty()
            && std::ranges::all_of(
                manager_id,
                [](char c) {
                    return std::isalnum(static_cast<unsigned char>(c)) || c == '_'
                           || c == '-' || c == '.';
                }
            ),
        "invalid manager id \"" + manager_id + "\"",
        std::invalid_argument
    );
}

}  // namespace

void InMemoryAddressBook::publish(ManagerID const& manager_id, Rank rank) {
    check_manager_id(manager_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[manager_id] = rank;
    }
    cv_.notify_all();
}

Rank InMemoryAddressBook::lookup(ManagerID const& manager_id, Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    DFMS_EXPECTS(
        cv_.wait_for(lock, timeout, [&] { return entries_.contains(manager_id); }),
        "manager " + manager_id + " was not published",
        std::out_of_range
    );
    return entries_.at(manager_id);
}

std::map<ManagerID, Rank> InMemoryAddressBook::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

FileAddressBook::FileAddressBook(std::filesystem::path directory)
    : directory_{std::move(directory)} {
    std::filesystem::create_directories(directory_);
}

std::filesystem::path FileAddressBook::entry_path(ManagerID const& manager_id) const {
    return directory_ / (manager_id + entry_suffix);
}

std::optional<Rank> FileAddressBook::read_entry(std::filesystem::path const& path) {
    std::ifstream in{path};
    Rank rank;
    if (!(in >> rank)) {
        return std::nullopt;
    }
    return rank;
}

void FileAddressBook::publish(ManagerID const& manager_id, Rank rank) {
    check_manager_id(manager_id);
    auto const target = entry_path(manager_id);
    auto tmp = target;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out{tmp, std::ios::trunc};
        out << rank << '\n';
        out.close();
        DFMS_EXPECTS(
            !out.fail(), "cannot write " + tmp.string(), std::runtime_error
        );
    }
    std::filesystem::rename(tmp, target);
}

Rank FileAddressBook::lookup(ManagerID const& manager_id, Duration timeout) {
    check_manager_id(manager_id);
    auto const path = entry_path(manager_id);
    auto const deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout);
    Duration backoff{0.001};
    for (;;) {
        if (auto rank = read_entry(path)) {
            return *rank;
        }
        DFMS_EXPECTS(
            Clock::now() < deadline,
            "manager " + manager_id + " was not published in " + directory_.string(),
            std::out_of_range
        );
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, Duration{0.5});
    }
}

std::map<ManagerID, Rank> FileAddressBook::entries() const {
    std::map<ManagerID, Rank> ret;
    for (auto const& entry : std::filesystem::directory_iterator(directory_)) {
        auto const& path = entry.path();
        if (!entry.is_regular_file() || path.extension() != entry_suffix) {
            continue;
        }
        if (auto rank = read_entry(path)) {
            ret.emplace(path.stem().string(), *rank);
        }
    }
    return ret;
}

}  // namespace dfms
