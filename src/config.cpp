/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <limits>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <unistd.h>

#include <dfms/checksum.hpp>
#include <dfms/config.hpp>

extern char** environ;

namespace dfms::config {

namespace {

constexpr std::size_t MAX_OPTIONS = 65536;
constexpr std::size_t MAX_KEY_LEN = 4 * 1024;
constexpr std::size_t MAX_VALUE_LEN = 1 * 1024 * 1024;
constexpr std::size_t MAX_TOTAL_SIZE = 64 * 1024 * 1024;

constexpr std::array<std::uint8_t, 4> MAGIC{{'D', 'F', 'M', 'S'}};
constexpr std::uint8_t FORMAT_VERSION = 1;
constexpr std::uint8_t FLAG_CRC_PRESENT = 0x01;
// MAGIC(4) + version(1) + flags(1) + reserved(2)
constexpr std::size_t PRELUDE_SIZE = 8;
constexpr std::size_t CRC_SIZE = 4;

std::uint64_t load_u64(std::uint8_t const* src) {
    std::uint64_t ret;
    std::memcpy(&ret, src, sizeof(ret));
    return ret;
}

void store_u64(std::uint8_t* dst, std::uint64_t value) {
    std::memcpy(dst, &value, sizeof(value));
}

std::unordered_map<std::string, OptionValue> from_options_as_strings(
    std::unordered_map<std::string, std::string>&& options_as_strings
) {
    std::unordered_map<std::string, OptionValue> ret;
    for (auto&& [key, val] : options_as_strings) {
        ret.emplace(key, OptionValue(std::move(val)));
    }
    return ret;
}

}  // namespace

Options::Options(std::unordered_map<std::string, OptionValue> options)
    : shared_{std::make_shared<detail::SharedOptions>()} {
    auto& opts = shared_->options;
    opts.reserve(options.size());
    for (auto&& [key, value] : options) {
        DFMS_EXPECTS(
            opts.emplace(to_lower(trim(key)), std::move(value)).second,
            "option keys must be case-insensitive",
            std::invalid_argument
        );
    }
}

Options::Options(std::unordered_map<std::string, std::string> options_as_strings)
    : Options(from_options_as_strings(std::move(options_as_strings))) {}

bool Options::insert_if_absent(std::string const& key, std::string option_as_string) {
    return insert_if_absent({{key, std::move(option_as_string)}}) == 1;
}

std::size_t Options::insert_if_absent(
    std::unordered_map<std::string, std::string> options_as_strings
) {
    auto& shared = *shared_;
    std::lock_guard<std::mutex> lock(shared.mutex);
    std::size_t ret = 0;
    for (auto&& [key, val] : options_as_strings) {
        if (shared.options.emplace(to_lower(trim(key)), OptionValue(std::move(val)))
                .second)
        {
            ++ret;
        }
    }
    return ret;
}

std::unordered_map<std::string, std::string> Options::get_strings() const {
    auto const& shared = *shared_;
    std::unordered_map<std::string, std::string> ret;
    std::lock_guard<std::mutex> lock(shared.mutex);
    for (auto const& [key, option] : shared.options) {
        ret[key] = option.get_value_as_string();
    }
    return ret;
}

std::vector<std::uint8_t> Options::serialize() const {
    std::vector<std::pair<std::string, std::string>> entries;
    {
        auto const& shared = *shared_;
        std::lock_guard<std::mutex> lock(shared.mutex);
        DFMS_EXPECTS(
            shared.options.size() <= MAX_OPTIONS,
            "too many options to serialize",
            std::invalid_argument
        );
        entries.reserve(shared.options.size());
        for (auto const& [key, option] : shared.options) {
            DFMS_EXPECTS(
                !option.get_value().has_value(),
                "cannot serialize already parsed (accessed) option values",
                std::invalid_argument
            );
            entries.emplace_back(key, option.get_value_as_string());
        }
    }
    // Sorted by key for a deterministic encoding.
    std::ranges::sort(entries, {}, &std::pair<std::string, std::string>::first);

    std::size_t data_size = 0;
    for (auto const& [key, value] : entries) {
        DFMS_EXPECTS(
            key.size() <= MAX_KEY_LEN,
            "key length exceeds maximum allowed size",
            std::invalid_argument
        );
        DFMS_EXPECTS(
            value.size() <= MAX_VALUE_LEN,
            "value length exceeds maximum allowed size",
            std::invalid_argument
        );
        data_size += key.size() + value.size();
    }
    std::size_t const header_size =
        PRELUDE_SIZE + sizeof(std::uint64_t) * (1 + 2 * entries.size());
    std::size_t const total_size = header_size + data_size + CRC_SIZE;
    DFMS_EXPECTS(
        total_size <= MAX_TOTAL_SIZE,
        "serialized buffer exceeds maximum allowed size",
        std::invalid_argument
    );

    std::vector<std::uint8_t> buffer(total_size);
    std::uint8_t* base = buffer.data();
    std::memcpy(base, MAGIC.data(), MAGIC.size());
    base[4] = FORMAT_VERSION;
    base[5] = FLAG_CRC_PRESENT;
    store_u64(base + PRELUDE_SIZE, entries.size());

    std::size_t offset_pos = PRELUDE_SIZE + sizeof(std::uint64_t);
    std::size_t data_pos = header_size;
    for (auto const& [key, value] : entries) {
        store_u64(base + offset_pos, data_pos);
        store_u64(base + offset_pos + sizeof(std::uint64_t), data_pos + key.size());
        offset_pos += 2 * sizeof(std::uint64_t);
        std::memcpy(base + data_pos, key.data(), key.size());
        std::memcpy(base + data_pos + key.size(), value.data(), value.size());
        data_pos += key.size() + value.size();
    }

    // CRC-32 over the data region, little endian.
    std::uint32_t const crc =
        crc32(std::span<std::uint8_t const>{base + header_size, data_size});
    for (std::size_t i = 0; i < CRC_SIZE; ++i) {
        base[data_pos + i] = static_cast<std::uint8_t>((crc >> (8 * i)) & 0xFFu);
    }
    return buffer;
}

Options Options::deserialize(std::vector<std::uint8_t> const& buffer) {
    std::uint8_t const* base = buffer.data();
    std::size_t const total_size = buffer.size();

    DFMS_EXPECTS(
        total_size >= PRELUDE_SIZE + sizeof(std::uint64_t)
            && std::memcmp(base, MAGIC.data(), MAGIC.size()) == 0,
        "buffer is too small to contain prelude and count",
        std::invalid_argument
    );
    DFMS_EXPECTS(
        base[4] == FORMAT_VERSION,
        "unsupported Options serialization version",
        std::invalid_argument
    );
    DFMS_EXPECTS(
        total_size <= MAX_TOTAL_SIZE,
        "serialized buffer exceeds maximum allowed size",
        std::invalid_argument
    );
    std::uint64_t const count = load_u64(base + PRELUDE_SIZE);
    DFMS_EXPECTS(
        count <= MAX_OPTIONS, "too many options in serialized buffer", std::invalid_argument
    );
    std::size_t const header_size =
        PRELUDE_SIZE + sizeof(std::uint64_t) * (1 + 2 * static_cast<std::size_t>(count));
    DFMS_EXPECTS(
        header_size <= total_size,
        "buffer is too small for header with declared count",
        std::invalid_argument
    );

    std::size_t data_limit = total_size;
    if ((base[5] & FLAG_CRC_PRESENT) != 0) {
        DFMS_EXPECTS(
            total_size >= header_size + CRC_SIZE,
            "buffer too small for CRC32 trailer",
            std::invalid_argument
        );
        data_limit = total_size - CRC_SIZE;
        std::uint32_t expected = 0;
        for (std::size_t i = 0; i < CRC_SIZE; ++i) {
            expected |= static_cast<std::uint32_t>(base[data_limit + i]) << (8 * i);
        }
        std::uint32_t const computed = crc32(
            std::span<std::uint8_t const>{base + header_size, data_limit - header_size}
        );
        DFMS_EXPECTS(
            expected == computed,
            "CRC32 mismatch in serialized buffer",
            std::invalid_argument
        );
    }

    std::unordered_map<std::string, std::string> ret;
    std::size_t offset_pos = PRELUDE_SIZE + sizeof(std::uint64_t);
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t const key_offset = load_u64(base + offset_pos);
        std::uint64_t const value_offset =
            load_u64(base + offset_pos + sizeof(std::uint64_t));
        offset_pos += 2 * sizeof(std::uint64_t);
        std::uint64_t const next_offset =
            (i + 1 < count) ? load_u64(base + offset_pos) : data_limit;

        DFMS_EXPECTS(
            key_offset >= header_size && key_offset < value_offset
                && value_offset <= next_offset && next_offset <= data_limit,
            "offsets exceed buffer size",
            std::out_of_range
        );
        ret.emplace(
            std::string(
                reinterpret_cast<char const*>(base + key_offset), value_offset - key_offset
            ),
            std::string(
                reinterpret_cast<char const*>(base + value_offset),
                next_offset - value_offset
            )
        );
    }
    return Options(std::move(ret));
}

void get_environment_variables(
    std::unordered_map<std::string, std::string>& output, std::string const& key_regex
) {
    DFMS_EXPECTS(
        std::regex(key_regex).mark_count() == 1,
        "key_regex must contain exactly one capture group (e.g., \"DFMS_(.*)\")",
        std::invalid_argument
    );
    std::regex name_pattern(
        "^" + key_regex + "$", std::regex::ECMAScript | std::regex::optimize
    );
    for (char** env = environ; *env != nullptr; ++env) {
        char const* cstr = *env;
        char const* eq = std::strchr(cstr, '=');
        if (!eq) {
            continue;
        }
        std::string name(cstr, static_cast<std::size_t>(eq - cstr));
        std::smatch match;
        if (std::regex_match(name, match, name_pattern) && match.size() == 2) {
            output.insert({match[1].str(), std::string(eq + 1)});
        }
    }
}

std::unordered_map<std::string, std::string> get_environment_variables(
    std::string const& key_regex
) {
    std::unordered_map<std::string, std::string> ret;
    get_environment_variables(ret, key_regex);
    return ret;
}

}  // namespace dfms::config
