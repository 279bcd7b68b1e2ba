/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <dfms/app/builtin.hpp>
#include <dfms/checksum.hpp>
#include <dfms/error.hpp>
#include <dfms/node/consumer_node.hpp>
#include <dfms/node/node_ref.hpp>

namespace dfms {

namespace {

// Splits after every '\n', each line keeps its terminator. A last line without
// terminator is kept as is.
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> ret;
    while (!text.empty()) {
        auto const pos = text.find('\n');
        auto const len = pos == std::string_view::npos ? text.size() : pos + 1;
        ret.push_back(text.substr(0, len));
        text.remove_prefix(len);
    }
    return ret;
}

}  // namespace

BuiltinApplication::BuiltinApplication(std::string name, config::Options& options)
    : name_{std::move(name)},
      chunk_size_{options.get<std::size_t>(
          "read_chunk_size", config::default_factory<std::size_t>(default_read_chunk_size)
      )} {
    DFMS_EXPECTS(
        chunk_size_ > 0, "read_chunk_size must be positive", std::invalid_argument
    );
}

CrcApplication::CrcApplication(config::Options& options)
    : BuiltinApplication{"crc", options} {}

void CrcApplication::run(ConsumerContext& ctx, NodeRef& producer) {
    std::uint32_t crc = 0;
    ScopedReader reader{producer};
    for (auto chunk = reader.read(chunk_size()); !chunk.empty();
         chunk = reader.read(chunk_size()))
    {
        crc = crc32(chunk, crc);
    }
    reader.close();
    ctx.write(std::to_string(crc));
}

GrepApplication::GrepApplication(config::Options& options)
    : BuiltinApplication{"grep", options},
      substring_{options.get<std::string>(
          "substring", config::default_factory<std::string>("")
      )} {}

void GrepApplication::run(ConsumerContext& ctx, NodeRef& producer) {
    auto const text = read_all_text(producer, chunk_size());
    std::string out;
    for (auto const& line : split_lines(text)) {
        if (line.find(substring_) != std::string_view::npos) {
            out.append(line);
        }
    }
    ctx.write(out);
}

SortApplication::SortApplication(config::Options& options)
    : BuiltinApplication{"sort", options} {}

void SortApplication::run(ConsumerContext& ctx, NodeRef& producer) {
    auto const text = read_all_text(producer, chunk_size());
    auto lines = split_lines(text);
    std::ranges::sort(lines);
    std::string out;
    out.reserve(text.size());
    for (auto const& line : lines) {
        out.append(line);
    }
    ctx.write(out);
}

ReverseApplication::ReverseApplication(config::Options& options)
    : BuiltinApplication{"reverse", options} {}

void ReverseApplication::run(ConsumerContext& ctx, NodeRef& producer) {
    auto const text = read_all_text(producer, chunk_size());
    std::string out;
    out.reserve(text.size());
    std::string token;
    for (char c : text) {
        if (c == ' ' || c == '\n') {
            out.append(token.rbegin(), token.rend());
            out.push_back(c);
            token.clear();
        } else {
            token.push_back(c);
        }
    }
    ctx.write(out);
}

CopyApplication::CopyApplication(config::Options& options)
    : BuiltinApplication{"copy", options} {}

void CopyApplication::run(ConsumerContext& ctx, NodeRef& producer) {
    ScopedReader reader{producer};
    for (auto chunk = reader.read(chunk_size()); !chunk.empty();
         chunk = reader.read(chunk_size()))
    {
        ctx.write(chunk);
    }
    reader.close();
}

std::uint64_t sum_leaf_checksums(NodeRef& container) {
    DFMS_EXPECTS(
        container.is_container(),
        container.instance_id() + " is not a container",
        std::invalid_argument
    );
    std::uint64_t ret = 0;
    for (auto const& child : container.children()) {
        if (child->is_container()) {
            ret += sum_leaf_checksums(*child);
        } else {
            ret += child->checksum();
        }
    }
    return ret;
}

SumChecksumsApplication::SumChecksumsApplication(config::Options& options)
    : BuiltinApplication{"sum_checksums", options} {}

void SumChecksumsApplication::run(ConsumerContext& ctx, NodeRef& producer) {
    ctx.write(std::to_string(sum_leaf_checksums(producer)));
}

void register_builtin_applications(ApplicationRegistry& registry) {
    registry.add("crc", [](config::Options& o) {
        return std::make_unique<CrcApplication>(o);
    });
    registry.add("grep", [](config::Options& o) {
        return std::make_unique<GrepApplication>(o);
    });
    registry.add("sort", [](config::Options& o) {
        return std::make_unique<SortApplication>(o);
    });
    registry.add("reverse", [](config::Options& o) {
        return std::make_unique<ReverseApplication>(o);
    });
    registry.add("copy", [](config::Options& o) {
        return std::make_unique<CopyApplication>(o);
    });
    registry.add("sum_checksums", [](config::Options& o) {
        return std::make_unique<SumChecksumsApplication>(o);
    });
}

}  // namespace dfms
