/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <bit>
#include <stdexcept>

#include <dfms/config.hpp>
#include <dfms/error.hpp>
#include <dfms/rpc/protocol.hpp>

namespace dfms::rpc {

namespace {

template <typename T>
void put_le(std::vector<std::uint8_t>& out, T value) {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
    }
}

template <typename T>
T get_le(std::span<std::uint8_t const> in) {
    T ret = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        ret |= static_cast<T>(static_cast<T>(in[i]) << (8 * i));
    }
    return ret;
}

template <typename E>
E checked_enum(std::uint8_t value, E last, char const* what) {
    DFMS_EXPECTS(
        value <= static_cast<std::uint8_t>(last),
        std::string{"malformed "} + what + ": " + std::to_string(value),
        std::out_of_range
    );
    return static_cast<E>(value);
}

}  // namespace

char const* to_string(Op op) noexcept {
    switch (op) {
    case Op::RESERVE:
        return "RESERVE";
    case Op::RELEASE:
        return "RELEASE";
    case Op::REGISTER_NODE:
        return "REGISTER_NODE";
    case Op::LINK:
        return "LINK";
    case Op::SHUTDOWN_SESSION:
        return "SHUTDOWN_SESSION";
    case Op::DELIVER_EVENT:
        return "DELIVER_EVENT";
    case Op::NODE_INFO:
        return "NODE_INFO";
    case Op::NODE_CHECKSUM:
        return "NODE_CHECKSUM";
    case Op::NODE_SIZE:
        return "NODE_SIZE";
    case Op::NODE_WRITE:
        return "NODE_WRITE";
    case Op::NODE_FINALIZE:
        return "NODE_FINALIZE";
    case Op::NODE_FAIL:
        return "NODE_FAIL";
    case Op::NODE_OPEN:
        return "NODE_OPEN";
    case Op::NODE_READ:
        return "NODE_READ";
    case Op::NODE_CLOSE:
        return "NODE_CLOSE";
    case Op::NODE_CHILDREN:
        return "NODE_CHILDREN";
    }
    return "UNKNOWN";
}

char const* to_string(Status status) noexcept {
    switch (status) {
    case Status::OK:
        return "OK";
    case Status::INVALID_STATE_TRANSITION:
        return "INVALID_STATE_TRANSITION";
    case Status::NODE_FAILED:
        return "NODE_FAILED";
    case Status::DUPLICATE_CONSUMER:
        return "DUPLICATE_CONSUMER";
    case Status::UNKNOWN_NODE:
        return "UNKNOWN_NODE";
    case Status::GRAPH_CONSTRUCTION_ERROR:
        return "GRAPH_CONSTRUCTION_ERROR";
    case Status::RESOURCE_UNAVAILABLE:
        return "RESOURCE_UNAVAILABLE";
    case Status::DELIVERY_ERROR:
        return "DELIVERY_ERROR";
    case Status::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    case Status::OUT_OF_RANGE:
        return "OUT_OF_RANGE";
    case Status::RUNTIME_ERROR:
        return "RUNTIME_ERROR";
    case Status::LOGIC_ERROR:
        return "LOGIC_ERROR";
    case Status::UNKNOWN_ERROR:
        return "UNKNOWN_ERROR";
    }
    return "UNKNOWN";
}

Status classify(std::exception const& e) noexcept {
    // Most derived first.
    if (dynamic_cast<node_failed const*>(&e) != nullptr) {
        return Status::NODE_FAILED;
    }
    if (dynamic_cast<invalid_state_transition const*>(&e) != nullptr) {
        return Status::INVALID_STATE_TRANSITION;
    }
    if (dynamic_cast<duplicate_consumer const*>(&e) != nullptr) {
        return Status::DUPLICATE_CONSUMER;
    }
    if (dynamic_cast<graph_construction_error const*>(&e) != nullptr) {
        return Status::GRAPH_CONSTRUCTION_ERROR;
    }
    if (dynamic_cast<unknown_node const*>(&e) != nullptr) {
        return Status::UNKNOWN_NODE;
    }
    if (dynamic_cast<resource_unavailable const*>(&e) != nullptr) {
        return Status::RESOURCE_UNAVAILABLE;
    }
    if (dynamic_cast<delivery_error const*>(&e) != nullptr) {
        return Status::DELIVERY_ERROR;
    }
    if (dynamic_cast<std::invalid_argument const*>(&e) != nullptr) {
        return Status::INVALID_ARGUMENT;
    }
    if (dynamic_cast<std::out_of_range const*>(&e) != nullptr) {
        return Status::OUT_OF_RANGE;
    }
    if (dynamic_cast<std::logic_error const*>(&e) != nullptr) {
        return Status::LOGIC_ERROR;
    }
    if (dynamic_cast<std::runtime_error const*>(&e) != nullptr) {
        return Status::RUNTIME_ERROR;
    }
    return Status::UNKNOWN_ERROR;
}

void raise(Status status, std::string const& message) {
    switch (status) {
    case Status::OK:
        break;
    case Status::INVALID_STATE_TRANSITION:
        throw invalid_state_transition(message);
    case Status::NODE_FAILED:
        throw node_failed(message);
    case Status::DUPLICATE_CONSUMER:
        throw duplicate_consumer(message);
    case Status::UNKNOWN_NODE:
        throw unknown_node(message);
    case Status::GRAPH_CONSTRUCTION_ERROR:
        throw graph_construction_error(message);
    case Status::RESOURCE_UNAVAILABLE:
        throw resource_unavailable(message);
    case Status::DELIVERY_ERROR:
        throw delivery_error(message);
    case Status::INVALID_ARGUMENT:
        throw std::invalid_argument(message);
    case Status::OUT_OF_RANGE:
        throw std::out_of_range(message);
    case Status::LOGIC_ERROR:
        throw std::logic_error(message);
    case Status::RUNTIME_ERROR:
    case Status::UNKNOWN_ERROR:
        throw std::runtime_error(message);
    }
    throw std::logic_error("raise() called with status OK: " + message);
}

std::unique_ptr<std::vector<std::uint8_t>> Message::encode() const {
    auto ret = std::make_unique<std::vector<std::uint8_t>>();
    ret->reserve(header_size + payload.size());
    put_le<std::uint64_t>(*ret, call_id);
    ret->push_back(static_cast<std::uint8_t>(op));
    ret->push_back(static_cast<std::uint8_t>(status));
    ret->push_back(0);
    ret->push_back(0);
    ret->insert(ret->end(), payload.begin(), payload.end());
    return ret;
}

Message Message::decode(std::vector<std::uint8_t> const& buffer) {
    DFMS_EXPECTS(
        buffer.size() >= header_size,
        "message of " + std::to_string(buffer.size()) + " bytes is too short",
        std::out_of_range
    );
    Message ret;
    ret.call_id = get_le<std::uint64_t>(buffer);
    DFMS_EXPECTS(
        buffer[8] >= static_cast<std::uint8_t>(Op::RESERVE),
        "malformed op: " + std::to_string(buffer[8]),
        std::out_of_range
    );
    ret.op = checked_enum(buffer[8], Op::NODE_CHILDREN, "op");
    ret.status = checked_enum(buffer[9], Status::UNKNOWN_ERROR, "status");
    ret.payload.assign(
        buffer.begin() + static_cast<std::ptrdiff_t>(header_size), buffer.end()
    );
    return ret;
}

Writer& Writer::u8(std::uint8_t value) {
    buffer_.push_back(value);
    return *this;
}

Writer& Writer::u32(std::uint32_t value) {
    put_le(buffer_, value);
    return *this;
}

Writer& Writer::u64(std::uint64_t value) {
    put_le(buffer_, value);
    return *this;
}

Writer& Writer::i32(std::int32_t value) {
    return u32(static_cast<std::uint32_t>(value));
}

Writer& Writer::f64(double value) {
    return u64(std::bit_cast<std::uint64_t>(value));
}

Writer& Writer::boolean(bool value) {
    return u8(value ? 1 : 0);
}

Writer& Writer::string(std::string const& value) {
    u64(value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

Writer& Writer::bytes(std::span<std::uint8_t const> value) {
    u64(value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

Writer& Writer::descriptor(NodeDescriptor const& value) {
    string(value.object_id);
    string(value.instance_id);
    u8(static_cast<std::uint8_t>(value.kind));
    u8(static_cast<std::uint8_t>(value.storage));
    boolean(value.expected_size.has_value());
    u64(value.expected_size.value_or(0));
    string(value.application);
    bytes(config::Options{value.params}.serialize());
    boolean(value.num_inputs.has_value());
    return u64(value.num_inputs.value_or(0));
}

Writer& Writer::edge(Edge const& value) {
    string(value.from);
    string(value.to);
    return u8(static_cast<std::uint8_t>(value.kind));
}

Writer& Writer::event(Event const& value) {
    string(value.source);
    u8(static_cast<std::uint8_t>(value.kind));
    return f64(value.timestamp);
}

Writer& Writer::address(NodeAddress const& value) {
    string(value.instance_id);
    return string(value.manager_id);
}

Writer& Writer::info(NodeInfo const& value) {
    address(value.address);
    u8(static_cast<std::uint8_t>(value.kind));
    return u8(static_cast<std::uint8_t>(value.state));
}

std::span<std::uint8_t const> Reader::take(std::size_t nbytes) {
    DFMS_EXPECTS(
        nbytes <= remaining(),
        "payload too short, need " + std::to_string(nbytes) + " bytes but "
            + std::to_string(remaining()) + " are left",
        std::out_of_range
    );
    auto ret = buffer_.subspan(offset_, nbytes);
    offset_ += nbytes;
    return ret;
}

std::uint8_t Reader::u8() {
    return take(1)[0];
}

std::uint32_t Reader::u32() {
    return get_le<std::uint32_t>(take(4));
}

std::uint64_t Reader::u64() {
    return get_le<std::uint64_t>(take(8));
}

std::int32_t Reader::i32() {
    return static_cast<std::int32_t>(u32());
}

double Reader::f64() {
    return std::bit_cast<double>(u64());
}

bool Reader::boolean() {
    return u8() != 0;
}

std::string Reader::string() {
    auto const data = take(u64());
    return std::string{data.begin(), data.end()};
}

std::vector<std::uint8_t> Reader::bytes() {
    auto const data = take(u64());
    return std::vector<std::uint8_t>{data.begin(), data.end()};
}

NodeDescriptor Reader::descriptor() {
    NodeDescriptor ret;
    ret.object_id = string();
    ret.instance_id = string();
    ret.kind = checked_enum(u8(), NodeKind::CONSUMER, "node kind");
    ret.storage = checked_enum(u8(), StorageKind::FILE, "storage kind");
    bool const has_expected_size = boolean();
    auto const expected_size = u64();
    if (has_expected_size) {
        ret.expected_size = expected_size;
    }
    ret.application = string();
    ret.params = config::Options::deserialize(bytes()).get_strings();
    bool const has_num_inputs = boolean();
    auto const num_inputs = u64();
    if (has_num_inputs) {
        ret.num_inputs = num_inputs;
    }
    return ret;
}

Edge Reader::edge() {
    Edge ret;
    ret.from = string();
    ret.to = string();
    ret.kind = checked_enum(u8(), EdgeKind::CHILD, "edge kind");
    return ret;
}

Event Reader::event() {
    Event ret;
    ret.source = string();
    ret.kind = checked_enum(u8(), EventKind::ERROR, "event kind");
    ret.timestamp = f64();
    return ret;
}

NodeAddress Reader::address() {
    NodeAddress ret;
    ret.instance_id = string();
    ret.manager_id = string();
    return ret;
}

NodeInfo Reader::info() {
    NodeInfo ret;
    ret.address = address();
    ret.kind = checked_enum(u8(), NodeKind::CONSUMER, "node kind");
    ret.state = checked_enum(u8(), NodeState::EXPIRED, "node state");
    return ret;
}

}  // namespace dfms::rpc
