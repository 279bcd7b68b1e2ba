/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>  // NOLINT(unused-includes)
#include <string>
#include <type_traits>

#include <dfms/utils.hpp>

namespace dfms {

/**
 * @brief Exception thrown when an operation is illegal in the current node state.
 *
 * @ingroup errors
 *
 * For example, writing to a node that is already COMPLETE.
 */
struct invalid_state_transition : public std::logic_error {
    using std::logic_error::logic_error;
};

/**
 * @brief Exception thrown when an operation is attempted on a node in ERROR state.
 *
 * @ingroup errors
 *
 * A failed node rejects every state changing operation, hence this is also an
 * `invalid_state_transition`.
 */
struct node_failed : public invalid_state_transition {
    using invalid_state_transition::invalid_state_transition;
};

/**
 * @brief Exception thrown when a consumer (or child) is registered twice on the same
 * node.
 *
 * @ingroup errors
 */
struct duplicate_consumer : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Exception thrown on lookup of a node that does not exist or has been torn
 * down.
 *
 * @ingroup errors
 */
struct unknown_node : public std::out_of_range {
    using std::out_of_range::out_of_range;
};

/**
 * @brief Exception thrown when a pipeline cannot be turned into a valid physical
 * dataflow graph (cycles, undeclared references, malformed stages).
 *
 * @ingroup errors
 */
struct graph_construction_error : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Exception thrown when a Node Manager cannot admit more nodes.
 *
 * @ingroup errors
 */
struct resource_unavailable : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception thrown when an event or a remote call could not be delivered.
 *
 * @ingroup errors
 */
struct delivery_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief Macro for checking (pre-)conditions that throws an exception when
 * a condition is violated.
 *
 * Defaults to throwing `std::logic_error`, but a custom exception may also be
 * specified.
 *
 * Example usage:
 * ```
 * // throws std::logic_error
 * DFMS_EXPECTS(p != nullptr, "Unexpected null pointer");
 *
 * // throws dfms::invalid_state_transition
 * DFMS_EXPECTS(state == NodeState::WRITING, "not writing", invalid_state_transition);
 * ```
 * @param ... This macro accepts either two or three arguments:
 *   - The first argument must be an expression that evaluates to true or
 *     false, and is the condition being checked.
 *   - The second argument is a string (literal or `std::string`) used to construct
 *     the `what` of the exception.
 *   - When given, the third argument is the exception to be thrown. When not
 *     specified, defaults to `std::logic_error`.
 *
 * @throw `_exception_type` if the condition evaluates to 0 (false).
 */
#define DFMS_EXPECTS(...) \
    GET_DFMS_EXPECTS_MACRO(__VA_ARGS__, DFMS_EXPECTS_3, DFMS_EXPECTS_2)(__VA_ARGS__)

#define GET_DFMS_EXPECTS_MACRO(_1, _2, _3, NAME, ...) NAME

#define DFMS_EXPECTS_3(_condition, _reason, _exception_type)                   \
    do {                                                                       \
        static_assert(std::is_base_of_v<std::exception, _exception_type>);     \
        if (!(_condition)) {                                                   \
            /*NOLINTNEXTLINE(bugprone-macro-parentheses)*/                     \
            throw _exception_type{                                             \
                std::string{"DFMS failure at: " __FILE__                       \
                            ":" DFMS_STRINGIFY(__LINE__) ": "}                 \
                + (_reason)                                                    \
            };                                                                 \
        }                                                                      \
    } while (0)

#define DFMS_EXPECTS_2(_condition, _reason) \
    DFMS_EXPECTS_3(_condition, _reason, std::logic_error)

/**
 * @brief Indicates that an erroneous code path has been taken.
 *
 * Example usage:
 * ```c++
 * // Throws `std::logic_error`
 * DFMS_FAIL("Unsupported code path");
 *
 * // Throws `dfms::unknown_node`
 * DFMS_FAIL("no such node: " + id, unknown_node);
 * ```
 *
 * @param ... This macro accepts either one or two arguments:
 *   - The first argument is a string used to construct the `what` of the exception.
 *   - When given, the second argument is the exception to be thrown. When not
 *     specified, defaults to `std::logic_error`.
 */
#define DFMS_FAIL(...) \
    GET_DFMS_FAIL_MACRO(__VA_ARGS__, DFMS_FAIL_2, DFMS_FAIL_1)(__VA_ARGS__)

#define GET_DFMS_FAIL_MACRO(_1, _2, NAME, ...) NAME

#define DFMS_FAIL_2(_what, _exception_type)                                      \
    /*NOLINTNEXTLINE(bugprone-macro-parentheses)*/                               \
    throw _exception_type {                                                      \
        std::string{"DFMS failure at: " __FILE__ ":" DFMS_STRINGIFY(__LINE__) ": "} \
            + (_what)                                                            \
    }

#define DFMS_FAIL_1(_what) DFMS_FAIL_2(_what, std::logic_error)

}  // namespace dfms
