/* Flow-Shuffle: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "shuffle/common.hpp"

/**
 * Namespace containing the shuffle::transport module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * shuffle::transport reports are system errors and would not draw from this set of codes/messages but rather
 * from `boost::asio::error` or `boost::system::errc` (e.g., `connection_reset`, `connection_refused`, `eof`).
 * Such mixing is normal in boost.system.
 *
 * The shuffle::fetch module reuses this code set; it adds no codes of its own beyond
 * Code::S_FETCH_START_FAILED which is declared here so that is_transient() can classify it together with the rest.
 *
 * @internal
 *
 * This file and error.cpp are standard boiler-plate modeled on Flow's `flow::net_flow::error`.
 */
namespace shuffle::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by shuffle::transport and shuffle::fetch
 * functions/methods *outside of* system-triggered errors such as `boost::asio::error::connection_reset`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp’s Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's Category::code_symbol().
 * This string must be identical to the symbol, minus the `S_`; e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 *
 * When you add a value to this `enum`, decide whether it is transient and update is_transient() accordingly.
 *
 * If, when adding a new revision of the code, you add a value to this `enum`, add it to the end, but ahead of
 * Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Connection closed (gracefully or otherwise) before the request could complete.
  S_CONNECTION_CLOSED = S_CODE_LOWEST_INT_VALUE,

  /**
   * Connection saw neither reads nor writes for longer than the configured connection timeout while requests were
   * outstanding; it was presumed dead and closed.
   */
  S_CONNECTION_IDLE_TIMEOUT,

  /// Connection could not be established within the configured connection timeout.
  S_CONNECT_TIMEOUT,

  /// Incoming frame header specified a length below the minimum or above the maximum; the connection must close.
  S_FRAME_INVALID,

  /// Incoming frame could not be decoded into a message (truncated field or unknown message type).
  S_MESSAGE_DECODE_FAILED,

  /// Opposing side reported that it failed to serve the request; details were logged on receipt.
  S_REMOTE_REQUEST_FAILED,

  /// Block store does not contain a block with the requested ID.
  S_BLOCK_NOT_FOUND,

  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT,

  /// A configuration value could not be parsed or is out of range.
  S_CONFIG_INVALID_VALUE,

  /// Block fetch starter threw an exception carrying no system error code; its message was logged.
  S_FETCH_START_FAILED,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// The RPC handler does not support this kind of request.
  S_RPC_HANDLER_UNSUPPORTED,

  /// Message would encode to a frame larger than the maximum frame size the opposing side accepts.
  S_MESSAGE_TOO_LARGE,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Returns `true` if and only if the given error belongs to the I/O class -- an error likely due to transient
 * network conditions and hence worth retrying -- as opposed to a permanent, logical error.
 *
 * Transient are:
 *   - Any error in the system or generic category (e.g., `connection_reset`, `connection_refused`, `broken_pipe`);
 *     and any error in a boost.asio-specific category (e.g., `boost::asio::error::eof`, `host_not_found`).
 *   - Code::S_CONNECTION_CLOSED, Code::S_CONNECTION_IDLE_TIMEOUT, Code::S_CONNECT_TIMEOUT.
 *
 * Everything else, including success (falsy `err_code`), is not transient.
 *
 * @param err_code
 *        Any error code.
 * @return See above.
 */
bool is_transient(const Error_code& err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "INVALID_ARGUMENT" (or "invalid_argument" or "Invalid_argument" or...) for Code::S_INVALID_ARGUMENT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream, e.g., Code::S_INVALID_ARGUMENT =>
 * `"INVALID_ARGUMENT"`.  The output string is compatible with the reverse `istream>>` operator.
 * To print an #Error_code storing a Code do the standard thing instead: output the #Error_code itself plus
 * its `.message()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace shuffle::transport::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system allows `enum` `Code` to be converted to `Error_code`;
 * this is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::shuffle::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
