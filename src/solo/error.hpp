/* Flow-IPC: Core
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

#include "solo/common.hpp"

/**
 * Namespace containing Solo's extension of boost.system error conventions, so that its APIs
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * Solo might report are system errors (e.g., from a failed `open()` or `mkfifo()`) and would not draw from this
 * set of codes/messages but rather from `boost::system::errc`.  Such mixing is normal in boost.system.
 *
 * In terms of the failure taxonomy of the launcher:
 *   - *configuration* error: Code::S_USER_IDENTITY_UNKNOWN, Code::S_INVALID_ARGUMENT;
 *   - *I/O* error: any system-category code;
 *   - *security* error: Code::S_CHANNEL_NOT_FIFO, Code::S_CHANNEL_PERMISSIONS_TOO_OPEN,
 *     Code::S_CHANNEL_OWNER_MISMATCH (see is_security_error());
 *   - *receiver exit*: Code::S_RECEIVER_EXITED_NON_ZERO, Code::S_RECEIVER_KILLED_BY_SIGNAL.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 *
 * @internal
 *
 * This file and error.cpp are standard boiler-plate, following Flow's and ipc::transport's convention.
 */
namespace solo::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by Solo functions/methods *outside of*
 * system-triggered errors such as `boost::system::errc::permission_denied`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 *
 * Add new values at the end, but ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Unable to determine the invoking user's name; refusing to fall back to a shared or guessable channel name.
  S_USER_IDENTITY_UNKNOWN = S_CODE_LOWEST_INT_VALUE,

  /// Channel failed trust validation: the object at the channel path is not a named pipe.
  S_CHANNEL_NOT_FIFO,

  /// Channel failed trust validation: the channel grants read or write permission to group or others.
  S_CHANNEL_PERMISSIONS_TOO_OPEN,

  /// Channel failed trust validation: the channel is not owned by the invoking user.
  S_CHANNEL_OWNER_MISMATCH,

  /// The newly launched receiver process exited with a non-zero exit code.
  S_RECEIVER_EXITED_NON_ZERO,

  /// The newly launched receiver process was terminated by a signal.
  S_RECEIVER_KILLED_BY_SIGNAL,

  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT,

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
 * Returns `true` if and only if the given #Error_code is one of the channel trust validation failures
 * (Code::S_CHANNEL_NOT_FIFO, Code::S_CHANNEL_PERMISSIONS_TOO_OPEN, Code::S_CHANNEL_OWNER_MISMATCH).
 * Callers reporting such an error to a user should say as little as possible about which check failed.
 *
 * @param err_code
 *        Any #Error_code, including success or one from another category.
 * @return See above.
 */
bool is_security_error(const Error_code& err_code);

/**
 * Deserializes an error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If none is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "CHANNEL_NOT_FIFO" (or "channel_not_fifo" or...) for Code::S_CHANNEL_NOT_FIFO.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes an error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  E.g., Code::S_CHANNEL_NOT_FIFO => `"CHANNEL_NOT_FIFO"`.
 *
 * When printing an #Error_code storing a Code, continue to do the standard thing: output the #Error_code itself
 * plus its `.message()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace solo::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system authorizes making `enum` `Code` convertible to `Error_code`.
 * This is the offical way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::solo::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
