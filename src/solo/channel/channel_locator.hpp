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

#include "solo/channel/channel_fwd.hpp"

namespace solo::channel
{

// Types.

/**
 * Computes the well-known channel path for a given user: `<dir>/<prefix>-<user name>`, by default
 * `/tmp/solo-play-fifo-<user name>`.
 *
 * The result is a pure function of the directory, the prefix, and the user name; so repeat invocations by the same
 * user find the same channel, and different users never share one.  If the user name cannot be determined, that
 * is an error; there is no fallback name.
 *
 * The directory and prefix are configurable only so that tests can relocate the channel; production code uses
 * the defaults.
 */
class Channel_locator
{
public:
  // Constants.

  /// Default value for dir().
  static const fs::path S_DEFAULT_DIR;

  /// Default value for prefix().
  static const std::string S_DEFAULT_PREFIX;

  // Constructors/destructor.

  /**
   * Constructs the locator.
   *
   * @param dir
   *        Directory in which channels live.  Should be absolute.
   * @param prefix
   *        Fixed prefix of the channel's file name; the user name and a `-` separator follow it.
   */
  explicit Channel_locator(const fs::path& dir = S_DEFAULT_DIR, const std::string& prefix = S_DEFAULT_PREFIX);

  // Methods.

  /**
   * Returns the channel path for the user identified by `creds.user_id()`.
   *
   * @param creds
   *        Credentials whose user_id() is of interest.  PID and GID are ignored.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see util::Process_credentials::user_name(); plus error::Code::S_USER_IDENTITY_UNKNOWN if the user name
   *        is not usable as a single file name component (contains `/`, or is `.` or `..`).
   * @return The path if no #Error_code is emitted.  Else empty path.
   */
  fs::path channel_path(const util::Process_credentials& creds, Error_code* err_code = 0) const;

  /**
   * Same as channel_path(), for the calling process's effective user.
   *
   * @param err_code
   *        See channel_path().
   * @return See channel_path().
   */
  fs::path own_channel_path(Error_code* err_code = 0) const;

  /**
   * Directory in which channels live.
   * @return See above.
   */
  const fs::path& dir() const;

  /**
   * Fixed prefix of the channel's file name.
   * @return See above.
   */
  const std::string& prefix() const;

private:
  // Data.

  /// See dir().
  fs::path m_dir;

  /// See prefix().
  std::string m_prefix;
}; // class Channel_locator

} // namespace solo::channel
