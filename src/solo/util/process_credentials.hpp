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

#include "solo/util/util_fwd.hpp"

namespace solo::util
{

// Types.

/**
 * The credentials a process acts with, as far as the channel is concerned: its user ID (UID); plus the ability
 * to look up the user name corresponding to it.
 *
 * The UID here is always the *effective* one when obtained via own_process_credentials(): that's the one the
 * kernel consults when we `open()`, `mkfifo()`, etc.; and therefore the one that must own the channel.
 */
class Process_credentials
{
public:
  // Constructors/destructor.

  /**
   * Ctor that sets the value explicitly.
   * @param user_id_init
   *        See user_id().
   */
  explicit Process_credentials(user_id_t user_id_init);

  // Methods.

  /**
   * The user ID (UID).
   * @return See above.
   */
  user_id_t user_id() const;

  /**
   * Obtains, from the user database (`getpwuid_r()`), the login name of user_id().
   *
   * There is deliberately no fallback (e.g., to `$USER` or `"unknown"`): callers derive a security-relevant
   * resource name from this, and a guessable or shared name would be worse than failing.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_USER_IDENTITY_UNKNOWN (no such user, or the entry has an empty name);
   *        system error codes if the lookup itself failed (e.g., `ENOMEM`, `EIO`).
   * @return The user name if no #Error_code is emitted.  Else empty string.
   */
  std::string user_name(Error_code* err_code = 0) const;

  /**
   * Obtains the calling process's effective user_id().  This value can be changed via OS calls.
   * @return See above.
   */
  static user_id_t own_user_id();

  /**
   * Constructs and returns Process_credentials containing values pertaining to the calling process at this
   * time.
   *
   * @return `Process_credentials(own_user_id())`.
   */
  static Process_credentials own_process_credentials();

private:
  // Data.

  /// See user_id().
  user_id_t m_user_id;
}; // class Process_credentials

} // namespace solo::util
