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
#include <ostream>

namespace solo::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "Solo relies on POSIX FIFO semantics and has been tested in Linux only.  Build in Linux only.");
#endif

// Types.

/**
 * An owning wrapper around a native handle (FD in POSIX parlance): it `close()`s the FD when destroyed
 * (unless null() or release()d).  It can be moved but not copied; a moved-from object becomes null().
 *
 * All FDs Solo opens end up here right after the `open()`-ish call succeeds, so that no error path
 * can leak one -- least of all into a receiver process we then spawn.  (They're also opened `O_CLOEXEC`,
 * for the same reason.)
 */
class Native_handle
{
public:
  // Types.

  /// The native handle type.
  using handle_t = int;

  // Constants.

  /**
   * The value for native_handle() such that `null() == true`; else it is `false`.
   * No valid handle ever equals this.
   */
  static const handle_t S_NULL_HANDLE;

  // Constructors/destructor.

  /**
   * Takes ownership of the given FD; also subsumes no-args construction to mean constructing an object with
   * `null() == true`.
   *
   * @param native_handle
   *        Payload.
   */
  explicit Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Constructs object taking over ownership of `src`'s FD, while making `src.null() == true`.
   * @param src
   *        Source object.
   */
  Native_handle(Native_handle&& src);

  /// Disallow copying: there would then be two owners of one FD.
  Native_handle(const Native_handle&) = delete;

  /// Closes the FD, unless null().  Any error from `close()` is ignored.
  ~Native_handle();

  // Methods.

  /**
   * Move assignment: closes our own FD (if any), then acts similarly to move ctor; no-op if `&src == this`.
   * @param src
   *        Source object which will be made `null() == true`.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /// Disallow copying.
  Native_handle& operator=(const Native_handle&) = delete;

  /**
   * The FD; or #S_NULL_HANDLE.  Ownership is retained by `*this`.
   * @return See above.
   */
  handle_t native_handle() const;

  /**
   * Returns `true` if and only if native_handle() equals #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;

  /**
   * Gives up ownership of the FD without closing it: returns it and makes `*this` null().
   * @return The formerly owned FD, or #S_NULL_HANDLE.
   */
  handle_t release();

  /// Closes the FD now, if any, and makes `*this` null().  Any error from `close()` is ignored.
  void close();

private:
  // Data.

  /// The native handle (possibly equal to #S_NULL_HANDLE).
  handle_t m_native_handle;
}; // class Native_handle

// Free functions.

/**
 * Prints string representation of the given Native_handle to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace solo::util
