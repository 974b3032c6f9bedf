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
#include "solo/util/native_handle.hpp"
#include <unistd.h>
#include <utility>

namespace solo::util
{

// Static initializers.

// Reminder: We've assured via static_assert() that this is being built in POSIX.
const Native_handle::handle_t Native_handle::S_NULL_HANDLE = -1;

// Native_handle implementations.

Native_handle::Native_handle(handle_t native_handle) :
  m_native_handle(native_handle)
{
  // Nope.
}

Native_handle::Native_handle(Native_handle&& src) :
  m_native_handle(S_NULL_HANDLE)
{
  operator=(std::move(src));
}

Native_handle::~Native_handle()
{
  close();
}

Native_handle& Native_handle::operator=(Native_handle&& src)
{
  if (&src != this)
  {
    close();
    m_native_handle = src.release();
  }
  return *this;
}

Native_handle::handle_t Native_handle::native_handle() const
{
  return m_native_handle;
}

bool Native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

Native_handle::handle_t Native_handle::release()
{
  using std::swap;

  handle_t released = S_NULL_HANDLE;
  swap(released, m_native_handle);
  return released;
}

void Native_handle::close()
{
  if (!null())
  {
    /* Disregard any error.  In Linux, by the way, the FD is released even if ::close() reports EINTR; so
     * retrying would be wrong. */
    ::close(release());
  }
}

std::ostream& operator<<(std::ostream& os, const Native_handle& val)
{
  os << "native_hndl[";
  if (val.null())
  {
    os << "NONE";
  }
  else
  {
    os << val.native_handle();
  }
  return os << ']';
}

} // namespace solo::util
