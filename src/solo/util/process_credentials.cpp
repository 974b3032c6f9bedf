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
#include "solo/util/process_credentials.hpp"
#include "solo/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace solo::util
{

// Process_credentials implementations.

Process_credentials::Process_credentials(user_id_t user_id_init) :
  m_user_id(user_id_init)
{
  // That's it.
}

user_id_t Process_credentials::user_id() const
{
  return m_user_id;
}

std::string Process_credentials::user_name(Error_code* err_code) const
{
  using boost::system::system_category;
  using std::string;
  using std::vector;
  using ::getpwuid_r;
  using ::sysconf;
  // using ::errno; // It's a macro apparently.

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, Process_credentials::user_name, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  /* getpwuid() is not reentrant; use the _r variant.  The buffer size hint may be -1 (no hint); then start with
   * something reasonable and grow on ERANGE, which is the documented protocol. */
  const auto size_hint = sysconf(_SC_GETPW_R_SIZE_MAX);
  vector<char> buf((size_hint > 0) ? size_t(size_hint) : size_t(1024));

  ::passwd entry;
  ::passwd* result = nullptr;
  int rc;
  while ((rc = getpwuid_r(m_user_id, &entry, buf.data(), buf.size(), &result)) == ERANGE)
  {
    buf.resize(buf.size() * 2);
  }

  if (rc != 0)
  {
    *err_code = Error_code(rc, system_category());
    return string();
  }
  // else
  if ((!result) || (!result->pw_name) || (result->pw_name[0] == '\0'))
  {
    *err_code = error::Code::S_USER_IDENTITY_UNKNOWN;
    return string();
  }
  // else

  err_code->clear();
  return result->pw_name;
} // Process_credentials::user_name()

user_id_t Process_credentials::own_user_id() // Static.
{
  return ::geteuid();
}

Process_credentials Process_credentials::own_process_credentials() // Static.
{
  return Process_credentials(own_user_id());
}

} // namespace solo::util
