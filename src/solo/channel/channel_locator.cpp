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
#include "solo/channel/channel_locator.hpp"
#include "solo/util/process_credentials.hpp"
#include "solo/error.hpp"
#include <flow/error/error.hpp>

namespace solo::channel
{

// Static initializations.

const fs::path Channel_locator::S_DEFAULT_DIR = "/tmp";
const std::string Channel_locator::S_DEFAULT_PREFIX = "solo-play-fifo";

// Channel_locator implementations.

Channel_locator::Channel_locator(const fs::path& dir, const std::string& prefix) :
  m_dir(dir),
  m_prefix(prefix)
{
  // That's it.
}

fs::path Channel_locator::channel_path(const util::Process_credentials& creds, Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(fs::path, Channel_locator::channel_path, flow::util::bind_ns::cref(creds), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const string user_name = creds.user_name(err_code);
  if (*err_code)
  {
    return fs::path();
  }
  // else

  // The name must be exactly one path component, or the channel would end up somewhere other than m_dir.
  if ((user_name.find('/') != string::npos) || (user_name == ".") || (user_name == ".."))
  {
    *err_code = error::Code::S_USER_IDENTITY_UNKNOWN;
    return fs::path();
  }
  // else

  return m_dir / (m_prefix + '-' + user_name);
} // Channel_locator::channel_path()

fs::path Channel_locator::own_channel_path(Error_code* err_code) const
{
  return channel_path(util::Process_credentials::own_process_credentials(), err_code);
}

const fs::path& Channel_locator::dir() const
{
  return m_dir;
}

const std::string& Channel_locator::prefix() const
{
  return m_prefix;
}

} // namespace solo::channel
