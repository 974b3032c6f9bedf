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
#include "solo/channel/channel_provisioner.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <sys/stat.h>
#include <unistd.h>

namespace solo::channel
{

// Implementations.

void provision_channel(flow::log::Logger* logger_ptr, const fs::path& channel_path, Error_code* err_code)
{
  using util::set_resource_permissions;
  using util::OWNER_ONLY_PERMISSIONS;
  using boost::system::system_category;
  using ::unlink;
  using ::mkfifo;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { provision_channel(logger_ptr, channel_path, actual_err_code); },
         err_code, "channel::provision_channel()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHANNEL);

  const auto& perms = OWNER_ONLY_PERMISSIONS;

  FLOW_LOG_INFO("Channel [" << channel_path << "]: Provisioning: removing any existing object; then creating FIFO.");

  if (unlink(channel_path.c_str()) == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    if (sys_err_code != boost::system::errc::no_such_file_or_directory)
    {
      FLOW_LOG_WARNING("Channel [" << channel_path << "]: Could not remove existing object; details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return;
    }
    // else { Nothing there.  Fine. }
  }

  if (mkfifo(channel_path.c_str(), perms.get_permissions()) == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Channel [" << channel_path << "]: mkfifo() failed (if it already exists, someone else "
                     "just provisioned it); details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return;
  }
  // else

  // mkfifo() is subject to umask; this is not.  It logged on error.
  set_resource_permissions(logger_ptr, channel_path, perms, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Channel [" << channel_path << "]: Created FIFO with owner-only read-write access.");
} // provision_channel()

} // namespace solo::channel
