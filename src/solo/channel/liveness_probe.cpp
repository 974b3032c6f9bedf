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
#include "solo/channel/liveness_probe.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <fcntl.h>

namespace solo::channel
{

// Implementations.

Probe_result probe_receiver(flow::log::Logger* logger_ptr, const fs::path& channel_path,
                            util::Native_handle* handle, Error_code* err_code)
{
  using util::Native_handle;
  using boost::system::system_category;
  namespace errc = boost::system::errc;
  using ::open;
  // using ::O_WRONLY; // A macro apparently.
  // using ::errno; // It's a macro apparently.

  Probe_result result = Probe_result::S_ABSENT;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Probe_result
           { return probe_receiver(logger_ptr, channel_path, handle, actual_err_code); },
         &result, err_code, "channel::probe_receiver()"))
  {
    return result;
  }
  // else

  assert(handle && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHANNEL);

  // No O_CREAT: creating the channel is provision_channel()'s job, and it must do it from scratch.
  Native_handle probe(open(channel_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC));
  if (!probe.null())
  {
    FLOW_LOG_INFO("Channel [" << channel_path << "]: Probe opened it for writing as [" << probe << "]; "
                  "someone is reading it.  Trust not yet established.");
    *handle = std::move(probe);
    err_code->clear();
    return Probe_result::S_LIVE_RECEIVER;
  }
  // else

  const Error_code sys_err_code(errno, system_category());
  if (sys_err_code == errc::no_such_device_or_address) // ENXIO.
  {
    FLOW_LOG_INFO("Channel [" << channel_path << "]: Probe found it present but without a reader.");
    err_code->clear();
    return Probe_result::S_NO_READER;
  }
  // else
  if (sys_err_code == errc::no_such_file_or_directory)
  {
    FLOW_LOG_INFO("Channel [" << channel_path << "]: Probe found nothing there.");
    err_code->clear();
    return Probe_result::S_ABSENT;
  }
  // else

  FLOW_LOG_WARNING("Channel [" << channel_path << "]: Probe failed unexpectedly; details follow.");
  FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  *err_code = sys_err_code;
  return Probe_result::S_ABSENT;
} // probe_receiver()

std::ostream& operator<<(std::ostream& os, Probe_result val)
{
  switch (val)
  {
  case Probe_result::S_LIVE_RECEIVER:
    return os << "LIVE_RECEIVER";
  case Probe_result::S_NO_READER:
    return os << "NO_READER";
  case Probe_result::S_ABSENT:
    return os << "ABSENT";
  }
  assert(false);
  return os;
}

} // namespace solo::channel
