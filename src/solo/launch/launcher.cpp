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
#include "solo/launch/launcher.hpp"
#include "solo/launch/receiver_launcher.hpp"
#include "solo/channel/liveness_probe.hpp"
#include "solo/channel/trust_validator.hpp"
#include "solo/channel/command_encoder.hpp"
#include "solo/channel/channel_writer.hpp"
#include "solo/channel/channel_provisioner.hpp"
#include "solo/util/process_credentials.hpp"
#include "solo/util/native_handle.hpp"
#include "solo/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <algorithm>

namespace solo::launch
{

// Launcher implementations.

Launcher::Launcher(flow::log::Logger* logger_ptr, const Launcher_config& config,
                   const channel::Channel_locator& locator) :
  flow::log::Log_context(logger_ptr, Log_component::S_LAUNCH),
  m_config(config),
  m_locator(locator),
  m_outcome(Outcome::S_NONE)
{
  FLOW_LOG_TRACE("Launcher [" << this << "]: Created with config [" << m_config << "]; channel dir "
                 "[" << m_locator.dir() << "], prefix [" << m_locator.prefix() << "].");
}

int Launcher::run(const std::vector<std::string>& args, Error_code* err_code)
{
  using channel::Probe_result;
  using util::Native_handle;
  using util::normalize_file_args;
  using std::any_of;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(int, Launcher::run, flow::util::bind_ns::cref(args), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  constexpr int BAD_EXIT = 1;

  m_outcome = Outcome::S_NONE;
  m_channel_path.clear();

  if (args.empty() || any_of(args.begin(), args.end(), [](const std::string& arg) { return arg.empty(); }))
  {
    FLOW_LOG_WARNING("Launcher [" << this << "]: No files given, or an empty one; nothing to do.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return BAD_EXIT;
  }
  // else

  const auto entries = normalize_file_args(args, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Launcher [" << this << "]: Cannot make file arguments absolute (working directory gone?): "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return BAD_EXIT;
  }
  // else

  m_channel_path = m_locator.own_channel_path(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Launcher [" << this << "]: Cannot determine channel path: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return BAD_EXIT;
  }
  // else

  FLOW_LOG_INFO("Launcher [" << this << "]: [" << entries.size() << "] file entries; channel "
                "[" << m_channel_path << "].");

  Native_handle handle;
  const auto probe_result = channel::probe_receiver(get_logger(), m_channel_path, &handle, err_code);
  if (*err_code)
  {
    return BAD_EXIT; // It logged.
  }
  // else

  if (probe_result == Probe_result::S_LIVE_RECEIVER)
  {
    hand_off(std::move(handle), entries, err_code);
    if (*err_code)
    {
      return BAD_EXIT; // It logged.
    }
    // else
    m_outcome = Outcome::S_HANDED_OFF;
    return 0;
  }
  // else

  FLOW_LOG_INFO("Launcher [" << this << "]: No receiver (probe said [" << probe_result << "]); will launch one.");
  return provision_and_launch(entries, err_code);
} // Launcher::run()

void Launcher::hand_off(util::Native_handle&& handle, const std::vector<std::string>& entries, Error_code* err_code)
{
  using util::Process_credentials;

  assert(err_code);

  channel::validate_channel_trust(get_logger(), handle, Process_credentials::own_user_id(), err_code);
  if (*err_code)
  {
    return; // It logged.  handle closes itself; nothing was written.
  }
  // else

  channel::write_commands(get_logger(), std::move(handle), channel::encode_loadfile_batch(entries), err_code);
  // It logged either way.
}

int Launcher::provision_and_launch(const std::vector<std::string>& entries, Error_code* err_code)
{
  constexpr int BAD_EXIT = 1;

  assert(err_code);

  channel::provision_channel(get_logger(), m_channel_path, err_code);
  if (*err_code)
  {
    return BAD_EXIT; // It logged.
  }
  // else

  Receiver_launcher receiver_launcher(get_logger(), m_config);
  const int exit_code = receiver_launcher.run(m_channel_path, entries, err_code);
  if ((!*err_code) || (*err_code == error::Code::S_RECEIVER_EXITED_NON_ZERO)
      || (*err_code == error::Code::S_RECEIVER_KILLED_BY_SIGNAL))
  {
    // The receiver did run, whatever its fate.
    m_outcome = Outcome::S_LAUNCHED;
  }
  return exit_code;
} // Launcher::provision_and_launch()

Launcher::Outcome Launcher::outcome() const
{
  return m_outcome;
}

const fs::path& Launcher::channel_path() const
{
  return m_channel_path;
}

std::ostream& operator<<(std::ostream& os, Launcher::Outcome val)
{
  switch (val)
  {
  case Launcher::Outcome::S_NONE:
    return os << "NONE";
  case Launcher::Outcome::S_HANDED_OFF:
    return os << "HANDED_OFF";
  case Launcher::Outcome::S_LAUNCHED:
    return os << "LAUNCHED";
  }
  assert(false);
  return os;
}

} // namespace solo::launch
