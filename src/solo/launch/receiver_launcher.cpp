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
#include "solo/launch/receiver_launcher.hpp"
#include "solo/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/process/child.hpp>
#include <boost/process/args.hpp>
#include <boost/process/search_path.hpp>
#include <boost/algorithm/string/join.hpp>
#include <sys/wait.h>
#include <system_error>

namespace solo::launch
{

// Static initializations.

const std::vector<std::string> Receiver_launcher::S_FIXED_OPTS = { "--no-terminal", "--force-window" };
const std::string Receiver_launcher::S_INPUT_FILE_OPT_PREFIX = "--input-file=";
const std::string Receiver_launcher::S_END_OF_OPTS = "--";

// Receiver_launcher implementations.

Receiver_launcher::Receiver_launcher(flow::log::Logger* logger_ptr, const Launcher_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_LAUNCH),
  m_config(config)
{
  FLOW_LOG_TRACE("Receiver_launcher [" << this << "]: Created with config [" << m_config << "].");
}

std::vector<std::string> Receiver_launcher::receiver_args(const fs::path& channel_path,
                                                          const std::vector<std::string>& entries) const
{
  std::vector<std::string> args(S_FIXED_OPTS);
  args.reserve(S_FIXED_OPTS.size() + 2 + m_config.m_extra_opts.size() + entries.size());
  args.emplace_back(S_INPUT_FILE_OPT_PREFIX + channel_path.string());
  args.insert(args.end(), m_config.m_extra_opts.begin(), m_config.m_extra_opts.end());
  args.emplace_back(S_END_OF_OPTS);
  args.insert(args.end(), entries.begin(), entries.end());
  return args;
}

fs::path Receiver_launcher::resolve_executable(Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(fs::path, Receiver_launcher::resolve_executable, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_config.m_player.find('/') != std::string::npos)
  {
    err_code->clear();
    return fs::path(m_config.m_player);
  }
  // else

  const auto exec_path = boost::process::search_path(m_config.m_player);
  if (exec_path.empty())
  {
    FLOW_LOG_WARNING("Receiver_launcher [" << this << "]: Receiver executable [" << m_config.m_player << "] "
                     "not found in PATH.");
    *err_code = boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
    return fs::path();
  }
  // else

  err_code->clear();
  return exec_path;
} // Receiver_launcher::resolve_executable()

int Receiver_launcher::run(const fs::path& channel_path, const std::vector<std::string>& entries,
                           Error_code* err_code)
{
  using boost::process::child;
  using boost::system::system_category;
  using boost::algorithm::join;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(int, Receiver_launcher::run,
                                     flow::util::bind_ns::cref(channel_path), flow::util::bind_ns::cref(entries), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  constexpr int BAD_EXIT = 1;

  const auto exec_path = resolve_executable(err_code);
  if (*err_code)
  {
    return BAD_EXIT;
  }
  // else

  const auto args = receiver_args(channel_path, entries);
  FLOW_LOG_INFO("Receiver_launcher [" << this << "]: Launching receiver [" << exec_path << "] with "
                "[" << args.size() << "] args; will wait for it to exit.");
  FLOW_LOG_TRACE("Receiver_launcher [" << this << "]: Args: [" << join(args, "] [") << "].");

  // Standard streams and environment are inherited by default.  boost.process reports via std::error_code.
  std::error_code std_err_code;
  child receiver(exec_path, boost::process::args(args), std_err_code);
  if (!std_err_code)
  {
    receiver.wait(std_err_code);
  }
  if (std_err_code)
  {
    const Error_code sys_err_code(std_err_code.value(), system_category());
    FLOW_LOG_WARNING("Receiver_launcher [" << this << "]: Could not launch or wait for receiver "
                     "[" << exec_path << "]; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return BAD_EXIT;
  }
  // else

  const int status = receiver.native_exit_code();
  if (WIFSIGNALED(status))
  {
    const int sig = WTERMSIG(status);
    FLOW_LOG_WARNING("Receiver_launcher [" << this << "]: Receiver killed by signal [" << sig << "].");
    *err_code = error::Code::S_RECEIVER_KILLED_BY_SIGNAL;
    return 128 + sig;
  }
  // else

  const int exit_code = WEXITSTATUS(status);
  if (exit_code != 0)
  {
    FLOW_LOG_WARNING("Receiver_launcher [" << this << "]: Receiver exited with code [" << exit_code << "].");
    *err_code = error::Code::S_RECEIVER_EXITED_NON_ZERO;
    return exit_code;
  }
  // else

  FLOW_LOG_INFO("Receiver_launcher [" << this << "]: Receiver exited normally.");
  err_code->clear();
  return 0;
} // Receiver_launcher::run()

} // namespace solo::launch
