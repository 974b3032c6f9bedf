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

#include "solo/launch/launcher_config.hpp"
#include <flow/log/log.hpp>
#include <string>
#include <vector>

namespace solo::launch
{

// Types.

/**
 * Starts a new receiver (player) process as the owner of a freshly provisioned channel and waits for it to exit.
 *
 * The receiver gets our standard input/output/error (so it can take over the terminal) and our environment.
 * Its argument list is, in order (see receiver_args()):
 *   -# `--no-terminal` (the receiver's own terminal UI output is disabled);
 *   -# `--force-window`;
 *   -# `--input-file=<channel path>` (where it shall read commands from later invocations);
 *   -# Launcher_config::m_extra_opts, if any;
 *   -# `--`, so that nothing after it can be taken for an option;
 *   -# the file entries.
 *
 * The invocation lasts as long as the receiver.  A non-zero exit (or death by signal) is an error; the exit code
 * is still reported so the program can propagate it.
 */
class Receiver_launcher :
  public flow::log::Log_context
{
public:
  // Constants.

  /// The options that always come first, ahead of the `--input-file=` one.
  static const std::vector<std::string> S_FIXED_OPTS;

  /// Prefix of the option telling the receiver its channel path.
  static const std::string S_INPUT_FILE_OPT_PREFIX;

  /// Separator ending the options.
  static const std::string S_END_OF_OPTS;

  // Constructors/destructor.

  /**
   * Constructs the launcher.  Nothing is spawned until run().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param config
   *        Settings; the receiver executable and extra options are taken from it.  Copied.
   */
  explicit Receiver_launcher(flow::log::Logger* logger_ptr, const Launcher_config& config);

  // Methods.

  /**
   * The receiver's argument list (not including the executable, a/k/a `argv[0]`).  See class doc header.
   *
   * @param channel_path
   *        Channel path.
   * @param entries
   *        File entries, as from util::normalize_file_args().
   * @return See above.
   */
  std::vector<std::string> receiver_args(const fs::path& channel_path,
                                         const std::vector<std::string>& entries) const;

  /**
   * Where the receiver executable is: Launcher_config::m_player itself if it contains a `/`; else the first match
   * in `PATH`.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::system::errc::no_such_file_or_directory` if not found in `PATH`.
   * @return See above.  Empty if an #Error_code is emitted.
   */
  fs::path resolve_executable(Error_code* err_code = 0) const;

  /**
   * Spawns the receiver with receiver_args() and blocks until it exits.
   *
   * @param channel_path
   *        Channel path (should have just been provisioned).
   * @param entries
   *        File entries, as from util::normalize_file_args().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_RECEIVER_EXITED_NON_ZERO, error::Code::S_RECEIVER_KILLED_BY_SIGNAL;
   *        see resolve_executable(); system error codes if spawning or waiting failed.
   * @return The code our program should exit with on account of the receiver: its exit code; or 128 plus the
   *         signal number if killed by a signal.  If a system error is emitted, 1.
   */
  int run(const fs::path& channel_path, const std::vector<std::string>& entries, Error_code* err_code = 0);

private:
  // Data.

  /// See ctor.
  const Launcher_config m_config;
}; // class Receiver_launcher

} // namespace solo::launch
