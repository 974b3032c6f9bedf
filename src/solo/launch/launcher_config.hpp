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

#include "solo/launch/launch_fwd.hpp"
#include <flow/log/log.hpp>
#include <string>
#include <vector>

namespace solo::launch
{

// Types.

/**
 * Settings for the launcher, loaded from the environment by load_from_environment().  Each `SOLO_<NAME>`
 * variable maps to option `<name>` (lower-case, `_` becoming `-`):
 *
 *   - `SOLO_PLAYER_OPTS` => #m_extra_opts: extra startup options for a *new* receiver, whitespace-split.
 *     Consulted only when a new receiver is launched; ignored on hand-off.
 *   - `SOLO_PLAYER` => #m_player: the receiver executable.  A name without `/` is searched for in `PATH`.
 *   - `SOLO_LOG_LEVEL` => #m_log_level: `flow::log::Sev` name, e.g. `WARNING` or `TRACE`.
 *
 * Other `SOLO_*` variables are ignored.  A default-constructed object holds the defaults.
 */
struct Launcher_config
{
  // Constants.

  /// Default for #m_player.
  static const std::string S_DEFAULT_PLAYER;

  /// Default for #m_log_level.
  static const flow::log::Sev S_DEFAULT_LOG_LEVEL;

  /// Prefix of the environment variables we read.
  static const std::string S_ENV_VAR_PREFIX;

  // Data.

  /// Receiver executable: name (searched in `PATH`) or path.
  std::string m_player;

  /// Extra receiver startup options, in order; placed after the fixed ones and before `--`.
  std::vector<std::string> m_extra_opts;

  /// Verbosity of the logger the program sets up.
  flow::log::Sev m_log_level;

  // Constructors/destructor.

  /// Constructs with the defaults.
  Launcher_config();

  // Methods.

  /**
   * Loads settings from the current environment.  Unset variables leave defaults in place.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT if a value cannot be parsed (e.g., unknown log level) or #m_player
   *        would be empty.
   * @return The settings.  If an #Error_code is emitted, the defaults.
   */
  static Launcher_config load_from_environment(Error_code* err_code = 0);

  /**
   * Splits a value of `SOLO_PLAYER_OPTS` into discrete options: on runs of whitespace, no quoting recognized.
   *
   * @param opts
   *        Value.
   * @return Non-empty tokens, in order.
   */
  static std::vector<std::string> split_opts(const std::string& opts);
}; // struct Launcher_config

} // namespace solo::launch
