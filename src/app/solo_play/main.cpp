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
#include "solo/launch/launcher_config.hpp"
#include "solo/error.hpp"
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <iostream>
#include <string>
#include <vector>

/* solo-play: opens the given files/URLs in the user's single media player instance, starting it if needed.
 * See solo::launch::Launcher for the procedure; here we only translate its results into an exit code and a
 * message on stderr. */

namespace
{

constexpr int S_BAD_EXIT = 1;

void print_usage(std::ostream& os, const char* prog)
{
  os << "Usage: " << prog << " <file or URL>...\n"
        "Opens the given files in the running media player, starting one if none is running.\n"
        "Environment:\n"
        "  SOLO_PLAYER       receiver executable (default: " << solo::launch::Launcher_config::S_DEFAULT_PLAYER
     << ")\n"
        "  SOLO_PLAYER_OPTS  extra options for a newly started receiver\n"
        "  SOLO_LOG_LEVEL    log verbosity, e.g. WARNING, INFO, TRACE\n";
}

} // namespace (anon)

int main(int argc, char const * const * argv)
{
  using solo::launch::Launcher;
  using solo::launch::Launcher_config;
  using solo::Error_code;
  using flow::log::Config;
  using flow::log::Simple_ostream_logger;
  using std::cerr;

  const char* const prog = (argc > 0) ? argv[0] : "solo-play";

  Error_code err_code;
  const auto launcher_config = Launcher_config::load_from_environment(&err_code);
  if (err_code)
  {
    cerr << prog << ": bad environment settings (see SOLO_* variables): " << err_code.message() << ".\n";
    return S_BAD_EXIT;
  }
  // else

  if (argc < 2)
  {
    print_usage(cerr, prog);
    return S_BAD_EXIT;
  }
  // else

  Config log_config(launcher_config.m_log_level);
  log_config.init_component_to_union_idx_mapping<solo::Log_component>
    (100, Config::standard_component_payload_enum_sparse_length<solo::Log_component>());
  log_config.init_component_names<solo::Log_component>(solo::S_SOLO_LOG_COMPONENT_NAME_MAP, false, "solo-");
  log_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
  log_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  Simple_ostream_logger logger(&log_config, cerr, cerr);

  const std::vector<std::string> args(argv + 1, argv + argc);

  Launcher launcher(&logger, launcher_config);
  const int exit_code = launcher.run(args, &err_code);
  if (!err_code)
  {
    return exit_code;
  }
  // else

  if (solo::error::is_security_error(err_code))
  {
    // Do not elaborate; details are logged at TRACE severity only.
    cerr << prog << ": refusing to use the player channel: it failed a security check.\n";
  }
  else if ((err_code != solo::error::Code::S_RECEIVER_EXITED_NON_ZERO)
           && (err_code != solo::error::Code::S_RECEIVER_KILLED_BY_SIGNAL))
  {
    // (For those two the receiver's own exit code is passed through; it has presumably spoken for itself.)
    cerr << prog << ": " << err_code.message() << ".\n";
  }
  return exit_code;
} // main()
