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
#include "solo/launch/launcher_config.hpp"
#include "solo/error.hpp"
#include <flow/error/error.hpp>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>

namespace solo::launch
{

// Static initializations.

const std::string Launcher_config::S_DEFAULT_PLAYER = "mpv";
const flow::log::Sev Launcher_config::S_DEFAULT_LOG_LEVEL = flow::log::Sev::S_WARNING;
const std::string Launcher_config::S_ENV_VAR_PREFIX = "SOLO_";

// Launcher_config implementations.

Launcher_config::Launcher_config() :
  m_player(S_DEFAULT_PLAYER),
  m_log_level(S_DEFAULT_LOG_LEVEL)
{
  // That's it.
}

Launcher_config Launcher_config::load_from_environment(Error_code* err_code) // Static.
{
  namespace opts = boost::program_options;
  using boost::algorithm::to_lower_copy;
  using boost::algorithm::replace_all_copy;
  using boost::algorithm::starts_with;
  using std::string;

  Launcher_config config;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Launcher_config
           { return load_from_environment(actual_err_code); },
         &config, err_code, "launch::Launcher_config::load_from_environment()"))
  {
    return config;
  }
  // else

  string player_opts;
  opts::options_description opts_desc("Solo environment settings");
  opts_desc.add_options()
    ("player-opts", opts::value<string>(&player_opts),
     "Extra receiver startup options (whitespace-separated).")
    ("player", opts::value<string>(&config.m_player)->default_value(S_DEFAULT_PLAYER),
     "Receiver executable.")
    ("log-level", opts::value<flow::log::Sev>(&config.m_log_level)->default_value(S_DEFAULT_LOG_LEVEL),
     "Log verbosity (flow::log::Sev name).");

  // SOLO_PLAYER_OPTS => "player-opts"; non-SOLO_ variables => "" (ignored by parse_environment()).
  const auto name_mapper = [&](const string& var_name) -> string
  {
    if (!starts_with(var_name, S_ENV_VAR_PREFIX))
    {
      return string();
    }
    // else
    const auto name = replace_all_copy(to_lower_copy(var_name.substr(S_ENV_VAR_PREFIX.size())), "_", "-");
    return opts_desc.find_nothrow(name, false) ? name : string();
  };

  try
  {
    opts::variables_map vars;
    opts::store(opts::parse_environment(opts_desc, name_mapper), vars);
    opts::notify(vars);
  }
  catch (const opts::error&)
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return Launcher_config();
  }

  if (config.m_player.empty())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return Launcher_config();
  }
  // else

  config.m_extra_opts = split_opts(player_opts);
  err_code->clear();
  return config;
} // Launcher_config::load_from_environment()

std::vector<std::string> Launcher_config::split_opts(const std::string& opts) // Static.
{
  using boost::algorithm::split;
  using boost::algorithm::is_space;
  using boost::algorithm::token_compress_on;

  std::vector<std::string> tokens;
  split(tokens, opts, is_space(), token_compress_on);
  // Leading/trailing whitespace yields an empty token at the respective end.
  tokens.erase(std::remove(tokens.begin(), tokens.end(), std::string()), tokens.end());
  return tokens;
}

std::ostream& operator<<(std::ostream& os, const Launcher_config& val)
{
  return os << "player[" << val.m_player << "] extra_opts[" << boost::algorithm::join(val.m_extra_opts, " ") << "] "
               "log_level[" << val.m_log_level << ']';
}

} // namespace solo::launch
