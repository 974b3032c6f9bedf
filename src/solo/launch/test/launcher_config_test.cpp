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

#include "solo/launch/launcher_config.hpp"
#include "solo/error.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <cstdlib>
#include <sstream>

namespace solo::launch::test
{

namespace
{

/// Sets (or unsets, if `value` is null) an environment variable for its lifetime; then restores it.
class Env_setter
{
public:
  Env_setter(const std::string& name, const char* value) :
    m_name(name)
  {
    const char* const saved = ::getenv(name.c_str());
    m_had_value = saved;
    if (saved)
    {
      m_saved = saved;
    }
    if (value)
    {
      ::setenv(name.c_str(), value, 1);
    }
    else
    {
      ::unsetenv(name.c_str());
    }
  }

  ~Env_setter()
  {
    if (m_had_value)
    {
      ::setenv(m_name.c_str(), m_saved.c_str(), 1);
    }
    else
    {
      ::unsetenv(m_name.c_str());
    }
  }

private:
  const std::string m_name;
  bool m_had_value;
  std::string m_saved;
}; // class Env_setter

} // namespace (anon)

/// Tests defaults when nothing is set.
TEST(Launcher_config_test, Defaults)
{
  const Env_setter env_opts("SOLO_PLAYER_OPTS", nullptr);
  const Env_setter env_player("SOLO_PLAYER", nullptr);
  const Env_setter env_log("SOLO_LOG_LEVEL", nullptr);

  const auto config = Launcher_config::load_from_environment();
  EXPECT_EQ(config.m_player, "mpv");
  EXPECT_EQ(config.m_player, Launcher_config::S_DEFAULT_PLAYER);
  EXPECT_TRUE(config.m_extra_opts.empty());
  EXPECT_EQ(config.m_log_level, flow::log::Sev::S_WARNING);

  const Launcher_config default_config;
  EXPECT_EQ(default_config.m_player, config.m_player);
  EXPECT_EQ(default_config.m_log_level, config.m_log_level);
}

/// Tests loading all settings.
TEST(Launcher_config_test, Load)
{
  const Env_setter env_opts("SOLO_PLAYER_OPTS", "  --fs\t--volume=50   --title=x  ");
  const Env_setter env_player("SOLO_PLAYER", "/opt/player/bin/player");
  const Env_setter env_log("SOLO_LOG_LEVEL", "INFO");
  const Env_setter env_unrelated("SOLO_NOT_A_SETTING", "whatever"); // Ignored.

  Error_code err_code;
  const auto config = Launcher_config::load_from_environment(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(config.m_player, "/opt/player/bin/player");
  EXPECT_EQ(config.m_extra_opts, (std::vector<std::string>{ "--fs", "--volume=50", "--title=x" }));
  EXPECT_EQ(config.m_log_level, flow::log::Sev::S_INFO);

  std::ostringstream os;
  os << config;
  EXPECT_NE(os.str().find("/opt/player/bin/player"), std::string::npos);
  EXPECT_NE(os.str().find("--fs --volume=50 --title=x"), std::string::npos);
}

/// Tests that an empty player is rejected.
TEST(Launcher_config_test, Empty_player)
{
  const Env_setter env_player("SOLO_PLAYER", "");

  Error_code err_code;
  Launcher_config::load_from_environment(&err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_THROW(Launcher_config::load_from_environment(), flow::error::Runtime_error);
}

/// Tests option splitting.
TEST(Launcher_config_test, Split_opts)
{
  using Strings = std::vector<std::string>;

  EXPECT_EQ(Launcher_config::split_opts(""), Strings());
  EXPECT_EQ(Launcher_config::split_opts("   \t "), Strings());
  EXPECT_EQ(Launcher_config::split_opts("--a"), Strings{ "--a" });
  EXPECT_EQ(Launcher_config::split_opts(" --a  --b=c\n--d "), (Strings{ "--a", "--b=c", "--d" }));
  // No quoting.
  EXPECT_EQ(Launcher_config::split_opts("--title=\"a b\""), (Strings{ "--title=\"a", "b\"" }));
}

} // namespace solo::launch::test
