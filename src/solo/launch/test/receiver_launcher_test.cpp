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

#include "solo/launch/receiver_launcher.hpp"
#include "solo/error.hpp"
#include "solo/test/test_common_util.hpp"
#include "solo/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>

namespace solo::launch::test
{

using solo::test::Temp_dir;
using solo::test::Test_logger;
using Strings = std::vector<std::string>;

namespace
{

/// Config running the given player with no extra options.
Launcher_config player_config(const std::string& player)
{
  Launcher_config config;
  config.m_player = player;
  return config;
}

} // namespace (anon)

/// Tests the receiver command line layout.
TEST(Receiver_launcher_test, Args)
{
  Test_logger logger;
  auto config = player_config("mpv");

  EXPECT_EQ(Receiver_launcher(&logger, config).receiver_args("/tmp/ch", { "/a.mkv" }),
            (Strings{ "--no-terminal", "--force-window", "--input-file=/tmp/ch", "--", "/a.mkv" }));

  config.m_extra_opts = { "--fs", "--volume=50" };
  // Entries go after "--", so one that looks like an option is still a file.
  EXPECT_EQ(Receiver_launcher(&logger, config).receiver_args("/tmp/ch", { "/a.mkv", "-b", "http://c" }),
            (Strings{ "--no-terminal", "--force-window", "--input-file=/tmp/ch", "--fs", "--volume=50", "--",
                      "/a.mkv", "-b", "http://c" }));
}

/// Tests finding the executable.
TEST(Receiver_launcher_test, Resolve)
{
  Test_logger logger;
  Error_code err_code;

  // Paths are taken as-is.
  EXPECT_EQ(Receiver_launcher(&logger, player_config("/no/such/player")).resolve_executable(&err_code),
            fs::path("/no/such/player"));
  EXPECT_FALSE(err_code);

  // Names are looked up in PATH.
  const auto sh_path = Receiver_launcher(&logger, player_config("sh")).resolve_executable(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(sh_path.is_absolute());
  EXPECT_EQ(sh_path.filename(), fs::path("sh"));

  EXPECT_TRUE(Receiver_launcher(&logger, player_config("solo-no-such-player-xyz"))
                .resolve_executable(&err_code).empty());
  EXPECT_EQ(err_code, boost::system::errc::no_such_file_or_directory);
  EXPECT_THROW(Receiver_launcher(&logger, player_config("solo-no-such-player-xyz")).resolve_executable(),
               flow::error::Runtime_error);
}

/// Tests that the receiver gets exactly the expected arguments, and its success is reported.
TEST(Receiver_launcher_test, Run_success)
{
  Test_logger logger;
  Temp_dir dir;
  const auto player = dir.path() / "player";
  const auto argv_out = dir.path() / "argv";
  solo::test::write_file(player,
                         "#!/bin/sh\n"
                         "for arg in \"$@\"; do printf '%s\\n' \"$arg\"; done > '" + argv_out.string() + "'\n",
                         true);

  auto config = player_config(player.string());
  config.m_extra_opts = { "--fs" };
  Receiver_launcher receiver_launcher(&logger, config);

  Error_code err_code;
  EXPECT_EQ(receiver_launcher.run("/tmp/ch", { "/m/a b.mkv", "http://h/c" }, &err_code), 0);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(solo::test::read_file(argv_out),
            "--no-terminal\n--force-window\n--input-file=/tmp/ch\n--fs\n--\n/m/a b.mkv\nhttp://h/c\n");
}

/// Tests reporting of receiver failures.
TEST(Receiver_launcher_test, Run_failure)
{
  Test_logger logger;
  Temp_dir dir;
  Error_code err_code;

  EXPECT_EQ(Receiver_launcher(&logger, player_config("true")).run("/tmp/ch", { "/a" }, &err_code), 0);
  EXPECT_FALSE(err_code);

  EXPECT_EQ(Receiver_launcher(&logger, player_config("false")).run("/tmp/ch", { "/a" }, &err_code), 1);
  EXPECT_EQ(err_code, error::Code::S_RECEIVER_EXITED_NON_ZERO);

  const auto exit_7 = dir.path() / "exit_7";
  solo::test::write_file(exit_7, "#!/bin/sh\nexit 7\n", true);
  EXPECT_EQ(Receiver_launcher(&logger, player_config(exit_7.string())).run("/tmp/ch", { "/a" }, &err_code), 7);
  EXPECT_EQ(err_code, error::Code::S_RECEIVER_EXITED_NON_ZERO);

  const auto suicide = dir.path() / "suicide";
  solo::test::write_file(suicide, "#!/bin/sh\nkill -KILL $$\n", true);
  EXPECT_EQ(Receiver_launcher(&logger, player_config(suicide.string())).run("/tmp/ch", { "/a" }, &err_code),
            128 + 9);
  EXPECT_EQ(err_code, error::Code::S_RECEIVER_KILLED_BY_SIGNAL);

  // Cannot launch at all.
  EXPECT_EQ(Receiver_launcher(&logger, player_config("solo-no-such-player-xyz")).run("/tmp/ch", { "/a" }, &err_code),
            1);
  EXPECT_EQ(err_code, boost::system::errc::no_such_file_or_directory);
  EXPECT_EQ(Receiver_launcher(&logger, player_config((dir.path() / "nothing").string()))
              .run("/tmp/ch", { "/a" }, &err_code),
            1);
  EXPECT_TRUE(err_code);
  EXPECT_FALSE(error::is_security_error(err_code));

  EXPECT_THROW(Receiver_launcher(&logger, player_config("false")).run("/tmp/ch", { "/a" }),
               flow::error::Runtime_error);
}

} // namespace solo::launch::test
