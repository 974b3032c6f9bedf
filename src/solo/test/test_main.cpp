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
#include "solo/test/test_config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <sstream>

/* Unit test driver.  Optional env var SOLO_TEST_LOG_LEVEL (a flow::log::Sev name, e.g. TRACE) sets the
 * severity threshold of test::Test_logger. */

int main(int argc, char** argv)
{
  using solo::test::Test_config;

  ::testing::InitGoogleTest(&argc, argv);

  const char* const sev_str = std::getenv("SOLO_TEST_LOG_LEVEL");
  if (sev_str)
  {
    std::istringstream is(sev_str);
    is >> Test_config::get_singleton().m_sev;
  }

  return RUN_ALL_TESTS();
}
