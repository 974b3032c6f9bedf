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

#include <flow/log/log.hpp>

namespace solo::test
{

/**
 * Process-wide settings for the unit tests, set up by the test `main()` before any test runs.
 * Singleton.
 */
class Test_config
{
public:
  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  /// Lowest severity logged by test::Test_logger by default.  Set from `SOLO_TEST_LOG_LEVEL` if present.
  flow::log::Sev m_sev;

private:
  /// Use get_singleton().
  Test_config();
}; // class Test_config

} // namespace solo::test
