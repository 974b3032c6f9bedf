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

#include "solo/util/util_fwd.hpp"
#include <ostream>

/**
 * Solo module that ties everything together: configuration (Launcher_config), starting a new receiver process
 * (Receiver_launcher), and the top-level decision of whether to hand files off to a running receiver or launch
 * a new one (Launcher).
 */
namespace solo::launch
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Launcher_config;
class Receiver_launcher;
class Launcher;

// Free functions.

/**
 * Prints string representation of the given Launcher_config to the given `ostream`.
 *
 * @relatesalso Launcher_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Launcher_config& val);

} // namespace solo::launch
