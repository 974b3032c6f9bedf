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

#include <flow/common.hpp>
#include <boost/unordered_map.hpp>
#include <string>

namespace solo
{

// Types.

/* The real doc header for this is in solo/common.hpp (under SOLO_DOXYGEN_ONLY); it is generated here via the
 * same macro magic Flow uses for flow::Flow_log_component. */
enum class Log_component
{
#define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
  S_##ARG_name_root = ARG_enum_val,
#include "solo/detail/macros/log_component_enum_declare.macros.hpp"
#undef FLOW_LOG_CFG_COMPONENT_DEFINE
  /// Sentinel: not a valid value.  Must be last.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/// See the doc header in solo/common.hpp (under SOLO_DOXYGEN_ONLY).
extern const boost::unordered_multimap<Log_component, std::string> S_SOLO_LOG_COMPONENT_NAME_MAP;

} // namespace solo
