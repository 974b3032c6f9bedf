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
#include "solo/channel/command_encoder.hpp"
#include <boost/algorithm/string/replace.hpp>

namespace solo::channel
{

// Implementations.

std::string escape_path(util::String_view entry)
{
  using boost::algorithm::replace_all;

  std::string escaped(entry);
  // Order matters.  See doc header.
  replace_all(escaped, "\\", "\\\\");
  replace_all(escaped, "\"", "\\\"");
  replace_all(escaped, "\n", "\\n");
  return escaped;
}

std::string encode_loadfile_command(util::String_view entry)
{
  std::string line("raw loadfile \"");
  line += escape_path(entry);
  line += "\" append\n";
  return line;
}

std::vector<std::string> encode_loadfile_batch(const std::vector<std::string>& entries)
{
  std::vector<std::string> lines;
  lines.reserve(entries.size());
  for (const auto& entry : entries)
  {
    lines.emplace_back(encode_loadfile_command(entry));
  }
  return lines;
}

} // namespace solo::channel
