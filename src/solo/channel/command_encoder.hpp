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

#include "solo/channel/channel_fwd.hpp"
#include <string>
#include <vector>

namespace solo::channel
{

// Free functions.

/**
 * Escapes a file entry for use inside a double-quoted argument of a receiver command: backslash becomes `\\`,
 * double-quote becomes `\"`, line-feed becomes `\n` (backslash, letter n).  The replacements are applied in exactly
 * that order: backslash first, so that the backslashes inserted by the later replacements are not themselves
 * escaped again.  The result contains no line-feed.
 *
 * @param entry
 *        File entry (absolute path or URL), any bytes.
 * @return See above.
 */
std::string escape_path(util::String_view entry);

/**
 * Produces the complete command line (terminated by line-feed) that asks the receiver to append `entry` to its
 * playlist: `raw loadfile "<escape_path(entry)>" append\n`.
 *
 * @param entry
 *        File entry (absolute path or URL).
 * @return See above.
 */
std::string encode_loadfile_command(util::String_view entry);

/**
 * Applies encode_loadfile_command() to each element.  Each resulting line is self-contained; write_commands()
 * writes each with one `write()`.
 *
 * @param entries
 *        File entries, in playlist order.
 * @return Command lines, in the same order.
 */
std::vector<std::string> encode_loadfile_batch(const std::vector<std::string>& entries);

} // namespace solo::channel
