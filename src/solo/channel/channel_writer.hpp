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
#include "solo/util/native_handle.hpp"
#include <string>
#include <vector>

namespace solo::channel
{

// Free functions.

/**
 * Writes the given command lines, in order, into a channel that has passed validate_channel_trust(), then closes
 * the channel.  Each line is handed to a single `write()`; a line no longer than `PIPE_BUF` (4KiB in Linux) is
 * therefore never interleaved with lines written concurrently by another invocation.  (A longer line may be, if
 * another writer happens to be active; the receiver sees garbage in that case, which we accept.)
 *
 * Blocking, no timeout: if the receiver stops reading, this waits forever.  If the receiver has gone away since
 * the probe, the write fails with `EPIPE`; `SIGPIPE` is ignored for the duration of this call so that this is an
 * error rather than the end of our process.  There is no acknowledgment from the receiver; success means only that
 * the bytes went into the pipe.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param handle
 *        Validated, blocking-mode channel descriptor.  It is closed by the time this returns (even on error).
 * @param command_lines
 *        Lines as from encode_loadfile_batch(); each must end in line-feed.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system error codes from the writes (e.g., `broken_pipe`).  Lines preceding the failed one were delivered.
 */
void write_commands(flow::log::Logger* logger_ptr, util::Native_handle&& handle,
                    const std::vector<std::string>& command_lines, Error_code* err_code = 0);

} // namespace solo::channel
