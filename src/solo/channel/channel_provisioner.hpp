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

namespace solo::channel
{

// Free functions.

/**
 * (Re)creates the channel at `channel_path`: removes whatever is there (if anything), then creates a FIFO with mode
 * 0600 (util::OWNER_ONLY_PERMISSIONS) regardless of process umask.
 *
 * Call this whenever probe_receiver() found no live receiver -- including when *something* was found
 * (Probe_result::S_NO_READER).  A leftover from a crashed receiver, or anything else someone placed at the path,
 * is never reused: only an object we just created ourselves has known type, owner and mode.
 *
 * Calling it twice in a row simply recreates the FIFO twice.  If another invocation recreates it concurrently, our
 * `mkfifo()` may find the path taken (`EEXIST`); that's emitted like any other error, and no retry is attempted.
 * The FIFO is never opened here.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param channel_path
 *        Channel path.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system error codes from `unlink()` (except `ENOENT`, which is not an error), `mkfifo()`, or `chmod()`.
 */
void provision_channel(flow::log::Logger* logger_ptr, const fs::path& channel_path, Error_code* err_code = 0);

} // namespace solo::channel
