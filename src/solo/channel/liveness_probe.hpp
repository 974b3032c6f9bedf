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

namespace solo::channel
{

// Free functions.

/**
 * Finds out whether a receiver is currently reading the channel at `channel_path`, by attempting to `open()` it
 * write-only and non-blocking, without creating it.  POSIX guarantees that such an `open()` of a FIFO succeeds if
 * and only if it has a reader at that instant, failing with `ENXIO` otherwise.  Outcomes:
 *   - Success: Probe_result::S_LIVE_RECEIVER; `*handle` receives the (non-blocking, close-on-exec) FD.
 *     Nothing about the opened object is trusted yet: it may not even be a FIFO (a regular file opens just fine).
 *     Pass it to validate_channel_trust() before writing anything.
 *   - `ENXIO`: Probe_result::S_NO_READER.
 *   - `ENOENT`: Probe_result::S_ABSENT.
 *   - Anything else (`EACCES`, `EISDIR`, `ELOOP`, ...): emitted as a system #Error_code.
 *
 * The answer can be stale the moment it is returned (the receiver may exit right after we open); callers
 * accept that and simply fail if the subsequent write fails.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param channel_path
 *        Channel path.
 * @param handle
 *        Must not be null.  On Probe_result::S_LIVE_RECEIVER, set to the opened FD; otherwise untouched.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system error codes other than the two listed above.
 * @return See above.  If an #Error_code is emitted, the return value is meaningless.
 */
Probe_result probe_receiver(flow::log::Logger* logger_ptr, const fs::path& channel_path,
                            util::Native_handle* handle, Error_code* err_code = 0);

} // namespace solo::channel
