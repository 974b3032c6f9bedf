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
#include <sys/stat.h>

namespace solo::channel
{

// Free functions.

/**
 * The pure decision procedure behind validate_channel_trust(): given the metadata of an object, decides
 * whether it is fit to receive commands.  All of the following must hold:
 *   - it is a FIFO (`S_ISFIFO`), else error::Code::S_CHANNEL_NOT_FIFO;
 *   - no group/other read/write bit is set (util::NON_OWNER_READ_WRITE_PERMISSIONS_MASK), else
 *     error::Code::S_CHANNEL_PERMISSIONS_TOO_OPEN;
 *   - it is owned by `expected_owner`, else error::Code::S_CHANNEL_OWNER_MISMATCH.
 * The checks are made in that order; the first failure is emitted.
 *
 * @param stat_buf
 *        Metadata, as from `fstat()`.
 * @param expected_owner
 *        The UID that must own the object; normally our own effective UID.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: see above.
 */
void check_channel_metadata(const struct ::stat& stat_buf, util::user_id_t expected_owner,
                            Error_code* err_code = 0);

/**
 * Establishes whether the object behind `handle` (as opened by probe_receiver()) may be written to; and, if so,
 * switches `handle` to blocking mode for the subsequent write.  The metadata are taken via `fstat()` on the
 * descriptor, never via the path: the path may by now name something else entirely.  See
 * check_channel_metadata() for the criteria.
 *
 * On failure nothing is done to `handle` (caller should just close it) and nothing should be written to it.
 * Details of which criterion failed are logged at TRACE level only.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param handle
 *        Open descriptor to the channel.  Behavior undefined if `handle.null()`.
 * @param expected_owner
 *        The UID that must own the object; normally util::Process_credentials::own_user_id().
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        see check_channel_metadata(); system error codes if `fstat()` or `fcntl()` fail.
 */
void validate_channel_trust(flow::log::Logger* logger_ptr, const util::Native_handle& handle,
                            util::user_id_t expected_owner, Error_code* err_code = 0);

} // namespace solo::channel
