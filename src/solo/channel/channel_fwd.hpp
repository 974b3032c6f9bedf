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
 * Solo module concerned with the *channel*: the per-user named pipe (FIFO) through which one invocation hands
 * files off to an already-running receiver (player) process.
 *
 * The protocol, such as it is, has no coordinator.  Each invocation, on its own:
 *   -# computes the channel path (Channel_locator);
 *   -# probes it with a non-blocking write-only `open()` (probe_receiver()): success means someone is reading;
 *   -# if so, checks that the thing it opened is trustworthy (validate_channel_trust()) and writes
 *      one `loadfile` command per file into it (encode_loadfile_batch(), write_commands());
 *   -# if not, destroys and recreates the channel (provision_channel()), so that a new receiver can own it.
 *
 * The receiver is expected to execute whatever commands arrive on the channel; hence a channel that anyone but
 * its owner can write to (or that is not a FIFO at all, or not ours) is a command-injection vector into the
 * receiver.  This is why validation is mandatory and happens strictly between `open()` and `write()`: whatever
 * was at the path when we looked earlier is irrelevant; what matters is the object behind our descriptor.
 */
namespace solo::channel
{

// Types.

// Find doc headers near the bodies of these compound types.

class Channel_locator;

/// Outcome of probe_receiver() short of an error.
enum class Probe_result
{
  /// The channel exists, and someone has it open for reading.  (Whether the channel is trustworthy: unknown yet.)
  S_LIVE_RECEIVER,

  /// Something exists at the channel path, but nobody has it open for reading (`ENXIO`).
  S_NO_READER,

  /// Nothing exists at the channel path (`ENOENT`).
  S_ABSENT
}; // enum class Probe_result

// Free functions.

/**
 * Prints string representation of the given Probe_result to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Probe_result val);

} // namespace solo::channel
