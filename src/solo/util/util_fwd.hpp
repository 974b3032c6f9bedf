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

#include "solo/common.hpp"
#include <flow/log/log.hpp>
#include <boost/interprocess/permissions.hpp>
#include <sys/types.h>
#include <string>
#include <vector>

/**
 * Solo module containing miscellaneous general-use facilities used by the other Solo modules
 * and/or that do not fit into any other Solo module.  Some particulars to note:
 *
 * solo::util::Native_handle is an owning wrapper of a native handle (FD in POSIX parlance).  Unlike most things
 * named "handle," it closes its FD when destroyed; it can be moved but not copied.
 *
 * solo::util::Process_credentials tells us who the current process is running as, including the user *name*
 * from which the channel path is derived.
 *
 * solo::util::normalize_file_arg() converts a command line argument to an absolute path (or a URL, unchanged).
 */
namespace solo::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Native_handle;
class Process_credentials;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Syntactic-sugary type for POSIX user ID (integer).
using user_id_t = ::uid_t;

/// Short-hand for Unix (POSIX) permissions class.
using Permissions = boost::interprocess::permissions;

// Constants.

/**
 * The permission bits which, if any is set on a file-system resource, grant read or write access to someone
 * other than the owning user: group-read, group-write, other-read, other-write.  Value a/k/a 0066.
 * Execute bits are not included, as they confer nothing on a FIFO.
 */
extern const unsigned int NON_OWNER_READ_WRITE_PERMISSIONS_MASK;

/**
 * Read-write access for the owning user and nothing for anyone else (a/k/a 0600).  The channel is created with
 * exactly these permissions; any bit in #NON_OWNER_READ_WRITE_PERMISSIONS_MASK beyond them is grounds for refusing
 * to write to it.
 */
extern const Permissions OWNER_ONLY_PERMISSIONS;

// Free functions.

/**
 * Utility that sets the permissions of the given resource (at the supplied file system path) to specified
 * POSIX value.  If the resource cannot be accessed (not found, permissions...) that system Error_code shall be
 * emitted.
 *
 * ### Rationale ###
 * It is typically placed right after the creation of the resource (here: `mkfifo()`), where the same `perms` is
 * supplied to the creation-API.  The reason is that such an API is bound by the "process umask" in POSIX/Linux; so
 * if, e.g., it's set to 0277 (octal), then the owner could not even write to the channel it just created.
 * set_resource_permissions() bypasses the umask thing.  It does not make any calls to change the umask to
 * accomplish this.
 *
 * The resource is not opened (the change is made by path).  For a FIFO that matters: opening it for reading,
 * however briefly, makes it look like it has a live reader to anyone probing it at that moment.
 *
 * @param logger_ptr
 *        Logger to use for logging (WARNING, on error only).  Caller can themselves log further info if desired.
 * @param path
 *        Path to resource.  Symlinks are followed, and the target is the resource in question (not the symlink).
 * @param perms
 *        Desired mode bits.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system error codes if permissions cannot be set (file-not-found being arguably the likeliest).
 */
void set_resource_permissions(flow::log::Logger* logger_ptr, const fs::path& path,
                              const Permissions& perms, Error_code* err_code = 0);

/**
 * Returns `true` if and only if `filename` looks like a URL, which we define as: a non-empty prefix consisting
 * solely of ASCII letters, followed by a colon.  E.g., `"https://x/y"`, `"dvd:"`, `"ytdl:abc"`.
 * No further validation is done.
 *
 * @param filename
 *        Command line argument.
 * @return See above.
 */
bool is_url(String_view filename);

/**
 * Converts a command line argument into a file entry suitable for handing to the receiver: URLs (see is_url())
 * are returned unchanged; anything else is made absolute against `base_dir` and lexically normalized (`.` and `..`
 * components resolved textually, no trailing separator).  The file system is not consulted; the file need not
 * exist; symlinks are not resolved.
 *
 * An absolute path can never look like a command line flag to the receiver (it starts with `/`), and it
 * means the same thing regardless of the receiver's working directory.
 *
 * @param arg
 *        Command line argument.  Behavior undefined if empty.
 * @param base_dir
 *        Absolute directory against which to resolve a relative `arg`: normally the working directory.
 * @return See above.
 */
std::string normalize_file_arg(const std::string& arg, const fs::path& base_dir);

/**
 * Applies normalize_file_arg() to each element, against the current working directory.  The latter is only
 * looked up if some element is a relative path; so it not existing anymore (say, removed by another process)
 * only matters then.
 *
 * @param args
 *        Command line arguments (not including the program name).  Behavior undefined if any is empty.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system error codes if the working directory cannot be determined (e.g., no-such-file-or-directory
 *        if it has been removed).
 * @return Equally-sized vector of normalized entries, in the same order; empty on error.
 */
std::vector<std::string> normalize_file_args(const std::vector<std::string>& args, Error_code* err_code = 0);

} // namespace solo::util
