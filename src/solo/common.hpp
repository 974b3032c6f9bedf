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

#include <flow/util/util.hpp>

#include "solo/detail/common.hpp"
#include <boost/filesystem.hpp>

/* We build in C++17 mode ourselves, and the APIs and header-inlined stuff require it too; and that applies to the
 * linking user's `#include`ing .cpp file(s).  Therefore enforce it by failing compile unless compiler's C++17 or
 * newer mode is in use. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any solo/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Solo project: single-instance coordination for a media player launcher.
 * Invoked with a list of files, it either appends them to the playlist of an already-running player
 * (the *receiver*) by writing commands into that player's control FIFO (the *channel*), or it recreates
 * the channel and starts a new receiver that owns it.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in Solo: The absolute most basic, commonly used symbols (such as the alias
 *     solo::Error_code and `enum class` solo::Log_component).
 *   - Sub-namespaces, each of which represents a Solo *module*.  In bottom-up order:
 *
 *   -# solo::util: Basic building blocks.  util::Native_handle is a trivial wrapper around an FD;
 *      util::Process_credentials tells us who we are (effective UID, user name); util::normalize_file_arg() turns
 *      command line arguments into absolute paths (or leaves URLs alone).
 *   -# solo::channel: Everything to do with the channel itself.  channel::Channel_locator computes its per-user
 *      path; channel::probe_receiver() finds out (race-awarely) whether a receiver is reading it;
 *      channel::validate_channel_trust() decides whether the object at that path may be written to at all;
 *      channel::encode_loadfile_batch() produces the text to write; channel::write_commands() writes it;
 *      channel::provision_channel() recreates the channel when nobody is listening.
 *   -# solo::launch: Configuration (launch::Launcher_config), starting a new receiver
 *      (launch::Receiver_launcher), and the top-level decision procedure tying it all together
 *      (launch::Launcher).
 *
 * There is no central coordinator among invocations.  Concurrent invocations race via the file system only;
 * see launch::Launcher doc header for the consequences, which are accepted as-is.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Solo requires Flow and Boost, not only for internal implementation purposes but also in its APIs.
 * `flow::log` is the assumed logging system, and `flow::Error_code` and related conventions are used
 * for error reporting.  See `namespace flow` doc header's "Error reporting" section: briefly, every fallible
 * API takes a trailing `Error_code* err_code` out-arg; if null, errors are thrown as `flow::error::Runtime_error`.
 */
namespace solo
{

// Types.  They're outside of `namespace ::solo::util` for brevity due to their frequent use.

/**
 * @namespace solo::fs
 * @brief Short-hand for `filesystem` namespace.
 *
 * We alias to `boost::filesystem`, as does the rest of the Flow family.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

#ifdef SOLO_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Solo logging.
 * Individual `enum` values are generated via macro magic; find them in the source file
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in solo::Log_component to its
 * string representation as used in log output and verbosity config.  Used when configuring logging via
 * `flow::log::Config::init_component_names()`.  Member `S_SOME_NAME` maps to `"SOME_NAME"`.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_SOLO_LOG_COMPONENT_NAME_MAP;

#endif // SOLO_DOXYGEN_ONLY

} // namespace solo
