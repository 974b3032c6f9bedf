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

#include "solo/launch/launcher_config.hpp"
#include "solo/channel/channel_locator.hpp"
#include <flow/log/log.hpp>
#include <string>
#include <vector>

namespace solo::launch
{

// Types.

/**
 * The top-level procedure of one invocation: given the command line file arguments, either hands them off to
 * a running receiver via the channel, or provisions the channel anew and launches a receiver that owns it.
 * Concretely, run():
 *   -# normalizes the arguments (util::normalize_file_args()), against the working directory if any is relative;
 *   -# computes the channel path (channel::Channel_locator);
 *   -# probes it (channel::probe_receiver());
 *   -# on a live receiver: validates trust (channel::validate_channel_trust()); if OK writes one command line
 *      per file (channel::encode_loadfile_batch(), channel::write_commands()); done.  If not OK: nothing is written,
 *      and nothing else is attempted either (in particular no new receiver);
 *   -# otherwise: provisions the channel (channel::provision_channel()) and runs a Receiver_launcher, passing
 *      the files on its command line (never through the channel).
 *
 * ### Empty arguments ###
 * An empty string argument is not resolved to the working directory, as the path normalization rules alone
 * would have it.  run() rejects the whole invocation with error::Code::S_INVALID_ARGUMENT before touching the
 * channel.
 *
 * ### Concurrency ###
 * Invocations do not coordinate beyond the above; there is no lock file.  Two invocations that both find no
 * receiver will both provision (the second one's `unlink()` removes the first one's FIFO) and both launch a
 * receiver; the first receiver then has a channel nobody else can find.  Or the slower one fails in `mkfifo()` with
 * `EEXIST`.  Either way no one is tricked into writing to an untrusted object, and the next invocation
 * re-derives everything from scratch.  This is accepted.
 *
 * Likewise a receiver can exit between our probe and our write; then the write fails (`EPIPE`), and we report it.
 *
 * ### Error handling ###
 * No retries.  Every error ends the invocation; see run() for what is reported.
 */
class Launcher :
  public flow::log::Log_context
{
public:
  // Types.

  /// How run() ended up dealing with the files, if it did not emit an error.
  enum class Outcome
  {
    /// Nothing done yet, or an error was emitted.
    S_NONE,

    /// A live, trusted receiver was found, and the files were written into its channel.
    S_HANDED_OFF,

    /// A new receiver was launched (and has since exited).
    S_LAUNCHED
  }; // enum class Outcome

  // Constructors/destructor.

  /**
   * Constructs the launcher.  Nothing happens until run().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param config
   *        Settings.  Copied.
   * @param locator
   *        Channel locator.  Copied.  Production code uses the default one.
   */
  explicit Launcher(flow::log::Logger* logger_ptr, const Launcher_config& config,
                    const channel::Channel_locator& locator = channel::Channel_locator());

  // Methods.

  /**
   * Performs the procedure described in the class doc header.
   *
   * @param args
   *        Command line arguments (files/URLs; not including the program name).  Must not be empty, nor contain
   *        an empty string.  Note that an empty string is not taken to mean the working directory (which is what
   *        normalizing it as a path would yield): the whole invocation is rejected instead, and nothing is
   *        written or launched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (see `args`);
   *        see util::normalize_file_args() (working directory unavailable);
   *        error::Code::S_USER_IDENTITY_UNKNOWN (see channel::Channel_locator::channel_path());
   *        any error::is_security_error() code (channel failed trust validation; nothing written);
   *        see Receiver_launcher::run();
   *        system error codes (probing, provisioning, writing).
   * @return The exit code the program should report.  0 on success; Receiver_launcher::run() result on the launch
   *         path; 1 on any other error.
   */
  int run(const std::vector<std::string>& args, Error_code* err_code = 0);

  /**
   * How the last run() dealt with the files.
   * @return See above.
   */
  Outcome outcome() const;

  /**
   * Channel path used by the last run(); empty if it was not yet computed.
   * @return See above.
   */
  const fs::path& channel_path() const;

private:
  // Methods.

  /**
   * The hand-off path: trust validation, then writing.
   *
   * @param handle
   *        Channel FD as returned by channel::probe_receiver().
   * @param entries
   *        Normalized file entries.
   * @param err_code
   *        Not null.  See run().
   */
  void hand_off(util::Native_handle&& handle, const std::vector<std::string>& entries, Error_code* err_code);

  /**
   * The launch path: provisioning, then running the receiver.
   *
   * @param entries
   *        Normalized file entries.
   * @param err_code
   *        Not null.  See run().
   * @return See run().
   */
  int provision_and_launch(const std::vector<std::string>& entries, Error_code* err_code);

  // Data.

  /// See ctor.
  const Launcher_config m_config;

  /// See ctor.
  const channel::Channel_locator m_locator;

  /// See outcome().
  Outcome m_outcome;

  /// See channel_path().
  fs::path m_channel_path;
}; // class Launcher

// Free functions.

/**
 * Prints string representation of the given Launcher::Outcome to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Launcher::Outcome val);

} // namespace solo::launch
