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
#include "solo/channel/channel_writer.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <signal.h>

namespace solo::channel
{

namespace
{

/**
 * While alive, `SIGPIPE` is ignored; the prior disposition is restored at destruction.  Our process is
 * single-threaded, so the process-wide change is not observable by anyone else.
 */
class Sigpipe_ignorer
{
public:
  /// Ignores `SIGPIPE`, saving the previous disposition.
  Sigpipe_ignorer()
  {
    struct ::sigaction ignore_action = {};
    ignore_action.sa_handler = SIG_IGN;
    sigemptyset(&ignore_action.sa_mask);
    m_restore = (::sigaction(SIGPIPE, &ignore_action, &m_saved_action) == 0);
  }

  /// Restores the saved disposition.
  ~Sigpipe_ignorer()
  {
    if (m_restore)
    {
      ::sigaction(SIGPIPE, &m_saved_action, nullptr);
    }
  }

  Sigpipe_ignorer(const Sigpipe_ignorer&) = delete;
  Sigpipe_ignorer& operator=(const Sigpipe_ignorer&) = delete;

private:
  /// Disposition before construction.
  struct ::sigaction m_saved_action;

  /// Whether #m_saved_action is valid.
  bool m_restore;
}; // class Sigpipe_ignorer

} // namespace (anon)

// Implementations.

void write_commands(flow::log::Logger* logger_ptr, util::Native_handle&& handle,
                    const std::vector<std::string>& command_lines, Error_code* err_code)
{
  using boost::asio::io_context;
  using boost::asio::posix::stream_descriptor;
  using boost::asio::buffer;
  using flow::util::buffers_dump_string;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { write_commands(logger_ptr, std::move(handle), command_lines, actual_err_code); },
         err_code, "channel::write_commands()"))
  {
    return;
  }
  // else

  assert((!handle.null()) && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHANNEL);

  /* A stream_descriptor does the write() loop for us (partial writes, EINTR).  We never run the io_context: only
   * synchronous ops are used, and since the FD is blocking, those really do block.  The descriptor takes over
   * the FD and closes it at the end of this scope. */
  io_context task_engine;
  stream_descriptor channel(task_engine, handle.release());
  const Sigpipe_ignorer sigpipe_ignorer;

  size_t n_lines_written = 0;
  for (const auto& line : command_lines)
  {
    assert((!line.empty()) && (line.back() == '\n'));

    Error_code sys_err_code;
    const auto blob = buffer(line);
    FLOW_LOG_TRACE("Channel: Writing command line [" << (n_lines_written + 1) << '/' << command_lines.size() << "] "
                   "of size [" << line.size() << "].");
    FLOW_LOG_DATA("Line contents: [\n" << buffers_dump_string(blob, "  ") << "].");

    boost::asio::write(channel, blob, sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Channel: Write failed after [" << n_lines_written << '/' << command_lines.size() << "] "
                       "command lines (receiver gone?); details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return;
    }
    // else
    ++n_lines_written;
  }

  FLOW_LOG_INFO("Channel: Handed off [" << n_lines_written << "] command lines to the receiver.");
  err_code->clear();
} // write_commands()

} // namespace solo::channel
