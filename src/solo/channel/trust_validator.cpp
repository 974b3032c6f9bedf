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
#include "solo/channel/trust_validator.hpp"
#include "solo/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <fcntl.h>
#include <iomanip>
#include <sstream>

namespace solo::channel
{

namespace
{

/// Helper for logging: e.g., 0010600 for an owner-read-write FIFO.
std::string octal_mode_str(::mode_t mode)
{
  std::ostringstream os;
  os << std::setfill('0') << std::setw(7) << std::oct << mode;
  return os.str();
}

} // namespace (anon)

// Implementations.

void check_channel_metadata(const struct ::stat& stat_buf, util::user_id_t expected_owner, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { check_channel_metadata(stat_buf, expected_owner, actual_err_code); },
         err_code, "channel::check_channel_metadata()"))
  {
    return;
  }
  // else

  if (!S_ISFIFO(stat_buf.st_mode))
  {
    *err_code = error::Code::S_CHANNEL_NOT_FIFO;
  }
  else if ((stat_buf.st_mode & util::NON_OWNER_READ_WRITE_PERMISSIONS_MASK) != 0)
  {
    *err_code = error::Code::S_CHANNEL_PERMISSIONS_TOO_OPEN;
  }
  else if (stat_buf.st_uid != expected_owner)
  {
    *err_code = error::Code::S_CHANNEL_OWNER_MISMATCH;
  }
  else
  {
    err_code->clear();
  }
} // check_channel_metadata()

void validate_channel_trust(flow::log::Logger* logger_ptr, const util::Native_handle& handle,
                            util::user_id_t expected_owner, Error_code* err_code)
{
  using boost::system::system_category;
  using ::fstat;
  using ::fcntl;
  // using ::O_NONBLOCK; // A macro apparently.
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { validate_channel_trust(logger_ptr, handle, expected_owner, actual_err_code); },
         err_code, "channel::validate_channel_trust()"))
  {
    return;
  }
  // else

  assert((!handle.null()) && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHANNEL);

  struct ::stat stat_buf;
  if (fstat(handle.native_handle(), &stat_buf) == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Channel handle [" << handle << "]: fstat() failed; cannot establish trust.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return;
  }
  // else

  check_channel_metadata(stat_buf, expected_owner, err_code);
  if (*err_code)
  {
    // Keep the particulars out of anything but the most verbose logging.
    FLOW_LOG_WARNING("Channel handle [" << handle << "]: Refusing to write to an untrusted channel.");
    FLOW_LOG_TRACE("Channel handle [" << handle << "]: Trust failure [" << *err_code << "] "
                   "[" << err_code->message() << "]; mode [" << octal_mode_str(stat_buf.st_mode) << "]; "
                   "owner [" << stat_buf.st_uid << "] versus expected [" << expected_owner << "].");
    return;
  }
  // else

  // The probe needed O_NONBLOCK to detect a missing reader; the write should simply wait for the reader.
  const int flags = fcntl(handle.native_handle(), F_GETFL);
  if ((flags == -1) || (fcntl(handle.native_handle(), F_SETFL, flags & ~O_NONBLOCK) == -1))
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Channel handle [" << handle << "]: Trusted, but could not switch to blocking mode.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return;
  }
  // else

  FLOW_LOG_TRACE("Channel handle [" << handle << "]: Trusted; now in blocking mode.");
  err_code->clear();
} // validate_channel_trust()

} // namespace solo::channel
