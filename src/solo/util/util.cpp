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
#include "solo/util/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <sys/stat.h>

namespace solo::util
{

// Initializations.

const unsigned int NON_OWNER_READ_WRITE_PERMISSIONS_MASK = 0b000110110; // a/k/a 0066.
const Permissions OWNER_ONLY_PERMISSIONS(0b110000000); // a/k/a 0600.

// Implementations.

void set_resource_permissions(flow::log::Logger* logger_ptr, const fs::path& path,
                              const Permissions& perms, Error_code* err_code)
{
  using boost::system::system_category;
  using ::chmod;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { set_resource_permissions(logger_ptr, path, perms, actual_err_code); },
         err_code, "util::set_resource_permissions()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  /* There's fs::permissions(path), but it reports errors its own way, and we want the errno verbatim.
   * No fchmod() on a descriptor either: see doc header as to why we won't open the thing. */
  if (chmod(path.c_str(), perms.get_permissions()) == -1)
  {
    *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Tried to set permissions of resource at [" << path << "] but encountered "
                     "error [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  err_code->clear();
  // As promised don't log anything else (not even TRACE) and leave that to the caller if desired.
} // set_resource_permissions()

bool is_url(String_view filename)
{
  const auto colon_pos = filename.find(':');
  if ((colon_pos == String_view::npos) || (colon_pos == 0))
  {
    return false;
  }
  // else

  // Locale-independent on purpose: isalpha() might accept who-knows-what in some locales.
  for (size_t idx = 0; idx != colon_pos; ++idx)
  {
    const char ch = filename[idx];
    if (!(((ch >= 'a') && (ch <= 'z')) || ((ch >= 'A') && (ch <= 'Z'))))
    {
      return false;
    }
  }
  return true;
} // is_url()

std::string normalize_file_arg(const std::string& arg, const fs::path& base_dir)
{
  using fs::path;

  assert((!arg.empty()) && "Disallowed per contract.");
  assert(base_dir.is_absolute() && "Disallowed per contract.");

  if (is_url(arg))
  {
    return arg;
  }
  // else

  /* With an explicit base, fs::absolute() does not touch the file system at all; lexically_normal() resolves
   * `.` and `..` textually.  The latter represents a trailing separator as a trailing "." element, which we strip,
   * so that e.g. "dir/" and "dir" yield the same "/cwd/dir". */
  path result = fs::absolute(path(arg), base_dir).lexically_normal();
  while ((result.filename() == ".") && result.has_parent_path() && (result != result.root_path()))
  {
    result = result.parent_path();
  }
  return result.string();
} // normalize_file_arg()

std::vector<std::string> normalize_file_args(const std::vector<std::string>& args, Error_code* err_code)
{
  using std::vector;
  using std::string;

  vector<string> entries;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> vector<string>
           { return normalize_file_args(args, actual_err_code); },
         &entries, err_code, "util::normalize_file_args()"))
  {
    return entries;
  }
  // else

  fs::path cwd; // Looked up on first relative path.
  entries.reserve(args.size());
  for (const auto& arg : args)
  {
    if (cwd.empty() && (!is_url(arg)) && fs::path(arg).is_relative())
    {
      // The no-throw overload: a removed working directory is an error to report, not to throw.
      cwd = fs::current_path(*err_code);
      if (*err_code)
      {
        return vector<string>();
      }
    }
    entries.emplace_back(normalize_file_arg(arg, cwd.empty() ? fs::path("/") : cwd));
  }

  err_code->clear();
  return entries;
} // normalize_file_args()

} // namespace solo::util
