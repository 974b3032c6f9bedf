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

#include "solo/util/process_credentials.hpp"
#include "solo/util/native_handle.hpp"
#include "solo/common.hpp"
#include <type_traits>

namespace solo::test
{

// Types.

/**
 * A fresh, empty, owner-only (0700) directory under the system temp directory; removed recursively (with contents)
 * on destruction.  Tests put channels and scratch files here instead of the real channel directory.
 */
class Temp_dir
{
public:
  /// Creates the directory.  Throws on failure (`boost::filesystem::filesystem_error`).
  Temp_dir();

  /// Removes the directory tree; errors are ignored.
  ~Temp_dir();

  /// Forbid copying.
  Temp_dir(const Temp_dir&) = delete;
  /// Forbid copying.
  Temp_dir& operator=(const Temp_dir&) = delete;

  /**
   * The directory.
   * @return See above.
   */
  const fs::path& path() const;

private:
  /// See path().
  fs::path m_path;
}; // class Temp_dir

/**
 * Makes the working directory one that no longer exists (a fresh directory inside `parent`, entered and then
 * removed) for its lifetime; then restores the previous working directory.
 */
class Removed_working_dir
{
public:
  /**
   * Enters and removes the directory.  Fails the current test on error.
   *
   * @param parent
   *        Existing directory in which to create the doomed one.
   */
  explicit Removed_working_dir(const fs::path& parent);

  /// Restores the previous working directory.
  ~Removed_working_dir();

  /// Forbid copying.
  Removed_working_dir(const Removed_working_dir&) = delete;
  /// Forbid copying.
  Removed_working_dir& operator=(const Removed_working_dir&) = delete;

private:
  /// Working directory before construction.
  const fs::path m_saved_cwd;
}; // class Removed_working_dir

// Free functions.

/**
 * Returns this process's credentials.
 *
 * @return See above.
 */
const solo::util::Process_credentials& get_process_creds();

/**
 * Returns the user name of this process's effective user; fails the current test (and returns empty) if unknown.
 *
 * @return See above.
 */
std::string get_own_user_name();

/**
 * Writes `contents` to a new (truncated) file at `path`, optionally making it executable.
 *
 * @param path
 *        File path.
 * @param contents
 *        Contents.
 * @param executable
 *        Whether to `chmod` it 0700 (else 0600).
 */
void write_file(const fs::path& path, const std::string& contents, bool executable = false);

/**
 * Returns contents of file at `path` (empty if it cannot be read).
 *
 * @param path
 *        File path.
 * @return See above.
 */
std::string read_file(const fs::path& path);

/**
 * Opens the FIFO at `path` for reading, non-blocking, thus playing a (mute) receiver: after this a writer can open it.
 * Fails the current test (and returns a null handle) on error.
 *
 * @param path
 *        FIFO path.
 * @return See above.
 */
solo::util::Native_handle open_fifo_reader(const fs::path& path);

/**
 * Reads whatever is currently buffered in the given non-blocking FIFO reader.
 *
 * @param reader
 *        Handle from open_fifo_reader().
 * @return See above.
 */
std::string read_available(const solo::util::Native_handle& reader);

/**
 * Converts an `enum` value to its underlying integer.
 *
 * @tparam Enum
 *         Enum type.
 * @param e
 *         Value.
 * @return See above.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace solo::test
