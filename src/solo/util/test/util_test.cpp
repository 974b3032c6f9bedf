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

#include "solo/util/util_fwd.hpp"
#include "solo/util/native_handle.hpp"
#include "solo/util/process_credentials.hpp"
#include "solo/error.hpp"
#include "solo/test/test_common_util.hpp"
#include "solo/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace solo::util::test
{

using solo::test::Temp_dir;
using solo::test::Test_logger;

/// Tests is_url().
TEST(Util_test, Is_url)
{
  EXPECT_TRUE(is_url("http://example.com/a.mkv"));
  EXPECT_TRUE(is_url("ytdl://abc"));
  EXPECT_TRUE(is_url("dvd:"));
  EXPECT_TRUE(is_url("C:foo"));

  EXPECT_FALSE(is_url("movie.mkv"));
  EXPECT_FALSE(is_url(":leading-colon"));
  EXPECT_FALSE(is_url("rtmp2://x")); // Digit before the colon.
  EXPECT_FALSE(is_url("dir/a:b"));
  EXPECT_FALSE(is_url("./a:b"));
  EXPECT_FALSE(is_url(""));
}

/// Tests normalize_file_arg() and normalize_file_args().
TEST(Util_test, Normalize_file_arg)
{
  const fs::path base("/base/dir");
  EXPECT_EQ(normalize_file_arg("/x/y/./z/", base), "/x/y/z");
  EXPECT_EQ(normalize_file_arg("/x/y/../z", base), "/x/z");
  EXPECT_EQ(normalize_file_arg("/x//y", base), "/x/y");
  EXPECT_EQ(normalize_file_arg("/", base), "/");
  EXPECT_EQ(normalize_file_arg("/movie with spaces.mkv", base), "/movie with spaces.mkv");

  // URLs pass through untouched, even if they look "unnormalized."
  EXPECT_EQ(normalize_file_arg("http://example.com/a/../b/", base), "http://example.com/a/../b/");

  EXPECT_EQ(normalize_file_arg("rel.mkv", base), "/base/dir/rel.mkv");
  EXPECT_EQ(normalize_file_arg("sub/../rel.mkv", base), "/base/dir/rel.mkv");
  EXPECT_EQ(normalize_file_arg("../up.mkv", base), "/base/up.mkv");
  // Trailing separator does not matter.
  EXPECT_EQ(normalize_file_arg("dir/", base), "/base/dir/dir");

  const auto cwd = fs::current_path();
  const std::vector<std::string> args{ "/a.mkv", "https://b", "c.mkv" };
  Error_code err_code;
  const auto entries = normalize_file_args(args, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0], "/a.mkv");
  EXPECT_EQ(entries[1], "https://b");
  EXPECT_EQ(entries[2], (cwd / "c.mkv").string());
}

/// Tests normalize_file_args() when the working directory has been removed.
TEST(Util_test, Normalize_without_working_dir)
{
  Temp_dir dir;
  const solo::test::Removed_working_dir removed_cwd(dir.path());

  // Relative paths cannot be resolved: reported, not thrown at the caller who asked for an Error_code.
  Error_code err_code;
  EXPECT_TRUE(normalize_file_args({ "/a.mkv", "rel.mkv" }, &err_code).empty());
  EXPECT_EQ(err_code, boost::system::errc::no_such_file_or_directory);
  EXPECT_THROW(normalize_file_args({ "rel.mkv" }), flow::error::Runtime_error);

  // Nothing else needs the working directory.
  const auto entries = normalize_file_args({ "/a/./b.mkv", "https://c" }, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(entries, (std::vector<std::string>{ "/a/b.mkv", "https://c" }));
}

/// Tests set_resource_permissions().
TEST(Util_test, Resource_permissions)
{
  EXPECT_EQ(OWNER_ONLY_PERMISSIONS.get_permissions(), 0600u);
  EXPECT_EQ(OWNER_ONLY_PERMISSIONS.get_permissions() & NON_OWNER_READ_WRITE_PERMISSIONS_MASK, 0u);

  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "file";
  solo::test::write_file(path, "x");

  Error_code err_code;
  set_resource_permissions(&logger, path, Permissions(0666), &err_code);
  EXPECT_FALSE(err_code);
  struct ::stat stat_buf;
  ASSERT_EQ(::stat(path.c_str(), &stat_buf), 0);
  EXPECT_EQ(stat_buf.st_mode & 0777, 0666u);

  set_resource_permissions(&logger, dir.path() / "nope", OWNER_ONLY_PERMISSIONS, &err_code);
  EXPECT_EQ(err_code, boost::system::errc::no_such_file_or_directory);

  EXPECT_THROW(set_resource_permissions(&logger, dir.path() / "nope", OWNER_ONLY_PERMISSIONS),
               flow::error::Runtime_error);
}

/// Tests Native_handle ownership semantics.
TEST(Native_handle_test, Ownership)
{
  Native_handle null_handle;
  EXPECT_TRUE(null_handle.null());
  EXPECT_EQ(null_handle.native_handle(), Native_handle::S_NULL_HANDLE);

  const int raw_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  ASSERT_NE(raw_fd, -1);

  Native_handle handle(raw_fd);
  EXPECT_FALSE(handle.null());
  EXPECT_EQ(handle.native_handle(), raw_fd);

  Native_handle moved(std::move(handle));
  EXPECT_TRUE(handle.null());
  EXPECT_EQ(moved.native_handle(), raw_fd);

  null_handle = std::move(moved);
  EXPECT_TRUE(moved.null());
  EXPECT_EQ(null_handle.native_handle(), raw_fd);

  const auto released = null_handle.release();
  EXPECT_EQ(released, raw_fd);
  EXPECT_TRUE(null_handle.null());
  EXPECT_NE(::fcntl(released, F_GETFD), -1); // Still open: release() does not close.

  {
    Native_handle owner(released);
  }
  EXPECT_EQ(::fcntl(released, F_GETFD), -1); // Closed by the destructor.
}

/// Tests Process_credentials.
TEST(Process_credentials_test, Interface)
{
  const auto creds = Process_credentials::own_process_credentials();
  EXPECT_EQ(creds.user_id(), ::geteuid());
  EXPECT_EQ(creds.user_id(), Process_credentials::own_user_id());

  Error_code err_code;
  const auto name = creds.user_name(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(name.empty());
  EXPECT_EQ(name.find('/'), std::string::npos);

  // A user ID no account has.
  const Process_credentials stranger(user_id_t(3999999999u));
  EXPECT_TRUE(stranger.user_name(&err_code).empty());
  EXPECT_EQ(err_code, error::Code::S_USER_IDENTITY_UNKNOWN);
  EXPECT_THROW(stranger.user_name(), flow::error::Runtime_error);
}

} // namespace solo::util::test
