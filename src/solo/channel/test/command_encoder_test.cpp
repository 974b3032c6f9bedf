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

#include "solo/channel/command_encoder.hpp"
#include <gtest/gtest.h>

namespace solo::channel::test
{

namespace
{

/// Undoes escape_path(), the way the receiver's command parser would.
std::string unescape(const std::string& escaped)
{
  std::string result;
  for (size_t idx = 0; idx != escaped.size(); ++idx)
  {
    if ((escaped[idx] == '\\') && ((idx + 1) != escaped.size()))
    {
      const char next = escaped[++idx];
      result += (next == 'n') ? '\n' : next;
    }
    else
    {
      result += escaped[idx];
    }
  }
  return result;
}

} // namespace (anon)

/// Tests escaping of the special characters.
TEST(Command_encoder_test, Escape)
{
  EXPECT_EQ(escape_path("/plain/path.mkv"), "/plain/path.mkv");
  EXPECT_EQ(escape_path("a\\b"), "a\\\\b");
  EXPECT_EQ(escape_path("a\"b"), "a\\\"b");
  EXPECT_EQ(escape_path("a\nb"), "a\\nb");
  // Backslash first, or the escapes added for the others would get doubled.
  EXPECT_EQ(escape_path("\\\"\n"), "\\\\\\\"\\n");
  EXPECT_EQ(escape_path(""), "");
  // Everything else is verbatim.
  EXPECT_EQ(escape_path("it's $HOME \t `x` 'y' \xC3\xA9"), "it's $HOME \t `x` 'y' \xC3\xA9");

  for (const std::string entry : { "/m/a \"b\".mkv", "/m/c\\d\\n.mkv", "/m/e\nf\n", "\\\\\"\"\n\n" })
  {
    const auto escaped = escape_path(entry);
    EXPECT_EQ(escaped.find('\n'), std::string::npos);
    EXPECT_EQ(unescape(escaped), entry);
  }
}

/// Tests the command line format.
TEST(Command_encoder_test, Commands)
{
  EXPECT_EQ(encode_loadfile_command("/m/x.mkv"), "raw loadfile \"/m/x.mkv\" append\n");
  EXPECT_EQ(encode_loadfile_command("http://h/a\"b"), "raw loadfile \"http://h/a\\\"b\" append\n");
  EXPECT_EQ(encode_loadfile_command("/m/a\nb"), "raw loadfile \"/m/a\\nb\" append\n");

  const auto lines = encode_loadfile_batch({ "/a", "/b", "/a" });
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "raw loadfile \"/a\" append\n");
  EXPECT_EQ(lines[1], "raw loadfile \"/b\" append\n");
  EXPECT_EQ(lines[2], lines[0]); // Duplicates are kept.
  EXPECT_TRUE(encode_loadfile_batch({}).empty());
}

} // namespace solo::channel::test
