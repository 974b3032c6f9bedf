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
#include "solo/error.hpp"
#include "solo/util/util_fwd.hpp"

namespace solo::error
{

// Types.

/**
 * The boost.system category for errors returned by Solo.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * This class's declaration is not available outside this translation unit, and its logic is accessed
 * indirectly through standard boost.system machinery (`Error_code::name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

bool is_security_error(const Error_code& err_code)
{
  return (err_code == Code::S_CHANNEL_NOT_FIFO)
         || (err_code == Code::S_CHANNEL_PERMISSIONS_TOO_OPEN)
         || (err_code == Code::S_CHANNEL_OWNER_MISMATCH);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "solo";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_USER_IDENTITY_UNKNOWN:
    return "Unable to determine the invoking user's name; refusing to fall back to a shared or guessable "
           "channel name.";
  case Code::S_CHANNEL_NOT_FIFO:
    return "Channel failed trust validation: the object at the channel path is not a named pipe.";
  case Code::S_CHANNEL_PERMISSIONS_TOO_OPEN:
    return "Channel failed trust validation: the channel grants read or write permission to group or others.";
  case Code::S_CHANNEL_OWNER_MISMATCH:
    return "Channel failed trust validation: the channel is not owned by the invoking user.";
  case Code::S_RECEIVER_EXITED_NON_ZERO:
    return "The newly launched receiver process exited with a non-zero exit code.";
  case Code::S_RECEIVER_KILLED_BY_SIGNAL:
    return "The newly launched receiver process was terminated by a signal.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against the API spec.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_USER_IDENTITY_UNKNOWN:
    return "USER_IDENTITY_UNKNOWN";
  case Code::S_CHANNEL_NOT_FIFO:
    return "CHANNEL_NOT_FIFO";
  case Code::S_CHANNEL_PERMISSIONS_TOO_OPEN:
    return "CHANNEL_PERMISSIONS_TOO_OPEN";
  case Code::S_CHANNEL_OWNER_MISMATCH:
    return "CHANNEL_OWNER_MISMATCH";
  case Code::S_RECEIVER_EXITED_NON_ZERO:
    return "RECEIVER_EXITED_NON_ZERO";
  case Code::S_RECEIVER_KILLED_BY_SIGNAL:
    return "RECEIVER_KILLED_BY_SIGNAL";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace solo::error
