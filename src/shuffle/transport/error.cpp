/* Flow-Shuffle: Core
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
#include "shuffle/transport/error.hpp"
#include "shuffle/util/util_fwd.hpp"

namespace shuffle::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the shuffle::transport module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::name()` and `Error_code::message()`).
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
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging
   * #Error_code).
   *
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
  /* Assign Category as the category for shuffle::transport::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

bool is_transient(const Error_code& err_code)
{
  using boost::system::system_category;
  using boost::system::generic_category;
  namespace asio_error = boost::asio::error;

  if (!err_code)
  {
    return false;
  }
  // else

  const auto& category = err_code.category();
  if (category == Category::S_CATEGORY)
  {
    switch (static_cast<Code>(err_code.value()))
    {
    case Code::S_CONNECTION_CLOSED:
    case Code::S_CONNECTION_IDLE_TIMEOUT:
    case Code::S_CONNECT_TIMEOUT:
      return true;
    default:
      return false;
    }
  }
  // else: Not ours.  The OS and boost.asio codes are all I/O of one kind or another.

  return (category == system_category())
         || (category == generic_category())
         || (category == asio_error::get_misc_category())
         || (category == asio_error::get_netdb_category())
         || (category == asio_error::get_addrinfo_category());
} // is_transient()

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "shuffle/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_CONNECTION_CLOSED:
    return "Connection closed (gracefully or otherwise) before the request could complete.";
  case Code::S_CONNECTION_IDLE_TIMEOUT:
    return "Connection saw neither reads nor writes for longer than the configured connection timeout while "
           "requests were outstanding; it was presumed dead and closed.";
  case Code::S_CONNECT_TIMEOUT:
    return "Connection could not be established within the configured connection timeout.";
  case Code::S_FRAME_INVALID:
    return "Incoming frame header specified a length below the minimum or above the maximum; the connection must "
           "close.";
  case Code::S_MESSAGE_DECODE_FAILED:
    return "Incoming frame could not be decoded into a message (truncated field or unknown message type).";
  case Code::S_REMOTE_REQUEST_FAILED:
    return "Opposing side reported that it failed to serve the request; details were logged on receipt.";
  case Code::S_BLOCK_NOT_FOUND:
    return "Block store does not contain a block with the requested ID.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against the API spec.";
  case Code::S_CONFIG_INVALID_VALUE:
    return "A configuration value could not be parsed or is out of range.";
  case Code::S_FETCH_START_FAILED:
    return "Block fetch starter threw an exception carrying no system error code; its message was logged.";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";
  case Code::S_RPC_HANDLER_UNSUPPORTED:
    return "The RPC handler does not support this kind of request.";

  case Code::S_MESSAGE_TOO_LARGE:
    return "Message would encode to a frame larger than the maximum frame size the opposing side accepts.";

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
  case Code::S_CONNECTION_CLOSED:
    return "CONNECTION_CLOSED";
  case Code::S_CONNECTION_IDLE_TIMEOUT:
    return "CONNECTION_IDLE_TIMEOUT";
  case Code::S_CONNECT_TIMEOUT:
    return "CONNECT_TIMEOUT";
  case Code::S_FRAME_INVALID:
    return "FRAME_INVALID";
  case Code::S_MESSAGE_DECODE_FAILED:
    return "MESSAGE_DECODE_FAILED";
  case Code::S_REMOTE_REQUEST_FAILED:
    return "REMOTE_REQUEST_FAILED";
  case Code::S_BLOCK_NOT_FOUND:
    return "BLOCK_NOT_FOUND";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_CONFIG_INVALID_VALUE:
    return "CONFIG_INVALID_VALUE";
  case Code::S_FETCH_START_FAILED:
    return "FETCH_START_FAILED";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";
  case Code::S_RPC_HANDLER_UNSUPPORTED:
    return "RPC_HANDLER_UNSUPPORTED";

  case Code::S_MESSAGE_TOO_LARGE:
    return "MESSAGE_TOO_LARGE";

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

} // namespace shuffle::transport::error
