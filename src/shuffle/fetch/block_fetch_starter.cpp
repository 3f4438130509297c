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
#include "shuffle/fetch/block_fetch_starter.hpp"
#include "shuffle/fetch/block_fetching_listener.hpp"
#include "shuffle/transport/error.hpp"
#include <boost/system/system_error.hpp>

namespace shuffle::fetch
{

// Free functions: Forward declarations.

namespace
{

/**
 * The nested-exception part of fetch_start_error_code(): the transient code of the `system_error` nested (at any
 * depth) in `exc`, or success if none.
 *
 * @param exc
 *        An exception.
 * @return See above.
 */
Error_code nested_transient_error_code(const std::exception& exc);

} // namespace (anon)

// Implementations.

Block_fetching_listener::~Block_fetching_listener() = default;

Block_fetch_starter::~Block_fetch_starter() = default;

Error_code fetch_start_error_code(flow::log::Logger* logger_ptr, const std::exception& exc)
{
  using boost::system::system_error;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_FETCH);

  if (const auto sys_exc = dynamic_cast<const system_error*>(&exc))
  {
    return sys_exc->code();
  }
  // else

  if (const auto err_code = nested_transient_error_code(exc))
  {
    FLOW_LOG_TRACE("Fetch-start exception [" << exc.what() << "] wraps transient error [" << err_code << "] "
                   "[" << err_code.message() << "].");
    return err_code;
  }
  // else

  FLOW_LOG_WARNING("Fetch-start exception [" << exc.what() << "] carries no transient system error; treating it as "
                   "permanent.");
  return transport::error::Code::S_FETCH_START_FAILED;
} // fetch_start_error_code()

namespace
{

Error_code nested_transient_error_code(const std::exception& exc)
{
  using boost::system::system_error;
  using std::nested_exception;

  const auto nested = dynamic_cast<const nested_exception*>(&exc);
  if ((!nested) || (!nested->nested_ptr()))
  {
    return Error_code();
  }
  // else

  try
  {
    nested->rethrow_nested();
  }
  catch (const system_error& cause)
  {
    if (transport::error::is_transient(cause.code()))
    {
      return cause.code();
    }
    // else
    return nested_transient_error_code(cause);
  }
  catch (const std::exception& cause)
  {
    return nested_transient_error_code(cause);
  }
  // A non-std::exception cause propagates: create_and_start() contract allows only std::exception trees.

  assert(false && "rethrow_nested() with non-null nested_ptr() must throw.");
  return Error_code();
} // nested_transient_error_code()

} // namespace (anon)

} // namespace shuffle::fetch
