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
#pragma once

#include "shuffle/fetch/fetch_fwd.hpp"
#include <flow/log/log.hpp>
#include <exception>

namespace shuffle::fetch
{

// Types.

/**
 * Something that can start fetching a list of blocks: the seam through which Retrying_block_fetcher issues each
 * attempt.  Typically an implementation opens a connection and runs a One_for_one_block_fetcher on it.
 */
class Block_fetch_starter
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Block_fetch_starter();

  // Methods.

  /**
   * Starts fetching the given blocks, reporting each one's outcome to `listener` exactly once (from any thread,
   * possibly synchronously from within this call).
   *
   * If the attempt cannot even be started (e.g., the connection cannot be made), this throws; then `listener` must
   * not be called for any block.  A thrown `boost::system::system_error` (such as `flow::error::Runtime_error`)
   * conveys its code, as does a `system_error` nested (via `std::throw_with_nested()`) inside the thrown
   * exception if that code is transient; see fetch_start_error_code().
   *
   * @param block_ids
   *        Block IDs, in the order they should be requested.  Not empty.
   * @param listener
   *        Receives outcomes.
   */
  virtual void create_and_start(const Block_ids& block_ids, const Block_fetching_listener_ptr& listener) = 0;
}; // class Block_fetch_starter

// Free functions.

/**
 * Maps an exception thrown by Block_fetch_starter::create_and_start() to the #Error_code that all the blocks of
 * that attempt are deemed to have failed with:
 *   - A `boost::system::system_error` (including `flow::error::Runtime_error`) => its code.
 *   - Otherwise, if it has a nested `boost::system::system_error` (at any depth) whose code is transient (see
 *     transport::error::is_transient()) => that code.
 *   - Otherwise => transport::error::Code::S_FETCH_START_FAILED (not transient).  The exception's `what()` is
 *     logged.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param exc
 *        What was thrown.
 * @return See above.  Truthy.
 */
Error_code fetch_start_error_code(flow::log::Logger* logger_ptr, const std::exception& exc);

} // namespace shuffle::fetch
