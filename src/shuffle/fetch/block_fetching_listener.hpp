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

namespace shuffle::fetch
{

// Types.

/**
 * Receiver of per-block fetch outcomes.  Whoever is handed a listener (a Block_fetch_starter, or the user's
 * listener given to Retrying_block_fetcher) calls exactly one of the two methods once per requested block ID.
 *
 * Calls may come from any thread, concurrently for different blocks; and they are never made while an internal
 * lock of the caller is held, so an implementation may call back into the fetch machinery.
 */
class Block_fetching_listener
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Block_fetching_listener();

  // Methods.

  /**
   * Block `block_id` was fetched.
   *
   * @param block_id
   *        Block ID.
   * @param data
   *        Its payload.  Not null.
   */
  virtual void on_block_fetch_success(const std::string& block_id, const Block_data_ptr& data) = 0;

  /**
   * Block `block_id` could not be fetched.
   *
   * @param block_id
   *        Block ID.
   * @param err_code
   *        Why.  Truthy.
   */
  virtual void on_block_fetch_failure(const std::string& block_id, const Error_code& err_code) = 0;
}; // class Block_fetching_listener

} // namespace shuffle::fetch
