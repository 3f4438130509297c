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

#include "shuffle/transport/transport_fwd.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * Flow-Shuffle module providing the retry and delivery discipline for fetching named blocks.  See namespace
 * ::shuffle doc header for an overview of Flow-Shuffle modules.  A synopsis follows.
 *
 * A Block_fetch_starter is anything that, given an ordered list of block IDs and a Block_fetching_listener, starts
 * fetching them and later reports each one's outcome to the listener.  One_for_one_block_fetcher, driven from a
 * fresh shuffle::transport::Transport_client, is the stock implementation.
 *
 * Retrying_block_fetcher wraps a starter so that blocks failing with transient errors are re-requested (all
 * outstanding ones together, in their original order) up to the configured budget, and so that the user's
 * listener hears exactly once about each block, no matter how completions of superseded attempts interleave.
 *
 * Shuffle_client puts it all together: `fetch_blocks(host, port, ids, listener)`.
 */
namespace shuffle::fetch
{

// Types.

// Find doc headers near the bodies of these compound types.

class Block_fetching_listener;
class Block_fetch_starter;
class Retrying_block_fetcher;
class One_for_one_block_fetcher;
class Shuffle_client;

/// Payload of one successfully fetched block.  Never null when delivered to a listener (but possibly empty).
using Block_data_ptr = util::Blob_ptr;

/// Short-hand for ref-counted pointer to Block_fetching_listener.
using Block_fetching_listener_ptr = std::shared_ptr<Block_fetching_listener>;

/// Short-hand for ref-counted pointer to Block_fetch_starter.
using Block_fetch_starter_ptr = std::shared_ptr<Block_fetch_starter>;

/// Short-hand for the ordered list of block IDs of one fetch.
using Block_ids = std::vector<std::string>;

} // namespace shuffle::fetch
