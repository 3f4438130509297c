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
#include <atomic>
#include <memory>

namespace shuffle::fetch
{

// Types.

/**
 * Fetches a list of blocks over one Transport_client, one `fetch_block()` request per block, all issued at once in
 * list order; each completion is reported to the listener as it arrives.  Once every block is reported, the client
 * is closed.
 *
 * Held by `shared_ptr`; the pending requests keep it alive.
 */
class One_for_one_block_fetcher :
  public flow::log::Log_context,
  public std::enable_shared_from_this<One_for_one_block_fetcher>
{
public:
  // Constructors/destructor.

  /**
   * Creates the fetcher.  Nothing is requested until start().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param client
   *        Connection to the server holding the blocks.  Becomes owned: closed when done.
   * @param block_ids
   *        Blocks.  Each element is requested (and reported) once, duplicates included.
   * @param listener
   *        Receives each block's outcome.
   * @return See above.
   */
  static std::shared_ptr<One_for_one_block_fetcher>
    create(flow::log::Logger* logger_ptr, transport::Transport_client_ptr client, const Block_ids& block_ids,
           Block_fetching_listener_ptr listener);

  // Methods.

  /// Issues the requests.  Call once.
  void start();

private:
  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param client
   *        See create().
   * @param block_ids
   *        See create().
   * @param listener
   *        See create().
   */
  explicit One_for_one_block_fetcher(flow::log::Logger* logger_ptr, transport::Transport_client_ptr client,
                                     const Block_ids& block_ids, Block_fetching_listener_ptr listener);

  // Methods.

  /**
   * Completion of one request.
   *
   * @param block_id
   *        Its block.
   * @param err_code
   *        Its result.
   * @param data
   *        Its payload, if successful.
   */
  void on_fetch_done(const std::string& block_id, const Error_code& err_code, const Block_data_ptr& data);

  // Data.

  /// See create().
  const transport::Transport_client_ptr m_client;

  /// See create().
  const Block_ids m_block_ids;

  /// See create().
  const Block_fetching_listener_ptr m_listener;

  /// How many requests have not yet completed.  When it hits 0 the client is closed.
  std::atomic<size_t> m_n_remaining;
}; // class One_for_one_block_fetcher

} // namespace shuffle::fetch
