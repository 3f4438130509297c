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
#include "shuffle/transport/transport_context.hpp"
#include <flow/log/log.hpp>
#include <flow/async/x_thread_task_loop.hpp>
#include <flow/util/util.hpp>
#include <boost/noncopyable.hpp>
#include <memory>
#include <vector>

namespace shuffle::fetch
{

// Types.

/**
 * The client side of block shuffling: fetches blocks from remote Transport_server instances (whose Rpc_handler
 * serves them via `get_block()`) with transparent retries per Retrying_block_fetcher.
 *
 * Each fetch_blocks() call, and each retry within it, opens a new connection; it is closed once all its blocks are
 * reported.  With Transport_conf::max_io_retries() of 0, fetch_blocks() makes exactly one attempt.  Retries run on
 * a pool of threads, so that a retry stuck connecting to one server does not hold up retries of other fetches.
 *
 * Destroying the Shuffle_client waits for retries in progress, then fails every block not yet reported with
 * transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, then closes all connections (stragglers from
 * those are dropped).  So every block passed to fetch_blocks() gets exactly one outcome.  Do not destroy it from a
 * listener callback.
 *
 * ### Thread safety ###
 * fetch_blocks() may be called concurrently, but not concurrently with the destructor.  It must not be called from
 * within a listener callback, as it blocks while connecting (see
 * transport::Transport_client_factory::create_client()).
 */
class Shuffle_client :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Constants.

  /// Default size of the retry pool.
  static constexpr size_t S_DEFAULT_N_RETRY_THREADS = 8;

  // Constructors/destructor.

  /**
   * Constructs the client and starts its threads.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param conf
   *        Connection timeout, retry budget and retry wait.
   * @param n_retry_threads
   *        Number of threads on which retries run.  At most this many retries can be connecting at once.  0 lets Flow
   *        choose, based on the hardware.
   */
  explicit Shuffle_client(flow::log::Logger* logger_ptr, const transport::Transport_conf& conf,
                          size_t n_retry_threads = S_DEFAULT_N_RETRY_THREADS);

  /// See class doc header.
  ~Shuffle_client();

  // Methods.

  /**
   * Fetches the given blocks from the given server, reporting each block's outcome to `listener` exactly once.
   * The first attempt is made synchronously, so this blocks for up to the connection timeout.
   *
   * @param host
   *        Server host.
   * @param port
   *        Server port.
   * @param block_ids
   *        Blocks.  Not empty.
   * @param listener
   *        Receives outcomes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_INVALID_ARGUMENT (empty `block_ids`; `listener` receives nothing).
   *        Any failure to reach the server is reported through `listener` instead.  Duplicates in `block_ids`
   *        are fetched (and reported) once.
   */
  void fetch_blocks(const std::string& host, uint16_t port, const Block_ids& block_ids,
                    const Block_fetching_listener_ptr& listener, Error_code* err_code = 0);

  /**
   * The transport context (client side; serves nothing).
   * @return See above.
   */
  const transport::Transport_context& context() const;

private:
  // Types.

  class Starter;

  // Methods.

  /**
   * Remembers `fetcher`, so that the destructor can shut it down; forgets fetchers that are done.
   * @param fetcher
   *        A new fetcher.
   */
  void track(const std::shared_ptr<Retrying_block_fetcher>& fetcher);

  // Data.

  /// Our transport context.  Its Rpc_handler rejects all requests from servers.
  transport::Transport_context m_context;

  /// Threads on which retries run.  Declared ahead of #m_client_factory, so it outlives the connections.
  flow::async::Cross_thread_task_loop m_retry_pool;

  /// Makes all our connections.
  std::unique_ptr<transport::Transport_client_factory> m_client_factory;

  /// Protects #m_fetchers.
  flow::util::Mutex_non_recursive m_fetchers_mutex;

  /// Fetchers that may still have blocks outstanding.  Protected by #m_fetchers_mutex.
  std::vector<std::weak_ptr<Retrying_block_fetcher>> m_fetchers;
}; // class Shuffle_client

} // namespace shuffle::fetch
