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
#include "shuffle/transport/transport_conf.hpp"
#include <flow/log/log.hpp>
#include <flow/async/concurrent_task_loop.hpp>
#include <flow/util/util.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/identity.hpp>
#include <memory>

namespace shuffle::fetch
{

// Types.

/**
 * Fetches a list of blocks through a Block_fetch_starter, re-requesting those that fail with transient errors, and
 * guaranteeing the user's Block_fetching_listener exactly one outcome per block.
 *
 * ### Semantics ###
 * The fetcher keeps the *outstanding set*: the block IDs not yet resolved, in original (first-appearance) order.
 * Each *attempt* hands the entire outstanding set, in order, to the starter, along with a fresh internal listener
 * bound to the attempt's *generation* number.  Then:
 *   - A success for an outstanding block removes it and forwards the success to the user.
 *   - A failure for an outstanding block with a *retryable* error -- transient per transport::error::is_transient()
 *     and with fewer than Transport_conf::max_io_retries() retries done so far -- leaves the block outstanding and
 *     triggers a retry: the retry count and generation are incremented, and after Transport_conf::io_retry_wait()
 *     a new attempt is made (on a thread of the retry pool) for everything still outstanding.
 *   - A failure with a non-retryable error removes the block and forwards the failure to the user.
 *   - Any outcome reported by a listener of an earlier generation, or for a block no longer outstanding, is
 *     silently dropped.  So: once a retry begins, stragglers of the superseded attempt cannot deliver anything;
 *     and no block is ever delivered twice.
 *
 * If the starter throws (cannot start the attempt at all), every block of that attempt is deemed failed with the
 * error given by fetch_start_error_code(); one retry decision is made for the whole batch.  If not retryable, every
 * block of the batch still outstanding fails.
 *
 * ### Threading, lifetime ###
 * start() runs the first attempt synchronously in the calling thread (and never throws).  Retries run on the
 * retry pool given to create(); since a starter may block (e.g., while connecting), the pool should have more than
 * one thread when it serves many fetchers.  Listener callbacks come from whatever threads the starter's completions
 * arrive on; they are never invoked while the internal mutex is held.  The fetcher is always held by `shared_ptr`;
 * in-flight attempts and scheduled retries keep it alive, so the user need not keep a reference after start().
 *
 * A retry scheduled on a retry pool that is then stopped never runs.  So the owner of the pool, before stopping it
 * for good, should shut_down() every fetcher still using it; shut_down() gives each outstanding block its outcome.
 */
class Retrying_block_fetcher :
  public flow::log::Log_context,
  public std::enable_shared_from_this<Retrying_block_fetcher>
{
public:
  // Constructors/destructor.

  /**
   * Creates the fetcher.  Nothing is fetched until start().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param conf
   *        Supplies the retry budget (Transport_conf::max_io_retries()) and delay (Transport_conf::io_retry_wait()).
   * @param retry_pool
   *        Started thread pool on which retries are scheduled.  Must outlive the fetcher's activity.
   * @param starter
   *        Starts each attempt.
   * @param block_ids
   *        Blocks to fetch.  Duplicates are fetched (and reported) once.
   * @param listener
   *        The user's listener.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_INVALID_ARGUMENT (empty `block_ids`).
   * @return The fetcher; null on error.
   */
  static std::shared_ptr<Retrying_block_fetcher>
    create(flow::log::Logger* logger_ptr, const transport::Transport_conf& conf,
           flow::async::Concurrent_task_loop* retry_pool, Block_fetch_starter_ptr starter,
           const Block_ids& block_ids, Block_fetching_listener_ptr listener, Error_code* err_code = 0);

  // Methods.

  /// Makes the first attempt, synchronously.  Call once.
  void start();

  /**
   * Ends the fetch early: every block still outstanding is removed and fails, on the user's listener, with
   * transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, from the calling thread.  Anything the
   * current attempt or a scheduled retry reports afterwards is dropped.  Idempotent; a no-op once every block has
   * its outcome.
   */
  void shut_down();

  /**
   * Number of retries initiated so far.
   * @return See above.
   */
  unsigned int retry_count() const;

  /**
   * Number of blocks not yet delivered to the user's listener.
   * @return See above.
   */
  size_t num_outstanding() const;

private:
  // Types.

  class Attempt_listener;

  /// The outstanding set: insertion-ordered, unique, with fast lookup by ID.
  using Outstanding_set
    = boost::multi_index::multi_index_container
        <std::string,
         boost::multi_index::indexed_by
           <boost::multi_index::sequenced<>,
            boost::multi_index::hashed_unique<boost::multi_index::identity<std::string>>>>;

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock over #Mutex.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param conf
   *        See create().
   * @param retry_pool
   *        See create().
   * @param starter
   *        See create().
   * @param block_ids
   *        See create().  Not empty.
   * @param listener
   *        See create().
   */
  explicit Retrying_block_fetcher(flow::log::Logger* logger_ptr, const transport::Transport_conf& conf,
                                  flow::async::Concurrent_task_loop* retry_pool, Block_fetch_starter_ptr starter,
                                  const Block_ids& block_ids, Block_fetching_listener_ptr listener);

  // Methods.

  /// Makes one attempt for everything outstanding.
  void fetch_all_outstanding();

  /**
   * Whether a failure with the given error should be retried.  #m_mutex must be locked.
   *
   * @param err_code
   *        The failure.
   * @return See above.
   */
  bool is_retryable_while_locked(const Error_code& err_code) const;

  /**
   * Increments the retry count and generation, thus invalidating every existing Attempt_listener.  #m_mutex must
   * be locked.  schedule_retry() must follow, outside the lock.
   */
  void initiate_retry_while_locked();

  /// Schedules fetch_all_outstanding() on the retry pool after the retry wait.  #m_mutex must not be locked.
  void schedule_retry();

  /**
   * Handles a success reported by the Attempt_listener of the given generation.
   *
   * @param generation
   *        The reporting listener's generation.
   * @param block_id
   *        See Block_fetching_listener.
   * @param data
   *        See Block_fetching_listener.
   */
  void on_attempt_success(uint64_t generation, const std::string& block_id, const Block_data_ptr& data);

  /**
   * Handles a failure reported by the Attempt_listener of the given generation.
   *
   * @param generation
   *        The reporting listener's generation.
   * @param block_id
   *        See Block_fetching_listener.
   * @param err_code
   *        See Block_fetching_listener.
   */
  void on_attempt_failure(uint64_t generation, const std::string& block_id, const Error_code& err_code);

  // Data.

  /// Retry budget.
  const unsigned int m_max_retries;

  /// Delay before each retry.
  const util::Fine_duration m_retry_wait;

  /// Pool on which retries run.
  flow::async::Concurrent_task_loop* const m_retry_pool;

  /// See ctor.
  const Block_fetch_starter_ptr m_starter;

  /// The user's listener.
  const Block_fetching_listener_ptr m_listener;

  /// Protects the following data.
  mutable Mutex m_mutex;

  /// Blocks not yet delivered to #m_listener.  Protected by #m_mutex.
  Outstanding_set m_outstanding;

  /// See retry_count().  Protected by #m_mutex.
  unsigned int m_retry_count;

  /// The only generation whose Attempt_listener may still deliver.  Protected by #m_mutex.
  uint64_t m_generation;
}; // class Retrying_block_fetcher

} // namespace shuffle::fetch
