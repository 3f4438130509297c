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
#include "shuffle/fetch/retrying_block_fetcher.hpp"
#include "shuffle/fetch/block_fetch_starter.hpp"
#include "shuffle/fetch/block_fetching_listener.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/sched_task.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>

namespace shuffle::fetch
{

// Types.

/**
 * The listener handed to the starter for one attempt.  It forwards everything, tagged with its generation, to
 * the fetcher, which decides whether the report is still relevant.  It holds the fetcher alive.
 */
class Retrying_block_fetcher::Attempt_listener :
  public Block_fetching_listener
{
public:
  // Constructors/destructor.

  /**
   * Constructs listener.
   *
   * @param fetcher
   *        The fetcher.
   * @param generation
   *        The attempt's generation.
   */
  explicit Attempt_listener(std::shared_ptr<Retrying_block_fetcher> fetcher, uint64_t generation) :
    m_fetcher(std::move(fetcher)),
    m_generation(generation)
  {
    // That's it.
  }

  // Methods.

  /**
   * Implements interface.
   *
   * @param block_id
   *        See interface.
   * @param data
   *        See interface.
   */
  void on_block_fetch_success(const std::string& block_id, const Block_data_ptr& data) override
  {
    m_fetcher->on_attempt_success(m_generation, block_id, data);
  }

  /**
   * Implements interface.
   *
   * @param block_id
   *        See interface.
   * @param err_code
   *        See interface.
   */
  void on_block_fetch_failure(const std::string& block_id, const Error_code& err_code) override
  {
    m_fetcher->on_attempt_failure(m_generation, block_id, err_code);
  }

private:
  // Data.

  /// The fetcher.
  const std::shared_ptr<Retrying_block_fetcher> m_fetcher;

  /// The attempt's generation.
  const uint64_t m_generation;
}; // class Retrying_block_fetcher::Attempt_listener

// Implementations.

std::shared_ptr<Retrying_block_fetcher>
  Retrying_block_fetcher::create(flow::log::Logger* logger_ptr, const transport::Transport_conf& conf,
                                 flow::async::Concurrent_task_loop* retry_pool, Block_fetch_starter_ptr starter,
                                 const Block_ids& block_ids, Block_fetching_listener_ptr listener,
                                 Error_code* err_code) // Static.
{
  using flow::error::Runtime_error;

  if (block_ids.empty())
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_FETCH);
    FLOW_LOG_WARNING("Retrying block fetcher cannot be created for an empty list of blocks.");

    if (err_code)
    {
      *err_code = transport::error::Code::S_INVALID_ARGUMENT;
      return std::shared_ptr<Retrying_block_fetcher>();
    }
    // else
    throw Runtime_error(transport::error::Code::S_INVALID_ARGUMENT, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  return std::shared_ptr<Retrying_block_fetcher>
           (new Retrying_block_fetcher(logger_ptr, conf, retry_pool, std::move(starter), block_ids,
                                       std::move(listener)));
} // Retrying_block_fetcher::create()

Retrying_block_fetcher::Retrying_block_fetcher(flow::log::Logger* logger_ptr, const transport::Transport_conf& conf,
                                               flow::async::Concurrent_task_loop* retry_pool,
                                               Block_fetch_starter_ptr starter, const Block_ids& block_ids,
                                               Block_fetching_listener_ptr listener) :
  flow::log::Log_context(logger_ptr, Log_component::S_FETCH),
  m_max_retries(conf.max_io_retries()),
  m_retry_wait(conf.io_retry_wait()),
  m_retry_pool(retry_pool),
  m_starter(std::move(starter)),
  m_listener(std::move(listener)),
  m_retry_count(0),
  m_generation(0)
{
  for (const auto& block_id : block_ids)
  {
    // hashed_unique index rejects repeats; sequenced index keeps first-appearance order.
    m_outstanding.push_back(block_id);
  }

  FLOW_LOG_TRACE("Retrying block fetcher [" << this << "]: Created for [" << m_outstanding.size() << "] distinct "
                 "blocks (of [" << block_ids.size() << "] given); max retries [" << m_max_retries << "].");
}

void Retrying_block_fetcher::start()
{
  fetch_all_outstanding();
}

void Retrying_block_fetcher::fetch_all_outstanding()
{
  // We are in thread U (first attempt) or a retry pool thread.

  Block_ids block_ids;
  unsigned int retry_count;
  uint64_t generation;
  {
    Lock_guard lock(m_mutex);
    block_ids.assign(m_outstanding.begin(), m_outstanding.end());
    retry_count = m_retry_count;
    generation = m_generation;
  }

  if (block_ids.empty())
  {
    FLOW_LOG_TRACE("Retrying block fetcher [" << this << "]: Nothing outstanding; no attempt needed.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Retrying block fetcher [" << this << "]: Attempt of generation [" << generation << "] "
                 "(retry [" << retry_count << '/' << m_max_retries << "]) for [" << block_ids.size() << "] blocks.");

  const auto attempt_listener = std::make_shared<Attempt_listener>(shared_from_this(), generation);

  Error_code err_code;
  try
  {
    m_starter->create_and_start(block_ids, attempt_listener);
  }
  catch (const std::exception& exc)
  {
    err_code = fetch_start_error_code(get_logger(), exc);
    FLOW_LOG_WARNING("Retrying block fetcher [" << this << "]: Exception while beginning fetch of "
                     "[" << block_ids.size() << "] outstanding blocks (retry [" << retry_count << '/'
                     << m_max_retries << "]): [" << exc.what() << "]; deemed error [" << err_code << "] "
                     "[" << err_code.message() << "].");
  }

  if (!err_code)
  {
    return;
  }
  // else: The whole batch failed.  One retry decision for all of it.

  bool retry = false;
  Block_ids failed_ids;
  {
    Lock_guard lock(m_mutex);
    if (generation != m_generation)
    {
      /* Something (a listener callback made synchronously before the throw) already began a retry; it will cover
       * everything still outstanding. */
      return;
    }
    // else

    if (is_retryable_while_locked(err_code))
    {
      initiate_retry_while_locked();
      retry = true;
    }
    else
    {
      for (const auto& block_id : block_ids)
      {
        if (m_outstanding.get<1>().erase(block_id) != 0)
        {
          failed_ids.push_back(block_id);
        }
      }
      // Anything the starter may have managed to issue before throwing must not deliver now.
      ++m_generation;
    }
  } // Lock_guard lock(m_mutex);

  if (retry)
  {
    schedule_retry();
    return;
  }
  // else

  for (const auto& block_id : failed_ids)
  {
    FLOW_LOG_WARNING("Retrying block fetcher [" << this << "]: Giving up on block [" << block_id << "]: could not "
                     "begin fetch: [" << err_code << "] [" << err_code.message() << "].");
    m_listener->on_block_fetch_failure(block_id, err_code);
  }
} // Retrying_block_fetcher::fetch_all_outstanding()

bool Retrying_block_fetcher::is_retryable_while_locked(const Error_code& err_code) const
{
  return transport::error::is_transient(err_code) && (m_retry_count < m_max_retries);
}

void Retrying_block_fetcher::initiate_retry_while_locked()
{
  ++m_retry_count;
  ++m_generation;
}

void Retrying_block_fetcher::schedule_retry()
{
  using flow::util::schedule_task_from_now;
  using boost::chrono::milliseconds;
  using boost::chrono::round;

  unsigned int retry_count;
  size_t n_outstanding;
  {
    Lock_guard lock(m_mutex);
    retry_count = m_retry_count;
    n_outstanding = m_outstanding.size();
  }

  FLOW_LOG_INFO("Retrying block fetcher [" << this << "]: Retrying fetch ([" << retry_count << '/' << m_max_retries
                << "]) for [" << n_outstanding << "] outstanding blocks after [" << round<milliseconds>(m_retry_wait)
                << "].");

  schedule_task_from_now(get_logger(), m_retry_wait, true, m_retry_pool->task_engine().get(),
                         [self = shared_from_this()](bool)
  {
    // We are in a retry pool thread.
    self->fetch_all_outstanding();
  });
}

void Retrying_block_fetcher::on_attempt_success(uint64_t generation, const std::string& block_id,
                                                const Block_data_ptr& data)
{
  bool forward;
  {
    Lock_guard lock(m_mutex);
    forward = (generation == m_generation) && (m_outstanding.get<1>().erase(block_id) != 0);
  }

  if (forward)
  {
    m_listener->on_block_fetch_success(block_id, data);
  }
  else
  {
    FLOW_LOG_TRACE("Retrying block fetcher [" << this << "]: Dropping success of block [" << block_id << "] "
                   "from attempt generation [" << generation << "]: stale or already resolved.");
  }
}

void Retrying_block_fetcher::on_attempt_failure(uint64_t generation, const std::string& block_id,
                                                const Error_code& err_code)
{
  bool forward = false;
  bool retry = false;
  {
    Lock_guard lock(m_mutex);
    if ((generation == m_generation) && (m_outstanding.get<1>().count(block_id) != 0))
    {
      if (is_retryable_while_locked(err_code))
      {
        initiate_retry_while_locked();
        retry = true;
      }
      else
      {
        m_outstanding.get<1>().erase(block_id);
        forward = true;
      }
    }
  } // Lock_guard lock(m_mutex);

  if (retry)
  {
    FLOW_LOG_TRACE("Retrying block fetcher [" << this << "]: Block [" << block_id << "] failed transiently "
                   "[" << err_code << "] [" << err_code.message() << "]; will retry.");
    schedule_retry();
  }
  else if (forward)
  {
    FLOW_LOG_WARNING("Retrying block fetcher [" << this << "]: Giving up on block [" << block_id << "]: "
                     "[" << err_code << "] [" << err_code.message() << "].");
    m_listener->on_block_fetch_failure(block_id, err_code);
  }
  else
  {
    FLOW_LOG_TRACE("Retrying block fetcher [" << this << "]: Dropping failure of block [" << block_id << "] "
                   "from attempt generation [" << generation << "]: stale or already resolved.");
  }
} // Retrying_block_fetcher::on_attempt_failure()

void Retrying_block_fetcher::shut_down()
{
  Block_ids aborted_ids;
  {
    Lock_guard lock(m_mutex);
    aborted_ids.assign(m_outstanding.begin(), m_outstanding.end());
    m_outstanding.clear();
    // The current attempt (and a retry scheduled for it) is now stale too.
    ++m_generation;
  }

  if (aborted_ids.empty())
  {
    return;
  }
  // else

  const Error_code err_code = transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER;
  FLOW_LOG_INFO("Retrying block fetcher [" << this << "]: Shutting down with [" << aborted_ids.size() << "] blocks "
                "outstanding; failing them with [" << err_code << "] [" << err_code.message() << "].");
  for (const auto& block_id : aborted_ids)
  {
    m_listener->on_block_fetch_failure(block_id, err_code);
  }
} // Retrying_block_fetcher::shut_down()

unsigned int Retrying_block_fetcher::retry_count() const
{
  Lock_guard lock(m_mutex);
  return m_retry_count;
}

size_t Retrying_block_fetcher::num_outstanding() const
{
  Lock_guard lock(m_mutex);
  return m_outstanding.size();
}

} // namespace shuffle::fetch
