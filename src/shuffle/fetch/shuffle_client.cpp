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
#include "shuffle/fetch/shuffle_client.hpp"
#include "shuffle/fetch/retrying_block_fetcher.hpp"
#include "shuffle/fetch/one_for_one_block_fetcher.hpp"
#include "shuffle/fetch/block_fetch_starter.hpp"
#include "shuffle/fetch/block_fetching_listener.hpp"
#include "shuffle/transport/transport_client_factory.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/rpc_handler.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>

namespace shuffle::fetch
{

// Types.

/// Connects to one server and runs a One_for_one_block_fetcher on the new connection.
class Shuffle_client::Starter :
  public Block_fetch_starter,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs starter.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param client_factory
   *        Makes the connections.  Must outlive `*this`'s activity.
   * @param host
   *        Server host.
   * @param port
   *        Server port.
   */
  explicit Starter(flow::log::Logger* logger_ptr, transport::Transport_client_factory* client_factory,
                   const std::string& host, uint16_t port) :
    flow::log::Log_context(logger_ptr, Log_component::S_FETCH),
    m_client_factory(client_factory),
    m_host(host),
    m_port(port)
  {
    // That's it.
  }

  // Methods.

  /**
   * Implements interface.  Throws `flow::error::Runtime_error` if the connection fails.
   *
   * @param block_ids
   *        See interface.
   * @param listener
   *        See interface.
   */
  void create_and_start(const Block_ids& block_ids, const Block_fetching_listener_ptr& listener) override
  {
    auto client = m_client_factory->create_client(m_host, m_port); // Throws on error.
    One_for_one_block_fetcher::create(get_logger(), std::move(client), block_ids, listener)->start();
  }

private:
  // Data.

  /// See ctor.
  transport::Transport_client_factory* const m_client_factory;

  /// See ctor.
  const std::string m_host;

  /// See ctor.
  const uint16_t m_port;
}; // class Shuffle_client::Starter

// Implementations.

Shuffle_client::Shuffle_client(flow::log::Logger* logger_ptr, const transport::Transport_conf& conf,
                               size_t n_retry_threads) :
  flow::log::Log_context(logger_ptr, Log_component::S_FETCH),
  m_context(logger_ptr, conf, std::make_shared<transport::No_op_rpc_handler>(logger_ptr)),
  m_retry_pool(get_logger(), "shfl_retry", n_retry_threads),
  m_client_factory(m_context.create_client_factory())
{
  m_retry_pool.start();

  FLOW_LOG_INFO("Shuffle client [" << this << "]: Started with [" << m_retry_pool.n_threads() << "] retry "
                "threads.");
}

Shuffle_client::~Shuffle_client()
{
  using flow::util::Lock_guard;
  using std::vector;
  using std::weak_ptr;

  FLOW_LOG_INFO("Shuffle client [" << this << "]: Shutting down: waiting for retries in progress; abandoning "
                "scheduled ones; failing blocks not yet reported; then closing connections.");

  // Retries first, so none is in progress (and none starts) while the fetchers shut down and the factory goes away.
  m_retry_pool.stop();

  vector<weak_ptr<Retrying_block_fetcher>> fetchers;
  {
    Lock_guard<decltype(m_fetchers_mutex)> lock(m_fetchers_mutex);
    fetchers.swap(m_fetchers);
  }
  for (const auto& fetcher_weak : fetchers)
  {
    const auto fetcher = fetcher_weak.lock();
    if (fetcher) // Else it is done and gone.
    {
      fetcher->shut_down();
    }
  }

  // Anything the closing connections report now is stale.
  m_client_factory.reset();
}

void Shuffle_client::track(const std::shared_ptr<Retrying_block_fetcher>& fetcher)
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_fetchers_mutex)> lock(m_fetchers_mutex);
  m_fetchers.erase(std::remove_if(m_fetchers.begin(), m_fetchers.end(),
                                  [](const std::weak_ptr<Retrying_block_fetcher>& fetcher_weak)
                                    { return fetcher_weak.expired(); }),
                   m_fetchers.end());
  m_fetchers.push_back(fetcher);
}

void Shuffle_client::fetch_blocks(const std::string& host, uint16_t port, const Block_ids& block_ids,
                                  const Block_fetching_listener_ptr& listener, Error_code* err_code)
{
  using flow::error::Runtime_error;
  using std::make_shared;

  if (block_ids.empty())
  {
    FLOW_LOG_WARNING("Shuffle client [" << this << "]: Asked to fetch no blocks from [" << host << ':' << port << "].");
    if (err_code)
    {
      *err_code = transport::error::Code::S_INVALID_ARGUMENT;
      return;
    }
    // else
    throw Runtime_error(transport::error::Code::S_INVALID_ARGUMENT, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }

  FLOW_LOG_INFO("Shuffle client [" << this << "]: Fetching [" << block_ids.size() << "] blocks from "
                "[" << host << ':' << port << "].");

  const auto starter = make_shared<Starter>(get_logger(), m_client_factory.get(), host, port);

  /* Even with no retries allowed, go through the retrying fetcher: it reports each distinct block once, and it
   * turns a failure to start into failures of every block. */
  const auto fetcher = Retrying_block_fetcher::create(get_logger(), m_context.conf(), &m_retry_pool, starter,
                                                      block_ids, listener); // Cannot fail: block_ids is not empty.
  track(fetcher);
  fetcher->start();
} // Shuffle_client::fetch_blocks()

const transport::Transport_context& Shuffle_client::context() const
{
  return m_context;
}

} // namespace shuffle::fetch
