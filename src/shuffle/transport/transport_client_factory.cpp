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
#include "shuffle/transport/transport_client_factory.hpp"
#include "shuffle/transport/transport_context.hpp"
#include "shuffle/transport/transport_bootstrap.hpp"
#include "shuffle/transport/transport_channel_handler.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/sched_task.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>
#include <algorithm>
#include <future>

namespace shuffle::transport
{

// Types.

struct Transport_client_factory::Connect_state
{
  /// The socket being connected; moved into the Channel on success.
  Channel::Socket m_socket;

  /// Set by the timeout handler, so that the connect handler reports error::Code::S_CONNECT_TIMEOUT.
  bool m_timed_out;

  /// The timeout (null if none).  Canceled by the connect handler.
  flow::util::Scheduled_task_handle m_timeout_task;

  /// Satisfied by the connect handler (the only one that does so) with the result.
  std::promise<Error_code> m_result;

  /**
   * Constructs the state.
   *
   * @param task_engine
   *        Thread W's engine.
   */
  explicit Connect_state(util::Task_engine* task_engine) :
    m_socket(*task_engine),
    m_timed_out(false)
  {
    // That's it.
  }
}; // struct Transport_client_factory::Connect_state

// Implementations.

Transport_client_factory::Transport_client_factory(flow::log::Logger* logger_ptr, const Transport_context* context,
                                                   const std::vector<Transport_client_bootstrap_ptr>& bootstraps) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_context(context),
  m_bootstraps(bootstraps),
  m_worker(get_logger(), "shfl_cli_fac")
{
  using flow::async::reset_thread_pinning;

  m_worker.start([this]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity.  Float free.
  });

  FLOW_LOG_INFO("Client factory [" << this << "]: Started with [" << m_bootstraps.size() << "] bootstraps; "
                "conf [" << m_context->conf() << "].");
}

Transport_client_factory::~Transport_client_factory()
{
  using flow::async::Synchronicity;
  using flow::util::Lock_guard;

  // We are in thread U.

  std::vector<Channel_ptr> channels;
  {
    Lock_guard<decltype(m_channels_mutex)> lock(m_channels_mutex);
    for (const auto& channel_weak : m_channels)
    {
      if (auto channel = channel_weak.lock())
      {
        channels.emplace_back(std::move(channel));
      }
    }
    m_channels.clear();
  }

  FLOW_LOG_INFO("Client factory [" << this << "]: Shutting down: closing [" << channels.size() << "] "
                "live connections; then stopping worker thread.");

  for (const auto& channel : channels)
  {
    channel->close();
  }
  channels.clear();

  // Each close() above posted onto W; this runs after all of them, so by its return every connection is closed.
  m_worker.post([]() {}, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  m_worker.stop();
  // Thread W is (synchronously!) no more.

  FLOW_LOG_INFO("Client factory [" << this << "]: Shut down.");
} // Transport_client_factory::~Transport_client_factory()

Transport_client_ptr Transport_client_factory::create_client(const std::string& host, uint16_t port,
                                                             Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Transport_client_ptr, Transport_client_factory::create_client,
                                     host, port, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  // We are in thread U (not W).

  FLOW_LOG_INFO("Client factory [" << this << "]: Creating client to [" << host << ':' << port << "].");

  const auto channel = connect(host, port, err_code);
  if (!channel)
  {
    assert(*err_code);
    return Transport_client_ptr();
  }
  // else

  auto client = set_up_client(channel, err_code);
  if (!client)
  {
    assert(*err_code);
    return client;
  }
  // else

  FLOW_LOG_INFO("Client factory [" << this << "]: Client [" << *client << "] ready.");
  err_code->clear();
  return client;
} // Transport_client_factory::create_client()

Channel_ptr Transport_client_factory::connect(const std::string& host, uint16_t port, Error_code* err_code)
{
  using boost::asio::ip::tcp;
  using boost::asio::async_connect;
  using boost::chrono::milliseconds;
  using boost::chrono::round;
  using flow::util::schedule_task_from_now;
  using flow::util::scheduled_task_cancel;
  using std::make_shared;
  using std::to_string;

  // We are in thread U.

  const auto task_engine = m_worker.task_engine();

  Error_code sys_err_code;
  tcp::resolver resolver(*task_engine);
  const auto endpoints = resolver.resolve(host, to_string(port), sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Client factory [" << this << "]: Could not resolve [" << host << ':' << port << "].  "
                     "Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return Channel_ptr();
  }
  // else

  const auto timeout = m_context->conf().connection_timeout();
  const auto state = make_shared<Connect_state>(task_engine.get());
  auto result = state->m_result.get_future();

  m_worker.post([this, state, endpoints, timeout, task_engine]()
  {
    // We are in thread W.
    if (timeout != util::Fine_duration::zero()) // 0 => no timeout.
    {
      state->m_timeout_task = schedule_task_from_now(get_logger(), timeout, true, task_engine.get(),
                                                     [this, state](bool)
      {
        // We are in thread W.  The connect handler has not run yet (else it would have canceled us).
        FLOW_LOG_TRACE("Client factory [" << this << "]: Connect timeout fired; aborting connect.");
        state->m_timed_out = true;
        Error_code dummy;
        state->m_socket.close(dummy); // The connect handler shall run soon with operation_aborted.
      });
    }

    async_connect(state->m_socket, endpoints,
                  [this, state](const Error_code& async_err_code, const tcp::endpoint&)
    {
      // We are in thread W.
      if (state->m_timeout_task)
      {
        scheduled_task_cancel(get_logger(), state->m_timeout_task);
        state->m_timeout_task.reset(); // The handle refers to `state`; break the cycle.
      }
      state->m_result.set_value(state->m_timed_out ? Error_code(error::Code::S_CONNECT_TIMEOUT)
                                                   : async_err_code);
    });
  }); // m_worker.post()

  sys_err_code = result.get();
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Client factory [" << this << "]: Could not connect to [" << host << ':' << port << "] "
                     "(timeout [" << round<milliseconds>(timeout) << "]).  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return Channel_ptr();
  }
  // else

  // W is done with m_socket: the connect handler was the last thing to touch it.
  return Channel::create(get_logger(), task_engine.get(), std::move(state->m_socket));
} // Transport_client_factory::connect()

Transport_client_ptr Transport_client_factory::set_up_client(const Channel_ptr& channel, Error_code* err_code)
{
  using flow::async::Synchronicity;
  using flow::error::Runtime_error;
  using flow::util::Lock_guard;

  // We are in thread U.

  std::shared_ptr<Transport_channel_handler> channel_handler;
  try
  {
    channel_handler = m_context->initialize_pipeline(channel);
  }
  catch (const Runtime_error& exc)
  {
    // It logged and closed the channel.
    *err_code = exc.code();
    return Transport_client_ptr();
  }

  {
    Lock_guard<decltype(m_channels_mutex)> lock(m_channels_mutex);
    m_channels.erase(std::remove_if(m_channels.begin(), m_channels.end(),
                                    [](const std::weak_ptr<Channel>& channel_weak) { return channel_weak.expired(); }),
                     m_channels.end());
    m_channels.emplace_back(channel);
  }

  channel->activate();
  // activate() posted onto W; once this returns, channel-active has fired, so the client may be used at once.
  m_worker.post([]() {}, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  const auto& client = channel_handler->client();
  for (const auto& bootstrap : m_bootstraps)
  {
    bootstrap->do_bootstrap(client, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Client factory [" << this << "]: Client [" << *client << "] bootstrap failed; closing "
                       "client.  Error: [" << *err_code << "] [" << err_code->message() << "].");
      client->close();
      return Transport_client_ptr();
    }
  }

  return client;
} // Transport_client_factory::set_up_client()

size_t Transport_client_factory::num_connections() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_channels_mutex)> lock(m_channels_mutex);
  return std::count_if(m_channels.begin(), m_channels.end(),
                       [](const std::weak_ptr<Channel>& channel_weak) { return !channel_weak.expired(); });
}

} // namespace shuffle::transport
