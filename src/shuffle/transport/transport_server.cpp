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
#include "shuffle/transport/transport_server.hpp"
#include "shuffle/transport/transport_context.hpp"
#include "shuffle/transport/transport_bootstrap.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>

namespace shuffle::transport
{

// Implementations.

Transport_server::Transport_server(flow::log::Logger* logger_ptr, const Transport_context* context,
                                   const std::string& host, uint16_t port,
                                   const std::vector<Transport_server_bootstrap_ptr>& bootstraps,
                                   Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_context(context),
  m_bootstraps(bootstraps),
  m_worker(get_logger(), "shfl_srv"),
  m_next_peer_socket(*(m_worker.task_engine())) // Steady state: start it as empty, per doc header.
{
  using boost::asio::ip::tcp;
  using boost::asio::ip::address_v4;
  using flow::error::Runtime_error;
  using flow::async::reset_thread_pinning;
  using boost::system::system_error;
  using std::to_string;

  /* Do all the work in thread W.  We have promised that upon our return the server is listening (assuming no
   * errors); so wait for the startup to finish using start() arg. */
  Error_code sys_err_code;

  FLOW_LOG_TRACE("Server [" << *this << "]: Awaiting initial setup/listening in worker thread.");
  m_worker.start([&]() // Execute all this synchronously in the thread.
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.

    const auto asio_engine = m_worker.task_engine();

    Endpoint local_endpoint(address_v4::any(), port);
    if (!host.empty())
    {
      tcp::resolver resolver(*asio_engine);
      const auto endpoints = resolver.resolve(host, to_string(port), sys_err_code);
      if (sys_err_code)
      {
        FLOW_LOG_WARNING("Server [" << *this << "]: Unable to resolve [" << host << "].  Details follow.");
        FLOW_ERROR_SYS_ERROR_LOG_WARNING();
        return; // Escape the start() callback, that is.
      }
      // else
      local_endpoint = endpoints.begin()->endpoint();
    }

    try
    {
      // Throws on error.  (It's normal in boost.asio ctors.)
      m_acceptor = std::make_unique<Acceptor>(*asio_engine, local_endpoint, true); // true => SO_REUSEADDR.
      m_local_endpoint = m_acceptor->local_endpoint();
    }
    catch (const system_error& exc)
    {
      m_acceptor.reset();
      FLOW_LOG_WARNING("Server [" << *this << "]: Unable to open/bind/listen at [" << local_endpoint << "]; "
                       "details logged below.");
      sys_err_code = exc.code();
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return; // Escape the start() callback, that is.
    }

    FLOW_LOG_INFO("Server [" << *this << "]: Successfully open/bind/listen-ed.  Ready for connections.");
    async_accept_next();
  }); // m_worker.start()

  if (sys_err_code)
  {
    // Just keep the thread going; even though it's not gonna be doing any listening.
    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
} // Transport_server::Transport_server()

Transport_server::~Transport_server()
{
  using flow::async::Synchronicity;
  using flow::util::Lock_guard;

  // We are in thread U.  By contract in doc header, they must not call us from thread W.

  FLOW_LOG_INFO("Server [" << *this << "]: Shutting down.  Acceptor will close; live connections will close; "
                "worker thread will be joined.");

  m_worker.post([&]()
  {
    // We are in thread W.
    if (m_acceptor)
    {
      Error_code dummy;
      m_acceptor->close(dummy);
    }

    Lock_guard<decltype(m_channels_mutex)> lock(m_channels_mutex);
    for (const auto& channel_weak : m_channels)
    {
      if (const auto channel = channel_weak.lock())
      {
        channel->close(); // This posts the actual closing.
      }
    }
    m_channels.clear();
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  // The close() calls above posted onto W; this runs after all of them.
  m_worker.post([]() {}, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  m_worker.stop();
  // Thread W is (synchronously!) no more.
} // Transport_server::~Transport_server()

void Transport_server::async_accept_next()
{
  // We are in thread W.
  FLOW_LOG_TRACE("Server [" << *this << "]: Starting the next background accept.");
  m_acceptor->async_accept(m_next_peer_socket,
                           [this](const Error_code& async_err_code)
  {
    // We are in thread W.
    on_next_peer_socket_or_error(async_err_code);
  });
}

void Transport_server::on_next_peer_socket_or_error(const Error_code& sys_err_code)
{
  using flow::error::Runtime_error;
  using flow::util::Lock_guard;

  // We are in thread W.
  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return; // Stuff is shutting down.  GTFO.
  }
  // else

  if (sys_err_code)
  {
    // Close/empty the potentially-almost-kinda-accepted socket.  Probably unnecessary but can't hurt.
    Error_code dummy;
    m_next_peer_socket.close(dummy);

    if (sys_err_code == boost::asio::error::connection_aborted)
    {
      FLOW_LOG_WARNING("Server [" << *this << "]: Incoming connection aborted halfway during connection; this is "
                       "quite weird but should not be fatal.  Ignoring.  Still listening.");
      async_accept_next();
      return;
    }
    // else

    FLOW_LOG_WARNING("Server [" << *this << "]: The background accept failed fatally.  "
                     "Closing acceptor; no longer listening.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    m_acceptor->close(dummy);
    return;
  }
  // else

  // Steady state again after this: m_next_peer_socket is empty/unconnected.
  const auto channel = Channel::create(get_logger(), m_worker.task_engine().get(), std::move(m_next_peer_socket));
  FLOW_LOG_INFO("Server [" << *this << "]: Accepted connection [" << *channel << "].");

  auto rpc_handler = m_context->rpc_handler();
  for (const auto& bootstrap : m_bootstraps)
  {
    rpc_handler = bootstrap->do_bootstrap(channel, rpc_handler);
  }

  bool ok = true;
  try
  {
    m_context->initialize_pipeline(channel, rpc_handler);
  }
  catch (const Runtime_error& exc)
  {
    // It logged and closed the channel.
    FLOW_LOG_WARNING("Server [" << *this << "]: Dropping connection [" << *channel << "]: [" << exc.what() << "].");
    ok = false;
  }

  if (ok)
  {
    {
      Lock_guard<decltype(m_channels_mutex)> lock(m_channels_mutex);
      m_channels.erase(std::remove_if(m_channels.begin(), m_channels.end(),
                                      [](const std::weak_ptr<Channel>& channel_weak)
                                        { return channel_weak.expired(); }),
                       m_channels.end());
      m_channels.emplace_back(channel);
    }
    channel->activate();
  }

  async_accept_next();
} // Transport_server::on_next_peer_socket_or_error()

uint16_t Transport_server::port() const
{
  return m_local_endpoint.port();
}

const Transport_server::Endpoint& Transport_server::local_endpoint() const
{
  return m_local_endpoint;
}

size_t Transport_server::num_connections() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_channels_mutex)> lock(m_channels_mutex);
  return std::count_if(m_channels.begin(), m_channels.end(),
                       [](const std::weak_ptr<Channel>& channel_weak) { return !channel_weak.expired(); });
}

std::ostream& operator<<(std::ostream& os, const Transport_server& val)
{
  return os << '[' << val.local_endpoint() << "]@" << static_cast<const void*>(&val);
}

} // namespace shuffle::transport
