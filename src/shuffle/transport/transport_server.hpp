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
#include <flow/log/log.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/util/util.hpp>
#include <boost/noncopyable.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <vector>

namespace shuffle::transport
{

// Types.

/**
 * A listening TCP server whose every accepted connection runs the pipeline of a Transport_context, its requests
 * served by the context's Rpc_handler (as possibly substituted by server bootstraps).  Obtain one from
 * Transport_context::create_server().
 *
 * Upon successful construction the server is already listening; port() reports the bound port (useful when the
 * requested port was 0).  It owns one worker thread (thread W) on which accepting and all connections' I/O run.
 *
 * Destroying the server stops listening, closes every live connection it accepted, and joins thread W.
 * The dtor must not be called from thread W (e.g., from an Rpc_handler method).
 */
class Transport_server :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Types.

  /// Short-hand for the TCP endpoint type.
  using Endpoint = boost::asio::ip::tcp::endpoint;

  // Constructors/destructor.

  /**
   * Binds and starts listening.  Normally only Transport_context does this.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param context
   *        The context whose pipeline is installed on each connection.  Must outlive `*this`.
   * @param host
   *        Local address to bind; empty means any IPv4 address.
   * @param port
   *        Port to bind; 0 means ephemeral.
   * @param bootstraps
   *        Applied, in order, to each accepted connection's Rpc_handler.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from resolving, binding or listening.  If emitted, `*this` is not listening and useless
   *        except for destruction.
   */
  explicit Transport_server(flow::log::Logger* logger_ptr, const Transport_context* context, const std::string& host,
                            uint16_t port, const std::vector<Transport_server_bootstrap_ptr>& bootstraps,
                            Error_code* err_code = 0);

  /// Stops listening, closes live connections, joins the worker thread.
  ~Transport_server();

  // Methods.

  /**
   * The bound port.  0 if construction failed.
   * @return See above.
   */
  uint16_t port() const;

  /**
   * The bound local endpoint.  Default-constructed if construction failed.
   * @return See above.
   */
  const Endpoint& local_endpoint() const;

  /**
   * Number of accepted connections which have not yet been destroyed.  Closed connections may linger for a bit.
   * Mostly for tests.
   *
   * @return See above.
   */
  size_t num_connections() const;

private:
  // Types.

  /// Short-hand for the acceptor type.
  using Acceptor = boost::asio::ip::tcp::acceptor;

  // Methods.

  /**
   * Handler for an incoming connection or an accept error.  Continues the accept chain unless fatal.
   *
   * @param sys_err_code
   *        Result of `async_accept()`.
   */
  void on_next_peer_socket_or_error(const Error_code& sys_err_code);

  /// Begins background-waiting for the next incoming connection into #m_next_peer_socket.
  void async_accept_next();

  // Data.

  /// See ctor.
  const Transport_context* const m_context;

  /// See ctor.
  const std::vector<Transport_server_bootstrap_ptr> m_bootstraps;

  /// See local_endpoint().  Set in ctor, constant afterwards.
  Endpoint m_local_endpoint;

  /// Protects #m_channels.
  mutable flow::util::Mutex_non_recursive m_channels_mutex;

  /// Every connection accepted so far, for closing them in dtor.  Expired ones are pruned as new ones are added.
  std::vector<std::weak_ptr<Channel>> m_channels;

  /// Thread W.
  flow::async::Single_thread_task_loop m_worker;

  /// The listening acceptor.  Null if construction failed.  Accessed only in thread W (after ctor).
  std::unique_ptr<Acceptor> m_acceptor;

  /**
   * Unconnected socket at entry to each background accept; connected by boost.asio as it invokes our handler;
   * moved into the new Channel (and thus emptied) by that handler before the next background accept.
   */
  boost::asio::ip::tcp::socket m_next_peer_socket;
}; // class Transport_server

} // namespace shuffle::transport
