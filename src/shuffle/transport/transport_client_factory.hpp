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
#include <vector>

namespace shuffle::transport
{

// Types.

/**
 * Connects to Transport_server instances, yielding a ready-to-use Transport_client per connection.  Obtain one from
 * Transport_context::create_client_factory().
 *
 * The factory owns one I/O worker thread (thread W) on which all of its connections' traffic runs.  Each
 * create_client() makes a new connection; there is no pooling.  Destroying the factory closes every connection
 * it created that is still open (their outstanding requests fail with error::Code::S_CONNECTION_CLOSED) and joins
 * thread W.
 *
 * ### Thread safety ###
 * create_client() may be called concurrently from any threads other than thread W: it blocks until the
 * connection is established (or fails), so calling it from a completion handler of one of the factory's own clients
 * would deadlock.
 */
class Transport_client_factory :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Constructors/destructor.

  /**
   * Constructs factory and starts its worker thread.  Normally only Transport_context does this.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param context
   *        The context whose pipeline is installed on each connection.  Must outlive `*this`.
   * @param bootstraps
   *        Run, in order, on each new client.
   */
  explicit Transport_client_factory(flow::log::Logger* logger_ptr, const Transport_context* context,
                                    const std::vector<Transport_client_bootstrap_ptr>& bootstraps);

  /// Closes all open connections made by `*this` and joins the worker thread.
  ~Transport_client_factory();

  // Methods.

  /**
   * Connects to the given server and returns a client on the new connection, after running the bootstraps.
   * Blocks for at most about Transport_conf::connection_timeout() (plus the bootstraps' run time).
   *
   * @param host
   *        Server host name or address.
   * @param port
   *        Server port.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from resolving or connecting (e.g., `connection_refused`),
   *        error::Code::S_CONNECT_TIMEOUT, error::Code::S_INVALID_ARGUMENT (pipeline could not be installed),
   *        or whatever a bootstrap emitted.
   * @return The client; null on error.
   */
  Transport_client_ptr create_client(const std::string& host, uint16_t port, Error_code* err_code = 0);

  /**
   * Number of connections made by `*this` which have not yet been destroyed.  Closed connections may linger for a
   * bit.  Mostly for tests.
   *
   * @return See above.
   */
  size_t num_connections() const;

private:
  // Types.

  /// State shared between create_client() and its connect-related async handlers in thread W.
  struct Connect_state;

  // Methods.

  /**
   * Establishes the TCP connection, with timeout, and returns the connected socket's Channel (pipeline not yet
   * installed).
   *
   * @param host
   *        See create_client().
   * @param port
   *        See create_client().
   * @param err_code
   *        Not null.  See create_client().
   * @return Null on error.
   */
  Channel_ptr connect(const std::string& host, uint16_t port, Error_code* err_code);

  /**
   * Installs pipeline, activates, and runs bootstraps on the new channel.
   *
   * @param channel
   *        Result of connect().
   * @param err_code
   *        Not null.  See create_client().
   * @return Null on error.
   */
  Transport_client_ptr set_up_client(const Channel_ptr& channel, Error_code* err_code);

  // Data.

  /// See ctor.
  const Transport_context* const m_context;

  /// See ctor.
  const std::vector<Transport_client_bootstrap_ptr> m_bootstraps;

  /// Protects #m_channels.
  mutable flow::util::Mutex_non_recursive m_channels_mutex;

  /// Every connection made so far, for closing them in dtor.  Expired ones are pruned as new ones are added.
  std::vector<std::weak_ptr<Channel>> m_channels;

  /// Thread W: all connect handlers and all I/O of all our connections run here.
  flow::async::Single_thread_task_loop m_worker;
}; // class Transport_client_factory

} // namespace shuffle::transport
