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

namespace shuffle::transport
{

// Types.

/**
 * Hook run by Transport_client_factory on every freshly connected, activated client before it is handed to the
 * user.  Typical use: an authentication or negotiation exchange over Transport_client::send_rpc().  Bootstraps of
 * one factory run in order; the first failure aborts connection establishment (the client is closed and the
 * failure is emitted by `create_client()`).
 *
 * do_bootstrap() runs synchronously in the thread calling `create_client()`, not in the connection's worker
 * thread; so it may block awaiting responses.
 */
class Transport_client_bootstrap
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Transport_client_bootstrap();

  // Methods.

  /**
   * Performs the bootstrap on the given client.
   *
   * @param client
   *        The new client; active.
   * @param err_code
   *        Not null.  Set it to a truthy value to abort connection establishment.
   */
  virtual void do_bootstrap(const Transport_client_ptr& client, Error_code* err_code) = 0;
}; // class Transport_client_bootstrap

/**
 * Hook run by Transport_server on every accepted connection before its pipeline is installed.  It may wrap or
 * replace the Rpc_handler that will serve the connection's requests (e.g., to require a successful handshake
 * first).  Bootstraps of one server are applied in order, each receiving the previous one's result.
 *
 * do_bootstrap() runs in the server's worker thread and must not block.
 */
class Transport_server_bootstrap
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Transport_server_bootstrap();

  // Methods.

  /**
   * Performs the bootstrap on the given new connection.
   *
   * @param channel
   *        The new connection; its pipeline is still empty.
   * @param rpc_handler
   *        The handler that would serve the connection absent this bootstrap.
   * @return The handler that shall serve the connection: `rpc_handler` itself or a replacement.  Not null.
   */
  virtual Rpc_handler_ptr do_bootstrap(const Channel_ptr& channel, const Rpc_handler_ptr& rpc_handler) = 0;
}; // class Transport_server_bootstrap

} // namespace shuffle::transport
