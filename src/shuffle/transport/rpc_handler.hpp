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
#include <string>

namespace shuffle::transport
{

// Types.

/**
 * Application-supplied handler of requests arriving on a connection: RPCs, one-way messages and block fetches.
 * One instance typically serves every connection of a Transport_context (though a Transport_server_bootstrap may
 * wrap it per connection); hence implementations must be thread-safe, as connections may be served by different
 * threads.  Each method is given the Transport_client for the connection the request came in on; the
 * application may use it to send requests in the reverse direction.
 *
 * Methods are invoked from the connection's thread W and must not block.
 */
class Rpc_handler
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Rpc_handler();

  // Methods.

  /**
   * Handles an RPC.  `on_response` must be invoked exactly once, from any thread, possibly after returning:
   * with a falsy code and a response payload; or with a truthy code (whose `message()` is sent back as the
   * failure text) and null.
   *
   * @param client
   *        The connection the request came in on.
   * @param message
   *        Request payload.  Never null; possibly empty.
   * @param on_response
   *        See above.
   */
  virtual void receive(const Transport_client_ptr& client, util::Blob_ptr message, Response_func&& on_response) = 0;

  /**
   * Handles a one-way message (no response expected).  Default implementation forwards to receive() with a
   * response handler that discards the result.
   *
   * @param client
   *        See receive().
   * @param message
   *        See receive().
   */
  virtual void receive_one_way(const Transport_client_ptr& client, util::Blob_ptr message);

  /**
   * Returns the bytes of the block named `block_id` for a block fetch request.  Default implementation serves
   * nothing: error::Code::S_RPC_HANDLER_UNSUPPORTED.
   *
   * @param block_id
   *        Block ID.
   * @param err_code
   *        Never null.  Must be set to success or the reason the block cannot be served (typically
   *        error::Code::S_BLOCK_NOT_FOUND); its `message()` is sent to the requester.
   * @return The block; null on error.
   */
  virtual util::Blob_ptr get_block(const std::string& block_id, Error_code* err_code);

  /**
   * The connection became active.  Default: no-op.
   * @param client
   *        The connection.
   */
  virtual void channel_active(const Transport_client_ptr& client);

  /**
   * The connection closed.  Default: no-op.
   * @param client
   *        The connection.
   */
  virtual void channel_inactive(const Transport_client_ptr& client);

  /**
   * An error occurred on the connection; it is closing.  Default: no-op.
   *
   * @param err_code
   *        The error.
   * @param client
   *        The connection.
   */
  virtual void exception_caught(const Error_code& err_code, const Transport_client_ptr& client);
}; // class Rpc_handler

/// Rpc_handler for a side that serves nothing (e.g., a pure client): every RPC fails.
class No_op_rpc_handler :
  public Rpc_handler,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the handler.
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit No_op_rpc_handler(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Implements Rpc_handler API: fails with error::Code::S_RPC_HANDLER_UNSUPPORTED.
   *
   * @param client
   *        See Rpc_handler.
   * @param message
   *        See Rpc_handler.
   * @param on_response
   *        See Rpc_handler.
   */
  void receive(const Transport_client_ptr& client, util::Blob_ptr message, Response_func&& on_response) override;
}; // class No_op_rpc_handler

} // namespace shuffle::transport
