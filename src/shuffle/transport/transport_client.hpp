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
#include <atomic>
#include <string>

namespace shuffle::transport
{

// Types.

/**
 * Handle through which many concurrent logical requests -- block fetches, RPCs, one-way messages -- are sent over
 * one connection and their responses received.  Obtained from Transport_client_factory::create_client() (the
 * client side) or via Rpc_handler callbacks (the server side, for requests in the reverse direction); in both
 * cases Transport_context made it when building the connection's pipeline.
 *
 * All methods are thread-safe and non-blocking.  Each request's Response_func is invoked exactly once, from the
 * connection's thread W (or, if the client is already inactive, synchronously from the calling thread).
 *
 * The client and its Channel reference each other (through the pipeline) until the channel closes; so a client
 * that is neither closed nor closed-by-error keeps its connection open even if the user drops every reference.
 * Call close() when done.
 */
class Transport_client :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs client over the given channel and its response bookkeeping.  Normally only Transport_context
   * does this.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param channel
   *        The connection.
   * @param response_handler
   *        Bookkeeping of outstanding requests, shared with the channel's Transport_channel_handler.
   */
  explicit Transport_client(flow::log::Logger* logger_ptr, Channel_ptr channel,
                            std::shared_ptr<Transport_response_handler> response_handler);

  // Methods.

  /**
   * Requests the block named `block_id` from the opposing side.  `on_done` receives its bytes or the error:
   * error::Code::S_REMOTE_REQUEST_FAILED if the opposing side could not serve it; error::Code::S_CONNECTION_CLOSED
   * or an I/O error if the connection failed first; error::Code::S_CONNECTION_IDLE_TIMEOUT if no response came
   * for too long; error::Code::S_MESSAGE_TOO_LARGE (immediately, nothing sent) if the request would exceed the
   * maximum frame size.
   *
   * @param block_id
   *        Block ID.
   * @param on_done
   *        Completion handler.
   */
  void fetch_block(const std::string& block_id, Response_func&& on_done);

  /**
   * Sends an RPC; `on_done` receives the response payload or the error (as for fetch_block()).
   *
   * @param message
   *        Request payload.  Null is treated as empty.
   * @param on_done
   *        Completion handler.
   */
  void send_rpc(util::Blob_ptr message, Response_func&& on_done);

  /**
   * Sends a one-way message: no response, no delivery guarantee.  One too large to frame is dropped.
   * @param message
   *        Payload.  Null is treated as empty.
   */
  void send(util::Blob_ptr message);

  /// Closes the connection; outstanding requests fail with error::Code::S_CONNECTION_CLOSED.
  void close();

  /// Marks the client as timed out: it becomes inactive even if the connection has not closed yet.
  void time_out();

  /**
   * Returns `true` if the connection is active and the client has not been timed out.
   * @return See above.
   */
  bool is_active() const;

  /**
   * The connection.
   * @return See above.
   */
  const Channel_ptr& channel() const;

private:
  // Methods.

  /**
   * Next request ID.
   * @return See above.
   */
  uint64_t next_request_id();

  // Data.

  /// See channel().
  const Channel_ptr m_channel;

  /// Outstanding requests.
  const std::shared_ptr<Transport_response_handler> m_response_handler;

  /// Source of request IDs.
  std::atomic<uint64_t> m_next_request_id;

  /// See time_out().
  std::atomic<bool> m_timed_out;
}; // class Transport_client

} // namespace shuffle::transport
