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

namespace shuffle::transport
{

// Types.

/**
 * Server-side counterpart of Transport_response_handler: serves each request arriving on one connection by
 * handing it to the Rpc_handler and writing back the response (if the request kind has one).
 * All methods are invoked from thread W.
 */
class Transport_request_handler :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs handler.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param reverse_client
   *        Client over the same connection; responses are written to its channel, and the Rpc_handler receives it.
   * @param rpc_handler
   *        The application's handler.
   */
  explicit Transport_request_handler(flow::log::Logger* logger_ptr, Transport_client_ptr reverse_client,
                                     Rpc_handler_ptr rpc_handler);

  // Methods.

  /**
   * Serves a request message.
   * @param request
   *        The request.  `is_request(request->m_type) == true`.
   */
  void handle(const Message_ptr& request);

  /// The connection became active.
  void channel_active();

  /// The connection closed.
  void channel_inactive();

  /**
   * The connection failed.
   * @param err_code
   *        The error.
   */
  void exception_caught(const Error_code& err_code);

private:
  // Methods.

  /**
   * Serves an RPC request.
   * @param request
   *        The request.
   */
  void process_rpc_request(const Message_ptr& request);

  /**
   * Serves a one-way message.
   * @param request
   *        The request.
   */
  void process_one_way_message(const Message_ptr& request);

  /**
   * Serves a block fetch request.
   * @param request
   *        The request.
   */
  void process_fetch_request(const Message_ptr& request);

  /**
   * Writes a response; logs if that is not possible (the connection has closed).  Any thread.
   *
   * @param logger_ptr
   *        Logger.
   * @param channel
   *        Where to write.
   * @param response
   *        The response.  One too large to frame is replaced by the matching failure response.
   */
  static void respond(flow::log::Logger* logger_ptr, const Channel_ptr& channel, Message_ptr response);

  // Data.

  /// See ctor.
  const Transport_client_ptr m_reverse_client;

  /// See ctor.
  const Rpc_handler_ptr m_rpc_handler;
}; // class Transport_request_handler

} // namespace shuffle::transport
