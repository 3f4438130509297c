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

#include "shuffle/transport/channel_pipeline.hpp"
#include <flow/log/log.hpp>

namespace shuffle::transport
{

// Types.

/**
 * The last stage of every pipeline built by Transport_context: it dispatches each decoded Message to the
 * connection's Transport_request_handler (requests) or Transport_response_handler (responses), and it decides
 * what to do about an idle connection.
 *
 * When Idle_state_monitor reports the connection idle:
 *   - If requests are outstanding and the last one was sent longer ago than the request timeout, the
 *     connection is presumed dead: the client is timed out, every outstanding request fails with
 *     error::Code::S_CONNECTION_IDLE_TIMEOUT, and the connection closes.
 *   - Otherwise, if idle-closing is enabled, the client is timed out and the connection closes.
 *   - Otherwise nothing happens; the connection stays open.
 *
 * Channel-active, channel-inactive and errors are propagated to both handlers.  An error also closes the
 * connection.
 */
class Transport_channel_handler :
  public Channel_stage,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stage.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param client
   *        The connection's client.
   * @param response_handler
   *        The connection's response bookkeeping (shared with `client`).
   * @param request_handler
   *        The connection's request server.
   * @param request_timeout
   *        See class doc header.
   * @param close_idle_connections
   *        See class doc header.
   */
  explicit Transport_channel_handler(flow::log::Logger* logger_ptr,
                                     Transport_client_ptr client,
                                     std::shared_ptr<Transport_response_handler> response_handler,
                                     std::shared_ptr<Transport_request_handler> request_handler,
                                     util::Fine_duration request_timeout,
                                     bool close_idle_connections);

  // Methods.

  /**
   * The connection's client.
   * @return See above.
   */
  const Transport_client_ptr& client() const;

  /**
   * The connection's response bookkeeping.
   * @return See above.
   */
  const std::shared_ptr<Transport_response_handler>& response_handler() const;

  /**
   * Whether idle connections are closed even with nothing outstanding.
   * @return See above.
   */
  bool close_idle_connections() const;

  /**
   * Implements Channel_stage API.
   * @param ctx
   *        See Channel_stage.
   */
  void channel_active(Stage_context* ctx) override;

  /**
   * Implements Channel_stage API.
   * @param ctx
   *        See Channel_stage.
   */
  void channel_inactive(Stage_context* ctx) override;

  /**
   * Implements Channel_stage API: dispatches Message items.
   *
   * @param ctx
   *        See Channel_stage.
   * @param item
   *        See Channel_stage.
   */
  void channel_read(Stage_context* ctx, Pipeline_item&& item) override;

  /**
   * Implements Channel_stage API: handles Channel_event::S_ALL_IDLE per class doc header.
   *
   * @param ctx
   *        See Channel_stage.
   * @param event
   *        See Channel_stage.
   */
  void event_triggered(Stage_context* ctx, Channel_event event) override;

  /**
   * Implements Channel_stage API.
   *
   * @param ctx
   *        See Channel_stage.
   * @param err_code
   *        See Channel_stage.
   */
  void exception_caught(Stage_context* ctx, const Error_code& err_code) override;

private:
  // Data.

  /// See client().
  const Transport_client_ptr m_client;

  /// See response_handler().
  const std::shared_ptr<Transport_response_handler> m_response_handler;

  /// See ctor.
  const std::shared_ptr<Transport_request_handler> m_request_handler;

  /// See ctor.
  const util::Fine_duration m_request_timeout;

  /// See close_idle_connections().
  const bool m_close_idle_connections;
}; // class Transport_channel_handler

} // namespace shuffle::transport
