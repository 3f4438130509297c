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

#include "shuffle/transport/transport_conf.hpp"
#include <flow/log/log.hpp>
#include <memory>
#include <vector>

namespace shuffle::transport
{

// Types.

/**
 * The factory of both sides of a shuffle::transport connection and of the processing pipeline every such
 * connection runs.  See also namespace shuffle::transport doc header.
 *
 * A Transport_context is configured once with a Transport_conf, the application's Rpc_handler (serving requests
 * that arrive from the opposing side, on either side of the connection), and whether connections that go idle should
 * be closed.  Then:
 *   - create_client_factory() yields a Transport_client_factory which connects to servers;
 *   - create_server() yields a bound, listening Transport_server;
 *   - both of those call initialize_pipeline() on each new Channel.
 *
 * initialize_pipeline() installs exactly these stages, in this order:
 *   -# `"encoder"`: the shared Message_encoder (outbound: Message => frame);
 *   -# `"frame_decoder"`: a new Frame_decoder (inbound: bytes => frames);
 *   -# `"decoder"`: the shared Message_decoder (inbound: frame => Message);
 *   -# `"idle_state_handler"`: a new Idle_state_monitor firing Channel_event::S_ALL_IDLE after
 *      Transport_conf::connection_timeout() with neither reads nor writes;
 *   -# `"handler"`: a new Transport_channel_handler, bound to a new Transport_client for the channel.
 *
 * The codec stages are stateless, hence shared by all pipelines built by `*this`.
 *
 * ### Thread safety ###
 * After construction all methods are `const` in spirit and may be called concurrently.  The context must outlive
 * every factory and server created from it.
 */
class Transport_context :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Name of the Message_encoder stage.
  static const std::string S_ENCODER_STAGE_NAME;
  /// Name of the Frame_decoder stage.
  static const std::string S_FRAME_DECODER_STAGE_NAME;
  /// Name of the Message_decoder stage.
  static const std::string S_DECODER_STAGE_NAME;
  /// Name of the Idle_state_monitor stage.
  static const std::string S_IDLE_STATE_HANDLER_STAGE_NAME;
  /// Name of the Transport_channel_handler stage.
  static const std::string S_HANDLER_STAGE_NAME;

  // Constructors/destructor.

  /**
   * Constructs the context.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; passed on to everything created by `*this`.
   * @param conf
   *        Configuration; copied.
   * @param rpc_handler
   *        Serves requests arriving on every connection (unless a server bootstrap substitutes another).  Not null.
   * @param close_idle_connections
   *        Whether a connection idle for the connection timeout is closed even with no requests outstanding.
   */
  explicit Transport_context(flow::log::Logger* logger_ptr, const Transport_conf& conf, Rpc_handler_ptr rpc_handler,
                             bool close_idle_connections = false);

  /// Boring destructor.
  ~Transport_context();

  // Methods.

  /**
   * Creates a client factory whose `create_client()` runs the given bootstraps, in order, on each new client.
   *
   * @param bootstraps
   *        Client bootstraps.
   * @return See above.  Not null.
   */
  std::unique_ptr<Transport_client_factory>
    create_client_factory(const std::vector<Transport_client_bootstrap_ptr>& bootstraps
                            = std::vector<Transport_client_bootstrap_ptr>()) const;

  /**
   * Creates a server listening at the given address and port, applying the given bootstraps to each accepted
   * connection.
   *
   * @param host
   *        Local address to bind; empty means any IPv4 address.
   * @param port
   *        Port to bind; 0 means an ephemeral port (see Transport_server::port()).
   * @param bootstraps
   *        Server bootstraps.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from resolving or binding.
   * @return See above.  Null on error.
   */
  std::unique_ptr<Transport_server>
    create_server(const std::string& host, uint16_t port,
                  const std::vector<Transport_server_bootstrap_ptr>& bootstraps, Error_code* err_code = 0) const;

  /**
   * Equivalent to `create_server("", port, bootstraps, err_code)`.
   *
   * @param port
   *        See other create_server().
   * @param bootstraps
   *        See other create_server().
   * @param err_code
   *        See other create_server().
   * @return See other create_server().
   */
  std::unique_ptr<Transport_server>
    create_server(uint16_t port, const std::vector<Transport_server_bootstrap_ptr>& bootstraps,
                  Error_code* err_code = 0) const;

  /**
   * Equivalent to `create_server("", 0, bootstraps, err_code)`.
   *
   * @param bootstraps
   *        See other create_server().
   * @param err_code
   *        See other create_server().
   * @return See other create_server().
   */
  std::unique_ptr<Transport_server>
    create_server(const std::vector<Transport_server_bootstrap_ptr>& bootstraps = {}, Error_code* err_code = 0) const;

  /**
   * Equivalent to `initialize_pipeline(channel, rpc_handler())`.
   *
   * @param channel
   *        See other initialize_pipeline().
   * @return See other initialize_pipeline().
   */
  std::shared_ptr<Transport_channel_handler> initialize_pipeline(const Channel_ptr& channel) const;

  /**
   * Installs the stages listed in the class doc header into the (not yet activated) channel's pipeline, with the
   * given handler serving requests arriving on that channel.
   *
   * If the pipeline cannot be built (e.g., it already contains stages), the failure is logged, `channel` is closed,
   * and `flow::error::Runtime_error` is thrown.
   *
   * @param channel
   *        The channel.  Its pipeline should be empty.
   * @param channel_rpc_handler
   *        Serves requests arriving on `channel`.
   * @return The `"handler"` stage.  Its Transport_channel_handler::client() is the channel's client.
   */
  std::shared_ptr<Transport_channel_handler> initialize_pipeline(const Channel_ptr& channel,
                                                                 const Rpc_handler_ptr& channel_rpc_handler) const;

  /**
   * The configuration.
   * @return See above.
   */
  const Transport_conf& conf() const;

  /**
   * Whether idle connections are closed even with no requests outstanding.
   * @return See above.
   */
  bool close_idle_connections() const;

  /**
   * The default Rpc_handler.
   * @return See above.
   */
  const Rpc_handler_ptr& rpc_handler() const;

private:
  // Data.

  /// See conf().
  const Transport_conf m_conf;

  /// See rpc_handler().
  const Rpc_handler_ptr m_rpc_handler;

  /// See close_idle_connections().
  const bool m_close_idle_connections;

  /// The encoder stage shared by all pipelines.
  const std::shared_ptr<Message_encoder> m_encoder;

  /// The decoder stage shared by all pipelines.
  const std::shared_ptr<Message_decoder> m_decoder;
}; // class Transport_context

} // namespace shuffle::transport
