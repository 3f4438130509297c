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
#include "shuffle/transport/transport_context.hpp"
#include "shuffle/transport/transport_client_factory.hpp"
#include "shuffle/transport/transport_server.hpp"
#include "shuffle/transport/transport_bootstrap.hpp"
#include "shuffle/transport/transport_channel_handler.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/transport_response_handler.hpp"
#include "shuffle/transport/transport_request_handler.hpp"
#include "shuffle/transport/idle_state_monitor.hpp"
#include "shuffle/transport/message_codec.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>

namespace shuffle::transport
{

// Static initializations.

const std::string Transport_context::S_ENCODER_STAGE_NAME = "encoder";
const std::string Transport_context::S_FRAME_DECODER_STAGE_NAME = "frame_decoder";
const std::string Transport_context::S_DECODER_STAGE_NAME = "decoder";
const std::string Transport_context::S_IDLE_STATE_HANDLER_STAGE_NAME = "idle_state_handler";
const std::string Transport_context::S_HANDLER_STAGE_NAME = "handler";

// Implementations.

Transport_client_bootstrap::~Transport_client_bootstrap() = default;

Transport_server_bootstrap::~Transport_server_bootstrap() = default;

Transport_context::Transport_context(flow::log::Logger* logger_ptr, const Transport_conf& conf,
                                     Rpc_handler_ptr rpc_handler, bool close_idle_connections) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_conf(conf),
  m_rpc_handler(std::move(rpc_handler)),
  m_close_idle_connections(close_idle_connections),
  m_encoder(std::make_shared<Message_encoder>(logger_ptr)),
  m_decoder(std::make_shared<Message_decoder>(logger_ptr))
{
  assert(m_rpc_handler && "Null Rpc_handler is not allowed.");

  FLOW_LOG_INFO("Transport context created: conf [" << m_conf << "]; "
                "close idle connections? = [" << m_close_idle_connections << "].");
}

Transport_context::~Transport_context() = default;

std::unique_ptr<Transport_client_factory>
  Transport_context::create_client_factory(const std::vector<Transport_client_bootstrap_ptr>& bootstraps) const
{
  return std::make_unique<Transport_client_factory>(get_logger(), this, bootstraps);
}

std::unique_ptr<Transport_server>
  Transport_context::create_server(const std::string& host, uint16_t port,
                                   const std::vector<Transport_server_bootstrap_ptr>& bootstraps,
                                   Error_code* err_code) const
{
  using flow::error::Runtime_error;
  using std::make_unique;

  Error_code our_err_code;
  auto server = make_unique<Transport_server>(get_logger(), this, host, port, bootstraps, &our_err_code);
  if (our_err_code)
  {
    server.reset();
    if (err_code)
    {
      *err_code = our_err_code;
      return server;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  return server;
} // Transport_context::create_server()

std::unique_ptr<Transport_server>
  Transport_context::create_server(uint16_t port, const std::vector<Transport_server_bootstrap_ptr>& bootstraps,
                                   Error_code* err_code) const
{
  return create_server(util::EMPTY_STRING, port, bootstraps, err_code);
}

std::unique_ptr<Transport_server>
  Transport_context::create_server(const std::vector<Transport_server_bootstrap_ptr>& bootstraps,
                                   Error_code* err_code) const
{
  return create_server(util::EMPTY_STRING, 0, bootstraps, err_code);
}

std::shared_ptr<Transport_channel_handler> Transport_context::initialize_pipeline(const Channel_ptr& channel) const
{
  return initialize_pipeline(channel, m_rpc_handler);
}

std::shared_ptr<Transport_channel_handler>
  Transport_context::initialize_pipeline(const Channel_ptr& channel, const Rpc_handler_ptr& channel_rpc_handler) const
{
  using flow::error::Runtime_error;
  using flow::util::ostream_op_string;
  using std::make_shared;

  auto& pipeline = channel->pipeline();

  Error_code err_code;
  if (!pipeline.empty())
  {
    FLOW_LOG_WARNING("Channel [" << *channel << "]: Cannot install pipeline: it already has "
                     "[" << pipeline.size() << "] stages.");
    err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else if (!channel_rpc_handler)
  {
    FLOW_LOG_WARNING("Channel [" << *channel << "]: Cannot install pipeline: null Rpc_handler.");
    err_code = error::Code::S_INVALID_ARGUMENT;
  }

  std::shared_ptr<Transport_channel_handler> channel_handler;
  if (!err_code)
  {
    const auto response_handler = make_shared<Transport_response_handler>(get_logger(),
                                                                          ostream_op_string(*channel));
    const auto client = make_shared<Transport_client>(get_logger(), channel, response_handler);
    const auto request_handler = make_shared<Transport_request_handler>(get_logger(), client, channel_rpc_handler);
    channel_handler = make_shared<Transport_channel_handler>(get_logger(), client, response_handler, request_handler,
                                                             m_conf.connection_timeout(), m_close_idle_connections);

    // Each add_last() emits an error (and logs) instead of throwing; stop at the first one.
    pipeline.add_last(S_ENCODER_STAGE_NAME, m_encoder, &err_code);
    if (!err_code)
    {
      pipeline.add_last(S_FRAME_DECODER_STAGE_NAME, make_shared<Frame_decoder>(get_logger()), &err_code);
    }
    if (!err_code)
    {
      pipeline.add_last(S_DECODER_STAGE_NAME, m_decoder, &err_code);
    }
    if (!err_code)
    {
      pipeline.add_last(S_IDLE_STATE_HANDLER_STAGE_NAME,
                        make_shared<Idle_state_monitor>(get_logger(), m_conf.connection_timeout()), &err_code);
    }
    if (!err_code)
    {
      pipeline.add_last(S_HANDLER_STAGE_NAME, channel_handler, &err_code);
    }
  } // if (!err_code)

  if (err_code)
  {
    FLOW_LOG_WARNING("Channel [" << *channel << "]: Pipeline initialization failed; closing channel.  "
                     "Details follow.");
    FLOW_LOG_WARNING("Error: [" << err_code << "] [" << err_code.message() << "].");
    channel->close();
    throw Runtime_error(err_code, "Transport_context::initialize_pipeline()");
  }
  // else

  FLOW_LOG_TRACE("Channel [" << *channel << "]: Pipeline installed: [" << pipeline.size() << "] stages.");
  return channel_handler;
} // Transport_context::initialize_pipeline()

const Transport_conf& Transport_context::conf() const
{
  return m_conf;
}

bool Transport_context::close_idle_connections() const
{
  return m_close_idle_connections;
}

const Rpc_handler_ptr& Transport_context::rpc_handler() const
{
  return m_rpc_handler;
}

} // namespace shuffle::transport
