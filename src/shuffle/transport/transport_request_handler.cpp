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
#include "shuffle/transport/transport_request_handler.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/rpc_handler.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/message.hpp"
#include "shuffle/transport/message_codec.hpp"
#include "shuffle/transport/error.hpp"

namespace shuffle::transport
{

// Implementations.

Transport_request_handler::Transport_request_handler(flow::log::Logger* logger_ptr,
                                                     Transport_client_ptr reverse_client,
                                                     Rpc_handler_ptr rpc_handler) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_reverse_client(std::move(reverse_client)),
  m_rpc_handler(std::move(rpc_handler))
{
  // That's it.
}

void Transport_request_handler::handle(const Message_ptr& request)
{
  // We are in thread W.
  FLOW_LOG_TRACE("Client [" << *m_reverse_client << "]: Serving request [" << *request << "].");

  switch (request->m_type)
  {
  case Message_type::S_RPC_REQUEST:
    process_rpc_request(request);
    break;
  case Message_type::S_ONE_WAY_MESSAGE:
    process_one_way_message(request);
    break;
  case Message_type::S_BLOCK_FETCH_REQUEST:
    process_fetch_request(request);
    break;
  default:
    assert(false && "Responses are dispatched to Transport_response_handler.");
  }
}

void Transport_request_handler::process_rpc_request(const Message_ptr& request)
{
  using std::make_shared;

  // We are in thread W.
  const auto request_id = request->m_request_id;
  auto body = request->m_body ? request->m_body : util::make_blob(get_logger(), util::String_view());

  m_rpc_handler->receive(m_reverse_client, std::move(body),
                         [logger_ptr = get_logger(), channel = m_reverse_client->channel(), request_id]
                           (const Error_code& err_code, util::Blob_ptr response_body)
  {
    // We are in some thread (the handler's choice).
    auto response = make_shared<Message>();
    response->m_request_id = request_id;
    if (err_code)
    {
      response->m_type = Message_type::S_RPC_FAILURE;
      response->m_error = err_code.message();
    }
    else
    {
      response->m_type = Message_type::S_RPC_RESPONSE;
      response->m_body = std::move(response_body);
    }
    respond(logger_ptr, channel, std::move(response));
  });
} // Transport_request_handler::process_rpc_request()

void Transport_request_handler::process_one_way_message(const Message_ptr& request)
{
  // We are in thread W.
  m_rpc_handler->receive_one_way(m_reverse_client,
                                 request->m_body ? request->m_body
                                                 : util::make_blob(get_logger(), util::String_view()));
}

void Transport_request_handler::process_fetch_request(const Message_ptr& request)
{
  using std::make_shared;

  // We are in thread W.
  Error_code err_code;
  auto block = m_rpc_handler->get_block(request->m_block_id, &err_code);

  auto response = make_shared<Message>();
  response->m_request_id = request->m_request_id;
  response->m_block_id = request->m_block_id;
  if (err_code)
  {
    FLOW_LOG_WARNING("Client [" << *m_reverse_client << "]: Cannot serve block [" << request->m_block_id << "]: "
                     "[" << err_code << "] [" << err_code.message() << "].");
    response->m_type = Message_type::S_BLOCK_FETCH_FAILURE;
    response->m_error = err_code.message();
  }
  else
  {
    response->m_type = Message_type::S_BLOCK_FETCH_SUCCESS;
    response->m_body = std::move(block);
  }
  respond(get_logger(), m_reverse_client->channel(), std::move(response));
} // Transport_request_handler::process_fetch_request()

void Transport_request_handler::respond(flow::log::Logger* logger_ptr, const Channel_ptr& channel,
                                        Message_ptr response) // Static.
{
  using std::make_shared;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  if (Message_encoder::too_large(*response))
  {
    const bool is_rpc = response->m_type == Message_type::S_RPC_RESPONSE;
    FLOW_LOG_WARNING("Channel [" << *channel << "]: Response [" << *response << "] would exceed the maximum frame "
                     "size; responding with a failure instead.");

    auto failure = make_shared<Message>();
    failure->m_type = is_rpc ? Message_type::S_RPC_FAILURE : Message_type::S_BLOCK_FETCH_FAILURE;
    failure->m_request_id = response->m_request_id;
    failure->m_block_id = response->m_block_id;
    failure->m_error = Error_code(error::Code::S_MESSAGE_TOO_LARGE).message();
    response = std::move(failure);
  }
  // else

  FLOW_LOG_TRACE("Channel [" << *channel << "]: Responding [" << *response << "].");

  channel->write(std::move(response), [logger_ptr, channel](const Error_code& err_code)
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);
    FLOW_LOG_WARNING("Channel [" << *channel << "]: Could not send response: [" << err_code << "] "
                     "[" << err_code.message() << "].");
  });
}

void Transport_request_handler::channel_active()
{
  m_rpc_handler->channel_active(m_reverse_client);
}

void Transport_request_handler::channel_inactive()
{
  m_rpc_handler->channel_inactive(m_reverse_client);
}

void Transport_request_handler::exception_caught(const Error_code& err_code)
{
  m_rpc_handler->exception_caught(err_code, m_reverse_client);
}

} // namespace shuffle::transport
