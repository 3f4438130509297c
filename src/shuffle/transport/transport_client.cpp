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
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/transport_response_handler.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/message.hpp"
#include "shuffle/transport/message_codec.hpp"
#include "shuffle/transport/error.hpp"

namespace shuffle::transport
{

// Implementations.

Transport_client::Transport_client(flow::log::Logger* logger_ptr, Channel_ptr channel,
                                   std::shared_ptr<Transport_response_handler> response_handler) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_channel(std::move(channel)),
  m_response_handler(std::move(response_handler)),
  m_next_request_id(1),
  m_timed_out(false)
{
  // That's it.
}

void Transport_client::fetch_block(const std::string& block_id, Response_func&& on_done)
{
  using std::make_shared;

  if (!is_active())
  {
    FLOW_LOG_WARNING("Client [" << *this << "]: Fetch of block [" << block_id << "] requested on inactive "
                     "client; failing it immediately.");
    on_done(error::Code::S_CONNECTION_CLOSED, util::Blob_ptr());
    return;
  }
  // else

  const auto request_id = next_request_id();
  auto request = make_shared<Message>();
  request->m_type = Message_type::S_BLOCK_FETCH_REQUEST;
  request->m_request_id = request_id;
  request->m_block_id = block_id;

  if (Message_encoder::too_large(*request))
  {
    FLOW_LOG_WARNING("Client [" << *this << "]: Fetch request [" << request_id << "] would exceed the maximum "
                     "frame size; failing it immediately.");
    on_done(error::Code::S_MESSAGE_TOO_LARGE, util::Blob_ptr());
    return;
  }
  // else

  FLOW_LOG_TRACE("Client [" << *this << "]: Sending fetch request [" << request_id << "] "
                 "for block [" << block_id << "].");

  m_response_handler->add_fetch_request(request_id, std::move(on_done));

  m_channel->write(Message_ptr(std::move(request)),
                   [response_handler = m_response_handler, request_id](const Error_code& err_code)
  {
    // We are in thread W.
    auto on_done = response_handler->remove_fetch_request(request_id);
    if (on_done) // Else the close already failed it.
    {
      on_done(err_code, util::Blob_ptr());
    }
  });
} // Transport_client::fetch_block()

void Transport_client::send_rpc(util::Blob_ptr message, Response_func&& on_done)
{
  using std::make_shared;

  if (!is_active())
  {
    FLOW_LOG_WARNING("Client [" << *this << "]: RPC of [" << util::blob_size(message) << "] bytes requested on "
                     "inactive client; failing it immediately.");
    on_done(error::Code::S_CONNECTION_CLOSED, util::Blob_ptr());
    return;
  }
  // else

  const auto request_id = next_request_id();
  const auto size = util::blob_size(message);
  auto request = make_shared<Message>();
  request->m_type = Message_type::S_RPC_REQUEST;
  request->m_request_id = request_id;
  request->m_body = std::move(message);

  if (Message_encoder::too_large(*request))
  {
    FLOW_LOG_WARNING("Client [" << *this << "]: RPC [" << request_id << "] of [" << size << "] bytes would exceed "
                     "the maximum frame size; failing it immediately.");
    on_done(error::Code::S_MESSAGE_TOO_LARGE, util::Blob_ptr());
    return;
  }
  // else

  FLOW_LOG_TRACE("Client [" << *this << "]: Sending RPC [" << request_id << "] of [" << size << "] bytes.");

  m_response_handler->add_rpc_request(request_id, std::move(on_done));

  m_channel->write(Message_ptr(std::move(request)),
                   [response_handler = m_response_handler, request_id](const Error_code& err_code)
  {
    // We are in thread W.
    auto on_done = response_handler->remove_rpc_request(request_id);
    if (on_done)
    {
      on_done(err_code, util::Blob_ptr());
    }
  });
} // Transport_client::send_rpc()

void Transport_client::send(util::Blob_ptr message)
{
  using std::make_shared;

  const auto size = util::blob_size(message);
  auto request = make_shared<Message>();
  request->m_type = Message_type::S_ONE_WAY_MESSAGE;
  request->m_request_id = 0;
  request->m_body = std::move(message);

  if (Message_encoder::too_large(*request))
  {
    FLOW_LOG_WARNING("Client [" << *this << "]: One-way message of [" << size << "] bytes would exceed the maximum "
                     "frame size; dropping it.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Client [" << *this << "]: Sending one-way message of [" << size << "] bytes.");
  m_channel->write(Message_ptr(std::move(request)));
}

void Transport_client::close()
{
  FLOW_LOG_INFO("Client [" << *this << "]: Closing by request.");
  m_channel->close();
}

void Transport_client::time_out()
{
  m_timed_out = true;
}

bool Transport_client::is_active() const
{
  return (!m_timed_out) && m_channel->is_active();
}

const Channel_ptr& Transport_client::channel() const
{
  return m_channel;
}

uint64_t Transport_client::next_request_id()
{
  return m_next_request_id++;
}

std::ostream& operator<<(std::ostream& os, const Transport_client& val)
{
  return os << *(val.channel());
}

} // namespace shuffle::transport
