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
#include "shuffle/transport/transport_channel_handler.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/transport_response_handler.hpp"
#include "shuffle/transport/transport_request_handler.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/message.hpp"
#include "shuffle/transport/error.hpp"
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>

namespace shuffle::transport
{

// Implementations.

Transport_channel_handler::Transport_channel_handler(flow::log::Logger* logger_ptr,
                                                     Transport_client_ptr client,
                                                     std::shared_ptr<Transport_response_handler> response_handler,
                                                     std::shared_ptr<Transport_request_handler> request_handler,
                                                     util::Fine_duration request_timeout,
                                                     bool close_idle_connections) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_client(std::move(client)),
  m_response_handler(std::move(response_handler)),
  m_request_handler(std::move(request_handler)),
  m_request_timeout(request_timeout),
  m_close_idle_connections(close_idle_connections)
{
  // That's it.
}

const Transport_client_ptr& Transport_channel_handler::client() const
{
  return m_client;
}

const std::shared_ptr<Transport_response_handler>& Transport_channel_handler::response_handler() const
{
  return m_response_handler;
}

bool Transport_channel_handler::close_idle_connections() const
{
  return m_close_idle_connections;
}

void Transport_channel_handler::channel_active(Stage_context* ctx) // Virtual.
{
  // We are in thread W.
  m_request_handler->channel_active();
  m_response_handler->channel_active();
  ctx->fire_channel_active();
}

void Transport_channel_handler::channel_inactive(Stage_context* ctx) // Virtual.
{
  // We are in thread W.
  m_request_handler->channel_inactive();
  m_response_handler->channel_inactive();
  ctx->fire_channel_inactive();
}

void Transport_channel_handler::channel_read(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  using std::holds_alternative;
  using std::get;

  // We are in thread W.
  if (!holds_alternative<Message_ptr>(item))
  {
    ctx->fire_channel_read(std::move(item));
    return;
  }
  // else

  const auto& msg = get<Message_ptr>(item);
  if (is_request(msg->m_type))
  {
    m_request_handler->handle(msg);
  }
  else
  {
    m_response_handler->handle(msg);
  }
}

void Transport_channel_handler::event_triggered(Stage_context* ctx, Channel_event event) // Virtual.
{
  using flow::Fine_clock;
  using boost::chrono::milliseconds;
  using boost::chrono::round;

  // We are in thread W.
  if (event == Channel_event::S_ALL_IDLE)
  {
    const auto since_last_request = Fine_clock::now() - m_response_handler->time_of_last_request();
    const bool is_actually_overdue = since_last_request > m_request_timeout;
    const auto n_outstanding = m_response_handler->num_outstanding_requests();

    if ((n_outstanding != 0) && is_actually_overdue)
    {
      FLOW_LOG_WARNING("Channel [" << ctx->channel() << "]: Connection has been quiet for "
                       "[" << round<milliseconds>(since_last_request) << "] while [" << n_outstanding << "] "
                       "requests are outstanding; assuming the connection is dead.  Please adjust the connection "
                       "timeout if this is wrong.");
      m_client->time_out();
      m_response_handler->fail_outstanding_requests(error::Code::S_CONNECTION_IDLE_TIMEOUT);
      ctx->close();
    }
    else if (m_close_idle_connections)
    {
      FLOW_LOG_INFO("Channel [" << ctx->channel() << "]: Connection idle; closing it as configured.");
      m_client->time_out();
      ctx->close();
    }
  } // if (event == Channel_event::S_ALL_IDLE)

  ctx->fire_event_triggered(event);
} // Transport_channel_handler::event_triggered()

void Transport_channel_handler::exception_caught(Stage_context* ctx, const Error_code& err_code) // Virtual.
{
  // We are in thread W.
  FLOW_LOG_WARNING("Channel [" << ctx->channel() << "]: Error caught: [" << err_code << "] "
                   "[" << err_code.message() << "]; closing.");
  m_request_handler->exception_caught(err_code);
  m_response_handler->exception_caught(err_code);
  ctx->close();
  ctx->fire_exception_caught(err_code);
}

} // namespace shuffle::transport
