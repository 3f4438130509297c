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
#include "shuffle/transport/transport_response_handler.hpp"
#include "shuffle/transport/message.hpp"
#include "shuffle/transport/error.hpp"
#include <vector>

namespace shuffle::transport
{

// Implementations.

Transport_response_handler::Transport_response_handler(flow::log::Logger* logger_ptr,
                                                       util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname),
  m_time_of_last_request(flow::Fine_clock::now())
{
  // That's it.
}

void Transport_response_handler::add_fetch_request(uint64_t request_id, Response_func&& on_done)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_time_of_last_request = flow::Fine_clock::now();
  m_outstanding_fetches.emplace(request_id, std::move(on_done));
}

Response_func Transport_response_handler::remove_fetch_request(uint64_t request_id)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return remove_request(&m_outstanding_fetches, request_id);
}

void Transport_response_handler::add_rpc_request(uint64_t request_id, Response_func&& on_done)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_time_of_last_request = flow::Fine_clock::now();
  m_outstanding_rpcs.emplace(request_id, std::move(on_done));
}

Response_func Transport_response_handler::remove_rpc_request(uint64_t request_id)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return remove_request(&m_outstanding_rpcs, request_id);
}

Response_func Transport_response_handler::remove_request(Request_map* requests, uint64_t request_id) // Static.
{
  const auto it = requests->find(request_id);
  if (it == requests->end())
  {
    return Response_func();
  }
  // else
  auto on_done = std::move(it->second);
  requests->erase(it);
  return on_done;
}

void Transport_response_handler::handle(const Message_ptr& response)
{
  // We are in thread W.
  Response_func on_done;
  switch (response->m_type)
  {
  case Message_type::S_BLOCK_FETCH_SUCCESS:
  case Message_type::S_BLOCK_FETCH_FAILURE:
    on_done = remove_fetch_request(response->m_request_id);
    break;
  case Message_type::S_RPC_RESPONSE:
  case Message_type::S_RPC_FAILURE:
    on_done = remove_rpc_request(response->m_request_id);
    break;
  default:
    assert(false && "Requests are dispatched to Transport_request_handler.");
    return;
  }

  if (!on_done)
  {
    FLOW_LOG_WARNING("Connection [" << m_nickname << "]: Ignoring response [" << *response << "] since it matches "
                     "no outstanding request.");
    return;
  }
  // else

  if ((response->m_type == Message_type::S_BLOCK_FETCH_FAILURE) || (response->m_type == Message_type::S_RPC_FAILURE))
  {
    FLOW_LOG_WARNING("Connection [" << m_nickname << "]: Opposing side failed request [" << *response << "]: "
                     "[" << response->m_error << "].");
    on_done(error::Code::S_REMOTE_REQUEST_FAILED, util::Blob_ptr());
    return;
  }
  // else

  FLOW_LOG_TRACE("Connection [" << m_nickname << "]: Completing request with response [" << *response << "].");
  on_done(Error_code(), response->m_body ? response->m_body : util::make_blob(get_logger(), util::String_view()));
} // Transport_response_handler::handle()

void Transport_response_handler::channel_active()
{
  // Nothing to do.
}

void Transport_response_handler::channel_inactive()
{
  // We are in thread W.
  const auto n_outstanding = num_outstanding_requests();
  if (n_outstanding != 0)
  {
    FLOW_LOG_WARNING("Connection [" << m_nickname << "]: Closed with [" << n_outstanding << "] requests "
                     "outstanding; failing them.");
    fail_outstanding_requests(error::Code::S_CONNECTION_CLOSED);
  }
}

void Transport_response_handler::exception_caught(const Error_code& err_code)
{
  // We are in thread W.
  const auto n_outstanding = num_outstanding_requests();
  if (n_outstanding != 0)
  {
    FLOW_LOG_WARNING("Connection [" << m_nickname << "]: Failed with [" << n_outstanding << "] requests "
                     "outstanding; failing them with [" << err_code << "] [" << err_code.message() << "].");
    fail_outstanding_requests(err_code);
  }
}

void Transport_response_handler::fail_outstanding_requests(const Error_code& err_code)
{
  Request_map fetches;
  Request_map rpcs;
  {
    flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
    fetches.swap(m_outstanding_fetches);
    rpcs.swap(m_outstanding_rpcs);
  }

  // Invoke outside the lock: a handler may well issue new requests on this or another connection.
  for (auto& id_and_func : fetches)
  {
    id_and_func.second(err_code, util::Blob_ptr());
  }
  for (auto& id_and_func : rpcs)
  {
    id_and_func.second(err_code, util::Blob_ptr());
  }
}

size_t Transport_response_handler::num_outstanding_requests() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_outstanding_fetches.size() + m_outstanding_rpcs.size();
}

util::Fine_time_pt Transport_response_handler::time_of_last_request() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_time_of_last_request;
}

} // namespace shuffle::transport
