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
#include "shuffle/transport/rpc_handler.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/error.hpp"

namespace shuffle::transport
{

// Rpc_handler implementations.

Rpc_handler::~Rpc_handler() = default;

void Rpc_handler::receive_one_way(const Transport_client_ptr& client, util::Blob_ptr message) // Virtual.
{
  receive(client, std::move(message), [](const Error_code&, util::Blob_ptr)
  {
    // One-way: there is nobody to reply to.
  });
}

util::Blob_ptr Rpc_handler::get_block(const std::string&, Error_code* err_code) // Virtual.
{
  *err_code = error::Code::S_RPC_HANDLER_UNSUPPORTED;
  return util::Blob_ptr();
}

void Rpc_handler::channel_active(const Transport_client_ptr&) // Virtual.
{
  // Do nothing.
}

void Rpc_handler::channel_inactive(const Transport_client_ptr&) // Virtual.
{
  // Do nothing.
}

void Rpc_handler::exception_caught(const Error_code&, const Transport_client_ptr&) // Virtual.
{
  // Do nothing.
}

// No_op_rpc_handler implementations.

No_op_rpc_handler::No_op_rpc_handler(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT)
{
  // That's it.
}

void No_op_rpc_handler::receive(const Transport_client_ptr& client, util::Blob_ptr message,
                                Response_func&& on_response)
{
  FLOW_LOG_WARNING("Client [" << *client << "]: Received RPC of [" << util::blob_size(message) << "] bytes, but "
                   "this side handles no RPCs.  Failing it.");
  on_response(error::Code::S_RPC_HANDLER_UNSUPPORTED, util::Blob_ptr());
}

} // namespace shuffle::transport
