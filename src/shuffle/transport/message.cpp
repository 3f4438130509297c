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
#include "shuffle/transport/message.hpp"
#include <ostream>

namespace shuffle::transport
{

// Implementations.

bool is_request(Message_type type)
{
  switch (type)
  {
  case Message_type::S_RPC_REQUEST:
  case Message_type::S_ONE_WAY_MESSAGE:
  case Message_type::S_BLOCK_FETCH_REQUEST:
    return true;
  default:
    return false;
  }
}

std::ostream& operator<<(std::ostream& os, Message_type val)
{
  switch (val)
  {
  case Message_type::S_RPC_REQUEST:
    return os << "RPC_REQUEST";
  case Message_type::S_RPC_RESPONSE:
    return os << "RPC_RESPONSE";
  case Message_type::S_RPC_FAILURE:
    return os << "RPC_FAILURE";
  case Message_type::S_ONE_WAY_MESSAGE:
    return os << "ONE_WAY_MESSAGE";
  case Message_type::S_BLOCK_FETCH_REQUEST:
    return os << "BLOCK_FETCH_REQUEST";
  case Message_type::S_BLOCK_FETCH_SUCCESS:
    return os << "BLOCK_FETCH_SUCCESS";
  case Message_type::S_BLOCK_FETCH_FAILURE:
    return os << "BLOCK_FETCH_FAILURE";
  case Message_type::S_END_SENTINEL:
    break;
  }
  return os << "UNKNOWN(" << int(val) << ')';
}

std::ostream& operator<<(std::ostream& os, const Message& val)
{
  os << val.m_type << " id[" << val.m_request_id << ']';
  if (!val.m_block_id.empty())
  {
    os << " block[" << val.m_block_id << ']';
  }
  if (!val.m_error.empty())
  {
    os << " error[" << val.m_error << ']';
  }
  return os << " body_sz[" << util::blob_size(val.m_body) << ']';
}

} // namespace shuffle::transport
