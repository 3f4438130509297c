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
#include <string>

namespace shuffle::transport
{

// Types.

/// Kind of a Message.  The numeric values appear on the wire; do not reorder.
enum class Message_type : uint8_t
{
  /// Request: RPC expecting exactly one response (S_RPC_RESPONSE or S_RPC_FAILURE).
  S_RPC_REQUEST = 0,

  /// Response: successful reply to an S_RPC_REQUEST; the body is the reply.
  S_RPC_RESPONSE,

  /// Response: failed reply to an S_RPC_REQUEST; the error text says why.
  S_RPC_FAILURE,

  /// Request: one-way message; no response.
  S_ONE_WAY_MESSAGE,

  /// Request: fetch the block named by the block ID.
  S_BLOCK_FETCH_REQUEST,

  /// Response: the block's bytes are the body.
  S_BLOCK_FETCH_SUCCESS,

  /// Response: the block could not be served; the error text says why.
  S_BLOCK_FETCH_FAILURE,

  /// SENTINEL: Not a type.  Values at or above it are invalid on the wire.
  S_END_SENTINEL
}; // enum class Message_type

/**
 * One decoded protocol message.  Which fields are meaningful depends on #m_type; unused ones are empty/zero.
 * The request ID correlates a response with its request; it is chosen by the requester and unique per connection.
 * Messages are immutable once made and are passed around as #Message_ptr.
 */
struct Message
{
  // Data.

  /// Kind.
  Message_type m_type;

  /// Correlation ID; 0 for one-way messages.
  uint64_t m_request_id;

  /// Block ID: block fetch request/success/failure only.
  std::string m_block_id;

  /// Error text: failure responses only.
  std::string m_error;

  /// Payload: RPC request/response, one-way message, block fetch success.  Null means empty.
  util::Blob_ptr m_body;
}; // struct Message

// Free functions.

/**
 * Returns `true` if and only if a message of the given type is sent by a requester (as opposed to being a
 * response).
 *
 * @param type
 *        Type.
 * @return See above.
 */
bool is_request(Message_type type);

/**
 * Prints string representation of the given `Message_type` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Message_type val);

} // namespace shuffle::transport
