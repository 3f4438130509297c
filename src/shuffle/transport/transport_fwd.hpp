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

#include "shuffle/util/util_fwd.hpp"
#include <memory>
#include <variant>

/**
 * Flow-Shuffle module that turns a raw TCP connection into a framed, encoded/decoded, idle-monitored
 * request/response channel shared by many concurrent logical requests.  See namespace ::shuffle doc header for an
 * overview of Flow-Shuffle modules and how shuffle::transport relates to the others.  Then return here.  A synopsis
 * follows.
 *
 * Everything starts with a Transport_context.  It is configured once (Transport_conf, an Rpc_handler for requests
 * arriving from the opposing side, whether idle connections should be closed) and then serves as the factory of
 * both sides of a connection:
 *   - Transport_context::create_client_factory() yields a Transport_client_factory; its `create_client()`
 *     connects to a server and returns a Transport_client on which one issues block fetches and RPCs.
 *   - Transport_context::create_server() yields a listening Transport_server.
 *
 * Either way each new connection (a Channel) receives the same ordered Channel_pipeline of stages, built by
 * Transport_context::initialize_pipeline(): an encoder, a frame decoder, a message decoder, an idle monitor, and
 * finally the Transport_channel_handler which multiplexes requests and responses.  The pipeline machinery is
 * deliberately small: named stages, inbound events head-to-tail, outbound writes tail-to-head.
 *
 * @internal
 *
 * Threading: every Channel belongs to one I/O worker thread (one per Transport_client_factory and one per
 * Transport_server); all pipeline traffic of that Channel runs there.  Within this module we call it thread W.
 * Public APIs that may be invoked from other threads (thread U) post onto W or lock.
 */
namespace shuffle::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Config_provider;
class Map_config_provider;
class Transport_conf;

struct Message;
class Message_encoder;
class Frame_decoder;
class Message_decoder;

class Channel;
class Channel_pipeline;
class Channel_stage;
class Stage_context;
class Idle_state_monitor;

class Rpc_handler;
class No_op_rpc_handler;
class Transport_client;
class Transport_response_handler;
class Transport_request_handler;
class Transport_channel_handler;

class Transport_client_bootstrap;
class Transport_server_bootstrap;
class Transport_context;
class Transport_client_factory;
class Transport_server;

/// Short-hand for ref-counted pointer to an immutable, decoded Message.
using Message_ptr = std::shared_ptr<const Message>;

/**
 * An item traveling through a Channel_pipeline: either raw bytes (a chunk read from the socket, a complete frame,
 * or an encoded frame ready to write) or a decoded Message.  Which one a given stage sees depends on its position
 * relative to the codec stages.
 */
using Pipeline_item = std::variant<util::Blob_ptr, Message_ptr>;

/// Short-hand for ref-counted pointer to Channel.  A Channel is always owned this way.
using Channel_ptr = std::shared_ptr<Channel>;

/// Short-hand for ref-counted pointer to a pipeline stage.  Some stages are shared among many pipelines.
using Channel_stage_ptr = std::shared_ptr<Channel_stage>;

/// Short-hand for ref-counted pointer to Rpc_handler.
using Rpc_handler_ptr = std::shared_ptr<Rpc_handler>;

/// Short-hand for ref-counted pointer to Transport_client.
using Transport_client_ptr = std::shared_ptr<Transport_client>;

/// Short-hand for ref-counted pointer to Transport_client_bootstrap.
using Transport_client_bootstrap_ptr = std::shared_ptr<Transport_client_bootstrap>;

/// Short-hand for ref-counted pointer to Transport_server_bootstrap.
using Transport_server_bootstrap_ptr = std::shared_ptr<Transport_server_bootstrap>;

/**
 * Completion handler for a request sent via Transport_client: block fetch or RPC.  Exactly one call per request.
 * On success `err_code` is falsy and `response` is the payload (never null, possibly empty); on failure
 * `err_code` is truthy and `response` is null.
 */
using Response_func = Function<void (const Error_code& err_code, util::Blob_ptr response)>;

// Free functions.

/**
 * Prints string representation of the given `Channel` to the given `ostream`.
 *
 * @relatesalso Channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Channel& val);

/**
 * Prints string representation of the given `Transport_client` to the given `ostream`.
 *
 * @relatesalso Transport_client
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transport_client& val);

/**
 * Prints string representation of the given `Transport_server` to the given `ostream`.
 *
 * @relatesalso Transport_server
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transport_server& val);

/**
 * Prints string representation of the given `Message` to the given `ostream`.  The body is not printed, only
 * its size.
 *
 * @relatesalso Message
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Message& val);

} // namespace shuffle::transport
