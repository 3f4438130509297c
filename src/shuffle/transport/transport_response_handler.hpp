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
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>

namespace shuffle::transport
{

// Types.

/**
 * Client-side bookkeeping of one connection's outstanding requests: for each request ID, the Response_func
 * awaiting it.  Each response arriving on the connection is matched to, and removes, its entry; when the
 * connection closes or fails, every remaining entry is failed.  Each Response_func is therefore invoked exactly
 * once, always outside the internal lock.
 *
 * Registration (add_*()) happens from any thread (via Transport_client); responses and failure events arrive in
 * thread W.  Hence the mutex.
 */
class Transport_response_handler :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs handler with nothing outstanding.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Brief description of the connection for logging.
   */
  explicit Transport_response_handler(flow::log::Logger* logger_ptr, util::String_view nickname);

  // Methods.

  /**
   * Registers a pending block fetch.  Updates time_of_last_request().
   *
   * @param request_id
   *        Request ID, unique within the connection.
   * @param on_done
   *        Completion handler.
   */
  void add_fetch_request(uint64_t request_id, Response_func&& on_done);

  /**
   * Unregisters a pending block fetch, returning its completion handler, or an empty one if not outstanding.
   *
   * @param request_id
   *        Request ID.
   * @return See above.
   */
  Response_func remove_fetch_request(uint64_t request_id);

  /**
   * Registers a pending RPC.  Updates time_of_last_request().
   *
   * @param request_id
   *        Request ID, unique within the connection.
   * @param on_done
   *        Completion handler.
   */
  void add_rpc_request(uint64_t request_id, Response_func&& on_done);

  /**
   * Unregisters a pending RPC, returning its completion handler, or an empty one if not outstanding.
   *
   * @param request_id
   *        Request ID.
   * @return See above.
   */
  Response_func remove_rpc_request(uint64_t request_id);

  /**
   * Handles a response message: completes the matching request.  A response matching nothing is logged and
   * ignored.  Thread W.
   *
   * @param response
   *        The response.  `is_request(response->m_type) == false`.
   */
  void handle(const Message_ptr& response);

  /// The connection became active.  Thread W.
  void channel_active();

  /// The connection closed: fails everything outstanding with error::Code::S_CONNECTION_CLOSED.  Thread W.
  void channel_inactive();

  /**
   * The connection failed: fails everything outstanding with `err_code`.  Thread W.
   * @param err_code
   *        The error.
   */
  void exception_caught(const Error_code& err_code);

  /**
   * Fails (and unregisters) every outstanding request with the given error.
   * @param err_code
   *        The error.
   */
  void fail_outstanding_requests(const Error_code& err_code);

  /**
   * Number of outstanding requests of all kinds.
   * @return See above.
   */
  size_t num_outstanding_requests() const;

  /**
   * When the last request was registered; or construction time if none.
   * @return See above.
   */
  util::Fine_time_pt time_of_last_request() const;

private:
  // Types.

  /// Request ID => completion handler.
  using Request_map = boost::unordered_map<uint64_t, Response_func>;

  // Methods.

  /**
   * Removes and returns the entry for `request_id` from `*requests`, or an empty function.  #m_mutex must be
   * locked.
   *
   * @param requests
   *        One of our maps.
   * @param request_id
   *        Request ID.
   * @return See above.
   */
  static Response_func remove_request(Request_map* requests, uint64_t request_id);

  // Data.

  /// Brief description of the connection for logging.
  const std::string m_nickname;

  /// Protects the data below.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Outstanding block fetches.
  Request_map m_outstanding_fetches;

  /// Outstanding RPCs.
  Request_map m_outstanding_rpcs;

  /// See time_of_last_request().
  util::Fine_time_pt m_time_of_last_request;
}; // class Transport_response_handler

} // namespace shuffle::transport
