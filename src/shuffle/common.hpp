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

/* @todo More consistent to move this below `#include "shuffle/..."`; but flow/common.hpp needs to #undef a couple
 * things before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*) for that to work. */
#include <flow/util/util.hpp>

#include "shuffle/detail/common.hpp"
#include <boost/asio.hpp>

/* We build in C++17 mode ourselves, and the headers (templates, constexprs) require it of the `#include`ing
 * translation unit as well.  Enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any shuffle/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-Shuffle project: the reliable-delivery and transport-wiring core of a
 * data-shuffle client.  It fetches named remote data blocks over asynchronous TCP connections, retries those that
 * fail for transient reasons, and guarantees each requested block exactly one terminal outcome delivered to the
 * caller's listener.
 *
 * Modules overview
 * ----------------
 *   - *shuffle::transport*: turns a raw TCP connection into a framed, encoded/decoded, idle-monitored
 *     request/response channel.  The centerpiece is shuffle::transport::Transport_context, which builds the ordered
 *     set of stages (`Channel_pipeline`) installed on every client or server connection, and from which one obtains
 *     a `Transport_client_factory` and `Transport_server`.  A `Transport_client` is the handle through which many
 *     concurrent logical requests (block fetches, RPCs) share one connection.
 *   - *shuffle::fetch*: the retry and delivery discipline.  shuffle::fetch::Retrying_block_fetcher wraps any
 *     `Block_fetch_starter` so that blocks failing with transient (I/O-class) errors are re-requested, all
 *     together and in their original order, up to a fixed budget; and so that the caller's
 *     `Block_fetching_listener` hears exactly once about every block.  shuffle::fetch::Shuffle_client puts the
 *     two modules together.
 *   - *shuffle::util*: small aliases and helpers used by the others.
 *
 * Dependencies: ::shuffle::util <- ::shuffle::transport <- ::shuffle::fetch.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-Shuffle requires Flow and Boost, not only for internal implementation purposes but also in its APIs.
 * `flow::log` is the assumed logging system; `flow::Error_code` and related conventions are used for error
 * reporting; `flow::async` supplies the worker threads; boost.asio supplies the sockets.
 *
 * ### Error reporting ###
 * Inherited from Flow: see the `namespace flow` doc header's "Error reporting" section.  Briefly: a synchronous
 * API taking `Error_code* err_code` sets `*err_code` on failure, if `err_code` is not null; otherwise it throws
 * `flow::error::Runtime_error` carrying the same code.  Asynchronous results are reported as a `const Error_code&`
 * argument to the completion handler.
 *
 * ### Logging ###
 * We use `flow::log`.  The user supplies a `flow::log::Logger` to the various APIs in order to enable logging;
 * null means log nowhere.
 */
namespace shuffle
{

// Types.  They're outside of `namespace ::shuffle::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef SHUFFLE_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by Flow-Shuffle internal
 * logging.  The individual members are generated by `flow::log` macro magic from
 * `log_component_enum_declare.macros.hpp`; look there for the list.
 *
 * A user configuring logging specifies it, rarely, in `flow::log::Config::init_component_to_union_idx_mapping()`
 * and `flow::log::Config::init_component_names()`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in shuffle::Log_component to its
 * string representation as used in log output and verbosity config.  If the member is `S_SOME_NAME`, its string is
 * `"SOME_NAME"` (optionally prefixed as supplied to `flow::log::Config::init_component_names()`).
 */
extern const boost::unordered_multimap<Log_component, std::string> S_SHUFFLE_LOG_COMPONENT_NAME_MAP;

#endif // SHUFFLE_DOXYGEN_ONLY

} // namespace shuffle
