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

#include "shuffle/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <flow/util/blob.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <string>

/**
 * Flow-Shuffle module containing miscellaneous general-use facilities that are used by ~all Flow-Shuffle
 * modules and/or do not fit into any other Flow-Shuffle module.
 */
namespace shuffle::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for boost.asio event loop (`io_context`) used by every worker thread in Flow-Shuffle.
using Task_engine = flow::util::Task_engine;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * Its API is that of `boost::asio::const_buffer`.
 */
using Blob_const = boost::asio::const_buffer;

/// Like #Blob_const but the memory is writable.
using Blob_mutable = boost::asio::mutable_buffer;

/**
 * Owned, immutable, shareable payload of one fetched block (or RPC response).  It is shared because the same
 * payload may be referenced by a transport completion handler and the user's listener simultaneously; and it is
 * `const` because nothing downstream of the decoder is allowed to modify it.
 */
using Blob_ptr = std::shared_ptr<const flow::util::Blob>;

// Constants.

/// A default-cted string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Allocates a new #Blob_ptr holding a copy of the given bytes.  The result is never null; if `bytes` is empty
 * the result is an empty (zero-sized) `Blob`.
 *
 * @param logger_ptr
 *        Logger to pass to the `Blob` for its (rare) logging.
 * @param bytes
 *        Bytes to copy.
 * @return See above.
 */
Blob_ptr make_blob(flow::log::Logger* logger_ptr, const Blob_const& bytes);

/**
 * Like the other make_blob() but copying the characters of a string.
 *
 * @param logger_ptr
 *        See other make_blob().
 * @param str
 *        Characters to copy.
 * @return See above.
 */
Blob_ptr make_blob(flow::log::Logger* logger_ptr, String_view str);

/**
 * Returns a view of the bytes in the given blob as characters.  Null or empty `blob` => empty view.
 * The view is valid as long as `*blob` is.
 *
 * @param blob
 *        Blob, or null.
 * @return See above.
 */
String_view blob_view(const Blob_ptr& blob);

/**
 * Returns the size of `*blob`, or 0 if `blob` is null.
 *
 * @param blob
 *        Blob, or null.
 * @return See above.
 */
size_t blob_size(const Blob_ptr& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

} // namespace shuffle::util
