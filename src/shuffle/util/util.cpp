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
#include "shuffle/util/util_fwd.hpp"
#include <cstring>

namespace shuffle::util
{

// Initializations.

const std::string EMPTY_STRING;

// Implementations.

Blob_ptr make_blob(flow::log::Logger* logger_ptr, const Blob_const& bytes)
{
  using flow::util::Blob;
  using std::memcpy;

  auto blob = std::make_shared<Blob>(logger_ptr, bytes.size());
  if (bytes.size() != 0)
  {
    memcpy(blob->begin(), bytes.data(), bytes.size());
  }
  return blob;
}

Blob_ptr make_blob(flow::log::Logger* logger_ptr, String_view str)
{
  return make_blob(logger_ptr, Blob_const(static_cast<const void*>(str.data()), str.size()));
}

String_view blob_view(const Blob_ptr& blob)
{
  if ((!blob) || blob->empty())
  {
    return String_view();
  }
  // else
  return String_view(reinterpret_cast<const char*>(blob->const_begin()), blob->size());
}

size_t blob_size(const Blob_ptr& blob)
{
  return blob ? blob->size() : 0;
}

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

} // namespace shuffle::util
