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


#pragma once

#include <shuffle/common.hpp>
#include <shuffle/util/util_fwd.hpp>
#include <functional>
#include <type_traits>

namespace shuffle::test
{

/**
 * Polls `condition` every few milliseconds until it holds or `timeout` passes.
 *
 * @param condition The condition.
 * @param timeout How long to wait at most.
 *
 * @return Whether `condition` held before the timeout.
 */
bool wait_until(const std::function<bool ()>& condition, util::Fine_duration timeout);

/**
 * Casts an enumeration to its primitive type.
 *
 * @tparam Enum The enumeration type.
 * @param e The enumeration value.
 *
 * @return The primitive type form of the enumeration value.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace shuffle::test
