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


#include "shuffle/test/test_common_util.hpp"
#include <flow/util/util.hpp>

namespace shuffle::test
{

bool wait_until(const std::function<bool ()>& condition, util::Fine_duration timeout)
{
  using flow::Fine_clock;

  const auto deadline = Fine_clock::now() + timeout;
  while (!condition())
  {
    if (Fine_clock::now() >= deadline)
    {
      return false;
    }
    flow::util::this_thread::sleep_for(boost::chrono::milliseconds(5));
  }
  return true;
}

} // namespace shuffle::test
