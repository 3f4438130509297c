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

#include <flow/log/simple_ostream_logger.hpp>
#include <shuffle/common.hpp>
#include "shuffle/test/test_config.hpp"

namespace shuffle::test
{

/**
 * Console logger for tests: both shuffle and Flow components, at or above the severity set in Test_config
 * (or the given one).
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity that will pass through logging filter.
   */
  Test_logger(flow::log::Sev min_severity = Test_config::get_singleton().m_sev) :
    m_config(make_config(min_severity)),
    m_logger(&m_config)
  {
  }

  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  bool logs_asynchronously() const override
  {
    return false;
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  static flow::log::Config make_config(flow::log::Sev min_severity)
  {
    using flow::log::Config;

    Config config(min_severity);
    config.init_component_to_union_idx_mapping<Log_component>
      (100, Config::standard_component_payload_enum_sparse_length<Log_component>());
    config.init_component_names<Log_component>(S_SHUFFLE_LOG_COMPONENT_NAME_MAP, false, "shuffle-");
    config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (200, Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
    return config;
  }

  /// Components and verbosity.  Must be constructed before #m_logger.
  flow::log::Config m_config;

  /// Writes to the console.
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace shuffle::test
