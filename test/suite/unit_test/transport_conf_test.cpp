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


#include "shuffle/transport/transport_conf.hpp"
#include "shuffle/transport/error.hpp"
#include "shuffle/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>

namespace shuffle::transport::test
{

namespace
{
using shuffle::test::Test_logger;
using boost::chrono::milliseconds;
using boost::chrono::seconds;
using boost::chrono::minutes;
using boost::chrono::hours;
} // namespace (anon)

TEST(Transport_conf_test, Defaults)
{
  const Transport_conf conf;
  EXPECT_EQ(conf.module(), "shuffle");
  EXPECT_EQ(conf.connection_timeout(), seconds(120));
  EXPECT_EQ(conf.max_io_retries(), 3u);
  EXPECT_EQ(conf.io_retry_wait(), seconds(5));

  // An empty provider yields the defaults too, under the given module.
  Test_logger logger;
  const Transport_conf conf2(&logger, "rpc", Map_config_provider());
  EXPECT_EQ(conf2.module(), "rpc");
  EXPECT_EQ(conf2.connection_timeout(), seconds(120));
  EXPECT_EQ(conf2.max_io_retries(), 3u);
}

TEST(Transport_conf_test, Reads_module_keys)
{
  Test_logger logger;
  const Map_config_provider provider({ { "shuffle.io.connectionTimeout", "30s" },
                                       { "shuffle.io.maxRetries", " 7 " },
                                       { "shuffle.io.retryWait", "250ms" },
                                       { "rpc.io.maxRetries", "1" } });
  const Transport_conf conf(&logger, "shuffle", provider);
  EXPECT_EQ(conf.connection_timeout(), seconds(30));
  EXPECT_EQ(conf.max_io_retries(), 7u);
  EXPECT_EQ(conf.io_retry_wait(), milliseconds(250));

  const Transport_conf rpc_conf(&logger, "rpc", provider);
  EXPECT_EQ(rpc_conf.max_io_retries(), 1u);
  EXPECT_EQ(rpc_conf.io_retry_wait(), seconds(5));
}

TEST(Transport_conf_test, Rejects_bad_values)
{
  Test_logger logger;
  Error_code err_code;

  const Transport_conf conf(&logger, "shuffle", Map_config_provider({ { "shuffle.io.maxRetries", "-1" } }),
                            &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_INVALID_VALUE);
  EXPECT_EQ(conf.max_io_retries(), Transport_conf::S_DEFAULT_MAX_IO_RETRIES);

  const Transport_conf conf2(&logger, "shuffle",
                             Map_config_provider({ { "shuffle.io.retryWait", "5 fortnights" } }), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_INVALID_VALUE);

  EXPECT_THROW(Transport_conf(&logger, "shuffle",
                              Map_config_provider({ { "shuffle.io.connectionTimeout", "" } })),
               flow::error::Runtime_error);
}

TEST(Transport_conf_test, Parse_duration)
{
  EXPECT_EQ(Transport_conf::parse_duration("15"), seconds(15));
  EXPECT_EQ(Transport_conf::parse_duration("15s"), seconds(15));
  EXPECT_EQ(Transport_conf::parse_duration("100ms"), milliseconds(100));
  EXPECT_EQ(Transport_conf::parse_duration("250us"), boost::chrono::microseconds(250));
  EXPECT_EQ(Transport_conf::parse_duration("2m"), minutes(2));
  EXPECT_EQ(Transport_conf::parse_duration("2min"), minutes(2));
  EXPECT_EQ(Transport_conf::parse_duration(" 3H "), hours(3));
  EXPECT_EQ(Transport_conf::parse_duration("1d"), hours(24));
  EXPECT_EQ(Transport_conf::parse_duration("0"), util::Fine_duration::zero());

  Error_code err_code;
  for (const char* bad : { "", "ms", "1.5s", "-3s", "12 parsecs", "10000000000s", "200000d",
                           "99999999999999999999999s" })
  {
    Transport_conf::parse_duration(bad, &err_code);
    EXPECT_EQ(err_code, error::Code::S_CONFIG_INVALID_VALUE) << "Input [" << bad << "].";
  }
  EXPECT_THROW(Transport_conf::parse_duration("x"), flow::error::Runtime_error);

  // Largest representable values still parse, and never come out negative.
  const auto big = Transport_conf::parse_duration("9000000000s", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(big, seconds(9000000000));
  EXPECT_GT(Transport_conf::parse_duration("106751d", &err_code), util::Fine_duration::zero());
  EXPECT_FALSE(err_code);
}

TEST(Transport_conf_test, Overflowing_timeout_falls_back_to_default)
{
  Test_logger logger;
  Error_code err_code;
  const Transport_conf conf(&logger, "shuffle",
                            Map_config_provider({ { "shuffle.io.connectionTimeout", "200000d" } }), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_INVALID_VALUE);
  EXPECT_EQ(conf.connection_timeout(), Transport_conf().connection_timeout());
}

} // namespace shuffle::transport::test
