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


#include "shuffle/fetch/shuffle_client.hpp"
#include "shuffle/fetch/block_fetching_listener.hpp"
#include "shuffle/transport/transport_server.hpp"
#include "shuffle/transport/rpc_handler.hpp"
#include "shuffle/transport/error.hpp"
#include "shuffle/test/test_logger.hpp"
#include "shuffle/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <future>
#include <map>

namespace shuffle::fetch::test
{

namespace
{

using shuffle::test::Test_logger;
using shuffle::test::wait_until;
using transport::Transport_conf;
using transport::Transport_context;
using transport::Map_config_provider;
using transport::Rpc_handler;
using transport::Transport_client_ptr;
using transport::Response_func;
using flow::util::Lock_guard;
using flow::util::Mutex_non_recursive;
using boost::chrono::seconds;
using std::string;
using std::map;

/// Serves blocks out of a map; rejects RPCs.
class Block_server_handler :
  public Rpc_handler
{
public:
  explicit Block_server_handler(map<string, string> blocks) :
    m_blocks(std::move(blocks))
  {
  }

  void receive(const Transport_client_ptr&, util::Blob_ptr, Response_func&& on_response) override
  {
    on_response(transport::error::Code::S_RPC_HANDLER_UNSUPPORTED, util::Blob_ptr());
  }

  util::Blob_ptr get_block(const string& block_id, Error_code* err_code) override
  {
    ++m_n_served;
    const auto it = m_blocks.find(block_id);
    if (it == m_blocks.end())
    {
      *err_code = transport::error::Code::S_BLOCK_NOT_FOUND;
      return util::Blob_ptr();
    }
    // else
    err_code->clear();
    return util::make_blob(nullptr, it->second);
  }

  std::atomic<int> m_n_served{0};

private:
  const map<string, string> m_blocks;
}; // class Block_server_handler

/// Serves nothing until released: each `get_block()` blocks the server's thread on the gate.
class Gated_block_server_handler :
  public Rpc_handler
{
public:
  Gated_block_server_handler() :
    m_gate(m_release.get_future().share())
  {
  }

  void receive(const Transport_client_ptr&, util::Blob_ptr, Response_func&& on_response) override
  {
    on_response(transport::error::Code::S_RPC_HANDLER_UNSUPPORTED, util::Blob_ptr());
  }

  util::Blob_ptr get_block(const string& block_id, Error_code* err_code) override
  {
    ++m_n_requested;
    m_gate.wait_for(std::chrono::seconds(10));
    err_code->clear();
    return util::make_blob(nullptr, block_id);
  }

  /// Lets every blocked and future `get_block()` through.
  void release()
  {
    m_release.set_value();
  }

  std::atomic<int> m_n_requested{0};

private:
  std::promise<void> m_release;
  const std::shared_future<void> m_gate;
}; // class Gated_block_server_handler

/// Records outcomes by block ID.
class Outcome_listener :
  public Block_fetching_listener
{
public:
  void on_block_fetch_success(const string& block_id, const Block_data_ptr& data) override
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    ++m_n_outcomes;
    m_data[block_id] = string(util::blob_view(data));
  }

  void on_block_fetch_failure(const string& block_id, const Error_code& err_code) override
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    ++m_n_outcomes;
    m_errors[block_id] = err_code;
  }

  size_t n_outcomes() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_n_outcomes;
  }

  map<string, string> data() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_data;
  }

  map<string, Error_code> errors() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_errors;
  }

private:
  mutable Mutex_non_recursive m_mutex;
  size_t m_n_outcomes = 0;
  map<string, string> m_data;
  map<string, Error_code> m_errors;
}; // class Outcome_listener

Transport_conf make_conf(flow::log::Logger* logger_ptr, const string& max_retries)
{
  return Transport_conf(logger_ptr, "shuffle",
                        Map_config_provider({ { "shuffle.io.maxRetries", max_retries },
                                              { "shuffle.io.retryWait", "20ms" },
                                              { "shuffle.io.connectionTimeout", "5s" } }));
}

} // namespace (anon)

TEST(Shuffle_client_test, Fetches_blocks_from_server)
{
  Test_logger logger;
  const auto handler = std::make_shared<Block_server_handler>(map<string, string>{ { "shuffle_0_0_0", "aaa" },
                                                                                   { "shuffle_0_1_0", "bbbb" },
                                                                                   { "shuffle_0_2_0", "" } });
  const Transport_context server_context(&logger, make_conf(&logger, "3"), handler);
  const auto server = server_context.create_server("127.0.0.1", 0, {});
  ASSERT_TRUE(server);

  Shuffle_client client(&logger, make_conf(&logger, "3"));
  const auto listener = std::make_shared<Outcome_listener>();
  client.fetch_blocks("127.0.0.1", server->port(), { "shuffle_0_0_0", "shuffle_0_1_0", "shuffle_0_2_0" }, listener);

  ASSERT_TRUE(wait_until([&]() { return listener->n_outcomes() == 3; }, seconds(10)));
  EXPECT_EQ(listener->data(), (map<string, string>{ { "shuffle_0_0_0", "aaa" },
                                                     { "shuffle_0_1_0", "bbbb" },
                                                     { "shuffle_0_2_0", "" } }));
  EXPECT_TRUE(listener->errors().empty());
  EXPECT_EQ(handler->m_n_served, 3);
}

TEST(Shuffle_client_test, Missing_block_fails_without_retry)
{
  Test_logger logger;
  const auto handler = std::make_shared<Block_server_handler>(map<string, string>{ { "present", "x" } });
  const Transport_context server_context(&logger, make_conf(&logger, "3"), handler);
  const auto server = server_context.create_server("127.0.0.1", 0, {});
  ASSERT_TRUE(server);

  Shuffle_client client(&logger, make_conf(&logger, "3"));
  const auto listener = std::make_shared<Outcome_listener>();
  client.fetch_blocks("127.0.0.1", server->port(), { "present", "absent" }, listener);

  ASSERT_TRUE(wait_until([&]() { return listener->n_outcomes() == 2; }, seconds(10)));
  EXPECT_EQ(listener->data(), (map<string, string>{ { "present", "x" } }));
  const auto errors = listener->errors();
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors.at("absent"), transport::error::Code::S_REMOTE_REQUEST_FAILED);
  // Not retried: each block was asked for once.
  flow::util::this_thread::sleep_for(boost::chrono::milliseconds(200));
  EXPECT_EQ(handler->m_n_served, 2);
  EXPECT_EQ(listener->n_outcomes(), 2u);
}

TEST(Shuffle_client_test, Unreachable_server_fails_after_retries)
{
  Test_logger logger;

  // Grab a free port, then stop listening on it.
  uint16_t port;
  {
    const Transport_context server_context(&logger, make_conf(&logger, "0"),
                                           std::make_shared<Block_server_handler>(map<string, string>()));
    port = server_context.create_server("127.0.0.1", 0, {})->port();
  }

  for (const string max_retries : { "0", "2" })
  {
    Shuffle_client client(&logger, make_conf(&logger, max_retries));
    const auto listener = std::make_shared<Outcome_listener>();
    client.fetch_blocks("127.0.0.1", port, { "a", "b" }, listener);

    ASSERT_TRUE(wait_until([&]() { return listener->n_outcomes() == 2; }, seconds(10)));
    const auto errors = listener->errors();
    ASSERT_EQ(errors.size(), 2u);
    for (const auto& id_and_err : errors)
    {
      EXPECT_TRUE(transport::error::is_transient(id_and_err.second)) << id_and_err.second;
    }
  }
}

TEST(Shuffle_client_test, Duplicate_ids_reported_once_without_retries)
{
  Test_logger logger;
  const auto handler = std::make_shared<Block_server_handler>(map<string, string>{ { "a", "A" }, { "b", "B" } });
  const Transport_context server_context(&logger, make_conf(&logger, "0"), handler);
  const auto server = server_context.create_server("127.0.0.1", 0, {});
  ASSERT_TRUE(server);

  Shuffle_client client(&logger, make_conf(&logger, "0"));
  const auto listener = std::make_shared<Outcome_listener>();
  client.fetch_blocks("127.0.0.1", server->port(), { "a", "b", "a", "a" }, listener);

  ASSERT_TRUE(wait_until([&]() { return listener->n_outcomes() >= 2; }, seconds(10)));
  flow::util::this_thread::sleep_for(boost::chrono::milliseconds(200));
  EXPECT_EQ(listener->n_outcomes(), 2u);
  EXPECT_EQ(listener->data(), (map<string, string>{ { "a", "A" }, { "b", "B" } }));
  EXPECT_EQ(handler->m_n_served, 2);
}

TEST(Shuffle_client_test, Destruction_fails_unreported_blocks_once)
{
  Test_logger logger;
  const auto handler = std::make_shared<Gated_block_server_handler>();
  const Transport_context server_context(&logger, make_conf(&logger, "3"), handler);
  const auto server = server_context.create_server("127.0.0.1", 0, {});
  ASSERT_TRUE(server);

  const auto listener = std::make_shared<Outcome_listener>();
  {
    Shuffle_client client(&logger, make_conf(&logger, "3"));
    client.fetch_blocks("127.0.0.1", server->port(), { "x", "y", "z" }, listener);
    // The server is now stuck serving the first block.
    ASSERT_TRUE(wait_until([&]() { return handler->m_n_requested >= 1; }, seconds(10)));
    EXPECT_EQ(listener->n_outcomes(), 0u);
  } // Shuffle_client destroyed with every block outstanding.

  EXPECT_EQ(listener->n_outcomes(), 3u);
  const auto errors = listener->errors();
  ASSERT_EQ(errors.size(), 3u);
  for (const auto& id_and_err : errors)
  {
    EXPECT_EQ(id_and_err.second, transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER)
      << id_and_err.first;
  }

  // Whatever the server sends now goes nowhere.
  handler->release();
  flow::util::this_thread::sleep_for(boost::chrono::milliseconds(200));
  EXPECT_EQ(listener->n_outcomes(), 3u);
}

TEST(Shuffle_client_test, Invalid_arguments)
{
  Test_logger logger;
  Shuffle_client client(&logger, make_conf(&logger, "1"));
  const auto listener = std::make_shared<Outcome_listener>();

  Error_code err_code;
  client.fetch_blocks("127.0.0.1", 1, {}, listener, &err_code);
  EXPECT_EQ(err_code, transport::error::Code::S_INVALID_ARGUMENT);
  EXPECT_THROW(client.fetch_blocks("127.0.0.1", 1, {}, listener), flow::error::Runtime_error);
  EXPECT_EQ(listener->n_outcomes(), 0u);
  EXPECT_EQ(client.context().conf().max_io_retries(), 1u);
}

} // namespace shuffle::fetch::test
