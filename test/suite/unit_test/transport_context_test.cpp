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


#include "shuffle/transport/transport_context.hpp"
#include "shuffle/transport/transport_client_factory.hpp"
#include "shuffle/transport/transport_server.hpp"
#include "shuffle/transport/transport_bootstrap.hpp"
#include "shuffle/transport/transport_channel_handler.hpp"
#include "shuffle/transport/transport_client.hpp"
#include "shuffle/transport/rpc_handler.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/message_codec.hpp"
#include "shuffle/transport/error.hpp"
#include "shuffle/test/test_logger.hpp"
#include "shuffle/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <future>
#include <map>

namespace shuffle::transport::test
{

namespace
{

using shuffle::test::Test_logger;
using shuffle::test::wait_until;
using flow::util::Lock_guard;
using flow::util::Mutex_non_recursive;
using boost::chrono::milliseconds;
using boost::chrono::seconds;
using std::string;
using std::vector;

/// Outcome of one request.
struct Result
{
  /// Error.
  Error_code m_err_code;
  /// Response payload (success only).
  string m_data;
};

/**
 * Issues a request through `issue` and waits for its result.
 *
 * @param issue Sends the request with the given completion handler.
 * @return The result; if none arrives in time, the test fails and the result carries `timed_out`.
 */
Result await_response(const Function<void (Response_func&&)>& issue)
{
  const auto promise = std::make_shared<std::promise<Result>>();
  auto future = promise->get_future();
  issue([promise](const Error_code& err_code, util::Blob_ptr data)
  {
    promise->set_value({ err_code, string(util::blob_view(data)) });
  });

  if (future.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
  {
    ADD_FAILURE() << "No response in time.";
    return { boost::asio::error::timed_out, string() };
  }
  // else
  return future.get();
}

/// Serves an in-memory block store and answers RPCs with a prefix; can be told to sit on RPCs forever.
class Test_rpc_handler :
  public Rpc_handler
{
public:
  explicit Test_rpc_handler(const string& prefix = "echo:", std::map<string, string> blocks = {}) :
    m_prefix(prefix),
    m_blocks(std::move(blocks)),
    m_hold_rpcs(false)
  {
  }

  void receive(const Transport_client_ptr&, util::Blob_ptr message, Response_func&& on_response) override
  {
    if (m_hold_rpcs)
    {
      Lock_guard<Mutex_non_recursive> lock(m_mutex);
      m_held.push_back(std::move(on_response));
      return;
    }
    // else
    on_response(Error_code(), util::make_blob(nullptr, m_prefix + string(util::blob_view(message))));
  }

  void receive_one_way(const Transport_client_ptr&, util::Blob_ptr message) override
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    m_one_way.emplace_back(util::blob_view(message));
  }

  util::Blob_ptr get_block(const string& block_id, Error_code* err_code) override
  {
    const auto it = m_blocks.find(block_id);
    if (it == m_blocks.end())
    {
      *err_code = error::Code::S_BLOCK_NOT_FOUND;
      return util::Blob_ptr();
    }
    // else
    err_code->clear();
    return util::make_blob(nullptr, it->second);
  }

  void channel_active(const Transport_client_ptr& client) override
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    m_clients.push_back(client);
  }

  void channel_inactive(const Transport_client_ptr&) override
  {
    ++m_n_inactive;
  }

  vector<Transport_client_ptr> clients() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_clients;
  }

  vector<string> one_way_messages() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_one_way;
  }

  const string m_prefix;
  const std::map<string, string> m_blocks;
  std::atomic<bool> m_hold_rpcs;
  std::atomic<int> m_n_inactive{0};

private:
  mutable Mutex_non_recursive m_mutex;
  vector<Response_func> m_held;
  vector<Transport_client_ptr> m_clients;
  vector<string> m_one_way;
}; // class Test_rpc_handler

/// Like Test_rpc_handler, but answers the RPC payload "huge" and the block "huge" with more than a frame can hold.
class Oversized_response_rpc_handler :
  public Test_rpc_handler
{
public:
  void receive(const Transport_client_ptr& client, util::Blob_ptr message, Response_func&& on_response) override
  {
    if (util::blob_view(message) != "huge")
    {
      Test_rpc_handler::receive(client, std::move(message), std::move(on_response));
      return;
    }
    // else
    on_response(Error_code(), huge_blob());
  }

  util::Blob_ptr get_block(const string& block_id, Error_code* err_code) override
  {
    if (block_id != "huge")
    {
      return Test_rpc_handler::get_block(block_id, err_code);
    }
    // else
    err_code->clear();
    return huge_blob();
  }

private:
  static util::Blob_ptr huge_blob()
  {
    // Uninitialized; only its size matters.
    return std::make_shared<flow::util::Blob>(nullptr, Frame_decoder::S_MAX_FRAME_SIZE);
  }
}; // class Oversized_response_rpc_handler

/// Makes a config with the given connection (and idle) timeout.
Transport_conf make_conf(flow::log::Logger* logger_ptr, const string& connection_timeout)
{
  return Transport_conf(logger_ptr, "shuffle",
                        Map_config_provider({ { "shuffle.io.connectionTimeout", connection_timeout } }));
}

} // namespace (anon)

TEST(Transport_context_test, Pipeline_layout)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();

  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);
  EXPECT_TRUE(client->is_active());

  const auto& pipeline = client->channel()->pipeline();
  EXPECT_EQ(pipeline.names(), (vector<string>{ "encoder", "frame_decoder", "decoder", "idle_state_handler",
                                               "handler" }));
  const auto channel_handler = pipeline.get_as<Transport_channel_handler>("handler");
  ASSERT_TRUE(channel_handler);
  EXPECT_EQ(channel_handler->client(), client);
  EXPECT_FALSE(channel_handler->close_idle_connections());

  // The server side got the same layout.  (One context serves both sides here, so the handler sees both.)
  ASSERT_TRUE(wait_until([&]() { return handler->clients().size() == 2; }, seconds(10)));
  for (const auto& seen_client : handler->clients())
  {
    EXPECT_EQ(seen_client->channel()->pipeline().size(), 5u);
  }

  // Codec stages are shared; per-connection stages are not.
  const auto client2 = factory->create_client("127.0.0.1", server->port());
  const auto& pipeline2 = client2->channel()->pipeline();
  EXPECT_EQ(pipeline.get("encoder"), pipeline2.get("encoder"));
  EXPECT_EQ(pipeline.get("decoder"), pipeline2.get("decoder"));
  EXPECT_NE(pipeline.get("frame_decoder"), pipeline2.get("frame_decoder"));
  EXPECT_NE(pipeline.get("idle_state_handler"), pipeline2.get("idle_state_handler"));
  EXPECT_NE(pipeline.get("handler"), pipeline2.get("handler"));
}

TEST(Transport_context_test, Fetch_rpc_and_one_way)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>("echo:",
                                                          std::map<string, string>{ { "b1", "block one" },
                                                                                    { "empty", "" } });
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server(0, {});
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("localhost", server->port());
  ASSERT_TRUE(client);

  auto result = await_response([&](Response_func&& on_done) { client->fetch_block("b1", std::move(on_done)); });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "block one");

  result = await_response([&](Response_func&& on_done) { client->fetch_block("empty", std::move(on_done)); });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "");

  result = await_response([&](Response_func&& on_done) { client->fetch_block("nope", std::move(on_done)); });
  EXPECT_EQ(result.m_err_code, error::Code::S_REMOTE_REQUEST_FAILED);

  result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "hi"), std::move(on_done));
  });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "echo:hi");

  client->send(util::make_blob(&logger, "fire-and-forget"));
  EXPECT_TRUE(wait_until([&]() { return handler->one_way_messages().size() == 1; }, seconds(10)));
  EXPECT_EQ(handler->one_way_messages().front(), "fire-and-forget");

  // Many concurrent requests share the one connection; each gets its own answer.
  vector<std::future<Result>> futures;
  for (size_t idx = 0; idx != 50; ++idx)
  {
    auto promise = std::make_shared<std::promise<Result>>();
    futures.push_back(promise->get_future());
    client->send_rpc(util::make_blob(&logger, std::to_string(idx)),
                     [promise](const Error_code& err_code, util::Blob_ptr data)
    {
      promise->set_value({ err_code, string(util::blob_view(data)) });
    });
  }
  for (size_t idx = 0; idx != futures.size(); ++idx)
  {
    ASSERT_EQ(futures[idx].wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(futures[idx].get().m_data, "echo:" + std::to_string(idx));
  }
}

TEST(Transport_context_test, Requests_on_closed_client_fail)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  client->close();
  ASSERT_TRUE(wait_until([&]() { return !client->is_active(); }, seconds(10)));

  const auto result = await_response([&](Response_func&& on_done) { client->fetch_block("b1", std::move(on_done)); });
  EXPECT_EQ(result.m_err_code, error::Code::S_CONNECTION_CLOSED);
  // Both sides of the connection report to the one handler.
  EXPECT_TRUE(wait_until([&]() { return handler->m_n_inactive == 2; }, seconds(10)));
}

TEST(Transport_context_test, Oversized_request_fails_locally)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  const util::Blob_ptr huge = std::make_shared<flow::util::Blob>(&logger, Frame_decoder::S_MAX_FRAME_SIZE);
  auto result = await_response([&](Response_func&& on_done) { client->send_rpc(huge, std::move(on_done)); });
  EXPECT_EQ(result.m_err_code, error::Code::S_MESSAGE_TOO_LARGE);
  EXPECT_FALSE(error::is_transient(result.m_err_code));

  // Nothing reached the wire, so the connection is as good as before.
  client->send(huge);
  EXPECT_TRUE(client->is_active());
  result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "after"), std::move(on_done));
  });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "echo:after");
  EXPECT_TRUE(handler->one_way_messages().empty());
}

TEST(Transport_context_test, Oversized_response_becomes_remote_failure)
{
  Test_logger logger;
  const auto handler = std::make_shared<Oversized_response_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  auto result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "huge"), std::move(on_done));
  });
  EXPECT_EQ(result.m_err_code, error::Code::S_REMOTE_REQUEST_FAILED);

  result = await_response([&](Response_func&& on_done) { client->fetch_block("huge", std::move(on_done)); });
  EXPECT_EQ(result.m_err_code, error::Code::S_REMOTE_REQUEST_FAILED);
  EXPECT_FALSE(error::is_transient(result.m_err_code));

  // The connection survives both.
  EXPECT_TRUE(client->is_active());
  result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "small"), std::move(on_done));
  });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "echo:small");
}

TEST(Transport_context_test, Second_pipeline_initialization_throws_and_closes)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  EXPECT_THROW(context.initialize_pipeline(client->channel()), flow::error::Runtime_error);
  EXPECT_TRUE(wait_until([&]() { return !client->is_active(); }, seconds(10)));
}

TEST(Transport_context_test, Idle_connection_closed_when_enabled)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "200ms"), handler, true);
  EXPECT_TRUE(context.close_idle_connections());
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  EXPECT_TRUE(wait_until([&]() { return !client->is_active(); }, seconds(10)));
}

TEST(Transport_context_test, Idle_connection_kept_when_disabled)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "200ms"), handler, false);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  // Several idle periods go by.
  flow::util::this_thread::sleep_for(milliseconds(800));
  EXPECT_TRUE(client->is_active());

  const auto result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "still there?"), std::move(on_done));
  });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "echo:still there?");
}

TEST(Transport_context_test, Idle_connection_with_outstanding_requests_times_out)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  handler->m_hold_rpcs = true; // Server never answers.
  const Transport_context context(&logger, make_conf(&logger, "200ms"), handler, false);
  const auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  const auto result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "anyone?"), std::move(on_done));
  });
  EXPECT_EQ(result.m_err_code, error::Code::S_CONNECTION_IDLE_TIMEOUT);
  EXPECT_TRUE(wait_until([&]() { return !client->is_active(); }, seconds(10)));
}

TEST(Transport_context_test, Server_can_send_requests_back_to_client)
{
  Test_logger logger;
  const auto server_handler = std::make_shared<Test_rpc_handler>("server:");
  const auto client_handler = std::make_shared<Test_rpc_handler>("client:");
  const Transport_context server_context(&logger, make_conf(&logger, "10s"), server_handler);
  const Transport_context client_context(&logger, make_conf(&logger, "10s"), client_handler);
  const auto server = server_context.create_server();
  const auto factory = client_context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  ASSERT_TRUE(wait_until([&]() { return server_handler->clients().size() == 1; }, seconds(10)));
  const auto reverse_client = server_handler->clients().front();

  const auto result = await_response([&](Response_func&& on_done)
  {
    reverse_client->send_rpc(util::make_blob(&logger, "push"), std::move(on_done));
  });
  EXPECT_FALSE(result.m_err_code);
  EXPECT_EQ(result.m_data, "client:push");
}

TEST(Transport_context_test, Client_bootstraps_run_in_order)
{
  class Recording_bootstrap :
    public Transport_client_bootstrap
  {
  public:
    Recording_bootstrap(vector<string>* log, const string& name, const Error_code& result) :
      m_log(log), m_name(name), m_result(result) {}

    void do_bootstrap(const Transport_client_ptr& client, Error_code* err_code) override
    {
      // Prove the client is usable: do a round trip.
      const auto result = await_response([&](Response_func&& on_done)
      {
        client->send_rpc(util::make_blob(nullptr, m_name), std::move(on_done));
      });
      m_log->push_back(result.m_data);
      *err_code = m_result;
    }

  private:
    vector<string>* const m_log;
    const string m_name;
    const Error_code m_result;
  }; // class Recording_bootstrap

  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto server = context.create_server();

  vector<string> log;
  const auto factory = context.create_client_factory
                         ({ std::make_shared<Recording_bootstrap>(&log, "first", Error_code()),
                            std::make_shared<Recording_bootstrap>(&log, "second", Error_code()) });
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);
  EXPECT_EQ(log, (vector<string>{ "echo:first", "echo:second" }));

  // A failing bootstrap aborts connection establishment.
  log.clear();
  const Error_code denied = boost::asio::error::access_denied;
  const auto failing_factory = context.create_client_factory
                                 ({ std::make_shared<Recording_bootstrap>(&log, "auth", denied),
                                    std::make_shared<Recording_bootstrap>(&log, "never", Error_code()) });
  Error_code err_code;
  EXPECT_FALSE(failing_factory->create_client("127.0.0.1", server->port(), &err_code));
  EXPECT_EQ(err_code, denied);
  EXPECT_EQ(log, (vector<string>{ "echo:auth" }));
  EXPECT_THROW(failing_factory->create_client("127.0.0.1", server->port()), flow::error::Runtime_error);
}

TEST(Transport_context_test, Server_bootstraps_may_substitute_handler)
{
  class Substituting_bootstrap :
    public Transport_server_bootstrap
  {
  public:
    explicit Substituting_bootstrap(Rpc_handler_ptr substitute) :
      m_substitute(std::move(substitute)) {}

    Rpc_handler_ptr do_bootstrap(const Channel_ptr& channel, const Rpc_handler_ptr& rpc_handler) override
    {
      EXPECT_TRUE(channel->pipeline().empty());
      EXPECT_TRUE(rpc_handler);
      ++m_n_calls;
      return m_substitute;
    }

    std::atomic<int> m_n_calls{0};

  private:
    const Rpc_handler_ptr m_substitute;
  }; // class Substituting_bootstrap

  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>("original:");
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  const auto bootstrap = std::make_shared<Substituting_bootstrap>(std::make_shared<Test_rpc_handler>("substitute:"));
  const auto server = context.create_server("127.0.0.1", 0, { bootstrap });
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);

  const auto result = await_response([&](Response_func&& on_done)
  {
    client->send_rpc(util::make_blob(&logger, "x"), std::move(on_done));
  });
  EXPECT_EQ(result.m_data, "substitute:x");
  EXPECT_EQ(bootstrap->m_n_calls, 1);
}

TEST(Transport_context_test, Connect_failures)
{
  Test_logger logger;
  const Transport_context context(&logger, make_conf(&logger, "10s"), std::make_shared<Test_rpc_handler>());
  const auto factory = context.create_client_factory();

  // Grab a free port, then stop listening on it.
  uint16_t port;
  {
    const auto server = context.create_server();
    port = server->port();
  }

  Error_code err_code;
  EXPECT_FALSE(factory->create_client("127.0.0.1", port, &err_code));
  EXPECT_TRUE(err_code);
  EXPECT_TRUE(error::is_transient(err_code));

  EXPECT_FALSE(factory->create_client("no-such-host.invalid", port, &err_code));
  EXPECT_TRUE(err_code);

  // Binding a port in use fails.
  const auto server = context.create_server();
  EXPECT_FALSE(context.create_server("127.0.0.1", server->port(), {}, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::address_in_use);
}

TEST(Transport_context_test, Server_destruction_closes_connections)
{
  Test_logger logger;
  const auto handler = std::make_shared<Test_rpc_handler>();
  handler->m_hold_rpcs = true;
  const Transport_context context(&logger, make_conf(&logger, "10s"), handler);
  auto server = context.create_server();
  const auto factory = context.create_client_factory();
  const auto client = factory->create_client("127.0.0.1", server->port());
  ASSERT_TRUE(client);
  EXPECT_EQ(factory->num_connections(), 1u);

  const auto promise = std::make_shared<std::promise<Error_code>>();
  auto future = promise->get_future();
  client->send_rpc(util::make_blob(&logger, "pending"), [promise](const Error_code& err_code, util::Blob_ptr)
  {
    promise->set_value(err_code);
  });
  ASSERT_TRUE(wait_until([&]() { return server->num_connections() == 1; }, seconds(10)));
  // Make sure the request got there before the server goes away.
  flow::util::this_thread::sleep_for(milliseconds(100));

  server.reset();

  ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  const auto err_code = future.get();
  EXPECT_TRUE(err_code);
  EXPECT_TRUE(error::is_transient(err_code));
  EXPECT_TRUE(wait_until([&]() { return !client->is_active(); }, seconds(10)));
}

} // namespace shuffle::transport::test
