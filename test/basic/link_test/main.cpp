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


#include <shuffle/transport/transport_context.hpp>
#include <shuffle/transport/transport_client_factory.hpp>
#include <shuffle/transport/transport_server.hpp>
#include <shuffle/transport/transport_client.hpp>
#include <shuffle/transport/rpc_handler.hpp>
#include <shuffle/transport/error.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <future>

namespace
{

/// Answers every RPC with its payload reversed; serves one block.
class Reversing_rpc_handler :
  public shuffle::transport::Rpc_handler
{
public:
  void receive(const shuffle::transport::Transport_client_ptr&, shuffle::util::Blob_ptr message,
               shuffle::transport::Response_func&& on_response) override
  {
    const auto view = shuffle::util::blob_view(message);
    on_response(flow::Error_code(), shuffle::util::make_blob(nullptr, std::string(view.rbegin(), view.rend())));
  }

  shuffle::util::Blob_ptr get_block(const std::string& block_id, flow::Error_code* err_code) override
  {
    if (block_id != "shuffle_0_0_0")
    {
      *err_code = shuffle::transport::error::Code::S_BLOCK_NOT_FOUND;
      return shuffle::util::Blob_ptr();
    }
    // else
    err_code->clear();
    return shuffle::util::make_blob(nullptr, "Hello, block!");
  }
}; // class Reversing_rpc_handler

} // namespace (anon)

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using shuffle::transport::Transport_conf;
  using shuffle::transport::Transport_context;
  using shuffle::transport::Map_config_provider;
  using shuffle::util::Blob_ptr;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "shuffle_core_link_test.log";
  const int BAD_EXIT = 1;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not? */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the Shuffle/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  FLOW_LOG_INFO("Opening log file [" << log_file << "] for Shuffle/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<shuffle::Log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<shuffle::Log_component>());
  log_config.init_component_names<shuffle::Log_component>(shuffle::S_SHUFFLE_LOG_COMPONENT_NAME_MAP, false,
                                                          "shuffle-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation; we're no serious business. */);

  try
  {
    /* Stand up a server and talk to it over loopback: one RPC and one block fetch.  As a reminder we're not
     * trying to demo the library here; just to ensure stuff built OK more or less. */
    const Transport_conf conf(&log_logger, "shuffle",
                              Map_config_provider({ { "shuffle.io.connectionTimeout", "5s" } }));
    const Transport_context context(&log_logger, conf, std::make_shared<Reversing_rpc_handler>());
    const auto server = context.create_server("127.0.0.1", 0, {});
    const auto factory = context.create_client_factory();
    const auto client = factory->create_client("127.0.0.1", server->port());

    std::promise<string> rpc_result;
    client->send_rpc(shuffle::util::make_blob(&log_logger, "Hello, world!"),
                     [&](const Error_code& err_code, Blob_ptr response)
    {
      if (err_code)
      {
        FLOW_LOG_WARNING("RPC failed; unexpected!  Error: [" << err_code << "] [" << err_code.message() << "].");
        rpc_result.set_value(string());
        return;
      }
      // else
      rpc_result.set_value(string(shuffle::util::blob_view(response)));
    });
    FLOW_LOG_INFO("RPC response: [" << rpc_result.get_future().get() << "].");

    std::promise<string> fetch_result;
    client->fetch_block("shuffle_0_0_0", [&](const Error_code& err_code, Blob_ptr block)
    {
      if (err_code)
      {
        FLOW_LOG_WARNING("Fetch failed; unexpected!  Error: [" << err_code << "] [" << err_code.message() << "].");
        fetch_result.set_value(string());
        return;
      }
      // else
      fetch_result.set_value(string(shuffle::util::blob_view(block)));
    });
    FLOW_LOG_INFO("Fetched block: [" << fetch_result.get_future().get() << "].");

    client->close();
    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
