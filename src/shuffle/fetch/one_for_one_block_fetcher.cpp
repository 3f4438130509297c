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
#include "shuffle/fetch/one_for_one_block_fetcher.hpp"
#include "shuffle/fetch/block_fetching_listener.hpp"
#include "shuffle/transport/transport_client.hpp"

namespace shuffle::fetch
{

// Implementations.

std::shared_ptr<One_for_one_block_fetcher>
  One_for_one_block_fetcher::create(flow::log::Logger* logger_ptr, transport::Transport_client_ptr client,
                                    const Block_ids& block_ids, Block_fetching_listener_ptr listener) // Static.
{
  return std::shared_ptr<One_for_one_block_fetcher>
           (new One_for_one_block_fetcher(logger_ptr, std::move(client), block_ids, std::move(listener)));
}

One_for_one_block_fetcher::One_for_one_block_fetcher(flow::log::Logger* logger_ptr,
                                                     transport::Transport_client_ptr client,
                                                     const Block_ids& block_ids,
                                                     Block_fetching_listener_ptr listener) :
  flow::log::Log_context(logger_ptr, Log_component::S_FETCH),
  m_client(std::move(client)),
  m_block_ids(block_ids),
  m_listener(std::move(listener)),
  m_n_remaining(block_ids.size())
{
  // That's it.
}

void One_for_one_block_fetcher::start()
{
  FLOW_LOG_TRACE("One-for-one fetcher [" << this << "]: Requesting [" << m_block_ids.size() << "] blocks over "
                 "client [" << *m_client << "].");

  if (m_block_ids.empty())
  {
    m_client->close();
    return;
  }
  // else

  for (const auto& block_id : m_block_ids)
  {
    m_client->fetch_block(block_id, [self = shared_from_this(), block_id]
                                      (const Error_code& err_code, util::Blob_ptr data)
    {
      // We are in thread W (or U, if the client was already inactive).
      self->on_fetch_done(block_id, err_code, data);
    });
  }
}

void One_for_one_block_fetcher::on_fetch_done(const std::string& block_id, const Error_code& err_code,
                                              const Block_data_ptr& data)
{
  if (err_code)
  {
    FLOW_LOG_TRACE("One-for-one fetcher [" << this << "]: Block [" << block_id << "] failed: "
                   "[" << err_code << "] [" << err_code.message() << "].");
    m_listener->on_block_fetch_failure(block_id, err_code);
  }
  else
  {
    FLOW_LOG_TRACE("One-for-one fetcher [" << this << "]: Block [" << block_id << "] fetched: "
                   "[" << util::blob_size(data) << "] bytes.");
    m_listener->on_block_fetch_success(block_id, data);
  }

  if (--m_n_remaining == 0)
  {
    FLOW_LOG_TRACE("One-for-one fetcher [" << this << "]: All blocks reported; closing client.");
    m_client->close();
  }
}

} // namespace shuffle::fetch
