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
#include "shuffle/transport/channel_pipeline.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>

namespace shuffle::transport
{

// Channel_stage implementations.

Channel_stage::~Channel_stage() = default;

void Channel_stage::channel_active(Stage_context* ctx) // Virtual.
{
  ctx->fire_channel_active();
}

void Channel_stage::channel_inactive(Stage_context* ctx) // Virtual.
{
  ctx->fire_channel_inactive();
}

void Channel_stage::channel_read(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  ctx->fire_channel_read(std::move(item));
}

void Channel_stage::write(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  ctx->write(std::move(item));
}

void Channel_stage::event_triggered(Stage_context* ctx, Channel_event event) // Virtual.
{
  ctx->fire_event_triggered(event);
}

void Channel_stage::exception_caught(Stage_context* ctx, const Error_code& err_code) // Virtual.
{
  ctx->fire_exception_caught(err_code);
}

// Stage_context implementations.

Stage_context::Stage_context(Channel_pipeline* pipeline, size_t idx) :
  m_pipeline(pipeline),
  m_idx(idx)
{
  // That's it.
}

Channel& Stage_context::channel() const
{
  return m_pipeline->channel();
}

const std::string& Stage_context::name() const
{
  return m_pipeline->m_entries[m_idx]->m_name;
}

void Stage_context::fire_channel_active()
{
  m_pipeline->invoke_channel_active(m_idx + 1);
}

void Stage_context::fire_channel_inactive()
{
  m_pipeline->invoke_channel_inactive(m_idx + 1);
}

void Stage_context::fire_channel_read(Pipeline_item&& item)
{
  m_pipeline->invoke_channel_read(m_idx + 1, std::move(item));
}

void Stage_context::fire_event_triggered(Channel_event event)
{
  m_pipeline->invoke_event_triggered(m_idx + 1, event);
}

void Stage_context::fire_exception_caught(const Error_code& err_code)
{
  m_pipeline->invoke_exception_caught(m_idx + 1, err_code);
}

void Stage_context::write(Pipeline_item&& item)
{
  m_pipeline->invoke_write(m_idx, std::move(item));
}

void Stage_context::close()
{
  channel().close();
}

// Channel_pipeline implementations.

Channel_pipeline::Channel_pipeline(flow::log::Logger* logger_ptr, Channel* channel) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_channel(channel)
{
  // That's it.
}

void Channel_pipeline::add_last(const std::string& name, Channel_stage_ptr stage, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { add_last(name, stage, actual_err_code); },
         err_code, "Channel_pipeline::add_last()"))
  {
    return;
  }
  // else

  if ((!stage) || get(name))
  {
    FLOW_LOG_WARNING("Channel [" << channel() << "]: Cannot add stage [" << name << "]: "
                     "null stage or name already present.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  m_entries.emplace_back(new Entry{ name, std::move(stage), Stage_context(this, m_entries.size()) });
  FLOW_LOG_TRACE("Channel [" << channel() << "]: Added stage [" << name << "] at index "
                 "[" << (m_entries.size() - 1) << "].");
  err_code->clear();
}

Channel_stage_ptr Channel_pipeline::get(util::String_view name) const
{
  for (const auto& entry : m_entries)
  {
    if (entry->m_name == name)
    {
      return entry->m_stage;
    }
  }
  return Channel_stage_ptr();
}

std::vector<std::string> Channel_pipeline::names() const
{
  std::vector<std::string> result;
  result.reserve(m_entries.size());
  for (const auto& entry : m_entries)
  {
    result.push_back(entry->m_name);
  }
  return result;
}

size_t Channel_pipeline::size() const
{
  return m_entries.size();
}

bool Channel_pipeline::empty() const
{
  return m_entries.empty();
}

void Channel_pipeline::clear()
{
  /* Channel calls us from close_impl() which never runs inside a stage method (stage-initiated closes are
   * posted); so no Stage_context is in use at this point. */
  m_entries.clear();
}

Channel& Channel_pipeline::channel() const
{
  return *m_channel;
}

void Channel_pipeline::fire_channel_active()
{
  invoke_channel_active(0);
}

void Channel_pipeline::fire_channel_inactive()
{
  invoke_channel_inactive(0);
}

void Channel_pipeline::fire_channel_read(Pipeline_item&& item)
{
  invoke_channel_read(0, std::move(item));
}

void Channel_pipeline::fire_exception_caught(const Error_code& err_code)
{
  invoke_exception_caught(0, err_code);
}

void Channel_pipeline::write(Pipeline_item&& item)
{
  invoke_write(m_entries.size(), std::move(item));
}

void Channel_pipeline::invoke_channel_active(size_t idx)
{
  if (idx < m_entries.size())
  {
    const auto stage = m_entries[idx]->m_stage;
    stage->channel_active(&m_entries[idx]->m_ctx);
  }
}

void Channel_pipeline::invoke_channel_inactive(size_t idx)
{
  if (idx < m_entries.size())
  {
    const auto stage = m_entries[idx]->m_stage;
    stage->channel_inactive(&m_entries[idx]->m_ctx);
  }
}

void Channel_pipeline::invoke_channel_read(size_t idx, Pipeline_item&& item)
{
  if (idx >= m_entries.size())
  {
    FLOW_LOG_TRACE("Channel [" << channel() << "]: Inbound item reached the end of the pipeline unhandled; "
                   "dropping.");
    return;
  }
  // else
  const auto stage = m_entries[idx]->m_stage;
  stage->channel_read(&m_entries[idx]->m_ctx, std::move(item));
}

void Channel_pipeline::invoke_event_triggered(size_t idx, Channel_event event)
{
  if (idx < m_entries.size())
  {
    const auto stage = m_entries[idx]->m_stage;
    stage->event_triggered(&m_entries[idx]->m_ctx, event);
  }
}

void Channel_pipeline::invoke_exception_caught(size_t idx, const Error_code& err_code)
{
  if (idx >= m_entries.size())
  {
    FLOW_LOG_TRACE("Channel [" << channel() << "]: Error [" << err_code << "] [" << err_code.message() << "] "
                   "reached the end of the pipeline unhandled.");
    return;
  }
  // else
  const auto stage = m_entries[idx]->m_stage;
  stage->exception_caught(&m_entries[idx]->m_ctx, err_code);
}

void Channel_pipeline::invoke_write(size_t end_idx, Pipeline_item&& item)
{
  using std::holds_alternative;
  using std::get;

  assert(end_idx <= m_entries.size());

  if (end_idx == 0)
  {
    if (!holds_alternative<util::Blob_ptr>(item))
    {
      FLOW_LOG_WARNING("Channel [" << channel() << "]: Outbound item reached the head of the pipeline without "
                       "being encoded to bytes; dropping.  Is the encoder stage missing?");
      return;
    }
    // else
    m_channel->send_bytes(std::move(get<util::Blob_ptr>(item)));
    return;
  }
  // else

  const auto idx = end_idx - 1;
  const auto stage = m_entries[idx]->m_stage;
  stage->write(&m_entries[idx]->m_ctx, std::move(item));
}

} // namespace shuffle::transport
