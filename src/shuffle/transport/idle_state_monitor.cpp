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
#include "shuffle/transport/idle_state_monitor.hpp"
#include "shuffle/transport/channel.hpp"
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>

namespace shuffle::transport
{

// Implementations.

Idle_state_monitor::Idle_state_monitor(flow::log::Logger* logger_ptr, util::Fine_duration all_idle_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_all_idle_timeout(all_idle_timeout),
  m_ctx(0),
  m_task_engine(0)
{
  // That's it.
}

util::Fine_duration Idle_state_monitor::all_idle_timeout() const
{
  return m_all_idle_timeout;
}

void Idle_state_monitor::channel_active(Stage_context* ctx) // Virtual.
{
  using flow::Fine_clock;
  using boost::chrono::milliseconds;
  using boost::chrono::round;

  // We are in thread W.
  if (m_all_idle_timeout != util::Fine_duration::zero())
  {
    m_ctx = ctx;
    m_task_engine = ctx->channel().task_engine();
    m_last_activity = Fine_clock::now();
    FLOW_LOG_TRACE("Channel [" << ctx->channel() << "]: Idle monitor armed: "
                   "[" << round<milliseconds>(m_all_idle_timeout) << "] of no reads and no writes => idle.");
    schedule_check(m_all_idle_timeout);
  }

  ctx->fire_channel_active();
}

void Idle_state_monitor::channel_inactive(Stage_context* ctx) // Virtual.
{
  using flow::util::scheduled_task_cancel;

  // We are in thread W.
  if (m_check_task)
  {
    scheduled_task_cancel(get_logger(), m_check_task);
    m_check_task.reset();
  }
  m_ctx = 0;

  ctx->fire_channel_inactive();
}

void Idle_state_monitor::channel_read(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  m_last_activity = flow::Fine_clock::now();
  ctx->fire_channel_read(std::move(item));
}

void Idle_state_monitor::write(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  m_last_activity = flow::Fine_clock::now();
  ctx->write(std::move(item));
}

void Idle_state_monitor::schedule_check(util::Fine_duration from_now)
{
  using flow::util::schedule_task_from_now;

  // We are in thread W.
  m_check_task = schedule_task_from_now(get_logger(), from_now, true, m_task_engine,
                                        [this, self = shared_from_this()](bool)
  {
    // We are in thread W.
    on_check();
  });
}

void Idle_state_monitor::on_check()
{
  using flow::Fine_clock;
  using boost::chrono::milliseconds;
  using boost::chrono::round;

  // We are in thread W.
  if (!m_ctx)
  {
    return; // Channel closed in the meantime.
  }
  // else

  const auto idle_for = Fine_clock::now() - m_last_activity;
  if (idle_for < m_all_idle_timeout)
  {
    schedule_check(m_all_idle_timeout - idle_for);
    return;
  }
  // else

  FLOW_LOG_INFO("Channel [" << m_ctx->channel() << "]: No reads and no writes for "
                "[" << round<milliseconds>(idle_for) << "]; firing all-idle event.");
  /* Re-arm first: the event may well close the channel, in which case channel-inactive (which comes later, as
   * closing is posted) cancels this. */
  m_last_activity = Fine_clock::now();
  schedule_check(m_all_idle_timeout);
  m_ctx->fire_event_triggered(Channel_event::S_ALL_IDLE);
}

} // namespace shuffle::transport
