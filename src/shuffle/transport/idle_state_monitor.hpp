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
#pragma once

#include "shuffle/transport/channel_pipeline.hpp"
#include <flow/log/log.hpp>
#include <flow/util/sched_task.hpp>
#include <memory>

namespace shuffle::transport
{

// Types.

/**
 * Pipeline stage that watches for a channel on which nothing has happened -- no read, no write -- for a
 * configured period; when that is the case it fires Channel_event::S_ALL_IDLE toward the tail and starts
 * watching anew.  It takes no action itself; the decision what to do about an idle channel belongs to a later
 * stage (Transport_channel_handler).
 *
 * The check is a Flow scheduled task on the channel's thread W, re-armed each time it fires for exactly the
 * remainder of the period since the last activity; so there is no periodic polling.  A zero period disables the
 * monitor entirely (events still pass through).  Stateful: one instance per pipeline.
 */
class Idle_state_monitor :
  public Channel_stage,
  public flow::log::Log_context,
  public std::enable_shared_from_this<Idle_state_monitor>
{
public:
  // Constructors/destructor.

  /**
   * Constructs the monitor; it does nothing until channel-active.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param all_idle_timeout
   *        Period of no reads and no writes after which S_ALL_IDLE fires.  Zero disables.
   */
  explicit Idle_state_monitor(flow::log::Logger* logger_ptr, util::Fine_duration all_idle_timeout);

  // Methods.

  /**
   * The configured period.
   * @return See above.
   */
  util::Fine_duration all_idle_timeout() const;

  /**
   * Implements Channel_stage API: records activity and arms the check.
   * @param ctx
   *        See Channel_stage.
   */
  void channel_active(Stage_context* ctx) override;

  /**
   * Implements Channel_stage API: cancels the check.
   * @param ctx
   *        See Channel_stage.
   */
  void channel_inactive(Stage_context* ctx) override;

  /**
   * Implements Channel_stage API: records activity.
   *
   * @param ctx
   *        See Channel_stage.
   * @param item
   *        See Channel_stage.
   */
  void channel_read(Stage_context* ctx, Pipeline_item&& item) override;

  /**
   * Implements Channel_stage API: records activity.
   *
   * @param ctx
   *        See Channel_stage.
   * @param item
   *        See Channel_stage.
   */
  void write(Stage_context* ctx, Pipeline_item&& item) override;

private:
  // Methods.

  /**
   * Arms the check to fire after `from_now`.
   * @param from_now
   *        Delay.
   */
  void schedule_check(util::Fine_duration from_now);

  /// The scheduled check: fires the event or re-arms.
  void on_check();

  // Data.

  /// See all_idle_timeout().
  const util::Fine_duration m_all_idle_timeout;

  /// Our context; set at channel-active; null before that and after channel-inactive.
  Stage_context* m_ctx;

  /// Event loop of the channel, for the scheduled check.
  util::Task_engine* m_task_engine;

  /// Time of the last read or write.
  util::Fine_time_pt m_last_activity;

  /// The pending check, if armed.
  flow::util::Scheduled_task_handle m_check_task;
}; // class Idle_state_monitor

} // namespace shuffle::transport
