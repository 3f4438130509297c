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

#include "shuffle/transport/transport_fwd.hpp"
#include <flow/log/log.hpp>
#include <memory>
#include <string>
#include <vector>

namespace shuffle::transport
{

// Types.

/// User events that a stage can fire down the rest of the pipeline via Stage_context::fire_event_triggered().
enum class Channel_event
{
  /// Neither a read nor a write happened for the configured idle period (Idle_state_monitor).
  S_ALL_IDLE
}; // enum class Channel_event

/**
 * One named stage in a Channel_pipeline.  Inbound events (channel_active(), channel_inactive(), channel_read(),
 * event_triggered(), exception_caught()) travel from the head of the pipeline to its tail; outbound writes
 * (write()) travel from the tail to the head and from there to the socket.  Each default implementation
 * simply forwards the event to the next stage in its direction via the given Stage_context; a stage overrides
 * those it cares about.
 *
 * All methods are invoked from the owning Channel's thread W.  A stage instance may be installed into many
 * pipelines at once if it holds no per-connection state (Message_encoder, Message_decoder); otherwise one
 * instance per pipeline.
 */
class Channel_stage
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Channel_stage();

  // Methods.

  /**
   * The channel became connected and ready for I/O.
   * @param ctx
   *        This stage's position in the pipeline.
   */
  virtual void channel_active(Stage_context* ctx);

  /**
   * The channel closed.  Fired exactly once per channel, after which no more events arrive.
   * @param ctx
   *        This stage's position in the pipeline.
   */
  virtual void channel_inactive(Stage_context* ctx);

  /**
   * An inbound item arrived.
   *
   * @param ctx
   *        This stage's position in the pipeline.
   * @param item
   *        The item.
   */
  virtual void channel_read(Stage_context* ctx, Pipeline_item&& item);

  /**
   * An outbound item is being written.
   *
   * @param ctx
   *        This stage's position in the pipeline.
   * @param item
   *        The item.
   */
  virtual void write(Stage_context* ctx, Pipeline_item&& item);

  /**
   * A user event was fired by an earlier stage.
   *
   * @param ctx
   *        This stage's position in the pipeline.
   * @param event
   *        The event.
   */
  virtual void event_triggered(Stage_context* ctx, Channel_event event);

  /**
   * An error was detected by the channel or an earlier stage.  The channel will close (if it has not already).
   *
   * @param ctx
   *        This stage's position in the pipeline.
   * @param err_code
   *        The error.  Truthy.
   */
  virtual void exception_caught(Stage_context* ctx, const Error_code& err_code);
}; // class Channel_stage

/**
 * A stage's handle onto its position inside a particular Channel_pipeline: it allows forwarding an event to
 * the neighboring stage and reaching the Channel itself.  One exists per installed stage and lives as long as the
 * pipeline keeps that stage; a stage may keep a pointer to it while the channel is active (i.e., until
 * Channel_stage::channel_inactive()).
 *
 * All methods must be called from thread W.
 */
class Stage_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the context of the stage at index `idx` of `*pipeline`.
   *
   * @param pipeline
   *        The pipeline.
   * @param idx
   *        Index of the stage.
   */
  explicit Stage_context(Channel_pipeline* pipeline, size_t idx);

  // Methods.

  /**
   * The channel whose pipeline this is.
   * @return See above.
   */
  Channel& channel() const;

  /**
   * Name of the stage.
   * @return See above.
   */
  const std::string& name() const;

  /// Forwards channel-active to the next stage toward the tail.
  void fire_channel_active();

  /// Forwards channel-inactive to the next stage toward the tail.
  void fire_channel_inactive();

  /**
   * Forwards an inbound item to the next stage toward the tail.
   * @param item
   *        The item.
   */
  void fire_channel_read(Pipeline_item&& item);

  /**
   * Forwards a user event to the next stage toward the tail.
   * @param event
   *        The event.
   */
  void fire_event_triggered(Channel_event event);

  /**
   * Forwards an error to the next stage toward the tail.
   * @param err_code
   *        The error.
   */
  void fire_exception_caught(const Error_code& err_code);

  /**
   * Forwards an outbound item to the next stage toward the head; or, if this is the head, hands it to the channel
   * which requires it to be a #util::Blob_ptr (encoded bytes).
   *
   * @param item
   *        The item.
   */
  void write(Pipeline_item&& item);

  /// Closes the channel (asynchronously; channel-inactive will follow).
  void close();

private:
  // Data.

  /// The pipeline.
  Channel_pipeline* const m_pipeline;

  /// Index of our stage in `*m_pipeline`.
  const size_t m_idx;
}; // class Stage_context

/**
 * Ordered sequence of named stages attached to one Channel.  Stages are added (add_last()) before the channel is
 * activated and stay until the channel closes, at which point the Channel clears the pipeline, releasing the
 * stages and whatever they reference.
 *
 * Event entry points (`fire_*()` and write()) are invoked by the Channel from thread W.  An inbound event that
 * passes the tail, or an outbound item that is not bytes by the time it passes the head, is logged and dropped.
 */
class Channel_pipeline :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty pipeline.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param channel
   *        The channel that owns `*this`.
   */
  explicit Channel_pipeline(flow::log::Logger* logger_ptr, Channel* channel);

  // Methods.

  /**
   * Appends a stage at the tail.
   *
   * @param name
   *        Name; must be unique within the pipeline.
   * @param stage
   *        The stage.  Must not be null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (duplicate name or null stage).
   */
  void add_last(const std::string& name, Channel_stage_ptr stage, Error_code* err_code = 0);

  /**
   * Returns the stage with the given name, or null.
   *
   * @param name
   *        Name.
   * @return See above.
   */
  Channel_stage_ptr get(util::String_view name) const;

  /**
   * Returns the stage with the given name cast to the given type, or null if absent or of another type.
   *
   * @tparam Stage
   *         A Channel_stage subclass.
   * @param name
   *        Name.
   * @return See above.
   */
  template<typename Stage>
  std::shared_ptr<Stage> get_as(util::String_view name) const;

  /**
   * Names of all stages, head to tail.
   * @return See above.
   */
  std::vector<std::string> names() const;

  /**
   * Number of stages.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /// Removes all stages.
  void clear();

  /**
   * The owning channel.
   * @return See above.
   */
  Channel& channel() const;

  /// Fires channel-active at the head.
  void fire_channel_active();

  /// Fires channel-inactive at the head.
  void fire_channel_inactive();

  /**
   * Fires an inbound item (bytes read from the socket) at the head.
   * @param item
   *        The item.
   */
  void fire_channel_read(Pipeline_item&& item);

  /**
   * Fires an error at the head.
   * @param err_code
   *        The error.
   */
  void fire_exception_caught(const Error_code& err_code);

  /**
   * Writes an outbound item at the tail.
   * @param item
   *        The item.
   */
  void write(Pipeline_item&& item);

private:
  // Friends.

  /// Stage_context forwards via our private `invoke_*()` methods.
  friend class Stage_context;

  // Types.

  /// One installed stage and its context.
  struct Entry
  {
    /// See add_last().
    std::string m_name;

    /// See add_last().
    Channel_stage_ptr m_stage;

    /// The context passed to `m_stage`.
    Stage_context m_ctx;
  };

  // Methods.

  /**
   * Runs channel-active on the stage at `idx`, or does nothing if past the tail.
   * @param idx
   *        Index.
   */
  void invoke_channel_active(size_t idx);

  /**
   * Runs channel-inactive on the stage at `idx`, or does nothing if past the tail.
   * @param idx
   *        Index.
   */
  void invoke_channel_inactive(size_t idx);

  /**
   * Runs channel-read on the stage at `idx`, or logs and drops `item` if past the tail.
   *
   * @param idx
   *        Index.
   * @param item
   *        The item.
   */
  void invoke_channel_read(size_t idx, Pipeline_item&& item);

  /**
   * Runs event-triggered on the stage at `idx`, or does nothing if past the tail.
   *
   * @param idx
   *        Index.
   * @param event
   *        The event.
   */
  void invoke_event_triggered(size_t idx, Channel_event event);

  /**
   * Runs exception-caught on the stage at `idx`, or logs if past the tail.
   *
   * @param idx
   *        Index.
   * @param err_code
   *        The error.
   */
  void invoke_exception_caught(size_t idx, const Error_code& err_code);

  /**
   * Runs write on the stage just before `end_idx` (toward the head), or hands `item` to the channel if
   * `end_idx == 0`.
   *
   * @param end_idx
   *        One past the index of the stage to run.
   * @param item
   *        The item.
   */
  void invoke_write(size_t end_idx, Pipeline_item&& item);

  // Data.

  /// See channel().
  Channel* const m_channel;

  /// The stages, head to tail.  Each Entry is heap-allocated so that its `m_ctx` address is stable.
  std::vector<std::unique_ptr<Entry>> m_entries;
}; // class Channel_pipeline

// Template implementations.

template<typename Stage>
std::shared_ptr<Stage> Channel_pipeline::get_as(util::String_view name) const
{
  return std::dynamic_pointer_cast<Stage>(get(name));
}

} // namespace shuffle::transport
