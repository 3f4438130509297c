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
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <queue>
#include <vector>

namespace shuffle::transport
{

// Types.

/**
 * One TCP connection together with the Channel_pipeline that processes its traffic.  A Channel is bound to one
 * `Task_engine` (the event loop of a single worker thread, thread W); all socket I/O and all pipeline events
 * execute there.  write(), close() and activate() may be called from any thread: they post onto W.
 *
 * Lifecycle: create() (socket already connected) => the owner installs the pipeline (typically
 * Transport_context::initialize_pipeline()) => activate() fires channel-active and starts reading => ... =>
 * the channel closes (close(), an I/O error, or EOF), firing channel-inactive exactly once and then clearing the
 * pipeline.  The socket is destroyed at that point too, so that a Channel object outliving its `Task_engine`
 * holds no I/O resources.  A closed Channel never reopens.
 *
 * A Channel is always held by `shared_ptr` (#Channel_ptr); outstanding async operations hold a reference, so the
 * Channel lives at least until its socket is closed and those operations are reaped.
 */
class Channel :
  public flow::log::Log_context,
  public std::enable_shared_from_this<Channel>
{
public:
  // Types.

  /// Short-hand for the TCP socket type.
  using Socket = boost::asio::ip::tcp::socket;

  /// Short-hand for the TCP endpoint type.
  using Endpoint = boost::asio::ip::tcp::endpoint;

  /// Called (from thread W) if a write() could not even be attempted, because the channel had closed.
  using Write_failed_func = Function<void (const Error_code& err_code)>;

  // Constants.

  /// Size of the buffer into which each socket read is performed.
  static constexpr size_t S_READ_BUF_SIZE = 64 * 1024;

  // Constructors/destructor.

  /**
   * Creates a Channel wrapping an already-connected socket.  The channel is not active until activate().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param task_engine
   *        The event loop on which `socket` was created; it must outlive the socket (i.e., at least until the
   *        channel closes).
   * @param socket
   *        Connected socket.  Becomes owned by the channel.
   * @return See above.
   */
  static Channel_ptr create(flow::log::Logger* logger_ptr, util::Task_engine* task_engine, Socket&& socket);

  /// Boring destructor.  Logs.
  ~Channel();

  // Methods.

  /**
   * The pipeline.  May be modified only before activate() (and by the channel itself afterwards).
   * @return See above.
   */
  Channel_pipeline& pipeline();

  /// Starts the channel (asynchronously, on thread W): fires channel-active and starts reading.  Idempotent.
  void activate();

  /**
   * Writes an item at the tail of the pipeline (asynchronously, on thread W).  If the channel has closed by
   * then, the item is dropped and `on_failure` (if not empty) is invoked with error::Code::S_CONNECTION_CLOSED.
   *
   * @param item
   *        The item; typically a Message to be encoded by the pipeline.
   * @param on_failure
   *        See above.
   */
  void write(Pipeline_item&& item, Write_failed_func&& on_failure = Write_failed_func());

  /// Closes the channel (asynchronously, on thread W).  Idempotent.
  void close();

  /**
   * Returns `true` between activation and closing.  May be called from any thread.
   * @return See above.
   */
  bool is_active() const;

  /**
   * Address of the opposing side (as of creation).
   * @return See above.
   */
  const Endpoint& remote_endpoint() const;

  /**
   * Address of our side (as of creation).
   * @return See above.
   */
  const Endpoint& local_endpoint() const;

  /**
   * The event loop of thread W.
   * @return See above.
   */
  util::Task_engine* task_engine() const;

private:
  // Friends.

  /// The pipeline hands encoded bytes to send_bytes().
  friend class Channel_pipeline;

  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param task_engine
   *        See create().
   * @param socket
   *        See create().
   */
  explicit Channel(flow::log::Logger* logger_ptr, util::Task_engine* task_engine, Socket&& socket);

  // Methods.

  /**
   * Enqueues bytes for writing to the socket.  Thread W.
   * @param bytes
   *        Bytes.
   */
  void send_bytes(util::Blob_ptr&& bytes);

  /// Starts the async write of `m_pending_writes.front()`.  Thread W.
  void async_write_next();

  /**
   * Completion of async_write_next().  Thread W.
   * @param sys_err_code
   *        Result.
   */
  void on_write_done(const Error_code& sys_err_code);

  /// Starts the next async read.  Thread W.
  void async_read_next();

  /**
   * Completion of async_read_next().  Thread W.
   *
   * @param sys_err_code
   *        Result.
   * @param n_rcvd
   *        Bytes read into `m_read_buf`.
   */
  void on_read_done(const Error_code& sys_err_code, size_t n_rcvd);

  /**
   * The body of close() and of closing on I/O error.  Thread W.
   * @param err_code
   *        The cause, if an error; else falsy.
   */
  void close_impl(const Error_code& err_code);

  // Data.

  /// See task_engine().
  util::Task_engine* const m_task_engine;

  /// The socket; empty once closed.
  std::optional<Socket> m_socket;

  /// See remote_endpoint().
  Endpoint m_remote_endpoint;

  /// See local_endpoint().
  Endpoint m_local_endpoint;

  /// See pipeline().
  Channel_pipeline m_pipeline;

  /// Target of each async read.
  std::vector<uint8_t> m_read_buf;

  /**
   * Encoded frames awaiting write, front being written now (if #m_writing).  Not cleared on close, as an aborted
   * async write may still reference the front buffer until its handler is reaped.
   */
  std::queue<util::Blob_ptr> m_pending_writes;

  /// `true` while an async write is outstanding.
  bool m_writing;

  /// `true` once activate() has taken effect.
  bool m_activated;

  /// `true` once close_impl() has taken effect.
  bool m_closed;

  /// See is_active().
  std::atomic<bool> m_active;
}; // class Channel

} // namespace shuffle::transport
