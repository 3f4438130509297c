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
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>

namespace shuffle::transport
{

// Implementations.

Channel_ptr Channel::create(flow::log::Logger* logger_ptr, util::Task_engine* task_engine, Socket&& socket) // Static.
{
  return Channel_ptr(new Channel(logger_ptr, task_engine, std::move(socket)));
}

Channel::Channel(flow::log::Logger* logger_ptr, util::Task_engine* task_engine, Socket&& socket) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_task_engine(task_engine),
  m_socket(std::move(socket)),
  m_pipeline(logger_ptr, this),
  m_read_buf(S_READ_BUF_SIZE),
  m_writing(false),
  m_activated(false),
  m_closed(false),
  m_active(false)
{
  Error_code dummy; // An unconnected socket would be a bug in the caller; then just print the empty endpoints.
  m_remote_endpoint = m_socket->remote_endpoint(dummy);
  m_local_endpoint = m_socket->local_endpoint(dummy);

  FLOW_LOG_TRACE("Channel [" << *this << "]: Created.");
}

Channel::~Channel()
{
  FLOW_LOG_TRACE("Channel [" << *this << "]: Destroyed.");
}

Channel_pipeline& Channel::pipeline()
{
  return m_pipeline;
}

void Channel::activate()
{
  boost::asio::post(*m_task_engine, [this, self = shared_from_this()]()
  {
    // We are in thread W.
    if (m_closed || m_activated)
    {
      return;
    }
    // else

    FLOW_LOG_INFO("Channel [" << *this << "]: Activating with pipeline of [" << m_pipeline.size() << "] stages.");
    m_activated = true;
    m_active = true;
    m_pipeline.fire_channel_active();

    if (!m_closed) // A stage may have closed us in channel-active.
    {
      async_read_next();
    }
  });
}

void Channel::write(Pipeline_item&& item, Write_failed_func&& on_failure)
{
  boost::asio::post(*m_task_engine,
                    [this, self = shared_from_this(), item = std::move(item), on_failure = std::move(on_failure)]
                      () mutable
  {
    // We are in thread W.
    if (m_closed)
    {
      FLOW_LOG_TRACE("Channel [" << *this << "]: Write requested after close; dropping.");
      if (on_failure)
      {
        on_failure(error::Code::S_CONNECTION_CLOSED);
      }
      return;
    }
    // else
    m_pipeline.write(std::move(item));
  });
}

void Channel::close()
{
  boost::asio::post(*m_task_engine, [this, self = shared_from_this()]()
  {
    // We are in thread W.
    close_impl(Error_code());
  });
}

bool Channel::is_active() const
{
  return m_active;
}

const Channel::Endpoint& Channel::remote_endpoint() const
{
  return m_remote_endpoint;
}

const Channel::Endpoint& Channel::local_endpoint() const
{
  return m_local_endpoint;
}

util::Task_engine* Channel::task_engine() const
{
  return m_task_engine;
}

void Channel::send_bytes(util::Blob_ptr&& bytes)
{
  // We are in thread W.
  if (m_closed)
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Channel [" << *this << "]: Enqueuing [" << util::blob_size(bytes) << "] bytes for writing; "
                 "[" << m_pending_writes.size() << "] already enqueued.");
  m_pending_writes.emplace(std::move(bytes));
  if (!m_writing)
  {
    async_write_next();
  }
}

void Channel::async_write_next()
{
  // We are in thread W.
  assert((!m_pending_writes.empty()) && (!m_writing) && (!m_closed));

  m_writing = true;
  boost::asio::async_write(*m_socket, m_pending_writes.front()->const_buffer(),
                           [this, self = shared_from_this()](const Error_code& sys_err_code, size_t)
  {
    // We are in thread W.
    on_write_done(sys_err_code);
  });
}

void Channel::on_write_done(const Error_code& sys_err_code)
{
  // We are in thread W.
  m_writing = false;
  if (m_closed)
  {
    return; // Includes operation_aborted due to our own close.
  }
  // else

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Channel [" << *this << "]: Socket write failed; closing.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    m_pipeline.fire_exception_caught(sys_err_code);
    close_impl(sys_err_code);
    return;
  }
  // else

  m_pending_writes.pop();
  if (!m_pending_writes.empty())
  {
    async_write_next();
  }
}

void Channel::async_read_next()
{
  // We are in thread W.
  m_socket->async_read_some(boost::asio::buffer(m_read_buf),
                            [this, self = shared_from_this()](const Error_code& sys_err_code, size_t n_rcvd)
  {
    // We are in thread W.
    on_read_done(sys_err_code, n_rcvd);
  });
}

void Channel::on_read_done(const Error_code& sys_err_code, size_t n_rcvd)
{
  using util::Blob_const;

  // We are in thread W.
  if (m_closed || (sys_err_code == boost::asio::error::operation_aborted))
  {
    return; // We closed the socket ourselves.
  }
  // else

  if (sys_err_code)
  {
    if (sys_err_code == boost::asio::error::eof)
    {
      FLOW_LOG_INFO("Channel [" << *this << "]: Opposing side closed the connection gracefully.");
    }
    else
    {
      FLOW_LOG_WARNING("Channel [" << *this << "]: Socket read failed; closing.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      m_pipeline.fire_exception_caught(sys_err_code);
    }
    close_impl(sys_err_code);
    return;
  }
  // else

  FLOW_LOG_TRACE("Channel [" << *this << "]: Read [" << n_rcvd << "] bytes.");
  m_pipeline.fire_channel_read(util::make_blob(get_logger(), Blob_const(m_read_buf.data(), n_rcvd)));

  if (!m_closed) // A stage may have closed us while handling the bytes.
  {
    async_read_next();
  }
} // Channel::on_read_done()

void Channel::close_impl(const Error_code& err_code)
{
  // We are in thread W.
  if (m_closed)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Channel [" << *this << "]: Closing (cause: "
                "[" << err_code << "] [" << (err_code ? err_code.message() : std::string("none")) << "]).");

  m_closed = true;
  m_active = false;

  Error_code dummy; // Shutdown/close errors (e.g., already disconnected) are of no interest now.
  m_socket->shutdown(Socket::shutdown_both, dummy);
  m_socket->close(dummy);
  m_socket.reset(); // Any outstanding async op completes with operation_aborted.

  if (m_activated)
  {
    m_pipeline.fire_channel_inactive();
  }
  m_pipeline.clear(); // Releases the stages; breaks any reference cycle through the handler.
} // Channel::close_impl()

std::ostream& operator<<(std::ostream& os, const Channel& val)
{
  return os << val.local_endpoint() << "<=>" << val.remote_endpoint() << '@' << static_cast<const void*>(&val);
}

} // namespace shuffle::transport
