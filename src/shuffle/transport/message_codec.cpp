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
#include "shuffle/transport/message_codec.hpp"
#include "shuffle/transport/channel.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>
#include <boost/endian/conversion.hpp>
#include <cstring>

namespace shuffle::transport
{

// Message_encoder implementations.

Message_encoder::Message_encoder(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT)
{
  // That's it.
}

util::Blob_ptr Message_encoder::encode(const Message& msg, Error_code* err_code) const
{
  using flow::util::Blob;
  using boost::endian::store_big_u64;
  using boost::endian::store_big_u32;
  using std::memcpy;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Blob_ptr, Message_encoder::encode, msg, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto frame_size = Message_encoder::frame_size(msg);
  if (frame_size > Frame_decoder::S_MAX_FRAME_SIZE)
  {
    FLOW_LOG_WARNING("Message [" << msg << "] would encode to a frame of [" << frame_size << "] bytes, above the "
                     "maximum [" << Frame_decoder::S_MAX_FRAME_SIZE << "]; refusing.");
    *err_code = error::Code::S_MESSAGE_TOO_LARGE;
    return util::Blob_ptr();
  }
  // else
  err_code->clear();

  const size_t body_size = util::blob_size(msg.m_body);
  auto frame = std::make_shared<Blob>(get_logger(), frame_size);
  auto* pos = frame->begin();

  store_big_u64(pos, frame_size);
  pos += 8;
  *pos = static_cast<uint8_t>(msg.m_type);
  ++pos;
  store_big_u64(pos, msg.m_request_id);
  pos += 8;
  for (const auto* str : { &msg.m_block_id, &msg.m_error })
  {
    store_big_u32(pos, static_cast<uint32_t>(str->size()));
    pos += 4;
    if (!str->empty())
    {
      memcpy(pos, str->data(), str->size());
      pos += str->size();
    }
  }
  if (body_size != 0)
  {
    memcpy(pos, msg.m_body->const_begin(), body_size);
  }

  FLOW_LOG_TRACE("Encoded message [" << msg << "] into frame of [" << frame_size << "] bytes.");
  return frame;
} // Message_encoder::encode()

uint64_t Message_encoder::frame_size(const Message& msg) // Static.
{
  return uint64_t(Frame_format::S_MIN_FRAME_SIZE) + msg.m_block_id.size() + msg.m_error.size()
         + util::blob_size(msg.m_body);
}

bool Message_encoder::too_large(const Message& msg) // Static.
{
  return frame_size(msg) > Frame_decoder::S_MAX_FRAME_SIZE;
}

void Message_encoder::write(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  using std::holds_alternative;
  using std::get;

  // We are in thread W.
  if (holds_alternative<Message_ptr>(item))
  {
    Error_code err_code;
    auto frame = encode(*(get<Message_ptr>(item)), &err_code);
    if (err_code)
    {
      return; // Already logged.
    }
    // else
    ctx->write(std::move(frame));
    return;
  }
  // else
  ctx->write(std::move(item));
}

// Frame_decoder implementations.

Frame_decoder::Frame_decoder(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_failed(false)
{
  // That's it.
}

void Frame_decoder::feed(const util::Blob_const& bytes, std::vector<util::Blob_ptr>* frames, Error_code* err_code)
{
  using util::Blob_const;
  using boost::endian::load_big_u64;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { feed(bytes, frames, actual_err_code); },
         err_code, "Frame_decoder::feed()"))
  {
    return;
  }
  // else

  if (m_failed)
  {
    *err_code = error::Code::S_FRAME_INVALID;
    return;
  }
  // else

  const auto* const data = util::blob_data(bytes);
  m_buf.insert(m_buf.end(), data, data + bytes.size());

  size_t consumed = 0;
  while ((m_buf.size() - consumed) >= Frame_format::S_LENGTH_FIELD_SIZE)
  {
    const uint64_t frame_size = load_big_u64(&m_buf[consumed]);
    if ((frame_size < Frame_format::S_MIN_FRAME_SIZE) || (frame_size > S_MAX_FRAME_SIZE))
    {
      FLOW_LOG_WARNING("Frame_decoder: Frame length [" << frame_size << "] is outside the valid range "
                       "[" << Frame_format::S_MIN_FRAME_SIZE << ", " << S_MAX_FRAME_SIZE << "]; stream is corrupt.");
      m_failed = true;
      m_buf.clear();
      *err_code = error::Code::S_FRAME_INVALID;
      return;
    }
    // else
    if ((m_buf.size() - consumed) < frame_size)
    {
      break; // Await the rest.
    }
    // else

    const auto payload_pos = consumed + Frame_format::S_LENGTH_FIELD_SIZE;
    const auto payload_size = size_t(frame_size) - Frame_format::S_LENGTH_FIELD_SIZE;
    frames->push_back(util::make_blob(get_logger(), Blob_const(&m_buf[payload_pos], payload_size)));
    consumed += size_t(frame_size);
  } // while (at least a length field is buffered)

  m_buf.erase(m_buf.begin(), m_buf.begin() + consumed);
  err_code->clear();
} // Frame_decoder::feed()

size_t Frame_decoder::buffered_size() const
{
  return m_buf.size();
}

void Frame_decoder::channel_read(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  using std::holds_alternative;
  using std::get;
  using std::vector;

  // We are in thread W.
  if (!holds_alternative<util::Blob_ptr>(item))
  {
    ctx->fire_channel_read(std::move(item));
    return;
  }
  // else
  if (m_failed)
  {
    return; // Channel is closing; ignore the rest.
  }
  // else

  const auto& chunk = get<util::Blob_ptr>(item);
  vector<util::Blob_ptr> frames;
  Error_code err_code;
  feed(chunk->const_buffer(), &frames, &err_code);

  // Emit whatever was complete before any bad length.
  for (auto& frame : frames)
  {
    ctx->fire_channel_read(std::move(frame));
  }

  if (err_code)
  {
    FLOW_LOG_WARNING("Channel [" << ctx->channel() << "]: Framing failed; closing channel.");
    ctx->fire_exception_caught(err_code);
    ctx->close();
  }
} // Frame_decoder::channel_read()

// Message_decoder implementations.

Message_decoder::Message_decoder(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT)
{
  // That's it.
}

Message_ptr Message_decoder::decode(const util::Blob_const& frame, Error_code* err_code) const
{
  using util::Blob_const;
  using boost::endian::load_big_u64;
  using boost::endian::load_big_u32;
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Message_ptr, Message_decoder::decode, frame, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto* pos = util::blob_data(frame);
  const auto* const end = pos + frame.size();
  const auto remaining = [&]() -> size_t { return end - pos; };
  const auto fail = [&](util::String_view what) -> Message_ptr
  {
    FLOW_LOG_WARNING("Message_decoder: Frame of [" << frame.size() << "] bytes is malformed: [" << what << "].");
    *err_code = error::Code::S_MESSAGE_DECODE_FAILED;
    return Message_ptr();
  };

  if (remaining() < (Frame_format::S_MIN_FRAME_SIZE - Frame_format::S_LENGTH_FIELD_SIZE))
  {
    return fail("shorter than the fixed header");
  }
  // else

  auto msg = std::make_shared<Message>();
  const auto raw_type = *pos;
  ++pos;
  if (raw_type >= static_cast<uint8_t>(Message_type::S_END_SENTINEL))
  {
    return fail("unknown message type");
  }
  // else
  msg->m_type = static_cast<Message_type>(raw_type);
  msg->m_request_id = load_big_u64(pos);
  pos += 8;

  for (auto* str : { &msg->m_block_id, &msg->m_error })
  {
    if (remaining() < 4)
    {
      return fail("truncated string length");
    }
    // else
    const size_t str_size = load_big_u32(pos);
    pos += 4;
    if (remaining() < str_size)
    {
      return fail("truncated string");
    }
    // else
    str->assign(reinterpret_cast<const char*>(pos), str_size);
    pos += str_size;
  }

  if (remaining() != 0)
  {
    msg->m_body = util::make_blob(get_logger(), Blob_const(pos, remaining()));
  }

  FLOW_LOG_TRACE("Decoded message [" << *msg << "].");
  err_code->clear();
  return msg;
} // Message_decoder::decode()

void Message_decoder::channel_read(Stage_context* ctx, Pipeline_item&& item) // Virtual.
{
  using std::holds_alternative;
  using std::get;

  // We are in thread W.
  if (!holds_alternative<util::Blob_ptr>(item))
  {
    ctx->fire_channel_read(std::move(item));
    return;
  }
  // else

  Error_code err_code;
  auto msg = decode(get<util::Blob_ptr>(item)->const_buffer(), &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Channel [" << ctx->channel() << "]: Decoding failed; closing channel.");
    ctx->fire_exception_caught(err_code);
    ctx->close();
    return;
  }
  // else
  ctx->fire_channel_read(std::move(msg));
}

} // namespace shuffle::transport
