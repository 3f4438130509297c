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
#include "shuffle/transport/message.hpp"
#include <flow/log/log.hpp>
#include <vector>

namespace shuffle::transport
{

// Types.

/**
 * Wire format constants shared by Message_encoder, Frame_decoder and Message_decoder.  A frame is:
 *
 *   Field           | Size
 *   --------------- | ---------------------------------
 *   frame length    | 8 (big-endian; includes itself)
 *   type            | 1 (Message_type)
 *   request ID      | 8 (big-endian)
 *   block ID length | 4 (big-endian), then that many bytes
 *   error length    | 4 (big-endian), then that many bytes
 *   body            | the rest of the frame
 */
struct Frame_format
{
  // Constants.

  /// Size of the frame length field.
  static constexpr size_t S_LENGTH_FIELD_SIZE = 8;

  /// Smallest possible frame (all fields present, strings and body empty).
  static constexpr size_t S_MIN_FRAME_SIZE = S_LENGTH_FIELD_SIZE + 1 + 8 + 4 + 4;
}; // struct Frame_format

/**
 * Outbound pipeline stage that turns each Message into one frame of bytes.  Stateless: one instance is shared by
 * all pipelines of a Transport_context.  Non-Message items pass through unchanged.
 */
class Message_encoder :
  public Channel_stage,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the encoder.
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Message_encoder(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Encodes `msg` into a complete frame (length field included).
   *
   * @param msg
   *        Message.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_MESSAGE_TOO_LARGE (frame would exceed Frame_decoder::S_MAX_FRAME_SIZE, so the opposing
   *        side would reject it).
   * @return Frame.  Null on error.
   */
  util::Blob_ptr encode(const Message& msg, Error_code* err_code = 0) const;

  /**
   * Size of the frame encode() would produce for `msg`, length field included.
   *
   * @param msg
   *        Message.
   * @return See above.
   */
  static uint64_t frame_size(const Message& msg);

  /**
   * Whether encode() would refuse `msg` as too large.
   *
   * @param msg
   *        Message.
   * @return See above.
   */
  static bool too_large(const Message& msg);

  /**
   * Implements Channel_stage API: encodes Message items, forwarding the bytes toward the head.  A Message too large
   * to encode is dropped with a warning; senders are expected to check too_large() first.
   *
   * @param ctx
   *        See Channel_stage.
   * @param item
   *        See Channel_stage.
   */
  void write(Stage_context* ctx, Pipeline_item&& item) override;
}; // class Message_encoder

/**
 * Inbound pipeline stage that reassembles complete frames from the arbitrarily split chunks read from the socket.
 * Each emitted frame excludes the length field.  Stateful: one instance per pipeline.
 *
 * A frame length below Frame_format::S_MIN_FRAME_SIZE or above #S_MAX_FRAME_SIZE cannot be recovered from: the
 * stage fires error::Code::S_FRAME_INVALID down the pipeline, closes the channel, and ignores all further input.
 */
class Frame_decoder :
  public Channel_stage,
  public flow::log::Log_context
{
public:
  // Constants.

  /// Largest accepted frame (length field included).
  static constexpr uint64_t S_MAX_FRAME_SIZE = uint64_t(1) << 30;

  // Constructors/destructor.

  /**
   * Constructs the decoder with nothing buffered.
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Frame_decoder(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Appends `bytes` to the internal buffer and extracts every frame thereby completed, in order.
   *
   * @param bytes
   *        Next chunk of the stream.
   * @param frames
   *        Completed frames (without the length field) are appended here.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_FRAME_INVALID.  Once emitted, every subsequent call emits it again.
   */
  void feed(const util::Blob_const& bytes, std::vector<util::Blob_ptr>* frames, Error_code* err_code = 0);

  /**
   * Number of bytes buffered that do not yet form a complete frame.
   * @return See above.
   */
  size_t buffered_size() const;

  /**
   * Implements Channel_stage API: feeds byte items, forwarding each complete frame toward the tail.
   *
   * @param ctx
   *        See Channel_stage.
   * @param item
   *        See Channel_stage.
   */
  void channel_read(Stage_context* ctx, Pipeline_item&& item) override;

private:
  // Data.

  /// Bytes received but not yet emitted as frames.
  std::vector<uint8_t> m_buf;

  /// `true` once an invalid frame length was seen.
  bool m_failed;
}; // class Frame_decoder

/**
 * Inbound pipeline stage that turns each frame (as emitted by Frame_decoder) into a Message.  Stateless: one
 * instance is shared by all pipelines of a Transport_context.  A malformed frame fires
 * error::Code::S_MESSAGE_DECODE_FAILED down the pipeline and closes the channel.
 */
class Message_decoder :
  public Channel_stage,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the decoder.
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Message_decoder(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Decodes one frame (without the length field).
   *
   * @param frame
   *        Frame bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_MESSAGE_DECODE_FAILED.
   * @return The message; null on error.
   */
  Message_ptr decode(const util::Blob_const& frame, Error_code* err_code = 0) const;

  /**
   * Implements Channel_stage API: decodes byte items, forwarding the Message toward the tail.
   *
   * @param ctx
   *        See Channel_stage.
   * @param item
   *        See Channel_stage.
   */
  void channel_read(Stage_context* ctx, Pipeline_item&& item) override;
}; // class Message_decoder

} // namespace shuffle::transport
