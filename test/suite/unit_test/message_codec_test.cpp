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


#include "shuffle/transport/message_codec.hpp"
#include "shuffle/transport/message.hpp"
#include "shuffle/transport/error.hpp"
#include "shuffle/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <boost/endian/conversion.hpp>
#include <gtest/gtest.h>

namespace shuffle::transport::test
{

namespace
{

using shuffle::test::Test_logger;
using util::Blob_const;
using util::Blob_ptr;
using std::string;
using std::vector;

/// Byte view of a blob.
Blob_const bytes_of(const Blob_ptr& blob)
{
  return blob->const_buffer();
}

} // namespace (anon)

TEST(Message_codec_test, Frame_layout)
{
  Test_logger logger;
  const Message_encoder encoder(&logger);

  const auto frame = encoder.encode(Message{ Message_type::S_BLOCK_FETCH_FAILURE, 0x0102030405060708,
                                             "blk", "oops", Blob_ptr() });

  ASSERT_EQ(frame->size(), Frame_format::S_MIN_FRAME_SIZE + 3 + 4);
  const auto* data = frame->const_begin();
  EXPECT_EQ(boost::endian::load_big_u64(data), frame->size());
  EXPECT_EQ(data[8], static_cast<uint8_t>(Message_type::S_BLOCK_FETCH_FAILURE));
  EXPECT_EQ(boost::endian::load_big_u64(data + 9), 0x0102030405060708u);
  EXPECT_EQ(boost::endian::load_big_u32(data + 17), 3u);
  EXPECT_EQ(string(reinterpret_cast<const char*>(data + 21), 3), "blk");
  EXPECT_EQ(boost::endian::load_big_u32(data + 24), 4u);
  EXPECT_EQ(string(reinterpret_cast<const char*>(data + 28), 4), "oops");
}

TEST(Message_codec_test, Frames_survive_arbitrary_splitting)
{
  Test_logger logger;
  const Message_encoder encoder(&logger);
  const Message_decoder decoder(&logger);
  Frame_decoder frame_decoder(&logger);

  // Two messages back to back, fed 1 byte at a time, then as one chunk.
  const auto frame1 = encoder.encode(Message{ Message_type::S_RPC_REQUEST, 1, "", "",
                                              util::make_blob(&logger, "ping") });
  const auto frame2 = encoder.encode(Message{ Message_type::S_BLOCK_FETCH_SUCCESS, 2, "b7", "",
                                              util::make_blob(&logger, "payload-of-b7") });
  vector<uint8_t> stream(frame1->const_begin(), frame1->const_begin() + frame1->size());
  stream.insert(stream.end(), frame2->const_begin(), frame2->const_begin() + frame2->size());

  vector<Blob_ptr> frames;
  for (size_t idx = 0; idx != stream.size(); ++idx)
  {
    frame_decoder.feed(Blob_const(&stream[idx], 1), &frames);
  }
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frame_decoder.buffered_size(), 0u);

  const auto msg1 = decoder.decode(bytes_of(frames[0]));
  EXPECT_EQ(msg1->m_type, Message_type::S_RPC_REQUEST);
  EXPECT_EQ(msg1->m_request_id, 1u);
  EXPECT_EQ(util::blob_view(msg1->m_body), "ping");

  const auto msg2 = decoder.decode(bytes_of(frames[1]));
  EXPECT_EQ(msg2->m_type, Message_type::S_BLOCK_FETCH_SUCCESS);
  EXPECT_EQ(msg2->m_block_id, "b7");
  EXPECT_TRUE(msg2->m_error.empty());
  EXPECT_EQ(util::blob_view(msg2->m_body), "payload-of-b7");

  // A partial frame stays buffered.
  frames.clear();
  frame_decoder.feed(Blob_const(stream.data(), frame1->size() + 5), &frames);
  EXPECT_EQ(frames.size(), 1u);
  EXPECT_EQ(frame_decoder.buffered_size(), 5u);
}

TEST(Message_codec_test, Empty_body_decodes_as_null)
{
  Test_logger logger;
  const Message_encoder encoder(&logger);
  const Message_decoder decoder(&logger);
  Frame_decoder frame_decoder(&logger);

  const auto frame = encoder.encode(Message{ Message_type::S_BLOCK_FETCH_REQUEST, 9, "b1", "", Blob_ptr() });
  vector<Blob_ptr> frames;
  frame_decoder.feed(bytes_of(frame), &frames);
  ASSERT_EQ(frames.size(), 1u);

  const auto msg = decoder.decode(bytes_of(frames[0]));
  EXPECT_EQ(msg->m_block_id, "b1");
  EXPECT_FALSE(msg->m_body);
  EXPECT_TRUE(is_request(msg->m_type));
}

TEST(Message_codec_test, Invalid_frame_length_is_sticky)
{
  Test_logger logger;
  Frame_decoder frame_decoder(&logger);

  uint8_t bad[Frame_format::S_LENGTH_FIELD_SIZE];
  boost::endian::store_big_u64(bad, 3); // Below the minimum.

  vector<Blob_ptr> frames;
  Error_code err_code;
  frame_decoder.feed(Blob_const(bad, sizeof bad), &frames, &err_code);
  EXPECT_EQ(err_code, error::Code::S_FRAME_INVALID);
  EXPECT_TRUE(frames.empty());

  // Even valid input is refused from now on.
  const Message_encoder encoder(&logger);
  const auto frame = encoder.encode(Message{ Message_type::S_ONE_WAY_MESSAGE, 0, "", "", Blob_ptr() });
  EXPECT_THROW(frame_decoder.feed(bytes_of(frame), &frames), flow::error::Runtime_error);

  Frame_decoder huge_decoder(&logger);
  boost::endian::store_big_u64(bad, Frame_decoder::S_MAX_FRAME_SIZE + 1);
  huge_decoder.feed(Blob_const(bad, sizeof bad), &frames, &err_code);
  EXPECT_EQ(err_code, error::Code::S_FRAME_INVALID);
}

TEST(Message_codec_test, Malformed_frames_fail_to_decode)
{
  Test_logger logger;
  const Message_decoder decoder(&logger);
  Error_code err_code;

  const uint8_t too_short[] = { 0, 0, 0 };
  EXPECT_FALSE(decoder.decode(Blob_const(too_short, sizeof too_short), &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_DECODE_FAILED);

  uint8_t unknown_type[Frame_format::S_MIN_FRAME_SIZE - Frame_format::S_LENGTH_FIELD_SIZE] = {};
  unknown_type[0] = 200;
  EXPECT_FALSE(decoder.decode(Blob_const(unknown_type, sizeof unknown_type), &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_DECODE_FAILED);

  uint8_t truncated[Frame_format::S_MIN_FRAME_SIZE - Frame_format::S_LENGTH_FIELD_SIZE] = {};
  boost::endian::store_big_u32(truncated + 9, 50); // Block ID claims 50 bytes; none follow.
  EXPECT_THROW(decoder.decode(Blob_const(truncated, sizeof truncated)), flow::error::Runtime_error);
}

TEST(Message_codec_test, Oversized_message_is_refused_before_framing)
{
  Test_logger logger;
  const Message_encoder encoder(&logger);

  // Uninitialized; only its size matters.
  const Blob_ptr huge_body = std::make_shared<flow::util::Blob>(&logger, Frame_decoder::S_MAX_FRAME_SIZE);
  const Message msg{ Message_type::S_RPC_REQUEST, 1, "", "", huge_body };
  EXPECT_GT(Message_encoder::frame_size(msg), Frame_decoder::S_MAX_FRAME_SIZE);
  EXPECT_TRUE(Message_encoder::too_large(msg));

  Error_code err_code;
  EXPECT_FALSE(encoder.encode(msg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_TOO_LARGE);
  EXPECT_FALSE(error::is_transient(err_code));
  EXPECT_THROW(encoder.encode(msg), flow::error::Runtime_error);

  // An ordinary message passes the size check.
  const Message small{ Message_type::S_RPC_REQUEST, 1, "blk", "", util::make_blob(&logger, "data") };
  EXPECT_EQ(Message_encoder::frame_size(small), Frame_format::S_MIN_FRAME_SIZE + 3 + 4);
  EXPECT_FALSE(Message_encoder::too_large(small));
  const auto frame = encoder.encode(small, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->size(), Message_encoder::frame_size(small));
}

} // namespace shuffle::transport::test
