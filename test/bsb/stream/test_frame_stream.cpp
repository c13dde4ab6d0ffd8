/*
 * Copyright (c) 2026 BSB Codec Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <vector>

#include "bsb/stream/frame_stream.hpp"
#include "../mock_frame_handler.hpp"

using namespace bsb::protocol;
using bsb::config::StreamConfig;
using bsb::stream::FrameStream;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::StrictMock;

class FrameStreamTest : public ::testing::Test
{
protected:
  StrictMock<MockFrameHandler> handler_;

  // None of these frames contain a second start byte
  const std::vector<uint8_t> get_request_ = {
    0xDC, 0xC2, 0x00, 0x0B, 0x06, 0x3D, 0x05, 0x19, 0xF0, 0x24, 0x3E
  };
  const std::vector<uint8_t> water_pressure_reply_ = {
    0xDC, 0x80, 0x42, 0x0E, 0x07, 0x05, 0x3D, 0x19, 0xF0, 0x00, 0x00, 0x0F, 0x1D, 0x74
  };

  size_t feed(FrameStream & stream, const std::vector<uint8_t> & bytes)
  {
    return stream.feed(bytes.data(), bytes.size());
  }

  static std::vector<uint8_t> concat(
    const std::vector<uint8_t> & a, const std::vector<uint8_t> & b)
  {
    std::vector<uint8_t> out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
  }
};

TEST_F(FrameStreamTest, DeliversSingleFrame) {
  FrameStream stream(handler_);
  EXPECT_CALL(handler_, onFrame(Field(&Frame::field_id, 0x053D19F0u))).Times(1);

  EXPECT_EQ(feed(stream, get_request_), 1u);
  EXPECT_EQ(stream.buffered(), 0u);
  EXPECT_EQ(stream.stats().frames, 1u);
}

TEST_F(FrameStreamTest, DeliversConcatenatedFramesInOrder) {
  FrameStream stream(handler_);
  {
    InSequence seq;
    EXPECT_CALL(handler_, onFrame(Field(&Frame::packet_type, 6))).Times(1);
    EXPECT_CALL(handler_, onFrame(Field(&Frame::packet_type, 7))).Times(1);
  }

  EXPECT_EQ(feed(stream, concat(get_request_, water_pressure_reply_)), 2u);
  EXPECT_EQ(stream.stats().frames, 2u);
}

TEST_F(FrameStreamTest, SkipsGarbageBeforeFrame) {
  FrameStream stream(handler_);
  EXPECT_CALL(handler_, onFrame(_)).Times(1);

  EXPECT_EQ(feed(stream, concat({0x00, 0x13, 0xFF, 0x42}, water_pressure_reply_)), 1u);
  EXPECT_EQ(stream.stats().dropped_bytes, 4u);
  EXPECT_EQ(stream.buffered(), 0u);
}

TEST_F(FrameStreamTest, GarbageOnlyIsDropped) {
  FrameStream stream(handler_);

  EXPECT_EQ(feed(stream, {0x01, 0x02, 0x03}), 0u);
  EXPECT_EQ(stream.buffered(), 0u);
  EXPECT_EQ(stream.stats().dropped_bytes, 3u);
}

TEST_F(FrameStreamTest, SplitFeedWaitsForRestOfFrame) {
  FrameStream stream(handler_);
  EXPECT_CALL(handler_, onFrame(Field(&Frame::payload, std::vector<uint8_t>{0x00, 0x00, 0x0F})))
  .Times(1);

  std::vector<uint8_t> head(water_pressure_reply_.begin(), water_pressure_reply_.begin() + 2);
  std::vector<uint8_t> middle(water_pressure_reply_.begin() + 2, water_pressure_reply_.begin() + 9);
  std::vector<uint8_t> tail(water_pressure_reply_.begin() + 9, water_pressure_reply_.end());

  EXPECT_EQ(feed(stream, head), 0u);
  EXPECT_EQ(stream.buffered(), 2u);
  EXPECT_EQ(feed(stream, middle), 0u);
  EXPECT_EQ(stream.buffered(), 9u);
  EXPECT_EQ(feed(stream, tail), 1u);
  EXPECT_EQ(stream.buffered(), 0u);
}

TEST_F(FrameStreamTest, ByteByByteFeed) {
  FrameStream stream(handler_);
  EXPECT_CALL(handler_, onFrame(_)).Times(2);

  size_t delivered = 0;
  for (uint8_t b : concat(get_request_, water_pressure_reply_)) {
    delivered += stream.feed(&b, 1);
  }
  EXPECT_EQ(delivered, 2u);
}

TEST_F(FrameStreamTest, CorruptFrameFollowedByGoodFrame) {
  FrameStream stream(handler_);
  std::vector<uint8_t> corrupt = water_pressure_reply_;
  corrupt[11] ^= 0x01;

  {
    InSequence seq;
    EXPECT_CALL(handler_, onError(ErrorCode::CHECKSUM_MISMATCH, corrupt)).Times(1);
    EXPECT_CALL(handler_, onFrame(Field(&Frame::field_id, 0x053D19F0u))).Times(1);
  }

  EXPECT_EQ(feed(stream, concat(corrupt, get_request_)), 1u);
  EXPECT_EQ(stream.stats().checksum_errors, 1u);
  EXPECT_EQ(stream.stats().frames, 1u);
  EXPECT_EQ(stream.stats().dropped_bytes, corrupt.size());
  EXPECT_EQ(stream.buffered(), 0u);
}

TEST_F(FrameStreamTest, CorruptFrameWithoutResync) {
  StreamConfig options;
  options.resync_on_error = false;
  FrameStream stream(handler_, options);
  std::vector<uint8_t> corrupt = get_request_;
  corrupt[9] ^= 0x80;

  EXPECT_CALL(handler_, onError(ErrorCode::CHECKSUM_MISMATCH, _)).Times(1);
  EXPECT_CALL(handler_, onFrame(_)).Times(1);

  EXPECT_EQ(feed(stream, concat(corrupt, water_pressure_reply_)), 1u);
  EXPECT_EQ(stream.stats().dropped_bytes, corrupt.size());
}

TEST_F(FrameStreamTest, InvalidLengthResyncs) {
  FrameStream stream(handler_);
  const std::vector<uint8_t> bad_header = {0xDC, 0x80, 0x42, 0x05};

  {
    InSequence seq;
    EXPECT_CALL(handler_, onError(ErrorCode::INVALID_LENGTH, bad_header)).Times(1);
    EXPECT_CALL(handler_, onFrame(_)).Times(1);
  }

  EXPECT_EQ(feed(stream, concat(bad_header, water_pressure_reply_)), 1u);
  EXPECT_EQ(stream.stats().length_errors, 1u);
  EXPECT_EQ(stream.stats().dropped_bytes, bad_header.size());
}

TEST_F(FrameStreamTest, ResetClearsBufferAndStats) {
  FrameStream stream(handler_);
  EXPECT_CALL(handler_, onFrame(_)).Times(1);

  feed(stream, get_request_);
  std::vector<uint8_t> partial(water_pressure_reply_.begin(), water_pressure_reply_.begin() + 5);
  feed(stream, partial);
  EXPECT_EQ(stream.buffered(), 5u);

  stream.reset();
  EXPECT_EQ(stream.buffered(), 0u);
  EXPECT_EQ(stream.stats().frames, 0u);

  // The rest of the discarded frame is now garbage
  std::vector<uint8_t> rest(water_pressure_reply_.begin() + 5, water_pressure_reply_.end());
  EXPECT_EQ(feed(stream, rest), 0u);
  EXPECT_EQ(stream.buffered(), 0u);
}

TEST_F(FrameStreamTest, EmptyFeed) {
  FrameStream stream(handler_);
  EXPECT_EQ(stream.feed(nullptr, 0), 0u);
  EXPECT_EQ(stream.buffered(), 0u);
}
