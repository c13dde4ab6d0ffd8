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
#include "bsb/protocol/frame.hpp"
#include <vector>

using namespace bsb::protocol;

// Test fixture for error handling tests
class FrameErrorTest : public ::testing::Test
{
protected:
  std::vector<uint8_t> buffer_;

  void SetUp() override
  {
    // Encode a valid frame to be tampered with later
    Frame frame = makeFrame(66, 0, PacketType::RET, 0x053D19F0, {0x00, 0x00, 0x0F});
    ASSERT_EQ(serializeFrame(frame, buffer_), ErrorCode::OK);
    ASSERT_EQ(buffer_.size(), 14u);
  }

  ErrorCode parse(const std::vector<uint8_t> & bytes, ParsedFrame & parsed)
  {
    return tryParseFrame(ByteSpan(bytes.data(), bytes.size()), parsed);
  }

  // Rewrite the trailing checksum after a deliberate header change
  void fixChecksum(std::vector<uint8_t> & bytes)
  {
    const size_t crc_offset = bytes.size() - CHECKSUM_SIZE;
    uint16_t crc = crc16_xmodem(bytes.data(), crc_offset);
    bytes[crc_offset] = static_cast<uint8_t>((crc >> 8) & 0xFF);
    bytes[crc_offset + 1] = static_cast<uint8_t>(crc & 0xFF);
  }
};

TEST_F(FrameErrorTest, ChecksumMismatch) {
  // Corrupt the last byte of the payload (before CRC)
  buffer_[buffer_.size() - 3]++;

  ParsedFrame parsed;
  ASSERT_EQ(parse(buffer_, parsed), ErrorCode::CHECKSUM_MISMATCH);
  EXPECT_FALSE(parsed.checksum_ok);
  EXPECT_EQ(parsed.result, ErrorCode::CHECKSUM_MISMATCH);

  // The frame is still reported so the caller can log what was rejected
  EXPECT_EQ(parsed.consumed, buffer_.size());
  EXPECT_EQ(parsed.frame.field_id, 0x053D19F0u);
}

TEST_F(FrameErrorTest, SingleBitFlipsAreDetected) {
  for (size_t i = 1; i < buffer_.size(); ++i) {
    // The length byte changes framing instead of content
    if (i == 3) {
      continue;
    }
    for (int bit = 0; bit < 8; ++bit) {
      std::vector<uint8_t> corrupted = buffer_;
      corrupted[i] ^= static_cast<uint8_t>(1u << bit);

      ParsedFrame parsed;
      EXPECT_EQ(parse(corrupted, parsed), ErrorCode::CHECKSUM_MISMATCH)
        << "byte " << i << " bit " << bit;
    }
  }
}

TEST_F(FrameErrorTest, LengthBitFlipIsRejected) {
  for (int bit = 0; bit < 8; ++bit) {
    std::vector<uint8_t> corrupted = buffer_;
    corrupted[3] ^= static_cast<uint8_t>(1u << bit);

    ParsedFrame parsed;
    EXPECT_NE(parse(corrupted, parsed), ErrorCode::OK) << "bit " << bit;
  }
}

TEST_F(FrameErrorTest, InvalidStartByte) {
  for (int first = 0; first < 256; ++first) {
    if (first == START_BYTE) {
      continue;
    }
    std::vector<uint8_t> bytes = buffer_;
    bytes[0] = static_cast<uint8_t>(first);

    ParsedFrame parsed;
    EXPECT_EQ(parse(bytes, parsed), ErrorCode::INVALID_START_BYTE) << "first byte " << first;
  }

  // Even a single byte is enough to know
  std::vector<uint8_t> one = {0x00};
  ParsedFrame parsed;
  EXPECT_EQ(parse(one, parsed), ErrorCode::INVALID_START_BYTE);
}

TEST_F(FrameErrorTest, EmptyInput) {
  ParsedFrame parsed;
  EXPECT_EQ(tryParseFrame(ByteSpan(), parsed), ErrorCode::INCOMPLETE);
  EXPECT_EQ(tryParseFrame(ByteSpan(buffer_.data(), 0), parsed), ErrorCode::INCOMPLETE);
}

TEST_F(FrameErrorTest, TruncatedFrame) {
  for (size_t len = 1; len < buffer_.size(); ++len) {
    ParsedFrame parsed;
    ErrorCode result = tryParseFrame(ByteSpan(buffer_.data(), len), parsed);
    EXPECT_EQ(result, ErrorCode::INCOMPLETE) << "length " << len;
    EXPECT_EQ(parsed.consumed, 0u);
  }
}

TEST_F(FrameErrorTest, LengthTooSmall) {
  buffer_[3] = 1;
  ParsedFrame parsed;
  EXPECT_EQ(parse(buffer_, parsed), ErrorCode::INVALID_LENGTH);

  buffer_[3] = static_cast<uint8_t>(MIN_FRAME_SIZE - 1);
  EXPECT_EQ(parse(buffer_, parsed), ErrorCode::INVALID_LENGTH);
}

TEST_F(FrameErrorTest, LengthTooLarge) {
  buffer_[3] = 70;
  ParsedFrame parsed;
  EXPECT_EQ(parse(buffer_, parsed), ErrorCode::INVALID_LENGTH);

  buffer_[3] = 0xFF;
  EXPECT_EQ(parse(buffer_, parsed), ErrorCode::INVALID_LENGTH);
}

TEST_F(FrameErrorTest, LengthCheckedBeforeCompleteness) {
  // Four bytes already tell that the length is impossible
  std::vector<uint8_t> header = {START_BYTE, 0x80, 0x42, 70};
  ParsedFrame parsed;
  EXPECT_EQ(parse(header, parsed), ErrorCode::INVALID_LENGTH);
}

TEST_F(FrameErrorTest, MinimumFrameWithoutPayload) {
  std::vector<uint8_t> bytes = {
    START_BYTE, 0xC2, 0x00, 0x0B, 0x02, 0x05, 0x3D, 0x00, 0x06, 0x00, 0x00
  };
  fixChecksum(bytes);

  ParsedFrame parsed;
  ASSERT_EQ(parse(bytes, parsed), ErrorCode::OK);
  EXPECT_TRUE(parsed.frame.payload.empty());
  EXPECT_EQ(classifyPacketType(parsed.frame.packet_type), PacketType::INFO);
  EXPECT_EQ(parsed.frame.field_id, 0x053D0006u);
}

TEST_F(FrameErrorTest, TrailingBytesAreLeftInRest) {
  buffer_.push_back(0xAA);
  buffer_.push_back(0xBB);

  ParsedFrame parsed;
  ASSERT_EQ(parse(buffer_, parsed), ErrorCode::OK);
  ASSERT_EQ(parsed.rest.size, 2u);
  EXPECT_EQ(parsed.rest.data[0], 0xAA);
  EXPECT_EQ(parsed.rest.data[1], 0xBB);
}

TEST_F(FrameErrorTest, SerializeRejectsOversizedPayload) {
  Frame frame = makeFrame(0, 66, PacketType::SET, 0x053D0236,
      std::vector<uint8_t>(MAX_PAYLOAD_SIZE + 1, 0x00));

  std::vector<uint8_t> bytes = {0x01};
  EXPECT_EQ(serializeFrame(frame, bytes), ErrorCode::VALUE_OUT_OF_RANGE);
  EXPECT_TRUE(bytes.empty());
}

TEST_F(FrameErrorTest, ErrorCodeNames) {
  EXPECT_STREQ(errorCodeName(ErrorCode::OK), "OK");
  EXPECT_STREQ(errorCodeName(ErrorCode::CHECKSUM_MISMATCH), "CHECKSUM_MISMATCH");
  EXPECT_STREQ(errorCodeName(ErrorCode::INVALID_TEXT), "INVALID_TEXT");
}
