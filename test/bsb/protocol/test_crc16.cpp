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
#include "bsb/protocol/crc16.hpp"
#include <string>
#include <vector>

class CRC16Test : public ::testing::Test
{
protected:
  const std::string check_input_ = "123456789";

  const uint8_t * checkData() const
  {
    return reinterpret_cast<const uint8_t *>(check_input_.c_str());
  }
};

TEST_F(CRC16Test, TestVector123456789) {
  // CRC-16/XMODEM check value
  uint16_t result = bsb::protocol::crc16_xmodem(checkData(), check_input_.length());
  EXPECT_EQ(result, 0x31C3);
}

TEST_F(CRC16Test, EmptyBuffer) {
  EXPECT_EQ(bsb::protocol::crc16_xmodem(nullptr, 0), 0x0000);

  uint8_t data = 0x42;
  EXPECT_EQ(bsb::protocol::crc16_xmodem(&data, 0), 0x0000);
}

TEST_F(CRC16Test, SingleZeroByte) {
  // Zero init and zero input stays zero
  uint8_t data = 0x00;
  EXPECT_EQ(bsb::protocol::crc16_xmodem(&data, 1), 0x0000);
}

TEST_F(CRC16Test, ClassBasedCalculation) {
  bsb::protocol::CRC16 crc;
  crc.update(checkData(), check_input_.length());
  EXPECT_EQ(crc.finalize(), 0x31C3);
}

TEST_F(CRC16Test, IncrementalUpdate) {
  bsb::protocol::CRC16 crc;
  for (char c : check_input_) {
    crc.update(static_cast<uint8_t>(c));
  }
  uint16_t incremental = crc.finalize();

  uint16_t one_shot = bsb::protocol::crc16_xmodem(checkData(), check_input_.length());
  EXPECT_EQ(incremental, one_shot);
}

TEST_F(CRC16Test, SplitUpdate) {
  bsb::protocol::CRC16 crc;
  crc.update(checkData(), 4);
  crc.update(checkData() + 4, check_input_.length() - 4);
  EXPECT_EQ(crc.finalize(), 0x31C3);
}

TEST_F(CRC16Test, Reset) {
  bsb::protocol::CRC16 crc;
  crc.update(checkData(), check_input_.length());
  crc.reset();
  EXPECT_EQ(crc.finalize(), bsb::protocol::CRC16::INIT_VALUE);

  crc.update(checkData(), check_input_.length());
  EXPECT_EQ(crc.finalize(), 0x31C3);
}

TEST_F(CRC16Test, BusFrameChecksum) {
  // Header and field id of a Get request for field 0x053D19F0
  const std::vector<uint8_t> frame = {0xDC, 0xC2, 0x00, 0x0B, 0x06, 0x3D, 0x05, 0x19, 0xF0};
  EXPECT_EQ(bsb::protocol::crc16_xmodem(frame.data(), frame.size()), 0x243E);
}

TEST_F(CRC16Test, Verify) {
  EXPECT_TRUE(bsb::protocol::verify_crc16(checkData(), check_input_.length(), 0x31C3));
  EXPECT_FALSE(bsb::protocol::verify_crc16(checkData(), check_input_.length(), 0x31C2));
}
