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

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include "bsb/protocol/crc16.hpp"
#include "bsb/protocol/error_code.hpp"

namespace bsb
{
namespace protocol
{

// Protocol constants
static constexpr uint8_t START_BYTE = 0xDC;
static constexpr uint8_t SOURCE_ADDRESS_MASK = 0x80;   // source travels with the top bit inverted

// START_BYTE + SRC + DST + LEN + TYPE
static constexpr size_t HEADER_SIZE = 5;
static constexpr size_t FIELD_ID_SIZE = 4;
static constexpr size_t CHECKSUM_SIZE = 2;
static constexpr size_t MIN_FRAME_SIZE = HEADER_SIZE + FIELD_ID_SIZE + CHECKSUM_SIZE;   // 11
static constexpr size_t MAX_FRAME_SIZE = 69;
static constexpr size_t MAX_PAYLOAD_SIZE = MAX_FRAME_SIZE - MIN_FRAME_SIZE;

// Packet types seen on the bus
enum class PacketType : uint8_t
{
  UNKNOWN_0 = 0,
  UNKNOWN_1 = 1,
  INFO = 2,
  SET = 3,
  ACK = 4,
  NACK = 5,
  GET = 6,
  RET = 7,
  ERROR = 8,
  UNKNOWN = 0xFF      // anything outside the known range
};

struct Frame
{
  uint8_t destination_address = 0;
  uint8_t source_address = 0;
  uint8_t packet_type = 0;      // raw byte, see classifyPacketType()
  uint32_t field_id = 0;
  std::vector<uint8_t> payload;

  bool operator==(const Frame & other) const
  {
    return destination_address == other.destination_address &&
           source_address == other.source_address &&
           packet_type == other.packet_type &&
           field_id == other.field_id &&
           payload == other.payload;
  }
  bool operator!=(const Frame & other) const {return !(*this == other);}
};

// Byte span for input data
struct ByteSpan
{
  const uint8_t * data;
  size_t size;

  ByteSpan()
  : data(nullptr), size(0) {}
  ByteSpan(const uint8_t * d, size_t s)
  : data(d), size(s) {}

  bool empty() const {return size == 0;}
};

// Parsed frame information
struct ParsedFrame
{
  Frame frame;
  size_t consumed = 0;        // bytes belonging to this frame
  ByteSpan rest;              // unconsumed remainder of the input
  bool checksum_ok = false;
  ErrorCode result = ErrorCode::INCOMPLETE;
};

// Parse one frame from the start of input. On CHECKSUM_MISMATCH the frame
// fields are still filled in and checksum_ok is false.
ErrorCode tryParseFrame(ByteSpan input, ParsedFrame & result);

// Serialize a frame into out (replacing its contents)
ErrorCode serializeFrame(const Frame & frame, std::vector<uint8_t> & out);

// Construction helpers
Frame makeFrame(
  uint8_t destination_address, uint8_t source_address, PacketType type,
  uint32_t field_id, std::vector<uint8_t> payload);
Frame makeGetFrame(uint8_t destination_address, uint8_t source_address, uint32_t field_id);
Frame makeSetFrame(
  uint8_t destination_address, uint8_t source_address, uint32_t field_id,
  std::vector<uint8_t> payload);

PacketType classifyPacketType(uint8_t raw);
const char * packetTypeName(PacketType type);

// SET and GET packets carry the two high-order field id bytes swapped.
// The transformation is its own inverse.
uint32_t wireFieldId(uint8_t packet_type, uint32_t field_id);

} // namespace protocol
} // namespace bsb
