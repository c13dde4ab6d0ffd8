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

#include "bsb/protocol/frame.hpp"
#include "bsb/protocol/crc16.hpp"

#include <utility>

namespace bsb
{
namespace protocol
{

const char * errorCodeName(ErrorCode code)
{
  switch (code) {
    case ErrorCode::OK: return "OK";
    case ErrorCode::INVALID_START_BYTE: return "INVALID_START_BYTE";
    case ErrorCode::INCOMPLETE: return "INCOMPLETE";
    case ErrorCode::INVALID_LENGTH: return "INVALID_LENGTH";
    case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
    case ErrorCode::UNKNOWN_FIELD: return "UNKNOWN_FIELD";
    case ErrorCode::PAYLOAD_TOO_SHORT: return "PAYLOAD_TOO_SHORT";
    case ErrorCode::INVALID_DATE_TIME: return "INVALID_DATE_TIME";
    case ErrorCode::INVALID_SCHEDULE: return "INVALID_SCHEDULE";
    case ErrorCode::VALUE_OUT_OF_RANGE: return "VALUE_OUT_OF_RANGE";
    case ErrorCode::TYPE_MISMATCH: return "TYPE_MISMATCH";
    case ErrorCode::INVALID_TEXT: return "INVALID_TEXT";
  }
  return "UNKNOWN_ERROR";
}

uint32_t wireFieldId(uint8_t packet_type, uint32_t field_id)
{
  if (packet_type != static_cast<uint8_t>(PacketType::SET) &&
    packet_type != static_cast<uint8_t>(PacketType::GET))
  {
    return field_id;
  }
  return (field_id & 0x0000FFFFu) |
         ((field_id >> 8) & 0x00FF0000u) |
         ((field_id << 8) & 0xFF000000u);
}

ErrorCode tryParseFrame(ByteSpan input, ParsedFrame & result)
{
  // Initialize result
  result = ParsedFrame{};
  result.rest = input;

  if (input.data == nullptr || input.size == 0) {
    result.result = ErrorCode::INCOMPLETE;
    return ErrorCode::INCOMPLETE;
  }

  // Check START_BYTE
  if (input.data[0] != START_BYTE) {
    result.result = ErrorCode::INVALID_START_BYTE;
    return ErrorCode::INVALID_START_BYTE;
  }

  // Need START_BYTE + SRC + DST + LEN to see the declared length
  if (input.size < 4) {
    result.result = ErrorCode::INCOMPLETE;
    return ErrorCode::INCOMPLETE;
  }

  const size_t frame_len = input.data[3];
  if (frame_len < MIN_FRAME_SIZE || frame_len > MAX_FRAME_SIZE) {
    result.result = ErrorCode::INVALID_LENGTH;
    return ErrorCode::INVALID_LENGTH;
  }

  // Check if we have enough data for complete frame
  if (input.size < frame_len) {
    result.result = ErrorCode::INCOMPLETE;
    return ErrorCode::INCOMPLETE;
  }

  Frame & frame = result.frame;
  frame.source_address = static_cast<uint8_t>(input.data[1] ^ SOURCE_ADDRESS_MASK);
  frame.destination_address = input.data[2];
  frame.packet_type = input.data[4];

  const uint8_t * id = &input.data[HEADER_SIZE];
  const uint32_t raw_id = (static_cast<uint32_t>(id[0]) << 24) |
    (static_cast<uint32_t>(id[1]) << 16) |
    (static_cast<uint32_t>(id[2]) << 8) |
    static_cast<uint32_t>(id[3]);
  frame.field_id = wireFieldId(frame.packet_type, raw_id);

  const size_t payload_offset = HEADER_SIZE + FIELD_ID_SIZE;
  const size_t payload_len = frame_len - MIN_FRAME_SIZE;
  frame.payload.assign(&input.data[payload_offset], &input.data[payload_offset + payload_len]);

  // CRC covers START_BYTE through the last payload byte, transmitted MSB first
  const size_t crc_offset = frame_len - CHECKSUM_SIZE;
  const uint16_t received_crc = static_cast<uint16_t>(
    (static_cast<uint16_t>(input.data[crc_offset]) << 8) |
    static_cast<uint16_t>(input.data[crc_offset + 1]));

  result.consumed = frame_len;
  result.rest = ByteSpan(input.data + frame_len, input.size - frame_len);
  result.checksum_ok = verify_crc16(input.data, crc_offset, received_crc);

  if (!result.checksum_ok) {
    result.result = ErrorCode::CHECKSUM_MISMATCH;
    return ErrorCode::CHECKSUM_MISMATCH;
  }

  result.result = ErrorCode::OK;
  return ErrorCode::OK;
}

ErrorCode serializeFrame(const Frame & frame, std::vector<uint8_t> & out)
{
  out.clear();

  const size_t frame_len = MIN_FRAME_SIZE + frame.payload.size();
  if (frame_len > MAX_FRAME_SIZE) {
    return ErrorCode::VALUE_OUT_OF_RANGE;
  }
  out.reserve(frame_len);

  out.push_back(START_BYTE);
  out.push_back(static_cast<uint8_t>(frame.source_address ^ SOURCE_ADDRESS_MASK));
  out.push_back(frame.destination_address);
  out.push_back(static_cast<uint8_t>(frame_len));
  out.push_back(frame.packet_type);

  // Field id, big-endian
  const uint32_t id = wireFieldId(frame.packet_type, frame.field_id);
  out.push_back(static_cast<uint8_t>((id >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((id >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((id >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(id & 0xFF));

  out.insert(out.end(), frame.payload.begin(), frame.payload.end());

  uint16_t crc = crc16_xmodem(out.data(), out.size());

  // CRC16 (MSB first as per protocol)
  out.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(crc & 0xFF));

  return ErrorCode::OK;
}

Frame makeFrame(
  uint8_t destination_address, uint8_t source_address, PacketType type,
  uint32_t field_id, std::vector<uint8_t> payload)
{
  Frame frame;
  frame.destination_address = destination_address;
  frame.source_address = source_address;
  frame.packet_type = static_cast<uint8_t>(type);
  frame.field_id = field_id;
  frame.payload = std::move(payload);
  return frame;
}

Frame makeGetFrame(uint8_t destination_address, uint8_t source_address, uint32_t field_id)
{
  return makeFrame(destination_address, source_address, PacketType::GET, field_id, {});
}

Frame makeSetFrame(
  uint8_t destination_address, uint8_t source_address, uint32_t field_id,
  std::vector<uint8_t> payload)
{
  return makeFrame(
    destination_address, source_address, PacketType::SET, field_id,
    std::move(payload));
}

PacketType classifyPacketType(uint8_t raw)
{
  if (raw <= static_cast<uint8_t>(PacketType::ERROR)) {
    return static_cast<PacketType>(raw);
  }
  return PacketType::UNKNOWN;
}

const char * packetTypeName(PacketType type)
{
  switch (type) {
    case PacketType::UNKNOWN_0: return "Unknown0";
    case PacketType::UNKNOWN_1: return "Unknown1";
    case PacketType::INFO: return "Info";
    case PacketType::SET: return "Set";
    case PacketType::ACK: return "Ack";
    case PacketType::NACK: return "Nack";
    case PacketType::GET: return "Get";
    case PacketType::RET: return "Ret";
    case PacketType::ERROR: return "Error";
    case PacketType::UNKNOWN: break;
  }
  return "Unknown";
}

} // namespace protocol
} // namespace bsb
