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

#include <algorithm>
#include <exception>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "bsb/config/config.hpp"
#include "bsb/protocol/field_value.hpp"
#include "bsb/stream/frame_stream.hpp"

namespace
{

// Prints every frame as "name: value"
class LoggingHandler : public bsb::stream::FrameHandler
{
public:
  explicit LoggingHandler(const bsb::registry::FieldRegistry & registry)
  : registry_(registry) {}

  void onFrame(const bsb::protocol::Frame & frame) override
  {
    bsb::protocol::FieldValue value;
    bsb::protocol::ErrorCode err = bsb::protocol::decodeFieldValue(frame, registry_, value);
    if (err != bsb::protocol::ErrorCode::OK) {
      RCLCPP_WARN(
        rclcpp::get_logger("bsb_decode_example"), "%s from %u: field 0x%08X not decoded (%s)",
        bsb::protocol::packetTypeName(bsb::protocol::classifyPacketType(frame.packet_type)),
        static_cast<unsigned>(frame.source_address), static_cast<unsigned>(frame.field_id),
        bsb::protocol::errorCodeName(err));
      return;
    }
    RCLCPP_INFO(
      rclcpp::get_logger("bsb_decode_example"), "%s from %u: %s",
      bsb::protocol::packetTypeName(bsb::protocol::classifyPacketType(frame.packet_type)),
      static_cast<unsigned>(frame.source_address), bsb::protocol::toString(value).c_str());
  }

  void onError(bsb::protocol::ErrorCode error, const std::vector<uint8_t> & bytes) override
  {
    RCLCPP_WARN(
      rclcpp::get_logger("bsb_decode_example"), "Dropped %zu bytes: %s", bytes.size(),
      bsb::protocol::errorCodeName(error));
  }

private:
  const bsb::registry::FieldRegistry & registry_;
};

}  // namespace

int main(int argc, char ** argv)
{
  using namespace bsb::protocol;

  bsb::config::Config cfg;
  try {
    if (argc > 1) {
      cfg = bsb::config::parse_from_yaml_file(argv[1]);
    }
  } catch (const std::exception & e) {
    RCLCPP_ERROR(rclcpp::get_logger("bsb_decode_example"), "Config error: %s", e.what());
    return 1;
  }
  const bsb::registry::FieldRegistry registry = bsb::config::make_registry(cfg);

  // Boiler reply with a water pressure of 1.5 bar
  const std::vector<uint8_t> captured = {
    0xDC, 0x80, 0x42, 0x0E, 0x07, 0x05, 0x3D, 0x19, 0xF0, 0x00, 0x00, 0x0F, 0x1D, 0x74
  };

  // Build the same frame from a value
  FieldValue pressure;
  if (parseFieldValue("water_pressure: 1.5", registry, pressure) != ErrorCode::OK) {
    RCLCPP_ERROR(rclcpp::get_logger("bsb_decode_example"), "water_pressure is not a known field");
    return 1;
  }
  Frame frame;
  ErrorCode err = encodeFieldValue(
    pressure, registry, static_cast<uint8_t>(cfg.own_address), 0, PacketType::RET, frame);
  std::vector<uint8_t> encoded;
  if (err == ErrorCode::OK) {
    err = serializeFrame(frame, encoded);
  }
  if (err != ErrorCode::OK) {
    RCLCPP_ERROR(
      rclcpp::get_logger("bsb_decode_example"), "Encoding failed: %s", errorCodeName(err));
    return 1;
  }
  RCLCPP_INFO(
    rclcpp::get_logger("bsb_decode_example"), "Encoded frame %s the captured bytes",
    encoded == captured ? "matches" : "differs from");

  // A Get request for the outside temperature, the captured reply, then line noise
  Frame request = makeGetFrame(
    static_cast<uint8_t>(cfg.destination_address), static_cast<uint8_t>(cfg.own_address),
    0x053D0521);
  std::vector<uint8_t> bus;
  if (serializeFrame(request, bus) != ErrorCode::OK) {
    return 1;
  }
  bus.insert(bus.end(), captured.begin(), captured.end());
  bus.insert(bus.end(), {0x00, 0xFF, 0x13});

  LoggingHandler handler(registry);
  bsb::stream::FrameStream stream(handler, cfg.stream);

  // Feed in small chunks the way a serial port delivers them
  const size_t chunk = 5;
  for (size_t offset = 0; offset < bus.size(); offset += chunk) {
    const size_t len = std::min(chunk, bus.size() - offset);
    stream.feed(bus.data() + offset, len);
  }

  const bsb::stream::StreamStats & stats = stream.stats();
  RCLCPP_INFO(
    rclcpp::get_logger("bsb_decode_example"),
    "%zu frames, %zu checksum errors, %zu dropped bytes", stats.frames,
    stats.checksum_errors, stats.dropped_bytes);

  return encoded == captured ? 0 : 1;
}
