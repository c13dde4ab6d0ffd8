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

#include "bsb/stream/frame_stream.hpp"

#include <algorithm>

#include <rclcpp/rclcpp.hpp>

namespace bsb
{
namespace stream
{

using protocol::ByteSpan;
using protocol::ErrorCode;
using protocol::ParsedFrame;
using protocol::START_BYTE;

FrameStream::FrameStream(FrameHandler & handler, config::StreamConfig options)
: handler_(handler), options_(options)
{
}

size_t FrameStream::feed(const uint8_t * data, size_t len)
{
  if (data != nullptr && len > 0) {
    buffer_.insert(buffer_.end(), data, data + len);
  }

  size_t delivered = 0;
  while (!buffer_.empty()) {
    if (buffer_.front() != START_BYTE) {
      skipToStartByte();
      continue;
    }

    ParsedFrame parsed;
    ErrorCode err = protocol::tryParseFrame(ByteSpan(buffer_.data(), buffer_.size()), parsed);

    if (err == ErrorCode::INCOMPLETE) {
      break;
    }

    if (err == ErrorCode::OK) {
      ++stats_.frames;
      ++delivered;
      buffer_.erase(
        buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(parsed.consumed));
      handler_.onFrame(parsed.frame);
      continue;
    }

    if (err == ErrorCode::CHECKSUM_MISMATCH) {
      ++stats_.checksum_errors;
      std::vector<uint8_t> rejected(
        buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(parsed.consumed));
      RCLCPP_WARN(
        rclcpp::get_logger("BsbFrameStream"),
        "Checksum mismatch on %zu byte frame for field 0x%08X", rejected.size(),
        static_cast<unsigned>(parsed.frame.field_id));
      // With resync only the start byte is dropped, a real frame may start inside
      dropFront(options_.resync_on_error ? 1 : parsed.consumed, err);
      handler_.onError(err, rejected);
      continue;
    }

    // INVALID_LENGTH: the length byte cannot be trusted, rescan after the start byte
    ++stats_.length_errors;
    std::vector<uint8_t> rejected(buffer_.begin(), buffer_.begin() + 4);
    RCLCPP_WARN(
      rclcpp::get_logger("BsbFrameStream"), "Invalid frame length %u, resyncing",
      static_cast<unsigned>(buffer_[3]));
    dropFront(1, err);
    handler_.onError(err, rejected);
  }

  return delivered;
}

void FrameStream::reset()
{
  buffer_.clear();
  stats_ = StreamStats{};
}

size_t FrameStream::skipToStartByte()
{
  auto it = std::find(buffer_.begin(), buffer_.end(), START_BYTE);
  const size_t count = static_cast<size_t>(it - buffer_.begin());
  if (count > 0) {
    dropFront(count, ErrorCode::INVALID_START_BYTE);
  }
  return count;
}

void FrameStream::dropFront(size_t count, ErrorCode reason)
{
  count = std::min(count, buffer_.size());
  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  stats_.dropped_bytes += count;

  if (options_.log_dropped_bytes) {
    RCLCPP_DEBUG(
      rclcpp::get_logger("BsbFrameStream"), "Dropped %zu byte(s): %s", count,
      protocol::errorCodeName(reason));
  }
}

} // namespace stream
} // namespace bsb
