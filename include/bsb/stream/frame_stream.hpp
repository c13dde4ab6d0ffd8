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

// Header guard
#ifndef BSB__STREAM__FRAME_STREAM_HPP_
#define BSB__STREAM__FRAME_STREAM_HPP_

#pragma once

#include <vector>

#include <cstddef>
#include <cstdint>

#include "bsb/config/config.hpp"
#include "bsb/protocol/frame.hpp"

namespace bsb
{
namespace stream
{

/**
 * @brief Receiver of frames reassembled by a FrameStream
 */
class FrameHandler
{
public:
  virtual ~FrameHandler() = default;

  // A complete frame with a valid checksum
  virtual void onFrame(const protocol::Frame & frame) = 0;

  // A frame that was dropped; bytes holds the rejected frame (or garbage) bytes
  virtual void onError(protocol::ErrorCode error, const std::vector<uint8_t> & bytes) = 0;
};

struct StreamStats
{
  size_t frames = 0;
  size_t checksum_errors = 0;
  size_t length_errors = 0;
  size_t dropped_bytes = 0;
};

/**
 * @brief Splits a bus byte stream into frames
 *
 * Bytes may arrive in arbitrary chunks. Garbage before a start byte is
 * skipped, a partial frame waits for more data, and a corrupt frame is
 * reported and skipped so the following frame is still found.
 * Not thread-safe; use one instance per bus.
 */
class FrameStream
{
public:
  /**
   * @brief Construct a new Frame Stream
   *
   * @param handler Receives frames and errors; must outlive the stream
   * @param options Resync and logging behaviour
   */
  explicit FrameStream(FrameHandler & handler, config::StreamConfig options = {});

  /**
   * @brief Append received bytes and deliver every complete frame
   *
   * @param data Received bytes
   * @param len Number of bytes
   * @return Number of frames delivered by this call
   */
  size_t feed(const uint8_t * data, size_t len);

  // Bytes waiting for the rest of a frame
  size_t buffered() const {return buffer_.size();}

  const StreamStats & stats() const {return stats_;}

  /**
   * @brief Drop buffered bytes and clear statistics
   */
  void reset();

private:
  // Drop bytes up to the next start byte; returns the number dropped
  size_t skipToStartByte();
  void dropFront(size_t count, protocol::ErrorCode reason);

  FrameHandler & handler_;
  config::StreamConfig options_;
  std::vector<uint8_t> buffer_;
  StreamStats stats_;
};

} // namespace stream
} // namespace bsb

#endif  // BSB__STREAM__FRAME_STREAM_HPP_
