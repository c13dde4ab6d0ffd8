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
#include <string>
#include <variant>
#include <vector>

#include "bsb/protocol/error_code.hpp"
#include "bsb/registry/field_registry.hpp"

namespace bsb
{
namespace protocol
{

// Fixed payload sizes per data type
static constexpr size_t INT16_PAYLOAD_SIZE = 3;      // flag, msb, lsb
static constexpr size_t DATE_TIME_PAYLOAD_SIZE = 9;
static constexpr size_t ENUM_PAYLOAD_SIZE = 2;       // flag, value
static constexpr size_t SCHEDULE_RANGE_SIZE = 4;
static constexpr size_t SCHEDULE_MAX_RANGES = 3;
static constexpr size_t SCHEDULE_PAYLOAD_SIZE = SCHEDULE_RANGE_SIZE * SCHEDULE_MAX_RANGES;

// Bit on a range's start hour that ends the schedule
static constexpr uint8_t SCHEDULE_END_MARKER = 0x80;
static constexpr uint8_t SCHEDULE_HOUR_MASK = 0x7F;

static constexpr uint16_t DATE_TIME_BASE_YEAR = 1900;

struct SettingValue
{
  uint8_t flag = 0;
  int16_t value = 0;      // meaning is field specific
};

struct NumberValue
{
  uint8_t flag = 0;
  int16_t value = 0;
};

struct FloatValue
{
  uint8_t flag = 0;
  double value = 0.0;
  uint8_t divisor = 1;
};

struct DateTimeValue
{
  uint8_t flag = 0;
  uint16_t year = 1970;
  uint8_t month = 1;
  uint8_t day = 1;
  uint8_t weekday = 4;    // Mon=1 .. Sun=7
  uint8_t hour = 0;
  uint8_t minute = 0;
  uint8_t second = 0;
  uint8_t reserved = 0;   // trailing byte, carried through unchanged
};

struct TimeRange
{
  uint8_t start_hour = 0;
  uint8_t start_minute = 0;
  uint8_t end_hour = 0;
  uint8_t end_minute = 0;
};

struct ScheduleValue
{
  std::vector<TimeRange> ranges;    // active ranges only
};

struct EnumValue
{
  uint8_t flag = 0;
  uint8_t value = 0;
};

using PayloadValue = std::variant<
  SettingValue, NumberValue, FloatValue, DateTimeValue, ScheduleValue, EnumValue>;

bool operator==(const SettingValue & a, const SettingValue & b);
bool operator==(const NumberValue & a, const NumberValue & b);
bool operator==(const FloatValue & a, const FloatValue & b);
bool operator==(const DateTimeValue & a, const DateTimeValue & b);
bool operator==(const TimeRange & a, const TimeRange & b);
bool operator==(const ScheduleValue & a, const ScheduleValue & b);
bool operator==(const EnumValue & a, const EnumValue & b);

/**
 * @brief Conversion between real values and the bus' 16-bit fixed-point integers
 */
class FixedPointScaler
{
public:
  /**
   * @brief Convert a stored integer to its real value
   * @param raw Signed 16-bit integer from the payload
   * @param divisor Scale factor from the field descriptor (0 is treated as 1)
   * @return raw / divisor
   */
  static double toReal(int16_t raw, uint8_t divisor);

  /**
   * @brief Convert a real value to the stored integer
   *
   * Rounds to the nearest integer, ties to even.
   *
   * @param value Real value
   * @param divisor Scale factor from the field descriptor (0 is treated as 1)
   * @param raw_out Receives the integer on success
   * @return false when the value is not finite or does not fit into int16
   */
  static bool toRaw(double value, uint8_t divisor, int16_t & raw_out);
};

// Decode payload bytes according to the descriptor's data type
ErrorCode decodePayload(
  const uint8_t * data, size_t len, const registry::FieldDescriptor & descriptor,
  PayloadValue & out);
ErrorCode decodePayload(
  const std::vector<uint8_t> & payload, const registry::FieldDescriptor & descriptor,
  PayloadValue & out);

// Encode a value for the descriptor's data type into out (replacing its contents)
ErrorCode encodePayload(
  const PayloadValue & value, const registry::FieldDescriptor & descriptor,
  std::vector<uint8_t> & out);

// Human readable form, e.g. "1.5", "2024-11-11T09:36:57", "6:50-7:10,18:30-18:50"
std::string formatValue(const PayloadValue & value);

// Inverse of formatValue for the descriptor's data type; flags are set to 0
ErrorCode parseValue(
  const std::string & text, const registry::FieldDescriptor & descriptor,
  PayloadValue & out);

// Zero value for the descriptor's data type
PayloadValue defaultValue(const registry::FieldDescriptor & descriptor);

// The data type a value belongs to
registry::DataType valueDataType(const PayloadValue & value);

// Schedules carry no flag: valueFlag returns false and setValueFlag is a no-op
bool valueFlag(const PayloadValue & value, uint8_t & flag);
void setValueFlag(PayloadValue & value, uint8_t flag);

// DateTime helpers
bool isValidDateTime(const DateTimeValue & dt);
uint8_t weekdayOf(uint16_t year, uint8_t month, uint8_t day);
ErrorCode makeDateTime(
  uint16_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute,
  uint8_t second, DateTimeValue & out);

} // namespace protocol
} // namespace bsb
