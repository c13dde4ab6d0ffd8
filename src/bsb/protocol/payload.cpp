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

#include "bsb/protocol/payload.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace bsb
{
namespace protocol
{

using registry::DataType;
using registry::FieldDescriptor;

namespace
{

int16_t read_be_int16(const uint8_t * p)
{
  const uint16_t raw = static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
  return static_cast<int16_t>(raw);
}

void write_be_int16(int16_t value, std::vector<uint8_t> & out)
{
  const uint16_t raw = static_cast<uint16_t>(value);
  out.push_back(static_cast<uint8_t>((raw >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(raw & 0xFF));
}

bool is_leap_year(unsigned year)
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(unsigned year, unsigned month)
{
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {return 29;}
  return kDays[month - 1];
}

bool is_valid_range(const TimeRange & r)
{
  return r.start_hour <= 24 && r.end_hour <= 24 && r.start_minute <= 59 && r.end_minute <= 59;
}

std::string trim(const std::string & s)
{
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {++i;}
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {--j;}
  return s.substr(i, j - i);
}

// Digits only, no sign or whitespace
bool parse_unsigned(const std::string & s, unsigned long max, unsigned long & out)
{
  if (s.empty() || s.size() > 10) {return false;}
  unsigned long v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') {return false;}
    v = v * 10 + static_cast<unsigned long>(c - '0');
  }
  if (v > max) {return false;}
  out = v;
  return true;
}

bool parse_int16(const std::string & s, int16_t & out, ErrorCode & err)
{
  if (s.empty()) {err = ErrorCode::INVALID_TEXT; return false;}
  errno = 0;
  char * end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') {err = ErrorCode::INVALID_TEXT; return false;}
  if (errno == ERANGE || v < std::numeric_limits<int16_t>::min() ||
    v > std::numeric_limits<int16_t>::max())
  {
    err = ErrorCode::VALUE_OUT_OF_RANGE;
    return false;
  }
  out = static_cast<int16_t>(v);
  return true;
}

// "H:MM" -> hour, minute
bool parse_clock(const std::string & s, uint8_t & hour, uint8_t & minute)
{
  auto colon = s.find(':');
  if (colon == std::string::npos) {return false;}
  unsigned long h = 0, m = 0;
  if (!parse_unsigned(s.substr(0, colon), 255, h)) {return false;}
  if (!parse_unsigned(s.substr(colon + 1), 255, m)) {return false;}
  hour = static_cast<uint8_t>(h);
  minute = static_cast<uint8_t>(m);
  return true;
}

struct FormatVisitor
{
  std::string operator()(const SettingValue & v) const {return std::to_string(v.value);}
  std::string operator()(const NumberValue & v) const {return std::to_string(v.value);}
  std::string operator()(const EnumValue & v) const {return std::to_string(v.value);}

  std::string operator()(const FloatValue & v) const
  {
    std::ostringstream ss;
    ss << std::setprecision(10) << v.value;
    return ss.str();
  }

  std::string operator()(const DateTimeValue & v) const
  {
    char buf[32];
    std::snprintf(
      buf, sizeof(buf), "%04u-%02u-%02uT%02u:%02u:%02u",
      static_cast<unsigned>(v.year), static_cast<unsigned>(v.month),
      static_cast<unsigned>(v.day), static_cast<unsigned>(v.hour),
      static_cast<unsigned>(v.minute), static_cast<unsigned>(v.second));
    return buf;
  }

  std::string operator()(const ScheduleValue & v) const
  {
    std::string result;
    for (const auto & r : v.ranges) {
      char buf[24];
      std::snprintf(
        buf, sizeof(buf), "%u:%02u-%u:%02u",
        static_cast<unsigned>(r.start_hour), static_cast<unsigned>(r.start_minute),
        static_cast<unsigned>(r.end_hour), static_cast<unsigned>(r.end_minute));
      if (!result.empty()) {result += ',';}
      result += buf;
    }
    return result;
  }
};

}  // namespace

bool operator==(const SettingValue & a, const SettingValue & b)
{
  return a.flag == b.flag && a.value == b.value;
}

bool operator==(const NumberValue & a, const NumberValue & b)
{
  return a.flag == b.flag && a.value == b.value;
}

bool operator==(const FloatValue & a, const FloatValue & b)
{
  return a.flag == b.flag && a.value == b.value && a.divisor == b.divisor;
}

bool operator==(const DateTimeValue & a, const DateTimeValue & b)
{
  return a.flag == b.flag && a.year == b.year && a.month == b.month && a.day == b.day &&
         a.weekday == b.weekday && a.hour == b.hour && a.minute == b.minute &&
         a.second == b.second && a.reserved == b.reserved;
}

bool operator==(const TimeRange & a, const TimeRange & b)
{
  return a.start_hour == b.start_hour && a.start_minute == b.start_minute &&
         a.end_hour == b.end_hour && a.end_minute == b.end_minute;
}

bool operator==(const ScheduleValue & a, const ScheduleValue & b)
{
  return a.ranges == b.ranges;
}

bool operator==(const EnumValue & a, const EnumValue & b)
{
  return a.flag == b.flag && a.value == b.value;
}

double FixedPointScaler::toReal(int16_t raw, uint8_t divisor)
{
  const double d = divisor == 0 ? 1.0 : static_cast<double>(divisor);
  return static_cast<double>(raw) / d;
}

bool FixedPointScaler::toRaw(double value, uint8_t divisor, int16_t & raw_out)
{
  const double d = divisor == 0 ? 1.0 : static_cast<double>(divisor);
  const double scaled = value * d;
  if (!std::isfinite(scaled)) {
    return false;
  }

  // Default rounding mode is round-to-nearest, ties to even
  const double rounded = std::nearbyint(scaled);
  if (rounded < std::numeric_limits<int16_t>::min() ||
    rounded > std::numeric_limits<int16_t>::max())
  {
    return false;
  }

  raw_out = static_cast<int16_t>(rounded);
  return true;
}

bool isValidDateTime(const DateTimeValue & dt)
{
  if (dt.month < 1 || dt.month > 12) {return false;}
  if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) {return false;}
  return dt.hour <= 23 && dt.minute <= 59 && dt.second <= 59;
}

uint8_t weekdayOf(uint16_t year, uint8_t month, uint8_t day)
{
  // Sakamoto's method, 0 = Sunday
  static const int kOffsets[12] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  int y = year;
  if (month < 3) {y -= 1;}
  const int dow = (y + y / 4 - y / 100 + y / 400 + kOffsets[month - 1] + day) % 7;
  return static_cast<uint8_t>(dow == 0 ? 7 : dow);
}

ErrorCode makeDateTime(
  uint16_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute,
  uint8_t second, DateTimeValue & out)
{
  DateTimeValue dt;
  dt.year = year;
  dt.month = month;
  dt.day = day;
  dt.hour = hour;
  dt.minute = minute;
  dt.second = second;
  if (!isValidDateTime(dt)) {
    return ErrorCode::INVALID_DATE_TIME;
  }
  dt.weekday = weekdayOf(year, month, day);
  out = dt;
  return ErrorCode::OK;
}

ErrorCode decodePayload(
  const uint8_t * data, size_t len, const FieldDescriptor & descriptor,
  PayloadValue & out)
{
  if (data == nullptr) {
    len = 0;
  }

  switch (descriptor.data_type) {
    case DataType::SETTING:
    case DataType::NUMBER:
    case DataType::FLOAT: {
        if (len < INT16_PAYLOAD_SIZE) {
          return ErrorCode::PAYLOAD_TOO_SHORT;
        }
        const uint8_t flag = data[0];
        const int16_t raw = read_be_int16(&data[1]);
        if (descriptor.data_type == DataType::SETTING) {
          out = SettingValue{flag, raw};
        } else if (descriptor.data_type == DataType::NUMBER) {
          out = NumberValue{flag, raw};
        } else {
          out = FloatValue{flag, FixedPointScaler::toReal(raw, descriptor.divisor),
            descriptor.divisor};
        }
        return ErrorCode::OK;
      }

    case DataType::DATE_TIME: {
        if (len < DATE_TIME_PAYLOAD_SIZE) {
          return ErrorCode::PAYLOAD_TOO_SHORT;
        }
        DateTimeValue dt;
        dt.flag = data[0];
        dt.year = static_cast<uint16_t>(DATE_TIME_BASE_YEAR + data[1]);
        dt.month = data[2];
        dt.day = data[3];
        dt.weekday = data[4];
        dt.hour = data[5];
        dt.minute = data[6];
        dt.second = data[7];
        dt.reserved = data[8];
        if (!isValidDateTime(dt)) {
          return ErrorCode::INVALID_DATE_TIME;
        }
        out = dt;
        return ErrorCode::OK;
      }

    case DataType::SCHEDULE: {
        if (len < SCHEDULE_RANGE_SIZE) {
          return ErrorCode::PAYLOAD_TOO_SHORT;
        }
        // Ranges come in whole 4 byte chunks
        if (len % SCHEDULE_RANGE_SIZE != 0) {
          return ErrorCode::INVALID_SCHEDULE;
        }
        ScheduleValue schedule;
        const size_t chunks = std::min(len / SCHEDULE_RANGE_SIZE, SCHEDULE_MAX_RANGES);
        for (size_t i = 0; i < chunks; ++i) {
          const uint8_t * chunk = &data[i * SCHEDULE_RANGE_SIZE];
          // The first marked range ends the schedule; it and later ranges are inactive
          if (chunk[0] & SCHEDULE_END_MARKER) {
            break;
          }
          TimeRange r;
          r.start_hour = static_cast<uint8_t>(chunk[0] & SCHEDULE_HOUR_MASK);
          r.start_minute = chunk[1];
          r.end_hour = static_cast<uint8_t>(chunk[2] & SCHEDULE_HOUR_MASK);
          r.end_minute = chunk[3];
          if (!is_valid_range(r)) {
            return ErrorCode::INVALID_SCHEDULE;
          }
          schedule.ranges.push_back(r);
        }
        out = std::move(schedule);
        return ErrorCode::OK;
      }

    case DataType::ENUM: {
        if (len < ENUM_PAYLOAD_SIZE) {
          return ErrorCode::PAYLOAD_TOO_SHORT;
        }
        out = EnumValue{data[0], data[1]};
        return ErrorCode::OK;
      }
  }
  return ErrorCode::TYPE_MISMATCH;
}

ErrorCode decodePayload(
  const std::vector<uint8_t> & payload, const FieldDescriptor & descriptor,
  PayloadValue & out)
{
  return decodePayload(payload.data(), payload.size(), descriptor, out);
}

ErrorCode encodePayload(
  const PayloadValue & value, const FieldDescriptor & descriptor,
  std::vector<uint8_t> & out)
{
  out.clear();
  if (valueDataType(value) != descriptor.data_type) {
    return ErrorCode::TYPE_MISMATCH;
  }

  switch (descriptor.data_type) {
    case DataType::SETTING: {
        const auto & v = std::get<SettingValue>(value);
        out.push_back(v.flag);
        write_be_int16(v.value, out);
        return ErrorCode::OK;
      }

    case DataType::NUMBER: {
        const auto & v = std::get<NumberValue>(value);
        out.push_back(v.flag);
        write_be_int16(v.value, out);
        return ErrorCode::OK;
      }

    case DataType::FLOAT: {
        const auto & v = std::get<FloatValue>(value);
        int16_t raw = 0;
        if (!FixedPointScaler::toRaw(v.value, descriptor.divisor, raw)) {
          return ErrorCode::VALUE_OUT_OF_RANGE;
        }
        out.push_back(v.flag);
        write_be_int16(raw, out);
        return ErrorCode::OK;
      }

    case DataType::DATE_TIME: {
        const auto & v = std::get<DateTimeValue>(value);
        if (!isValidDateTime(v)) {
          return ErrorCode::INVALID_DATE_TIME;
        }
        if (v.year < DATE_TIME_BASE_YEAR || v.year > DATE_TIME_BASE_YEAR + 255) {
          return ErrorCode::VALUE_OUT_OF_RANGE;
        }
        out = {
          v.flag,
          static_cast<uint8_t>(v.year - DATE_TIME_BASE_YEAR),
          v.month,
          v.day,
          v.weekday,
          v.hour,
          v.minute,
          v.second,
          v.reserved
        };
        return ErrorCode::OK;
      }

    case DataType::SCHEDULE: {
        const auto & v = std::get<ScheduleValue>(value);
        if (v.ranges.size() > SCHEDULE_MAX_RANGES) {
          return ErrorCode::VALUE_OUT_OF_RANGE;
        }
        for (const auto & r : v.ranges) {
          if (!is_valid_range(r)) {
            return ErrorCode::INVALID_SCHEDULE;
          }
          out.insert(out.end(), {r.start_hour, r.start_minute, r.end_hour, r.end_minute});
        }
        // Terminate a short schedule, then zero fill to the full size
        if (v.ranges.size() < SCHEDULE_MAX_RANGES) {
          out.insert(out.end(), {static_cast<uint8_t>(24 | SCHEDULE_END_MARKER), 0, 24, 0});
        }
        out.resize(SCHEDULE_PAYLOAD_SIZE, 0);
        return ErrorCode::OK;
      }

    case DataType::ENUM: {
        const auto & v = std::get<EnumValue>(value);
        out = {v.flag, v.value};
        return ErrorCode::OK;
      }
  }
  return ErrorCode::TYPE_MISMATCH;
}

std::string formatValue(const PayloadValue & value)
{
  return std::visit(FormatVisitor{}, value);
}

ErrorCode parseValue(
  const std::string & text, const FieldDescriptor & descriptor,
  PayloadValue & out)
{
  const std::string s = trim(text);
  ErrorCode err = ErrorCode::OK;

  switch (descriptor.data_type) {
    case DataType::SETTING:
    case DataType::NUMBER: {
        int16_t v = 0;
        if (!parse_int16(s, v, err)) {return err;}
        if (descriptor.data_type == DataType::SETTING) {
          out = SettingValue{0, v};
        } else {
          out = NumberValue{0, v};
        }
        return ErrorCode::OK;
      }

    case DataType::FLOAT: {
        if (s.empty()) {return ErrorCode::INVALID_TEXT;}
        char * end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
          return ErrorCode::INVALID_TEXT;
        }
        out = FloatValue{0, v, descriptor.divisor};
        return ErrorCode::OK;
      }

    case DataType::DATE_TIME: {
        // YYYY-MM-DDTHH:MM:SS
        if (s.size() != 19 || s[4] != '-' || s[7] != '-' || s[10] != 'T' ||
          s[13] != ':' || s[16] != ':')
        {
          return ErrorCode::INVALID_TEXT;
        }
        unsigned long y = 0, mo = 0, d = 0, h = 0, mi = 0, se = 0;
        if (!parse_unsigned(s.substr(0, 4), 9999, y) ||
          !parse_unsigned(s.substr(5, 2), 99, mo) ||
          !parse_unsigned(s.substr(8, 2), 99, d) ||
          !parse_unsigned(s.substr(11, 2), 99, h) ||
          !parse_unsigned(s.substr(14, 2), 99, mi) ||
          !parse_unsigned(s.substr(17, 2), 99, se))
        {
          return ErrorCode::INVALID_TEXT;
        }
        DateTimeValue dt;
        err = makeDateTime(
          static_cast<uint16_t>(y), static_cast<uint8_t>(mo), static_cast<uint8_t>(d),
          static_cast<uint8_t>(h), static_cast<uint8_t>(mi), static_cast<uint8_t>(se), dt);
        if (err != ErrorCode::OK) {return err;}
        out = dt;
        return ErrorCode::OK;
      }

    case DataType::SCHEDULE: {
        // "<range>,<range>,<range>", each "H:MM-H:MM"
        ScheduleValue schedule;
        if (!s.empty()) {
          std::stringstream ss(s);
          std::string item;
          while (std::getline(ss, item, ',')) {
            item = trim(item);
            auto dash = item.find('-');
            if (dash == std::string::npos) {return ErrorCode::INVALID_TEXT;}
            TimeRange r;
            if (!parse_clock(trim(item.substr(0, dash)), r.start_hour, r.start_minute) ||
              !parse_clock(trim(item.substr(dash + 1)), r.end_hour, r.end_minute))
            {
              return ErrorCode::INVALID_TEXT;
            }
            if (!is_valid_range(r)) {return ErrorCode::INVALID_SCHEDULE;}
            schedule.ranges.push_back(r);
          }
        }
        if (schedule.ranges.size() > SCHEDULE_MAX_RANGES) {
          return ErrorCode::VALUE_OUT_OF_RANGE;
        }
        out = std::move(schedule);
        return ErrorCode::OK;
      }

    case DataType::ENUM: {
        unsigned long v = 0;
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
          return ErrorCode::INVALID_TEXT;
        }
        if (!parse_unsigned(s, 255, v)) {return ErrorCode::VALUE_OUT_OF_RANGE;}
        out = EnumValue{0, static_cast<uint8_t>(v)};
        return ErrorCode::OK;
      }
  }
  return ErrorCode::TYPE_MISMATCH;
}

PayloadValue defaultValue(const FieldDescriptor & descriptor)
{
  switch (descriptor.data_type) {
    case DataType::SETTING: return SettingValue{};
    case DataType::NUMBER: return NumberValue{};
    case DataType::FLOAT: return FloatValue{0, 0.0, descriptor.divisor};
    case DataType::DATE_TIME: return DateTimeValue{};
    case DataType::SCHEDULE: return ScheduleValue{{TimeRange{}}};
    case DataType::ENUM: return EnumValue{};
  }
  return NumberValue{};
}

DataType valueDataType(const PayloadValue & value)
{
  if (std::holds_alternative<SettingValue>(value)) {return DataType::SETTING;}
  if (std::holds_alternative<NumberValue>(value)) {return DataType::NUMBER;}
  if (std::holds_alternative<FloatValue>(value)) {return DataType::FLOAT;}
  if (std::holds_alternative<DateTimeValue>(value)) {return DataType::DATE_TIME;}
  if (std::holds_alternative<ScheduleValue>(value)) {return DataType::SCHEDULE;}
  return DataType::ENUM;
}

bool valueFlag(const PayloadValue & value, uint8_t & flag)
{
  if (auto * v = std::get_if<SettingValue>(&value)) {flag = v->flag; return true;}
  if (auto * v = std::get_if<NumberValue>(&value)) {flag = v->flag; return true;}
  if (auto * v = std::get_if<FloatValue>(&value)) {flag = v->flag; return true;}
  if (auto * v = std::get_if<DateTimeValue>(&value)) {flag = v->flag; return true;}
  if (auto * v = std::get_if<EnumValue>(&value)) {flag = v->flag; return true;}
  return false;
}

void setValueFlag(PayloadValue & value, uint8_t flag)
{
  if (auto * v = std::get_if<SettingValue>(&value)) {v->flag = flag;}
  if (auto * v = std::get_if<NumberValue>(&value)) {v->flag = flag;}
  if (auto * v = std::get_if<FloatValue>(&value)) {v->flag = flag;}
  if (auto * v = std::get_if<DateTimeValue>(&value)) {v->flag = flag;}
  if (auto * v = std::get_if<EnumValue>(&value)) {v->flag = flag;}
}

} // namespace protocol
} // namespace bsb
