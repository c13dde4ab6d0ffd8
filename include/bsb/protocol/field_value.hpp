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
#include <string>

#include "bsb/protocol/error_code.hpp"
#include "bsb/protocol/frame.hpp"
#include "bsb/protocol/payload.hpp"
#include "bsb/registry/field_registry.hpp"

namespace bsb
{
namespace protocol
{

// A decoded datapoint: which field, its name and its typed value
struct FieldValue
{
  uint32_t field_id = 0;
  std::string name;
  PayloadValue value;

  bool operator==(const FieldValue & other) const
  {
    return field_id == other.field_id && name == other.name && value == other.value;
  }
  bool operator!=(const FieldValue & other) const {return !(*this == other);}
};

// Look up frame.field_id and decode frame.payload with the field's data type
ErrorCode decodeFieldValue(
  const Frame & frame, const registry::FieldRegistry & registry, FieldValue & out);

// Build a frame carrying the encoded value. Addressing and packet type are
// not part of a FieldValue and come from the caller.
ErrorCode encodeFieldValue(
  const FieldValue & value, const registry::FieldRegistry & registry,
  uint8_t destination_address, uint8_t source_address, PacketType packet_type,
  Frame & out);

// "<name>: <value>", e.g. "water_pressure: 1.5"
std::string toString(const FieldValue & value);

// Inverse of toString: "water_pressure: 1.5" -> FieldValue
ErrorCode parseFieldValue(
  const std::string & text, const registry::FieldRegistry & registry, FieldValue & out);

FieldValue defaultFieldValue(const registry::FieldDescriptor & descriptor);

} // namespace protocol
} // namespace bsb
