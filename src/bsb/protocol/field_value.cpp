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

#include "bsb/protocol/field_value.hpp"

#include <utility>
#include <vector>

namespace bsb
{
namespace protocol
{

ErrorCode decodeFieldValue(
  const Frame & frame, const registry::FieldRegistry & registry, FieldValue & out)
{
  const registry::FieldDescriptor * descriptor = registry.lookup(frame.field_id);
  if (descriptor == nullptr) {
    return ErrorCode::UNKNOWN_FIELD;
  }

  PayloadValue value;
  ErrorCode err = decodePayload(frame.payload, *descriptor, value);
  if (err != ErrorCode::OK) {
    return err;
  }

  out.field_id = frame.field_id;
  out.name = descriptor->name;
  out.value = std::move(value);
  return ErrorCode::OK;
}

ErrorCode encodeFieldValue(
  const FieldValue & value, const registry::FieldRegistry & registry,
  uint8_t destination_address, uint8_t source_address, PacketType packet_type,
  Frame & out)
{
  const registry::FieldDescriptor * descriptor = registry.lookup(value.field_id);
  if (descriptor == nullptr) {
    return ErrorCode::UNKNOWN_FIELD;
  }

  std::vector<uint8_t> payload;
  ErrorCode err = encodePayload(value.value, *descriptor, payload);
  if (err != ErrorCode::OK) {
    return err;
  }

  out = makeFrame(
    destination_address, source_address, packet_type, value.field_id,
    std::move(payload));
  return ErrorCode::OK;
}

std::string toString(const FieldValue & value)
{
  return value.name + ": " + formatValue(value.value);
}

ErrorCode parseFieldValue(
  const std::string & text, const registry::FieldRegistry & registry, FieldValue & out)
{
  auto colon = text.find(':');
  if (colon == std::string::npos) {
    return ErrorCode::INVALID_TEXT;
  }

  std::string name = text.substr(0, colon);
  while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) {name.pop_back();}
  while (!name.empty() && (name.front() == ' ' || name.front() == '\t')) {name.erase(0, 1);}

  const registry::FieldDescriptor * descriptor = registry.findByName(name);
  if (descriptor == nullptr) {
    return ErrorCode::UNKNOWN_FIELD;
  }

  // DateTime and Schedule values contain ':' themselves, so split at the first one only
  PayloadValue value;
  ErrorCode err = parseValue(text.substr(colon + 1), *descriptor, value);
  if (err != ErrorCode::OK) {
    return err;
  }

  out.field_id = descriptor->id;
  out.name = descriptor->name;
  out.value = std::move(value);
  return ErrorCode::OK;
}

FieldValue defaultFieldValue(const registry::FieldDescriptor & descriptor)
{
  FieldValue fv;
  fv.field_id = descriptor.id;
  fv.name = descriptor.name;
  fv.value = defaultValue(descriptor);
  return fv;
}

} // namespace protocol
} // namespace bsb
