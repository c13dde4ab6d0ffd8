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

#include "bsb/registry/field_registry.hpp"
#include "bsb/registry/field_table.hpp"

#include <utility>

namespace bsb
{
namespace registry
{

FieldRegistry::FieldRegistry(std::vector<FieldDescriptor> descriptors)
{
  descriptors_.reserve(descriptors.size());
  for (auto & d : descriptors) {
    auto it = by_id_.find(d.id);
    if (it != by_id_.end()) {
      descriptors_[it->second] = std::move(d);
      continue;
    }
    by_id_.emplace(d.id, descriptors_.size());
    descriptors_.push_back(std::move(d));
  }
}

const FieldDescriptor * FieldRegistry::lookup(uint32_t field_id) const
{
  auto it = by_id_.find(field_id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &descriptors_[it->second];
}

const FieldDescriptor * FieldRegistry::findByName(const std::string & name) const
{
  for (const auto & d : descriptors_) {
    if (d.name == name) {
      return &d;
    }
  }
  return nullptr;
}

const FieldRegistry & FieldRegistry::builtin()
{
  static const FieldRegistry registry(builtin_field_table());
  return registry;
}

bool parseDataType(const std::string & name, DataType & out)
{
  if (name == "Setting") {out = DataType::SETTING; return true;}
  if (name == "Number") {out = DataType::NUMBER; return true;}
  if (name == "Float") {out = DataType::FLOAT; return true;}
  if (name == "DateTime") {out = DataType::DATE_TIME; return true;}
  if (name == "Schedule") {out = DataType::SCHEDULE; return true;}
  if (name == "Enum") {out = DataType::ENUM; return true;}
  return false;
}

const char * dataTypeName(DataType type)
{
  switch (type) {
    case DataType::SETTING: return "Setting";
    case DataType::NUMBER: return "Number";
    case DataType::FLOAT: return "Float";
    case DataType::DATE_TIME: return "DateTime";
    case DataType::SCHEDULE: return "Schedule";
    case DataType::ENUM: return "Enum";
  }
  return "Unknown";
}

} // namespace registry
} // namespace bsb
