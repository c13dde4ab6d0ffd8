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

// Primary include guard
#ifndef BSB__REGISTRY__FIELD_REGISTRY_HPP_
#define BSB__REGISTRY__FIELD_REGISTRY_HPP_

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace bsb
{
namespace registry
{

// Wire data type of a field's payload
enum class DataType : uint8_t
{
  SETTING,
  NUMBER,
  FLOAT,
  DATE_TIME,
  SCHEDULE,
  ENUM
};

struct FieldDescriptor
{
  uint32_t id = 0;
  std::string name;
  uint16_t prognr = 0;          // menu line on the operating unit
  DataType data_type = DataType::NUMBER;
  uint8_t divisor = 1;          // FLOAT only, e.g. pressure 10, slope 50, temperature 64
  std::string path;             // hierarchical, e.g. "system/water_pressure"
};

/**
 * @brief Immutable field_id -> FieldDescriptor mapping
 *
 * The index is built once in the constructor and never changes afterwards,
 * so a registry can be shared between threads without locking.
 */
class FieldRegistry
{
public:
  /**
   * @brief Build a registry from a list of descriptors
   *
   * @param descriptors Field rows; a later row replaces an earlier one with the same id
   */
  explicit FieldRegistry(std::vector<FieldDescriptor> descriptors);

  /**
   * @brief Find the descriptor for a field id
   *
   * @return Descriptor, or nullptr when the id is not known
   */
  const FieldDescriptor * lookup(uint32_t field_id) const;

  /**
   * @brief Find a descriptor by its display name
   *
   * @return Descriptor, or nullptr when no field has this name
   */
  const FieldDescriptor * findByName(const std::string & name) const;

  size_t size() const {return descriptors_.size();}
  const std::vector<FieldDescriptor> & descriptors() const {return descriptors_;}

  // Registry of the compiled-in field table, built on first use
  static const FieldRegistry & builtin();

private:
  std::vector<FieldDescriptor> descriptors_;
  std::unordered_map<uint32_t, size_t> by_id_;
};

// "Float" -> DataType::FLOAT; returns false for unknown names
bool parseDataType(const std::string & name, DataType & out);
const char * dataTypeName(DataType type);

}   // namespace registry
} // namespace bsb

#endif  // BSB__REGISTRY__FIELD_REGISTRY_HPP_
