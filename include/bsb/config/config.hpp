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
#ifndef BSB__CONFIG__CONFIG_HPP_
#define BSB__CONFIG__CONFIG_HPP_

#pragma once  // Optional, redundant with guard but retained for faster builds

#include <string>
#include <vector>

#include <cstdint>
#include <stdexcept>

#include "bsb/registry/field_registry.hpp"

namespace bsb
{
namespace config
{

struct StreamConfig
{
  bool resync_on_error = true;      // drop a bad start byte and rescan
  bool log_dropped_bytes = true;
};

struct Config
{
  // Bus addressing
  int own_address = 0x42;           // 0..127
  int destination_address = 0x00;   // 0..127, default target (boiler)

  StreamConfig stream;

  // Extra or overriding field definitions
  std::vector<registry::FieldDescriptor> fields;

  // Validate constraints; throws std::runtime_error on failure
  void validate() const;
};

// Parse a YAML string (minimal parser supporting the documented schema)
// Throws std::runtime_error on parse/validation error.
Config parse_from_yaml_string(const std::string & yaml);

// Load from a YAML file path
Config parse_from_yaml_file(const std::string & path);

// Compiled-in field table with the config's fields added or overriding.
// Throws std::runtime_error if a new id reuses a builtin field name.
registry::FieldRegistry make_registry(const Config & cfg);

}   // namespace config
} // namespace bsb

#endif  // BSB__CONFIG__CONFIG_HPP_
