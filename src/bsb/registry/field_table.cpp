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

#include "bsb/registry/field_table.hpp"

namespace bsb
{
namespace registry
{

namespace
{

FieldDescriptor row(
  uint32_t id, const char * name, uint16_t prognr, DataType type, uint8_t divisor,
  const char * path)
{
  FieldDescriptor d;
  d.id = id;
  d.name = name;
  d.prognr = prognr;
  d.data_type = type;
  d.divisor = divisor;
  d.path = path;
  return d;
}

}  // namespace

std::vector<FieldDescriptor> builtin_field_table()
{
  return {
    row(0x053D0006, "date_time", 0, DataType::DATE_TIME, 1, "system/date_time"),
    row(
      0x053D0A6B, "hc1_schedule_monday", 500, DataType::SCHEDULE, 1,
      "heating_circuit_1/schedule/monday"),
    row(
      0x053D0236, "hc1_operating_mode", 700, DataType::ENUM, 1,
      "heating_circuit_1/operating_mode"),
    row(
      0x213D0A88, "hc1_heating_curve_slope", 720, DataType::FLOAT, 50,
      "heating_circuit_1/heating_curve_slope"),
    row(0x253D0722, "dhw_release", 1620, DataType::SETTING, 1, "warmwater/release"),
    row(0x053D0064, "error_code", 6705, DataType::NUMBER, 1, "system/error_code"),
    row(0x0D3D092A, "burner_state", 8310, DataType::ENUM, 1, "boiler/burner_state"),
    row(0x053D19F0, "water_pressure", 8327, DataType::FLOAT, 10, "system/water_pressure"),
    row(0x053D0A2E, "burner_starts", 8330, DataType::NUMBER, 1, "boiler/burner_starts"),
    row(
      0x313D052F, "warmwater_temperature", 8701, DataType::FLOAT, 64,
      "temperature/warmwater"),
    row(0x053D0521, "outside_temperature", 8700, DataType::FLOAT, 64, "temperature/outside"),
  };
}

} // namespace registry
} // namespace bsb
