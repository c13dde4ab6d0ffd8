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

#ifndef BSB__PROTOCOL__ERROR_CODE_HPP_
#define BSB__PROTOCOL__ERROR_CODE_HPP_

#pragma once

#include <cstdint>

namespace bsb
{
namespace protocol
{

// Result of every frame and payload codec operation.
// INCOMPLETE is the only code a caller may retry (with more bytes).
enum class ErrorCode : uint8_t
{
  OK = 0,
  INVALID_START_BYTE = 1,
  INCOMPLETE = 2,
  INVALID_LENGTH = 3,
  CHECKSUM_MISMATCH = 4,
  UNKNOWN_FIELD = 5,
  PAYLOAD_TOO_SHORT = 6,
  INVALID_DATE_TIME = 7,
  INVALID_SCHEDULE = 8,
  VALUE_OUT_OF_RANGE = 9,
  TYPE_MISMATCH = 10,
  INVALID_TEXT = 11
};

const char * errorCodeName(ErrorCode code);

} // namespace protocol
} // namespace bsb

#endif  // BSB__PROTOCOL__ERROR_CODE_HPP_
