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

#include "bsb/config/config.hpp"
#include "bsb/registry/field_table.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace bsb
{
namespace config
{

static inline std::string trim(const std::string & s)
{
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {++i;}
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {--j;}
  return s.substr(i, j - i);
}

static inline std::string strip_inline_comment(const std::string & s)
{
  auto pos = s.find('#');
  return pos == std::string::npos ? s : s.substr(0, pos);
}

static inline bool ieq(const std::string & a, const std::string & b)
{
  if (a.size() != b.size()) {return false;}
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {return false;}
  }
  return true;
}

void Config::validate() const
{
  if (own_address < 0 || own_address > 127) {
    throw std::runtime_error("own_address out of range");
  }
  if (destination_address < 0 || destination_address > 127) {
    throw std::runtime_error("destination_address out of range");
  }

  // Field ids and names must be unique, names usable in "name: value" text
  std::set<uint32_t> uniq_ids;
  std::set<std::string> uniq_names;
  for (const auto & f : fields) {
    if (f.name.empty()) {throw std::runtime_error("field name missing");}
    if (f.name.find(':') != std::string::npos) {
      throw std::runtime_error("field name must not contain ':' : " + f.name);
    }
    if (!uniq_ids.insert(f.id).second) {throw std::runtime_error("duplicate field id");}
    if (!uniq_names.insert(f.name).second) {
      throw std::runtime_error("duplicate field name: " + f.name);
    }
    if (f.data_type == registry::DataType::FLOAT && f.divisor == 0) {
      throw std::runtime_error("Float field needs a divisor >0: " + f.name);
    }
  }
}

// Very small YAML-ish line parser helpers
static inline bool parse_kv_scalar(const std::string & line, std::string & key, std::string & value)
{
  auto s = strip_inline_comment(line);
  auto pos = s.find(':');
  if (pos == std::string::npos) {return false;}
  key = trim(s.substr(0, pos));
  value = trim(s.substr(pos + 1));
  return !key.empty();
}

// Decimal unless 0x-prefixed, so leading zeros are not octal
static inline int number_base(const std::string & v)
{
  size_t i = (!v.empty() && (v[0] == '-' || v[0] == '+')) ? 1 : 0;
  if (v.size() > i + 1 && v[i] == '0' && (v[i + 1] == 'x' || v[i + 1] == 'X')) {return 16;}
  return 10;
}

static inline long to_long(const std::string & v, long min, long max)
{
  size_t used = 0;
  long n = 0;
  try {
    n = std::stol(v, &used, number_base(v));
  } catch (const std::exception &) {
    throw std::runtime_error("invalid integer for: " + v);
  }
  if (used != v.size()) {throw std::runtime_error("invalid integer for: " + v);}
  if (n < min || n > max) {throw std::runtime_error("integer out of range: " + v);}
  return n;
}
static inline int to_int(const std::string & v)
{
  return static_cast<int>(to_long(v, -2147483647L, 2147483647L));
}
static inline uint32_t to_field_id(const std::string & v)
{
  size_t used = 0;
  unsigned long long n = 0;
  try {
    n = std::stoull(v, &used, number_base(v));
  } catch (const std::exception &) {
    throw std::runtime_error("invalid field id: " + v);
  }
  if (used != v.size() || n > 0xFFFFFFFFull) {throw std::runtime_error("invalid field id: " + v);}
  return static_cast<uint32_t>(n);
}
static inline bool to_bool(const std::string & v)
{
  if (ieq(v, "true") || v == "1") {return true;}
  if (ieq(v, "false") || v == "0") {return false;}
  throw std::runtime_error("invalid bool for: " + v);
}
static inline std::string unquote(std::string v)
{
  if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
    if (v.size() >= 2 && v.back() == v.front()) {v = v.substr(1, v.size() - 2);}
  }
  return v;
}

static void parse_inline_map(
  const std::string & expr, std::vector<std::pair<std::string,
  std::string>> & out)
{
  // expect format: { a: 1, b: x }
  auto s = trim(expr);
  if (s.empty() || s.front() != '{' || s.back() != '}') {
    throw std::runtime_error("expected inline map: " + expr);
  }
  s = s.substr(1, s.size() - 2);
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    std::string k, v;
    if (parse_kv_scalar(item, k, v)) {
      out.emplace_back(trim(k), trim(v));
    }
  }
}

static registry::FieldDescriptor parse_field(const std::string & expr)
{
  std::vector<std::pair<std::string, std::string>> kv;
  parse_inline_map(expr, kv);

  registry::FieldDescriptor field;
  bool have_id = false;
  bool have_type = false;
  for (auto & p : kv) {
    const std::string value = unquote(p.second);
    if (p.first == "id") {
      field.id = to_field_id(value);
      have_id = true;
    } else if (p.first == "name") {
      field.name = value;
    } else if (p.first == "prognr") {
      field.prognr = static_cast<uint16_t>(to_long(value, 0, 65535));
    } else if (p.first == "type") {
      if (!registry::parseDataType(value, field.data_type)) {
        throw std::runtime_error("unknown data type: " + value);
      }
      have_type = true;
    } else if (p.first == "divisor") {
      field.divisor = static_cast<uint8_t>(to_long(value, 0, 255));
    } else if (p.first == "path") {
      field.path = value;
    } else {
      throw std::runtime_error("unknown field key: " + p.first);
    }
  }
  if (!have_id) {throw std::runtime_error("field id missing");}
  if (!have_type) {throw std::runtime_error("field type missing for: " + field.name);}
  return field;
}

static bool apply_root_key(Config & cfg, const std::string & key, const std::string & value)
{
  if (key == "own_address") {
    cfg.own_address = to_int(value);
  } else if (key == "destination_address") {
    cfg.destination_address = to_int(value);
  } else if (key == "resync_on_error") {
    cfg.stream.resync_on_error = to_bool(value);
  } else if (key == "log_dropped_bytes") {
    cfg.stream.log_dropped_bytes = to_bool(value);
  } else {
    return false;
  }
  return true;
}

Config parse_from_yaml_string(const std::string & yaml)
{
  Config cfg;

  enum class Sect { NONE, ROOT, STREAM, FIELDS };
  Sect sect = Sect::NONE;

  std::stringstream in(yaml);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    // A field row may contain '#' only inside a comment
    if (line.empty() || line.front() == '#') {continue;}

    // Section headers
    if (line == "bsb:") {sect = Sect::ROOT; continue;}
    if (line == "stream:") {sect = Sect::STREAM; continue;}
    if (line == "fields:") {sect = Sect::FIELDS; continue;}

    if (sect == Sect::FIELDS && line.front() == '-') {
      cfg.fields.push_back(parse_field(strip_inline_comment(line.substr(1))));
      continue;
    }

    // Our simple parser ignores indent, so stream keys are accepted in any section
    std::string key, value;
    if (!parse_kv_scalar(line, key, value)) {continue;}
    value = unquote(value);

    // Unknown keys are ignored
    if (sect != Sect::NONE) {
      (void)apply_root_key(cfg, key, value);
    }
  }

  // Validate at end
  cfg.validate();
  return cfg;
}

Config parse_from_yaml_file(const std::string & path)
{
  std::ifstream in(path);
  if (!in) {throw std::runtime_error("failed to open YAML: " + path);}
  std::stringstream ss; ss << in.rdbuf();
  return parse_from_yaml_string(ss.str());
}

registry::FieldRegistry make_registry(const Config & cfg)
{
  auto table = registry::builtin_field_table();
  for (const auto & f : cfg.fields) {
    auto clash = std::find_if(table.begin(), table.end(),
        [&f](const registry::FieldDescriptor & b) {return b.name == f.name && b.id != f.id;});
    if (clash != table.end()) {
      throw std::runtime_error("field name already used by builtin field: " + f.name);
    }
  }
  table.insert(table.end(), cfg.fields.begin(), cfg.fields.end());
  return registry::FieldRegistry(std::move(table));
}

} // namespace config
} // namespace bsb
