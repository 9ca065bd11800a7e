#include "invoicer/coerce.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace invoicer {

static constexpr std::int64_t kInt32Min = std::numeric_limits<std::int32_t>::min();
static constexpr std::int64_t kInt32Max = std::numeric_limits<std::int32_t>::max();

static void trim_inplace(std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  s = s.substr(start, end - start);
}

static bool in_int32_range(std::int64_t v) {
  return v >= kInt32Min && v <= kInt32Max;
}

static bool decimal_to_int32(const Decimal& d, std::int32_t& out) {
  std::int64_t v = 0;
  if (!d.to_int64(v) || !in_int32_range(v)) return false;
  out = static_cast<std::int32_t>(v);
  return true;
}

// Source text of a floating-point value: the token as written when the
// reader kept it, else the DOM's own (round-trip) serialization.
static std::string float_token(const nlohmann::json& value, const std::string* raw_number) {
  return raw_number ? *raw_number : value.dump();
}

bool parse_int32_text(const std::string& s, std::int32_t& out) {
  std::string t = s;
  trim_inplace(t);
  if (t.empty()) return false;

  try {
    size_t idx = 0;
    const long long v = std::stoll(t, &idx, 10);
    if (idx != t.size() || !in_int32_range(v)) return false;
    out = static_cast<std::int32_t>(v);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

bool coerce_int32(const nlohmann::json& value, std::int32_t& out, const std::string* raw_number) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(kInt32Max)) return false;
    out = static_cast<std::int32_t>(v);
    return true;
  }

  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (!in_int32_range(v)) return false;
    out = static_cast<std::int32_t>(v);
    return true;
  }

  if (value.is_number_float()) {
    Decimal d;
    return Decimal::parse_json_number(float_token(value, raw_number), d) && decimal_to_int32(d, out);
  }

  if (value.is_string()) {
    const auto& s = value.get_ref<const std::string&>();
    if (parse_int32_text(s, out)) return true;

    Decimal d;
    return Decimal::parse(s, d) && decimal_to_int32(d, out);
  }

  return false;
}

bool coerce_decimal(const nlohmann::json& value, Decimal& out, const std::string* raw_number) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
    out = Decimal::from_int(static_cast<std::int64_t>(v));
    return true;
  }

  if (value.is_number_integer()) {
    out = Decimal::from_int(value.get<std::int64_t>());
    return true;
  }

  if (value.is_number_float()) {
    return Decimal::parse_json_number(float_token(value, raw_number), out);
  }

  if (value.is_string()) {
    return Decimal::parse(value.get_ref<const std::string&>(), out);
  }

  return false;
}

bool coerce_text(const nlohmann::json& value, std::string& out, const std::string* raw_number) {
  if (value.is_null() || value.is_discarded()) return false;

  if (value.is_string()) {
    out = value.get<std::string>();
  } else if (value.is_number_float()) {
    out = float_token(value, raw_number);
  } else {
    out = value.dump();
  }
  return true;
}

} // namespace invoicer
