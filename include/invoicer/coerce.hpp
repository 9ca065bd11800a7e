#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "invoicer/decimal.hpp"

namespace invoicer {

// Field coercion from loosely-typed JSON values.
// Every function returns false on failure and only writes `out` on success.
// `raw_number` is the source token of a floating-point value when the reader
// kept it (see json_reader.hpp); floats are read from that text, never from
// the double.

// Strict integer text: optional surrounding whitespace and sign, digits only.
bool parse_int32_text(const std::string& s, std::int32_t& out);

// Attempts, in order: JSON integer in range; JSON float token that is
// integral and in range; string as integer text; string as decimal text
// that is integral and in range. Anything else fails.
bool coerce_int32(const nlohmann::json& value,
                  std::int32_t& out,
                  const std::string* raw_number = nullptr);

// Attempts, in order: JSON integer; JSON float token; string as decimal
// text. Anything else fails.
bool coerce_decimal(const nlohmann::json& value,
                    Decimal& out,
                    const std::string* raw_number = nullptr);

// Strings verbatim, floats as their token, other non-null values as compact
// JSON. Null fails.
bool coerce_text(const nlohmann::json& value,
                 std::string& out,
                 const std::string* raw_number = nullptr);

} // namespace invoicer
