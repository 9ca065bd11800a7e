#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

namespace invoicer {

// Exact base-10 number: coefficient * 10^-scale.
// Scale is kept as written ("10.50" stays at scale 2) and only grows through
// multiplication; equality and ordering compare values, not representations.
class Decimal {
public:
  static constexpr std::uint32_t kMaxScale = 18;

  Decimal() = default;

  static Decimal from_int(std::int64_t value);

  // Throws std::invalid_argument if scale > kMaxScale.
  static Decimal from_units(std::int64_t coefficient, std::uint32_t scale);

  // Locale-independent text: [ws][+|-]digits[,digits...][.digits][ws].
  // No exponent. Fraction digits past kMaxScale, or past what the
  // coefficient can hold, are rounded half-to-even; an integer part that
  // does not fit fails.
  static bool parse(const std::string& text, Decimal& out);

  // A JSON number token as written in the source (-?int[.frac][e[+-]exp]),
  // read digit for digit with the same rounding as parse().
  static bool parse_json_number(const std::string& token, Decimal& out);

  std::int64_t coefficient() const { return coefficient_; }
  std::uint32_t scale() const { return scale_; }

  bool is_integral() const;

  // Only succeeds for integral values.
  bool to_int64(std::int64_t& out) const;

  // Arithmetic throws std::overflow_error instead of wrapping.
  Decimal operator+(const Decimal& other) const;
  Decimal operator-(const Decimal& other) const;
  Decimal operator*(const Decimal& other) const;
  Decimal operator-() const;

  int compare(const Decimal& other) const;

  // Full precision, scale preserved.
  std::string to_string() const;

  // Rounded half away from zero to `places` decimals, zero-padded.
  std::string to_fixed(std::uint32_t places) const;

private:
  Decimal(std::int64_t coefficient, std::uint32_t scale)
      : coefficient_(coefficient), scale_(scale) {}

  std::int64_t coefficient_ = 0;
  std::uint32_t scale_ = 0;
};

inline bool operator==(const Decimal& a, const Decimal& b) { return a.compare(b) == 0; }
inline bool operator!=(const Decimal& a, const Decimal& b) { return a.compare(b) != 0; }
inline bool operator<(const Decimal& a, const Decimal& b) { return a.compare(b) < 0; }
inline bool operator>(const Decimal& a, const Decimal& b) { return a.compare(b) > 0; }
inline bool operator<=(const Decimal& a, const Decimal& b) { return a.compare(b) <= 0; }
inline bool operator>=(const Decimal& a, const Decimal& b) { return a.compare(b) >= 0; }

std::ostream& operator<<(std::ostream& os, const Decimal& d);

} // namespace invoicer
