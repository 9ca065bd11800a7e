#include "invoicer/decimal.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace invoicer {

// Intermediate results (aligned operands, products) can need up to 37 digits.
using wide_t = __int128;

static constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();
static constexpr std::int64_t kInt64Min = std::numeric_limits<std::int64_t>::min();

static constexpr std::int64_t kPow10[Decimal::kMaxScale + 1] = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL,
    1000000000LL,
    10000000000LL,
    100000000000LL,
    1000000000000LL,
    10000000000000LL,
    100000000000000LL,
    1000000000000000LL,
    10000000000000000LL,
    100000000000000000LL,
    1000000000000000000LL,
};

static wide_t pow10_wide(std::uint32_t n) {
  wide_t p = 1;
  for (std::uint32_t i = 0; i < n; ++i) p *= 10;
  return p;
}

static bool fits_int64(wide_t v) {
  return v >= kInt64Min && v <= kInt64Max;
}

// d > 0
static wide_t divide_round_half_even(wide_t v, wide_t d) {
  wide_t q = v / d;
  wide_t r = v % d;
  if (r < 0) r = -r;
  const wide_t twice = r * 2;
  if (twice > d || (twice == d && q % 2 != 0)) q += (v < 0) ? -1 : 1;
  return q;
}

static wide_t divide_round_half_away(wide_t v, wide_t d) {
  wide_t q = v / d;
  wide_t r = v % d;
  if (r < 0) r = -r;
  if (r * 2 >= d) q += (v < 0) ? -1 : 1;
  return q;
}

// Brings a wide intermediate back into (int64 coefficient, scale <= 18),
// dropping fraction digits only when it has to.
static Decimal narrow(wide_t coef, std::uint32_t scale) {
  if (scale > Decimal::kMaxScale) {
    coef = divide_round_half_even(coef, pow10_wide(scale - Decimal::kMaxScale));
    scale = Decimal::kMaxScale;
  }

  if (!fits_int64(coef)) {
    const wide_t original = coef;
    std::uint32_t dropped = 1;
    for (; dropped <= scale; ++dropped) {
      coef = divide_round_half_even(original, pow10_wide(dropped));
      if (fits_int64(coef)) break;
    }
    if (!fits_int64(coef)) throw std::overflow_error("decimal overflow");
    scale -= dropped;
  }

  return Decimal::from_units(static_cast<std::int64_t>(coef), scale);
}

static std::string format_scaled(wide_t v, std::uint32_t places) {
  const bool negative = v < 0;
  wide_t mag = negative ? -v : v;

  std::string digits; // least significant first
  do {
    digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
    mag /= 10;
  } while (mag != 0);
  while (digits.size() <= places) digits.push_back('0');

  std::string out;
  out.reserve(digits.size() + 2);
  if (negative) out.push_back('-');
  for (size_t i = digits.size(); i-- > 0;) {
    out.push_back(digits[i]);
    if (i == places && places > 0) out.push_back('.');
  }
  return out;
}

// Exponents past this only matter as "too large" or "rounds to zero".
static constexpr long long kExponentLimit = 1000000;

static void trim_inplace(std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  s = s.substr(start, end - start);
}

static bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

// First `count` characters of `digits` as an int64.
static bool digits_to_int64(const std::string& digits, size_t count, std::int64_t& out) {
  std::int64_t v = 0;
  for (size_t i = 0; i < count; ++i) {
    const int d = digits[i] - '0';
    if (v > (kInt64Max - d) / 10) return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

// value = digits * 10^-scale, where scale may be negative (exponent form).
// Drops as few fraction digits as it can, rounding half-to-even; fails only
// when the integer part does not fit.
static bool decimal_from_digits(std::string digits, long long scale, bool negative, Decimal& out) {
  const size_t first = digits.find_first_not_of('0');
  digits.erase(0, first == std::string::npos ? digits.size() : first);

  const long long max_scale = Decimal::kMaxScale;

  if (digits.empty()) {
    const long long s = std::min(std::max(scale, 0LL), max_scale);
    out = Decimal::from_units(0, static_cast<std::uint32_t>(s));
    return true;
  }

  if (scale < 0) {
    if (-scale > 19 || digits.size() + static_cast<size_t>(-scale) > 19) return false;
    digits.append(static_cast<size_t>(-scale), '0');
    scale = 0;
  }

  const long long len = static_cast<long long>(digits.size());
  for (long long drop = std::max({scale - max_scale, len - 19, 0LL}); drop <= scale; ++drop) {
    const size_t keep = drop < len ? static_cast<size_t>(len - drop) : 0;

    std::int64_t coef = 0;
    if (!digits_to_int64(digits, keep, coef)) continue;

    if (drop > 0 && drop <= len) {
      const char first_dropped = digits[keep];
      const bool rest_nonzero = digits.find_first_not_of('0', keep + 1) != std::string::npos;
      const bool up = first_dropped > '5' ||
                      (first_dropped == '5' && (rest_nonzero || coef % 2 != 0));
      if (up) {
        if (coef == kInt64Max) continue;
        ++coef;
      }
    }

    out = Decimal::from_units(negative ? -coef : coef, static_cast<std::uint32_t>(scale - drop));
    return true;
  }
  return false;
}

Decimal Decimal::from_int(std::int64_t value) {
  return Decimal(value, 0);
}

Decimal Decimal::from_units(std::int64_t coefficient, std::uint32_t scale) {
  if (scale > kMaxScale) {
    throw std::invalid_argument("decimal scale out of range: " + std::to_string(scale));
  }
  return Decimal(coefficient, scale);
}

bool Decimal::parse(const std::string& text, Decimal& out) {
  std::string t = text;
  trim_inplace(t);
  if (t.empty()) return false;

  size_t i = 0;
  bool negative = false;
  if (t[i] == '+' || t[i] == '-') {
    negative = t[i] == '-';
    ++i;
  }

  std::string digits;
  long long frac = 0;
  bool seen_point = false;

  for (; i < t.size(); ++i) {
    const char c = t[i];
    if (is_digit(c)) {
      digits.push_back(c);
      if (seen_point) ++frac;
    } else if (c == ',' && !seen_point && !digits.empty()) {
      // thousands separator
    } else if (c == '.' && !seen_point) {
      seen_point = true;
    } else {
      return false;
    }
  }

  if (digits.empty()) return false;
  return decimal_from_digits(digits, frac, negative, out);
}

bool Decimal::parse_json_number(const std::string& token, Decimal& out) {
  const size_t n = token.size();
  size_t i = 0;

  bool negative = false;
  if (i < n && token[i] == '-') {
    negative = true;
    ++i;
  }

  std::string digits;
  const size_t int_start = i;
  while (i < n && is_digit(token[i])) digits.push_back(token[i++]);
  const size_t int_len = i - int_start;
  if (int_len == 0 || (int_len > 1 && token[int_start] == '0')) return false;

  long long frac = 0;
  if (i < n && token[i] == '.') {
    ++i;
    const size_t frac_start = i;
    while (i < n && is_digit(token[i])) {
      digits.push_back(token[i++]);
      ++frac;
    }
    if (i == frac_start) return false;
  }

  long long exponent = 0;
  if (i < n && (token[i] == 'e' || token[i] == 'E')) {
    ++i;
    bool exp_negative = false;
    if (i < n && (token[i] == '+' || token[i] == '-')) {
      exp_negative = token[i] == '-';
      ++i;
    }
    const size_t exp_start = i;
    while (i < n && is_digit(token[i])) {
      if (exponent < kExponentLimit) exponent = exponent * 10 + (token[i] - '0');
      ++i;
    }
    if (i == exp_start) return false;
    if (exp_negative) exponent = -exponent;
  }

  if (i != n) return false;
  return decimal_from_digits(digits, frac - exponent, negative, out);
}

bool Decimal::is_integral() const {
  return coefficient_ % kPow10[scale_] == 0;
}

bool Decimal::to_int64(std::int64_t& out) const {
  if (!is_integral()) return false;
  out = coefficient_ / kPow10[scale_];
  return true;
}

Decimal Decimal::operator+(const Decimal& other) const {
  const std::uint32_t s = std::max(scale_, other.scale_);
  const wide_t a = static_cast<wide_t>(coefficient_) * pow10_wide(s - scale_);
  const wide_t b = static_cast<wide_t>(other.coefficient_) * pow10_wide(s - other.scale_);
  return narrow(a + b, s);
}

Decimal Decimal::operator-(const Decimal& other) const {
  const std::uint32_t s = std::max(scale_, other.scale_);
  const wide_t a = static_cast<wide_t>(coefficient_) * pow10_wide(s - scale_);
  const wide_t b = static_cast<wide_t>(other.coefficient_) * pow10_wide(s - other.scale_);
  return narrow(a - b, s);
}

Decimal Decimal::operator*(const Decimal& other) const {
  const wide_t product = static_cast<wide_t>(coefficient_) * other.coefficient_;
  return narrow(product, scale_ + other.scale_);
}

Decimal Decimal::operator-() const {
  if (coefficient_ == kInt64Min) throw std::overflow_error("decimal overflow");
  return Decimal(-coefficient_, scale_);
}

int Decimal::compare(const Decimal& other) const {
  const std::uint32_t s = std::max(scale_, other.scale_);
  const wide_t a = static_cast<wide_t>(coefficient_) * pow10_wide(s - scale_);
  const wide_t b = static_cast<wide_t>(other.coefficient_) * pow10_wide(s - other.scale_);
  if (a < b) return -1;
  if (a > b) return 1;
  return 0;
}

std::string Decimal::to_string() const {
  return format_scaled(coefficient_, scale_);
}

std::string Decimal::to_fixed(std::uint32_t places) const {
  if (places > kMaxScale) {
    throw std::invalid_argument("decimal places out of range: " + std::to_string(places));
  }

  wide_t v = coefficient_;
  if (places >= scale_) {
    v *= pow10_wide(places - scale_);
  } else {
    v = divide_round_half_away(v, pow10_wide(scale_ - places));
  }
  return format_scaled(v, places);
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
  return os << d.to_string();
}

} // namespace invoicer
