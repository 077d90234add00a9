#include "Decimal.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace cb {

namespace {

using int128 = __int128;

int64_t checkedNarrow(int128 value) {
  if (value > std::numeric_limits<int64_t>::max() ||
      value < std::numeric_limits<int64_t>::min()) {
    throw std::overflow_error("Decimal overflow");
  }
  return static_cast<int64_t>(value);
}

} // namespace

Decimal Decimal::fromUnits(int64_t units) { return Decimal(units); }

Decimal Decimal::fromInt(int64_t whole) {
  return Decimal(checkedNarrow(static_cast<int128>(whole) * ONE));
}

Decimal::Roe<Decimal> Decimal::parse(const std::string &str) {
  if (str.empty()) {
    return Error(E_FORMAT, "Empty amount");
  }

  size_t pos = 0;
  bool negative = false;
  if (str[0] == '-' || str[0] == '+') {
    negative = str[0] == '-';
    pos = 1;
  }

  int128 whole = 0;
  size_t wholeDigits = 0;
  while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
    whole = whole * 10 + (str[pos] - '0');
    if (whole > std::numeric_limits<int64_t>::max()) {
      return Error(E_RANGE, "Amount out of range: " + str);
    }
    ++pos;
    ++wholeDigits;
  }

  int128 fraction = 0;
  size_t fractionDigits = 0;
  if (pos < str.size() && str[pos] == '.') {
    ++pos;
    while (pos < str.size() &&
           std::isdigit(static_cast<unsigned char>(str[pos]))) {
      if (fractionDigits == SCALE) {
        return Error(E_PRECISION,
                     "Amount has more than 8 fractional digits: " + str);
      }
      fraction = fraction * 10 + (str[pos] - '0');
      ++pos;
      ++fractionDigits;
    }
    if (fractionDigits == 0) {
      return Error(E_FORMAT, "Invalid amount: " + str);
    }
  }

  if (pos != str.size() || wholeDigits + fractionDigits == 0) {
    return Error(E_FORMAT, "Invalid amount: " + str);
  }

  for (size_t i = fractionDigits; i < static_cast<size_t>(SCALE); ++i) {
    fraction *= 10;
  }

  int128 units = whole * ONE + fraction;
  if (negative) {
    units = -units;
  }
  if (units > std::numeric_limits<int64_t>::max() ||
      units < std::numeric_limits<int64_t>::min()) {
    return Error(E_RANGE, "Amount out of range: " + str);
  }
  return Decimal(static_cast<int64_t>(units));
}

Decimal::Roe<Decimal> Decimal::fromJson(const nlohmann::json &jd) {
  if (jd.is_string()) {
    return parse(jd.get<std::string>());
  }
  if (jd.is_number_integer()) {
    try {
      if (jd.is_number_unsigned()) {
        uint64_t whole = jd.get<uint64_t>();
        if (whole > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          return Error(E_RANGE, "Amount out of range: " + jd.dump());
        }
        return fromInt(static_cast<int64_t>(whole));
      }
      return fromInt(jd.get<int64_t>());
    } catch (const std::overflow_error &) {
      return Error(E_RANGE, "Amount out of range: " + jd.dump());
    }
  }
  if (jd.is_number_float()) {
    return parse(jd.dump());
  }
  return Error(E_FORMAT, "Amount must be a string or number");
}

Decimal Decimal::mulDiv(const Decimal &a, const Decimal &b, const Decimal &c) {
  if (c.units_ == 0) {
    throw std::domain_error("Decimal division by zero");
  }
  int128 num = static_cast<int128>(a.units_) * b.units_;
  int128 den = c.units_;
  if (den < 0) {
    num = -num;
    den = -den;
  }
  int128 quotient = num / den;
  int128 remainder = num % den;
  if (remainder < 0) {
    remainder = -remainder;
  }
  if (remainder * 2 >= den) {
    quotient += num < 0 ? -1 : 1;
  }
  return Decimal(checkedNarrow(quotient));
}

Decimal Decimal::abs() const {
  if (units_ == std::numeric_limits<int64_t>::min()) {
    throw std::overflow_error("Decimal overflow");
  }
  return Decimal(units_ < 0 ? -units_ : units_);
}

std::string Decimal::toString() const {
  int128 value = units_;
  bool negative = value < 0;
  if (negative) {
    value = -value;
  }
  int64_t whole = static_cast<int64_t>(value / ONE);
  int64_t fraction = static_cast<int64_t>(value % ONE);

  std::string out = negative ? "-" : "";
  out += std::to_string(whole);
  if (fraction != 0) {
    std::string digits = std::to_string(fraction);
    digits.insert(0, SCALE - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    out += "." + digits;
  }
  return out;
}

Decimal Decimal::operator+(const Decimal &other) const {
  return Decimal(checkedNarrow(static_cast<int128>(units_) + other.units_));
}

Decimal Decimal::operator-(const Decimal &other) const {
  return Decimal(checkedNarrow(static_cast<int128>(units_) - other.units_));
}

Decimal Decimal::operator-() const {
  return Decimal(checkedNarrow(-static_cast<int128>(units_)));
}

Decimal &Decimal::operator+=(const Decimal &other) {
  *this = *this + other;
  return *this;
}

Decimal &Decimal::operator-=(const Decimal &other) {
  *this = *this - other;
  return *this;
}

std::ostream &operator<<(std::ostream &os, const Decimal &value) {
  return os << value.toString();
}

} // namespace cb
