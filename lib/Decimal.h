#ifndef CB_LEDGER_DECIMAL_H
#define CB_LEDGER_DECIMAL_H

#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ostream>
#include <string>

namespace cb {

/**
 * Decimal - signed fixed-point amount with 8 fractional digits.
 *
 * Stored as an int64_t count of 1e-8 units, so sums and comparisons are
 * exact. Arithmetic that would leave the int64 range throws
 * std::overflow_error; components catch it at their boundary and report
 * E_OVERFLOW.
 */
class Decimal {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FORMAT = 1;
  constexpr static int32_t E_PRECISION = 2;
  constexpr static int32_t E_RANGE = 3;

  constexpr static int SCALE = 8;
  constexpr static int64_t ONE = 100000000;

  Decimal() = default;

  static Decimal fromUnits(int64_t units);
  static Decimal fromInt(int64_t whole);

  /**
   * Parse "123", "-0.5", "100.25000000"
   * Rejects exponents, more than 8 fractional digits and out-of-range values.
   */
  static Roe<Decimal> parse(const std::string &str);

  /**
   * Amount from JSON. Strings go through parse(); integers are exact;
   * floating point literals are accepted by their JSON text.
   */
  static Roe<Decimal> fromJson(const nlohmann::json &jd);

  /**
   * a * b / c with a 128-bit intermediate, rounded half away from zero
   * @throws std::domain_error if c is zero
   * @throws std::overflow_error if the result does not fit
   */
  static Decimal mulDiv(const Decimal &a, const Decimal &b, const Decimal &c);

  int64_t units() const { return units_; }

  bool isZero() const { return units_ == 0; }
  bool isNegative() const { return units_ < 0; }
  bool isPositive() const { return units_ > 0; }

  Decimal abs() const;

  // Shortest exact form: "124", "0.5", "-3.14159265"
  std::string toString() const;

  Decimal operator+(const Decimal &other) const;
  Decimal operator-(const Decimal &other) const;
  Decimal operator-() const;
  Decimal &operator+=(const Decimal &other);
  Decimal &operator-=(const Decimal &other);

  bool operator==(const Decimal &other) const { return units_ == other.units_; }
  bool operator!=(const Decimal &other) const { return units_ != other.units_; }
  bool operator<(const Decimal &other) const { return units_ < other.units_; }
  bool operator<=(const Decimal &other) const { return units_ <= other.units_; }
  bool operator>(const Decimal &other) const { return units_ > other.units_; }
  bool operator>=(const Decimal &other) const { return units_ >= other.units_; }

  template <typename Archive> void serialize(Archive &ar) { ar &units_; }

private:
  explicit Decimal(int64_t units) : units_(units) {}

  int64_t units_{ 0 };
};

std::ostream &operator<<(std::ostream &os, const Decimal &value);

} // namespace cb

#endif // CB_LEDGER_DECIMAL_H
