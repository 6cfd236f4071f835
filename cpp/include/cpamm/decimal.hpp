#ifndef CPAMM_DECIMAL_HPP
#define CPAMM_DECIMAL_HPP

#include <iosfwd>
#include <string>

#include "u256_math.hpp"

namespace cpamm {

// Fixed-point ratio with 18 fractional digits: value = atomics / 10^18.
// Used for fee rates, tolerances and belief prices; reserve-scale swap math
// stays in integer arithmetic.
class Decimal {
public:
    Decimal();  // one

    static const uint256& fractional();
    static Decimal one();
    static Decimal zero();
    static Decimal from_atomics(const uint256& atomics);

    // nom / denom; DegenerateState when denom is zero
    static Decimal from_ratio(const uint256& nom, const uint256& denom);

    // "0.005", "1", "12.5"; at most 18 fractional digits
    static Decimal parse(const std::string& s);

    Decimal multiply(const Decimal& rhs) const;
    // ArithmeticError if rhs > *this
    Decimal subtract(const Decimal& rhs) const;
    // 1 / x; DegenerateState for zero
    Decimal reverse() const;

    // floor(amount * value)
    uint256 mul_floor(const uint256& amount) const;

    bool is_zero() const { return atomics_ == 0; }
    const uint256& atomics() const { return atomics_; }
    std::string to_string() const;

    bool operator==(const Decimal& o) const { return atomics_ == o.atomics_; }
    bool operator!=(const Decimal& o) const { return atomics_ != o.atomics_; }
    bool operator<(const Decimal& o) const { return atomics_ < o.atomics_; }
    bool operator>(const Decimal& o) const { return atomics_ > o.atomics_; }
    bool operator<=(const Decimal& o) const { return atomics_ <= o.atomics_; }
    bool operator>=(const Decimal& o) const { return atomics_ >= o.atomics_; }

private:
    explicit Decimal(const uint256& atomics) : atomics_(atomics) {}

    uint256 atomics_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& d);

} // namespace cpamm

#endif // CPAMM_DECIMAL_HPP
