#include "cpamm/decimal.hpp"
#include "cpamm/errors.hpp"

#include <cctype>
#include <ostream>
#include <stdexcept>

namespace cpamm {

Decimal::Decimal() : atomics_(fractional()) {}

const uint256& Decimal::fractional() {
    static const uint256 v("1000000000000000000");
    return v;
}

Decimal Decimal::one() {
    return Decimal(fractional());
}

Decimal Decimal::zero() {
    return Decimal(uint256(0));
}

Decimal Decimal::from_atomics(const uint256& atomics) {
    return Decimal(atomics);
}

Decimal Decimal::from_ratio(const uint256& nom, const uint256& denom) {
    if (denom == 0) {
        throw DegenerateState("Decimal::from_ratio(" + nom.str() + ", 0): zero denominator");
    }
    return Decimal(u256::expect(
        u256::div(u256::mul(nom, fractional()), denom),
        "Cannot calculate Decimal::from_ratio(" + nom.str() + ", " + denom.str() + ")"
    ));
}

Decimal Decimal::parse(const std::string& s) {
    auto dot = s.find('.');
    std::string whole = s.substr(0, dot);
    std::string frac = (dot == std::string::npos) ? std::string() : s.substr(dot + 1);

    auto digits = [](const std::string& part) {
        for (unsigned char c : part) {
            if (!std::isdigit(c)) return false;
        }
        return true;
    };
    if (whole.empty() || !digits(whole) || !digits(frac) || frac.size() > 18
        || (dot != std::string::npos && frac.empty())) {
        throw std::invalid_argument("invalid decimal: '" + s + "'");
    }

    frac.append(18 - frac.size(), '0');
    auto whole_atomics = u256::mul(uint256(parse_amount(whole)), fractional());
    auto atomics = u256::add(whole_atomics, uint256(parse_amount(frac)));
    if (!atomics) {
        throw std::invalid_argument("decimal out of range: '" + s + "'");
    }
    return Decimal(*atomics);
}

Decimal Decimal::multiply(const Decimal& rhs) const {
    return Decimal(u256::expect(
        u256::div(u256::mul(atomics_, rhs.atomics_), fractional()),
        "Cannot calculate " + to_string() + " * " + rhs.to_string()
    ));
}

Decimal Decimal::subtract(const Decimal& rhs) const {
    return Decimal(u256::expect(
        u256::sub(atomics_, rhs.atomics_),
        "Cannot calculate " + to_string() + " - " + rhs.to_string()
    ));
}

Decimal Decimal::reverse() const {
    if (is_zero()) {
        throw DegenerateState("Cannot reverse a zero decimal");
    }
    return from_ratio(fractional(), atomics_);
}

uint256 Decimal::mul_floor(const uint256& amount) const {
    return u256::expect(
        u256::div(u256::mul(amount, atomics_), fractional()),
        "Cannot calculate " + amount.str() + " * " + to_string()
    );
}

std::string Decimal::to_string() const {
    uint256 whole = atomics_ / fractional();
    uint256 frac = atomics_ % fractional();
    if (frac == 0) {
        return whole.str();
    }
    std::string digits = frac.str();
    digits.insert(0, 18 - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    return whole.str() + "." + digits;
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

} // namespace cpamm
