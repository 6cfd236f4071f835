#include "cpamm/u256_math.hpp"
#include "cpamm/errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace cpamm {
namespace u256 {

namespace {

const uint512& max_u256() {
    static const uint512 v = uint512((std::numeric_limits<uint256>::max)());
    return v;
}

const uint256& max_u128() {
    static const uint256 v = uint256((std::numeric_limits<uint128>::max)());
    return v;
}

} // namespace

maybe add(const maybe& a, const maybe& b) {
    if (!a || !b) {
        return std::nullopt;
    }
    uint512 wide = uint512(*a) + uint512(*b);
    if (wide > max_u256()) {
        return std::nullopt;
    }
    return static_cast<uint256>(wide);
}

maybe sub(const maybe& a, const maybe& b) {
    if (!a || !b || *b > *a) {
        return std::nullopt;
    }
    return uint256(*a - *b);
}

maybe mul(const maybe& a, const maybe& b) {
    if (!a || !b) {
        return std::nullopt;
    }
    uint512 wide = uint512(*a) * uint512(*b);
    if (wide > max_u256()) {
        return std::nullopt;
    }
    return static_cast<uint256>(wide);
}

maybe div(const maybe& a, const maybe& b) {
    if (!a || !b || *b == 0) {
        return std::nullopt;
    }
    return uint256(*a / *b);
}

maybe sqrt(const maybe& a) {
    if (!a) {
        return std::nullopt;
    }
    return uint256(boost::multiprecision::sqrt(*a));
}

uint256 saturating_sub(const uint256& a, const uint256& b) {
    return a > b ? uint256(a - b) : uint256(0);
}

uint256 expect(const maybe& value, const std::string& what) {
    if (!value) {
        throw ArithmeticError(what);
    }
    return *value;
}

uint128 to_amount(const uint256& value, const std::string& what) {
    if (value > max_u128()) {
        throw ArithmeticError(what + ": " + value.str() + " does not fit in 128 bits");
    }
    return static_cast<uint128>(value);
}

std::string to_string(const maybe& value) {
    return value ? value->str() : std::string("<none>");
}

} // namespace u256

uint128 parse_amount(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("invalid amount: '" + s + "'");
    }
    // 2^128 - 1 has 39 digits
    auto first = s.find_first_not_of('0');
    if (first == std::string::npos) {
        return 0;
    }
    if (s.size() - first > 39) {
        throw std::invalid_argument("amount out of range: " + s);
    }
    uint256 v(s.substr(first));
    if (v > uint256((std::numeric_limits<uint128>::max)())) {
        throw std::invalid_argument("amount out of range: " + s);
    }
    return static_cast<uint128>(v);
}

} // namespace cpamm
