#ifndef CPAMM_U256_MATH_HPP
#define CPAMM_U256_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <optional>
#include <string>

namespace cpamm {

// Native-size amount (smallest unit of an asset) and the wide types used for
// every reserve-scale intermediate.
using uint128 = boost::multiprecision::uint128_t;
using uint256 = boost::multiprecision::uint256_t;
using uint512 = boost::multiprecision::uint512_t;

namespace u256 {

using maybe = std::optional<uint256>;

// Checked operations. An absent argument, overflow past 2^256 - 1, a negative
// difference or a zero divisor all give an absent result, so calls chain:
//   div(mul(a, b), c)
maybe add(const maybe& a, const maybe& b);
maybe sub(const maybe& a, const maybe& b);
maybe mul(const maybe& a, const maybe& b);
maybe div(const maybe& a, const maybe& b);

// Floor of the exact square root.
maybe sqrt(const maybe& a);

uint256 saturating_sub(const uint256& a, const uint256& b);

// Unwrap or throw ArithmeticError carrying `what`.
uint256 expect(const maybe& value, const std::string& what);

// Narrow to an amount; throws ArithmeticError when out of range.
uint128 to_amount(const uint256& value, const std::string& what);

std::string to_string(const maybe& value);

} // namespace u256

// Parse a base-10 amount ("1000000"); throws std::invalid_argument on
// malformed input or values above 2^128 - 1.
uint128 parse_amount(const std::string& s);

} // namespace cpamm

#endif // CPAMM_U256_MATH_HPP
