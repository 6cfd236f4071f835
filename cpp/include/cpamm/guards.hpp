#ifndef CPAMM_GUARDS_HPP
#define CPAMM_GUARDS_HPP

#include <array>
#include <optional>
#include <variant>

#include "decimal.hpp"
#include "swap_math.hpp"

namespace cpamm {

// Swap protection. Exactly one mode applies per swap.
struct NoSpreadLimit {};

struct ExpectedReturn {
    uint128 amount;
};

struct BeliefPriceSpread {
    Decimal belief_price;
    Decimal max_spread;
};

struct MaxSpread {
    Decimal max_spread;
};

using SpreadLimit = std::variant<NoSpreadLimit, ExpectedReturn, BeliefPriceSpread, MaxSpread>;

// Priority: expected_return, then belief_price with max_spread, then
// max_spread alone. A belief_price without max_spread is ignored.
SpreadLimit select_spread_limit(
    const std::optional<Decimal>& belief_price,
    const std::optional<Decimal>& max_spread,
    const std::optional<uint128>& expected_return
);

// Throws ReturnBelowExpected or SpreadExceeded.
void assert_max_spread(
    const SpreadLimit& limit,
    const uint128& offer_amount,
    const SwapResult& swap
);

void assert_max_spread(
    const std::optional<Decimal>& belief_price,
    const std::optional<Decimal>& max_spread,
    const std::optional<uint128>& expected_return,
    const uint128& offer_amount,
    const SwapResult& swap
);

// Rejects a deposit whose price deviates from the pool's by more than the
// tolerance in either direction. No-op without a tolerance, or while either
// reserve is still empty.
void assert_slippage_tolerance(
    const std::optional<Decimal>& slippage_tolerance,
    const std::array<uint128, 2>& deposits,
    const std::array<uint128, 2>& pools
);

} // namespace cpamm

#endif // CPAMM_GUARDS_HPP
