#include "cpamm/guards.hpp"
#include "cpamm/errors.hpp"

namespace cpamm {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

SpreadLimit select_spread_limit(
    const std::optional<Decimal>& belief_price,
    const std::optional<Decimal>& max_spread,
    const std::optional<uint128>& expected_return
) {
    if (expected_return) {
        return ExpectedReturn{*expected_return};
    }
    if (belief_price && max_spread) {
        return BeliefPriceSpread{*belief_price, *max_spread};
    }
    if (max_spread) {
        return MaxSpread{*max_spread};
    }
    return NoSpreadLimit{};
}

void assert_max_spread(
    const SpreadLimit& limit,
    const uint128& offer_amount,
    const SwapResult& swap
) {
    // return amount before the commission was taken
    const uint256 gross_return = uint256(swap.return_amount) + uint256(swap.commission_amount);

    std::visit(overloaded{
        [](const NoSpreadLimit&) {},
        [&](const ExpectedReturn& l) {
            if (swap.return_amount < l.amount) {
                throw ReturnBelowExpected(
                    "Operation fell short of expected_return: " + swap.return_amount.str()
                        + " < " + l.amount.str()
                );
            }
        },
        [&](const BeliefPriceSpread& l) {
            const uint256 expected = l.belief_price.reverse().mul_floor(offer_amount);
            const uint256 spread = u256::saturating_sub(expected, gross_return);
            if (gross_return < expected && Decimal::from_ratio(spread, expected) > l.max_spread) {
                throw SpreadExceeded(
                    "Operation exceeds max spread limit with belief_price: spread "
                        + Decimal::from_ratio(spread, expected).to_string() + " > "
                        + l.max_spread.to_string()
                );
            }
        },
        [&](const MaxSpread& l) {
            const uint256 spread = swap.spread_amount;
            const Decimal ratio = Decimal::from_ratio(spread, uint256(gross_return + spread));
            if (ratio > l.max_spread) {
                throw SpreadExceeded(
                    "Operation exceeds max spread limit: spread " + ratio.to_string() + " > "
                        + l.max_spread.to_string()
                );
            }
        }
    }, limit);
}

void assert_max_spread(
    const std::optional<Decimal>& belief_price,
    const std::optional<Decimal>& max_spread,
    const std::optional<uint128>& expected_return,
    const uint128& offer_amount,
    const SwapResult& swap
) {
    assert_max_spread(select_spread_limit(belief_price, max_spread, expected_return), offer_amount, swap);
}

void assert_slippage_tolerance(
    const std::optional<Decimal>& slippage_tolerance,
    const std::array<uint128, 2>& deposits,
    const std::array<uint128, 2>& pools
) {
    if (!slippage_tolerance || pools[0] == 0 || pools[1] == 0) {
        return;
    }

    const Decimal one_minus_slippage_tolerance = Decimal::one().subtract(*slippage_tolerance);

    // each side's deposit price may not undercut the pool price by more than
    // the tolerance
    if (Decimal::from_ratio(deposits[0], deposits[1]).multiply(one_minus_slippage_tolerance)
            > Decimal::from_ratio(pools[0], pools[1])
        || Decimal::from_ratio(deposits[1], deposits[0]).multiply(one_minus_slippage_tolerance)
            > Decimal::from_ratio(pools[1], pools[0])) {
        throw SlippageExceeded("Operation exceeds max slippage tolerance " + slippage_tolerance->to_string());
    }
}

} // namespace cpamm
