#ifndef CPAMM_LIQUIDITY_MATH_HPP
#define CPAMM_LIQUIDITY_MATH_HPP

#include "u256_math.hpp"

namespace cpamm {

class LiquidityMath {
public:
    // First deposit into an empty pool: floor(sqrt(deposit0 * deposit1)).
    static uint128 compute_initial_shares(
        const uint128& deposit0,
        const uint128& deposit1
    );

    // min(deposit0 * total_share / pool0, deposit1 * total_share / pool1).
    // Taking the smaller side keeps an unbalanced deposit from diluting
    // existing holders.
    static uint128 compute_additional_shares(
        const uint128& deposit0,
        const uint128& deposit1,
        const uint128& pool0,
        const uint128& pool1,
        const uint128& total_share
    );

    // reserve * burn_amount / total_share for one side. burn_amount <=
    // total_share is the caller's responsibility.
    static uint128 compute_withdrawal(
        const uint128& reserve,
        const uint128& burn_amount,
        const uint128& total_share
    );
};

} // namespace cpamm

#endif // CPAMM_LIQUIDITY_MATH_HPP
