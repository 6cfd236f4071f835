#include "cpamm/liquidity_math.hpp"
#include "cpamm/errors.hpp"

#include <algorithm>

namespace cpamm {

uint128 LiquidityMath::compute_initial_shares(
    const uint128& deposit0_,
    const uint128& deposit1_
) {
    const uint256 deposit0 = deposit0_;
    const uint256 deposit1 = deposit1_;

    const uint256 shares = u256::expect(
        u256::sqrt(u256::mul(deposit0, deposit1)),
        "Cannot calculate sqrt(deposit_0 " + deposit0.str() + " * deposit_1 " + deposit1.str() + ")"
    );
    return u256::to_amount(shares, "initial share");
}

uint128 LiquidityMath::compute_additional_shares(
    const uint128& deposit0_,
    const uint128& deposit1_,
    const uint128& pool0_,
    const uint128& pool1_,
    const uint128& total_share_
) {
    if (pool0_ == 0 || pool1_ == 0) {
        throw DegenerateState(
            "Cannot mint against an empty side: pools " + pool0_.str() + ", " + pool1_.str()
        );
    }

    const uint256 total_share = total_share_;
    const uint256 deposit0 = deposit0_;
    const uint256 deposit1 = deposit1_;
    const uint256 pool0 = pool0_;
    const uint256 pool1 = pool1_;

    const uint256 share0 = u256::expect(
        u256::div(u256::mul(deposit0, total_share), pool0),
        "Cannot calculate deposits[0] " + deposit0.str() + " * total_share " + total_share.str()
            + " / pools[0].amount " + pool0.str()
    );
    const uint256 share1 = u256::expect(
        u256::div(u256::mul(deposit1, total_share), pool1),
        "Cannot calculate deposits[1] " + deposit1.str() + " * total_share " + total_share.str()
            + " / pools[1].amount " + pool1.str()
    );

    return u256::to_amount(std::min(share0, share1), "share");
}

uint128 LiquidityMath::compute_withdrawal(
    const uint128& reserve_,
    const uint128& burn_amount_,
    const uint128& total_share_
) {
    if (total_share_ == 0) {
        throw DegenerateState("Cannot withdraw: total_share is zero");
    }

    const uint256 reserve = reserve_;
    const uint256 burn_amount = burn_amount_;
    const uint256 total_share = total_share_;

    const uint256 refund = u256::expect(
        u256::div(u256::mul(reserve, burn_amount), total_share),
        "Cannot calculate current_pool_amount " + reserve.str() + " * withdrawn_share_amount "
            + burn_amount.str() + " / total_share " + total_share.str()
    );
    return u256::to_amount(refund, "refund amount");
}

} // namespace cpamm
