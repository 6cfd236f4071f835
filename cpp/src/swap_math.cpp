#include "cpamm/swap_math.hpp"
#include "cpamm/errors.hpp"

namespace cpamm {

using u256::maybe;

namespace {

maybe div_ceil(const maybe& a, const maybe& b) {
    auto q = u256::div(a, b);
    if (q && *a % *b != 0) {
        return u256::add(q, uint256(1));
    }
    return q;
}

void require_reserves(const uint128& offer_pool, const uint128& ask_pool) {
    if (offer_pool == 0 || ask_pool == 0) {
        throw DegenerateState(
            "empty pool: offer_pool " + offer_pool.str() + ", ask_pool " + ask_pool.str()
        );
    }
}

void require_fee_denom(const uint128& commission_rate_denom) {
    if (commission_rate_denom == 0) {
        throw DegenerateState("commission_rate_denom is zero");
    }
}

} // namespace

// ------------------------------ compute_swap ---------------------------------

SwapResult SwapMath::compute_swap(
    const uint128& offer_pool_,
    const uint128& ask_pool_,
    const uint128& offer_amount_,
    const uint128& commission_rate_nom_,
    const uint128& commission_rate_denom_
) {
    require_reserves(offer_pool_, ask_pool_);
    require_fee_denom(commission_rate_denom_);

    const uint256 offer_pool = offer_pool_;
    const uint256 ask_pool = ask_pool_;
    const uint256 offer_amount = offer_amount_;

    // cp = offer_pool * ask_pool
    const uint256 cp = u256::expect(
        u256::mul(offer_pool, ask_pool),
        "Cannot calculate cp = offer_pool " + offer_pool.str() + " * ask_pool " + ask_pool.str()
    );

    // return_amount = ask_pool - cp / (offer_pool + offer_amount)
    const uint256 return_amount = u256::expect(
        u256::sub(ask_pool, div_ceil(cp, u256::add(offer_pool, offer_amount))),
        "Cannot calculate return_amount = (ask_pool " + ask_pool.str() + " - cp " + cp.str()
            + " / (offer_pool " + offer_pool.str() + " + offer_amount " + offer_amount.str() + "))"
    );

    // spread = offer_amount * ask_pool / offer_pool - return_amount
    const uint256 quoted = u256::expect(
        u256::div(u256::mul(offer_amount, ask_pool), offer_pool),
        "Cannot calculate offer_amount " + offer_amount.str() + " * ask_pool " + ask_pool.str()
            + " / offer_pool " + offer_pool.str()
    );
    const uint256 spread_amount = u256::saturating_sub(quoted, return_amount);

    const uint256 nom = commission_rate_nom_;
    const uint256 denom = commission_rate_denom_;
    const uint256 commission_amount = u256::expect(
        u256::div(u256::mul(return_amount, nom), denom),
        "Cannot calculate return_amount " + return_amount.str() + " * commission_rate_nom "
            + nom.str() + " / commission_rate_denom " + denom.str()
    );

    // commission is absorbed into the pool
    const uint256 net_return = u256::expect(
        u256::sub(return_amount, commission_amount),
        "Cannot calculate return_amount " + return_amount.str() + " - commission_amount "
            + commission_amount.str()
    );

    return {
        u256::to_amount(net_return, "return_amount"),
        u256::to_amount(spread_amount, "spread_amount"),
        u256::to_amount(commission_amount, "commission_amount")
    };
}

// --------------------------- compute_offer_amount ----------------------------

ReverseSwapResult SwapMath::compute_offer_amount(
    const uint128& offer_pool_,
    const uint128& ask_pool_,
    const uint128& ask_amount_,
    const uint128& commission_rate_nom,
    const uint128& commission_rate_denom
) {
    require_reserves(offer_pool_, ask_pool_);
    require_fee_denom(commission_rate_denom);

    const uint256 offer_pool = offer_pool_;
    const uint256 ask_pool = ask_pool_;
    const uint256 ask_amount = ask_amount_;

    const Decimal commission_rate = Decimal::from_ratio(commission_rate_nom, commission_rate_denom);
    const Decimal one_minus_commission = Decimal::one().subtract(commission_rate);

    // ask amount grossed up by the commission
    const uint256 before_commission = one_minus_commission.reverse().mul_floor(ask_amount);
    if (before_commission >= ask_pool) {
        throw ArithmeticError(
            "Cannot calculate offer_amount: ask_amount " + ask_amount.str() + " / (1 - "
                + commission_rate.to_string() + ") = " + before_commission.str()
                + " exhausts ask_pool " + ask_pool.str()
        );
    }

    const uint256 cp = u256::expect(
        u256::mul(offer_pool, ask_pool),
        "Cannot calculate cp = offer_pool " + offer_pool.str() + " * ask_pool " + ask_pool.str()
    );
    const uint256 offer_amount = u256::expect(
        u256::sub(u256::div(cp, u256::sub(ask_pool, before_commission)), offer_pool),
        "Cannot calculate offer_amount = cp " + cp.str() + " / (ask_pool " + ask_pool.str()
            + " - " + before_commission.str() + ") - offer_pool " + offer_pool.str()
    );

    const uint256 spread_amount = u256::saturating_sub(
        Decimal::from_ratio(ask_pool, offer_pool).mul_floor(offer_amount),
        before_commission
    );
    const uint256 commission_amount = commission_rate.mul_floor(before_commission);

    return {
        u256::to_amount(offer_amount, "offer_amount"),
        u256::to_amount(spread_amount, "spread_amount"),
        u256::to_amount(commission_amount, "commission_amount")
    };
}

} // namespace cpamm
