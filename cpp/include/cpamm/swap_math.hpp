#ifndef CPAMM_SWAP_MATH_HPP
#define CPAMM_SWAP_MATH_HPP

#include "decimal.hpp"
#include "u256_math.hpp"

namespace cpamm {

// Commission rate nom / denom, supplied per call by the settings service.
struct FeeConfig {
    uint128 commission_rate_nom{0};
    uint128 commission_rate_denom{1};

    Decimal rate() const { return Decimal::from_ratio(commission_rate_nom, commission_rate_denom); }
};

struct SwapResult {
    uint128 return_amount;      // after commission
    uint128 spread_amount;
    uint128 commission_amount;
};

struct ReverseSwapResult {
    uint128 offer_amount;
    uint128 spread_amount;
    uint128 commission_amount;
};

class SwapMath {
public:
    // offer_pool excludes the offered amount. The retained ask reserve
    // cp / (offer_pool + offer_amount) is rounded up so the pricing invariant
    // never decreases; the commission stays in the pool.
    static SwapResult compute_swap(
        const uint128& offer_pool,
        const uint128& ask_pool,
        const uint128& offer_amount,
        const uint128& commission_rate_nom,
        const uint128& commission_rate_denom
    );

    static SwapResult compute_swap(
        const uint128& offer_pool,
        const uint128& ask_pool,
        const uint128& offer_amount,
        const FeeConfig& fee
    ) {
        return compute_swap(offer_pool, ask_pool, offer_amount,
                            fee.commission_rate_nom, fee.commission_rate_denom);
    }

    // Inverse quote: input required to receive ask_amount after commission.
    // offer_amount = cp / (ask_pool - ask_amount / (1 - commission_rate)) - offer_pool
    static ReverseSwapResult compute_offer_amount(
        const uint128& offer_pool,
        const uint128& ask_pool,
        const uint128& ask_amount,
        const uint128& commission_rate_nom,
        const uint128& commission_rate_denom
    );
};

} // namespace cpamm

#endif // CPAMM_SWAP_MATH_HPP
