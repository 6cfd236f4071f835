#include "cpamm/pair.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/liquidity_math.hpp"
#include "cpamm/trace.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace cpamm {

namespace {

uint128 add_volume(const uint128& volume, const uint128& amount) {
    return u256::to_amount(
        u256::expect(u256::add(uint256(volume), uint256(amount)),
                     "Cannot calculate volume " + volume.str() + " + " + amount.str()),
        "volume"
    );
}

} // namespace

Pair::Pair(PairInfo info, Ledger& ledger, const PairSettings& settings, EntropySource& entropy)
    : info_(std::move(info)), ledger_(ledger), settings_(settings), entropy_(entropy) {
    if (info_.asset_infos[0] == info_.asset_infos[1]) {
        throw InvalidAsset("Pair assets must differ: " + info_.asset_infos[0].to_string());
    }
    if (info_.asset_infos[1] < info_.asset_infos[0]) {
        std::swap(info_.asset_infos[0], info_.asset_infos[1]);
        std::swap(info_.asset0_volume, info_.asset1_volume);
    }
}

// ---- provide_liquidity ----

ProvideLiquidityResponse Pair::provide_liquidity(
    const std::string& sender,
    const std::array<Asset, 2>& assets,
    const std::optional<Decimal>& slippage_tolerance
) {
    std::array<Asset, 2> pools = ledger_.query_pools(info_.asset_infos);

    std::array<uint128, 2> deposits;
    for (std::size_t i = 0; i < 2; ++i) {
        auto it = std::find_if(assets.begin(), assets.end(),
                               [&](const Asset& a) { return a.info == pools[i].info; });
        if (it == assets.end()) {
            throw InvalidAsset("Wrong asset info is given");
        }
        deposits[i] = it->amount;
    }

    // Native deposits arrive with the message, so the pool balance already
    // includes them.
    std::array<uint128, 2> reserves;
    for (std::size_t i = 0; i < 2; ++i) {
        if (pools[i].info.is_native()) {
            reserves[i] = u256::to_amount(
                u256::expect(u256::sub(uint256(pools[i].amount), uint256(deposits[i])),
                             "native deposit " + deposits[i].str() + " larger than pool balance "
                                 + pools[i].amount.str()),
                "reserve"
            );
        } else {
            reserves[i] = pools[i].amount;
        }
    }

    assert_slippage_tolerance(slippage_tolerance, deposits, reserves);

    const uint128 total_share = ledger_.query_total_share();
    const uint128 share = total_share == 0
        ? LiquidityMath::compute_initial_shares(deposits[0], deposits[1])
        : LiquidityMath::compute_additional_shares(deposits[0], deposits[1], reserves[0], reserves[1],
                                                   total_share);

    ProvideLiquidityResponse response{
        {Asset{pools[0].info, deposits[0]}, Asset{pools[1].info, deposits[1]}},
        share
    };

    for (const auto& deposit : response.deposits) {
        if (!deposit.info.is_native()) {
            ledger_.transfer_from(sender, deposit);
        }
    }
    ledger_.mint_shares(sender, share);

    entropy_.mix("provide_liquidity:" + sender + ":" + response.deposits[0].to_string() + ","
                 + response.deposits[1].to_string());

    if (trace_enabled()) {
        std::cout << "TRACE provide_liquidity sender=" << sender
                  << " deposits=" << response.deposits[0] << "," << response.deposits[1]
                  << " reserves=" << reserves[0] << "," << reserves[1]
                  << " total_share=" << total_share
                  << " share=" << share << std::endl;
    }
    return response;
}

// ---- withdraw_liquidity ----

WithdrawLiquidityResponse Pair::withdraw_liquidity(const std::string& sender, const uint128& amount) {
    const std::array<Asset, 2> pools = ledger_.query_pools(info_.asset_infos);
    const uint128 total_share = ledger_.query_total_share();
    if (amount > total_share) {
        throw std::invalid_argument(
            "insufficient LP tokens: burn " + amount.str() + " > total_share " + total_share.str()
        );
    }

    WithdrawLiquidityResponse response{amount, {}};
    for (std::size_t i = 0; i < 2; ++i) {
        response.refund_assets[i] = Asset{
            pools[i].info,
            LiquidityMath::compute_withdrawal(pools[i].amount, amount, total_share)
        };
    }

    ledger_.burn_shares(sender, amount);
    for (const auto& refund : response.refund_assets) {
        ledger_.transfer(sender, refund);
    }

    entropy_.mix("withdraw_liquidity:" + sender + ":" + amount.str());

    if (trace_enabled()) {
        std::cout << "TRACE withdraw_liquidity sender=" << sender
                  << " withdrawn_share=" << amount
                  << " total_share=" << total_share
                  << " refund=" << response.refund_assets[0] << "," << response.refund_assets[1]
                  << std::endl;
    }
    return response;
}

// ---- swap ----

SwapResponse Pair::swap(const std::string& sender, const Asset& offer_asset, const SwapOptions& options) {
    const std::array<Asset, 2> pools = ledger_.query_pools(info_.asset_infos);

    std::size_t offer_idx;
    if (offer_asset.info == pools[0].info) {
        offer_idx = 0;
    } else if (offer_asset.info == pools[1].info) {
        offer_idx = 1;
    } else {
        throw InvalidAsset("Wrong asset info is given");
    }
    const std::size_t ask_idx = 1 - offer_idx;

    // the offered amount is already part of the pool balance
    const auto offer_pool = u256::sub(uint256(pools[offer_idx].amount), uint256(offer_asset.amount));
    if (!offer_pool) {
        throw ArithmeticError("offer_amount larger than pool_amount + offer_amount");
    }

    const FeeConfig fee = settings_.swap_fee();
    const SwapResult result = SwapMath::compute_swap(
        static_cast<uint128>(*offer_pool),
        pools[ask_idx].amount,
        offer_asset.amount,
        fee
    );

    assert_max_spread(options.belief_price, options.max_spread, options.expected_return,
                      offer_asset.amount, result);

    uint128& volume = offer_idx == 0 ? info_.asset0_volume : info_.asset1_volume;
    const uint128 new_volume = add_volume(volume, offer_asset.amount);

    SwapResponse response{
        offer_asset,
        Asset{pools[ask_idx].info, result.return_amount},
        result.spread_amount,
        result.commission_amount,
        options.to.value_or(sender)
    };

    ledger_.transfer(response.recipient, response.return_asset);
    volume = new_volume;

    entropy_.mix("swap:" + sender + ":" + offer_asset.to_string());

    if (trace_enabled()) {
        std::cout << "TRACE swap sender=" << sender
                  << " offer=" << offer_asset
                  << " ask_asset=" << response.return_asset.info
                  << " offer_pool=" << *offer_pool
                  << " ask_pool=" << pools[ask_idx].amount
                  << " return_amount=" << result.return_amount
                  << " spread_amount=" << result.spread_amount
                  << " commission_amount=" << result.commission_amount << std::endl;
    }
    return response;
}

// ---- queries ----

std::array<Asset, 2> Pair::observed_pools() {
    std::array<Asset, 2> pools = ledger_.query_pools(info_.asset_infos);
    const ObservedPool observed = obfuscate({pools[0].amount, pools[1].amount}, uint128(0), entropy_);
    pools[0].amount = observed.reserves[0];
    pools[1].amount = observed.reserves[1];
    return pools;
}

PoolResponse Pair::query_pool() {
    std::array<Asset, 2> pools = ledger_.query_pools(info_.asset_infos);
    const ObservedPool observed = obfuscate(
        {pools[0].amount, pools[1].amount}, ledger_.query_total_share(), entropy_
    );
    pools[0].amount = observed.reserves[0];
    pools[1].amount = observed.reserves[1];
    return {pools, observed.total_share};
}

SimulationResponse Pair::query_simulation(const Asset& offer_asset) {
    const std::array<Asset, 2> pools = observed_pools();

    std::size_t offer_idx;
    if (offer_asset.info == pools[0].info) {
        offer_idx = 0;
    } else if (offer_asset.info == pools[1].info) {
        offer_idx = 1;
    } else {
        throw InvalidAsset("Given offer asset is not belong to pairs");
    }

    return SwapMath::compute_swap(
        pools[offer_idx].amount, pools[1 - offer_idx].amount, offer_asset.amount, settings_.swap_fee()
    );
}

ReverseSimulationResponse Pair::query_reverse_simulation(const Asset& ask_asset) {
    const std::array<Asset, 2> pools = observed_pools();

    std::size_t ask_idx;
    if (ask_asset.info == pools[0].info) {
        ask_idx = 0;
    } else if (ask_asset.info == pools[1].info) {
        ask_idx = 1;
    } else {
        throw InvalidAsset("Given ask asset is not belong to pairs");
    }

    const FeeConfig fee = settings_.swap_fee();
    return SwapMath::compute_offer_amount(
        pools[1 - ask_idx].amount, pools[ask_idx].amount, ask_asset.amount,
        fee.commission_rate_nom, fee.commission_rate_denom
    );
}

} // namespace cpamm
