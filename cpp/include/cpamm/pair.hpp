#ifndef CPAMM_PAIR_HPP
#define CPAMM_PAIR_HPP

#include <array>
#include <optional>
#include <string>

#include "asset.hpp"
#include "decimal.hpp"
#include "guards.hpp"
#include "obfuscation.hpp"
#include "swap_math.hpp"

namespace cpamm {

struct PairInfo {
    std::array<AssetInfo, 2> asset_infos;
    std::string contract_addr;
    std::string liquidity_token;
    // cumulative offered amount per side, committed swaps only
    uint128 asset0_volume{0};
    uint128 asset1_volume{0};
};

// Holder of the true reserves and the share supply. The pair never keeps
// either; every action reads them fresh and settles through these calls.
class Ledger {
public:
    virtual ~Ledger() = default;

    // Pool account balances, one per info, in the order given.
    virtual std::array<Asset, 2> query_pools(const std::array<AssetInfo, 2>& infos) const = 0;
    virtual uint128 query_total_share() const = 0;

    // owner -> pool
    virtual void transfer_from(const std::string& owner, const Asset& asset) = 0;
    // pool -> recipient
    virtual void transfer(const std::string& recipient, const Asset& asset) = 0;

    virtual void mint_shares(const std::string& recipient, const uint128& amount) = 0;
    virtual void burn_shares(const std::string& owner, const uint128& amount) = 0;
};

class PairSettings {
public:
    virtual ~PairSettings() = default;
    virtual FeeConfig swap_fee() const = 0;
};

class StaticPairSettings : public PairSettings {
public:
    explicit StaticPairSettings(FeeConfig fee) : fee_(fee) {}
    FeeConfig swap_fee() const override { return fee_; }

private:
    FeeConfig fee_;
};

struct SwapOptions {
    std::optional<uint128> expected_return;
    std::optional<Decimal> belief_price;
    std::optional<Decimal> max_spread;
    // recipient of the return asset; sender when absent
    std::optional<std::string> to;
};

struct ProvideLiquidityResponse {
    std::array<Asset, 2> deposits;
    uint128 share;
};

struct WithdrawLiquidityResponse {
    uint128 withdrawn_share;
    std::array<Asset, 2> refund_assets;
};

struct SwapResponse {
    Asset offer_asset;
    Asset return_asset;
    uint128 spread_amount;
    uint128 commission_amount;
    std::string recipient;
};

struct PoolResponse {
    std::array<Asset, 2> assets;
    uint128 total_share;
};

using SimulationResponse = SwapResult;
using ReverseSimulationResponse = ReverseSwapResult;

// Dispatcher for one two-asset pool.
//
// Actions compute every amount and run every guard before the first ledger
// call, so a computational failure or guard rejection leaves the ledger and
// the volume counters untouched. Failures raised by the ledger itself are
// propagated; undoing earlier transfers of the same action is the ledger
// owner's concern.
//
// Queries observe reserves through one obfuscation draw each and never touch
// the ledger's state. Not thread-safe.
class Pair {
public:
    // Asset infos are stored in canonical order. Throws InvalidAsset when both
    // sides name the same asset.
    Pair(PairInfo info, Ledger& ledger, const PairSettings& settings, EntropySource& entropy);

    // Native deposits must already be credited to the pool; token deposits are
    // pulled from `sender`.
    ProvideLiquidityResponse provide_liquidity(
        const std::string& sender,
        const std::array<Asset, 2>& assets,
        const std::optional<Decimal>& slippage_tolerance = std::nullopt
    );

    WithdrawLiquidityResponse withdraw_liquidity(const std::string& sender, const uint128& amount);

    // The offered amount must already be credited to the pool.
    SwapResponse swap(
        const std::string& sender,
        const Asset& offer_asset,
        const SwapOptions& options = {}
    );

    const PairInfo& pair_info() const { return info_; }
    PoolResponse query_pool();
    SimulationResponse query_simulation(const Asset& offer_asset);
    ReverseSimulationResponse query_reverse_simulation(const Asset& ask_asset);

private:
    std::array<Asset, 2> observed_pools();

    PairInfo info_;
    Ledger& ledger_;
    const PairSettings& settings_;
    EntropySource& entropy_;
};

} // namespace cpamm

#endif // CPAMM_PAIR_HPP
