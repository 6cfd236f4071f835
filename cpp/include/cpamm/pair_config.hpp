#ifndef CPAMM_PAIR_CONFIG_HPP
#define CPAMM_PAIR_CONFIG_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/json.hpp>

#include "asset.hpp"
#include "pair.hpp"

namespace cpamm {

// Scenario files for the pair harness. Amounts are decimal strings, rates and
// tolerances decimal strings such as "0.01"; asset infos are written as
// {"native": "<denom>"} or {"token": "<contract_addr>"}.

struct AccountFunding {
    std::string account;
    Asset asset;
};

struct PairConfig {
    std::string name;
    PairInfo info;
    FeeConfig fee;
    std::string entropy_seed;
    std::vector<AccountFunding> balances;
};

struct ProvideLiquidityAction {
    std::string sender;
    std::array<Asset, 2> assets;
    std::optional<Decimal> slippage_tolerance;
};

struct WithdrawLiquidityAction {
    std::string sender;
    uint128 amount;
};

struct SwapAction {
    std::string sender;
    Asset offer_asset;
    SwapOptions options;
};

struct QueryPoolAction {};

struct SimulationAction {
    Asset offer_asset;
};

struct ReverseSimulationAction {
    Asset ask_asset;
};

using Action = std::variant<
    ProvideLiquidityAction,
    WithdrawLiquidityAction,
    SwapAction,
    QueryPoolAction,
    SimulationAction,
    ReverseSimulationAction
>;

struct ActionSequence {
    std::string name;
    std::vector<Action> actions;
};

// Parsers throw std::invalid_argument for malformed amounts, decimals and
// unknown action types. Missing keys and wrong value kinds surface as the
// exceptions Boost.JSON raises from at() and as_*().
AssetInfo parse_asset_info(const boost::json::value& v);
Asset parse_asset(const boost::json::value& v);
PairConfig parse_pair_config(const boost::json::value& v);
std::vector<PairConfig> parse_pair_configs(const boost::json::value& v);
Action parse_action(const boost::json::value& v);
ActionSequence parse_sequence(const boost::json::value& v);
std::vector<ActionSequence> parse_sequences(const boost::json::value& v);

// Reads and parses a whole file; std::runtime_error when it cannot be opened.
boost::json::value load_json_file(const std::string& path);

boost::json::value to_json(const AssetInfo& info);
boost::json::value to_json(const Asset& asset);

} // namespace cpamm

#endif // CPAMM_PAIR_CONFIG_HPP
