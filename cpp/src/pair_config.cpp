#include "cpamm/pair_config.hpp"

#include <boost/json/src.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace json = boost::json;

namespace cpamm {

namespace {

std::string str(const json::value& v) {
    return v.as_string().c_str();
}

uint128 amount_at(const json::object& obj, const char* key) {
    return parse_amount(str(obj.at(key)));
}

std::optional<uint128> optional_amount(const json::object& obj, const char* key) {
    if (const json::value* v = obj.if_contains(key)) {
        return parse_amount(str(*v));
    }
    return std::nullopt;
}

std::optional<Decimal> optional_decimal(const json::object& obj, const char* key) {
    if (const json::value* v = obj.if_contains(key)) {
        return Decimal::parse(str(*v));
    }
    return std::nullopt;
}

} // namespace

AssetInfo parse_asset_info(const json::value& v) {
    const json::object& obj = v.as_object();
    if (const json::value* denom = obj.if_contains("native")) {
        return AssetInfo::native(str(*denom));
    }
    if (const json::value* addr = obj.if_contains("token")) {
        return AssetInfo::token(str(*addr));
    }
    throw std::invalid_argument("asset info needs a \"native\" or \"token\" key: " + json::serialize(v));
}

Asset parse_asset(const json::value& v) {
    const json::object& obj = v.as_object();
    return Asset{parse_asset_info(obj.at("info")), amount_at(obj, "amount")};
}

PairConfig parse_pair_config(const json::value& v) {
    const json::object& obj = v.as_object();

    PairConfig cfg;
    cfg.name = str(obj.at("name"));

    const json::array& assets = obj.at("assets").as_array();
    if (assets.size() != 2) {
        throw std::invalid_argument("pair " + cfg.name + ": expected 2 assets, got "
                                    + std::to_string(assets.size()));
    }
    cfg.info.asset_infos = {parse_asset_info(assets[0]), parse_asset_info(assets[1])};
    cfg.info.contract_addr = obj.if_contains("contract_addr") ? str(obj.at("contract_addr")) : cfg.name;
    cfg.info.liquidity_token = obj.if_contains("liquidity_token")
        ? str(obj.at("liquidity_token")) : cfg.name + "_lp";

    cfg.fee.commission_rate_nom = amount_at(obj, "commission_rate_nom");
    cfg.fee.commission_rate_denom = amount_at(obj, "commission_rate_denom");
    if (cfg.fee.commission_rate_denom == 0 || cfg.fee.commission_rate_nom > cfg.fee.commission_rate_denom) {
        throw std::invalid_argument("pair " + cfg.name + ": commission rate "
                                    + cfg.fee.commission_rate_nom.str() + "/"
                                    + cfg.fee.commission_rate_denom.str() + " outside [0, 1]");
    }

    cfg.entropy_seed = obj.if_contains("entropy_seed") ? str(obj.at("entropy_seed")) : cfg.name;

    if (const json::value* balances = obj.if_contains("balances")) {
        for (const auto& b : balances->as_array()) {
            const json::object& entry = b.as_object();
            cfg.balances.push_back({str(entry.at("account")), parse_asset(entry.at("asset"))});
        }
    }
    return cfg;
}

std::vector<PairConfig> parse_pair_configs(const json::value& v) {
    std::vector<PairConfig> out;
    for (const auto& p : v.as_object().at("pairs").as_array()) {
        out.push_back(parse_pair_config(p));
    }
    return out;
}

Action parse_action(const json::value& v) {
    const json::object& obj = v.as_object();
    const std::string type = str(obj.at("type"));

    if (type == "provide_liquidity") {
        const json::array& assets = obj.at("assets").as_array();
        if (assets.size() != 2) {
            throw std::invalid_argument("provide_liquidity: expected 2 assets");
        }
        return ProvideLiquidityAction{
            str(obj.at("sender")),
            {parse_asset(assets[0]), parse_asset(assets[1])},
            optional_decimal(obj, "slippage_tolerance")
        };
    }
    if (type == "withdraw_liquidity") {
        return WithdrawLiquidityAction{str(obj.at("sender")), amount_at(obj, "amount")};
    }
    if (type == "swap") {
        SwapAction action;
        action.sender = str(obj.at("sender"));
        action.offer_asset = parse_asset(obj.at("offer_asset"));
        action.options.expected_return = optional_amount(obj, "expected_return");
        action.options.belief_price = optional_decimal(obj, "belief_price");
        action.options.max_spread = optional_decimal(obj, "max_spread");
        if (const json::value* to = obj.if_contains("to")) {
            action.options.to = str(*to);
        }
        return action;
    }
    if (type == "query_pool") {
        return QueryPoolAction{};
    }
    if (type == "simulation") {
        return SimulationAction{parse_asset(obj.at("offer_asset"))};
    }
    if (type == "reverse_simulation") {
        return ReverseSimulationAction{parse_asset(obj.at("ask_asset"))};
    }
    throw std::invalid_argument("unknown action type: " + type);
}

ActionSequence parse_sequence(const json::value& v) {
    const json::object& obj = v.as_object();
    ActionSequence seq;
    seq.name = str(obj.at("name"));
    for (const auto& a : obj.at("actions").as_array()) {
        seq.actions.push_back(parse_action(a));
    }
    return seq;
}

std::vector<ActionSequence> parse_sequences(const json::value& v) {
    std::vector<ActionSequence> out;
    for (const auto& s : v.as_object().at("sequences").as_array()) {
        out.push_back(parse_sequence(s));
    }
    return out;
}

json::value load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return json::parse(text);
}

json::value to_json(const AssetInfo& info) {
    json::object obj;
    obj[info.is_native() ? "native" : "token"] = info.id;
    return obj;
}

json::value to_json(const Asset& asset) {
    json::object obj;
    obj["info"] = to_json(asset.info);
    obj["amount"] = asset.amount.str();
    return obj;
}

} // namespace cpamm
