#include "cpamm/memory_ledger.hpp"
#include "cpamm/pair.hpp"
#include "cpamm/pair_config.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace cpamm;
namespace json = boost::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::mutex io_mu;

// Numeric environment knob; a malformed value keeps the default with a warning.
long env_long(const char* name, long fallback) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return fallback;
    }
    try {
        return std::stol(raw);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lk(io_mu);
        std::cerr << "Ignoring " << name << "=" << raw << " (" << e.what() << ")" << std::endl;
        return fallback;
    }
}

bool env_flag(const char* name) {
    const char* raw = std::getenv(name);
    return raw && std::string(raw) == "1";
}

// True ledger-side state after an action; obfuscation never applies here.
json::object pool_state(const Pair& pair, const MemoryLedger& ledger) {
    const PairInfo& info = pair.pair_info();
    const auto pools = ledger.query_pools(info.asset_infos);

    json::object obj;
    obj["reserves"] = json::array{pools[0].amount.str(), pools[1].amount.str()};
    obj["total_share"] = ledger.query_total_share().str();
    obj["volumes"] = json::array{info.asset0_volume.str(), info.asset1_volume.str()};
    return obj;
}

json::object swap_result_json(const SwapResult& r) {
    json::object obj;
    obj["return_amount"] = r.return_amount.str();
    obj["spread_amount"] = r.spread_amount.str();
    obj["commission_amount"] = r.commission_amount.str();
    return obj;
}

// Runs one action. State-changing actions settle against `ledger`; the
// returned object carries what the caller would have seen.
json::object run_action(Pair& pair, MemoryLedger& ledger, const Action& action) {
    return std::visit(overloaded{
        [&](const ProvideLiquidityAction& a) {
            // native deposits travel with the message
            for (const auto& asset : a.assets) {
                if (asset.info.is_native()) {
                    ledger.send(a.sender, asset);
                }
            }
            auto r = pair.provide_liquidity(a.sender, a.assets, a.slippage_tolerance);
            json::object obj;
            obj["type"] = "provide_liquidity";
            obj["share"] = r.share.str();
            return obj;
        },
        [&](const WithdrawLiquidityAction& a) {
            auto r = pair.withdraw_liquidity(a.sender, a.amount);
            json::object obj;
            obj["type"] = "withdraw_liquidity";
            obj["refund_assets"] = json::array{to_json(r.refund_assets[0]), to_json(r.refund_assets[1])};
            return obj;
        },
        [&](const SwapAction& a) {
            ledger.send(a.sender, a.offer_asset);
            auto r = pair.swap(a.sender, a.offer_asset, a.options);
            json::object obj;
            obj["type"] = "swap";
            obj["return_asset"] = to_json(r.return_asset);
            obj["spread_amount"] = r.spread_amount.str();
            obj["commission_amount"] = r.commission_amount.str();
            obj["recipient"] = r.recipient;
            return obj;
        },
        [&](const QueryPoolAction&) {
            auto r = pair.query_pool();
            json::object obj;
            obj["type"] = "query_pool";
            obj["assets"] = json::array{to_json(r.assets[0]), to_json(r.assets[1])};
            obj["total_share"] = r.total_share.str();
            return obj;
        },
        [&](const SimulationAction& a) {
            json::object obj = swap_result_json(pair.query_simulation(a.offer_asset));
            obj["type"] = "simulation";
            return obj;
        },
        [&](const ReverseSimulationAction& a) {
            auto r = pair.query_reverse_simulation(a.ask_asset);
            json::object obj;
            obj["type"] = "reverse_simulation";
            obj["offer_amount"] = r.offer_amount.str();
            obj["spread_amount"] = r.spread_amount.str();
            obj["commission_amount"] = r.commission_amount.str();
            return obj;
        }
    }, action);
}

// Process one pair configuration against one action sequence.
// A failing action is reported and rolled back by restoring the ledger copy
// taken before it; the sequence carries on from the restored state.
json::object process_pair_sequence(const PairConfig& cfg, const ActionSequence& seq) {
    json::object result;
    result["pair_name"] = cfg.name;

    try {
        MemoryLedger ledger(cfg.info.contract_addr);
        for (const auto& f : cfg.balances) {
            ledger.credit(f.account, f.asset);
        }
        StaticPairSettings settings(cfg.fee);
        SeededEntropy entropy(cfg.entropy_seed);
        Pair pair(cfg.info, ledger, settings, entropy);

        const bool save_last_only = env_flag("SAVE_LAST_ONLY");
        long snapshot_every = env_long("SNAPSHOT_EVERY", 1);
        if (save_last_only) {
            snapshot_every = 0;
        }

        json::array states;
        bool all_success = true;
        size_t action_idx = 0;

        for (const auto& action : seq.actions) {
            const MemoryLedger before = ledger;

            bool success = true;
            std::string error;
            json::object output;
            try {
                output = run_action(pair, ledger, action);
            } catch (const std::exception& e) {
                success = false;
                error = e.what();
                ledger = before;
            }
            if (!success) all_success = false;

            bool do_snap = false;
            if (snapshot_every == 1) {
                do_snap = true;
            } else if (snapshot_every > 1 && ((action_idx + 1) % snapshot_every == 0)) {
                do_snap = true;
            }

            if (do_snap) {
                json::object state = pool_state(pair, ledger);
                state["action_success"] = success;
                if (success) {
                    state["output"] = output;
                } else {
                    state["error"] = error;
                }
                states.push_back(state);
            }
            action_idx++;
        }

        // final state when intermediate snapshots skipped it
        if (snapshot_every == 0 || (snapshot_every > 1 && (action_idx % snapshot_every != 0))) {
            json::object final_state = pool_state(pair, ledger);
            final_state["action_success"] = all_success;
            states.push_back(final_state);
        }

        if (save_last_only) {
            result["final_state"] = states.back();
        } else {
            result["states"] = states;
        }
        result["success"] = all_success;

    } catch (const std::exception& e) {
        result["success"] = false;
        result["error"] = e.what();
    }

    return result;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <pairs.json> <sequences.json> <output_results.json>" << std::endl;
        return 1;
    }

    std::string pairs_file = argv[1];
    std::string sequences_file = argv[2];
    std::string output_file = argv[3];

    try {
        const std::vector<PairConfig> pairs = parse_pair_configs(load_json_file(pairs_file));
        const std::vector<ActionSequence> sequences = parse_sequences(load_json_file(sequences_file));
        if (sequences.empty()) {
            throw std::runtime_error("No sequences found in " + sequences_file);
        }

        const char* only_pair = std::getenv("FILTER_PAIR");
        const char* only_seq = std::getenv("FILTER_SEQUENCE");

        struct Task { size_t pi; size_t si; };
        std::vector<Task> tasks;
        tasks.reserve(pairs.size() * sequences.size());
        for (size_t pi = 0; pi < pairs.size(); ++pi) {
            if (only_pair && pairs[pi].name != only_pair) continue;
            for (size_t si = 0; si < sequences.size(); ++si) {
                if (only_seq && sequences[si].name != only_seq) continue;
                tasks.push_back({pi, si});
            }
        }

        size_t threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4;
        threads = static_cast<size_t>(std::max<long>(1, env_long("CPP_THREADS", static_cast<long>(threads))));
        std::cout << "Running with " << threads << " worker threads (" << tasks.size() << " tasks)" << std::endl;

        std::vector<json::object> results_vec(tasks.size());
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (;;) {
                size_t idx = next.fetch_add(1);
                if (idx >= tasks.size()) break;
                const auto [pi, si] = tasks[idx];
                {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << "Processing " << pairs[pi].name << " with " << sequences[si].name << "..." << std::endl;
                }
                json::object test_result;
                test_result["pair_config"] = pairs[pi].name;
                test_result["sequence"] = sequences[si].name;
                test_result["result"] = process_pair_sequence(pairs[pi], sequences[si]);
                results_vec[idx] = std::move(test_result);
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (size_t t = 0; t < threads; ++t) workers.emplace_back(worker);
        for (auto& th : workers) th.join();

        json::array results;
        results.reserve(results_vec.size());
        for (auto& obj : results_vec) results.push_back(obj);

        json::object output;
        output["results"] = results;
        output["metadata"] = {
            {"pairs_file", pairs_file},
            {"sequences_file", sequences_file},
            {"num_pairs", pairs.size()},
            {"num_sequences", sequences.size()},
            {"total_tests", tasks.size()}
        };

        std::ofstream out_file(output_file);
        if (!out_file) {
            throw std::runtime_error("Cannot open output file: " + output_file);
        }
        out_file << json::serialize(output) << std::endl;

        std::cout << "\nProcessed " << tasks.size() << " pair-sequence combinations" << std::endl;
        std::cout << "Results written to " << output_file << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
