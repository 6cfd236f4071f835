#include <boost/test/unit_test.hpp>

#include <cpamm/errors.hpp>
#include <cpamm/memory_ledger.hpp>
#include <cpamm/pair.hpp>

#include <deque>
#include <set>
#include <string>
#include <string_view>
#include <vector>

using namespace cpamm;

namespace {

// Hands out queued draws, then zeros. Records mixed-in action data.
class ScriptedEntropy : public EntropySource {
public:
    std::uint64_t next_u64() override {
        ++draws;
        if (queue.empty()) return 0;
        std::uint64_t v = queue.front();
        queue.pop_front();
        return v;
    }
    void mix(std::string_view data) override { mixed.emplace_back(data); }

    std::deque<std::uint64_t> queue;
    std::vector<std::string> mixed;
    int draws = 0;
};

const AssetInfo scrt = AssetInfo::native("uscrt");
const AssetInfo sefi = AssetInfo::token("secret1sefi");
const AssetInfo other = AssetInfo::token("secret1other");

Asset asset(const AssetInfo& info, unsigned long long amount) {
    return Asset{info, uint128(amount)};
}

struct PairFixture {
    PairFixture()
        : ledger("secret1pair"),
          settings(FeeConfig{3, 1000}),
          pair(PairInfo{{sefi, scrt}, "secret1pair", "secret1lp"}, ledger, settings, entropy) {
        ledger.credit("alice", asset(scrt, 2000000));
        ledger.credit("alice", asset(sefi, 8000000));
        ledger.credit("bob", asset(scrt, 50000));
        ledger.credit("bob", asset(sefi, 50000));
    }

    // Initial 1:4 deposit by alice: 1e6 uscrt + 4e6 sefi -> 2e6 shares.
    void seed_liquidity() {
        ledger.send("alice", asset(scrt, 1000000));
        pair.provide_liquidity("alice", {asset(scrt, 1000000), asset(sefi, 4000000)});
    }

    // bob swaps 10000 uscrt for sefi.
    SwapResponse bob_swaps(const SwapOptions& options = {}) {
        ledger.send("bob", asset(scrt, 10000));
        return pair.swap("bob", asset(scrt, 10000), options);
    }

    std::array<Asset, 2> pools() const { return ledger.query_pools(pair.pair_info().asset_infos); }

    MemoryLedger ledger;
    StaticPairSettings settings;
    ScriptedEntropy entropy;
    Pair pair;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(pair_tests, PairFixture)

BOOST_AUTO_TEST_CASE(assets_are_ordered_canonically) {
    const PairInfo& info = pair.pair_info();
    BOOST_CHECK(info.asset_infos[0] == scrt);
    BOOST_CHECK(info.asset_infos[1] == sefi);
    BOOST_CHECK_EQUAL(info.liquidity_token, "secret1lp");
}

BOOST_AUTO_TEST_CASE(identical_assets_are_rejected) {
    BOOST_CHECK_THROW(Pair(PairInfo{{scrt, scrt}, "p", "lp"}, ledger, settings, entropy), InvalidAsset);
}

BOOST_AUTO_TEST_CASE(initial_deposit_mints_geometric_mean) {
    ledger.send("alice", asset(scrt, 1000000));
    auto r = pair.provide_liquidity("alice", {asset(sefi, 4000000), asset(scrt, 1000000)}, Decimal::parse("0.01"));

    BOOST_CHECK_EQUAL(r.share, uint128(2000000));
    BOOST_CHECK(r.deposits[0].info == scrt);
    BOOST_CHECK_EQUAL(ledger.share_balance("alice"), uint128(2000000));
    BOOST_CHECK_EQUAL(ledger.query_total_share(), uint128(2000000));
    BOOST_CHECK_EQUAL(pools()[0].amount, uint128(1000000));
    BOOST_CHECK_EQUAL(pools()[1].amount, uint128(4000000));
    BOOST_CHECK_EQUAL(ledger.balance("alice", sefi), uint128(4000000));
    BOOST_CHECK_EQUAL(entropy.mixed.size(), 1u);
}

BOOST_AUTO_TEST_CASE(additional_deposit_is_proportional) {
    seed_liquidity();
    ledger.send("bob", asset(scrt, 1000));
    auto r = pair.provide_liquidity("bob", {asset(scrt, 1000), asset(sefi, 4000)}, Decimal::parse("0.01"));
    BOOST_CHECK_EQUAL(r.share, uint128(2000));
    BOOST_CHECK_EQUAL(ledger.share_balance("bob"), uint128(2000));
    BOOST_CHECK_EQUAL(pools()[0].amount, uint128(1001000));
    BOOST_CHECK_EQUAL(pools()[1].amount, uint128(4004000));
}

BOOST_AUTO_TEST_CASE(deposit_outside_tolerance_changes_nothing) {
    seed_liquidity();
    ledger.send("bob", asset(scrt, 1000));
    const MemoryLedger before = ledger;

    BOOST_CHECK_THROW(
        pair.provide_liquidity("bob", {asset(scrt, 1000), asset(sefi, 1000)}, Decimal::parse("0.01")),
        SlippageExceeded
    );
    BOOST_CHECK_EQUAL(ledger.balance("bob", sefi), before.balance("bob", sefi));
    BOOST_CHECK_EQUAL(ledger.query_total_share(), before.query_total_share());
    BOOST_CHECK_EQUAL(ledger.share_balance("bob"), uint128(0));
}

BOOST_AUTO_TEST_CASE(deposit_of_foreign_asset_is_rejected) {
    BOOST_CHECK_THROW(pair.provide_liquidity("alice", {asset(scrt, 1000), asset(other, 1000)}), InvalidAsset);
    BOOST_CHECK_THROW(pair.provide_liquidity("alice", {asset(sefi, 1000), asset(sefi, 1000)}), InvalidAsset);
    BOOST_CHECK_EQUAL(ledger.query_total_share(), uint128(0));
}

BOOST_AUTO_TEST_CASE(native_deposit_not_sent_fails) {
    BOOST_CHECK_THROW(pair.provide_liquidity("alice", {asset(scrt, 1000), asset(sefi, 1000)}), ArithmeticError);
}

BOOST_AUTO_TEST_CASE(swap_pays_out_and_keeps_commission) {
    seed_liquidity();
    auto r = bob_swaps();

    BOOST_CHECK(r.return_asset.info == sefi);
    BOOST_CHECK_EQUAL(r.return_asset.amount, uint128(39485));
    BOOST_CHECK_EQUAL(r.spread_amount, uint128(397));
    BOOST_CHECK_EQUAL(r.commission_amount, uint128(118));
    BOOST_CHECK_EQUAL(r.recipient, "bob");

    BOOST_CHECK_EQUAL(ledger.balance("bob", sefi), uint128(50000 + 39485));
    BOOST_CHECK_EQUAL(ledger.balance("bob", scrt), uint128(40000));
    BOOST_CHECK_EQUAL(pools()[0].amount, uint128(1010000));
    BOOST_CHECK_EQUAL(pools()[1].amount, uint128(3960515));

    BOOST_CHECK_EQUAL(pair.pair_info().asset0_volume, uint128(10000));
    BOOST_CHECK_EQUAL(pair.pair_info().asset1_volume, uint128(0));
}

BOOST_AUTO_TEST_CASE(swap_to_another_recipient) {
    seed_liquidity();
    SwapOptions options;
    options.to = "carol";
    auto r = bob_swaps(options);
    BOOST_CHECK_EQUAL(r.recipient, "carol");
    BOOST_CHECK_EQUAL(ledger.balance("carol", sefi), uint128(39485));
    BOOST_CHECK_EQUAL(ledger.balance("bob", sefi), uint128(50000));
}

BOOST_AUTO_TEST_CASE(rejected_swap_changes_nothing) {
    seed_liquidity();
    SwapOptions options;
    options.expected_return = uint128(39486);

    ledger.send("bob", asset(scrt, 10000));
    const auto pools_before = pools();
    BOOST_CHECK_THROW(pair.swap("bob", asset(scrt, 10000), options), ReturnBelowExpected);

    BOOST_CHECK_EQUAL(pools()[0].amount, pools_before[0].amount);
    BOOST_CHECK_EQUAL(pools()[1].amount, pools_before[1].amount);
    BOOST_CHECK_EQUAL(ledger.balance("bob", sefi), uint128(50000));
    BOOST_CHECK_EQUAL(pair.pair_info().asset0_volume, uint128(0));
    BOOST_CHECK_EQUAL(entropy.mixed.size(), 1u);
}

BOOST_AUTO_TEST_CASE(swap_with_exact_expected_return) {
    seed_liquidity();
    SwapOptions options;
    options.expected_return = uint128(39485);
    BOOST_CHECK_NO_THROW(bob_swaps(options));
}

BOOST_AUTO_TEST_CASE(swap_of_foreign_asset_is_rejected) {
    seed_liquidity();
    BOOST_CHECK_THROW(pair.swap("bob", asset(other, 10)), InvalidAsset);
}

BOOST_AUTO_TEST_CASE(swap_offer_not_in_pool_fails) {
    seed_liquidity();
    BOOST_CHECK_THROW(pair.swap("bob", asset(scrt, 2000000)), ArithmeticError);
}

BOOST_AUTO_TEST_CASE(swap_on_empty_pool_is_degenerate) {
    ledger.send("bob", asset(scrt, 10000));
    BOOST_CHECK_THROW(pair.swap("bob", asset(scrt, 10000)), DegenerateState);
}

BOOST_AUTO_TEST_CASE(volume_tracks_each_side) {
    seed_liquidity();
    bob_swaps();
    // sefi is a token: the hook delivers it to the pool before the swap
    ledger.send("bob", asset(sefi, 20000));
    pair.swap("bob", asset(sefi, 20000));
    BOOST_CHECK_EQUAL(pair.pair_info().asset0_volume, uint128(10000));
    BOOST_CHECK_EQUAL(pair.pair_info().asset1_volume, uint128(20000));
}

BOOST_AUTO_TEST_CASE(withdraw_returns_pro_rata_share) {
    seed_liquidity();
    bob_swaps();

    auto r = pair.withdraw_liquidity("alice", 1000000);
    BOOST_CHECK_EQUAL(r.withdrawn_share, uint128(1000000));
    BOOST_CHECK_EQUAL(r.refund_assets[0].amount, uint128(505000));
    BOOST_CHECK_EQUAL(r.refund_assets[1].amount, uint128(1980257));

    BOOST_CHECK_EQUAL(ledger.query_total_share(), uint128(1000000));
    BOOST_CHECK_EQUAL(ledger.share_balance("alice"), uint128(1000000));
    BOOST_CHECK_EQUAL(ledger.balance("alice", scrt), uint128(1000000 + 505000));
    BOOST_CHECK_EQUAL(pools()[0].amount, uint128(505000));
    BOOST_CHECK_EQUAL(pools()[1].amount, uint128(3960515 - 1980257));
}

BOOST_AUTO_TEST_CASE(withdraw_more_than_supply_fails) {
    seed_liquidity();
    BOOST_CHECK_THROW(pair.withdraw_liquidity("alice", 2000001), std::invalid_argument);
    BOOST_CHECK_EQUAL(ledger.query_total_share(), uint128(2000000));
}

BOOST_AUTO_TEST_CASE(withdraw_without_supply_is_degenerate) {
    BOOST_CHECK_THROW(pair.withdraw_liquidity("alice", 0), DegenerateState);
}

BOOST_AUTO_TEST_CASE(withdraw_everything_then_redeposit) {
    seed_liquidity();
    auto r = pair.withdraw_liquidity("alice", 2000000);
    BOOST_CHECK_EQUAL(ledger.query_total_share(), uint128(0));
    BOOST_CHECK_EQUAL(pools()[0].amount, uint128(0));

    ledger.send("alice", r.refund_assets[0]);
    auto again = pair.provide_liquidity("alice", r.refund_assets);
    BOOST_CHECK(again.share <= r.withdrawn_share);
}

BOOST_AUTO_TEST_CASE(query_pool_is_obfuscated) {
    seed_liquidity();
    bob_swaps();
    entropy.queue = {4, 7};

    auto up = pair.query_pool();
    BOOST_CHECK_EQUAL(up.assets[0].amount, uint128(1010404));
    BOOST_CHECK_EQUAL(up.assets[1].amount, uint128(3962099));
    BOOST_CHECK_EQUAL(up.total_share, uint128(2000800));

    auto down = pair.query_pool();
    BOOST_CHECK_EQUAL(down.assets[0].amount, uint128(1009293));
    BOOST_CHECK_EQUAL(down.total_share, uint128(1998600));

    BOOST_CHECK_EQUAL(entropy.draws, 2);
    // true reserves untouched
    BOOST_CHECK_EQUAL(pools()[0].amount, uint128(1010000));
    BOOST_CHECK_EQUAL(pools()[1].amount, uint128(3960515));
}

BOOST_AUTO_TEST_CASE(simulations_use_one_draw_each) {
    seed_liquidity();
    bob_swaps();

    auto sim = pair.query_simulation(asset(scrt, 5000));
    BOOST_CHECK_EQUAL(sim.return_amount, uint128(19451));
    BOOST_CHECK_EQUAL(sim.spread_amount, uint128(97));
    BOOST_CHECK_EQUAL(sim.commission_amount, uint128(58));

    auto rev = pair.query_reverse_simulation(asset(sefi, 5000));
    BOOST_CHECK_EQUAL(rev.offer_amount, uint128(1280));
    BOOST_CHECK_EQUAL(rev.spread_amount, uint128(4));
    BOOST_CHECK_EQUAL(rev.commission_amount, uint128(15));

    BOOST_CHECK_EQUAL(entropy.draws, 2);
}

BOOST_AUTO_TEST_CASE(simulations_reject_foreign_assets) {
    seed_liquidity();
    BOOST_CHECK_THROW(pair.query_simulation(asset(other, 5000)), InvalidAsset);
    BOOST_CHECK_THROW(pair.query_reverse_simulation(asset(other, 5000)), InvalidAsset);
}

BOOST_AUTO_TEST_CASE(observation_does_not_move_committed_swaps) {
    seed_liquidity();
    SeededEntropy seeded("pair-seed");
    Pair observed(PairInfo{{scrt, sefi}, "secret1pair", "secret1lp"}, ledger, settings, seeded);

    std::set<uint128> seen;
    for (int i = 0; i < 20; ++i) {
        seen.insert(observed.query_pool().assets[0].amount);
    }
    BOOST_CHECK(seen.size() > 1);

    ledger.send("bob", asset(scrt, 10000));
    auto r = observed.swap("bob", asset(scrt, 10000));
    auto expected = SwapMath::compute_swap(1000000, 4000000, 10000, settings.swap_fee());
    BOOST_CHECK_EQUAL(r.return_asset.amount, expected.return_amount);
    BOOST_CHECK_EQUAL(r.return_asset.amount, uint128(39485));
}

BOOST_AUTO_TEST_CASE(memory_ledger_rejects_overdraft) {
    BOOST_CHECK_THROW(ledger.send("bob", asset(scrt, 50001)), std::runtime_error);
    BOOST_CHECK_THROW(ledger.burn_shares("bob", 1), std::runtime_error);
    BOOST_CHECK_EQUAL(ledger.balance("bob", scrt), uint128(50000));
}

BOOST_AUTO_TEST_SUITE_END()
