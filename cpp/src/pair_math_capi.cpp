// C API wrapper exposing the pair math (uint128 amounts as strings)
#include "cpamm/capi.h"
#include "cpamm/liquidity_math.hpp"
#include "cpamm/obfuscation.hpp"
#include "cpamm/swap_math.hpp"

#include <array>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>

using cpamm::uint128;

namespace {

thread_local std::string last_error;

char* alloc_cstr(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

template <std::size_t N>
char** alloc_array(const std::array<std::string, N>& values) {
    char** arr = static_cast<char**>(std::malloc(sizeof(char*) * N));
    if (!arr) return nullptr;
    for (std::size_t i = 0; i < N; ++i) {
        arr[i] = alloc_cstr(values[i]);
        if (!arr[i]) {
            cpamm_free_string_array(arr, static_cast<int>(i));
            return nullptr;
        }
    }
    return arr;
}

uint128 to_amount(const char* s, const char* name) {
    if (!s) {
        throw std::invalid_argument(std::string(name) + " is null");
    }
    return cpamm::parse_amount(s);
}

// Runs `f`, recording the message of any std::exception for cpamm_last_error.
template <class F>
auto guarded(F&& f) -> decltype(f()) {
    last_error.clear();
    try {
        return f();
    } catch (const std::exception& e) {
        last_error = e.what();
        return nullptr;
    }
}

} // namespace

extern "C" {

char** cpamm_compute_swap(const char* offer_pool, const char* ask_pool, const char* offer_amount,
                          const char* commission_rate_nom, const char* commission_rate_denom) {
    return guarded([&]() {
        auto r = cpamm::SwapMath::compute_swap(
            to_amount(offer_pool, "offer_pool"),
            to_amount(ask_pool, "ask_pool"),
            to_amount(offer_amount, "offer_amount"),
            to_amount(commission_rate_nom, "commission_rate_nom"),
            to_amount(commission_rate_denom, "commission_rate_denom")
        );
        return alloc_array<3>({r.return_amount.str(), r.spread_amount.str(), r.commission_amount.str()});
    });
}

char** cpamm_compute_offer_amount(const char* offer_pool, const char* ask_pool, const char* ask_amount,
                                  const char* commission_rate_nom, const char* commission_rate_denom) {
    return guarded([&]() {
        auto r = cpamm::SwapMath::compute_offer_amount(
            to_amount(offer_pool, "offer_pool"),
            to_amount(ask_pool, "ask_pool"),
            to_amount(ask_amount, "ask_amount"),
            to_amount(commission_rate_nom, "commission_rate_nom"),
            to_amount(commission_rate_denom, "commission_rate_denom")
        );
        return alloc_array<3>({r.offer_amount.str(), r.spread_amount.str(), r.commission_amount.str()});
    });
}

char* cpamm_initial_shares(const char* deposit0, const char* deposit1) {
    return guarded([&]() {
        return alloc_cstr(cpamm::LiquidityMath::compute_initial_shares(
            to_amount(deposit0, "deposit0"), to_amount(deposit1, "deposit1")
        ).str());
    });
}

char* cpamm_additional_shares(const char* deposit0, const char* deposit1,
                              const char* pool0, const char* pool1, const char* total_share) {
    return guarded([&]() {
        return alloc_cstr(cpamm::LiquidityMath::compute_additional_shares(
            to_amount(deposit0, "deposit0"), to_amount(deposit1, "deposit1"),
            to_amount(pool0, "pool0"), to_amount(pool1, "pool1"),
            to_amount(total_share, "total_share")
        ).str());
    });
}

char* cpamm_withdrawal(const char* reserve, const char* burn_amount, const char* total_share) {
    return guarded([&]() {
        return alloc_cstr(cpamm::LiquidityMath::compute_withdrawal(
            to_amount(reserve, "reserve"), to_amount(burn_amount, "burn_amount"),
            to_amount(total_share, "total_share")
        ).str());
    });
}

char** cpamm_obfuscate(const char* reserve0, const char* reserve1, const char* total_share, uint64_t draw) {
    return guarded([&]() {
        auto observed = cpamm::obfuscate(
            {to_amount(reserve0, "reserve0"), to_amount(reserve1, "reserve1")},
            to_amount(total_share, "total_share"),
            cpamm::noise_ratio(draw)
        );
        return alloc_array<3>({observed.reserves[0].str(), observed.reserves[1].str(),
                               observed.total_share.str()});
    });
}

const char* cpamm_last_error(void) {
    return last_error.c_str();
}

void cpamm_free_string(char* p) {
    if (p) std::free(p);
}

void cpamm_free_string_array(char** arr, int n) {
    if (!arr) return;
    for (int i = 0; i < n; ++i) {
        if (arr[i]) std::free(arr[i]);
    }
    std::free(arr);
}

} // extern "C"
