#ifndef CPAMM_OBFUSCATION_HPP
#define CPAMM_OBFUSCATION_HPP

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include "u256_math.hpp"

namespace cpamm {

// Source of 64-bit draws for read-only pool queries. mix() folds executed
// actions back into the state so later draws depend on the pool's history.
class EntropySource {
public:
    virtual ~EntropySource() = default;

    virtual std::uint64_t next_u64() = 0;
    virtual void mix(std::string_view) {}
};

// Multiplicative noise applied to every observed value: value * nom / denom.
struct NoiseRatio {
    uint128 nom;
    uint128 denom;
};

// denom = 10000, noise = draw % 100; even draws scale up by noise, odd draws
// scale down. nom is therefore in [9901, 10098].
NoiseRatio noise_ratio(std::uint64_t draw);

struct ObservedPool {
    std::array<uint128, 2> reserves;
    uint128 total_share;
};

// Scales both reserves and the share supply by one ratio so the observed
// price and per-share value stay consistent. Result is for display and
// simulation only.
ObservedPool obfuscate(
    const std::array<uint128, 2>& reserves,
    const uint128& total_share,
    const NoiseRatio& ratio
);

// Takes exactly one draw from `entropy`.
ObservedPool obfuscate(
    const std::array<uint128, 2>& reserves,
    const uint128& total_share,
    EntropySource& entropy
);

// Deterministic entropy: mt19937_64 keyed by a seed string. mix() rekeys the
// engine from the previous seed material plus the new bytes.
class SeededEntropy : public EntropySource {
public:
    explicit SeededEntropy(std::string seed);

    std::uint64_t next_u64() override;
    void mix(std::string_view data) override;

    const std::string& seed() const { return seed_; }

private:
    void reseed();

    std::string seed_;
    std::mt19937_64 engine_;
};

} // namespace cpamm

#endif // CPAMM_OBFUSCATION_HPP
