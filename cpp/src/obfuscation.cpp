#include "cpamm/obfuscation.hpp"
#include "cpamm/errors.hpp"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace cpamm {

namespace {

constexpr std::uint64_t kNoiseDenom = 10000;
constexpr std::uint64_t kNoiseRange = 100;

uint128 scale(const uint128& value, const NoiseRatio& ratio, const char* what) {
    const uint256 v = value;
    const uint256 nom = ratio.nom;
    const uint256 denom = ratio.denom;
    const uint256 scaled = u256::expect(
        u256::div(u256::mul(v, nom), denom),
        std::string("Cannot calculate ") + what + " " + v.str() + " * " + nom.str() + " / " + denom.str()
    );
    return u256::to_amount(scaled, what);
}

// big-endian packing of seed bytes into seed_seq words
std::vector<std::uint32_t> to_words(std::string_view bytes) {
    std::vector<std::uint32_t> words;
    words.reserve(bytes.size() / 4 + 1);
    std::uint32_t w = 0;
    std::size_t n = 0;
    for (unsigned char c : bytes) {
        w = (w << 8) | c;
        if (++n % 4 == 0) {
            words.push_back(w);
            w = 0;
        }
    }
    if (n % 4 != 0 || words.empty()) {
        words.push_back(w);
    }
    return words;
}

} // namespace

NoiseRatio noise_ratio(std::uint64_t draw) {
    const std::uint64_t noise = draw % kNoiseRange;
    const bool is_plus = draw % 2 == 0;
    const std::uint64_t nom = is_plus ? kNoiseDenom + noise : kNoiseDenom - noise;
    return {uint128(nom), uint128(kNoiseDenom)};
}

ObservedPool obfuscate(
    const std::array<uint128, 2>& reserves,
    const uint128& total_share,
    const NoiseRatio& ratio
) {
    if (ratio.denom == 0) {
        throw DegenerateState("obfuscate: noise denominator is zero");
    }
    ObservedPool observed;
    observed.reserves[0] = scale(reserves[0], ratio, "observed reserve 0");
    observed.reserves[1] = scale(reserves[1], ratio, "observed reserve 1");
    observed.total_share = scale(total_share, ratio, "observed total_share");
    return observed;
}

ObservedPool obfuscate(
    const std::array<uint128, 2>& reserves,
    const uint128& total_share,
    EntropySource& entropy
) {
    return obfuscate(reserves, total_share, noise_ratio(entropy.next_u64()));
}

// ---- SeededEntropy ----

SeededEntropy::SeededEntropy(std::string seed) : seed_(std::move(seed)) {
    reseed();
}

std::uint64_t SeededEntropy::next_u64() {
    return engine_();
}

void SeededEntropy::mix(std::string_view data) {
    std::string material = seed_;
    material.append(data.data(), data.size());

    auto words = to_words(material);
    std::seed_seq seq(words.begin(), words.end());
    std::array<std::uint32_t, 8> digest{};
    seq.generate(digest.begin(), digest.end());

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (auto d : digest) {
        os << std::setw(8) << d;
    }
    seed_ = os.str();
    reseed();
}

void SeededEntropy::reseed() {
    auto words = to_words(seed_);
    std::seed_seq seq(words.begin(), words.end());
    engine_.seed(seq);
}

} // namespace cpamm
