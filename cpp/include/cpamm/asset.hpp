#pragma once

#include <iosfwd>
#include <string>
#include <utility>

#include "u256_math.hpp"

namespace cpamm {

// Asset kind: the chain's native coin (identified by denom) or a fungible
// token (identified by its contract address).
struct AssetInfo {
    enum class Kind { Native, Token };

    Kind kind{Kind::Native};
    std::string id;

    static AssetInfo native(std::string denom) { return {Kind::Native, std::move(denom)}; }
    static AssetInfo token(std::string contract_addr) { return {Kind::Token, std::move(contract_addr)}; }

    bool is_native() const { return kind == Kind::Native; }
    std::string to_string() const { return id; }

    bool operator==(const AssetInfo& o) const { return kind == o.kind && id == o.id; }
    bool operator!=(const AssetInfo& o) const { return !(*this == o); }
    // canonical pair ordering: natives first, then by id
    bool operator<(const AssetInfo& o) const {
        if (kind != o.kind) return kind < o.kind;
        return id < o.id;
    }
};

struct Asset {
    AssetInfo info;
    uint128 amount{0};

    std::string to_string() const { return amount.str() + info.id; }
};

std::ostream& operator<<(std::ostream& os, const AssetInfo& info);
std::ostream& operator<<(std::ostream& os, const Asset& asset);

} // namespace cpamm
