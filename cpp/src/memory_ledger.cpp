#include "cpamm/memory_ledger.hpp"
#include "cpamm/errors.hpp"

#include <stdexcept>

namespace cpamm {

namespace {

uint128 checked_add(const uint128& a, const uint128& b, const std::string& what) {
    return u256::to_amount(
        u256::expect(u256::add(uint256(a), uint256(b)),
                     "Cannot calculate " + what + " " + a.str() + " + " + b.str()),
        what
    );
}

} // namespace

MemoryLedger::MemoryLedger(std::string pool_account) : pool_account_(std::move(pool_account)) {}

void MemoryLedger::credit(const std::string& account, const Asset& asset) {
    uint128& bal = balances_[Key{account, asset.info}];
    bal = checked_add(bal, asset.amount, "balance");
}

void MemoryLedger::send(const std::string& owner, const Asset& asset) {
    move(owner, pool_account_, asset);
}

uint128 MemoryLedger::balance(const std::string& account, const AssetInfo& info) const {
    auto it = balances_.find(Key{account, info});
    return it == balances_.end() ? uint128(0) : it->second;
}

uint128 MemoryLedger::share_balance(const std::string& account) const {
    auto it = shares_.find(account);
    return it == shares_.end() ? uint128(0) : it->second;
}

std::array<Asset, 2> MemoryLedger::query_pools(const std::array<AssetInfo, 2>& infos) const {
    return {
        Asset{infos[0], balance(pool_account_, infos[0])},
        Asset{infos[1], balance(pool_account_, infos[1])}
    };
}

void MemoryLedger::transfer_from(const std::string& owner, const Asset& asset) {
    move(owner, pool_account_, asset);
}

void MemoryLedger::transfer(const std::string& recipient, const Asset& asset) {
    move(pool_account_, recipient, asset);
}

void MemoryLedger::mint_shares(const std::string& recipient, const uint128& amount) {
    const uint128 supply = checked_add(total_share_, amount, "total_share");
    uint128& held = shares_[recipient];
    held = checked_add(held, amount, "share balance");
    total_share_ = supply;
}

void MemoryLedger::burn_shares(const std::string& owner, const uint128& amount) {
    auto it = shares_.find(owner);
    if (it == shares_.end() || it->second < amount) {
        throw std::runtime_error(
            "insufficient balance: " + owner + " holds " + share_balance(owner).str()
                + " shares, burn " + amount.str()
        );
    }
    it->second -= amount;
    total_share_ -= amount;
}

void MemoryLedger::move(const std::string& from, const std::string& to, const Asset& asset) {
    const Key from_key{from, asset.info};
    const uint128 available = balance(from, asset.info);
    if (available < asset.amount) {
        throw std::runtime_error(
            "insufficient balance: " + from + " holds " + available.str() + asset.info.id
                + ", needs " + asset.to_string()
        );
    }
    if (from == to) {
        return;
    }
    uint128& dst = balances_[Key{to, asset.info}];
    const uint128 credited = checked_add(dst, asset.amount, "balance");
    balances_[from_key] -= asset.amount;
    dst = credited;
}

} // namespace cpamm
