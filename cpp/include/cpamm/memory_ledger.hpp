#ifndef CPAMM_MEMORY_LEDGER_HPP
#define CPAMM_MEMORY_LEDGER_HPP

#include <map>
#include <string>
#include <utility>

#include "pair.hpp"

namespace cpamm {

// In-process ledger: asset balances per account, the pair's pool account and
// the liquidity share book. A plain value type, so a copy taken before an
// action is a complete snapshot to restore from.
class MemoryLedger : public Ledger {
public:
    explicit MemoryLedger(std::string pool_account);

    // Funds entering from outside the ledger (genesis balances).
    void credit(const std::string& account, const Asset& asset);
    // owner -> pool, for funds attached to a message (native deposits and
    // offered swap amounts).
    void send(const std::string& owner, const Asset& asset);

    uint128 balance(const std::string& account, const AssetInfo& info) const;
    uint128 share_balance(const std::string& account) const;
    const std::string& pool_account() const { return pool_account_; }

    std::array<Asset, 2> query_pools(const std::array<AssetInfo, 2>& infos) const override;
    uint128 query_total_share() const override { return total_share_; }
    void transfer_from(const std::string& owner, const Asset& asset) override;
    void transfer(const std::string& recipient, const Asset& asset) override;
    void mint_shares(const std::string& recipient, const uint128& amount) override;
    void burn_shares(const std::string& owner, const uint128& amount) override;

private:
    using Key = std::pair<std::string, AssetInfo>;

    void move(const std::string& from, const std::string& to, const Asset& asset);

    std::string pool_account_;
    std::map<Key, uint128> balances_;
    std::map<std::string, uint128> shares_;
    uint128 total_share_{0};
};

} // namespace cpamm

#endif // CPAMM_MEMORY_LEDGER_HPP
