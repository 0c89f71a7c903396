#pragma once

#include "lendswap/custody/i_custodian.hpp"
#include "lendswap/custody/i_transaction_host.hpp"

#include <optional>
#include <unordered_map>

namespace lendswap {

// -----------------------------------------------------------------------------
// InMemoryLedger - deterministic custodian and transaction host
// -----------------------------------------------------------------------------
//
// @brief  Balance map implementing ICustodian and ITransactionHost.
//
// @details
// Accounts are created up front with createMint() / createVault(). A vault
// holds tokens of exactly one mint and has one owning authority.
//
// Transactions: begin() snapshots every vault and mint; rollback() restores
// the snapshot; commit() drops it. Calls made outside a transaction apply
// immediately (used to seed balances).
//
// Thread model:
//   Not internally synchronized. LendingEngine serializes every access under
//   its operation mutex; tests use it single-threaded.
//
// Ownership:
//   Owned by main() or a test fixture. Referenced by the managers, the
//   simulated venue and LendingEngine.
// -----------------------------------------------------------------------------
class InMemoryLedger final : public ICustodian, public ITransactionHost {
 public:
  InMemoryLedger() = default;

  InMemoryLedger(const InMemoryLedger&) = delete;
  InMemoryLedger& operator=(const InMemoryLedger&) = delete;

  // Registers a mint. Throws std::invalid_argument if the id is taken.
  void createMint(const domain::AccountId& mint,
                  const domain::AccountId& authority);

  // Registers an empty vault for `mint` owned by `owner`. Throws
  // std::invalid_argument if the id is taken or the mint is unknown.
  void createVault(const domain::AccountId& vault,
                   const domain::AccountId& mint,
                   const domain::AccountId& owner);

  bool hasVault(const domain::AccountId& vault) const;

  // --- ICustodian -----------------------------------------------------------
  math::TokenAmount balance(const domain::AccountId& vault) const override;
  math::TokenAmount supply(const domain::AccountId& mint) const override;

  void transfer(const domain::AccountId& from, const domain::AccountId& to,
                const domain::AccountId& authority,
                math::TokenAmount amount) override;

  void mint(const domain::AccountId& mint, const domain::AccountId& to,
            const domain::AccountId& authority,
            math::TokenAmount amount) override;

  void burn(const domain::AccountId& mint, const domain::AccountId& from,
            const domain::AccountId& authority,
            math::TokenAmount amount) override;

  // --- ITransactionHost -----------------------------------------------------
  void begin() override;
  void commit() override;
  void rollback() override;

 private:
  struct VaultRecord {
    domain::AccountId mint;
    domain::AccountId owner;
    math::TokenAmount amount;
  };

  struct MintRecord {
    domain::AccountId authority;
    math::TokenAmount supply;
  };

  struct Snapshot {
    std::unordered_map<domain::AccountId, VaultRecord> vaults;
    std::unordered_map<domain::AccountId, MintRecord> mints;
  };

  VaultRecord& vaultFor(const domain::AccountId& vault);
  const VaultRecord& vaultFor(const domain::AccountId& vault) const;
  MintRecord& mintFor(const domain::AccountId& mint);
  const MintRecord& mintFor(const domain::AccountId& mint) const;

  std::unordered_map<domain::AccountId, VaultRecord> vaults_;
  std::unordered_map<domain::AccountId, MintRecord> mints_;
  std::optional<Snapshot> snapshot_;
};

}  // namespace lendswap
