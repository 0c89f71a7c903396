#include "lendswap/custody/in_memory_ledger.hpp"

#include "lendswap/domain/error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace lendswap {

using domain::AccountId;
using domain::ErrorCode;
using domain::ProtocolError;
using math::TokenAmount;

namespace {

[[noreturn]] void reject(const std::string& message) {
  throw ProtocolError(ErrorCode::CustodyRejected, message);
}

}  // namespace

// -----------------------------------------------------------------------------
// Account setup
// -----------------------------------------------------------------------------
void InMemoryLedger::createMint(const AccountId& mint,
                                const AccountId& authority) {
  if (mints_.count(mint) != 0) {
    throw std::invalid_argument("mint already exists: " + mint);
  }
  mints_.emplace(mint, MintRecord{authority, TokenAmount(0)});
}

void InMemoryLedger::createVault(const AccountId& vault, const AccountId& mint,
                                 const AccountId& owner) {
  if (vaults_.count(vault) != 0) {
    throw std::invalid_argument("vault already exists: " + vault);
  }
  if (mints_.count(mint) == 0) {
    throw std::invalid_argument("unknown mint for vault " + vault + ": " +
                                mint);
  }
  vaults_.emplace(vault, VaultRecord{mint, owner, TokenAmount(0)});
}

bool InMemoryLedger::hasVault(const AccountId& vault) const {
  return vaults_.count(vault) != 0;
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
InMemoryLedger::VaultRecord& InMemoryLedger::vaultFor(const AccountId& vault) {
  auto it = vaults_.find(vault);
  if (it == vaults_.end()) {
    reject("unknown vault: " + vault);
  }
  return it->second;
}

const InMemoryLedger::VaultRecord& InMemoryLedger::vaultFor(
    const AccountId& vault) const {
  auto it = vaults_.find(vault);
  if (it == vaults_.end()) {
    reject("unknown vault: " + vault);
  }
  return it->second;
}

InMemoryLedger::MintRecord& InMemoryLedger::mintFor(const AccountId& mint) {
  auto it = mints_.find(mint);
  if (it == mints_.end()) {
    reject("unknown mint: " + mint);
  }
  return it->second;
}

const InMemoryLedger::MintRecord& InMemoryLedger::mintFor(
    const AccountId& mint) const {
  auto it = mints_.find(mint);
  if (it == mints_.end()) {
    reject("unknown mint: " + mint);
  }
  return it->second;
}

TokenAmount InMemoryLedger::balance(const AccountId& vault) const {
  return vaultFor(vault).amount;
}

TokenAmount InMemoryLedger::supply(const AccountId& mint) const {
  return mintFor(mint).supply;
}

// -----------------------------------------------------------------------------
// transfer / mint / burn
// -----------------------------------------------------------------------------
void InMemoryLedger::transfer(const AccountId& from, const AccountId& to,
                              const AccountId& authority, TokenAmount amount) {
  VaultRecord& source = vaultFor(from);
  VaultRecord& destination = vaultFor(to);

  if (source.mint != destination.mint) {
    reject("mint mismatch: " + from + " -> " + to);
  }
  if (source.owner != authority) {
    reject("authority " + authority + " does not own " + from);
  }

  auto debited = source.amount.checkedSub(amount);
  if (!debited) {
    reject("insufficient funds in " + from);
  }
  if (&source == &destination) {
    return;
  }
  auto credited = destination.amount.checkedAdd(amount);
  if (!credited) {
    reject("balance overflow in " + to);
  }

  source.amount = *debited;
  destination.amount = *credited;
}

void InMemoryLedger::mint(const AccountId& mint, const AccountId& to,
                          const AccountId& authority, TokenAmount amount) {
  MintRecord& record = mintFor(mint);
  VaultRecord& destination = vaultFor(to);

  if (destination.mint != mint) {
    reject("vault " + to + " does not hold " + mint);
  }
  if (record.authority != authority) {
    reject("authority " + authority + " cannot mint " + mint);
  }

  auto next_supply = record.supply.checkedAdd(amount);
  auto next_balance = destination.amount.checkedAdd(amount);
  if (!next_supply || !next_balance) {
    reject("supply overflow for " + mint);
  }

  record.supply = *next_supply;
  destination.amount = *next_balance;
}

void InMemoryLedger::burn(const AccountId& mint, const AccountId& from,
                          const AccountId& authority, TokenAmount amount) {
  MintRecord& record = mintFor(mint);
  VaultRecord& source = vaultFor(from);

  if (source.mint != mint) {
    reject("vault " + from + " does not hold " + mint);
  }
  if (source.owner != authority) {
    reject("authority " + authority + " does not own " + from);
  }

  auto next_balance = source.amount.checkedSub(amount);
  if (!next_balance) {
    reject("insufficient funds in " + from);
  }
  auto next_supply = record.supply.checkedSub(amount);
  if (!next_supply) {
    reject("supply underflow for " + mint);
  }

  source.amount = *next_balance;
  record.supply = *next_supply;
}

// -----------------------------------------------------------------------------
// Transactions
// -----------------------------------------------------------------------------
void InMemoryLedger::begin() {
  if (snapshot_.has_value()) {
    throw std::logic_error("InMemoryLedger: transaction already open");
  }
  snapshot_ = Snapshot{vaults_, mints_};
}

void InMemoryLedger::commit() { snapshot_.reset(); }

void InMemoryLedger::rollback() {
  if (!snapshot_.has_value()) {
    return;
  }
  vaults_ = std::move(snapshot_->vaults);
  mints_ = std::move(snapshot_->mints);
  snapshot_.reset();
}

}  // namespace lendswap
