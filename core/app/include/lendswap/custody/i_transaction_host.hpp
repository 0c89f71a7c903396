#pragma once

namespace lendswap {

// -----------------------------------------------------------------------------
// ITransactionHost - all-or-nothing envelope around one operation
// -----------------------------------------------------------------------------
//
// @brief  Makes the external effects of an operation atomic.
//
// @details
// The lifecycle managers call begin() before the first external call of an
// operation, then exactly one of commit() or rollback(). After rollback()
// every balance and supply touched since begin() is as it was before.
// Transactions do not nest.
//
// On a chain this is the host runtime's instruction semantics; in-process it
// is InMemoryLedger's snapshot.
// -----------------------------------------------------------------------------
class ITransactionHost {
 public:
  virtual ~ITransactionHost() = default;

  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;
};

}  // namespace lendswap
