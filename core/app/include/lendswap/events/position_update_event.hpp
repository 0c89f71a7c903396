#pragma once

#include "lendswap/domain/market.hpp"
#include "lendswap/domain/position.hpp"
#include "lendswap/events/event_types.hpp"

#include <string>

namespace lendswap {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a position and its market after a committed open,
//         close or liquidation.
//
// @details
// Carries copies, not references: the event stays valid after the engine's
// records move on. `receipt_balance` is the receipt-token balance of the
// position's receipt account at commit time.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  std::string operation;
  domain::Position position;
  math::TokenAmount market_total_loan;
  math::TokenAmount receipt_balance;
  Timestamp timestamp{};
};

}  // namespace lendswap
