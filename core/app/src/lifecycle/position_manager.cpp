#include "lendswap/lifecycle/position_manager.hpp"

#include "lendswap/accounting/reserve_accounting.hpp"
#include "lendswap/lifecycle/atomic_operation.hpp"
#include "lendswap/math/checked_math.hpp"
#include "lendswap/math/liquidity.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace lendswap {

using domain::ErrorCode;
using domain::Market;
using domain::OperationResult;
using domain::Position;
using domain::PositionStatus;
using domain::ProtocolError;
using domain::Reserve;
using domain::expectValue;
using math::Factor;
using math::TokenAmount;
using math::UnixTimestamp;

namespace {

constexpr const char* kComponent = "PositionManager";

// Lot and price conversions: caller-supplied quantities that do not fit are
// rejected rather than faulted.
std::uint64_t lotProduct(std::uint64_t a, std::uint64_t b, const char* what) {
  const auto product = math::checkedMul<std::uint64_t>(a, b);
  if (!product || *product == 0) {
    throw ProtocolError(ErrorCode::InvalidArgument, what);
  }
  return *product;
}

void requireTransition(PositionStatus from, PositionStatus to) {
  if (!domain::isValidTransition(from, to)) {
    throw ProtocolError(ErrorCode::InvalidPositionState,
                        std::string("position is ") +
                            domain::positionStatusToString(from) +
                            ", cannot become " +
                            domain::positionStatusToString(to));
  }
}

}  // namespace

PositionManager::PositionManager(const domain::Governance& governance,
                                 ICustodian& custodian, IVenue& venue,
                                 ITransactionHost& host,
                                 const ITimeProvider& clock, EventBus& bus)
    : governance_(governance),
      custodian_(custodian),
      venue_(venue),
      host_(host),
      clock_(clock),
      bus_(bus) {}

OperationResult PositionManager::initializeMarket(const Market& market,
                                                  const Reserve& reserve) {
  const MarketMints mints = venue_.mints();
  if (mints.base_mint != market.base_mint ||
      mints.quote_mint != market.quote_mint) {
    std::cerr << "[" << kComponent << "] market " << market.id
              << " does not match the venue pair\n";
    return OperationResult::failure(ErrorCode::InvalidMint,
                                    "market mints differ from venue mints");
  }
  if (market.quote_mint != reserve.lendable_mint) {
    std::cerr << "[" << kComponent << "] market " << market.id
              << " quote mint is not lendable by reserve " << reserve.id
              << "\n";
    return OperationResult::failure(ErrorCode::InvalidMint,
                                    "market quote mint differs from reserve "
                                    "lendable mint");
  }
  std::cout << "[" << kComponent << "] market " << market.id
            << " bound to reserve " << reserve.id << "\n";
  return OperationResult::success();
}

Position PositionManager::initializePosition(
    const domain::AccountId& trader, const domain::AccountId& market,
    const domain::AccountId& receipt_account,
    const domain::AccountId& trader_quote_vault) {
  Position position;
  position.trader = trader;
  position.market = market;
  position.receipt_account = receipt_account;
  position.trader_quote_vault = trader_quote_vault;
  return position;
}

// -----------------------------------------------------------------------------
// Public operations: copy in, run atomically, copy out
// -----------------------------------------------------------------------------
OperationResult PositionManager::open(Market& market, Reserve& reserve,
                                      Position& position,
                                      const OpenRequest& request) {
  const UnixTimestamp now = UnixTimestamp::fromMillis(clock_.now_ms());
  Market next_market = market;
  Reserve next_reserve = reserve;
  Position next_position = position;

  const OperationResult result = runAtomically(host_, kComponent, "open", [&] {
    doOpen(next_market, next_reserve, next_position, request, now);
    market = next_market;
    reserve = next_reserve;
    position = next_position;
  });
  return finish("open", result, market, reserve, position);
}

OperationResult PositionManager::close(Market& market, Reserve& reserve,
                                       Position& position,
                                       const CloseRequest& request) {
  const UnixTimestamp now = UnixTimestamp::fromMillis(clock_.now_ms());
  Market next_market = market;
  Reserve next_reserve = reserve;
  Position next_position = position;

  const OperationResult result = runAtomically(host_, kComponent, "close", [&] {
    doClose(next_market, next_reserve, next_position, request, now);
    market = next_market;
    reserve = next_reserve;
    position = next_position;
  });
  return finish("close", result, market, reserve, position);
}

OperationResult PositionManager::liquidate(
    Market& market, Reserve& reserve, Position& position,
    const domain::AccountId& liquidator_vault) {
  const UnixTimestamp now = UnixTimestamp::fromMillis(clock_.now_ms());
  Market next_market = market;
  Reserve next_reserve = reserve;
  Position next_position = position;

  const OperationResult result =
      runAtomically(host_, kComponent, "liquidate", [&] {
        doLiquidate(next_market, next_reserve, next_position, liquidator_vault,
                    now);
        market = next_market;
        reserve = next_reserve;
        position = next_position;
      });
  return finish("liquidate", result, market, reserve, position);
}

// -----------------------------------------------------------------------------
// open
// -----------------------------------------------------------------------------
void PositionManager::doOpen(Market& market, Reserve& reserve,
                             Position& position, const OpenRequest& request,
                             UnixTimestamp now) {
  if (request.limit_price == 0 || request.base_qty == 0) {
    throw ProtocolError(ErrorCode::InvalidArgument,
                        "open requires a positive price and quantity");
  }
  const Factor max_leverage = governance_.maxLeverageFactor();
  if (request.leverage < Factor::one() || request.leverage > max_leverage) {
    throw ProtocolError(ErrorCode::InvalidLeverageFactor,
                        "leverage factor outside [1, max_leverage_factor]");
  }
  requireTransition(position.status, PositionStatus::Open);

  const Factor borrowed_share = expectValue(
      request.leverage.checkedSub(Factor::one()), "leverage underflow");
  const std::uint64_t loan_lots =
      expectValue(math::narrowToU64(borrowed_share.percentageMul(
                      request.base_qty)),
                  "loan quantity overflow");
  const std::uint64_t total_lots =
      expectValue(math::checkedAdd<std::uint64_t>(request.base_qty, loan_lots),
                  "base quantity overflow");

  const LotSizes lots = venue_.lotSizes();
  lotProduct(total_lots, lots.base_lot, "base quantity overflows lot size");
  const std::uint64_t lot_price =
      lotProduct(request.limit_price, lots.quote_lot,
                 "limit price overflows lot size");
  const TokenAmount budget(
      lotProduct(lot_price, total_lots, "order cost overflows"));
  const TokenAmount borrowed = loan_lots == 0
      ? TokenAmount(0)
      : TokenAmount(lotProduct(lot_price, loan_lots, "loan cost overflows"));

  // Liquidity as of the start of the operation; the rate and borrow limit
  // are priced against it.
  const TokenAmount reserve_liquidity =
      custodian_.balance(reserve.lendable_vault);

  if (!borrowed.isZero()) {
    custodian_.transfer(reserve.lendable_vault, market.quote_vault,
                        reserve.signer, borrowed);
  }
  custodian_.transfer(position.trader_quote_vault, market.quote_vault,
                      position.trader,
                      expectValue(budget.checkedSub(borrowed),
                                  "trader funding underflow"));

  OrderRequest order;
  order.side = Side::Buy;
  order.limit_price = request.limit_price;
  order.max_base_qty = total_lots;
  order.max_native_quote = budget;
  order.payer_vault = market.quote_vault;
  order.owner = market.signer;
  const Fill fill = venue_.submitOrder(order);
  venue_.settle(market.signer, market.base_vault, market.quote_vault);

  if (!borrowed.isZero()) {
    const TokenAmount unspent = custodian_.balance(market.quote_vault);
    const TokenAmount returned = std::min(borrowed, unspent);
    const TokenAmount loan = expectValue(borrowed.checkedSub(returned),
                                         "loan underflow");
    custodian_.transfer(market.quote_vault, reserve.lendable_vault,
                        market.signer, returned);

    if (!loan.isZero()) {
      market.state.total_loan = expectValue(
          market.state.total_loan.checkedAdd(loan), "total_loan overflow");
      position.state.loan =
          expectValue(position.state.loan.checkedAdd(loan), "loan overflow");

      const TokenAmount total_debt =
          accounting::projectTotalDebt(reserve.debt, now);
      const TokenAmount total_liquidity = accounting::availableLiquidity(
          reserve, total_debt, reserve_liquidity);
      const TokenAmount borrow_limit = expectValue(
          TokenAmount::fromU128(governance_.poolUtilizationAllowance()
                                    .percentageMul(total_liquidity.value())),
          "borrow limit overflow");
      if (market.state.total_loan >= borrow_limit) {
        throw ProtocolError(ErrorCode::BorrowLimitExceeded,
                            "market loan would reach the pool utilization "
                            "allowance");
      }

      const Factor multiplier = rateMultiplier(request.leverage);
      accounting::accrueTreasury(reserve, governance_, total_debt, now);
      accounting::refreshBorrowRate(reserve, governance_, reserve_liquidity,
                                    TokenAmount(0), loan, total_debt, loan,
                                    TokenAmount(0));
      accounting::increaseDebt(reserve, position.state, now, total_debt, loan,
                               multiplier);
    }
  }

  returnTraderFunds(market, position);

  custodian_.mint(market.receipt_mint, position.receipt_account,
                  market.signer, fill.native_base);
  if (fill.filled_base_lots > 0) {
    position.status = PositionStatus::Open;
  }
}

// -----------------------------------------------------------------------------
// close
// -----------------------------------------------------------------------------
void PositionManager::doClose(Market& market, Reserve& reserve,
                              Position& position, const CloseRequest& request,
                              UnixTimestamp now) {
  if (request.limit_price == 0 || request.base_qty == 0) {
    throw ProtocolError(ErrorCode::InvalidArgument,
                        "close requires a positive price and quantity");
  }
  requireTransition(position.status, PositionStatus::PartiallyRepaid);

  const LotSizes lots = venue_.lotSizes();
  const TokenAmount native_base(lotProduct(
      request.base_qty, lots.base_lot, "base quantity overflows lot size"));
  const std::uint64_t lot_price =
      lotProduct(request.limit_price, lots.quote_lot,
                 "limit price overflows lot size");
  const TokenAmount max_quote(
      lotProduct(lot_price, request.base_qty, "order proceeds overflow"));

  const TokenAmount reserve_liquidity =
      custodian_.balance(reserve.lendable_vault);

  custodian_.burn(market.receipt_mint, position.receipt_account,
                  market.signer, native_base);

  OrderRequest order;
  order.side = Side::Sell;
  order.limit_price = request.limit_price;
  order.max_base_qty = request.base_qty;
  order.max_native_quote = max_quote;
  order.payer_vault = market.base_vault;
  order.owner = market.signer;
  venue_.submitOrder(order);
  venue_.settle(market.signer, market.base_vault, market.quote_vault);

  const TokenAmount current_debt =
      accounting::projectPositionDebt(position.state, now);
  if (!current_debt.isZero()) {
    const TokenAmount proceeds = custodian_.balance(market.quote_vault);
    TokenAmount debt_change = current_debt;
    TokenAmount loan_change = position.state.loan;
    if (current_debt > proceeds) {
      // Partial repayment clears the loan pro rata.
      debt_change = proceeds;
      loan_change = math::calculateShare(proceeds, current_debt,
                                         position.state.loan);
    }

    market.state.total_loan =
        expectValue(market.state.total_loan.checkedSub(loan_change),
                    "total_loan underflow");
    position.state.loan = expectValue(
        position.state.loan.checkedSub(loan_change), "loan underflow");

    custodian_.transfer(market.quote_vault, reserve.lendable_vault,
                        market.signer, debt_change);
    recordRepayment(reserve, position.state, now, debt_change,
                    reserve_liquidity);
  }

  returnTraderFunds(market, position);

  const bool settled = position.state.amount.isZero() &&
                       custodian_.balance(position.receipt_account).isZero();
  position.status =
      settled ? PositionStatus::Closed : PositionStatus::PartiallyRepaid;
}

// -----------------------------------------------------------------------------
// liquidate
// -----------------------------------------------------------------------------
void PositionManager::doLiquidate(Market& market, Reserve& reserve,
                                  Position& position,
                                  const domain::AccountId& liquidator_vault,
                                  UnixTimestamp now) {
  requireTransition(position.status, PositionStatus::Liquidated);

  const TokenAmount current_debt =
      accounting::projectPositionDebt(position.state, now);
  const TokenAmount liquidation_cost = expectValue(
      current_debt.checkedAdd(
          governance_.liquidationMargin().percentageOf(current_debt)),
      "liquidation cost overflow");

  const LotSizes lots = venue_.lotSizes();
  const TokenAmount native_base = custodian_.balance(position.receipt_account);
  const std::uint64_t base_lots =
      expectValue(math::checkedDiv<std::uint64_t>(native_base.value(),
                                                  lots.base_lot),
                  "zero base lot size");
  if (base_lots == 0) {
    throw ProtocolError(ErrorCode::InvalidPositionState,
                        "position holds no receipt lots to unwind");
  }
  const std::uint64_t limit_price = 1;
  const TokenAmount max_quote(lotProduct(
      lotProduct(limit_price, lots.quote_lot, "limit price overflows lot size"),
      base_lots, "order proceeds overflow"));

  const TokenAmount reserve_liquidity =
      custodian_.balance(reserve.lendable_vault);

  custodian_.burn(market.receipt_mint, position.receipt_account,
                  market.signer, native_base);

  OrderRequest order;
  order.side = Side::Sell;
  order.limit_price = limit_price;
  order.max_base_qty = base_lots;
  order.max_native_quote = max_quote;
  order.payer_vault = market.base_vault;
  order.owner = market.signer;
  venue_.submitOrder(order);
  venue_.settle(market.signer, market.base_vault, market.quote_vault);

  // Health is judged on what the unwind actually produced. A healthy
  // position fails here and the rollback undoes the burn and the sale.
  const TokenAmount output = custodian_.balance(market.quote_vault);
  if (output > liquidation_cost) {
    throw ProtocolError(ErrorCode::LiquidateHealthyPosition,
                        "unwind proceeds " + math::toString(output.value()) +
                            " exceed liquidation cost " +
                            math::toString(liquidation_cost.value()));
  }

  TokenAmount reward = governance_.liquidationReward().percentageOf(output);
  const TokenAmount max_reward = governance_.maxLiquidationReward();
  if (!max_reward.isZero() && max_reward < reward) {
    reward = max_reward;
  }
  custodian_.transfer(market.quote_vault, liquidator_vault, market.signer,
                      reward);
  const TokenAmount remaining =
      expectValue(output.checkedSub(reward), "liquidation amount underflow");

  if (remaining > current_debt) {
    custodian_.transfer(market.quote_vault, reserve.lendable_vault,
                        market.signer, current_debt);
    custodian_.transfer(market.quote_vault, position.trader_quote_vault,
                        market.signer,
                        expectValue(remaining.checkedSub(current_debt),
                                    "trader remainder underflow"));
  } else {
    custodian_.transfer(market.quote_vault, reserve.lendable_vault,
                        market.signer, remaining);
  }

  market.state.total_loan =
      expectValue(market.state.total_loan.checkedSub(position.state.loan),
                  "total_loan underflow");
  position.state.loan = TokenAmount(0);

  recordRepayment(reserve, position.state, now, current_debt,
                  reserve_liquidity);
  position.status = PositionStatus::Liquidated;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
void PositionManager::recordRepayment(Reserve& reserve,
                                      domain::PositionState& position,
                                      UnixTimestamp now,
                                      TokenAmount debt_change,
                                      TokenAmount reserve_liquidity) {
  const TokenAmount total_debt = accounting::projectTotalDebt(reserve.debt, now);
  accounting::accrueTreasury(reserve, governance_, total_debt, now);
  accounting::decreaseDebt(reserve, position, now, total_debt, debt_change);

  const TokenAmount remaining_debt =
      accounting::projectTotalDebt(reserve.debt, now);
  accounting::refreshBorrowRate(reserve, governance_, reserve_liquidity,
                                debt_change, TokenAmount(0), remaining_debt,
                                TokenAmount(0), TokenAmount(0));
}

Factor PositionManager::rateMultiplier(Factor leverage) const {
  const Factor one = Factor::one();
  const Factor extra_leverage =
      expectValue(leverage.checkedSub(one), "leverage underflow");
  const Factor extra_multiplier = expectValue(
      governance_.maxRateMultiplier().checkedSub(one),
      "invalid max_rate_multiplier");
  const Factor leverage_range = expectValue(
      governance_.maxLeverageFactor().checkedSub(one),
      "invalid max_leverage_factor");

  const auto scaled = extra_leverage.checkedMul(extra_multiplier);
  const auto ratio = scaled ? scaled->checkedDiv(leverage_range) : scaled;
  return expectValue(ratio ? ratio->checkedAdd(one) : ratio,
                     "rate multiplier overflow");
}

void PositionManager::returnTraderFunds(const Market& market,
                                        const Position& position) {
  custodian_.transfer(market.quote_vault, position.trader_quote_vault,
                      market.signer, custodian_.balance(market.quote_vault));
}

OperationResult PositionManager::finish(const std::string& operation,
                                        const OperationResult& result,
                                        const Market& market,
                                        const Reserve& reserve,
                                        const Position& position) {
  const auto stamp = std::chrono::system_clock::now();

  if (!result.ok()) {
    OperationRejectedEvent rejected;
    rejected.operation = operation;
    rejected.subject = position.trader;
    rejected.code = result.code;
    rejected.message = result.message;
    rejected.timestamp = stamp;
    bus_.publish(rejected);
    return result;
  }

  std::cout << "[" << kComponent << "] " << operation << " " << position.trader
            << " -> " << domain::positionStatusToString(position.status)
            << " loan=" << position.state.loan.value()
            << " debt=" << position.state.amount.value() << "\n";

  PositionUpdateEvent position_update;
  position_update.operation = operation;
  position_update.position = position;
  position_update.market_total_loan = market.state.total_loan;
  position_update.receipt_balance =
      custodian_.balance(position.receipt_account);
  position_update.timestamp = stamp;
  bus_.publish(position_update);

  ReserveUpdateEvent reserve_update;
  reserve_update.operation = operation;
  reserve_update.reserve = reserve;
  reserve_update.vault_balance = custodian_.balance(reserve.lendable_vault);
  reserve_update.redeemable_supply = custodian_.supply(reserve.redeemable_mint);
  reserve_update.timestamp = stamp;
  bus_.publish(reserve_update);

  return result;
}

}  // namespace lendswap
