#include "vault/execution/trade_execution_engine.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/events/trade_events.hpp"

#include <iostream>
#include <limits>

namespace vault {

namespace {

ErrorCode toErrorCode(SettlementStatus status) {
  switch (status) {
    case SettlementStatus::InsufficientFunds:
      return ErrorCode::InsufficientFunds;
    case SettlementStatus::Unauthorized:
      return ErrorCode::Unauthorized;
    case SettlementStatus::DestinationOverflow:
      return ErrorCode::AmountOverflow;
    case SettlementStatus::UnknownAccount:
    case SettlementStatus::Ok:
      break;
  }
  return ErrorCode::SettlementAccountNotFound;
}

}  // namespace

TradeExecutionEngine::TradeExecutionEngine(EventBus& bus,
                                           const ITimeProvider& clock,
                                           const IAuthorizationProvider& auth,
                                           ISettlementProvider& settlement,
                                           SettlementAmountPolicy amount_policy,
                                           bool require_matching_asset)
    : bus_(bus),
      clock_(clock),
      auth_(auth),
      settlement_(settlement),
      amount_policy_(amount_policy),
      require_matching_asset_(require_matching_asset) {}

// -----------------------------------------------------------------------------
// executeTrade
// -----------------------------------------------------------------------------
TradeReceipt TradeExecutionEngine::executeTrade(AssetRegistry& registry,
                                                OrderBook& book,
                                                const TradeRequest& request) {
  std::uint64_t settled_amount = 0;
  try {
    settled_amount = verifyAndSettle(registry, book, request);
  } catch (const LedgerError& e) {
    publishRejection(request, e);
    throw;
  }

  // Settlement is done; the two writes below cannot fail for records that
  // were just looked up.
  const domain::Identity previous_owner =
      registry.find(request.asset_id)->owner_id;

  book.deactivate(request.order_id);
  registry.transferOwnership(request.asset_id, request.buyer.identity);

  TradeReceipt receipt;
  receipt.order = *book.find(request.order_id);
  receipt.asset = *registry.find(request.asset_id);
  receipt.settled_amount = settled_amount;

  TradeExecutedEvent event;
  event.order = receipt.order;
  event.asset = receipt.asset;
  event.previous_owner = previous_owner;
  event.buyer = request.buyer.identity;
  event.settlement_source = request.settlement_source;
  event.settlement_destination = request.settlement_destination;
  event.settled_amount = settled_amount;
  event.timestamp = clock_.now_seconds();
  bus_.publish(event);

  return receipt;
}

std::uint64_t TradeExecutionEngine::verifyAndSettle(
    const AssetRegistry& registry, const OrderBook& book,
    const TradeRequest& request) {
  const domain::TradeOrder* order = book.find(request.order_id);
  if (order == nullptr) {
    throw LedgerError(ErrorCode::OrderNotFound,
                      "no order at " + request.order_id);
  }
  const domain::Asset* asset = registry.find(request.asset_id);
  if (asset == nullptr) {
    throw LedgerError(ErrorCode::AssetNotFound,
                      "no asset at " + request.asset_id);
  }

  if (!order->is_active) {
    throw LedgerError(ErrorCode::OrderInactive,
                      order->id + " has already been executed");
  }
  if (order->quantity == 0) {
    throw LedgerError(ErrorCode::InvalidQuantity,
                      order->id + " has zero quantity");
  }
  if (!auth_.verify(request.order_owner)) {
    throw LedgerError(ErrorCode::Unauthorized,
                      "order owner credential rejected for " +
                          request.order_owner.identity);
  }
  if (request.order_owner.identity != order->owner_id) {
    throw LedgerError(ErrorCode::Unauthorized,
                      request.order_owner.identity + " does not own " +
                          order->id);
  }
  if (!auth_.verify(request.buyer)) {
    throw LedgerError(ErrorCode::Unauthorized,
                      "buyer credential rejected for " +
                          request.buyer.identity);
  }
  if (require_matching_asset_ && order->asset_ref != request.asset_id) {
    throw LedgerError(ErrorCode::AssetMismatch,
                      order->id + " targets " + order->asset_ref + ", not " +
                          request.asset_id);
  }

  const std::uint64_t amount = settlementAmount(*order);
  const SettlementStatus status =
      settlement_.transfer(request.settlement_source,
                           request.settlement_destination, amount,
                           order->owner_id);
  if (status != SettlementStatus::Ok) {
    throw LedgerError(toErrorCode(status),
                      std::string("settlement refused: ") +
                          settlementStatusToString(status));
  }
  return amount;
}

std::uint64_t TradeExecutionEngine::settlementAmount(
    const domain::TradeOrder& order) const {
  if (amount_policy_ == SettlementAmountPolicy::Quantity) {
    return order.quantity;
  }
  if (order.price_per_unit != 0 &&
      order.quantity >
          std::numeric_limits<std::uint64_t>::max() / order.price_per_unit) {
    throw LedgerError(ErrorCode::AmountOverflow,
                      "quantity * price_per_unit exceeds 64 bits for " +
                          order.id);
  }
  return order.quantity * order.price_per_unit;
}

void TradeExecutionEngine::publishRejection(const TradeRequest& request,
                                            const LedgerError& error) {
  std::cerr << "[TradeExecutionEngine] Rejected " << request.order_id << ": "
            << error.what() << "\n";

  TradeRejectedEvent event;
  event.order_id = request.order_id;
  event.asset_id = request.asset_id;
  event.error = error.code();
  event.reason = error.what();
  event.timestamp = clock_.now_seconds();
  bus_.publish(event);
}

}  // namespace vault
