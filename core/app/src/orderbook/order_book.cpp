#include "vault/orderbook/order_book.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/events/event_types.hpp"

namespace vault {

OrderBook::OrderBook(EventBus& bus, const ITimeProvider& clock,
                     AddressScheme scheme)
    : bus_(bus), clock_(clock), addresses_(scheme) {}

domain::OrderId OrderBook::createOrder(const domain::AssetId& asset_id,
                                       const domain::Identity& owner,
                                       domain::OrderType order_type,
                                       std::uint64_t quantity,
                                       std::uint64_t price_per_unit) {
  const std::int64_t now = clock_.now_seconds();
  domain::OrderId id = addresses_.orderAddress(
      owner, now,
      [this](const std::string& address) { return orders_.contains(address); });

  domain::TradeOrder order;
  order.id = id;
  order.asset_ref = asset_id;
  order.owner_id = owner;
  order.order_type = order_type;
  order.quantity = quantity;
  order.price_per_unit = price_per_unit;
  order.created_at = now;
  order.is_active = true;

  if (!orders_.create(id, order)) {
    throw LedgerError(ErrorCode::DuplicateOrder,
                      "an order already exists at " + id);
  }

  OrderCreatedEvent event;
  event.order = order;
  event.timestamp = now;
  bus_.publish(event);

  return id;
}

void OrderBook::deactivate(const domain::OrderId& order_id) {
  domain::TradeOrder* order = orders_.findMutable(order_id);
  if (order == nullptr) {
    throw LedgerError(ErrorCode::OrderNotFound, "no order at " + order_id);
  }
  order->quantity = 0;
  order->is_active = false;
}

const domain::TradeOrder* OrderBook::find(
    const domain::OrderId& order_id) const {
  return orders_.find(order_id);
}

std::vector<domain::TradeOrder> OrderBook::list(
    const OrderFilter& filter) const {
  std::vector<domain::TradeOrder> result;
  std::size_t skipped = 0;

  orders_.forEach([&](const std::string&, const domain::TradeOrder& order) {
    if (result.size() >= filter.limit) {
      return;
    }
    if (filter.asset_ref && order.asset_ref != *filter.asset_ref) {
      return;
    }
    if (filter.order_type && order.order_type != *filter.order_type) {
      return;
    }
    if (filter.owner && order.owner_id != *filter.owner) {
      return;
    }
    if (filter.is_active && order.is_active != *filter.is_active) {
      return;
    }
    if (skipped < filter.skip) {
      ++skipped;
      return;
    }
    result.push_back(order);
  });

  return result;
}

std::vector<domain::TradeOrder> OrderBook::all() const {
  std::vector<domain::TradeOrder> result;
  result.reserve(orders_.size());
  orders_.forEach([&result](const std::string&,
                            const domain::TradeOrder& order) {
    result.push_back(order);
  });
  return result;
}

std::size_t OrderBook::activeCount() const {
  std::size_t count = 0;
  orders_.forEach([&count](const std::string&, const domain::TradeOrder& order) {
    if (order.is_active) {
      ++count;
    }
  });
  return count;
}

void OrderBook::hydrateOrder(const domain::TradeOrder& order) {
  orders_.put(order.id, order);
}

}  // namespace vault
