#pragma once

#include "vault/events/event_types.hpp"
#include "vault/events/trade_events.hpp"

#include <variant>

namespace vault {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus and the
// IpcServer telemetry queue.
//
// Adding an event kind means adding it here and to
// IpcServer::formatTelemetry(); std::get_if dispatch silently ignores kinds
// a subscriber did not ask for.
// -----------------------------------------------------------------------------
using Event = std::variant<
    AssetCreatedEvent,
    AssetPriceUpdatedEvent,
    OrderCreatedEvent,
    TradeExecutedEvent,
    TradeRejectedEvent>;

}  // namespace vault
