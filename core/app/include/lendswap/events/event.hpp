#pragma once

#include "lendswap/events/event_types.hpp"
#include "lendswap/events/position_update_event.hpp"
#include "lendswap/events/reserve_update_event.hpp"

#include <variant>

namespace lendswap {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus and the IPC telemetry queue.
// Adding a type here means handling it in IpcServer::formatTelemetry().
// -----------------------------------------------------------------------------
using Event = std::variant<
    PositionUpdateEvent,
    ReserveUpdateEvent,
    OperationRejectedEvent>;

}  // namespace lendswap
