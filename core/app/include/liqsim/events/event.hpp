#pragma once

#include "liqsim/events/event_types.hpp"

#include <variant>

namespace liqsim {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus. A closed std::variant keeps
// events as values and lets subscribers dispatch with std::get_if or
// std::visit; adding an alternative makes the compiler flag every exhaustive
// visitor that needs updating.
// -----------------------------------------------------------------------------
using Event = std::variant<
    DayStartedEvent,
    AgentReactedEvent,
    RepoRefusedEvent,
    DayCompletedEvent>;

}  // namespace liqsim
