#pragma once

#include "liqsim/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace liqsim {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel between the Simulation and
// whatever observes it (progress logging, report writers, tests). The
// Simulation publishes; observers never call back into the engine.
//
// Thread model: the engine itself publishes from one thread. Observers may
// subscribe or unsubscribe from their own threads while a run is publishing,
// so the subscriber list is guarded by a mutex. Callbacks run synchronously
// on the publishing thread, so delivery order equals publish order.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event as the variant.
  using GenericCallback = std::function<void(const Event&)>;

  // Returned by subscribe(); pass to unsubscribe().
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for all events.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only for events holding EventType, e.g.
  // subscribe<AgentReactedEvent>(...). Implemented as a generic callback
  // that filters on the variant alternative.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish already in flight may still deliver
  // to it once.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers `event` to every current subscriber before returning. The
  // subscriber list is copied under the lock and callbacks run without it,
  // so a callback may publish or unsubscribe without deadlocking.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

  // Events published since construction, counted whether or not anyone
  // was subscribed.
  std::size_t publishedCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;  // guards everything below
  SubscriptionId next_id_{0};
  std::size_t published_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace liqsim
