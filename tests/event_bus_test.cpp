// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for liqsim::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are a no-op
//   - Re-entrant publish (subscriber publishes inside callback) does not
//     deadlock
//   - Payloads survive the variant dispatch path
//   - Concurrent publishers deliver every event exactly once
// =============================================================================

#include "liqsim/eventbus/event_bus.hpp"
#include "liqsim/events/event.hpp"
#include "liqsim/events/event_types.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

using liqsim::AgentReactedEvent;
using liqsim::DayCompletedEvent;
using liqsim::DayStartedEvent;
using liqsim::Event;
using liqsim::EventBus;
using liqsim::RepoRefusedEvent;

// =============================================================================
// Test fixture: a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  EventBus bus;

  static DayStartedEvent makeDayStarted(int day, double vix) {
    DayStartedEvent e;
    e.day = day;
    e.vix = vix;
    e.stress_intensity = vix / 15.0;
    return e;
  }

  static AgentReactedEvent makeReacted(const std::string& name,
                                       double action_total) {
    AgentReactedEvent e;
    e.agent_name = name;
    e.agent_type = liqsim::domain::AgentType::HedgeFund;
    e.action_total = action_total;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// Why: The progress logger subscribes generically; a skipped alternative
//      would leave gaps in the run log.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const Event&) { ++call_count; });

  bus.publish(makeDayStarted(0, 30.0));
  bus.publish(makeReacted("HF_Macro", 120.0));
  bus.publish(RepoRefusedEvent{});
  bus.publish(DayCompletedEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int reacted_count = 0;
  bus.subscribe<AgentReactedEvent>(
      [&reacted_count](const AgentReactedEvent&) { ++reacted_count; });

  bus.publish(makeDayStarted(0, 30.0));
  bus.publish(makeReacted("HF_Macro", 120.0));
  bus.publish(DayCompletedEvent{});

  EXPECT_EQ(reacted_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  int count_c = 0;

  bus.subscribe<DayStartedEvent>(
      [&count_a](const DayStartedEvent&) { ++count_a; });
  bus.subscribe<DayStartedEvent>(
      [&count_b](const DayStartedEvent&) { ++count_b; });
  bus.subscribe([&count_c](const Event&) { ++count_c; });

  bus.publish(makeDayStarted(2, 45.0));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(count_c, 1);
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback no longer fires.
// Why: A report writer that outlives its run unsubscribes; later runs must
//      not call into it.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<DayStartedEvent>(
      [&call_count](const DayStartedEvent&) { ++call_count; });

  bus.publish(makeDayStarted(0, 20.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeDayStarted(1, 25.0));
  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing an unknown id is harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  bus.subscribe([](const Event&) {});
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 6. Publishing with no subscribers is harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeDayStarted(0, 15.0)));
  EXPECT_EQ(bus.publishedCount(), 1u);
}

// -----------------------------------------------------------------------------
// 7. A subscriber that publishes inside its callback does not deadlock.
// Why: publish() copies the subscriber list and releases the lock before
//      invoking callbacks. Holding the lock across callbacks would hang here.
//
// Scenario: subscriber A receives AgentReactedEvent and publishes a
//           RepoRefusedEvent for the same agent. Subscriber B receives it.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::string refused_name;

  bus.subscribe<RepoRefusedEvent>(
      [&refused_name](const RepoRefusedEvent& e) { refused_name = e.agent_name; });

  bus.subscribe<AgentReactedEvent>([this](const AgentReactedEvent& reacted) {
    RepoRefusedEvent refused;
    refused.day = reacted.day;
    refused.agent_name = reacted.agent_name;
    refused.banks_contacted = 2;
    bus.publish(refused);
  });

  bus.publish(makeReacted("HF_Macro", 120.0));

  EXPECT_EQ(refused_name, "HF_Macro");
}

// -----------------------------------------------------------------------------
// 8. Field values survive publish -> dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  DayCompletedEvent received;

  bus.subscribe<DayCompletedEvent>(
      [&received](const DayCompletedEvent& e) { received = e; });

  DayCompletedEvent sent;
  sent.day = 4;
  sent.agents_reacted = 3;
  sent.total_e1 = 1234.5;
  sent.total_e2 = 67.25;
  sent.gilt_selling = 800.0;
  sent.sequence_id = 41;
  bus.publish(sent);

  EXPECT_EQ(received.day, 4);
  EXPECT_EQ(received.agents_reacted, 3u);
  EXPECT_DOUBLE_EQ(received.total_e1, 1234.5);
  EXPECT_DOUBLE_EQ(received.total_e2, 67.25);
  EXPECT_DOUBLE_EQ(received.gilt_selling, 800.0);
  EXPECT_EQ(received.sequence_id, 41u);
}

// -----------------------------------------------------------------------------
// 9. Concurrent publishers: every event is delivered exactly once.
// Why: subscribe/unsubscribe/publish are documented as thread-safe; an
//      observer may publish from its own thread while a run is in progress.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishDeliversEveryEvent) {
  constexpr int kThreads = 4;
  constexpr int kEventsPerThread = 500;

  std::atomic<int> received{0};
  bus.subscribe([&received](const Event&) { ++received; });

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this, t] {
      for (int i = 0; i < kEventsPerThread; ++i) {
        bus.publish(makeDayStarted(t * kEventsPerThread + i, 15.0));
      }
    });
  }
  for (auto& thread : publishers) {
    thread.join();
  }

  EXPECT_EQ(received.load(), kThreads * kEventsPerThread);
  EXPECT_EQ(bus.publishedCount(),
            static_cast<std::size_t>(kThreads * kEventsPerThread));
}
