// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for custody::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish (subscriber publishes inside callback) does not deadlock
//   - Payload fields survive the variant dispatch path
//   - A subscriber that throws is isolated from the others
//
// All tests are single-threaded. Cross-thread delivery through
// EventLoopThread is covered in custody_engine_test.cpp.
// =============================================================================

#include "custody/eventbus/event_bus.hpp"
#include "custody/events/event.hpp"
#include "custody/events/event_types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  custody::EventBus bus;

  static custody::ProductCreatedEvent makeCreated(custody::domain::ProductId id,
                                                  const std::string& name) {
    custody::ProductCreatedEvent e;
    e.product_id = id;
    e.producer = "producer-1";
    e.name = name;
    e.origin = "Kisumu";
    e.price = 100;
    return e;
  }

  static custody::ProductShippedEvent makeShipped(
      custody::domain::ProductId id, const std::string& location) {
    custody::ProductShippedEvent e;
    e.product_id = id;
    e.shipper = "shipper-1";
    e.location = location;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const custody::Event&) { ++call_count; });

  bus.publish(makeCreated(1, "coffee"));
  bus.publish(makeShipped(1, "Mombasa"));
  bus.publish(custody::DisputeRaisedEvent{1, "buyer-1"});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int shipped_count = 0;
  bus.subscribe<custody::ProductShippedEvent>(
      [&shipped_count](const custody::ProductShippedEvent&) {
        ++shipped_count;
      });

  bus.publish(makeCreated(1, "coffee"));
  bus.publish(makeShipped(1, "Mombasa"));

  EXPECT_EQ(shipped_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  int count_c = 0;

  bus.subscribe<custody::ProductCreatedEvent>(
      [&count_a](const custody::ProductCreatedEvent&) { ++count_a; });
  bus.subscribe<custody::ProductCreatedEvent>(
      [&count_b](const custody::ProductCreatedEvent&) { ++count_b; });
  bus.subscribe([&count_c](const custody::Event&) { ++count_c; });

  bus.publish(makeCreated(7, "tea"));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(count_c, 1);
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<custody::ProductCreatedEvent>(
      [&call_count](const custody::ProductCreatedEvent&) { ++call_count; });

  bus.publish(makeCreated(1, "coffee"));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeCreated(2, "cocoa"));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeCreated(1, "coffee")));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// The bus copies its subscriber list before invoking callbacks, so the inner
// publish takes the lock afresh.
//
// Scenario: subscriber A sees a DisputeRaisedEvent and publishes the matching
//           DisputeResolvedEvent. Subscriber B counts resolutions.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int resolved = 0;

  bus.subscribe<custody::DisputeResolvedEvent>(
      [&resolved](const custody::DisputeResolvedEvent&) { ++resolved; });

  bus.subscribe<custody::DisputeRaisedEvent>(
      [this](const custody::DisputeRaisedEvent& raised) {
        custody::DisputeResolvedEvent e;
        e.product_id = raised.product_id;
        e.resolved_by = "admin";
        bus.publish(e);
      });

  bus.publish(custody::DisputeRaisedEvent{4, "producer-1"});

  EXPECT_EQ(resolved, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive publish → variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  custody::domain::ProductId received_id = 0;
  std::string received_location;

  bus.subscribe<custody::ProductShippedEvent>(
      [&](const custody::ProductShippedEvent& e) {
        received_id = e.product_id;
        received_location = e.location;
      });

  bus.publish(makeShipped(42, "Rotterdam"));

  EXPECT_EQ(received_id, 42u);
  EXPECT_EQ(received_location, "Rotterdam");
}

// -----------------------------------------------------------------------------
// A throwing subscriber does not keep the event from later subscribers.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotBlockOthers) {
  int delivered = 0;
  bus.subscribe([](const custody::Event&) {
    throw std::runtime_error("observer failed");
  });
  bus.subscribe([&delivered](const custody::Event&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(makeCreated(1, "Maize")));
  EXPECT_NO_THROW(bus.publish(makeShipped(1, "Nakuru")));
  EXPECT_EQ(delivered, 2);
}
