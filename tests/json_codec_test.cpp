// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the custody::codec JSON encoders.
//
// Validates:
//   - Product rendering: unset shipper/buyer are null, stage is derived
//   - Event rendering: envelope fields plus per-type fields
//   - Result rendering for ok and rejected outcomes
// =============================================================================

#include "custody/codec/json_codec.hpp"
#include "custody/time/time_utils.hpp"

#include <gtest/gtest.h>

using custody::domain::Product;
using custody::domain::TransitionError;
using custody::domain::TransitionResult;

namespace {

Product makeProduct() {
  Product p;
  p.id = 7;
  p.name = "Coffee";
  p.origin = "Arusha";
  p.producer = "farm";
  p.location = "Arusha";
  p.price = 120;
  return p;
}

}  // namespace

TEST(JsonCodecTest, FreshProductRendersNullParties) {
  auto j = custody::codec::productToJson(makeProduct());

  EXPECT_EQ(j["id"], 7);
  EXPECT_EQ(j["name"], "Coffee");
  EXPECT_EQ(j["producer"], "farm");
  EXPECT_TRUE(j["shipper"].is_null());
  EXPECT_TRUE(j["buyer"].is_null());
  EXPECT_EQ(j["price"], 120);
  EXPECT_EQ(j["is_paid"], false);
  EXPECT_EQ(j["stage"], "Created");
}

TEST(JsonCodecTest, ReceivedProductRendersBoundParties) {
  Product p = makeProduct();
  p.is_paid = true;
  p.shipper = "carrier";
  p.location = "Mombasa";
  p.is_received = true;
  p.buyer = "shop";
  p.is_disputed = true;

  auto j = custody::codec::productToJson(p);
  EXPECT_EQ(j["shipper"], "carrier");
  EXPECT_EQ(j["buyer"], "shop");
  EXPECT_EQ(j["location"], "Mombasa");
  EXPECT_EQ(j["is_disputed"], true);
  EXPECT_EQ(j["stage"], "Received");
}

// -----------------------------------------------------------------------------
// Events: every alternative carries the envelope and its own fields.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, CreatedEventCarriesEnvelope) {
  custody::ProductCreatedEvent e;
  e.product_id = 3;
  e.producer = "farm";
  e.name = "Tea";
  e.origin = "Kericho";
  e.price = 55;
  e.sequence_id = 9;
  e.timestamp = custody::ms_to_timestamp(1'700'000'000'123);

  auto j = custody::codec::eventToJson(e);
  EXPECT_EQ(j["type"], "product_created");
  EXPECT_EQ(j["sequence_id"], 9);
  EXPECT_EQ(j["timestamp_ms"], 1'700'000'000'123);
  EXPECT_EQ(j["product_id"], 3);
  EXPECT_EQ(j["producer"], "farm");
  EXPECT_EQ(j["origin"], "Kericho");
  EXPECT_EQ(j["price"], 55);
}

TEST(JsonCodecTest, TransitionEventsCarryTheirParties) {
  custody::PaymentTransferredEvent paid;
  paid.product_id = 1;
  paid.payer = "shop";
  paid.payee = "farm";
  paid.amount = 40;
  auto j = custody::codec::eventToJson(paid);
  EXPECT_EQ(j["type"], "payment_transferred");
  EXPECT_EQ(j["payer"], "shop");
  EXPECT_EQ(j["payee"], "farm");
  EXPECT_EQ(j["amount"], 40);

  custody::ProductShippedEvent shipped;
  shipped.product_id = 1;
  shipped.shipper = "carrier";
  shipped.location = "Port";
  j = custody::codec::eventToJson(shipped);
  EXPECT_EQ(j["type"], "product_shipped");
  EXPECT_EQ(j["shipper"], "carrier");
  EXPECT_EQ(j["location"], "Port");

  custody::ProductReceivedEvent received;
  received.buyer = "shop";
  j = custody::codec::eventToJson(received);
  EXPECT_EQ(j["type"], "product_received");
  EXPECT_EQ(j["buyer"], "shop");

  custody::DisputeRaisedEvent raised;
  raised.raised_by = "farm";
  j = custody::codec::eventToJson(raised);
  EXPECT_EQ(j["type"], "dispute_raised");
  EXPECT_EQ(j["raised_by"], "farm");

  custody::DisputeResolvedEvent resolved;
  resolved.resolved_by = "admin";
  j = custody::codec::eventToJson(resolved);
  EXPECT_EQ(j["type"], "dispute_resolved");
  EXPECT_EQ(j["resolved_by"], "admin");
}

TEST(JsonCodecTest, EventsToJsonPreservesOrder) {
  std::vector<custody::Event> events;
  custody::DisputeRaisedEvent first;
  first.sequence_id = 1;
  custody::DisputeResolvedEvent second;
  second.sequence_id = 2;
  events.emplace_back(first);
  events.emplace_back(second);

  auto j = custody::codec::eventsToJson(events);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["sequence_id"], 1);
  EXPECT_EQ(j[1]["type"], "dispute_resolved");

  EXPECT_TRUE(custody::codec::eventsToJson({}).is_array());
  EXPECT_TRUE(custody::codec::eventsToJson({}).empty());
}

TEST(JsonCodecTest, ResultRendering) {
  auto ok = custody::codec::resultToJson(TransitionResult::success(4));
  EXPECT_EQ(ok["status"], "ok");
  EXPECT_EQ(ok["product_id"], 4);
  EXPECT_FALSE(ok.contains("error"));

  auto bare = custody::codec::resultToJson(TransitionResult::success());
  EXPECT_FALSE(bare.contains("product_id"));

  auto rejected = custody::codec::resultToJson(
      TransitionResult::failure(TransitionError::InsufficientFunds, 4));
  EXPECT_EQ(rejected["status"], "rejected");
  EXPECT_EQ(rejected["error"], "InsufficientFunds");
  EXPECT_EQ(rejected["product_id"], 4);
}
