// Client Record Unit Tests
//
// Tests cover:
// - Aliveness predicate and grace period
// - Applying partial updates
// - Binding mode text conversion

#include "client.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace registration {
namespace {

using namespace std::chrono_literals;

Client MakeClient() {
  Client client;
  client.registration_id = "reg-1";
  client.endpoint = "device-1";
  client.lifetime = 60s;
  client.registration_time = std::chrono::steady_clock::time_point{} + 100s;
  client.last_update_time = client.registration_time;
  client.address = "10.0.0.1";
  client.port = 5683;
  client.sms_number = "+100";
  client.lwm2m_version = "1.0";
  client.binding_mode = BindingMode::kU;
  client.object_links = {"</1/0>", "</3/0>"};
  return client;
}

// =============================================================================
// Aliveness Tests
// =============================================================================

TEST(ClientTest, AliveBeforeLifetimeElapses) {
  Client client = MakeClient();
  EXPECT_TRUE(client.IsAlive(client.last_update_time));
  EXPECT_TRUE(client.IsAlive(client.last_update_time + 59s));
}

TEST(ClientTest, DeadOnceLifetimeElapses) {
  Client client = MakeClient();
  EXPECT_FALSE(client.IsAlive(client.last_update_time + 60s));
  EXPECT_FALSE(client.IsAlive(client.last_update_time + 61s));
}

TEST(ClientTest, GraceExtendsLease) {
  Client client = MakeClient();
  EXPECT_TRUE(client.IsAlive(client.last_update_time + 65s, 10s));
  EXPECT_FALSE(client.IsAlive(client.last_update_time + 70s, 10s));
}

TEST(ClientTest, ZeroLifetimeIsNeverAlive) {
  Client client = MakeClient();
  client.lifetime = 0s;
  EXPECT_FALSE(client.IsAlive(client.last_update_time));
}

TEST(ClientTest, ExpirationTime) {
  Client client = MakeClient();
  EXPECT_EQ(client.ExpirationTime(), client.last_update_time + 60s);
  EXPECT_EQ(client.ExpirationTime(10s), client.last_update_time + 70s);
}

TEST(ClientTest, VeryLongLifetimeStaysAlive) {
  Client client = MakeClient();
  client.lifetime = std::chrono::seconds(10'000'000'000);

  EXPECT_EQ(client.ExpirationTime(),
            std::chrono::steady_clock::time_point::max());
  EXPECT_TRUE(client.IsAlive(client.last_update_time));
  EXPECT_TRUE(client.IsAlive(client.last_update_time + 24h * 365 * 100));
}

TEST(ClientTest, MaximalLifetimeAndGraceStayAlive) {
  Client client = MakeClient();
  client.lifetime = std::chrono::seconds::max();

  EXPECT_TRUE(client.IsAlive(client.last_update_time));
  EXPECT_TRUE(
      client.IsAlive(client.last_update_time, std::chrono::seconds::max()));
}

TEST(ClientTest, HugeGraceStaysAlive) {
  Client client = MakeClient();
  EXPECT_TRUE(client.IsAlive(client.last_update_time + 24h * 365,
                             std::chrono::seconds(10'000'000'000)));
}

// =============================================================================
// Update Tests
// =============================================================================

TEST(ClientUpdateTest, EmptyUpdateOnlyRefreshesLease) {
  Client client = MakeClient();
  ClientUpdate update;
  update.registration_id = client.registration_id;
  update.update_time = client.last_update_time + 30s;

  Client updated = update.ApplyTo(client);

  EXPECT_EQ(updated.last_update_time, client.last_update_time + 30s);
  updated.last_update_time = client.last_update_time;
  EXPECT_EQ(updated, client);
}

TEST(ClientUpdateTest, PresentFieldsReplaced) {
  Client client = MakeClient();
  ClientUpdate update;
  update.registration_id = client.registration_id;
  update.lifetime = 120s;
  update.address = "10.0.0.2";
  update.port = 5684;
  update.sms_number = "+200";
  update.binding_mode = BindingMode::kUQ;
  update.object_links = std::vector<std::string>{"</5/0>"};
  update.update_time = client.last_update_time + 1s;

  Client updated = update.ApplyTo(client);

  EXPECT_EQ(updated.lifetime, 120s);
  EXPECT_EQ(updated.address, "10.0.0.2");
  EXPECT_EQ(updated.port, 5684);
  EXPECT_EQ(updated.sms_number, "+200");
  EXPECT_EQ(updated.binding_mode, BindingMode::kUQ);
  EXPECT_EQ(updated.object_links, std::vector<std::string>({"</5/0>"}));
}

TEST(ClientUpdateTest, IdentityPreserved) {
  Client client = MakeClient();
  ClientUpdate update;
  update.registration_id = client.registration_id;
  update.lifetime = 5s;
  update.update_time = client.last_update_time + 10s;

  Client updated = update.ApplyTo(client);

  EXPECT_EQ(updated.registration_id, client.registration_id);
  EXPECT_EQ(updated.endpoint, client.endpoint);
  EXPECT_EQ(updated.registration_time, client.registration_time);
  EXPECT_EQ(updated.lwm2m_version, client.lwm2m_version);
}

TEST(ClientUpdateTest, EmptyObjectLinksClearsLinks) {
  Client client = MakeClient();
  ClientUpdate update;
  update.registration_id = client.registration_id;
  update.object_links = std::vector<std::string>{};

  EXPECT_TRUE(update.ApplyTo(client).object_links.empty());
}

TEST(ClientUpdateTest, RefreshedLeaseIsAlive) {
  Client client = MakeClient();
  auto late = client.last_update_time + 90s;
  ASSERT_FALSE(client.IsAlive(late));

  ClientUpdate update;
  update.registration_id = client.registration_id;
  update.update_time = late;

  EXPECT_TRUE(update.ApplyTo(client).IsAlive(late + 59s));
}

// =============================================================================
// Binding Mode Tests
// =============================================================================

TEST(BindingModeTest, TextForms) {
  for (BindingMode mode : {BindingMode::kU, BindingMode::kUQ, BindingMode::kS,
                           BindingMode::kSQ, BindingMode::kUS,
                           BindingMode::kUQS}) {
    auto parsed = ParseBindingMode(BindingModeToString(mode));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, mode);
  }
  EXPECT_EQ(BindingModeToString(BindingMode::kUQS), "UQS");
}

TEST(BindingModeTest, UnknownTextRejected) {
  EXPECT_FALSE(ParseBindingMode("").has_value());
  EXPECT_FALSE(ParseBindingMode("T").has_value());
  EXPECT_FALSE(ParseBindingMode("uq").has_value());
}

}  // namespace
}  // namespace registration
