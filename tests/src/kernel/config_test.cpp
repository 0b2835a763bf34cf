#include <gtest/gtest.h>
#include <covenant/kernel/config.hpp>

#include <string>
#include <variant>

using covenant::kernel::try_parse_bootstrap_agent;

namespace {

std::string hex_of(const std::size_t bytes, const char digit = 'a') {
  return std::string(bytes * 2, digit);
}

}  // namespace

TEST(bootstrap_agent, parses_ed25519_with_capabilities) {
  auto error = std::string{};
  auto agent = try_parse_bootstrap_agent(
      "planner:ed25519:" + hex_of(32) + ":" + hex_of(64, 'b') + ":plan,review",
      error);
  ASSERT_TRUE(agent.has_value()) << error;
  EXPECT_EQ(agent->agent_id, "planner");
  ASSERT_TRUE(std::holds_alternative<covenant::schema::ed25519_signer_id>(
      agent->public_key));
  EXPECT_EQ(std::get<covenant::schema::ed25519_signer_id>(agent->public_key)
                .public_key[0],
            0xaa);
  ASSERT_TRUE(std::holds_alternative<covenant::schema::ed25519_signature_t>(
      agent->oath_signature));
  EXPECT_EQ(agent->capabilities, (std::vector<std::string>{"plan", "review"}));
}

TEST(bootstrap_agent, parses_secp256k1_without_capabilities) {
  auto error = std::string{};
  auto agent = try_parse_bootstrap_agent(
      "auditor:secp256k1:" + hex_of(33) + ":" + hex_of(65), error);
  ASSERT_TRUE(agent.has_value()) << error;
  EXPECT_TRUE(std::holds_alternative<covenant::schema::secp256k1_signer_id>(
      agent->public_key));
  EXPECT_TRUE(agent->capabilities.empty());
}

TEST(bootstrap_agent, rejects_malformed_entries) {
  auto error = std::string{};
  EXPECT_FALSE(try_parse_bootstrap_agent("planner:ed25519", error));
  EXPECT_FALSE(error.empty());

  EXPECT_FALSE(try_parse_bootstrap_agent(
      ":ed25519:" + hex_of(32) + ":" + hex_of(64), error));
  EXPECT_EQ(error, "empty agent id");

  EXPECT_FALSE(try_parse_bootstrap_agent(
      "planner:rsa:" + hex_of(32) + ":" + hex_of(64), error));
  EXPECT_EQ(error, "unknown signature scheme 'rsa'");

  EXPECT_FALSE(try_parse_bootstrap_agent(
      "planner:ed25519:" + hex_of(31) + ":" + hex_of(64), error));
  EXPECT_FALSE(try_parse_bootstrap_agent(
      "planner:ed25519:" + hex_of(32) + ":zz" + hex_of(63), error));
}
