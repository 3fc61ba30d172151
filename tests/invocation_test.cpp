#include "cli/invocation.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

Result<Invocation> Parse(const std::vector<std::string>& args) {
  return ParseInvocation(args, "mainnet");
}

void ExpectUsageError(const std::vector<std::string>& args) {
  auto inv = Parse(args);
  ASSERT_FALSE(inv.IsOk());
  EXPECT_EQ(inv.Error().kind, ErrorKind::USAGE);
  EXPECT_EQ(inv.Error().context, "arguments");
  EXPECT_EQ(ExitCodeFor(inv.Error().kind), 2);
}

}

TEST(InvocationTest, ParsesPositionalSignAndSubmit) {
  auto inv = Parse({"SEED", "Coin", "transfer", R"([{"b58":"R"},"10","AMA"])", "testnet"});
  ASSERT_TRUE(inv.IsOk());
  EXPECT_EQ(inv.Value().command, Command::SIGN_AND_SUBMIT);
  EXPECT_EQ(inv.Value().seed_b58, "SEED");
  EXPECT_EQ(inv.Value().request.contract, "Coin");
  EXPECT_EQ(inv.Value().request.function, "transfer");
  EXPECT_EQ(inv.Value().request.args, json::parse(R"([{"b58":"R"},"10","AMA"])"));
  EXPECT_EQ(inv.Value().request.network, "testnet");
}

TEST(InvocationTest, NetworkDefaultsFromConfiguration) {
  auto inv = ParseInvocation({"SEED", "Contract", "call", "{}"}, "devnet");
  ASSERT_TRUE(inv.IsOk());
  EXPECT_EQ(inv.Value().request.network, "devnet");
  EXPECT_TRUE(inv.Value().request.args.is_object());
}

TEST(InvocationTest, ArgsJsonIsForwardedUninterpreted) {
  auto inv = Parse({"SEED", "Contract", "call", R"({"nested":{"deep":[1,2.5,null,true]}})"});
  ASSERT_TRUE(inv.IsOk());
  EXPECT_EQ(inv.Value().request.args["nested"]["deep"][1], 2.5);
}

TEST(InvocationTest, ParsesTransferShortcut) {
  auto inv = Parse({"--transfer", "SEED", "RECIPIENT", "1000000000", "AMA"});
  ASSERT_TRUE(inv.IsOk());
  EXPECT_EQ(inv.Value().command, Command::TRANSFER);
  EXPECT_EQ(inv.Value().seed_b58, "SEED");
  EXPECT_EQ(inv.Value().request.contract, "Coin");
  EXPECT_EQ(inv.Value().request.function, "transfer");
  EXPECT_EQ(inv.Value().request.network, "mainnet");
  EXPECT_EQ(inv.Value().request.args, json::parse(R"([{"b58":"RECIPIENT"},"1000000000","AMA"])"));
}

TEST(InvocationTest, ParsesPubkeyBalanceAndHelp) {
  auto pubkey = Parse({"--pubkey", "-"});
  ASSERT_TRUE(pubkey.IsOk());
  EXPECT_EQ(pubkey.Value().command, Command::SHOW_PUBKEY);
  EXPECT_EQ(pubkey.Value().seed_b58, "-");

  auto balance = Parse({"--balance", "ADDR"});
  ASSERT_TRUE(balance.IsOk());
  EXPECT_EQ(balance.Value().command, Command::BALANCE);
  EXPECT_EQ(balance.Value().address_b58, "ADDR");

  auto help = Parse({"--help"});
  ASSERT_TRUE(help.IsOk());
  EXPECT_EQ(help.Value().command, Command::HELP);
  EXPECT_EQ(Parse({"-h"}).Value().command, Command::HELP);
}

TEST(InvocationTest, MissingOrExtraArgumentsAreUsageErrors) {
  ExpectUsageError({});
  ExpectUsageError({"SEED", "Coin", "transfer"});
  ExpectUsageError({"SEED", "Coin", "transfer", "[]", "testnet", "extra"});
  ExpectUsageError({"--transfer", "SEED", "RECIPIENT", "10"});
  ExpectUsageError({"--pubkey"});
  ExpectUsageError({"--balance", "A", "B"});
}

TEST(InvocationTest, InvalidValuesAreUsageErrors) {
  ExpectUsageError({"SEED", "Coin", "transfer", "[not json"});
  ExpectUsageError({"SEED", "", "transfer", "[]"});
  ExpectUsageError({"SEED", "Coin", "", "[]"});
  ExpectUsageError({"SEED", "Coin", "transfer", "[]", ""});
  ExpectUsageError({"--transfer", "SEED", "RECIPIENT", "1.5", "AMA"});
  ExpectUsageError({"--transfer", "SEED", "RECIPIENT", "-1", "AMA"});
  ExpectUsageError({"--transfer", "SEED", "RECIPIENT", "10", ""});
  ExpectUsageError({"--frobnicate", "x"});
}

TEST(InvocationTest, UsageTextNamesEveryForm) {
  std::string text = UsageText("ama-sign");
  EXPECT_NE(text.find("--transfer"), std::string::npos);
  EXPECT_NE(text.find("--pubkey"), std::string::npos);
  EXPECT_NE(text.find("--balance"), std::string::npos);
  EXPECT_NE(text.find("<args_json>"), std::string::npos);
}
