// =============================================================================
// collaborators_test.cpp
// =============================================================================
// Unit tests for the in-memory collaborators the standalone binary runs on:
// vault::KeyringAuthorizationProvider and vault::TokenLedger.
// =============================================================================

#include "vault/auth/keyring_authorization_provider.hpp"
#include "vault/settlement/token_ledger.hpp"

#include <gtest/gtest.h>

#include <cstdint>

// -----------------------------------------------------------------------------
// 1. Keyring: only the registered proof verifies.
// -----------------------------------------------------------------------------
TEST(KeyringAuthorizationProviderTest, VerifiesRegisteredProofOnly) {
  vault::KeyringAuthorizationProvider keyring;
  keyring.registerIdentity("alice", "s3cret");

  EXPECT_TRUE(keyring.verify({"alice", "s3cret"}));
  EXPECT_FALSE(keyring.verify({"alice", "guess"}));
  EXPECT_FALSE(keyring.verify({"bob", "s3cret"}));

  keyring.registerIdentity("alice", "rotated");
  EXPECT_FALSE(keyring.verify({"alice", "s3cret"}));
  EXPECT_TRUE(keyring.verify({"alice", "rotated"}));
}

class TokenLedgerTest : public ::testing::Test {
 protected:
  vault::TokenLedger ledger;

  void SetUp() override {
    ledger.openAccount("tok/alice", "alice", 100);
    ledger.openAccount("tok/bob", "bob", 5);
  }
};

// -----------------------------------------------------------------------------
// 2. A valid transfer moves the amount and is counted.
// -----------------------------------------------------------------------------
TEST_F(TokenLedgerTest, TransferMovesBalance) {
  EXPECT_EQ(ledger.transfer("tok/alice", "tok/bob", 40, "alice"),
            vault::SettlementStatus::Ok);
  EXPECT_EQ(ledger.balance("tok/alice"), 60u);
  EXPECT_EQ(ledger.balance("tok/bob"), 45u);
  EXPECT_EQ(ledger.completedTransfers(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Failures move nothing.
// -----------------------------------------------------------------------------
TEST_F(TokenLedgerTest, FailedTransfersMoveNothing) {
  EXPECT_EQ(ledger.transfer("tok/alice", "tok/nobody", 1, "alice"),
            vault::SettlementStatus::UnknownAccount);
  EXPECT_EQ(ledger.transfer("tok/alice", "tok/bob", 1, "bob"),
            vault::SettlementStatus::Unauthorized);
  EXPECT_EQ(ledger.transfer("tok/alice", "tok/bob", 101, "alice"),
            vault::SettlementStatus::InsufficientFunds);

  EXPECT_EQ(ledger.balance("tok/alice"), 100u);
  EXPECT_EQ(ledger.balance("tok/bob"), 5u);
  EXPECT_EQ(ledger.completedTransfers(), 0u);
  EXPECT_FALSE(ledger.balance("tok/nobody").has_value());
}

// -----------------------------------------------------------------------------
// 4. A credit that would overflow the destination is refused.
// -----------------------------------------------------------------------------
TEST_F(TokenLedgerTest, DestinationOverflowIsRefused) {
  ledger.openAccount("tok/whale", "whale", UINT64_MAX);
  EXPECT_EQ(ledger.transfer("tok/alice", "tok/whale", 1, "alice"),
            vault::SettlementStatus::DestinationOverflow);
  EXPECT_EQ(ledger.balance("tok/alice"), 100u);
  EXPECT_EQ(ledger.balance("tok/whale"), UINT64_MAX);
  EXPECT_STREQ(vault::settlementStatusToString(
                   vault::SettlementStatus::DestinationOverflow),
               "DestinationOverflow");
}
