#include "pool/lending_pool.hpp"
#include "ledger/token_ledger.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>

namespace {

PoolConfig TestPoolConfig() {
  PoolConfig cfg;
  cfg.admin = "admin";
  cfg.account = "lending-pool";
  return cfg;
}

CallContext At(const Identity& who, Height height) { return CallContext{who, height}; }

class LendingPoolTest : public ::testing::Test {
protected:
  LendingPoolTest() : pool_(TestPoolConfig(), ledger_) {
    ledger_.Mint("alice", 200000);
    ledger_.Mint("bob", 5000);
  }
  TokenLedger ledger_;
  LendingPool pool_;
};

TEST_F(LendingPoolTest, ContributionMovesFundsAndLocksThem) {
  EXPECT_EQ(pool_.Contribute(At("bob", 10), 5000), 5000u);
  auto c = pool_.GetContribution("bob");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->amount, 5000u);
  EXPECT_EQ(c->last_contribution_height, 10u);
  EXPECT_EQ(c->locked_until, 154u);
  EXPECT_EQ(pool_.GetTotalPoolBalance(), 5000u);
  EXPECT_EQ(pool_.GetAvailableFunds(), 5000u);
  EXPECT_EQ(ledger_.BalanceOf("bob"), 0u);
  EXPECT_TRUE(pool_.IsWithdrawalLocked("bob", 153));
  EXPECT_FALSE(pool_.IsWithdrawalLocked("bob", 154));
}

TEST_F(LendingPoolTest, ContributionBounds) {
  ExpectLendingError(ErrorCode::ZeroAmount, [&] { pool_.Contribute(At("alice", 1), 0); });
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { pool_.Contribute(At("alice", 1), 999); });
  ExpectLendingError(ErrorCode::MaxContributionExceeded, [&] { pool_.Contribute(At("alice", 1), 100001); });
  ExpectLendingError(ErrorCode::TransferFailed, [&] { pool_.Contribute(At("carol", 1), 1000); });
  EXPECT_FALSE(pool_.GetContribution("carol").has_value());
  EXPECT_EQ(pool_.GetTotalPoolBalance(), 0u);
}

TEST_F(LendingPoolTest, WithdrawalWaitsForLock) {
  ExpectLendingError(ErrorCode::InsufficientBalance, [&] { pool_.Withdraw(At("alice", 1), 10); });
  pool_.Contribute(At("alice", 0), 50000);
  ExpectLendingError(ErrorCode::WithdrawalLocked, [&] { pool_.Withdraw(At("alice", 143), 1000); });
  ExpectLendingError(ErrorCode::ZeroAmount, [&] { pool_.Withdraw(At("alice", 144), 0); });
  ExpectLendingError(ErrorCode::InsufficientBalance, [&] { pool_.Withdraw(At("alice", 144), 50001); });

  EXPECT_EQ(pool_.Withdraw(At("alice", 144), 20000), 30000u);
  EXPECT_EQ(ledger_.BalanceOf("alice"), 170000u);
  EXPECT_EQ(pool_.GetTotalPoolBalance(), 30000u);
  EXPECT_EQ(pool_.Withdraw(At("alice", 145), 30000), 0u);
  EXPECT_FALSE(pool_.GetContribution("alice").has_value());
}

TEST_F(LendingPoolTest, PauseBlocksContributionsAndDisbursements) {
  pool_.Contribute(At("alice", 0), 10000);
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { pool_.Pause(At("alice", 1)); });
  pool_.Pause(At("admin", 1));
  EXPECT_TRUE(pool_.IsPaused());
  ExpectLendingError(ErrorCode::PoolPaused, [&] { pool_.Contribute(At("alice", 2), 1000); });
  ExpectLendingError(ErrorCode::PoolPaused, [&] { pool_.Withdraw(At("alice", 500), 1000); });
  EXPECT_FALSE(pool_.DisburseFunds(100, "bob"));

  pool_.Unpause(At("admin", 3));
  EXPECT_TRUE(pool_.DisburseFunds(100, "bob"));
  EXPECT_EQ(ledger_.BalanceOf("bob"), 5100u);
  EXPECT_EQ(pool_.GetAvailableFunds(), 9900u);
}

TEST_F(LendingPoolTest, DisbursementNeedsFunds) {
  pool_.Contribute(At("bob", 0), 1000);
  EXPECT_FALSE(pool_.DisburseFunds(1001, "carol"));
  EXPECT_EQ(ledger_.BalanceOf("carol"), 0u);
}

TEST_F(LendingPoolTest, InterestCountsWholeDays) {
  EXPECT_EQ(pool_.CalculateInterest(1000, 30), 0u);
  EXPECT_EQ(pool_.CalculateInterest(1000, 288), 40u);
  pool_.SetBaseInterestRate(At("admin", 0), 10);
  EXPECT_EQ(pool_.CalculateInterest(1000, 288), 200u);
  ExpectLendingError(ErrorCode::InvalidConfig, [&] { pool_.SetBaseInterestRate(At("admin", 0), 11); });
  ExpectLendingError(ErrorCode::InvalidConfig, [&] { pool_.SetBaseInterestRate(At("admin", 0), 0); });
}

TEST_F(LendingPoolTest, AdminSetters) {
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { pool_.SetMinContribution(At("admin", 0), 0); });
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { pool_.SetMaxContribution(At("admin", 0), 0); });
  ExpectLendingError(ErrorCode::InvalidDuration, [&] { pool_.SetWithdrawalLockPeriod(At("admin", 0), 0); });
  pool_.SetMinContribution(At("admin", 0), 10);
  pool_.SetWithdrawalLockPeriod(At("admin", 0), 5);
  pool_.Contribute(At("bob", 0), 10);
  EXPECT_EQ(pool_.GetContribution("bob")->locked_until, 5u);

  pool_.SetAdmin(At("admin", 0), "treasury");
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { pool_.Pause(At("admin", 1)); });
  pool_.Pause(At("treasury", 1));
  EXPECT_TRUE(pool_.IsPaused());
}

TEST_F(LendingPoolTest, LockedUntilAndPoolBalanceQueries) {
  EXPECT_EQ(pool_.GetUserLockedUntil("alice"), 0u);
  pool_.Contribute(At("alice", 100), 5000);
  EXPECT_EQ(pool_.GetUserLockedUntil("alice"), 244u);
  EXPECT_EQ(pool_.GetTotalPoolBalance(), 5000u);
  pool_.Withdraw(At("alice", 300), 5000);
  EXPECT_EQ(pool_.GetUserLockedUntil("alice"), 0u);
  EXPECT_EQ(pool_.GetTotalPoolBalance(), 0u);
}

TEST_F(LendingPoolTest, YieldHistoryIsKeyedByHeight) {
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { pool_.RecordYield(At("alice", 100), 100); });
  EXPECT_FALSE(pool_.GetHistoricalYield(100).has_value());

  pool_.RecordYield(At("admin", 100), 100);
  pool_.RecordYield(At("admin", 250), 40);
  EXPECT_EQ(pool_.GetHistoricalYield(100), std::optional<Amount>(100));
  EXPECT_EQ(pool_.GetHistoricalYield(250), std::optional<Amount>(40));
  EXPECT_FALSE(pool_.GetHistoricalYield(101).has_value());

  pool_.RecordYield(At("admin", 100), 120);
  EXPECT_EQ(pool_.GetHistoricalYield(100), std::optional<Amount>(120));
}

TEST_F(LendingPoolTest, UnlockHeightOnlyMovesForward) {
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { pool_.UpdateUnlockTimestamp(At("alice", 0), 50); });
  pool_.UpdateUnlockTimestamp(At("admin", 0), 50);
  pool_.UpdateUnlockTimestamp(At("admin", 0), 120);
  EXPECT_EQ(pool_.GetUnlockTimestamp(), 120u);
  pool_.UpdateUnlockTimestamp(At("admin", 0), 120);
  ExpectLendingError(ErrorCode::UnlockPeriodNotEnded, [&] { pool_.UpdateUnlockTimestamp(At("admin", 0), 50); });
  EXPECT_EQ(pool_.GetUnlockTimestamp(), 120u);
}

TEST_F(LendingPoolTest, UnlockHeightReleasesEarlierLocks) {
  pool_.Contribute(At("alice", 100), 5000);
  EXPECT_TRUE(pool_.IsWithdrawalLocked("alice", 150));
  pool_.UpdateUnlockTimestamp(At("admin", 150), 243);
  ExpectLendingError(ErrorCode::WithdrawalLocked, [&] { pool_.Withdraw(At("alice", 150), 1000); });

  pool_.UpdateUnlockTimestamp(At("admin", 150), 244);
  EXPECT_FALSE(pool_.IsWithdrawalLocked("alice", 150));
  EXPECT_EQ(pool_.Withdraw(At("alice", 150), 1000), 4000u);
}

TEST_F(LendingPoolTest, RollbackRestoresContributions) {
  pool_.Checkpoint();
  pool_.Contribute(At("alice", 0), 5000);
  pool_.Rollback();
  EXPECT_FALSE(pool_.GetContribution("alice").has_value());
  EXPECT_EQ(pool_.GetTotalPoolBalance(), 0u);
}

} // namespace
