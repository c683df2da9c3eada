#include "loans/loan_manager.hpp"
#include "vault/collateral_vault.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>

namespace {

LoanConfig TestLoanConfig() {
  LoanConfig cfg;
  cfg.authority = "gov";
  cfg.engine_identity = "manager";
  cfg.collateral_currency = "STX";
  return cfg;
}

VaultConfig TestVaultConfig() {
  VaultConfig cfg;
  cfg.authority = "manager";
  cfg.custody_account = "vault";
  cfg.pool_recipient = "pool";
  cfg.currency_oracles["STX"] = "static";
  return cfg;
}

CallContext At(const Identity& who, Height height) { return CallContext{who, height}; }

class LoanManagerTest : public ::testing::Test {
protected:
  LoanManagerTest()
    : vault_(TestVaultConfig(), oracle_, ledger_, coordinator_),
      manager_(TestLoanConfig(), vault_, pool_, registry_, repayments_, coordinator_) {
    coordinator_.Enlist(ledger_);
    oracle_.SetPrice("STX", 1);
    ledger_.Mint("alice", 10000);
    ledger_.Mint("bob", 10000);
    for (const char* who : {"alice", "bob", "carol", "dave", "erin"}) registry_.Verify(who);
    registry_.SetAssetOwner(1, "alice");
    registry_.SetAssetOwner(2, "bob");
  }

  LoanId Request(const Identity& who = "alice", Height height = 0) {
    return manager_.RequestLoan(At(who, height), 1000, 30, who == "alice" ? 1 : 2, 1500);
  }

  // Request at 0, one approving vote, finalize at 101.
  LoanId Activate() {
    LoanId id = Request();
    manager_.VoteOnLoan(At("bob", 1), id, true);
    EXPECT_TRUE(manager_.FinalizeLoan(At("carol", 101), id));
    return id;
  }

  TransactionCoordinator coordinator_;
  TokenLedger ledger_;
  StaticPriceOracle oracle_;
  JsonRegistry registry_;
  FakeFundsPool pool_;
  FakeRepaymentHandler repayments_;
  CollateralVault vault_;
  LoanManager manager_;
};

TEST_F(LoanManagerTest, RequestCreatesPendingLoanWithCollateral) {
  LoanId id = Request();
  EXPECT_EQ(id, 0u);
  EXPECT_EQ(manager_.NextLoanId(), 1u);

  auto loan = manager_.GetLoan(id);
  ASSERT_TRUE(loan.has_value());
  EXPECT_EQ(loan->borrower, "alice");
  EXPECT_EQ(loan->principal, 1000u);
  EXPECT_EQ(loan->interest, 20u);
  EXPECT_EQ(loan->collateral_amount, 1500u);
  EXPECT_EQ(loan->asset_reference, 1u);
  EXPECT_EQ(loan->status, LoanStatus::PENDING);
  EXPECT_EQ(loan->start_height, 0u);
  EXPECT_EQ(loan->duration, 30u);
  EXPECT_EQ(loan->voting_deadline, 100u);

  auto status = vault_.GetLoanStatus(id);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->status, LoanStatus::PENDING);
  EXPECT_EQ(status->reference_value, 1000u);
  EXPECT_EQ(vault_.GetLoanCollateralSum(id)->total_amount, 1500u);
  EXPECT_EQ(vault_.GetCollateral(id, 0)->depositor, "alice");
  EXPECT_EQ(ledger_.BalanceOf("alice"), 8500u);
}

TEST_F(LoanManagerTest, OversizedRequestLeavesNoTrace) {
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { manager_.RequestLoan(At("alice", 0), 20000, 30, 1, 3000); });
  EXPECT_EQ(manager_.NextLoanId(), 0u);
  EXPECT_FALSE(manager_.GetLoan(0).has_value());
  EXPECT_FALSE(vault_.GetLoanStatus(0).has_value());
}

TEST_F(LoanManagerTest, RequestChecksPreconditionsInOrder) {
  ExpectLendingError(ErrorCode::NotVerified, [&] { manager_.RequestLoan(At("mallory", 0), 0, 0, 99, 0); });
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { manager_.RequestLoan(At("alice", 0), 0, 0, 99, 0); });
  ExpectLendingError(ErrorCode::InvalidDuration, [&] { manager_.RequestLoan(At("alice", 0), 1000, 0, 99, 0); });
  ExpectLendingError(ErrorCode::InvalidDuration, [&] { manager_.RequestLoan(At("alice", 0), 1000, 91, 99, 0); });
  ExpectLendingError(ErrorCode::AssetNotFound, [&] { manager_.RequestLoan(At("alice", 0), 1000, 30, 99, 0); });
  ExpectLendingError(ErrorCode::InvalidCollateral, [&] { manager_.RequestLoan(At("alice", 0), 1000, 30, 1, 1499); });
  pool_.available = 999;
  ExpectLendingError(ErrorCode::InsufficientFunds, [&] { manager_.RequestLoan(At("alice", 0), 1000, 30, 1, 1500); });
  EXPECT_EQ(manager_.NextLoanId(), 0u);
}

TEST_F(LoanManagerTest, FailedCollateralTransferRollsBackVaultStatus) {
  ExpectLendingError(ErrorCode::TransferFailed, [&] { manager_.RequestLoan(At("carol", 0), 1000, 30, 1, 1500); });
  EXPECT_FALSE(vault_.GetLoanStatus(0).has_value());
  EXPECT_EQ(manager_.NextLoanId(), 0u);
  EXPECT_EQ(coordinator_.Depth(), 0);
}

TEST_F(LoanManagerTest, EngineIdentityMustBeTheVaultAuthority) {
  LoanConfig cfg = TestLoanConfig();
  cfg.engine_identity = "intruder";
  LoanManager rogue(cfg, vault_, pool_, registry_, repayments_, coordinator_);
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { rogue.RequestLoan(At("alice", 0), 1000, 30, 1, 1500); });
  EXPECT_EQ(rogue.NextLoanId(), 0u);
  EXPECT_EQ(ledger_.BalanceOf("alice"), 10000u);
}

TEST_F(LoanManagerTest, VotesAreRecordedOncePerVoter) {
  LoanId id = Request();
  ExpectLendingError(ErrorCode::LoanNotFound, [&] { manager_.VoteOnLoan(At("bob", 1), 42, true); });
  ExpectLendingError(ErrorCode::NotVerified, [&] { manager_.VoteOnLoan(At("mallory", 1), id, true); });

  manager_.VoteOnLoan(At("bob", 1), id, true);
  manager_.VoteOnLoan(At("carol", 2), id, false);
  ExpectLendingError(ErrorCode::AlreadyVoted, [&] { manager_.VoteOnLoan(At("bob", 3), id, false); });

  EXPECT_EQ(manager_.GetVote(id, "bob"), std::optional<bool>(true));
  EXPECT_EQ(manager_.GetVote(id, "carol"), std::optional<bool>(false));
  EXPECT_FALSE(manager_.GetVote(id, "dave").has_value());
  EXPECT_EQ(manager_.GetLoan(id)->votes_for, 1u);
  EXPECT_EQ(manager_.GetLoan(id)->votes_against, 1u);
}

TEST_F(LoanManagerTest, VotingClosesAfterDeadline) {
  LoanId id = Request();
  manager_.VoteOnLoan(At("bob", 100), id, true);
  ExpectLendingError(ErrorCode::VotingClosed, [&] { manager_.VoteOnLoan(At("carol", 101), id, true); });
}

TEST_F(LoanManagerTest, SingleApprovalActivatesAndDisbursesOnce) {
  LoanId id = Request();
  manager_.VoteOnLoan(At("bob", 1), id, true);
  ExpectLendingError(ErrorCode::VotingOpen, [&] { manager_.FinalizeLoan(At("carol", 100), id); });

  EXPECT_TRUE(manager_.FinalizeLoan(At("carol", 101), id));
  auto loan = manager_.GetLoan(id);
  EXPECT_EQ(loan->status, LoanStatus::ACTIVE);
  EXPECT_EQ(loan->start_height, 0u);
  ASSERT_EQ(pool_.disbursements.size(), 1u);
  EXPECT_EQ(pool_.disbursements[0].amount, 1000u);
  EXPECT_EQ(pool_.disbursements[0].recipient, "alice");
  EXPECT_EQ(vault_.GetLoanStatus(id)->status, LoanStatus::ACTIVE);
  EXPECT_TRUE(manager_.HasActiveLoan("alice"));

  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.FinalizeLoan(At("carol", 102), id); });
  EXPECT_EQ(pool_.disbursements.size(), 1u);
}

TEST_F(LoanManagerTest, ApprovalNeedsThreeQuarters) {
  LoanId first = Request("alice");
  LoanId second = Request("bob");
  for (const char* v : {"carol", "dave", "erin"}) manager_.VoteOnLoan(At(v, 1), first, true);
  manager_.VoteOnLoan(At("bob", 1), first, false);
  for (const char* v : {"carol", "dave"}) manager_.VoteOnLoan(At(v, 1), second, true);
  manager_.VoteOnLoan(At("erin", 1), second, false);

  EXPECT_TRUE(manager_.FinalizeLoan(At("gov", 101), first));
  EXPECT_FALSE(manager_.FinalizeLoan(At("gov", 101), second));
  EXPECT_EQ(manager_.GetLoan(second)->status, LoanStatus::REJECTED);
}

TEST_F(LoanManagerTest, NoVotesRejectsAndReleasesCollateral) {
  LoanId id = Request();
  EXPECT_FALSE(manager_.FinalizeLoan(At("carol", 101), id));
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::REJECTED);
  EXPECT_EQ(ledger_.BalanceOf("alice"), 10000u);
  EXPECT_EQ(ledger_.BalanceOf("vault"), 0u);
  EXPECT_FALSE(vault_.GetLoanStatus(id).has_value());
  EXPECT_TRUE(pool_.disbursements.empty());
  EXPECT_FALSE(manager_.HasActiveLoan("alice"));
}

TEST_F(LoanManagerTest, FailedDisbursementKeepsLoanPending) {
  LoanId id = Request();
  manager_.VoteOnLoan(At("bob", 1), id, true);
  pool_.disburse_ok = false;
  ExpectLendingError(ErrorCode::DisbursementFailed, [&] { manager_.FinalizeLoan(At("carol", 101), id); });
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::PENDING);
  EXPECT_EQ(vault_.GetLoanStatus(id)->status, LoanStatus::PENDING);
  EXPECT_FALSE(manager_.HasActiveLoan("alice"));
}

TEST_F(LoanManagerTest, ActiveBorrowerCannotRequestAgain) {
  Activate();
  ExpectLendingError(ErrorCode::LoanActive, [&] { manager_.RequestLoan(At("alice", 102), 2000, 30, 1, 3000); });
}

TEST_F(LoanManagerTest, RepaymentCollectsOnlyWhatIsDue) {
  LoanId pending = Request("bob");
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.RepayLoan(At("bob", 5), pending, 5000); });

  LoanId id = Activate();
  ExpectLendingError(ErrorCode::LoanNotFound, [&] { manager_.RepayLoan(At("alice", 110), 42, 5000); });
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { manager_.RepayLoan(At("bob", 110), id, 5000); });
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { manager_.RepayLoan(At("alice", 110), id, 1019); });

  manager_.RepayLoan(At("alice", 110), id, 1500);
  ASSERT_EQ(repayments_.calls.size(), 1u);
  EXPECT_EQ(repayments_.calls[0].amount, 1020u);
  EXPECT_EQ(repayments_.calls[0].payer, "alice");
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::REPAID);
  EXPECT_EQ(ledger_.BalanceOf("alice"), 10000u);
  EXPECT_FALSE(manager_.HasActiveLoan("alice"));
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.RepayLoan(At("alice", 111), id, 1500); });
}

TEST_F(LoanManagerTest, FailedRepaymentChangesNothing) {
  LoanId id = Activate();
  repayments_.succeed = false;
  ExpectLendingError(ErrorCode::RepaymentFailed, [&] { manager_.RepayLoan(At("alice", 110), id, 1020); });
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::ACTIVE);
  EXPECT_EQ(ledger_.BalanceOf("vault"), 1500u);
  EXPECT_TRUE(manager_.HasActiveLoan("alice"));
}

TEST_F(LoanManagerTest, DefaultLiquidatesExactlyOnce) {
  LoanId id = Request();
  ExpectLendingError(ErrorCode::LoanNotExpired, [&] { manager_.MarkLoanDefault(At("dave", 30), id); });
  manager_.VoteOnLoan(At("bob", 1), id, true);
  EXPECT_TRUE(manager_.FinalizeLoan(At("carol", 101), id));
  EXPECT_EQ(manager_.GetLoan(id)->start_height, 0u);

  // the term counts from the request height, not from activation
  DefaultOutcome out = manager_.MarkLoanDefault(At("dave", 131), id);
  EXPECT_EQ(out.liquidated, 1500u);
  EXPECT_EQ(out.penalty, 75u);
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::DEFAULTED);
  EXPECT_EQ(ledger_.BalanceOf("pool"), 1500u);
  EXPECT_TRUE(vault_.GetDeposits(id).empty());
  EXPECT_FALSE(manager_.HasActiveLoan("alice"));

  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.MarkLoanDefault(At("dave", 200), id); });
  EXPECT_EQ(ledger_.BalanceOf("pool"), 1500u);
}

TEST_F(LoanManagerTest, PriceDropCannotStrandALoanWithoutCollateral) {
  oracle_.SetPrice("STX", 10);
  LoanId id = Activate();
  oracle_.SetPrice("STX", 1);
  ExpectLendingError(ErrorCode::RatioBelowThreshold, [&] { vault_.WithdrawCollateral(At("alice", 102), id, 0, 1500); });
  EXPECT_EQ(vault_.GetLoanCollateralSum(id)->total_amount, 1500u);

  DefaultOutcome out = manager_.MarkLoanDefault(At("dave", 1000), id);
  EXPECT_EQ(out.liquidated, 1500u);
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::DEFAULTED);
  EXPECT_EQ(ledger_.BalanceOf("pool"), 1500u);
}

TEST_F(LoanManagerTest, PendingLoanCannotDefault) {
  LoanId id = Request();
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.MarkLoanDefault(At("dave", 200), id); });
}

TEST_F(LoanManagerTest, TerminalLoansRejectEveryTransition) {
  LoanId id = Request();
  manager_.FinalizeLoan(At("carol", 101), id);
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.VoteOnLoan(At("bob", 50), id, true); });
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.FinalizeLoan(At("carol", 150), id); });
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.RepayLoan(At("alice", 150), id, 5000); });
  ExpectLendingError(ErrorCode::InvalidStatus, [&] { manager_.MarkLoanDefault(At("dave", 500), id); });
  EXPECT_EQ(manager_.GetLoan(id)->status, LoanStatus::REJECTED);
}

TEST_F(LoanManagerTest, AdminSettersAreAuthorityOnly) {
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { manager_.SetMaxLoanAmount(At("alice", 0), 20000); });
  ExpectLendingError(ErrorCode::InvalidAmount, [&] { manager_.SetMaxLoanAmount(At("gov", 0), 0); });
  ExpectLendingError(ErrorCode::InvalidDuration, [&] { manager_.SetMaxLoanDuration(At("gov", 0), 0); });
  ExpectLendingError(ErrorCode::InvalidCollateral, [&] { manager_.SetMinCollateralRatio(At("gov", 0), 100); });

  manager_.SetMaxLoanAmount(At("gov", 0), 20000);
  manager_.SetMaxLoanDuration(At("gov", 0), 180);
  manager_.SetMinCollateralRatio(At("gov", 0), 200);
  EXPECT_EQ(manager_.GetConfig().max_loan_amount, 20000u);
  EXPECT_EQ(manager_.GetConfig().max_loan_duration, 180u);
  EXPECT_EQ(manager_.GetConfig().min_collateral_ratio, 200u);

  manager_.SetAuthority(At("gov", 0), "council");
  ExpectLendingError(ErrorCode::NotAuthorized, [&] { manager_.SetMaxLoanAmount(At("gov", 0), 1); });
}

} // namespace
