#include "core/transaction.hpp"
#include "common/errors.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

class Counter : public Journaled {
public:
  void Checkpoint() override { journal_.Push(value); }
  void Rollback() override { journal_.RestoreInto(value); }
  void Release() override { journal_.Drop(); }
  std::size_t Saved() const { return journal_.Depth(); }
  int value = 0;
private:
  SnapshotJournal<int> journal_;
};

class TransactionTest : public ::testing::Test {
protected:
  TransactionTest() {
    coordinator_.Enlist(a_);
    coordinator_.Enlist(b_);
  }
  TransactionCoordinator coordinator_;
  Counter a_;
  Counter b_;
};

TEST_F(TransactionTest, CommitKeepsChanges) {
  {
    TransactionScope scope(coordinator_);
    a_.value = 1;
    b_.value = 2;
    scope.Commit();
  }
  EXPECT_EQ(a_.value, 1);
  EXPECT_EQ(b_.value, 2);
  EXPECT_EQ(a_.Saved(), 0u);
  EXPECT_EQ(coordinator_.Depth(), 0);
}

TEST_F(TransactionTest, ExceptionRestoresEveryParticipant) {
  a_.value = 5;
  EXPECT_THROW({
    TransactionScope scope(coordinator_);
    a_.value = 6;
    b_.value = 7;
    throw std::runtime_error("collaborator failed");
  }, std::runtime_error);
  EXPECT_EQ(a_.value, 5);
  EXPECT_EQ(b_.value, 0);
  EXPECT_EQ(coordinator_.Depth(), 0);
}

TEST_F(TransactionTest, NestedScopesJoinTheOuterTransaction) {
  {
    TransactionScope outer(coordinator_);
    a_.value = 1;
    {
      TransactionScope inner(coordinator_);
      b_.value = 2;
      inner.Commit();
    }
    EXPECT_EQ(a_.Saved(), 1u);
    outer.Commit();
  }
  EXPECT_EQ(a_.value, 1);
  EXPECT_EQ(b_.value, 2);
}

TEST_F(TransactionTest, SwallowedNestedFailureMakesOuterRollBack) {
  try {
    TransactionScope outer(coordinator_);
    a_.value = 1;
    try {
      TransactionScope inner(coordinator_);
      b_.value = 2;
      throw std::runtime_error("inner");
    } catch (const std::runtime_error&) {
    }
    outer.Commit();
    FAIL() << "commit of a rollback-only transaction succeeded";
  } catch (const LendingError& e) {
    EXPECT_EQ(e.Code(), ErrorCode::RollbackOnly);
  }
  EXPECT_EQ(a_.value, 0);
  EXPECT_EQ(b_.value, 0);
  EXPECT_EQ(coordinator_.Depth(), 0);
}

TEST_F(TransactionTest, DelistedParticipantIsNotRestored) {
  coordinator_.Delist(b_);
  EXPECT_THROW({
    TransactionScope scope(coordinator_);
    a_.value = 3;
    b_.value = 4;
    throw std::runtime_error("boom");
  }, std::runtime_error);
  EXPECT_EQ(a_.value, 0);
  EXPECT_EQ(b_.value, 4);
}

} // namespace
