#pragma once
#include "core/types.hpp"
#include "core/transaction.hpp"
#include "config/protocol_config.hpp"
#include <map>
#include <optional>
#include <utility>

class CollateralVault;
class FundsPool;
class Registry;
class RepaymentHandler;

struct LoanRecord {
  LoanId loan_id = 0;
  Identity borrower;
  Amount principal = 0;
  Amount interest = 0;
  Amount collateral_amount = 0;
  std::uint64_t asset_reference = 0;
  LoanStatus status = LoanStatus::PENDING;
  Height start_height = 0;
  Height duration = 0;
  std::uint64_t votes_for = 0;
  std::uint64_t votes_against = 0;
  Height voting_deadline = 0;
};

struct DefaultOutcome {
  LoanId loan_id = 0;
  Amount liquidated = 0;
  Amount penalty = 0;
};

// Loan lifecycle engine: request, community vote, finalize, repay, default.
// Talks to the vault under its own engine identity; the vault authority must match it.
class LoanManager : public Journaled {
public:
  LoanManager(const LoanConfig& config, CollateralVault& vault, FundsPool& pool, Registry& registry,
              RepaymentHandler& repayments, TransactionCoordinator& coordinator);
  ~LoanManager() override;
  LoanManager(const LoanManager&) = delete;
  LoanManager& operator=(const LoanManager&) = delete;

  LoanId RequestLoan(const CallContext& ctx, Amount amount, Height duration, std::uint64_t asset_reference, Amount collateral_amount);
  void VoteOnLoan(const CallContext& ctx, LoanId loan_id, bool approve);
  bool FinalizeLoan(const CallContext& ctx, LoanId loan_id);
  void RepayLoan(const CallContext& ctx, LoanId loan_id, Amount amount);
  DefaultOutcome MarkLoanDefault(const CallContext& ctx, LoanId loan_id);

  std::optional<LoanRecord> GetLoan(LoanId loan_id) const;
  std::optional<bool> GetVote(LoanId loan_id, const Identity& voter) const;
  bool HasActiveLoan(const Identity& borrower) const;
  LoanId NextLoanId() const { return state_.next_loan_id; }
  const LoanConfig& GetConfig() const { return state_.config; }

  void SetAuthority(const CallContext& ctx, const Identity& authority);
  void SetMaxLoanAmount(const CallContext& ctx, Amount amount);
  void SetMaxLoanDuration(const CallContext& ctx, Height duration);
  void SetMinCollateralRatio(const CallContext& ctx, Amount ratio);

  void Checkpoint() override { journal_.Push(state_); }
  void Rollback() override { journal_.RestoreInto(state_); }
  void Release() override { journal_.Drop(); }
private:
  void RequireAuthority(const CallContext& ctx) const;
  LoanRecord& FindLoan(LoanId loan_id);
  void Transition(LoanRecord& loan, LoanStatus to);
  CallContext EngineContext(const CallContext& ctx) const { return CallContext{state_.config.engine_identity, ctx.height}; }

  struct State {
    LoanConfig config;
    std::map<LoanId, LoanRecord> loans;
    std::map<std::pair<LoanId, Identity>, bool> votes;
    std::map<Identity, LoanId> active_loans;
    LoanId next_loan_id = 0;
  };
  State state_;
  SnapshotJournal<State> journal_;
  CollateralVault& vault_;
  FundsPool& pool_;
  Registry& registry_;
  RepaymentHandler& repayments_;
  TransactionCoordinator& coordinator_;
};
