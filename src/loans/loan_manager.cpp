#include "loans/loan_manager.hpp"
#include "vault/collateral_vault.hpp"
#include "pool/funds_pool.hpp"
#include "registry/registry.hpp"
#include "repayment/repayment_handler.hpp"
#include "core/checked_math.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {
std::string LoanTag(LoanId id) { return "loan " + std::to_string(id); }
}

LoanManager::LoanManager(const LoanConfig& config, CollateralVault& vault, FundsPool& pool, Registry& registry,
                         RepaymentHandler& repayments, TransactionCoordinator& coordinator)
  : vault_(vault), pool_(pool), registry_(registry), repayments_(repayments), coordinator_(coordinator) {
  state_.config = config;
  coordinator_.Enlist(*this);
}

LoanManager::~LoanManager() { coordinator_.Delist(*this); }

void LoanManager::RequireAuthority(const CallContext& ctx) const {
  if (state_.config.authority.empty() || ctx.caller != state_.config.authority)
    throw LendingError(ErrorCode::NotAuthorized, ctx.caller + " is not the loan authority");
}

LoanRecord& LoanManager::FindLoan(LoanId loan_id) {
  auto it = state_.loans.find(loan_id);
  if (it == state_.loans.end()) throw LendingError(ErrorCode::LoanNotFound, LoanTag(loan_id) + " does not exist");
  return it->second;
}

void LoanManager::Transition(LoanRecord& loan, LoanStatus to) {
  if (!CanTransition(loan.status, to))
    throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan.loan_id) + " cannot move from " + LoanStatusName(loan.status)
                       + " to " + LoanStatusName(to));
  loan.status = to;
  if (to == LoanStatus::ACTIVE) state_.active_loans[loan.borrower] = loan.loan_id;
  else if (IsTerminal(to)) {
    auto it = state_.active_loans.find(loan.borrower);
    if (it != state_.active_loans.end() && it->second == loan.loan_id) state_.active_loans.erase(it);
  }
}

LoanId LoanManager::RequestLoan(const CallContext& ctx, Amount amount, Height duration, std::uint64_t asset_reference,
                                Amount collateral_amount) {
  TransactionScope scope(coordinator_);
  const auto& cfg = state_.config;
  if (!registry_.IsVerified(ctx.caller)) throw LendingError(ErrorCode::NotVerified, ctx.caller + " is not verified");
  if (HasActiveLoan(ctx.caller)) throw LendingError(ErrorCode::LoanActive, ctx.caller + " already has an active loan");
  if (amount == 0 || amount > cfg.max_loan_amount)
    throw LendingError(ErrorCode::InvalidAmount, "loan amount must be within [1, " + std::to_string(cfg.max_loan_amount) + "]");
  if (duration == 0 || duration > cfg.max_loan_duration)
    throw LendingError(ErrorCode::InvalidDuration, "loan duration must be within [1, " + std::to_string(cfg.max_loan_duration) + "]");
  if (!registry_.GetAssetOwner(asset_reference))
    throw LendingError(ErrorCode::AssetNotFound, "asset " + std::to_string(asset_reference) + " has no owner");
  Amount required = CheckedMath::Mul(amount, cfg.min_collateral_ratio) / 100;
  if (collateral_amount < required)
    throw LendingError(ErrorCode::InvalidCollateral, "collateral " + std::to_string(collateral_amount) + " below required "
                       + std::to_string(required));
  if (pool_.GetAvailableFunds() < amount) throw LendingError(ErrorCode::InsufficientFunds, "pool cannot fund " + std::to_string(amount));

  const LoanId loan_id = state_.next_loan_id;
  Amount interest = pool_.CalculateInterest(amount, duration);
  vault_.UpdateLoanStatus(EngineContext(ctx), loan_id, LoanStatus::PENDING, amount);
  vault_.DepositCollateral(ctx, loan_id, collateral_amount, cfg.collateral_currency);

  LoanRecord loan;
  loan.loan_id = loan_id;
  loan.borrower = ctx.caller;
  loan.principal = amount;
  loan.interest = interest;
  loan.collateral_amount = collateral_amount;
  loan.asset_reference = asset_reference;
  loan.start_height = ctx.height;
  loan.duration = duration;
  loan.voting_deadline = CheckedMath::Add(ctx.height, cfg.voting_period);
  state_.loans[loan_id] = loan;
  state_.next_loan_id = loan_id + 1;
  scope.Commit();
  Logger::Info(LoanTag(loan_id) + " requested by " + ctx.caller + ": principal " + std::to_string(amount) + ", interest "
               + std::to_string(interest) + ", voting until " + std::to_string(loan.voting_deadline));
  return loan_id;
}

void LoanManager::VoteOnLoan(const CallContext& ctx, LoanId loan_id, bool approve) {
  TransactionScope scope(coordinator_);
  LoanRecord& loan = FindLoan(loan_id);
  if (!registry_.IsVerified(ctx.caller)) throw LendingError(ErrorCode::NotVerified, ctx.caller + " is not verified");
  if (loan.status != LoanStatus::PENDING) throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is not pending");
  if (ctx.height > loan.voting_deadline) throw LendingError(ErrorCode::VotingClosed, LoanTag(loan_id) + " voting closed");
  auto key = std::make_pair(loan_id, ctx.caller);
  if (state_.votes.count(key)) throw LendingError(ErrorCode::AlreadyVoted, ctx.caller + " already voted on " + LoanTag(loan_id));
  state_.votes[key] = approve;
  if (approve) loan.votes_for += 1;
  else loan.votes_against += 1;
  scope.Commit();
  Logger::Debug(LoanTag(loan_id) + " vote by " + ctx.caller + (approve ? " for" : " against"));
}

bool LoanManager::FinalizeLoan(const CallContext& ctx, LoanId loan_id) {
  TransactionScope scope(coordinator_);
  LoanRecord& loan = FindLoan(loan_id);
  if (ctx.height <= loan.voting_deadline) throw LendingError(ErrorCode::VotingOpen, LoanTag(loan_id) + " voting still open");
  if (loan.status != LoanStatus::PENDING) throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is not pending");

  std::uint64_t total = loan.votes_for + loan.votes_against;
  bool approved = total > 0 && loan.votes_for * 100 / total >= state_.config.approval_threshold_pct;
  if (approved) {
    Transition(loan, LoanStatus::ACTIVE);
    vault_.UpdateLoanStatus(EngineContext(ctx), loan_id, LoanStatus::ACTIVE, loan.principal);
    if (!pool_.DisburseFunds(loan.principal, loan.borrower))
      throw LendingError(ErrorCode::DisbursementFailed, "pool could not disburse " + std::to_string(loan.principal) + " for " + LoanTag(loan_id));
  } else {
    Transition(loan, LoanStatus::REJECTED);
    vault_.UpdateLoanStatus(EngineContext(ctx), loan_id, LoanStatus::REJECTED, loan.principal);
    vault_.ReleaseCollateral(EngineContext(ctx), loan_id);
  }
  scope.Commit();
  Logger::Info(LoanTag(loan_id) + (approved ? " approved" : " rejected") + " with " + std::to_string(loan.votes_for) + "/"
               + std::to_string(total) + " votes");
  return approved;
}

void LoanManager::RepayLoan(const CallContext& ctx, LoanId loan_id, Amount amount) {
  TransactionScope scope(coordinator_);
  LoanRecord& loan = FindLoan(loan_id);
  if (ctx.caller != loan.borrower) throw LendingError(ErrorCode::NotAuthorized, ctx.caller + " is not the borrower of " + LoanTag(loan_id));
  if (loan.status != LoanStatus::ACTIVE) throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is not active");
  Amount due = CheckedMath::Add(loan.principal, loan.interest);
  if (amount < due) throw LendingError(ErrorCode::InvalidAmount, "repayment " + std::to_string(amount) + " below due " + std::to_string(due));
  // only the amount due leaves the borrower
  if (!repayments_.ProcessRepayment(loan_id, loan.borrower, due))
    throw LendingError(ErrorCode::RepaymentFailed, "repayment of " + LoanTag(loan_id) + " was not collected");
  Transition(loan, LoanStatus::REPAID);
  vault_.UpdateLoanStatus(EngineContext(ctx), loan_id, LoanStatus::REPAID, loan.principal);
  vault_.ReleaseCollateral(EngineContext(ctx), loan_id);
  scope.Commit();
  Logger::Info(LoanTag(loan_id) + " repaid " + std::to_string(due) + " by " + ctx.caller);
}

DefaultOutcome LoanManager::MarkLoanDefault(const CallContext& ctx, LoanId loan_id) {
  TransactionScope scope(coordinator_);
  LoanRecord& loan = FindLoan(loan_id);
  if (ctx.height <= loan.start_height + loan.duration)
    throw LendingError(ErrorCode::LoanNotExpired, LoanTag(loan_id) + " runs until " + std::to_string(loan.start_height + loan.duration));
  if (loan.status != LoanStatus::ACTIVE) throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is not active");
  Transition(loan, LoanStatus::DEFAULTED);
  vault_.UpdateLoanStatus(EngineContext(ctx), loan_id, LoanStatus::DEFAULTED, loan.principal);
  LiquidationReport report = vault_.LiquidateCollateral(EngineContext(ctx), loan_id);
  scope.Commit();

  DefaultOutcome out;
  out.loan_id = loan_id;
  out.liquidated = report.total_liquidated;
  out.penalty = report.penalty;
  Logger::Warning(LoanTag(loan_id) + " defaulted; " + std::to_string(out.liquidated) + " collateral liquidated");
  return out;
}

std::optional<LoanRecord> LoanManager::GetLoan(LoanId loan_id) const {
  auto it = state_.loans.find(loan_id);
  if (it == state_.loans.end()) return std::nullopt;
  return it->second;
}

std::optional<bool> LoanManager::GetVote(LoanId loan_id, const Identity& voter) const {
  auto it = state_.votes.find({loan_id, voter});
  if (it == state_.votes.end()) return std::nullopt;
  return it->second;
}

bool LoanManager::HasActiveLoan(const Identity& borrower) const {
  return state_.active_loans.count(borrower) > 0;
}

void LoanManager::SetAuthority(const CallContext& ctx, const Identity& authority) {
  RequireAuthority(ctx);
  if (authority.empty()) throw LendingError(ErrorCode::InvalidConfig, "authority must not be empty");
  state_.config.authority = authority;
  Logger::Info("loan authority moved to " + authority);
}

void LoanManager::SetMaxLoanAmount(const CallContext& ctx, Amount amount) {
  RequireAuthority(ctx);
  if (amount == 0) throw LendingError(ErrorCode::InvalidAmount, "max loan amount must be positive");
  state_.config.max_loan_amount = amount;
}

void LoanManager::SetMaxLoanDuration(const CallContext& ctx, Height duration) {
  RequireAuthority(ctx);
  if (duration == 0) throw LendingError(ErrorCode::InvalidDuration, "max loan duration must be positive");
  state_.config.max_loan_duration = duration;
}

void LoanManager::SetMinCollateralRatio(const CallContext& ctx, Amount ratio) {
  RequireAuthority(ctx);
  if (ratio <= 100) throw LendingError(ErrorCode::InvalidCollateral, "min collateral ratio must exceed 100");
  state_.config.min_collateral_ratio = ratio;
}
