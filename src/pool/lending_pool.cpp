#include "pool/lending_pool.hpp"
#include "ledger/token_ledger.hpp"
#include "core/checked_math.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

LendingPool::LendingPool(const PoolConfig& config, TokenLedger& ledger) : ledger_(ledger) {
  state_.config.params = config;
}

void LendingPool::RequireAdmin(const CallContext& ctx) const {
  if (ctx.caller != state_.config.params.admin) throw LendingError(ErrorCode::NotAuthorized, ctx.caller + " is not the pool admin");
}

Amount LendingPool::Contribute(const CallContext& ctx, Amount amount) {
  const auto& p = state_.config.params;
  if (state_.config.paused) throw LendingError(ErrorCode::PoolPaused, "pool is paused");
  if (amount == 0) throw LendingError(ErrorCode::ZeroAmount, "contribution must be positive");
  if (amount < p.min_contribution) throw LendingError(ErrorCode::InvalidAmount, "contribution below minimum " + std::to_string(p.min_contribution));
  if (amount > p.max_contribution) throw LendingError(ErrorCode::MaxContributionExceeded, "contribution above maximum " + std::to_string(p.max_contribution));

  PoolContribution next = GetContribution(ctx.caller).value_or(PoolContribution{});
  next.amount = CheckedMath::Add(next.amount, amount);
  next.last_contribution_height = ctx.height;
  next.locked_until = CheckedMath::Add(ctx.height, p.withdrawal_lock_period);
  Amount total = CheckedMath::Add(state_.total_contributions, amount);

  if (!ledger_.Transfer(amount, ctx.caller, p.account))
    throw LendingError(ErrorCode::TransferFailed, "could not move " + std::to_string(amount) + " from " + ctx.caller + " into the pool");
  state_.contributions[ctx.caller] = next;
  state_.total_contributions = total;
  Logger::Info("pool contribution " + std::to_string(amount) + " by " + ctx.caller + ", locked until " + std::to_string(next.locked_until));
  return next.amount;
}

Amount LendingPool::Withdraw(const CallContext& ctx, Amount amount) {
  auto it = state_.contributions.find(ctx.caller);
  if (it == state_.contributions.end()) throw LendingError(ErrorCode::InsufficientBalance, ctx.caller + " has no contribution");
  if (state_.config.paused) throw LendingError(ErrorCode::PoolPaused, "pool is paused");
  if (amount == 0) throw LendingError(ErrorCode::ZeroAmount, "withdrawal must be positive");
  if (it->second.amount < amount) throw LendingError(ErrorCode::InsufficientBalance, "withdrawal exceeds contribution");
  if (IsWithdrawalLocked(ctx.caller, ctx.height))
    throw LendingError(ErrorCode::WithdrawalLocked, "contribution locked until " + std::to_string(it->second.locked_until));

  if (!ledger_.Transfer(amount, state_.config.params.account, ctx.caller))
    throw LendingError(ErrorCode::TransferFailed, "pool account cannot cover withdrawal of " + std::to_string(amount));
  Amount remaining = it->second.amount - amount;
  if (remaining > 0) it->second.amount = remaining;
  else state_.contributions.erase(it);
  state_.total_contributions -= amount;
  return remaining;
}

Amount LendingPool::GetAvailableFunds() {
  return ledger_.BalanceOf(state_.config.params.account);
}

Amount LendingPool::CalculateInterest(Amount principal, Height duration_blocks) {
  const auto& p = state_.config.params;
  Height days = duration_blocks / p.blocks_per_day;
  return CheckedMath::Mul(principal, CheckedMath::Mul(p.base_interest_rate, days)) / 100;
}

bool LendingPool::DisburseFunds(Amount amount, const Identity& recipient) {
  if (state_.config.paused) {
    Logger::Warning("disbursement refused: pool paused");
    return false;
  }
  if (!ledger_.Transfer(amount, state_.config.params.account, recipient)) return false;
  Logger::Info("pool disbursed " + std::to_string(amount) + " to " + recipient);
  return true;
}

std::optional<PoolContribution> LendingPool::GetContribution(const Identity& contributor) const {
  auto it = state_.contributions.find(contributor);
  if (it == state_.contributions.end()) return std::nullopt;
  return it->second;
}

Height LendingPool::GetUserLockedUntil(const Identity& contributor) const {
  auto c = GetContribution(contributor);
  return c ? c->locked_until : 0;
}

bool LendingPool::IsWithdrawalLocked(const Identity& contributor, Height height) const {
  Height until = GetUserLockedUntil(contributor);
  return height < until && state_.unlock_timestamp < until;
}

std::optional<Amount> LendingPool::GetHistoricalYield(Height height) const {
  auto it = state_.yields.find(height);
  if (it == state_.yields.end()) return std::nullopt;
  return it->second;
}

void LendingPool::SetAdmin(const CallContext& ctx, const Identity& admin) {
  RequireAdmin(ctx);
  if (admin.empty()) throw LendingError(ErrorCode::InvalidConfig, "admin must not be empty");
  state_.config.params.admin = admin;
}

void LendingPool::Pause(const CallContext& ctx) {
  RequireAdmin(ctx);
  state_.config.paused = true;
  Logger::Warning("pool paused by " + ctx.caller);
}

void LendingPool::Unpause(const CallContext& ctx) {
  RequireAdmin(ctx);
  state_.config.paused = false;
}

void LendingPool::SetMinContribution(const CallContext& ctx, Amount value) {
  RequireAdmin(ctx);
  if (value == 0) throw LendingError(ErrorCode::InvalidAmount, "minimum contribution must be positive");
  state_.config.params.min_contribution = value;
}

void LendingPool::SetMaxContribution(const CallContext& ctx, Amount value) {
  RequireAdmin(ctx);
  if (value == 0) throw LendingError(ErrorCode::InvalidAmount, "maximum contribution must be positive");
  state_.config.params.max_contribution = value;
}

void LendingPool::SetBaseInterestRate(const CallContext& ctx, Amount rate) {
  RequireAdmin(ctx);
  if (rate < 1 || rate > 10) throw LendingError(ErrorCode::InvalidConfig, "interest rate must be within [1, 10]");
  state_.config.params.base_interest_rate = rate;
}

void LendingPool::SetWithdrawalLockPeriod(const CallContext& ctx, Height period) {
  RequireAdmin(ctx);
  if (period == 0) throw LendingError(ErrorCode::InvalidDuration, "lock period must be positive");
  state_.config.params.withdrawal_lock_period = period;
}

// One entry per height; a second record at the same height replaces the first.
void LendingPool::RecordYield(const CallContext& ctx, Amount yield_amount) {
  RequireAdmin(ctx);
  state_.yields[ctx.height] = yield_amount;
  Logger::Info("pool yield " + std::to_string(yield_amount) + " recorded at height " + std::to_string(ctx.height));
}

void LendingPool::UpdateUnlockTimestamp(const CallContext& ctx, Height timestamp) {
  RequireAdmin(ctx);
  if (timestamp < state_.unlock_timestamp)
    throw LendingError(ErrorCode::UnlockPeriodNotEnded, "unlock height cannot move back from " + std::to_string(state_.unlock_timestamp));
  state_.unlock_timestamp = timestamp;
  Logger::Info("pool unlock height set to " + std::to_string(timestamp));
}
