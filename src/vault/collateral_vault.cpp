#include "vault/collateral_vault.hpp"
#include "oracle/price_oracle.hpp"
#include "ledger/token_ledger.hpp"
#include "core/checked_math.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <limits>

namespace {
std::string LoanTag(LoanId id) { return "loan " + std::to_string(id); }
}

CollateralVault::CollateralVault(const VaultConfig& config, PriceOracle& oracle, TokenTransfer& transfer,
                                 TransactionCoordinator& coordinator)
  : oracle_(oracle), transfer_(transfer), coordinator_(coordinator) {
  state_.config = config;
  coordinator_.Enlist(*this);
}

CollateralVault::~CollateralVault() { coordinator_.Delist(*this); }

void CollateralVault::RequireAuthority(const CallContext& ctx) const {
  if (state_.config.authority.empty() || ctx.caller != state_.config.authority)
    throw LendingError(ErrorCode::NotAuthorized, ctx.caller + " is not the vault authority");
}

CollateralDeposit& CollateralVault::FindDeposit(LoanId loan_id, CollateralId collateral_id) {
  auto it = state_.deposits.find({loan_id, collateral_id});
  if (it == state_.deposits.end())
    throw LendingError(ErrorCode::CollateralNotFound, LoanTag(loan_id) + " has no collateral " + std::to_string(collateral_id));
  return it->second;
}

Amount CollateralVault::QuoteValue(const std::string& currency, Amount amount) {
  auto binding = state_.config.currency_oracles.find(currency);
  if (binding == state_.config.currency_oracles.end())
    throw LendingError(ErrorCode::InvalidCurrency, "no oracle bound to " + currency);
  auto price = oracle_.GetPrice(binding->second, currency, amount);
  if (!price || *price == 0)
    throw LendingError(ErrorCode::OracleUnavailable, "oracle " + binding->second + " has no price for " + currency);
  return CheckedMath::Mul(amount, *price);
}

// Current value of every live deposit of the loan, with `amount` taken off one of them.
Amount CollateralVault::ValueAfterWithdrawal(LoanId loan_id, CollateralId collateral_id, Amount amount) {
  Amount value = 0;
  for (const auto& d : GetDeposits(loan_id)) {
    Amount held = d.collateral_id == collateral_id ? d.amount - amount : d.amount;
    if (held == 0) continue;
    value = CheckedMath::Add(value, QuoteValue(d.currency, held));
  }
  return value;
}

void CollateralVault::EraseDeposits(LoanId loan_id) {
  auto first = state_.deposits.lower_bound({loan_id, 0});
  auto last = state_.deposits.upper_bound({loan_id, std::numeric_limits<CollateralId>::max()});
  state_.deposits.erase(first, last);
}

CollateralId CollateralVault::DepositCollateral(const CallContext& ctx, LoanId loan_id, Amount amount, const std::string& currency) {
  TransactionScope scope(coordinator_);
  const auto& cfg = state_.config;
  if (amount == 0) throw LendingError(ErrorCode::ZeroAmount, "deposit amount must be positive");
  if (cfg.currency_oracles.count(currency) == 0) throw LendingError(ErrorCode::InvalidCurrency, "unsupported currency " + currency);
  auto status = state_.statuses.find(loan_id);
  if (status == state_.statuses.end()) throw LendingError(ErrorCode::LoanNotFound, LoanTag(loan_id) + " has no status record");

  CollateralId next_id = 0;
  auto next_it = state_.next_collateral_ids.find(loan_id);
  if (next_it != state_.next_collateral_ids.end()) next_id = next_it->second;
  if (next_id >= cfg.max_deposits_per_loan)
    throw LendingError(ErrorCode::MaxCollateralExceeded, LoanTag(loan_id) + " reached " + std::to_string(cfg.max_deposits_per_loan) + " deposits");

  LoanCollateralSummary sum;
  sum.loan_id = loan_id;
  auto sum_it = state_.sums.find(loan_id);
  if (sum_it != state_.sums.end()) sum = sum_it->second;
  Amount new_total = CheckedMath::Add(sum.total_amount, amount);
  if (new_total > cfg.max_collateral_per_loan)
    throw LendingError(ErrorCode::MaxCollateralExceeded, LoanTag(loan_id) + " collateral would exceed " + std::to_string(cfg.max_collateral_per_loan));

  Amount value = QuoteValue(currency, amount);
  Amount new_value = CheckedMath::Add(sum.total_value, value);
  Amount ratio = CheckedMath::RatioPercent(new_value, status->second.reference_value);
  if (ratio < cfg.min_collateral_ratio)
    throw LendingError(ErrorCode::RatioBelowThreshold, LoanTag(loan_id) + " ratio " + std::to_string(ratio) + " below "
                       + std::to_string(cfg.min_collateral_ratio));

  if (!transfer_.Transfer(amount, ctx.caller, cfg.custody_account))
    throw LendingError(ErrorCode::TransferFailed, "could not move " + std::to_string(amount) + " " + currency + " from " + ctx.caller);

  CollateralDeposit d;
  d.loan_id = loan_id;
  d.collateral_id = next_id;
  d.amount = amount;
  d.currency = currency;
  d.deposited_at = ctx.height;
  d.depositor = ctx.caller;
  state_.deposits[{loan_id, next_id}] = d;
  state_.next_collateral_ids[loan_id] = next_id + 1;
  sum.total_amount = new_total;
  sum.total_value = new_value;
  sum.deposit_count += 1;
  state_.sums[loan_id] = sum;
  scope.Commit();
  Logger::Info(LoanTag(loan_id) + " collateral " + std::to_string(next_id) + ": " + ctx.caller + " deposited "
               + std::to_string(amount) + " " + currency + " (ratio " + std::to_string(ratio) + ")");
  return next_id;
}

bool CollateralVault::WithdrawCollateral(const CallContext& ctx, LoanId loan_id, CollateralId collateral_id, Amount amount) {
  TransactionScope scope(coordinator_);
  CollateralDeposit& d = FindDeposit(loan_id, collateral_id);
  if (ctx.caller != d.depositor) throw LendingError(ErrorCode::NotAuthorized, ctx.caller + " did not deposit this collateral");
  if (d.locked) throw LendingError(ErrorCode::CollateralLocked, LoanTag(loan_id) + " collateral " + std::to_string(collateral_id) + " is locked");
  auto status = state_.statuses.find(loan_id);
  if (status == state_.statuses.end() || status->second.status != LoanStatus::ACTIVE)
    throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is not active");
  if (amount == 0) throw LendingError(ErrorCode::ZeroAmount, "withdrawal amount must be positive");
  if (amount > d.amount) throw LendingError(ErrorCode::WithdrawalExceeds, "withdrawal of " + std::to_string(amount) + " exceeds deposit of "
                                             + std::to_string(d.amount));

  LoanCollateralSummary& sum = state_.sums.at(loan_id);
  Amount remaining_value = ValueAfterWithdrawal(loan_id, collateral_id, amount);
  Amount ratio = CheckedMath::RatioPercent(remaining_value, status->second.reference_value);
  if (ratio < state_.config.min_collateral_ratio)
    throw LendingError(ErrorCode::RatioBelowThreshold, LoanTag(loan_id) + " ratio would fall to " + std::to_string(ratio));

  const Identity depositor = d.depositor;
  if (!transfer_.Transfer(amount, state_.config.custody_account, depositor))
    throw LendingError(ErrorCode::TransferFailed, "custody could not return " + std::to_string(amount) + " to " + depositor);

  Amount remaining = d.amount - amount;
  if (remaining == 0) {
    state_.deposits.erase({loan_id, collateral_id});
    sum.deposit_count -= 1;
  } else {
    d.amount = remaining;
  }
  sum.total_amount -= amount;
  sum.total_value = remaining_value;
  scope.Commit();
  Logger::Info(LoanTag(loan_id) + " collateral " + std::to_string(collateral_id) + ": " + depositor + " withdrew " + std::to_string(amount));
  return true;
}

void CollateralVault::LockCollateral(const CallContext& ctx, LoanId loan_id, CollateralId collateral_id) {
  TransactionScope scope(coordinator_);
  CollateralDeposit& d = FindDeposit(loan_id, collateral_id);
  RequireAuthority(ctx);
  d.locked = true;
  scope.Commit();
}

void CollateralVault::UnlockCollateral(const CallContext& ctx, LoanId loan_id, CollateralId collateral_id) {
  TransactionScope scope(coordinator_);
  CollateralDeposit& d = FindDeposit(loan_id, collateral_id);
  RequireAuthority(ctx);
  d.locked = false;
  scope.Commit();
}

void CollateralVault::UpdateLoanStatus(const CallContext& ctx, LoanId loan_id, LoanStatus status, Amount reference_value) {
  TransactionScope scope(coordinator_);
  RequireAuthority(ctx);
  if (reference_value == 0) throw LendingError(ErrorCode::InvalidAmount, "reference value must be positive");
  LoanStatusRecord r;
  r.loan_id = loan_id;
  r.status = status;
  r.reference_value = reference_value;
  r.last_updated = ctx.height;
  state_.statuses[loan_id] = r;
  scope.Commit();
  Logger::Debug(LoanTag(loan_id) + " vault status " + LoanStatusName(status) + " reference " + std::to_string(reference_value));
}

Amount CollateralVault::ReleaseCollateral(const CallContext& ctx, LoanId loan_id) {
  TransactionScope scope(coordinator_);
  RequireAuthority(ctx);
  auto status = state_.statuses.find(loan_id);
  if (status == state_.statuses.end()) throw LendingError(ErrorCode::LoanNotFound, LoanTag(loan_id) + " has no status record");
  if (status->second.status != LoanStatus::REJECTED && status->second.status != LoanStatus::REPAID)
    throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is " + LoanStatusName(status->second.status) + ", cannot release");
  auto deposits = GetDeposits(loan_id);
  for (const auto& d : deposits) {
    if (d.locked) throw LendingError(ErrorCode::CollateralLocked, LoanTag(loan_id) + " collateral " + std::to_string(d.collateral_id) + " is locked");
  }

  Amount released = 0;
  for (const auto& d : deposits) {
    if (!transfer_.Transfer(d.amount, state_.config.custody_account, d.depositor))
      throw LendingError(ErrorCode::TransferFailed, "custody could not return " + std::to_string(d.amount) + " to " + d.depositor);
    released = CheckedMath::Add(released, d.amount);
  }
  EraseDeposits(loan_id);
  LoanCollateralSummary cleared;
  cleared.loan_id = loan_id;
  state_.sums[loan_id] = cleared;
  state_.statuses.erase(status);
  scope.Commit();
  Logger::Info(LoanTag(loan_id) + " released " + std::to_string(released) + " across " + std::to_string(deposits.size()) + " deposits");
  return released;
}

LiquidationReport CollateralVault::LiquidateCollateral(const CallContext& ctx, LoanId loan_id) {
  TransactionScope scope(coordinator_);
  RequireAuthority(ctx);
  auto status = state_.statuses.find(loan_id);
  if (status == state_.statuses.end()) throw LendingError(ErrorCode::LoanNotFound, LoanTag(loan_id) + " has no status record");
  if (status->second.status != LoanStatus::DEFAULTED)
    throw LendingError(ErrorCode::InvalidStatus, LoanTag(loan_id) + " is " + LoanStatusName(status->second.status) + ", not defaulted");
  auto sum_it = state_.sums.find(loan_id);
  if (sum_it == state_.sums.end() || sum_it->second.total_amount == 0)
    throw LendingError(ErrorCode::InsufficientCollateral, LoanTag(loan_id) + " has no collateral to liquidate");

  LiquidationReport report;
  report.loan_id = loan_id;
  report.total_liquidated = sum_it->second.total_amount;
  report.total_value = sum_it->second.total_value;
  report.penalty = CheckedMath::Mul(report.total_value, state_.config.liquidation_penalty) / 100;
  report.recipient = state_.config.pool_recipient;

  if (!transfer_.Transfer(report.total_liquidated, state_.config.custody_account, report.recipient))
    throw LendingError(ErrorCode::TransferFailed, "custody could not sweep " + std::to_string(report.total_liquidated) + " to " + report.recipient);

  LoanCollateralSummary cleared;
  cleared.loan_id = loan_id;
  sum_it->second = cleared;
  state_.statuses.erase(status);
  EraseDeposits(loan_id);
  scope.Commit();
  Logger::Warning(LoanTag(loan_id) + " liquidated " + std::to_string(report.total_liquidated) + " to " + report.recipient
                  + " (penalty " + std::to_string(report.penalty) + ")");
  return report;
}

bool CollateralVault::IsOverCollateralized(LoanId loan_id) const {
  auto sum = state_.sums.find(loan_id);
  auto status = state_.statuses.find(loan_id);
  if (sum == state_.sums.end() || status == state_.statuses.end()) return false;
  if (status->second.reference_value == 0) return false;
  return CheckedMath::RatioPercent(sum->second.total_value, status->second.reference_value) >= state_.config.min_collateral_ratio;
}

std::optional<CollateralDeposit> CollateralVault::GetCollateral(LoanId loan_id, CollateralId collateral_id) const {
  auto it = state_.deposits.find({loan_id, collateral_id});
  if (it == state_.deposits.end()) return std::nullopt;
  return it->second;
}

std::optional<LoanCollateralSummary> CollateralVault::GetLoanCollateralSum(LoanId loan_id) const {
  auto it = state_.sums.find(loan_id);
  if (it == state_.sums.end()) return std::nullopt;
  return it->second;
}

std::optional<LoanStatusRecord> CollateralVault::GetLoanStatus(LoanId loan_id) const {
  auto it = state_.statuses.find(loan_id);
  if (it == state_.statuses.end()) return std::nullopt;
  return it->second;
}

std::vector<CollateralDeposit> CollateralVault::GetDeposits(LoanId loan_id) const {
  std::vector<CollateralDeposit> out;
  auto first = state_.deposits.lower_bound({loan_id, 0});
  auto last = state_.deposits.upper_bound({loan_id, std::numeric_limits<CollateralId>::max()});
  for (auto it = first; it != last; ++it) out.push_back(it->second);
  return out;
}

void CollateralVault::SetAuthority(const CallContext& ctx, const Identity& authority) {
  RequireAuthority(ctx);
  if (authority.empty()) throw LendingError(ErrorCode::InvalidConfig, "authority must not be empty");
  state_.config.authority = authority;
  Logger::Info("vault authority moved to " + authority);
}

void CollateralVault::SetMinCollateralRatio(const CallContext& ctx, Amount ratio) {
  RequireAuthority(ctx);
  if (ratio < 100 || ratio > 300) throw LendingError(ErrorCode::InvalidAmount, "ratio must be within [100, 300]");
  state_.config.min_collateral_ratio = ratio;
}

void CollateralVault::SetMaxCollateralPerLoan(const CallContext& ctx, Amount max_amount) {
  RequireAuthority(ctx);
  if (max_amount == 0) throw LendingError(ErrorCode::InvalidAmount, "max collateral must be positive");
  state_.config.max_collateral_per_loan = max_amount;
}

void CollateralVault::SetLiquidationPenalty(const CallContext& ctx, Amount penalty) {
  RequireAuthority(ctx);
  if (penalty > 10) throw LendingError(ErrorCode::InvalidConfig, "penalty must not exceed 10");
  state_.config.liquidation_penalty = penalty;
}

void CollateralVault::SetCurrencyOracle(const CallContext& ctx, const std::string& currency, const std::string& oracle) {
  RequireAuthority(ctx);
  if (currency.empty() || oracle.empty()) throw LendingError(ErrorCode::InvalidCurrency, "currency and oracle must be named");
  state_.config.currency_oracles[currency] = oracle;
}
