#pragma once
#include "core/types.hpp"
#include "core/transaction.hpp"
#include "config/protocol_config.hpp"
#include <map>
#include <optional>
#include <vector>
#include <utility>

class PriceOracle;
class TokenTransfer;

struct CollateralDeposit {
  LoanId loan_id = 0;
  CollateralId collateral_id = 0;
  Amount amount = 0;
  std::string currency;
  Height deposited_at = 0;
  Identity depositor;
  bool locked = false;
};

struct LoanCollateralSummary {
  LoanId loan_id = 0;
  Amount total_amount = 0;
  Amount total_value = 0;
  std::uint32_t deposit_count = 0;
};

struct LoanStatusRecord {
  LoanId loan_id = 0;
  LoanStatus status = LoanStatus::PENDING;
  Amount reference_value = 0; // ratio denominator
  Height last_updated = 0;
};

struct LiquidationReport {
  LoanId loan_id = 0;
  Amount total_liquidated = 0;
  Amount total_value = 0;
  Amount penalty = 0; // reported, not transferred
  Identity recipient;
};

// Collateral accounting engine. Holds deposits in the custody account of the transfer
// service and keeps per-loan aggregates in step with them.
//
// Every mutating call validates everything before the first transfer and runs inside a
// transaction scope of the shared coordinator.
class CollateralVault : public Journaled {
public:
  CollateralVault(const VaultConfig& config, PriceOracle& oracle, TokenTransfer& transfer,
                  TransactionCoordinator& coordinator);
  ~CollateralVault() override;
  CollateralVault(const CollateralVault&) = delete;
  CollateralVault& operator=(const CollateralVault&) = delete;

  CollateralId DepositCollateral(const CallContext& ctx, LoanId loan_id, Amount amount, const std::string& currency);
  bool WithdrawCollateral(const CallContext& ctx, LoanId loan_id, CollateralId collateral_id, Amount amount);
  void LockCollateral(const CallContext& ctx, LoanId loan_id, CollateralId collateral_id);
  void UnlockCollateral(const CallContext& ctx, LoanId loan_id, CollateralId collateral_id);
  void UpdateLoanStatus(const CallContext& ctx, LoanId loan_id, LoanStatus status, Amount reference_value);
  // Returns every deposit of a rejected or repaid loan to its depositor.
  Amount ReleaseCollateral(const CallContext& ctx, LoanId loan_id);
  // Sweeps all collateral of a defaulted loan to the pool recipient. Succeeds once.
  LiquidationReport LiquidateCollateral(const CallContext& ctx, LoanId loan_id);

  bool IsOverCollateralized(LoanId loan_id) const;
  std::optional<CollateralDeposit> GetCollateral(LoanId loan_id, CollateralId collateral_id) const;
  std::optional<LoanCollateralSummary> GetLoanCollateralSum(LoanId loan_id) const;
  std::optional<LoanStatusRecord> GetLoanStatus(LoanId loan_id) const;
  std::vector<CollateralDeposit> GetDeposits(LoanId loan_id) const;
  const VaultConfig& GetConfig() const { return state_.config; }

  void SetAuthority(const CallContext& ctx, const Identity& authority);
  void SetMinCollateralRatio(const CallContext& ctx, Amount ratio);
  void SetMaxCollateralPerLoan(const CallContext& ctx, Amount max_amount);
  void SetLiquidationPenalty(const CallContext& ctx, Amount penalty);
  void SetCurrencyOracle(const CallContext& ctx, const std::string& currency, const std::string& oracle);

  void Checkpoint() override { journal_.Push(state_); }
  void Rollback() override { journal_.RestoreInto(state_); }
  void Release() override { journal_.Drop(); }
private:
  using DepositKey = std::pair<LoanId, CollateralId>;

  void RequireAuthority(const CallContext& ctx) const;
  CollateralDeposit& FindDeposit(LoanId loan_id, CollateralId collateral_id);
  Amount QuoteValue(const std::string& currency, Amount amount);
  Amount ValueAfterWithdrawal(LoanId loan_id, CollateralId collateral_id, Amount amount);
  void EraseDeposits(LoanId loan_id);

  struct State {
    VaultConfig config;
    std::map<DepositKey, CollateralDeposit> deposits;
    std::map<LoanId, LoanCollateralSummary> sums;
    std::map<LoanId, LoanStatusRecord> statuses;
    std::map<LoanId, CollateralId> next_collateral_ids;
  };
  State state_;
  SnapshotJournal<State> journal_;
  PriceOracle& oracle_;
  TokenTransfer& transfer_;
  TransactionCoordinator& coordinator_;
};
