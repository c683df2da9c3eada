#pragma once
#include "pool/funds_pool.hpp"
#include "config/protocol_config.hpp"
#include "core/transaction.hpp"
#include <map>
#include <optional>

class TokenLedger;

struct PoolContribution {
  Amount amount = 0;
  Height last_contribution_height = 0;
  Height locked_until = 0;
};

// Lender liquidity held in the pool account of the ledger. Contributions are locked for
// a fixed number of blocks; available funds are whatever the pool account holds.
class LendingPool : public FundsPool, public Journaled {
public:
  LendingPool(const PoolConfig& config, TokenLedger& ledger);

  Amount Contribute(const CallContext& ctx, Amount amount);
  Amount Withdraw(const CallContext& ctx, Amount amount);

  Amount GetAvailableFunds() override;
  Amount CalculateInterest(Amount principal, Height duration_blocks) override;
  bool DisburseFunds(Amount amount, const Identity& recipient) override;

  std::optional<PoolContribution> GetContribution(const Identity& contributor) const;
  // 0 when the contributor has nothing in the pool.
  Height GetUserLockedUntil(const Identity& contributor) const;
  // A lock ends at `locked_until` or earlier once the admin unlock height reaches it.
  bool IsWithdrawalLocked(const Identity& contributor, Height height) const;
  Amount GetTotalPoolBalance() const { return state_.total_contributions; }
  std::optional<Amount> GetHistoricalYield(Height height) const;
  Height GetUnlockTimestamp() const { return state_.unlock_timestamp; }
  bool IsPaused() const { return state_.config.paused; }
  const PoolConfig& GetConfig() const { return state_.config.params; }

  void SetAdmin(const CallContext& ctx, const Identity& admin);
  void Pause(const CallContext& ctx);
  void Unpause(const CallContext& ctx);
  void SetMinContribution(const CallContext& ctx, Amount value);
  void SetMaxContribution(const CallContext& ctx, Amount value);
  void SetBaseInterestRate(const CallContext& ctx, Amount rate);
  void SetWithdrawalLockPeriod(const CallContext& ctx, Height period);
  void RecordYield(const CallContext& ctx, Amount yield_amount);
  void UpdateUnlockTimestamp(const CallContext& ctx, Height timestamp);

  void Checkpoint() override { journal_.Push(state_); }
  void Rollback() override { journal_.RestoreInto(state_); }
  void Release() override { journal_.Drop(); }
private:
  void RequireAdmin(const CallContext& ctx) const;

  struct Settings {
    PoolConfig params;
    bool paused = false;
  };
  struct State {
    Settings config;
    std::map<Identity, PoolContribution> contributions;
    Amount total_contributions = 0;
    std::map<Height, Amount> yields;
    Height unlock_timestamp = 0;
  };
  State state_;
  SnapshotJournal<State> journal_;
  TokenLedger& ledger_;
};
