#pragma once
#include "core/types.hpp"
#include "core/transaction.hpp"
#include <map>

// Low-level value movement between identities.
class TokenTransfer {
public:
  virtual ~TokenTransfer() = default;
  virtual bool Transfer(Amount amount, const Identity& from, const Identity& to) = 0;
};

// In-memory balances. Transfers fail (return false) rather than overdraw.
class TokenLedger : public TokenTransfer, public Journaled {
public:
  bool Transfer(Amount amount, const Identity& from, const Identity& to) override;
  void Mint(const Identity& account, Amount amount);
  Amount BalanceOf(const Identity& account) const;
  Amount TotalSupply() const { return state_.total_supply; }

  void Checkpoint() override { journal_.Push(state_); }
  void Rollback() override { journal_.RestoreInto(state_); }
  void Release() override { journal_.Drop(); }
private:
  struct State {
    std::map<Identity, Amount> balances;
    Amount total_supply = 0;
  };
  State state_;
  SnapshotJournal<State> journal_;
};
