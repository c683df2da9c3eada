#include "ledger/token_ledger.hpp"
#include "core/checked_math.hpp"
#include "common/logger.hpp"

bool TokenLedger::Transfer(Amount amount, const Identity& from, const Identity& to) {
  if (amount == 0 || from == to || from.empty() || to.empty()) return false;
  auto it = state_.balances.find(from);
  if (it == state_.balances.end() || it->second < amount) {
    Logger::Debug("transfer of " + std::to_string(amount) + " from " + from + " refused: insufficient balance");
    return false;
  }
  if (BalanceOf(to) > std::numeric_limits<Amount>::max() - amount) return false;
  it->second -= amount;
  state_.balances[to] += amount;
  if (it->second == 0) state_.balances.erase(it);
  return true;
}

void TokenLedger::Mint(const Identity& account, Amount amount) {
  if (account.empty()) throw LendingError(ErrorCode::InvalidConfig, "cannot mint to an empty account");
  Amount supply = CheckedMath::Add(state_.total_supply, amount);
  Amount balance = CheckedMath::Add(BalanceOf(account), amount);
  state_.balances[account] = balance;
  state_.total_supply = supply;
}

Amount TokenLedger::BalanceOf(const Identity& account) const {
  auto it = state_.balances.find(account);
  return it == state_.balances.end() ? 0 : it->second;
}
