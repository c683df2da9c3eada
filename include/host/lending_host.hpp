#pragma once
#include "config/protocol_config.hpp"
#include "core/transaction.hpp"
#include "ledger/token_ledger.hpp"
#include "pool/lending_pool.hpp"
#include "registry/registry.hpp"
#include "repayment/repayment_handler.hpp"
#include "vault/collateral_vault.hpp"
#include "loans/loan_manager.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

class PriceOracle;

// Owns one instance of every protocol component, wired the way the daemon runs them.
// Calls are serialized; each mutating call is one transaction and, once committed,
// one event line.
class LendingHost {
public:
  LendingHost(const ProtocolConfig& config, PriceOracle& oracle);
  LendingHost(const ProtocolConfig& config, PriceOracle& oracle, JsonRegistry registry);
  LendingHost(const LendingHost&) = delete;
  LendingHost& operator=(const LendingHost&) = delete;

  // Runs fn(ctx) for `caller` at the current height. fn returns the result document that
  // is also attached to the emitted event.
  template <typename Fn>
  nlohmann::json Execute(const std::string& op, const Identity& caller, Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    CallContext ctx{caller, height_};
    nlohmann::json result;
    {
      TransactionScope scope(coordinator_);
      result = fn(ctx);
      scope.Commit();
    }
    EmitEvent(op, ctx, result);
    return result;
  }

  // Read-only access under the host lock.
  template <typename Fn>
  nlohmann::json Query(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn();
  }

  // Operator actions; the caller must be the loan authority.
  void Mint(const CallContext& ctx, const Identity& account, Amount amount);
  void Verify(const CallContext& ctx, const Identity& identity);
  void Revoke(const CallContext& ctx, const Identity& identity);
  void SetAssetOwner(const CallContext& ctx, std::uint64_t asset_id, const Identity& owner);
  Height AdvanceHeight(const CallContext& ctx, Height blocks);

  Height CurrentHeight();

  TokenLedger& Ledger() { return ledger_; }
  LendingPool& Pool() { return pool_; }
  JsonRegistry& Identities() { return registry_; }
  CollateralVault& Vault() { return vault_; }
  LoanManager& Loans() { return loans_; }
  const ProtocolConfig& Config() const { return config_; }
private:
  void RequireOperator(const CallContext& ctx) const;
  void EmitEvent(const std::string& op, const CallContext& ctx, const nlohmann::json& result);

  ProtocolConfig config_;
  std::mutex mutex_;
  Height height_;
  TransactionCoordinator coordinator_;
  TokenLedger ledger_;
  LendingPool pool_;
  JsonRegistry registry_;
  PoolRepaymentHandler repayments_;
  CollateralVault vault_;
  LoanManager loans_;
};
