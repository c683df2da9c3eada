#include "host/lending_host.hpp"
#include "telemetry/structured_logger.hpp"
#include "core/checked_math.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {
JsonRegistry LoadRegistry(const HostConfig& host) {
  if (host.registry_file.empty()) return JsonRegistry();
  return JsonRegistry::FromFile(host.registry_file);
}
}

LendingHost::LendingHost(const ProtocolConfig& config, PriceOracle& oracle)
  : LendingHost(config, oracle, LoadRegistry(config.host)) {}

LendingHost::LendingHost(const ProtocolConfig& config, PriceOracle& oracle, JsonRegistry registry)
  : config_(config),
    height_(config.host.start_height),
    pool_(config.pool, ledger_),
    registry_(std::move(registry)),
    repayments_(ledger_, config.pool.account),
    vault_(config.vault, oracle, ledger_, coordinator_),
    loans_(config.loans, vault_, pool_, registry_, repayments_, coordinator_) {
  coordinator_.Enlist(ledger_);
  coordinator_.Enlist(pool_);
  for (const auto& kv : config_.host.genesis_balances) ledger_.Mint(kv.first, kv.second);
  Logger::Info("host ready at height " + std::to_string(height_) + ", " + std::to_string(config_.host.genesis_balances.size())
               + " genesis accounts, supply " + std::to_string(ledger_.TotalSupply()));
}

void LendingHost::RequireOperator(const CallContext& ctx) const {
  if (ctx.caller != config_.loans.authority) throw LendingError(ErrorCode::NotAuthorized, ctx.caller + " is not the host operator");
}

void LendingHost::Mint(const CallContext& ctx, const Identity& account, Amount amount) {
  RequireOperator(ctx);
  if (amount == 0) throw LendingError(ErrorCode::ZeroAmount, "mint amount must be positive");
  ledger_.Mint(account, amount);
}

void LendingHost::Verify(const CallContext& ctx, const Identity& identity) {
  RequireOperator(ctx);
  if (identity.empty()) throw LendingError(ErrorCode::InvalidConfig, "identity must not be empty");
  registry_.Verify(identity);
}

void LendingHost::Revoke(const CallContext& ctx, const Identity& identity) {
  RequireOperator(ctx);
  registry_.Revoke(identity);
}

void LendingHost::SetAssetOwner(const CallContext& ctx, std::uint64_t asset_id, const Identity& owner) {
  RequireOperator(ctx);
  if (owner.empty()) throw LendingError(ErrorCode::InvalidConfig, "asset owner must not be empty");
  registry_.SetAssetOwner(asset_id, owner);
}

// Called from inside Execute, so the host lock is already held.
Height LendingHost::AdvanceHeight(const CallContext& ctx, Height blocks) {
  RequireOperator(ctx);
  if (blocks == 0) throw LendingError(ErrorCode::InvalidAmount, "height only moves forward");
  height_ = CheckedMath::Add(height_, blocks);
  return height_;
}

Height LendingHost::CurrentHeight() {
  std::lock_guard<std::mutex> lock(mutex_);
  return height_;
}

void LendingHost::EmitEvent(const std::string& op, const CallContext& ctx, const nlohmann::json& result) {
  nlohmann::json fields;
  fields["caller"] = ctx.caller;
  fields["height"] = ctx.height;
  fields["result"] = result;
  StructuredLogger::Instance().LogEvent(op, fields);
}
