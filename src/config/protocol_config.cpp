#include "config/protocol_config.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <stdexcept>

ProtocolConfig LoadProtocolConfig() {
  ProtocolConfig cfg;

  // The loan manager is the vault's authority unless told otherwise.
  cfg.loans.engine_identity = ConfigManager::Get("LOAN_ENGINE_IDENTITY").value_or(cfg.loans.engine_identity);
  cfg.loans.authority = ConfigManager::GetOrThrow("LOAN_AUTHORITY");
  cfg.loans.max_loan_amount = ConfigManager::GetUint64Or("MAX_LOAN_AMOUNT", cfg.loans.max_loan_amount);
  cfg.loans.max_loan_duration = ConfigManager::GetUint64Or("MAX_LOAN_DURATION", cfg.loans.max_loan_duration);
  cfg.loans.min_collateral_ratio = ConfigManager::GetUint64Or("LOAN_MIN_COLLATERAL_RATIO", cfg.loans.min_collateral_ratio);
  cfg.loans.voting_period = ConfigManager::GetUint64Or("VOTING_PERIOD_BLOCKS", cfg.loans.voting_period);
  cfg.loans.approval_threshold_pct = ConfigManager::GetUint64Or("APPROVAL_THRESHOLD_PCT", cfg.loans.approval_threshold_pct);
  cfg.loans.collateral_currency = ConfigManager::Get("COLLATERAL_CURRENCY").value_or(cfg.loans.collateral_currency);

  cfg.vault.authority = ConfigManager::Get("VAULT_AUTHORITY").value_or(cfg.loans.engine_identity);
  cfg.vault.min_collateral_ratio = ConfigManager::GetUint64Or("MIN_COLLATERAL_RATIO", cfg.vault.min_collateral_ratio);
  cfg.vault.max_collateral_per_loan = ConfigManager::GetUint64Or("MAX_COLLATERAL_PER_LOAN", cfg.vault.max_collateral_per_loan);
  cfg.vault.liquidation_penalty = ConfigManager::GetUint64Or("LIQUIDATION_PENALTY", cfg.vault.liquidation_penalty);
  cfg.vault.custody_account = ConfigManager::Get("VAULT_ACCOUNT").value_or(cfg.vault.custody_account);

  cfg.pool.admin = ConfigManager::Get("POOL_ADMIN").value_or(cfg.loans.authority);
  cfg.pool.account = ConfigManager::Get("POOL_ACCOUNT").value_or(cfg.pool.account);
  cfg.pool.min_contribution = ConfigManager::GetUint64Or("POOL_MIN_CONTRIBUTION", cfg.pool.min_contribution);
  cfg.pool.max_contribution = ConfigManager::GetUint64Or("POOL_MAX_CONTRIBUTION", cfg.pool.max_contribution);
  cfg.pool.withdrawal_lock_period = ConfigManager::GetUint64Or("POOL_WITHDRAWAL_LOCK_PERIOD", cfg.pool.withdrawal_lock_period);
  cfg.pool.base_interest_rate = ConfigManager::GetUint64Or("POOL_BASE_INTEREST_RATE", cfg.pool.base_interest_rate);
  cfg.pool.blocks_per_day = ConfigManager::GetUint64Or("BLOCKS_PER_DAY", cfg.pool.blocks_per_day);
  cfg.vault.pool_recipient = cfg.pool.account;

  for (const auto& kv : ConfigManager::GetPairs("CURRENCY_ORACLES")) cfg.vault.currency_oracles[kv.first] = kv.second;
  if (cfg.vault.currency_oracles.empty()) cfg.vault.currency_oracles[cfg.loans.collateral_currency] = "static";

  cfg.host.start_height = ConfigManager::GetUint64Or("START_HEIGHT", 0);
  for (const auto& kv : ConfigManager::GetPairs("GENESIS_BALANCES")) {
    try {
      cfg.host.genesis_balances.emplace_back(kv.first, static_cast<Amount>(std::stoull(kv.second)));
    } catch (const std::logic_error&) {
      throw std::runtime_error("Bad GENESIS_BALANCES entry: " + kv.first + ":" + kv.second);
    }
  }
  cfg.host.registry_file = ConfigManager::Get("REGISTRY_FILE").value_or("");
  cfg.host.oracle_url = ConfigManager::Get("ORACLE_URL").value_or("");
  cfg.host.oracle_timeout_ms = ConfigManager::GetIntOr("ORACLE_TIMEOUT_MS", cfg.host.oracle_timeout_ms);
  cfg.host.event_log_file = ConfigManager::Get("EVENT_LOG_FILE").value_or(cfg.host.event_log_file);

  if (cfg.vault.min_collateral_ratio < 100 || cfg.vault.min_collateral_ratio > 300)
    throw std::runtime_error("MIN_COLLATERAL_RATIO must be within [100, 300]");
  if (cfg.loans.min_collateral_ratio <= 100)
    throw std::runtime_error("LOAN_MIN_COLLATERAL_RATIO must be above 100");
  if (cfg.vault.liquidation_penalty > 10)
    throw std::runtime_error("LIQUIDATION_PENALTY must not exceed 10");
  if (cfg.pool.blocks_per_day == 0)
    throw std::runtime_error("BLOCKS_PER_DAY must be positive");
  if (cfg.vault.authority != cfg.loans.engine_identity)
    Logger::Warning("vault authority " + cfg.vault.authority + " differs from loan engine identity " + cfg.loans.engine_identity
                    + "; loan transitions will be refused by the vault");
  return cfg;
}
