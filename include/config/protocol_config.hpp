#pragma once
#include "core/types.hpp"
#include <string>
#include <map>
#include <vector>
#include <utility>

struct VaultConfig {
  Identity authority;
  Amount min_collateral_ratio = 150;       // percent, [100, 300]
  Amount max_collateral_per_loan = 1000000;
  Amount liquidation_penalty = 5;          // percent of total value, reporting only
  std::uint32_t max_deposits_per_loan = 100;
  Identity custody_account = "vault";
  Identity pool_recipient = "lending-pool";
  std::map<std::string, std::string> currency_oracles; // currency -> oracle identity
};

struct LoanConfig {
  Identity authority;
  Identity engine_identity = "loan-manager";
  Amount max_loan_amount = 10000;
  Height max_loan_duration = 90;
  Amount min_collateral_ratio = 150;       // percent, > 100
  Height voting_period = 100;
  Amount approval_threshold_pct = 75;
  std::string collateral_currency = "STX";
};

struct PoolConfig {
  Identity admin;
  Identity account = "lending-pool";
  Amount min_contribution = 1000;
  Amount max_contribution = 100000;
  Height withdrawal_lock_period = 144;
  Amount base_interest_rate = 2;           // percent per day, [1, 10]
  Height blocks_per_day = 144;
};

struct HostConfig {
  Height start_height = 0;
  std::vector<std::pair<Identity, Amount>> genesis_balances;
  std::string registry_file;
  std::string oracle_url;                  // empty -> static prices
  int oracle_timeout_ms = 2000;
  std::string event_log_file = "events.jsonl";
};

struct ProtocolConfig {
  VaultConfig vault;
  LoanConfig loans;
  PoolConfig pool;
  HostConfig host;
};

// Reads every section from ConfigManager keys, applying the defaults above.
// Throws std::runtime_error when a required key is missing or inconsistent.
ProtocolConfig LoadProtocolConfig();
