#include "host/command_processor.hpp"
#include "host/lending_host.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <limits>

using json = nlohmann::json;

namespace {

json ErrorResponse(const std::string& code, const std::string& kind, const std::string& message) {
  return json{{"ok", false}, {"error", {{"code", code}, {"kind", kind}, {"message", message}}}};
}

json ErrorResponse(const LendingError& e) {
  return ErrorResponse(ErrorCodeName(e.Code()), ErrorKindName(e.Kind()), e.what());
}

[[noreturn]] void Malformed(const std::string& message) {
  throw LendingError(ErrorCode::MalformedCommand, message);
}

std::uint64_t U64(const json& c, const char* key) {
  auto it = c.find(key);
  if (it == c.end() || !it->is_number_unsigned()) Malformed(std::string("'") + key + "' must be a non-negative integer");
  return it->get<std::uint64_t>();
}

std::string Str(const json& c, const char* key) {
  auto it = c.find(key);
  if (it == c.end() || !it->is_string()) Malformed(std::string("'") + key + "' must be a string");
  return it->get<std::string>();
}

bool Bool(const json& c, const char* key) {
  auto it = c.find(key);
  if (it == c.end() || !it->is_boolean()) Malformed(std::string("'") + key + "' must be a boolean");
  return it->get<bool>();
}

CollateralId CollateralIdArg(const json& c) {
  std::uint64_t id = U64(c, "collateral_id");
  if (id > std::numeric_limits<CollateralId>::max()) Malformed("'collateral_id' out of range");
  return static_cast<CollateralId>(id);
}

json ToJson(const CollateralDeposit& d) {
  return json{{"loan_id", d.loan_id}, {"collateral_id", d.collateral_id}, {"amount", d.amount}, {"currency", d.currency},
              {"deposited_at", d.deposited_at}, {"depositor", d.depositor}, {"locked", d.locked}};
}

json ToJson(const LoanCollateralSummary& s) {
  return json{{"loan_id", s.loan_id}, {"total_amount", s.total_amount}, {"total_value", s.total_value},
              {"deposit_count", s.deposit_count}};
}

json ToJson(const LoanStatusRecord& r) {
  return json{{"loan_id", r.loan_id}, {"status", LoanStatusName(r.status)}, {"reference_value", r.reference_value},
              {"last_updated", r.last_updated}};
}

json ToJson(const LoanRecord& l) {
  return json{{"loan_id", l.loan_id}, {"borrower", l.borrower}, {"principal", l.principal}, {"interest", l.interest},
              {"collateral_amount", l.collateral_amount}, {"asset_reference", l.asset_reference},
              {"status", LoanStatusName(l.status)}, {"start_height", l.start_height}, {"duration", l.duration},
              {"votes_for", l.votes_for}, {"votes_against", l.votes_against}, {"voting_deadline", l.voting_deadline}};
}

template <typename T>
json OptionalJson(const std::optional<T>& v) {
  if (!v) return json(nullptr);
  return ToJson(*v);
}

} // namespace

CommandProcessor::CommandProcessor(LendingHost& host) : host_(host) {
  RegisterVaultOps();
  RegisterLoanOps();
  RegisterPoolOps();
  RegisterHostOps();
  RegisterQueries();
}

void CommandProcessor::Mutation(const std::string& op, std::function<json(const json&, const CallContext&)> fn) {
  handlers_[op] = [this, op, fn](const json& c) {
    const Identity caller = Str(c, "caller");
    return host_.Execute(op, caller, [&](const CallContext& ctx) { return fn(c, ctx); });
  };
}

void CommandProcessor::RegisterVaultOps() {
  CollateralVault& v = host_.Vault();
  Mutation("deposit_collateral", [&v](const json& c, const CallContext& ctx) {
    return json{{"collateral_id", v.DepositCollateral(ctx, U64(c, "loan_id"), U64(c, "amount"), Str(c, "currency"))}};
  });
  Mutation("withdraw_collateral", [&v](const json& c, const CallContext& ctx) {
    return json(v.WithdrawCollateral(ctx, U64(c, "loan_id"), CollateralIdArg(c), U64(c, "amount")));
  });
  Mutation("lock_collateral", [&v](const json& c, const CallContext& ctx) {
    v.LockCollateral(ctx, U64(c, "loan_id"), CollateralIdArg(c));
    return json(true);
  });
  Mutation("unlock_collateral", [&v](const json& c, const CallContext& ctx) {
    v.UnlockCollateral(ctx, U64(c, "loan_id"), CollateralIdArg(c));
    return json(true);
  });
  Mutation("update_loan_status", [&v](const json& c, const CallContext& ctx) {
    auto status = ParseLoanStatus(Str(c, "status"));
    if (!status) Malformed("unknown status " + Str(c, "status"));
    v.UpdateLoanStatus(ctx, U64(c, "loan_id"), *status, U64(c, "reference_value"));
    return json(true);
  });
  Mutation("release_collateral", [&v](const json& c, const CallContext& ctx) {
    return json{{"released", v.ReleaseCollateral(ctx, U64(c, "loan_id"))}};
  });
  Mutation("liquidate_collateral", [&v](const json& c, const CallContext& ctx) {
    LiquidationReport r = v.LiquidateCollateral(ctx, U64(c, "loan_id"));
    return json{{"loan_id", r.loan_id}, {"total_liquidated", r.total_liquidated}, {"total_value", r.total_value},
                {"penalty", r.penalty}, {"recipient", r.recipient}};
  });
  Mutation("vault_set_authority", [&v](const json& c, const CallContext& ctx) {
    v.SetAuthority(ctx, Str(c, "authority"));
    return json(true);
  });
  Mutation("vault_set_min_ratio", [&v](const json& c, const CallContext& ctx) {
    v.SetMinCollateralRatio(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("vault_set_max_collateral", [&v](const json& c, const CallContext& ctx) {
    v.SetMaxCollateralPerLoan(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("vault_set_penalty", [&v](const json& c, const CallContext& ctx) {
    v.SetLiquidationPenalty(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("vault_set_oracle", [&v](const json& c, const CallContext& ctx) {
    v.SetCurrencyOracle(ctx, Str(c, "currency"), Str(c, "oracle"));
    return json(true);
  });
}

void CommandProcessor::RegisterLoanOps() {
  LoanManager& m = host_.Loans();
  Mutation("request_loan", [&m](const json& c, const CallContext& ctx) {
    return json{{"loan_id", m.RequestLoan(ctx, U64(c, "amount"), U64(c, "duration"), U64(c, "asset_id"), U64(c, "collateral"))}};
  });
  Mutation("vote", [&m](const json& c, const CallContext& ctx) {
    m.VoteOnLoan(ctx, U64(c, "loan_id"), Bool(c, "approve"));
    return json(true);
  });
  Mutation("finalize_loan", [&m](const json& c, const CallContext& ctx) {
    return json{{"approved", m.FinalizeLoan(ctx, U64(c, "loan_id"))}};
  });
  Mutation("repay_loan", [&m](const json& c, const CallContext& ctx) {
    m.RepayLoan(ctx, U64(c, "loan_id"), U64(c, "amount"));
    return json(true);
  });
  Mutation("mark_default", [&m](const json& c, const CallContext& ctx) {
    DefaultOutcome out = m.MarkLoanDefault(ctx, U64(c, "loan_id"));
    return json{{"loan_id", out.loan_id}, {"liquidated", out.liquidated}, {"penalty", out.penalty}};
  });
  Mutation("loans_set_authority", [&m](const json& c, const CallContext& ctx) {
    m.SetAuthority(ctx, Str(c, "authority"));
    return json(true);
  });
  Mutation("loans_set_max_amount", [&m](const json& c, const CallContext& ctx) {
    m.SetMaxLoanAmount(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("loans_set_max_duration", [&m](const json& c, const CallContext& ctx) {
    m.SetMaxLoanDuration(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("loans_set_min_ratio", [&m](const json& c, const CallContext& ctx) {
    m.SetMinCollateralRatio(ctx, U64(c, "value"));
    return json(true);
  });
}

void CommandProcessor::RegisterPoolOps() {
  LendingPool& p = host_.Pool();
  Mutation("pool_contribute", [&p](const json& c, const CallContext& ctx) {
    return json{{"contribution", p.Contribute(ctx, U64(c, "amount"))}};
  });
  Mutation("pool_withdraw", [&p](const json& c, const CallContext& ctx) {
    return json{{"remaining", p.Withdraw(ctx, U64(c, "amount"))}};
  });
  Mutation("pool_set_admin", [&p](const json& c, const CallContext& ctx) {
    p.SetAdmin(ctx, Str(c, "admin"));
    return json(true);
  });
  Mutation("pool_pause", [&p](const json&, const CallContext& ctx) {
    p.Pause(ctx);
    return json(true);
  });
  Mutation("pool_unpause", [&p](const json&, const CallContext& ctx) {
    p.Unpause(ctx);
    return json(true);
  });
  Mutation("pool_set_min_contribution", [&p](const json& c, const CallContext& ctx) {
    p.SetMinContribution(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("pool_set_max_contribution", [&p](const json& c, const CallContext& ctx) {
    p.SetMaxContribution(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("pool_set_interest_rate", [&p](const json& c, const CallContext& ctx) {
    p.SetBaseInterestRate(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("pool_set_lock_period", [&p](const json& c, const CallContext& ctx) {
    p.SetWithdrawalLockPeriod(ctx, U64(c, "value"));
    return json(true);
  });
  Mutation("pool_record_yield", [&p](const json& c, const CallContext& ctx) {
    p.RecordYield(ctx, U64(c, "amount"));
    return json{{"height", ctx.height}};
  });
  Mutation("pool_update_unlock", [&p](const json& c, const CallContext& ctx) {
    p.UpdateUnlockTimestamp(ctx, U64(c, "height"));
    return json(true);
  });
}

void CommandProcessor::RegisterHostOps() {
  LendingHost& h = host_;
  Mutation("mint", [&h](const json& c, const CallContext& ctx) {
    h.Mint(ctx, Str(c, "account"), U64(c, "amount"));
    return json{{"balance", h.Ledger().BalanceOf(Str(c, "account"))}};
  });
  Mutation("verify", [&h](const json& c, const CallContext& ctx) {
    h.Verify(ctx, Str(c, "identity"));
    return json(true);
  });
  Mutation("revoke", [&h](const json& c, const CallContext& ctx) {
    h.Revoke(ctx, Str(c, "identity"));
    return json(true);
  });
  Mutation("set_asset_owner", [&h](const json& c, const CallContext& ctx) {
    h.SetAssetOwner(ctx, U64(c, "asset_id"), Str(c, "owner"));
    return json(true);
  });
  Mutation("advance", [&h](const json& c, const CallContext& ctx) {
    return json{{"height", h.AdvanceHeight(ctx, U64(c, "blocks"))}};
  });
}

void CommandProcessor::RegisterQueries() {
  LendingHost& h = host_;
  handlers_["get_collateral"] = [&h](const json& c) {
    return h.Query([&] { return OptionalJson(h.Vault().GetCollateral(U64(c, "loan_id"), CollateralIdArg(c))); });
  };
  handlers_["get_collateral_sum"] = [&h](const json& c) {
    return h.Query([&] { return OptionalJson(h.Vault().GetLoanCollateralSum(U64(c, "loan_id"))); });
  };
  handlers_["get_vault_status"] = [&h](const json& c) {
    return h.Query([&] { return OptionalJson(h.Vault().GetLoanStatus(U64(c, "loan_id"))); });
  };
  handlers_["is_over_collateralized"] = [&h](const json& c) {
    return h.Query([&] { return json(h.Vault().IsOverCollateralized(U64(c, "loan_id"))); });
  };
  handlers_["get_loan"] = [&h](const json& c) {
    return h.Query([&] { return OptionalJson(h.Loans().GetLoan(U64(c, "loan_id"))); });
  };
  handlers_["get_vote"] = [&h](const json& c) {
    return h.Query([&] {
      auto vote = h.Loans().GetVote(U64(c, "loan_id"), Str(c, "voter"));
      return vote ? json(*vote) : json(nullptr);
    });
  };
  handlers_["has_active_loan"] = [&h](const json& c) {
    return h.Query([&] { return json(h.Loans().HasActiveLoan(Str(c, "borrower"))); });
  };
  handlers_["next_loan_id"] = [&h](const json&) {
    return h.Query([&] { return json(h.Loans().NextLoanId()); });
  };
  handlers_["balance"] = [&h](const json& c) {
    return h.Query([&] { return json(h.Ledger().BalanceOf(Str(c, "account"))); });
  };
  handlers_["pool_contribution"] = [&h](const json& c) {
    return h.Query([&] {
      auto pc = h.Pool().GetContribution(Str(c, "contributor"));
      if (!pc) return json(nullptr);
      return json{{"amount", pc->amount}, {"last_contribution_height", pc->last_contribution_height}, {"locked_until", pc->locked_until}};
    });
  };
  handlers_["pool_locked_until"] = [&h](const json& c) {
    return h.Query([&] { return json(h.Pool().GetUserLockedUntil(Str(c, "contributor"))); });
  };
  handlers_["pool_balance"] = [&h](const json&) {
    return h.Query([&] { return json(h.Pool().GetTotalPoolBalance()); });
  };
  handlers_["pool_yield"] = [&h](const json& c) {
    return h.Query([&] {
      auto y = h.Pool().GetHistoricalYield(U64(c, "height"));
      return y ? json(*y) : json(nullptr);
    });
  };
  handlers_["pool_unlock_height"] = [&h](const json&) {
    return h.Query([&] { return json(h.Pool().GetUnlockTimestamp()); });
  };
  handlers_["available_funds"] = [&h](const json&) {
    return h.Query([&] { return json(h.Pool().GetAvailableFunds()); });
  };
  handlers_["height"] = [&h](const json&) { return json(h.CurrentHeight()); };
}

std::vector<std::string> CommandProcessor::Operations() const {
  std::vector<std::string> ops;
  for (const auto& kv : handlers_) ops.push_back(kv.first);
  return ops;
}

json CommandProcessor::Handle(const json& command) {
  try {
    if (!command.is_object()) Malformed("command must be a JSON object");
    const std::string op = Str(command, "op");
    auto it = handlers_.find(op);
    if (it == handlers_.end()) Malformed("unknown op " + op);
    return json{{"ok", true}, {"result", it->second(command)}};
  } catch (const LendingError& e) {
    Logger::Debug(std::string("command rejected: ") + e.what());
    return ErrorResponse(e);
  } catch (const json::exception& e) {
    return ErrorResponse(ErrorCodeName(ErrorCode::MalformedCommand), ErrorKindName(ErrorKind::VALIDATION), e.what());
  } catch (const std::exception& e) {
    Logger::Error(std::string("command failed: ") + e.what(), __FILE__, __LINE__);
    return ErrorResponse("Internal", ErrorKindName(ErrorKind::EXTERNAL_FAILURE), e.what());
  }
}

std::string CommandProcessor::HandleLine(const std::string& line) {
  json command;
  try {
    command = json::parse(line);
  } catch (const json::parse_error& e) {
    return ErrorResponse(ErrorCodeName(ErrorCode::MalformedCommand), ErrorKindName(ErrorKind::VALIDATION), e.what()).dump();
  }
  return Handle(command).dump();
}
