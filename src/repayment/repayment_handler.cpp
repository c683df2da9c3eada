#include "repayment/repayment_handler.hpp"
#include "ledger/token_ledger.hpp"
#include "common/logger.hpp"

PoolRepaymentHandler::PoolRepaymentHandler(TokenTransfer& transfer, Identity pool_account)
  : transfer_(transfer), pool_account_(std::move(pool_account)) {}

bool PoolRepaymentHandler::ProcessRepayment(LoanId loan_id, const Identity& payer, Amount amount) {
  if (!transfer_.Transfer(amount, payer, pool_account_)) {
    Logger::Warning("repayment of loan " + std::to_string(loan_id) + " by " + payer + " could not be collected");
    return false;
  }
  Logger::Info("loan " + std::to_string(loan_id) + " repayment of " + std::to_string(amount) + " settled into " + pool_account_);
  return true;
}
