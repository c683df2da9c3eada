#pragma once
#include "core/types.hpp"

class TokenTransfer;

class RepaymentHandler {
public:
  virtual ~RepaymentHandler() = default;
  virtual bool ProcessRepayment(LoanId loan_id, const Identity& payer, Amount amount) = 0;
};

// Settles a repayment by moving it from the payer into the pool account.
class PoolRepaymentHandler : public RepaymentHandler {
public:
  PoolRepaymentHandler(TokenTransfer& transfer, Identity pool_account);
  bool ProcessRepayment(LoanId loan_id, const Identity& payer, Amount amount) override;
private:
  TokenTransfer& transfer_;
  Identity pool_account_;
};
