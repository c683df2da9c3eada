#pragma once
#include "core/types.hpp"

// Pooled lender funds as seen by the loan manager.
class FundsPool {
public:
  virtual ~FundsPool() = default;
  virtual Amount GetAvailableFunds() = 0;
  virtual Amount CalculateInterest(Amount principal, Height duration_blocks) = 0;
  virtual bool DisburseFunds(Amount amount, const Identity& recipient) = 0;
};
