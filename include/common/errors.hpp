#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind { AUTHORIZATION, NOT_FOUND, STATE, VALIDATION, INVARIANT_VIOLATION, EXTERNAL_FAILURE };

enum class ErrorCode {
  // Authorization
  NotAuthorized,
  NotVerified,
  // NotFound
  LoanNotFound,
  CollateralNotFound,
  AssetNotFound,
  // State
  InvalidStatus,
  CollateralLocked,
  VotingClosed,
  VotingOpen,
  AlreadyVoted,
  LoanActive,
  LoanNotExpired,
  InsufficientCollateral,
  InsufficientFunds,
  PoolPaused,
  WithdrawalLocked,
  UnlockPeriodNotEnded,
  RollbackOnly,
  // Validation
  ZeroAmount,
  InvalidAmount,
  InvalidDuration,
  InvalidCurrency,
  InvalidCollateral,
  InvalidConfig,
  WithdrawalExceeds,
  InsufficientBalance,
  MaxContributionExceeded,
  AmountOverflow,
  MalformedCommand,
  // InvariantViolation
  RatioBelowThreshold,
  MaxCollateralExceeded,
  // ExternalFailure
  TransferFailed,
  OracleUnavailable,
  DisbursementFailed,
  RepaymentFailed
};

ErrorKind KindOf(ErrorCode code);
const char* ErrorCodeName(ErrorCode code);
const char* ErrorKindName(ErrorKind kind);

// Thrown by every protocol operation. The operation has had no effect when this escapes.
class LendingError : public std::runtime_error {
public:
  LendingError(ErrorCode code, const std::string& message);
  ErrorCode Code() const { return code_; }
  ErrorKind Kind() const { return KindOf(code_); }
private:
  ErrorCode code_;
};
