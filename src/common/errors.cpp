#include "common/errors.hpp"

LendingError::LendingError(ErrorCode code, const std::string& message)
  : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message), code_(code) {}

ErrorKind KindOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotAuthorized:
    case ErrorCode::NotVerified:
      return ErrorKind::AUTHORIZATION;
    case ErrorCode::LoanNotFound:
    case ErrorCode::CollateralNotFound:
    case ErrorCode::AssetNotFound:
      return ErrorKind::NOT_FOUND;
    case ErrorCode::InvalidStatus:
    case ErrorCode::CollateralLocked:
    case ErrorCode::VotingClosed:
    case ErrorCode::VotingOpen:
    case ErrorCode::AlreadyVoted:
    case ErrorCode::LoanActive:
    case ErrorCode::LoanNotExpired:
    case ErrorCode::InsufficientCollateral:
    case ErrorCode::InsufficientFunds:
    case ErrorCode::PoolPaused:
    case ErrorCode::WithdrawalLocked:
    case ErrorCode::UnlockPeriodNotEnded:
    case ErrorCode::RollbackOnly:
      return ErrorKind::STATE;
    case ErrorCode::ZeroAmount:
    case ErrorCode::InvalidAmount:
    case ErrorCode::InvalidDuration:
    case ErrorCode::InvalidCurrency:
    case ErrorCode::InvalidCollateral:
    case ErrorCode::InvalidConfig:
    case ErrorCode::WithdrawalExceeds:
    case ErrorCode::InsufficientBalance:
    case ErrorCode::MaxContributionExceeded:
    case ErrorCode::AmountOverflow:
    case ErrorCode::MalformedCommand:
      return ErrorKind::VALIDATION;
    case ErrorCode::RatioBelowThreshold:
    case ErrorCode::MaxCollateralExceeded:
      return ErrorKind::INVARIANT_VIOLATION;
    case ErrorCode::TransferFailed:
    case ErrorCode::OracleUnavailable:
    case ErrorCode::DisbursementFailed:
    case ErrorCode::RepaymentFailed:
      return ErrorKind::EXTERNAL_FAILURE;
  }
  return ErrorKind::VALIDATION;
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotAuthorized: return "NotAuthorized";
    case ErrorCode::NotVerified: return "NotVerified";
    case ErrorCode::LoanNotFound: return "LoanNotFound";
    case ErrorCode::CollateralNotFound: return "CollateralNotFound";
    case ErrorCode::AssetNotFound: return "AssetNotFound";
    case ErrorCode::InvalidStatus: return "InvalidStatus";
    case ErrorCode::CollateralLocked: return "CollateralLocked";
    case ErrorCode::VotingClosed: return "VotingClosed";
    case ErrorCode::VotingOpen: return "VotingOpen";
    case ErrorCode::AlreadyVoted: return "AlreadyVoted";
    case ErrorCode::LoanActive: return "LoanActive";
    case ErrorCode::LoanNotExpired: return "LoanNotExpired";
    case ErrorCode::InsufficientCollateral: return "InsufficientCollateral";
    case ErrorCode::InsufficientFunds: return "InsufficientFunds";
    case ErrorCode::PoolPaused: return "PoolPaused";
    case ErrorCode::WithdrawalLocked: return "WithdrawalLocked";
    case ErrorCode::UnlockPeriodNotEnded: return "UnlockPeriodNotEnded";
    case ErrorCode::RollbackOnly: return "RollbackOnly";
    case ErrorCode::ZeroAmount: return "ZeroAmount";
    case ErrorCode::InvalidAmount: return "InvalidAmount";
    case ErrorCode::InvalidDuration: return "InvalidDuration";
    case ErrorCode::InvalidCurrency: return "InvalidCurrency";
    case ErrorCode::InvalidCollateral: return "InvalidCollateral";
    case ErrorCode::InvalidConfig: return "InvalidConfig";
    case ErrorCode::WithdrawalExceeds: return "WithdrawalExceeds";
    case ErrorCode::InsufficientBalance: return "InsufficientBalance";
    case ErrorCode::MaxContributionExceeded: return "MaxContributionExceeded";
    case ErrorCode::AmountOverflow: return "AmountOverflow";
    case ErrorCode::MalformedCommand: return "MalformedCommand";
    case ErrorCode::RatioBelowThreshold: return "RatioBelowThreshold";
    case ErrorCode::MaxCollateralExceeded: return "MaxCollateralExceeded";
    case ErrorCode::TransferFailed: return "TransferFailed";
    case ErrorCode::OracleUnavailable: return "OracleUnavailable";
    case ErrorCode::DisbursementFailed: return "DisbursementFailed";
    case ErrorCode::RepaymentFailed: return "RepaymentFailed";
  }
  return "Unknown";
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::AUTHORIZATION: return "AuthorizationError";
    case ErrorKind::NOT_FOUND: return "NotFoundError";
    case ErrorKind::STATE: return "StateError";
    case ErrorKind::VALIDATION: return "ValidationError";
    case ErrorKind::INVARIANT_VIOLATION: return "InvariantViolation";
    case ErrorKind::EXTERNAL_FAILURE: return "ExternalFailure";
  }
  return "Unknown";
}
