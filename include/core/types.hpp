#pragma once
#include <cstdint>
#include <string>
#include <optional>

using Amount = std::uint64_t;
using Height = std::uint64_t;
using LoanId = std::uint64_t;
using CollateralId = std::uint32_t;
using Identity = std::string;

// Who is calling and at which height. Built by the host for every operation.
struct CallContext {
  Identity caller;
  Height height = 0;
};

enum class LoanStatus { PENDING, ACTIVE, REPAID, REJECTED, DEFAULTED };

const char* LoanStatusName(LoanStatus s);
std::optional<LoanStatus> ParseLoanStatus(const std::string& s);
bool IsTerminal(LoanStatus s);
// Allowed forward edges: pending->{active,rejected}, active->{repaid,defaulted}.
bool CanTransition(LoanStatus from, LoanStatus to);
