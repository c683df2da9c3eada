#include "core/types.hpp"
#include <algorithm>
#include <cctype>

namespace {
struct Edge { LoanStatus from; LoanStatus to; };

constexpr Edge kTransitions[] = {
  { LoanStatus::PENDING, LoanStatus::ACTIVE },
  { LoanStatus::PENDING, LoanStatus::REJECTED },
  { LoanStatus::ACTIVE, LoanStatus::REPAID },
  { LoanStatus::ACTIVE, LoanStatus::DEFAULTED },
};
}

const char* LoanStatusName(LoanStatus s) {
  switch (s) {
    case LoanStatus::PENDING: return "pending";
    case LoanStatus::ACTIVE: return "active";
    case LoanStatus::REPAID: return "repaid";
    case LoanStatus::REJECTED: return "rejected";
    case LoanStatus::DEFAULTED: return "defaulted";
  }
  return "unknown";
}

std::optional<LoanStatus> ParseLoanStatus(const std::string& s) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
  if (v == "pending") return LoanStatus::PENDING;
  if (v == "active") return LoanStatus::ACTIVE;
  if (v == "repaid") return LoanStatus::REPAID;
  if (v == "rejected") return LoanStatus::REJECTED;
  if (v == "defaulted") return LoanStatus::DEFAULTED;
  return std::nullopt;
}

bool IsTerminal(LoanStatus s) {
  return s == LoanStatus::REPAID || s == LoanStatus::REJECTED || s == LoanStatus::DEFAULTED;
}

bool CanTransition(LoanStatus from, LoanStatus to) {
  for (const auto& e : kTransitions) {
    if (e.from == from && e.to == to) return true;
  }
  return false;
}
