#include "core/transaction.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

void TransactionCoordinator::Enlist(Journaled& p) {
  if (std::find(participants_.begin(), participants_.end(), &p) == participants_.end()) {
    participants_.push_back(&p);
  }
}

void TransactionCoordinator::Delist(Journaled& p) {
  participants_.erase(std::remove(participants_.begin(), participants_.end(), &p), participants_.end());
}

void TransactionCoordinator::Begin() {
  if (depth_++ > 0) return;
  rollback_only_ = false;
  for (auto* p : participants_) p->Checkpoint();
}

void TransactionCoordinator::Commit() {
  if (depth_ == 0) return;
  if (--depth_ > 0) return;
  if (rollback_only_) {
    RollbackAll();
    throw LendingError(ErrorCode::RollbackOnly, "nested operation failed; transaction rolled back");
  }
  for (auto* p : participants_) p->Release();
}

void TransactionCoordinator::Abort() {
  if (depth_ == 0) return;
  if (--depth_ > 0) {
    rollback_only_ = true;
    return;
  }
  RollbackAll();
}

void TransactionCoordinator::RollbackAll() {
  for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) (*it)->Rollback();
  rollback_only_ = false;
  Logger::Debug("transaction rolled back", __FILE__, __LINE__);
}

TransactionScope::TransactionScope(TransactionCoordinator& coordinator) : coordinator_(coordinator) {
  coordinator_.Begin();
}

TransactionScope::~TransactionScope() {
  if (!done_) coordinator_.Abort();
}

void TransactionScope::Commit() {
  done_ = true;
  coordinator_.Commit();
}
