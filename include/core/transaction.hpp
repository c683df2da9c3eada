#pragma once
#include <vector>
#include <cstddef>
#include <utility>

// A component whose state can be saved and restored as a unit.
class Journaled {
public:
  virtual ~Journaled() = default;
  virtual void Checkpoint() = 0;
  virtual void Rollback() = 0;
  virtual void Release() = 0;
};

// Copy-on-checkpoint journal for a plain state struct.
template <typename State>
class SnapshotJournal {
public:
  void Push(const State& s) { stack_.push_back(s); }
  void RestoreInto(State& s) {
    if (stack_.empty()) return;
    s = std::move(stack_.back());
    stack_.pop_back();
  }
  void Drop() { if (!stack_.empty()) stack_.pop_back(); }
  std::size_t Depth() const { return stack_.size(); }
private:
  std::vector<State> stack_;
};

// Spans every enlisted participant. Only the outermost Begin/Commit pair checkpoints and
// releases; nested scopes join it. An aborted nested scope marks the whole transaction
// rollback-only.
class TransactionCoordinator {
public:
  void Enlist(Journaled& p);
  void Delist(Journaled& p);
  void Begin();
  void Commit();
  void Abort();
  int Depth() const { return depth_; }
private:
  void RollbackAll();
  std::vector<Journaled*> participants_;
  int depth_ = 0;
  bool rollback_only_ = false;
};

// RAII boundary: aborts unless Commit() was reached.
class TransactionScope {
public:
  explicit TransactionScope(TransactionCoordinator& coordinator);
  ~TransactionScope();
  TransactionScope(const TransactionScope&) = delete;
  TransactionScope& operator=(const TransactionScope&) = delete;
  void Commit();
private:
  TransactionCoordinator& coordinator_;
  bool done_ = false;
};
