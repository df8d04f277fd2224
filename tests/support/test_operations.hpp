#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/atomic_operation.hpp"
#include "internal/state/state_provider.hpp"

namespace rollback::testing {

// Shared, ordered record of callbacks ("execute:a", "rollback:a", ...).
class CallLog {
 public:
  void Record(std::string entry) {
    std::lock_guard lock(mutex_);
    entries_.push_back(std::move(entry));
  }

  std::vector<std::string> Entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
  }

  std::size_t Count(const std::string& entry) const {
    std::lock_guard lock(mutex_);
    std::size_t     n = 0;
    for (const auto& e : entries_) n += e == entry ? 1 : 0;
    return n;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> entries_;
};

struct OperationBehavior {
  bool        fail_execute  = false;
  bool        fail_rollback = false;
  bool        invalid       = false;
  std::string output        = "ok";
};

class RecordingOperation final : public model::AtomicOperation {
 public:
  RecordingOperation(std::string id, std::shared_ptr<CallLog> log, OperationBehavior behavior = {})
      : model::AtomicOperation({id, "op " + id, "", {}, std::chrono::milliseconds(1000), 0, 0}),
        log_(std::move(log)),
        behavior_(std::move(behavior)) {
  }

  model::OperationOutput Execute(const model::TransactionContext&) override {
    log_->Record("execute:" + Id());
    if (behavior_.fail_execute) throw std::runtime_error("boom");
    return behavior_.output;
  }

  void Rollback(const model::TransactionContext&) override {
    log_->Record("rollback:" + Id());
    if (behavior_.fail_rollback) throw std::runtime_error("rollback of " + Id() + " failed");
  }

  model::ValidationResult Validate(const model::TransactionContext&) override {
    log_->Record("validate:" + Id());
    if (behavior_.invalid) return model::ValidationResult::Invalid(Id() + " is invalid");
    return model::ValidationResult::Valid();
  }

 private:
  std::shared_ptr<CallLog> log_;
  OperationBehavior        behavior_;
};

inline std::shared_ptr<RecordingOperation> MakeOperation(const std::string& id, const std::shared_ptr<CallLog>& log,
                                                         OperationBehavior behavior = {}) {
  return std::make_shared<RecordingOperation>(id, log, std::move(behavior));
}

// Execute blocks until Release(); lets a test act while the callback is in flight.
class GatedOperation final : public model::AtomicOperation {
 public:
  GatedOperation(std::string id, std::shared_ptr<CallLog> log)
      : model::AtomicOperation({id, "op " + id, "", {}, std::chrono::milliseconds(1000), 0, 0}), log_(std::move(log)) {
  }

  model::OperationOutput Execute(const model::TransactionContext&) override {
    log_->Record("execute:" + Id());
    std::unique_lock lock(mutex_);
    started_ = true;
    changed_.notify_all();
    changed_.wait(lock, [this] { return released_; });
    return std::string("ok");
  }

  void Rollback(const model::TransactionContext&) override {
    log_->Record("rollback:" + Id());
  }

  model::ValidationResult Validate(const model::TransactionContext&) override {
    return model::ValidationResult::Valid();
  }

  void WaitUntilStarted() {
    std::unique_lock lock(mutex_);
    changed_.wait(lock, [this] { return started_; });
  }

  void Release() {
    {
      std::lock_guard lock(mutex_);
      released_ = true;
    }
    changed_.notify_all();
  }

 private:
  std::shared_ptr<CallLog> log_;
  std::mutex               mutex_;
  std::condition_variable  changed_;
  bool                     started_  = false;
  bool                     released_ = false;
};

// Live state is a single string; Apply counts restores.
class StringStateProvider final : public state::StateProvider {
 public:
  explicit StringStateProvider(std::string value = "") : value_(std::move(value)) {
  }

  std::string Collect(model::SnapshotType) override {
    std::lock_guard lock(mutex_);
    return value_;
  }

  void Apply(const std::string& data) override {
    std::lock_guard lock(mutex_);
    value_ = data;
    ++restores_;
  }

  void Set(std::string value) {
    std::lock_guard lock(mutex_);
    value_ = std::move(value);
  }

  std::string Value() const {
    std::lock_guard lock(mutex_);
    return value_;
  }

  int Restores() const {
    std::lock_guard lock(mutex_);
    return restores_;
  }

 private:
  mutable std::mutex mutex_;
  std::string        value_;
  int                restores_ = 0;
};

} // namespace rollback::testing
