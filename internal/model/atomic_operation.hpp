#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/transaction_context.hpp"
#include "internal/model/validation_result.hpp"

namespace rollback::model {

/*
  Static description of an operation.

  dependencies, timeout, retry_count and priority are informational: the
  engine never reorders operations, never enforces the timeout and never
  retries. timeout feeds rollback-duration estimates only.
*/
struct OperationDescriptor {
  std::string               id;
  std::string               name;
  std::string               description;
  std::vector<std::string>  dependencies;
  std::chrono::milliseconds timeout{30000};
  std::uint32_t             retry_count = 0;
  std::int32_t              priority    = 0;
};

// Opaque value produced by a successful Execute.
using OperationOutput = std::string;

/*
  Caller-supplied unit of reversible work.

  Rollback must tolerate being called after a partial or missing Execute
  and must not throw when there is nothing to undo.
*/
class AtomicOperation {
 public:
  explicit AtomicOperation(OperationDescriptor descriptor) : descriptor_(std::move(descriptor)) {
  }
  virtual ~AtomicOperation() = default;

  AtomicOperation(const AtomicOperation&)            = delete;
  AtomicOperation& operator=(const AtomicOperation&) = delete;

  const OperationDescriptor& Descriptor() const {
    return descriptor_;
  }
  const std::string& Id() const {
    return descriptor_.id;
  }
  const std::string& Name() const {
    return descriptor_.name;
  }

  virtual OperationOutput  Execute(const TransactionContext& ctx)  = 0;
  virtual void             Rollback(const TransactionContext& ctx) = 0;
  virtual ValidationResult Validate(const TransactionContext& ctx) = 0;

 private:
  OperationDescriptor descriptor_;
};

using OperationPtr = std::shared_ptr<AtomicOperation>;

} // namespace rollback::model
