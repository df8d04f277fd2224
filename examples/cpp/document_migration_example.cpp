#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/atomic_operation.hpp"
#include "internal/model/migration.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_provider.hpp"

using namespace rollback;

/*
  Key/value document guarded by the engine. Snapshots serialize it as
  one "key=value" line per field.
*/
class Document final : public state::StateProvider {
 public:
  std::optional<std::string> Get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto            it = fields_.find(key);
    if (it == fields_.end()) return std::nullopt;
    return it->second;
  }

  void Set(const std::string& key, std::optional<std::string> value) {
    std::lock_guard lock(mutex_);
    if (value) {
      fields_[key] = *value;
    } else {
      fields_.erase(key);
    }
  }

  std::string Collect(model::SnapshotType) override {
    std::lock_guard    lock(mutex_);
    std::ostringstream out;
    for (const auto& [key, value] : fields_) out << key << "=" << value << "\n";
    return out.str();
  }

  void Apply(const std::string& data) override {
    std::map<std::string, std::string> restored;
    std::istringstream                 in(data);
    std::string                        line;
    while (std::getline(in, line)) {
      auto eq = line.find('=');
      if (eq == std::string::npos) continue;
      restored[line.substr(0, eq)] = line.substr(eq + 1);
    }
    std::lock_guard lock(mutex_);
    fields_.swap(restored);
  }

  void Print(const std::string& label) {
    std::cout << label << ":\n" << Collect(model::SnapshotType::kFull);
  }

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> fields_;
};

// Writes one field and remembers the previous value for undo.
class SetFieldOperation final : public model::AtomicOperation {
 public:
  SetFieldOperation(std::shared_ptr<Document> document, std::string key, std::string value, bool fail = false)
      : model::AtomicOperation({"set_" + key, "Set " + key, "", {}, std::chrono::milliseconds(2000), 0, 0}),
        document_(std::move(document)),
        key_(std::move(key)),
        value_(std::move(value)),
        fail_(fail) {
  }

  model::OperationOutput Execute(const model::TransactionContext&) override {
    previous_ = document_->Get(key_);
    applied_  = true;
    if (fail_) throw std::runtime_error("simulated failure writing " + key_);
    document_->Set(key_, value_);
    return value_;
  }

  void Rollback(const model::TransactionContext&) override {
    if (!applied_) return;
    document_->Set(key_, previous_);
    applied_ = false;
  }

  model::ValidationResult Validate(const model::TransactionContext&) override {
    if (key_.empty()) return model::ValidationResult::Invalid("field name must not be empty");
    return model::ValidationResult::Valid();
  }

 private:
  std::shared_ptr<Document>  document_;
  std::string                key_;
  std::string                value_;
  bool                       fail_;
  std::optional<std::string> previous_;
  bool                       applied_ = false;
};

int main() {
  auto config = config::ConfigLoader::LoadFromYamlString(R"(
logging:
  level: info
engine:
  max_history_entries: 100
  affected_services: [documents]
)");
  observability::InitializeTracing(config);
  observability::InitializeLogging(config);

  auto document = std::make_shared<Document>();
  document->Set("schema", std::string("1"));
  document->Set("title", std::string("Ground floor duct layout"));

  auto engine = factory::Build(config, document);
  document->Print("Before migration");

  model::MigrationStep add_units;
  add_units.id         = "add_units";
  add_units.name       = "Add unit system";
  add_units.phase      = "v2";
  add_units.operations = {std::make_shared<SetFieldOperation>(document, "units", "metric"),
                          std::make_shared<SetFieldOperation>(document, "schema", "2")};

  model::MigrationStep add_owner;
  add_owner.id                = "add_owner";
  add_owner.name              = "Add owner";
  add_owner.phase             = "v2";
  add_owner.prerequisites     = {"add_units"};
  add_owner.rollback_strategy = model::StepRollbackStrategy::kPhase;
  add_owner.operations        = {std::make_shared<SetFieldOperation>(document, "owner", "hvac-team", true)};

  model::TransactionOptions options;
  options.user_id = "example-user";

  auto result = engine.transaction_manager->ExecuteMigration({add_units, add_owner}, options);

  std::cout << "Migration " << result.migration_id << " success=" << std::boolalpha << result.success << "\n";
  if (result.failed_step) std::cout << "Failed step: " << *result.failed_step << "\n";
  if (result.error) std::cout << "Error: " << *result.error << "\n";
  std::cout << "Completed steps after rollback: " << result.completed_steps.size() << "\n";

  document->Print("After migration");

  for (const auto& entry : engine.transaction_manager->GetTransactionHistory()) {
    std::cout << entry.transaction_id << " " << model::ToString(entry.status) << "\n";
  }

  observability::ShutdownLogging();
  observability::ShutdownTracing();
  return 0;
}
