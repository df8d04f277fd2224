#pragma once

#include <string>
#include <utility>
#include <vector>

namespace rollback::model {

struct ValidationResult {
  bool                     is_valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  static ValidationResult Valid() {
    return {};
  }

  static ValidationResult Invalid(std::string error) {
    ValidationResult result;
    result.is_valid = false;
    result.errors.push_back(std::move(error));
    return result;
  }

  // Folds another result in; validity is the conjunction.
  void Merge(const ValidationResult& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    is_valid = is_valid && other.is_valid && errors.empty();
  }

  std::string JoinedErrors() const {
    std::string joined;
    for (const auto& error : errors) {
      if (!joined.empty()) joined += ", ";
      joined += error;
    }
    return joined;
  }
};

} // namespace rollback::model
