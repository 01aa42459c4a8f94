#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace sasrec {

enum class violation_kind {
  missing_required_field,
  unexpected_field,
  type_mismatch,
  pattern_violation,
  format_violation,
  nested_schema_violation,
};

std::string_view to_string(violation_kind kind);

struct violation {
  violation_kind kind;
  std::string field; // Top-level field name, empty when the record itself is at fault
  std::string path;  // JSON pointer to the offending value
  std::string message;
};

struct validation_result {
  std::vector<violation> violations;
  std::optional<std::string> engine_failure; // Set when the schema engine aborted the check

  [[nodiscard]] bool valid() const noexcept
  {
    return violations.empty() && !engine_failure;
  }
  explicit operator bool() const noexcept
  {
    return valid();
  }

  [[nodiscard]] bool has(violation_kind kind, std::string_view field) const;
};

void to_json(nlohmann::json &j, const violation &v);
void to_json(nlohmann::json &j, const validation_result &result);

} // namespace sasrec
