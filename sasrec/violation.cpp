#include "violation.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace sasrec {

static constexpr std::array<std::pair<violation_kind, std::string_view>, 6> violation_names = { {
  { violation_kind::missing_required_field, "MissingRequiredField" },
  { violation_kind::unexpected_field, "UnexpectedField" },
  { violation_kind::type_mismatch, "TypeMismatch" },
  { violation_kind::pattern_violation, "PatternViolation" },
  { violation_kind::format_violation, "FormatViolation" },
  { violation_kind::nested_schema_violation, "NestedSchemaViolation" },
} };

std::string_view to_string(violation_kind kind)
{
  for (const auto &[k, name]: violation_names)
    if (k == kind)
      return name;
  return "Unknown";
}

bool validation_result::has(violation_kind kind, std::string_view field) const
{
  return std::ranges::any_of(violations, [&](const auto &v) {
    return v.kind == kind && v.field == field;
  });
}

void to_json(nlohmann::json &j, const violation &v)
{
  j = { { "rule", std::string{ to_string(v.kind) } }, { "field", v.field }, { "path", v.path }, { "message", v.message } };
}

void to_json(nlohmann::json &j, const validation_result &result)
{
  j = { { "valid", result.valid() }, { "violations", result.violations } };
  if (result.engine_failure)
    j["error"] = result.engine_failure.value();
}

} // namespace sasrec
