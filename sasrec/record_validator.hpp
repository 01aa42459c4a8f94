#pragma once

#include "schema_resolver.hpp"
#include "violation.hpp"
#include <nlohmann/json-schema.hpp>
#include <expected>
#include <memory>
#include <set>
#include <string>
#include <string_view>

namespace sasrec {

enum class report_mode { first, all };

// Format checker handed to the schema engine. Adds "uri" to the formats the engine knows.
void sas_string_format_check(const std::string &format, const std::string &value);
bool is_valid_uri(std::string_view value);

/**
 * @brief Compiled SAS Implementation Record schema.
 *
 * Instances are only handed out through create() as shared pointers to const. The schema
 * tree, including every referenced sub-schema, is resolved and compiled once during create()
 * and never changes afterwards, so one instance can serve any number of threads.
 */
class record_validator {
public:
  using pointer = std::shared_ptr<const record_validator>;

  // Loads the record schema itself through the resolver
  [[nodiscard]] static std::expected<pointer, std::error_code> create(std::shared_ptr<const schema_resolver> resolver);
  [[nodiscard]] static std::expected<pointer, std::error_code> create(std::shared_ptr<const schema_resolver> resolver, const json &root_schema);

  record_validator(const record_validator &)            = delete;
  record_validator &operator=(const record_validator &) = delete;

  [[nodiscard]] validation_result validate(const json &record, report_mode mode = report_mode::all) const;

  [[nodiscard]] const json &get_schema() const noexcept
  {
    return schema;
  }

private:
  record_validator(std::shared_ptr<const schema_resolver> resolver, const json &root_schema);

  std::shared_ptr<const schema_resolver> resolver;
  json schema;
  std::set<std::string, std::less<>> nested_fields;
  nlohmann::json_schema::json_validator validator;
};

} // namespace sasrec
