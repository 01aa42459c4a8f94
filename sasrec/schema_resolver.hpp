#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace sasrec {

using json = nlohmann::json;
using std::filesystem::path;

/**
 * @brief Resolves the name of a referenced schema document ("ContactInformation.schema.json")
 *        to the parsed document. Supplied to record_validator::create so sub-schemas can be
 *        swapped without touching the record schema.
 */
class schema_resolver {
public:
  virtual ~schema_resolver() = default;

  [[nodiscard]] virtual std::expected<json, std::error_code> resolve(std::string_view reference) const = 0;
};

// Serves the built-in schema documents. Entries added with add() take precedence.
class embedded_schema_resolver : public schema_resolver {
public:
  embedded_schema_resolver();

  void add(std::string_view reference, json schema);
  [[nodiscard]] std::expected<json, std::error_code> resolve(std::string_view reference) const override;

private:
  std::map<std::string, json, std::less<>> documents;
};

// Reads schema documents from a directory on disk
class directory_schema_resolver : public schema_resolver {
public:
  explicit directory_schema_resolver(path schema_directory);

  [[nodiscard]] std::expected<json, std::error_code> resolve(std::string_view reference) const override;

private:
  path schema_directory;
};

} // namespace sasrec
