#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace sasrec {

/**
 * @brief In-memory form of a SAS Implementation Record.
 *
 * Contact and FCC information are kept as JSON objects; their shape is owned by the
 * referenced schemas, not by this type.
 */
struct sas_implementation_record {
  std::string id;
  std::string name;
  std::string administrator_id;
  std::vector<nlohmann::json> contact_information;
  std::string public_key;
  nlohmann::json fcc_information = nlohmann::json::object();
  std::string url;

  static std::expected<sas_implementation_record, std::error_code> parse_file(const std::filesystem::path &file_path);

  // A record that satisfies the built-in schemas
  static sas_implementation_record example();
};

void to_json(nlohmann::json &j, const sas_implementation_record &record);
void from_json(const nlohmann::json &j, sas_implementation_record &record);

} // namespace sasrec
