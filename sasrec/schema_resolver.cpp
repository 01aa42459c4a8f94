#include "schema_resolver.hpp"
#include "sas_schemas.hpp"
#include "sasrec.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace sasrec {

embedded_schema_resolver::embedded_schema_resolver()
{
  documents[record_schema_filename]              = json::parse(sas_implementation_record_schema_json);
  documents[contact_information_schema_filename] = json::parse(contact_information_schema_json);
  documents[fcc_information_schema_filename]     = json::parse(fcc_information_schema_json);
}

void embedded_schema_resolver::add(std::string_view reference, json schema)
{
  documents[schema_reference_name(reference)] = std::move(schema);
}

std::expected<json, std::error_code> embedded_schema_resolver::resolve(std::string_view reference) const
{
  const auto name = schema_reference_name(reference);
  if (auto it = documents.find(name); it != documents.end())
    return it->second;

  spdlog::error("No built-in schema named '{}'", name);
  return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
}

directory_schema_resolver::directory_schema_resolver(path schema_directory) : schema_directory(std::move(schema_directory))
{
}

std::expected<json, std::error_code> directory_schema_resolver::resolve(std::string_view reference) const
{
  const auto name = schema_reference_name(reference);
  if (name.empty())
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));

  const auto schema_path = schema_directory / name;
  spdlog::info("Loading schema '{}'", schema_path.generic_string());
  return load_document(schema_path);
}

} // namespace sasrec
