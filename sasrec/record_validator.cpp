#include "record_validator.hpp"
#include "sasrec.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace sasrec {

static const std::string required_prefix   = "required property '";
static const std::string required_suffix   = "' not found in object";
static const std::string additional_prefix = "validation failed for additional property '";

static bool is_uri_character(unsigned char c)
{
  static const std::string_view allowed = "-._~:/?#[]@!$&'()*+,;=";
  return std::isalnum(c) || allowed.find(static_cast<char>(c)) != std::string_view::npos;
}

// RFC 3986 absolute URI: scheme ":" followed by URI characters or percent escapes
bool is_valid_uri(std::string_view value)
{
  const auto colon = value.find(':');
  if (colon == std::string_view::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(value[0])))
    return false;

  for (size_t i = 1; i < colon; ++i) {
    const auto c = static_cast<unsigned char>(value[i]);
    if (!std::isalnum(c) && c != '+' && c != '.' && c != '-')
      return false;
  }

  for (size_t i = colon + 1; i < value.size(); ++i) {
    const auto c = static_cast<unsigned char>(value[i]);
    if (c == '%') {
      if (i + 2 >= value.size() || !std::isxdigit(static_cast<unsigned char>(value[i + 1])) || !std::isxdigit(static_cast<unsigned char>(value[i + 2])))
        return false;
      i += 2;
    } else if (!is_uri_character(c)) {
      return false;
    }
  }
  return true;
}

void sas_string_format_check(const std::string &format, const std::string &value)
{
  if (format == "uri") {
    if (!is_valid_uri(value))
      throw std::invalid_argument("value is not a valid URI");
    return;
  }
  nlohmann::json_schema::default_string_format_check(format, value);
}

// The name quoted in "required property '<name>' not found in object"
static std::string required_name(const std::string &message)
{
  if (!message.starts_with(required_prefix) || !message.ends_with(required_suffix))
    return {};
  return message.substr(required_prefix.size(), message.size() - required_prefix.size() - required_suffix.size());
}

// Picks the undeclared key of the instance that the additional-property message names.
// Keys may contain quotes, so the longest key followed by the closing "': " wins.
static std::string additional_name(const std::string &message, const nlohmann::json &instance, const nlohmann::json &properties)
{
  std::string name;
  if (!instance.is_object() || !message.starts_with(additional_prefix))
    return name;

  for (const auto &[key, value]: instance.items()) {
    if (properties.is_object() && properties.contains(key))
      continue;
    if (key.size() >= name.size() && message.compare(additional_prefix.size(), key.size() + 3, key + "': ") == 0)
      name = key;
  }
  return name;
}

namespace {
class violation_collector : public nlohmann::json_schema::basic_error_handler {
public:
  violation_collector(const nlohmann::json &properties, const std::set<std::string, std::less<>> &nested_fields, report_mode mode)
      : properties(properties),
        nested_fields(nested_fields),
        mode(mode)
  {
  }

  void error(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance, const std::string &message) override
  {
    nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
    if (mode == report_mode::first && !result.violations.empty())
      return;

    auto v = classify(ptr, instance, message);
    spdlog::debug("{} at '{}': {}", to_string(v.kind), v.path, v.message);
    result.violations.push_back(std::move(v));
  }

  validation_result result;

private:
  violation classify(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance, const std::string &message) const
  {
    const auto path  = ptr.to_string();
    const auto field = json_pointer_head(ptr);
    const auto depth = std::ranges::count(path, '/');

    // Errors reported against the record object itself
    if (depth == 0) {
      if (message.starts_with(required_prefix)) {
        const auto name = required_name(message);
        return { violation_kind::missing_required_field, name, (ptr / name).to_string(), message };
      }
      if (message.starts_with(additional_prefix)) {
        const auto name = additional_name(message, instance, properties);
        return { violation_kind::unexpected_field, name, (ptr / name).to_string(), message };
      }
      return { violation_kind::type_mismatch, {}, path, message };
    }

    if (depth == 1) {
      if (message == "unexpected instance type")
        return { violation_kind::type_mismatch, field, path, message };
      if (nested_fields.contains(field))
        return { violation_kind::nested_schema_violation, field, path, message };
      if (message.starts_with("instance does not match regex pattern"))
        return { violation_kind::pattern_violation, field, path, message };
      if (message.starts_with("format-checking failed"))
        return { violation_kind::format_violation, field, path, message };
      return { violation_kind::type_mismatch, field, path, message };
    }

    return { violation_kind::nested_schema_violation, field, path, message };
  }

  const nlohmann::json &properties;
  const std::set<std::string, std::less<>> &nested_fields;
  report_mode mode;
};
} // namespace

record_validator::record_validator(std::shared_ptr<const schema_resolver> resolver, const json &root_schema)
    : resolver(std::move(resolver)),
      schema(root_schema),
      validator(
        [this](const nlohmann::json_uri &uri, nlohmann::json &loaded_schema) {
          const auto name = schema_reference_name(uri.path());
          auto document   = this->resolver->resolve(name);
          if (!document)
            throw std::system_error(document.error(), "Cannot resolve schema reference '" + name + "'");
          loaded_schema = std::move(document.value());
        },
        sas_string_format_check)
{
  // Top-level properties whose values are checked by a referenced schema
  if (schema.contains("properties") && schema["properties"].is_object()) {
    for (const auto &[key, value]: schema["properties"].items()) {
      if (!value.is_object())
        continue;
      if (value.contains("$ref") || (value.contains("items") && value["items"].is_object() && value["items"].contains("$ref")))
        nested_fields.insert(key);
    }
  }
}

std::expected<record_validator::pointer, std::error_code> record_validator::create(std::shared_ptr<const schema_resolver> resolver)
{
  if (!resolver)
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));

  auto root_schema = resolver->resolve(record_schema_filename);
  if (!root_schema)
    return std::unexpected(root_schema.error());
  return create(std::move(resolver), root_schema.value());
}

std::expected<record_validator::pointer, std::error_code> record_validator::create(std::shared_ptr<const schema_resolver> resolver, const json &root_schema)
{
  if (!resolver || !root_schema.is_object())
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));

  std::shared_ptr<record_validator> instance(new record_validator(std::move(resolver), root_schema));
  try {
    instance->validator.set_root_schema(instance->schema);
  } catch (const std::system_error &e) {
    spdlog::error("Failed to load schema: {}", e.what());
    return std::unexpected(e.code());
  } catch (const std::exception &e) {
    spdlog::error("Invalid schema: {}", e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  spdlog::info("SAS Implementation Record schema loaded");
  return instance;
}

validation_result record_validator::validate(const json &record, report_mode mode) const
{
  static const json no_properties = json::object();
  const auto &properties          = schema.contains("properties") ? schema["properties"] : no_properties;
  violation_collector collector(properties, nested_fields, mode);

  // Over-long ids are reported here and replaced by a conforming placeholder.
  // The engine's backtracking regex search on the id pattern exhausts the stack on such input.
  const json *checked = &record;
  json guarded;
  if (record.is_object() && record.contains("id") && record["id"].is_string() && record["id"].get_ref<const std::string &>().size() > max_id_length) {
    collector.result.violations.push_back({ violation_kind::pattern_violation, "id", "/id", fmt::format("id is longer than {} characters and is not matched against the pattern", max_id_length) });
    spdlog::debug("{} at '/id': id of {} characters rejected before schema validation", to_string(violation_kind::pattern_violation), record["id"].get_ref<const std::string &>().size());
    if (mode == report_mode::first)
      return std::move(collector.result);
    guarded       = record;
    guarded["id"] = "a/b/c";
    checked       = &guarded;
  }

  try {
    auto patch = validator.validate(*checked, collector);
  } catch (const std::exception &e) {
    // The engine only throws for schema defects it could not detect while compiling
    spdlog::error("Schema engine failure: {}", e.what());
    collector.result.engine_failure = e.what();
  }
  return std::move(collector.result);
}

} // namespace sasrec
