#include "configuration.hpp"
#include "sasrec.hpp"
#include "yaml-cpp/yaml.h"

namespace sasrec {

static std::expected<void, std::error_code> apply_configuration(configuration &config, const YAML::Node &node)
{
  if (!node || node.IsNull())
    return {};
  if (!node.IsMap()) {
    spdlog::error("Configuration must be a map");
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  if (node["schema_directory"])
    config.schema_directory = node["schema_directory"].as<std::string>();

  if (node["report"]) {
    const auto report = node["report"].as<std::string>();
    if (report == "first")
      config.report = report_mode::first;
    else if (report == "all")
      config.report = report_mode::all;
    else {
      spdlog::error("Unknown report mode '{}'. Use 'first' or 'all'", report);
      return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
  }

  if (node["log_file"])
    config.log_file = node["log_file"].as<std::string>();

  if (node["log_level"]) {
    const auto level_name = node["log_level"].as<std::string>();
    const auto level      = spdlog::level::from_str(level_name);
    // from_str() maps unknown names to 'off'
    if (level == spdlog::level::off && level_name != "off") {
      spdlog::error("Unknown log level '{}'", level_name);
      return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    config.log_level = level;
  }

  return {};
}

configuration::configuration() : log_file(default_log_filename)
{
}

std::expected<void, std::error_code> configuration::load(const std::filesystem::path &config_file_path, bool required)
{
  std::error_code ec;
  if (!std::filesystem::exists(config_file_path, ec)) {
    if (!required)
      return {};
    spdlog::error("Configuration file '{}' not found", config_file_path.generic_string());
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  try {
    return apply_configuration(*this, YAML::LoadFile(config_file_path.string()));
  } catch (const YAML::Exception &e) {
    spdlog::error("Failed to load configuration '{}': {}", config_file_path.generic_string(), e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
}

std::expected<void, std::error_code> configuration::load_string(const std::string &yaml_text)
{
  try {
    return apply_configuration(*this, YAML::Load(yaml_text));
  } catch (const YAML::Exception &e) {
    spdlog::error("Failed to parse configuration: {}", e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
}

} // namespace sasrec
