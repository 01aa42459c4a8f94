#pragma once

#include "yaml-cpp/yaml.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <filesystem>

namespace fs = std::filesystem;

namespace sasrec {
nlohmann::json yaml_to_json(const YAML::Node &node);
std::expected<nlohmann::json, std::error_code> load_document(const fs::path &file_path);
std::expected<void, std::error_code> save_document(const fs::path &file_path, const nlohmann::json &document);
std::string schema_reference_name(std::string_view reference);
std::string json_pointer_head(const nlohmann::json::json_pointer &pointer);
} // namespace sasrec
