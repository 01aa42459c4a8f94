#pragma once

#include "record_validator.hpp"
#include "spdlog/spdlog.h"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace sasrec {

struct configuration {
  std::optional<std::filesystem::path> schema_directory;
  report_mode report          = report_mode::all;
  std::filesystem::path log_file;
  spdlog::level::level_enum log_level = spdlog::level::trace;

  configuration();

  // A missing file is only an error when required is set
  [[nodiscard]] std::expected<void, std::error_code> load(const std::filesystem::path &config_file_path, bool required = false);
  [[nodiscard]] std::expected<void, std::error_code> load_string(const std::string &yaml_text);
};

} // namespace sasrec
