#include "sasrec.hpp"
#include "configuration.hpp"
#include "record_validator.hpp"
#include "sas_implementation_record.hpp"
#include "schema_resolver.hpp"
#include "utilities.hpp"
#include "cxxopts.hpp"
#include "semver.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>
#include <iostream>
#include <vector>

static const semver::version sasrec_version{ 1, 0, 0 };

struct file_result {
  fs::path file;
  std::expected<sasrec::validation_result, std::error_code> outcome;
};

static std::vector<file_result> validate_files(const sasrec::record_validator &validator, const std::vector<std::string> &files, sasrec::report_mode mode);
static int report_results(const std::vector<file_result> &results, bool json_output);

int main(int argc, char **argv)
{
  // Setup logging
  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("sasrec", console_error));

  cxxopts::Options options("sasrec", "SAS Implementation Record validator. Ver " + sasrec_version.to_string());
  options.positional_help("<validate|schema|example> [files]");
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("version", "Print version")
                       ("c,config", "Configuration file", cxxopts::value<std::string>())
                       ("s,schema-dir", "Load schemas from this directory instead of the built-in copies", cxxopts::value<std::string>())
                       ("f,first", "Report only the first violation of each record", cxxopts::value<bool>()->default_value("false"))
                       ("j,json", "Print a JSON report", cxxopts::value<bool>()->default_value("false"))
                       ("v,verbose", "Print debug output", cxxopts::value<bool>()->default_value("false"))
                       ("action", "Select from 'validate', 'schema' or 'example'", cxxopts::value<std::string>())
                       ("files", "Record files", cxxopts::value<std::vector<std::string>>());
  // clang-format on
  options.parse_positional({ "action", "files" });

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return sasrec::FAIL;
  }

  if (result.count("version")) {
    std::cout << sasrec_version.to_string() << "\n";
    return sasrec::SUCCESS;
  }
  if (result.count("help") || !result.count("action")) {
    std::cout << options.help() << std::endl;
    return sasrec::SUCCESS;
  }

  // Load configuration. Command line options take precedence
  sasrec::configuration config;
  const bool explicit_config = result.count("config") > 0;
  const fs::path config_path = explicit_config ? fs::path{ result["config"].as<std::string>() } : fs::path{ sasrec::default_config_filename };
  if (auto loaded = config.load(config_path, explicit_config); !loaded) {
    spdlog::error("Cannot use configuration '{}': {}", config_path.generic_string(), loaded.error().message());
    return sasrec::FAIL;
  }
  if (result.count("schema-dir"))
    config.schema_directory = result["schema-dir"].as<std::string>();
  if (result["first"].as<bool>())
    config.report = sasrec::report_mode::first;
  if (result["verbose"].as<bool>())
    console_error->set_level(spdlog::level::debug);

  try {
    auto file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file.string(), true);
    file_log->set_level(config.log_level);
    auto sasrec_log = std::make_shared<spdlog::logger>("sasrec", spdlog::sinks_init_list{ console_error, file_log });
    sasrec_log->set_level(spdlog::level::trace);
    spdlog::set_default_logger(sasrec_log);
  } catch (const spdlog::spdlog_ex &e) {
    spdlog::warn("Cannot open log file '{}': {}", config.log_file.generic_string(), e.what());
  }

  const auto action = result["action"].as<std::string>();
  if (action == "example") {
    const nlohmann::json example = sasrec::sas_implementation_record::example();
    if (!result.count("files")) {
      std::cout << example.dump(2) << "\n";
      return sasrec::SUCCESS;
    }
    const auto target = result["files"].as<std::vector<std::string>>().front();
    if (auto saved = sasrec::save_document(target, example); !saved) {
      spdlog::error("Failed to write '{}': {}", target, saved.error().message());
      return sasrec::FAIL;
    }
    std::cout << "Wrote " << target << "\n";
    return sasrec::SUCCESS;
  }

  if (action != "validate" && action != "schema") {
    spdlog::error("Unknown action '{}'", action);
    std::cout << options.help() << std::endl;
    return sasrec::FAIL;
  }

  std::shared_ptr<const sasrec::schema_resolver> resolver;
  if (config.schema_directory) {
    spdlog::info("Using schemas from '{}'", config.schema_directory->generic_string());
    resolver = std::make_shared<sasrec::directory_schema_resolver>(*config.schema_directory);
  } else {
    resolver = std::make_shared<sasrec::embedded_schema_resolver>();
  }

  auto validator = sasrec::record_validator::create(resolver);
  if (!validator) {
    spdlog::error("Failed to load the SAS Implementation Record schema: {}", validator.error().message());
    return sasrec::FAIL;
  }

  if (action == "schema") {
    std::cout << validator.value()->get_schema().dump(2) << "\n";
    return sasrec::SUCCESS;
  }

  if (!result.count("files")) {
    spdlog::error("Must provide at least one record file");
    return sasrec::FAIL;
  }

  const auto files   = result["files"].as<std::vector<std::string>>();
  const auto results = validate_files(*validator.value(), files, config.report);
  return report_results(results, result["json"].as<bool>());
}

static std::vector<file_result> validate_files(const sasrec::record_validator &validator, const std::vector<std::string> &files, sasrec::report_mode mode)
{
  std::vector<file_result> results(files.size());

  // Each task writes only its own slot. The validator is shared read-only
  tf::Executor executor;
  tf::Taskflow taskflow;
  taskflow.for_each_index(size_t{ 0 }, files.size(), size_t{ 1 }, [&](size_t i) {
    results[i].file = files[i];
    auto document   = sasrec::load_document(results[i].file);
    if (!document) {
      results[i].outcome = std::unexpected(document.error());
      return;
    }
    results[i].outcome = validator.validate(document.value(), mode);
  });
  executor.run(taskflow).wait();

  return results;
}

static int report_results(const std::vector<file_result> &results, bool json_output)
{
  int status = sasrec::SUCCESS;
  auto report = nlohmann::json::array();

  for (const auto &r: results) {
    if (!r.outcome) {
      status = sasrec::FAIL;
      spdlog::error("Cannot read '{}': {}", r.file.generic_string(), r.outcome.error().message());
      report.push_back({ { "file", r.file.generic_string() }, { "error", r.outcome.error().message() } });
      continue;
    }

    const auto &validation = r.outcome.value();
    if (validation.engine_failure)
      status = sasrec::FAIL;
    else if (!validation && status == sasrec::SUCCESS)
      status = sasrec::INVALID_RECORD;

    if (json_output) {
      nlohmann::json entry = validation;
      entry["file"]        = r.file.generic_string();
      report.push_back(entry);
      continue;
    }

    std::cout << (validation ? "OK   " : "FAIL ") << r.file.generic_string() << "\n";
    for (const auto &v: validation.violations)
      std::cout << "  " << sasrec::to_string(v.kind) << " " << v.path << ": " << v.message << "\n";
    if (validation.engine_failure)
      std::cout << "  Error: " << validation.engine_failure.value() << "\n";
  }

  if (json_output)
    std::cout << report.dump(2) << "\n";
  return status;
}
