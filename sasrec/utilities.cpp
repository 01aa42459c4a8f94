#include "utilities.hpp"
#include "sasrec.hpp"
#include "spdlog/spdlog.h"
#include <fstream>
#include <system_error>

namespace sasrec {

nlohmann::json yaml_to_json(const YAML::Node &node)
{
  switch (node.Type()) {
    case YAML::NodeType::Sequence: {
      auto array = nlohmann::json::array();
      for (const auto &item: node)
        array.push_back(yaml_to_json(item));
      return array;
    }
    case YAML::NodeType::Map: {
      auto object = nlohmann::json::object();
      for (const auto &item: node)
        object[item.first.as<std::string>()] = yaml_to_json(item.second);
      return object;
    }
    case YAML::NodeType::Scalar: {
      // Quoted scalars carry the non-specific "!" tag and are always strings
      if (node.Tag() == "!")
        return node.Scalar();

      bool bool_value;
      if (YAML::convert<bool>::decode(node, bool_value))
        return bool_value;
      long long int_value;
      if (YAML::convert<long long>::decode(node, int_value))
        return int_value;
      double double_value;
      if (YAML::convert<double>::decode(node, double_value))
        return double_value;
      return node.Scalar();
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
      return nullptr;
  }
}

std::expected<nlohmann::json, std::error_code> load_document(const fs::path &file_path)
{
  std::error_code ec;
  if (!fs::exists(file_path, ec)) {
    spdlog::error("File not found: '{}'", file_path.generic_string());
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  const auto extension = file_path.extension().string();
  try {
    if (extension == ".yaml" || extension == ".yml")
      return yaml_to_json(YAML::LoadFile(file_path.string()));

    std::ifstream ifs(file_path);
    if (!ifs.good())
      return std::unexpected(std::make_error_code(std::errc::io_error));
    return nlohmann::json::parse(ifs);
  } catch (const YAML::Exception &e) {
    spdlog::error("Failed to parse YAML '{}': {}", file_path.generic_string(), e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  } catch (const nlohmann::json::exception &e) {
    spdlog::error("Failed to parse JSON '{}': {}", file_path.generic_string(), e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
}

std::expected<void, std::error_code> save_document(const fs::path &file_path, const nlohmann::json &document)
{
  std::ofstream ofs(file_path);
  if (!ofs.good()) {
    spdlog::error("Cannot open '{}' for writing", file_path.generic_string());
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }
  ofs << document.dump(2) << "\n";
  if (!ofs.good())
    return std::unexpected(std::make_error_code(std::errc::io_error));
  return {};
}

/**
 * @brief Reduces a schema reference such as "file:ContactInformation.schema.json",
 *        "file:///schemas/ContactInformation.schema.json#/definitions/x" or the
 *        location "/file:ContactInformation.schema.json" to the bare file name.
 */
std::string schema_reference_name(std::string_view reference)
{
  auto name = std::string{ reference.substr(0, reference.find('#')) };

  const auto last_slash = name.rfind('/');
  if (last_slash != std::string::npos)
    name = name.substr(last_slash + 1);

  if (name.starts_with(schema_reference_prefix))
    name = name.substr(schema_reference_prefix.size());

  return name;
}

std::string json_pointer_head(const nlohmann::json::json_pointer &pointer)
{
  const auto text = pointer.to_string();
  if (text.empty())
    return {};

  auto token = text.substr(1, text.find('/', 1) - 1);
  // Unescape in the order mandated by RFC 6901
  for (auto pos = token.find("~1"); pos != std::string::npos; pos = token.find("~1", pos + 1))
    token.replace(pos, 2, "/");
  for (auto pos = token.find("~0"); pos != std::string::npos; pos = token.find("~0", pos + 1))
    token.replace(pos, 2, "~");
  return token;
}

} // namespace sasrec
