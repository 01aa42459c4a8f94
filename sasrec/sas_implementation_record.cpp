#include "sas_implementation_record.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace sasrec {

void to_json(nlohmann::json &j, const sas_implementation_record &record)
{
  j = {
    { "id", record.id },
    { "name", record.name },
    { "administratorId", record.administrator_id },
    { "contactInformation", record.contact_information },
    { "publicKey", record.public_key },
    { "fccInformation", record.fcc_information },
    { "url", record.url },
  };
}

void from_json(const nlohmann::json &j, sas_implementation_record &record)
{
  j.at("id").get_to(record.id);
  j.at("name").get_to(record.name);
  j.at("administratorId").get_to(record.administrator_id);
  j.at("contactInformation").get_to(record.contact_information);
  j.at("publicKey").get_to(record.public_key);
  record.fcc_information = j.at("fccInformation");
  j.at("url").get_to(record.url);
}

std::expected<sas_implementation_record, std::error_code> sas_implementation_record::parse_file(const std::filesystem::path &file_path)
{
  auto document = load_document(file_path);
  if (!document)
    return std::unexpected(document.error());

  try {
    return document->get<sas_implementation_record>();
  } catch (const nlohmann::json::exception &e) {
    spdlog::error("'{}' is not a SAS Implementation Record: {}", file_path.generic_string(), e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
}

sas_implementation_record sas_implementation_record::example()
{
  sas_implementation_record record;
  record.id               = "sas1/sas2/region1";
  record.name             = "Example SAS";
  record.administrator_id = "admin-42";
  record.contact_information.push_back({
    { "contactType", "TECHNICAL" },
    { "name", "SAS Operations" },
    { "email", "operations@example.org" },
    { "phoneNumber", "+1 555 0100" },
  });
  record.public_key      = "-----BEGIN PUBLIC KEY-----\n"
                           "MFkwEwYHKoZIzj0CAQYIKoZIzj0DAQcDQgAEexampleexampleexampleexampleexa\n"
                           "mpleexampleexampleexampleexampleexampleexampleexampleexampleexample==\n"
                           "-----END PUBLIC KEY-----\n";
  record.fcc_information = {
    { "fccRegistrationNumber", "0012345678" },
    { "fccCertificationId", "SAS-EXAMPLE-001" },
    { "certificationDate", "2018-06-01" },
  };
  record.url = "https://example.org/sas";
  return record;
}

} // namespace sasrec
