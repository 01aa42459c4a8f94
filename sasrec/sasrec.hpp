#pragma once

#include <cstddef>
#include <string>

namespace sasrec {
const std::string record_schema_filename              = "SasImplementationRecord.schema.json";
const std::string contact_information_schema_filename = "ContactInformation.schema.json";
const std::string fcc_information_schema_filename     = "FccInformation.schema.json";
const std::string schema_reference_prefix             = "file:";
const std::string default_config_filename             = "sasrec.yaml";
const std::string default_log_filename                = "sasrec.log";

// Longest id matched against the id pattern
constexpr size_t max_id_length = 256;

// Process exit codes of the command line tool
enum sasrec_status {
  SUCCESS = 0,
  FAIL,
  INVALID_RECORD,
};

} // namespace sasrec
