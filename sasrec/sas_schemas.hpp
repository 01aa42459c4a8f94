#pragma once

#include <string>

namespace sasrec {

// Built-in copies of the documents under schemas/. Keep both in sync.
// clang-format off
const std::string sas_implementation_record_schema_json = R"json(
{
  "$schema": "http://json-schema.org/draft-04/schema#",
  "description": "SAS Implementation Record exchanged between SAS peers",
  "type": "object",
  "required": [
    "id",
    "name",
    "administratorId",
    "contactInformation",
    "publicKey",
    "fccInformation",
    "url"
  ],
  "additionalProperties": false,
  "properties": {
    "id": {
      "description": "Record identifier of the form <class>/<administrator>/<implementation>",
      "type": "string",
      "pattern": "((.+?)/(.+?)/(.+?)+)"
    },
    "name": {
      "description": "Name of the SAS implementation",
      "type": "string"
    },
    "administratorId": {
      "description": "Identifier of the Sas Administrator responsible for the implementation",
      "type": "string"
    },
    "contactInformation": {
      "description": "Contacts for the SAS implementation",
      "type": "array",
      "items": {
        "$ref": "file:ContactInformation.schema.json"
      }
    },
    "publicKey": {
      "description": "X.509 public key of the SAS implementation, encoded as text",
      "type": "string"
    },
    "fccInformation": {
      "description": "FCC certification information",
      "$ref": "file:FccInformation.schema.json"
    },
    "url": {
      "description": "Base URL of the SAS-SAS interface",
      "type": "string",
      "format": "uri"
    }
  }
}
)json";

const std::string contact_information_schema_json = R"json(
{
  "$schema": "http://json-schema.org/draft-04/schema#",
  "description": "A contactable party associated with a SAS implementation",
  "type": "object",
  "required": [
    "contactType",
    "name"
  ],
  "additionalProperties": false,
  "properties": {
    "contactType": {
      "type": "string",
      "enum": [
        "ADMINISTRATIVE",
        "TECHNICAL",
        "OPERATIONAL",
        "EMERGENCY"
      ]
    },
    "name": {
      "type": "string",
      "minLength": 1
    },
    "title": {
      "type": "string"
    },
    "address": {
      "type": "string"
    },
    "email": {
      "type": "string",
      "format": "email"
    },
    "phoneNumber": {
      "type": "string"
    },
    "additionalInformation": {
      "type": "string"
    }
  }
}
)json";

const std::string fcc_information_schema_json = R"json(
{
  "$schema": "http://json-schema.org/draft-04/schema#",
  "description": "FCC certification information of a SAS implementation",
  "type": "object",
  "required": [
    "fccRegistrationNumber",
    "fccCertificationId"
  ],
  "additionalProperties": false,
  "properties": {
    "fccRegistrationNumber": {
      "description": "FCC Registration Number (FRN)",
      "type": "string",
      "pattern": "^[0-9]{10}$"
    },
    "fccCertificationId": {
      "type": "string",
      "minLength": 1
    },
    "certificationDate": {
      "type": "string",
      "format": "date"
    }
  }
}
)json";

// clang-format on

} // namespace sasrec
