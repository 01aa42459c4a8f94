#include <gtest/gtest.h>
#include "record_validator.hpp"
#include "sas_implementation_record.hpp"
#include "schema_resolver.hpp"
#include "sasrec.hpp"
#include <filesystem>
#include <fstream>

namespace sasrec::test {

namespace fs = std::filesystem;

static const fs::path shipped_schema_directory = SASREC_SCHEMA_DIR;

class SchemaResolverTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    test_path = fs::temp_directory_path() / "sasrec_schema_test";
    fs::create_directories(test_path);
  }

  void TearDown() override
  {
    fs::remove_all(test_path);
  }

  fs::path test_path;
};

TEST_F(SchemaResolverTest, EmbeddedResolverServesAllSchemas)
{
  embedded_schema_resolver resolver;
  EXPECT_TRUE(resolver.resolve(record_schema_filename).has_value());
  EXPECT_TRUE(resolver.resolve(contact_information_schema_filename).has_value());
  EXPECT_TRUE(resolver.resolve("file:FccInformation.schema.json").has_value());

  auto missing = resolver.resolve("Unknown.schema.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), std::make_error_code(std::errc::no_such_file_or_directory));
}

TEST_F(SchemaResolverTest, RecordSchemaDeclaresExchangeContract)
{
  auto schema = embedded_schema_resolver().resolve(record_schema_filename).value();
  EXPECT_EQ(schema["$schema"], "http://json-schema.org/draft-04/schema#");
  EXPECT_EQ(schema["required"], nlohmann::json({ "id", "name", "administratorId", "contactInformation", "publicKey", "fccInformation", "url" }));
  EXPECT_EQ(schema["additionalProperties"], false);
  EXPECT_EQ(schema["properties"]["id"]["pattern"], "((.+?)/(.+?)/(.+?)+)");
  EXPECT_EQ(schema["properties"]["contactInformation"]["items"]["$ref"], "file:ContactInformation.schema.json");
  EXPECT_EQ(schema["properties"]["fccInformation"]["$ref"], "file:FccInformation.schema.json");
  EXPECT_EQ(schema["properties"]["url"]["format"], "uri");
  EXPECT_EQ(schema["properties"].size(), 7u);
}

TEST_F(SchemaResolverTest, ShippedFilesMatchEmbeddedCopies)
{
  embedded_schema_resolver embedded;
  directory_schema_resolver shipped(shipped_schema_directory);

  for (const auto &name: { record_schema_filename, contact_information_schema_filename, fcc_information_schema_filename }) {
    auto from_disk = shipped.resolve(name);
    ASSERT_TRUE(from_disk.has_value()) << name;
    EXPECT_EQ(from_disk.value(), embedded.resolve(name).value()) << name;
  }
}

TEST_F(SchemaResolverTest, DirectoryResolverBuildsValidator)
{
  auto validator = record_validator::create(std::make_shared<directory_schema_resolver>(shipped_schema_directory));
  ASSERT_TRUE(validator.has_value()) << validator.error().message();
  EXPECT_TRUE(validator.value()->validate(sas_implementation_record::example()).valid());
}

TEST_F(SchemaResolverTest, MissingReferencedSchemaFailsConstruction)
{
  fs::copy_file(shipped_schema_directory / record_schema_filename, test_path / record_schema_filename);
  fs::copy_file(shipped_schema_directory / contact_information_schema_filename, test_path / contact_information_schema_filename);

  auto validator = record_validator::create(std::make_shared<directory_schema_resolver>(test_path));
  ASSERT_FALSE(validator.has_value());
  EXPECT_EQ(validator.error(), std::make_error_code(std::errc::no_such_file_or_directory));
}

TEST_F(SchemaResolverTest, UnparsableSchemaFailsConstruction)
{
  fs::copy_file(shipped_schema_directory / record_schema_filename, test_path / record_schema_filename);
  fs::copy_file(shipped_schema_directory / contact_information_schema_filename, test_path / contact_information_schema_filename);
  std::ofstream(test_path / fcc_information_schema_filename) << "{ \"type\": ";

  auto validator = record_validator::create(std::make_shared<directory_schema_resolver>(test_path));
  ASSERT_FALSE(validator.has_value());
  EXPECT_EQ(validator.error(), std::make_error_code(std::errc::invalid_argument));
}

TEST_F(SchemaResolverTest, InjectedSubSchemaReplacesDefault)
{
  auto resolver = std::make_shared<embedded_schema_resolver>();
  resolver->add("file:FccInformation.schema.json", { { "type", "object" } });

  auto validator = record_validator::create(resolver);
  ASSERT_TRUE(validator.has_value());

  nlohmann::json record    = sas_implementation_record::example();
  record["fccInformation"] = { { "anything", 1 } };
  EXPECT_TRUE(validator.value()->validate(record).valid());

  record["fccInformation"] = nlohmann::json::array();
  EXPECT_TRUE(validator.value()->validate(record).has(violation_kind::type_mismatch, "fccInformation"));
}

TEST_F(SchemaResolverTest, RejectsUnusableInputs)
{
  auto no_resolver = record_validator::create(nullptr);
  ASSERT_FALSE(no_resolver.has_value());
  EXPECT_EQ(no_resolver.error(), std::make_error_code(std::errc::invalid_argument));

  auto not_a_schema = record_validator::create(std::make_shared<embedded_schema_resolver>(), nlohmann::json::array());
  ASSERT_FALSE(not_a_schema.has_value());
  EXPECT_EQ(not_a_schema.error(), std::make_error_code(std::errc::invalid_argument));
}

TEST_F(SchemaResolverTest, ExplicitRootSchema)
{
  nlohmann::json root = { { "type", "object" }, { "required", { "id" } }, { "properties", { { "id", { { "type", "string" }, { "pattern", "((.+?)/(.+?)/(.+?)+)" } } } } } };

  auto validator = record_validator::create(std::make_shared<embedded_schema_resolver>(), root);
  ASSERT_TRUE(validator.has_value());
  EXPECT_TRUE(validator.value()->validate({ { "id", "x/y/z" } }).valid());
  EXPECT_TRUE(validator.value()->validate({ { "id", "xyz" } }).has(violation_kind::pattern_violation, "id"));
}

} // namespace sasrec::test
