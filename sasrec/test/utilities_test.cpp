#include <gtest/gtest.h>
#include "utilities.hpp"
#include <filesystem>
#include <fstream>

namespace sasrec::test {

namespace fs = std::filesystem;

class DocumentLoadTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    test_path = fs::temp_directory_path() / "sasrec_document_test";
    fs::create_directories(test_path);
  }

  void TearDown() override
  {
    fs::remove_all(test_path);
  }

  fs::path test_path;
};

TEST(YamlToJsonTest, ScalarTypes)
{
  auto node = YAML::Load(R"(
flag: true
count: 42
ratio: 0.5
nothing: ~
text: hello
quoted_number: "0012345678"
quoted_flag: 'true'
list: [1, two]
)");
  auto j = yaml_to_json(node);
  EXPECT_EQ(j["flag"], true);
  EXPECT_EQ(j["count"], 42);
  EXPECT_DOUBLE_EQ(j["ratio"].get<double>(), 0.5);
  EXPECT_TRUE(j["nothing"].is_null());
  EXPECT_EQ(j["text"], "hello");
  EXPECT_EQ(j["quoted_number"], "0012345678");
  EXPECT_EQ(j["quoted_flag"], "true");
  EXPECT_EQ(j["list"], nlohmann::json({ 1, "two" }));
}

TEST_F(DocumentLoadTest, YamlAndJsonLoadTheSameRecord)
{
  std::ofstream(test_path / "record.json") << R"({
  "id": "sas1/sas2/region1",
  "name": "Example SAS",
  "contactInformation": [ { "contactType": "TECHNICAL", "name": "Ops" } ],
  "fccInformation": { "fccRegistrationNumber": "0012345678" }
})";
  std::ofstream(test_path / "record.yaml") << R"(
id: sas1/sas2/region1
name: Example SAS
contactInformation:
  - contactType: TECHNICAL
    name: Ops
fccInformation:
  fccRegistrationNumber: "0012345678"
)";

  auto from_json = load_document(test_path / "record.json");
  auto from_yaml = load_document(test_path / "record.yaml");
  ASSERT_TRUE(from_json.has_value());
  ASSERT_TRUE(from_yaml.has_value());
  EXPECT_EQ(from_json.value(), from_yaml.value());
}

TEST_F(DocumentLoadTest, ErrorHandling)
{
  auto missing = load_document(test_path / "missing.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), std::make_error_code(std::errc::no_such_file_or_directory));

  std::ofstream(test_path / "broken.json") << "{ \"id\": ";
  auto broken_json = load_document(test_path / "broken.json");
  ASSERT_FALSE(broken_json.has_value());
  EXPECT_EQ(broken_json.error(), std::make_error_code(std::errc::invalid_argument));

  std::ofstream(test_path / "broken.yaml") << "id: [unterminated";
  auto broken_yaml = load_document(test_path / "broken.yaml");
  ASSERT_FALSE(broken_yaml.has_value());
  EXPECT_EQ(broken_yaml.error(), std::make_error_code(std::errc::invalid_argument));
}

TEST_F(DocumentLoadTest, SaveAndReload)
{
  const nlohmann::json document = { { "id", "a/b/c" }, { "contactInformation", nlohmann::json::array() } };
  ASSERT_TRUE(save_document(test_path / "saved.json", document).has_value());

  auto reloaded = load_document(test_path / "saved.json");
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded.value(), document);

  EXPECT_FALSE(save_document(test_path / "no_such_dir" / "saved.json", document).has_value());
}

TEST(SchemaReferenceTest, ReducesToFileName)
{
  EXPECT_EQ(schema_reference_name("file:ContactInformation.schema.json"), "ContactInformation.schema.json");
  EXPECT_EQ(schema_reference_name("/file:ContactInformation.schema.json"), "ContactInformation.schema.json");
  EXPECT_EQ(schema_reference_name("file:///opt/schemas/FccInformation.schema.json"), "FccInformation.schema.json");
  EXPECT_EQ(schema_reference_name("FccInformation.schema.json#/properties/x"), "FccInformation.schema.json");
  EXPECT_EQ(schema_reference_name(""), "");
}

TEST(JsonPointerTest, HeadToken)
{
  EXPECT_EQ(json_pointer_head(nlohmann::json::json_pointer("")), "");
  EXPECT_EQ(json_pointer_head(nlohmann::json::json_pointer("/url")), "url");
  EXPECT_EQ(json_pointer_head(nlohmann::json::json_pointer("/contactInformation/0/name")), "contactInformation");
  EXPECT_EQ(json_pointer_head(nlohmann::json::json_pointer("/a~1b~0c/d")), "a/b~c");
}

} // namespace sasrec::test
