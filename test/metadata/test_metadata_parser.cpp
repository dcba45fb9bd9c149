#include <catch2/catch_test_macros.hpp>

#include <reso_client/metadata/metadata_parser.hpp>

#include <fstream>
#include <sstream>
#include <string>

using namespace reso_client;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

std::string LoadFixture(const std::string& filename) {
    std::ifstream in(TestDataPath(filename));
    REQUIRE(in.good());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Schema ParseFixture() {
    auto result = ParseMetadata(LoadFixture("metadata.xml"));
    REQUIRE(result.IsOk());
    return result.Value();
}

} // anonymous namespace

// ===========================================================================
// ParseMetadata
// ===========================================================================

TEST_CASE("ParseMetadata: schema namespace and entity types", "[metadata]") {
    auto schema = ParseFixture();
    CHECK(schema.namespace_name == "org.reso.metadata");
    REQUIRE(schema.entity_types.size() == 4);
    CHECK(schema.entity_types[0].name == "Property");
    CHECK(schema.entity_types[1].name == "Member");
    CHECK(schema.entity_types[2].name == "Media");
    CHECK(schema.entity_types[3].name == "CustomWidget");
}

TEST_CASE("ParseMetadata: property attributes", "[metadata]") {
    auto schema = ParseFixture();
    const auto* property = schema.FindEntity("Property");
    REQUIRE(property != nullptr);

    // NavigationProperty and Key are not scalar properties.
    REQUIRE(property->properties.size() == 4);

    const auto& key = property->properties[0];
    CHECK(key.name == "ListingKey");
    CHECK(key.type == "Edm.String");
    CHECK_FALSE(key.nullable);
    CHECK(key.max_length == std::optional<int>(255));

    const auto& price = property->properties[1];
    CHECK(price.name == "ListPrice");
    CHECK(price.type == "Edm.Decimal");
    CHECK(price.nullable);
    CHECK_FALSE(price.max_length.has_value());
}

TEST_CASE("ParseMetadata: FindEntity misses return nullptr", "[metadata]") {
    auto schema = ParseFixture();
    CHECK(schema.FindEntity("Office") == nullptr);
    CHECK(schema.FindEntity("property") == nullptr);
}

TEST_CASE("ParseMetadata: unprefixed elements", "[metadata]") {
    const std::string xml = R"(<Edmx><DataServices>
        <Schema Namespace="plain"><EntityType Name="Office">
          <Property Name="OfficeKey" Type="Edm.String"/>
        </EntityType></Schema>
      </DataServices></Edmx>)";
    auto result = ParseMetadata(xml);
    REQUIRE(result.IsOk());
    CHECK(result.Value().namespace_name == "plain");
    REQUIRE(result.Value().entity_types.size() == 1);
    CHECK(result.Value().entity_types[0].properties[0].name == "OfficeKey");
}

TEST_CASE("ParseMetadata: multiple schemas are merged", "[metadata]") {
    const std::string xml = R"(<edmx:Edmx xmlns:edmx="x"><edmx:DataServices>
        <Schema Namespace="first"><EntityType Name="Property"/></Schema>
        <Schema Namespace="second"><EntityType Name="Team"/></Schema>
      </edmx:DataServices></edmx:Edmx>)";
    auto result = ParseMetadata(xml);
    REQUIRE(result.IsOk());
    CHECK(result.Value().namespace_name == "first");
    CHECK(result.Value().entity_types.size() == 2);
}

TEST_CASE("ParseMetadata: malformed XML is a Parse error", "[metadata]") {
    auto result = ParseMetadata("<Edmx><DataServices></Edmx>");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Parse);
    CHECK(result.Error().message.rfind("XML parse error: ", 0) == 0);
}

TEST_CASE("ParseMetadata: empty input is a Parse error", "[metadata]") {
    auto result = ParseMetadata("");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Parse);
}

// ===========================================================================
// Summaries
// ===========================================================================

TEST_CASE("FindResoResources: canonical order, standard names only", "[metadata]") {
    auto schema = ParseFixture();
    auto resources = FindResoResources(schema);
    REQUIRE(resources.size() == 3);
    CHECK(resources[0] == "Property");
    CHECK(resources[1] == "Member");
    CHECK(resources[2] == "Media");
}

TEST_CASE("EdmTypeNames: sorted and distinct", "[metadata]") {
    auto schema = ParseFixture();
    auto types = EdmTypeNames(schema);
    REQUIRE(types.size() == 5);
    CHECK(types[0] == "Edm.DateTimeOffset");
    CHECK(types[1] == "Edm.Decimal");
    CHECK(types[2] == "Edm.Int32");
    CHECK(types[3] == "Edm.Int64");
    CHECK(types[4] == "Edm.String");
}

// ===========================================================================
// Code generation
// ===========================================================================

TEST_CASE("CppTypeForEdm: scalar, collection and unknown types", "[metadata][generate]") {
    CHECK(CppTypeForEdm("Edm.String") == "std::string");
    CHECK(CppTypeForEdm("Edm.Int32") == "std::int32_t");
    CHECK(CppTypeForEdm("Edm.Int64") == "std::int64_t");
    CHECK(CppTypeForEdm("Edm.Decimal") == "double");
    CHECK(CppTypeForEdm("Edm.Boolean") == "bool");
    CHECK(CppTypeForEdm("Edm.DateTimeOffset") == "std::string");
    CHECK(CppTypeForEdm("Edm.Binary") == "std::vector<std::uint8_t>");
    CHECK(CppTypeForEdm("Collection(Edm.String)") == "std::vector<std::string>");
    CHECK(CppTypeForEdm("org.reso.metadata.enums.StandardStatus") == "nlohmann::json");
    CHECK(CppTypeForEdm("") == "nlohmann::json");
}

TEST_CASE("ToSnakeCase: splits before each capital", "[metadata][generate]") {
    CHECK(ToSnakeCase("ListingKey") == "listing_key");
    CHECK(ToSnakeCase("City") == "city");
    CHECK(ToSnakeCase("listPrice") == "list_price");
}

TEST_CASE("GenerateStruct: Property from the fixture", "[metadata][generate]") {
    auto schema = ParseFixture();
    const auto* entity = schema.FindEntity("Property");
    REQUIRE(entity != nullptr);

    CHECK(GenerateStruct(*entity) ==
          "// Property entity from RESO metadata\n"
          "struct Property {\n"
          "    std::optional<std::string> listing_key;  // ListingKey\n"
          "    std::optional<double> list_price;  // ListPrice\n"
          "    std::optional<std::string> city;  // City\n"
          "    std::optional<std::string> modification_timestamp;  // ModificationTimestamp\n"
          "};\n");
}
