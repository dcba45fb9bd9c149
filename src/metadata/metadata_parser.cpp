#include <reso_client/metadata/metadata_parser.hpp>

#include <tinyxml2.h>

#include <cctype>
#include <set>
#include <sstream>
#include <utility>

namespace reso_client {

namespace {

constexpr const char* kResoResources[] = {
    "Property", "Member", "Office", "OpenHouse", "Media",
    "Team", "Contact", "InternetAddress", "Contacts", "HistoryTransactional",
};

// Element name without its namespace prefix.
std::string_view LocalName(const tinyxml2::XMLElement* element) {
    std::string_view name = element->Name() ? element->Name() : "";
    auto colon = name.find(':');
    if (colon != std::string_view::npos) {
        name.remove_prefix(colon + 1);
    }
    return name;
}

std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    const char* value = element->Attribute(name);
    return value ? value : "";
}

std::optional<int> ParseMaxLength(const tinyxml2::XMLElement* element) {
    int value = 0;
    if (element->QueryIntAttribute("MaxLength", &value) == tinyxml2::XML_SUCCESS) {
        return value;
    }
    return std::nullopt;
}

EntityType ParseEntityType(const tinyxml2::XMLElement* element) {
    EntityType entity;
    entity.name = Attr(element, "Name");
    for (auto* child = element->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        if (LocalName(child) != "Property") continue;

        EntityProperty prop;
        prop.name = Attr(child, "Name");
        prop.type = Attr(child, "Type");
        prop.nullable = Attr(child, "Nullable") != "false";
        prop.max_length = ParseMaxLength(child);
        entity.properties.push_back(std::move(prop));
    }
    return entity;
}

void AddSchema(const tinyxml2::XMLElement* element, Schema& schema) {
    if (schema.namespace_name.empty()) {
        schema.namespace_name = Attr(element, "Namespace");
    }
    for (auto* item = element->FirstChildElement(); item;
         item = item->NextSiblingElement()) {
        if (LocalName(item) == "EntityType") {
            schema.entity_types.push_back(ParseEntityType(item));
        }
    }
}

// Edmx > DataServices > Schema*, at whatever depth the server nests them.
void CollectSchemas(const tinyxml2::XMLElement* element, Schema& schema) {
    if (LocalName(element) == "Schema") {
        AddSchema(element, schema);
        return;
    }
    for (auto* child = element->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        CollectSchemas(child, schema);
    }
}

} // anonymous namespace

const EntityType* Schema::FindEntity(std::string_view name) const {
    for (const auto& entity : entity_types) {
        if (entity.name == name) return &entity;
    }
    return nullptr;
}

Result<Schema, Error> ParseMetadata(std::string_view xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return Result<Schema, Error>::Err(Error::Parse(
            std::string("XML parse error: ") + doc.ErrorStr()));
    }

    auto* root = doc.RootElement();
    if (!root) {
        return Result<Schema, Error>::Err(Error::Parse("Empty metadata document"));
    }

    Schema schema;
    CollectSchemas(root, schema);
    return Result<Schema, Error>::Ok(std::move(schema));
}

std::vector<std::string> FindResoResources(const Schema& schema) {
    std::vector<std::string> found;
    for (const auto* name : kResoResources) {
        if (schema.FindEntity(name) != nullptr) {
            found.emplace_back(name);
        }
    }
    return found;
}

std::vector<std::string> EdmTypeNames(const Schema& schema) {
    std::set<std::string> types;
    for (const auto& entity : schema.entity_types) {
        for (const auto& prop : entity.properties) {
            if (!prop.type.empty()) types.insert(prop.type);
        }
    }
    return {types.begin(), types.end()};
}

std::string CppTypeForEdm(std::string_view edm_type) {
    static const std::pair<std::string_view, std::string_view> kScalars[] = {
        {"Edm.String", "std::string"},
        {"Edm.Guid", "std::string"},
        {"Edm.Int16", "std::int16_t"},
        {"Edm.Int32", "std::int32_t"},
        {"Edm.Int64", "std::int64_t"},
        {"Edm.Double", "double"},
        {"Edm.Decimal", "double"},
        {"Edm.Boolean", "bool"},
        {"Edm.DateTime", "std::string"},
        {"Edm.DateTimeOffset", "std::string"},
        {"Edm.Date", "std::string"},
        {"Edm.TimeOfDay", "std::string"},
        {"Edm.Binary", "std::vector<std::uint8_t>"},
    };
    for (const auto& [edm, cpp] : kScalars) {
        if (edm == edm_type) return std::string(cpp);
    }

    constexpr std::string_view kCollection = "Collection(";
    if (edm_type.substr(0, kCollection.size()) == kCollection && edm_type.back() == ')') {
        auto inner = edm_type.substr(kCollection.size(),
                                     edm_type.size() - kCollection.size() - 1);
        return "std::vector<" + CppTypeForEdm(inner) + ">";
    }
    return "nlohmann::json";
}

std::string ToSnakeCase(std::string_view name) {
    std::string result;
    result.reserve(name.size() + 4);
    for (char c : name) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            if (!result.empty()) result += '_';
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

std::string GenerateStruct(const EntityType& entity) {
    std::ostringstream code;
    code << "// " << entity.name << " entity from RESO metadata\n";
    code << "struct " << entity.name << " {\n";
    for (const auto& prop : entity.properties) {
        code << "    std::optional<" << CppTypeForEdm(prop.type) << "> "
             << ToSnakeCase(prop.name) << ";  // " << prop.name << "\n";
    }
    code << "};\n";
    return code.str();
}

} // namespace reso_client
