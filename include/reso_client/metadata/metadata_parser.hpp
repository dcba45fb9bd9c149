#pragma once

#include <reso_client/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reso_client {

// ---------------------------------------------------------------------------
// EDMX $metadata model: only what a RESO client needs: entity types and
// their scalar properties. Navigation properties, complex types and
// annotations are skipped.
// ---------------------------------------------------------------------------
struct EntityProperty {
    std::string name;
    std::string type;                 // e.g. "Edm.String"
    bool nullable = true;             // Nullable="false" clears it
    std::optional<int> max_length;    // MaxLength, when numeric
};

struct EntityType {
    std::string name;
    std::vector<EntityProperty> properties;   // document order
};

struct Schema {
    std::string namespace_name;
    std::vector<EntityType> entity_types;     // document order

    /// Entity type by exact name, or nullptr.
    [[nodiscard]] const EntityType* FindEntity(std::string_view name) const;
};

/// Parse an EDMX document. Element prefixes (edmx:, edm:) are ignored.
[[nodiscard]] Result<Schema, Error> ParseMetadata(std::string_view xml);

/// The standard RESO resources the schema defines, in canonical order.
std::vector<std::string> FindResoResources(const Schema& schema);

/// Sorted, distinct property types across all entity types.
std::vector<std::string> EdmTypeNames(const Schema& schema);

// ---------------------------------------------------------------------------
// Code generation
// ---------------------------------------------------------------------------

/// C++ type for an Edm type name. Collection(T) maps to std::vector of T;
/// date and time types stay ISO 8601 text; unknown types and enum
/// references map to nlohmann::json.
std::string CppTypeForEdm(std::string_view edm_type);

/// PascalCase property name to a snake_case field name.
std::string ToSnakeCase(std::string_view name);

/// A C++ struct for one entity type. Every field is std::optional since a
/// record may omit any property ($select, nulls). Each field carries its
/// wire name in a trailing comment.
std::string GenerateStruct(const EntityType& entity);

} // namespace reso_client
