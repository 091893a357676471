#pragma once

#include "streamcat/catalog/catalog_ids.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace streamcat::catalog {

class CatalogSnapshot;

inline constexpr std::uint32_t kCatalogIntrospectionSchemaVersion = 1U;

enum class CatalogRelationKind : std::uint8_t {
    Table = 0,
    MaterializedView,
    Internal,
    Source,
    Sink,
    Index,
    View
};

[[nodiscard]] const char* to_string(CatalogRelationKind kind) noexcept;

struct CatalogColumnSummary final {
    std::string name;
    std::string data_type;
    bool is_hidden = false;
};

struct CatalogRelationSummary final {
    std::string database_name;
    std::string schema_name;
    std::string relation_name;
    CatalogRelationKind relation_kind = CatalogRelationKind::Table;
    std::uint64_t relation_id = 0U;
    // Table a coupled source or an index belongs to; empty otherwise.
    std::string owner_relation_name;
    std::string definition;
    std::vector<CatalogColumnSummary> columns;
};

struct CatalogFunctionSummary final {
    std::string database_name;
    std::string schema_name;
    std::string function_name;
    std::vector<std::string> arg_types;
    std::string return_type;
    std::string language;
};

struct CatalogIntrospectionSnapshot final {
    std::uint32_t schema_version = kCatalogIntrospectionSchemaVersion;
    std::uint64_t catalog_version = 0U;
    std::vector<CatalogRelationSummary> relations;
    std::vector<CatalogFunctionSummary> functions;
};

// Index backing tables are reported through their index, never on their own.
CatalogIntrospectionSnapshot collect_catalog_introspection(const CatalogSnapshot& snapshot);

std::string catalog_introspection_to_json(const CatalogIntrospectionSnapshot& snapshot);

// SHOW TABLES / SOURCES / SINKS / ... for one schema, sorted by name.
std::vector<std::string> show_relations(const CatalogSnapshot& snapshot, SchemaId schema_id, CatalogRelationKind kind);

// SHOW COLUMNS: visible columns only. std::nullopt when the relation does not exist.
std::optional<std::vector<CatalogColumnSummary>> show_columns(const CatalogSnapshot& snapshot,
                                                              SchemaId schema_id,
                                                              std::string_view name);

// SHOW CREATE: the stored definition text. Sources and indexes carry none and
// are rendered from their properties and key columns.
std::optional<std::string> show_create(const CatalogSnapshot& snapshot, SchemaId schema_id, std::string_view name);

}  // namespace streamcat::catalog
