#include "streamcat/catalog/catalog_objects.hpp"

#include <type_traits>

namespace streamcat::catalog {

CatalogObjectKind object_kind(const CatalogObject& object) noexcept
{
    return static_cast<CatalogObjectKind>(object.index());
}

std::uint64_t object_id(const CatalogObject& object) noexcept
{
    return std::visit([](const auto& entry) -> std::uint64_t { return entry.id.value; }, object);
}

std::string_view object_name(const CatalogObject& object) noexcept
{
    return std::visit([](const auto& entry) -> std::string_view { return entry.name; }, object);
}

SchemaId object_schema_id(const CatalogObject& object) noexcept
{
    return std::visit(
        [](const auto& entry) -> SchemaId {
            using T = std::decay_t<decltype(entry)>;
            if constexpr (std::is_same_v<T, CatalogDatabase>) {
                return SchemaId{};
            } else if constexpr (std::is_same_v<T, CatalogSchema>) {
                return entry.id;
            } else {
                return entry.schema_id;
            }
        },
        object);
}

bool is_relation_kind(CatalogObjectKind kind) noexcept
{
    switch (kind) {
    case CatalogObjectKind::Table:
    case CatalogObjectKind::Source:
    case CatalogObjectKind::Sink:
    case CatalogObjectKind::Index:
    case CatalogObjectKind::View:
        return true;
    default:
        return false;
    }
}

CatalogIdCategory id_category(CatalogObjectKind kind) noexcept
{
    switch (kind) {
    case CatalogObjectKind::Database:
        return CatalogIdCategory::Database;
    case CatalogObjectKind::Schema:
        return CatalogIdCategory::Schema;
    case CatalogObjectKind::Function:
        return CatalogIdCategory::Function;
    default:
        return CatalogIdCategory::Relation;
    }
}

const char* to_string(CatalogIdCategory category) noexcept
{
    switch (category) {
    case CatalogIdCategory::Database:
        return "database";
    case CatalogIdCategory::Schema:
        return "schema";
    case CatalogIdCategory::Relation:
        return "relation";
    case CatalogIdCategory::Function:
        return "function";
    default:
        return "unknown";
    }
}

const char* to_string(CatalogObjectKind kind) noexcept
{
    switch (kind) {
    case CatalogObjectKind::Database:
        return "database";
    case CatalogObjectKind::Schema:
        return "schema";
    case CatalogObjectKind::Table:
        return "table";
    case CatalogObjectKind::Source:
        return "source";
    case CatalogObjectKind::Sink:
        return "sink";
    case CatalogObjectKind::Index:
        return "index";
    case CatalogObjectKind::View:
        return "view";
    case CatalogObjectKind::Function:
        return "function";
    default:
        return "unknown";
    }
}

const char* to_string(TableType type) noexcept
{
    switch (type) {
    case TableType::Table:
        return "table";
    case TableType::MaterializedView:
        return "materialized_view";
    case TableType::Index:
        return "index";
    case TableType::Internal:
        return "internal";
    case TableType::Unspecified:
    default:
        return "unspecified";
    }
}

const char* to_string(CatalogDataType type) noexcept
{
    switch (type) {
    case CatalogDataType::Boolean:
        return "boolean";
    case CatalogDataType::Int16:
        return "smallint";
    case CatalogDataType::Int32:
        return "integer";
    case CatalogDataType::Int64:
        return "bigint";
    case CatalogDataType::Float32:
        return "real";
    case CatalogDataType::Float64:
        return "double precision";
    case CatalogDataType::Decimal:
        return "numeric";
    case CatalogDataType::Varchar:
        return "varchar";
    case CatalogDataType::Date:
        return "date";
    case CatalogDataType::Time:
        return "time";
    case CatalogDataType::Timestamp:
        return "timestamp";
    case CatalogDataType::Timestamptz:
        return "timestamptz";
    case CatalogDataType::Interval:
        return "interval";
    case CatalogDataType::Bytea:
        return "bytea";
    case CatalogDataType::Jsonb:
        return "jsonb";
    case CatalogDataType::Serial:
        return "serial";
    case CatalogDataType::Unknown:
    default:
        return "unknown";
    }
}

}  // namespace streamcat::catalog
