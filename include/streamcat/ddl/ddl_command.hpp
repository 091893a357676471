#pragma once

#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/catalog/catalog_ids.hpp"
#include "streamcat/catalog/catalog_objects.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace streamcat::ddl {

enum class DdlVerb : std::uint8_t {
    CreateDatabase = 0,
    DropDatabase,
    CreateSchema,
    DropSchema,
    CreateTable,
    AlterTable,
    DropTable,
    CreateSource,
    DropSource,
    CreateSink,
    DropSink,
    CreateIndex,
    DropIndex,
    CreateView,
    DropView,
    CreateMaterializedView,
    DropMaterializedView,
    CreateFunction,
    DropFunction,
    Count
};

struct CreateDatabaseRequest final {
    std::string name{};
    catalog::UserId owner = catalog::kRootUserId;
    bool if_not_exists = false;
};

// The database must not contain anything besides empty schemas.
struct DropDatabaseRequest final {
    std::string name{};
    bool if_exists = false;
};

struct CreateSchemaRequest final {
    catalog::DatabaseId database_id{};
    std::string name{};
    catalog::UserId owner = catalog::kRootUserId;
    bool if_not_exists = false;
};

struct DropSchemaRequest final {
    catalog::DatabaseId database_id{};
    std::string name{};
    bool if_exists = false;
};

// Ids inside `table` and `source` are assigned by the catalog; database_id
// is taken from the schema. Passing a source couples it to the table.
struct CreateTableRequest final {
    catalog::CatalogTable table{};
    std::optional<catalog::CatalogSource> source{};
    bool if_not_exists = false;
};

struct AlterTableAddColumn final {
    catalog::ColumnDescriptor column{};
    bool if_not_exists = false;
};

struct AlterTableDropColumn final {
    std::string column_name{};
    bool if_exists = false;
};

struct AlterTableRenameColumn final {
    std::string column_name{};
    std::string new_column_name{};
};

struct AlterTableAlterColumnType final {
    std::string column_name{};
    catalog::CatalogDataType data_type = catalog::CatalogDataType::Unknown;
};

struct AlterTableRenameTable final {
    std::string new_table_name{};
};

using AlterTableAction = std::variant<AlterTableAddColumn,
                                      AlterTableDropColumn,
                                      AlterTableRenameColumn,
                                      AlterTableAlterColumnType,
                                      AlterTableRenameTable>;

struct AlterTableRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    std::uint64_t expected_version = 0U;
    std::vector<AlterTableAction> actions{};
    // Replaces the stored definition when not empty.
    std::string definition{};
};

// Also drops the coupled source, the table's indexes and their backing tables.
struct DropTableRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    bool if_exists = false;
};

struct CreateSourceRequest final {
    catalog::CatalogSource source{};
    bool if_not_exists = false;
};

struct DropSourceRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    bool if_exists = false;
};

struct CreateSinkRequest final {
    catalog::CatalogSink sink{};
    bool if_not_exists = false;
};

struct DropSinkRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    bool if_exists = false;
};

struct CreateIndexRequest final {
    catalog::SchemaId schema_id{};
    std::string index_name{};
    std::string table_name{};
    std::vector<std::string> column_names{};
    std::vector<std::string> include_column_names{};
    catalog::UserId owner = catalog::kRootUserId;
    bool if_not_exists = false;
};

struct DropIndexRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    bool if_exists = false;
};

// view.columns holds the query's output fields. When column_names is not
// empty it must name every output field, in order.
struct CreateViewRequest final {
    catalog::CatalogView view{};
    std::vector<std::string> column_names{};
    bool if_not_exists = false;
};

struct DropViewRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    bool if_exists = false;
};

struct CreateMaterializedViewRequest final {
    catalog::CatalogTable table{};
    bool if_not_exists = false;
};

struct DropMaterializedViewRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    bool if_exists = false;
};

struct CreateFunctionRequest final {
    catalog::CatalogFunction function{};
    bool if_not_exists = false;
};

// Without arg_types the name must identify a single overload.
struct DropFunctionRequest final {
    catalog::SchemaId schema_id{};
    std::string name{};
    std::optional<std::vector<catalog::CatalogDataType>> arg_types{};
    bool if_exists = false;
};

using DdlCommand = std::variant<CreateDatabaseRequest,
                                DropDatabaseRequest,
                                CreateSchemaRequest,
                                DropSchemaRequest,
                                CreateTableRequest,
                                AlterTableRequest,
                                DropTableRequest,
                                CreateSourceRequest,
                                DropSourceRequest,
                                CreateSinkRequest,
                                DropSinkRequest,
                                CreateIndexRequest,
                                DropIndexRequest,
                                CreateViewRequest,
                                DropViewRequest,
                                CreateMaterializedViewRequest,
                                DropMaterializedViewRequest,
                                CreateFunctionRequest,
                                DropFunctionRequest>;

enum class DdlDiagnosticSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct DdlCommandResponse final {
    bool success = false;
    std::error_code error{};
    std::string message{};
    DdlDiagnosticSeverity severity = DdlDiagnosticSeverity::Error;
    std::vector<std::string> remediation_hints{};
    // Committed objects with their assigned ids, in staging order.
    std::vector<catalog::CatalogObject> objects{};
    // Zero when the request committed nothing (rejections and no-ops).
    std::uint64_t catalog_version = 0U;
};

namespace detail {

template <typename Request>
struct RequestTrait;

template <>
struct RequestTrait<CreateDatabaseRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateDatabase;
};

template <>
struct RequestTrait<DropDatabaseRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropDatabase;
};

template <>
struct RequestTrait<CreateSchemaRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateSchema;
};

template <>
struct RequestTrait<DropSchemaRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropSchema;
};

template <>
struct RequestTrait<CreateTableRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateTable;
};

template <>
struct RequestTrait<AlterTableRequest> {
    static constexpr DdlVerb verb = DdlVerb::AlterTable;
};

template <>
struct RequestTrait<DropTableRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropTable;
};

template <>
struct RequestTrait<CreateSourceRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateSource;
};

template <>
struct RequestTrait<DropSourceRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropSource;
};

template <>
struct RequestTrait<CreateSinkRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateSink;
};

template <>
struct RequestTrait<DropSinkRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropSink;
};

template <>
struct RequestTrait<CreateIndexRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateIndex;
};

template <>
struct RequestTrait<DropIndexRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropIndex;
};

template <>
struct RequestTrait<CreateViewRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateView;
};

template <>
struct RequestTrait<DropViewRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropView;
};

template <>
struct RequestTrait<CreateMaterializedViewRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateMaterializedView;
};

template <>
struct RequestTrait<DropMaterializedViewRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropMaterializedView;
};

template <>
struct RequestTrait<CreateFunctionRequest> {
    static constexpr DdlVerb verb = DdlVerb::CreateFunction;
};

template <>
struct RequestTrait<DropFunctionRequest> {
    static constexpr DdlVerb verb = DdlVerb::DropFunction;
};

}  // namespace detail

template <typename Request>
constexpr DdlVerb request_verb() noexcept
{
    return detail::RequestTrait<Request>::verb;
}

template <typename Request>
constexpr std::size_t request_verb_index() noexcept
{
    return static_cast<std::size_t>(request_verb<Request>());
}

[[nodiscard]] const char* to_string(DdlVerb verb) noexcept;

inline DdlDiagnosticSeverity default_diagnostic_severity(std::error_code error) noexcept
{
    if (!error) {
        return DdlDiagnosticSeverity::Info;
    }
    if (error.category() != catalog::catalog_error_category()) {
        return DdlDiagnosticSeverity::Error;
    }

    switch (static_cast<catalog::CatalogErrc>(error.value())) {
    case catalog::CatalogErrc::Success:
        return DdlDiagnosticSeverity::Info;
    case catalog::CatalogErrc::NameConflict:
    case catalog::CatalogErrc::DependencyViolation:
    case catalog::CatalogErrc::VersionConflict:
    case catalog::CatalogErrc::NotFound:
    case catalog::CatalogErrc::InvalidDefinition:
        return DdlDiagnosticSeverity::Warning;
    default:
        return DdlDiagnosticSeverity::Error;
    }
}

inline std::vector<std::string> default_remediation_hints(std::error_code error)
{
    if (!error) {
        return {};
    }
    if (error.category() != catalog::catalog_error_category()) {
        return {"Inspect server logs for additional details."};
    }

    switch (static_cast<catalog::CatalogErrc>(error.value())) {
    case catalog::CatalogErrc::Success:
        return {};
    case catalog::CatalogErrc::NameConflict:
        return {"Use IF NOT EXISTS, drop the existing object, or choose a different name."};
    case catalog::CatalogErrc::DependencyViolation:
        return {"Drop the dependent objects first, then retry."};
    case catalog::CatalogErrc::VersionConflict:
        return {"Fetch the current table version and retry the ALTER against it."};
    case catalog::CatalogErrc::NotFound:
        return {"Confirm the object name and schema are correct."};
    case catalog::CatalogErrc::StoreUnavailable:
        return {"The catalog store rejected the commit; nothing was applied. Retry once the store is reachable."};
    case catalog::CatalogErrc::Inconsistent:
        return {"The catalog failed an internal consistency check. Contact an operator before retrying."};
    case catalog::CatalogErrc::InvalidDefinition:
        return {"Review the validation message and adjust the object definition."};
    default:
        return {"Inspect server logs for additional details."};
    }
}

inline DdlCommandResponse make_success(std::vector<catalog::CatalogObject> objects = {}, std::uint64_t catalog_version = 0U)
{
    DdlCommandResponse response{};
    response.success = true;
    response.severity = DdlDiagnosticSeverity::Info;
    response.objects = std::move(objects);
    response.catalog_version = catalog_version;
    return response;
}

inline DdlCommandResponse make_failure(std::error_code error, std::string message = {})
{
    DdlCommandResponse response{};
    response.success = false;
    response.error = error;
    response.message = std::move(message);
    response.severity = default_diagnostic_severity(response.error);
    response.remediation_hints = default_remediation_hints(response.error);
    return response;
}

}  // namespace streamcat::ddl
