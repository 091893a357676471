#include "streamcat/ddl/ddl_schema_evolution.hpp"

#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/catalog/catalog_id_allocator.hpp"
#include "streamcat/ddl/ddl_validation.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <utility>
#include <variant>

namespace streamcat::ddl {

namespace {

using catalog::CatalogErrc;

std::error_code fail(CatalogErrc code, std::string& detail, std::string message)
{
    detail = std::move(message);
    return make_error_code(code);
}

std::optional<std::uint32_t> find_column(const catalog::CatalogTable& table, std::string_view name)
{
    for (std::size_t index = 0U; index < table.columns.size(); ++index) {
        if (table.columns[index].name == name) {
            return static_cast<std::uint32_t>(index);
        }
    }
    return std::nullopt;
}

bool contains_index(const std::vector<std::uint32_t>& indices, std::uint32_t position)
{
    return std::find(indices.begin(), indices.end(), position) != indices.end();
}

bool in_primary_key(const catalog::CatalogTable& table, std::uint32_t position)
{
    return std::any_of(table.pk.begin(), table.pk.end(), [position](const auto& order) {
        return order.column_index == position;
    });
}

// Name of the key the column participates in, or nullptr when it is free to drop.
const char* key_role(const catalog::CatalogTable& table, std::uint32_t position)
{
    if (in_primary_key(table, position)) {
        return "the primary key";
    }
    if (contains_index(table.distribution_key, position)) {
        return "the distribution key";
    }
    if (contains_index(table.stream_key, position)) {
        return "the stream key";
    }
    if (contains_index(table.watermark_indices, position)) {
        return "a watermark";
    }
    if (table.row_id_index == position) {
        return "the row id";
    }
    if (table.vnode_col_index == position) {
        return "the vnode column";
    }
    return nullptr;
}

void shift_after_drop(std::vector<std::uint32_t>& indices, std::uint32_t position)
{
    indices.erase(std::remove(indices.begin(), indices.end(), position), indices.end());
    for (auto& index : indices) {
        if (index > position) {
            --index;
        }
    }
}

void shift_after_drop(catalog::OptionalColumnIndex& index, std::uint32_t position)
{
    if (index && *index > position) {
        --*index;
    }
}

std::error_code apply_add_column(catalog::CatalogTable& table,
                                 catalog::TableVersion& next,
                                 const AlterTableAddColumn& action,
                                 SchemaEvolutionResult& result,
                                 std::string& detail)
{
    if (find_column(table, action.column.name)) {
        if (action.if_not_exists) {
            return {};
        }
        return fail(CatalogErrc::NameConflict,
                    detail,
                    fmt::format("column '{}' already exists in table '{}'", action.column.name, table.name));
    }
    if (!is_valid_identifier(action.column.name)) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("column name '{}' is not a valid identifier", action.column.name));
    }
    if (action.column.data_type == catalog::CatalogDataType::Unknown) {
        return fail(CatalogErrc::InvalidDefinition, detail, fmt::format("column '{}' has no data type", action.column.name));
    }

    catalog::ColumnDescriptor column = action.column;
    column.column_id = allocate_column(next);
    column.is_hidden = false;

    table.value_indices.push_back(static_cast<std::uint32_t>(table.columns.size()));
    table.columns.push_back(std::move(column));
    result.added_columns.push_back(table.columns.back().column_id);
    result.columns_changed = true;
    return {};
}

std::error_code apply_drop_column(catalog::CatalogTable& table,
                                  const AlterTableDropColumn& action,
                                  SchemaEvolutionResult& result,
                                  std::string& detail)
{
    const auto position = find_column(table, action.column_name);
    if (!position) {
        if (action.if_exists) {
            return {};
        }
        return fail(CatalogErrc::NotFound,
                    detail,
                    fmt::format("column '{}' does not exist in table '{}'", action.column_name, table.name));
    }

    const auto& column = table.columns[*position];
    if (column.is_hidden) {
        return fail(CatalogErrc::InvalidDefinition, detail, fmt::format("cannot drop hidden column '{}'", column.name));
    }
    if (const auto* role = key_role(table, *position)) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("cannot drop column '{}' because it is part of {}", column.name, role));
    }

    const auto visible = std::count_if(table.columns.begin(), table.columns.end(), [](const auto& entry) {
        return !entry.is_hidden;
    });
    if (visible <= 1) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("cannot drop column '{}' because it is the last column of table '{}'", column.name, table.name));
    }

    result.dropped_columns.push_back(column.column_id);
    table.columns.erase(table.columns.begin() + *position);

    for (auto& order : table.pk) {
        if (order.column_index > *position) {
            --order.column_index;
        }
    }
    shift_after_drop(table.distribution_key, *position);
    shift_after_drop(table.stream_key, *position);
    shift_after_drop(table.value_indices, *position);
    shift_after_drop(table.watermark_indices, *position);
    shift_after_drop(table.row_id_index, *position);
    shift_after_drop(table.vnode_col_index, *position);
    result.columns_changed = true;
    return {};
}

std::error_code apply_rename_column(catalog::CatalogTable& table,
                                    const AlterTableRenameColumn& action,
                                    SchemaEvolutionResult& result,
                                    std::string& detail)
{
    const auto position = find_column(table, action.column_name);
    if (!position) {
        return fail(CatalogErrc::NotFound,
                    detail,
                    fmt::format("column '{}' does not exist in table '{}'", action.column_name, table.name));
    }
    if (table.columns[*position].is_hidden) {
        return fail(CatalogErrc::InvalidDefinition, detail, fmt::format("cannot rename hidden column '{}'", action.column_name));
    }
    if (!is_valid_identifier(action.new_column_name)) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("column name '{}' is not a valid identifier", action.new_column_name));
    }
    if (find_column(table, action.new_column_name)) {
        return fail(CatalogErrc::NameConflict,
                    detail,
                    fmt::format("column '{}' already exists in table '{}'", action.new_column_name, table.name));
    }

    table.columns[*position].name = action.new_column_name;
    result.columns_changed = true;
    return {};
}

std::error_code apply_alter_column_type(catalog::CatalogTable& table,
                                        const AlterTableAlterColumnType& action,
                                        SchemaEvolutionResult& result,
                                        std::string& detail)
{
    const auto position = find_column(table, action.column_name);
    if (!position) {
        return fail(CatalogErrc::NotFound,
                    detail,
                    fmt::format("column '{}' does not exist in table '{}'", action.column_name, table.name));
    }

    auto& column = table.columns[*position];
    if (column.is_hidden) {
        return fail(CatalogErrc::InvalidDefinition, detail, fmt::format("cannot change type of hidden column '{}'", column.name));
    }
    if (action.data_type == catalog::CatalogDataType::Unknown) {
        return fail(CatalogErrc::InvalidDefinition, detail, fmt::format("column '{}' has no data type", column.name));
    }
    if (in_primary_key(table, *position) || contains_index(table.distribution_key, *position)) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("cannot change type of key column '{}'", column.name));
    }

    column.data_type = action.data_type;
    result.columns_changed = true;
    return {};
}

std::error_code apply_rename_table(catalog::CatalogTable& table,
                                   const AlterTableRenameTable& action,
                                   SchemaEvolutionResult& result,
                                   std::string& detail)
{
    if (!is_valid_identifier(action.new_table_name)) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("table name '{}' is not a valid identifier", action.new_table_name));
    }
    table.name = action.new_table_name;
    result.renamed = true;
    return {};
}

}  // namespace

void assign_initial_column_ids(catalog::CatalogTable& table)
{
    catalog::TableVersion version{};
    version.version = 0U;
    version.next_column_id = catalog::kFirstUserColumnId;

    for (std::size_t index = 0U; index < table.columns.size(); ++index) {
        if (table.row_id_index == index) {
            table.columns[index].column_id = catalog::kRowIdColumnId;
            continue;
        }
        table.columns[index].column_id = allocate_column(version);
    }
    table.version = version;
}

std::error_code begin_alter(const catalog::CatalogTable& table,
                            std::uint64_t expected_version,
                            catalog::TableVersion& next,
                            std::string& detail)
{
    if (!table.version) {
        return fail(CatalogErrc::InvalidDefinition,
                    detail,
                    fmt::format("table '{}' does not support ALTER", table.name));
    }
    if (table.version->version != expected_version) {
        return fail(CatalogErrc::VersionConflict,
                    detail,
                    fmt::format("table '{}' is at version {} but the request expected version {}",
                                table.name,
                                table.version->version,
                                expected_version));
    }

    next.version = table.version->version + 1U;
    next.next_column_id = table.version->next_column_id;
    return {};
}

catalog::ColumnId allocate_column(catalog::TableVersion& version)
{
    return catalog::CatalogIdAllocator::next_column_id(version);
}

std::error_code verify_version_successor(const catalog::TableVersion& current,
                                         const catalog::TableVersion& proposed,
                                         std::string& detail)
{
    if (proposed.version != current.version + 1U) {
        return fail(CatalogErrc::VersionConflict,
                    detail,
                    fmt::format("table version {} cannot follow version {}", proposed.version, current.version));
    }
    if (proposed.next_column_id < current.next_column_id) {
        return fail(CatalogErrc::Inconsistent,
                    detail,
                    fmt::format("next column id moved backwards from {} to {}",
                                current.next_column_id.value,
                                proposed.next_column_id.value));
    }
    return {};
}

std::error_code evolve_table(const catalog::CatalogTable& table,
                             std::uint64_t expected_version,
                             std::span<const AlterTableAction> actions,
                             SchemaEvolutionResult& result,
                             std::string& detail)
{
    catalog::TableVersion next{};
    if (auto ec = begin_alter(table, expected_version, next, detail)) {
        return ec;
    }
    if (actions.empty()) {
        return fail(CatalogErrc::InvalidDefinition, detail, fmt::format("ALTER TABLE '{}' has no actions", table.name));
    }

    result = SchemaEvolutionResult{};
    result.table = table;

    for (const auto& action : actions) {
        std::error_code ec{};
        if (std::holds_alternative<AlterTableAddColumn>(action)) {
            ec = apply_add_column(result.table, next, std::get<AlterTableAddColumn>(action), result, detail);
        } else if (std::holds_alternative<AlterTableDropColumn>(action)) {
            ec = apply_drop_column(result.table, std::get<AlterTableDropColumn>(action), result, detail);
        } else if (std::holds_alternative<AlterTableRenameColumn>(action)) {
            ec = apply_rename_column(result.table, std::get<AlterTableRenameColumn>(action), result, detail);
        } else if (std::holds_alternative<AlterTableAlterColumnType>(action)) {
            ec = apply_alter_column_type(result.table, std::get<AlterTableAlterColumnType>(action), result, detail);
        } else if (std::holds_alternative<AlterTableRenameTable>(action)) {
            ec = apply_rename_table(result.table, std::get<AlterTableRenameTable>(action), result, detail);
        }
        if (ec) {
            return ec;
        }
    }

    result.table.version = next;
    return verify_version_successor(*table.version, next, detail);
}

}  // namespace streamcat::ddl
