#include "streamcat/ddl/ddl_validation.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace streamcat::ddl {

namespace {

bool is_valid_identifier_char(unsigned char ch) noexcept
{
    return std::isalnum(ch) != 0 || ch == '_' || ch == '$';
}

bool is_valid_identifier_start(unsigned char ch) noexcept
{
    return std::isalpha(ch) != 0 || ch == '_';
}

std::error_code invalid(std::string& detail, std::string message)
{
    detail = std::move(message);
    return make_error_code(catalog::CatalogErrc::InvalidDefinition);
}

std::error_code check_name(std::string_view what, std::string_view name, std::string& detail)
{
    if (is_valid_identifier(name)) {
        return {};
    }
    return invalid(detail, fmt::format("{} name '{}' is not a valid identifier", what, name));
}

std::error_code check_indices(std::string_view field,
                              std::span<const std::uint32_t> indices,
                              std::size_t column_count,
                              std::string& detail)
{
    for (const auto index : indices) {
        if (index >= column_count) {
            return invalid(detail, fmt::format("{} references column {} but only {} columns exist", field, index, column_count));
        }
    }
    return {};
}

std::error_code check_optional_index(std::string_view field,
                                     const catalog::OptionalColumnIndex& index,
                                     std::size_t column_count,
                                     std::string& detail)
{
    if (index && *index >= column_count) {
        return invalid(detail, fmt::format("{} references column {} but only {} columns exist", field, *index, column_count));
    }
    return {};
}

std::error_code check_primary_key(std::span<const catalog::ColumnOrder> pk, std::size_t column_count, std::string& detail)
{
    std::set<std::uint32_t> seen;
    for (const auto& order : pk) {
        if (order.column_index >= column_count) {
            return invalid(detail,
                           fmt::format("primary key references column {} but only {} columns exist", order.column_index, column_count));
        }
        if (!seen.insert(order.column_index).second) {
            return invalid(detail, fmt::format("primary key lists column {} twice", order.column_index));
        }
    }
    return {};
}

}  // namespace

bool is_valid_identifier(std::string_view name) noexcept
{
    if (name.empty()) {
        return false;
    }
    if (!is_valid_identifier_start(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char ch : name) {
        if (!is_valid_identifier_char(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::error_code validate_columns(std::span<const catalog::ColumnDescriptor> columns, std::string& detail)
{
    if (columns.empty()) {
        return invalid(detail, "at least one column is required");
    }

    std::set<std::string_view> names;
    for (const auto& column : columns) {
        if (auto ec = check_name("column", column.name, detail)) {
            return ec;
        }
        if (column.data_type == catalog::CatalogDataType::Unknown) {
            return invalid(detail, fmt::format("column '{}' has no data type", column.name));
        }
        if (!names.insert(column.name).second) {
            return invalid(detail, fmt::format("column '{}' specified more than once", column.name));
        }
    }
    return {};
}

std::error_code validate_table_definition(const catalog::CatalogTable& table, std::string& detail)
{
    if (auto ec = check_name("table", table.name, detail)) {
        return ec;
    }
    if (table.table_type == catalog::TableType::Unspecified) {
        return invalid(detail, fmt::format("table '{}' has no table type", table.name));
    }
    if (auto ec = validate_columns(table.columns, detail)) {
        return ec;
    }

    const auto count = table.columns.size();
    if (auto ec = check_primary_key(table.pk, count, detail)) {
        return ec;
    }
    if (auto ec = check_indices("distribution key", table.distribution_key, count, detail)) {
        return ec;
    }
    if (auto ec = check_indices("stream key", table.stream_key, count, detail)) {
        return ec;
    }
    if (auto ec = check_indices("value indices", table.value_indices, count, detail)) {
        return ec;
    }
    if (auto ec = check_indices("watermark indices", table.watermark_indices, count, detail)) {
        return ec;
    }
    if (auto ec = check_optional_index("row id index", table.row_id_index, count, detail)) {
        return ec;
    }
    return check_optional_index("vnode column index", table.vnode_col_index, count, detail);
}

std::error_code validate_source_definition(const catalog::CatalogSource& source, std::string& detail)
{
    if (auto ec = check_name("source", source.name, detail)) {
        return ec;
    }
    if (auto ec = validate_columns(source.columns, detail)) {
        return ec;
    }
    if (auto ec = check_optional_index("row id index", source.row_id_index, source.columns.size(), detail)) {
        return ec;
    }

    std::set<std::int32_t> column_ids;
    for (const auto& column : source.columns) {
        if (!column_ids.insert(column.column_id.value).second) {
            return invalid(detail, fmt::format("column id {} assigned to more than one column", column.column_id.value));
        }
    }
    for (const auto pk_id : source.pk_column_ids) {
        if (column_ids.count(pk_id.value) == 0U) {
            return invalid(detail, fmt::format("primary key references unknown column id {}", pk_id.value));
        }
    }
    for (const auto& watermark : source.watermark_descs) {
        if (watermark.watermark_idx >= source.columns.size()) {
            return invalid(detail,
                           fmt::format("watermark references column {} but only {} columns exist",
                                       watermark.watermark_idx,
                                       source.columns.size()));
        }
        if (watermark.expr.empty()) {
            return invalid(detail, fmt::format("watermark on column {} has no expression", watermark.watermark_idx));
        }
    }
    return {};
}

std::error_code validate_sink_definition(const catalog::CatalogSink& sink, std::string& detail)
{
    if (auto ec = check_name("sink", sink.name, detail)) {
        return ec;
    }
    if (auto ec = validate_columns(sink.columns, detail)) {
        return ec;
    }

    const auto count = sink.columns.size();
    if (auto ec = check_primary_key(sink.pk, count, detail)) {
        return ec;
    }
    if (auto ec = check_indices("distribution key", sink.distribution_key, count, detail)) {
        return ec;
    }
    return check_indices("stream key", sink.stream_key, count, detail);
}

std::error_code validate_function_definition(const catalog::CatalogFunction& function, std::string& detail)
{
    if (auto ec = check_name("function", function.name, detail)) {
        return ec;
    }
    if (function.return_type == catalog::CatalogDataType::Unknown) {
        return invalid(detail, fmt::format("function '{}' has no return type", function.name));
    }
    if (std::find(function.arg_types.begin(), function.arg_types.end(), catalog::CatalogDataType::Unknown)
        != function.arg_types.end()) {
        return invalid(detail, fmt::format("function '{}' has an argument without a type", function.name));
    }
    if (function.language.empty()) {
        return invalid(detail, fmt::format("function '{}' has no implementation language", function.name));
    }
    return {};
}

std::error_code validate_view_columns(std::span<const catalog::Field> fields,
                                      std::span<const std::string> column_names,
                                      std::string& detail)
{
    if (fields.empty()) {
        return invalid(detail, "view query produces no columns");
    }
    if (column_names.empty()) {
        return {};
    }
    if (column_names.size() != fields.size()) {
        return invalid(detail,
                       fmt::format("view specifies {} column names but its query produces {} columns",
                                   column_names.size(),
                                   fields.size()));
    }

    std::set<std::string_view> names;
    for (const auto& name : column_names) {
        if (auto ec = check_name("column", name, detail)) {
            return ec;
        }
        if (!names.insert(name).second) {
            return invalid(detail, fmt::format("column '{}' specified more than once", name));
        }
    }
    return {};
}

void normalize_index_set(std::vector<std::uint32_t>& indices)
{
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
}

}  // namespace streamcat::ddl
