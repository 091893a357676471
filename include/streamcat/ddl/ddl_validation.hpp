#pragma once

#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/catalog/catalog_objects.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace streamcat::ddl {

bool is_valid_identifier(std::string_view name) noexcept;

// Structural checks on a definition before anything is allocated. On failure
// `detail` names the offending field.
std::error_code validate_columns(std::span<const catalog::ColumnDescriptor> columns, std::string& detail);
std::error_code validate_table_definition(const catalog::CatalogTable& table, std::string& detail);
std::error_code validate_source_definition(const catalog::CatalogSource& source, std::string& detail);
std::error_code validate_sink_definition(const catalog::CatalogSink& sink, std::string& detail);
std::error_code validate_function_definition(const catalog::CatalogFunction& function, std::string& detail);
std::error_code validate_view_columns(std::span<const catalog::Field> fields,
                                      std::span<const std::string> column_names,
                                      std::string& detail);

// Watermark columns form an ordered set.
void normalize_index_set(std::vector<std::uint32_t>& indices);

}  // namespace streamcat::ddl
