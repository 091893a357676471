#pragma once

#include "streamcat/catalog/catalog_objects.hpp"
#include "streamcat/ddl/ddl_command.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace streamcat::ddl {

struct SchemaEvolutionResult final {
    catalog::CatalogTable table{};
    std::vector<catalog::ColumnId> added_columns{};
    std::vector<catalog::ColumnId> dropped_columns{};
    bool columns_changed = false;
    bool renamed = false;
};

// Gives a new table its first column ids: the row id column takes id 0, the
// remaining columns 1, 2, ... in order, and the version starts at 0.
void assign_initial_column_ids(catalog::CatalogTable& table);

// Returns {current + 1, next_column_id unchanged}. Rejects tables without a
// version and callers whose expected version is stale.
std::error_code begin_alter(const catalog::CatalogTable& table,
                            std::uint64_t expected_version,
                            catalog::TableVersion& next,
                            std::string& detail);

[[nodiscard]] catalog::ColumnId allocate_column(catalog::TableVersion& version);

std::error_code verify_version_successor(const catalog::TableVersion& current,
                                         const catalog::TableVersion& proposed,
                                         std::string& detail);

// Applies every action to a copy of `table`. Column ids survive renames and
// type changes; dropped ids are never handed out again.
std::error_code evolve_table(const catalog::CatalogTable& table,
                             std::uint64_t expected_version,
                             std::span<const AlterTableAction> actions,
                             SchemaEvolutionResult& result,
                             std::string& detail);

}  // namespace streamcat::ddl
