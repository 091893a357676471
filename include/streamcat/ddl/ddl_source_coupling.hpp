#pragma once

#include "streamcat/catalog/catalog_id_allocator.hpp"
#include "streamcat/catalog/catalog_mutator.hpp"
#include "streamcat/catalog/catalog_objects.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace streamcat::catalog {
class CatalogSnapshot;
}

namespace streamcat::ddl {

// A table carrying this property ingests from an external connector and is
// always created together with its source.
inline constexpr std::string_view kConnectorPropertyKey = "connector";

[[nodiscard]] bool requires_associated_source(const catalog::CatalogTable& table);

// Copies the table's columns, row id index and primary key onto its source.
// Watermark positions of a source that already has columns follow their
// column ids; for a fresh source they are read as table positions.
std::error_code mirror_table_columns(const catalog::CatalogTable& table,
                                     catalog::CatalogSource& source,
                                     std::string& detail);

// Allocates the table id and then the source id, links them both ways and
// stages both creations in the caller's mutator. The table's column ids must
// already be assigned.
std::error_code stage_create_table_with_source(catalog::CatalogIdAllocator& allocator,
                                               catalog::CatalogMutator& mutator,
                                               catalog::CatalogTable& table,
                                               catalog::CatalogSource& source,
                                               std::string& detail);

// Stages the drop of the table, its coupled source, its indexes and their
// backing tables. `dropped` receives every relation id staged for removal.
std::error_code stage_drop_table(const catalog::CatalogSnapshot& snapshot,
                                 catalog::CatalogMutator& mutator,
                                 const catalog::CatalogTable& table,
                                 std::vector<catalog::RelationId>& dropped,
                                 std::string& detail);

std::error_code verify_table_coupling(const catalog::CatalogSnapshot& snapshot,
                                      const catalog::CatalogTable& table,
                                      std::string& detail);

// Checks every table/source pair in both directions and every index against
// its tables.
std::error_code verify_coupling(const catalog::CatalogSnapshot& snapshot, std::string& detail);

}  // namespace streamcat::ddl
