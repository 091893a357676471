#include "streamcat/ddl/ddl_source_coupling.hpp"

#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/catalog/catalog_snapshot.hpp"
#include "streamcat/ddl/ddl_validation.hpp"

#include <fmt/format.h>

#include <optional>
#include <utility>

namespace streamcat::ddl {

namespace {

using catalog::CatalogErrc;

std::error_code inconsistent(std::string& detail, std::string message)
{
    detail = std::move(message);
    return make_error_code(CatalogErrc::Inconsistent);
}

std::optional<std::uint32_t> position_of(const std::vector<catalog::ColumnDescriptor>& columns, catalog::ColumnId id)
{
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (columns[index].column_id == id) {
            return static_cast<std::uint32_t>(index);
        }
    }
    return std::nullopt;
}

}  // namespace

bool requires_associated_source(const catalog::CatalogTable& table)
{
    return table.properties.find(std::string{kConnectorPropertyKey}) != table.properties.end();
}

std::error_code mirror_table_columns(const catalog::CatalogTable& table,
                                     catalog::CatalogSource& source,
                                     std::string& detail)
{
    std::vector<catalog::WatermarkDesc> watermarks = source.watermark_descs;
    for (auto& watermark : watermarks) {
        if (source.columns.empty()) {
            if (watermark.watermark_idx >= table.columns.size()) {
                detail = fmt::format("watermark column {} is out of range for table '{}'", watermark.watermark_idx, table.name);
                return make_error_code(CatalogErrc::InvalidDefinition);
            }
            continue;
        }

        if (watermark.watermark_idx >= source.columns.size()) {
            return inconsistent(detail,
                                fmt::format("source '{}' has watermark column {} beyond its {} columns",
                                            source.name,
                                            watermark.watermark_idx,
                                            source.columns.size()));
        }
        const auto column_id = source.columns[watermark.watermark_idx].column_id;
        const auto position = position_of(table.columns, column_id);
        if (!position) {
            detail = fmt::format("watermark column '{}' of source '{}' no longer exists in table '{}'",
                                 source.columns[watermark.watermark_idx].name,
                                 source.name,
                                 table.name);
            return make_error_code(CatalogErrc::InvalidDefinition);
        }
        watermark.watermark_idx = *position;
    }

    source.columns = table.columns;
    source.row_id_index = table.row_id_index;
    source.pk_column_ids.clear();
    source.pk_column_ids.reserve(table.pk.size());
    for (const auto& order : table.pk) {
        source.pk_column_ids.push_back(table.columns[order.column_index].column_id);
    }
    source.watermark_descs = std::move(watermarks);
    return {};
}

std::error_code stage_create_table_with_source(catalog::CatalogIdAllocator& allocator,
                                               catalog::CatalogMutator& mutator,
                                               catalog::CatalogTable& table,
                                               catalog::CatalogSource& source,
                                               std::string& detail)
{
    source.columns.clear();
    if (auto ec = mirror_table_columns(table, source, detail)) {
        return ec;
    }

    // Watermarks declared on the source are enforced through the table.
    for (const auto& watermark : source.watermark_descs) {
        table.watermark_indices.push_back(watermark.watermark_idx);
    }
    normalize_index_set(table.watermark_indices);

    table.id = allocator.next_relation_id();
    source.id = allocator.next_relation_id();

    source.schema_id = table.schema_id;
    source.database_id = table.database_id;
    source.name = table.name;
    source.owner = table.owner;
    if (source.properties.empty()) {
        source.properties = table.properties;
    }

    table.associated_source_id = source.id;
    source.associated_table_id = table.id;

    mutator.stage_create(table);
    mutator.stage_create(source);
    return {};
}

std::error_code verify_table_coupling(const catalog::CatalogSnapshot& snapshot,
                                      const catalog::CatalogTable& table,
                                      std::string& detail)
{
    if (!table.associated_source_id) {
        return {};
    }

    const auto source = snapshot.source(*table.associated_source_id);
    if (!source) {
        return inconsistent(detail,
                            fmt::format("table '{}' (id {}) references missing associated source {}",
                                        table.name,
                                        table.id.value,
                                        table.associated_source_id->value));
    }
    if (source->associated_table_id != table.id) {
        return inconsistent(detail,
                            fmt::format("source '{}' (id {}) does not point back to table '{}' (id {})",
                                        source->name,
                                        source->id.value,
                                        table.name,
                                        table.id.value));
    }
    return {};
}

std::error_code stage_drop_table(const catalog::CatalogSnapshot& snapshot,
                                 catalog::CatalogMutator& mutator,
                                 const catalog::CatalogTable& table,
                                 std::vector<catalog::RelationId>& dropped,
                                 std::string& detail)
{
    if (auto ec = verify_table_coupling(snapshot, table, detail)) {
        return ec;
    }

    for (const auto& index : snapshot.indexes_on_table(table.id)) {
        if (snapshot.table(index->index_table_id)) {
            mutator.stage_drop(catalog::CatalogObjectKind::Table, index->index_table_id.value);
            dropped.push_back(index->index_table_id);
        }
        mutator.stage_drop(catalog::CatalogObjectKind::Index, index->id.value);
        dropped.push_back(index->id);
    }

    if (table.associated_source_id) {
        mutator.stage_drop(catalog::CatalogObjectKind::Source, table.associated_source_id->value);
        dropped.push_back(*table.associated_source_id);
    }

    mutator.stage_drop(catalog::CatalogObjectKind::Table, table.id.value);
    dropped.push_back(table.id);
    return {};
}

std::error_code verify_coupling(const catalog::CatalogSnapshot& snapshot, std::string& detail)
{
    for (const auto& [id, table] : snapshot.all_tables()) {
        if (auto ec = verify_table_coupling(snapshot, *table, detail)) {
            return ec;
        }
    }

    for (const auto& [id, source] : snapshot.all_sources()) {
        if (!source->associated_table_id) {
            continue;
        }
        const auto table = snapshot.table(*source->associated_table_id);
        if (!table) {
            return inconsistent(detail,
                                fmt::format("source '{}' (id {}) references missing table {}",
                                            source->name,
                                            id,
                                            source->associated_table_id->value));
        }
        if (table->associated_source_id != source->id) {
            return inconsistent(detail,
                                fmt::format("table '{}' (id {}) does not point back to source '{}' (id {})",
                                            table->name,
                                            table->id.value,
                                            source->name,
                                            id));
        }
    }

    for (const auto& [id, index] : snapshot.all_indexes()) {
        if (!snapshot.table(index->primary_table_id)) {
            return inconsistent(detail,
                                fmt::format("index '{}' (id {}) references missing table {}",
                                            index->name,
                                            id,
                                            index->primary_table_id.value));
        }
        if (!snapshot.table(index->index_table_id)) {
            return inconsistent(detail,
                                fmt::format("index '{}' (id {}) references missing backing table {}",
                                            index->name,
                                            id,
                                            index->index_table_id.value));
        }
    }
    return {};
}

}  // namespace streamcat::ddl
