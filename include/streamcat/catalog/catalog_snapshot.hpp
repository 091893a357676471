#pragma once

#include "streamcat/catalog/catalog_delta.hpp"
#include "streamcat/catalog/catalog_ids.hpp"
#include "streamcat/catalog/catalog_objects.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace streamcat::catalog {

struct RelationRef final {
    CatalogObjectKind kind = CatalogObjectKind::Table;
    RelationId id{};
};

// In-memory view of every live catalog object plus the name indexes used for
// resolution. The writer mutates a private copy and publishes it; once
// published a snapshot is never modified, so readers share it freely.
//
// Relation names are unique per schema across tables, sources, sinks,
// indexes and views. Two relations are exempt from the name index because
// they borrow a visible relation's name: the source backing a connector
// table, and the covering table backing an index.
class CatalogSnapshot final {
public:
    template <typename T>
    using ObjectMap = std::map<std::uint64_t, std::shared_ptr<const T>>;

    using ObjectVisitor = std::function<void(const CatalogObject&)>;

    [[nodiscard]] std::uint64_t catalog_version() const noexcept;
    void set_catalog_version(std::uint64_t version) noexcept;

    // Idempotent: Created for a present id and Dropped for an absent id are no-ops.
    void apply(const CatalogDelta& delta);
    void apply(const CatalogNotification& notification);

    void upsert(CatalogObject object);
    bool erase(CatalogObjectKind kind, std::uint64_t id);

    [[nodiscard]] bool contains(CatalogObjectKind kind, std::uint64_t id) const noexcept;
    [[nodiscard]] std::optional<CatalogObject> object(CatalogObjectKind kind, std::uint64_t id) const;
    [[nodiscard]] std::size_t object_count() const noexcept;
    void for_each_object(const ObjectVisitor& visitor) const;

    [[nodiscard]] std::shared_ptr<const CatalogDatabase> database(DatabaseId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogSchema> schema(SchemaId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogTable> table(RelationId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogSource> source(RelationId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogSink> sink(RelationId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogIndex> index(RelationId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogView> view(RelationId id) const;
    [[nodiscard]] std::shared_ptr<const CatalogFunction> function(FunctionId id) const;

    [[nodiscard]] std::optional<CatalogObjectKind> relation_kind(RelationId id) const;
    [[nodiscard]] bool relation_exists(RelationId id) const;

    [[nodiscard]] std::shared_ptr<const CatalogDatabase> find_database(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const CatalogSchema> find_schema(DatabaseId database_id, std::string_view name) const;
    [[nodiscard]] std::optional<RelationRef> find_relation(SchemaId schema_id, std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const CatalogTable> find_table(SchemaId schema_id, std::string_view name) const;
    // Also resolves the hidden source of a connector table through the table's name.
    [[nodiscard]] std::shared_ptr<const CatalogSource> find_source(SchemaId schema_id, std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const CatalogSink> find_sink(SchemaId schema_id, std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const CatalogIndex> find_index(SchemaId schema_id, std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const CatalogView> find_view(SchemaId schema_id, std::string_view name) const;
    [[nodiscard]] std::shared_ptr<const CatalogFunction> find_function(SchemaId schema_id,
                                                                       std::string_view name,
                                                                       std::span<const CatalogDataType> arg_types) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogFunction>> functions_named(SchemaId schema_id,
                                                                                     std::string_view name) const;

    [[nodiscard]] std::vector<std::shared_ptr<const CatalogDatabase>> databases() const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogSchema>> schemas(DatabaseId database_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogTable>> tables(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogTable>> materialized_views(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogTable>> internal_tables(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogSource>> sources(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogSink>> sinks(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogIndex>> indexes(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogView>> views(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogFunction>> functions(SchemaId schema_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<const CatalogIndex>> indexes_on_table(RelationId table_id) const;

    [[nodiscard]] bool schema_is_empty(SchemaId schema_id) const;

    [[nodiscard]] const ObjectMap<CatalogTable>& all_tables() const noexcept;
    [[nodiscard]] const ObjectMap<CatalogSource>& all_sources() const noexcept;
    [[nodiscard]] const ObjectMap<CatalogSink>& all_sinks() const noexcept;
    [[nodiscard]] const ObjectMap<CatalogIndex>& all_indexes() const noexcept;
    [[nodiscard]] const ObjectMap<CatalogView>& all_views() const noexcept;

private:
    using ScopedName = std::pair<std::uint64_t, std::string>;
    using FunctionSignature = std::tuple<std::uint64_t, std::string, std::vector<CatalogDataType>>;

    template <typename T>
    [[nodiscard]] ObjectMap<T>& map_for() noexcept;
    template <typename T>
    [[nodiscard]] const ObjectMap<T>& map_for() const noexcept;
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> lookup(std::uint64_t id) const;
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> find_relation_as(SchemaId schema_id,
                                                            std::string_view name,
                                                            CatalogObjectKind kind) const;

    void index_object(const CatalogObject& object);
    void unindex_object(const CatalogObject& object);

    std::uint64_t catalog_version_ = 0U;

    ObjectMap<CatalogDatabase> databases_{};
    ObjectMap<CatalogSchema> schemas_{};
    ObjectMap<CatalogTable> tables_{};
    ObjectMap<CatalogSource> sources_{};
    ObjectMap<CatalogSink> sinks_{};
    ObjectMap<CatalogIndex> indexes_{};
    ObjectMap<CatalogView> views_{};
    ObjectMap<CatalogFunction> functions_{};

    std::map<std::string, std::uint64_t, std::less<>> database_names_{};
    std::map<ScopedName, std::uint64_t> schema_names_{};
    std::map<ScopedName, RelationRef> relation_names_{};
    std::map<FunctionSignature, std::uint64_t> function_signatures_{};
    std::map<std::uint64_t, CatalogObjectKind> relation_kinds_{};
    std::map<std::uint64_t, std::set<std::uint64_t>> table_indexes_{};
};

}  // namespace streamcat::catalog
