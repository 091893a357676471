#include "streamcat/ddl/catalog_manager.hpp"

#include "streamcat/catalog/catalog_encoding.hpp"
#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/catalog/catalog_mutator.hpp"
#include "streamcat/catalog/catalog_transaction.hpp"
#include "streamcat/ddl/ddl_schema_evolution.hpp"
#include "streamcat/ddl/ddl_source_coupling.hpp"
#include "streamcat/ddl/ddl_validation.hpp"
#include "streamcat/notify/notification_broadcaster.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <set>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace streamcat::ddl {

namespace {

using catalog::CatalogErrc;
using catalog::CatalogObjectKind;

constexpr std::string_view kDefaultSchemaName = "public";

std::string schema_missing(catalog::SchemaId schema_id)
{
    return fmt::format("schema {} does not exist", schema_id.value);
}

std::string describe_relation(const catalog::CatalogSnapshot& snapshot, catalog::RelationId id)
{
    const auto kind = snapshot.relation_kind(id);
    if (!kind) {
        return fmt::format("relation {}", id.value);
    }
    const auto object = snapshot.object(*kind, id.value);
    return fmt::format("{} '{}' (id {})", catalog::to_string(*kind), catalog::object_name(*object), id.value);
}

std::string describe_relations(const catalog::CatalogSnapshot& snapshot, const std::vector<catalog::RelationId>& ids)
{
    std::string text;
    for (const auto id : ids) {
        if (!text.empty()) {
            text += ", ";
        }
        text += describe_relation(snapshot, id);
    }
    return text;
}

// Readers of any relation in the dropped set that are not themselves dropped.
std::vector<catalog::RelationId> outside_dependents(const DdlDependencyGraph& graph,
                                                   const std::vector<catalog::RelationId>& dropped)
{
    std::set<catalog::RelationId> blocking;
    for (const auto id : dropped) {
        for (const auto reader : graph.dependents(id)) {
            if (std::find(dropped.begin(), dropped.end(), reader) == dropped.end()) {
                blocking.insert(reader);
            }
        }
    }
    return {blocking.begin(), blocking.end()};
}

std::error_code check_references(const catalog::CatalogSnapshot& snapshot,
                                 const std::vector<catalog::RelationId>& references,
                                 std::string& detail)
{
    for (const auto reference : references) {
        if (!snapshot.relation_exists(reference)) {
            detail = fmt::format("referenced relation {} does not exist", reference.value);
            return make_error_code(CatalogErrc::NotFound);
        }
    }
    return {};
}

std::optional<std::uint32_t> visible_column(const catalog::CatalogTable& table, std::string_view name)
{
    for (std::size_t index = 0U; index < table.columns.size(); ++index) {
        if (!table.columns[index].is_hidden && table.columns[index].name == name) {
            return static_cast<std::uint32_t>(index);
        }
    }
    return std::nullopt;
}

std::optional<catalog::CatalogObject> existing_relation(const catalog::CatalogSnapshot& snapshot,
                                                        const catalog::RelationRef& ref)
{
    return snapshot.object(ref.kind, ref.id.value);
}

}  // namespace

const char* to_string(CatalogRequestState state) noexcept
{
    switch (state) {
    case CatalogRequestState::Idle:
        return "idle";
    case CatalogRequestState::Validating:
        return "validating";
    case CatalogRequestState::Allocating:
        return "allocating";
    case CatalogRequestState::Committing:
        return "committing";
    case CatalogRequestState::Broadcasting:
        return "broadcasting";
    case CatalogRequestState::Done:
        return "done";
    case CatalogRequestState::Rejected:
        return "rejected";
    case CatalogRequestState::Aborted:
        return "aborted";
    default:
        return "unknown";
    }
}

// Transaction and mutator for one request, bound to the id allocator. An
// uncommitted scope aborts on exit so pending ids are always returned.
struct CatalogManager::WriteScope final {
    WriteScope(std::uint64_t transaction_id, catalog::CatalogIdAllocator& allocator)
        : transaction{transaction_id}
        , mutator{catalog::CatalogMutator::Config{&transaction}}
    {
        allocator.attach(transaction, mutator);
    }

    ~WriteScope()
    {
        if (transaction.is_active()) {
            (void)transaction.abort();
        }
    }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    catalog::CatalogTransaction transaction;
    catalog::CatalogMutator mutator;
};

CatalogManager::CatalogManager(Config config)
    : config_{config}
    , allocator_{config.id_allocator}
    , snapshot_{std::make_shared<const catalog::CatalogSnapshot>()}
{
    if (config_.store == nullptr) {
        throw std::invalid_argument{"CatalogManager requires a catalog store"};
    }
    if (config_.broadcaster == nullptr) {
        throw std::invalid_argument{"CatalogManager requires a notification broadcaster"};
    }
}

std::error_code CatalogManager::recover()
{
    std::lock_guard writer{writer_mutex_};

    catalog::CatalogStoreContents contents;
    if (auto ec = config_.store->load_all(contents)) {
        SPDLOG_ERROR("catalog recovery could not load the store: {}", ec.message());
        return CatalogErrc::StoreUnavailable;
    }

    auto recovered = std::make_shared<catalog::CatalogSnapshot>();
    allocator_.reset();

    for (const auto& [key, value] : contents) {
        if (catalog::is_id_watermark_key(key)) {
            const auto watermark = catalog::decode_id_watermark(value);
            if (!watermark) {
                SPDLOG_ERROR("catalog recovery found an undecodable id watermark under '{}'", key);
                return CatalogErrc::Inconsistent;
            }
            allocator_.advance_to(watermark->category, watermark->last_allocated);
            continue;
        }

        auto object = catalog::decode_catalog_object(value);
        if (!object) {
            SPDLOG_ERROR("catalog recovery found an undecodable object under '{}'", key);
            return CatalogErrc::Inconsistent;
        }
        if (catalog::catalog_object_key(*object) != key) {
            SPDLOG_ERROR("catalog recovery found {} {} stored under foreign key '{}'",
                         catalog::to_string(catalog::object_kind(*object)),
                         catalog::object_id(*object),
                         key);
            return CatalogErrc::Inconsistent;
        }

        allocator_.observe(catalog::object_kind(*object), catalog::object_id(*object));
        recovered->upsert(std::move(*object));
    }

    std::string detail;
    if (auto ec = verify_coupling(*recovered, detail)) {
        SPDLOG_ERROR("catalog recovery detected an inconsistent catalog: {}", detail);
        return ec;
    }

    recovered->set_catalog_version(config_.broadcaster->current_version());
    graph_.rebuild(*recovered);

    SPDLOG_INFO("catalog recovered {} objects and {} dependency edges at version {}",
                recovered->object_count(),
                graph_.edge_count(),
                recovered->catalog_version());

    publish_snapshot(std::move(recovered));
    set_state(CatalogRequestState::Idle);
    return {};
}

std::shared_ptr<const catalog::CatalogSnapshot> CatalogManager::snapshot() const
{
    std::lock_guard guard{snapshot_mutex_};
    return snapshot_;
}

CatalogRequestState CatalogManager::last_request_state() const noexcept
{
    return state_.load(std::memory_order_acquire);
}

std::uint64_t CatalogManager::catalog_version() const
{
    return snapshot()->catalog_version();
}

std::vector<catalog::RelationId> CatalogManager::dependents(catalog::RelationId relation_id) const
{
    std::lock_guard writer{writer_mutex_};
    return graph_.dependents(relation_id);
}

std::uint64_t CatalogManager::last_allocated_id(catalog::CatalogIdCategory category) const
{
    std::lock_guard writer{writer_mutex_};
    return allocator_.last_allocated(category);
}

DdlCommandResponse CatalogManager::create_database(const CreateDatabaseRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    if (!is_valid_identifier(request.name)) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("database name '{}' is not a valid identifier", request.name));
    }
    if (auto existing = base->find_database(request.name)) {
        if (request.if_not_exists) {
            return unchanged(catalog::CatalogObject{*existing});
        }
        return reject(CatalogErrc::NameConflict, fmt::format("database '{}' already exists", request.name));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};

    catalog::CatalogDatabase database{};
    database.id = allocator_.next_database_id();
    database.name = request.name;
    database.owner = request.owner;

    catalog::CatalogSchema schema{};
    schema.id = allocator_.next_schema_id();
    schema.database_id = database.id;
    schema.name = std::string{kDefaultSchemaName};
    schema.owner = request.owner;

    scope.mutator.stage_create(database);
    scope.mutator.stage_create(schema);
    return commit(scope, *base, {database, schema}, {});
}

DdlCommandResponse CatalogManager::drop_database(const DropDatabaseRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto database = base->find_database(request.name);
    if (!database) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound, fmt::format("database '{}' does not exist", request.name));
    }

    const auto schemas = base->schemas(database->id);
    for (const auto& schema : schemas) {
        if (!base->schema_is_empty(schema->id)) {
            return reject(CatalogErrc::DependencyViolation,
                          fmt::format("database '{}' is not empty: schema '{}' still contains objects",
                                      database->name,
                                      schema->name));
        }
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    for (const auto& schema : schemas) {
        scope.mutator.stage_drop(CatalogObjectKind::Schema, schema->id.value);
    }
    scope.mutator.stage_drop(CatalogObjectKind::Database, database->id.value);
    return commit(scope, *base, {}, {});
}

DdlCommandResponse CatalogManager::create_schema(const CreateSchemaRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto database = base->database(request.database_id);
    if (!database) {
        return reject(CatalogErrc::NotFound, fmt::format("database {} does not exist", request.database_id.value));
    }
    if (!is_valid_identifier(request.name)) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("schema name '{}' is not a valid identifier", request.name));
    }
    if (auto existing = base->find_schema(request.database_id, request.name)) {
        if (request.if_not_exists) {
            return unchanged(catalog::CatalogObject{*existing});
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("schema '{}' already exists in database '{}'", request.name, database->name));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};

    catalog::CatalogSchema schema{};
    schema.id = allocator_.next_schema_id();
    schema.database_id = database->id;
    schema.name = request.name;
    schema.owner = request.owner;

    scope.mutator.stage_create(schema);
    return commit(scope, *base, {schema}, {});
}

DdlCommandResponse CatalogManager::drop_schema(const DropSchemaRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto schema = base->find_schema(request.database_id, request.name);
    if (!schema) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("schema '{}' does not exist in database {}", request.name, request.database_id.value));
    }
    if (!base->schema_is_empty(schema->id)) {
        return reject(CatalogErrc::DependencyViolation, fmt::format("schema '{}' still contains objects", schema->name));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    scope.mutator.stage_drop(CatalogObjectKind::Schema, schema->id.value);
    return commit(scope, *base, {}, {});
}

DdlCommandResponse CatalogManager::create_table(const CreateTableRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    auto table = request.table;
    if (table.table_type == catalog::TableType::Unspecified) {
        table.table_type = catalog::TableType::Table;
    }
    if (table.table_type != catalog::TableType::Table && table.table_type != catalog::TableType::Internal) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("CREATE TABLE cannot create {} '{}'", catalog::to_string(table.table_type), table.name));
    }

    const auto schema = base->schema(table.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(table.schema_id));
    }
    table.database_id = schema->database_id;

    std::string detail;
    if (auto ec = validate_table_definition(table, detail)) {
        return reject(ec, detail);
    }
    if (auto existing = base->find_relation(table.schema_id, table.name)) {
        if (request.if_not_exists) {
            return unchanged(existing_relation(*base, *existing));
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("relation '{}' already exists in schema '{}'", table.name, schema->name));
    }
    if (auto ec = check_references(*base, table.dependent_relations, detail)) {
        return reject(ec, detail);
    }

    const bool coupled = request.source.has_value() || requires_associated_source(table);
    if (coupled && table.table_type != catalog::TableType::Table) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("{} '{}' cannot ingest from a connector", catalog::to_string(table.table_type), table.name));
    }

    table.associated_source_id.reset();
    assign_initial_column_ids(table);
    if (table.table_type == catalog::TableType::Internal) {
        table.version.reset();
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};

    std::vector<catalog::CatalogObject> objects;
    if (coupled) {
        auto source = request.source.value_or(catalog::CatalogSource{});
        source.associated_table_id.reset();
        if (auto ec = stage_create_table_with_source(allocator_, scope.mutator, table, source, detail)) {
            return reject(ec, detail);
        }
        objects.emplace_back(table);
        objects.emplace_back(std::move(source));
    } else {
        table.id = allocator_.next_relation_id();
        scope.mutator.stage_create(table);
        objects.emplace_back(table);
    }

    return commit(scope, *base, std::move(objects), [table_id = table.id, references = table.dependent_relations](DdlDependencyGraph& graph) {
        graph.add_edges(table_id, references);
    });
}

DdlCommandResponse CatalogManager::alter_table(const AlterTableRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto table = base->find_table(request.schema_id, request.name);
    if (!table) {
        return reject(CatalogErrc::NotFound,
                      fmt::format("table '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    if (table->table_type != catalog::TableType::Table) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("ALTER TABLE cannot modify {} '{}'", catalog::to_string(table->table_type), table->name));
    }

    std::string detail;
    SchemaEvolutionResult result{};
    if (auto ec = evolve_table(*table, request.expected_version, request.actions, result, detail)) {
        return reject(ec, detail);
    }

    if (!result.dropped_columns.empty()) {
        const auto indexes = base->indexes_on_table(table->id);
        auto readers = graph_.dependents(table->id);
        if (table->associated_source_id) {
            for (const auto reader : graph_.dependents(*table->associated_source_id)) {
                readers.push_back(reader);
            }
        }
        if (!indexes.empty() || !readers.empty()) {
            std::vector<catalog::RelationId> blocking = readers;
            for (const auto& index : indexes) {
                blocking.push_back(index->id);
            }
            return reject(CatalogErrc::DependencyViolation,
                          fmt::format("cannot drop columns of table '{}' while {} depend on it",
                                      table->name,
                                      describe_relations(*base, blocking)));
        }
    }

    if (result.renamed) {
        if (auto existing = base->find_relation(table->schema_id, result.table.name); existing && existing->id != table->id) {
            return reject(CatalogErrc::NameConflict,
                          fmt::format("relation '{}' already exists in schema {}", result.table.name, table->schema_id.value));
        }
    }
    if (!request.definition.empty()) {
        result.table.definition = request.definition;
    }

    std::optional<catalog::CatalogSource> source;
    if (table->associated_source_id) {
        if (auto ec = verify_table_coupling(*base, *table, detail)) {
            SPDLOG_ERROR("ALTER TABLE '{}' found an inconsistent catalog: {}", table->name, detail);
            return reject(ec, detail);
        }
        if (result.columns_changed || result.renamed) {
            source = *base->source(*table->associated_source_id);
            if (auto ec = mirror_table_columns(result.table, *source, detail)) {
                return reject(ec, detail);
            }
            source->name = result.table.name;
        }
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};

    std::vector<catalog::CatalogObject> objects;
    scope.mutator.stage_alter(result.table);
    objects.emplace_back(result.table);
    if (source) {
        scope.mutator.stage_alter(*source);
        objects.emplace_back(std::move(*source));
    }
    return commit(scope, *base, std::move(objects), {});
}

DdlCommandResponse CatalogManager::drop_table(const DropTableRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto table = base->find_table(request.schema_id, request.name);
    if (!table) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("table '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    if (table->table_type == catalog::TableType::MaterializedView) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("'{}' is a materialized view; use DROP MATERIALIZED VIEW", table->name));
    }
    return drop_table_like(*base, *table);
}

DdlCommandResponse CatalogManager::create_source(const CreateSourceRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    auto source = request.source;
    const auto schema = base->schema(source.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(source.schema_id));
    }
    source.database_id = schema->database_id;

    std::string detail;
    if (auto ec = validate_source_definition(source, detail)) {
        return reject(ec, detail);
    }
    if (source.associated_table_id) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("source '{}' cannot name an owning table; create the table with a connector instead",
                                  source.name));
    }
    if (auto existing = base->find_relation(source.schema_id, source.name)) {
        if (request.if_not_exists) {
            return unchanged(existing_relation(*base, *existing));
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("relation '{}' already exists in schema '{}'", source.name, schema->name));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    source.id = allocator_.next_relation_id();
    scope.mutator.stage_create(source);
    return commit(scope, *base, {source}, {});
}

DdlCommandResponse CatalogManager::drop_source(const DropSourceRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto source = base->find_source(request.schema_id, request.name);
    if (!source) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("source '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    if (source->associated_table_id) {
        return reject(CatalogErrc::DependencyViolation,
                      fmt::format("source '{}' belongs to table {}; drop the table instead",
                                  source->name,
                                  source->associated_table_id->value));
    }
    return drop_relation(*base, CatalogObjectKind::Source, source->id, source->name);
}

DdlCommandResponse CatalogManager::create_sink(const CreateSinkRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    auto sink = request.sink;
    const auto schema = base->schema(sink.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(sink.schema_id));
    }
    sink.database_id = schema->database_id;

    std::string detail;
    if (auto ec = validate_sink_definition(sink, detail)) {
        return reject(ec, detail);
    }
    if (auto existing = base->find_relation(sink.schema_id, sink.name)) {
        if (request.if_not_exists) {
            return unchanged(existing_relation(*base, *existing));
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("relation '{}' already exists in schema '{}'", sink.name, schema->name));
    }
    if (auto ec = check_references(*base, sink.dependent_relations, detail)) {
        return reject(ec, detail);
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    sink.id = allocator_.next_relation_id();
    scope.mutator.stage_create(sink);
    return commit(scope, *base, {sink}, [sink_id = sink.id, references = sink.dependent_relations](DdlDependencyGraph& graph) {
        graph.add_edges(sink_id, references);
    });
}

DdlCommandResponse CatalogManager::drop_sink(const DropSinkRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto sink = base->find_sink(request.schema_id, request.name);
    if (!sink) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("sink '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    return drop_relation(*base, CatalogObjectKind::Sink, sink->id, sink->name);
}

DdlCommandResponse CatalogManager::create_index(const CreateIndexRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto schema = base->schema(request.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(request.schema_id));
    }
    if (!is_valid_identifier(request.index_name)) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("index name '{}' is not a valid identifier", request.index_name));
    }
    if (auto existing = base->find_relation(request.schema_id, request.index_name)) {
        if (request.if_not_exists) {
            return unchanged(existing_relation(*base, *existing));
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("relation '{}' already exists in schema '{}'", request.index_name, schema->name));
    }

    const auto table = base->find_table(request.schema_id, request.table_name);
    if (!table) {
        return reject(CatalogErrc::NotFound,
                      fmt::format("table '{}' does not exist in schema '{}'", request.table_name, schema->name));
    }
    if (table->table_type != catalog::TableType::Table && table->table_type != catalog::TableType::MaterializedView) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("cannot index {} '{}'", catalog::to_string(table->table_type), table->name));
    }
    if (request.column_names.empty()) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("index '{}' must name at least one column", request.index_name));
    }

    std::string detail;
    std::vector<std::uint32_t> index_columns;
    std::vector<std::uint32_t> include_columns;
    std::set<std::uint32_t> seen;
    const auto resolve = [&](const std::vector<std::string>& names, std::vector<std::uint32_t>& out) -> std::error_code {
        for (const auto& name : names) {
            const auto position = visible_column(*table, name);
            if (!position) {
                detail = fmt::format("column '{}' does not exist in table '{}'", name, table->name);
                return CatalogErrc::NotFound;
            }
            if (!seen.insert(*position).second) {
                detail = fmt::format("column '{}' is listed more than once in index '{}'", name, request.index_name);
                return CatalogErrc::InvalidDefinition;
            }
            out.push_back(*position);
        }
        return {};
    };
    if (auto ec = resolve(request.column_names, index_columns)) {
        return reject(ec, detail);
    }
    if (auto ec = resolve(request.include_column_names, include_columns)) {
        return reject(ec, detail);
    }

    // Backing table layout: index columns, included columns, then any
    // primary key column of the indexed table not already present.
    std::vector<std::uint32_t> layout = index_columns;
    layout.insert(layout.end(), include_columns.begin(), include_columns.end());
    for (const auto& order : table->pk) {
        if (seen.insert(order.column_index).second) {
            layout.push_back(order.column_index);
        }
    }
    const auto position_in_layout = [&layout](std::uint32_t column) {
        return static_cast<std::uint32_t>(std::find(layout.begin(), layout.end(), column) - layout.begin());
    };

    catalog::CatalogTable index_table{};
    index_table.schema_id = table->schema_id;
    index_table.database_id = table->database_id;
    index_table.name = request.index_name;
    index_table.owner = request.owner;
    index_table.table_type = catalog::TableType::Index;
    index_table.append_only = table->append_only;
    for (const auto column : layout) {
        index_table.columns.push_back(table->columns[column]);
        index_table.value_indices.push_back(position_in_layout(column));
    }
    for (std::uint32_t position = 0U; position < index_columns.size(); ++position) {
        index_table.pk.push_back(catalog::ColumnOrder{position, catalog::OrderType::Ascending});
    }
    for (const auto& order : table->pk) {
        const auto position = position_in_layout(order.column_index);
        if (position >= index_columns.size()) {
            index_table.pk.push_back(catalog::ColumnOrder{position, order.order});
        }
    }
    for (const auto& order : index_table.pk) {
        index_table.stream_key.push_back(order.column_index);
    }
    index_table.distribution_key.push_back(0U);
    index_table.read_prefix_len_hint = static_cast<std::uint32_t>(index_columns.size());

    catalog::CatalogIndex index{};
    index.schema_id = table->schema_id;
    index.database_id = table->database_id;
    index.name = request.index_name;
    index.owner = request.owner;
    index.primary_table_id = table->id;
    for (const auto column : index_columns) {
        index.index_items.push_back(catalog::IndexItem{column, table->columns[column].data_type});
    }
    index.original_columns = index_columns;
    index.original_columns.insert(index.original_columns.end(), include_columns.begin(), include_columns.end());

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    index_table.id = allocator_.next_relation_id();
    index.id = allocator_.next_relation_id();
    index.index_table_id = index_table.id;

    scope.mutator.stage_create(index_table);
    scope.mutator.stage_create(index);
    return commit(scope, *base, {index, index_table}, {});
}

DdlCommandResponse CatalogManager::drop_index(const DropIndexRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto index = base->find_index(request.schema_id, request.name);
    if (!index) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("index '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    if (const auto blocking = outside_dependents(graph_, {index->id, index->index_table_id}); !blocking.empty()) {
        return reject(CatalogErrc::DependencyViolation,
                      fmt::format("cannot drop index '{}': {} depend on it",
                                  index->name,
                                  describe_relations(*base, blocking)));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    if (base->table(index->index_table_id)) {
        scope.mutator.stage_drop(CatalogObjectKind::Table, index->index_table_id.value);
    }
    scope.mutator.stage_drop(CatalogObjectKind::Index, index->id.value);
    return commit(scope, *base, {}, [index_id = index->id, table_id = index->index_table_id](DdlDependencyGraph& graph) {
        graph.remove(index_id);
        graph.remove(table_id);
    });
}

DdlCommandResponse CatalogManager::create_view(const CreateViewRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    auto view = request.view;
    const auto schema = base->schema(view.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(view.schema_id));
    }
    view.database_id = schema->database_id;

    std::string detail;
    if (!is_valid_identifier(view.name)) {
        return reject(CatalogErrc::InvalidDefinition, fmt::format("view name '{}' is not a valid identifier", view.name));
    }
    if (auto ec = validate_view_columns(view.columns, request.column_names, detail)) {
        return reject(ec, fmt::format("view '{}': {}", view.name, detail));
    }
    for (std::size_t index = 0U; index < request.column_names.size(); ++index) {
        view.columns[index].name = request.column_names[index];
    }
    if (auto existing = base->find_relation(view.schema_id, view.name)) {
        if (request.if_not_exists) {
            return unchanged(existing_relation(*base, *existing));
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("relation '{}' already exists in schema '{}'", view.name, schema->name));
    }
    if (auto ec = check_references(*base, view.dependent_relations, detail)) {
        return reject(ec, detail);
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    view.id = allocator_.next_relation_id();
    scope.mutator.stage_create(view);
    return commit(scope, *base, {view}, [view_id = view.id, references = view.dependent_relations](DdlDependencyGraph& graph) {
        graph.add_edges(view_id, references);
    });
}

DdlCommandResponse CatalogManager::drop_view(const DropViewRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto view = base->find_view(request.schema_id, request.name);
    if (!view) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("view '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    return drop_relation(*base, CatalogObjectKind::View, view->id, view->name);
}

DdlCommandResponse CatalogManager::create_materialized_view(const CreateMaterializedViewRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    auto table = request.table;
    if (table.table_type == catalog::TableType::Unspecified) {
        table.table_type = catalog::TableType::MaterializedView;
    }
    if (table.table_type != catalog::TableType::MaterializedView) {
        return reject(CatalogErrc::InvalidDefinition,
                      fmt::format("CREATE MATERIALIZED VIEW cannot create {} '{}'", catalog::to_string(table.table_type), table.name));
    }

    const auto schema = base->schema(table.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(table.schema_id));
    }
    table.database_id = schema->database_id;

    std::string detail;
    if (auto ec = validate_table_definition(table, detail)) {
        return reject(ec, detail);
    }
    if (auto existing = base->find_relation(table.schema_id, table.name)) {
        if (request.if_not_exists) {
            return unchanged(existing_relation(*base, *existing));
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("relation '{}' already exists in schema '{}'", table.name, schema->name));
    }
    if (auto ec = check_references(*base, table.dependent_relations, detail)) {
        return reject(ec, detail);
    }

    table.associated_source_id.reset();
    assign_initial_column_ids(table);

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    table.id = allocator_.next_relation_id();
    scope.mutator.stage_create(table);
    return commit(scope, *base, {table}, [table_id = table.id, references = table.dependent_relations](DdlDependencyGraph& graph) {
        graph.add_edges(table_id, references);
    });
}

DdlCommandResponse CatalogManager::drop_materialized_view(const DropMaterializedViewRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    const auto table = base->find_table(request.schema_id, request.name);
    if (!table || table->table_type != catalog::TableType::MaterializedView) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("materialized view '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }
    return drop_table_like(*base, *table);
}

DdlCommandResponse CatalogManager::create_function(const CreateFunctionRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    auto function = request.function;
    const auto schema = base->schema(function.schema_id);
    if (!schema) {
        return reject(CatalogErrc::NotFound, schema_missing(function.schema_id));
    }
    function.database_id = schema->database_id;

    std::string detail;
    if (auto ec = validate_function_definition(function, detail)) {
        return reject(ec, detail);
    }
    if (auto existing = base->find_function(function.schema_id, function.name, function.arg_types)) {
        if (request.if_not_exists) {
            return unchanged(catalog::CatalogObject{*existing});
        }
        return reject(CatalogErrc::NameConflict,
                      fmt::format("function '{}' with the same argument types already exists in schema '{}'",
                                  function.name,
                                  schema->name));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    function.id = allocator_.next_function_id();
    scope.mutator.stage_create(function);
    return commit(scope, *base, {function}, {});
}

DdlCommandResponse CatalogManager::drop_function(const DropFunctionRequest& request)
{
    std::lock_guard writer{writer_mutex_};
    set_state(CatalogRequestState::Validating);
    const auto base = snapshot();

    std::shared_ptr<const catalog::CatalogFunction> function;
    if (request.arg_types) {
        function = base->find_function(request.schema_id, request.name, *request.arg_types);
    } else {
        const auto overloads = base->functions_named(request.schema_id, request.name);
        if (overloads.size() > 1U) {
            return reject(CatalogErrc::InvalidDefinition,
                          fmt::format("function name '{}' matches {} overloads; specify the argument types",
                                      request.name,
                                      overloads.size()));
        }
        if (!overloads.empty()) {
            function = overloads.front();
        }
    }

    if (!function) {
        if (request.if_exists) {
            return unchanged(std::nullopt);
        }
        return reject(CatalogErrc::NotFound,
                      fmt::format("function '{}' does not exist in schema {}", request.name, request.schema_id.value));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    scope.mutator.stage_drop(CatalogObjectKind::Function, function->id.value);
    return commit(scope, *base, {}, {});
}

DdlCommandResponse CatalogManager::drop_relation(const catalog::CatalogSnapshot& base,
                                                 catalog::CatalogObjectKind kind,
                                                 catalog::RelationId relation_id,
                                                 std::string_view name)
{
    if (!graph_.can_drop(relation_id)) {
        return reject(CatalogErrc::DependencyViolation,
                      fmt::format("cannot drop {} '{}': {} depend on it",
                                  catalog::to_string(kind),
                                  name,
                                  describe_relations(base, graph_.dependents(relation_id))));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};
    scope.mutator.stage_drop(kind, relation_id.value);
    return commit(scope, base, {}, [relation_id](DdlDependencyGraph& graph) {
        graph.remove(relation_id);
    });
}

DdlCommandResponse CatalogManager::drop_table_like(const catalog::CatalogSnapshot& base, const catalog::CatalogTable& table)
{
    // Everything the cascade removes: the table, its coupled source, its
    // indexes and their backing tables.
    std::vector<catalog::RelationId> cascade{table.id};
    if (table.associated_source_id) {
        cascade.push_back(*table.associated_source_id);
    }
    for (const auto& index : base.indexes_on_table(table.id)) {
        cascade.push_back(index->id);
        cascade.push_back(index->index_table_id);
    }
    if (const auto blocking = outside_dependents(graph_, cascade); !blocking.empty()) {
        return reject(CatalogErrc::DependencyViolation,
                      fmt::format("cannot drop {} '{}': {} depend on it",
                                  catalog::to_string(table.table_type),
                                  table.name,
                                  describe_relations(base, blocking)));
    }

    set_state(CatalogRequestState::Allocating);
    WriteScope scope{next_transaction_id_++, allocator_};

    std::string detail;
    std::vector<catalog::RelationId> dropped;
    if (auto ec = stage_drop_table(base, scope.mutator, table, dropped, detail)) {
        SPDLOG_ERROR("DROP of '{}' found an inconsistent catalog: {}", table.name, detail);
        return reject(ec, detail);
    }
    return commit(scope, base, {}, [dropped = std::move(dropped)](DdlDependencyGraph& graph) {
        for (const auto id : dropped) {
            graph.remove(id);
        }
    });
}

DdlCommandResponse CatalogManager::reject(std::error_code error, std::string message)
{
    set_state(CatalogRequestState::Rejected);
    SPDLOG_WARN("catalog request rejected ({}): {}", error.message(), message);
    return make_failure(error, std::move(message));
}

DdlCommandResponse CatalogManager::unchanged(std::optional<catalog::CatalogObject> existing)
{
    set_state(CatalogRequestState::Done);
    std::vector<catalog::CatalogObject> objects;
    if (existing) {
        objects.push_back(std::move(*existing));
    }
    return make_success(std::move(objects));
}

DdlCommandResponse CatalogManager::commit(WriteScope& scope,
                                          const catalog::CatalogSnapshot& base,
                                          std::vector<catalog::CatalogObject> objects,
                                          const GraphUpdate& update_graph)
{
    set_state(CatalogRequestState::Committing);

    std::error_code store_error{};
    scope.mutator.set_publish_listener([this, &store_error](const catalog::CatalogMutationBatch& batch) -> std::error_code {
        store_error = config_.store->commit(batch.writes);
        return store_error ? make_error_code(CatalogErrc::StoreUnavailable) : std::error_code{};
    });

    if (auto ec = scope.transaction.commit()) {
        set_state(CatalogRequestState::Aborted);
        const auto cause = store_error ? store_error.message() : ec.message();
        SPDLOG_ERROR("catalog transaction {} aborted: {}", scope.transaction.transaction_id(), cause);
        return make_failure(ec, fmt::format("catalog commit failed: {}", cause));
    }

    set_state(CatalogRequestState::Broadcasting);
    auto batch = scope.mutator.consume_published_batch();

    auto next = std::make_shared<catalog::CatalogSnapshot>(base);
    for (const auto& delta : batch.deltas) {
        next->apply(delta);
    }

    const auto version = config_.broadcaster->publish(batch.deltas);
    next->set_catalog_version(version);
    if (update_graph) {
        update_graph(graph_);
    }
    publish_snapshot(std::move(next));

    for (const auto& delta : batch.deltas) {
        const std::string_view name = delta.object ? catalog::object_name(*delta.object) : std::string_view{};
        SPDLOG_INFO("catalog version {}: {} {} {} '{}'",
                    version,
                    catalog::to_string(delta.kind),
                    catalog::to_string(delta.object_kind),
                    delta.object_id,
                    name);
    }

    set_state(CatalogRequestState::Done);
    return make_success(std::move(objects), version);
}

void CatalogManager::publish_snapshot(std::shared_ptr<const catalog::CatalogSnapshot> snapshot)
{
    std::lock_guard guard{snapshot_mutex_};
    snapshot_ = std::move(snapshot);
}

void CatalogManager::set_state(CatalogRequestState state) noexcept
{
    state_.store(state, std::memory_order_release);
}

}  // namespace streamcat::ddl
