#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/catalog/catalog_introspection.hpp"
#include "streamcat/ddl/catalog_manager.hpp"

#include "support/catalog_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace streamcat;
using catalog::CatalogErrc;
using ddl::CatalogRequestState;
using testing::CatalogHarness;

TEST_CASE("Catalog manager requires its collaborators")
{
    catalog::InMemoryCatalogStore store;
    notify::NotificationBroadcaster broadcaster;
    CHECK_THROWS_AS(ddl::CatalogManager(ddl::CatalogManager::Config{nullptr, &broadcaster, {}}), std::invalid_argument);
    CHECK_THROWS_AS(ddl::CatalogManager(ddl::CatalogManager::Config{&store, nullptr, {}}), std::invalid_argument);
}

TEST_CASE("Creating a database also creates its public schema")
{
    CatalogHarness harness;
    const auto snapshot = harness.manager.snapshot();

    const auto database = snapshot->find_database("dev");
    REQUIRE(database != nullptr);
    const auto schema = snapshot->find_schema(database->id, "public");
    REQUIRE(schema != nullptr);
    CHECK(schema->id == harness.schema_id);
    CHECK(harness.manager.catalog_version() == 1U);
    CHECK(harness.manager.last_request_state() == CatalogRequestState::Done);

    SECTION("Duplicate database names conflict")
    {
        const auto response = harness.manager.create_database(ddl::CreateDatabaseRequest{"dev"});
        CHECK_FALSE(response.success);
        CHECK(response.error == CatalogErrc::NameConflict);
        CHECK(response.message.find("dev") != std::string::npos);
        CHECK(response.severity == ddl::DdlDiagnosticSeverity::Warning);
        CHECK_FALSE(response.remediation_hints.empty());
        CHECK(harness.manager.last_request_state() == CatalogRequestState::Rejected);
        CHECK(harness.manager.catalog_version() == 1U);
    }

    SECTION("IF NOT EXISTS returns the existing database without a new version")
    {
        ddl::CreateDatabaseRequest request{"dev"};
        request.if_not_exists = true;
        const auto response = harness.manager.create_database(request);
        REQUIRE(response.success);
        CHECK(response.catalog_version == 0U);
        CHECK(testing::object_as<catalog::CatalogDatabase>(response, 0U).id == harness.database_id);
        CHECK(harness.broadcaster.current_version() == 1U);
    }

    SECTION("Invalid names are rejected before anything is allocated")
    {
        const auto response = harness.manager.create_database(ddl::CreateDatabaseRequest{"1st"});
        CHECK(response.error == CatalogErrc::InvalidDefinition);
        CHECK(harness.manager.last_allocated_id(catalog::CatalogIdCategory::Database) == 1U);
    }
}

TEST_CASE("Schemas and databases must be empty before they are dropped")
{
    CatalogHarness harness;
    harness.create_table(testing::make_table(harness.schema_id, "t", {"a"}));

    auto response = harness.manager.drop_schema(ddl::DropSchemaRequest{harness.database_id, "public"});
    CHECK(response.error == CatalogErrc::DependencyViolation);

    response = harness.manager.drop_database(ddl::DropDatabaseRequest{"dev"});
    CHECK(response.error == CatalogErrc::DependencyViolation);
    CHECK(response.message.find("public") != std::string::npos);

    REQUIRE(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "t"}).success);

    response = harness.manager.drop_database(ddl::DropDatabaseRequest{"dev"});
    REQUIRE(response.success);
    const auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->find_database("dev") == nullptr);
    CHECK(snapshot->schema(harness.schema_id) == nullptr);
    CHECK(snapshot->object_count() == 0U);
}

TEST_CASE("Schemas are created inside existing databases")
{
    CatalogHarness harness;

    auto response = harness.manager.create_schema(ddl::CreateSchemaRequest{harness.database_id, "analytics"});
    REQUIRE(response.success);
    const auto schema = testing::object_as<catalog::CatalogSchema>(response, 0U);
    CHECK(schema.database_id == harness.database_id);
    CHECK(schema.id.value == 2U);

    response = harness.manager.create_schema(ddl::CreateSchemaRequest{catalog::DatabaseId{77U}, "analytics"});
    CHECK(response.error == CatalogErrc::NotFound);

    response = harness.manager.create_schema(ddl::CreateSchemaRequest{harness.database_id, "analytics"});
    CHECK(response.error == CatalogErrc::NameConflict);

    REQUIRE(harness.manager.drop_schema(ddl::DropSchemaRequest{harness.database_id, "analytics"}).success);

    ddl::DropSchemaRequest missing{harness.database_id, "analytics"};
    CHECK(harness.manager.drop_schema(missing).error == CatalogErrc::NotFound);
    missing.if_exists = true;
    const auto noop = harness.manager.drop_schema(missing);
    CHECK(noop.success);
    CHECK(noop.catalog_version == 0U);
}

TEST_CASE("Creating a table assigns ids and a first version")
{
    CatalogHarness harness;
    const auto table = harness.create_table(testing::make_table(harness.schema_id, "events", {"kind", "payload"}));

    CHECK(table.id.value == 1U);
    CHECK(table.database_id == harness.database_id);
    REQUIRE(table.version.has_value());
    CHECK(table.version->version == 0U);
    CHECK(table.version->next_column_id.value == 3);
    CHECK(table.columns[0].column_id == catalog::kRowIdColumnId);
    CHECK_FALSE(table.associated_source_id.has_value());
    CHECK(harness.manager.snapshot()->find_table(harness.schema_id, "events") != nullptr);

    SECTION("Same name in the same schema conflicts with any relation kind")
    {
        auto source = testing::make_source(harness.schema_id, "events", {"v"});
        const auto response = harness.manager.create_source(ddl::CreateSourceRequest{source});
        CHECK(response.error == CatalogErrc::NameConflict);
    }

    SECTION("IF NOT EXISTS returns the existing table")
    {
        ddl::CreateTableRequest request{testing::make_table(harness.schema_id, "events", {"other"})};
        request.if_not_exists = true;
        const auto response = harness.manager.create_table(request);
        REQUIRE(response.success);
        CHECK(response.catalog_version == 0U);
        CHECK(testing::object_as<catalog::CatalogTable>(response, 0U).id == table.id);
    }

    SECTION("Unknown schema is not found")
    {
        const auto response = harness.manager.create_table(
            ddl::CreateTableRequest{testing::make_table(catalog::SchemaId{99U}, "events", {"v"})});
        CHECK(response.error == CatalogErrc::NotFound);
    }

    SECTION("Malformed definitions are rejected")
    {
        auto broken = testing::make_table(harness.schema_id, "broken", {"v"});
        broken.distribution_key = {9U};
        const auto response = harness.manager.create_table(ddl::CreateTableRequest{broken});
        CHECK(response.error == CatalogErrc::InvalidDefinition);
        CHECK(response.message.find("distribution key") != std::string::npos);
    }
}

TEST_CASE("Internal tables carry no version and reject ALTER")
{
    CatalogHarness harness;
    auto internal = testing::make_table(harness.schema_id, "agg_state", {"k", "v"});
    internal.table_type = catalog::TableType::Internal;
    const auto created = harness.create_table(internal);
    CHECK_FALSE(created.version.has_value());

    const auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->tables(harness.schema_id).empty());
    CHECK(snapshot->internal_tables(harness.schema_id).size() == 1U);

    ddl::AlterTableRequest alter{harness.schema_id, "agg_state", 0U, {ddl::AlterTableRenameTable{"agg"}}};
    CHECK(harness.manager.alter_table(alter).error == CatalogErrc::InvalidDefinition);
}

TEST_CASE("ALTER TABLE bumps the version and keeps dropped ids retired")
{
    CatalogHarness harness;
    harness.create_table(testing::make_table(harness.schema_id, "t", {"a", "b"}));

    ddl::AlterTableRequest drop{harness.schema_id, "t", 0U, {ddl::AlterTableDropColumn{"b"}}};
    auto response = harness.manager.alter_table(drop);
    REQUIRE(response.success);
    auto altered = testing::object_as<catalog::CatalogTable>(response, 0U);
    CHECK(altered.version->version == 1U);
    CHECK(altered.columns.size() == 2U);

    ddl::AlterTableRequest add{harness.schema_id, "t", 1U, {ddl::AlterTableAddColumn{testing::make_column("b")}}};
    add.definition = "CREATE TABLE t (a BIGINT, b BIGINT)";
    response = harness.manager.alter_table(add);
    REQUIRE(response.success);
    altered = testing::object_as<catalog::CatalogTable>(response, 0U);
    CHECK(altered.version->version == 2U);
    CHECK(altered.columns.back().column_id.value == 3);
    CHECK(altered.definition == "CREATE TABLE t (a BIGINT, b BIGINT)");

    SECTION("A stale version is a conflict")
    {
        ddl::AlterTableRequest stale{harness.schema_id, "t", 1U, {ddl::AlterTableAddColumn{testing::make_column("c")}}};
        const auto conflict = harness.manager.alter_table(stale);
        CHECK(conflict.error == CatalogErrc::VersionConflict);
        CHECK(harness.manager.snapshot()->find_table(harness.schema_id, "t")->version->version == 2U);
    }

    SECTION("Renaming onto another relation conflicts")
    {
        harness.create_table(testing::make_table(harness.schema_id, "u", {"a"}));
        ddl::AlterTableRequest rename{harness.schema_id, "t", 2U, {ddl::AlterTableRenameTable{"u"}}};
        CHECK(harness.manager.alter_table(rename).error == CatalogErrc::NameConflict);
    }

    SECTION("Unknown tables are not found")
    {
        ddl::AlterTableRequest missing{harness.schema_id, "nope", 0U, {ddl::AlterTableRenameTable{"x"}}};
        CHECK(harness.manager.alter_table(missing).error == CatalogErrc::NotFound);
    }
}

TEST_CASE("Connector tables keep their source in step")
{
    CatalogHarness harness;
    auto table = testing::make_table(harness.schema_id, "ticks", {"symbol", "price"});
    table.properties["connector"] = "kafka";

    auto response = harness.manager.create_table(ddl::CreateTableRequest{table});
    REQUIRE(response.success);
    REQUIRE(response.objects.size() == 2U);
    const auto created = testing::object_as<catalog::CatalogTable>(response, 0U);
    const auto source = testing::object_as<catalog::CatalogSource>(response, 1U);
    CHECK(created.associated_source_id == source.id);
    CHECK(source.associated_table_id == created.id);

    ddl::AlterTableRequest alter{harness.schema_id,
                                 "ticks",
                                 0U,
                                 {ddl::AlterTableAddColumn{testing::make_column("volume")}, ddl::AlterTableRenameTable{"quotes"}}};
    response = harness.manager.alter_table(alter);
    REQUIRE(response.success);
    REQUIRE(response.objects.size() == 2U);

    const auto snapshot = harness.manager.snapshot();
    const auto mirrored = snapshot->find_source(harness.schema_id, "quotes");
    REQUIRE(mirrored != nullptr);
    CHECK(mirrored->name == "quotes");
    CHECK(mirrored->columns.size() == 4U);
    CHECK(mirrored->columns.back().name == "volume");
    CHECK(snapshot->find_relation(harness.schema_id, "ticks") == std::nullopt);

    SECTION("The coupled source cannot be dropped on its own")
    {
        const auto drop = harness.manager.drop_source(ddl::DropSourceRequest{harness.schema_id, "quotes"});
        CHECK(drop.error == CatalogErrc::DependencyViolation);
        CHECK(harness.manager.snapshot()->source(source.id) != nullptr);
    }
}

TEST_CASE("Standalone sources are created and dropped directly")
{
    CatalogHarness harness;
    auto source = testing::make_source(harness.schema_id, "clicks", {"user_id", "url"});

    auto response = harness.manager.create_source(ddl::CreateSourceRequest{source});
    REQUIRE(response.success);
    CHECK_FALSE(testing::object_as<catalog::CatalogSource>(response, 0U).associated_table_id.has_value());

    SECTION("A source cannot claim an owning table")
    {
        auto claimed = testing::make_source(harness.schema_id, "claimed", {"v"});
        claimed.associated_table_id = catalog::RelationId{1U};
        CHECK(harness.manager.create_source(ddl::CreateSourceRequest{claimed}).error == CatalogErrc::InvalidDefinition);
    }

    SECTION("Drop removes it")
    {
        REQUIRE(harness.manager.drop_source(ddl::DropSourceRequest{harness.schema_id, "clicks"}).success);
        CHECK(harness.manager.snapshot()->sources(harness.schema_id).empty());
    }
}

TEST_CASE("Sinks block drops of the relations they read")
{
    CatalogHarness harness;
    const auto table = harness.create_table(testing::make_table(harness.schema_id, "orders", {"id", "amount"}));

    catalog::CatalogSink sink{};
    sink.schema_id = harness.schema_id;
    sink.name = "orders_out";
    sink.columns.push_back(testing::make_column("id"));
    sink.dependent_relations = {table.id};
    sink.definition = "CREATE SINK orders_out FROM orders";

    REQUIRE(harness.manager.create_sink(ddl::CreateSinkRequest{sink}).success);
    CHECK(harness.manager.dependents(table.id).size() == 1U);

    const auto blocked = harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "orders"});
    CHECK(blocked.error == CatalogErrc::DependencyViolation);
    CHECK(blocked.message.find("orders_out") != std::string::npos);

    REQUIRE(harness.manager.drop_sink(ddl::DropSinkRequest{harness.schema_id, "orders_out"}).success);
    CHECK(harness.manager.dependents(table.id).empty());
    CHECK(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "orders"}).success);

    SECTION("Sinks over unknown relations are not found")
    {
        sink.name = "dangling";
        sink.dependent_relations = {catalog::RelationId{500U}};
        CHECK(harness.manager.create_sink(ddl::CreateSinkRequest{sink}).error == CatalogErrc::NotFound);
    }
}

TEST_CASE("Indexes get a covering backing table")
{
    CatalogHarness harness;
    const auto table = harness.create_table(testing::make_table(harness.schema_id, "users", {"name", "email", "age"}));

    ddl::CreateIndexRequest request{};
    request.schema_id = harness.schema_id;
    request.index_name = "users_by_email";
    request.table_name = "users";
    request.column_names = {"email"};
    request.include_column_names = {"age"};

    const auto response = harness.manager.create_index(request);
    REQUIRE(response.success);
    REQUIRE(response.objects.size() == 2U);
    const auto index = testing::object_as<catalog::CatalogIndex>(response, 0U);
    const auto backing = testing::object_as<catalog::CatalogTable>(response, 1U);

    CHECK(index.primary_table_id == table.id);
    CHECK(index.index_table_id == backing.id);
    REQUIRE(index.index_items.size() == 1U);
    CHECK(index.index_items.front().input_ref == 2U);
    CHECK(index.original_columns == std::vector<std::uint32_t>{2U, 3U});

    CHECK(backing.table_type == catalog::TableType::Index);
    REQUIRE(backing.columns.size() == 3U);
    CHECK(backing.columns[0].name == "email");
    CHECK(backing.columns[1].name == "age");
    CHECK(backing.columns[2].name == "_row_id");
    REQUIRE(backing.pk.size() == 2U);
    CHECK(backing.pk[0].column_index == 0U);
    CHECK(backing.pk[1].column_index == 2U);
    CHECK(backing.stream_key == std::vector<std::uint32_t>{0U, 2U});
    CHECK(backing.distribution_key == std::vector<std::uint32_t>{0U});
    CHECK(backing.read_prefix_len_hint == 1U);

    const auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->indexes_on_table(table.id).size() == 1U);
    CHECK(snapshot->tables(harness.schema_id).size() == 1U);

    SECTION("Index columns must exist and be visible")
    {
        request.index_name = "users_by_row";
        request.column_names = {"_row_id"};
        request.include_column_names.clear();
        CHECK(harness.manager.create_index(request).error == CatalogErrc::NotFound);
    }

    SECTION("A column may appear only once")
    {
        request.index_name = "users_twice";
        request.column_names = {"name"};
        request.include_column_names = {"name"};
        CHECK(harness.manager.create_index(request).error == CatalogErrc::InvalidDefinition);
    }

    SECTION("Index names share the relation namespace")
    {
        request.index_name = "users";
        CHECK(harness.manager.create_index(request).error == CatalogErrc::NameConflict);
    }

    SECTION("Indexed columns cannot be dropped from the table")
    {
        ddl::AlterTableRequest alter{harness.schema_id, "users", 0U, {ddl::AlterTableDropColumn{"name"}}};
        const auto blocked = harness.manager.alter_table(alter);
        CHECK(blocked.error == CatalogErrc::DependencyViolation);
        CHECK(blocked.message.find("users_by_email") != std::string::npos);
    }

    SECTION("Dropping the index removes its backing table")
    {
        REQUIRE(harness.manager.drop_index(ddl::DropIndexRequest{harness.schema_id, "users_by_email"}).success);
        const auto after = harness.manager.snapshot();
        CHECK(after->index(index.id) == nullptr);
        CHECK(after->table(backing.id) == nullptr);
    }

    SECTION("Dropping the table cascades to its indexes")
    {
        REQUIRE(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "users"}).success);
        const auto after = harness.manager.snapshot();
        CHECK(after->index(index.id) == nullptr);
        CHECK(after->table(backing.id) == nullptr);
        CHECK(after->schema_is_empty(harness.schema_id));
    }
}

TEST_CASE("Materialized views are tables with their own drop verb")
{
    CatalogHarness harness;
    const auto base = harness.create_table(testing::make_table(harness.schema_id, "trips", {"city", "fare"}));

    auto mv = testing::make_table(harness.schema_id, "fares_by_city", {"city", "total"});
    mv.table_type = catalog::TableType::MaterializedView;
    mv.dependent_relations = {base.id};

    auto response = harness.manager.create_materialized_view(ddl::CreateMaterializedViewRequest{mv});
    REQUIRE(response.success);
    const auto created = testing::object_as<catalog::CatalogTable>(response, 0U);
    CHECK(created.version.has_value());

    const auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->tables(harness.schema_id).size() == 1U);
    CHECK(snapshot->materialized_views(harness.schema_id).size() == 1U);

    CHECK(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "fares_by_city"}).error
          == CatalogErrc::InvalidDefinition);
    CHECK(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "trips"}).error
          == CatalogErrc::DependencyViolation);

    ddl::AlterTableRequest alter{harness.schema_id, "fares_by_city", 0U, {ddl::AlterTableRenameTable{"x"}}};
    CHECK(harness.manager.alter_table(alter).error == CatalogErrc::InvalidDefinition);

    REQUIRE(harness.manager.drop_materialized_view(ddl::DropMaterializedViewRequest{harness.schema_id, "fares_by_city"}).success);
    CHECK(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "trips"}).success);

    SECTION("DROP MATERIALIZED VIEW does not drop plain tables")
    {
        harness.create_table(testing::make_table(harness.schema_id, "plain", {"v"}));
        CHECK(harness.manager.drop_materialized_view(ddl::DropMaterializedViewRequest{harness.schema_id, "plain"}).error
              == CatalogErrc::NotFound);
    }
}

TEST_CASE("Functions are unique by name and argument types")
{
    CatalogHarness harness;
    using catalog::CatalogDataType;

    REQUIRE(harness.manager.create_function(ddl::CreateFunctionRequest{testing::make_function(harness.schema_id, "gcd", {CatalogDataType::Int32})}).success);
    REQUIRE(harness.manager
                .create_function(ddl::CreateFunctionRequest{
                    testing::make_function(harness.schema_id, "gcd", {CatalogDataType::Int32, CatalogDataType::Int32})})
                .success);

    const auto duplicate = harness.manager.create_function(
        ddl::CreateFunctionRequest{testing::make_function(harness.schema_id, "gcd", {CatalogDataType::Int32})});
    CHECK(duplicate.error == CatalogErrc::NameConflict);

    ddl::DropFunctionRequest ambiguous{harness.schema_id, "gcd"};
    CHECK(harness.manager.drop_function(ambiguous).error == CatalogErrc::InvalidDefinition);

    ddl::DropFunctionRequest exact{harness.schema_id, "gcd"};
    exact.arg_types = std::vector<CatalogDataType>{CatalogDataType::Int32, CatalogDataType::Int32};
    REQUIRE(harness.manager.drop_function(exact).success);

    REQUIRE(harness.manager.drop_function(ambiguous).success);
    CHECK(harness.manager.snapshot()->functions(harness.schema_id).empty());

    CHECK(harness.manager.drop_function(ambiguous).error == CatalogErrc::NotFound);
    ambiguous.if_exists = true;
    CHECK(harness.manager.drop_function(ambiguous).success);
}

TEST_CASE("Every commit publishes exactly one notification")
{
    CatalogHarness harness;
    auto subscription = harness.broadcaster.subscribe(harness.manager.catalog_version());

    auto table = testing::make_table(harness.schema_id, "s", {"v"});
    table.properties["connector"] = "kafka";
    const auto created = harness.manager.create_table(ddl::CreateTableRequest{table});
    REQUIRE(created.success);
    CHECK(created.catalog_version == 2U);

    const auto rejected = harness.manager.create_table(ddl::CreateTableRequest{table});
    CHECK_FALSE(rejected.success);

    const auto dropped = harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "s"});
    REQUIRE(dropped.success);
    CHECK(dropped.catalog_version == 3U);

    catalog::CatalogNotification notification{};
    REQUIRE_FALSE(subscription->try_next(notification));
    CHECK(notification.version == 2U);
    REQUIRE(notification.deltas.size() == 2U);
    CHECK(notification.deltas[0].object_kind == catalog::CatalogObjectKind::Table);
    CHECK(notification.deltas[1].object_kind == catalog::CatalogObjectKind::Source);

    REQUIRE_FALSE(subscription->try_next(notification));
    CHECK(notification.version == 3U);
    REQUIRE(notification.deltas.size() == 2U);
    CHECK(notification.deltas[0].kind == catalog::CatalogDeltaKind::Dropped);

    CHECK(subscription->try_next(notification) == std::errc::timed_out);
}

TEST_CASE("A table with a connector is listed as both a table and a source")
{
    CatalogHarness harness;
    auto table = testing::make_table(harness.schema_id, "s", {"v"});
    table.properties["connector"] = "kafka";
    REQUIRE(harness.manager.create_table(ddl::CreateTableRequest{table}).success);

    auto snapshot = harness.manager.snapshot();
    CHECK(catalog::show_relations(*snapshot, harness.schema_id, catalog::CatalogRelationKind::Source)
          == std::vector<std::string>{"s"});
    CHECK(catalog::show_relations(*snapshot, harness.schema_id, catalog::CatalogRelationKind::Table)
          == std::vector<std::string>{"s"});

    REQUIRE(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "s"}).success);
    snapshot = harness.manager.snapshot();
    CHECK(catalog::show_relations(*snapshot, harness.schema_id, catalog::CatalogRelationKind::Source).empty());
    CHECK(catalog::show_relations(*snapshot, harness.schema_id, catalog::CatalogRelationKind::Table).empty());
    CHECK(snapshot->all_sources().empty());
}

TEST_CASE("View column names must match the query arity")
{
    CatalogHarness harness;

    ddl::CreateViewRequest too_many{testing::make_view(harness.schema_id, "v1", {}, {"?column?"}), {"a", "b"}};
    too_many.view.sql = "SELECT 1";
    const auto rejected = harness.manager.create_view(too_many);
    CHECK(rejected.error == CatalogErrc::InvalidDefinition);
    CHECK(harness.manager.snapshot()->find_view(harness.schema_id, "v1") == nullptr);

    ddl::CreateViewRequest matching{testing::make_view(harness.schema_id, "v2", {}, {"?column?", "?column?"}), {"a", "b"}};
    matching.view.sql = "SELECT 1, 2";
    const auto response = harness.manager.create_view(matching);
    REQUIRE(response.success);
    const auto view = testing::object_as<catalog::CatalogView>(response, 0U);
    REQUIRE(view.columns.size() == 2U);
    CHECK(view.columns[0].name == "a");
    CHECK(view.columns[1].name == "b");
    CHECK(view.sql == "SELECT 1, 2");
}

TEST_CASE("A view blocks dropping the table it reads until the view is gone")
{
    CatalogHarness harness;
    const auto table = harness.create_table(testing::make_table(harness.schema_id, "t", {"a"}));

    const auto view = harness.manager.create_view(
        ddl::CreateViewRequest{testing::make_view(harness.schema_id, "v3", {table.id}, {"a"}), {}});
    REQUIRE(view.success);
    const auto version_before = harness.manager.catalog_version();

    const auto blocked = harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "t"});
    CHECK(blocked.error == CatalogErrc::DependencyViolation);
    CHECK(blocked.message.find("v3") != std::string::npos);
    CHECK(harness.manager.catalog_version() == version_before);
    CHECK(harness.manager.snapshot()->find_table(harness.schema_id, "t") != nullptr);

    REQUIRE(harness.manager.drop_view(ddl::DropViewRequest{harness.schema_id, "v3"}).success);
    CHECK(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "t"}).success);
}

TEST_CASE("Readers of a coupled source block dropping its table")
{
    CatalogHarness harness;
    auto table = testing::make_table(harness.schema_id, "clicks", {"url"});
    table.properties["connector"] = "kafka";
    const auto created = harness.manager.create_table(ddl::CreateTableRequest{table});
    REQUIRE(created.success);
    const auto source = testing::object_as<catalog::CatalogSource>(created, 1U);

    const auto view = harness.manager.create_view(
        ddl::CreateViewRequest{testing::make_view(harness.schema_id, "raw_clicks", {source.id}, {"url"}), {}});
    REQUIRE(view.success);
    const auto version_before = harness.manager.catalog_version();

    const auto blocked = harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "clicks"});
    CHECK(blocked.error == CatalogErrc::DependencyViolation);
    CHECK(blocked.message.find("raw_clicks") != std::string::npos);
    CHECK(harness.manager.last_request_state() == CatalogRequestState::Rejected);
    CHECK(harness.manager.catalog_version() == version_before);
    auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->find_table(harness.schema_id, "clicks") != nullptr);
    CHECK(snapshot->source(source.id) != nullptr);

    ddl::AlterTableRequest alter{harness.schema_id, "clicks", 0U, {ddl::AlterTableDropColumn{"url"}}};
    const auto alter_blocked = harness.manager.alter_table(alter);
    CHECK(alter_blocked.error == CatalogErrc::DependencyViolation);
    CHECK(alter_blocked.message.find("raw_clicks") != std::string::npos);
    CHECK(harness.manager.catalog_version() == version_before);

    REQUIRE(harness.manager.drop_view(ddl::DropViewRequest{harness.schema_id, "raw_clicks"}).success);
    REQUIRE(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "clicks"}).success);
    snapshot = harness.manager.snapshot();
    CHECK(snapshot->source(source.id) == nullptr);
    CHECK(snapshot->schema_is_empty(harness.schema_id));
}

TEST_CASE("Readers of an index backing table block dropping the index")
{
    CatalogHarness harness;
    harness.create_table(testing::make_table(harness.schema_id, "t", {"a", "b"}));

    ddl::CreateIndexRequest request{};
    request.schema_id = harness.schema_id;
    request.index_name = "idx";
    request.table_name = "t";
    request.column_names = {"a"};
    const auto created = harness.manager.create_index(request);
    REQUIRE(created.success);
    const auto index = testing::object_as<catalog::CatalogIndex>(created, 0U);

    auto mv = testing::make_table(harness.schema_id, "by_a", {"a"});
    mv.table_type = catalog::TableType::MaterializedView;
    mv.dependent_relations = {index.index_table_id};
    REQUIRE(harness.manager.create_materialized_view(ddl::CreateMaterializedViewRequest{mv}).success);
    const auto version_before = harness.manager.catalog_version();

    SECTION("DROP INDEX")
    {
        const auto blocked = harness.manager.drop_index(ddl::DropIndexRequest{harness.schema_id, "idx"});
        CHECK(blocked.error == CatalogErrc::DependencyViolation);
        CHECK(blocked.message.find("by_a") != std::string::npos);
    }

    SECTION("DROP TABLE on the primary table")
    {
        const auto blocked = harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "t"});
        CHECK(blocked.error == CatalogErrc::DependencyViolation);
        CHECK(blocked.message.find("by_a") != std::string::npos);
    }

    CHECK(harness.manager.catalog_version() == version_before);
    const auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->index(index.id) != nullptr);
    CHECK(snapshot->table(index.index_table_id) != nullptr);

    REQUIRE(harness.manager.drop_materialized_view(ddl::DropMaterializedViewRequest{harness.schema_id, "by_a"}).success);
    REQUIRE(harness.manager.drop_index(ddl::DropIndexRequest{harness.schema_id, "idx"}).success);
    CHECK(harness.manager.snapshot()->table(index.index_table_id) == nullptr);
}
