#include "streamcat/catalog/catalog_introspection.hpp"
#include "streamcat/catalog/catalog_snapshot.hpp"

#include "support/catalog_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace streamcat;
using namespace streamcat::catalog;

namespace {

// orders(id, amount) with an index and a view, a connector table `feed`, a
// standalone source `clicks`, a sink and a function.
struct IntrospectionFixture final {
    IntrospectionFixture()
    {
        const auto orders = harness.create_table(testing::make_table(harness.schema_id, "orders", {"id", "amount"}));

        auto feed = testing::make_table(harness.schema_id, "feed", {"v"});
        feed.properties["connector"] = "kafka";
        REQUIRE(harness.manager.create_table(ddl::CreateTableRequest{feed}).success);

        REQUIRE(harness.manager
                    .create_source(ddl::CreateSourceRequest{testing::make_source(harness.schema_id, "clicks", {"url"})})
                    .success);

        ddl::CreateIndexRequest index{};
        index.schema_id = harness.schema_id;
        index.index_name = "orders_by_id";
        index.table_name = "orders";
        index.column_names = {"id"};
        REQUIRE(harness.manager.create_index(index).success);

        auto view = testing::make_view(harness.schema_id, "big_orders", {orders.id}, {"id"});
        view.sql = "SELECT id FROM orders WHERE amount > 100";
        REQUIRE(harness.manager.create_view(ddl::CreateViewRequest{view}).success);

        CatalogSink sink{};
        sink.schema_id = harness.schema_id;
        sink.name = "orders_out";
        sink.columns.push_back(testing::make_column("id"));
        sink.dependent_relations = {orders.id};
        sink.definition = "CREATE SINK orders_out FROM orders";
        REQUIRE(harness.manager.create_sink(ddl::CreateSinkRequest{sink}).success);

        REQUIRE(harness.manager
                    .create_function(ddl::CreateFunctionRequest{
                        testing::make_function(harness.schema_id, "discount", {CatalogDataType::Int32})})
                    .success);
    }

    testing::CatalogHarness harness;
};

const CatalogRelationSummary& relation_named(const CatalogIntrospectionSnapshot& snapshot,
                                             const std::string& name,
                                             CatalogRelationKind kind)
{
    for (const auto& relation : snapshot.relations) {
        if (relation.relation_name == name && relation.relation_kind == kind) {
            return relation;
        }
    }
    FAIL("relation " << name << " not reported");
    return snapshot.relations.front();
}

}  // namespace

TEST_CASE("Catalog introspection reports every visible relation in name order")
{
    IntrospectionFixture fixture;
    const auto snapshot = fixture.harness.manager.snapshot();
    const auto introspection = collect_catalog_introspection(*snapshot);

    CHECK(introspection.schema_version == kCatalogIntrospectionSchemaVersion);
    CHECK(introspection.catalog_version == snapshot->catalog_version());

    std::vector<std::string> names;
    for (const auto& relation : introspection.relations) {
        names.push_back(relation.relation_name + ":" + to_string(relation.relation_kind));
        CHECK(relation.database_name == "dev");
        CHECK(relation.schema_name == "public");
    }
    CHECK(names
          == std::vector<std::string>{"big_orders:view",
                                      "clicks:source",
                                      "feed:table",
                                      "feed:source",
                                      "orders:table",
                                      "orders_by_id:index",
                                      "orders_out:sink"});

    const auto& coupled = relation_named(introspection, "feed", CatalogRelationKind::Source);
    CHECK(coupled.owner_relation_name == "feed");
    CHECK(coupled.definition == "CREATE SOURCE feed WITH (connector = 'kafka')");

    const auto& index = relation_named(introspection, "orders_by_id", CatalogRelationKind::Index);
    CHECK(index.owner_relation_name == "orders");
    CHECK(index.definition == "CREATE INDEX orders_by_id ON orders(id)");
    REQUIRE(index.columns.size() == 2U);
    CHECK(index.columns[1].name == "_row_id");
    CHECK(index.columns[1].is_hidden);

    const auto& orders = relation_named(introspection, "orders", CatalogRelationKind::Table);
    CHECK(orders.owner_relation_name.empty());
    REQUIRE(orders.columns.size() == 3U);
    CHECK(orders.columns[0].data_type == "serial");
    CHECK(orders.columns[1].data_type == "bigint");

    REQUIRE(introspection.functions.size() == 1U);
    CHECK(introspection.functions[0].function_name == "discount");
    CHECK(introspection.functions[0].arg_types == std::vector<std::string>{"integer"});
    CHECK(introspection.functions[0].return_type == "bigint");
}

TEST_CASE("Catalog introspection JSON has a fixed layout")
{
    CatalogIntrospectionSnapshot snapshot{};
    snapshot.catalog_version = 7U;

    CatalogRelationSummary relation{};
    relation.database_name = "dev";
    relation.schema_name = "public";
    relation.relation_name = "metrics";
    relation.relation_kind = CatalogRelationKind::Table;
    relation.relation_id = 3U;
    relation.definition = "CREATE TABLE \"metrics\"\n";
    relation.columns.push_back(CatalogColumnSummary{"_row_id", "serial", true});
    snapshot.relations.push_back(relation);

    CatalogFunctionSummary function{};
    function.database_name = "dev";
    function.schema_name = "public";
    function.function_name = "f";
    function.arg_types = {"integer", "varchar"};
    function.return_type = "bigint";
    function.language = "python";
    snapshot.functions.push_back(function);

    const std::string expected =
        R"({"schema_version":1,"catalog_version":7,"relations":[)"
        R"({"database":"dev","schema":"public","name":"metrics","kind":"table","id":3,)"
        R"("definition":"CREATE TABLE \"metrics\"\n","columns":[{"name":"_row_id","type":"serial","hidden":true}]}],)"
        R"("functions":[{"database":"dev","schema":"public","name":"f","arg_types":["integer","varchar"],)"
        R"("return_type":"bigint","language":"python"}]})";
    CHECK(catalog_introspection_to_json(snapshot) == expected);

    SECTION("Owner appears only when set")
    {
        snapshot.relations[0].owner_relation_name = "base";
        using Catch::Matchers::ContainsSubstring;
        CHECK_THAT(catalog_introspection_to_json(snapshot), ContainsSubstring(R"("id":3,"owner":"base","definition")"));
    }
}

TEST_CASE("SHOW commands read from a snapshot")
{
    IntrospectionFixture fixture;
    const auto schema_id = fixture.harness.schema_id;
    const auto snapshot = fixture.harness.manager.snapshot();

    CHECK(show_relations(*snapshot, schema_id, CatalogRelationKind::Table) == std::vector<std::string>{"feed", "orders"});
    CHECK(show_relations(*snapshot, schema_id, CatalogRelationKind::Source) == std::vector<std::string>{"clicks", "feed"});
    CHECK(show_relations(*snapshot, schema_id, CatalogRelationKind::Index) == std::vector<std::string>{"orders_by_id"});
    CHECK(show_relations(*snapshot, schema_id, CatalogRelationKind::Sink) == std::vector<std::string>{"orders_out"});
    CHECK(show_relations(*snapshot, schema_id, CatalogRelationKind::View) == std::vector<std::string>{"big_orders"});
    CHECK(show_relations(*snapshot, schema_id, CatalogRelationKind::MaterializedView).empty());

    const auto columns = show_columns(*snapshot, schema_id, "orders");
    REQUIRE(columns.has_value());
    REQUIRE(columns->size() == 2U);
    CHECK((*columns)[0].name == "id");
    CHECK((*columns)[1].name == "amount");

    const auto index_columns = show_columns(*snapshot, schema_id, "orders_by_id");
    REQUIRE(index_columns.has_value());
    REQUIRE(index_columns->size() == 1U);
    CHECK(index_columns->front().name == "id");

    CHECK(show_columns(*snapshot, schema_id, "missing") == std::nullopt);

    CHECK(show_create(*snapshot, schema_id, "orders") == std::optional<std::string>{"CREATE TABLE orders"});
    CHECK(show_create(*snapshot, schema_id, "clicks")
          == std::optional<std::string>{"CREATE SOURCE clicks WITH (connector = 'kafka', topic = 'clicks')"});
    CHECK(show_create(*snapshot, schema_id, "orders_by_id") == std::optional<std::string>{"CREATE INDEX orders_by_id ON orders(id)"});
    CHECK(show_create(*snapshot, schema_id, "big_orders")
          == std::optional<std::string>{"SELECT id FROM orders WHERE amount > 100"});
    CHECK(show_create(*snapshot, schema_id, "orders_out") == std::optional<std::string>{"CREATE SINK orders_out FROM orders"});
    CHECK(show_create(*snapshot, schema_id, "missing") == std::nullopt);
}
