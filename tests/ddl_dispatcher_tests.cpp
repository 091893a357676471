#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/ddl/ddl_dispatcher.hpp"

#include "support/catalog_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

using namespace streamcat;
using namespace streamcat::ddl;
using catalog::CatalogErrc;

namespace {

const DdlVerbTelemetrySnapshot& verb_stats(const DdlTelemetrySnapshot& snapshot, DdlVerb verb)
{
    return snapshot.verbs[static_cast<std::size_t>(verb)];
}

}  // namespace

TEST_CASE("DdlCommandDispatcher requires a catalog manager")
{
    CHECK_THROWS_AS(DdlCommandDispatcher(DdlCommandDispatcher::Config{}), std::invalid_argument);
}

TEST_CASE("DdlCommandDispatcher routes each request to the manager")
{
    testing::CatalogHarness harness;
    DdlCommandDispatcher dispatcher{DdlCommandDispatcher::Config{&harness.manager, nullptr, {}}};

    auto response = dispatcher.dispatch(CreateTableRequest{testing::make_table(harness.schema_id, "t", {"a", "b"})});
    REQUIRE(response.success);
    const auto table_id = testing::object_as<catalog::CatalogTable>(response, 0U).id;

    response = dispatcher.dispatch(CreateIndexRequest{harness.schema_id, "t_by_a", "t", {"a"}, {}, catalog::kRootUserId, false});
    REQUIRE(response.success);

    response = dispatcher.dispatch(
        CreateViewRequest{testing::make_view(harness.schema_id, "v", {table_id}, {"a"}), {}, false});
    REQUIRE(response.success);

    response = dispatcher.dispatch(
        CreateFunctionRequest{testing::make_function(harness.schema_id, "f", {catalog::CatalogDataType::Int64}), false});
    REQUIRE(response.success);

    response = dispatcher.dispatch(DropTableRequest{harness.schema_id, "t", false});
    CHECK(response.error == CatalogErrc::DependencyViolation);

    response = dispatcher.dispatch(DropViewRequest{harness.schema_id, "v", false});
    REQUIRE(response.success);
    response = dispatcher.dispatch(DropTableRequest{harness.schema_id, "t", false});
    REQUIRE(response.success);
    CHECK(response.catalog_version == harness.manager.catalog_version());

    const auto snapshot = harness.manager.snapshot();
    CHECK(snapshot->find_relation(harness.schema_id, "t") == std::nullopt);
    CHECK(snapshot->find_relation(harness.schema_id, "t_by_a") == std::nullopt);
    CHECK(snapshot->functions(harness.schema_id).size() == 1U);
}

TEST_CASE("DdlCommandDispatcher records telemetry per verb")
{
    testing::CatalogHarness harness;
    DdlCommandDispatcher dispatcher{DdlCommandDispatcher::Config{&harness.manager, nullptr, {}}};

    harness.create_table(testing::make_table(harness.schema_id, "t", {"a"}));

    REQUIRE(dispatcher.dispatch(CreateSchemaRequest{harness.database_id, "staging", catalog::kRootUserId, false}).success);
    CHECK_FALSE(dispatcher.dispatch(CreateSchemaRequest{harness.database_id, "staging", catalog::kRootUserId, false}).success);
    CHECK_FALSE(dispatcher.dispatch(DropSchemaRequest{harness.database_id, "public", false}).success);
    REQUIRE(dispatcher
                .dispatch(AlterTableRequest{harness.schema_id, "t", 0U, {AlterTableAddColumn{testing::make_column("b")}}, {}})
                .success);
    CHECK_FALSE(dispatcher
                    .dispatch(AlterTableRequest{harness.schema_id, "t", 0U, {AlterTableAddColumn{testing::make_column("c")}}, {}})
                    .success);

    harness.store.fail_commits = true;
    CHECK_FALSE(dispatcher.dispatch(DropTableRequest{harness.schema_id, "t", false}).success);

    const auto snapshot = dispatcher.telemetry().snapshot();
    const auto& create_schema = verb_stats(snapshot, DdlVerb::CreateSchema);
    CHECK(create_schema.attempts == 2U);
    CHECK(create_schema.successes == 1U);
    CHECK(create_schema.failures == 1U);

    const auto& alter = verb_stats(snapshot, DdlVerb::AlterTable);
    CHECK(alter.attempts == 2U);
    CHECK(alter.successes == 1U);
    CHECK(alter.failures == 1U);

    CHECK(verb_stats(snapshot, DdlVerb::CreateTable).attempts == 0U);
    CHECK(verb_stats(snapshot, DdlVerb::DropTable).failures == 1U);

    CHECK(snapshot.failures.validation_failures == 1U);
    CHECK(snapshot.failures.dependency_violations == 1U);
    CHECK(snapshot.failures.version_conflicts == 1U);
    CHECK(snapshot.failures.store_failures == 1U);
    CHECK(snapshot.failures.other_failures == 0U);
}

TEST_CASE("DdlCommandDispatcher registers its telemetry for its lifetime")
{
    testing::CatalogHarness harness;
    DdlTelemetryRegistry registry;

    {
        DdlCommandDispatcher first{DdlCommandDispatcher::Config{&harness.manager, &registry, "session-1"}};
        DdlCommandDispatcher second{DdlCommandDispatcher::Config{&harness.manager, &registry, "session-2"}};

        REQUIRE(first.dispatch(CreateSchemaRequest{harness.database_id, "a", catalog::kRootUserId, false}).success);
        REQUIRE(second.dispatch(CreateSchemaRequest{harness.database_id, "b", catalog::kRootUserId, false}).success);
        CHECK_FALSE(second.dispatch(DropSchemaRequest{harness.database_id, "missing", false}).success);

        const auto total = registry.aggregate();
        CHECK(verb_stats(total, DdlVerb::CreateSchema).successes == 2U);
        CHECK(verb_stats(total, DdlVerb::DropSchema).failures == 1U);
        CHECK(total.failures.validation_failures == 1U);

        std::vector<std::string> identifiers;
        registry.visit([&identifiers](const std::string& identifier, const DdlTelemetrySnapshot&) {
            identifiers.push_back(identifier);
        });
        CHECK(identifiers.size() == 2U);
    }

    CHECK(verb_stats(registry.aggregate(), DdlVerb::CreateSchema).attempts == 0U);
}
