#include "streamcat/catalog/catalog_encoding.hpp"
#include "streamcat/catalog/catalog_errors.hpp"
#include "streamcat/ddl/catalog_manager.hpp"

#include "support/catalog_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace streamcat;
using catalog::CatalogErrc;
using catalog::CatalogIdCategory;
using ddl::CatalogRequestState;
using testing::CatalogHarness;

namespace {

// Second manager over the same store, as after a restart.
struct RestartedCatalog final {
    explicit RestartedCatalog(CatalogHarness& harness)
        : broadcaster{notify::NotificationBroadcaster::Config{4096U, 256U, harness.broadcaster.current_version()}}
        , manager{ddl::CatalogManager::Config{&harness.store, &broadcaster, {}}}
    {
    }

    notify::NotificationBroadcaster broadcaster;
    ddl::CatalogManager manager;
};

void put(catalog::InMemoryCatalogStore& store, std::string key, std::vector<std::byte> value)
{
    std::vector<catalog::CatalogWrite> writes;
    writes.push_back(catalog::CatalogWrite{std::move(key), std::move(value)});
    REQUIRE_FALSE(store.commit(writes));
}

}  // namespace

TEST_CASE("A failed store commit leaves no trace")
{
    CatalogHarness harness;
    harness.create_table(testing::make_table(harness.schema_id, "kept", {"v"}));

    const auto version_before = harness.broadcaster.current_version();
    const auto relation_before = harness.manager.last_allocated_id(CatalogIdCategory::Relation);
    const auto objects_before = harness.manager.snapshot()->object_count();
    auto subscription = harness.broadcaster.subscribe(version_before);

    harness.store.fail_commits = true;
    auto table = testing::make_table(harness.schema_id, "lost", {"v"});
    table.properties["connector"] = "kafka";
    const auto response = harness.manager.create_table(ddl::CreateTableRequest{table});

    CHECK_FALSE(response.success);
    CHECK(response.error == CatalogErrc::StoreUnavailable);
    CHECK(response.severity == ddl::DdlDiagnosticSeverity::Error);
    CHECK(harness.store.rejected_commits.load() == 1);
    CHECK(harness.manager.last_request_state() == CatalogRequestState::Aborted);
    CHECK(harness.broadcaster.current_version() == version_before);
    CHECK(harness.manager.catalog_version() == version_before);
    CHECK(harness.manager.last_allocated_id(CatalogIdCategory::Relation) == relation_before);
    CHECK(harness.manager.snapshot()->object_count() == objects_before);
    CHECK(harness.manager.snapshot()->find_relation(harness.schema_id, "lost") == std::nullopt);

    catalog::CatalogNotification notification{};
    CHECK(subscription->try_next(notification) == std::errc::timed_out);

    SECTION("The next commit reuses the returned ids")
    {
        harness.store.fail_commits = false;
        const auto retried = harness.manager.create_table(ddl::CreateTableRequest{table});
        REQUIRE(retried.success);
        CHECK(testing::object_as<catalog::CatalogTable>(retried, 0U).id.value == relation_before + 1U);
        CHECK(retried.catalog_version == version_before + 1U);
    }

    SECTION("Drops are atomic too")
    {
        const auto drop = harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "kept"});
        CHECK(drop.error == CatalogErrc::StoreUnavailable);
        CHECK(harness.manager.snapshot()->find_table(harness.schema_id, "kept") != nullptr);
    }
}

TEST_CASE("Relation ids are never reused")
{
    CatalogHarness harness;
    const auto first = harness.create_table(testing::make_table(harness.schema_id, "t", {"v"}));
    REQUIRE(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "t"}).success);
    const auto second = harness.create_table(testing::make_table(harness.schema_id, "t", {"v"}));
    CHECK(second.id.value == first.id.value + 1U);

    SECTION("Not even after a restart that drops the largest id")
    {
        REQUIRE(harness.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "t"}).success);

        RestartedCatalog restarted{harness};
        REQUIRE_FALSE(restarted.manager.recover());
        CHECK(restarted.manager.last_allocated_id(CatalogIdCategory::Relation) == second.id.value);

        auto response = restarted.manager.create_table(
            ddl::CreateTableRequest{testing::make_table(harness.schema_id, "t", {"v"})});
        REQUIRE(response.success);
        CHECK(testing::object_as<catalog::CatalogTable>(response, 0U).id.value == second.id.value + 1U);
    }
}

TEST_CASE("Recovery rebuilds the catalog from the store")
{
    CatalogHarness harness;
    const auto table = harness.create_table(testing::make_table(harness.schema_id, "orders", {"id", "amount"}));
    auto coupled = testing::make_table(harness.schema_id, "feed", {"v"});
    coupled.properties["connector"] = "kafka";
    REQUIRE(harness.manager.create_table(ddl::CreateTableRequest{coupled}).success);
    REQUIRE(harness.manager
                .create_view(ddl::CreateViewRequest{testing::make_view(harness.schema_id, "recent", {table.id}, {"id"}), {}})
                .success);
    REQUIRE(harness.manager
                .create_function(ddl::CreateFunctionRequest{
                    testing::make_function(harness.schema_id, "score", {catalog::CatalogDataType::Int64})})
                .success);

    RestartedCatalog restarted{harness};
    REQUIRE_FALSE(restarted.manager.recover());
    CHECK(restarted.manager.last_request_state() == CatalogRequestState::Idle);

    const auto before = harness.manager.snapshot();
    const auto after = restarted.manager.snapshot();
    CHECK(after->object_count() == before->object_count());
    CHECK(after->catalog_version() == harness.broadcaster.current_version());
    CHECK(*after->find_table(harness.schema_id, "orders") == table);
    CHECK(after->find_source(harness.schema_id, "feed") != nullptr);
    CHECK(after->functions_named(harness.schema_id, "score").size() == 1U);

    CHECK(restarted.manager.dependents(table.id).size() == 1U);
    const auto blocked = restarted.manager.drop_table(ddl::DropTableRequest{harness.schema_id, "orders"});
    CHECK(blocked.error == CatalogErrc::DependencyViolation);

    const auto next = restarted.manager.create_schema(ddl::CreateSchemaRequest{harness.database_id, "staging"});
    REQUIRE(next.success);
    CHECK(next.catalog_version == harness.broadcaster.current_version() + 1U);
}

TEST_CASE("Recovery refuses an inconsistent store")
{
    CatalogHarness harness;
    const auto table = harness.create_table(testing::make_table(harness.schema_id, "t", {"v"}));

    SECTION("Undecodable payload")
    {
        put(harness.store.inner, catalog::catalog_object_key(catalog::CatalogObjectKind::Table, 900U), {std::byte{0x7f}});
    }

    SECTION("Object stored under another object's key")
    {
        put(harness.store.inner,
            catalog::catalog_object_key(catalog::CatalogObjectKind::Table, 900U),
            catalog::encode_catalog_object(table));
    }

    SECTION("Undecodable id watermark")
    {
        put(harness.store.inner, catalog::id_watermark_key(CatalogIdCategory::Relation), {std::byte{0x01}});
    }

    SECTION("Table pointing at a missing source")
    {
        auto broken = table;
        broken.associated_source_id = catalog::RelationId{901U};
        put(harness.store.inner, catalog::catalog_object_key(broken), catalog::encode_catalog_object(broken));
    }

    RestartedCatalog restarted{harness};
    CHECK(restarted.manager.recover() == CatalogErrc::Inconsistent);
    CHECK(restarted.manager.snapshot()->object_count() == 0U);
}

TEST_CASE("Recovery reports an unreachable store")
{
    class UnreachableStore final : public catalog::CatalogStore {
    public:
        std::error_code commit(std::span<const catalog::CatalogWrite>) override
        {
            return std::make_error_code(std::errc::host_unreachable);
        }

        std::error_code load_all(catalog::CatalogStoreContents&) override
        {
            return std::make_error_code(std::errc::host_unreachable);
        }
    };

    UnreachableStore store;
    notify::NotificationBroadcaster broadcaster;
    ddl::CatalogManager manager{ddl::CatalogManager::Config{&store, &broadcaster, {}}};
    CHECK(manager.recover() == CatalogErrc::StoreUnavailable);
}
