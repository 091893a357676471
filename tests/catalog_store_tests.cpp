#include "streamcat/catalog/catalog_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <initializer_list>
#include <vector>

using namespace streamcat::catalog;

namespace {

std::vector<std::byte> bytes(std::initializer_list<int> values)
{
    std::vector<std::byte> out;
    for (const auto value : values) {
        out.push_back(static_cast<std::byte>(value));
    }
    return out;
}

}  // namespace

TEST_CASE("In-memory catalog store applies puts and tombstones")
{
    InMemoryCatalogStore store;

    const std::vector<CatalogWrite> first{{"table/1", bytes({1, 2})}, {"table/2", bytes({3})}};
    REQUIRE_FALSE(store.commit(first));
    CHECK(store.size() == 2U);

    const std::vector<CatalogWrite> second{{"table/1", std::nullopt}, {"table/2", bytes({4, 5, 6})}};
    REQUIRE_FALSE(store.commit(second));

    CatalogStoreContents contents;
    REQUIRE_FALSE(store.load_all(contents));
    CHECK(contents.size() == 1U);
    CHECK_FALSE(store.contains("table/1"));
    REQUIRE(contents.count("table/2") == 1U);
    CHECK(contents["table/2"] == bytes({4, 5, 6}));

    const auto telemetry = store.telemetry();
    CHECK(telemetry.commits == 2U);
    CHECK(telemetry.writes == 3U);
    CHECK(telemetry.tombstones == 1U);
}

TEST_CASE("In-memory catalog store starts from seeded contents")
{
    CatalogStoreContents seed;
    seed["schema/1"] = bytes({9});
    InMemoryCatalogStore store{seed};

    CHECK(store.contains("schema/1"));

    CatalogStoreContents contents;
    REQUIRE_FALSE(store.load_all(contents));
    CHECK(contents == seed);
}
