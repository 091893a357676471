#include "streamcat/ddl/ddl_validation.hpp"

#include "support/catalog_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace streamcat;
using namespace streamcat::ddl;
using catalog::CatalogErrc;

TEST_CASE("is_valid_identifier enforces naming rules")
{
    CHECK(is_valid_identifier("valid_name"));
    CHECK(is_valid_identifier("_underscore"));
    CHECK(is_valid_identifier("dollar$"));
    CHECK_FALSE(is_valid_identifier(""));
    CHECK_FALSE(is_valid_identifier("9startsWithDigit"));
    CHECK_FALSE(is_valid_identifier("has-hyphen"));
    CHECK_FALSE(is_valid_identifier("contains space"));
}

TEST_CASE("Table definitions must reference existing columns")
{
    const auto table = testing::make_table(catalog::SchemaId{1U}, "t", {"a", "b"});
    std::string detail;
    CHECK_FALSE(validate_table_definition(table, detail));

    SECTION("Primary key out of range")
    {
        auto broken = table;
        broken.pk.push_back(catalog::ColumnOrder{7U, catalog::OrderType::Ascending});
        CHECK(validate_table_definition(broken, detail) == CatalogErrc::InvalidDefinition);
        CHECK(detail.find("primary key") != std::string::npos);
    }

    SECTION("Primary key repeats a column")
    {
        auto broken = table;
        broken.pk.push_back(catalog::ColumnOrder{0U, catalog::OrderType::Descending});
        CHECK(validate_table_definition(broken, detail) == CatalogErrc::InvalidDefinition);
        CHECK(detail.find("twice") != std::string::npos);
    }

    SECTION("Row id out of range")
    {
        auto broken = table;
        broken.row_id_index = 3U;
        CHECK(validate_table_definition(broken, detail) == CatalogErrc::InvalidDefinition);
        CHECK(detail.find("row id") != std::string::npos);
    }

    SECTION("Duplicate column names")
    {
        auto broken = table;
        broken.columns.push_back(testing::make_column("a"));
        CHECK(validate_table_definition(broken, detail) == CatalogErrc::InvalidDefinition);
        CHECK(detail.find("'a'") != std::string::npos);
    }

    SECTION("Columns without a type")
    {
        auto broken = table;
        broken.columns[1].data_type = catalog::CatalogDataType::Unknown;
        CHECK(validate_table_definition(broken, detail) == CatalogErrc::InvalidDefinition);
    }

    SECTION("No columns at all")
    {
        auto broken = table;
        broken.columns.clear();
        broken.pk.clear();
        broken.distribution_key.clear();
        broken.stream_key.clear();
        broken.value_indices.clear();
        broken.row_id_index.reset();
        CHECK(validate_table_definition(broken, detail) == CatalogErrc::InvalidDefinition);
    }
}

TEST_CASE("Source definitions need unique column ids and valid watermarks")
{
    auto source = testing::make_source(catalog::SchemaId{1U}, "events", {"ts", "payload"});
    std::string detail;
    CHECK_FALSE(validate_source_definition(source, detail));

    SECTION("Repeated column id")
    {
        source.columns[1].column_id = source.columns[0].column_id;
        CHECK(validate_source_definition(source, detail) == CatalogErrc::InvalidDefinition);
    }

    SECTION("Primary key on an unknown column id")
    {
        source.pk_column_ids.push_back(catalog::ColumnId{42});
        CHECK(validate_source_definition(source, detail) == CatalogErrc::InvalidDefinition);
    }

    SECTION("Watermark without an expression")
    {
        source.watermark_descs.push_back(catalog::WatermarkDesc{0U, {}});
        CHECK(validate_source_definition(source, detail) == CatalogErrc::InvalidDefinition);
    }

    SECTION("Watermark beyond the columns")
    {
        source.watermark_descs.push_back(catalog::WatermarkDesc{5U, "ts - INTERVAL '5' SECOND"});
        CHECK(validate_source_definition(source, detail) == CatalogErrc::InvalidDefinition);
    }
}

TEST_CASE("Function definitions need complete signatures")
{
    auto function = testing::make_function(catalog::SchemaId{1U}, "f", {catalog::CatalogDataType::Int32});
    std::string detail;
    CHECK_FALSE(validate_function_definition(function, detail));

    function.arg_types.push_back(catalog::CatalogDataType::Unknown);
    CHECK(validate_function_definition(function, detail) == CatalogErrc::InvalidDefinition);

    function.arg_types.pop_back();
    function.language.clear();
    CHECK(validate_function_definition(function, detail) == CatalogErrc::InvalidDefinition);
}

TEST_CASE("View column names rename the query output one for one")
{
    const std::vector<catalog::Field> fields{{"x", catalog::CatalogDataType::Int32}, {"y", catalog::CatalogDataType::Int32}};
    std::string detail;

    CHECK_FALSE(validate_view_columns(fields, std::vector<std::string>{}, detail));
    CHECK_FALSE(validate_view_columns(fields, std::vector<std::string>{"a", "b"}, detail));
    CHECK(validate_view_columns(fields, std::vector<std::string>{"a"}, detail) == CatalogErrc::InvalidDefinition);
    CHECK(detail.find("1 column names") != std::string::npos);
    CHECK(validate_view_columns(fields, std::vector<std::string>{"a", "a"}, detail) == CatalogErrc::InvalidDefinition);
    CHECK(validate_view_columns({}, std::vector<std::string>{}, detail) == CatalogErrc::InvalidDefinition);
}

TEST_CASE("normalize_index_set sorts and removes duplicates")
{
    std::vector<std::uint32_t> indices{4U, 1U, 4U, 2U, 1U};
    normalize_index_set(indices);
    CHECK(indices == std::vector<std::uint32_t>{1U, 2U, 4U});
}
