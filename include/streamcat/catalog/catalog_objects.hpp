#pragma once

#include "streamcat/catalog/catalog_ids.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace streamcat::catalog {

enum class CatalogDataType : std::uint16_t {
    Unknown = 0,
    Boolean = 1,
    Int16 = 2,
    Int32 = 3,
    Int64 = 4,
    Float32 = 5,
    Float64 = 6,
    Decimal = 7,
    Varchar = 8,
    Date = 9,
    Time = 10,
    Timestamp = 11,
    Timestamptz = 12,
    Interval = 13,
    Bytea = 14,
    Jsonb = 15,
    Serial = 16
};

enum class OrderType : std::uint8_t {
    Ascending = 0,
    Descending = 1
};

enum class TableType : std::uint8_t {
    Unspecified = 0,
    Table = 1,
    MaterializedView = 2,
    Index = 3,
    Internal = 4
};

enum class RowFormatType : std::uint8_t {
    Unspecified = 0,
    Json = 1,
    Protobuf = 2,
    DebeziumJson = 3,
    Avro = 4,
    Maxwell = 5,
    CanalJson = 6,
    Csv = 7,
    Native = 8,
    DebeziumAvro = 9,
    UpsertJson = 10,
    UpsertAvro = 11
};

// Distinguishes "index 0" from "no index"; never use a sentinel for these.
using OptionalColumnIndex = std::optional<std::uint32_t>;

using PropertyMap = std::map<std::string, std::string>;

struct ColumnDescriptor final {
    ColumnId column_id{};
    std::string name{};
    CatalogDataType data_type = CatalogDataType::Unknown;
    bool is_hidden = false;

    friend bool operator==(const ColumnDescriptor&, const ColumnDescriptor&) = default;
};

struct ColumnOrder final {
    std::uint32_t column_index = 0U;
    OrderType order = OrderType::Ascending;

    friend bool operator==(const ColumnOrder&, const ColumnOrder&) = default;
};

struct Field final {
    std::string name{};
    CatalogDataType data_type = CatalogDataType::Unknown;

    friend bool operator==(const Field&, const Field&) = default;
};

// Per-table schema version. Not to be confused with the global catalog
// version stamped on notifications.
struct TableVersion final {
    std::uint64_t version = 0U;
    ColumnId next_column_id{};

    friend bool operator==(const TableVersion&, const TableVersion&) = default;
};

struct CatalogDatabase final {
    DatabaseId id{};
    std::string name{};
    UserId owner = kRootUserId;

    friend bool operator==(const CatalogDatabase&, const CatalogDatabase&) = default;
};

struct CatalogSchema final {
    SchemaId id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;

    friend bool operator==(const CatalogSchema&, const CatalogSchema&) = default;
};

struct CatalogTable final {
    RelationId id{};
    SchemaId schema_id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;
    TableType table_type = TableType::Table;
    std::vector<ColumnDescriptor> columns{};
    std::vector<ColumnOrder> pk{};
    std::vector<std::uint32_t> distribution_key{};
    std::vector<std::uint32_t> stream_key{};
    bool append_only = false;
    OptionalColumnIndex vnode_col_index{};
    OptionalColumnIndex row_id_index{};
    std::vector<std::uint32_t> value_indices{};
    std::vector<std::uint32_t> watermark_indices{};
    std::string definition{};
    std::optional<TableVersion> version{};
    std::optional<RelationId> associated_source_id{};
    std::vector<RelationId> dependent_relations{};
    PropertyMap properties{};
    bool handle_pk_conflict = false;
    std::uint32_t read_prefix_len_hint = 0U;

    friend bool operator==(const CatalogTable&, const CatalogTable&) = default;
};

struct StreamSourceInfo final {
    RowFormatType row_format = RowFormatType::Unspecified;
    std::string row_schema_location{};
    bool use_schema_registry = false;
    std::string proto_message_name{};
    std::int32_t csv_delimiter = ',';
    bool csv_has_header = false;

    friend bool operator==(const StreamSourceInfo&, const StreamSourceInfo&) = default;
};

struct WatermarkDesc final {
    std::uint32_t watermark_idx = 0U;
    // Opaque expression text; evaluated by the stream engine, never here.
    std::string expr{};

    friend bool operator==(const WatermarkDesc&, const WatermarkDesc&) = default;
};

struct CatalogSource final {
    RelationId id{};
    SchemaId schema_id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;
    OptionalColumnIndex row_id_index{};
    std::vector<ColumnDescriptor> columns{};
    std::vector<ColumnId> pk_column_ids{};
    PropertyMap properties{};
    StreamSourceInfo info{};
    std::vector<WatermarkDesc> watermark_descs{};
    std::optional<RelationId> associated_table_id{};

    friend bool operator==(const CatalogSource&, const CatalogSource&) = default;
};

struct CatalogSink final {
    RelationId id{};
    SchemaId schema_id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;
    std::vector<ColumnDescriptor> columns{};
    std::vector<ColumnOrder> pk{};
    std::vector<RelationId> dependent_relations{};
    std::vector<std::uint32_t> distribution_key{};
    std::vector<std::uint32_t> stream_key{};
    bool append_only = false;
    PropertyMap properties{};
    std::string definition{};

    friend bool operator==(const CatalogSink&, const CatalogSink&) = default;
};

// Only plain column references into the primary table are supported.
struct IndexItem final {
    std::uint32_t input_ref = 0U;
    CatalogDataType return_type = CatalogDataType::Unknown;

    friend bool operator==(const IndexItem&, const IndexItem&) = default;
};

struct CatalogIndex final {
    RelationId id{};
    SchemaId schema_id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;
    RelationId index_table_id{};
    RelationId primary_table_id{};
    std::vector<IndexItem> index_items{};
    std::vector<std::uint32_t> original_columns{};

    friend bool operator==(const CatalogIndex&, const CatalogIndex&) = default;
};

struct CatalogView final {
    RelationId id{};
    SchemaId schema_id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;
    PropertyMap properties{};
    std::string sql{};
    std::vector<RelationId> dependent_relations{};
    std::vector<Field> columns{};

    friend bool operator==(const CatalogView&, const CatalogView&) = default;
};

struct CatalogFunction final {
    FunctionId id{};
    SchemaId schema_id{};
    DatabaseId database_id{};
    std::string name{};
    UserId owner = kRootUserId;
    std::vector<CatalogDataType> arg_types{};
    CatalogDataType return_type = CatalogDataType::Unknown;
    std::string language{};
    std::string link{};

    friend bool operator==(const CatalogFunction&, const CatalogFunction&) = default;
};

// Alternative order matches CatalogObjectKind.
using CatalogObject = std::variant<CatalogDatabase,
                                   CatalogSchema,
                                   CatalogTable,
                                   CatalogSource,
                                   CatalogSink,
                                   CatalogIndex,
                                   CatalogView,
                                   CatalogFunction>;

enum class CatalogObjectKind : std::uint8_t {
    Database = 0,
    Schema,
    Table,
    Source,
    Sink,
    Index,
    View,
    Function,
    Count
};

// Id spaces. Every relation kind draws from the same counter.
enum class CatalogIdCategory : std::uint8_t {
    Database = 0,
    Schema,
    Relation,
    Function,
    Count
};

[[nodiscard]] CatalogObjectKind object_kind(const CatalogObject& object) noexcept;
[[nodiscard]] std::uint64_t object_id(const CatalogObject& object) noexcept;
[[nodiscard]] std::string_view object_name(const CatalogObject& object) noexcept;
[[nodiscard]] SchemaId object_schema_id(const CatalogObject& object) noexcept;

[[nodiscard]] bool is_relation_kind(CatalogObjectKind kind) noexcept;
[[nodiscard]] CatalogIdCategory id_category(CatalogObjectKind kind) noexcept;

[[nodiscard]] const char* to_string(CatalogObjectKind kind) noexcept;
[[nodiscard]] const char* to_string(CatalogIdCategory category) noexcept;
[[nodiscard]] const char* to_string(TableType type) noexcept;
[[nodiscard]] const char* to_string(CatalogDataType type) noexcept;

}  // namespace streamcat::catalog
