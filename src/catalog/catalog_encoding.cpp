#include "streamcat/catalog/catalog_encoding.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace streamcat::catalog {

namespace {

class PayloadWriter final {
public:
    template <typename T>
    void write_unsigned(T value)
    {
        static_assert(std::is_unsigned_v<T>);
        for (std::size_t index = 0U; index < sizeof(T); ++index) {
            buffer_.push_back(static_cast<std::byte>((value >> (8U * index)) & 0xFFU));
        }
    }

    void write_bool(bool value)
    {
        write_unsigned<std::uint8_t>(value ? 1U : 0U);
    }

    void write_i32(std::int32_t value)
    {
        write_unsigned(static_cast<std::uint32_t>(value));
    }

    template <typename E>
    void write_enum(E value)
    {
        write_unsigned(static_cast<std::underlying_type_t<E>>(value));
    }

    void write_string(std::string_view value)
    {
        write_unsigned(static_cast<std::uint32_t>(value.size()));
        for (const char ch : value) {
            buffer_.push_back(static_cast<std::byte>(ch));
        }
    }

    void write_count(std::size_t count)
    {
        write_unsigned(static_cast<std::uint32_t>(count));
    }

    std::vector<std::byte> release() noexcept
    {
        return std::move(buffer_);
    }

private:
    std::vector<std::byte> buffer_{};
};

class PayloadReader final {
public:
    explicit PayloadReader(std::span<const std::byte> buffer) noexcept
        : buffer_{buffer}
    {
    }

    template <typename T>
    [[nodiscard]] bool read_unsigned(T& out) noexcept
    {
        static_assert(std::is_unsigned_v<T>);
        if (remaining() < sizeof(T)) {
            return false;
        }
        T value = 0U;
        for (std::size_t index = 0U; index < sizeof(T); ++index) {
            value = static_cast<T>(value | (static_cast<T>(std::to_integer<std::uint8_t>(buffer_[offset_ + index])) << (8U * index)));
        }
        offset_ += sizeof(T);
        out = value;
        return true;
    }

    [[nodiscard]] bool read_bool(bool& out) noexcept
    {
        std::uint8_t raw = 0U;
        if (!read_unsigned(raw) || raw > 1U) {
            return false;
        }
        out = raw == 1U;
        return true;
    }

    [[nodiscard]] bool read_i32(std::int32_t& out) noexcept
    {
        std::uint32_t raw = 0U;
        if (!read_unsigned(raw)) {
            return false;
        }
        out = static_cast<std::int32_t>(raw);
        return true;
    }

    template <typename E>
    [[nodiscard]] bool read_enum(E& out, E max_value) noexcept
    {
        std::underlying_type_t<E> raw{};
        if (!read_unsigned(raw) || raw > static_cast<std::underlying_type_t<E>>(max_value)) {
            return false;
        }
        out = static_cast<E>(raw);
        return true;
    }

    [[nodiscard]] bool read_string(std::string& out)
    {
        std::uint32_t length = 0U;
        if (!read_unsigned(length) || remaining() < length) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(buffer_.data() + offset_), length);
        offset_ += length;
        return true;
    }

    // Every encoded element occupies at least one byte, so a count larger
    // than the remaining payload can only come from a corrupt buffer.
    [[nodiscard]] bool read_count(std::size_t& out) noexcept
    {
        std::uint32_t count = 0U;
        if (!read_unsigned(count) || count > remaining()) {
            return false;
        }
        out = count;
        return true;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return buffer_.size() - offset_;
    }

    [[nodiscard]] bool exhausted() const noexcept
    {
        return offset_ == buffer_.size();
    }

private:
    std::span<const std::byte> buffer_{};
    std::size_t offset_ = 0U;
};

void write_optional_index(PayloadWriter& writer, const OptionalColumnIndex& index)
{
    writer.write_bool(index.has_value());
    if (index) {
        writer.write_unsigned(*index);
    }
}

[[nodiscard]] bool read_optional_index(PayloadReader& reader, OptionalColumnIndex& out)
{
    bool present = false;
    if (!reader.read_bool(present)) {
        return false;
    }
    if (!present) {
        out.reset();
        return true;
    }
    std::uint32_t value = 0U;
    if (!reader.read_unsigned(value)) {
        return false;
    }
    out = value;
    return true;
}

void write_indices(PayloadWriter& writer, const std::vector<std::uint32_t>& indices)
{
    writer.write_count(indices.size());
    for (const auto index : indices) {
        writer.write_unsigned(index);
    }
}

[[nodiscard]] bool read_indices(PayloadReader& reader, std::vector<std::uint32_t>& out)
{
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    out.resize(count);
    for (auto& index : out) {
        if (!reader.read_unsigned(index)) {
            return false;
        }
    }
    return true;
}

void write_relation_ids(PayloadWriter& writer, const std::vector<RelationId>& ids)
{
    writer.write_count(ids.size());
    for (const auto id : ids) {
        writer.write_unsigned(id.value);
    }
}

[[nodiscard]] bool read_relation_ids(PayloadReader& reader, std::vector<RelationId>& out)
{
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    out.resize(count);
    for (auto& id : out) {
        if (!reader.read_unsigned(id.value)) {
            return false;
        }
    }
    return true;
}

void write_properties(PayloadWriter& writer, const PropertyMap& properties)
{
    writer.write_count(properties.size());
    for (const auto& [key, value] : properties) {
        writer.write_string(key);
        writer.write_string(value);
    }
}

[[nodiscard]] bool read_properties(PayloadReader& reader, PropertyMap& out)
{
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    out.clear();
    for (std::size_t index = 0U; index < count; ++index) {
        std::string key;
        std::string value;
        if (!reader.read_string(key) || !reader.read_string(value)) {
            return false;
        }
        out.emplace(std::move(key), std::move(value));
    }
    return true;
}

void write_columns(PayloadWriter& writer, const std::vector<ColumnDescriptor>& columns)
{
    writer.write_count(columns.size());
    for (const auto& column : columns) {
        writer.write_i32(column.column_id.value);
        writer.write_string(column.name);
        writer.write_enum(column.data_type);
        writer.write_bool(column.is_hidden);
    }
}

[[nodiscard]] bool read_columns(PayloadReader& reader, std::vector<ColumnDescriptor>& out)
{
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    out.resize(count);
    for (auto& column : out) {
        if (!reader.read_i32(column.column_id.value) || !reader.read_string(column.name)
            || !reader.read_enum(column.data_type, CatalogDataType::Serial) || !reader.read_bool(column.is_hidden)) {
            return false;
        }
    }
    return true;
}

void write_column_orders(PayloadWriter& writer, const std::vector<ColumnOrder>& orders)
{
    writer.write_count(orders.size());
    for (const auto& order : orders) {
        writer.write_unsigned(order.column_index);
        writer.write_enum(order.order);
    }
}

[[nodiscard]] bool read_column_orders(PayloadReader& reader, std::vector<ColumnOrder>& out)
{
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    out.resize(count);
    for (auto& order : out) {
        if (!reader.read_unsigned(order.column_index) || !reader.read_enum(order.order, OrderType::Descending)) {
            return false;
        }
    }
    return true;
}

template <typename T>
void write_header(PayloadWriter& writer, const T& object)
{
    writer.write_unsigned(object.id.value);
    writer.write_string(object.name);
    writer.write_unsigned(object.owner);
}

template <typename T>
[[nodiscard]] bool read_header(PayloadReader& reader, T& object)
{
    return reader.read_unsigned(object.id.value) && reader.read_string(object.name) && reader.read_unsigned(object.owner);
}

template <typename T>
void write_scope(PayloadWriter& writer, const T& object)
{
    writer.write_unsigned(object.schema_id.value);
    writer.write_unsigned(object.database_id.value);
}

template <typename T>
[[nodiscard]] bool read_scope(PayloadReader& reader, T& object)
{
    return reader.read_unsigned(object.schema_id.value) && reader.read_unsigned(object.database_id.value);
}

void write_body(PayloadWriter&, const CatalogDatabase&)
{
}

[[nodiscard]] bool read_body(PayloadReader&, CatalogDatabase&)
{
    return true;
}

void write_body(PayloadWriter& writer, const CatalogSchema& schema)
{
    writer.write_unsigned(schema.database_id.value);
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogSchema& schema)
{
    return reader.read_unsigned(schema.database_id.value);
}

void write_body(PayloadWriter& writer, const CatalogTable& table)
{
    write_scope(writer, table);
    writer.write_enum(table.table_type);
    write_columns(writer, table.columns);
    write_column_orders(writer, table.pk);
    write_indices(writer, table.distribution_key);
    write_indices(writer, table.stream_key);
    writer.write_bool(table.append_only);
    write_optional_index(writer, table.vnode_col_index);
    write_optional_index(writer, table.row_id_index);
    write_indices(writer, table.value_indices);
    write_indices(writer, table.watermark_indices);
    writer.write_string(table.definition);
    writer.write_bool(table.version.has_value());
    if (table.version) {
        writer.write_unsigned(table.version->version);
        writer.write_i32(table.version->next_column_id.value);
    }
    writer.write_bool(table.associated_source_id.has_value());
    if (table.associated_source_id) {
        writer.write_unsigned(table.associated_source_id->value);
    }
    write_relation_ids(writer, table.dependent_relations);
    write_properties(writer, table.properties);
    writer.write_bool(table.handle_pk_conflict);
    writer.write_unsigned(table.read_prefix_len_hint);
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogTable& table)
{
    if (!read_scope(reader, table) || !reader.read_enum(table.table_type, TableType::Internal)
        || !read_columns(reader, table.columns) || !read_column_orders(reader, table.pk)
        || !read_indices(reader, table.distribution_key) || !read_indices(reader, table.stream_key)
        || !reader.read_bool(table.append_only) || !read_optional_index(reader, table.vnode_col_index)
        || !read_optional_index(reader, table.row_id_index) || !read_indices(reader, table.value_indices)
        || !read_indices(reader, table.watermark_indices) || !reader.read_string(table.definition)) {
        return false;
    }

    bool has_version = false;
    if (!reader.read_bool(has_version)) {
        return false;
    }
    if (has_version) {
        TableVersion version{};
        if (!reader.read_unsigned(version.version) || !reader.read_i32(version.next_column_id.value)) {
            return false;
        }
        table.version = version;
    }

    bool has_source = false;
    if (!reader.read_bool(has_source)) {
        return false;
    }
    if (has_source) {
        RelationId source_id{};
        if (!reader.read_unsigned(source_id.value)) {
            return false;
        }
        table.associated_source_id = source_id;
    }

    return read_relation_ids(reader, table.dependent_relations) && read_properties(reader, table.properties)
           && reader.read_bool(table.handle_pk_conflict) && reader.read_unsigned(table.read_prefix_len_hint);
}

void write_body(PayloadWriter& writer, const CatalogSource& source)
{
    write_scope(writer, source);
    write_optional_index(writer, source.row_id_index);
    write_columns(writer, source.columns);
    writer.write_count(source.pk_column_ids.size());
    for (const auto column_id : source.pk_column_ids) {
        writer.write_i32(column_id.value);
    }
    write_properties(writer, source.properties);
    writer.write_enum(source.info.row_format);
    writer.write_string(source.info.row_schema_location);
    writer.write_bool(source.info.use_schema_registry);
    writer.write_string(source.info.proto_message_name);
    writer.write_i32(source.info.csv_delimiter);
    writer.write_bool(source.info.csv_has_header);
    writer.write_count(source.watermark_descs.size());
    for (const auto& watermark : source.watermark_descs) {
        writer.write_unsigned(watermark.watermark_idx);
        writer.write_string(watermark.expr);
    }
    writer.write_bool(source.associated_table_id.has_value());
    if (source.associated_table_id) {
        writer.write_unsigned(source.associated_table_id->value);
    }
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogSource& source)
{
    if (!read_scope(reader, source) || !read_optional_index(reader, source.row_id_index)
        || !read_columns(reader, source.columns)) {
        return false;
    }

    std::size_t pk_count = 0U;
    if (!reader.read_count(pk_count)) {
        return false;
    }
    source.pk_column_ids.resize(pk_count);
    for (auto& column_id : source.pk_column_ids) {
        if (!reader.read_i32(column_id.value)) {
            return false;
        }
    }

    if (!read_properties(reader, source.properties) || !reader.read_enum(source.info.row_format, RowFormatType::UpsertAvro)
        || !reader.read_string(source.info.row_schema_location) || !reader.read_bool(source.info.use_schema_registry)
        || !reader.read_string(source.info.proto_message_name) || !reader.read_i32(source.info.csv_delimiter)
        || !reader.read_bool(source.info.csv_has_header)) {
        return false;
    }

    std::size_t watermark_count = 0U;
    if (!reader.read_count(watermark_count)) {
        return false;
    }
    source.watermark_descs.resize(watermark_count);
    for (auto& watermark : source.watermark_descs) {
        if (!reader.read_unsigned(watermark.watermark_idx) || !reader.read_string(watermark.expr)) {
            return false;
        }
    }

    bool has_table = false;
    if (!reader.read_bool(has_table)) {
        return false;
    }
    if (has_table) {
        RelationId table_id{};
        if (!reader.read_unsigned(table_id.value)) {
            return false;
        }
        source.associated_table_id = table_id;
    }
    return true;
}

void write_body(PayloadWriter& writer, const CatalogSink& sink)
{
    write_scope(writer, sink);
    write_columns(writer, sink.columns);
    write_column_orders(writer, sink.pk);
    write_relation_ids(writer, sink.dependent_relations);
    write_indices(writer, sink.distribution_key);
    write_indices(writer, sink.stream_key);
    writer.write_bool(sink.append_only);
    write_properties(writer, sink.properties);
    writer.write_string(sink.definition);
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogSink& sink)
{
    return read_scope(reader, sink) && read_columns(reader, sink.columns) && read_column_orders(reader, sink.pk)
           && read_relation_ids(reader, sink.dependent_relations) && read_indices(reader, sink.distribution_key)
           && read_indices(reader, sink.stream_key) && reader.read_bool(sink.append_only)
           && read_properties(reader, sink.properties) && reader.read_string(sink.definition);
}

void write_body(PayloadWriter& writer, const CatalogIndex& index)
{
    write_scope(writer, index);
    writer.write_unsigned(index.index_table_id.value);
    writer.write_unsigned(index.primary_table_id.value);
    writer.write_count(index.index_items.size());
    for (const auto& item : index.index_items) {
        writer.write_unsigned(item.input_ref);
        writer.write_enum(item.return_type);
    }
    write_indices(writer, index.original_columns);
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogIndex& index)
{
    if (!read_scope(reader, index) || !reader.read_unsigned(index.index_table_id.value)
        || !reader.read_unsigned(index.primary_table_id.value)) {
        return false;
    }
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    index.index_items.resize(count);
    for (auto& item : index.index_items) {
        if (!reader.read_unsigned(item.input_ref) || !reader.read_enum(item.return_type, CatalogDataType::Serial)) {
            return false;
        }
    }
    return read_indices(reader, index.original_columns);
}

void write_body(PayloadWriter& writer, const CatalogView& view)
{
    write_scope(writer, view);
    write_properties(writer, view.properties);
    writer.write_string(view.sql);
    write_relation_ids(writer, view.dependent_relations);
    writer.write_count(view.columns.size());
    for (const auto& field : view.columns) {
        writer.write_string(field.name);
        writer.write_enum(field.data_type);
    }
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogView& view)
{
    if (!read_scope(reader, view) || !read_properties(reader, view.properties) || !reader.read_string(view.sql)
        || !read_relation_ids(reader, view.dependent_relations)) {
        return false;
    }
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    view.columns.resize(count);
    for (auto& field : view.columns) {
        if (!reader.read_string(field.name) || !reader.read_enum(field.data_type, CatalogDataType::Serial)) {
            return false;
        }
    }
    return true;
}

void write_body(PayloadWriter& writer, const CatalogFunction& function)
{
    write_scope(writer, function);
    writer.write_count(function.arg_types.size());
    for (const auto type : function.arg_types) {
        writer.write_enum(type);
    }
    writer.write_enum(function.return_type);
    writer.write_string(function.language);
    writer.write_string(function.link);
}

[[nodiscard]] bool read_body(PayloadReader& reader, CatalogFunction& function)
{
    if (!read_scope(reader, function)) {
        return false;
    }
    std::size_t count = 0U;
    if (!reader.read_count(count)) {
        return false;
    }
    function.arg_types.resize(count);
    for (auto& type : function.arg_types) {
        if (!reader.read_enum(type, CatalogDataType::Serial)) {
            return false;
        }
    }
    return reader.read_enum(function.return_type, CatalogDataType::Serial) && reader.read_string(function.language)
           && reader.read_string(function.link);
}

template <typename T>
[[nodiscard]] std::optional<CatalogObject> decode_as(PayloadReader& reader)
{
    T object{};
    if (!read_header(reader, object) || !read_body(reader, object) || !reader.exhausted()) {
        return std::nullopt;
    }
    return CatalogObject{std::move(object)};
}

}  // namespace

std::string catalog_object_key(CatalogObjectKind kind, std::uint64_t id)
{
    return fmt::format("{}/{:020}", to_string(kind), id);
}

std::string catalog_object_key(const CatalogObject& object)
{
    return catalog_object_key(object_kind(object), object_id(object));
}

std::string id_watermark_key(CatalogIdCategory category)
{
    return fmt::format("{}{}", kIdWatermarkKeyPrefix, to_string(category));
}

bool is_id_watermark_key(std::string_view key) noexcept
{
    return key.substr(0U, kIdWatermarkKeyPrefix.size()) == kIdWatermarkKeyPrefix;
}

std::vector<std::byte> encode_catalog_object(const CatalogObject& object)
{
    PayloadWriter writer;
    writer.write_unsigned(kCatalogEncodingVersion);
    writer.write_enum(object_kind(object));
    std::visit(
        [&writer](const auto& entry) {
            write_header(writer, entry);
            write_body(writer, entry);
        },
        object);
    return writer.release();
}

std::optional<CatalogObject> decode_catalog_object(std::span<const std::byte> buffer)
{
    PayloadReader reader{buffer};
    std::uint8_t version = 0U;
    if (!reader.read_unsigned(version) || version != kCatalogEncodingVersion) {
        return std::nullopt;
    }

    CatalogObjectKind kind = CatalogObjectKind::Database;
    if (!reader.read_enum(kind, CatalogObjectKind::Function)) {
        return std::nullopt;
    }

    switch (kind) {
    case CatalogObjectKind::Database:
        return decode_as<CatalogDatabase>(reader);
    case CatalogObjectKind::Schema:
        return decode_as<CatalogSchema>(reader);
    case CatalogObjectKind::Table:
        return decode_as<CatalogTable>(reader);
    case CatalogObjectKind::Source:
        return decode_as<CatalogSource>(reader);
    case CatalogObjectKind::Sink:
        return decode_as<CatalogSink>(reader);
    case CatalogObjectKind::Index:
        return decode_as<CatalogIndex>(reader);
    case CatalogObjectKind::View:
        return decode_as<CatalogView>(reader);
    case CatalogObjectKind::Function:
        return decode_as<CatalogFunction>(reader);
    default:
        return std::nullopt;
    }
}

std::vector<std::byte> encode_id_watermark(const CatalogIdWatermark& watermark)
{
    PayloadWriter writer;
    writer.write_unsigned(kCatalogEncodingVersion);
    writer.write_enum(watermark.category);
    writer.write_unsigned(watermark.last_allocated);
    return writer.release();
}

std::optional<CatalogIdWatermark> decode_id_watermark(std::span<const std::byte> buffer)
{
    PayloadReader reader{buffer};
    std::uint8_t version = 0U;
    CatalogIdWatermark watermark{};
    if (!reader.read_unsigned(version) || version != kCatalogEncodingVersion
        || !reader.read_enum(watermark.category, CatalogIdCategory::Function)
        || !reader.read_unsigned(watermark.last_allocated) || !reader.exhausted()) {
        return std::nullopt;
    }
    return watermark;
}

}  // namespace streamcat::catalog
