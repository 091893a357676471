#include "streamcat/catalog/catalog_introspection.hpp"

#include "streamcat/catalog/catalog_snapshot.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace streamcat::catalog {
namespace {

struct SchemaMetadata final {
    std::string database_name{};
    std::string schema_name{};
};

using SchemaLookup = std::unordered_map<std::uint64_t, SchemaMetadata>;

void append_json_string(std::string& out, const std::string& value)
{
    out.push_back('"');
    for (unsigned char ch : value) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

// Emits `"name":` with a leading comma for every field after the first.
class JsonObjectWriter final {
public:
    explicit JsonObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    void field_name(const char* name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        out_.push_back('"');
        out_.append(name);
        out_.append("\":");
    }

    void string_field(const char* name, const std::string& value)
    {
        field_name(name);
        append_json_string(out_, value);
    }

    void uint_field(const char* name, std::uint64_t value)
    {
        field_name(name);
        out_.append(std::to_string(value));
    }

    void bool_field(const char* name, bool value)
    {
        field_name(name);
        out_.append(value ? "true" : "false");
    }

    void close()
    {
        out_.push_back('}');
    }

private:
    std::string& out_;
    bool first_ = true;
};

SchemaLookup build_schema_lookup(const CatalogSnapshot& snapshot)
{
    SchemaLookup lookup;
    for (const auto& database : snapshot.databases()) {
        for (const auto& schema : snapshot.schemas(database->id)) {
            lookup.emplace(schema->id.value, SchemaMetadata{database->name, schema->name});
        }
    }
    return lookup;
}

std::vector<CatalogColumnSummary> summarize_columns(const std::vector<ColumnDescriptor>& columns, bool include_hidden)
{
    std::vector<CatalogColumnSummary> result;
    result.reserve(columns.size());
    for (const auto& column : columns) {
        if (column.is_hidden && !include_hidden) {
            continue;
        }
        result.push_back(CatalogColumnSummary{column.name, to_string(column.data_type), column.is_hidden});
    }
    return result;
}

std::vector<CatalogColumnSummary> summarize_fields(const std::vector<Field>& fields)
{
    std::vector<CatalogColumnSummary> result;
    result.reserve(fields.size());
    for (const auto& field : fields) {
        result.push_back(CatalogColumnSummary{field.name, to_string(field.data_type), false});
    }
    return result;
}

CatalogRelationKind table_relation_kind(TableType type) noexcept
{
    switch (type) {
    case TableType::MaterializedView:
        return CatalogRelationKind::MaterializedView;
    case TableType::Internal:
        return CatalogRelationKind::Internal;
    case TableType::Index:
        return CatalogRelationKind::Index;
    default:
        return CatalogRelationKind::Table;
    }
}

std::string render_properties(const PropertyMap& properties)
{
    std::string text;
    for (const auto& [key, value] : properties) {
        if (!text.empty()) {
            text += ", ";
        }
        text += fmt::format("{} = '{}'", key, value);
    }
    return text;
}

std::string index_definition(const CatalogSnapshot& snapshot, const CatalogIndex& index)
{
    const auto table = snapshot.table(index.primary_table_id);
    if (!table) {
        return {};
    }

    std::string columns;
    for (const auto& item : index.index_items) {
        if (item.input_ref >= table->columns.size()) {
            continue;
        }
        if (!columns.empty()) {
            columns += ", ";
        }
        columns += table->columns[item.input_ref].name;
    }
    return fmt::format("CREATE INDEX {} ON {}({})", index.name, table->name, columns);
}

std::string source_definition(const CatalogSource& source)
{
    if (source.properties.empty()) {
        return fmt::format("CREATE SOURCE {}", source.name);
    }
    return fmt::format("CREATE SOURCE {} WITH ({})", source.name, render_properties(source.properties));
}

void fill_schema(CatalogRelationSummary& summary, const SchemaLookup& lookup, SchemaId schema_id)
{
    const auto it = lookup.find(schema_id.value);
    if (it != lookup.end()) {
        summary.database_name = it->second.database_name;
        summary.schema_name = it->second.schema_name;
    } else {
        summary.database_name = "<unknown>";
        summary.schema_name = "<unknown>";
    }
}

std::string relation_name(const CatalogSnapshot& snapshot, RelationId id)
{
    if (auto table = snapshot.table(id)) {
        return table->name;
    }
    return "<unknown>";
}

}  // namespace

const char* to_string(CatalogRelationKind kind) noexcept
{
    switch (kind) {
    case CatalogRelationKind::Table:
        return "table";
    case CatalogRelationKind::MaterializedView:
        return "materialized_view";
    case CatalogRelationKind::Internal:
        return "internal";
    case CatalogRelationKind::Source:
        return "source";
    case CatalogRelationKind::Sink:
        return "sink";
    case CatalogRelationKind::Index:
        return "index";
    case CatalogRelationKind::View:
        return "view";
    default:
        return "unknown";
    }
}

CatalogIntrospectionSnapshot collect_catalog_introspection(const CatalogSnapshot& snapshot)
{
    CatalogIntrospectionSnapshot result{};
    result.catalog_version = snapshot.catalog_version();

    const auto schemas = build_schema_lookup(snapshot);

    for (const auto& [id, table] : snapshot.all_tables()) {
        if (table->table_type == TableType::Index) {
            continue;
        }
        CatalogRelationSummary summary{};
        fill_schema(summary, schemas, table->schema_id);
        summary.relation_name = table->name;
        summary.relation_kind = table_relation_kind(table->table_type);
        summary.relation_id = id;
        summary.definition = table->definition;
        summary.columns = summarize_columns(table->columns, true);
        result.relations.push_back(std::move(summary));
    }

    for (const auto& [id, source] : snapshot.all_sources()) {
        CatalogRelationSummary summary{};
        fill_schema(summary, schemas, source->schema_id);
        summary.relation_name = source->name;
        summary.relation_kind = CatalogRelationKind::Source;
        summary.relation_id = id;
        if (source->associated_table_id) {
            summary.owner_relation_name = relation_name(snapshot, *source->associated_table_id);
        }
        summary.definition = source_definition(*source);
        summary.columns = summarize_columns(source->columns, true);
        result.relations.push_back(std::move(summary));
    }

    for (const auto& [id, sink] : snapshot.all_sinks()) {
        CatalogRelationSummary summary{};
        fill_schema(summary, schemas, sink->schema_id);
        summary.relation_name = sink->name;
        summary.relation_kind = CatalogRelationKind::Sink;
        summary.relation_id = id;
        summary.definition = sink->definition;
        summary.columns = summarize_columns(sink->columns, true);
        result.relations.push_back(std::move(summary));
    }

    for (const auto& [id, index] : snapshot.all_indexes()) {
        CatalogRelationSummary summary{};
        fill_schema(summary, schemas, index->schema_id);
        summary.relation_name = index->name;
        summary.relation_kind = CatalogRelationKind::Index;
        summary.relation_id = id;
        summary.owner_relation_name = relation_name(snapshot, index->primary_table_id);
        summary.definition = index_definition(snapshot, *index);
        if (auto backing = snapshot.table(index->index_table_id)) {
            summary.columns = summarize_columns(backing->columns, true);
        }
        result.relations.push_back(std::move(summary));
    }

    for (const auto& [id, view] : snapshot.all_views()) {
        CatalogRelationSummary summary{};
        fill_schema(summary, schemas, view->schema_id);
        summary.relation_name = view->name;
        summary.relation_kind = CatalogRelationKind::View;
        summary.relation_id = id;
        summary.definition = view->sql;
        summary.columns = summarize_fields(view->columns);
        result.relations.push_back(std::move(summary));
    }

    std::sort(result.relations.begin(), result.relations.end(), [](const auto& lhs, const auto& rhs) {
        return std::tie(lhs.database_name, lhs.schema_name, lhs.relation_name, lhs.relation_kind)
               < std::tie(rhs.database_name, rhs.schema_name, rhs.relation_name, rhs.relation_kind);
    });

    for (const auto& [schema_id, metadata] : schemas) {
        for (const auto& function : snapshot.functions(SchemaId{schema_id})) {
            CatalogFunctionSummary summary{};
            summary.database_name = metadata.database_name;
            summary.schema_name = metadata.schema_name;
            summary.function_name = function->name;
            for (const auto type : function->arg_types) {
                summary.arg_types.emplace_back(to_string(type));
            }
            summary.return_type = to_string(function->return_type);
            summary.language = function->language;
            result.functions.push_back(std::move(summary));
        }
    }

    std::sort(result.functions.begin(), result.functions.end(), [](const auto& lhs, const auto& rhs) {
        return std::tie(lhs.database_name, lhs.schema_name, lhs.function_name, lhs.arg_types)
               < std::tie(rhs.database_name, rhs.schema_name, rhs.function_name, rhs.arg_types);
    });

    return result;
}

std::string catalog_introspection_to_json(const CatalogIntrospectionSnapshot& snapshot)
{
    std::string json;
    json.reserve(1024U);

    JsonObjectWriter root{json};
    root.uint_field("schema_version", snapshot.schema_version);
    root.uint_field("catalog_version", snapshot.catalog_version);

    root.field_name("relations");
    json.push_back('[');
    for (std::size_t i = 0U; i < snapshot.relations.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& relation = snapshot.relations[i];
        JsonObjectWriter object{json};
        object.string_field("database", relation.database_name);
        object.string_field("schema", relation.schema_name);
        object.string_field("name", relation.relation_name);
        object.string_field("kind", to_string(relation.relation_kind));
        object.uint_field("id", relation.relation_id);
        if (!relation.owner_relation_name.empty()) {
            object.string_field("owner", relation.owner_relation_name);
        }
        object.string_field("definition", relation.definition);

        object.field_name("columns");
        json.push_back('[');
        for (std::size_t c = 0U; c < relation.columns.size(); ++c) {
            if (c > 0U) {
                json.push_back(',');
            }
            JsonObjectWriter column{json};
            column.string_field("name", relation.columns[c].name);
            column.string_field("type", relation.columns[c].data_type);
            column.bool_field("hidden", relation.columns[c].is_hidden);
            column.close();
        }
        json.push_back(']');
        object.close();
    }
    json.push_back(']');

    root.field_name("functions");
    json.push_back('[');
    for (std::size_t i = 0U; i < snapshot.functions.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& function = snapshot.functions[i];
        JsonObjectWriter object{json};
        object.string_field("database", function.database_name);
        object.string_field("schema", function.schema_name);
        object.string_field("name", function.function_name);
        object.field_name("arg_types");
        json.push_back('[');
        for (std::size_t a = 0U; a < function.arg_types.size(); ++a) {
            if (a > 0U) {
                json.push_back(',');
            }
            append_json_string(json, function.arg_types[a]);
        }
        json.push_back(']');
        object.string_field("return_type", function.return_type);
        object.string_field("language", function.language);
        object.close();
    }
    json.push_back(']');

    root.close();
    return json;
}

std::vector<std::string> show_relations(const CatalogSnapshot& snapshot, SchemaId schema_id, CatalogRelationKind kind)
{
    std::vector<std::string> names;
    const auto collect = [&names](const auto& objects) {
        for (const auto& object : objects) {
            names.push_back(object->name);
        }
    };

    switch (kind) {
    case CatalogRelationKind::Table:
        collect(snapshot.tables(schema_id));
        break;
    case CatalogRelationKind::MaterializedView:
        collect(snapshot.materialized_views(schema_id));
        break;
    case CatalogRelationKind::Internal:
        collect(snapshot.internal_tables(schema_id));
        break;
    case CatalogRelationKind::Source:
        collect(snapshot.sources(schema_id));
        break;
    case CatalogRelationKind::Sink:
        collect(snapshot.sinks(schema_id));
        break;
    case CatalogRelationKind::Index:
        collect(snapshot.indexes(schema_id));
        break;
    case CatalogRelationKind::View:
        collect(snapshot.views(schema_id));
        break;
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::optional<std::vector<CatalogColumnSummary>> show_columns(const CatalogSnapshot& snapshot,
                                                              SchemaId schema_id,
                                                              std::string_view name)
{
    const auto ref = snapshot.find_relation(schema_id, name);
    if (!ref) {
        return std::nullopt;
    }

    switch (ref->kind) {
    case CatalogObjectKind::Table:
        return summarize_columns(snapshot.table(ref->id)->columns, false);
    case CatalogObjectKind::Source:
        return summarize_columns(snapshot.source(ref->id)->columns, false);
    case CatalogObjectKind::Sink:
        return summarize_columns(snapshot.sink(ref->id)->columns, false);
    case CatalogObjectKind::Index: {
        const auto backing = snapshot.table(snapshot.index(ref->id)->index_table_id);
        if (!backing) {
            return std::nullopt;
        }
        return summarize_columns(backing->columns, false);
    }
    case CatalogObjectKind::View:
        return summarize_fields(snapshot.view(ref->id)->columns);
    default:
        return std::nullopt;
    }
}

std::optional<std::string> show_create(const CatalogSnapshot& snapshot, SchemaId schema_id, std::string_view name)
{
    const auto ref = snapshot.find_relation(schema_id, name);
    if (!ref) {
        return std::nullopt;
    }

    switch (ref->kind) {
    case CatalogObjectKind::Table:
        return snapshot.table(ref->id)->definition;
    case CatalogObjectKind::Source:
        return source_definition(*snapshot.source(ref->id));
    case CatalogObjectKind::Sink:
        return snapshot.sink(ref->id)->definition;
    case CatalogObjectKind::Index:
        return index_definition(snapshot, *snapshot.index(ref->id));
    case CatalogObjectKind::View:
        return snapshot.view(ref->id)->sql;
    default:
        return std::nullopt;
    }
}

}  // namespace streamcat::catalog
