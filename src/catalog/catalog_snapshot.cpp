#include "streamcat/catalog/catalog_snapshot.hpp"

#include <algorithm>
#include <type_traits>

namespace streamcat::catalog {

namespace {

[[nodiscard]] bool borrows_visible_name(const CatalogObject& object) noexcept
{
    if (const auto* source = std::get_if<CatalogSource>(&object)) {
        return source->associated_table_id.has_value();
    }
    if (const auto* table = std::get_if<CatalogTable>(&object)) {
        return table->table_type == TableType::Index;
    }
    return false;
}

template <typename T, typename Predicate>
[[nodiscard]] std::vector<std::shared_ptr<const T>> collect(const CatalogSnapshot::ObjectMap<T>& objects, Predicate&& predicate)
{
    std::vector<std::shared_ptr<const T>> result;
    for (const auto& [_, entry] : objects) {
        if (predicate(*entry)) {
            result.push_back(entry);
        }
    }
    return result;
}

}  // namespace

template <typename T>
CatalogSnapshot::ObjectMap<T>& CatalogSnapshot::map_for() noexcept
{
    if constexpr (std::is_same_v<T, CatalogDatabase>) {
        return databases_;
    } else if constexpr (std::is_same_v<T, CatalogSchema>) {
        return schemas_;
    } else if constexpr (std::is_same_v<T, CatalogTable>) {
        return tables_;
    } else if constexpr (std::is_same_v<T, CatalogSource>) {
        return sources_;
    } else if constexpr (std::is_same_v<T, CatalogSink>) {
        return sinks_;
    } else if constexpr (std::is_same_v<T, CatalogIndex>) {
        return indexes_;
    } else if constexpr (std::is_same_v<T, CatalogView>) {
        return views_;
    } else {
        static_assert(std::is_same_v<T, CatalogFunction>);
        return functions_;
    }
}

template <typename T>
const CatalogSnapshot::ObjectMap<T>& CatalogSnapshot::map_for() const noexcept
{
    return const_cast<CatalogSnapshot*>(this)->map_for<T>();
}

template <typename T>
std::shared_ptr<const T> CatalogSnapshot::lookup(std::uint64_t id) const
{
    const auto& objects = map_for<T>();
    auto it = objects.find(id);
    return it != objects.end() ? it->second : nullptr;
}

template <typename T>
std::shared_ptr<const T> CatalogSnapshot::find_relation_as(SchemaId schema_id,
                                                           std::string_view name,
                                                           CatalogObjectKind kind) const
{
    auto ref = find_relation(schema_id, name);
    if (!ref || ref->kind != kind) {
        return nullptr;
    }
    return lookup<T>(ref->id.value);
}

std::uint64_t CatalogSnapshot::catalog_version() const noexcept
{
    return catalog_version_;
}

void CatalogSnapshot::set_catalog_version(std::uint64_t version) noexcept
{
    catalog_version_ = version;
}

void CatalogSnapshot::apply(const CatalogDelta& delta)
{
    switch (delta.kind) {
    case CatalogDeltaKind::Created:
        if (delta.object && !contains(delta.object_kind, delta.object_id)) {
            upsert(*delta.object);
        }
        break;
    case CatalogDeltaKind::Altered:
        if (delta.object) {
            upsert(*delta.object);
        }
        break;
    case CatalogDeltaKind::Dropped:
        (void)erase(delta.object_kind, delta.object_id);
        break;
    }
}

void CatalogSnapshot::apply(const CatalogNotification& notification)
{
    for (const auto& delta : notification.deltas) {
        apply(delta);
    }
    catalog_version_ = std::max(catalog_version_, notification.version);
}

void CatalogSnapshot::upsert(CatalogObject object)
{
    if (auto existing = this->object(object_kind(object), object_id(object))) {
        unindex_object(*existing);
    }

    index_object(object);
    std::visit(
        [this](auto&& entry) {
            using T = std::decay_t<decltype(entry)>;
            const auto id = entry.id.value;
            map_for<T>()[id] = std::make_shared<const T>(std::move(entry));
        },
        std::move(object));
}

bool CatalogSnapshot::erase(CatalogObjectKind kind, std::uint64_t id)
{
    auto existing = object(kind, id);
    if (!existing) {
        return false;
    }

    unindex_object(*existing);
    std::visit(
        [this, id](const auto& entry) {
            using T = std::decay_t<decltype(entry)>;
            map_for<T>().erase(id);
        },
        *existing);
    return true;
}

bool CatalogSnapshot::contains(CatalogObjectKind kind, std::uint64_t id) const noexcept
{
    switch (kind) {
    case CatalogObjectKind::Database:
        return databases_.count(id) != 0U;
    case CatalogObjectKind::Schema:
        return schemas_.count(id) != 0U;
    case CatalogObjectKind::Table:
        return tables_.count(id) != 0U;
    case CatalogObjectKind::Source:
        return sources_.count(id) != 0U;
    case CatalogObjectKind::Sink:
        return sinks_.count(id) != 0U;
    case CatalogObjectKind::Index:
        return indexes_.count(id) != 0U;
    case CatalogObjectKind::View:
        return views_.count(id) != 0U;
    case CatalogObjectKind::Function:
        return functions_.count(id) != 0U;
    default:
        return false;
    }
}

std::optional<CatalogObject> CatalogSnapshot::object(CatalogObjectKind kind, std::uint64_t id) const
{
    auto as_object = [](const auto& entry) -> std::optional<CatalogObject> {
        if (!entry) {
            return std::nullopt;
        }
        return CatalogObject{*entry};
    };

    switch (kind) {
    case CatalogObjectKind::Database:
        return as_object(lookup<CatalogDatabase>(id));
    case CatalogObjectKind::Schema:
        return as_object(lookup<CatalogSchema>(id));
    case CatalogObjectKind::Table:
        return as_object(lookup<CatalogTable>(id));
    case CatalogObjectKind::Source:
        return as_object(lookup<CatalogSource>(id));
    case CatalogObjectKind::Sink:
        return as_object(lookup<CatalogSink>(id));
    case CatalogObjectKind::Index:
        return as_object(lookup<CatalogIndex>(id));
    case CatalogObjectKind::View:
        return as_object(lookup<CatalogView>(id));
    case CatalogObjectKind::Function:
        return as_object(lookup<CatalogFunction>(id));
    default:
        return std::nullopt;
    }
}

std::size_t CatalogSnapshot::object_count() const noexcept
{
    return databases_.size() + schemas_.size() + tables_.size() + sources_.size() + sinks_.size() + indexes_.size()
           + views_.size() + functions_.size();
}

void CatalogSnapshot::for_each_object(const ObjectVisitor& visitor) const
{
    auto visit_all = [&visitor](const auto& objects) {
        for (const auto& [_, entry] : objects) {
            visitor(CatalogObject{*entry});
        }
    };

    visit_all(databases_);
    visit_all(schemas_);
    visit_all(tables_);
    visit_all(sources_);
    visit_all(sinks_);
    visit_all(indexes_);
    visit_all(views_);
    visit_all(functions_);
}

std::shared_ptr<const CatalogDatabase> CatalogSnapshot::database(DatabaseId id) const
{
    return lookup<CatalogDatabase>(id.value);
}

std::shared_ptr<const CatalogSchema> CatalogSnapshot::schema(SchemaId id) const
{
    return lookup<CatalogSchema>(id.value);
}

std::shared_ptr<const CatalogTable> CatalogSnapshot::table(RelationId id) const
{
    return lookup<CatalogTable>(id.value);
}

std::shared_ptr<const CatalogSource> CatalogSnapshot::source(RelationId id) const
{
    return lookup<CatalogSource>(id.value);
}

std::shared_ptr<const CatalogSink> CatalogSnapshot::sink(RelationId id) const
{
    return lookup<CatalogSink>(id.value);
}

std::shared_ptr<const CatalogIndex> CatalogSnapshot::index(RelationId id) const
{
    return lookup<CatalogIndex>(id.value);
}

std::shared_ptr<const CatalogView> CatalogSnapshot::view(RelationId id) const
{
    return lookup<CatalogView>(id.value);
}

std::shared_ptr<const CatalogFunction> CatalogSnapshot::function(FunctionId id) const
{
    return lookup<CatalogFunction>(id.value);
}

std::optional<CatalogObjectKind> CatalogSnapshot::relation_kind(RelationId id) const
{
    auto it = relation_kinds_.find(id.value);
    if (it == relation_kinds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CatalogSnapshot::relation_exists(RelationId id) const
{
    return relation_kinds_.count(id.value) != 0U;
}

std::shared_ptr<const CatalogDatabase> CatalogSnapshot::find_database(std::string_view name) const
{
    auto it = database_names_.find(name);
    return it != database_names_.end() ? lookup<CatalogDatabase>(it->second) : nullptr;
}

std::shared_ptr<const CatalogSchema> CatalogSnapshot::find_schema(DatabaseId database_id, std::string_view name) const
{
    auto it = schema_names_.find(ScopedName{database_id.value, std::string{name}});
    return it != schema_names_.end() ? lookup<CatalogSchema>(it->second) : nullptr;
}

std::optional<RelationRef> CatalogSnapshot::find_relation(SchemaId schema_id, std::string_view name) const
{
    auto it = relation_names_.find(ScopedName{schema_id.value, std::string{name}});
    if (it == relation_names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<const CatalogTable> CatalogSnapshot::find_table(SchemaId schema_id, std::string_view name) const
{
    return find_relation_as<CatalogTable>(schema_id, name, CatalogObjectKind::Table);
}

std::shared_ptr<const CatalogSource> CatalogSnapshot::find_source(SchemaId schema_id, std::string_view name) const
{
    auto ref = find_relation(schema_id, name);
    if (!ref) {
        return nullptr;
    }
    if (ref->kind == CatalogObjectKind::Source) {
        return lookup<CatalogSource>(ref->id.value);
    }
    if (ref->kind == CatalogObjectKind::Table) {
        auto owner = lookup<CatalogTable>(ref->id.value);
        if (owner && owner->associated_source_id) {
            return lookup<CatalogSource>(owner->associated_source_id->value);
        }
    }
    return nullptr;
}

std::shared_ptr<const CatalogSink> CatalogSnapshot::find_sink(SchemaId schema_id, std::string_view name) const
{
    return find_relation_as<CatalogSink>(schema_id, name, CatalogObjectKind::Sink);
}

std::shared_ptr<const CatalogIndex> CatalogSnapshot::find_index(SchemaId schema_id, std::string_view name) const
{
    return find_relation_as<CatalogIndex>(schema_id, name, CatalogObjectKind::Index);
}

std::shared_ptr<const CatalogView> CatalogSnapshot::find_view(SchemaId schema_id, std::string_view name) const
{
    return find_relation_as<CatalogView>(schema_id, name, CatalogObjectKind::View);
}

std::shared_ptr<const CatalogFunction> CatalogSnapshot::find_function(SchemaId schema_id,
                                                                      std::string_view name,
                                                                      std::span<const CatalogDataType> arg_types) const
{
    FunctionSignature signature{schema_id.value,
                                std::string{name},
                                std::vector<CatalogDataType>(arg_types.begin(), arg_types.end())};
    auto it = function_signatures_.find(signature);
    return it != function_signatures_.end() ? lookup<CatalogFunction>(it->second) : nullptr;
}

std::vector<std::shared_ptr<const CatalogFunction>> CatalogSnapshot::functions_named(SchemaId schema_id,
                                                                                    std::string_view name) const
{
    return collect(functions_, [&](const CatalogFunction& function) {
        return function.schema_id == schema_id && function.name == name;
    });
}

std::vector<std::shared_ptr<const CatalogDatabase>> CatalogSnapshot::databases() const
{
    return collect(databases_, [](const CatalogDatabase&) { return true; });
}

std::vector<std::shared_ptr<const CatalogSchema>> CatalogSnapshot::schemas(DatabaseId database_id) const
{
    return collect(schemas_, [database_id](const CatalogSchema& schema) { return schema.database_id == database_id; });
}

std::vector<std::shared_ptr<const CatalogTable>> CatalogSnapshot::tables(SchemaId schema_id) const
{
    return collect(tables_, [schema_id](const CatalogTable& table) {
        return table.schema_id == schema_id && table.table_type == TableType::Table;
    });
}

std::vector<std::shared_ptr<const CatalogTable>> CatalogSnapshot::materialized_views(SchemaId schema_id) const
{
    return collect(tables_, [schema_id](const CatalogTable& table) {
        return table.schema_id == schema_id && table.table_type == TableType::MaterializedView;
    });
}

std::vector<std::shared_ptr<const CatalogTable>> CatalogSnapshot::internal_tables(SchemaId schema_id) const
{
    return collect(tables_, [schema_id](const CatalogTable& table) {
        return table.schema_id == schema_id && table.table_type == TableType::Internal;
    });
}

std::vector<std::shared_ptr<const CatalogSource>> CatalogSnapshot::sources(SchemaId schema_id) const
{
    return collect(sources_, [schema_id](const CatalogSource& source) { return source.schema_id == schema_id; });
}

std::vector<std::shared_ptr<const CatalogSink>> CatalogSnapshot::sinks(SchemaId schema_id) const
{
    return collect(sinks_, [schema_id](const CatalogSink& sink) { return sink.schema_id == schema_id; });
}

std::vector<std::shared_ptr<const CatalogIndex>> CatalogSnapshot::indexes(SchemaId schema_id) const
{
    return collect(indexes_, [schema_id](const CatalogIndex& index) { return index.schema_id == schema_id; });
}

std::vector<std::shared_ptr<const CatalogView>> CatalogSnapshot::views(SchemaId schema_id) const
{
    return collect(views_, [schema_id](const CatalogView& view) { return view.schema_id == schema_id; });
}

std::vector<std::shared_ptr<const CatalogFunction>> CatalogSnapshot::functions(SchemaId schema_id) const
{
    return collect(functions_, [schema_id](const CatalogFunction& function) { return function.schema_id == schema_id; });
}

std::vector<std::shared_ptr<const CatalogIndex>> CatalogSnapshot::indexes_on_table(RelationId table_id) const
{
    std::vector<std::shared_ptr<const CatalogIndex>> result;
    auto it = table_indexes_.find(table_id.value);
    if (it == table_indexes_.end()) {
        return result;
    }
    for (const auto index_id : it->second) {
        if (auto entry = lookup<CatalogIndex>(index_id)) {
            result.push_back(std::move(entry));
        }
    }
    return result;
}

bool CatalogSnapshot::schema_is_empty(SchemaId schema_id) const
{
    auto in_schema = [schema_id](const auto& objects) {
        return std::any_of(objects.begin(), objects.end(), [schema_id](const auto& entry) {
            return entry.second->schema_id == schema_id;
        });
    };
    return !in_schema(tables_) && !in_schema(sources_) && !in_schema(sinks_) && !in_schema(indexes_)
           && !in_schema(views_) && !in_schema(functions_);
}

const CatalogSnapshot::ObjectMap<CatalogTable>& CatalogSnapshot::all_tables() const noexcept
{
    return tables_;
}

const CatalogSnapshot::ObjectMap<CatalogSource>& CatalogSnapshot::all_sources() const noexcept
{
    return sources_;
}

const CatalogSnapshot::ObjectMap<CatalogSink>& CatalogSnapshot::all_sinks() const noexcept
{
    return sinks_;
}

const CatalogSnapshot::ObjectMap<CatalogIndex>& CatalogSnapshot::all_indexes() const noexcept
{
    return indexes_;
}

const CatalogSnapshot::ObjectMap<CatalogView>& CatalogSnapshot::all_views() const noexcept
{
    return views_;
}

void CatalogSnapshot::index_object(const CatalogObject& object)
{
    const bool hidden_name = borrows_visible_name(object);
    const auto kind = object_kind(object);
    std::visit(
        [this, hidden_name, kind](const auto& entry) {
            using T = std::decay_t<decltype(entry)>;
            const auto id = entry.id.value;
            if constexpr (std::is_same_v<T, CatalogDatabase>) {
                database_names_[entry.name] = id;
            } else if constexpr (std::is_same_v<T, CatalogSchema>) {
                schema_names_[ScopedName{entry.database_id.value, entry.name}] = id;
            } else if constexpr (std::is_same_v<T, CatalogFunction>) {
                function_signatures_[FunctionSignature{entry.schema_id.value, entry.name, entry.arg_types}] = id;
            } else {
                relation_kinds_[id] = kind;
                if (!hidden_name) {
                    relation_names_[ScopedName{entry.schema_id.value, entry.name}] = RelationRef{kind, RelationId{id}};
                }
                if constexpr (std::is_same_v<T, CatalogIndex>) {
                    table_indexes_[entry.primary_table_id.value].insert(id);
                }
            }
        },
        object);
}

void CatalogSnapshot::unindex_object(const CatalogObject& object)
{
    std::visit(
        [this](const auto& entry) {
            using T = std::decay_t<decltype(entry)>;
            const auto id = entry.id.value;
            if constexpr (std::is_same_v<T, CatalogDatabase>) {
                auto it = database_names_.find(entry.name);
                if (it != database_names_.end() && it->second == id) {
                    database_names_.erase(it);
                }
            } else if constexpr (std::is_same_v<T, CatalogSchema>) {
                auto it = schema_names_.find(ScopedName{entry.database_id.value, entry.name});
                if (it != schema_names_.end() && it->second == id) {
                    schema_names_.erase(it);
                }
            } else if constexpr (std::is_same_v<T, CatalogFunction>) {
                auto it = function_signatures_.find(FunctionSignature{entry.schema_id.value, entry.name, entry.arg_types});
                if (it != function_signatures_.end() && it->second == id) {
                    function_signatures_.erase(it);
                }
            } else {
                relation_kinds_.erase(id);
                auto it = relation_names_.find(ScopedName{entry.schema_id.value, entry.name});
                if (it != relation_names_.end() && it->second.id.value == id) {
                    relation_names_.erase(it);
                }
                if constexpr (std::is_same_v<T, CatalogIndex>) {
                    auto table_it = table_indexes_.find(entry.primary_table_id.value);
                    if (table_it != table_indexes_.end()) {
                        table_it->second.erase(id);
                        if (table_it->second.empty()) {
                            table_indexes_.erase(table_it);
                        }
                    }
                }
            }
        },
        object);
}

}  // namespace streamcat::catalog
