#include "streamcat/ddl/ddl_dependency_graph.hpp"

#include "streamcat/catalog/catalog_snapshot.hpp"

namespace streamcat::ddl {

void DdlDependencyGraph::add_edges(catalog::RelationId relation_id, std::span<const catalog::RelationId> referenced_ids)
{
    for (const auto referenced : referenced_ids) {
        if (!referenced.is_valid()) {
            continue;
        }
        if (dependencies_[relation_id].insert(referenced).second) {
            dependents_[referenced].insert(relation_id);
            ++edge_count_;
        }
    }
}

void DdlDependencyGraph::remove(catalog::RelationId relation_id)
{
    auto it = dependencies_.find(relation_id);
    if (it == dependencies_.end()) {
        return;
    }

    for (const auto referenced : it->second) {
        auto dependent_it = dependents_.find(referenced);
        if (dependent_it == dependents_.end()) {
            continue;
        }
        dependent_it->second.erase(relation_id);
        if (dependent_it->second.empty()) {
            dependents_.erase(dependent_it);
        }
        --edge_count_;
    }
    dependencies_.erase(it);
}

void DdlDependencyGraph::rebuild(const catalog::CatalogSnapshot& snapshot)
{
    clear();
    for (const auto& [_, table] : snapshot.all_tables()) {
        add_edges(table->id, table->dependent_relations);
    }
    for (const auto& [_, sink] : snapshot.all_sinks()) {
        add_edges(sink->id, sink->dependent_relations);
    }
    for (const auto& [_, view] : snapshot.all_views()) {
        add_edges(view->id, view->dependent_relations);
    }
}

void DdlDependencyGraph::clear() noexcept
{
    dependencies_.clear();
    dependents_.clear();
    edge_count_ = 0U;
}

bool DdlDependencyGraph::can_drop(catalog::RelationId relation_id) const
{
    auto it = dependents_.find(relation_id);
    if (it == dependents_.end()) {
        return true;
    }
    for (const auto dependent : it->second) {
        if (dependent != relation_id) {
            return false;
        }
    }
    return true;
}

std::vector<catalog::RelationId> DdlDependencyGraph::dependents(catalog::RelationId relation_id) const
{
    auto it = dependents_.find(relation_id);
    if (it == dependents_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::vector<catalog::RelationId> DdlDependencyGraph::dependencies(catalog::RelationId relation_id) const
{
    auto it = dependencies_.find(relation_id);
    if (it == dependencies_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::size_t DdlDependencyGraph::edge_count() const noexcept
{
    return edge_count_;
}

}  // namespace streamcat::ddl
