#pragma once

#include "streamcat/catalog/catalog_ids.hpp"

#include <cstddef>
#include <set>
#include <span>
#include <unordered_map>
#include <vector>

namespace streamcat::catalog {
class CatalogSnapshot;
}

namespace streamcat::ddl {

// Reverse index over dependent_relations. Derived state only: it is rebuilt
// from the stored objects at startup and updated by the catalog writer under
// the same lock as the transaction that adds or removes the edges.
//
// Only direct dependents block a drop; a view whose base view was dropped is
// detected when it is next read.
class DdlDependencyGraph final {
public:
    DdlDependencyGraph() = default;

    void add_edges(catalog::RelationId relation_id, std::span<const catalog::RelationId> referenced_ids);
    void remove(catalog::RelationId relation_id);
    void rebuild(const catalog::CatalogSnapshot& snapshot);
    void clear() noexcept;

    [[nodiscard]] bool can_drop(catalog::RelationId relation_id) const;
    [[nodiscard]] std::vector<catalog::RelationId> dependents(catalog::RelationId relation_id) const;
    [[nodiscard]] std::vector<catalog::RelationId> dependencies(catalog::RelationId relation_id) const;
    [[nodiscard]] std::size_t edge_count() const noexcept;

private:
    std::unordered_map<catalog::RelationId, std::set<catalog::RelationId>> dependencies_{};
    std::unordered_map<catalog::RelationId, std::set<catalog::RelationId>> dependents_{};
    std::size_t edge_count_ = 0U;
};

}  // namespace streamcat::ddl
