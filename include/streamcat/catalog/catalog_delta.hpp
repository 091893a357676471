#pragma once

#include "streamcat/catalog/catalog_objects.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace streamcat::catalog {

enum class CatalogDeltaKind : std::uint8_t {
    Created = 0,
    Altered,
    Dropped
};

// Created and Altered carry the full object; Dropped carries only kind and id.
struct CatalogDelta final {
    CatalogDeltaKind kind = CatalogDeltaKind::Created;
    CatalogObjectKind object_kind = CatalogObjectKind::Database;
    std::uint64_t object_id = 0U;
    std::optional<CatalogObject> object{};

    [[nodiscard]] static CatalogDelta created(CatalogObject value)
    {
        return make_with_object(CatalogDeltaKind::Created, std::move(value));
    }

    [[nodiscard]] static CatalogDelta altered(CatalogObject value)
    {
        return make_with_object(CatalogDeltaKind::Altered, std::move(value));
    }

    [[nodiscard]] static CatalogDelta dropped(CatalogObjectKind kind, std::uint64_t id)
    {
        CatalogDelta delta{};
        delta.kind = CatalogDeltaKind::Dropped;
        delta.object_kind = kind;
        delta.object_id = id;
        return delta;
    }

private:
    static CatalogDelta make_with_object(CatalogDeltaKind kind, CatalogObject value)
    {
        CatalogDelta delta{};
        delta.kind = kind;
        delta.object_kind = catalog::object_kind(value);
        delta.object_id = catalog::object_id(value);
        delta.object = std::move(value);
        return delta;
    }
};

// Every delta committed by one transaction, stamped with the catalog version
// that transaction produced.
struct CatalogNotification final {
    std::uint64_t version = 0U;
    std::vector<CatalogDelta> deltas{};
};

[[nodiscard]] inline const char* to_string(CatalogDeltaKind kind) noexcept
{
    switch (kind) {
    case CatalogDeltaKind::Created:
        return "created";
    case CatalogDeltaKind::Altered:
        return "altered";
    case CatalogDeltaKind::Dropped:
        return "dropped";
    default:
        return "unknown";
    }
}

}  // namespace streamcat::catalog
