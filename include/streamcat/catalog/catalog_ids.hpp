#pragma once

#include <cstdint>
#include <functional>

namespace streamcat::catalog {

using UserId = std::uint32_t;

inline constexpr UserId kRootUserId = 1U;

struct DatabaseId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct SchemaId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

// Shared by tables, sources, sinks, indexes and views so that
// dependent_relations never needs a kind tag.
struct RelationId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct FunctionId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

// Scoped to a single table. Id 0 is reserved for the hidden row id column.
struct ColumnId final {
    std::int32_t value = 0;
};

inline constexpr ColumnId kRowIdColumnId{0};
inline constexpr ColumnId kFirstUserColumnId{1};

constexpr bool operator==(DatabaseId lhs, DatabaseId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(DatabaseId lhs, DatabaseId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator==(SchemaId lhs, SchemaId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(SchemaId lhs, SchemaId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator==(RelationId lhs, RelationId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(RelationId lhs, RelationId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(RelationId lhs, RelationId rhs) noexcept { return lhs.value < rhs.value; }
constexpr bool operator==(FunctionId lhs, FunctionId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(FunctionId lhs, FunctionId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator==(ColumnId lhs, ColumnId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(ColumnId lhs, ColumnId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(ColumnId lhs, ColumnId rhs) noexcept { return lhs.value < rhs.value; }

}  // namespace streamcat::catalog

template <>
struct std::hash<streamcat::catalog::RelationId> {
    std::size_t operator()(streamcat::catalog::RelationId id) const noexcept
    {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
