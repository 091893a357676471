#pragma once

#include "streamcat/catalog/catalog_ids.hpp"
#include "streamcat/catalog/catalog_mutator.hpp"
#include "streamcat/catalog/catalog_objects.hpp"
#include "streamcat/catalog/catalog_transaction.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>

namespace streamcat::catalog {

// Hands out cluster-unique object ids. Allocations made inside a transaction
// stay pending until that transaction commits and are forgotten if it aborts,
// so a failed commit never advances the visible counters. The committed
// high-water mark of each id space is written in the same batch as the
// objects, which keeps ids of dropped objects retired across restarts.
//
// Not internally synchronized: callers hold the catalog writer lock.
class CatalogIdAllocator final {
public:
    struct Config final {
        std::uint64_t first_database_id = 1U;
        std::uint64_t first_schema_id = 1U;
        std::uint64_t first_relation_id = 1U;
        std::uint64_t first_function_id = 1U;
    };

    struct TelemetrySnapshot final {
        std::uint64_t allocated_ids = 0U;
        std::uint64_t rolled_back_ids = 0U;
        std::uint64_t watermark_writes = 0U;
    };

    CatalogIdAllocator();
    explicit CatalogIdAllocator(Config config);

    CatalogIdAllocator(const CatalogIdAllocator&) = delete;
    CatalogIdAllocator& operator=(const CatalogIdAllocator&) = delete;
    CatalogIdAllocator(CatalogIdAllocator&&) = delete;
    CatalogIdAllocator& operator=(CatalogIdAllocator&&) = delete;

    // Binds subsequent allocations to the given transaction until it finishes.
    void attach(CatalogTransaction& transaction, CatalogMutator& mutator);
    [[nodiscard]] bool attached() const noexcept;

    [[nodiscard]] std::uint64_t next_id(CatalogObjectKind kind);
    [[nodiscard]] DatabaseId next_database_id();
    [[nodiscard]] SchemaId next_schema_id();
    [[nodiscard]] RelationId next_relation_id();
    [[nodiscard]] FunctionId next_function_id();

    // Column ids live in the table's own version record, which the caller
    // stages together with the table in the same transaction.
    [[nodiscard]] static ColumnId next_column_id(TableVersion& version);

    void observe(CatalogObjectKind kind, std::uint64_t id) noexcept;
    void advance_to(CatalogIdCategory category, std::uint64_t last_allocated) noexcept;

    [[nodiscard]] std::uint64_t last_allocated(CatalogIdCategory category) const noexcept;
    [[nodiscard]] bool has_pending_allocations() const noexcept;
    [[nodiscard]] TelemetrySnapshot telemetry() const noexcept;

    void reset() noexcept;

private:
    static constexpr std::size_t kCategoryCount = static_cast<std::size_t>(CatalogIdCategory::Count);

    [[nodiscard]] std::uint64_t allocate(CatalogIdCategory category);
    std::error_code stage_watermarks();
    void promote_pending() noexcept;
    void rollback_pending() noexcept;

    std::array<std::uint64_t, kCategoryCount> floor_{};
    std::array<std::uint64_t, kCategoryCount> committed_{};
    std::array<std::optional<std::uint64_t>, kCategoryCount> pending_{};
    CatalogMutator* mutator_ = nullptr;
    TelemetrySnapshot telemetry_{};
};

}  // namespace streamcat::catalog
