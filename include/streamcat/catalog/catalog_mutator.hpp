#pragma once

#include "streamcat/catalog/catalog_delta.hpp"
#include "streamcat/catalog/catalog_objects.hpp"
#include "streamcat/catalog/catalog_store.hpp"
#include "streamcat/catalog/catalog_transaction.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <system_error>
#include <vector>

namespace streamcat::catalog {

// What one transaction hands to the store: the encoded writes (objects plus
// any allocator watermarks) and the deltas subscribers will see.
struct CatalogMutationBatch final {
    std::uint64_t transaction_id = 0U;
    std::vector<CatalogWrite> writes{};
    std::vector<CatalogDelta> deltas{};
};

struct CatalogMutationTelemetrySnapshot final {
    std::uint64_t published_batches = 0U;
    std::uint64_t published_writes = 0U;
    std::uint64_t publish_failures = 0U;
    std::uint64_t aborted_batches = 0U;
    std::uint64_t aborted_writes = 0U;
};

class CatalogMutator final {
public:
    struct Config final {
        CatalogTransaction* transaction = nullptr;
    };

    using PublishListener = std::function<std::error_code(const CatalogMutationBatch&)>;
    using PrePublishHook = std::function<std::error_code()>;

    explicit CatalogMutator(Config config);

    CatalogMutator(const CatalogMutator&) = delete;
    CatalogMutator& operator=(const CatalogMutator&) = delete;
    CatalogMutator(CatalogMutator&&) = delete;
    CatalogMutator& operator=(CatalogMutator&&) = delete;

    [[nodiscard]] const CatalogTransaction& transaction() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const std::vector<CatalogWrite>& staged_writes() const noexcept;
    [[nodiscard]] const std::vector<CatalogDelta>& staged_deltas() const noexcept;
    [[nodiscard]] bool has_published_batch() const noexcept;
    [[nodiscard]] const CatalogMutationBatch& published_batch() const;
    CatalogMutationBatch consume_published_batch();

    void stage_create(CatalogObject object);
    void stage_alter(CatalogObject object);
    void stage_drop(CatalogObjectKind kind, std::uint64_t id);

    // Persisted alongside the objects but never broadcast.
    void stage_internal_write(CatalogWrite write);

    void clear() noexcept;

    void register_pre_publish_hook(PrePublishHook hook);
    void set_publish_listener(PublishListener listener);

    static CatalogMutationTelemetrySnapshot telemetry() noexcept;
    static void reset_telemetry() noexcept;

private:
    std::error_code publish_staged_batch();
    void register_transaction_hooks();
    void record_abort() noexcept;

    CatalogTransaction* transaction_ = nullptr;
    std::vector<CatalogWrite> writes_{};
    std::vector<CatalogDelta> deltas_{};
    std::vector<PrePublishHook> pre_publish_hooks_{};
    std::optional<CatalogMutationBatch> published_batch_{};
    PublishListener publish_listener_{};
};

}  // namespace streamcat::catalog
