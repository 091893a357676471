#pragma once

#include "streamcat/catalog/catalog_delta.hpp"
#include "streamcat/catalog/catalog_snapshot.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>

namespace streamcat::catalog {

// Read cache kept by a node that follows the catalog through notifications.
// Notifications must arrive in version order: a repeat of an applied version
// is ignored, a gap is refused with ResyncRequired and leaves the cache as it
// was. Readers get the current snapshot without waiting on the applier.
class CatalogReplica final {
public:
    struct TelemetrySnapshot final {
        std::uint64_t applied_notifications = 0U;
        std::uint64_t applied_deltas = 0U;
        std::uint64_t duplicate_notifications = 0U;
        std::uint64_t gaps_detected = 0U;
        std::uint64_t resyncs = 0U;
    };

    CatalogReplica();
    explicit CatalogReplica(std::shared_ptr<const CatalogSnapshot> snapshot);

    CatalogReplica(const CatalogReplica&) = delete;
    CatalogReplica& operator=(const CatalogReplica&) = delete;
    CatalogReplica(CatalogReplica&&) = delete;
    CatalogReplica& operator=(CatalogReplica&&) = delete;

    std::error_code apply(const CatalogNotification& notification);
    void resync(std::shared_ptr<const CatalogSnapshot> snapshot);

    [[nodiscard]] std::uint64_t applied_version() const;
    [[nodiscard]] std::shared_ptr<const CatalogSnapshot> snapshot() const;
    [[nodiscard]] TelemetrySnapshot telemetry() const;

private:
    std::mutex apply_mutex_{};
    mutable std::mutex snapshot_mutex_{};
    std::shared_ptr<const CatalogSnapshot> snapshot_{};
    TelemetrySnapshot telemetry_{};
};

}  // namespace streamcat::catalog
