#include "streamcat/catalog/catalog_replica.hpp"

#include "streamcat/catalog/catalog_errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace streamcat::catalog {

CatalogReplica::CatalogReplica()
    : snapshot_{std::make_shared<const CatalogSnapshot>()}
{
}

CatalogReplica::CatalogReplica(std::shared_ptr<const CatalogSnapshot> snapshot)
    : snapshot_{std::move(snapshot)}
{
    if (!snapshot_) {
        throw std::invalid_argument{"CatalogReplica requires a snapshot"};
    }
}

std::error_code CatalogReplica::apply(const CatalogNotification& notification)
{
    std::lock_guard apply_guard{apply_mutex_};
    const auto current = snapshot();

    if (notification.version <= current->catalog_version()) {
        std::lock_guard guard{snapshot_mutex_};
        ++telemetry_.duplicate_notifications;
        return {};
    }
    if (notification.version != current->catalog_version() + 1U) {
        SPDLOG_WARN("catalog replica at version {} received version {}, resync required",
                    current->catalog_version(),
                    notification.version);
        std::lock_guard guard{snapshot_mutex_};
        ++telemetry_.gaps_detected;
        return CatalogErrc::ResyncRequired;
    }

    auto next = std::make_shared<CatalogSnapshot>(*current);
    next->apply(notification);

    std::lock_guard guard{snapshot_mutex_};
    snapshot_ = std::move(next);
    ++telemetry_.applied_notifications;
    telemetry_.applied_deltas += notification.deltas.size();
    return {};
}

void CatalogReplica::resync(std::shared_ptr<const CatalogSnapshot> snapshot)
{
    if (!snapshot) {
        throw std::invalid_argument{"CatalogReplica::resync requires a snapshot"};
    }

    std::lock_guard apply_guard{apply_mutex_};
    SPDLOG_INFO("catalog replica resynchronized at version {} with {} objects",
                snapshot->catalog_version(),
                snapshot->object_count());

    std::lock_guard guard{snapshot_mutex_};
    snapshot_ = std::move(snapshot);
    ++telemetry_.resyncs;
}

std::uint64_t CatalogReplica::applied_version() const
{
    return snapshot()->catalog_version();
}

std::shared_ptr<const CatalogSnapshot> CatalogReplica::snapshot() const
{
    std::lock_guard guard{snapshot_mutex_};
    return snapshot_;
}

CatalogReplica::TelemetrySnapshot CatalogReplica::telemetry() const
{
    std::lock_guard guard{snapshot_mutex_};
    return telemetry_;
}

}  // namespace streamcat::catalog
