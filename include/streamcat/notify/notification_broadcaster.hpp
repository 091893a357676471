#pragma once

#include "streamcat/catalog/catalog_delta.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>

namespace streamcat::notify {

class NotificationBroadcaster;

// One subscriber's ordered view of the notification log. Delivery goes
// through a bounded queue; when the queue overflows it is discarded and
// refilled from the broadcaster's retained log on the next read, so a slow
// reader never holds up publication. A reader whose next version has already
// left the log gets ResyncRequired and must start over from a full snapshot.
//
// Intended for a single consuming thread; cancel() may be called from any thread.
class CatalogSubscription final {
    struct State;

    // Only the broadcaster can name this, so only it can construct subscriptions.
    struct ConstructionKey final {
        explicit ConstructionKey() = default;
    };

public:
    CatalogSubscription(ConstructionKey key,
                        std::shared_ptr<State> state,
                        std::uint64_t id,
                        std::uint64_t from_version,
                        std::size_t capacity);

    CatalogSubscription(const CatalogSubscription&) = delete;
    CatalogSubscription& operator=(const CatalogSubscription&) = delete;
    CatalogSubscription(CatalogSubscription&&) = delete;
    CatalogSubscription& operator=(CatalogSubscription&&) = delete;

    // Blocks until a notification is available, the timeout elapses
    // (std::errc::timed_out), or the subscription is cancelled.
    std::error_code next(std::chrono::milliseconds timeout, catalog::CatalogNotification& out);
    std::error_code try_next(catalog::CatalogNotification& out);

    void cancel() noexcept;

    [[nodiscard]] std::uint64_t id() const noexcept;
    [[nodiscard]] std::uint64_t last_delivered_version() const;
    [[nodiscard]] std::size_t queued() const;
    [[nodiscard]] bool cancelled() const;

private:
    friend class NotificationBroadcaster;

    std::error_code pop_locked(catalog::CatalogNotification& out);
    void deliver(const std::shared_ptr<const catalog::CatalogNotification>& notification);

    std::shared_ptr<State> broadcaster_state_{};
    std::uint64_t id_ = 0U;
    std::size_t capacity_ = 0U;

    mutable std::mutex mutex_{};
    std::condition_variable ready_{};
    std::deque<std::shared_ptr<const catalog::CatalogNotification>> queue_{};
    std::uint64_t last_delivered_ = 0U;
    bool catching_up_ = true;
    bool resync_required_ = false;
    bool cancelled_ = false;
};

// Stamps every committed batch of deltas with the next catalog version and
// fans it out. Versions start at 1 and increase by exactly one per publish.
class NotificationBroadcaster final {
public:
    struct Config final {
        std::size_t log_retention = 4096U;
        std::size_t subscriber_queue_capacity = 256U;
        std::uint64_t initial_version = 0U;
    };

    struct TelemetrySnapshot final {
        std::uint64_t published_versions = 0U;
        std::uint64_t published_deltas = 0U;
        std::uint64_t live_subscriptions = 0U;
        std::uint64_t overflow_fallbacks = 0U;
        std::uint64_t resync_demands = 0U;
        std::uint64_t retained_versions = 0U;
    };

    NotificationBroadcaster();
    explicit NotificationBroadcaster(Config config);
    ~NotificationBroadcaster();

    NotificationBroadcaster(const NotificationBroadcaster&) = delete;
    NotificationBroadcaster& operator=(const NotificationBroadcaster&) = delete;
    NotificationBroadcaster(NotificationBroadcaster&&) = delete;
    NotificationBroadcaster& operator=(NotificationBroadcaster&&) = delete;

    std::uint64_t publish(std::vector<catalog::CatalogDelta> deltas);

    // Delivers every version after `from_version`, first from the log and then live.
    [[nodiscard]] std::shared_ptr<CatalogSubscription> subscribe(std::uint64_t from_version);

    [[nodiscard]] std::uint64_t current_version() const;
    [[nodiscard]] std::uint64_t oldest_retained_version() const;

    // Copies up to `limit` retained notifications after `from_version`.
    std::error_code replay(std::uint64_t from_version,
                           std::size_t limit,
                           std::vector<catalog::CatalogNotification>& out) const;

    [[nodiscard]] TelemetrySnapshot telemetry() const;

private:
    friend class CatalogSubscription;

    static void refill(CatalogSubscription::State& state, CatalogSubscription& subscription);

    std::shared_ptr<CatalogSubscription::State> state_{};
};

}  // namespace streamcat::notify
