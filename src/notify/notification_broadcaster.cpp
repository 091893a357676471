#include "streamcat/notify/notification_broadcaster.hpp"

#include "streamcat/catalog/catalog_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace streamcat::notify {

namespace {

constexpr std::size_t default_if_zero(std::size_t value, std::size_t fallback) noexcept
{
    return value == 0U ? fallback : value;
}

}  // namespace

struct CatalogSubscription::State final {
    mutable std::mutex mutex{};
    std::deque<std::shared_ptr<const catalog::CatalogNotification>> log{};
    std::vector<std::weak_ptr<CatalogSubscription>> subscriptions{};
    std::size_t log_retention = 0U;
    std::size_t queue_capacity = 0U;
    std::uint64_t version = 0U;
    std::uint64_t next_subscription_id = 1U;
    NotificationBroadcaster::TelemetrySnapshot telemetry{};
};

CatalogSubscription::CatalogSubscription(ConstructionKey,
                                         std::shared_ptr<State> state,
                                         std::uint64_t id,
                                         std::uint64_t from_version,
                                         std::size_t capacity)
    : broadcaster_state_{std::move(state)}
    , id_{id}
    , capacity_{capacity}
    , last_delivered_{from_version}
{
}

std::error_code CatalogSubscription::next(std::chrono::milliseconds timeout, catalog::CatalogNotification& out)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock lock{mutex_};
    while (true) {
        if (cancelled_ || resync_required_ || !queue_.empty()) {
            return pop_locked(out);
        }
        if (catching_up_) {
            lock.unlock();
            NotificationBroadcaster::refill(*broadcaster_state_, *this);
            lock.lock();
            continue;
        }
        if (ready_.wait_until(lock, deadline) == std::cv_status::timeout) {
            if (cancelled_ || resync_required_ || !queue_.empty() || catching_up_) {
                continue;
            }
            return std::make_error_code(std::errc::timed_out);
        }
    }
}

std::error_code CatalogSubscription::try_next(catalog::CatalogNotification& out)
{
    return next(std::chrono::milliseconds{0}, out);
}

std::error_code CatalogSubscription::pop_locked(catalog::CatalogNotification& out)
{
    if (cancelled_) {
        return catalog::CatalogErrc::SubscriptionClosed;
    }
    if (resync_required_) {
        return catalog::CatalogErrc::ResyncRequired;
    }

    out = *queue_.front();
    queue_.pop_front();
    last_delivered_ = out.version;
    return {};
}

void CatalogSubscription::deliver(const std::shared_ptr<const catalog::CatalogNotification>& notification)
{
    {
        std::lock_guard guard{mutex_};
        if (cancelled_ || resync_required_ || catching_up_) {
            return;
        }

        const auto expected = queue_.empty() ? last_delivered_ + 1U : queue_.back()->version + 1U;
        if (notification->version < expected) {
            return;
        }

        if (queue_.size() >= capacity_) {
            // Fall back to the log; last_delivered_ still marks where to resume.
            queue_.clear();
            catching_up_ = true;
            ++broadcaster_state_->telemetry.overflow_fallbacks;
            SPDLOG_WARN("catalog subscription {} overflowed at version {}, replaying from version {}",
                        id_,
                        notification->version,
                        last_delivered_ + 1U);
        } else {
            queue_.push_back(notification);
        }
    }
    ready_.notify_all();
}

void CatalogSubscription::cancel() noexcept
{
    {
        std::lock_guard guard{mutex_};
        cancelled_ = true;
        queue_.clear();
    }
    ready_.notify_all();
}

std::uint64_t CatalogSubscription::id() const noexcept
{
    return id_;
}

std::uint64_t CatalogSubscription::last_delivered_version() const
{
    std::lock_guard guard{mutex_};
    return last_delivered_;
}

std::size_t CatalogSubscription::queued() const
{
    std::lock_guard guard{mutex_};
    return queue_.size();
}

bool CatalogSubscription::cancelled() const
{
    std::lock_guard guard{mutex_};
    return cancelled_;
}

NotificationBroadcaster::NotificationBroadcaster()
    : NotificationBroadcaster(Config{})
{
}

NotificationBroadcaster::NotificationBroadcaster(Config config)
    : state_{std::make_shared<CatalogSubscription::State>()}
{
    state_->log_retention = default_if_zero(config.log_retention, Config{}.log_retention);
    state_->queue_capacity = default_if_zero(config.subscriber_queue_capacity, Config{}.subscriber_queue_capacity);
    state_->version = config.initial_version;
}

NotificationBroadcaster::~NotificationBroadcaster()
{
    std::vector<std::shared_ptr<CatalogSubscription>> live;
    {
        std::lock_guard guard{state_->mutex};
        for (auto& entry : state_->subscriptions) {
            if (auto subscription = entry.lock()) {
                live.push_back(std::move(subscription));
            }
        }
        state_->subscriptions.clear();
    }
    for (auto& subscription : live) {
        subscription->cancel();
    }
}

std::uint64_t NotificationBroadcaster::publish(std::vector<catalog::CatalogDelta> deltas)
{
    std::lock_guard guard{state_->mutex};

    auto notification = std::make_shared<catalog::CatalogNotification>();
    notification->version = ++state_->version;
    notification->deltas = std::move(deltas);
    std::shared_ptr<const catalog::CatalogNotification> published = std::move(notification);

    state_->log.push_back(published);
    while (state_->log.size() > state_->log_retention) {
        state_->log.pop_front();
    }

    ++state_->telemetry.published_versions;
    state_->telemetry.published_deltas += published->deltas.size();

    auto& subscriptions = state_->subscriptions;
    subscriptions.erase(std::remove_if(subscriptions.begin(),
                                       subscriptions.end(),
                                       [](const auto& entry) {
                                           auto subscription = entry.lock();
                                           return !subscription || subscription->cancelled();
                                       }),
                        subscriptions.end());

    for (auto& entry : subscriptions) {
        if (auto subscription = entry.lock()) {
            subscription->deliver(published);
        }
    }
    return published->version;
}

std::shared_ptr<CatalogSubscription> NotificationBroadcaster::subscribe(std::uint64_t from_version)
{
    std::lock_guard guard{state_->mutex};

    auto subscription = std::make_shared<CatalogSubscription>(CatalogSubscription::ConstructionKey{},
                                                              state_,
                                                              state_->next_subscription_id++,
                                                              from_version,
                                                              state_->queue_capacity);

    if (from_version > state_->version) {
        // The subscriber saw versions this broadcaster never produced.
        SPDLOG_WARN("catalog subscription {} requested version {} beyond current version {}, resync required",
                    subscription->id(),
                    from_version,
                    state_->version);
        subscription->resync_required_ = true;
        ++state_->telemetry.resync_demands;
    }

    state_->subscriptions.push_back(subscription);
    return subscription;
}

void NotificationBroadcaster::refill(CatalogSubscription::State& state, CatalogSubscription& subscription)
{
    bool notify = false;
    {
        std::lock_guard broadcaster_guard{state.mutex};
        std::lock_guard subscription_guard{subscription.mutex_};
        if (!subscription.catching_up_ || subscription.cancelled_ || subscription.resync_required_) {
            return;
        }

        const auto needed = subscription.last_delivered_ + 1U;
        if (needed > state.version) {
            subscription.catching_up_ = false;
            return;
        }

        if (state.log.empty() || state.log.front()->version > needed) {
            const auto oldest = state.log.empty() ? state.version + 1U : state.log.front()->version;
            SPDLOG_WARN("catalog log starts at version {}, subscription {} needs version {}, resync required",
                        oldest,
                        subscription.id_,
                        needed);
            subscription.resync_required_ = true;
            ++state.telemetry.resync_demands;
            notify = true;
        } else {
            const auto offset = static_cast<std::size_t>(needed - state.log.front()->version);
            auto it = state.log.begin() + static_cast<std::ptrdiff_t>(offset);
            while (it != state.log.end() && subscription.queue_.size() < subscription.capacity_) {
                subscription.queue_.push_back(*it);
                ++it;
            }
            subscription.catching_up_ = it != state.log.end();
            notify = !subscription.queue_.empty();
        }
    }
    if (notify) {
        subscription.ready_.notify_all();
    }
}

std::uint64_t NotificationBroadcaster::current_version() const
{
    std::lock_guard guard{state_->mutex};
    return state_->version;
}

std::uint64_t NotificationBroadcaster::oldest_retained_version() const
{
    std::lock_guard guard{state_->mutex};
    return state_->log.empty() ? state_->version + 1U : state_->log.front()->version;
}

std::error_code NotificationBroadcaster::replay(std::uint64_t from_version,
                                                std::size_t limit,
                                                std::vector<catalog::CatalogNotification>& out) const
{
    std::lock_guard guard{state_->mutex};
    const auto needed = from_version + 1U;
    if (needed > state_->version) {
        return {};
    }
    if (state_->log.empty() || state_->log.front()->version > needed) {
        return catalog::CatalogErrc::ResyncRequired;
    }

    const auto offset = static_cast<std::size_t>(needed - state_->log.front()->version);
    for (auto it = state_->log.begin() + static_cast<std::ptrdiff_t>(offset);
         it != state_->log.end() && out.size() < limit;
         ++it) {
        out.push_back(**it);
    }
    return {};
}

NotificationBroadcaster::TelemetrySnapshot NotificationBroadcaster::telemetry() const
{
    std::lock_guard guard{state_->mutex};
    auto snapshot = state_->telemetry;
    snapshot.live_subscriptions = static_cast<std::uint64_t>(
        std::count_if(state_->subscriptions.begin(), state_->subscriptions.end(), [](const auto& entry) {
            auto subscription = entry.lock();
            return subscription && !subscription->cancelled();
        }));
    snapshot.retained_versions = state_->log.size();
    return snapshot;
}

}  // namespace streamcat::notify
