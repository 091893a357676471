#include "streamcat/catalog/catalog_mutator.hpp"

#include "streamcat/catalog/catalog_encoding.hpp"

#include <atomic>
#include <stdexcept>
#include <utility>

namespace streamcat::catalog {

namespace {

std::atomic<std::uint64_t> g_published_batches{0U};
std::atomic<std::uint64_t> g_published_writes{0U};
std::atomic<std::uint64_t> g_publish_failures{0U};
std::atomic<std::uint64_t> g_aborted_batches{0U};
std::atomic<std::uint64_t> g_aborted_writes{0U};

[[nodiscard]] CatalogWrite make_put(const CatalogObject& object)
{
    CatalogWrite write{};
    write.key = catalog_object_key(object);
    write.value = encode_catalog_object(object);
    return write;
}

}  // namespace

CatalogMutator::CatalogMutator(Config config)
    : transaction_{config.transaction}
{
    if (transaction_ == nullptr) {
        throw std::invalid_argument{"CatalogMutator requires an active transaction"};
    }
    register_transaction_hooks();
}

const CatalogTransaction& CatalogMutator::transaction() const noexcept
{
    return *transaction_;
}

bool CatalogMutator::empty() const noexcept
{
    return writes_.empty() && deltas_.empty();
}

const std::vector<CatalogWrite>& CatalogMutator::staged_writes() const noexcept
{
    return writes_;
}

const std::vector<CatalogDelta>& CatalogMutator::staged_deltas() const noexcept
{
    return deltas_;
}

bool CatalogMutator::has_published_batch() const noexcept
{
    return published_batch_.has_value();
}

const CatalogMutationBatch& CatalogMutator::published_batch() const
{
    if (!published_batch_) {
        throw std::logic_error{"CatalogMutator::published_batch called without published batch"};
    }
    return *published_batch_;
}

CatalogMutationBatch CatalogMutator::consume_published_batch()
{
    if (!published_batch_) {
        throw std::logic_error{"CatalogMutator::consume_published_batch called without published batch"};
    }
    auto batch = std::move(*published_batch_);
    published_batch_.reset();
    return batch;
}

void CatalogMutator::stage_create(CatalogObject object)
{
    writes_.push_back(make_put(object));
    deltas_.push_back(CatalogDelta::created(std::move(object)));
}

void CatalogMutator::stage_alter(CatalogObject object)
{
    writes_.push_back(make_put(object));
    deltas_.push_back(CatalogDelta::altered(std::move(object)));
}

void CatalogMutator::stage_drop(CatalogObjectKind kind, std::uint64_t id)
{
    if (id == 0U) {
        throw std::invalid_argument{"CatalogMutator::stage_drop requires non-zero object id"};
    }

    CatalogWrite write{};
    write.key = catalog_object_key(kind, id);
    writes_.push_back(std::move(write));
    deltas_.push_back(CatalogDelta::dropped(kind, id));
}

void CatalogMutator::stage_internal_write(CatalogWrite write)
{
    if (write.key.empty()) {
        throw std::invalid_argument{"CatalogMutator::stage_internal_write requires a key"};
    }
    writes_.push_back(std::move(write));
}

void CatalogMutator::clear() noexcept
{
    writes_.clear();
    deltas_.clear();
    published_batch_.reset();
}

void CatalogMutator::register_pre_publish_hook(PrePublishHook hook)
{
    if (!hook) {
        throw std::invalid_argument{"CatalogMutator::register_pre_publish_hook requires valid hook"};
    }
    pre_publish_hooks_.push_back(std::move(hook));
}

void CatalogMutator::set_publish_listener(PublishListener listener)
{
    publish_listener_ = std::move(listener);
}

std::error_code CatalogMutator::publish_staged_batch()
{
    for (auto& hook : pre_publish_hooks_) {
        if (auto ec = hook()) {
            g_publish_failures.fetch_add(1U, std::memory_order_relaxed);
            return ec;
        }
    }

    if (empty()) {
        published_batch_.reset();
        return {};
    }

    CatalogMutationBatch batch{};
    batch.transaction_id = transaction_->transaction_id();
    batch.writes = std::move(writes_);
    batch.deltas = std::move(deltas_);
    writes_.clear();
    deltas_.clear();

    if (publish_listener_) {
        if (auto ec = publish_listener_(batch)) {
            g_publish_failures.fetch_add(1U, std::memory_order_relaxed);
            // Keep the staged state so the abort path can account for it.
            writes_ = std::move(batch.writes);
            deltas_ = std::move(batch.deltas);
            return ec;
        }
    }

    g_published_batches.fetch_add(1U, std::memory_order_relaxed);
    g_published_writes.fetch_add(batch.writes.size(), std::memory_order_relaxed);
    published_batch_ = std::move(batch);
    return {};
}

void CatalogMutator::register_transaction_hooks()
{
    transaction_->register_commit_hook([this]() {
        return this->publish_staged_batch();
    });
    transaction_->register_abort_hook([this]() {
        this->record_abort();
        this->clear();
    });
}

CatalogMutationTelemetrySnapshot CatalogMutator::telemetry() noexcept
{
    CatalogMutationTelemetrySnapshot snapshot{};
    snapshot.published_batches = g_published_batches.load(std::memory_order_relaxed);
    snapshot.published_writes = g_published_writes.load(std::memory_order_relaxed);
    snapshot.publish_failures = g_publish_failures.load(std::memory_order_relaxed);
    snapshot.aborted_batches = g_aborted_batches.load(std::memory_order_relaxed);
    snapshot.aborted_writes = g_aborted_writes.load(std::memory_order_relaxed);
    return snapshot;
}

void CatalogMutator::reset_telemetry() noexcept
{
    g_published_batches.store(0U, std::memory_order_relaxed);
    g_published_writes.store(0U, std::memory_order_relaxed);
    g_publish_failures.store(0U, std::memory_order_relaxed);
    g_aborted_batches.store(0U, std::memory_order_relaxed);
    g_aborted_writes.store(0U, std::memory_order_relaxed);
}

void CatalogMutator::record_abort() noexcept
{
    if (writes_.empty()) {
        return;
    }
    g_aborted_batches.fetch_add(1U, std::memory_order_relaxed);
    g_aborted_writes.fetch_add(writes_.size(), std::memory_order_relaxed);
}

}  // namespace streamcat::catalog
