#include "streamcat/catalog/catalog_store.hpp"

#include <utility>

namespace streamcat::catalog {

InMemoryCatalogStore::InMemoryCatalogStore(CatalogStoreContents contents)
    : contents_{std::move(contents)}
{
}

std::error_code InMemoryCatalogStore::commit(std::span<const CatalogWrite> writes)
{
    std::lock_guard guard{mutex_};
    for (const auto& write : writes) {
        if (write.value) {
            contents_[write.key] = *write.value;
            ++telemetry_.writes;
        } else {
            contents_.erase(write.key);
            ++telemetry_.tombstones;
        }
    }
    ++telemetry_.commits;
    return {};
}

std::error_code InMemoryCatalogStore::load_all(CatalogStoreContents& out)
{
    std::lock_guard guard{mutex_};
    out = contents_;
    return {};
}

std::size_t InMemoryCatalogStore::size() const
{
    std::lock_guard guard{mutex_};
    return contents_.size();
}

bool InMemoryCatalogStore::contains(const std::string& key) const
{
    std::lock_guard guard{mutex_};
    return contents_.find(key) != contents_.end();
}

InMemoryCatalogStore::TelemetrySnapshot InMemoryCatalogStore::telemetry() const
{
    std::lock_guard guard{mutex_};
    return telemetry_;
}

}  // namespace streamcat::catalog
