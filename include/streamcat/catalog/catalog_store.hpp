#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace streamcat::catalog {

// A value of std::nullopt deletes the key.
struct CatalogWrite final {
    std::string key{};
    std::optional<std::vector<std::byte>> value{};
};

using CatalogStoreContents = std::map<std::string, std::vector<std::byte>>;

// Durable key/value backend for catalog objects. A commit is atomic across
// every key it names; retries and timeouts are the implementation's concern.
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    [[nodiscard]] virtual std::error_code commit(std::span<const CatalogWrite> writes) = 0;
    [[nodiscard]] virtual std::error_code load_all(CatalogStoreContents& out) = 0;
};

class InMemoryCatalogStore final : public CatalogStore {
public:
    struct TelemetrySnapshot final {
        std::uint64_t commits = 0U;
        std::uint64_t writes = 0U;
        std::uint64_t tombstones = 0U;
    };

    InMemoryCatalogStore() = default;
    explicit InMemoryCatalogStore(CatalogStoreContents contents);

    InMemoryCatalogStore(const InMemoryCatalogStore&) = delete;
    InMemoryCatalogStore& operator=(const InMemoryCatalogStore&) = delete;
    InMemoryCatalogStore(InMemoryCatalogStore&&) = delete;
    InMemoryCatalogStore& operator=(InMemoryCatalogStore&&) = delete;

    [[nodiscard]] std::error_code commit(std::span<const CatalogWrite> writes) override;
    [[nodiscard]] std::error_code load_all(CatalogStoreContents& out) override;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] TelemetrySnapshot telemetry() const;

private:
    mutable std::mutex mutex_{};
    CatalogStoreContents contents_{};
    TelemetrySnapshot telemetry_{};
};

}  // namespace streamcat::catalog
