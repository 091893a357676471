#pragma once

#include "streamcat/catalog/catalog_objects.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace streamcat::catalog {

inline constexpr std::uint8_t kCatalogEncodingVersion = 1U;
inline constexpr std::string_view kIdWatermarkKeyPrefix = "meta/id_watermark/";

// Highest id ever handed out in a category, persisted so that a dropped
// object with the largest id does not free that id after a restart.
struct CatalogIdWatermark final {
    CatalogIdCategory category = CatalogIdCategory::Relation;
    std::uint64_t last_allocated = 0U;
};

[[nodiscard]] std::string catalog_object_key(CatalogObjectKind kind, std::uint64_t id);
[[nodiscard]] std::string catalog_object_key(const CatalogObject& object);
[[nodiscard]] std::string id_watermark_key(CatalogIdCategory category);
[[nodiscard]] bool is_id_watermark_key(std::string_view key) noexcept;

[[nodiscard]] std::vector<std::byte> encode_catalog_object(const CatalogObject& object);
[[nodiscard]] std::optional<CatalogObject> decode_catalog_object(std::span<const std::byte> buffer);

[[nodiscard]] std::vector<std::byte> encode_id_watermark(const CatalogIdWatermark& watermark);
[[nodiscard]] std::optional<CatalogIdWatermark> decode_id_watermark(std::span<const std::byte> buffer);

}  // namespace streamcat::catalog
