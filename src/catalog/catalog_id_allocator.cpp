#include "streamcat/catalog/catalog_id_allocator.hpp"

#include "streamcat/catalog/catalog_encoding.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace streamcat::catalog {

namespace {

[[nodiscard]] constexpr std::size_t category_index(CatalogIdCategory category) noexcept
{
    return static_cast<std::size_t>(category);
}

[[nodiscard]] constexpr std::uint64_t first_or_default(std::uint64_t value) noexcept
{
    return value == 0U ? 1U : value;
}

}  // namespace

CatalogIdAllocator::CatalogIdAllocator()
    : CatalogIdAllocator(Config{})
{
}

CatalogIdAllocator::CatalogIdAllocator(Config config)
{
    floor_[category_index(CatalogIdCategory::Database)] = first_or_default(config.first_database_id) - 1U;
    floor_[category_index(CatalogIdCategory::Schema)] = first_or_default(config.first_schema_id) - 1U;
    floor_[category_index(CatalogIdCategory::Relation)] = first_or_default(config.first_relation_id) - 1U;
    floor_[category_index(CatalogIdCategory::Function)] = first_or_default(config.first_function_id) - 1U;
    committed_ = floor_;
}

void CatalogIdAllocator::attach(CatalogTransaction& transaction, CatalogMutator& mutator)
{
    if (mutator_ != nullptr) {
        throw std::logic_error{"CatalogIdAllocator is already attached to an active transaction"};
    }
    if (!transaction.is_active()) {
        throw std::logic_error{"CatalogIdAllocator::attach requires an active transaction"};
    }

    mutator_ = &mutator;
    mutator.register_pre_publish_hook([this]() -> std::error_code {
        return this->stage_watermarks();
    });
    transaction.register_commit_hook([this]() -> std::error_code {
        this->promote_pending();
        return {};
    });
    transaction.register_abort_hook([this]() {
        this->rollback_pending();
    });
}

bool CatalogIdAllocator::attached() const noexcept
{
    return mutator_ != nullptr;
}

std::uint64_t CatalogIdAllocator::next_id(CatalogObjectKind kind)
{
    return allocate(id_category(kind));
}

DatabaseId CatalogIdAllocator::next_database_id()
{
    return DatabaseId{allocate(CatalogIdCategory::Database)};
}

SchemaId CatalogIdAllocator::next_schema_id()
{
    return SchemaId{allocate(CatalogIdCategory::Schema)};
}

RelationId CatalogIdAllocator::next_relation_id()
{
    return RelationId{allocate(CatalogIdCategory::Relation)};
}

FunctionId CatalogIdAllocator::next_function_id()
{
    return FunctionId{allocate(CatalogIdCategory::Function)};
}

ColumnId CatalogIdAllocator::next_column_id(TableVersion& version)
{
    if (version.next_column_id.value == std::numeric_limits<std::int32_t>::max()) {
        throw std::system_error(std::make_error_code(std::errc::value_too_large), "Column id space exhausted");
    }
    const auto column_id = version.next_column_id;
    ++version.next_column_id.value;
    return column_id;
}

void CatalogIdAllocator::observe(CatalogObjectKind kind, std::uint64_t id) noexcept
{
    advance_to(id_category(kind), id);
}

void CatalogIdAllocator::advance_to(CatalogIdCategory category, std::uint64_t last_allocated) noexcept
{
    auto& committed = committed_[category_index(category)];
    committed = std::max(committed, last_allocated);
}

std::uint64_t CatalogIdAllocator::last_allocated(CatalogIdCategory category) const noexcept
{
    return committed_[category_index(category)];
}

bool CatalogIdAllocator::has_pending_allocations() const noexcept
{
    return std::any_of(pending_.begin(), pending_.end(), [](const auto& entry) { return entry.has_value(); });
}

CatalogIdAllocator::TelemetrySnapshot CatalogIdAllocator::telemetry() const noexcept
{
    return telemetry_;
}

void CatalogIdAllocator::reset() noexcept
{
    committed_ = floor_;
    pending_.fill(std::nullopt);
    mutator_ = nullptr;
}

std::uint64_t CatalogIdAllocator::allocate(CatalogIdCategory category)
{
    if (mutator_ == nullptr) {
        throw std::logic_error{"CatalogIdAllocator requires an attached transaction to allocate ids"};
    }

    auto& pending = pending_[category_index(category)];
    const auto current = pending.value_or(committed_[category_index(category)]);
    if (current == std::numeric_limits<std::uint64_t>::max()) {
        throw std::system_error(std::make_error_code(std::errc::value_too_large), "Catalog id space exhausted");
    }

    pending = current + 1U;
    ++telemetry_.allocated_ids;
    return *pending;
}

std::error_code CatalogIdAllocator::stage_watermarks()
{
    if (mutator_ == nullptr) {
        return {};
    }

    for (std::size_t index = 0U; index < kCategoryCount; ++index) {
        if (!pending_[index]) {
            continue;
        }

        CatalogIdWatermark watermark{};
        watermark.category = static_cast<CatalogIdCategory>(index);
        watermark.last_allocated = *pending_[index];

        CatalogWrite write{};
        write.key = id_watermark_key(watermark.category);
        write.value = encode_id_watermark(watermark);
        mutator_->stage_internal_write(std::move(write));
        ++telemetry_.watermark_writes;
    }
    return {};
}

void CatalogIdAllocator::promote_pending() noexcept
{
    for (std::size_t index = 0U; index < kCategoryCount; ++index) {
        if (pending_[index]) {
            committed_[index] = std::max(committed_[index], *pending_[index]);
            pending_[index].reset();
        }
    }
    mutator_ = nullptr;
}

void CatalogIdAllocator::rollback_pending() noexcept
{
    for (std::size_t index = 0U; index < kCategoryCount; ++index) {
        if (pending_[index]) {
            telemetry_.rolled_back_ids += *pending_[index] - committed_[index];
            pending_[index].reset();
        }
    }
    mutator_ = nullptr;
}

}  // namespace streamcat::catalog
