#pragma once

#include <system_error>

namespace streamcat::catalog {

enum class CatalogErrc {
    Success = 0,
    NameConflict,
    DependencyViolation,
    VersionConflict,
    NotFound,
    StoreUnavailable,
    Inconsistent,
    InvalidDefinition,
    ResyncRequired,
    SubscriptionClosed
};

const std::error_category& catalog_error_category() noexcept;
std::error_code make_error_code(CatalogErrc value) noexcept;

}  // namespace streamcat::catalog

namespace std {

template <>
struct is_error_code_enum<streamcat::catalog::CatalogErrc> : true_type {
};

}  // namespace std
