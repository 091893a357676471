#include "streamcat/catalog/catalog_errors.hpp"

#include <string>

namespace streamcat::catalog {

namespace {

class CatalogErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "streamcat.catalog";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CatalogErrc>(condition)) {
        case CatalogErrc::Success:
            return "success";
        case CatalogErrc::NameConflict:
            return "name already in use";
        case CatalogErrc::DependencyViolation:
            return "object has live dependents";
        case CatalogErrc::VersionConflict:
            return "table version conflict";
        case CatalogErrc::NotFound:
            return "catalog object not found";
        case CatalogErrc::StoreUnavailable:
            return "catalog store unavailable";
        case CatalogErrc::Inconsistent:
            return "catalog state inconsistent";
        case CatalogErrc::InvalidDefinition:
            return "invalid object definition";
        case CatalogErrc::ResyncRequired:
            return "subscriber must resynchronize";
        case CatalogErrc::SubscriptionClosed:
            return "subscription closed";
        default:
            return "unknown catalog error";
        }
    }
};

const CatalogErrorCategory kCategory{};

}  // namespace

const std::error_category& catalog_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CatalogErrc value) noexcept
{
    return {static_cast<int>(value), catalog_error_category()};
}

}  // namespace streamcat::catalog
