#include "catalog/CatalogError.hpp"

namespace catalog {

CatalogError::CatalogError(Reason reason, const std::string &message)
    : std::runtime_error(std::string(reasonName(reason)) + ": " + message), reason_{reason} {}

const char* CatalogError::reasonName(Reason reason) {
    switch (reason) {
        case Reason::permission_denied: return "permission_denied";
        case Reason::wrong_value: return "wrong_value";
        case Reason::duplicate_content: return "duplicate_content";
        case Reason::content_not_found: return "content_not_found";
        case Reason::unregistered: return "unregistered";
        case Reason::threshold_not_reached: return "threshold_not_reached";
        case Reason::subscription_expired: return "subscription_expired";
        case Reason::too_early: return "too_early";
        case Reason::nothing_to_distribute: return "nothing_to_distribute";
        case Reason::external_call_failed: return "external_call_failed";
        case Reason::invalid_account: return "invalid_account";
        case Reason::catalog_closed: return "catalog_closed";
    }
    return "unknown";
}

}
