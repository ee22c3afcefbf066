/**
 * @file scheduling_error.cpp
 * @brief Mapping of module errors to caller-facing codes
 */

#include "clinic/opd/scheduling/scheduling_error.h"

#include <format>

namespace clinic::opd::scheduling {

scheduling_failure scheduling_failure::from(security::access_error error) {
    switch (error) {
        case security::access_error::cross_tenant_access:
            return make(scheduling_error::cross_tenant_access,
                        security::to_string(error));
        case security::access_error::department_access_denied:
            return make(scheduling_error::department_access_denied,
                        security::to_string(error));
        case security::access_error::permission_denied:
        case security::access_error::invalid_session:
        default:
            return make(scheduling_error::permission_denied,
                        security::to_string(error));
    }
}

scheduling_failure scheduling_failure::from(security::rate_limit_error error) {
    if (error == security::rate_limit_error::limit_exceeded) {
        return make(scheduling_error::rate_limited, security::to_string(error));
    }
    return make(scheduling_error::internal, security::to_string(error));
}

scheduling_failure scheduling_failure::from(integration::database_error error) {
    if (error == integration::database_error::constraint_violation) {
        return make(scheduling_error::slot_conflict,
                    "Slot was taken by a concurrent booking");
    }
    return make(scheduling_error::internal,
                std::string(integration::to_string(error)));
}

std::string scheduling_failure::to_string() const {
    if (message.empty()) {
        return scheduling::to_string(code);
    }
    return std::format("{}: {}", scheduling::to_string(code), message);
}

}  // namespace clinic::opd::scheduling
