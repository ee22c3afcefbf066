/**
 * @file access_guard.cpp
 * @brief Tenant and department access decisions
 */

#include "clinic/opd/security/access_guard.h"

#include "clinic/opd/integration/logger_adapter.h"

#include <algorithm>
#include <array>
#include <format>

namespace clinic::opd::security {

namespace {

constexpr std::array<std::string_view, static_cast<std::size_t>(permission::count_)>
    permission_codes = {
        "APPOINTMENT_VIEW",
        "APPOINTMENT_CREATE",
        "APPOINTMENT_UPDATE",
        "APPOINTMENT_CANCEL",
        "APPOINTMENT_RESCHEDULE",
        "APPOINTMENT_CHECKIN",
        "SLOTS_VIEW",
        "AVAILABILITY_MANAGE",
        "QUEUE_VIEW",
        "OPD_CHECKIN",
        "CONSULTATION_START",
        "CONSULTATION_COMPLETE",
        "QUEUE_ADMIN",
};

integration::logger_adapter& access_logger() {
    static auto logger = integration::create_logger("access_guard");
    return *logger;
}

std::expected<void, access_error> deny(const session_context& session,
                                       access_error error,
                                       std::string_view detail) {
    access_logger().debug(std::format("Denied user={} tenant={}: {} ({})",
                                      session.user_id, session.tenant_id,
                                      to_string(error), detail));
    return std::unexpected(error);
}

}  // namespace

// =============================================================================
// Capabilities
// =============================================================================

std::string_view to_string(permission perm) noexcept {
    auto index = static_cast<std::size_t>(perm);
    if (index >= permission_codes.size()) {
        return "UNKNOWN";
    }
    return permission_codes[index];
}

std::optional<permission> parse_permission(std::string_view code) {
    for (std::size_t i = 0; i < permission_codes.size(); ++i) {
        if (permission_codes[i] == code) {
            return static_cast<permission>(i);
        }
    }
    return std::nullopt;
}

capability_set::capability_set(std::initializer_list<permission> perms) {
    for (auto perm : perms) {
        grant(perm);
    }
}

capability_set capability_set::from_codes(const std::vector<std::string>& codes) {
    capability_set set;
    for (const auto& code : codes) {
        if (auto perm = parse_permission(code)) {
            set.grant(*perm);
        }
    }
    return set;
}

capability_set capability_set::all() {
    capability_set set;
    set.bits_.set();
    return set;
}

void capability_set::grant(permission perm) noexcept {
    auto index = static_cast<std::size_t>(perm);
    if (index < bits_.size()) {
        bits_.set(index);
    }
}

void capability_set::revoke(permission perm) noexcept {
    auto index = static_cast<std::size_t>(perm);
    if (index < bits_.size()) {
        bits_.reset(index);
    }
}

bool capability_set::has(permission perm) const noexcept {
    auto index = static_cast<std::size_t>(perm);
    return index < bits_.size() && bits_.test(index);
}

// =============================================================================
// Decisions
// =============================================================================

std::expected<void, access_error> require_permission(const session_context& session,
                                                     permission action) {
    if (!session.is_valid()) {
        return deny(session, access_error::invalid_session, "missing tenant or user");
    }
    if (!session.permissions.has(action)) {
        return deny(session, access_error::permission_denied, to_string(action));
    }
    return {};
}

std::expected<void, access_error> verify_record_access(const session_context& session,
                                                       const resource_scope& record) {
    if (!session.is_valid()) {
        return deny(session, access_error::invalid_session, "missing tenant or user");
    }
    if (record.tenant_id != session.tenant_id) {
        return deny(session, access_error::cross_tenant_access, record.tenant_id);
    }
    if (record.department_id &&
        !verify_department_access(session, *record.department_id)) {
        return deny(session, access_error::department_access_denied,
                    *record.department_id);
    }
    return {};
}

std::expected<void, access_error> authorize(const session_context& session,
                                            const resource_scope& resource,
                                            permission action) {
    if (auto allowed = require_permission(session, action); !allowed) {
        return allowed;
    }
    return verify_record_access(session, resource);
}

bool verify_department_access(const session_context& session,
                              std::string_view department_id) {
    if (session.is_super_admin) {
        return true;
    }
    return std::find(session.department_ids.begin(), session.department_ids.end(),
                     department_id) != session.department_ids.end();
}

std::expected<void, access_error> verify_department_list(
    const session_context& session,
    const std::vector<std::string>& department_ids) {
    for (const auto& department_id : department_ids) {
        if (!verify_department_access(session, department_id)) {
            return deny(session, access_error::department_access_denied, department_id);
        }
    }
    return {};
}

// =============================================================================
// Department Filter
// =============================================================================

department_filter::department_filter(kind k, std::string field,
                                     std::vector<std::string> ids)
    : kind_(k), field_(std::move(field)), department_ids_(std::move(ids)) {}

department_filter department_filter::unrestricted() {
    return department_filter(kind::unrestricted, {}, {});
}

department_filter department_filter::match_nothing() {
    return department_filter(kind::match_nothing, {}, {});
}

department_filter department_filter::restricted(std::string field,
                                                std::vector<std::string> department_ids) {
    if (department_ids.empty()) {
        return match_nothing();
    }
    return department_filter(kind::restricted, std::move(field),
                             std::move(department_ids));
}

std::string department_filter::to_sql() const {
    switch (kind_) {
        case kind::unrestricted:
            return "1 = 1";
        case kind::match_nothing:
            return "1 = 0";
        case kind::restricted:
            break;
    }

    std::string sql = field_ + " IN (";
    for (std::size_t i = 0; i < department_ids_.size(); ++i) {
        sql += i == 0 ? "?" : ", ?";
    }
    sql += ")";
    return sql;
}

std::vector<integration::database_value> department_filter::bindings() const {
    std::vector<integration::database_value> values;
    if (kind_ != kind::restricted) {
        return values;
    }
    values.reserve(department_ids_.size());
    for (const auto& id : department_ids_) {
        values.emplace_back(id);
    }
    return values;
}

department_filter build_filter(const session_context& session, std::string_view field) {
    if (session.is_super_admin) {
        return department_filter::unrestricted();
    }
    return department_filter::restricted(std::string(field), session.department_ids);
}

}  // namespace clinic::opd::security
