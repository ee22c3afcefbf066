#ifndef CLINIC_OPD_SECURITY_ACCESS_GUARD_H
#define CLINIC_OPD_SECURITY_ACCESS_GUARD_H

/**
 * @file access_guard.h
 * @brief Tenant and department scoping of every read and write
 *
 * Every operation first checks the caller's capability, then the tenant,
 * then the department. Tenant isolation is absolute; department scoping
 * is bypassed only by super-admin sessions.
 *
 * Listing queries use build_filter() so that department scoping is part
 * of the SQL rather than a post-filter:
 *
 * @code
 * auto filter = build_filter(session, "department_id");
 * // SELECT ... WHERE tenant_id = ? AND <filter.to_sql()>
 * @endcode
 */

#include "clinic/opd/integration/database_adapter.h"

#include <bitset>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clinic::opd::security {

// =============================================================================
// Error Codes (-950 to -959)
// =============================================================================

/**
 * @brief Access guard error codes
 *
 * Allocated range: -950 to -959
 */
enum class access_error : int {
    /** Session lacks the capability required by the action */
    permission_denied = -950,

    /** Resource belongs to another tenant */
    cross_tenant_access = -951,

    /** Resource belongs to a department the session is not assigned to */
    department_access_denied = -952,

    /** Session has no tenant or user */
    invalid_session = -953
};

[[nodiscard]] constexpr int to_error_code(access_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(access_error error) noexcept {
    switch (error) {
        case access_error::permission_denied:
            return "Permission denied";
        case access_error::cross_tenant_access:
            return "Cross-tenant access denied";
        case access_error::department_access_denied:
            return "Department access denied";
        case access_error::invalid_session:
            return "Invalid session";
        default:
            return "Unknown access error";
    }
}

// =============================================================================
// Capabilities
// =============================================================================

/**
 * @brief Typed capabilities checked by authorize()
 */
enum class permission : std::size_t {
    appointment_view,
    appointment_create,
    appointment_update,
    appointment_cancel,
    appointment_reschedule,
    appointment_checkin,
    slots_view,
    availability_manage,
    queue_view,
    opd_checkin,
    consultation_start,
    consultation_complete,
    queue_admin,

    count_
};

/** "APPOINTMENT_VIEW", "QUEUE_ADMIN", ... */
[[nodiscard]] std::string_view to_string(permission perm) noexcept;

/**
 * @brief Parse an external permission code (case-sensitive, upper snake case)
 */
[[nodiscard]] std::optional<permission> parse_permission(std::string_view code);

/**
 * @brief Set of granted capabilities
 */
class capability_set {
public:
    capability_set() = default;
    capability_set(std::initializer_list<permission> perms);

    /**
     * @brief Build from external codes; unknown codes are ignored
     */
    [[nodiscard]] static capability_set from_codes(
        const std::vector<std::string>& codes);

    /** Every capability */
    [[nodiscard]] static capability_set all();

    void grant(permission perm) noexcept;
    void revoke(permission perm) noexcept;

    [[nodiscard]] bool has(permission perm) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return bits_.none(); }

    [[nodiscard]] std::size_t size() const noexcept { return bits_.count(); }

private:
    std::bitset<static_cast<std::size_t>(permission::count_)> bits_;
};

// =============================================================================
// Session and Resource
// =============================================================================

/**
 * @brief Authenticated caller, as handed over by the session layer
 */
struct session_context {
    std::string tenant_id;
    std::string user_id;

    /** Departments the user is assigned to */
    std::vector<std::string> department_ids;

    capability_set permissions;

    /** Bypasses department scoping; never tenant scoping */
    bool is_super_admin = false;

    [[nodiscard]] bool is_valid() const noexcept {
        return !tenant_id.empty() && !user_id.empty();
    }
};

/**
 * @brief Ownership of the record an action targets
 */
struct resource_scope {
    std::string tenant_id;

    /** nullopt for tenant-wide resources */
    std::optional<std::string> department_id;
};

// =============================================================================
// Decisions
// =============================================================================

/**
 * @brief Authorize an action on a resource
 *
 * Checks, in order: session validity, capability, tenant, department.
 */
[[nodiscard]] std::expected<void, access_error> authorize(
    const session_context& session,
    const resource_scope& resource,
    permission action);

/**
 * @brief Check the capability only (for tenant-scoped listings)
 */
[[nodiscard]] std::expected<void, access_error> require_permission(
    const session_context& session,
    permission action);

/**
 * @brief Tenant then department check of an existing record
 */
[[nodiscard]] std::expected<void, access_error> verify_record_access(
    const session_context& session,
    const resource_scope& record);

/**
 * @brief true if the session may act on @p department_id
 */
[[nodiscard]] bool verify_department_access(const session_context& session,
                                            std::string_view department_id);

/**
 * @brief Check that every requested department is assigned to the session
 */
[[nodiscard]] std::expected<void, access_error> verify_department_list(
    const session_context& session,
    const std::vector<std::string>& department_ids);

// =============================================================================
// Department Filter
// =============================================================================

/**
 * @brief Department predicate for listing queries
 */
class department_filter {
public:
    enum class kind {
        /** Super-admin; no restriction */
        unrestricted,

        /** field IN (...) */
        restricted,

        /** Session has no departments; matches no rows */
        match_nothing
    };

    [[nodiscard]] static department_filter unrestricted();

    [[nodiscard]] static department_filter match_nothing();

    [[nodiscard]] static department_filter restricted(
        std::string field, std::vector<std::string> department_ids);

    [[nodiscard]] kind type() const noexcept { return kind_; }

    [[nodiscard]] const std::vector<std::string>& department_ids() const noexcept {
        return department_ids_;
    }

    /**
     * @brief "1 = 1", "1 = 0" or "field IN (?, ?)"
     */
    [[nodiscard]] std::string to_sql() const;

    /**
     * @brief Values for the placeholders of to_sql(), in order
     */
    [[nodiscard]] std::vector<integration::database_value> bindings() const;

private:
    department_filter(kind k, std::string field, std::vector<std::string> ids);

    kind kind_;
    std::string field_;
    std::vector<std::string> department_ids_;
};

/**
 * @brief Build the department predicate for @p session over column @p field
 */
[[nodiscard]] department_filter build_filter(const session_context& session,
                                             std::string_view field);

}  // namespace clinic::opd::security

#endif  // CLINIC_OPD_SECURITY_ACCESS_GUARD_H
