/**
 * @file directory.cpp
 * @brief Reference data lookups
 */

#include "clinic/opd/scheduling/directory.h"

namespace clinic::opd::scheduling::directory {

lookup_result<practitioner_info> find_practitioner(integration::database_connection& conn,
                                                   std::string_view tenant_id,
                                                   std::string_view practitioner_id) {
    auto result = conn.query(
        "SELECT id, tenant_id, name, status FROM practitioners "
        "WHERE id = ? AND tenant_id = ?",
        {std::string(practitioner_id), std::string(tenant_id)});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!(*result)->next()) {
        return std::optional<practitioner_info>{};
    }

    const auto& row = (*result)->current_row();
    practitioner_info info;
    info.id = row.get_string(0);
    info.tenant_id = row.get_string(1);
    info.name = row.get_string(2);
    // Unknown statuses are not schedulable
    info.status = parse_practitioner_status(row.get_string(3))
                      .value_or(practitioner_status::inactive);
    return info;
}

lookup_result<department_info> find_department(integration::database_connection& conn,
                                               std::string_view tenant_id,
                                               std::string_view department_id) {
    auto result = conn.query(
        "SELECT id, tenant_id, name FROM departments WHERE id = ? AND tenant_id = ?",
        {std::string(department_id), std::string(tenant_id)});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!(*result)->next()) {
        return std::optional<department_info>{};
    }

    const auto& row = (*result)->current_row();
    return department_info{row.get_string(0), row.get_string(1), row.get_string(2)};
}

lookup_result<patient_info> find_patient(integration::database_connection& conn,
                                         std::string_view tenant_id,
                                         std::string_view patient_id) {
    auto result = conn.query(
        "SELECT id, tenant_id, uhid, name FROM patients WHERE id = ? AND tenant_id = ?",
        {std::string(patient_id), std::string(tenant_id)});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!(*result)->next()) {
        return std::optional<patient_info>{};
    }

    const auto& row = (*result)->current_row();
    return patient_info{row.get_string(0), row.get_string(1), row.get_string(2),
                        row.get_string(3)};
}

std::expected<bool, integration::database_error> practitioner_in_department(
    integration::database_connection& conn,
    std::string_view practitioner_id,
    std::string_view department_id) {
    auto result = conn.query(
        "SELECT 1 FROM practitioner_departments "
        "WHERE practitioner_id = ? AND department_id = ?",
        {std::string(practitioner_id), std::string(department_id)});
    if (!result) {
        return std::unexpected(result.error());
    }
    return (*result)->next();
}

}  // namespace clinic::opd::scheduling::directory
