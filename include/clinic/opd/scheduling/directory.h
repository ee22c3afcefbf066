#ifndef CLINIC_OPD_SCHEDULING_DIRECTORY_H
#define CLINIC_OPD_SCHEDULING_DIRECTORY_H

/**
 * @file directory.h
 * @brief Read-only lookups of practitioner, department and patient
 *        reference data
 *
 * All lookups are tenant-scoped: a record of another tenant is reported
 * as missing.
 */

#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/scheduling/scheduling_types.h"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace clinic::opd::scheduling::directory {

struct practitioner_info {
    std::string id;
    std::string tenant_id;
    std::string name;
    practitioner_status status = practitioner_status::active;
};

struct department_info {
    std::string id;
    std::string tenant_id;
    std::string name;
};

struct patient_info {
    std::string id;
    std::string tenant_id;
    std::string uhid;
    std::string name;
};

template <typename T>
using lookup_result = std::expected<std::optional<T>, integration::database_error>;

[[nodiscard]] lookup_result<practitioner_info> find_practitioner(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id);

[[nodiscard]] lookup_result<department_info> find_department(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view department_id);

[[nodiscard]] lookup_result<patient_info> find_patient(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view patient_id);

/**
 * @brief Whether the practitioner is assigned to the department
 */
[[nodiscard]] std::expected<bool, integration::database_error> practitioner_in_department(
    integration::database_connection& conn,
    std::string_view practitioner_id,
    std::string_view department_id);

}  // namespace clinic::opd::scheduling::directory

#endif  // CLINIC_OPD_SCHEDULING_DIRECTORY_H
