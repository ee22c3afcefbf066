#ifndef CLINIC_OPD_STORAGE_SCHEMA_H
#define CLINIC_OPD_STORAGE_SCHEMA_H

/**
 * @file schema.h
 * @brief Shared store schema bootstrap
 *
 * Reference tables (departments, practitioners, patients) are owned by
 * other services; they are created here only so that a standalone
 * deployment and the test suite have somewhere to read them from.
 *
 * Slot reservation is enforced by a partial UNIQUE index on
 * appointments(tenant_id, practitioner_id, appointment_date,
 * appointment_time) covering every status except CANCELLED, NO_SHOW and
 * RESCHEDULED.
 */

#include "clinic/opd/integration/database_adapter.h"

#include <expected>
#include <string_view>

namespace clinic::opd::storage {

/** Incremented whenever the DDL below changes */
inline constexpr int schema_version = 1;

/**
 * @brief Full DDL script (idempotent, CREATE ... IF NOT EXISTS)
 */
[[nodiscard]] std::string_view schema_ddl() noexcept;

/**
 * @brief Create any missing tables and indexes
 */
[[nodiscard]] std::expected<void, integration::database_error>
apply_schema(integration::database_adapter& adapter);

}  // namespace clinic::opd::storage

#endif  // CLINIC_OPD_STORAGE_SCHEMA_H
