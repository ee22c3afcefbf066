/**
 * @file schema.cpp
 * @brief Shared store DDL
 */

#include "clinic/opd/storage/schema.h"

#include "clinic/opd/integration/logger_adapter.h"

#include <format>

namespace clinic::opd::storage {

namespace {

constexpr std::string_view ddl = R"(
CREATE TABLE IF NOT EXISTS schema_info (
    version INTEGER NOT NULL
);

-- Reference data (read-only for the scheduler)

CREATE TABLE IF NOT EXISTS departments (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    name TEXT NOT NULL,
    code TEXT,
    status TEXT NOT NULL DEFAULT 'ACTIVE'
);

CREATE TABLE IF NOT EXISTS practitioners (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    name TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'ACTIVE'
);

CREATE TABLE IF NOT EXISTS practitioner_departments (
    practitioner_id TEXT NOT NULL,
    department_id TEXT NOT NULL,
    is_primary INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (practitioner_id, department_id)
);

CREATE TABLE IF NOT EXISTS patients (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    uhid TEXT NOT NULL,
    name TEXT NOT NULL,
    phone TEXT,
    gender TEXT,
    date_of_birth TEXT
);

-- Availability

CREATE TABLE IF NOT EXISTS availability_templates (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    practitioner_id TEXT NOT NULL,
    department_id TEXT NOT NULL,
    day_of_week TEXT NOT NULL,
    start_time TEXT NOT NULL,
    end_time TEXT NOT NULL,
    slot_duration_minutes INTEGER NOT NULL DEFAULT 15,
    max_patients_per_day INTEGER,
    allow_walk_in INTEGER NOT NULL DEFAULT 1,
    walk_in_slots INTEGER NOT NULL DEFAULT 0,
    effective_from TEXT,
    effective_to TEXT,
    status TEXT NOT NULL DEFAULT 'ACTIVE',
    version INTEGER NOT NULL DEFAULT 1,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_templates_practitioner_day
    ON availability_templates(tenant_id, practitioner_id, day_of_week, status);

-- Appointments

CREATE TABLE IF NOT EXISTS appointments (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    patient_id TEXT NOT NULL,
    practitioner_id TEXT NOT NULL,
    department_id TEXT NOT NULL,
    appointment_date TEXT NOT NULL,
    appointment_time TEXT NOT NULL,
    end_time TEXT,
    status TEXT NOT NULL,
    booking_source TEXT NOT NULL,
    priority TEXT NOT NULL DEFAULT 'NORMAL',
    token_number INTEGER NOT NULL,
    is_walk_in INTEGER NOT NULL DEFAULT 0,
    chief_complaint TEXT,
    notes TEXT,
    cancellation_reason TEXT,
    cancelled_at TEXT,
    checked_in_at TEXT,
    completed_at TEXT,
    rescheduled_from_id TEXT,
    rescheduled_to_id TEXT,
    created_by TEXT,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS ux_appointments_active_slot
    ON appointments(tenant_id, practitioner_id, appointment_date, appointment_time)
    WHERE status NOT IN ('CANCELLED', 'NO_SHOW', 'RESCHEDULED');

CREATE INDEX IF NOT EXISTS idx_appointments_listing
    ON appointments(tenant_id, appointment_date, appointment_time, id);

CREATE INDEX IF NOT EXISTS idx_appointments_patient
    ON appointments(tenant_id, patient_id, appointment_date);

-- Visits

CREATE TABLE IF NOT EXISTS visits (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    patient_id TEXT NOT NULL,
    practitioner_id TEXT NOT NULL,
    department_id TEXT NOT NULL,
    appointment_id TEXT,
    visit_number INTEGER NOT NULL,
    visit_type TEXT NOT NULL DEFAULT 'OPD',
    status TEXT NOT NULL,
    priority TEXT NOT NULL DEFAULT 'NORMAL',
    token_number INTEGER,
    check_in_time TEXT NOT NULL,
    start_time TEXT,
    end_time TEXT,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_visits_practitioner_status
    ON visits(tenant_id, practitioner_id, status);

CREATE INDEX IF NOT EXISTS idx_visits_patient
    ON visits(tenant_id, patient_id, visit_number);

-- Queue read model

CREATE TABLE IF NOT EXISTS opd_queue_snapshots (
    visit_id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    patient_id TEXT NOT NULL,
    patient_uhid TEXT,
    patient_name TEXT,
    patient_phone TEXT,
    patient_gender TEXT,
    patient_date_of_birth TEXT,
    practitioner_id TEXT NOT NULL,
    practitioner_name TEXT,
    department_id TEXT NOT NULL,
    department_name TEXT,
    appointment_id TEXT,
    token_number INTEGER,
    visit_number INTEGER NOT NULL,
    priority TEXT NOT NULL,
    priority_rank INTEGER NOT NULL,
    status TEXT NOT NULL,
    visit_type TEXT NOT NULL,
    check_in_time TEXT NOT NULL,
    start_time TEXT,
    end_time TEXT,
    visit_updated_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_queue_order
    ON opd_queue_snapshots(tenant_id, department_id, priority_rank DESC,
                           check_in_time, visit_id);

CREATE TABLE IF NOT EXISTS queue_sync_failures (
    visit_id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    last_error TEXT NOT NULL,
    attempt_count INTEGER NOT NULL DEFAULT 1,
    last_failed_at TEXT NOT NULL
);

-- Shared counters (token numbers, rate limits)

CREATE TABLE IF NOT EXISTS shared_counters (
    counter_key TEXT PRIMARY KEY,
    value INTEGER NOT NULL,
    window_expires_at TEXT
);

-- Audit

CREATE TABLE IF NOT EXISTS audit_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    tenant_id TEXT NOT NULL,
    user_id TEXT,
    action TEXT NOT NULL,
    entity_type TEXT NOT NULL,
    entity_id TEXT NOT NULL,
    details TEXT,
    created_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_entity
    ON audit_log(tenant_id, entity_type, entity_id);
)";

}  // namespace

std::string_view schema_ddl() noexcept {
    return ddl;
}

std::expected<void, integration::database_error>
apply_schema(integration::database_adapter& adapter) {
    auto logger = integration::create_logger("schema");

    if (auto applied = adapter.execute_schema(ddl); !applied) {
        logger->error(std::format("Schema bootstrap failed: {}",
                                  integration::to_string(applied.error())));
        return applied;
    }

    auto scope = integration::connection_scope::acquire(adapter);
    if (!scope) {
        return std::unexpected(scope.error());
    }
    auto& conn = scope->connection();

    auto current = conn.query("SELECT version FROM schema_info LIMIT 1", {});
    if (!current) {
        return std::unexpected(current.error());
    }

    if (!(*current)->next()) {
        auto inserted = conn.query("INSERT INTO schema_info (version) VALUES (?)",
                                   {static_cast<int64_t>(schema_version)});
        if (!inserted) {
            return std::unexpected(inserted.error());
        }
    }

    logger->info(std::format("Schema version {} ready", schema_version));
    return {};
}

}  // namespace clinic::opd::storage
