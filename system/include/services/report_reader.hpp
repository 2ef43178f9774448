// ============= include/services/report_reader.hpp =============
#pragma once
#include "core/attendance_error.hpp"
#include "database/attendance_database.hpp"
#include <optional>
#include <string>
#include <vector>

// Solo lectura: refleja lo que hay en la base
class ReportReader {
public:
    explicit ReportReader(AttendanceDatabase& db);

    // (nombre, timestamp, estado) de todos los eventos, en orden de insercion.
    // Vacio si la base no responde (ver last_error()).
    std::vector<AttendanceRecord> list_events();

    // Eventos de una fecha "YYYY-MM-DD"
    std::vector<AttendanceRecord> list_events_on(const std::string& date);

    std::optional<StaffRecord> get_staff_info(const std::string& name);

    // CSV con cabecera name,timestamp,status
    bool export_csv(const std::string& path, const std::vector<AttendanceRecord>& events);

    AttendanceError last_error() const { return error; }

private:
    AttendanceDatabase& db;
    AttendanceError error;
};
