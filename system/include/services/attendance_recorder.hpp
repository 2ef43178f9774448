// ============= include/services/attendance_recorder.hpp =============
/*
 * Attendance Recorder - nombre reconocido -> evento "Present"
 *
 * El llamador ya filtro "Unknown". record():
 * 1. nombre -> staff.id (UnknownIdentity si no existe: inconsistencia
 *    entre galeria y base, se loguea como tal)
 * 2. timestamp del reloj inyectado, resolucion de segundos
 * 3. INSERT segun la politica de duplicados:
 *    - EveryRecognition: cada llamada inserta un evento
 *    - OncePerDay: como mucho un "Present" por persona y fecha local;
 *      si ya existe, ok = true y already_recorded = true
 */

#pragma once
#include "core/attendance_error.hpp"
#include <chrono>
#include <functional>
#include <string>

class AttendanceDatabase;

enum class DuplicatePolicy {
    EveryRecognition,
    OncePerDay
};

bool parse_duplicate_policy(const std::string& text, DuplicatePolicy& policy);
const char* to_string(DuplicatePolicy policy);

struct RecordResult {
    bool ok = false;
    AttendanceError error = AttendanceError::None;
    int staff_id = -1;
    std::string timestamp;
    bool already_recorded = false;
    std::string message;
};

class AttendanceRecorder {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit AttendanceRecorder(AttendanceDatabase& db,
                                DuplicatePolicy policy = DuplicatePolicy::EveryRecognition,
                                Clock clock = [] { return std::chrono::system_clock::now(); });

    RecordResult record(const std::string& name);

    DuplicatePolicy get_policy() const { return policy; }

private:
    AttendanceDatabase& db;
    DuplicatePolicy policy;
    Clock clock;
};
