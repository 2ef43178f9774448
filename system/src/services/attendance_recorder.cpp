#include "services/attendance_recorder.hpp"
#include "config.hpp"
#include "database/attendance_database.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <utility>

bool parse_duplicate_policy(const std::string& text, DuplicatePolicy& policy) {
    if (text == "every_recognition") {
        policy = DuplicatePolicy::EveryRecognition;
        return true;
    }
    if (text == "once_per_day") {
        policy = DuplicatePolicy::OncePerDay;
        return true;
    }
    return false;
}

const char* to_string(DuplicatePolicy policy) {
    return policy == DuplicatePolicy::OncePerDay ? "once_per_day" : "every_recognition";
}

AttendanceRecorder::AttendanceRecorder(AttendanceDatabase& db,
                                       DuplicatePolicy policy,
                                       Clock clock)
    : db(db), policy(policy), clock(std::move(clock))
{
}

RecordResult AttendanceRecorder::record(const std::string& name) {
    RecordResult result;

    int staff_id = -1;
    AttendanceError err = db.find_staff_id(name, staff_id);
    if (err == AttendanceError::UnknownIdentity) {
        result.error = err;
        result.message = "Staff member " + name + " not found in the database.";
        spdlog::error("{} (gallery/database out of sync)", result.message);
        return result;
    }
    if (err != AttendanceError::None) {
        result.error = err;
        result.message = "Error recording attendance for " + name;
        spdlog::error("{}: {}", result.message, to_string(err));
        return result;
    }

    result.staff_id = staff_id;
    result.timestamp = format_timestamp(clock());

    if (policy == DuplicatePolicy::OncePerDay) {
        bool inserted = false;
        err = db.insert_attendance_once_per_day(staff_id, result.timestamp,
                                                Config::STATUS_PRESENT, inserted);
        if (err == AttendanceError::None && !inserted) {
            result.ok = true;
            result.already_recorded = true;
            result.message = "Attendance already recorded today for " + name;
            spdlog::info("{}", result.message);
            return result;
        }
    } else {
        err = db.insert_attendance(staff_id, result.timestamp, Config::STATUS_PRESENT);
    }

    if (err != AttendanceError::None) {
        result.error = err;
        result.message = "Error recording attendance for " + name;
        spdlog::error("{}: {}", result.message, to_string(err));
        return result;
    }

    result.ok = true;
    result.message = "Attendance recorded for " + name;
    spdlog::info("{} ({})", result.message, result.timestamp);
    return result;
}
