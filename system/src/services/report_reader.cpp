#include "services/report_reader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

ReportReader::ReportReader(AttendanceDatabase& db)
    : db(db), error(AttendanceError::None)
{
}

std::vector<AttendanceRecord> ReportReader::list_events() {
    return list_events_on("");
}

std::vector<AttendanceRecord> ReportReader::list_events_on(const std::string& date) {
    std::vector<AttendanceRecord> records;
    error = db.list_attendance(records, date);
    if (error != AttendanceError::None) {
        spdlog::error("Error generating report: {}", to_string(error));
        records.clear();
    }
    return records;
}

std::optional<StaffRecord> ReportReader::get_staff_info(const std::string& name) {
    StaffRecord staff;
    error = db.get_staff_info(name, staff);
    if (error == AttendanceError::UnknownIdentity) {
        spdlog::warn("No staff member found with name {}", name);
        return std::nullopt;
    }
    if (error != AttendanceError::None) {
        spdlog::error("Error fetching staff info: {}", to_string(error));
        return std::nullopt;
    }
    return staff;
}

bool ReportReader::export_csv(const std::string& path,
                              const std::vector<AttendanceRecord>& events) {
    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("No se pudo crear {}", path);
        return false;
    }

    file << "name,timestamp,status\n";
    for (const auto& e : events) {
        file << csv_field(e.name) << ',' << csv_field(e.timestamp) << ','
             << csv_field(e.status) << '\n';
    }

    file.close();
    if (file.fail()) {
        spdlog::error("Error escribiendo {}", path);
        return false;
    }

    spdlog::info("✓ {} registros exportados a {}", events.size(), path);
    return true;
}
