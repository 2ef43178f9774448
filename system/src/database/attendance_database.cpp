// ============= src/database/attendance_database.cpp =============
#include "database/attendance_database.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>
#include <utility>

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

AttendanceDatabase::AttendanceDatabase(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    spdlog::info("Inicializando Attendance Database");
    spdlog::info("   Path: {}", db_path);

    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::warn("No se pudo crear {}: {}", p.parent_path().string(), ec.message());
        }
    }

    if (!init_database()) {
        spdlog::error("Database connection not established ({})", db_path);
        return;
    }

    spdlog::info("✓ Database ready ({} staff, {} attendance records)",
                 count_staff(), count_attendance());
}

AttendanceDatabase::~AttendanceDatabase() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool AttendanceDatabase::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");

    if (!create_tables()) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

bool AttendanceDatabase::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS staff (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            age INTEGER,
            position TEXT,
            image_path TEXT,
            face_encoding BLOB
        );

        CREATE TABLE IF NOT EXISTS attendance (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            staff_id INTEGER REFERENCES staff(id),
            date_time TEXT NOT NULL,
            status TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_attendance_staff ON attendance(staff_id, date_time);
    )";

    if (!exec(sql)) return false;

    // Bases antiguas pueden tener nombres repetidos: en ese caso el indice
    // no se crea y la unicidad queda solo en insert_staff().
    if (!exec("CREATE UNIQUE INDEX IF NOT EXISTS idx_staff_name ON staff(name);")) {
        spdlog::warn("staff.name tiene duplicados, indice UNIQUE no creado");
    }
    return true;
}

bool AttendanceDatabase::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : sqlite3_errmsg(db));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

void AttendanceDatabase::rollback() {
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
}

// ==================== STAFF ====================

AttendanceError AttendanceDatabase::name_exists_locked(const std::string& name, bool& exists) {
    const char* sql = "SELECT 1 FROM staff WHERE name = ? LIMIT 1";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        spdlog::error("Failed to query staff: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    exists = (rc == SQLITE_ROW);
    return AttendanceError::None;
}

AttendanceError AttendanceDatabase::staff_name_exists(const std::string& name, bool& exists) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;
    return name_exists_locked(name, exists);
}

AttendanceError AttendanceDatabase::insert_staff(const StaffRecord& staff,
                                                 const std::vector<unsigned char>& encoding,
                                                 int& new_id)
{
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    if (!exec("BEGIN IMMEDIATE;")) return AttendanceError::PersistenceWriteError;

    bool exists = false;
    AttendanceError err = name_exists_locked(staff.name, exists);
    if (err != AttendanceError::None) {
        rollback();
        return err;
    }
    if (exists) {
        rollback();
        return AttendanceError::DuplicateName;
    }

    const char* sql = R"(
        INSERT INTO staff (name, age, position, image_path, face_encoding)
        VALUES (?, ?, ?, ?, ?)
    )";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        rollback();
        return AttendanceError::PersistenceWriteError;
    }

    sqlite3_bind_text(stmt, 1, staff.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, staff.age);
    sqlite3_bind_text(stmt, 3, staff.position.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, staff.image_path.c_str(), -1, SQLITE_TRANSIENT);
    if (encoding.empty()) {
        sqlite3_bind_null(stmt, 5);
    } else {
        sqlite3_bind_blob(stmt, 5, encoding.data(), static_cast<int>(encoding.size()),
                          SQLITE_TRANSIENT);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to insert staff: {}", sqlite3_errmsg(db));
        rollback();
        return AttendanceError::PersistenceWriteError;
    }

    int id = static_cast<int>(sqlite3_last_insert_rowid(db));

    if (!exec("COMMIT;")) {
        rollback();
        return AttendanceError::PersistenceWriteError;
    }

    new_id = id;
    spdlog::info("✓ Added staff: {} (ID={})", staff.name, id);
    return AttendanceError::None;
}

AttendanceError AttendanceDatabase::find_staff_id(const std::string& name, int& staff_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    const char* sql = "SELECT id FROM staff WHERE name = ? ORDER BY id LIMIT 1";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    AttendanceError result = AttendanceError::UnknownIdentity;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        staff_id = sqlite3_column_int(stmt, 0);
        result = AttendanceError::None;
    } else if (rc != SQLITE_DONE) {
        spdlog::error("Failed to query staff: {}", sqlite3_errmsg(db));
        result = AttendanceError::ConnectionError;
    }

    sqlite3_finalize(stmt);
    return result;
}

AttendanceError AttendanceDatabase::get_staff_info(const std::string& name, StaffRecord& out) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    const char* sql = R"(
        SELECT id, name, age, position, image_path
        FROM staff WHERE name = ? ORDER BY id LIMIT 1
    )";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Error fetching staff info: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    AttendanceError result = AttendanceError::UnknownIdentity;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out.id = sqlite3_column_int(stmt, 0);
        out.name = column_text(stmt, 1);
        out.age = sqlite3_column_int(stmt, 2);
        out.position = column_text(stmt, 3);
        out.image_path = column_text(stmt, 4);
        result = AttendanceError::None;
    } else if (rc != SQLITE_DONE) {
        spdlog::error("Error fetching staff info: {}", sqlite3_errmsg(db));
        result = AttendanceError::ConnectionError;
    }

    sqlite3_finalize(stmt);
    return result;
}

AttendanceError AttendanceDatabase::load_descriptor_rows(std::vector<DescriptorRow>& rows) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    const char* sql = "SELECT id, name, face_encoding FROM staff ORDER BY id";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    std::vector<DescriptorRow> loaded;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        DescriptorRow row;
        row.staff_id = sqlite3_column_int(stmt, 0);
        row.name = column_text(stmt, 1);

        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
            const unsigned char* blob = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, 2));
            int blob_size = sqlite3_column_bytes(stmt, 2);
            row.has_encoding = blob != nullptr && blob_size > 0;
            if (row.has_encoding) {
                row.encoding.assign(blob, blob + blob_size);
            }
        }

        loaded.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to read staff: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    rows = std::move(loaded);
    return AttendanceError::None;
}

int AttendanceDatabase::count_staff() {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return -1;

    const char* sql = "SELECT COUNT(*) FROM staff";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare count: {}", sqlite3_errmsg(db));
        return -1;
    }

    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

// ==================== ATTENDANCE ====================

AttendanceError AttendanceDatabase::insert_attendance_locked(int staff_id,
                                                             const std::string& date_time,
                                                             const std::string& status)
{
    const char* sql = "INSERT INTO attendance (staff_id, date_time, status) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return AttendanceError::PersistenceWriteError;
    }

    sqlite3_bind_int(stmt, 1, staff_id);
    sqlite3_bind_text(stmt, 2, date_time.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, status.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Error recording attendance: {}", sqlite3_errmsg(db));
        return AttendanceError::PersistenceWriteError;
    }
    return AttendanceError::None;
}

AttendanceError AttendanceDatabase::insert_attendance(int staff_id,
                                                      const std::string& date_time,
                                                      const std::string& status)
{
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    // Un solo INSERT en autocommit ya es atomico
    return insert_attendance_locked(staff_id, date_time, status);
}

AttendanceError AttendanceDatabase::insert_attendance_once_per_day(int staff_id,
                                                                   const std::string& date_time,
                                                                   const std::string& status,
                                                                   bool& inserted)
{
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    inserted = false;
    if (!exec("BEGIN IMMEDIATE;")) return AttendanceError::PersistenceWriteError;

    const char* sql = R"(
        SELECT 1 FROM attendance
        WHERE staff_id = ? AND status = ? AND substr(date_time, 1, 10) = ?
        LIMIT 1
    )";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        rollback();
        return AttendanceError::PersistenceWriteError;
    }

    std::string date = date_time.substr(0, 10);
    sqlite3_bind_int(stmt, 1, staff_id);
    sqlite3_bind_text(stmt, 2, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, date.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW) {
        rollback();
        return AttendanceError::None;
    }
    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to query attendance: {}", sqlite3_errmsg(db));
        rollback();
        return AttendanceError::PersistenceWriteError;
    }

    AttendanceError err = insert_attendance_locked(staff_id, date_time, status);
    if (err != AttendanceError::None) {
        rollback();
        return err;
    }

    if (!exec("COMMIT;")) {
        rollback();
        return AttendanceError::PersistenceWriteError;
    }

    inserted = true;
    return AttendanceError::None;
}

AttendanceError AttendanceDatabase::list_attendance(std::vector<AttendanceRecord>& records,
                                                    const std::string& date)
{
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return AttendanceError::ConnectionError;

    const char* sql = R"(
        SELECT staff.name, attendance.date_time, attendance.status
        FROM attendance
        JOIN staff ON staff.id = attendance.staff_id
        WHERE ?1 = '' OR substr(attendance.date_time, 1, 10) = ?1
        ORDER BY attendance.id
    )";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    sqlite3_bind_text(stmt, 1, date.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<AttendanceRecord> loaded;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        AttendanceRecord record;
        record.name = column_text(stmt, 0);
        record.timestamp = column_text(stmt, 1);
        record.status = column_text(stmt, 2);
        loaded.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to read attendance: {}", sqlite3_errmsg(db));
        return AttendanceError::ConnectionError;
    }

    records = std::move(loaded);
    return AttendanceError::None;
}

int AttendanceDatabase::count_attendance(int staff_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return -1;

    const char* sql = "SELECT COUNT(*) FROM attendance WHERE ?1 < 0 OR staff_id = ?1";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare count: {}", sqlite3_errmsg(db));
        return -1;
    }

    sqlite3_bind_int(stmt, 1, staff_id);

    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}
