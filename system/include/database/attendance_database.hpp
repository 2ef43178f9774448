// ============= include/database/attendance_database.hpp =============
/*
 * Attendance Database - SQLite Backend
 *
 * TABLA: staff
 * ├── id (INTEGER PRIMARY KEY AUTOINCREMENT)
 * ├── name (TEXT NOT NULL, UNIQUE via idx_staff_name)
 * ├── age (INTEGER)
 * ├── position (TEXT)
 * ├── image_path (TEXT)
 * └── face_encoding (BLOB) - 128 doubles little-endian
 *
 * TABLA: attendance
 * ├── id (INTEGER PRIMARY KEY AUTOINCREMENT)
 * ├── staff_id (INTEGER) -> staff.id
 * ├── date_time (TEXT) - "YYYY-MM-DD HH:MM:SS"
 * └── status (TEXT) - "Present"
 *
 * Cada INSERT corre en su propia transaccion. Todas las llamadas se
 * serializan con db_mutex, asi que varias sesiones pueden compartir
 * una instancia.
 *
 * Si la base no se pudo abrir, is_open() == false y cada operacion
 * devuelve AttendanceError::ConnectionError sin tocar nada.
 */

#pragma once
#include "core/attendance_error.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

struct StaffRecord {
    int id = -1;
    std::string name;
    int age = 0;
    std::string position;
    std::string image_path;
};

// Fila cruda para reconstruir la galeria. has_encoding == false si la
// columna es NULL.
struct DescriptorRow {
    int staff_id = -1;
    std::string name;
    bool has_encoding = false;
    std::vector<unsigned char> encoding;
};

struct AttendanceRecord {
    std::string name;
    std::string timestamp;
    std::string status;
};

class AttendanceDatabase {
public:
    explicit AttendanceDatabase(const std::string& db_path);
    ~AttendanceDatabase();

    AttendanceDatabase(const AttendanceDatabase&) = delete;
    AttendanceDatabase& operator=(const AttendanceDatabase&) = delete;

    bool is_open() const { return db != nullptr; }
    const std::string& get_path() const { return db_path; }

    // ===== STAFF =====

    // Inserta un miembro del personal. Comprueba la unicidad del nombre
    // dentro de la misma transaccion (DuplicateName).
    AttendanceError insert_staff(const StaffRecord& staff,
                                 const std::vector<unsigned char>& encoding,
                                 int& new_id);

    AttendanceError staff_name_exists(const std::string& name, bool& exists);

    // UnknownIdentity si no hay fila con ese nombre
    AttendanceError find_staff_id(const std::string& name, int& staff_id);

    AttendanceError get_staff_info(const std::string& name, StaffRecord& out);

    // Todas las filas en orden de id
    AttendanceError load_descriptor_rows(std::vector<DescriptorRow>& rows);

    // -1 si la base no esta abierta o la consulta falla
    int count_staff();

    // ===== ATTENDANCE =====

    AttendanceError insert_attendance(int staff_id,
                                      const std::string& date_time,
                                      const std::string& status);

    // Inserta solo si staff_id no tiene ya un evento con `status` en la
    // misma fecha (primeros 10 caracteres de date_time). Check + insert
    // en una sola transaccion BEGIN IMMEDIATE.
    AttendanceError insert_attendance_once_per_day(int staff_id,
                                                   const std::string& date_time,
                                                   const std::string& status,
                                                   bool& inserted);

    // Join attendance x staff en orden de attendance.id. Con `date`
    // no vacio ("YYYY-MM-DD") filtra por esa fecha.
    AttendanceError list_attendance(std::vector<AttendanceRecord>& records,
                                    const std::string& date = "");

    // staff_id < 0 cuenta todos los eventos; -1 si falla, como count_staff()
    int count_attendance(int staff_id = -1);

private:
    sqlite3* db;
    std::string db_path;
    mutable std::mutex db_mutex;

    bool init_database();
    bool create_tables();
    bool exec(const char* sql);
    void rollback();

    // Sin lock: llamadas desde metodos que ya tienen db_mutex
    AttendanceError name_exists_locked(const std::string& name, bool& exists);
    AttendanceError insert_attendance_locked(int staff_id,
                                             const std::string& date_time,
                                             const std::string& status);
};
