// ============= include/core/attendance_error.hpp =============
#pragma once
#include <string>

// Resultado de cada operacion en el borde de un componente.
// None = exito.
enum class AttendanceError {
    None,
    ConnectionError,        // base de datos no disponible
    NoFaceDetected,         // imagen de registro sin descriptor
    AmbiguousFace,          // mas de un rostro con politica "reject"
    InvalidImage,           // bytes que no se pueden decodificar
    InvalidProfile,         // nombre/edad/cargo fuera de rango
    DuplicateName,          // nombre ya registrado
    MalformedDescriptor,    // dimension incorrecta o valores no finitos
    UnknownIdentity,        // nombre sin fila en staff
    PersistenceWriteError   // INSERT / COMMIT fallido
};

const char* to_string(AttendanceError error);
