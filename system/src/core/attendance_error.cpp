#include "core/attendance_error.hpp"

const char* to_string(AttendanceError error) {
    switch (error) {
        case AttendanceError::None:                  return "None";
        case AttendanceError::ConnectionError:       return "ConnectionError";
        case AttendanceError::NoFaceDetected:        return "NoFaceDetected";
        case AttendanceError::AmbiguousFace:         return "AmbiguousFace";
        case AttendanceError::InvalidImage:          return "InvalidImage";
        case AttendanceError::InvalidProfile:        return "InvalidProfile";
        case AttendanceError::DuplicateName:         return "DuplicateName";
        case AttendanceError::MalformedDescriptor:   return "MalformedDescriptor";
        case AttendanceError::UnknownIdentity:       return "UnknownIdentity";
        case AttendanceError::PersistenceWriteError: return "PersistenceWriteError";
    }
    return "Unknown";
}
