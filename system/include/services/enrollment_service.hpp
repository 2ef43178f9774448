// ============= include/services/enrollment_service.hpp =============
/*
 * Enrollment Service - alta de personal
 *
 * FLUJO add_identity():
 * 1. base abierta?                    -> ConnectionError
 * 2. perfil valido (nombre no reservado, edad 18-100, cargo) -> InvalidProfile
 * 3. nombre no registrado             -> DuplicateName
 * 4. decodificar imagen               -> InvalidImage
 * 5. detect_descriptors()
 *    - 0 rostros                      -> NoFaceDetected
 *    - >1 rostros: TakeFirst usa el primero, Reject -> AmbiguousFace
 * 6. dimension / valores finitos      -> MalformedDescriptor
 * 7. INSERT en staff                  -> PersistenceWriteError
 * 8. recarga sincrona de la galeria
 *
 * Un fallo en 1-7 no persiste nada y no recarga la galeria.
 */

#pragma once
#include "core/attendance_error.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

class AttendanceDatabase;
class DescriptorGallery;
class FaceAnalyzer;

struct StaffProfile {
    std::string name;
    int age = 0;
    std::string position;
    std::string image_path;
};

enum class MultiFacePolicy {
    TakeFirst,
    Reject
};

bool parse_multi_face_policy(const std::string& text, MultiFacePolicy& policy);
const char* to_string(MultiFacePolicy policy);

struct EnrollResult {
    bool ok = false;
    AttendanceError error = AttendanceError::None;
    int staff_id = -1;
    size_t faces_found = 0;
    std::string message;
};

class EnrollmentService {
public:
    EnrollmentService(AttendanceDatabase& db,
                      DescriptorGallery& gallery,
                      FaceAnalyzer& analyzer,
                      MultiFacePolicy policy = MultiFacePolicy::TakeFirst);

    EnrollResult add_identity(const StaffProfile& profile,
                              const std::vector<unsigned char>& image_bytes);

    EnrollResult add_identity(const StaffProfile& profile, const cv::Mat& image_bgr);

    MultiFacePolicy get_policy() const { return policy; }

private:
    AttendanceDatabase& db;
    DescriptorGallery& gallery;
    FaceAnalyzer& analyzer;
    MultiFacePolicy policy;

    EnrollResult check_profile(const StaffProfile& profile);
    EnrollResult enroll(const StaffProfile& profile, const cv::Mat& image_bgr);
    EnrollResult fail(EnrollResult result, AttendanceError error, const std::string& message);
};
