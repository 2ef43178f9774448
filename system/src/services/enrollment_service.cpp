// ============= src/services/enrollment_service.cpp =============
#include "services/enrollment_service.hpp"
#include "config.hpp"
#include "database/attendance_database.hpp"
#include "detection/face_analyzer.hpp"
#include "recognition/descriptor_gallery.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

bool parse_multi_face_policy(const std::string& text, MultiFacePolicy& policy) {
    if (text == "take_first") {
        policy = MultiFacePolicy::TakeFirst;
        return true;
    }
    if (text == "reject") {
        policy = MultiFacePolicy::Reject;
        return true;
    }
    return false;
}

const char* to_string(MultiFacePolicy policy) {
    return policy == MultiFacePolicy::Reject ? "reject" : "take_first";
}

EnrollmentService::EnrollmentService(AttendanceDatabase& db,
                                     DescriptorGallery& gallery,
                                     FaceAnalyzer& analyzer,
                                     MultiFacePolicy policy)
    : db(db), gallery(gallery), analyzer(analyzer), policy(policy)
{
}

EnrollResult EnrollmentService::fail(EnrollResult result, AttendanceError error,
                                     const std::string& message) {
    result.ok = false;
    result.error = error;
    result.message = message;
    spdlog::error("{} [{}]", message, to_string(error));
    return result;
}

// ==================== VALIDATION ====================

EnrollResult EnrollmentService::check_profile(const StaffProfile& profile) {
    EnrollResult result;

    if (!db.is_open()) {
        return fail(result, AttendanceError::ConnectionError,
                    "Database connection not established.");
    }

    if (profile.name.empty() || profile.position.empty() ||
        profile.age < Config::MIN_STAFF_AGE || profile.age > Config::MAX_STAFF_AGE) {
        return fail(result, AttendanceError::InvalidProfile,
                    "Please fill all fields (age " + std::to_string(Config::MIN_STAFF_AGE) +
                    "-" + std::to_string(Config::MAX_STAFF_AGE) + ").");
    }

    // El nombre reservado es la respuesta "no reconocido" del matcher
    if (profile.name == Config::UNKNOWN_NAME) {
        return fail(result, AttendanceError::InvalidProfile,
                    "Name " + profile.name + " is reserved");
    }

    bool exists = false;
    AttendanceError err = db.staff_name_exists(profile.name, exists);
    if (err != AttendanceError::None) {
        return fail(result, err, "Error checking staff " + profile.name);
    }
    if (exists) {
        return fail(result, AttendanceError::DuplicateName,
                    "Staff " + profile.name + " already exists");
    }

    result.ok = true;
    return result;
}

// ==================== ADD IDENTITY ====================

EnrollResult EnrollmentService::add_identity(const StaffProfile& profile,
                                             const std::vector<unsigned char>& image_bytes) {
    EnrollResult checked = check_profile(profile);
    if (!checked.ok) return checked;

    cv::Mat image = decode_image(image_bytes);
    if (image.empty()) {
        return fail(EnrollResult(), AttendanceError::InvalidImage,
                    "Cannot decode image for " + profile.name);
    }

    return enroll(profile, image);
}

EnrollResult EnrollmentService::add_identity(const StaffProfile& profile,
                                             const cv::Mat& image_bgr) {
    EnrollResult checked = check_profile(profile);
    if (!checked.ok) return checked;

    return enroll(profile, image_bgr);
}

EnrollResult EnrollmentService::enroll(const StaffProfile& profile, const cv::Mat& image_bgr) {
    EnrollResult result;

    if (image_bgr.empty()) {
        return fail(result, AttendanceError::InvalidImage,
                    "Empty image for " + profile.name);
    }

    std::vector<Descriptor> descriptors = analyzer.detect_descriptors(image_bgr);
    result.faces_found = descriptors.size();

    if (descriptors.empty()) {
        return fail(result, AttendanceError::NoFaceDetected,
                    "No face detected in the image for " + profile.name +
                    ". Please upload a clear image.");
    }

    if (descriptors.size() > 1) {
        if (policy == MultiFacePolicy::Reject) {
            return fail(result, AttendanceError::AmbiguousFace,
                        std::to_string(descriptors.size()) + " faces in the image for " +
                        profile.name + ". Please upload an image with one face.");
        }
        spdlog::warn("{} faces in the image for {}, using the first one",
                     descriptors.size(), profile.name);
    }

    const Descriptor& descriptor = descriptors.front();
    if (!is_valid_descriptor(descriptor, gallery.get_descriptor_dim())) {
        return fail(result, AttendanceError::MalformedDescriptor,
                    "Descriptor for " + profile.name + " has " +
                    std::to_string(descriptor.size()) + " values (expected " +
                    std::to_string(gallery.get_descriptor_dim()) + ")");
    }

    int staff_id = -1;
    AttendanceError err = db.insert_staff({-1, profile.name, profile.age,
                                           profile.position, profile.image_path},
                                          serialize_descriptor(descriptor), staff_id);
    if (err != AttendanceError::None) {
        return fail(result, err, "Error adding staff " + profile.name);
    }

    GalleryLoadResult reload = gallery.load(db);
    if (!reload.ok) {
        // Ya persistido: la proxima recarga lo incluira
        spdlog::warn("Staff {} saved but gallery reload failed: {}",
                     profile.name, to_string(reload.error));
    }

    result.ok = true;
    result.error = AttendanceError::None;
    result.staff_id = staff_id;
    result.message = "Staff " + profile.name + " added successfully";
    spdlog::info("{}", result.message);
    return result;
}
