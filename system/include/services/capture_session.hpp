// ============= include/services/capture_session.hpp =============
/*
 * Capture Session - un ciclo de "tomar asistencia"
 *
 * detectar -> descriptor por rostro -> identify() -> record() -> anotar
 *
 * - Toda la captura se compara contra un unico snapshot de la galeria
 * - Cada identidad reconocida se registra una sola vez por captura,
 *   aunque aparezca en varios rostros del mismo frame
 * - "Unknown" nunca llega al recorder
 */

#pragma once
#include "core/attendance_error.hpp"
#include "database/attendance_database.hpp"
#include "draw_utils.hpp"
#include "recognition/matcher.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

class AttendanceRecorder;
class DescriptorGallery;
class FaceAnalyzer;
class ReportReader;

struct FaceOutcome {
    cv::Rect box;
    MatchResult match;
    bool attendance_recorded = false;   // se inserto un evento nuevo
    bool already_recorded = false;      // OncePerDay: ya estaba hoy
    bool repeated_in_capture = false;   // mismo nombre en otro rostro del frame
    AttendanceError record_error = AttendanceError::None;
    std::optional<StaffRecord> staff;
};

struct CaptureReport {
    bool ok = false;
    AttendanceError error = AttendanceError::None;
    std::vector<FaceOutcome> faces;

    size_t recognized_count() const;
};

class CaptureSession {
public:
    CaptureSession(FaceAnalyzer& analyzer,
                   const DescriptorGallery& gallery,
                   const FaceMatcher& matcher,
                   AttendanceRecorder& recorder,
                   ReportReader& reports,
                   const DrawUtils::DrawConfig& draw_config = DrawUtils::DrawConfig());

    // Anota `frame` en sitio si annotate == true
    CaptureReport process_frame(cv::Mat& frame, bool annotate = true);

    // Decodifica y procesa; `annotated` recibe el frame dibujado
    CaptureReport process_image_bytes(const std::vector<unsigned char>& bytes,
                                      cv::Mat& annotated);

private:
    FaceAnalyzer& analyzer;
    const DescriptorGallery& gallery;
    const FaceMatcher& matcher;
    AttendanceRecorder& recorder;
    ReportReader& reports;
    DrawUtils::DrawConfig draw_config;
};
