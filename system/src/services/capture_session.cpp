#include "services/capture_session.hpp"
#include "detection/face_analyzer.hpp"
#include "recognition/descriptor_gallery.hpp"
#include "services/attendance_recorder.hpp"
#include "services/report_reader.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <set>

size_t CaptureReport::recognized_count() const {
    size_t count = 0;
    for (const auto& face : faces) {
        if (face.match.recognized) count++;
    }
    return count;
}

CaptureSession::CaptureSession(FaceAnalyzer& analyzer,
                               const DescriptorGallery& gallery,
                               const FaceMatcher& matcher,
                               AttendanceRecorder& recorder,
                               ReportReader& reports,
                               const DrawUtils::DrawConfig& draw_config)
    : analyzer(analyzer), gallery(gallery), matcher(matcher),
      recorder(recorder), reports(reports), draw_config(draw_config)
{
}

CaptureReport CaptureSession::process_frame(cv::Mat& frame, bool annotate) {
    CaptureReport report;

    if (frame.empty()) {
        report.error = AttendanceError::InvalidImage;
        spdlog::error("Empty frame");
        return report;
    }

    std::vector<FaceDetection> detections = analyzer.analyze(frame);
    GallerySnapshot snapshot = gallery.all();
    std::set<std::string> recorded_names;

    spdlog::debug("Capture: {} faces, gallery {}", detections.size(), snapshot->size());

    for (const auto& detection : detections) {
        FaceOutcome outcome;
        outcome.box = detection.box;
        outcome.match = matcher.identify(detection.descriptor, *snapshot);

        if (outcome.match.recognized) {
            const std::string& name = outcome.match.name;

            if (!recorded_names.insert(name).second) {
                outcome.repeated_in_capture = true;
            } else {
                RecordResult recorded = recorder.record(name);
                outcome.record_error = recorded.error;
                outcome.attendance_recorded = recorded.ok && !recorded.already_recorded;
                outcome.already_recorded = recorded.already_recorded;
            }

            outcome.staff = reports.get_staff_info(name);
        }

        if (annotate) {
            DrawUtils::draw_face_label(frame, outcome.box, outcome.match.name, draw_config);
        }

        report.faces.push_back(std::move(outcome));
    }

    if (annotate) {
        DrawUtils::draw_capture_summary(frame, report.faces.size(),
                                        report.recognized_count(), draw_config);
    }

    report.ok = true;
    return report;
}

CaptureReport CaptureSession::process_image_bytes(const std::vector<unsigned char>& bytes,
                                                  cv::Mat& annotated) {
    annotated = decode_image(bytes);
    if (annotated.empty()) {
        CaptureReport report;
        report.error = AttendanceError::InvalidImage;
        spdlog::error("Cannot decode captured image ({} bytes)", bytes.size());
        return report;
    }
    return process_frame(annotated, true);
}
