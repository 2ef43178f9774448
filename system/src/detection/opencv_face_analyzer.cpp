// ============= src/detection/opencv_face_analyzer.cpp =============
#include "detection/opencv_face_analyzer.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace {

void check_model_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Model not found: " + path);
    }
    if (std::filesystem::file_size(path) == 0) {
        throw std::runtime_error("Model file is empty: " + path);
    }
}

} // namespace

OpenCvFaceAnalyzer::OpenCvFaceAnalyzer(const Options& options)
    : options(options), input_size(320, 320)
{
    spdlog::info("Inicializando OpenCV Face Analyzer");
    spdlog::info("   Detector: {}", options.detector_model);
    spdlog::info("   Recognizer: {}", options.recognizer_model);
    spdlog::info("   Score threshold: {:.2f}", options.score_threshold);

    check_model_file(options.detector_model);
    check_model_file(options.recognizer_model);

    detector = cv::FaceDetectorYN::create(options.detector_model, "", input_size,
                                          options.score_threshold,
                                          options.nms_threshold,
                                          options.top_k);
    if (!detector) {
        throw std::runtime_error("FaceDetectorYN::create failed");
    }

    recognizer = cv::FaceRecognizerSF::create(options.recognizer_model, "");
    if (!recognizer) {
        throw std::runtime_error("FaceRecognizerSF::create failed");
    }

    spdlog::info("✓ Face analyzer ready");
}

void OpenCvFaceAnalyzer::ensure_input_size(const cv::Size& frame_size) {
    if (frame_size != input_size) {
        input_size = frame_size;
        detector->setInputSize(input_size);
        spdlog::debug("YuNet input size -> {}x{}", input_size.width, input_size.height);
    }
}

std::vector<FaceDetection> OpenCvFaceAnalyzer::analyze(const cv::Mat& image_bgr) {
    std::vector<FaceDetection> detections;
    if (image_bgr.empty()) return detections;

    cv::Mat frame = image_bgr;
    if (frame.channels() == 1) {
        cv::cvtColor(image_bgr, frame, cv::COLOR_GRAY2BGR);
    } else if (frame.channels() == 4) {
        cv::cvtColor(image_bgr, frame, cv::COLOR_BGRA2BGR);
    }

    ensure_input_size(frame.size());

    cv::Mat faces;
    detector->detect(frame, faces);
    if (faces.empty()) return detections;

    const cv::Rect bounds(0, 0, frame.cols, frame.rows);

    for (int i = 0; i < faces.rows; ++i) {
        float score = faces.at<float>(i, 4);
        if (score < options.score_threshold) continue;

        cv::Rect box(static_cast<int>(faces.at<float>(i, 0)),
                     static_cast<int>(faces.at<float>(i, 1)),
                     static_cast<int>(faces.at<float>(i, 2)),
                     static_cast<int>(faces.at<float>(i, 3)));
        box &= bounds;
        if (box.area() <= 0) continue;

        cv::Mat aligned;
        recognizer->alignCrop(frame, faces.row(i), aligned);

        cv::Mat feature;
        recognizer->feature(aligned, feature);

        cv::Mat normalized;
        cv::normalize(feature.reshape(1, 1), normalized);

        FaceDetection detection;
        detection.box = box;
        detection.confidence = score;
        normalized.convertTo(normalized, CV_64F);
        detection.descriptor.assign(normalized.ptr<double>(0),
                                    normalized.ptr<double>(0) + normalized.cols);
        detections.push_back(std::move(detection));
    }

    spdlog::debug("Faces detected: {}", detections.size());
    return detections;
}
