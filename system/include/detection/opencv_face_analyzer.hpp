// ============= include/detection/opencv_face_analyzer.hpp =============
/*
 * OpenCV Face Analyzer - YuNet + SFace (modulo objdetect)
 *
 * DETECCION: cv::FaceDetectorYN
 * - salida Nx15: [x y w h score l0x l0y ... l4x l4y]
 * - el input size debe coincidir con el frame; se ajusta en cada cambio
 *
 * DESCRIPTOR: cv::FaceRecognizerSF
 * - alignCrop() con los 5 landmarks -> 112x112
 * - feature() -> 1x128 CV_32F, normalizado L2 y pasado a double
 *
 * Con descriptores normalizados el umbral euclidiano tipico de SFace es
 * ~1.128 (recognition.threshold en config.toml).
 */

#pragma once
#include "detection/face_analyzer.hpp"
#include "config.hpp"
#include <opencv2/objdetect/face.hpp>
#include <string>

class OpenCvFaceAnalyzer : public FaceAnalyzer {
public:
    struct Options {
        std::string detector_model = Config::DEFAULT_DETECTOR_MODEL;
        std::string recognizer_model = Config::DEFAULT_RECOGNIZER_MODEL;
        float score_threshold = Config::DEFAULT_SCORE_THRESHOLD;
        float nms_threshold = Config::DEFAULT_NMS_THRESHOLD;
        int top_k = Config::DEFAULT_TOP_K;
    };

    // Lanza std::runtime_error si algun modelo no existe o no carga
    explicit OpenCvFaceAnalyzer(const Options& options);

    std::vector<FaceDetection> analyze(const cv::Mat& image_bgr) override;

private:
    Options options;
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    cv::Size input_size;

    void ensure_input_size(const cv::Size& frame_size);
};
