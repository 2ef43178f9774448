// ============= include/detection/face_analyzer.hpp =============
#pragma once
#include "recognition/descriptor.hpp"
#include <opencv2/core.hpp>
#include <vector>

struct FaceDetection {
    cv::Rect box;
    float confidence;
    Descriptor descriptor;
};

// Detector + extractor de descriptores. Caja negra: imagen BGR -> cero o
// mas rostros, cada uno con su bounding box y su descriptor.
class FaceAnalyzer {
public:
    virtual ~FaceAnalyzer() = default;

    virtual std::vector<FaceDetection> analyze(const cv::Mat& image_bgr) = 0;

    std::vector<Descriptor> detect_descriptors(const cv::Mat& image_bgr);

    // Solo para anotar el frame, no participa en el matching
    std::vector<cv::Rect> detect_face_regions(const cv::Mat& image_bgr);
};
