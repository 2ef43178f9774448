#include "detection/face_analyzer.hpp"

std::vector<Descriptor> FaceAnalyzer::detect_descriptors(const cv::Mat& image_bgr) {
    std::vector<Descriptor> descriptors;
    for (auto& face : analyze(image_bgr)) {
        descriptors.push_back(std::move(face.descriptor));
    }
    return descriptors;
}

std::vector<cv::Rect> FaceAnalyzer::detect_face_regions(const cv::Mat& image_bgr) {
    std::vector<cv::Rect> regions;
    for (const auto& face : analyze(image_bgr)) {
        regions.push_back(face.box);
    }
    return regions;
}
