#include "draw_utils.hpp"

namespace DrawUtils {

void draw_face_label(cv::Mat& frame, const cv::Rect& box, const std::string& label,
                     const DrawConfig& config) {
    if (frame.empty()) return;

    cv::rectangle(frame, box, config.box_color, config.box_thickness);

    int bottom = box.y + box.height;
    cv::rectangle(frame,
                  cv::Point(box.x, bottom - config.label_height),
                  cv::Point(box.x + box.width, bottom),
                  config.box_color, cv::FILLED);

    cv::putText(frame, label,
                cv::Point(box.x + config.label_padding, bottom - config.label_padding),
                config.font, config.font_scale, config.text_color, config.thickness);
}

void draw_capture_summary(cv::Mat& frame, size_t faces, size_t recognized,
                          const DrawConfig& config) {
    if (frame.empty()) return;

    DrawConfig small = config;
    small.font = cv::FONT_HERSHEY_SIMPLEX;
    small.font_scale = 0.6;

    std::string text = "faces: " + std::to_string(faces) +
                       "  present: " + std::to_string(recognized);
    draw_text_with_background(frame, text, cv::Point(config.margin_x, config.margin_y),
                              config.text_color, config.banner_color, small);
}

void draw_text_with_background(cv::Mat& frame, const std::string& text,
                               const cv::Point& position,
                               const cv::Scalar& text_color,
                               const cv::Scalar& bg_color,
                               const DrawConfig& config) {
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(text, config.font, config.font_scale,
                                         config.thickness, &baseline);

    cv::rectangle(frame,
                 cv::Point(position.x - 2, position.y - text_size.height - 2),
                 cv::Point(position.x + text_size.width + 2, position.y + baseline + 2),
                 bg_color, -1);

    cv::putText(frame, text, position,
               config.font, config.font_scale, text_color, config.thickness);
}

}
