#pragma once
#include <opencv2/imgproc.hpp>
#include <string>

namespace DrawUtils {

    struct DrawConfig {
        cv::Scalar box_color = cv::Scalar(0, 0, 255);
        cv::Scalar text_color = cv::Scalar(255, 255, 255);
        cv::Scalar banner_color = cv::Scalar(0, 0, 0);
        int font = cv::FONT_HERSHEY_DUPLEX;
        double font_scale = 1.0;
        int thickness = 1;
        int box_thickness = 2;
        int label_height = 35;
        int label_padding = 6;
        int margin_x = 10;
        int margin_y = 30;
    };

    // Caja alrededor del rostro + barra rellena abajo con el nombre
    void draw_face_label(cv::Mat& frame, const cv::Rect& box, const std::string& label,
                         const DrawConfig& config = DrawConfig());

    // Resumen de la captura arriba a la izquierda
    void draw_capture_summary(cv::Mat& frame, size_t faces, size_t recognized,
                              const DrawConfig& config = DrawConfig());

    void draw_text_with_background(cv::Mat& frame, const std::string& text,
                                   const cv::Point& position,
                                   const cv::Scalar& text_color,
                                   const cv::Scalar& bg_color,
                                   const DrawConfig& config = DrawConfig());
}
