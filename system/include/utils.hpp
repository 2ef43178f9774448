// ============= include/utils.hpp =============
#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <chrono>
#include <string>
#include <vector>

// Lee un archivo completo (imagen subida, etc.)
bool read_file_bytes(const std::string& path, std::vector<unsigned char>& bytes);

// cv::imdecode en color; Mat vacio si los bytes no son una imagen
cv::Mat decode_image(const std::vector<unsigned char>& bytes);

// "YYYY-MM-DD HH:MM:SS" en hora local
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// Abrir camara local con reintentos
cv::VideoCapture open_camera(int index, int retries = 5);

// Lee un frame descartando los primeros `warmup` (exposicion automatica)
bool grab_frame(cv::VideoCapture& cap, cv::Mat& frame, int warmup = 5);
