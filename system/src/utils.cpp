#include "utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <thread>

// ==================== FILES / IMAGES ====================

bool read_file_bytes(const std::string& path, std::vector<unsigned char>& bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("No se pudo abrir {}", path);
        return false;
    }

    bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

cv::Mat decode_image(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) return cv::Mat();
    return cv::imdecode(bytes, cv::IMREAD_COLOR);
}

// ==================== TIMESTAMPS ====================

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// ==================== CAMERA ====================

cv::VideoCapture open_camera(int index, int retries) {
    cv::VideoCapture cap;

    spdlog::info("intentando abrir camara {}...", index);

    for (int i = 0; i < retries; ++i) {
        spdlog::info("intento {}/{}...", i + 1, retries);

        if (cap.open(index) && cap.isOpened()) {
            spdlog::info("✓ camara abierta");
            spdlog::info("  resolución: {}x{}",
                         static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                         static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
            return cap;
        }

        cap.release();
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
    }

    spdlog::error("no se pudo abrir la camara {} tras {} intentos", index, retries);
    return cap;
}

bool grab_frame(cv::VideoCapture& cap, cv::Mat& frame, int warmup) {
    if (!cap.isOpened()) return false;

    for (int i = 0; i < warmup; ++i) {
        cap.grab();
    }

    if (!cap.read(frame) || frame.empty()) {
        spdlog::warn("camara abierta pero no puede leer frames");
        return false;
    }
    return true;
}
