// ============= test/test_helpers.hpp =============
#pragma once
#include "detection/face_analyzer.hpp"
#include "recognition/descriptor.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>
#include <sqlite3.h>
#include <unistd.h>

namespace test_support {

// Directorio temporal borrado al salir del scope
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("asistencia_test_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }

private:
    std::filesystem::path path;
};

// Descriptor con todos los valores = base, salvo el primero = base + offset
inline Descriptor make_descriptor(double base, double offset = 0.0,
                                  int dim = DEFAULT_DESCRIPTOR_DIM) {
    Descriptor d(static_cast<size_t>(dim), base);
    d[0] += offset;
    return d;
}

inline std::vector<unsigned char> make_png_bytes(int width = 64, int height = 48) {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(40, 80, 120));
    cv::circle(image, cv::Point(width / 2, height / 2), height / 4, cv::Scalar(200, 200, 200), -1);
    std::vector<unsigned char> bytes;
    cv::imencode(".png", image, bytes);
    return bytes;
}

// Ejecuta SQL en una conexion aparte (triggers, filas corruptas, etc.)
inline bool exec_sql(const std::string& db_path, const std::string& sql) {
    sqlite3* db = nullptr;
    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    sqlite3_free(err);
    sqlite3_close(db);
    return rc == SQLITE_OK;
}

// Analyzer guionado: devuelve siempre los rostros configurados
class FakeFaceAnalyzer : public FaceAnalyzer {
public:
    std::vector<FaceDetection> faces;
    int calls = 0;

    void set_descriptors(const std::vector<Descriptor>& descriptors) {
        faces.clear();
        int x = 0;
        for (const auto& d : descriptors) {
            faces.push_back({cv::Rect(x, 0, 16, 16), 0.99f, d});
            x += 20;
        }
    }

    std::vector<FaceDetection> analyze(const cv::Mat&) override {
        calls++;
        return faces;
    }
};

} // namespace test_support
