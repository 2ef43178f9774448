// ============= include/app_config.hpp =============
/*
 * config.toml -> AppConfig
 *
 *   [database]    path
 *   [recognition] threshold, descriptor_dim
 *   [enrollment]  multi_face_policy = "take_first" | "reject"
 *   [attendance]  duplicate_policy = "every_recognition" | "once_per_day"
 *   [analyzer]    detector_model, recognizer_model, score_threshold, nms_threshold
 *   [camera]      index
 *   [log]         level = "trace" | "debug" | "info" | "warn" | "error"
 */

#pragma once
#include "config.hpp"
#include "detection/opencv_face_analyzer.hpp"
#include "recognition/descriptor.hpp"
#include "services/attendance_recorder.hpp"
#include "services/enrollment_service.hpp"
#include <map>
#include <string>

// Subconjunto de TOML: [seccion], clave = valor, comentarios con '#'.
// Las claves quedan como "seccion.clave".
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    bool parse(const std::string& text);

    bool has(const std::string& key) const { return values.count(key) > 0; }
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    double get_double(const std::string& key, double def = 0.0) const;
};

struct AppConfig {
    std::string db_path = Config::DEFAULT_DB_PATH;
    double match_threshold = Config::DEFAULT_MATCH_THRESHOLD;
    int descriptor_dim = DEFAULT_DESCRIPTOR_DIM;
    MultiFacePolicy multi_face_policy = MultiFacePolicy::TakeFirst;
    DuplicatePolicy duplicate_policy = DuplicatePolicy::EveryRecognition;
    OpenCvFaceAnalyzer::Options analyzer;
    int camera_index = Config::DEFAULT_CAMERA_INDEX;
    std::string log_level = "info";
};

// false si el archivo no se puede leer o algun valor es invalido
// (se loguea cual). Las claves ausentes mantienen el valor por defecto.
bool load_app_config(const std::string& path, AppConfig& config);
bool apply_app_config(const SimpleToml& toml, AppConfig& config);
