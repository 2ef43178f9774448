#include "app_config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

// ==================== SIMPLE TOML ====================

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

bool SimpleToml::parse(const std::string& text) {
    std::istringstream stream(text);
    std::string line, section;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) val = val.substr(1, close - 1);
        } else {
            auto hash = val.find('#');
            if (hash != std::string::npos) val = trim(val.substr(0, hash));
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try { return std::stoi(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("config: {} no es un entero, usando {}", key, def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try { return std::stof(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("config: {} no es un numero, usando {}", key, def);
        return def;
    }
}

double SimpleToml::get_double(const std::string& key, double def) const {
    if (!has(key)) return def;
    try { return std::stod(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("config: {} no es un numero, usando {}", key, def);
        return def;
    }
}

// ==================== APP CONFIG ====================

bool apply_app_config(const SimpleToml& toml, AppConfig& config) {
    bool valid = true;

    config.db_path = toml.get("database.path", config.db_path);

    config.match_threshold = toml.get_double("recognition.threshold", config.match_threshold);
    if (config.match_threshold <= 0.0) {
        spdlog::error("config: recognition.threshold debe ser > 0");
        valid = false;
    }

    config.descriptor_dim = toml.get_int("recognition.descriptor_dim", config.descriptor_dim);
    if (config.descriptor_dim <= 0) {
        spdlog::error("config: recognition.descriptor_dim debe ser > 0");
        valid = false;
    }

    if (toml.has("enrollment.multi_face_policy") &&
        !parse_multi_face_policy(toml.get("enrollment.multi_face_policy"),
                                 config.multi_face_policy)) {
        spdlog::error("config: enrollment.multi_face_policy invalida: {}",
                      toml.get("enrollment.multi_face_policy"));
        valid = false;
    }

    if (toml.has("attendance.duplicate_policy") &&
        !parse_duplicate_policy(toml.get("attendance.duplicate_policy"),
                                config.duplicate_policy)) {
        spdlog::error("config: attendance.duplicate_policy invalida: {}",
                      toml.get("attendance.duplicate_policy"));
        valid = false;
    }

    config.analyzer.detector_model = toml.get("analyzer.detector_model", config.analyzer.detector_model);
    config.analyzer.recognizer_model = toml.get("analyzer.recognizer_model", config.analyzer.recognizer_model);
    config.analyzer.score_threshold = toml.get_float("analyzer.score_threshold", config.analyzer.score_threshold);
    config.analyzer.nms_threshold = toml.get_float("analyzer.nms_threshold", config.analyzer.nms_threshold);

    config.camera_index = toml.get_int("camera.index", config.camera_index);
    config.log_level = toml.get("log.level", config.log_level);
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
        spdlog::error("config: log.level invalido: {}", config.log_level);
        valid = false;
    }

    return valid;
}

bool load_app_config(const std::string& path, AppConfig& config) {
    SimpleToml toml;
    if (!toml.load(path)) {
        spdlog::error("No se pudo cargar {}", path);
        return false;
    }
    return apply_app_config(toml, config);
}
