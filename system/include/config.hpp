#pragma once

namespace Config {

    // Database
    constexpr const char* DEFAULT_DB_PATH = "attendance.db";

    // Recognition
    constexpr double DEFAULT_MATCH_THRESHOLD = 0.6;
    constexpr const char* UNKNOWN_NAME = "Unknown";

    // Enrollment (limites del formulario original)
    constexpr int MIN_STAFF_AGE = 18;
    constexpr int MAX_STAFF_AGE = 100;

    // Attendance
    constexpr const char* STATUS_PRESENT = "Present";

    // Analyzer (YuNet + SFace)
    constexpr const char* DEFAULT_DETECTOR_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* DEFAULT_RECOGNIZER_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr float DEFAULT_SCORE_THRESHOLD = 0.9f;
    constexpr float DEFAULT_NMS_THRESHOLD = 0.3f;
    constexpr int DEFAULT_TOP_K = 5000;

    // Camera
    constexpr int DEFAULT_CAMERA_INDEX = 0;
    constexpr int CAMERA_RETRIES = 5;
    constexpr int CAMERA_WARMUP_FRAMES = 5;
}
