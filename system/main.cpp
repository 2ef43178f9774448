// ============= main.cpp - ASISTENCIA POR RECONOCIMIENTO FACIAL =============
/*
 * USO:
 *   asistencia [--config config.toml] enroll --name N --age A --position P --image foto.jpg
 *   asistencia [--config config.toml] take (--image foto.jpg | --camera [N]) [--out anotada.jpg] [--show]
 *   asistencia [--config config.toml] report [--date YYYY-MM-DD] [--csv salida.csv]
 *   asistencia [--config config.toml] info <nombre>
 */

#include "app_config.hpp"
#include "database/attendance_database.hpp"
#include "detection/opencv_face_analyzer.hpp"
#include "recognition/descriptor_gallery.hpp"
#include "recognition/matcher.hpp"
#include "services/attendance_recorder.hpp"
#include "services/capture_session.hpp"
#include "services/enrollment_service.hpp"
#include "services/report_reader.hpp"
#include "utils.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>


namespace {

struct CliArgs {
    std::string config_file = "config.toml";
    bool config_given = false;
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::map<std::string, bool> flags;
};

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [--config F] enroll --name N --age A --position P --image IMG\n"
              << "  " << prog << " [--config F] take (--image IMG | --camera [N]) [--out IMG] [--show]\n"
              << "  " << prog << " [--config F] report [--date YYYY-MM-DD] [--csv FILE]\n"
              << "  " << prog << " [--config F] info NAME\n";
}

bool parse_args(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config") {
            if (i + 1 >= argc) return false;
            args.config_file = argv[++i];
            args.config_given = true;
        } else if (arg == "--show") {
            args.flags["show"] = true;
        } else if (arg == "--camera") {
            args.flags["camera"] = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args.options["camera"] = argv[++i];
            }
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) return false;
            args.options[arg.substr(2)] = argv[++i];
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return !args.command.empty();
}

std::string option(const CliArgs& args, const std::string& key, const std::string& def = "") {
    auto it = args.options.find(key);
    return it != args.options.end() ? it->second : def;
}

void print_staff(const StaffRecord& staff) {
    std::cout << "Name:     " << staff.name << "\n"
              << "Age:      " << staff.age << "\n"
              << "Position: " << staff.position << "\n"
              << "Image:    " << staff.image_path << "\n";
}

// ==================== COMMANDS ====================

int cmd_enroll(const CliArgs& args, const AppConfig& config,
               AttendanceDatabase& db, DescriptorGallery& gallery) {
    std::string name = option(args, "name");
    std::string position = option(args, "position");
    std::string image_path = option(args, "image");
    std::string age_text = option(args, "age");

    if (name.empty() || position.empty() || image_path.empty() || age_text.empty()) {
        spdlog::warn("Please fill all fields and upload an image.");
        return 1;
    }

    int age = 0;
    try {
        age = std::stoi(age_text);
    } catch (const std::exception&) {
        spdlog::error("Edad invalida: {}", age_text);
        return 1;
    }

    std::vector<unsigned char> bytes;
    if (!read_file_bytes(image_path, bytes)) return 1;

    OpenCvFaceAnalyzer analyzer(config.analyzer);
    EnrollmentService enrollment(db, gallery, analyzer, config.multi_face_policy);

    StaffProfile profile;
    profile.name = name;
    profile.age = age;
    profile.position = position;
    profile.image_path = std::filesystem::path(image_path).filename().string();

    EnrollResult result = enrollment.add_identity(profile, bytes);
    if (!result.ok) {
        std::cerr << result.message << "\n";
        return 1;
    }

    std::cout << result.message << " (ID=" << result.staff_id << ")\n";
    return 0;
}

int cmd_take(const CliArgs& args, const AppConfig& config,
             AttendanceDatabase& db, DescriptorGallery& gallery) {
    cv::Mat frame;

    if (args.flags.count("camera")) {
        int index = config.camera_index;
        if (args.options.count("camera")) {
            try {
                index = std::stoi(option(args, "camera"));
            } catch (const std::exception&) {
                spdlog::error("Indice de camara invalido: {}", option(args, "camera"));
                return 1;
            }
        }
        cv::VideoCapture cap = open_camera(index, Config::CAMERA_RETRIES);
        if (!grab_frame(cap, frame, Config::CAMERA_WARMUP_FRAMES)) return 1;
    } else {
        std::string image_path = option(args, "image");
        if (image_path.empty()) {
            spdlog::error("take necesita --image o --camera");
            return 1;
        }
        std::vector<unsigned char> bytes;
        if (!read_file_bytes(image_path, bytes)) return 1;
        frame = decode_image(bytes);
        if (frame.empty()) {
            spdlog::error("No se pudo decodificar {}", image_path);
            return 1;
        }
    }

    OpenCvFaceAnalyzer analyzer(config.analyzer);
    FaceMatcher matcher(config.match_threshold);
    AttendanceRecorder recorder(db, config.duplicate_policy);
    ReportReader reports(db);
    CaptureSession session(analyzer, gallery, matcher, recorder, reports);

    CaptureReport report = session.process_frame(frame, true);
    if (!report.ok) {
        spdlog::error("Capture failed: {}", to_string(report.error));
        return 1;
    }

    std::cout << "Faces: " << report.faces.size()
              << "  recognized: " << report.recognized_count() << "\n";

    int failures = 0;
    for (const auto& face : report.faces) {
        std::cout << "\n" << face.match.name;
        if (face.match.index >= 0) {
            std::cout << std::fixed << std::setprecision(3)
                      << "  (distance " << face.match.distance << ")";
        }
        std::cout << "\n";

        if (!face.match.recognized) continue;

        if (face.record_error != AttendanceError::None) {
            std::cout << "  attendance: ERROR " << to_string(face.record_error) << "\n";
            failures++;
        } else if (face.already_recorded) {
            std::cout << "  attendance: already recorded today\n";
        } else if (face.repeated_in_capture) {
            std::cout << "  attendance: same person twice in frame, recorded once\n";
        } else {
            std::cout << "  Status: Present\n";
        }

        if (face.staff) print_staff(*face.staff);
    }

    std::string out_path = option(args, "out");
    if (!out_path.empty()) {
        if (cv::imwrite(out_path, frame)) {
            spdlog::info("Imagen anotada: {}", out_path);
        } else {
            spdlog::error("No se pudo guardar {}", out_path);
            failures++;
        }
    }

    if (args.flags.count("show")) {
        cv::imshow("Attendance", frame);
        cv::waitKey(0);
        cv::destroyAllWindows();
    }

    return failures == 0 ? 0 : 1;
}

int cmd_report(const CliArgs& args, AttendanceDatabase& db) {
    ReportReader reports(db);

    std::string date = option(args, "date");
    std::vector<AttendanceRecord> events = date.empty() ? reports.list_events()
                                                        : reports.list_events_on(date);
    if (reports.last_error() != AttendanceError::None) return 1;

    std::string csv = option(args, "csv");
    if (!csv.empty()) {
        return reports.export_csv(csv, events) ? 0 : 1;
    }

    if (events.empty()) {
        std::cout << "No attendance records found.\n";
        return 0;
    }

    std::cout << std::left << std::setw(24) << "NAME"
              << std::setw(22) << "DATE_TIME" << "STATUS\n";
    for (const auto& e : events) {
        std::cout << std::left << std::setw(24) << e.name
                  << std::setw(22) << e.timestamp << e.status << "\n";
    }
    std::cout << events.size() << " records\n";
    return 0;
}

int cmd_info(const CliArgs& args, AttendanceDatabase& db) {
    if (args.positional.empty()) {
        spdlog::error("info necesita un nombre");
        return 1;
    }

    ReportReader reports(db);
    auto staff = reports.get_staff_info(args.positional.front());
    if (!staff) return 1;

    print_staff(*staff);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    CliArgs args;
    if (!parse_args(argc, argv, args) ||
        (args.command != "enroll" && args.command != "take" &&
         args.command != "report" && args.command != "info")) {
        print_usage(argv[0]);
        return 1;
    }

    AppConfig config;
    if (args.config_given || std::filesystem::exists(args.config_file)) {
        if (!load_app_config(args.config_file, config)) return 1;
    } else {
        spdlog::warn("{} no encontrado, usando valores por defecto", args.config_file);
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    spdlog::info("Database: {}", config.db_path);
    spdlog::info("Threshold: {:.3f}  dim: {}  multi-face: {}  duplicates: {}",
                 config.match_threshold, config.descriptor_dim,
                 to_string(config.multi_face_policy), to_string(config.duplicate_policy));

    try {
        AttendanceDatabase db(config.db_path);
        if (!db.is_open()) {
            std::cerr << "Database connection not established.\n";
            return 1;
        }

        if (args.command == "report") return cmd_report(args, db);
        if (args.command == "info") return cmd_info(args, db);

        DescriptorGallery gallery(config.descriptor_dim);
        GalleryLoadResult loaded = gallery.load(db);
        if (!loaded.ok) return 1;

        if (args.command == "enroll") return cmd_enroll(args, config, db, gallery);
        return cmd_take(args, config, db, gallery);
    }
    catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
