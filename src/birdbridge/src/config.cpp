#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static std::vector<std::string> parse_list(const char* s) {
    std::vector<std::string> out;
    for (const auto& item : split(s, ',')) {
        std::string t = trim(item);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

std::string default_data_dir() {
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/.birdcam/birds";
}

BridgeConfig parse_args(int argc, char** argv) {
    BridgeConfig cfg;
    cfg.data_dir = default_data_dir();

    // Env names match the bridge's .env file
    if (const char* v = std::getenv("CAMERA_RTSP_URL")) cfg.source = v;
    if (const char* v = std::getenv("FFMPEG_PATH")) cfg.ffmpeg_path = v;
    if (const char* v = std::getenv("PYTHON_PATH")) cfg.python_path = v;
    if (const char* v = std::getenv("BIRD_DATA_DIR")) cfg.data_dir = v;
    if (const char* v = std::getenv("BIRD_WORK_DIR")) cfg.work_dir = v;
    if (const char* v = std::getenv("SNAPSHOT_DIR")) cfg.snapshot_dir = v;
    if (const char* v = std::getenv("ALERTS_JSONL")) cfg.alerts_jsonl = v;
    if (const char* v = std::getenv("WEATHER_FILE")) cfg.weather_file = v;
    if (const char* v = std::getenv("API_KEY")) cfg.api_key = v;
    if (const char* v = std::getenv("HTTP_PORT")) cfg.port = std::atoi(v);
    if (const char* v = std::getenv("DEBUG")) cfg.debug = arg_eq(v, "true");
    if (const char* v = std::getenv("BIRD_DETECTION_ENABLED")) cfg.detection_enabled = !arg_eq(v, "false");
    if (const char* v = std::getenv("DETECTION_MIN_CONFIDENCE")) cfg.min_confidence = std::atof(v);
    if (const char* v = std::getenv("DETECTION_INTERVAL")) cfg.analysis_interval_s = std::atoi(v);
    if (const char* v = std::getenv("DETECTION_SAMPLE_DURATION")) cfg.sample_duration_s = std::atoi(v);
    if (const char* v = std::getenv("LOCATION_LATITUDE")) cfg.latitude = std::atof(v);
    if (const char* v = std::getenv("LOCATION_LONGITUDE")) cfg.longitude = std::atof(v);
    if (const char* v = std::getenv("BIRDNET_LOCALE")) cfg.locale = v;
    if (const char* v = std::getenv("MOTION_ENABLED")) cfg.motion.enabled = !arg_eq(v, "false");
    if (const char* v = std::getenv("MOTION_SENSITIVITY")) cfg.motion.sensitivity = std::atof(v);
    if (const char* v = std::getenv("MOTION_THRESHOLD")) cfg.motion.threshold = std::atof(v);
    if (const char* v = std::getenv("MOTION_COOLDOWN_MS")) cfg.motion.cooldown_ms = std::atoi(v);
    if (const char* v = std::getenv("MOTION_MIN_DURATION_MS")) cfg.motion.min_duration_ms = std::atoi(v);
    if (const char* v = std::getenv("RARE_SPECIES")) cfg.rare_species = parse_list(v);
    if (const char* v = std::getenv("IGNORED_SPECIES")) cfg.ignored_species = parse_list(v);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--ffmpeg") && next()) {
            cfg.ffmpeg_path = next();
            i++;
        } else if (arg_eq(arg, "--python") && next()) {
            cfg.python_path = next();
            i++;
        } else if (arg_eq(arg, "--data-dir") && next()) {
            cfg.data_dir = next();
            i++;
        } else if (arg_eq(arg, "--work-dir") && next()) {
            cfg.work_dir = next();
            i++;
        } else if (arg_eq(arg, "--snapshots") && next()) {
            cfg.snapshot_dir = next();
            i++;
        } else if (arg_eq(arg, "--alerts") && next()) {
            cfg.alerts_jsonl = next();
            i++;
        } else if (arg_eq(arg, "--weather") && next()) {
            cfg.weather_file = next();
            i++;
        } else if (arg_eq(arg, "--api-key") && next()) {
            cfg.api_key = next();
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.port = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--min-conf") && next()) {
            cfg.min_confidence = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--interval") && next()) {
            cfg.analysis_interval_s = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--sample") && next()) {
            cfg.sample_duration_s = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--lat") && next()) {
            cfg.latitude = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--lon") && next()) {
            cfg.longitude = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--locale") && next()) {
            cfg.locale = next();
            i++;
        } else if (arg_eq(arg, "--no-detection")) {
            cfg.detection_enabled = false;
        } else if (arg_eq(arg, "--no-motion")) {
            cfg.motion.enabled = false;
        } else if (arg_eq(arg, "--debug")) {
            cfg.debug = true;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: birdbridge --source <rtsp-url> [--data-dir <dir>] [--port <n>] [--api-key <key>]\n"
                      << "                  [--ffmpeg <path>] [--python <path>] [--work-dir <dir>]\n"
                      << "                  [--min-conf <0-1>] [--interval <s>] [--sample <s>]\n"
                      << "                  [--lat <deg>] [--lon <deg>] [--locale <code>]\n"
                      << "                  [--snapshots <dir>] [--alerts <path>] [--weather <path>]\n"
                      << "                  [--no-detection] [--no-motion] [--debug]\n";
            std::exit(0);
        }
    }

    cfg.motion.debug = cfg.motion.debug || cfg.debug;
    return cfg;
}

std::vector<std::string> validate_config(const BridgeConfig& cfg) {
    std::vector<std::string> errors;
    if (cfg.source.empty()) {
        errors.push_back("CAMERA_RTSP_URL (or --source) is required");
    }
    if (cfg.min_confidence < 0.0 || cfg.min_confidence > 1.0) {
        errors.push_back("DETECTION_MIN_CONFIDENCE must be between 0 and 1");
    }
    if (cfg.analysis_interval_s <= 0) {
        errors.push_back("DETECTION_INTERVAL must be positive");
    }
    if (cfg.sample_duration_s <= 0) {
        errors.push_back("DETECTION_SAMPLE_DURATION must be positive");
    }
    if (cfg.latitude.has_value() != cfg.longitude.has_value()) {
        errors.push_back("LOCATION_LATITUDE and LOCATION_LONGITUDE must be set together");
    }
    if (cfg.port <= 0 || cfg.port > 65535) {
        errors.push_back("HTTP_PORT must be a valid TCP port");
    }
    if (cfg.data_dir.empty()) {
        errors.push_back("BIRD_DATA_DIR must not be empty");
    }
    return errors;
}
