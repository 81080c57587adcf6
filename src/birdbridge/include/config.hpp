#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "motion.hpp"

namespace cfg {
// Network
inline constexpr int SERVER_PORT = 8080;

// Motion capture: low-rate, downscaled MJPEG is plenty for scene scoring
inline constexpr int MOTION_FPS    = 5;
inline constexpr int MOTION_WIDTH  = 320;
inline constexpr int MOTION_HEIGHT = 240;
inline constexpr int RESTART_BACKOFF_SEC = 5;

// Audio sample for the classifier: mono 16-bit PCM
inline constexpr int AUDIO_SAMPLE_RATE = 48000;
inline constexpr int CLASSIFIER_CHECK_SEC = 5;

// Tracker
inline constexpr std::size_t MAX_SIGHTINGS = 10000;
inline constexpr std::size_t SIGHTINGS_PER_FILE = 1000;
inline const std::string STATE_FILE = "tracker-state.json";

// Auth
inline const std::string API_KEY_HEADER = "X-API-Key";
}

struct BridgeConfig {
    std::string source;                  // RTSP URL, file or device
    std::string ffmpeg_path{"ffmpeg"};
    std::string python_path{"python"};
    std::string data_dir;                // defaults to ~/.birdcam/birds
    std::string work_dir{"temp"};        // transient audio samples and results
    std::string snapshot_dir;            // empty = no motion snapshots
    std::string alerts_jsonl{"alerts.jsonl"};
    std::string weather_file;            // empty = no weather enrichment
    std::string api_key;                 // empty = generated at start-up
    int port{cfg::SERVER_PORT};
    bool debug{false};

    // Bird detection
    bool detection_enabled{true};
    double min_confidence{0.7};
    int analysis_interval_s{3};
    int sample_duration_s{3};
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string locale{"en"};

    // Motion
    MotionConfig motion;

    // Alerts
    std::vector<std::string> rare_species;
    std::vector<std::string> ignored_species;
};

// Environment first, then command-line flags.
BridgeConfig parse_args(int argc, char** argv);

// Human-readable problems; empty when the config is usable.
std::vector<std::string> validate_config(const BridgeConfig& config);

std::string default_data_dir();
