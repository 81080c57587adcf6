#include <signal.h>
#include <pthread.h>
#include "config.hpp"
#include "auth.hpp"
#include "collaborators.hpp"
#include "errors.hpp"
#include "external_tools.hpp"
#include "http_server.hpp"
#include "motion_engine.hpp"
#include "routes.hpp"
#include "sighting_tracker.hpp"
#include "species_detector.hpp"
#include <iostream>
#include <memory>

int main(int argc, char** argv){
    BridgeConfig config = parse_args(argc, argv);
    auto errors = validate_config(config);
    if (!errors.empty()) {
        for (const auto& e : errors) std::cerr<<"[Main] "<<e<<"\n";
        return 1;
    }

    // Block termination signals before any thread exists so only sigwait sees them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    AlertSettings alert_settings;
    alert_settings.rare_species = config.rare_species;
    alert_settings.ignored_species = config.ignored_species;
    AlertLog alerts(config.alerts_jsonl, alert_settings);

    std::unique_ptr<FileWeatherProvider> weather;
    if (!config.weather_file.empty()) weather = std::make_unique<FileWeatherProvider>(config.weather_file);

    SightingTracker tracker(config.data_dir, weather.get(), &alerts);

    MotionEngine motion(config.motion, config.ffmpeg_path, config.snapshot_dir);
    motion.subscribe(
        [](const MotionEvent& e){
            if (!e.snapshot_path.empty()) std::cout<<"[Main] Motion snapshot: "<<e.snapshot_path<<"\n";
        },
        [](std::chrono::system_clock::time_point){
            std::cout<<"[Main] Motion ended\n";
        });

    DetectorOptions opts;
    opts.min_confidence = config.min_confidence;
    opts.analysis_interval_s = config.analysis_interval_s;
    opts.sample_duration_s = config.sample_duration_s;
    opts.latitude = config.latitude;
    opts.longitude = config.longitude;
    opts.locale = config.locale;
    opts.work_dir = config.work_dir;
    opts.sample_rate = cfg::AUDIO_SAMPLE_RATE;

    SpeciesDetector detector(std::make_unique<FfmpegAudioCapture>(config.ffmpeg_path),
                             std::make_unique<BirdnetClassifier>(config.python_path));
    detector.init(opts);
    detector.set_source(config.source);
    detector.subscribe([&tracker](const BirdDetection& d){
        SightingInput input;
        input.species = d.species;
        input.scientific_name = d.scientific_name;
        input.confidence = d.confidence;
        input.timestamp = to_iso8601(d.timestamp);
        tracker.record_sighting(input);
    });

    Auth auth(config.api_key);
    BridgeContext ctx{tracker, motion, detector, std::chrono::steady_clock::now()};

    HttpServer srv;
    register_routes(srv, auth, ctx);
    if (!srv.start(config.port)) {
        std::cerr<<"[Main] Failed to start HTTP server\n"; return 1;
    }
    if (auth.generated()) {
        std::cout<<"[Main] No API_KEY set, generated: "<<auth.key()<<"\n";
    }

    if (config.motion.enabled) motion.start(config.source);
    if (config.detection_enabled) {
        try {
            detector.start();
        } catch (const ConfigError& e) {
            std::cerr<<"[Main] Bird detection not started: "<<e.what()<<"\n";
        }
    }

    std::cout<<"[Main] Bridge running, API on http://<pi-ip>:"<<srv.port()<<"/api  (data: "<<config.data_dir<<")\n";

    int sig = 0;
    sigwait(&stop_signals, &sig);
    std::cout<<"[Main] Caught signal "<<sig<<", shutting down\n";

    detector.stop();
    motion.stop();
    srv.stop();
    return 0;
}
