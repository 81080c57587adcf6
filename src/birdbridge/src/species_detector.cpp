#include "species_detector.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
// Removes the transient sample whichever way the cycle ends.
struct SampleFile {
    std::string path;
    ~SampleFile() {
        std::error_code ec;
        if (!path.empty()) fs::remove(path, ec);
    }
};
}

SpeciesDetector::SpeciesDetector(std::unique_ptr<AudioCapture> capture,
                                 std::unique_ptr<SpeciesClassifier> classifier)
    : capture_(std::move(capture)),
      classifier_(std::move(classifier)),
      task_("Detector", [this](const CancellationToken& token) { loop_body(token); }) {}

SpeciesDetector::~SpeciesDetector() {
    stop();
}

void SpeciesDetector::init(const DetectorOptions& options) {
    std::lock_guard<std::mutex> lk(m_);
    options_ = options;
    std::error_code ec;
    fs::create_directories(fs::path(options_.work_dir) / "audio", ec);
    fs::create_directories(fs::path(options_.work_dir) / "results", ec);
    if (ec) {
        fprintf(stderr, "[Detector] Cannot create work dir %s: %s\n",
                options_.work_dir.c_str(), ec.message().c_str());
    }
    printf("[Detector] Initialized: minConfidence=%.2f interval=%ds sample=%ds\n",
           options_.min_confidence, options_.analysis_interval_s, options_.sample_duration_s);
}

DetectorOptions SpeciesDetector::options() const {
    std::lock_guard<std::mutex> lk(m_);
    return options_;
}

void SpeciesDetector::set_source(const std::string& source) {
    std::lock_guard<std::mutex> lk(m_);
    source_ = source;
}

std::string SpeciesDetector::source() const {
    std::lock_guard<std::mutex> lk(m_);
    return source_;
}

int SpeciesDetector::subscribe(DetectionSink sink) {
    std::lock_guard<std::mutex> lk(sinks_m_);
    int id = next_sink_id_++;
    sinks_.push_back({id, std::move(sink)});
    return id;
}

void SpeciesDetector::unsubscribe(int id) {
    std::lock_guard<std::mutex> lk(sinks_m_);
    for (auto it = sinks_.begin(); it != sinks_.end(); ++it) {
        if (it->first == id) { sinks_.erase(it); break; }
    }
}

bool SpeciesDetector::start() {
    if (source().empty()) {
        throw ConfigError("No source set - call set_source first");
    }
    if (task_.running()) {
        printf("[Detector] Already running\n");
        return true;
    }
    capture_->reset();
    classifier_->reset();
    if (!classifier_->available()) {
        fprintf(stderr, "[Detector] BirdNET-Analyzer not found - detection disabled\n");
        fprintf(stderr, "[Detector] Install: pip install birdnetlib\n");
        return false;
    }

    int interval = std::max(options().analysis_interval_s, 1);
    printf("[Detector] Starting bird detection...\n");
    task_.start(std::chrono::seconds(interval));
    return true;
}

void SpeciesDetector::stop() {
    bool was_running = task_.running();
    task_.request_stop();
    capture_->cancel();
    classifier_->cancel();
    task_.stop();
    if (was_running) printf("[Detector] Stopped\n");
}

bool SpeciesDetector::running() const {
    return task_.running();
}

std::vector<BirdDetection> SpeciesDetector::analyze_now() {
    if (source().empty()) {
        throw ConfigError("No source set");
    }
    return run_cycle(nullptr);
}

std::vector<BirdDetection> SpeciesDetector::run_cycle(const CancellationToken* token) {
    std::lock_guard<std::mutex> lk(cycle_m_);
    const DetectorOptions opts = options();

    // A cancel() from stop() after this point sticks until the next cycle.
    capture_->reset();
    classifier_->reset();
    if (token && token->cancelled()) return {};

    SampleFile sample{capture_->capture(source(), opts)};
    if (token && token->cancelled()) return {};

    ClassifyResult result = classifier_->classify(sample.path, opts);
    if (token && token->cancelled()) return {};
    last_invocation_ = result.invocation;

    std::vector<BirdDetection> accepted;
    for (auto& d : result.detections) {
        if (d.confidence >= opts.min_confidence) accepted.push_back(std::move(d));
    }
    return accepted;
}

void SpeciesDetector::loop_body(const CancellationToken& token) {
    std::vector<BirdDetection> detections;
    try {
        detections = run_cycle(&token);
    } catch (const std::exception& e) {
        cycles_failed_++;
        if (!token.cancelled()) fprintf(stderr, "[Detector] Analysis cycle error: %s\n", e.what());
        return;
    }
    cycles_completed_++;

    std::vector<std::pair<int, DetectionSink>> sinks;
    {
        std::lock_guard<std::mutex> lk(sinks_m_);
        sinks = sinks_;
    }
    for (const auto& d : detections) {
        printf("[Detector] %s (%.1f%%)\n", d.species.c_str(), d.confidence * 100.0);
        for (auto& p : sinks) {
            try {
                if (p.second) p.second(d);
            } catch (const std::exception& e) {
                fprintf(stderr, "[Detector] Callback error: %s\n", e.what());
            }
        }
    }
}
