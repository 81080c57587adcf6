#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "external_tools.hpp"
#include "periodic_task.hpp"

// Periodic acoustic species classification. Each cycle captures a short
// audio sample, classifies it and hands every detection at or above
// min_confidence to the subscribers. Cycles never overlap, including
// analyze_now() calls made while the loop is running.
class SpeciesDetector {
public:
    using DetectionSink = std::function<void(const BirdDetection&)>;

    SpeciesDetector(std::unique_ptr<AudioCapture> capture,
                    std::unique_ptr<SpeciesClassifier> classifier);
    ~SpeciesDetector();

    SpeciesDetector(const SpeciesDetector&) = delete;
    SpeciesDetector& operator=(const SpeciesDetector&) = delete;

    void init(const DetectorOptions& options);
    DetectorOptions options() const;
    void set_source(const std::string& source);

    int subscribe(DetectionSink sink);
    void unsubscribe(int id);

    // Throws ConfigError without a source. Returns false (and stays stopped)
    // when the classifier is not installed. Idempotent.
    bool start();
    void stop();
    bool running() const;

    // One synchronous cycle outside the loop; subscribers are not called.
    // Throws ConfigError without a source, ToolError if the cycle fails.
    std::vector<BirdDetection> analyze_now();

    Invocation last_invocation() const { return last_invocation_; }
    uint64_t cycles_completed() const { return cycles_completed_; }
    uint64_t cycles_failed() const { return cycles_failed_; }

private:
    std::vector<BirdDetection> run_cycle(const CancellationToken* token);
    void loop_body(const CancellationToken& token);
    std::string source() const;

    std::unique_ptr<AudioCapture> capture_;
    std::unique_ptr<SpeciesClassifier> classifier_;

    mutable std::mutex m_;
    DetectorOptions options_;
    std::string source_;

    std::mutex cycle_m_;   // one capture/classify at a time
    PeriodicTask task_;

    std::mutex sinks_m_;
    int next_sink_id_ = 1;
    std::vector<std::pair<int, DetectionSink>> sinks_;

    std::atomic<Invocation> last_invocation_{Invocation::None};
    std::atomic<uint64_t> cycles_completed_{0};
    std::atomic<uint64_t> cycles_failed_{0};
};
