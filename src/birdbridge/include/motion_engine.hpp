#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "motion.hpp"
#include "subprocess.hpp"

struct MotionEvent {
    std::chrono::system_clock::time_point timestamp;
    double confidence = 0;          // 0-100
    std::optional<Region> region;
    std::string snapshot_path;      // empty when no snapshot was written
};

enum class MotionPhase { Idle, Rising, Active };

const char* motion_phase_name(MotionPhase p);

// Turns a stream of scene-change scores into motion start/end events.
//
//   Idle   --score above threshold-->                         Rising
//   Rising --held min_duration_ms and cooldown elapsed-->     Active (emit MotionEvent)
//   Active --score at/below threshold-->                      Idle   (emit motion end)
//   Rising --score at/below threshold-->                      Idle
//
// Scores come either from the built-in ffmpeg capture (start/stop) or from
// any other producer through process_score().
class MotionEngine {
public:
    using MotionSink = std::function<void(const MotionEvent&)>;
    using MotionEndSink = std::function<void(std::chrono::system_clock::time_point)>;
    using Clock = std::chrono::steady_clock;

    explicit MotionEngine(MotionConfig config = MotionConfig{},
                          std::string ffmpeg_path = "ffmpeg",
                          std::string snapshot_dir = std::string());
    ~MotionEngine();

    MotionEngine(const MotionEngine&) = delete;
    MotionEngine& operator=(const MotionEngine&) = delete;

    void configure(const MotionConfig& config);
    MotionConfig config() const;

    // Idempotent. Returns false when disabled by config. The capture is
    // restarted after a non-zero exit; a clean exit, or one while disabled,
    // ends detection as if stop() had been called.
    bool start(const std::string& source);
    void stop();
    bool running() const { return run_; }

    // Register a consumer; returns an ID; call unsubscribe(id) when done
    int subscribe(MotionSink on_motion, MotionEndSink on_end = MotionEndSink());
    void unsubscribe(int id);

    // Feed one score (0-1) observed at `now`.
    void process_score(double score, Clock::time_point now);
    void process_score(const SceneScore& score, Clock::time_point now,
                       const std::vector<unsigned char>* frame = nullptr);

    MotionPhase phase() const;
    uint64_t events_emitted() const { return events_emitted_; }

    std::vector<std::string> capture_args(const std::string& source) const;

private:
    void capture_thread_fn(std::string source);
    void read_frames(Subprocess& proc);
    void end_motion();  // Active -> Idle, notifying end sinks
    std::string write_snapshot(const std::vector<unsigned char>& jpeg);

    MotionConfig config_;
    mutable std::mutex config_m_;

    std::string ffmpeg_path_;
    std::string snapshot_dir_;

    // state machine
    mutable std::mutex state_m_;
    MotionPhase phase_ = MotionPhase::Idle;
    Clock::time_point motion_start_{};
    Clock::time_point last_emit_{};
    bool has_emitted_ = false;
    std::atomic<uint64_t> events_emitted_{0};

    // sinks
    std::mutex sinks_m_;
    int next_sink_id_ = 1;
    std::vector<std::pair<int, std::pair<MotionSink, MotionEndSink>>> sinks_;

    // capture
    std::mutex lifecycle_m_;
    std::atomic<bool> run_{false};
    std::thread th_;
    Subprocess* proc_ = nullptr;
    std::mutex proc_m_;
    std::mutex wake_m_;
    std::condition_variable wake_cv_;
};
