#include "motion_engine.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>
#include <fstream>

using namespace std::chrono;

const char* motion_phase_name(MotionPhase p) {
    switch (p) {
        case MotionPhase::Idle: return "idle";
        case MotionPhase::Rising: return "rising";
        case MotionPhase::Active: return "active";
    }
    return "idle";
}

MotionEngine::MotionEngine(MotionConfig config, std::string ffmpeg_path, std::string snapshot_dir)
    : config_(normalized(std::move(config))),
      ffmpeg_path_(std::move(ffmpeg_path)),
      snapshot_dir_(std::move(snapshot_dir)) {}

MotionEngine::~MotionEngine() {
    stop();
}

void MotionEngine::configure(const MotionConfig& config) {
    MotionConfig c = normalized(config);
    {
        std::lock_guard<std::mutex> lk(config_m_);
        config_ = std::move(c);
        printf("[Motion] Config updated: sensitivity=%.0f threshold=%.1f cooldown=%dms minDuration=%dms regions=%zu\n",
               config_.sensitivity, config_.threshold, config_.cooldown_ms,
               config_.min_duration_ms, config_.regions.size());
    }
    {
        std::lock_guard<std::mutex> wlk(wake_m_);
    }
    wake_cv_.notify_all();
}

MotionConfig MotionEngine::config() const {
    std::lock_guard<std::mutex> lk(config_m_);
    return config_;
}

bool MotionEngine::start(const std::string& source) {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    if (run_) return true;
    if (!config().enabled) {
        printf("[Motion] Detection disabled\n");
        return false;
    }
    if (th_.joinable()) th_.join();

    {
        std::lock_guard<std::mutex> slk(state_m_);
        phase_ = MotionPhase::Idle;
    }
    run_ = true;
    printf("[Motion] Starting detection...\n");
    th_ = std::thread(&MotionEngine::capture_thread_fn, this, source);
    return true;
}

void MotionEngine::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    bool was_running = run_.exchange(false);
    {
        std::lock_guard<std::mutex> plk(proc_m_);
        if (proc_) proc_->terminate();
    }
    {
        std::lock_guard<std::mutex> wlk(wake_m_);
    }
    wake_cv_.notify_all();
    if (th_.joinable()) th_.join();

    end_motion();
    if (was_running) printf("[Motion] Detection stopped\n");
}

void MotionEngine::end_motion() {
    bool was_active = false;
    {
        std::lock_guard<std::mutex> slk(state_m_);
        was_active = phase_ == MotionPhase::Active;
        phase_ = MotionPhase::Idle;
    }
    if (!was_active) return;

    auto now = system_clock::now();
    std::vector<std::pair<int, std::pair<MotionSink, MotionEndSink>>> sinks;
    {
        std::lock_guard<std::mutex> slk(sinks_m_);
        sinks = sinks_;
    }
    for (auto& p : sinks) {
        try {
            if (p.second.second) p.second.second(now);
        } catch (const std::exception& e) {
            fprintf(stderr, "[Motion] Listener error: %s\n", e.what());
        }
    }
}

int MotionEngine::subscribe(MotionSink on_motion, MotionEndSink on_end) {
    std::lock_guard<std::mutex> lk(sinks_m_);
    int id = next_sink_id_++;
    sinks_.push_back({id, {std::move(on_motion), std::move(on_end)}});
    return id;
}

void MotionEngine::unsubscribe(int id) {
    std::lock_guard<std::mutex> lk(sinks_m_);
    for (auto it = sinks_.begin(); it != sinks_.end(); ++it) {
        if (it->first == id) { sinks_.erase(it); break; }
    }
}

MotionPhase MotionEngine::phase() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return phase_;
}

void MotionEngine::process_score(double score, Clock::time_point now) {
    SceneScore s;
    s.score = score;
    process_score(s, now, nullptr);
}

void MotionEngine::process_score(const SceneScore& score, Clock::time_point now,
                                 const std::vector<unsigned char>* frame) {
    const MotionConfig cfg = config();
    const bool above = score.score * 100.0 > cfg.threshold;

    if (cfg.debug) {
        printf("[Motion] score=%.3f (%s)\n", score.score, above ? "above" : "below");
    }

    std::optional<MotionEvent> fired;
    bool ended = false;
    {
        std::lock_guard<std::mutex> lk(state_m_);
        if (above) {
            if (phase_ == MotionPhase::Idle) {
                phase_ = MotionPhase::Rising;
                motion_start_ = now;
            }
            if (phase_ == MotionPhase::Rising) {
                bool held = now - motion_start_ >= milliseconds(cfg.min_duration_ms);
                bool cooled = !has_emitted_ || now - last_emit_ >= milliseconds(cfg.cooldown_ms);
                if (held && cooled) {
                    phase_ = MotionPhase::Active;
                    last_emit_ = now;
                    has_emitted_ = true;

                    MotionEvent ev;
                    ev.timestamp = system_clock::now();
                    ev.confidence = std::min(score.score * 100.0, 100.0);
                    ev.region = score.region;
                    fired = ev;
                }
            }
        } else {
            ended = phase_ == MotionPhase::Active;
            phase_ = MotionPhase::Idle;
        }
    }

    if (!fired && !ended) return;

    if (fired && frame && !snapshot_dir_.empty()) {
        fired->snapshot_path = write_snapshot(*frame);
    }
    if (fired) {
        events_emitted_++;
        printf("[Motion] Detected! Confidence: %.1f%%\n", fired->confidence);
    }

    std::vector<std::pair<int, std::pair<MotionSink, MotionEndSink>>> sinks;
    {
        std::lock_guard<std::mutex> lk(sinks_m_);
        sinks = sinks_;
    }
    auto end_time = system_clock::now();
    for (auto& p : sinks) {
        try {
            if (fired && p.second.first) p.second.first(*fired);
            if (ended && p.second.second) p.second.second(end_time);
        } catch (const std::exception& e) {
            fprintf(stderr, "[Motion] Listener error: %s\n", e.what());
        }
    }
}

std::vector<std::string> MotionEngine::capture_args(const std::string& source) const {
    std::vector<std::string> args = {ffmpeg_path_, "-hide_banner", "-loglevel", "error"};
    if (source.rfind("rtsp://", 0) == 0 || source.rfind("rtsps://", 0) == 0) {
        args.insert(args.end(), {"-rtsp_transport", "tcp"});
    }
    char vf[64];
    snprintf(vf, sizeof(vf), "fps=%d,scale=%d:%d", cfg::MOTION_FPS, cfg::MOTION_WIDTH, cfg::MOTION_HEIGHT);
    args.insert(args.end(), {"-i", source, "-an", "-vf", vf,
                             "-f", "image2pipe", "-c:v", "mjpeg", "-q:v", "8", "-"});
    return args;
}

void MotionEngine::capture_thread_fn(std::string source) {
    while (run_) {
        Subprocess proc;
        auto args = capture_args(source);
        int code = -1;
        if (!proc.start(args, /*capture_stdout*/true)) {
            fprintf(stderr, "[Motion] Failed to start capture: %s\n", Subprocess::describe(args).c_str());
        } else {
            { std::lock_guard<std::mutex> lk(proc_m_); proc_ = &proc; }
            // stop() may have run before proc_ was published
            if (!run_) proc.terminate();
            read_frames(proc);
            { std::lock_guard<std::mutex> lk(proc_m_); proc_ = nullptr; }
            auto exited = proc.wait_for(seconds(2));
            if (!exited) { proc.terminate(); exited = proc.wait(); }
            code = *exited;
            printf("[Motion] Capture exited with code: %d\n", code);
        }
        {
            std::lock_guard<std::mutex> lk(state_m_);
            if (phase_ == MotionPhase::Rising) phase_ = MotionPhase::Idle;
        }
        if (!run_) break;

        // Only an unexpected exit of an enabled engine is retried; a file
        // source that reached its end stays finished.
        if (code == 0 || !config().enabled) {
            printf("[Motion] Capture ended, not restarting\n");
            run_ = false;
            end_motion();
            break;
        }

        printf("[Motion] Auto-restarting in %d seconds...\n", cfg::RESTART_BACKOFF_SEC);
        {
            std::unique_lock<std::mutex> lk(wake_m_);
            wake_cv_.wait_for(lk, seconds(cfg::RESTART_BACKOFF_SEC),
                              [this] { return !run_ || !config().enabled; });
        }
        if (run_ && !config().enabled) {
            printf("[Motion] Detection disabled, not restarting\n");
            run_ = false;
            end_motion();
            break;
        }
    }
}

void MotionEngine::read_frames(Subprocess& proc) {
    SceneScorer scorer(cfg::MOTION_WIDTH, cfg::MOTION_HEIGHT);

    std::vector<unsigned char> buf(1 << 16);
    std::vector<unsigned char> frame;
    bool in_frame = false;
    unsigned char prev = 0;

    while (run_) {
        ssize_t n = proc.read_stdout(buf.data(), buf.size());
        if (n <= 0) break;

        for (ssize_t i = 0; i < n; i++) {
            unsigned char c = buf[i];

            if (!in_frame) {
                if (prev == 0xFF && c == 0xD8) { // SOI
                    frame.clear();
                    frame.push_back(0xFF);
                    frame.push_back(c);
                    in_frame = true;
                }
            } else {
                frame.push_back(c);
                size_t sz = frame.size();
                if (sz >= 4 && frame[sz - 2] == 0xFF && frame[sz - 1] == 0xD9) { // EOI
                    auto s = scorer.score(frame, config());
                    if (s) process_score(*s, Clock::now(), &frame);
                    in_frame = false;
                }
            }
            prev = c;
        }
    }
}

std::string MotionEngine::write_snapshot(const std::vector<unsigned char>& jpeg) {
    if (!ensure_dir(snapshot_dir_)) {
        fprintf(stderr, "[Motion] Failed to create snapshot dir: %s\n", snapshot_dir_.c_str());
        return std::string();
    }
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count() % 1000;
    char suffix[16];
    snprintf(suffix, sizeof(suffix), "_%03d.jpg", static_cast<int>(ms));
    std::string path = snapshot_dir_ + "/motion_" + now_timestamp_filename() + suffix;

    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
    if (!out) {
        fprintf(stderr, "[Motion] Failed to write snapshot: %s\n", path.c_str());
        return std::string();
    }
    return path;
}
